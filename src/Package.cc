#include "Package.hpp"

#include "Algos.hpp"
#include "Command.hpp"
#include "Rustify/Result.hpp"

#include <cctype>
#include <exception>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gocov {

using json = nlohmann::json;

static std::vector<std::string>
stringsOr(const json& obj, const char* key) {
  if (!obj.contains(key) || obj[key].is_null()) {
    return {};
  }
  return obj[key].get<std::vector<std::string>>();
}

static std::string
stringOr(const json& obj, const char* key) {
  if (!obj.contains(key) || obj[key].is_null()) {
    return "";
  }
  return obj[key].get<std::string>();
}

static Package
toPackage(const json& obj) {
  Package pkg;
  pkg.importPath = obj.at("ImportPath").get<std::string>();
  pkg.name = stringOr(obj, "Name");
  pkg.dir = stringOr(obj, "Dir");
  pkg.root = stringOr(obj, "Root");
  pkg.standard = obj.value("Standard", false);
  pkg.goFiles = stringsOr(obj, "GoFiles");
  pkg.cgoFiles = stringsOr(obj, "CgoFiles");
  pkg.testGoFiles = stringsOr(obj, "TestGoFiles");
  pkg.deps = stringsOr(obj, "Deps");
  if (obj.contains("Module") && obj["Module"].is_object()) {
    const json& mod = obj["Module"];
    pkg.module = Module{ .path = stringOr(mod, "Path"),
                         .dir = stringOr(mod, "Dir"),
                         .goMod = stringOr(mod, "GoMod") };
  }
  if (obj.contains("Error") && obj["Error"].is_object()) {
    pkg.error = stringOr(obj["Error"], "Err");
  }
  return pkg;
}

Result<PackageGraph>
parsePackageList(const std::string_view text) {
  PackageGraph graph;
  std::istringstream iss{ std::string(text) };
  try {
    while ((iss >> std::ws).peek() != std::char_traits<char>::eof()) {
      json obj;
      iss >> obj;
      Package pkg = toPackage(obj);
      std::string importPath = pkg.importPath;
      graph.insert_or_assign(std::move(importPath), std::move(pkg));
    }
  } catch (const std::exception& e) {
    Bail("invalid `go list` output: {}", e.what());
  }
  return Ok(graph);
}

Result<PackageGraph>
listPackages(const std::string& goBin, const fs::path& dir) {
  const Command cmd = Command(goBin, { "list", "-json", "./..." })
                          .setWorkingDirectory(dir);
  const std::string out = Try(getCmdOutput(cmd).with_context([&] {
    return anyhow::anyhow("cannot list packages in {}", dir.string());
  }));
  PackageGraph graph = Try(parsePackageList(out));

  for (const auto& [importPath, pkg] : graph) {
    if (pkg.error.has_value()) {
      spdlog::warn("package {}: {}", importPath, pkg.error.value());
    }
  }
  spdlog::debug("Listed {} package(s) in {}", graph.size(), dir.string());
  return Ok(graph);
}

}  // namespace gocov

#ifdef GOCOV_TEST

#  include "Rustify/Tests.hpp"

namespace tests {

using namespace gocov;  // NOLINT(build/namespaces,google-build-using-namespace)

static constexpr std::string_view GO_LIST_OUTPUT = R"({
	"Dir": "/home/u/my_app",
	"ImportPath": "example.com/my_app",
	"Name": "main",
	"Module": {
		"Path": "example.com/my_app",
		"Dir": "/home/u/my_app",
		"GoMod": "/home/u/my_app/go.mod"
	},
	"GoFiles": ["main.go", "flags.go"],
	"Deps": ["example.com/my_app/internal/db", "fmt"]
}
{
	"Dir": "/home/u/my_app/internal/db",
	"ImportPath": "example.com/my_app/internal/db",
	"Name": "db",
	"GoFiles": ["db.go"],
	"CgoFiles": ["sqlite.go"],
	"TestGoFiles": ["db_test.go"],
	"Deps": null
}
{
	"Dir": "/home/u/my_app/broken",
	"ImportPath": "example.com/my_app/broken",
	"Error": { "Err": "no Go files in /home/u/my_app/broken" }
}
)";

static void
testParsePackageList() {
  const PackageGraph graph = parsePackageList(GO_LIST_OUTPUT).unwrap();
  assertEq(graph.size(), 3UL);

  const Package& app = graph.at("example.com/my_app");
  assertTrue(app.isMain());
  assertEq(app.dir, "/home/u/my_app");
  assertEq(app.goFiles, std::vector<std::string>{ "main.go", "flags.go" });
  assertTrue(app.module.has_value());
  assertEq(app.module->goMod, "/home/u/my_app/go.mod");
  assertFalse(app.error.has_value());

  const Package& db = graph.at("example.com/my_app/internal/db");
  assertFalse(db.isMain());
  assertEq(db.cgoFiles, std::vector<std::string>{ "sqlite.go" });
  assertEq(db.testGoFiles, std::vector<std::string>{ "db_test.go" });
  assertTrue(db.deps.empty());
  assertFalse(db.module.has_value());

  const Package& broken = graph.at("example.com/my_app/broken");
  assertEq(
      broken.error.value_or(""), "no Go files in /home/u/my_app/broken"
  );

  pass();
}

static void
testParsePackageListEmpty() {
  assertTrue(parsePackageList("").unwrap().empty());
  assertTrue(parsePackageList("  \n").unwrap().empty());

  pass();
}

static void
testParsePackageListInvalid() {
  assertTrue(parsePackageList("{\"ImportPath\": ").is_err());
  assertTrue(parsePackageList("{\"Dir\": \"/x\"}").is_err());  // no ImportPath
  assertTrue(parsePackageList("[1, 2]").is_err());

  pass();
}

static void
testListPackagesRunsGoList() {
  const TempDir tmp;
  const fs::path goBin = tmp.path() / "go";
  // Fails unless invoked exactly as `go list -json ./...`.
  writeScript(
      goBin,
      R"([ "$1 $2 $3" = "list -json ./..." ] || exit 2
printf '{"ImportPath": "%s", "Name": "main", "Dir": "%s"}\n' \
  example.com/x "$(pwd)"
)"
  );

  const PackageGraph graph = listPackages(goBin.string(), tmp.path()).unwrap();
  assertEq(graph.size(), 1UL);
  assertEq(
      fs::canonical(graph.at("example.com/x").dir), fs::canonical(tmp.path())
  );

  pass();
}

static void
testListPackagesFailure() {
  const TempDir tmp;
  const fs::path goBin = tmp.path() / "go";
  writeScript(goBin, "echo 'go: no go files' >&2\nexit 1\n");

  const auto res = listPackages(goBin.string(), tmp.path());
  assertTrue(res.is_err());

  pass();
}

}  // namespace tests

int
main() {
  tests::testParsePackageList();
  tests::testParsePackageListEmpty();
  tests::testParsePackageListInvalid();
  tests::testListPackagesRunsGoList();
  tests::testListPackagesFailure();
}

#endif
