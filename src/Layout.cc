#include "Layout.hpp"

#include "Algos.hpp"
#include "Command.hpp"
#include "Rustify/Result.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <optional>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace gocov {

static std::string_view
trim(std::string_view str) noexcept {
  constexpr std::string_view spaces = " \t\r\n";
  const std::size_t begin = str.find_first_not_of(spaces);
  if (begin == std::string_view::npos) {
    return {};
  }
  const std::size_t end = str.find_last_not_of(spaces);
  return str.substr(begin, end - begin + 1);
}

std::optional<fs::path>
findGoMod(fs::path dir) {
  while (true) {
    const fs::path candidate = dir / Layout::GO_MOD;
    spdlog::trace("Finding go.mod: {}", candidate.string());
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
      return candidate;
    }
    if (dir == dir.root_path() || !dir.has_parent_path()) {
      return std::nullopt;
    }
    dir = dir.parent_path();
  }
}

Result<std::string>
parseModulePath(const std::string_view goModContent) {
  std::istringstream iss{ std::string(goModContent) };
  std::string line;
  while (std::getline(iss, line)) {
    std::string_view view = line;
    if (const std::size_t comment = view.find("//");
        comment != std::string_view::npos) {
      view = view.substr(0, comment);
    }
    view = trim(view);
    if (!view.starts_with("module")) {
      continue;
    }
    view = view.substr(std::string_view("module").size());
    if (!view.empty() && view.front() != ' ' && view.front() != '\t'
        && view.front() != '"') {
      continue;  // e.g. `modules`
    }
    view = trim(view);
    if (view.size() >= 2 && (view.front() == '"' || view.front() == '`')
        && view.back() == view.front()) {
      view = view.substr(1, view.size() - 2);
    }
    Ensure(!view.empty(), "go.mod has an empty module directive");
    return Ok(std::string(view));
  }
  Bail("go.mod has no module directive");
}

std::vector<fs::path>
splitPathList(const std::string_view list) {
  std::vector<fs::path> paths;
  std::size_t start = 0;
  while (start <= list.size()) {
    std::size_t end = list.find(':', start);
    if (end == std::string_view::npos) {
      end = list.size();
    }
    const std::string_view entry = trim(list.substr(start, end - start));
    if (!entry.empty()) {
      paths.emplace_back(entry);
    }
    start = end + 1;
  }
  return paths;
}

bool
isWithin(const fs::path& path, const fs::path& base) {
  std::error_code ec;
  const fs::path canonPath = fs::weakly_canonical(path, ec);
  if (ec) {
    spdlog::debug("cannot resolve {}: {}", path.string(), ec.message());
    return false;
  }
  const fs::path canonBase = fs::weakly_canonical(base, ec);
  if (ec) {
    spdlog::debug("cannot resolve {}: {}", base.string(), ec.message());
    return false;
  }
  const auto [baseEnd, pathItr] = std::mismatch(
      canonBase.begin(), canonBase.end(), canonPath.begin(), canonPath.end()
  );
  // A trailing separator on `base` shows up as an empty last element.
  return baseEnd == canonBase.end()
         || (std::next(baseEnd) == canonBase.end() && baseEnd->empty());
}

Result<Layout>
detectLayout(const fs::path& workingDir, const std::string& goBin) {
  if (const auto goMod = findGoMod(workingDir)) {
    std::ifstream ifs(goMod.value());
    Ensure(ifs.is_open(), "cannot read {}", goMod->string());
    const std::string content{ std::istreambuf_iterator<char>(ifs),
                               std::istreambuf_iterator<char>() };

    Layout layout;
    layout.isModule = true;
    layout.root = goMod->parent_path();
    layout.modulePath =
        Try(parseModulePath(content).with_context([&goMod] {
          return anyhow::anyhow("invalid {}", goMod->string());
        }));
    spdlog::debug(
        "Module layout: {} at {}", layout.modulePath, layout.root.string()
    );
    return Ok(layout);
  }

  const std::string output = Try(
      getCmdOutput(Command(goBin, { "env", "GOPATH" })).with_context([] {
        return anyhow::anyhow("cannot determine GOPATH");
      })
  );
  const std::string gopath{ trim(output) };
  for (const fs::path& entry : splitPathList(gopath)) {
    if (isWithin(workingDir, entry)) {
      Layout layout;
      layout.root = entry;
      layout.gopath = gopath;
      spdlog::debug("Legacy layout: GOPATH entry {}", entry.string());
      return Ok(layout);
    }
  }
  Bail(
      "{} has no {} in any parent directory and is not inside GOPATH ({})",
      workingDir.string(), Layout::GO_MOD, gopath
  );
}

}  // namespace gocov

#ifdef GOCOV_TEST

#  include "Rustify/Tests.hpp"

namespace tests {

using namespace gocov;  // NOLINT(build/namespaces,google-build-using-namespace)

static void
testParseModulePath() {
  assertEq(
      parseModulePath("module example.com/my_app\n\ngo 1.21\n").unwrap(),
      "example.com/my_app"
  );
  assertEq(
      parseModulePath("// header\nmodule \"example.com/q\" // quoted\n")
          .unwrap(),
      "example.com/q"
  );
  assertEq(
      parseModulePath("  module\texample.com/tab  \r\n").unwrap(),
      "example.com/tab"
  );
  assertTrue(parseModulePath("go 1.21\n").is_err());
  assertTrue(parseModulePath("module\n").is_err());

  pass();
}

static void
testSplitPathList() {
  const auto paths = splitPathList("/a/go::/b/go \n");
  assertEq(paths.size(), 2UL);
  assertEq(paths[0], fs::path("/a/go"));
  assertEq(paths[1], fs::path("/b/go"));
  assertTrue(splitPathList("").empty());

  pass();
}

static void
testIsWithin() {
  const TempDir tmp;
  fs::create_directories(tmp.path() / "go/src/app");
  assertTrue(isWithin(tmp.path() / "go/src/app", tmp.path() / "go"));
  assertTrue(isWithin(tmp.path() / "go", tmp.path() / "go"));
  assertTrue(isWithin(tmp.path() / "go/src", tmp.path() / "go/"));
  assertFalse(isWithin(tmp.path() / "gopath", tmp.path() / "go"));
  assertFalse(isWithin(tmp.path(), tmp.path() / "go"));

  // `loop` points at itself, so resolving anything below it fails.
  fs::create_directory_symlink(tmp.path() / "loop", tmp.path() / "loop");
  assertFalse(isWithin(tmp.path() / "go/src/app", tmp.path() / "loop/go"));
  assertFalse(isWithin(tmp.path() / "loop/go/src", tmp.path() / "loop/go"));

  pass();
}

static void
testFindGoMod() {
  const TempDir tmp;
  writeFile(tmp.path() / "proj/go.mod", "module example.com/proj\n");
  fs::create_directories(tmp.path() / "proj/cmd/server");

  assertEq(
      findGoMod(tmp.path() / "proj/cmd/server").value_or(""),
      tmp.path() / "proj/go.mod"
  );
  assertEq(
      findGoMod(tmp.path() / "proj").value_or(""), tmp.path() / "proj/go.mod"
  );

  pass();
}

static void
testDetectModuleLayout() {
  const TempDir tmp;
  writeFile(tmp.path() / "my_app/go.mod", "module example.com/my_app\n");
  fs::create_directories(tmp.path() / "my_app/cmd");

  // The toolchain is not consulted in module layout.
  const Layout layout =
      detectLayout(tmp.path() / "my_app/cmd", "/nonexistent/go").unwrap();
  assertTrue(layout.isModule);
  assertEq(layout.root, tmp.path() / "my_app");
  assertEq(layout.modulePath, "example.com/my_app");
  assertTrue(layout.gopath.empty());

  pass();
}

static void
testDetectLegacyLayout() {
  const TempDir tmp;
  const fs::path gopath = tmp.path() / "gopath";
  fs::create_directories(gopath / "src/myapp");
  const fs::path goBin = tmp.path() / "bin/go";
  writeScript(
      goBin, fmt::format(
                 "[ \"$1 $2\" = \"env GOPATH\" ] || exit 2\n"
                 "echo '/elsewhere/go:{}'\n",
                 gopath.string()
             )
  );

  const Layout layout =
      detectLayout(gopath / "src/myapp", goBin.string()).unwrap();
  assertFalse(layout.isModule);
  assertEq(layout.root, gopath);
  assertEq(layout.gopath, fmt::format("/elsewhere/go:{}", gopath.string()));

  pass();
}

static void
testDetectLegacyLayoutSkipsUnresolvableEntry() {
  const TempDir tmp;
  const fs::path gopath = tmp.path() / "gopath";
  fs::create_directories(gopath / "src/myapp");
  fs::create_directory_symlink(tmp.path() / "loop", tmp.path() / "loop");
  const fs::path goBin = tmp.path() / "bin/go";
  writeScript(
      goBin, fmt::format(
                 "echo '{}:{}'\n", (tmp.path() / "loop/go").string(),
                 gopath.string()
             )
  );

  const auto layout = detectLayout(gopath / "src/myapp", goBin.string());
  assertTrue(layout.is_ok());
  assertEq(layout.unwrap().root, gopath);

  pass();
}

static void
testDetectLayoutOutsideGopath() {
  const TempDir tmp;
  fs::create_directories(tmp.path() / "loose");
  const fs::path goBin = tmp.path() / "bin/go";
  writeScript(goBin, "echo /elsewhere/go\n");

  assertTrue(detectLayout(tmp.path() / "loose", goBin.string()).is_err());

  pass();
}

}  // namespace tests

int
main() {
  tests::testParseModulePath();
  tests::testSplitPathList();
  tests::testIsWithin();
  tests::testFindGoMod();
  tests::testDetectModuleLayout();
  tests::testDetectLegacyLayout();
  tests::testDetectLegacyLayoutSkipsUnresolvableEntry();
  tests::testDetectLayoutOutsideGopath();
}

#endif
