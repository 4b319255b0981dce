#include "Config.hpp"

#include "Rustify/Result.hpp"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>
#include <toml.hpp>
#include <utility>
#include <vector>

namespace gocov {

// Looks up `section.key`.  A missing section or key is nullopt; a value of
// the wrong type is an error.
template <typename T>
static Result<std::optional<T>>
findOptional(
    const toml::value& val, const char* section, const char* key
) noexcept {
  if (!val.is_table() || !val.contains(section)) {
    return Ok(std::nullopt);
  }
  const toml::value& table = val.at(section);
  Ensure(table.is_table(), "`{}` must be a table", section);
  if (!table.contains(key)) {
    return Ok(std::nullopt);
  }
  return Ok(std::optional<T>(Try(toml::try_find<T>(val, section, key))));
}

Result<Config>
Config::tryFromToml(const toml::value& val, fs::path path) noexcept {
  Config config;
  config.goBin = Try(findOptional<std::string>(val, "toolchain", "go"));

  config.buildFlags =
      Try(findOptional<std::vector<std::string>>(val, "build", "flags"));
  config.buildOutput = Try(findOptional<std::string>(val, "build", "output"));

  config.runExec = Try(findOptional<std::string>(val, "run", "exec"));
  config.runArgs =
      Try(findOptional<std::vector<std::string>>(val, "run", "args"));

  if (const auto baseDir =
          Try(findOptional<std::string>(val, "workspace", "base-dir"))) {
    Ensure(!baseDir->empty(), "`workspace.base-dir` must not be empty");
    fs::path dir = baseDir.value();
    if (dir.is_relative() && path.has_parent_path()) {
      dir = path.parent_path() / dir;
    }
    config.baseDir = dir.lexically_normal();
  }
  config.keepWorkspace =
      Try(findOptional<bool>(val, "workspace", "keep")).value_or(false);
  config.excludes =
      Try(findOptional<std::vector<std::string>>(val, "workspace", "exclude"))
          .value_or(std::vector<std::string>{});
  for (const std::string& exclude : config.excludes) {
    Ensure(
        !exclude.empty() && fs::path(exclude).is_relative(),
        "`workspace.exclude` entries must be relative paths: `{}`", exclude
    );
  }

  config.listHost = Try(findOptional<std::string>(val, "list", "host"));
  config.listWide =
      Try(findOptional<bool>(val, "list", "wide")).value_or(false);

  config.path = std::move(path);
  return Ok(config);
}

std::optional<fs::path>
Config::findPath(fs::path dir) {
  while (true) {
    const fs::path candidate = dir / FILE_NAME;
    spdlog::trace("Finding config: {}", candidate.string());
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

Result<Config>
Config::load(const fs::path& workingDir) noexcept {
  fs::path path;
  if (const char* env = std::getenv(ENV_NAME); env && *env != '\0') {
    std::error_code ec;
    path = fs::absolute(env, ec);
    Ensure(!ec, "cannot resolve {}={}: {}", ENV_NAME, env, ec.message());
    Ensure(
        fs::is_regular_file(path, ec), "{}={} does not name a file", ENV_NAME,
        path.string()
    );
  } else if (const auto found = findPath(workingDir)) {
    path = found.value();
  } else {
    spdlog::debug("No {} found; using defaults", FILE_NAME);
    return Ok(Config{});
  }

  spdlog::debug("Loading config from {}", path.string());
  toml::value data;
  try {
    data = toml::parse(path);
  } catch (const std::exception& e) {
    Bail("cannot parse {}: {}", path.string(), e.what());
  }
  return tryFromToml(data, path).with_context([&path] {
    return anyhow::anyhow("invalid {}", path.string());
  });
}

}  // namespace gocov

#ifdef GOCOV_TEST

#  include "Rustify/Tests.hpp"

#  include <toml11/fwd/literal_fwd.hpp>

namespace tests {

// NOLINTBEGIN
using namespace gocov;
using namespace toml::literals::toml_literals;
// NOLINTEND

static void
testEmptyConfig() {
  const Config config = Config::tryFromToml(""_toml).unwrap();
  assertFalse(config.goBin.has_value());
  assertFalse(config.buildFlags.has_value());
  assertFalse(config.buildOutput.has_value());
  assertFalse(config.runExec.has_value());
  assertFalse(config.runArgs.has_value());
  assertFalse(config.baseDir.has_value());
  assertFalse(config.keepWorkspace);
  assertTrue(config.excludes.empty());
  assertFalse(config.listHost.has_value());
  assertFalse(config.listWide);

  pass();
}

static void
testFullConfig() {
  const toml::value val = R"(
    [toolchain]
    go = "/usr/local/go/bin/go"

    [build]
    flags = ["-v", "-ldflags", "-s -w"]
    output = "bin/app"

    [run]
    exec = "xprog"
    args = ["--port", "80"]

    [workspace]
    base-dir = "tmp"
    keep = true
    exclude = [".git", "node_modules"]

    [list]
    host = "http://127.0.0.1:7777"
    wide = true

    [unknown]
    ignored = 1
  )"_toml;

  const Config config =
      Config::tryFromToml(val, "/home/u/app/gocov.toml").unwrap();
  assertEq(config.goBin.value(), "/usr/local/go/bin/go");
  assertEq(
      config.buildFlags.value(),
      (std::vector<std::string>{ "-v", "-ldflags", "-s -w" })
  );
  assertEq(config.buildOutput.value(), "bin/app");
  assertEq(config.runExec.value(), "xprog");
  assertEq(
      config.runArgs.value(), (std::vector<std::string>{ "--port", "80" })
  );
  assertEq(config.baseDir.value(), fs::path("/home/u/app/tmp"));
  assertTrue(config.keepWorkspace);
  assertEq(
      config.excludes, (std::vector<std::string>{ ".git", "node_modules" })
  );
  assertEq(config.listHost.value(), "http://127.0.0.1:7777");
  assertTrue(config.listWide);
  assertEq(config.path, fs::path("/home/u/app/gocov.toml"));

  pass();
}

static void
testMistypedConfig() {
  assertTrue(Config::tryFromToml(R"(
    [build]
    flags = "-v"
  )"_toml)
                 .is_err());
  assertTrue(Config::tryFromToml(R"(
    [workspace]
    keep = "yes"
  )"_toml)
                 .is_err());
  assertTrue(Config::tryFromToml(R"(
    build = 1
  )"_toml)
                 .is_err());
  assertTrue(Config::tryFromToml(R"(
    [workspace]
    exclude = ["/abs"]
  )"_toml)
                 .is_err());

  pass();
}

static void
testLoadSearchesParents() {
  const TempDir tmp;
  writeFile(
      tmp.path() / "proj" / Config::FILE_NAME,
      "[toolchain]\ngo = \"go1.21\"\n"
  );
  fs::create_directories(tmp.path() / "proj/cmd/app");

  ::unsetenv(Config::ENV_NAME);
  const Config config = Config::load(tmp.path() / "proj/cmd/app").unwrap();
  assertEq(config.goBin.value_or(""), "go1.21");
  assertEq(config.path, tmp.path() / "proj" / Config::FILE_NAME);

  pass();
}

static void
testLoadFromEnv() {
  const TempDir tmp;
  const fs::path path = tmp.path() / "custom.toml";
  writeFile(path, "[list]\nwide = true\n");

  ::setenv(Config::ENV_NAME, path.c_str(), 1);
  const Config config = Config::load(tmp.path()).unwrap();
  assertTrue(config.listWide);

  ::setenv(Config::ENV_NAME, (tmp.path() / "missing.toml").c_str(), 1);
  assertTrue(Config::load(tmp.path()).is_err());
  ::unsetenv(Config::ENV_NAME);

  pass();
}

static void
testLoadSyntaxError() {
  const TempDir tmp;
  writeFile(tmp.path() / Config::FILE_NAME, "[build\nflags = \n");

  ::unsetenv(Config::ENV_NAME);
  assertTrue(Config::load(tmp.path()).is_err());

  pass();
}

}  // namespace tests

int
main() {
  tests::testEmptyConfig();
  tests::testFullConfig();
  tests::testMistypedConfig();
  tests::testLoadSearchesParents();
  tests::testLoadFromEnv();
  tests::testLoadSyntaxError();
}

#endif
