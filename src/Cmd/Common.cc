#include "Common.hpp"

#include "../Algos.hpp"
#include "../Cli.hpp"
#include "../Config.hpp"
#include "../Diag.hpp"
#include "../Error.hpp"
#include "../Parallelism.hpp"
#include "../Rustify/Result.hpp"
#include "../Workspace.hpp"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace gocov {

Result<void>
parseJobs(const std::string_view arg) {
  std::uint64_t numThreads{};
  const auto [ptr, ec] =
      std::from_chars(arg.data(), arg.data() + arg.size(), numThreads);
  Ensure(
      ec == std::errc() && ptr == arg.data() + arg.size() && numThreads > 0,
      "invalid number of threads: {}", arg
  );
  setParallelism(numThreads);
  return Ok();
}

Result<bool>
parseWorkspaceOpt(
    CliArgsView::iterator& itr, const CliArgsView::iterator end,
    WorkspaceArgs& args
) {
  const std::string_view arg = *itr;
  if (arg == "--buildflags") {
    if (itr + 1 == end) {
      return Subcmd::missingOptArgumentFor(arg);
    }
    args.buildFlags = *++itr;
  } else if (arg == "-j" || arg == "--jobs") {
    if (itr + 1 == end) {
      return Subcmd::missingOptArgumentFor(arg);
    }
    Try(parseJobs(*++itr));
  } else if (arg == "--keep-workspace") {
    args.keepWorkspace = true;
  } else {
    return Ok(false);
  }
  return Ok(true);
}

Result<WorkspaceOptions>
toWorkspaceOptions(const Config& config, const WorkspaceArgs& args) {
  WorkspaceOptions opts;
  if (args.packageSpec.has_value()) {
    opts.packageSpec = args.packageSpec.value();
  }
  opts.workingDir = fs::current_path();
  if (config.goBin.has_value()) {
    opts.goBin = config.goBin.value();
  }

  if (args.buildFlags.has_value()) {
    opts.buildFlags = Try(splitArgs(args.buildFlags.value()));
  } else if (config.buildFlags.has_value()) {
    opts.buildFlags = config.buildFlags.value();
  }
  if (config.runExec.has_value()) {
    opts.runExec = config.runExec.value();
  }

  if (config.baseDir.has_value()) {
    opts.baseDir = config.baseDir.value();
  }
  for (const std::string& exclude : config.excludes) {
    opts.excludes.emplace_back(exclude);
  }
  return Ok(std::move(opts));
}

static void
cleanup(const Workspace& ws, const bool keep) noexcept {
  const fs::path& dir = ws.getTmpDir();
  if (dir.empty()) {
    return;
  }
  if (keep) {
    Diag::info("Keeping", "{}", dir.string());
    return;
  }

  std::error_code ec;
  fs::remove_all(dir, ec);
  if (ec) {
    Diag::warn("failed to remove {}: {}", dir.string(), ec.message());
  } else {
    spdlog::debug("Removed workspace {}", dir.string());
  }
}

Result<void>
withWorkspace(
    WorkspaceOptions opts, const std::string& output, const bool keep,
    const std::function<Result<void, Error>(Workspace&)>& action
) {
  Workspace ws = Try(Workspace::init(std::move(opts)).map_err(toAnyhow));
  Try(ws.relocate().map_err(toAnyhow));

  const auto runAction = [&]() -> Result<void, Error> {
    Try(ws.resolveTarget(output));
    return action(ws);
  };
  const Result<void, Error> res = runAction();
  cleanup(ws, keep);
  if (res.is_err()) {
    return Err(res.unwrap_err().toAnyhow());
  }
  return Ok();
}

}  // namespace gocov

#ifdef GOCOV_TEST

#  include "../Rustify/Tests.hpp"

#  include <vector>

namespace tests {

using namespace gocov;  // NOLINT(build/namespaces,google-build-using-namespace)

static void
testParseJobs() {
  assertTrue(parseJobs("4").is_ok());
  assertTrue(parseJobs("1").is_ok());
  assertEq(getParallelism(), 1UL);
  assertFalse(isParallel());

  assertEq(
      std::string(parseJobs("0").unwrap_err()->what()),
      "invalid number of threads: 0"
  );
  assertTrue(parseJobs("four").is_err());
  assertTrue(parseJobs("4x").is_err());
  assertTrue(parseJobs("-2").is_err());
  assertTrue(parseJobs("").is_err());

  pass();
}

static void
testParseWorkspaceOpt() {
  const std::vector<std::string> args{ "--buildflags", "-v -race",
                                       "--keep-workspace", "-j", "1",
                                       "--output" };
  WorkspaceArgs parsed;
  auto itr = CliArgsView{ args }.begin();
  const auto end = CliArgsView{ args }.end();

  assertTrue(parseWorkspaceOpt(itr, end, parsed).unwrap());
  assertEq(parsed.buildFlags.value(), "-v -race");
  ++itr;
  assertTrue(parseWorkspaceOpt(itr, end, parsed).unwrap());
  assertTrue(parsed.keepWorkspace);
  ++itr;
  assertTrue(parseWorkspaceOpt(itr, end, parsed).unwrap());
  assertEq(getParallelism(), 1UL);
  ++itr;
  assertFalse(parseWorkspaceOpt(itr, end, parsed).unwrap());
  assertEq(*itr, "--output");

  const std::vector<std::string> dangling{ "--buildflags" };
  auto itr2 = CliArgsView{ dangling }.begin();
  assertEq(
      std::string(parseWorkspaceOpt(itr2, CliArgsView{ dangling }.end(), parsed)
                      .unwrap_err()
                      ->what()),
      "Missing argument for `--buildflags`"
  );

  pass();
}

static void
testCommandLineOverridesConfig() {
  Config config;
  config.goBin = "/opt/go/bin/go";
  config.buildFlags = std::vector<std::string>{ "-tags", "integration" };
  config.runExec = "xprog";
  config.baseDir = "/var/tmp";
  config.excludes = { ".git", "node_modules" };

  const WorkspaceOptions fromConfig =
      toWorkspaceOptions(config, WorkspaceArgs{}).unwrap();
  assertEq(fromConfig.packageSpec, ".");
  assertEq(fromConfig.workingDir, fs::current_path());
  assertEq(fromConfig.goBin, "/opt/go/bin/go");
  assertEq(
      fromConfig.buildFlags, std::vector<std::string>{ "-tags", "integration" }
  );
  assertEq(fromConfig.runExec, "xprog");
  assertEq(fromConfig.baseDir, fs::path("/var/tmp"));
  assertEq(
      fromConfig.excludes, std::vector<fs::path>{ ".git", "node_modules" }
  );

  WorkspaceArgs args;
  args.buildFlags = R"(-ldflags "-X main.version=1.0" -v)";
  args.packageSpec = "./...";
  const WorkspaceOptions overridden = toWorkspaceOptions(config, args).unwrap();
  assertEq(
      overridden.buildFlags,
      std::vector<std::string>{ "-ldflags", "-X main.version=1.0", "-v" }
  );
  assertEq(overridden.packageSpec, "./...");

  args.buildFlags = "-ldflags 'unterminated";
  assertTrue(toWorkspaceOptions(config, args).is_err());

  pass();
}

static void
testDefaultsWithoutConfig() {
  const WorkspaceOptions opts =
      toWorkspaceOptions(Config{}, WorkspaceArgs{}).unwrap();
  assertEq(opts.goBin, "go");
  assertTrue(opts.buildFlags.empty());
  assertTrue(opts.runExec.empty());
  assertTrue(opts.baseDir.empty());
  assertTrue(opts.excludes.empty());

  pass();
}

static void
testWithWorkspaceRejectsPackageSpec() {
  WorkspaceOptions opts;
  opts.packageSpec = "./cmd/server";
  bool called = false;
  const auto res =
      withWorkspace(opts, "", false, [&](Workspace&) -> Result<void, Error> {
        called = true;
        return Ok();
      });
  assertTrue(res.is_err());
  assertTrue(
      std::string(res.unwrap_err()->what()).starts_with("invalid package spec")
  );
  assertFalse(called);

  pass();
}

}  // namespace tests

int
main() {
  tests::testParseJobs();
  tests::testParseWorkspaceOpt();
  tests::testCommandLineOverridesConfig();
  tests::testDefaultsWithoutConfig();
  tests::testWithWorkspaceRejectsPackageSpec();
}

#endif
