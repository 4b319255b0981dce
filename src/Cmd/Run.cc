#include "../Cli.hpp"
#include "../Cmd.hpp"
#include "../Config.hpp"
#include "../Rustify/Result.hpp"
#include "../Workspace.hpp"
#include "Common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gocov {

static Result<void> runMain(CliArgsView args);

const Subcmd RUN_CMD =
    Subcmd{ "run" }
        .setDesc("Run the package in the current directory out of tree")
        .addOpt(OPT_BUILDFLAGS)
        .addOpt(
            Opt{ "--exec" }
                .setDesc("Invoke the binary through PROG (go run -exec)")
                .setPlaceholder("<PROG>")
        )
        .addOpt(OPT_JOBS)
        .addOpt(OPT_KEEP_WORKSPACE)
        .addArg(
            Arg{ "PACKAGE" }
                .setDesc("Package to run; only `.` is supported")
                .setRequired(false)
        )
        .addArg(
            Arg{ "ARGS" }
                .setDesc("Arguments passed to the program")
                .setRequired(false)
                .setVariadic(true)
        )
        .setMainFn(runMain);

static Result<void>
runMain(const CliArgsView args) {
  // Parse args
  WorkspaceArgs wsArgs;
  std::optional<std::string> exec;
  auto itr = args.begin();
  for (; itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = Try(Cli::handleGlobalOpts(itr, args.end(), "run"));
    if (control == Cli::Return) {
      return Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (Try(parseWorkspaceOpt(itr, args.end(), wsArgs))) {
      continue;
    } else if (arg == "--exec") {
      if (itr + 1 == args.end()) {
        return Subcmd::missingOptArgumentFor(arg);
      }
      exec = *++itr;
    } else if (arg == "--") {
      ++itr;
      break;
    } else if (!arg.starts_with('-')) {
      // The package, then the program arguments.
      wsArgs.packageSpec = arg;
      ++itr;
      if (itr != args.end() && *itr == "--") {
        ++itr;
      }
      break;
    } else {
      return RUN_CMD.noSuchArg(arg);
    }
  }

  std::optional<std::vector<std::string>> runArgs;
  if (itr != args.end()) {
    runArgs.emplace(itr, args.end());
  }

  const Config config = Try(Config::load(fs::current_path()));
  WorkspaceOptions opts = Try(toWorkspaceOptions(config, wsArgs));
  if (exec.has_value()) {
    opts.runExec = exec.value();
  }
  opts.runArgs =
      runArgs.value_or(config.runArgs.value_or(std::vector<std::string>{}));

  return withWorkspace(
      std::move(opts), "", wsArgs.keepWorkspace || config.keepWorkspace,
      [](Workspace& ws) { return ws.run(); }
  );
}

}  // namespace gocov
