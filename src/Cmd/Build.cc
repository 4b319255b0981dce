#include "../Cli.hpp"
#include "../Cmd.hpp"
#include "../Config.hpp"
#include "../Diag.hpp"
#include "../Rustify/Result.hpp"
#include "../Workspace.hpp"
#include "Common.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace gocov {

static Result<void> buildMain(CliArgsView args);

const Subcmd BUILD_CMD =
    Subcmd{ "build" }
        .setDesc("Compile the package in the current directory out of tree")
        .addOpt(OPT_BUILDFLAGS)
        .addOpt(
            Opt{ "--output" }
                .setShort("-o")
                .setDesc("Write the binary to PATH")
                .setPlaceholder("<PATH>")
        )
        .addOpt(OPT_JOBS)
        .addOpt(OPT_KEEP_WORKSPACE)
        .addArg(
            Arg{ "PACKAGE" }
                .setDesc("Package to build; only `.` is supported")
                .setRequired(false)
        )
        .setMainFn(buildMain);

static Result<void>
buildMain(const CliArgsView args) {
  // Parse args
  WorkspaceArgs wsArgs;
  std::optional<std::string> output;
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = Try(Cli::handleGlobalOpts(itr, args.end(), "build"));
    if (control == Cli::Return) {
      return Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (Try(parseWorkspaceOpt(itr, args.end(), wsArgs))) {
      continue;
    } else if (arg == "-o" || arg == "--output") {
      if (itr + 1 == args.end()) {
        return Subcmd::missingOptArgumentFor(arg);
      }
      output = *++itr;
    } else if (!arg.starts_with('-') && !wsArgs.packageSpec.has_value()) {
      wsArgs.packageSpec = arg;
    } else {
      return BUILD_CMD.noSuchArg(arg);
    }
  }

  const Config config = Try(Config::load(fs::current_path()));
  WorkspaceOptions opts = Try(toWorkspaceOptions(config, wsArgs));
  if (!output.has_value()) {
    output = config.buildOutput.value_or("");
  }

  const auto start = std::chrono::steady_clock::now();
  fs::path target;
  Try(withWorkspace(
      std::move(opts), output.value(),
      wsArgs.keepWorkspace || config.keepWorkspace,
      [&](Workspace& ws) -> Result<void, Error> {
        Try(ws.build());
        target = ws.getTarget();
        return Ok();
      }
  ));
  const auto end = std::chrono::steady_clock::now();
  const std::chrono::duration<double> elapsed = end - start;

  Diag::info("Finished", "{} in {:.2f}s", target.string(), elapsed.count());
  return Ok();
}

}  // namespace gocov
