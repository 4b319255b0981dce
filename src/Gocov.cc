#include "Gocov.hpp"

#include "Algos.hpp"
#include "Cli.hpp"
#include "Cmd.hpp"
#include "Diag.hpp"
#include "Rustify/Result.hpp"
#include "TermColor.hpp"

#include <cstdlib>
#include <spdlog/cfg/env.h>
#include <spdlog/version.h>
#include <string>
#include <utility>

namespace gocov {

const Cli&
getCli() noexcept {
  static const Cli cli =  //
      Cli{ "gocov" }
          .setDesc("Build and run Go programs in a relocated workspace")
          .addOpt(
              Opt{ "--verbose" }
                  .setShort("-v")
                  .setDesc("Use verbose output (-vv very verbose output)")
                  .setGlobal(true)
          )
          .addOpt(
              Opt{ "-vv" }
                  .setShort("-vv")
                  .setDesc("Use very verbose output")
                  .setGlobal(true)
                  .setHidden(true)
          )
          .addOpt(
              Opt{ "--quiet" }
                  .setShort("-q")
                  .setDesc("Do not print gocov log messages")
                  .setGlobal(true)
          )
          .addOpt(
              Opt{ "--color" }
                  .setDesc("Coloring: auto, always, never")
                  .setPlaceholder("<WHEN>")
                  .setGlobal(true)
          )
          .addOpt(
              Opt{ "--help" }  //
                  .setShort("-h")
                  .setDesc("Print help")
                  .setGlobal(true)
          )
          .addOpt(
              Opt{ "--version" }
                  .setShort("-V")
                  .setDesc("Print version info and exit")
          )
          .addSubcmd(BUILD_CMD)
          .addSubcmd(RUN_CMD)
          .addSubcmd(LIST_CMD)
          .addSubcmd(HELP_CMD)
          .addSubcmd(VERSION_CMD);
  return cli;
}

static std::string
colorizeAnyhowError(std::string s) {
  if (s.find("Caused by:") != std::string::npos) {
    s = replaceAll(std::move(s), "Caused by:", Yellow("Caused by:").toErrStr());
  }
  if (!s.empty() && s.back() == '\n') {
    s.pop_back();  // Diag::error adds one.
  }
  return s;
}

static void
warnUnusedLogEnv() {
#if SPDLOG_VERSION > 11500
  if (std::getenv("SPDLOG_LEVEL")) {
    Diag::warn("SPDLOG_LEVEL is set but not used. Use GOCOV_LOG instead.");
  }
#else
  if (std::getenv("GOCOV_LOG")) {
    Diag::warn("GOCOV_LOG is set but not used. Use SPDLOG_LEVEL instead.");
  }
#endif
}

Result<void, void>
gocovMain(int argc, char* argv[]) noexcept {  // NOLINT(*-avoid-c-arrays)
  // Set up logger
  spdlog::cfg::load_env_levels(
#if SPDLOG_VERSION > 11500
      "GOCOV_LOG"
#endif
  );
  warnUnusedLogEnv();

  return getCli()
      .parseArgs(argc, argv)
      .map_err([](const auto& e) { return colorizeAnyhowError(e->what()); })
      .map_err([](std::string e) { Diag::error("{}", std::move(e)); });
}

}  // namespace gocov
