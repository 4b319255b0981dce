#include "../Cli.hpp"
#include "../Cmd.hpp"
#include "../CurlVersion.hpp"
#include "../Diag.hpp"
#include "../Rustify/Result.hpp"

#include <array>
#include <cstddef>
#include <fmt/core.h>
#include <spdlog/version.h>
#include <string_view>
#include <tbb/version.h>

#ifndef GOCOV_PKG_VERSION
#  error "GOCOV_PKG_VERSION is not defined"
#endif

#ifndef GOCOV_COMMIT_SHORT_HASH
#  error "GOCOV_COMMIT_SHORT_HASH is not defined"
#endif

#ifndef GOCOV_COMMIT_HASH
#  error "GOCOV_COMMIT_HASH is not defined"
#endif

#ifndef GOCOV_COMMIT_DATE
#  error "GOCOV_COMMIT_DATE is not defined"
#endif

#if defined(__GNUC__) && !defined(__clang__)
#  define COMPILER_VERSION "GCC " __VERSION__
#else
#  define COMPILER_VERSION __VERSION__
#endif

namespace gocov {

static Result<void> versionMain(CliArgsView args);

const Subcmd VERSION_CMD =  //
    Subcmd{ "version" }
        .setDesc("Show version information")
        .setMainFn(versionMain);

static consteval std::string_view
commitInfo() noexcept {
  if (sizeof(GOCOV_COMMIT_SHORT_HASH) <= 1 && sizeof(GOCOV_COMMIT_DATE) <= 1) {
    return "";
  } else if (sizeof(GOCOV_COMMIT_SHORT_HASH) <= 1) {
    return " (" GOCOV_COMMIT_DATE ")";
  } else if (sizeof(GOCOV_COMMIT_DATE) <= 1) {
    return " (" GOCOV_COMMIT_SHORT_HASH ")";
  } else {
    return " (" GOCOV_COMMIT_SHORT_HASH " " GOCOV_COMMIT_DATE ")";
  }
}

// `Mmm dd yyyy` as in __DATE__ to `yyyy-mm-dd`.
static consteval std::array<char, 11>
isoDate(const std::string_view date) noexcept {
  constexpr std::string_view months = "JanFebMarAprMayJunJulAugSepOctNovDec";
  const std::size_t month = months.find(date.substr(0, 3)) / 3 + 1;
  return { date[7],
           date[8],
           date[9],
           date[10],
           '-',
           static_cast<char>('0' + month / 10),
           static_cast<char>('0' + month % 10),
           '-',
           date[4] == ' ' ? '0' : date[4],
           date[5],
           '\0' };
}

static constexpr std::array<char, 11> COMPILE_DATE = isoDate(__DATE__);

static Result<void>
versionMain(const CliArgsView args) {
  // Parse args
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = Try(Cli::handleGlobalOpts(itr, args.end(), "version"));
    if (control == Cli::Return) {
      return Ok();
    } else if (control == Cli::Continue) {
      continue;
    }
    return VERSION_CMD.noSuchArg(arg);
  }

  fmt::print("gocov {}{}\n", GOCOV_PKG_VERSION, commitInfo());
  if (isVerbose()) {
    fmt::print(
        "release: {}\n"
        "commit-hash: {}\n"
        "commit-date: {}\n"
        "compiler: {}\n"
        "compile-date: {}\n"
        "libcurl: {}\n"
        "oneTBB: {}\n"
        "spdlog: {}.{}.{}\n",
        GOCOV_PKG_VERSION, GOCOV_COMMIT_HASH, GOCOV_COMMIT_DATE,
        COMPILER_VERSION, COMPILE_DATE.data(), CurlVersion(),
        TBB_runtime_version(), SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR,
        SPDLOG_VER_PATCH
    );
  }

  return Ok();
}

}  // namespace gocov
