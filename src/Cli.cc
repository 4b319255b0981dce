#include "Cli.hpp"

#include "Algos.hpp"
#include "Diag.hpp"
#include "Rustify/Result.hpp"
#include "TermColor.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <fmt/core.h>
#include <functional>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gocov {

static constexpr std::string_view PADDING = "  ";

// `left` is colored; `leftSize` is its visible width.
static std::string
formatRow(
    const std::string_view left, const std::size_t leftSize,
    const std::size_t offset, const std::string_view desc
) {
  std::string str(PADDING);
  str += left;
  str.append(offset + PADDING.size() - std::min(offset, leftSize), ' ');
  str += desc;
  return str;
}

static std::string
formatHeader(const std::string_view header) {
  return fmt::format("{}\n", Bold(Green(header)).toStr());
}

static void
addOptCandidates(
    std::vector<std::string_view>& candidates, const std::vector<Opt>& opts
) {
  for (const Opt& opt : opts) {
    if (opt.isHidden) {
      continue;
    }
    candidates.push_back(opt.name);
    if (!opt.shortName.empty()) {
      candidates.push_back(opt.shortName);
    }
  }
}

static std::string
suggest(
    const std::string_view arg,
    const std::span<const std::string_view> candidates
) {
  if (const auto similar = findSimilarStr(arg, candidates)) {
    return fmt::format(
        "{} did you mean '{}'?\n\n", Bold(Cyan("Tip:")).toErrStr(),
        Bold(Yellow(similar.value())).toErrStr()
    );
  }
  return "";
}

static std::size_t
maxShortSizeOf(const std::vector<Opt>& opts) noexcept {
  std::size_t size = 0;
  for (const Opt& opt : opts) {
    if (!opt.isHidden) {
      size = std::max(size, opt.shortName.size());
    }
  }
  return size;
}

static std::size_t
maxOffsetOf(const std::vector<Opt>& opts, const std::size_t maxShortSize) {
  std::size_t offset = 0;
  for (const Opt& opt : opts) {
    if (!opt.isHidden) {
      offset = std::max(offset, opt.leftSize(maxShortSize));
    }
  }
  return offset;
}

static std::string
formatOpts(
    const std::vector<Opt>& opts, const std::size_t maxShortSize,
    const std::size_t maxOffset
) {
  std::string str;
  for (const Opt& opt : opts) {
    if (!opt.isHidden) {
      str += opt.format(maxShortSize, maxOffset);
    }
  }
  return str;
}

std::string
Opt::format(const std::size_t maxShortSize, const std::size_t maxOffset) const {
  std::string left;
  if (!shortName.empty()) {
    left += Bold(Cyan(shortName)).toStr();
    left += ", ";
    left.append(maxShortSize - shortName.size(), ' ');
  } else {
    left.append(maxShortSize + 2, ' ');
  }
  left += Bold(Cyan(name)).toStr();
  if (takesArg()) {
    left += ' ';
    left += Cyan(placeholder).toStr();
  }

  std::string str = formatRow(left, leftSize(maxShortSize), maxOffset, desc);
  if (!defaultVal.empty()) {
    str += fmt::format(" [default: {}]", defaultVal);
  }
  str += '\n';
  return str;
}

std::string
Arg::getLeft() const {
  std::string left = required ? "<" : "[";
  left += name;
  left += required ? ">" : "]";
  if (variadic) {
    left += "...";
  }
  return left;
}

Subcmd&
Subcmd::setDesc(const std::string_view desc) noexcept {
  this->desc = desc;
  return *this;
}
Subcmd&
Subcmd::addOpt(Opt opt) {
  localOpts.push_back(opt);
  return *this;
}
Subcmd&
Subcmd::addArg(Arg arg) {
  args.push_back(arg);
  return *this;
}
Subcmd&
Subcmd::setMainFn(std::function<MainFn> mainFn) noexcept {
  this->mainFn = std::move(mainFn);
  return *this;
}

bool
Subcmd::hasTrailingArgs() const noexcept {
  return std::ranges::any_of(args, &Arg::variadic);
}

const Opt*
Subcmd::findOpt(const std::string_view arg) const noexcept {
  for (const auto* opts : { &globalOpts, &localOpts }) {
    const auto itr = std::ranges::find_if(*opts, [arg](const Opt& opt) {
      return opt.is(arg);
    });
    if (itr != opts->end()) {
      return &*itr;
    }
  }
  return nullptr;
}

std::string
Subcmd::formatUsage(const bool toStderr) const {
  const auto paint = [toStderr](const ColorStr& str) {
    return toStderr ? str.toErrStr() : str.toStr();
  };

  std::string str = paint(Bold(Green("Usage: ")));
  str += paint(Bold(Cyan(cmdName)));
  str += ' ';
  str += paint(Bold(Cyan(name)));
  str += ' ';
  str += paint(Cyan("[OPTIONS]"));
  for (const Arg& arg : args) {
    str += ' ';
    str += paint(Cyan(arg.getLeft()));
  }
  return str;
}

AnyhowErr
Subcmd::noSuchArg(const std::string_view arg) const {
  std::vector<std::string_view> candidates;
  addOptCandidates(candidates, globalOpts);
  addOptCandidates(candidates, localOpts);

  return anyhow::anyhow(
      "unexpected argument '{}' found\n\n"
      "{}"
      "{}\n\n"
      "For more information, try '{}'",
      Bold(Yellow(arg)).toErrStr(), suggest(arg, candidates),
      formatUsage(true), Bold(Cyan("--help")).toErrStr()
  );
}

AnyhowErr
Subcmd::missingOptArgumentFor(const std::string_view arg) noexcept {
  return anyhow::anyhow("Missing argument for `{}`", arg);
}

std::string
Subcmd::formatHelp() const {
  const std::size_t maxShortSize =
      std::max(maxShortSizeOf(globalOpts), maxShortSizeOf(localOpts));
  std::size_t maxOffset = std::max(
      maxOffsetOf(globalOpts, maxShortSize),
      maxOffsetOf(localOpts, maxShortSize)
  );
  for (const Arg& arg : args) {
    if (!arg.desc.empty()) {
      maxOffset = std::max(maxOffset, arg.getLeft().size());
    }
  }

  std::string str(desc);
  str += "\n\n";
  str += formatUsage(false);
  str += "\n\n";
  str += formatHeader("Options:");
  str += formatOpts(globalOpts, maxShortSize, maxOffset);
  str += formatOpts(localOpts, maxShortSize, maxOffset);

  if (!args.empty()) {
    str += '\n';
    str += formatHeader("Arguments:");
    for (const Arg& arg : args) {
      const std::string left = arg.getLeft();
      str += formatRow(Cyan(left).toStr(), left.size(), maxOffset, arg.desc);
      str += '\n';
    }
  }
  return str;
}

Cli&
Cli::setDesc(const std::string_view desc) noexcept {
  this->desc = desc;
  return *this;
}
Cli&
Cli::addOpt(Opt opt) {
  if (opt.isGlobal) {
    globalOpts.push_back(opt);
  } else {
    localOpts.push_back(opt);
  }
  return *this;
}
Cli&
Cli::addSubcmd(Subcmd subcmd) {
  subcmd.cmdName = name;
  subcmd.globalOpts = globalOpts;
  subcmds.push_back(std::move(subcmd));
  return *this;
}

const Subcmd*
Cli::findSubcmd(const std::string_view name) const noexcept {
  const auto itr = std::ranges::find(subcmds, name, &Subcmd::name);
  return itr == subcmds.end() ? nullptr : &*itr;
}

AnyhowErr
Cli::noSuchArg(const std::string_view arg) const {
  std::vector<std::string_view> candidates;
  for (const Subcmd& cmd : subcmds) {
    candidates.push_back(cmd.name);
  }
  addOptCandidates(candidates, globalOpts);
  addOptCandidates(candidates, localOpts);

  return anyhow::anyhow(
      "unexpected argument '{}' found\n\n"
      "{}"
      "For a list of commands, try '{}'",
      Bold(Yellow(arg)).toErrStr(), suggest(arg, candidates),
      Bold(Cyan(fmt::format("{} help", name))).toErrStr()
  );
}

Result<Cli::ControlFlow>
Cli::handleGlobalOpts(
    CliArgsView::iterator& itr, const CliArgsView::iterator end,
    const std::string_view subcmd
) {
  const std::string_view arg = *itr;

  if (arg == "-h" || arg == "--help") {
    if (subcmd.empty()) {
      return getCli().printHelp({}).map([] { return Return; });
    }
    const std::string name(subcmd);
    return getCli().printHelp({ &name, 1 }).map([] { return Return; });
  } else if (arg == "-v" || arg == "--verbose") {
    setDiagLevel(DiagLevel::Verbose);
    return Ok(Continue);
  } else if (arg == "-vv") {
    setDiagLevel(DiagLevel::VeryVerbose);
    return Ok(Continue);
  } else if (arg == "-q" || arg == "--quiet") {
    setDiagLevel(DiagLevel::Off);
    return Ok(Continue);
  } else if (arg == "--color") {
    Ensure(itr + 1 < end, "missing argument for `--color`");
    setColorMode(*++itr);
    return Ok(Continue);
  }
  return Ok(Fallthrough);
}

Result<void>
Cli::parseArgs(const int argc, char* argv[]) const {
  // Drop the program name.
  const std::vector<std::string> args =
      Try(expandOpts({ argv + 1, argv + argc }));
  return parseArgs(CliArgsView{ args });
}

// Global options go before the subcommand, though they are accepted after
// it too:
//   gocov --verbose run --exec wrapper . --color never
//   ^^^^^^^^^^^^^^^ ^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^
Result<void>
Cli::parseArgs(const CliArgsView args) const {
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = Try(handleGlobalOpts(itr, args.end()));
    if (control == Return) {
      return Ok();
    } else if (control == Continue) {
      continue;
    } else if (arg == "-V" || arg == "--version") {
      return findSubcmd("version")->mainFn({ itr + 1, args.end() });
    } else if (const Subcmd* cmd = findSubcmd(arg)) {
      try {
        return cmd->mainFn({ itr + 1, args.end() });
      } catch (const std::exception& e) {
        Bail(e.what());
      }
    } else {
      return noSuchArg(arg);
    }
  }
  return printHelp({});
}

Result<std::vector<std::string>>
Cli::expandOpts(const std::span<const char* const> args) const {
  const Subcmd* curSubcmd = nullptr;
  const auto findOpt = [&](const std::string_view arg) -> const Opt* {
    if (curSubcmd != nullptr) {
      return curSubcmd->findOpt(arg);
    }
    for (const auto* opts : { &globalOpts, &localOpts }) {
      const auto itr = std::ranges::find_if(*opts, [arg](const Opt& opt) {
        return opt.is(arg);
      });
      if (itr != opts->end()) {
        return &*itr;
      }
    }
    return nullptr;
  };
  const auto maxShortSize = [&] {
    std::size_t size = 0;
    for (const auto* opts : { &globalOpts, &localOpts }) {
      for (const Opt& opt : *opts) {
        size = std::max(size, opt.shortName.size());
      }
    }
    if (curSubcmd != nullptr) {
      for (const Opt& opt : curSubcmd->localOpts) {
        size = std::max(size, opt.shortName.size());
      }
    }
    return size;
  };

  std::vector<std::string> expanded;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view arg = args[i];

    if (curSubcmd == nullptr && !arg.starts_with('-')) {
      curSubcmd = findSubcmd(arg);
      if (curSubcmd == nullptr) {
        return noSuchArg(arg);
      }
      expanded.emplace_back(arg);
      continue;
    }

    if (arg == "--"
        || (!arg.starts_with('-') && curSubcmd->hasTrailingArgs())) {
      expanded.insert(expanded.end(), args.begin() + i, args.end());
      break;
    }

    // "--color always" and "--color=always" => ["--color", "always"]
    if (arg.starts_with("--")) {
      const auto eqPos = arg.find('=');
      const std::string_view optName = arg.substr(0, eqPos);
      if (const Opt* opt = findOpt(optName)) {
        if (!opt->takesArg()) {
          expanded.emplace_back(arg);
        } else if (eqPos != std::string_view::npos) {
          if (eqPos + 1 == arg.size()) {
            return Subcmd::missingOptArgumentFor(optName);
          }
          expanded.emplace_back(optName);
          expanded.emplace_back(arg.substr(eqPos + 1));
        } else if (i + 1 < args.size()) {
          expanded.emplace_back(arg);
          expanded.emplace_back(args[++i]);
        } else {
          return Subcmd::missingOptArgumentFor(arg);
        }
        continue;
      }
    }

    // "-vvvj4" => ["-vv", "-v", "-j", "4"], matching the longest name first
    else if (arg.starts_with('-') && arg.size() > 1) {
      const std::size_t maxLen = std::max<std::size_t>(maxShortSize(), 2) - 1;
      std::vector<std::string> pieces;
      bool handled = true;
      for (std::size_t pos = 1; pos < arg.size();) {
        const Opt* opt = nullptr;
        std::size_t len = std::min(maxLen, arg.size() - pos);
        for (; len > 0; --len) {
          opt = findOpt(fmt::format("-{}", arg.substr(pos, len)));
          if (opt != nullptr) {
            break;
          }
        }
        if (opt == nullptr) {
          handled = false;
          break;
        }

        pieces.emplace_back(opt->shortName);
        pos += len;
        if (opt->takesArg()) {
          if (pos < arg.size()) {
            pieces.emplace_back(arg.substr(pos));
          } else if (i + 1 < args.size()) {
            pieces.emplace_back(args[++i]);
          } else {
            return Subcmd::missingOptArgumentFor(opt->shortName);
          }
          break;
        }
      }
      if (handled) {
        std::ranges::move(pieces, std::back_inserter(expanded));
        continue;
      }
    }

    // Unknown arguments are checked by the subcommand.
    expanded.emplace_back(arg);
  }
  return Ok(expanded);
}

std::string
Cli::formatHelp() const {
  const std::size_t maxShortSize =
      std::max(maxShortSizeOf(globalOpts), maxShortSizeOf(localOpts));
  std::size_t maxOffset = std::max(
      maxOffsetOf(globalOpts, maxShortSize),
      maxOffsetOf(localOpts, maxShortSize)
  );
  for (const Subcmd& cmd : subcmds) {
    maxOffset = std::max(maxOffset, cmd.name.size());
  }

  std::string str(desc);
  str += "\n\n";
  str += Bold(Green("Usage: ")).toStr();
  str += Bold(Cyan(name)).toStr();
  str += ' ';
  str += Cyan("[OPTIONS] [COMMAND]").toStr();
  str += "\n\n";
  str += formatHeader("Options:");
  str += formatOpts(globalOpts, maxShortSize, maxOffset);
  str += formatOpts(localOpts, maxShortSize, maxOffset);
  str += '\n';
  str += formatHeader("Commands:");
  for (const Subcmd& cmd : subcmds) {
    str += formatRow(
        Bold(Cyan(cmd.name)).toStr(), cmd.name.size(), maxOffset, cmd.desc
    );
    str += '\n';
  }
  str += '\n';
  str += fmt::format(
      "See '{} {} {}' for more information on a specific command.\n",
      Bold(Cyan(name)).toStr(), Bold(Cyan("help")).toStr(),
      Cyan("<command>").toStr()
  );
  return str;
}

Result<void>
Cli::printHelp(const CliArgsView args) const {
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = Try(handleGlobalOpts(itr, args.end(), "help"));
    if (control == Return) {
      return Ok();
    } else if (control == Continue) {
      continue;
    } else if (const Subcmd* cmd = findSubcmd(arg)) {
      fmt::print("{}", cmd->formatHelp());
      return Ok();
    } else {
      return noSuchArg(arg);
    }
  }

  fmt::print("{}", formatHelp());
  return Ok();
}

}  // namespace gocov

#ifdef GOCOV_TEST

#  include "Rustify/Tests.hpp"

namespace tests {

using namespace gocov;  // NOLINT(build/namespaces,google-build-using-namespace)

static const Cli&
testCli() {
  static const Cli cli =  //
      Cli{ "gocov" }
          .addOpt(Opt{ "--verbose" }.setShort("-v").setGlobal(true))
          .addOpt(Opt{ "-vv" }.setShort("-vv").setGlobal(true).setHidden(true))
          .addOpt(Opt{ "--color" }.setPlaceholder("<WHEN>").setGlobal(true))
          .addSubcmd(
              Subcmd{ "run" }
                  .addOpt(Opt{ "--exec" }.setPlaceholder("<CMD>"))
                  .addOpt(
                      Opt{ "--jobs" }.setShort("-j").setPlaceholder("<NUM>")
                  )
                  .addArg(Arg{ "PACKAGE" }.setRequired(false))
                  .addArg(Arg{ "ARGS" }.setRequired(false).setVariadic(true))
          )
          .addSubcmd(Subcmd{ "build" }.addOpt(
              Opt{ "--output" }.setShort("-o").setPlaceholder("<PATH>")
          ))
          .addSubcmd(Subcmd{ "list" }.addOpt(Opt{ "--wide" }.setShort("-w")));
  return cli;
}

static std::vector<std::string>
expand(const std::vector<const char*>& args) {
  return testCli().expandOpts(args).unwrap();
}

static std::string
expandErr(const std::vector<const char*>& args) {
  return testCli().expandOpts(args).unwrap_err()->what();
}

static void
testExpandShortOpts() {
  assertEq(
      expand({ "run", "-vvvj4" }),
      std::vector<std::string>{ "run", "-vv", "-v", "-j", "4" }
  );
  assertEq(
      expand({ "run", "-j4vvv" }),
      std::vector<std::string>{ "run", "-j", "4vvv" }
  );
  assertEq(
      expand({ "run", "-j", "4" }),
      std::vector<std::string>{ "run", "-j", "4" }
  );
  assertEq(expandErr({ "run", "-vj" }), "Missing argument for `-j`");

  // `-j` only belongs to `run`.
  assertEq(
      expand({ "build", "-j" }), std::vector<std::string>{ "build", "-j" }
  );
  assertEq(
      expand({ "list", "-vw" }), std::vector<std::string>{ "list", "-v", "-w" }
  );
  // Unknown letters leave the whole argument untouched.
  assertEq(
      expand({ "list", "-wx" }), std::vector<std::string>{ "list", "-wx" }
  );

  pass();
}

static void
testExpandLongOpts() {
  assertEq(
      expand({ "build", "--output=bin/app" }),
      std::vector<std::string>{ "build", "--output", "bin/app" }
  );
  assertEq(
      expand({ "build", "--output", "bin/app" }),
      std::vector<std::string>{ "build", "--output", "bin/app" }
  );
  assertEq(
      expand({ "--color=never", "list" }),
      std::vector<std::string>{ "--color", "never", "list" }
  );
  assertEq(
      expandErr({ "build", "--output=" }), "Missing argument for `--output`"
  );
  assertEq(expandErr({ "build", "-o" }), "Missing argument for `-o`");
  assertEq(expandErr({ "--color" }), "Missing argument for `--color`");

  pass();
}

static void
testExpandKeepsProgramArgs() {
  assertEq(
      expand({ "run", "--exec", "sudo", ".", "--", "-vj4", "--output=x" }),
      std::vector<std::string>{ "run", "--exec", "sudo", ".", "--", "-vj4",
                                "--output=x" }
  );
  // A program argument that happens to be a subcommand name.
  assertEq(
      expand({ "run", ".", "build" }),
      std::vector<std::string>{ "run", ".", "build" }
  );
  // Everything after the package belongs to the program.
  assertEq(
      expand({ "run", "-j2", ".", "-vj4", "--exec=/x" }),
      std::vector<std::string>{ "run", "-j", "2", ".", "-vj4", "--exec=/x" }
  );
  assertEq(
      expand({ "run", "--exec", "sudo", ".", "-j" }),
      std::vector<std::string>{ "run", "--exec", "sudo", ".", "-j" }
  );
  // `build` takes no trailing arguments, so options after the package are
  // still gocov's.
  assertEq(
      expand({ "build", ".", "-o", "bin/app" }),
      std::vector<std::string>{ "build", ".", "-o", "bin/app" }
  );
  assertEq(expandErr({ "build", ".", "-o" }), "Missing argument for `-o`");

  pass();
}

static void
testUnknownSubcmd() {
  assertEq(
      expandErr({ "deploy" }),
      "unexpected argument 'deploy' found\n\n"
      "For a list of commands, try 'gocov help'"
  );
  assertEq(
      expandErr({ "buld" }),
      "unexpected argument 'buld' found\n\n"
      "Tip: did you mean 'build'?\n\n"
      "For a list of commands, try 'gocov help'"
  );

  pass();
}

static void
testSubcmdNoSuchArg() {
  const Subcmd* run = testCli().findSubcmd("run");
  assertTrue(run != nullptr);
  assertEq(
      std::string(run->noSuchArg("--exce")->what()),
      "unexpected argument '--exce' found\n\n"
      "Tip: did you mean '--exec'?\n\n"
      "Usage: gocov run [OPTIONS] [PACKAGE] [ARGS]...\n\n"
      "For more information, try '--help'"
  );
  assertTrue(testCli().findSubcmd("fmt") == nullptr);

  pass();
}

static void
testHandleGlobalOpts() {
  const std::vector<std::string> args{ "-q", "--color", "always", "-vv",
                                       "run" };
  auto itr = CliArgsView{ args }.begin();
  const auto end = CliArgsView{ args }.end();

  assertTrue(Cli::handleGlobalOpts(itr, end).unwrap() == Cli::Continue);
  assertTrue(isQuiet());
  ++itr;
  assertTrue(Cli::handleGlobalOpts(itr, end).unwrap() == Cli::Continue);
  assertEq(*itr, "always");
  assertTrue(getColorMode() == ColorMode::Always);
  ++itr;
  assertTrue(Cli::handleGlobalOpts(itr, end).unwrap() == Cli::Continue);
  assertTrue(getDiagLevel() == DiagLevel::VeryVerbose);
  ++itr;
  assertTrue(Cli::handleGlobalOpts(itr, end).unwrap() == Cli::Fallthrough);

  const std::vector<std::string> dangling{ "--color" };
  auto itr2 = CliArgsView{ dangling }.begin();
  assertTrue(
      Cli::handleGlobalOpts(itr2, CliArgsView{ dangling }.end()).is_err()
  );

  setColorMode(ColorMode::Never);
  setDiagLevel(DiagLevel::Info);
  pass();
}

}  // namespace tests

int
main() {
  gocov::setColorMode("never");

  tests::testExpandShortOpts();
  tests::testExpandLongOpts();
  tests::testExpandKeepsProgramArgs();
  tests::testUnknownSubcmd();
  tests::testSubcmdNoSuchArg();
  tests::testHandleGlobalOpts();
}

#endif
