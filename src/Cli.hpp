#pragma once

#include "Rustify/Result.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gocov {

class Cli;

using CliArgsView = std::span<const std::string>;

// Defined in Gocov.cc
const Cli& getCli() noexcept;

class Opt {
  friend class Subcmd;
  friend class Cli;

  std::string_view name;
  std::string_view shortName;
  std::string_view desc;
  std::string_view placeholder;
  std::string_view defaultVal;
  bool isGlobal = false;
  bool isHidden = false;

public:
  constexpr explicit Opt(const std::string_view name) noexcept : name(name) {}

  constexpr Opt& setShort(const std::string_view shortName) noexcept {
    this->shortName = shortName;
    return *this;
  }
  constexpr Opt& setDesc(const std::string_view desc) noexcept {
    this->desc = desc;
    return *this;
  }
  constexpr Opt& setPlaceholder(const std::string_view placeholder) noexcept {
    this->placeholder = placeholder;
    return *this;
  }
  constexpr Opt& setDefault(const std::string_view defaultVal) noexcept {
    this->defaultVal = defaultVal;
    return *this;
  }
  constexpr Opt& setGlobal(const bool isGlobal) noexcept {
    this->isGlobal = isGlobal;
    return *this;
  }
  constexpr Opt& setHidden(const bool isHidden) noexcept {
    this->isHidden = isHidden;
    return *this;
  }

  constexpr bool takesArg() const noexcept {
    return !placeholder.empty();
  }
  constexpr bool is(const std::string_view arg) const noexcept {
    return arg == name || (!shortName.empty() && arg == shortName);
  }

private:
  // Size of `-c, --color <WHEN>` without color.
  constexpr std::size_t
  leftSize(const std::size_t maxShortSize) const noexcept {
    std::size_t size = maxShortSize + 2 + name.size();  // `-c, --color`
    if (takesArg()) {
      size += 1 + placeholder.size();  // ` <WHEN>`
    }
    return size;
  }

  std::string format(std::size_t maxShortSize, std::size_t maxOffset) const;
};

class Arg {
  friend class Subcmd;

  std::string_view name;
  std::string_view desc;
  bool required = true;
  bool variadic = false;

public:
  constexpr explicit Arg(const std::string_view name) noexcept : name(name) {}

  constexpr Arg& setDesc(const std::string_view desc) noexcept {
    this->desc = desc;
    return *this;
  }
  constexpr Arg& setRequired(const bool required) noexcept {
    this->required = required;
    return *this;
  }
  constexpr Arg& setVariadic(const bool variadic) noexcept {
    this->variadic = variadic;
    return *this;
  }

private:
  // `<NAME>`, `[NAME]` or `[NAME]...`, uncolored.
  std::string getLeft() const;
};

class Subcmd {
  friend class Cli;

  using MainFn = Result<void>(CliArgsView);

  std::string_view name;
  std::string_view desc;
  std::string_view cmdName;
  std::vector<Opt> globalOpts;
  std::vector<Opt> localOpts;
  std::vector<Arg> args;
  std::function<MainFn> mainFn;

public:
  explicit Subcmd(const std::string_view name) noexcept : name(name) {}

  Subcmd& setDesc(std::string_view desc) noexcept;
  Subcmd& addOpt(Opt opt);
  Subcmd& addArg(Arg arg);
  Subcmd& setMainFn(std::function<MainFn> mainFn) noexcept;

  [[nodiscard]] AnyhowErr noSuchArg(std::string_view arg) const;
  [[nodiscard]] static AnyhowErr
  missingOptArgumentFor(std::string_view arg) noexcept;

private:
  // Whether arguments trail the first positional one, as in `run . <ARGS>`.
  bool hasTrailingArgs() const noexcept;
  // Global or local option whose long or short name is `arg`.
  const Opt* findOpt(std::string_view arg) const noexcept;
  std::string formatUsage(bool toStderr) const;
  std::string formatHelp() const;
};

class Cli {
  std::string_view name;
  std::string_view desc;
  std::vector<Opt> globalOpts;
  std::vector<Opt> localOpts;
  std::vector<Subcmd> subcmds;

public:
  explicit Cli(const std::string_view name) noexcept : name(name) {}

  Cli& setDesc(std::string_view desc) noexcept;
  // Global options must be added before the subcommands.
  Cli& addOpt(Opt opt);
  Cli& addSubcmd(Subcmd subcmd);

  const Subcmd* findSubcmd(std::string_view name) const noexcept;

  [[nodiscard]] AnyhowErr noSuchArg(std::string_view arg) const;
  [[nodiscard]] Result<void> printHelp(CliArgsView args) const;

  enum class ControlFlow : std::uint8_t {
    Return,
    Continue,
    Fallthrough,
  };
  using enum ControlFlow;

  // Handles `-h`, `-v`, `-vv`, `-q` and `--color` wherever they appear.
  // `subcmd` selects the help printed for `-h`.
  [[nodiscard]] static Result<ControlFlow> handleGlobalOpts(
      CliArgsView::iterator& itr, CliArgsView::iterator end,
      std::string_view subcmd = ""
  );

  // NOLINTNEXTLINE(*-avoid-c-arrays)
  Result<void> parseArgs(int argc, char* argv[]) const;

  // Splits `-vvj4` into `-vv -v -j 4` and `--opt=val` into `--opt val`.
  // Everything after `--` is kept as is, and so is everything from the
  // first positional argument of a subcommand taking trailing arguments.
  Result<std::vector<std::string>>
  expandOpts(std::span<const char* const> args) const;

private:
  Result<void> parseArgs(CliArgsView args) const;
  std::string formatHelp() const;
};

}  // namespace gocov
