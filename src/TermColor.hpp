#pragma once

#include <cstdint>
#include <cstdio>
#include <fmt/core.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace gocov {

enum class ColorMode : std::uint8_t {
  Always,
  Auto,
  Never,
};

void setColorMode(ColorMode mode) noexcept;
void setColorMode(std::string_view str) noexcept;
ColorMode getColorMode() noexcept;
bool shouldColor(const std::ostream& os) noexcept;
bool shouldColorStderr() noexcept;

// Column count of the terminal attached to `fd`, or nullopt when `fd` is not
// a terminal.
std::optional<std::size_t> terminalWidth(int fd) noexcept;

class ColorStr {
  std::vector<std::uint8_t> codes;
  mutable std::string str;
  mutable bool finalized = false;

public:
  ColorStr(const std::uint8_t code, std::string str) noexcept
      : str(std::move(str)) {
    codes.push_back(code);
  }

  template <typename S>
    requires(std::is_convertible_v<std::remove_cvref_t<S>, std::string_view> //
             && !std::is_same_v<std::remove_cvref_t<S>, std::string>)
  ColorStr(const std::uint8_t code, S&& str) noexcept
      : ColorStr(code, std::string(std::forward<S>(str))) {}

  ColorStr(const std::uint8_t code, ColorStr other) noexcept
      : codes(std::move(other.codes)), str(std::move(other.str)) {
    codes.push_back(code);
  }

  ColorStr(const ColorStr&) = delete;
  ColorStr& operator=(const ColorStr&) = delete;
  ColorStr(ColorStr&&) noexcept = default;
  ColorStr& operator=(ColorStr&&) noexcept = default;
  virtual ~ColorStr() noexcept = default;

  std::string toStr() const noexcept {
    finalize(std::cout);
    return str;
  }
  std::string toErrStr() const noexcept {
    finalize(std::cerr);
    return str;
  }

  void finalize(const std::ostream& os) const noexcept {
    if (!finalized && shouldColor(os)) {
      finalized = true;
      str = fmt::format("\033[{}m{}\033[0m", fmt::join(codes, ";"), str);
    }
  }

  friend std::ostream&
  operator<<(std::ostream& os, const ColorStr& c) noexcept {
    if (!c.finalized) {
      // NOTE: If this operator<< is called from fmtlib, we cannot detect if
      // the stream is a terminal since they are using a custom stream.  As a
      // result, we always don't color the output in this case.
      c.finalize(os);
    }
    return os << c.str;
  }
};

class Red : public ColorStr {
  static constexpr std::uint8_t CODE = 31;

public:
  template <typename S>
    requires(!std::is_base_of_v<ColorStr, S>)
  explicit Red(S&& str) noexcept : ColorStr(CODE, std::forward<S>(str)) {}

  explicit Red(ColorStr other) noexcept : ColorStr(CODE, std::move(other)) {}
};

class Green : public ColorStr {
  static constexpr std::uint8_t CODE = 32;

public:
  template <typename S>
    requires(!std::is_base_of_v<ColorStr, S>)
  explicit Green(S&& str) noexcept : ColorStr(CODE, std::forward<S>(str)) {}

  explicit Green(ColorStr other) noexcept : ColorStr(CODE, std::move(other)) {}
};

class Yellow : public ColorStr {
  static constexpr std::uint8_t CODE = 33;

public:
  template <typename S>
    requires(!std::is_base_of_v<ColorStr, S>)
  explicit Yellow(S&& str) noexcept : ColorStr(CODE, std::forward<S>(str)) {}

  explicit Yellow(ColorStr other) noexcept : ColorStr(CODE, std::move(other)) {}
};

class Cyan : public ColorStr {
  static constexpr std::uint8_t CODE = 36;

public:
  template <typename S>
    requires(!std::is_base_of_v<ColorStr, S>)
  explicit Cyan(S&& str) noexcept : ColorStr(CODE, std::forward<S>(str)) {}

  explicit Cyan(ColorStr other) noexcept : ColorStr(CODE, std::move(other)) {}
};

class Bold : public ColorStr {
  static constexpr std::uint8_t CODE = 1;

public:
  template <typename S>
    requires(!std::is_base_of_v<ColorStr, S>)
  explicit Bold(S&& str) noexcept : ColorStr(CODE, std::forward<S>(str)) {}

  explicit Bold(ColorStr other) noexcept : ColorStr(CODE, std::move(other)) {}
};

}  // namespace gocov

template <>
struct fmt::formatter<gocov::ColorStr> : ostream_formatter {};

template <>
struct fmt::formatter<gocov::Red> : ostream_formatter {};

template <>
struct fmt::formatter<gocov::Green> : ostream_formatter {};

template <>
struct fmt::formatter<gocov::Yellow> : ostream_formatter {};

template <>
struct fmt::formatter<gocov::Cyan> : ostream_formatter {};

template <>
struct fmt::formatter<gocov::Bold> : ostream_formatter {};
