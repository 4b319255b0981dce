#include "TermColor.hpp"

#include "Diag.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string_view>
#include <sys/ioctl.h>
#include <unistd.h>

namespace gocov {

static ColorMode
parseColorMode(const std::string_view str) noexcept {
  if (str == "always") {
    return ColorMode::Always;
  } else if (str == "auto") {
    return ColorMode::Auto;
  } else if (str == "never") {
    return ColorMode::Never;
  }
  Diag::warn("unknown color mode `{}`; falling back to auto", str);
  return ColorMode::Auto;
}

struct ColorState {
  // ColorState is a singleton
  ColorState(const ColorState&) = delete;
  ColorState& operator=(const ColorState&) = delete;
  ColorState(ColorState&&) noexcept = delete;
  ColorState& operator=(ColorState&&) noexcept = delete;
  ~ColorState() noexcept = default;

  static ColorState& instance() noexcept {
    static ColorState instance;
    return instance;
  }

  ColorMode mode = ColorMode::Auto;

private:
  ColorState() noexcept {
    if (const char* color = std::getenv("GOCOV_TERM_COLOR")) {
      mode = parseColorMode(color);
    }
  }
};

void
setColorMode(const ColorMode mode) noexcept {
  ColorState::instance().mode = mode;
}
void
setColorMode(const std::string_view str) noexcept {
  setColorMode(parseColorMode(str));
}

ColorMode
getColorMode() noexcept {
  return ColorState::instance().mode;
}

static bool
isTerm(const std::ostream& os) noexcept {
  if (&os == &std::cout) {
    return isatty(fileno(stdout));
  } else if (&os == &std::cerr) {
    return isatty(fileno(stderr));
  }
  return false;
}

bool
shouldColor(const std::ostream& os) noexcept {
  switch (getColorMode()) {
    case ColorMode::Always:
      return true;
    case ColorMode::Auto:
      return isTerm(os);
    case ColorMode::Never:
      return false;
  }
  __builtin_unreachable();
}
bool
shouldColorStderr() noexcept {
  return shouldColor(std::cerr);
}

std::optional<std::size_t>
terminalWidth(const int fd) noexcept {
  winsize ws{};
  if (ioctl(fd, TIOCGWINSZ, &ws) == -1 || ws.ws_col == 0) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(ws.ws_col);
}

}  // namespace gocov
