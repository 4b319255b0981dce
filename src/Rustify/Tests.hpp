#pragma once

#include <concepts>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <fstream>
#include <random>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tests {

inline constinit const std::string_view GREEN = "\033[32m";
inline constinit const std::string_view RED = "\033[31m";
inline constinit const std::string_view RESET = "\033[0m";

template <typename T, typename U>
concept Eq = requires(T lhs, U rhs) {
  { lhs == rhs } -> std::convertible_to<bool>;
};

template <typename T, typename U>
concept Ne = requires(T lhs, U rhs) {
  { lhs != rhs } -> std::convertible_to<bool>;
};

// Turns `/path/to/repo/src/Cmd/List.cc` into `src/Cmd/List`.  Paths without
// `src/` are returned as is.
constexpr std::string_view
getModName(std::string_view file) noexcept {
  if (file.empty()) {
    return file;
  }

  const std::size_t start = file.rfind("src/");
  if (start == std::string_view::npos) {
    return file;
  }

  const std::size_t end = file.find_last_of('.');
  if (end == std::string_view::npos || end < start) {
    return file;
  }

  return file.substr(start, end - start);
}

constexpr std::string_view
prettifyFuncName(std::string_view func) noexcept {
  if (func.empty()) {
    return func;
  }

  const std::size_t end = func.find_last_of('(');
  if (end == std::string_view::npos) {
    return func;
  }
  func = func.substr(0, end);

  const std::size_t start = func.find_last_of(' ');
  if (start == std::string_view::npos) {
    return func;
  }
  return func.substr(start + 1);
}

inline void
pass(
    const std::source_location& loc = std::source_location::current()
) noexcept {
  fmt::print(
      "        test {}::{} ... {}ok{}\n", getModName(loc.file_name()),
      prettifyFuncName(loc.function_name()), GREEN, RESET
  );
}

[[noreturn]] inline void
error(const std::source_location& loc, const std::string_view msg) {
  fmt::print(
      stderr,
      "\n        test {}::{} ... {}FAILED{}\n\n"
      "'{}' failed at '{}', {}:{}\n",
      getModName(loc.file_name()), prettifyFuncName(loc.function_name()), RED,
      RESET, prettifyFuncName(loc.function_name()), msg, loc.file_name(),
      loc.line()
  );
  throw std::logic_error("test failed");
}

inline void
assertTrue(
    const bool cond, const std::string_view msg = "",
    const std::source_location& loc = std::source_location::current()
) {
  if (cond) {
    return;
  }
  error(loc, msg.empty() ? "expected `true` but got `false`" : msg);
}

inline void
assertFalse(
    const bool cond, const std::string_view msg = "",
    const std::source_location& loc = std::source_location::current()
) {
  if (!cond) {
    return;
  }
  error(loc, msg.empty() ? "expected `false` but got `true`" : msg);
}

template <typename Lhs, typename Rhs>
  requires Eq<Lhs, Rhs> && fmt::is_formattable<Lhs>::value
           && fmt::is_formattable<Rhs>::value
inline void
assertEq(
    Lhs&& lhs, Rhs&& rhs, const std::string_view msg = "",
    const std::source_location& loc = std::source_location::current()
) {
  if (lhs == rhs) {
    return;
  }

  if (!msg.empty()) {
    error(loc, msg);
  }
  error(
      loc, fmt::format(
               "assertion failed: `(left == right)`\n"
               "  left: `{}`\n"
               " right: `{}`\n",
               std::forward<Lhs>(lhs), std::forward<Rhs>(rhs)
           )
  );
}

template <typename Lhs, typename Rhs>
  requires Ne<Lhs, Rhs> && fmt::is_formattable<Lhs>::value
           && fmt::is_formattable<Rhs>::value
inline void
assertNe(
    Lhs&& lhs, Rhs&& rhs, const std::string_view msg = "",
    const std::source_location& loc = std::source_location::current()
) {
  if (lhs != rhs) {
    return;
  }

  if (!msg.empty()) {
    error(loc, msg);
  }
  error(
      loc, fmt::format(
               "assertion failed: `(left != right)`\n"
               "  left: `{}`\n"
               " right: `{}`\n",
               std::forward<Lhs>(lhs), std::forward<Rhs>(rhs)
           )
  );
}

// A scratch directory under the system temp directory, removed on scope exit.
class TempDir {
  std::filesystem::path dir;

public:
  TempDir() {
    std::random_device rd;
    dir = std::filesystem::temp_directory_path()
          / fmt::format("gocov-test-{:08x}", rd());
    std::filesystem::create_directories(dir);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;
  TempDir(TempDir&&) = delete;
  TempDir& operator=(TempDir&&) = delete;
  ~TempDir() noexcept {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }

  const std::filesystem::path& path() const noexcept {
    return dir;
  }
};

inline void
writeFile(const std::filesystem::path& path, const std::string_view content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream ofs(path);
  ofs << content;
}

// Writes an executable shell script, typically a stand-in for `go`.
inline void
writeScript(const std::filesystem::path& path, const std::string_view body) {
  writeFile(path, fmt::format("#!/bin/sh\n{}", body));
  std::filesystem::permissions(
      path,
      std::filesystem::perms::owner_all | std::filesystem::perms::group_read
          | std::filesystem::perms::group_exec
  );
}

}  // namespace tests
