#pragma once

#include "Rustify/Result.hpp"

#include <cstdint>
#include <fmt/format.h>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace gocov {

enum class ErrorKind : std::uint8_t {
  // Workspace
  InvalidPackageSpec,
  CallSequenceViolation,
  RelocationFailure,
  ProcessStartFailure,
  ProcessExecutionFailure,
  Cancelled,
  // Agent listing
  InvalidHost,
  NetworkTransientFailure,
  NetworkFailure,
  ResponseDecodeFailure,
};

std::string_view toString(ErrorKind kind) noexcept;

struct Error {
  ErrorKind kind;
  std::string msg;

  std::string toString() const;

  // Converts into an anyhow error, for callers that only report.
  std::shared_ptr<anyhow::error> toAnyhow() const;
};

template <typename... Args>
inline auto
fail(ErrorKind kind, fmt::format_string<Args...> fmt, Args&&... args) {
  return Err(Error{ kind, fmt::format(fmt, std::forward<Args>(args)...) });
}

// Adapts an anyhow error into a kinded one, for use with map_err().
inline auto
toError(const ErrorKind kind) {
  return [kind](const std::shared_ptr<anyhow::error>& err) {
    return Error{ kind, err->what() };
  };
}

}  // namespace gocov

template <>
struct fmt::formatter<gocov::ErrorKind> : formatter<std::string_view> {
  auto format(gocov::ErrorKind v, format_context& ctx) const
      -> format_context::iterator;
};

template <>
struct fmt::formatter<gocov::Error> : formatter<std::string> {
  auto format(const gocov::Error& v, format_context& ctx) const
      -> format_context::iterator;
};
