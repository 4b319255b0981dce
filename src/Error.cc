#include "Error.hpp"

#include "Rustify/Result.hpp"

#include <fmt/format.h>
#include <memory>
#include <string>
#include <string_view>

namespace gocov {

std::string_view
toString(const ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::InvalidPackageSpec:
      return "invalid package spec";
    case ErrorKind::CallSequenceViolation:
      return "call sequence violation";
    case ErrorKind::RelocationFailure:
      return "relocation failed";
    case ErrorKind::ProcessStartFailure:
      return "failed to start process";
    case ErrorKind::ProcessExecutionFailure:
      return "process failed";
    case ErrorKind::Cancelled:
      return "cancelled";
    case ErrorKind::InvalidHost:
      return "invalid host";
    case ErrorKind::NetworkTransientFailure:
      return "transient network failure";
    case ErrorKind::NetworkFailure:
      return "network failure";
    case ErrorKind::ResponseDecodeFailure:
      return "failed to decode response";
  }
  __builtin_unreachable();
}

std::string
Error::toString() const {
  if (msg.empty()) {
    return std::string(gocov::toString(kind));
  }
  return fmt::format("{}: {}", gocov::toString(kind), msg);
}

std::shared_ptr<anyhow::error>
Error::toAnyhow() const {
  return anyhow::anyhow(toString());
}

}  // namespace gocov

auto
fmt::formatter<gocov::ErrorKind>::format(
    gocov::ErrorKind v, format_context& ctx
) const -> format_context::iterator {
  return formatter<std::string_view>::format(gocov::toString(v), ctx);
}

auto
fmt::formatter<gocov::Error>::format(
    const gocov::Error& v, format_context& ctx
) const -> format_context::iterator {
  return formatter<std::string>::format(v.toString(), ctx);
}

#ifdef GOCOV_TEST

#  include "Rustify/Tests.hpp"

namespace tests {

using namespace gocov;  // NOLINT(build/namespaces,google-build-using-namespace)

static void
testErrorToString() {
  const Error withMsg{ ErrorKind::InvalidPackageSpec, "`./sub`" };
  assertEq(withMsg.toString(), "invalid package spec: `./sub`");
  assertEq(fmt::format("{}", withMsg), "invalid package spec: `./sub`");

  const Error bare{ ErrorKind::Cancelled, "" };
  assertEq(bare.toString(), "cancelled");

  pass();
}

static void
testFail() {
  const Result<int, Error> res =
      fail(ErrorKind::RelocationFailure, "cannot copy {}", "a.go");
  assertTrue(res.is_err());
  assertTrue(res.unwrap_err().kind == ErrorKind::RelocationFailure);
  assertEq(res.unwrap_err().msg, "cannot copy a.go");

  pass();
}

}  // namespace tests

int
main() {
  tests::testErrorToString();
  tests::testFail();
}

#endif
