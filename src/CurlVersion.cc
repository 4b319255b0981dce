#include "CurlVersion.hpp"

#include <fmt/format.h>
#include <string>

namespace gocov {

std::string
CurlVersion::toString() const {
  if (data == nullptr) {
    return "";
  }
  return fmt::format(
      "{} (ssl: {})", data->version,
      data->ssl_version != nullptr ? data->ssl_version : "none"
  );
}

}  // namespace gocov

auto
fmt::formatter<gocov::CurlVersion>::format(
    const gocov::CurlVersion& v, format_context& ctx
) const -> format_context::iterator {
  return formatter<std::string>::format(v.toString(), ctx);
}

#ifdef GOCOV_TEST

#  include "Rustify/Tests.hpp"

namespace tests {

using namespace gocov;  // NOLINT(build/namespaces,google-build-using-namespace)

static void
testToString() {
  curl_version_info_data data{};
  data.version = "8.5.0";
  data.ssl_version = "OpenSSL/3.0.13";
  assertEq(CurlVersion(&data).toString(), "8.5.0 (ssl: OpenSSL/3.0.13)");

  data.ssl_version = nullptr;
  assertEq(fmt::format("{}", CurlVersion(&data)), "8.5.0 (ssl: none)");

  assertEq(CurlVersion(nullptr).toString(), "");

  pass();
}

static void
testLinkedLibrary() {
  const CurlVersion version;
  assertTrue(version.data != nullptr);
  assertTrue(version.toString().starts_with(version.data->version));

  pass();
}

}  // namespace tests

int
main() {
  tests::testToString();
  tests::testLinkedLibrary();
}

#endif
