#pragma once

#include <curl/curl.h>
#include <fmt/format.h>
#include <string>

namespace gocov {

struct CurlVersion {
  const curl_version_info_data* data;

  CurlVersion() noexcept : data(curl_version_info(CURLVERSION_NOW)) {}
  explicit CurlVersion(const curl_version_info_data* data) noexcept
      : data(data) {}

  // `8.5.0 (ssl: OpenSSL/3.0.13)`, or empty without version data.
  std::string toString() const;
};

}  // namespace gocov

template <>
struct fmt::formatter<gocov::CurlVersion> : formatter<std::string> {
  auto format(const gocov::CurlVersion& v, format_context& ctx) const
      -> format_context::iterator;
};
