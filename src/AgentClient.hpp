#pragma once

#include "Error.hpp"
#include "Rustify/Result.hpp"

#include <curl/curl.h>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gocov {

// An instrumented process registered with the coverage server.
struct Agent {
  std::string id;
  std::string remoteIp;
  std::string hostname;
  std::string cmdLine;
  std::string pid;
};

struct HttpResponse {
  long status = 0;
  std::string body;
};

// Issues GET requests.  Failures are NetworkTransientFailure when repeating
// the request may succeed, NetworkFailure otherwise.
class HttpTransport {
public:
  HttpTransport() = default;
  HttpTransport(const HttpTransport&) = delete;
  HttpTransport& operator=(const HttpTransport&) = delete;
  HttpTransport(HttpTransport&&) = delete;
  HttpTransport& operator=(HttpTransport&&) = delete;
  virtual ~HttpTransport() = default;

  virtual Result<HttpResponse, Error> get(const std::string& url) = 0;
};

class CurlTransport : public HttpTransport {
  long timeoutSecs;

public:
  static constexpr long DEFAULT_TIMEOUT_SECS = 10;

  explicit CurlTransport(long timeoutSecs = DEFAULT_TIMEOUT_SECS) noexcept;

  Result<HttpResponse, Error> get(const std::string& url) override;
};

// Whether a failed transfer is worth repeating.
bool isTransient(CURLcode code) noexcept;

// Decodes `{"items": [{"id", "remoteip", "hostname", "cmdline", "pid"}]}`.
Result<std::vector<Agent>, Error> parseAgentList(std::string_view body);

class AgentClient {
  std::string host;
  std::unique_ptr<HttpTransport> transport;

  AgentClient(std::string host, std::unique_ptr<HttpTransport> transport)
      : host(std::move(host)), transport(std::move(transport)) {}

public:
  static constexpr std::string_view LIST_AGENTS_API = "/v2/rpcagents";
  static constexpr std::string_view DEFAULT_HOST = "http://127.0.0.1:7777";

  // Fails with InvalidHost unless `host` is an absolute URL.
  static Result<AgentClient, Error> create(
      std::string host,
      std::unique_ptr<HttpTransport> transport =
          std::make_unique<CurlTransport>()
  );

  const std::string& getHost() const noexcept {
    return host;
  }

  // Retried once if the first request fails transiently.
  Result<std::vector<Agent>, Error> listAgents() const;
};

}  // namespace gocov
