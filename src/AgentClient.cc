#include "AgentClient.hpp"

#include "Error.hpp"
#include "Rustify/Result.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <curl/curl.h>
#include <exception>
#include <fmt/format.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gocov {

using json = nlohmann::json;

namespace {

// curl_global_init() for the lifetime of the process.
struct CurlGlobal {
  CURLcode code;

  CurlGlobal() noexcept : code(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
  CurlGlobal(CurlGlobal&&) = delete;
  CurlGlobal& operator=(CurlGlobal&&) = delete;
  ~CurlGlobal() noexcept {
    if (code == CURLE_OK) {
      curl_global_cleanup();
    }
  }

  static CURLcode init() noexcept {
    static const CurlGlobal global;
    return global.code;
  }
};

std::size_t
writeBody(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

}  // namespace

bool
isTransient(const CURLcode code) noexcept {
  switch (code) {
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_PARTIAL_FILE:
    case CURLE_GOT_NOTHING:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
      return true;
    default:
      return false;
  }
}

CurlTransport::CurlTransport(const long timeoutSecs) noexcept
    : timeoutSecs(timeoutSecs) {}

Result<HttpResponse, Error>
CurlTransport::get(const std::string& url) {
  if (const CURLcode code = CurlGlobal::init(); code != CURLE_OK) {
    return fail(
        ErrorKind::NetworkFailure, "cannot initialize libcurl: {}",
        curl_easy_strerror(code)
    );
  }

  const std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(
      curl_easy_init(), &curl_easy_cleanup
  );
  if (!curl) {
    return fail(ErrorKind::NetworkFailure, "cannot initialize libcurl");
  }

  HttpResponse res;
  std::array<char, CURL_ERROR_SIZE> errBuf{};
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeoutSecs);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "gocov");
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errBuf.data());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &res.body);

  const CURLcode code = curl_easy_perform(curl.get());
  if (code != CURLE_OK) {
    const std::string_view detail =
        errBuf.front() != '\0' ? std::string_view(errBuf.data())
                               : std::string_view(curl_easy_strerror(code));
    return fail(
        isTransient(code) ? ErrorKind::NetworkTransientFailure
                          : ErrorKind::NetworkFailure,
        "GET {}: {}", url, detail
    );
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &res.status);
  spdlog::debug("GET {}: {} ({} bytes)", url, res.status, res.body.size());
  return Ok(res);
}

static std::string
stringOr(const json& obj, const char* key) {
  if (!obj.contains(key) || obj[key].is_null()) {
    return "";
  }
  return obj[key].get<std::string>();
}

Result<std::vector<Agent>, Error>
parseAgentList(const std::string_view body) {
  std::vector<Agent> agents;
  try {
    const json doc = json::parse(body);
    if (!doc.is_object()) {
      return fail(
          ErrorKind::ResponseDecodeFailure, "expected a JSON object, got {}",
          doc.type_name()
      );
    }
    if (!doc.contains("items") || doc["items"].is_null()) {
      return Ok(agents);
    }
    const json& items = doc.at("items");
    if (!items.is_array()) {
      return fail(
          ErrorKind::ResponseDecodeFailure, "`items` must be an array, got {}",
          items.type_name()
      );
    }
    for (const json& item : items) {
      if (!item.is_object()) {
        return fail(
            ErrorKind::ResponseDecodeFailure,
            "`items` must hold objects, got {}", item.type_name()
        );
      }
      agents.push_back(Agent{ .id = stringOr(item, "id"),
                              .remoteIp = stringOr(item, "remoteip"),
                              .hostname = stringOr(item, "hostname"),
                              .cmdLine = stringOr(item, "cmdline"),
                              .pid = stringOr(item, "pid") });
    }
  } catch (const json::exception& e) {
    return fail(ErrorKind::ResponseDecodeFailure, "{}", e.what());
  }
  return Ok(agents);
}

static bool
isAbsoluteUrl(const std::string_view url) noexcept {
  const std::size_t sep = url.find("://");
  if (sep == 0 || sep == std::string_view::npos
      || sep + 3 == url.size()) {
    return false;
  }
  const std::string_view scheme = url.substr(0, sep);
  return std::isalpha(static_cast<unsigned char>(scheme.front()))
         && std::ranges::all_of(scheme, [](const char c) {
              return std::isalnum(static_cast<unsigned char>(c)) || c == '+'
                     || c == '-' || c == '.';
            });
}

Result<AgentClient, Error>
AgentClient::create(
    std::string host, std::unique_ptr<HttpTransport> transport
) {
  if (!isAbsoluteUrl(host)) {
    return fail(
        ErrorKind::InvalidHost, "invalid host `{}`: expected e.g. `{}`", host,
        DEFAULT_HOST
    );
  }
  while (host.ends_with('/')) {
    host.pop_back();
  }
  return Ok(AgentClient(std::move(host), std::move(transport)));
}

Result<std::vector<Agent>, Error>
AgentClient::listAgents() const {
  const std::string url = fmt::format("{}{}", host, LIST_AGENTS_API);

  const auto fetch = [&]() -> Result<HttpResponse, Error> {
    auto res = transport->get(url);
    if (res.is_ok()
        || res.unwrap_err().kind != ErrorKind::NetworkTransientFailure) {
      return res;
    }
    spdlog::debug("Retrying after {}", res.unwrap_err().msg);
    return transport->get(url);
  };
  const HttpResponse resp = Try(fetch());

  return parseAgentList(resp.body).map_err([&resp](Error err) {
    err.msg = fmt::format("HTTP {}: {}", resp.status, err.msg);
    return err;
  });
}

}  // namespace gocov

#ifdef GOCOV_TEST

#  include "Rustify/Tests.hpp"

#  include <deque>

namespace tests {

using namespace gocov;  // NOLINT(build/namespaces,google-build-using-namespace)

// Replays canned results and records the requested URLs.
class FakeTransport : public HttpTransport {
  std::deque<Result<HttpResponse, Error>> replies;
  std::vector<std::string>* urls;

public:
  FakeTransport(
      std::deque<Result<HttpResponse, Error>> replies,
      std::vector<std::string>* urls
  )
      : replies(std::move(replies)), urls(urls) {}

  Result<HttpResponse, Error> get(const std::string& url) override {
    urls->push_back(url);
    if (replies.empty()) {
      return fail(ErrorKind::NetworkFailure, "no more replies");
    }
    auto reply = std::move(replies.front());
    replies.pop_front();
    return reply;
  }
};

static constexpr std::string_view AGENTS_BODY =
    R"({"items":[{"id":"1","remoteip":"10.0.0.1","hostname":"h1",)"
    R"("cmdline":"/bin/foo --flag=verylongvalue","pid":"99"}]})";

static Result<HttpResponse, Error>
ok(const std::string_view body) {
  return Ok(HttpResponse{ .status = 200, .body = std::string(body) });
}

static Result<HttpResponse, Error>
transient() {
  return fail(ErrorKind::NetworkTransientFailure, "connection refused");
}

static AgentClient
makeClient(
    std::deque<Result<HttpResponse, Error>> replies,
    std::vector<std::string>* urls
) {
  return AgentClient::create(
             "http://127.0.0.1:7777/",
             std::make_unique<FakeTransport>(std::move(replies), urls)
  )
      .unwrap();
}

static void
testParseAgentList() {
  const auto agents = parseAgentList(AGENTS_BODY).unwrap();
  assertEq(agents.size(), 1UL);
  assertEq(agents[0].id, "1");
  assertEq(agents[0].remoteIp, "10.0.0.1");
  assertEq(agents[0].hostname, "h1");
  assertEq(agents[0].cmdLine, "/bin/foo --flag=verylongvalue");
  assertEq(agents[0].pid, "99");

  assertTrue(parseAgentList(R"({"items":null})").unwrap().empty());
  assertTrue(parseAgentList("{}").unwrap().empty());
  assertEq(
      parseAgentList(R"({"items":[{"id":"7"}]})").unwrap()[0].hostname, ""
  );

  assertEq(
      parseAgentList("not json").unwrap_err().kind,
      ErrorKind::ResponseDecodeFailure
  );
  assertEq(
      parseAgentList("[]").unwrap_err().kind, ErrorKind::ResponseDecodeFailure
  );
  assertEq(
      parseAgentList(R"({"items":{"id":"1"}})").unwrap_err().kind,
      ErrorKind::ResponseDecodeFailure
  );
  assertEq(
      parseAgentList(R"({"items":[{"pid":99}]})").unwrap_err().kind,
      ErrorKind::ResponseDecodeFailure
  );

  pass();
}

static void
testCreateValidatesHost() {
  for (const char* host : { "127.0.0.1:7777", "", "://x", "http://",
                            "/v2/rpcagents", "1http://x" }) {
    assertEq(
        AgentClient::create(host).unwrap_err().kind, ErrorKind::InvalidHost
    );
  }
  assertEq(
      AgentClient::create("https://cov.example.com//").unwrap().getHost(),
      "https://cov.example.com"
  );

  pass();
}

static void
testListAgents() {
  std::vector<std::string> urls;
  const AgentClient client = makeClient({ ok(AGENTS_BODY) }, &urls);

  assertEq(client.listAgents().unwrap().size(), 1UL);
  assertEq(
      urls, std::vector<std::string>{ "http://127.0.0.1:7777/v2/rpcagents" }
  );

  pass();
}

static void
testRetriesOnceOnTransientFailure() {
  {
    std::vector<std::string> urls;
    const AgentClient client =
        makeClient({ transient(), ok(AGENTS_BODY) }, &urls);
    assertEq(client.listAgents().unwrap().size(), 1UL);
    assertEq(urls.size(), 2UL);
  }
  {
    std::vector<std::string> urls;
    const AgentClient client =
        makeClient({ transient(), transient(), ok(AGENTS_BODY) }, &urls);
    assertEq(
        client.listAgents().unwrap_err().kind,
        ErrorKind::NetworkTransientFailure
    );
    assertEq(urls.size(), 2UL);
  }

  pass();
}

static void
testNoRetryOnOtherFailures() {
  {
    std::vector<std::string> urls;
    const AgentClient client = makeClient(
        { fail(ErrorKind::NetworkFailure, "unsupported protocol"),
          ok(AGENTS_BODY) },
        &urls
    );
    assertEq(client.listAgents().unwrap_err().kind, ErrorKind::NetworkFailure);
    assertEq(urls.size(), 1UL);
  }
  {
    std::vector<std::string> urls;
    const AgentClient client = makeClient(
        { Ok(HttpResponse{ .status = 404, .body = "404 page not found" }),
          ok(AGENTS_BODY) },
        &urls
    );
    const Error err = client.listAgents().unwrap_err();
    assertEq(err.kind, ErrorKind::ResponseDecodeFailure);
    assertTrue(err.msg.starts_with("HTTP 404: "));
    assertEq(urls.size(), 1UL);
  }

  pass();
}

static void
testIsTransient() {
  assertTrue(isTransient(CURLE_COULDNT_CONNECT));
  assertTrue(isTransient(CURLE_OPERATION_TIMEDOUT));
  assertTrue(isTransient(CURLE_GOT_NOTHING));
  assertFalse(isTransient(CURLE_UNSUPPORTED_PROTOCOL));
  assertFalse(isTransient(CURLE_URL_MALFORMAT));
  assertFalse(isTransient(CURLE_OK));

  pass();
}

static void
testCurlTransportConnectionRefused() {
  // Port 1 on loopback is closed on any sane test machine.
  CurlTransport transport(2);
  const auto res = transport.get("http://127.0.0.1:1/v2/rpcagents");
  assertTrue(res.is_err());
  assertEq(res.unwrap_err().kind, ErrorKind::NetworkTransientFailure);

  pass();
}

}  // namespace tests

int
main() {
  tests::testParseAgentList();
  tests::testCreateValidatesHost();
  tests::testListAgents();
  tests::testRetriesOnceOnTransientFailure();
  tests::testNoRetryOnOtherFailures();
  tests::testIsTransient();
  tests::testCurlTransportConnectionRefused();
}

#endif
