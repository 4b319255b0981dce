#include "Algos.hpp"

#include "Command.hpp"
#include "Rustify/Result.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fmt/format.h>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace gocov {

std::string
replaceAll(
    std::string str, const std::string_view from, const std::string_view to
) noexcept {
  if (from.empty()) {
    return str;
  }

  std::size_t startPos = 0;
  while ((startPos = str.find(from, startPos)) != std::string::npos) {
    str.replace(startPos, from.length(), to);
    startPos += to.length();  // Move past the last replaced substring
  }
  return str;
}

Result<std::vector<std::string>>
splitArgs(const std::string_view str) {
  enum class State : std::uint8_t {
    Blank,
    Word,
    SingleQuoted,
    DoubleQuoted,
  };

  std::vector<std::string> words;
  std::string cur;
  State state = State::Blank;
  for (std::size_t i = 0; i < str.size(); ++i) {
    const char c = str[i];
    switch (state) {
      case State::Blank:
      case State::Word:
        if (c == ' ' || c == '\t' || c == '\n') {
          if (state == State::Word) {
            words.push_back(std::move(cur));
            cur.clear();
          }
          state = State::Blank;
        } else if (c == '\'') {
          state = State::SingleQuoted;
        } else if (c == '"') {
          state = State::DoubleQuoted;
        } else if (c == '\\') {
          Ensure(i + 1 < str.size(), "trailing backslash in `{}`", str);
          cur += str[++i];
          state = State::Word;
        } else {
          cur += c;
          state = State::Word;
        }
        break;
      case State::SingleQuoted:
        if (c == '\'') {
          state = State::Word;
        } else {
          cur += c;
        }
        break;
      case State::DoubleQuoted:
        if (c == '"') {
          state = State::Word;
        } else if (c == '\\' && i + 1 < str.size()
                   && std::string_view("\"\\$`").find(str[i + 1])
                          != std::string_view::npos) {
          cur += str[++i];
        } else {
          cur += c;
        }
        break;
    }
  }

  Ensure(
      state != State::SingleQuoted && state != State::DoubleQuoted,
      "unterminated quote in `{}`", str
  );
  if (state == State::Word) {
    words.push_back(std::move(cur));
  }
  return Ok(words);
}

std::string
hashHex(const std::string_view str) noexcept {
  constexpr std::uint64_t fnvOffsetBasis = 14695981039346656037ULL;
  constexpr std::uint64_t fnvPrime = 1099511628211ULL;

  std::uint64_t hash = fnvOffsetBasis;
  for (const unsigned char c : str) {
    hash ^= c;
    hash *= fnvPrime;
  }
  return fmt::format("{:016x}", hash);
}

Result<std::string>
getCmdOutput(const Command& cmd, const std::size_t retry) noexcept {
  spdlog::trace("Running `{}`", cmd.toString());

  ExitStatus exitStatus;
  std::string stdErr;
  int waitTime = 1;
  for (std::size_t i = 0; i < retry; ++i) {
    if (i > 0) {
      // Sleep for an exponential backoff.
      std::this_thread::sleep_for(std::chrono::seconds(waitTime));
      waitTime *= 2;
    }

    const auto cmdOut = Try(cmd.output());
    if (cmdOut.exitStatus.success()) {
      return Ok(cmdOut.stdOut);
    }
    exitStatus = cmdOut.exitStatus;
    stdErr = cmdOut.stdErr;
  }

  return Result<std::string>(
             Err(anyhow::anyhow("Command `{}` {}", cmd.toString(), exitStatus))
  )
      .with_context([stdErr = std::move(stdErr)] {
        return anyhow::anyhow(stdErr);
      });
}

}  // namespace gocov

#ifdef GOCOV_TEST

#  include "Rustify/Tests.hpp"

#  include <array>

namespace tests {

using namespace gocov;  // NOLINT(build/namespaces,google-build-using-namespace)
using std::string_view_literals::operator""sv;

static void
testReplaceAll() {
  assertEq(replaceAll("my_app_v2", "_", "-"), "my-app-v2");
  assertEq(replaceAll("myapp", "_", "-"), "myapp");
  assertEq(replaceAll("abc", "", "-"), "abc");

  pass();
}

static void
testSplitArgs() {
  using Words = std::vector<std::string>;

  assertEq(splitArgs("").unwrap(), Words{});
  assertEq(splitArgs("   ").unwrap(), Words{});
  assertEq(splitArgs("-v").unwrap(), Words{ "-v" });
  assertEq(splitArgs("-v  -race").unwrap(), Words{ "-v", "-race" });
  assertEq(
      splitArgs(R"(-ldflags "-X main.version=1.0" -tags 'a b')").unwrap(),
      (Words{ "-ldflags", "-X main.version=1.0", "-tags", "a b" })
  );
  assertEq(splitArgs(R"(a\ b)").unwrap(), Words{ "a b" });
  assertEq(splitArgs(R"("say \"hi\"")").unwrap(), Words{ R"(say "hi")" });
  assertEq(
      splitArgs(R"('single \ stays')").unwrap(), Words{ R"(single \ stays)" }
  );
  assertEq(splitArgs(R"(pre"mid"post)").unwrap(), Words{ "premidpost" });
  assertEq(splitArgs(R"("")").unwrap(), Words{ "" });

  assertTrue(splitArgs(R"(-ldflags "-X a)").is_err());
  assertTrue(splitArgs("'open").is_err());
  assertTrue(splitArgs("trailing\\").is_err());

  pass();
}

static void
testHashHex() {
  // FNV-1a reference values.
  assertEq(hashHex(""), "cbf29ce484222325");
  assertEq(hashHex("a"), "af63dc4c8601ec8c");
  assertEq(hashHex("/home/u/go/src/app"), hashHex("/home/u/go/src/app"));
  assertNe(hashHex("/home/u/go/src/app"), hashHex("/home/u/go/src/app2"));
  assertEq(hashHex("anything").size(), 16UL);

  pass();
}

static void
testFindSimilarStr() {
  constexpr std::array<std::string_view, 5> candidates{ "build", "run",
                                                        "list", "help",
                                                        "version" };

  static_assert(findSimilarStr("buid", candidates) == "build"sv);
  static_assert(findSimilarStr("lst", candidates) == "list"sv);
  static_assert(findSimilarStr("RUN", candidates) == "run"sv);
  static_assert(findSimilarStr("versoin", candidates) == "version"sv);
  static_assert(!findSimilarStr("instrument", candidates).has_value());

  pass();
}

}  // namespace tests

int
main() {
  tests::testReplaceAll();
  tests::testSplitArgs();
  tests::testHashHex();
  tests::testFindSimilarStr();
}

#endif
