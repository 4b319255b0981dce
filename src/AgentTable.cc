#include "AgentTable.hpp"

#include "AgentClient.hpp"
#include "TermColor.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace gocov {

static constexpr std::string_view COLUMN_PADDING = "   ";

std::optional<std::size_t>
stdinWidth() noexcept {
  return terminalWidth(STDIN_FILENO);
}

static bool
isContinuationByte(const char c) noexcept {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Number of code points, which is what a terminal shows for the ASCII and
// Latin text command lines are made of.
static std::size_t
displayWidth(const std::string_view str) noexcept {
  return static_cast<std::size_t>(
      std::ranges::count_if(str, [](const char c) {
        return !isContinuationByte(c);
      })
  );
}

std::string
clipCmdLine(
    const std::size_t preLen, const std::string_view cmdLine,
    std::optional<std::size_t> width
) {
  if (!width.has_value() || width.value() <= preLen + MIN_CMD_WIDTH) {
    width = preLen + MIN_CMD_WIDTH;
  }
  std::size_t maxLen = width.value() - preLen;
  if (cmdLine.size() <= maxLen) {
    return std::string(cmdLine);
  }
  while (maxLen > 0 && isContinuationByte(cmdLine[maxLen])) {
    --maxLen;
  }
  return std::string(cmdLine.substr(0, maxLen));
}

std::string
renderAgentTable(
    const std::vector<Agent>& agents, const bool wide,
    const WidthProvider& width
) {
  std::vector<std::vector<std::string>> rows;
  rows.reserve(agents.size() + 1);
  if (wide) {
    rows.push_back({ "ID", "REMOTEIP", "HOSTNAME", "PID", "CMD" });
  } else {
    rows.push_back({ "ID", "REMOTEIP", "CMD" });
  }

  const std::optional<std::size_t> termWidth =
      !wide && width ? width() : std::nullopt;
  for (const Agent& agent : agents) {
    if (wide) {
      rows.push_back({ agent.id, agent.remoteIp, agent.hostname, agent.pid,
                       agent.cmdLine });
    } else {
      // The id and address columns plus separators.
      const std::size_t preLen = agent.id.size() + agent.remoteIp.size() + 9;
      rows.push_back({ agent.id, agent.remoteIp,
                       clipCmdLine(preLen, agent.cmdLine, termWidth) });
    }
  }

  std::vector<std::size_t> colWidths(rows.front().size(), 0);
  for (const auto& row : rows) {
    for (std::size_t i = 0; i < row.size(); ++i) {
      colWidths[i] = std::max(colWidths[i], displayWidth(row[i]));
    }
  }

  std::string out;
  for (const auto& row : rows) {
    std::string line;
    for (std::size_t i = 0; i < row.size(); ++i) {
      line += row[i];
      if (i + 1 < row.size()) {
        line.append(colWidths[i] - displayWidth(row[i]), ' ');
        line += COLUMN_PADDING;
      }
    }
    while (!line.empty() && line.back() == ' ') {
      line.pop_back();
    }
    out += line;
    out += '\n';
  }
  return out;
}

}  // namespace gocov

#ifdef GOCOV_TEST

#  include "Rustify/Tests.hpp"

namespace tests {

using namespace gocov;  // NOLINT(build/namespaces,google-build-using-namespace)

static const Agent FOO{ .id = "1",
                        .remoteIp = "10.0.0.1",
                        .hostname = "h1",
                        .cmdLine = "/bin/foo --flag=verylongvalue --other",
                        .pid = "99" };

static std::optional<std::size_t>
noTerminal() {
  return std::nullopt;
}

static void
testClipCmdLine() {
  // id "1" + remoteip "10.0.0.1" + 9
  constexpr std::size_t preLen = 18;
  assertEq(
      clipCmdLine(preLen, FOO.cmdLine, std::nullopt), "/bin/foo --flag="
  );
  // Too narrow counts as unknown.
  assertEq(clipCmdLine(preLen, FOO.cmdLine, 20), "/bin/foo --flag=");
  assertEq(clipCmdLine(preLen, FOO.cmdLine, 38), "/bin/foo --flag=very");
  assertEq(clipCmdLine(preLen, FOO.cmdLine, 200), FOO.cmdLine);
  assertEq(clipCmdLine(preLen, "/bin/short", std::nullopt), "/bin/short");

  // U+00E9 is two bytes and is kept or dropped whole.
  assertEq(
      clipCmdLine(preLen, "/bin/foo --name=\xC3\xA9t\xC3\xA9", std::nullopt),
      "/bin/foo --name="
  );
  assertEq(
      clipCmdLine(preLen, "/bin/foo --nam=\xC3\xA9t\xC3\xA9", std::nullopt),
      "/bin/foo --nam="
  );

  pass();
}

static void
testClipNeverExceedsWidth() {
  constexpr std::size_t preLen = 18;
  for (std::size_t width = preLen + MIN_CMD_WIDTH + 1; width < 80; ++width) {
    assertTrue(
        clipCmdLine(preLen, FOO.cmdLine, width).size() + preLen <= width
    );
  }

  pass();
}

static void
testNarrowTable() {
  const std::string table = renderAgentTable({ FOO }, false, noTerminal);
  assertEq(
      table,
      "ID   REMOTEIP   CMD\n"
      "1    10.0.0.1   /bin/foo --flag=\n"
  );

  pass();
}

static void
testNarrowTableUsesWidth() {
  const std::string table = renderAgentTable({ FOO }, false, [] {
    return std::optional<std::size_t>(38);
  });
  assertEq(
      table,
      "ID   REMOTEIP   CMD\n"
      "1    10.0.0.1   /bin/foo --flag=very\n"
  );

  pass();
}

static void
testWideTable() {
  const Agent bar{ .id = "12",
                   .remoteIp = "192.168.1.20",
                   .hostname = "build-host",
                   .cmdLine = "./bar",
                   .pid = "4242" };
  const std::string table =
      renderAgentTable({ FOO, bar }, true, []() -> std::optional<std::size_t> {
        error(std::source_location::current(), "width queried in wide mode");
      });
  assertEq(
      table,
      "ID   REMOTEIP       HOSTNAME     PID    CMD\n"
      "1    10.0.0.1       h1           99     "
      "/bin/foo --flag=verylongvalue --other\n"
      "12   192.168.1.20   build-host   4242   ./bar\n"
  );

  pass();
}

static void
testEmptyTable() {
  assertEq(renderAgentTable({}, false, noTerminal), "ID   REMOTEIP   CMD\n");
  assertEq(
      renderAgentTable({}, true, noTerminal),
      "ID   REMOTEIP   HOSTNAME   PID   CMD\n"
  );

  pass();
}

}  // namespace tests

int
main() {
  tests::testClipCmdLine();
  tests::testClipNeverExceedsWidth();
  tests::testNarrowTable();
  tests::testNarrowTableUsesWidth();
  tests::testWideTable();
  tests::testEmptyTable();
}

#endif
