#pragma once

#include "AgentClient.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gocov {

// Columns of the terminal the table is printed to, if known.
using WidthProvider = std::function<std::optional<std::size_t>()>;

// Width of the terminal attached to stdin.
std::optional<std::size_t> stdinWidth() noexcept;

// Minimum number of command line bytes shown in narrow mode.
inline constexpr std::size_t MIN_CMD_WIDTH = 16;

// Fits `cmdLine` into what remains of the terminal after `preLen` columns.
// An unknown or too narrow terminal still gets MIN_CMD_WIDTH bytes.  A
// UTF-8 sequence is never split.
std::string clipCmdLine(
    std::size_t preLen, std::string_view cmdLine,
    std::optional<std::size_t> width
);

// Borderless, left-aligned table; `ID REMOTEIP CMD`, or with `wide`
// `ID REMOTEIP HOSTNAME PID CMD` and the command line unclipped.
std::string renderAgentTable(
    const std::vector<Agent>& agents, bool wide,
    const WidthProvider& width = stdinWidth
);

}  // namespace gocov
