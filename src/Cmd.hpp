#pragma once

#include "Cli.hpp"

namespace gocov {

extern const Subcmd BUILD_CMD;
extern const Subcmd HELP_CMD;
extern const Subcmd LIST_CMD;
extern const Subcmd RUN_CMD;
extern const Subcmd VERSION_CMD;

}  // namespace gocov
