#pragma once

#include "Rustify/Result.hpp"

namespace gocov {

// NOLINTNEXTLINE(*-avoid-c-arrays)
Result<void, void> gocovMain(int argc, char* argv[]) noexcept;

}  // namespace gocov
