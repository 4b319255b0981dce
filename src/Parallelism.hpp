#pragma once

#include <cstddef>
#include <string>

namespace gocov {

std::size_t numThreads() noexcept;
inline const std::string NUM_DEFAULT_THREADS = std::to_string(numThreads());

// Caps the TBB worker pool used while copying files into the workspace.
void setParallelism(std::size_t numThreads) noexcept;
std::size_t getParallelism() noexcept;
bool isParallel() noexcept;

}  // namespace gocov
