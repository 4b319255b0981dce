#include "Parallelism.hpp"

#include <cstddef>
#include <memory>
#include <tbb/global_control.h>
#include <tbb/info.h>

namespace gocov {

std::size_t
numThreads() noexcept {
  return static_cast<std::size_t>(tbb::info::default_concurrency());
}

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static std::unique_ptr<tbb::global_control> parallelism;

void
setParallelism(const std::size_t numThreads) noexcept {
  parallelism = std::make_unique<tbb::global_control>(
      tbb::global_control::max_allowed_parallelism, numThreads
  );
}

std::size_t
getParallelism() noexcept {
  return tbb::global_control::active_value(
      tbb::global_control::max_allowed_parallelism
  );
}

bool
isParallel() noexcept {
  return getParallelism() > 1;
}

}  // namespace gocov
