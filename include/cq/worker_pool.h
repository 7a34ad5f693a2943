#pragma once

#include <cstddef>
#include <functional>

namespace cq {

// Resolves a configured worker count; zero selects the hardware concurrency.
std::size_t ResolveWorkerCount(std::size_t requested);

// Runs fn(i) for every i in [0, count) on up to `workers` threads. Each index
// runs exactly once. If any call throws, the exception of the lowest failing
// index is rethrown after all threads have joined.
void ParallelFor(std::size_t count, std::size_t workers,
                 const std::function<void(std::size_t)> &fn);

} // namespace cq
