#include <cq/worker_pool.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include <vector>

namespace cq {

std::size_t ResolveWorkerCount(std::size_t requested) {
  if (requested > 0) {
    return requested;
  }
  const auto hardware = std::thread::hardware_concurrency();
  return hardware == 0 ? 1 : static_cast<std::size_t>(hardware);
}

void ParallelFor(std::size_t count, std::size_t workers,
                 const std::function<void(std::size_t)> &fn) {
  if (count == 0) {
    return;
  }
  const auto jobs = std::min(ResolveWorkerCount(workers), count);
  std::vector<std::exception_ptr> errors(count);

  if (jobs == 1) {
    for (std::size_t i = 0; i < count; ++i) {
      try {
        fn(i);
      } catch (...) {
        errors[i] = std::current_exception();
      }
    }
  } else {
    std::atomic<std::size_t> next{0};
    auto worker = [&]() {
      for (;;) {
        const auto index = next.fetch_add(1);
        if (index >= count) {
          return;
        }
        try {
          fn(index);
        } catch (...) {
          errors[index] = std::current_exception();
        }
      }
    };

    std::vector<std::thread> threads;
    threads.reserve(jobs);
    for (std::size_t t = 0; t < jobs; ++t) {
      threads.emplace_back(worker);
    }
    for (auto &thread : threads) {
      thread.join();
    }
  }

  for (const auto &error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }
}

} // namespace cq
