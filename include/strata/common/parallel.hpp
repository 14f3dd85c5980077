#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

namespace strata::common {

struct ParallelOptions {
  bool concurrent = true;
  uint32_t max_parallelism = 0;  // 0: std::thread::hardware_concurrency()
};

// Runs body(index) for every index in [0, count).
//
// Sequential mode runs inline on the caller, in index order. Concurrent mode
// spreads indices over a short-lived pool of std::jthread workers pulling
// from a shared counter; completion order is unspecified, so bodies must
// write into per-index slots rather than shared state.
//
// Once `stop` is requested no further index is started. Bodies already
// running finish normally. The first exception thrown by a body stops the
// remaining work and is rethrown on the caller after every worker joined.
template <typename Body>
void ParallelFor(
    size_t count, const ParallelOptions& options, std::stop_token stop,
    Body&& body) {
  if (count == 0) {
    return;
  }

  size_t workers = options.max_parallelism != 0
                       ? options.max_parallelism
                       : std::max(1U, std::thread::hardware_concurrency());
  workers = std::min(workers, count);

  if (!options.concurrent || workers <= 1) {
    for (size_t i = 0; i < count; ++i) {
      if (stop.stop_requested()) {
        return;
      }
      body(i);
    }
    return;
  }

  std::atomic<size_t> next{0};
  std::atomic<bool> failed{false};
  std::exception_ptr first_error;
  std::mutex error_mutex;

  auto worker = [&] {
    while (!stop.stop_requested() && !failed.load(std::memory_order_relaxed)) {
      size_t index = next.fetch_add(1, std::memory_order_relaxed);
      if (index >= count) {
        return;
      }
      try {
        body(index);
      } catch (...) {
        std::lock_guard lock(error_mutex);
        if (!first_error) {
          first_error = std::current_exception();
        }
        failed.store(true, std::memory_order_relaxed);
        return;
      }
    }
  };

  {
    std::vector<std::jthread> pool;
    pool.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
      pool.emplace_back(worker);
    }
    // jthread destructors join
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

// Overload for callers without a cancellation source.
template <typename Body>
void ParallelFor(size_t count, const ParallelOptions& options, Body&& body) {
  ParallelFor(count, options, std::stop_token{}, std::forward<Body>(body));
}

}  // namespace strata::common
