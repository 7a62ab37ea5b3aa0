#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <system_error>
#include <thread>
#include <vector>

#include "clipscan/log/log.hpp"

namespace clipscan::scan::detail {
/**
 * Run fn(i) for every i in [0, count) on up to `workers` threads, the calling
 * thread included. Tasks are handed out through an atomic counter; fn must
 * only write to state owned by task i.
 */
template <typename Fn>
void parallel_for(std::size_t count, unsigned workers, Fn&& fn) {
  if (count == 0) return;
  const std::size_t n = std::max<std::size_t>(1, std::min<std::size_t>(workers, count));

  std::atomic<std::size_t> next{0};
  auto worker = [&]() {
    for (;;) {
      const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
      if (i >= count) return;
      fn(i);
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(n - 1);
  for (std::size_t t = 1; t < n; ++t) {
    try {
      pool.emplace_back(worker);
    } catch (const std::system_error& e) {
      CLIPSCAN_LOG_WARN("started " << pool.size() + 1 << " of " << n
                        << " workers: " << e.what());
      break;
    }
  }
  worker();
  for (auto& th : pool) th.join();
}
} // namespace clipscan::scan::detail
