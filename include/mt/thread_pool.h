#pragma once

#include "mt/sleeper.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <functional>
#include <thread>
#include <type_traits>
#include <vector>

// Hands out the items of a fixed batch in order to at most n_threads
// workers. A false return from func aborts the remaining items; the
// destructor waits for every worker.
template <typename T>
  requires std::is_move_constructible_v<T>
class thread_pool {
  using Func = std::function<bool(T&&)>;

  const Func func;
  std::vector<T> items;
  std::atomic<size_t> cursor{0};
  std::atomic<bool> aborted{false};

  std::vector<std::jthread> workers;

  bool runnable() const {
    return !aborted.load(std::memory_order_relaxed) && !sleeper.should_shutdown();
  }

  void drain() {
    while (runnable()) {
      auto i = cursor.fetch_add(1, std::memory_order_relaxed);
      if (i >= items.size())
        return;
      if (!func(std::move(items[i])))
        aborted.store(true, std::memory_order_relaxed);
    }
  }

 public:
  thread_pool(size_t n_threads, Func f, std::vector<T> batch) noexcept
      : func{std::move(f)}, items{std::move(batch)} {
    auto n = std::min(std::max<size_t>(n_threads, 1),
                      std::max<size_t>(items.size(), 1));
    workers.reserve(n);
    while (workers.size() < n)
      workers.emplace_back([this] { drain(); });
  }

  ~thread_pool() {
    for (auto& w : workers)
      if (w.joinable())
        w.join();
  }

  thread_pool(const thread_pool&) = delete;
  thread_pool& operator=(const thread_pool&) = delete;
};
