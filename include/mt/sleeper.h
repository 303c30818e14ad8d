#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <ctime>
#include <mutex>
#include <pthread.h>
#include <stdexcept>
#include <string>
#include <thread>

// SIGINT and SIGTERM are masked process-wide and collected by a watcher
// thread, which raises the shutdown flag and wakes every sleeping caller.
class Sleeper {
  std::atomic<bool> stop_flag{false};
  std::mutex wake_mtx;
  std::condition_variable wake;
  std::jthread watcher;

  static sigset_t stop_signals() {
    sigset_t s;
    sigemptyset(&s);
    sigaddset(&s, SIGINT);
    sigaddset(&s, SIGTERM);
    return s;
  }

  void watch(std::stop_token st) {
    auto s = stop_signals();
    timespec poll{0, 200'000'000};
    while (!st.stop_requested() && !should_shutdown()) {
      if (sigtimedwait(&s, nullptr, &poll) > 0)
        request_shutdown();
    }
  }

 public:
  Sleeper() {
    auto s = stop_signals();
    if (int rc = pthread_sigmask(SIG_BLOCK, &s, nullptr); rc != 0)
      throw std::runtime_error("pthread_sigmask failed with code " + std::to_string(rc));
    watcher = std::jthread([this](std::stop_token st) { watch(st); });
  }

  ~Sleeper() {
    request_shutdown();
    watcher.request_stop();
  }

  Sleeper(const Sleeper&) = delete;
  Sleeper& operator=(const Sleeper&) = delete;

  bool should_shutdown() const {
    return stop_flag.load(std::memory_order_acquire);
  }

  void request_shutdown() {
    std::unique_lock lk{wake_mtx};
    stop_flag.store(true, std::memory_order_release);
    lk.unlock();
    wake.notify_all();
  }

  // Returns false if the wait ended because of a shutdown request
  template <typename Rep, typename Period>
  bool sleep_for(std::chrono::duration<Rep, Period> d) {
    std::unique_lock lk{wake_mtx};
    bool stopping = wake.wait_for(lk, d, [this] { return should_shutdown(); });
    return !stopping;
  }
};

inline Sleeper sleeper;
