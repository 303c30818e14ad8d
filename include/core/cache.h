#pragma once

#include "util/times.h"

#include <functional>
#include <optional>

template <typename T>
struct CacheEntry {
  T value;
  SysTimePoint fetched_at;
  minutes ttl;

  bool stale(SysTimePoint now) const { return now - fetched_at > ttl; }
};

// Single-slot memo. Reads past the ttl see nothing.
template <typename T>
class Cached {
  std::optional<CacheEntry<T>> entry;

 public:
  using Opt = std::optional<std::reference_wrapper<const T>>;

  void store(T value, SysTimePoint now, minutes ttl) {
    entry.emplace(CacheEntry<T>{std::move(value), now, ttl});
  }

  Opt get(SysTimePoint now) const {
    if (!entry || entry->stale(now))
      return std::nullopt;
    return std::cref(entry->value);
  }

  // Refresh is due when never fetched or the cadence has elapsed
  bool due(SysTimePoint now, minutes cadence) const {
    return !entry || now - entry->fetched_at >= cadence;
  }

  void invalidate() { entry.reset(); }

  std::optional<SysTimePoint> fetched_at() const {
    if (!entry)
      return std::nullopt;
    return entry->fetched_at;
  }
};
