#pragma once

#include "ind/candle.h"

#include <deque>
#include <optional>
#include <vector>

enum class Side {
  Upper,
  Lower,
};

struct LiquidityLevel {
  double price;
  Side side;
  size_t touch_count = 0;
  bool swept = false;
  std::optional<SysTimePoint> swept_at;
  SysTimePoint formed_at;
  size_t index;
};

struct Sweep {
  Horizon horizon;
  Side side;
  double level;
  double extreme;
  SysTimePoint time;

  // A sweep of lows favours longs
  Direction favors() const {
    return side == Side::Lower ? Direction::Bullish : Direction::Bearish;
  }

  bool operator==(const Sweep& other) const = default;
};

struct LiquidityFindings {
  std::vector<LiquidityLevel> levels;
  std::vector<Sweep> sweeps;

  std::vector<LiquidityLevel> unswept(Side side) const;
};

LiquidityFindings analyze_liquidity(const CandleSeries& series);

// Per-symbol chronological record of sweeps across horizons, newest last
class SweepLog {
  std::deque<Sweep> entries;
  size_t cap;

 public:
  SweepLog(size_t cap) noexcept : cap{cap} {}

  void append(const Sweep& sweep);
  bool has_recent(Direction favor, SysTimePoint now, minutes window) const;

  size_t size() const { return entries.size(); }
  const Sweep& back() const { return entries.back(); }
  auto begin() const { return entries.begin(); }
  auto end() const { return entries.end(); }
};
