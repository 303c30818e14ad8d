#pragma once

#include "util/times.h"

#include <stdexcept>
#include <string>
#include <vector>

enum class Direction {
  Bullish,
  Bearish,
};

constexpr Direction opposite(Direction d) {
  return d == Direction::Bullish ? Direction::Bearish : Direction::Bullish;
}

struct Candle {
  SysTimePoint datetime;
  double open = 0.0;
  double high = 0.0;
  double low = 0.0;
  double close = 0.0;
  double volume = 0.0;

  double price() const { return close; }
  SysTimePoint time() const { return datetime; }

  bool bullish() const { return close > open; }
  bool bearish() const { return close < open; }

  bool overlaps(double lower, double upper) const {
    return low <= upper && high >= lower;
  }
};

struct CandleSeries {
  std::string symbol;
  Horizon horizon = Horizon::H1;
  double point = 0.00001;
  std::vector<Candle> candles;

  auto size() const { return candles.size(); }
  bool empty() const { return candles.empty(); }

  const Candle& operator[](size_t i) const { return candles[i]; }
  const Candle& back() const { return candles.back(); }

  auto begin() const { return candles.begin(); }
  auto end() const { return candles.end(); }

  // Time at which candle i is complete
  SysTimePoint closes_at(size_t i) const {
    return candles[i].time() + duration_of(horizon);
  }
};

struct InvalidSeries : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// Throws InvalidSeries on non-increasing timestamps, non-finite prices or
// candles whose high/low do not bound open/close.
void validate(const CandleSeries& series);

// Logs and returns false when upper is not strictly above lower
bool checked_bounds(double upper,
                    double lower,
                    const char* tag,
                    const CandleSeries& series,
                    size_t idx);
