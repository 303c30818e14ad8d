#pragma once

#include "ind/candle.h"

#include <functional>
#include <optional>
#include <vector>

struct Gap {
  Horizon horizon;
  Direction dir;
  double upper;
  double lower;
  double equilibrium;
  SysTimePoint created_at;
  bool filled = false;
  size_t source_index;

  bool contains(double price) const { return price >= lower && price <= upper; }
  bool same_as(const Gap& other) const {
    return horizon == other.horizon && dir == other.dir &&
           created_at == other.created_at && upper == other.upper &&
           lower == other.lower;
  }

  bool operator==(const Gap& other) const = default;
};

// Three-candle imbalances, newest last. A bullish gap sits above the later
// price (c1.low > c3.high) and is expected to be revisited from below.
std::vector<Gap> detect_gaps(const CandleSeries& series);

// Marks gaps fully traversed by candles after their third candle
void scan_fills(std::vector<Gap>& gaps, const CandleSeries& series);

using GapOpt = std::optional<std::reference_wrapper<const Gap>>;

GapOpt nearest_unfilled(const std::vector<Gap>& gaps,
                        double price,
                        std::optional<Direction> dir = std::nullopt);

enum class PriceZone {
  Premium,
  Discount,
  Equilibrium,
};

PriceZone classify(double price, double equilibrium);

// Fill tracking for one (symbol, horizon) across refreshes. Running extremes
// are kept per gap so candles from any horizon contribute to the fill.
class GapBook {
  struct Entry {
    Gap gap;
    SysTimePoint active_from;
    double lowest;
    double highest;
    SysTimePoint filled_at;
  };

  std::vector<Entry> entries;

 public:
  void merge(const std::vector<Gap>& detected);
  void scan(const CandleSeries& series);
  void prune(SysTimePoint now);

  std::vector<Gap> gaps() const;
  size_t size() const { return entries.size(); }
};
