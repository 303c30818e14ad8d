#include "ind/structure.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/spdlog.h>

inline auto& structure_config = config.structure_config;

bool is_swing_high(const CandleSeries& series, size_t i, size_t k) {
  if (i < k || i + k >= series.size())
    return false;

  for (size_t j = i - k; j <= i + k; j++)
    if (j != i && series[j].high >= series[i].high)
      return false;
  return true;
}

bool is_swing_low(const CandleSeries& series, size_t i, size_t k) {
  if (i < k || i + k >= series.size())
    return false;

  for (size_t j = i - k; j <= i + k; j++)
    if (j != i && series[j].low <= series[i].low)
      return false;
  return true;
}

namespace {

struct Swings {
  std::vector<StructurePoint> highs;
  std::vector<StructurePoint> lows;

  void add(const StructurePoint& sp) {
    auto& v = sp.type == SwingType::High ? highs : lows;
    v.push_back(sp);
    if (v.size() > 2)
      v.erase(v.begin());
  }

  void clear() {
    highs.clear();
    lows.clear();
  }

  // Only reclassifies once two highs and two lows are known
  Trend classify(Trend current) const {
    if (highs.size() < 2 || lows.size() < 2)
      return current;

    auto hh = highs[1].price > highs[0].price;
    auto hl = lows[1].price > lows[0].price;
    auto lh = highs[1].price < highs[0].price;
    auto ll = lows[1].price < lows[0].price;

    if (hh && hl)
      return Trend::Uptrend;
    if (lh && ll)
      return Trend::Downtrend;
    return Trend::Ranging;
  }
};

}  // namespace

Structure analyze_structure(const CandleSeries& series) {
  Structure s;

  auto k = structure_config.swing_window;
  auto n = series.size();
  if (n < 2 * k + 1)
    return s;

  Swings swings;
  bool high_broken = false, low_broken = false;

  auto emit = [&](StructureEventType type, Direction dir, double level,
                  size_t j) {
    s.events.push_back(StructureEvent{type, dir, level, series[j].time(), j});
    spdlog::debug("[structure] {} {} {} {} at {:.5f} on {}", series.symbol,
                  to_str(series.horizon), to_str(dir), to_str(type), level,
                  datetime_to_string(series[j].time()));
  };

  for (size_t j = 2 * k; j < n; j++) {
    // swing at i is confirmed once candle j = i + k has closed
    auto i = j - k;
    if (is_swing_high(series, i, k)) {
      StructurePoint sp{series[i].high, SwingType::High, series[i].time(), i};
      s.points.push_back(sp);
      swings.add(sp);
      high_broken = false;
      s.trend = swings.classify(s.trend);
    }
    if (is_swing_low(series, i, k)) {
      StructurePoint sp{series[i].low, SwingType::Low, series[i].time(), i};
      s.points.push_back(sp);
      swings.add(sp);
      low_broken = false;
      s.trend = swings.classify(s.trend);
    }

    auto close = series[j].close;

    if (s.trend == Trend::Uptrend) {
      if (!swings.lows.empty() && close < swings.lows.back().price) {
        emit(StructureEventType::Shift, Direction::Bearish,
             swings.lows.back().price, j);
        s.trend = Trend::Downtrend;
        swings.clear();
        continue;
      }
      if (!swings.highs.empty() && !high_broken &&
          close > swings.highs.back().price) {
        emit(StructureEventType::Break, Direction::Bullish,
             swings.highs.back().price, j);
        high_broken = true;
      }
    } else if (s.trend == Trend::Downtrend) {
      if (!swings.highs.empty() && close > swings.highs.back().price) {
        emit(StructureEventType::Shift, Direction::Bullish,
             swings.highs.back().price, j);
        s.trend = Trend::Uptrend;
        swings.clear();
        continue;
      }
      if (!swings.lows.empty() && !low_broken &&
          close < swings.lows.back().price) {
        emit(StructureEventType::Break, Direction::Bearish,
             swings.lows.back().price, j);
        low_broken = true;
      }
    }
  }

  spdlog::debug("[structure] {} {}: {} ({} points, {} events)", series.symbol,
                to_str(series.horizon), to_str(s.trend), s.points.size(),
                s.events.size());
  return s;
}
