#include "ind/liquidity.h"
#include "ind/structure.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <algorithm>

inline auto& liquidity_config = config.liquidity_config;

namespace {

enum class Outcome {
  Active,
  Broken,
  Swept,
};

// Walks the candles after the level was confirmed. Returns how the level
// ended up and, for a sweep, the candle indices of the spike and the reclaim.
Outcome follow(LiquidityLevel& level,
               const CandleSeries& series,
               size_t from,
               double sweep_tol,
               double touch_tol,
               size_t& spike,
               size_t& reclaim) {
  auto upper = level.side == Side::Upper;
  auto beyond = [&](const Candle& c) {
    return upper ? c.high - level.price : level.price - c.low;
  };
  auto reclaimed = [&](const Candle& c) {
    return upper ? c.close <= level.price : c.close >= level.price;
  };

  for (size_t j = from; j < series.size(); j++) {
    auto& c = series[j];

    if (beyond(c) > sweep_tol) {
      if (reclaimed(c)) {
        spike = reclaim = j;
        return Outcome::Swept;
      }
      if (j + 1 == series.size())
        return Outcome::Active;
      if (reclaimed(series[j + 1])) {
        spike = j;
        reclaim = j + 1;
        return Outcome::Swept;
      }
      return Outcome::Broken;
    }

    if (!reclaimed(c))
      return Outcome::Broken;

    if (beyond(c) >= -touch_tol)
      level.touch_count++;
  }

  return Outcome::Active;
}

}  // namespace

std::vector<LiquidityLevel> LiquidityFindings::unswept(Side side) const {
  std::vector<LiquidityLevel> out;
  for (auto& l : levels)
    if (l.side == side && !l.swept)
      out.push_back(l);
  return out;
}

LiquidityFindings analyze_liquidity(const CandleSeries& series) {
  LiquidityFindings findings;

  auto k = liquidity_config.swing_window;
  auto n = series.size();
  if (n < 2 * k + 1)
    return findings;

  auto sweep_tol = liquidity_config.sweep_tolerance_points * series.point;
  auto touch_tol = liquidity_config.touch_tolerance_points * series.point;
  auto first = n > liquidity_config.lookback ? n - liquidity_config.lookback : 0;

  for (size_t i = std::max(first, k); i + k < n; i++) {
    for (auto side : {Side::Upper, Side::Lower}) {
      auto swing = side == Side::Upper ? is_swing_high(series, i, k)
                                       : is_swing_low(series, i, k);
      if (!swing)
        continue;

      LiquidityLevel level{
          .price = side == Side::Upper ? series[i].high : series[i].low,
          .side = side,
          .formed_at = series[i].time(),
          .index = i,
      };

      size_t spike = 0, reclaim = 0;
      auto outcome = follow(level, series, i + k + 1, sweep_tol, touch_tol,
                            spike, reclaim);

      if (outcome == Outcome::Broken)
        continue;

      if (outcome == Outcome::Swept) {
        auto& sc = series[spike];
        level.swept = true;
        level.swept_at = series[reclaim].time();
        findings.sweeps.push_back(Sweep{
            .horizon = series.horizon,
            .side = side,
            .level = level.price,
            .extreme = side == Side::Upper ? sc.high : sc.low,
            .time = series[reclaim].time(),
        });
        spdlog::debug("[liquidity] {} {} {} level {:.5f} swept at {}",
                      series.symbol, to_str(series.horizon), to_str(side),
                      level.price, datetime_to_string(*level.swept_at));
      }

      findings.levels.push_back(level);
    }
  }

  // Keep the most touched, then most recent, active levels per side
  std::ranges::sort(findings.levels, [](const auto& a, const auto& b) {
    if (a.touch_count != b.touch_count)
      return a.touch_count > b.touch_count;
    return a.index > b.index;
  });

  size_t n_upper = 0, n_lower = 0;
  std::erase_if(findings.levels, [&](const LiquidityLevel& l) {
    if (l.swept)
      return false;
    auto& count = l.side == Side::Upper ? n_upper : n_lower;
    return ++count > liquidity_config.max_levels_per_side;
  });

  std::ranges::sort(findings.sweeps, {}, &Sweep::time);

  spdlog::debug("[liquidity] {} {}: {} levels, {} sweeps", series.symbol,
                to_str(series.horizon), findings.levels.size(),
                findings.sweeps.size());
  return findings;
}

void SweepLog::append(const Sweep& sweep) {
  if (std::ranges::find(entries, sweep) != entries.end())
    return;

  auto it = std::ranges::upper_bound(entries, sweep.time, {}, &Sweep::time);
  entries.insert(it, sweep);

  while (entries.size() > cap)
    entries.pop_front();
}

bool SweepLog::has_recent(Direction favor,
                          SysTimePoint now,
                          minutes window) const {
  return std::ranges::any_of(entries, [&](const Sweep& s) {
    return s.favors() == favor && s.time <= now && now - s.time <= window;
  });
}
