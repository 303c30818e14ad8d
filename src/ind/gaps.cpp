#include "ind/gaps.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>

inline auto& gap_config = config.gap_config;

std::vector<Gap> detect_gaps(const CandleSeries& series) {
  std::vector<Gap> gaps;
  if (series.size() < 3)
    return gaps;

  for (size_t i = 0; i + 2 < series.size(); i++) {
    auto& c1 = series[i];
    auto& c3 = series[i + 2];

    std::optional<Direction> dir;
    double upper = 0.0, lower = 0.0;

    if (c1.low > c3.high) {
      dir = Direction::Bullish;
      upper = c1.low;
      lower = c3.high;
    } else if (c1.high < c3.low) {
      dir = Direction::Bearish;
      upper = c3.low;
      lower = c1.high;
    }

    if (!dir || !checked_bounds(upper, lower, "gap", series, i))
      continue;

    gaps.push_back(Gap{
        .horizon = series.horizon,
        .dir = *dir,
        .upper = upper,
        .lower = lower,
        .equilibrium = (upper + lower) / 2,
        .created_at = c3.time(),
        .filled = false,
        .source_index = i,
    });
  }

  spdlog::debug("[gap] {} {}: {} gaps", series.symbol, to_str(series.horizon),
                gaps.size());
  return gaps;
}

void scan_fills(std::vector<Gap>& gaps, const CandleSeries& series) {
  for (auto& gap : gaps) {
    if (gap.filled)
      continue;

    double lowest = std::numeric_limits<double>::max();
    double highest = std::numeric_limits<double>::lowest();

    for (size_t j = gap.source_index + 3; j < series.size(); j++) {
      lowest = std::min(lowest, series[j].low);
      highest = std::max(highest, series[j].high);
      if (lowest <= gap.lower && highest >= gap.upper) {
        gap.filled = true;
        break;
      }
    }
  }
}

GapOpt nearest_unfilled(const std::vector<Gap>& gaps,
                        double price,
                        std::optional<Direction> dir) {
  GapOpt nearest;
  double best = std::numeric_limits<double>::max();

  for (auto& gap : gaps) {
    if (gap.filled || (dir && gap.dir != *dir))
      continue;

    auto dist = std::abs(price - gap.equilibrium);
    if (dist < best) {
      best = dist;
      nearest = std::cref(gap);
    }
  }

  return nearest;
}

PriceZone classify(double price, double equilibrium) {
  if (price > equilibrium)
    return PriceZone::Premium;
  if (price < equilibrium)
    return PriceZone::Discount;
  return PriceZone::Equilibrium;
}

void GapBook::merge(const std::vector<Gap>& detected) {
  for (auto& gap : detected) {
    auto it = std::ranges::find_if(
        entries, [&](const Entry& e) { return e.gap.same_as(gap); });
    if (it != entries.end())
      continue;

    auto active_from = gap.created_at + duration_of(gap.horizon);
    entries.push_back(Entry{
        .gap = gap,
        .active_from = active_from,
        .lowest = std::numeric_limits<double>::max(),
        .highest = std::numeric_limits<double>::lowest(),
        .filled_at = {},
    });
    entries.back().gap.filled = false;
  }

  std::ranges::sort(entries, {}, [](const Entry& e) { return e.gap.created_at; });
}

void GapBook::scan(const CandleSeries& series) {
  for (auto& e : entries) {
    if (e.gap.filled)
      continue;

    for (auto& c : series) {
      if (c.time() < e.active_from)
        continue;

      e.lowest = std::min(e.lowest, c.low);
      e.highest = std::max(e.highest, c.high);
      if (e.lowest <= e.gap.lower && e.highest >= e.gap.upper) {
        e.gap.filled = true;
        e.filled_at = c.time();
        spdlog::debug("[gap] {} {} gap {:.5f}-{:.5f} filled at {}",
                      series.symbol, to_str(e.gap.horizon), e.gap.lower,
                      e.gap.upper, datetime_to_string(c.time()));
        break;
      }
    }
  }
}

void GapBook::prune(SysTimePoint now) {
  std::erase_if(entries, [&](const Entry& e) {
    return e.gap.filled && now - e.filled_at > gap_config.retention();
  });

  if (entries.size() <= gap_config.max_tracked)
    return;

  // Oldest filled gaps go first, then the oldest unfilled ones
  auto excess = entries.size() - gap_config.max_tracked;
  for (auto it = entries.begin(); it != entries.end() && excess > 0;) {
    if (it->gap.filled) {
      it = entries.erase(it);
      excess--;
    } else {
      it++;
    }
  }
  if (excess > 0)
    entries.erase(entries.begin(), entries.begin() + excess);
}

std::vector<Gap> GapBook::gaps() const {
  std::vector<Gap> out;
  out.reserve(entries.size());
  for (auto& e : entries)
    out.push_back(e.gap);
  return out;
}
