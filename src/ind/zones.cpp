#include "ind/zones.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <algorithm>

inline auto& zone_config = config.zone_config;

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

ZoneView view(const ZoneState& state) {
  return std::visit(
      overloaded{
          [](const Zone& z) {
            return ZoneView{z.horizon, z.dir,        z.upper, z.lower,
                            z.entry_level, z.created_at, z.valid, false};
          },
          [](const FlippedZone& f) {
            return ZoneView{f.origin.horizon, f.dir,        f.upper, f.lower,
                            f.entry_level,    f.created_at, f.valid, true};
          },
      },
      state);
}

namespace {

bool closes_beyond(Direction dir, double upper, double lower, const Candle& c) {
  return dir == Direction::Bullish ? c.close < lower : c.close > upper;
}

std::optional<Direction> direction_of(const Candle& c) {
  if (c.bullish())
    return Direction::Bullish;
  if (c.bearish())
    return Direction::Bearish;
  return std::nullopt;
}

}  // namespace

ZoneState transition(const ZoneState& state, const Candle& candle, size_t idx) {
  return std::visit(
      overloaded{
          [&](const Zone& z) -> ZoneState {
            if (!z.valid || !closes_beyond(z.dir, z.upper, z.lower, candle))
              return z;

            auto origin = z;
            origin.valid = false;
            return FlippedZone{
                .origin = origin,
                .dir = opposite(z.dir),
                .upper = z.upper,
                .lower = z.lower,
                .entry_level = z.entry_level,
                .created_at = candle.time(),
                .valid = true,
                .index = idx,
            };
          },
          [&](const FlippedZone& f) -> ZoneState {
            if (!f.valid || !closes_beyond(f.dir, f.upper, f.lower, candle))
              return f;
            auto out = f;
            out.valid = false;
            return out;
          },
      },
      state);
}

std::vector<ZoneView> ZoneFindings::views() const {
  std::vector<ZoneView> out;
  out.reserve(zones.size());
  for (auto& z : zones)
    out.push_back(view(z));
  return out;
}

size_t ZoneFindings::n_valid() const {
  return std::ranges::count_if(zones,
                               [](const auto& z) { return view(z).valid; });
}

// Folds the candles after the zone candle through the transition, recording
// re-entries into the bounds once the impulsive run has completed.
static void track(ZoneState& state,
                  size_t zone_idx,
                  const CandleSeries& series,
                  std::vector<Retest>& retests) {
  const auto zone = std::get<Zone>(state);
  bool inside_prev = series[zone.run_end].overlaps(zone.lower, zone.upper);

  for (size_t j = zone.index + 1; j < series.size(); j++) {
    auto& c = series[j];
    bool was_zone = std::holds_alternative<Zone>(state);

    state = transition(state, c, j);

    if (was_zone && std::holds_alternative<FlippedZone>(state)) {
      spdlog::debug("[zone] {} {} {} zone {:.5f}-{:.5f} flipped at {}",
                    series.symbol, to_str(series.horizon),
                    to_str(std::get<FlippedZone>(state).origin.dir),
                    zone.lower, zone.upper, datetime_to_string(c.time()));
      inside_prev = true;
      continue;
    }

    if (j <= zone.run_end)
      continue;

    auto v = view(state);
    bool inside = c.overlaps(v.lower, v.upper);
    if (v.valid && inside && !inside_prev)
      retests.push_back(Retest{zone_idx, j, c.time(), v.flipped});
    inside_prev = inside;
  }
}

ZoneFindings detect_zones(const CandleSeries& series) {
  ZoneFindings findings;

  auto n = series.size();
  auto min_run = zone_config.min_run;
  if (n < min_run + 1)
    return findings;

  auto min_move = zone_config.min_move_points * series.point;

  size_t i = 0;
  while (i + min_run < n) {
    auto dir = direction_of(series[i + 1]);
    if (!dir) {
      i++;
      continue;
    }

    size_t end = i + 1;
    while (end + 1 < n && direction_of(series[end + 1]) == dir)
      end++;

    auto len = end - i;
    auto move = *dir == Direction::Bullish
                    ? series[end].close - series[i + 1].open
                    : series[i + 1].open - series[end].close;

    if (len < min_run || move < min_move) {
      i = end;
      continue;
    }

    // Zone candle: the one just before the run, or the last opposing body
    std::optional<size_t> zi;
    auto stop = i >= zone_config.opposing_lookback
                    ? i - zone_config.opposing_lookback
                    : 0;
    for (size_t k = i + 1; k-- > stop;) {
      if (direction_of(series[k]) == opposite(*dir)) {
        zi = k;
        break;
      }
    }

    if (!zi) {
      i = end;
      continue;
    }

    auto& zc = series[*zi];
    if (checked_bounds(zc.high, zc.low, "zone", series, *zi)) {
      auto range = std::max(zc.high - zc.low, series.point);
      Zone zone{
          .horizon = series.horizon,
          .dir = *dir,
          .upper = zc.high,
          .lower = zc.low,
          .entry_level = (zc.high + zc.low) / 2,
          .created_at = zc.time(),
          .valid = true,
          .strength = move / range,
          .index = *zi,
          .run_end = end,
      };

      ZoneState state = zone;
      track(state, findings.zones.size(), series, findings.retests);
      findings.zones.push_back(std::move(state));
    }

    i = end;
  }

  spdlog::debug("[zone] {} {}: {} zones, {} valid, {} retests", series.symbol,
                to_str(series.horizon), findings.zones.size(),
                findings.n_valid(), findings.retests.size());
  return findings;
}
