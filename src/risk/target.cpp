#include "risk/target.h"
#include "util/config.h"

#include <cmath>

inline auto& signal_config = config.signal_config;

std::optional<Target> find_target(const Snapshot& snapshot,
                                  Direction dir,
                                  double entry) {
  auto up = dir == Direction::Bullish;
  std::optional<Target> best;

  auto consider = [&](double price, TargetKind kind, Horizon h) {
    auto beyond = up ? price > entry : price < entry;
    if (!beyond)
      return;
    if (!best || std::abs(price - entry) < std::abs(best->price - entry))
      best = Target{price, kind, h};
  };

  for (auto h : horizons) {
    auto& hs = snapshot[h];
    if (!hs.available())
      continue;

    for (auto& gap : hs.gaps)
      if (!gap.filled && gap.dir != dir)
        consider(up ? gap.lower : gap.upper, TargetKind::Gap, h);

    for (auto& z : hs.findings->zones.views())
      if (z.valid && z.dir != dir)
        consider(up ? z.lower : z.upper, TargetKind::Zone, h);

    auto side = up ? Side::Upper : Side::Lower;
    for (auto& level : hs.findings->liquidity.unswept(side))
      consider(level.price, TargetKind::Liquidity, h);
  }

  return best;
}

double reward_risk(double entry, double stop, double target) {
  auto risk = std::abs(entry - stop);
  if (risk == 0.0)
    return 0.0;
  return std::abs(target - entry) / risk;
}

bool meets_reward_risk(double rr, double min_rr) {
  return rr + signal_config.eps >= min_rr;
}
