#include "sig/synthesizer.h"
#include "risk/stop_loss.h"
#include "risk/target.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>

inline auto& signal_config = config.signal_config;
inline auto& liquidity_config = config.liquidity_config;

OrderKind order_kind(Direction dir, double entry, double price) {
  if (dir == Direction::Bullish)
    return entry <= price ? OrderKind::LimitBelow : OrderKind::StopAbove;
  return entry >= price ? OrderKind::LimitAbove : OrderKind::StopBelow;
}

double proposal_confidence(const Assessment& assessment, bool favorable_sweep) {
  double contributors = assessment.candidate ? assessment.candidate->confidence : 0.0;
  auto conf = signal_config.tier_weight * assessment.bias.confidence +
              signal_config.confluence_weight * contributors +
              signal_config.sweep_weight * (favorable_sweep ? 1.0 : 0.0);
  return std::clamp(conf, 0.0, 1.0);
}

static std::string setup_of(const Candidate& c) {
  if (c.confluence)
    return "confluence";
  switch (c.sources.front().kind) {
    case SourceKind::Gap:
      return "gap";
    case SourceKind::Zone:
      return "zone";
    default:
      return "flipped-zone";
  }
}

// A contributing zone whose bounds were re-entered on the latest candle
static bool retested(const Candidate& c, const Snapshot& snapshot) {
  for (auto& src : c.sources) {
    if (src.kind == SourceKind::Gap)
      continue;

    auto* f = snapshot[src.horizon].findings;
    if (!f)
      continue;

    for (auto& r : f->zones.retests) {
      auto v = view(f->zones.zones[r.zone]);
      if (r.time == f->as_of && v.created_at == src.created_at &&
          v.upper == src.upper && v.lower == src.lower)
        return true;
    }
  }
  return false;
}

Decision synthesize(const std::string& symbol,
                    const Assessment& assessment,
                    const Snapshot& snapshot,
                    const SweepLog& sweeps,
                    double point,
                    SysTimePoint now) {
  auto reject = [&](Rejection r) {
    spdlog::info("[signal] {} no signal: {}", symbol, to_str(r));
    return Decision{r, std::nullopt};
  };

  auto dir = assessment.bias.direction();
  if (!dir)
    return reject(Rejection::NeutralBias);

  if (!assessment.candidate)
    return reject(Rejection::NoCandidate);

  auto& cand = *assessment.candidate;
  auto entry = cand.entry_level;
  auto stop = place_stop(cand, point);

  auto target = find_target(snapshot, *dir, entry);
  if (!target)
    return reject(Rejection::NoTarget);

  auto stop_ok = *dir == Direction::Bullish ? stop < entry : stop > entry;
  if (!stop_ok)
    return reject(Rejection::InvalidRisk);

  auto rr = reward_risk(entry, stop, target->price);
  if (!meets_reward_risk(rr, signal_config.min_reward_risk)) {
    spdlog::debug("[signal] {} rr {:.3f} below {:.3f}", symbol, rr,
                  signal_config.min_reward_risk);
    return reject(Rejection::RewardRisk);
  }

  auto sweep = sweeps.has_recent(*dir, now, liquidity_config.recent_sweep_window());
  auto conf = proposal_confidence(assessment, sweep);
  if (conf < signal_config.min_confidence)
    return reject(Rejection::LowConfidence);

  SignalProposal p{
      .symbol = symbol,
      .dir = *dir,
      .kind = order_kind(*dir, entry, assessment.price),
      .entry = entry,
      .stop = stop,
      .target = target->price,
      .reward_risk = rr,
      .confidence = conf,
      .setup = setup_of(cand),
      .tags = {},
      .bias_snapshot = assessment.trends,
      .timestamp = now,
  };

  p.tags.push_back("tier:" + to_str(assessment.bias.tier));
  p.tags.push_back(std::format("sources:{}", cand.sources.size()));
  for (auto& src : cand.sources)
    p.tags.push_back(to_str(src.horizon) + ":" + to_str(src.kind));
  if (sweep)
    p.tags.push_back("sweep");
  if (retested(cand, snapshot))
    p.tags.push_back("retest");
  p.tags.push_back("target:" + to_str(target->kind));

  spdlog::info("[signal] {} {} {} entry {:.5f} stop {:.5f} target {:.5f} "
               "rr {:.2f} conf {:.2f} [{}]",
               symbol, to_str(p.dir), to_str(p.kind), p.entry, p.stop,
               p.target, p.reward_risk, p.confidence,
               join(p.tags.begin(), p.tags.end()));

  return Decision{Rejection::None, std::move(p)};
}
