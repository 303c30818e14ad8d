#include "sig/bias.h"
#include "util/config.h"

inline auto& coordinator_config = config.coordinator_config;

std::optional<Direction> BiasDecision::direction() const {
  if (bias == Bias::Bullish)
    return Direction::Bullish;
  if (bias == Bias::Bearish)
    return Direction::Bearish;
  return std::nullopt;
}

double tier_confidence(BiasTier tier) {
  switch (tier) {
    case BiasTier::Aligned:
      return coordinator_config.aligned_confidence;
    case BiasTier::WidestPriority:
      return coordinator_config.widest_confidence;
    case BiasTier::Fallback:
      return coordinator_config.fallback_confidence;
    default:
      return coordinator_config.neutral_confidence;
  }
}

static std::optional<Bias> bias_of(std::optional<Trend> trend) {
  if (trend == Trend::Uptrend)
    return Bias::Bullish;
  if (trend == Trend::Downtrend)
    return Bias::Bearish;
  return std::nullopt;
}

BiasDecision resolve_bias(std::optional<Trend> widest,
                          std::optional<Trend> second) {
  auto decide = [](Bias bias, BiasTier tier) {
    return BiasDecision{bias, tier, tier_confidence(tier)};
  };

  auto w = bias_of(widest);
  auto s = bias_of(second);

  if (w && s && *w == *s)
    return decide(*w, BiasTier::Aligned);
  if (w)
    return decide(*w, BiasTier::WidestPriority);
  if (s)
    return decide(*s, BiasTier::Fallback);
  return decide(Bias::Neutral, BiasTier::Neutral);
}
