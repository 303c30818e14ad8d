#pragma once

#include "ind/candle.h"
#include "ind/structure.h"

#include <optional>

enum class Bias {
  Bullish,
  Bearish,
  Neutral,
};

enum class BiasTier {
  Aligned = 1,
  WidestPriority = 2,
  Fallback = 3,
  Neutral = 4,
};

struct BiasDecision {
  Bias bias = Bias::Neutral;
  BiasTier tier = BiasTier::Neutral;
  double confidence = 0.0;

  std::optional<Direction> direction() const;
};

double tier_confidence(BiasTier tier);

// Rules evaluated top-down. A missing widest horizon counts as ranging; when
// both are missing the result is neutral.
BiasDecision resolve_bias(std::optional<Trend> widest,
                          std::optional<Trend> second);
