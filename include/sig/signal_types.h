#pragma once

#include "ind/candle.h"
#include "ind/structure.h"

#include <optional>
#include <string>
#include <vector>

enum class OrderKind {
  LimitAbove,
  LimitBelow,
  StopAbove,
  StopBelow,
};

enum class Rejection {
  None,
  NoData,
  NeutralBias,
  NoCandidate,
  NoTarget,
  InvalidRisk,
  RewardRisk,
  LowConfidence,
};

struct SignalProposal {
  std::string symbol;
  Direction dir;
  OrderKind kind;
  double entry;
  double stop;
  double target;
  double reward_risk;
  double confidence;
  std::string setup;
  std::vector<std::string> tags;
  PerHorizon<std::optional<Trend>> bias_snapshot;
  SysTimePoint timestamp;
};

struct Decision {
  Rejection rejection = Rejection::None;
  std::optional<SignalProposal> proposal;

  bool emitted() const { return proposal.has_value(); }
};
