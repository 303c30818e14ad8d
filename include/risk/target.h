#pragma once

#include "ind/candle.h"
#include "sig/coordinator.h"

#include <optional>

enum class TargetKind {
  Gap,
  Zone,
  Liquidity,
};

struct Target {
  double price;
  TargetKind kind;
  Horizon horizon;
};

// Nearest level strictly beyond entry in the trade direction: the near edge
// of an unfilled opposing gap or of a valid opposing zone, or an unswept
// liquidity level on the trade's side.
std::optional<Target> find_target(const Snapshot& snapshot,
                                  Direction dir,
                                  double entry);

double reward_risk(double entry, double stop, double target);
bool meets_reward_risk(double rr, double min_rr);
