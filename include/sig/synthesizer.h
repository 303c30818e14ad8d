#pragma once

#include "ind/liquidity.h"
#include "sig/coordinator.h"
#include "sig/signal_types.h"

#include <string>

// Limit when the entry waits for a pullback, stop when it waits for a breakout
OrderKind order_kind(Direction dir, double entry, double price);

double proposal_confidence(const Assessment& assessment, bool favorable_sweep);

Decision synthesize(const std::string& symbol,
                    const Assessment& assessment,
                    const Snapshot& snapshot,
                    const SweepLog& sweeps,
                    double point,
                    SysTimePoint now);
