#pragma once

#include "core/collaborators.h"
#include "ind/liquidity.h"
#include "sig/bias.h"
#include "sig/coordinator.h"
#include "sig/signal_types.h"
#include "util/symbols.h"

#include <map>
#include <optional>
#include <string>

struct SymbolState {
  SymbolInfo si;
  std::string broker_id;
  Coordinator coordinator;
  SweepLog sweeps;
  std::optional<Bias> last_bias;

  SymbolState(const SymbolInfo& si, std::string broker_id) noexcept;
};

class Engine {
  CandleSource& source;
  const MarketHours& hours;
  ProposalSink& sink;

  std::map<std::string, SymbolState> states;
  size_t n_cycles = 0;

  void refresh(SymbolState& state, SysTimePoint now);

 public:
  Engine(const Symbols& symbols,
         CandleSource& source,
         const MarketHours& hours,
         const SymbolResolver& resolver,
         ProposalSink& sink) noexcept;

  // Evaluates every open symbol once; returns the number of proposals
  size_t cycle();
  void run();

  Decision evaluate(SymbolState& state, SysTimePoint now);

  const SymbolState* state(const std::string& symbol) const;
  size_t cycles() const { return n_cycles; }
};
