#pragma once

#include "ind/candle.h"
#include "sig/signal_types.h"

#include <string>
#include <vector>

class CandleSource {
 public:
  virtual ~CandleSource() = default;

  // Oldest first; may hold fewer candles than asked for
  virtual std::vector<Candle> get_candles(const std::string& id,
                                          Horizon horizon,
                                          size_t count) = 0;
  virtual SysTimePoint now() const = 0;

  // Moves to the next cycle; false once nothing is left to serve
  virtual bool advance() { return true; }
};

class MarketHours {
 public:
  virtual ~MarketHours() = default;
  virtual bool is_open(const std::string& symbol, SysTimePoint now) const = 0;
};

class SymbolResolver {
 public:
  virtual ~SymbolResolver() = default;
  virtual std::string resolve(const std::string& symbol) const = 0;
};

class ProposalSink {
 public:
  virtual ~ProposalSink() = default;
  virtual void submit(const SignalProposal& proposal) = 0;
};
