#pragma once

#include "core/collaborators.h"
#include "ind/candle.h"
#include "util/times.h"

#include <string>
#include <unordered_map>
#include <vector>

struct Timeline {
  std::vector<Candle> candles;
};

// Keyed by series_key(id, horizon)
using CandleStore = std::unordered_map<std::string, Timeline>;

std::string series_key(const std::string& id, Horizon h);

// Parses {"values": [{"datetime": ..., "open": ...}, ...]} sorted by time.
// Rows whose datetime does not parse are dropped.
std::vector<Candle> read_candles_json(const std::string& str);

// Serves stored candle series against a replay clock that moves forward by
// the narrowest horizon each cycle. Only candles already closed are served.
class ReplaySource : public CandleSource {
  CandleStore store;
  std::vector<std::string> ids;

  SysTimePoint clock;
  SysTimePoint end;

  void init_clock();

 public:
  ReplaySource(const std::string& dir) noexcept;
  ReplaySource(CandleStore store) noexcept;

  std::vector<Candle> get_candles(const std::string& id,
                                  Horizon horizon,
                                  size_t count) override;
  SysTimePoint now() const override { return clock; }
  bool advance() override;

  const std::vector<std::string>& offered() const { return ids; }
  bool has_data() const { return !store.empty() && clock <= end; }
};
