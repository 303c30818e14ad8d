#pragma once

#include "ind/candle.h"

#include <optional>
#include <variant>
#include <vector>

struct Zone {
  Horizon horizon;
  Direction dir;
  double upper;
  double lower;
  double entry_level;
  SysTimePoint created_at;
  bool valid = true;
  double strength = 0.0;
  size_t index;
  size_t run_end;
};

struct FlippedZone {
  Zone origin;
  Direction dir;
  double upper;
  double lower;
  double entry_level;
  SysTimePoint created_at;
  bool valid = true;
  size_t index;
};

using ZoneState = std::variant<Zone, FlippedZone>;

// Common read-only view over either alternative
struct ZoneView {
  Horizon horizon;
  Direction dir;
  double upper;
  double lower;
  double entry_level;
  SysTimePoint created_at;
  bool valid;
  bool flipped;
};

ZoneView view(const ZoneState& state);

// Pure transition for one closed candle. A valid Zone closed beyond its
// opposite extreme becomes a FlippedZone; a FlippedZone closed beyond its own
// opposite extreme only loses validity.
ZoneState transition(const ZoneState& state, const Candle& candle, size_t idx);

struct Retest {
  size_t zone;
  size_t index;
  SysTimePoint time;
  bool flipped;
};

struct ZoneFindings {
  std::vector<ZoneState> zones;
  std::vector<Retest> retests;

  std::vector<ZoneView> views() const;
  size_t n_valid() const;
};

ZoneFindings detect_zones(const CandleSeries& series);
