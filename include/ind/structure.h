#pragma once

#include "ind/candle.h"

#include <vector>

enum class Trend {
  Uptrend,
  Downtrend,
  Ranging,
};

enum class SwingType {
  High,
  Low,
};

struct StructurePoint {
  double price;
  SwingType type;
  SysTimePoint time;
  size_t index;
};

enum class StructureEventType {
  Break,
  Shift,
};

struct StructureEvent {
  StructureEventType type;
  Direction dir;
  double level;
  SysTimePoint time;
  size_t index;
};

struct Structure {
  std::vector<StructurePoint> points;
  std::vector<StructureEvent> events;
  Trend trend = Trend::Ranging;
};

bool is_swing_high(const CandleSeries& series, size_t i, size_t k);
bool is_swing_low(const CandleSeries& series, size_t i, size_t k);

Structure analyze_structure(const CandleSeries& series);
