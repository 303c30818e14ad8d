#pragma once

#include "ind/candle.h"
#include "ind/gaps.h"
#include "ind/liquidity.h"
#include "ind/structure.h"
#include "ind/zones.h"

// Output of every detector for one series
struct Findings {
  Horizon horizon;
  SysTimePoint as_of;
  double last_close = 0.0;

  std::vector<Gap> gaps;
  ZoneFindings zones;
  Structure structure;
  LiquidityFindings liquidity;

  Findings(const CandleSeries& series) noexcept;
};
