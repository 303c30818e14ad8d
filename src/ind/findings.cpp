#include "ind/findings.h"

Findings::Findings(const CandleSeries& series) noexcept
    : horizon{series.horizon},
      gaps{detect_gaps(series)},
      zones{detect_zones(series)},
      structure{analyze_structure(series)},
      liquidity{analyze_liquidity(series)}  //
{
  if (series.empty())
    return;

  as_of = series.back().time();
  last_close = series.back().close;
  scan_fills(gaps, series);
}
