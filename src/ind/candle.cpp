#include "ind/candle.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <format>

void validate(const CandleSeries& series) {
  for (size_t i = 0; i < series.size(); i++) {
    auto& c = series[i];

    if (!std::isfinite(c.open) || !std::isfinite(c.high) ||
        !std::isfinite(c.low) || !std::isfinite(c.close))
      throw InvalidSeries(std::format("{} {}: non-finite price at {}",
                                      series.symbol, to_str(series.horizon),
                                      datetime_to_string(c.time())));

    if (c.low < 0)
      throw InvalidSeries(std::format("{} {}: negative price at {}",
                                      series.symbol, to_str(series.horizon),
                                      datetime_to_string(c.time())));

    if (c.high < std::max(c.open, c.close) || c.low > std::min(c.open, c.close))
      throw InvalidSeries(std::format("{} {}: bad candle [{}]", series.symbol,
                                      to_str(series.horizon), to_str(c)));

    if (i > 0 && series[i - 1].time() >= c.time())
      throw InvalidSeries(std::format("{} {}: timestamps not increasing at {}",
                                      series.symbol, to_str(series.horizon),
                                      datetime_to_string(c.time())));
  }
}

bool checked_bounds(double upper,
                    double lower,
                    const char* tag,
                    const CandleSeries& series,
                    size_t idx) {
  if (upper > lower)
    return true;

  spdlog::warn("[{}] {} {}: discarding bounds {:.5f}/{:.5f} at {}", tag,
               series.symbol, to_str(series.horizon), upper, lower,
               datetime_to_string(series[idx].time()));
  return false;
}
