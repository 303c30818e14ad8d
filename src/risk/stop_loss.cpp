#include "risk/stop_loss.h"
#include "sig/coordinator.h"
#include "util/config.h"

#include <algorithm>

inline auto& signal_config = config.signal_config;

double stop_buffer(const Candidate& candidate, double point) {
  auto range = candidate.upper - candidate.lower;
  return std::max({signal_config.stop_buffer_points * point,
                   signal_config.stop_buffer_ratio * range, point});
}

double place_stop(const Candidate& candidate, double point) {
  auto buffer = stop_buffer(candidate, point);
  return candidate.dir == Direction::Bullish ? candidate.lower - buffer
                                             : candidate.upper + buffer;
}
