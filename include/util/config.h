#pragma once

#include "util/times.h"

#include <map>
#include <string>
#include <vector>

struct GapConfig {
  static constexpr const char* name = "gap_config";
  static constexpr bool debug = true;

  size_t retention_hours = 24;
  size_t max_tracked = 120;

  hours retention() const { return hours{retention_hours}; }
};

struct ZoneConfig {
  static constexpr const char* name = "zone_config";
  static constexpr bool debug = true;

  size_t min_run = 3;
  double min_move_points = 20;
  size_t opposing_lookback = 5;
};

struct StructureConfig {
  static constexpr const char* name = "structure_config";
  static constexpr bool debug = true;

  size_t swing_window = 2;
};

struct LiquidityConfig {
  static constexpr const char* name = "liquidity_config";
  static constexpr bool debug = true;

  size_t lookback = 60;
  size_t swing_window = 2;
  double sweep_tolerance_points = 10;
  double touch_tolerance_points = 5;
  size_t max_levels_per_side = 5;

  size_t sweep_log_cap = 20;
  size_t recent_sweep_minutes = 240;

  minutes recent_sweep_window() const { return minutes{recent_sweep_minutes}; }
};

struct CoordinatorConfig {
  static constexpr const char* name = "coordinator_config";
  static constexpr bool debug = true;

  double aligned_confidence = 0.9;
  double widest_confidence = 0.75;
  double fallback_confidence = 0.55;
  double neutral_confidence = 0.0;

  double confluence_base = 0.6;
  double confluence_step = 0.15;
  double standalone_confidence = 0.4;
};

struct SignalConfig {
  static constexpr const char* name = "signal_config";
  static constexpr bool debug = true;

  double min_reward_risk = 2.0;
  double min_confidence = 0.0;

  double stop_buffer_points = 2;
  double stop_buffer_ratio = 0.1;

  double tier_weight = 0.5;
  double confluence_weight = 0.3;
  double sweep_weight = 0.2;

  double eps = 1e-9;
};

struct CacheConfig {
  static constexpr const char* name = "cache_config";
  static constexpr bool debug = true;

  size_t candles_h4 = 100;
  size_t candles_h1 = 100;
  size_t candles_m15 = 100;
  size_t candles_m5 = 100;

  size_t cadence_h4 = 30;
  size_t cadence_h1 = 10;
  size_t cadence_m15 = 3;
  size_t cadence_m5 = 1;

  size_t ttl_h4 = 240;
  size_t ttl_h1 = 60;
  size_t ttl_m15 = 20;
  size_t ttl_m5 = 8;

  size_t n_candles(Horizon h) const {
    return h == Horizon::H4    ? candles_h4
           : h == Horizon::H1  ? candles_h1
           : h == Horizon::M15 ? candles_m15
                               : candles_m5;
  }

  minutes cadence(Horizon h) const {
    return minutes{h == Horizon::H4    ? cadence_h4
                   : h == Horizon::H1  ? cadence_h1
                   : h == Horizon::M15 ? cadence_m15
                                       : cadence_m5};
  }

  minutes ttl(Horizon h) const {
    return minutes{h == Horizon::H4    ? ttl_h4
                   : h == Horizon::H1  ? ttl_h1
                   : h == Horizon::M15 ? ttl_m15
                                       : ttl_m5};
  }
};

// Weekly window with a daily break, all in GMT. Days are ISO, Monday = 1.
struct Session {
  std::string symbol;
  unsigned open_day = 7;
  std::string open = "23:00";
  unsigned close_day = 5;
  std::string close = "22:00";
  std::string break_start = "22:00";
  std::string break_end = "23:00";
};

struct SessionsConfig {
  static constexpr const char* name = "sessions_config";
  static constexpr bool debug = true;

  Session fallback;
  std::vector<Session> sessions;
  std::map<std::string, std::vector<std::string>> variations = {
      {"XAUUSD", {"XAUUSD", "GOLD", "XAUUSD.a", "XAUUSDm"}},
      {"EURUSD", {"EURUSD", "EURUSD.a", "EURUSDm"}},
      {"GBPUSD", {"GBPUSD", "GBPUSD.a", "GBPUSDm"}},
      {"USDJPY", {"USDJPY", "USDJPY.a", "USDJPYm"}},
  };
};

struct Config {
  bool debug_en = false;
  std::string data_dir = "data";
  double speed = 0.0;
  size_t max_cycles = 0;
  size_t n_concurrency = 1;

  GapConfig gap_config;
  ZoneConfig zone_config;
  StructureConfig structure_config;
  LiquidityConfig liquidity_config;
  CoordinatorConfig coordinator_config;
  SignalConfig signal_config;
  CacheConfig cache_config;
  SessionsConfig sessions_config;

  Config() noexcept = default;
  void read_args(int argc, char* argv[]);
  void update();

  seconds update_interval() const {
    if (speed == 0.0)
      return minutes{1};
    auto secs = static_cast<uint64_t>(60 / speed);
    return seconds{secs};
  }
};

inline Config config;
