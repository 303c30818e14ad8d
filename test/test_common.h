#pragma once

#include "ind/candle.h"
#include "util/times.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

static int g_testsPassed = 0;
static int g_testsFailed = 0;

#define TEST_ASSERT(cond, msg) do { \
    if (!(cond)) { \
        std::cerr << "[FAIL] " << msg << " (line " << __LINE__ << ")\n"; \
        g_testsFailed++; \
    } else { \
        g_testsPassed++; \
    } \
} while(0)

#define TEST_SECTION(name) std::cout << "\n=== " << name << " ===\n"

inline bool near(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

// Monday 2024-01-08 00:00 GMT
inline SysTimePoint base_time() {
  using namespace std::chrono;
  return sys_days{2024y / January / 8};
}

using OHLC = std::array<double, 4>;

inline Candle candle_at(SysTimePoint t, const OHLC& v) {
  return Candle{t, v[0], v[1], v[2], v[3], 100.0};
}

inline CandleSeries make_series(Horizon h,
                                const std::vector<OHLC>& bars,
                                double point = 1.0,
                                SysTimePoint start = base_time()) {
  CandleSeries s{"TEST", h, point, {}};
  for (size_t i = 0; i < bars.size(); i++)
    s.candles.push_back(candle_at(start + duration_of(h) * static_cast<int>(i), bars[i]));
  return s;
}

inline int summarize(const char* name) {
  std::cout << "\n=================================================\n";
  std::cout << name << ": " << g_testsPassed << " passed, " << g_testsFailed
            << " failed\n";
  return g_testsFailed > 0 ? 1 : 0;
}
