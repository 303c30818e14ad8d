// ============================================================================
// test_liquidity.cpp - Liquidity levels, touches, sweeps and the sweep log
// ============================================================================

#include "test_common.h"

#include "ind/liquidity.h"
#include "util/config.h"

// Swing high at 100, three approaches within tolerance, a spike to 112 that
// closes above, then a close back below the level on the next candle.
static CandleSeries sweep_series() {
  return make_series(Horizon::M15, {
                                       {90, 95, 88, 93},
                                       {93, 97, 92, 96},
                                       {96, 100, 95, 97},
                                       {97, 98, 94, 95},
                                       {95, 96, 92, 94},
                                       {94, 98, 93, 97},
                                       {97, 99, 95, 96},
                                       {96, 99.5, 94, 95},
                                       {95, 112, 94, 101},
                                       {101, 102, 96, 97},
                                   });
}

static void reset_config() {
  config.liquidity_config.swing_window = 2;
  config.liquidity_config.sweep_tolerance_points = 10;
  config.liquidity_config.touch_tolerance_points = 5;
  config.liquidity_config.lookback = 60;
  config.liquidity_config.max_levels_per_side = 5;
}

void TestSweepScenario() {
  TEST_SECTION("Three touches, spike beyond tolerance, close back below");

  reset_config();
  auto s = sweep_series();
  auto f = analyze_liquidity(s);

  TEST_ASSERT(f.sweeps.size() == 1, "exactly one sweep");
  if (f.sweeps.size() == 1) {
    auto& sw = f.sweeps[0];
    TEST_ASSERT(sw.side == Side::Upper && sw.level == 100,
                "upper level at 100 swept");
    TEST_ASSERT(sw.extreme == 112, "spike extreme recorded");
    TEST_ASSERT(sw.time == s[9].time(), "confirmed by the next candle");
    TEST_ASSERT(sw.favors() == Direction::Bearish, "sweep of highs favours shorts");
  }

  auto it = std::ranges::find_if(f.levels, [](const LiquidityLevel& l) {
    return l.side == Side::Upper && l.price == 100;
  });
  TEST_ASSERT(it != f.levels.end(), "level kept for audit");
  if (it != f.levels.end()) {
    TEST_ASSERT(it->swept, "level marked swept");
    TEST_ASSERT(it->touch_count == 3, "three touches before the sweep");
    TEST_ASSERT(it->swept_at && *it->swept_at == s[9].time(), "swept_at set");
  }

  auto lower = f.unswept(Side::Lower);
  TEST_ASSERT(lower.size() == 1 && lower[0].price == 92,
              "swing low at 92 stays unswept");
  TEST_ASSERT(f.unswept(Side::Upper).empty(), "no unswept highs left");
}

void TestSpikeWithinTolerance() {
  TEST_SECTION("Spike inside tolerance is a touch, not a sweep");

  reset_config();
  auto s = sweep_series();
  s.candles[8] = candle_at(s[8].time(), {95, 108, 94, 99});

  auto f = analyze_liquidity(s);
  TEST_ASSERT(f.sweeps.empty(), "8 points beyond with tolerance 10");

  auto upper = f.unswept(Side::Upper);
  TEST_ASSERT(upper.size() == 1 && upper[0].touch_count == 5,
              "spike and the following candle both count as touches");
}

void TestBrokenLevel() {
  TEST_SECTION("Close through without reclaim breaks the level");

  reset_config();
  auto s = sweep_series();
  s.candles[9] = candle_at(s[9].time(), {101, 104, 100.5, 103});

  auto f = analyze_liquidity(s);
  TEST_ASSERT(f.sweeps.empty(), "no sweep when price holds above");
  TEST_ASSERT(f.unswept(Side::Upper).empty(), "broken level removed");
}

void TestSameCandleReclaim() {
  TEST_SECTION("Spike and reclaim on one candle");

  reset_config();
  auto s = sweep_series();
  s.candles[8] = candle_at(s[8].time(), {95, 112, 94, 98});

  auto f = analyze_liquidity(s);
  TEST_ASSERT(f.sweeps.size() == 1 && f.sweeps[0].time == s[8].time(),
              "swept on the spike candle itself");
}

void TestSweepLog() {
  TEST_SECTION("Sweep log ordering, dedupe and cap");

  SweepLog log{3};
  auto t = base_time();
  auto sweep = [&](int i, Side side) {
    return Sweep{Horizon::M15, side, 100.0 + i, 112.0 + i, t + M_15 * i};
  };

  log.append(sweep(2, Side::Upper));
  log.append(sweep(1, Side::Lower));
  log.append(sweep(2, Side::Upper));
  TEST_ASSERT(log.size() == 2, "duplicate ignored");
  TEST_ASSERT(log.begin()->time == t + M_15, "kept chronological");

  log.append(sweep(3, Side::Upper));
  log.append(sweep(4, Side::Upper));
  TEST_ASSERT(log.size() == 3, "capped");
  TEST_ASSERT(log.begin()->time == t + M_15 * 2, "oldest pruned first");
  TEST_ASSERT(log.back().time == t + M_15 * 4, "newest last");

  auto now = t + M_15 * 5;
  TEST_ASSERT(log.has_recent(Direction::Bearish, now, minutes{60}),
              "recent upper sweep favours shorts");
  TEST_ASSERT(!log.has_recent(Direction::Bullish, now, minutes{60}),
              "the lower sweep was pruned");
  TEST_ASSERT(!log.has_recent(Direction::Bearish, now + hours{5}, minutes{60}),
              "old sweeps fall out of the window");
}

int main() {
  std::cout << "=================================================\n";
  std::cout << "           Stop-Hunt Analyzer Unit Tests\n";
  std::cout << "=================================================\n";

  TestSweepScenario();
  TestSpikeWithinTolerance();
  TestBrokenLevel();
  TestSameCandleReclaim();
  TestSweepLog();

  return summarize("test_liquidity");
}
