// ============================================================================
// test_zones.cpp - Reversal zone detection, flips and retests
// ============================================================================

#include "test_common.h"

#include "ind/zones.h"
#include "util/config.h"

// Bullish run off a bearish candle, a retest, a close through the zone low
// that flips it, a retest of the flipped zone and finally a close through it.
static CandleSeries flip_series() {
  return make_series(Horizon::H1, {
                                      {100.0, 101.0, 99.0, 100.5},
                                      {101.0, 101.5, 98.0, 98.5},
                                      {98.5, 101.0, 98.2, 100.8},
                                      {100.8, 103.0, 100.5, 102.8},
                                      {102.8, 106.0, 102.5, 105.8},
                                      {105.8, 106.0, 104.0, 104.2},
                                      {104.2, 104.5, 101.0, 101.2},
                                      {101.2, 101.4, 97.0, 97.5},
                                      {97.5, 98.0, 96.0, 96.5},
                                      {96.5, 97.0, 95.0, 95.5},
                                      {95.5, 99.0, 95.2, 98.8},
                                      {98.8, 103.0, 98.5, 102.5},
                                  });
}

void TestDetection() {
  TEST_SECTION("Zone detection");

  config.zone_config.min_move_points = 2;
  auto s = flip_series();
  auto f = detect_zones(s);

  TEST_ASSERT(f.zones.size() == 2, "two impulsive runs, two zones");
  if (f.zones.size() != 2)
    return;

  auto first = view(f.zones[0]);
  TEST_ASSERT(first.upper == 101.5 && first.lower == 98.0,
              "bounds from the opposing candle");
  TEST_ASSERT(first.entry_level == (101.5 + 98.0) / 2, "entry is the midpoint");

  auto& second = std::get<Zone>(f.zones[1]);
  TEST_ASSERT(second.dir == Direction::Bearish, "falling run gives a bearish zone");
  TEST_ASSERT(second.upper == 106.0 && second.lower == 102.5,
              "bearish zone bounds from the last bullish candle");
  TEST_ASSERT(second.index == 4 && second.run_end == 9, "run indices");
  TEST_ASSERT(second.valid, "bearish zone never closed through");
  TEST_ASSERT(near(second.strength, (105.8 - 95.5) / 3.5), "strength is move over range");
}

void TestFlip() {
  TEST_SECTION("Zone flips once at the invalidation candle");

  config.zone_config.min_move_points = 2;
  auto s = flip_series();
  auto f = detect_zones(s);
  if (f.zones.empty())
    return;

  TEST_ASSERT(std::holds_alternative<FlippedZone>(f.zones[0]),
              "bullish zone closed below its low has flipped");
  if (!std::holds_alternative<FlippedZone>(f.zones[0]))
    return;

  auto& fz = std::get<FlippedZone>(f.zones[0]);
  TEST_ASSERT(!fz.origin.valid, "origin zone is invalid");
  TEST_ASSERT(fz.origin.dir == Direction::Bullish, "origin was bullish");
  TEST_ASSERT(fz.dir == Direction::Bearish, "flipped direction is inverted");
  TEST_ASSERT(fz.upper == fz.origin.upper && fz.lower == fz.origin.lower,
              "same bounds");
  TEST_ASSERT(fz.created_at == s[7].time() && fz.index == 7,
              "stamped with the invalidation candle");
  TEST_ASSERT(!fz.valid, "flipped zone closed through later");
}

void TestTransition() {
  TEST_SECTION("Pure transition function");

  Zone z{
      .horizon = Horizon::H1,
      .dir = Direction::Bullish,
      .upper = 101.5,
      .lower = 98.0,
      .entry_level = 99.75,
      .created_at = base_time(),
      .valid = true,
      .strength = 2.0,
      .index = 1,
      .run_end = 4,
  };

  auto t = base_time() + H_1 * 6;
  ZoneState s0 = z;

  auto s1 = transition(s0, candle_at(t, {100, 100.5, 98.5, 99}), 6);
  TEST_ASSERT(std::holds_alternative<Zone>(s1) && std::get<Zone>(s1).valid,
              "close inside keeps the zone");

  auto s2 = transition(s1, candle_at(t + H_1, {99, 99.5, 96.5, 97}), 7);
  TEST_ASSERT(std::holds_alternative<FlippedZone>(s2), "close below flips");

  auto s3 = transition(s2, candle_at(t + H_1 * 2, {97, 97.5, 95, 96}), 8);
  TEST_ASSERT(std::holds_alternative<FlippedZone>(s3) &&
                  std::get<FlippedZone>(s3).valid &&
                  std::get<FlippedZone>(s3).created_at == t + H_1,
              "a second close below does not flip again");

  auto s4 = transition(s3, candle_at(t + H_1 * 3, {96, 102.5, 96, 102}), 9);
  TEST_ASSERT(std::holds_alternative<FlippedZone>(s4) &&
                  !std::get<FlippedZone>(s4).valid,
              "close above the flipped zone invalidates it");

  auto s5 = transition(s4, candle_at(t + H_1 * 4, {102, 103, 90, 91}), 10);
  TEST_ASSERT(std::holds_alternative<FlippedZone>(s5) &&
                  !std::get<FlippedZone>(s5).valid,
              "no further transitions once invalid");

  auto v = view(s2);
  TEST_ASSERT(v.flipped && v.valid && v.dir == Direction::Bearish,
              "view reflects the flipped alternative");
}

void TestRetests() {
  TEST_SECTION("Retest events");

  config.zone_config.min_move_points = 2;
  auto f = detect_zones(flip_series());

  TEST_ASSERT(f.retests.size() == 3, "three re-entries");
  if (f.retests.size() != 3)
    return;

  TEST_ASSERT(f.retests[0].zone == 0 && f.retests[0].index == 6 &&
                  !f.retests[0].flipped,
              "valid zone retested before it failed");
  TEST_ASSERT(f.retests[1].zone == 0 && f.retests[1].index == 10 &&
                  f.retests[1].flipped,
              "flipped zone retested from below");
  TEST_ASSERT(f.retests[2].zone == 1 && f.retests[2].index == 11,
              "bearish zone retested by the last candle");
}

void TestInvalidBounds() {
  TEST_SECTION("Malformed zone candle is discarded");

  config.zone_config.min_move_points = 2;
  auto s = flip_series();
  s.candles[1] = candle_at(s[1].time(), {101.0, 97.0, 101.5, 98.5});

  auto f = detect_zones(s);
  TEST_ASSERT(f.zones.size() == 1, "only the well formed zone survives");
  if (!f.zones.empty())
    TEST_ASSERT(view(f.zones[0]).dir == Direction::Bearish,
                "remaining zone is the bearish one");
}

void TestThresholds() {
  TEST_SECTION("Run length and minimum move");

  config.zone_config.min_move_points = 50;
  TEST_ASSERT(detect_zones(flip_series()).zones.empty(),
              "moves below the minimum are ignored");

  config.zone_config.min_move_points = 2;
  config.zone_config.min_run = 6;
  TEST_ASSERT(detect_zones(flip_series()).zones.empty(),
              "runs shorter than the minimum are ignored");
  config.zone_config.min_run = 3;

  auto tiny = make_series(Horizon::H1, {{1, 2, 0.5, 1.5}, {1.5, 2.5, 1, 2}});
  TEST_ASSERT(detect_zones(tiny).zones.empty(), "too few candles");
}

int main() {
  std::cout << "=================================================\n";
  std::cout << "           Reversal Zone Unit Tests\n";
  std::cout << "=================================================\n";

  TestDetection();
  TestFlip();
  TestTransition();
  TestRetests();
  TestInvalidBounds();
  TestThresholds();

  return summarize("test_zones");
}
