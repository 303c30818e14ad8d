// ============================================================================
// test_gaps.cpp - Gap detection, fill scanning and gap book tracking
// ============================================================================

#include "test_common.h"

#include "ind/gaps.h"
#include "util/config.h"

#include <random>

void TestBullishGapLiteral() {
  TEST_SECTION("Bullish gap from literal candles");

  auto s = make_series(Horizon::H1, {
                                        {111.0, 112.0, 110.0, 111.5},
                                        {108.8, 109.0, 108.0, 108.2},
                                        {104.5, 105.0, 103.0, 103.5},
                                    });
  auto gaps = detect_gaps(s);

  TEST_ASSERT(gaps.size() == 1, "one gap expected");
  if (gaps.size() != 1)
    return;

  auto& g = gaps[0];
  TEST_ASSERT(g.dir == Direction::Bullish, "c1.low > c3.high is a bullish gap");
  TEST_ASSERT(g.upper == 110.0, "upper is c1.low");
  TEST_ASSERT(g.lower == 105.0, "lower is c3.high");
  TEST_ASSERT(g.equilibrium == 107.5, "equilibrium is the midpoint");
  TEST_ASSERT(g.created_at == s[2].time(), "created at the third candle");
  TEST_ASSERT(g.source_index == 0, "source index is the first candle");
  TEST_ASSERT(!g.filled, "new gaps start unfilled");
  TEST_ASSERT(g.horizon == Horizon::H1, "horizon carried over");
}

void TestBearishGapLiteral() {
  TEST_SECTION("Bearish gap from literal candles");

  auto s = make_series(Horizon::M15, {
                                         {101.0, 102.0, 100.0, 101.5},
                                         {103.0, 104.0, 102.5, 103.8},
                                         {106.0, 107.0, 105.0, 106.5},
                                     });
  auto gaps = detect_gaps(s);

  TEST_ASSERT(gaps.size() == 1, "one gap expected");
  if (gaps.size() != 1)
    return;

  TEST_ASSERT(gaps[0].dir == Direction::Bearish, "c1.high < c3.low is bearish");
  TEST_ASSERT(gaps[0].upper == 105.0, "upper is c3.low");
  TEST_ASSERT(gaps[0].lower == 102.0, "lower is c1.high");
}

void TestDegenerateTriple() {
  TEST_SECTION("Touching candles produce no gap");

  auto s = make_series(Horizon::H1, {
                                        {111.0, 112.0, 110.0, 111.5},
                                        {109.0, 110.5, 108.0, 108.5},
                                        {108.0, 110.0, 107.0, 107.5},
                                    });
  TEST_ASSERT(detect_gaps(s).empty(), "c1.low == c3.high is not a gap");

  auto short_series = make_series(Horizon::H1, {{1, 2, 0.5, 1.5}, {1, 2, 0.5, 1.5}});
  TEST_ASSERT(detect_gaps(short_series).empty(), "fewer than 3 candles");
}

void TestRandomTriples() {
  TEST_SECTION("Random triples keep bounds and midpoint exact");

  std::mt19937 rng{42};
  std::uniform_real_distribution<double> mid{50.0, 150.0};
  std::uniform_real_distribution<double> half{0.1, 5.0};

  size_t n_gaps = 0;
  bool ok = true;
  for (int t = 0; t < 2000; t++) {
    std::vector<OHLC> bars;
    for (int k = 0; k < 3; k++) {
      auto m = mid(rng);
      auto h = half(rng);
      bars.push_back({m, m + h, m - h, m});
    }

    auto gaps = detect_gaps(make_series(Horizon::H4, bars));
    for (auto& g : gaps) {
      n_gaps++;
      ok = ok && g.upper == std::max(g.upper, g.lower) && g.upper > g.lower &&
           g.equilibrium == (g.upper + g.lower) / 2;
    }
  }

  TEST_ASSERT(n_gaps > 0, "random triples should produce some gaps");
  TEST_ASSERT(ok, "every gap has upper above lower and an exact midpoint");
}

void TestIdempotence() {
  TEST_SECTION("Detection is idempotent");

  auto s = make_series(Horizon::H1, {
                                        {111, 112, 110, 111.5},
                                        {108.8, 109, 108, 108.2},
                                        {104.5, 105, 103, 103.5},
                                        {103.5, 104, 100, 100.5},
                                        {100.5, 101, 98, 98.5},
                                        {98.5, 99, 95, 95.5},
                                    });

  auto first = detect_gaps(s);
  auto second = detect_gaps(s);
  TEST_ASSERT(first.size() >= 2, "several gaps in a falling series");
  TEST_ASSERT(first == second, "same input, same gaps");
}

void TestFillScan() {
  TEST_SECTION("Fill scan and monotonicity");

  auto s = make_series(Horizon::H1, {
                                        {111, 112, 110, 111.5},
                                        {108.8, 109, 108, 108.2},
                                        {104.5, 105, 103, 103.5},
                                        {103.5, 108, 102, 107.5},
                                        {107.5, 111, 106, 110.5},
                                    });

  auto partial = s;
  partial.candles.resize(4);

  auto gaps = detect_gaps(partial);
  scan_fills(gaps, partial);
  TEST_ASSERT(gaps.size() == 1 && !gaps[0].filled,
              "partially traded gap stays unfilled");

  auto full = detect_gaps(s);
  scan_fills(full, s);
  auto bullish = nearest_unfilled(full, 107.0, Direction::Bullish);
  TEST_ASSERT(!bullish, "filled gap is excluded from the nearest search");
  TEST_ASSERT(full[0].filled, "gap traded through on both sides is filled");

  scan_fills(full, partial);
  TEST_ASSERT(full[0].filled, "filled never reverts");
}

void TestGapBook() {
  TEST_SECTION("Gap book merges, fills across horizons and retains 24h");

  auto h1 = make_series(Horizon::H1, {
                                         {111, 112, 110, 111.5},
                                         {108.8, 109, 108, 108.2},
                                         {104.5, 105, 103, 103.5},
                                     });

  GapBook book;
  book.merge(detect_gaps(h1));
  book.merge(detect_gaps(h1));
  TEST_ASSERT(book.size() == 1, "duplicate detections are merged");

  // M5 candles after the gap completed, reaching the edges one at a time
  auto active = h1[2].time() + H_1;
  auto m5_mid = make_series(Horizon::M5, {{107, 108, 106, 107.5}}, 1.0, active);
  auto m5_high = make_series(Horizon::M5, {{108, 110.5, 107.5, 110}}, 1.0,
                             active + M_5);

  book.scan(m5_mid);
  TEST_ASSERT(!book.gaps()[0].filled, "partial traversal does not fill");
  book.scan(m5_high);
  TEST_ASSERT(!book.gaps()[0].filled, "lower edge not reached yet");

  auto m5_drop = make_series(Horizon::M5, {{106, 106.5, 104.8, 105}}, 1.0,
                             active + M_5 * 2);
  book.scan(m5_drop);
  TEST_ASSERT(book.gaps()[0].filled, "extremes accumulate across scans");

  auto before = make_series(Horizon::M5, {{90, 91, 89, 90}}, 1.0, h1[0].time());
  book.scan(before);
  TEST_ASSERT(book.gaps()[0].filled, "later scans cannot unfill");

  auto filled_at = m5_drop[0].time();
  book.prune(filled_at + hours{23});
  TEST_ASSERT(book.size() == 1, "filled gap retained inside the window");
  book.prune(filled_at + hours{25});
  TEST_ASSERT(book.size() == 0, "filled gap dropped after the window");
}

void TestGapBookCap() {
  TEST_SECTION("Gap book caps tracked gaps");

  auto saved = config.gap_config.max_tracked;
  config.gap_config.max_tracked = 2;

  std::vector<OHLC> bars;
  for (int i = 0; i < 6; i++) {
    auto base = 200.0 - i * 5;
    bars.push_back({base, base + 1, base - 1, base - 0.5});
  }
  auto s = make_series(Horizon::H1, bars);
  auto gaps = detect_gaps(s);

  GapBook book;
  book.merge(gaps);
  book.prune(s.back().time());
  TEST_ASSERT(gaps.size() > 2, "falling series has several gaps");
  TEST_ASSERT(book.size() == 2, "oldest gaps pruned past the cap");
  TEST_ASSERT(book.gaps().back().created_at == gaps.back().created_at,
              "newest gap kept");

  config.gap_config.max_tracked = saved;
}

void TestHelpers() {
  TEST_SECTION("Nearest gap and premium/discount");

  std::vector<Gap> gaps{
      Gap{Horizon::H1, Direction::Bullish, 110, 105, 107.5, base_time(), false, 0},
      Gap{Horizon::H1, Direction::Bearish, 95, 90, 92.5, base_time(), false, 3},
      Gap{Horizon::H1, Direction::Bearish, 101, 99, 100, base_time(), true, 5},
  };

  auto any = nearest_unfilled(gaps, 99.0);
  TEST_ASSERT(any && any->get().equilibrium == 92.5,
              "nearest unfilled ignores the filled gap");

  auto bull = nearest_unfilled(gaps, 99.0, Direction::Bullish);
  TEST_ASSERT(bull && bull->get().dir == Direction::Bullish,
              "direction filter honoured");

  TEST_ASSERT(classify(108.0, 107.5) == PriceZone::Premium, "above is premium");
  TEST_ASSERT(classify(107.0, 107.5) == PriceZone::Discount, "below is discount");
  TEST_ASSERT(classify(107.5, 107.5) == PriceZone::Equilibrium, "at equilibrium");
}

int main() {
  std::cout << "=================================================\n";
  std::cout << "           Gap Detector Unit Tests\n";
  std::cout << "=================================================\n";

  TestBullishGapLiteral();
  TestBearishGapLiteral();
  TestDegenerateTriple();
  TestRandomTriples();
  TestIdempotence();
  TestFillScan();
  TestGapBook();
  TestGapBookCap();
  TestHelpers();

  return summarize("test_gaps");
}
