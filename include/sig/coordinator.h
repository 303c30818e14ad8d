#pragma once

#include "core/cache.h"
#include "ind/findings.h"
#include "sig/bias.h"
#include "sig/confluence.h"

#include <optional>
#include <string>
#include <vector>

// One horizon as seen by a single evaluation cycle
struct HorizonSnapshot {
  const Findings* findings = nullptr;
  std::vector<Gap> gaps;

  HorizonSnapshot() = default;
  HorizonSnapshot(const Findings& f) : findings{&f}, gaps{f.gaps} {}
  HorizonSnapshot(const Findings& f, std::vector<Gap> gaps)
      : findings{&f}, gaps{std::move(gaps)} {}

  bool available() const { return findings != nullptr; }
};

using Snapshot = PerHorizon<HorizonSnapshot>;

struct Candidate {
  Direction dir;
  double upper;
  double lower;
  double entry_level;
  double confidence;
  bool confluence;
  std::vector<ZoneSource> sources;
};

struct Assessment {
  BiasDecision bias;
  PerHorizon<std::optional<Trend>> trends;
  std::vector<ConfluenceZone> confluence;
  std::optional<Candidate> candidate;
  double price = 0.0;
};

// Unfilled gaps and valid (flipped) zones of one direction across horizons
std::vector<ZoneSource> collect_sources(const Snapshot& snapshot,
                                        Direction dir,
                                        std::optional<Horizon> only = {});

Assessment assess(const Snapshot& snapshot, double price);

// Per-symbol detector caches and gap books
class Coordinator {
  std::string symbol;
  PerHorizon<Cached<Findings>> cache;
  PerHorizon<GapBook> books;

 public:
  Coordinator(std::string symbol) noexcept : symbol{std::move(symbol)} {}

  bool due(Horizon h, SysTimePoint now) const;
  void update(const CandleSeries& series, SysTimePoint now);
  void invalidate(Horizon h);

  Cached<Findings>::Opt findings(Horizon h, SysTimePoint now) const;
  Snapshot snapshot(SysTimePoint now) const;

  // Last close of the narrowest horizon still within its ttl
  std::optional<double> last_price(SysTimePoint now) const;
};
