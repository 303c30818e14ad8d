#pragma once

#include "ind/candle.h"

#include <vector>

enum class SourceKind {
  Gap,
  Zone,
  FlippedZone,
};

struct ZoneSource {
  Horizon horizon;
  SourceKind kind;
  Direction dir;
  double upper;
  double lower;
  SysTimePoint created_at;

  bool operator==(const ZoneSource& other) const = default;
};

struct ConfluenceZone {
  double upper;
  double lower;
  double entry_level;
  Direction dir;
  double confidence;
  std::vector<ZoneSource> sources;
};

double confluence_confidence(size_t n_sources);

// Overlaps between sources of the given direction taken from distinct
// horizons. Pairs are grown with any further source overlapping the running
// intersection; identical contributor sets are reported once.
std::vector<ConfluenceZone> find_confluence(const std::vector<ZoneSource>& sources,
                                            Direction dir);
