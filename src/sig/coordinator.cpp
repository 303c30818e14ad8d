#include "sig/coordinator.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>

inline auto& cache_config = config.cache_config;
inline auto& coordinator_config = config.coordinator_config;

std::vector<ZoneSource> collect_sources(const Snapshot& snapshot,
                                        Direction dir,
                                        std::optional<Horizon> only) {
  std::vector<ZoneSource> sources;

  for (auto h : horizons) {
    auto& hs = snapshot[h];
    if (!hs.available() || (only && *only != h))
      continue;

    for (auto& gap : hs.gaps)
      if (!gap.filled && gap.dir == dir)
        sources.push_back(ZoneSource{h, SourceKind::Gap, dir, gap.upper,
                                     gap.lower, gap.created_at});

    for (auto& z : hs.findings->zones.views())
      if (z.valid && z.dir == dir)
        sources.push_back(ZoneSource{
            h, z.flipped ? SourceKind::FlippedZone : SourceKind::Zone, dir,
            z.upper, z.lower, z.created_at});
  }

  return sources;
}

static std::optional<Candidate> standalone(const Snapshot& snapshot,
                                           Direction dir,
                                           double price) {
  auto sources = collect_sources(snapshot, dir, SECOND);

  const ZoneSource* best = nullptr;
  double best_dist = std::numeric_limits<double>::max();
  for (auto& s : sources) {
    auto dist = std::abs(price - (s.upper + s.lower) / 2);
    if (dist < best_dist) {
      best_dist = dist;
      best = &s;
    }
  }

  if (!best)
    return std::nullopt;

  return Candidate{
      .dir = dir,
      .upper = best->upper,
      .lower = best->lower,
      .entry_level = (best->upper + best->lower) / 2,
      .confidence = coordinator_config.standalone_confidence,
      .confluence = false,
      .sources = {*best},
  };
}

Assessment assess(const Snapshot& snapshot, double price) {
  Assessment a;
  a.price = price;

  for (auto h : horizons)
    if (snapshot[h].available())
      a.trends[h] = snapshot[h].findings->structure.trend;

  a.bias = resolve_bias(a.trends[WIDEST], a.trends[SECOND]);

  auto dir = a.bias.direction();
  if (!dir)
    return a;

  a.confluence = find_confluence(collect_sources(snapshot, *dir), *dir);

  if (!a.confluence.empty()) {
    auto dist = [&](const ConfluenceZone& cz) {
      return std::abs(price - cz.entry_level);
    };
    auto it = std::ranges::min_element(a.confluence, [&](auto& l, auto& r) {
      if (dist(l) != dist(r))
        return dist(l) < dist(r);
      return l.confidence > r.confidence;
    });

    a.candidate = Candidate{
        .dir = *dir,
        .upper = it->upper,
        .lower = it->lower,
        .entry_level = it->entry_level,
        .confidence = it->confidence,
        .confluence = true,
        .sources = it->sources,
    };
    return a;
  }

  a.candidate = standalone(snapshot, *dir, price);
  return a;
}

bool Coordinator::due(Horizon h, SysTimePoint now) const {
  return cache[h].due(now, cache_config.cadence(h));
}

void Coordinator::update(const CandleSeries& series, SysTimePoint now) {
  auto h = series.horizon;
  Findings findings{series};

  books[h].merge(findings.gaps);
  for (auto& book : books) {
    book.scan(series);
    book.prune(now);
  }

  spdlog::debug("[cache] {} {} refreshed: {} gaps tracked, {} zones", symbol,
                to_str(h), books[h].size(), findings.zones.zones.size());
  cache[h].store(std::move(findings), now, cache_config.ttl(h));
}

void Coordinator::invalidate(Horizon h) {
  cache[h].invalidate();
}

Cached<Findings>::Opt Coordinator::findings(Horizon h, SysTimePoint now) const {
  return cache[h].get(now);
}

Snapshot Coordinator::snapshot(SysTimePoint now) const {
  Snapshot snap;
  for (auto h : horizons) {
    auto f = cache[h].get(now);
    if (!f) {
      if (cache[h].fetched_at())
        spdlog::info("[cache] {} {} stale, treated as unavailable", symbol,
                     to_str(h));
      continue;
    }
    snap[h] = HorizonSnapshot{f->get(), books[h].gaps()};
  }
  return snap;
}

std::optional<double> Coordinator::last_price(SysTimePoint now) const {
  for (auto it = horizons.rbegin(); it != horizons.rend(); it++)
    if (auto f = cache[*it].get(now))
      return f->get().last_close;
  return std::nullopt;
}
