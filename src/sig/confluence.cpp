#include "sig/confluence.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <algorithm>

inline auto& coordinator_config = config.coordinator_config;

double confluence_confidence(size_t n_sources) {
  if (n_sources < 2)
    return coordinator_config.standalone_confidence;
  auto extra = static_cast<double>(n_sources - 2);
  return std::min(1.0, coordinator_config.confluence_base +
                           extra * coordinator_config.confluence_step);
}

std::vector<ConfluenceZone> find_confluence(const std::vector<ZoneSource>& sources,
                                            Direction dir) {
  std::vector<ConfluenceZone> out;
  std::vector<std::vector<size_t>> seen;

  auto n = sources.size();
  for (size_t a = 0; a < n; a++) {
    if (sources[a].dir != dir)
      continue;

    for (size_t b = a + 1; b < n; b++) {
      auto& sa = sources[a];
      auto& sb = sources[b];
      if (sb.dir != dir || sa.horizon == sb.horizon)
        continue;

      auto lower = std::max(sa.lower, sb.lower);
      auto upper = std::min(sa.upper, sb.upper);
      if (lower > upper)
        continue;

      std::vector<size_t> members{a, b};
      for (size_t c = 0; c < n; c++) {
        if (c == a || c == b || sources[c].dir != dir)
          continue;
        auto lo = std::max(lower, sources[c].lower);
        auto hi = std::min(upper, sources[c].upper);
        if (lo <= hi) {
          lower = lo;
          upper = hi;
          members.push_back(c);
        }
      }

      std::ranges::sort(members);
      if (std::ranges::find(seen, members) != seen.end())
        continue;
      seen.push_back(members);

      ConfluenceZone cz{
          .upper = upper,
          .lower = lower,
          .entry_level = (upper + lower) / 2,
          .dir = dir,
          .confidence = confluence_confidence(members.size()),
          .sources = {},
      };
      for (auto m : members)
        cz.sources.push_back(sources[m]);

      spdlog::debug("[confluence] {} {:.5f}-{:.5f} from {} sources", to_str(dir),
                    cz.lower, cz.upper, cz.sources.size());
      out.push_back(std::move(cz));
    }
  }

  return out;
}
