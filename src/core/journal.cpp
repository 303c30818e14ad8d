#include "core/journal.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <fstream>
#include <glaze/glaze.hpp>
#include <map>

struct ProposalRecord {
  std::string symbol;
  std::string direction;
  std::string kind;
  double entry;
  double stop;
  double target;
  double reward_risk;
  double confidence;
  std::string setup;
  std::vector<std::string> tags;
  std::map<std::string, std::string> bias;
  std::string timestamp;
};

std::string to_json(const SignalProposal& p) {
  ProposalRecord rec{
      .symbol = p.symbol,
      .direction = to_str(p.dir),
      .kind = to_str(p.kind),
      .entry = p.entry,
      .stop = p.stop,
      .target = p.target,
      .reward_risk = p.reward_risk,
      .confidence = p.confidence,
      .setup = p.setup,
      .tags = p.tags,
      .bias = {},
      .timestamp = datetime_to_string(p.timestamp),
  };

  for (auto h : horizons)
    rec.bias[to_str(h)] = p.bias_snapshot[h] ? to_str(*p.bias_snapshot[h])
                                             : std::string{"unavailable"};

  std::string buffer;
  auto ec = glz::write_json(rec, buffer);
  if (ec) {
    spdlog::error("[journal] {} json error: {}", p.symbol,
                  glz::format_error(ec, buffer));
    return {};
  }
  return buffer;
}

void ProposalJournal::submit(const SignalProposal& proposal) {
  auto line = to_json(proposal);

  std::lock_guard lk{mtx};
  n_submitted++;
  spdlog::info("[journal] {} {} {} @ {:.5f}", proposal.symbol,
               to_str(proposal.dir), to_str(proposal.kind), proposal.entry);

  if (line.empty())
    return;

  std::ofstream out{path, std::ios::app};
  if (!out) {
    spdlog::error("[journal] cannot open {}", path);
    return;
  }
  out << line << '\n';
}
