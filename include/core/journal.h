#pragma once

#include "core/collaborators.h"

#include <atomic>
#include <mutex>
#include <string>

// Logs proposals and appends each one as a JSON line
class ProposalJournal : public ProposalSink {
  std::string path;
  std::mutex mtx;
  std::atomic<size_t> n_submitted{0};

 public:
  ProposalJournal(std::string path = "logs/proposals.jsonl") noexcept
      : path{std::move(path)} {}

  void submit(const SignalProposal& proposal) override;
  size_t submitted() const { return n_submitted; }
};

std::string to_json(const SignalProposal& proposal);
