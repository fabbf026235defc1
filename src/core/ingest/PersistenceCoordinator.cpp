#include "PersistenceCoordinator.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace sai {

void PersistenceCoordinator::persistProgress(const Submission& s) {
  if (is_terminal(s.status)) throw std::logic_error("persistProgress called with terminal status");
  if (!store_.upsertSubmission(s)) {
    spdlog::warn("submission {} already terminal, progress row not written", s.uid);
  }
}

void PersistenceCoordinator::commit(const Submission& s, const std::vector<ScanRecord>& records) {
  if (!is_terminal(s.status)) throw std::logic_error("commit requires a terminal status");
  store_.commitSubmission(s, records);
}

void PersistenceCoordinator::recordOutcome(const Submission& s) {
  const bool failed = s.status == SubmissionStatus::Failed;
  const int64_t at = unix_now();
  store_.recordOutcome(s.uid, failed, at);
  checkpoints_.markProcessed(s.uid);
  checkpoints_.applyOutcome(s.uid, failed, at);
}

void PersistenceCoordinator::advanceCursor(uint64_t block) {
  const int64_t at = unix_now();
  store_.advanceCursor(block, at);
  checkpoints_.applyCursor(block, at);
}

} // namespace sai
