#include "CheckpointStore.hpp"

#include <spdlog/spdlog.h>

namespace sai {

void CheckpointStore::reload() {
  processed_.clear();
  for (auto& uid : store_.loadTerminalUids()) processed_.insert(std::move(uid));
  state_ = store_.loadCheckpoint().value_or(CheckpointState{});
  spdlog::info("loaded {} processed submissions, checkpoint at block {}",
               processedCount(),
               state_.last_block ? std::to_string(*state_.last_block) : std::string("<none>"));
}

std::optional<uint64_t> CheckpointStore::resumePosition(uint64_t overlap) const {
  if (!hasCursor()) return std::nullopt;
  const uint64_t next = *state_.last_block + 1;
  return next > overlap ? next - overlap : 0;
}

void CheckpointStore::applyOutcome(const std::string& uid, bool failed, int64_t at) {
  state_.last_attestation_uid = uid;
  state_.processed_count += 1;
  if (failed) state_.error_count += 1;
  state_.updated_at = at;
}

void CheckpointStore::applyCursor(uint64_t block, int64_t at) {
  if (!state_.last_block || *state_.last_block < block) state_.last_block = block;
  state_.updated_at = at;
}

} // namespace sai
