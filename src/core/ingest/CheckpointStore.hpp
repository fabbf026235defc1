#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>

#include "core/metadata/IndexStore.hpp"

namespace sai {

// In-memory view of the durable cursor and of the set of identifiers that
// reached a terminal status. Reloaded from the IndexStore at startup; only
// the PersistenceCoordinator applies changes after they were committed.
class CheckpointStore {
public:
  explicit CheckpointStore(IndexStore& store) : store_(store) {}

  void reload();

  bool isProcessed(const std::string& uid) const { return processed_.count(uid) != 0; }
  size_t processedCount() const { return processed_.size(); }
  const CheckpointState& state() const { return state_; }

  // True once a window was confirmed at least once.
  bool hasCursor() const { return state_.last_block.has_value(); }

  // First position to scan after a restart: last_block + 1 - overlap, floored at 0.
  std::optional<uint64_t> resumePosition(uint64_t overlap) const;

  // Cache updates, mirrored from committed writes.
  void markProcessed(const std::string& uid) { processed_.insert(uid); }
  void applyOutcome(const std::string& uid, bool failed, int64_t at);
  void applyCursor(uint64_t block, int64_t at);

private:
  IndexStore& store_;
  std::unordered_set<std::string> processed_;
  CheckpointState state_;
};

} // namespace sai
