#pragma once
#include <cstdint>
#include <vector>

#include "core/ingest/CheckpointStore.hpp"
#include "core/metadata/IndexStore.hpp"

namespace sai {

// The only writer of submissions, records and the checkpoint row. Every
// in-memory checkpoint change happens after the matching durable write.
class PersistenceCoordinator {
public:
  PersistenceCoordinator(IndexStore& store, CheckpointStore& checkpoints)
    : store_(store), checkpoints_(checkpoints) {}

  // Writes a non-terminal row so an interrupted fetch stays visible.
  void persistProgress(const Submission& s);

  // Submission row and its full record set, atomically.
  void commit(const Submission& s, const std::vector<ScanRecord>& records);

  // After commit(): marks the uid processed and bumps the counters.
  void recordOutcome(const Submission& s);

  // Confirms every position up to and including block.
  void advanceCursor(uint64_t block);

  std::vector<Submission> unfinished() { return store_.listUnfinished(); }

private:
  IndexStore& store_;
  CheckpointStore& checkpoints_;
};

} // namespace sai
