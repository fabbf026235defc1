#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/model/Types.hpp"

namespace sai {

// SQLite access for the three durable collections: submissions, records
// and the single-row indexer_state checkpoint. Every write method is one
// transaction. Throws IndexerError(Storage) on any SQLite failure.
class IndexStore {
public:
  explicit IndexStore(const std::string& dbPath);
  ~IndexStore();
  IndexStore(const IndexStore&) = delete;
  IndexStore& operator=(const IndexStore&) = delete;

  // Insert or replace the submission row by uid. A terminal row is never
  // overwritten by a non-terminal status. Returns false when the guard
  // left the existing row untouched.
  bool upsertSubmission(const Submission& s);

  // upsertSubmission plus replacement of the submission's record set, in
  // one transaction.
  bool commitSubmission(const Submission& s, const std::vector<ScanRecord>& records);

  // Cascades to the submission's records.
  void deleteSubmission(const std::string& uid);

  std::optional<Submission> findSubmission(const std::string& uid);
  std::vector<Submission> listUnfinished();
  std::vector<std::string> loadTerminalUids();
  std::vector<ScanRecord> recordsFor(const std::string& uid);
  int64_t countRecords(const std::string& uid);
  int64_t countAllRecords();

  std::optional<CheckpointState> loadCheckpoint();
  // Sets last uid, bumps processed_count and, when failed, error_count.
  void recordOutcome(const std::string& uid, bool failed, int64_t at);
  // last_block = max(last_block, block).
  void advanceCursor(uint64_t block, int64_t at);

  IndexerStats stats();
  std::vector<FailureInfo> recentFailures(int limit);

private:
  void* db_; // sqlite3*
};

} // namespace sai
