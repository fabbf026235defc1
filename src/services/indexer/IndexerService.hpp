#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

#include "core/ingest/CheckpointStore.hpp"
#include "core/ingest/EventScanner.hpp"
#include "core/ingest/IngestionOrchestrator.hpp"
#include "core/ingest/PersistenceCoordinator.hpp"
#include "core/ledger/LedgerClient.hpp"

namespace sai {

struct ServiceOptions {
  uint64_t rescan_overlap = 0;
  std::optional<uint64_t> start_block;
  uint64_t initial_lookback = 1000;
  std::chrono::milliseconds poll_interval{10000};
  std::chrono::milliseconds error_backoff{1000};
};

struct PollReport {
  uint64_t from = 0;
  uint64_t to = 0;
  uint64_t head = 0;
  bool scanned = false;       // window was inspected and the cursor advanced
  bool interrupted = false;   // stop requested mid-window
  size_t events = 0;
  size_t completed = 0;
  size_t failed = 0;
  size_t ignored = 0;
  size_t duplicates = 0;
};

// The scan loop: one window per poll, every event handled before the
// cursor moves past the window.
class IndexerService {
public:
  IndexerService(LedgerClient& ledger,
                 EventScanner& scanner,
                 IngestionOrchestrator& orchestrator,
                 PersistenceCoordinator& persistence,
                 CheckpointStore& checkpoints,
                 ServiceOptions opts = {});

  // Loads the checkpoint, picks the start position and finishes
  // submissions an earlier run left non-terminal.
  void initialize();

  PollReport pollOnce(const std::atomic<bool>& stop);

  // Polls until stop is set. Errors are logged and the window retried.
  void run(const std::atomic<bool>& stop);

  uint64_t cursor() const { return cursor_.load(); }

private:
  void sleepFor(std::chrono::milliseconds d, const std::atomic<bool>& stop);

  LedgerClient& ledger_;
  EventScanner& scanner_;
  IngestionOrchestrator& orchestrator_;
  PersistenceCoordinator& persistence_;
  CheckpointStore& checkpoints_;
  ServiceOptions opts_;
  std::atomic<uint64_t> cursor_{0};
  bool initialized_ = false;
};

} // namespace sai
