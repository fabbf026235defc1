#include "IndexerService.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include <spdlog/spdlog.h>

namespace sai {

IndexerService::IndexerService(LedgerClient& ledger,
                               EventScanner& scanner,
                               IngestionOrchestrator& orchestrator,
                               PersistenceCoordinator& persistence,
                               CheckpointStore& checkpoints,
                               ServiceOptions opts)
  : ledger_(ledger), scanner_(scanner), orchestrator_(orchestrator),
    persistence_(persistence), checkpoints_(checkpoints), opts_(opts) {}

void IndexerService::initialize() {
  checkpoints_.reload();

  if (auto resume = checkpoints_.resumePosition(opts_.rescan_overlap)) {
    cursor_ = *resume;
    spdlog::info("resuming scan at block {}", cursor_.load());
  } else if (opts_.start_block) {
    cursor_ = *opts_.start_block;
    spdlog::info("no checkpoint, starting at configured block {}", cursor_.load());
  } else {
    const uint64_t head = ledger_.currentHead();
    cursor_ = head > opts_.initial_lookback ? head - opts_.initial_lookback : 0;
    spdlog::info("no checkpoint, starting {} blocks behind head {} at {}",
                 opts_.initial_lookback, head, cursor_.load());
  }

  const size_t resumed = orchestrator_.resumeInterrupted();
  if (resumed > 0) spdlog::info("finished {} interrupted submissions", resumed);
  initialized_ = true;
}

PollReport IndexerService::pollOnce(const std::atomic<bool>& stop) {
  if (!initialized_) throw std::logic_error("IndexerService::pollOnce before initialize");

  PollReport r;
  const uint64_t head = ledger_.currentHead();
  ScanWindow w = scanner_.scan(cursor_, head);
  r.head = head;
  r.from = w.from;
  r.to = w.to;
  r.events = w.events.size();
  if (!w.inspected) {
    spdlog::debug("cursor {} ahead of head {}, nothing to scan", cursor_.load(), head);
    return r;
  }

  for (const auto& ev : w.events) {
    if (stop.load()) {
      r.interrupted = true;
      break;
    }
    const HandleOutcome o = orchestrator_.handle(ev);
    spdlog::debug("event {} at block {}: {}", ev.uid, ev.block_number, to_string(o));
    switch (o) {
      case HandleOutcome::Completed: ++r.completed;  break;
      case HandleOutcome::Failed:    ++r.failed;     break;
      case HandleOutcome::Ignored:   ++r.ignored;    break;
      case HandleOutcome::Duplicate: ++r.duplicates; break;
    }
  }

  if (r.interrupted) {
    spdlog::info("stop requested, blocks {}..{} will be rescanned", w.from, w.to);
    return r;
  }

  persistence_.advanceCursor(w.to);
  cursor_ = w.next;
  r.scanned = true;
  if (r.events > 0) {
    spdlog::info("blocks {}..{}: {} events, {} completed, {} failed, {} ignored, {} duplicate",
                 w.from, w.to, r.events, r.completed, r.failed, r.ignored, r.duplicates);
  }
  return r;
}

void IndexerService::run(const std::atomic<bool>& stop) {
  if (!initialized_) initialize();
  spdlog::info("indexer running, window {} blocks, poll interval {} ms",
               scanner_.windowSize(), opts_.poll_interval.count());

  while (!stop.load()) {
    try {
      const PollReport r = pollOnce(stop);
      // Behind head: keep going without waiting.
      if (r.scanned && r.to < r.head) continue;
      sleepFor(opts_.poll_interval, stop);
    } catch (const std::exception& e) {
      spdlog::error("poll failed at block {}: {}", cursor_.load(), e.what());
      sleepFor(opts_.error_backoff, stop);
    }
  }
  spdlog::info("indexer stopped at block {}", cursor_.load());
}

void IndexerService::sleepFor(std::chrono::milliseconds d, const std::atomic<bool>& stop) {
  const auto slice = std::chrono::milliseconds(100);
  const auto until = std::chrono::steady_clock::now() + d;
  while (!stop.load()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= until) return;
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(slice, until - now));
  }
}

} // namespace sai
