#pragma once
#include <cstdint>
#include <vector>

#include "core/ledger/LedgerClient.hpp"

namespace sai {

struct ScanWindow {
  uint64_t from = 0;
  uint64_t to = 0;          // inclusive; meaningful only when inspected
  uint64_t next = 0;        // cursor for the following scan
  bool     inspected = false;
  std::vector<AttestationEvent> events;   // ascending block_number, deduplicated by uid
};

// Scans [start, min(start + window - 1, head)] through both retrieval paths
// of the ledger and merges them.
class EventScanner {
public:
  EventScanner(LedgerClient& ledger, uint64_t windowSize);

  // RangeUnavailable is logged and yields an inspected, empty window.
  // Every other IndexerError propagates.
  ScanWindow scan(uint64_t start, uint64_t head);

  uint64_t windowSize() const { return window_; }

private:
  LedgerClient& ledger_;
  uint64_t window_;
};

// Union of two event lists, first occurrence of each uid wins, then a
// stable sort by position.
std::vector<AttestationEvent> merge_events(std::vector<AttestationEvent> first,
                                           const std::vector<AttestationEvent>& second);

} // namespace sai
