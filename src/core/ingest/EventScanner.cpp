#include "EventScanner.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "core/util/Errors.hpp"

namespace sai {

std::vector<AttestationEvent> merge_events(std::vector<AttestationEvent> first,
                                           const std::vector<AttestationEvent>& second) {
  std::vector<AttestationEvent> merged;
  merged.reserve(first.size() + second.size());
  std::unordered_set<std::string> seen;
  for (auto& ev : first) {
    if (seen.insert(ev.uid).second) merged.push_back(std::move(ev));
  }
  for (const auto& ev : second) {
    if (seen.insert(ev.uid).second) merged.push_back(ev);
  }
  std::stable_sort(merged.begin(), merged.end(),
                   [](const AttestationEvent& a, const AttestationEvent& b) {
                     return a.block_number < b.block_number;
                   });
  return merged;
}

EventScanner::EventScanner(LedgerClient& ledger, uint64_t windowSize)
  : ledger_(ledger), window_(windowSize) {
  if (window_ == 0) throw std::invalid_argument("scan window must be at least 1");
}

ScanWindow EventScanner::scan(uint64_t start, uint64_t head) {
  ScanWindow w;
  w.from = start;
  w.next = start;
  if (start > head) return w;

  w.to = std::min(start + window_ - 1, head);
  w.next = std::min(start + window_, head + 1);
  w.inspected = true;

  try {
    auto filtered = ledger_.filterEvents(w.from, w.to);
    auto ranged = ledger_.queryEvents(w.from, w.to);
    const size_t raw = filtered.size() + ranged.size();
    w.events = merge_events(std::move(filtered), ranged);
    spdlog::debug("scanned blocks {}..{}: {} events ({} before dedup)", w.from, w.to, w.events.size(), raw);
  } catch (const IndexerError& e) {
    if (e.kind() != ErrorKind::RangeUnavailable) throw;
    spdlog::warn("blocks {}..{} not available: {}", w.from, w.to, e.what());
    w.events.clear();
  }
  return w;
}

} // namespace sai
