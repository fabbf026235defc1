#include <gtest/gtest.h>

#include <stdexcept>

#include "TestSupport.hpp"
#include "core/ingest/EventScanner.hpp"

using namespace sai;
using namespace sai::test;

namespace {

AttestationEvent event_at(const std::string& uid, uint64_t block) {
  AttestationEvent ev;
  ev.uid = uid;
  ev.attester = kAttester;
  ev.block_number = block;
  return ev;
}

class BrokenRangeLedger : public FakeLedger {
public:
  std::vector<AttestationEvent> queryEvents(uint64_t, uint64_t) override {
    throw IndexerError(ErrorKind::Transport, "connection reset");
  }
};

} // namespace

TEST(EventScannerTest, RejectsZeroWindow) {
  FakeLedger ledger;
  EXPECT_THROW(EventScanner(ledger, 0), std::invalid_argument);
}

TEST(EventScannerTest, WindowIsClampedToHead) {
  FakeLedger ledger;
  EventScanner scanner(ledger, 100);

  ScanWindow w = scanner.scan(100, 150);
  EXPECT_TRUE(w.inspected);
  EXPECT_EQ(w.from, 100u);
  EXPECT_EQ(w.to, 150u);
  EXPECT_EQ(w.next, 151u);

  w = scanner.scan(0, 1000);
  EXPECT_EQ(w.to, 99u);
  EXPECT_EQ(w.next, 100u);
}

TEST(EventScannerTest, StartPastHeadInspectsNothing) {
  FakeLedger ledger;
  EventScanner scanner(ledger, 10);
  ScanWindow w = scanner.scan(51, 50);
  EXPECT_FALSE(w.inspected);
  EXPECT_EQ(w.next, 51u);
  EXPECT_TRUE(ledger.queried.empty());
}

TEST(EventScannerTest, MergesBothPathsWithoutDuplicates) {
  FakeLedger ledger;
  ledger.events = {event_at(uid_of(2), 7), event_at(uid_of(1), 5), event_at(uid_of(3), 30)};
  ledger.hiddenFromFilter = {uid_of(1)};
  EventScanner scanner(ledger, 10);

  ScanWindow w = scanner.scan(0, 100);
  ASSERT_EQ(w.events.size(), 2u);
  EXPECT_EQ(w.events[0].uid, uid_of(1));
  EXPECT_EQ(w.events[0].block_number, 5u);
  EXPECT_EQ(w.events[1].uid, uid_of(2));
  ASSERT_EQ(ledger.queried.size(), 1u);
  EXPECT_EQ(ledger.queried[0], (std::pair<uint64_t, uint64_t>(0, 9)));
}

TEST(EventScannerTest, UnavailableRangeYieldsEmptyInspectedWindow) {
  FakeLedger ledger;
  ledger.events = {event_at(uid_of(1), 5)};
  ledger.rangeUnavailable = true;
  EventScanner scanner(ledger, 10);

  ScanWindow w = scanner.scan(0, 100);
  EXPECT_TRUE(w.inspected);
  EXPECT_TRUE(w.events.empty());
  EXPECT_EQ(w.next, 10u);
}

TEST(EventScannerTest, TransportErrorPropagates) {
  BrokenRangeLedger ledger;
  EventScanner scanner(ledger, 10);
  try {
    scanner.scan(0, 100);
    FAIL() << "transport error swallowed";
  } catch (const IndexerError& e) {
    EXPECT_TRUE(e.retryable());
  }
}

TEST(MergeEventsTest, FirstOccurrenceWinsAndOrderIsStable) {
  AttestationEvent a = event_at(uid_of(1), 4);
  a.subject = "from-filter";
  AttestationEvent dup = event_at(uid_of(1), 4);
  dup.subject = "from-range";

  auto merged = merge_events({event_at(uid_of(9), 4), a}, {dup, event_at(uid_of(5), 2)});
  ASSERT_EQ(merged.size(), 3u);
  EXPECT_EQ(merged[0].uid, uid_of(5));
  EXPECT_EQ(merged[1].uid, uid_of(9));
  EXPECT_EQ(merged[2].uid, uid_of(1));
  EXPECT_EQ(merged[2].subject, "from-filter");
}
