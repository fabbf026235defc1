#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "TestSupport.hpp"
#include "core/ingest/EventScanner.hpp"
#include "services/indexer/IndexerService.hpp"

using namespace sai;
using namespace sai::test;

class IndexerServiceTest : public PipelineTest {
protected:
  void build() override {
    PipelineTest::build();
    scanner = std::make_unique<EventScanner>(ledger, 10);
    service = std::make_unique<IndexerService>(ledger, *scanner, *orchestrator,
                                               *persistence, *checkpoints, options);
  }

  void restart() override {
    service.reset();
    scanner.reset();
    PipelineTest::restart();
  }

  void TearDown() override {
    service.reset();
    scanner.reset();
    PipelineTest::TearDown();
  }

  // Bundle with a matching attested root, event at block.
  void addGood(unsigned n, uint64_t block) {
    const std::string cid = "bafy" + std::to_string(n);
    const std::string root = content.addBundle(cid, three_record_stream());
    ledger.addSubmission(uid_of(n), block, sample_payload(cid, root));
  }

  void rebuildService() {
    service = std::make_unique<IndexerService>(ledger, *scanner, *orchestrator,
                                               *persistence, *checkpoints, options);
  }

  ServiceOptions options;
  std::unique_ptr<EventScanner> scanner;
  std::unique_ptr<IndexerService> service;
  std::atomic<bool> stop{false};
};

TEST_F(IndexerServiceTest, PollBeforeInitializeIsRejected) {
  EXPECT_THROW(service->pollOnce(stop), std::logic_error);
}

TEST_F(IndexerServiceTest, StartsBehindHeadWithoutCheckpoint) {
  ledger.head = 5000;
  service->initialize();
  EXPECT_EQ(service->cursor(), 4000u);

  ledger.head = 300;
  rebuildService();
  service->initialize();
  EXPECT_EQ(service->cursor(), 0u);
}

TEST_F(IndexerServiceTest, ConfiguredStartBlockWithoutCheckpoint) {
  ledger.head = 5000;
  options.start_block = 1234;
  rebuildService();
  service->initialize();
  EXPECT_EQ(service->cursor(), 1234u);
}

TEST_F(IndexerServiceTest, DrainsEveryWindowUpToHead) {
  ledger.head = 25;
  addGood(1, 3);
  addGood(2, 12);
  addGood(3, 12);
  addGood(4, 25);
  options.start_block = 0;
  rebuildService();
  service->initialize();
  EXPECT_EQ(scanner->windowSize(), 10u);
  EXPECT_FALSE(checkpoints->hasCursor());

  PollReport r = service->pollOnce(stop);
  EXPECT_TRUE(r.scanned);
  EXPECT_EQ(r.from, 0u);
  EXPECT_EQ(r.to, 9u);
  EXPECT_EQ(r.completed, 1u);
  EXPECT_EQ(store_->loadCheckpoint()->last_block.value_or(999), 9u);

  r = service->pollOnce(stop);
  EXPECT_EQ(r.completed, 2u);
  r = service->pollOnce(stop);
  EXPECT_EQ(r.from, 20u);
  EXPECT_EQ(r.to, 25u);
  EXPECT_EQ(r.completed, 1u);
  EXPECT_EQ(service->cursor(), 26u);

  r = service->pollOnce(stop);
  EXPECT_FALSE(r.scanned);
  EXPECT_EQ(service->cursor(), 26u);

  EXPECT_TRUE(store_->listUnfinished().empty());
  EXPECT_EQ(store_->stats().submissions_by_status.at("completed"), 4);
  EXPECT_EQ(store_->countAllRecords(), 12);
  EXPECT_EQ(store_->loadCheckpoint()->last_block.value_or(0), 25u);
  EXPECT_TRUE(checkpoints->hasCursor());
  EXPECT_EQ(checkpoints->processedCount(), 4u);
}

TEST_F(IndexerServiceTest, FailedSubmissionStillAdvancesCheckpoint) {
  ledger.head = 9;
  content.addBundle("bafyABC", three_record_stream());
  ledger.addSubmission(uid_of(1), 4, sample_payload("bafyABC", "0x" + std::string(64, 'd')));
  options.start_block = 0;
  rebuildService();
  service->initialize();

  PollReport r = service->pollOnce(stop);
  EXPECT_EQ(r.failed, 1u);
  EXPECT_TRUE(r.scanned);
  EXPECT_EQ(store_->loadCheckpoint()->last_block.value_or(0), 9u);
  EXPECT_EQ(store_->countRecords(uid_of(1)), 0);
}

TEST_F(IndexerServiceTest, UndecodableAttestationDoesNotStallScan) {
  ledger.head = 15;
  addGood(1, 10);
  addGood(2, 11);
  addGood(3, 12);
  ledger.undecodable.insert(uid_of(2));
  options.start_block = 10;
  rebuildService();
  service->initialize();

  const PollReport r = service->pollOnce(stop);
  EXPECT_TRUE(r.scanned);
  EXPECT_EQ(r.completed, 2u);
  EXPECT_EQ(r.failed, 1u);
  EXPECT_EQ(service->cursor(), 16u);
  EXPECT_EQ(store_->loadCheckpoint()->last_block.value_or(0), 15u);

  ASSERT_TRUE(store_->findSubmission(uid_of(3)).has_value());
  EXPECT_EQ(store_->findSubmission(uid_of(3))->status, SubmissionStatus::Completed);
  EXPECT_EQ(store_->findSubmission(uid_of(2))->status, SubmissionStatus::Failed);
}

TEST_F(IndexerServiceTest, UnavailableRangeAdvancesCursor) {
  ledger.head = 50;
  ledger.rangeUnavailable = true;
  options.start_block = 0;
  rebuildService();
  service->initialize();

  PollReport r = service->pollOnce(stop);
  EXPECT_TRUE(r.scanned);
  EXPECT_EQ(r.events, 0u);
  EXPECT_EQ(service->cursor(), 10u);
}

TEST_F(IndexerServiceTest, ResumesAfterRestartWithoutReprocessing) {
  ledger.head = 19;
  addGood(1, 3);
  addGood(2, 15);
  options.start_block = 0;
  rebuildService();
  service->initialize();
  service->pollOnce(stop);

  options.rescan_overlap = 5;
  restart();
  service->initialize();
  EXPECT_EQ(service->cursor(), 5u);

  PollReport r = service->pollOnce(stop);
  EXPECT_EQ(r.from, 5u);
  EXPECT_EQ(r.to, 14u);
  r = service->pollOnce(stop);
  EXPECT_EQ(r.completed, 1u);
  EXPECT_EQ(store_->stats().submissions_by_status.at("completed"), 2);
  EXPECT_EQ(store_->loadCheckpoint()->processed_count, 2);
}

TEST_F(IndexerServiceTest, OverlapRedeliveryIsDuplicate) {
  ledger.head = 9;
  addGood(1, 8);
  options.start_block = 0;
  rebuildService();
  service->initialize();
  service->pollOnce(stop);

  options.rescan_overlap = 3;
  restart();
  service->initialize();
  PollReport r = service->pollOnce(stop);
  EXPECT_EQ(r.duplicates, 1u);
  EXPECT_EQ(r.completed, 0u);
  EXPECT_EQ(store_->countRecords(uid_of(1)), 3);
}

TEST_F(IndexerServiceTest, InterruptedWindowIsNotConfirmed) {
  ledger.head = 9;
  addGood(1, 2);
  addGood(2, 3);
  options.start_block = 0;
  rebuildService();
  service->initialize();

  stop = true;
  PollReport r = service->pollOnce(stop);
  EXPECT_TRUE(r.interrupted);
  EXPECT_FALSE(r.scanned);
  EXPECT_EQ(service->cursor(), 0u);
  EXPECT_FALSE(store_->loadCheckpoint().has_value());
}

TEST_F(IndexerServiceTest, NothingLostWhenStoppedMidFetch) {
  ledger.head = 9;
  addGood(1, 2);
  // Left processing by a run that died before committing.
  Submission s;
  s.uid = uid_of(1);
  s.cid = "bafy1";
  s.status = SubmissionStatus::Processing;
  s.block_number = 2;
  store_->upsertSubmission(s);

  options.start_block = 0;
  restart();
  service->initialize();
  EXPECT_EQ(store_->findSubmission(uid_of(1))->status, SubmissionStatus::Completed);

  PollReport r = service->pollOnce(stop);
  EXPECT_EQ(r.duplicates, 1u);
  EXPECT_TRUE(store_->listUnfinished().empty());
}

TEST_F(IndexerServiceTest, TransportErrorLeavesCursorForRetry) {
  ledger.head = 9;
  addGood(1, 2);
  options.start_block = 0;
  rebuildService();
  service->initialize();

  ledger.resolveFailures = 1;
  EXPECT_THROW(service->pollOnce(stop), IndexerError);
  EXPECT_EQ(service->cursor(), 0u);

  PollReport r = service->pollOnce(stop);
  EXPECT_EQ(r.completed, 1u);
  EXPECT_EQ(service->cursor(), 10u);
}

TEST_F(IndexerServiceTest, RunRecoversFromTransientErrorsAndStops) {
  ledger.head = 25;
  addGood(1, 3);
  addGood(2, 22);
  options.start_block = 0;
  options.poll_interval = std::chrono::milliseconds(10);
  options.error_backoff = std::chrono::milliseconds(10);
  rebuildService();
  service->initialize();
  ledger.headFailures = 2;

  std::thread worker([&] { service->run(stop); });
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (std::chrono::steady_clock::now() < deadline && service->cursor() < 26) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  stop = true;
  worker.join();

  EXPECT_EQ(ledger.headFailures, 0);
  EXPECT_EQ(store_->loadCheckpoint()->last_block.value_or(0), 25u);
  EXPECT_EQ(store_->stats().submissions_by_status.at("completed"), 2);
}
