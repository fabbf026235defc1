#pragma once
#include <chrono>
#include <memory>
#include <vector>

#include "core/ingest/BundleVerifier.hpp"
#include "core/ingest/CheckpointStore.hpp"
#include "core/ingest/PersistenceCoordinator.hpp"
#include "core/ingest/SubmissionDecoder.hpp"
#include "core/ingest/SubmissionObserver.hpp"
#include "core/ledger/LedgerClient.hpp"

namespace sai {

enum class HandleOutcome { Duplicate, Ignored, Completed, Failed };

const char* to_string(HandleOutcome o);

struct OrchestratorOptions {
  int max_retries = 3;                               // extra attempts on transport/timeout
  std::chrono::milliseconds retry_delay{1000};
};

// Drives one attestation event through pending -> processing ->
// {completed, failed}. Bundle problems and attestations the ledger cannot
// decode end as a failed row; transient ledger errors and store errors
// propagate so the scan loop can retry the window.
class IngestionOrchestrator {
public:
  IngestionOrchestrator(LedgerClient& ledger,
                        const SubmissionDecoder& decoder,
                        BundleVerifier& verifier,
                        PersistenceCoordinator& persistence,
                        const CheckpointStore& checkpoints,
                        OrchestratorOptions opts = {});

  // Observers run in registration order.
  void addObserver(std::shared_ptr<SubmissionObserver> observer);

  HandleOutcome handle(const AttestationEvent& ev);

  // Re-drives submissions left non-terminal by an earlier run. Returns the
  // number of submissions brought to a terminal status.
  size_t resumeInterrupted();

private:
  FetchOutcome fetchWithRetry(const Submission& s);
  HandleOutcome finish(Submission& s, const std::vector<ScanRecord>& records);
  void notify(const Submission& s);

  LedgerClient& ledger_;
  const SubmissionDecoder& decoder_;
  BundleVerifier& verifier_;
  PersistenceCoordinator& persistence_;
  const CheckpointStore& checkpoints_;
  OrchestratorOptions opts_;
  std::vector<std::shared_ptr<SubmissionObserver>> observers_;
};

} // namespace sai
