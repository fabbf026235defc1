#include "IngestionOrchestrator.hpp"

#include <optional>
#include <stdexcept>
#include <thread>

#include <spdlog/spdlog.h>

#include "core/util/Errors.hpp"

namespace sai {

namespace {

void transition(Submission& s, SubmissionStatus to) {
  if (!can_transition(s.status, to)) {
    throw std::logic_error(std::string("invalid status transition ") + to_string(s.status) +
                           " -> " + to_string(to) + " for " + s.uid);
  }
  s.status = to;
}

void fillFromManifest(Submission& s, const BundleManifest& m) {
  if (s.namespace_name.empty())  s.namespace_name = m.namespace_name;
  if (s.dataset_type.empty())    s.dataset_type = m.dataset_type;
  if (s.target_spec_cid.empty()) s.target_spec_cid = m.target_spec_cid;
  if (s.tool.empty())            s.tool = m.tool;
  if (s.version.empty())         s.version = m.tool_version;
  if (s.vantage.empty())         s.vantage = m.vantage;
  if (s.started_at == 0)         s.started_at = m.started_at;
  if (s.finished_at == 0)        s.finished_at = m.finished_at;
}

} // namespace

const char* to_string(HandleOutcome o) {
  switch (o) {
    case HandleOutcome::Duplicate: return "duplicate";
    case HandleOutcome::Ignored:   return "ignored";
    case HandleOutcome::Completed: return "completed";
    case HandleOutcome::Failed:    return "failed";
  }
  return "unknown";
}

IngestionOrchestrator::IngestionOrchestrator(LedgerClient& ledger,
                                             const SubmissionDecoder& decoder,
                                             BundleVerifier& verifier,
                                             PersistenceCoordinator& persistence,
                                             const CheckpointStore& checkpoints,
                                             OrchestratorOptions opts)
  : ledger_(ledger), decoder_(decoder), verifier_(verifier),
    persistence_(persistence), checkpoints_(checkpoints), opts_(opts) {}

void IngestionOrchestrator::addObserver(std::shared_ptr<SubmissionObserver> observer) {
  observers_.push_back(std::move(observer));
}

HandleOutcome IngestionOrchestrator::handle(const AttestationEvent& ev) {
  if (checkpoints_.isProcessed(ev.uid)) {
    spdlog::debug("submission {} already processed", ev.uid);
    return HandleOutcome::Duplicate;
  }

  std::optional<Attestation> att;
  try {
    att = ledger_.resolveAttestation(ev.uid);
  } catch (const IndexerError& e) {
    if (e.retryable()) throw;
    Submission s = SubmissionDecoder::skeleton(Attestation{}, ev);
    s.error_message = std::string("attestation unresolvable: ") + e.what();
    transition(s, SubmissionStatus::Failed);
    return finish(s, {});
  }
  if (!att) {
    spdlog::warn("attestation {} not found on ledger", ev.uid);
    return HandleOutcome::Ignored;
  }
  if (att->revoked) {
    spdlog::warn("attestation {} is revoked, skipping", ev.uid);
    return HandleOutcome::Ignored;
  }

  const DecodeResult decoded = decoder_.decode(*att);
  if (std::holds_alternative<UnrecognizedSchema>(decoded)) {
    spdlog::debug("attestation {} has schema {}, not a scan submission", ev.uid, att->schema_uid);
    return HandleOutcome::Ignored;
  }

  Submission s = SubmissionDecoder::skeleton(*att, ev);
  spdlog::info("processing submission {} from {} (block {})", s.uid, s.submitter, s.block_number);

  if (const auto* err = std::get_if<DecodeError>(&decoded)) {
    s.error_message = "payload decode failed: " + err->message;
    transition(s, SubmissionStatus::Failed);
    return finish(s, {});
  }
  SubmissionDecoder::apply(std::get<ScanSubmissionPayload>(decoded), s);

  transition(s, SubmissionStatus::Processing);
  persistence_.persistProgress(s);

  std::vector<ScanRecord> records;
  if (s.cid.empty()) {
    s.error_message = "no content address";
    transition(s, SubmissionStatus::Failed);
    return finish(s, records);
  }

  FetchOutcome out = fetchWithRetry(s);
  if (out.ok()) {
    VerifiedBundle& b = out.bundle();
    s.manifest_sha256 = b.manifest_sha256;
    fillFromManifest(s, b.manifest);
    records = std::move(b.records);
    transition(s, SubmissionStatus::Completed);
  } else {
    s.error_message = out.error().message;
    transition(s, SubmissionStatus::Failed);
  }
  return finish(s, records);
}

FetchOutcome IngestionOrchestrator::fetchWithRetry(const Submission& s) {
  const int attempts = 1 + (opts_.max_retries > 0 ? opts_.max_retries : 0);
  for (int attempt = 1;; ++attempt) {
    FetchOutcome out = verifier_.fetch(s.cid, s.merkle_root, s.manifest_sha256);
    if (out.ok() || !out.error().retryable() || attempt >= attempts) return out;
    spdlog::warn("fetch of {} failed (attempt {}/{}): {}", s.cid, attempt, attempts, out.error().message);
    std::this_thread::sleep_for(opts_.retry_delay);
  }
}

HandleOutcome IngestionOrchestrator::finish(Submission& s, const std::vector<ScanRecord>& records) {
  s.processed_at = unix_now();
  persistence_.commit(s, records);
  persistence_.recordOutcome(s);

  if (s.status == SubmissionStatus::Completed) {
    spdlog::info("submission {} completed with {} records", s.uid, records.size());
  } else {
    spdlog::error("submission {} failed: {}", s.uid, s.error_message);
  }
  notify(s);
  return s.status == SubmissionStatus::Completed ? HandleOutcome::Completed : HandleOutcome::Failed;
}

void IngestionOrchestrator::notify(const Submission& s) {
  for (const auto& obs : observers_) {
    try {
      obs->onSubmissionFinished(s);
    } catch (const std::exception& e) {
      spdlog::error("observer {} failed for {}: {}", obs->name(), s.uid, e.what());
    } catch (...) {
      spdlog::error("observer {} failed for {}: non-standard exception", obs->name(), s.uid);
    }
  }
}

size_t IngestionOrchestrator::resumeInterrupted() {
  size_t done = 0;
  for (Submission s : persistence_.unfinished()) {
    spdlog::info("resuming interrupted submission {} ({})", s.uid, to_string(s.status));
    AttestationEvent ev;
    ev.uid = s.uid;
    ev.attester = s.submitter;
    ev.block_number = s.block_number;

    HandleOutcome o = handle(ev);
    if (o == HandleOutcome::Ignored) {
      // Revoked or gone since the row was written.
      s.error_message = "attestation no longer resolvable as a scan submission";
      transition(s, SubmissionStatus::Failed);
      o = finish(s, {});
    }
    if (o == HandleOutcome::Completed || o == HandleOutcome::Failed) ++done;
  }
  return done;
}

} // namespace sai
