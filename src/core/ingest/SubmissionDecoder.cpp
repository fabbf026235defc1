#include "SubmissionDecoder.hpp"

#include <limits>

#include "core/ledger/Abi.hpp"
#include "core/util/Errors.hpp"
#include "core/util/Hash.hpp"

namespace sai {

namespace {

constexpr size_t kHeadWords = 12;

int64_t to_i64(uint64_t v, const char* field) {
  if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    throw IndexerError(ErrorKind::Decode, std::string(field) + " out of range");
  }
  return static_cast<int64_t>(v);
}

ScanSubmissionPayload decodeScanSubmission(const std::string& data) {
  AbiReader abi(data);
  if (abi.words() < kHeadWords) {
    throw IndexerError(ErrorKind::Decode, "payload shorter than " + std::to_string(kHeadWords) + " head words");
  }
  ScanSubmissionPayload p;
  p.job_id          = abi.bytes32Hex(0);
  p.cid             = abi.dynamicBytes(1);
  p.merkle_root     = abi.isZero(2) ? std::string() : abi.bytes32Hex(2);
  p.target_spec_cid = abi.dynamicBytes(3);
  p.started_at      = to_i64(abi.uint64At(4), "startedAt");
  p.finished_at     = to_i64(abi.uint64At(5), "finishedAt");
  p.tool            = abi.dynamicBytes(6);
  p.tool_version    = abi.dynamicBytes(7);
  p.vantage         = abi.dynamicBytes(8);
  p.manifest_sha256 = abi.isZero(9) ? std::string() : abi.bytes32Hex(9).substr(2);
  p.namespace_name  = abi.dynamicBytes(10);
  p.dataset_type    = abi.dynamicBytes(11);
  return p;
}

} // namespace

SubmissionDecoder::SubmissionDecoder(const std::string& scanSchemaUid)
  : scanSchema_(normalize_root(scanSchemaUid)) {}

DecodeResult SubmissionDecoder::decode(const Attestation& a) const {
  const std::string schema = normalize_root(a.schema_uid);
  if (schema != scanSchema_) return UnrecognizedSchema{a.schema_uid};
  try {
    return decodeScanSubmission(a.data);
  } catch (const IndexerError& e) {
    return DecodeError{e.what()};
  }
}

Submission SubmissionDecoder::skeleton(const Attestation& a, const AttestationEvent& ev) {
  Submission s;
  s.uid          = ev.uid;
  s.submitter    = a.attester.empty() ? ev.attester : a.attester;
  s.extra        = a.data;
  s.timestamp    = static_cast<int64_t>(a.timestamp);
  s.block_number = ev.block_number;
  s.created_at   = unix_now();
  return s;
}

void SubmissionDecoder::apply(const ScanSubmissionPayload& p, Submission& s) {
  s.job_id          = p.job_id;
  s.cid             = p.cid;
  s.merkle_root     = p.merkle_root;
  s.target_spec_cid = p.target_spec_cid;
  s.started_at      = p.started_at;
  s.finished_at     = p.finished_at;
  s.tool            = p.tool;
  s.version         = p.tool_version;
  s.vantage         = p.vantage;
  s.manifest_sha256 = p.manifest_sha256;
  s.namespace_name  = p.namespace_name;
  s.dataset_type    = p.dataset_type;
}

} // namespace sai
