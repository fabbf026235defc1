#pragma once
#include <cstdint>
#include <string>
#include <variant>

#include "core/model/Types.hpp"

namespace sai {

// Decoded scan-submission attestation payload. ABI layout:
// (bytes32 jobId, string cid, bytes32 merkleRoot, string targetSpecCid,
//  uint64 startedAt, uint64 finishedAt, string tool, string toolVersion,
//  string vantage, bytes32 manifestSha256, string namespace, string datasetType)
struct ScanSubmissionPayload {
  std::string job_id;
  std::string cid;
  std::string merkle_root;        // "" when the attested word is zero
  std::string target_spec_cid;
  int64_t     started_at = 0;
  int64_t     finished_at = 0;
  std::string tool;
  std::string tool_version;
  std::string vantage;
  std::string manifest_sha256;    // 64 hex chars, "" when zero
  std::string namespace_name;
  std::string dataset_type;
};

struct UnrecognizedSchema {
  std::string schema_uid;
};

struct DecodeError {
  std::string message;
};

using DecodeResult = std::variant<ScanSubmissionPayload, UnrecognizedSchema, DecodeError>;

class SubmissionDecoder {
public:
  explicit SubmissionDecoder(const std::string& scanSchemaUid);

  DecodeResult decode(const Attestation& a) const;

  // Submission skeleton carrying the attestation fields; payload fields
  // are applied by apply().
  static Submission skeleton(const Attestation& a, const AttestationEvent& ev);
  static void apply(const ScanSubmissionPayload& p, Submission& s);

private:
  std::string scanSchema_;   // normalised "0x" + lowercase
};

} // namespace sai
