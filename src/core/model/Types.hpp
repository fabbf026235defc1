#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sai {

// pending -> processing -> {completed, failed}; pending -> failed is allowed
// for submissions whose payload cannot be decoded.
enum class SubmissionStatus { Pending, Processing, Completed, Failed };

const char* to_string(SubmissionStatus s);
std::optional<SubmissionStatus> status_from_string(std::string_view s);
bool is_terminal(SubmissionStatus s);
bool can_transition(SubmissionStatus from, SubmissionStatus to);

int64_t unix_now();

struct AttestationEvent {
  std::string uid;        // 0x-prefixed 32-byte handle
  std::string attester;
  std::string subject;
  uint64_t    block_number = 0;
};

struct Attestation {
  std::string uid;
  std::string schema_uid;
  std::string attester;
  std::string subject;
  uint64_t    timestamp = 0;
  uint64_t    expiration_time = 0;
  bool        revoked = false;
  std::string data;       // raw payload bytes
};

struct ScanRecord {
  int64_t     timestamp = 0;
  std::string ip;
  int         port = 0;
  std::string protocol;
  std::string state;
  std::optional<std::string> service;
  std::optional<std::string> product;
  std::optional<std::string> version;
  std::optional<std::string> banner_sha256;
  std::optional<std::string> cert_fpr;
  std::optional<std::string> tls_ja3;
  std::optional<int64_t>     latency_ms;
  std::string tool;
  std::string tool_version;
  std::string options;
  std::string vantage;
};

struct ArtifactRef {
  std::string path;
  std::string kind;
  std::string sha256;     // optional, empty when not declared
};

struct BundleManifest {
  std::string schema;
  std::string namespace_name;
  std::string dataset_type;
  std::string scanprint_path;
  std::string scanprint_root;   // optional attested root, empty when absent
  std::vector<ArtifactRef> artifacts;
  std::string target_spec_cid;
  std::string tool;
  std::string tool_version;
  std::string vantage;
  int64_t     started_at = 0;
  int64_t     finished_at = 0;
  std::optional<std::string> notes;
};

struct Submission {
  std::string uid;
  std::string submitter;
  std::string job_id;
  std::string namespace_name;
  std::string dataset_type;
  std::string cid;
  std::string merkle_root;
  std::string target_spec_cid;
  int64_t     started_at = 0;
  int64_t     finished_at = 0;
  std::string tool;
  std::string version;
  std::string vantage;
  std::string manifest_sha256;
  std::string extra;
  int64_t     timestamp = 0;
  std::optional<int64_t> processed_at;
  SubmissionStatus status = SubmissionStatus::Pending;
  std::string error_message;
  uint64_t    block_number = 0;
  int64_t     created_at = 0;
};

struct CheckpointState {
  std::optional<uint64_t> last_block;   // unset until the first window is confirmed
  std::string last_attestation_uid;
  int64_t     processed_count = 0;
  int64_t     error_count = 0;
  int64_t     updated_at = 0;
};

struct FailureInfo {
  std::string uid;
  std::string error_message;
  std::optional<int64_t> processed_at;
};

struct IndexerStats {
  std::map<std::string, int64_t> submissions_by_status;
  int64_t total_records = 0;
  std::optional<CheckpointState> checkpoint;
};

} // namespace sai
