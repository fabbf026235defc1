#include "ModelJson.hpp"

#include <string>

#include "core/util/Errors.hpp"

using nlohmann::json;

namespace sai {

namespace {

std::optional<std::string> opt_string(const json& j, const char* k) {
  auto it = j.find(k);
  if (it == j.end() || it->is_null()) return std::nullopt;
  return it->get<std::string>();
}

std::optional<int64_t> opt_i64(const json& j, const char* k) {
  auto it = j.find(k);
  if (it == j.end() || it->is_null()) return std::nullopt;
  return it->get<int64_t>();
}

template <typename T>
json nullable(const std::optional<T>& v) {
  return v ? json(*v) : json(nullptr);
}

} // namespace

BundleManifest parse_manifest(std::string_view bytes) {
  BundleManifest m;
  try {
    const json j = json::parse(bytes.begin(), bytes.end());
    if (!j.is_object()) throw IndexerError(ErrorKind::MalformedManifest, "manifest is not a JSON object");

    m.schema          = j.at("schema").get<std::string>();
    m.namespace_name  = j.at("namespace").get<std::string>();
    m.dataset_type    = j.at("dataset_type").get<std::string>();
    const json& sp    = j.at("scanprint");
    m.scanprint_path  = sp.at("path").get<std::string>();
    m.scanprint_root  = opt_string(sp, "merkleRoot").value_or("");
    m.target_spec_cid = j.at("target_spec_cid").get<std::string>();
    m.tool            = j.at("tool").get<std::string>();
    m.tool_version    = j.at("tool_version").get<std::string>();
    m.vantage         = j.at("vantage").get<std::string>();
    m.started_at      = j.at("started_at").get<int64_t>();
    m.finished_at     = j.at("finished_at").get<int64_t>();
    m.notes           = opt_string(j, "notes");

    if (auto it = j.find("artifacts"); it != j.end() && !it->is_null()) {
      for (const auto& a : *it) {
        ArtifactRef ref;
        ref.path   = a.at("path").get<std::string>();
        ref.kind   = opt_string(a, "kind").value_or("");
        ref.sha256 = opt_string(a, "sha256").value_or("");
        m.artifacts.push_back(std::move(ref));
      }
    }
  } catch (const json::exception& e) {
    throw IndexerError(ErrorKind::MalformedManifest, std::string("malformed manifest: ") + e.what());
  }
  if (m.scanprint_path.empty()) {
    throw IndexerError(ErrorKind::MalformedManifest, "malformed manifest: empty scanprint path");
  }
  return m;
}

ScanRecord parse_scan_record(std::string_view line) {
  const json j = json::parse(line.begin(), line.end());
  ScanRecord r;
  r.timestamp     = j.at("timestamp").get<int64_t>();
  r.ip            = j.at("ip").get<std::string>();
  r.port          = j.at("port").get<int>();
  r.protocol      = j.at("protocol").get<std::string>();
  r.state         = j.at("state").get<std::string>();
  r.service       = opt_string(j, "service");
  r.product       = opt_string(j, "product");
  r.version       = opt_string(j, "version");
  r.banner_sha256 = opt_string(j, "banner_sha256");
  r.cert_fpr      = opt_string(j, "cert_fpr");
  r.tls_ja3       = opt_string(j, "tls_ja3");
  r.latency_ms    = opt_i64(j, "latency_ms");
  r.tool          = j.at("tool").get<std::string>();
  r.tool_version  = j.at("tool_version").get<std::string>();
  r.options       = j.at("options").get<std::string>();
  r.vantage       = j.at("vantage").get<std::string>();
  return r;
}

std::vector<ScanRecord> parse_scanprint(std::string_view stream) {
  std::vector<ScanRecord> out;
  size_t pos = 0, lineNo = 0;
  while (pos < stream.size()) {
    size_t nl = stream.find('\n', pos);
    if (nl == std::string_view::npos) nl = stream.size();
    std::string_view line = stream.substr(pos, nl - pos);
    pos = nl + 1;
    ++lineNo;
    if (line.find_first_not_of(" \t\r\v\f") == std::string_view::npos) continue;
    try {
      out.push_back(parse_scan_record(line));
    } catch (const json::exception& e) {
      throw IndexerError(ErrorKind::MalformedRecords,
                         "malformed scanprint line " + std::to_string(lineNo) + ": " + e.what());
    }
  }
  return out;
}

json to_json(const ScanRecord& r) {
  return json{
    {"timestamp", r.timestamp},
    {"ip", r.ip},
    {"port", r.port},
    {"protocol", r.protocol},
    {"state", r.state},
    {"service", nullable(r.service)},
    {"product", nullable(r.product)},
    {"version", nullable(r.version)},
    {"banner_sha256", nullable(r.banner_sha256)},
    {"cert_fpr", nullable(r.cert_fpr)},
    {"tls_ja3", nullable(r.tls_ja3)},
    {"latency_ms", nullable(r.latency_ms)},
    {"tool", r.tool},
    {"tool_version", r.tool_version},
    {"options", r.options},
    {"vantage", r.vantage}
  };
}

json to_json(const Submission& s) {
  return json{
    {"uid", s.uid},
    {"submitter", s.submitter},
    {"job_id", s.job_id},
    {"namespace", s.namespace_name},
    {"dataset_type", s.dataset_type},
    {"cid", s.cid},
    {"merkle_root", s.merkle_root},
    {"target_spec_cid", s.target_spec_cid},
    {"started_at", s.started_at},
    {"finished_at", s.finished_at},
    {"tool", s.tool},
    {"version", s.version},
    {"vantage", s.vantage},
    {"manifest_sha256", s.manifest_sha256},
    {"timestamp", s.timestamp},
    {"processed_at", nullable(s.processed_at)},
    {"status", to_string(s.status)},
    {"error_message", s.error_message.empty() ? json(nullptr) : json(s.error_message)},
    {"block_number", s.block_number}
  };
}

json to_json(const CheckpointState& c) {
  return json{
    {"last_block", nullable(c.last_block)},
    {"last_attestation_uid", c.last_attestation_uid},
    {"processed_count", c.processed_count},
    {"error_count", c.error_count},
    {"updated_at", c.updated_at}
  };
}

json to_json(const IndexerStats& st) {
  json out = {
    {"submissions", st.submissions_by_status},
    {"total_records", st.total_records}
  };
  out["checkpoint"] = st.checkpoint ? to_json(*st.checkpoint) : json(nullptr);
  return out;
}

json to_json(const FailureInfo& f) {
  return json{
    {"uid", f.uid},
    {"error_message", f.error_message},
    {"processed_at", nullable(f.processed_at)}
  };
}

} // namespace sai
