#include "IndexerConfig.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

#include "core/util/Errors.hpp"

namespace sai {

namespace {

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

class EnvSource {
public:
  explicit EnvSource(const std::map<std::string, std::string>& fileVars) : file_(fileVars) {}

  std::optional<std::string> get(const char* key) const {
    if (const char* v = std::getenv(key)) return std::string(v);
    if (auto it = file_.find(key); it != file_.end()) return it->second;
    return std::nullopt;
  }

  std::string get_or(const char* key, const std::string& defval) const {
    return get(key).value_or(defval);
  }

  uint64_t u64_or(const char* key, uint64_t defval) const {
    auto v = get(key);
    if (!v || v->empty()) return defval;
    try {
      size_t used = 0;
      const unsigned long long n = std::stoull(*v, &used);
      if (used != v->size() || v->front() == '-') throw std::invalid_argument(*v);
      return static_cast<uint64_t>(n);
    } catch (const std::logic_error&) {
      throw IndexerError(ErrorKind::Config, std::string(key) + ": not a non-negative integer: " + *v);
    }
  }

  uint64_t u64_max(const char* key, uint64_t defval, uint64_t max) const {
    const uint64_t n = u64_or(key, defval);
    if (n > max) {
      throw IndexerError(ErrorKind::Config, std::string(key) + ": " + std::to_string(n) +
                         " exceeds maximum " + std::to_string(max));
    }
    return n;
  }

  int int_or(const char* key, int defval) const {
    return static_cast<int>(u64_max(key, static_cast<uint64_t>(defval),
                                    static_cast<uint64_t>(std::numeric_limits<int>::max())));
  }

private:
  const std::map<std::string, std::string>& file_;
};

constexpr uint64_t kMaxDelayMs = 24ull * 60 * 60 * 1000;
constexpr uint64_t kMaxTimeoutS = 24ull * 60 * 60;

} // namespace

std::map<std::string, std::string> read_env_file(const std::string& path) {
  std::map<std::string, std::string> out;
  std::ifstream in(path);
  if (!in) return out;
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));
    const auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    std::string key = trim(line.substr(0, eq));
    std::string val = trim(line.substr(eq + 1));
    if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') && val.back() == val.front()) {
      val = val.substr(1, val.size() - 2);
    }
    if (!key.empty()) out[key] = val;
  }
  return out;
}

IndexerConfig load_config(const std::map<std::string, std::string>& fileVars) {
  const EnvSource env(fileVars);
  IndexerConfig c;

  c.rpc_url          = env.get_or("SAI_RPC_URL", "");
  c.attestor_address = env.get_or("SAI_ATTESTOR_ADDRESS", "");
  c.schema_uid       = env.get_or("SAI_SCHEMA_UID", "");
  c.ipfs_api         = env.get_or("SAI_IPFS_API", c.ipfs_api);
  c.ipfs_gateway     = env.get_or("SAI_IPFS_GATEWAY", c.ipfs_gateway);
  c.db_path          = env.get_or("SAI_DB_PATH", c.db_path);
  c.schema_path      = env.get_or("SAI_SCHEMA_PATH", "");

  c.poll_interval    = std::chrono::milliseconds(env.u64_max("SAI_POLL_INTERVAL_MS", 10000, kMaxDelayMs));
  c.scan_window      = env.u64_or("SAI_SCAN_WINDOW", c.scan_window);
  c.rescan_overlap   = env.u64_or("SAI_RESCAN_OVERLAP", c.rescan_overlap);
  if (auto v = env.get("SAI_START_BLOCK"); v && !v->empty()) {
    c.start_block = env.u64_or("SAI_START_BLOCK", 0);
  }
  c.initial_lookback = env.u64_or("SAI_INITIAL_LOOKBACK", c.initial_lookback);
  c.max_retries      = env.int_or("SAI_MAX_RETRIES", c.max_retries);
  c.retry_delay      = std::chrono::milliseconds(env.u64_max("SAI_RETRY_DELAY_MS", 1000, kMaxDelayMs));

  c.fetch_timeout    = std::chrono::seconds(env.u64_max("SAI_FETCH_TIMEOUT_S", 30, kMaxTimeoutS));
  c.max_bundle_size  = static_cast<size_t>(env.u64_max("SAI_MAX_BUNDLE_SIZE", c.max_bundle_size,
                                                         std::numeric_limits<size_t>::max()));

  c.api_port         = env.int_or("SAI_PORT", c.api_port);
  c.api_key          = env.get_or("SAI_API_KEY", "");
  c.log_level        = env.get_or("SAI_LOG_LEVEL", c.log_level);
  return c;
}

void validate_config(const IndexerConfig& c, bool requireLedger) {
  auto fail = [](const std::string& msg) { throw IndexerError(ErrorKind::Config, msg); };
  if (requireLedger) {
    if (c.rpc_url.empty())          fail("SAI_RPC_URL is required");
    if (c.attestor_address.empty()) fail("SAI_ATTESTOR_ADDRESS is required");
    if (c.schema_uid.empty())       fail("SAI_SCHEMA_UID is required");
  }
  if (c.db_path.empty())            fail("SAI_DB_PATH must not be empty");
  if (c.scan_window == 0)           fail("SAI_SCAN_WINDOW must be at least 1");
  if (c.max_bundle_size == 0)       fail("SAI_MAX_BUNDLE_SIZE must be at least 1");
  if (c.fetch_timeout.count() == 0) fail("SAI_FETCH_TIMEOUT_S must be at least 1");
  if (c.api_port <= 0 || c.api_port > 65535) fail("SAI_PORT out of range");
  if (c.max_retries > 100)          fail("SAI_MAX_RETRIES must be at most 100");
}

} // namespace sai
