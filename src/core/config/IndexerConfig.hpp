#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace sai {

struct IndexerConfig {
  // ledger
  std::string rpc_url;
  std::string attestor_address;
  std::string schema_uid;

  // content store
  std::string ipfs_api     = "http://127.0.0.1:5001";
  std::string ipfs_gateway = "http://127.0.0.1:8080";

  // store
  std::string db_path      = "data/scan-index.db";
  std::string schema_path;          // empty: search the usual locations

  // scan loop
  std::chrono::milliseconds poll_interval{10000};
  uint64_t scan_window      = 100;
  uint64_t rescan_overlap   = 0;
  std::optional<uint64_t> start_block;
  uint64_t initial_lookback = 1000;
  int      max_retries      = 3;
  std::chrono::milliseconds retry_delay{1000};

  // bundles
  std::chrono::seconds fetch_timeout{30};
  size_t   max_bundle_size  = 100u * 1024u * 1024u;

  // status API
  int         api_port = 8080;
  std::string api_key;

  std::string log_level = "info";
};

// KEY=VALUE lines; '#' comments and blank lines skipped, optional
// surrounding quotes stripped. Missing file yields an empty map.
std::map<std::string, std::string> read_env_file(const std::string& path);

// Reads SAI_* variables from the environment, falling back to `fileVars`
// (typically read_env_file(".env")). Throws IndexerError(Config) on
// unparsable numbers.
IndexerConfig load_config(const std::map<std::string, std::string>& fileVars = {});

// Throws IndexerError(Config) naming the first problem. `requireLedger`
// is false for commands that only read the store.
void validate_config(const IndexerConfig& cfg, bool requireLedger = true);

} // namespace sai
