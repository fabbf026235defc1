// src/main.cpp
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "core/config/IndexerConfig.hpp"
#include "core/content/IpfsContentStore.hpp"
#include "core/ingest/BundleVerifier.hpp"
#include "core/ingest/CheckpointStore.hpp"
#include "core/ingest/EventScanner.hpp"
#include "core/ingest/IngestionOrchestrator.hpp"
#include "core/ingest/PersistenceCoordinator.hpp"
#include "core/ingest/SubmissionDecoder.hpp"
#include "core/ingest/SubmissionObserver.hpp"
#include "core/ledger/EthRpcLedgerClient.hpp"
#include "core/metadata/IndexStore.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/util/Errors.hpp"
#include "services/api/HttpServer.hpp"
#include "services/indexer/IndexerService.hpp"

using namespace sai;

// ---------- helpers ----------

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true); }

std::string envFilePath() {
  if (const char* v = std::getenv("SAI_ENV_FILE")) return std::string(v);
  return ".env";
}

// Look for schema.sql in CWD first (the build copies it there), then fallback.
std::string findSchemaPath(const IndexerConfig& cfg) {
  namespace fs = std::filesystem;
  if (!cfg.schema_path.empty()) {
    if (!fs::exists(cfg.schema_path)) {
      throw IndexerError(ErrorKind::Config, "SAI_SCHEMA_PATH does not exist: " + cfg.schema_path);
    }
    return cfg.schema_path;
  }
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/metadata/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw IndexerError(ErrorKind::Config, "schema.sql not found (looked in ./ and src/core/metadata)");
}

void ensure_dirs_for(const std::string& file_path) {
  namespace fs = std::filesystem;
  fs::path parent = fs::path(file_path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
}

void apply_log_level(const std::string& name) {
  const auto lvl = spdlog::level::from_str(name);
  if (lvl == spdlog::level::off && name != "off") {
    throw IndexerError(ErrorKind::Config, "SAI_LOG_LEVEL: unknown level " + name);
  }
  spdlog::set_level(lvl);
}

// Self-heal DB (idempotent), as every command expects the schema.
void prepare_db(const IndexerConfig& cfg) {
  ensure_dirs_for(cfg.db_path);
  initDatabase(cfg.db_path, findSchemaPath(cfg));
}

std::string format_time(int64_t t) {
  if (t <= 0) return "-";
  std::time_t tt = static_cast<std::time_t>(t);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

void print_stats(IndexStore& store) {
  const IndexerStats st = store.stats();
  std::cout << "Submissions by status:\n";
  for (const char* s : {"pending", "processing", "completed", "failed"}) {
    auto it = st.submissions_by_status.find(s);
    std::cout << "  " << s << ": " << (it == st.submissions_by_status.end() ? 0 : it->second) << "\n";
  }
  std::cout << "Total records: " << st.total_records << "\n";
  if (st.checkpoint && st.checkpoint->last_block) {
    std::cout << "Last checkpoint: block " << *st.checkpoint->last_block
              << " at " << format_time(st.checkpoint->updated_at) << "\n"
              << "Processed: " << st.checkpoint->processed_count
              << " (errors: " << st.checkpoint->error_count << ")\n";
  } else {
    std::cout << "Last checkpoint: none\n";
  }
  const auto failures = store.recentFailures(10);
  if (!failures.empty()) {
    std::cout << "Recent failures:\n";
    for (const auto& f : failures) {
      std::cout << "  " << f.uid << "  " << format_time(f.processed_at.value_or(0))
                << "  " << f.error_message << "\n";
    }
  }
}

int run_indexer(const IndexerConfig& cfg) {
  IndexStore store(cfg.db_path);
  EthRpcLedgerClient ledger(cfg.rpc_url, cfg.attestor_address, cfg.fetch_timeout);
  IpfsContentStore content(cfg.ipfs_api, cfg.ipfs_gateway, cfg.fetch_timeout);

  // Reachability checks; failures here are fatal.
  const uint64_t head = ledger.currentHead();
  spdlog::info("ledger reachable at {}, head {}", cfg.rpc_url, head);
  spdlog::info("content store reachable at {}, version {}", cfg.ipfs_api, content.version());

  CheckpointStore checkpoints(store);
  PersistenceCoordinator persistence(store, checkpoints);
  SubmissionDecoder decoder(cfg.schema_uid);
  BundleVerifier verifier(content, cfg.max_bundle_size);
  EventScanner scanner(ledger, cfg.scan_window);

  OrchestratorOptions oopts;
  oopts.max_retries = cfg.max_retries;
  oopts.retry_delay = cfg.retry_delay;
  IngestionOrchestrator orchestrator(ledger, decoder, verifier, persistence, checkpoints, oopts);
  orchestrator.addObserver(std::make_shared<PinningObserver>(content));

  ServiceOptions sopts;
  sopts.rescan_overlap = cfg.rescan_overlap;
  sopts.start_block = cfg.start_block;
  sopts.initial_lookback = cfg.initial_lookback;
  sopts.poll_interval = cfg.poll_interval;
  sopts.error_backoff = cfg.retry_delay;
  IndexerService service(ledger, scanner, orchestrator, persistence, checkpoints, sopts);

  service.initialize();
  service.run(g_stop);
  return 0;
}

void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --run         # scan the ledger and index submissions\n"
            << "  " << argv0 << " --stats       # print indexing statistics\n"
            << "  " << argv0 << " --serve       # start status HTTP server (SAI_PORT or 8080)\n";
}

} // namespace

// ---------- main ----------

int main(int argc, char** argv) {
  if (argc != 2) {
    print_usage(argv[0]);
    return 1;
  }
  const std::string cmd = argv[1];
  if (cmd != "--init" && cmd != "--run" && cmd != "--stats" && cmd != "--serve") {
    print_usage(argv[0]);
    return 1;
  }

  try {
    const IndexerConfig cfg = load_config(read_env_file(envFilePath()));
    validate_config(cfg, cmd == "--run");
    apply_log_level(cfg.log_level);

    prepare_db(cfg);

    if (cmd == "--init") {
      std::cout << "DB initialized at: " << cfg.db_path << "\n";
      return 0;
    }

    if (cmd == "--stats") {
      IndexStore store(cfg.db_path);
      print_stats(store);
      return 0;
    }

    if (cmd == "--serve") {
      IndexStore store(cfg.db_path);
      run_http_server(store, cfg.api_port, cfg.api_key);
      return 0;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    return run_indexer(cfg);
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
