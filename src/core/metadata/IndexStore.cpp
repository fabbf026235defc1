#include "IndexStore.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include "core/util/Errors.hpp"

namespace sai {

namespace {

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
  throw IndexerError(ErrorKind::Storage, what + " failed: " + sqlite3_errmsg(db));
}

// Owns one prepared statement.
class Statement {
public:
  Statement(sqlite3* db, const char* sql, const char* what) : db_(db), what_(what) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) fail(db_, what_);
  }
  ~Statement() { sqlite3_finalize(st_); }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return st_; }

  void text(int i, const std::string& v) {
    sqlite3_bind_text(st_, i, v.c_str(), -1, SQLITE_TRANSIENT);
  }
  void text(int i, const std::optional<std::string>& v) {
    if (v) text(i, *v); else sqlite3_bind_null(st_, i);
  }
  void blob(int i, const std::string& v) {
    sqlite3_bind_blob(st_, i, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
  }
  void i64(int i, int64_t v) { sqlite3_bind_int64(st_, i, v); }
  void i64(int i, const std::optional<int64_t>& v) {
    if (v) i64(i, *v); else sqlite3_bind_null(st_, i);
  }

  // true while a row is available
  bool step() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    fail(db_, what_);
  }
  void run() {
    if (sqlite3_step(st_) != SQLITE_DONE) fail(db_, what_);
  }

  std::string colText(int i) const {
    const unsigned char* p = sqlite3_column_text(st_, i);
    return p ? std::string(reinterpret_cast<const char*>(p)) : std::string();
  }
  std::optional<std::string> colOptText(int i) const {
    if (sqlite3_column_type(st_, i) == SQLITE_NULL) return std::nullopt;
    return colText(i);
  }
  std::string colBlob(int i) const {
    const void* p = sqlite3_column_blob(st_, i);
    int n = sqlite3_column_bytes(st_, i);
    return p ? std::string(static_cast<const char*>(p), static_cast<size_t>(n)) : std::string();
  }
  int64_t colI64(int i) const { return sqlite3_column_int64(st_, i); }
  std::optional<int64_t> colOptI64(int i) const {
    if (sqlite3_column_type(st_, i) == SQLITE_NULL) return std::nullopt;
    return colI64(i);
  }

private:
  sqlite3* db_;
  const char* what_;
  sqlite3_stmt* st_ = nullptr;
};

// BEGIN IMMEDIATE on construction; rolls back unless commit() was reached.
class Transaction {
public:
  explicit Transaction(sqlite3* db) : db_(db) {
    if (sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) != SQLITE_OK) fail(db_, "begin");
  }
  ~Transaction() {
    if (done_) return;
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      spdlog::error("rollback failed: {}", sqlite3_errmsg(db_));
    }
  }
  void commit() {
    if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) fail(db_, "commit");
    done_ = true;
  }

private:
  sqlite3* db_;
  bool done_ = false;
};

void exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw IndexerError(ErrorKind::Storage, std::string("exec '") + sql + "' failed: " + msg);
  }
}

const char* kSubmissionColumns =
  "uid, submitter, job_id, namespace, dataset_type, cid, merkle_root, target_spec_cid,"
  " started_at, finished_at, tool, version, vantage, manifest_sha256, extra, timestamp,"
  " processed_at, status, error_message, block_number, created_at";

Submission readSubmission(const Statement& st) {
  Submission s;
  int i = 0;
  s.uid             = st.colText(i++);
  s.submitter       = st.colText(i++);
  s.job_id          = st.colText(i++);
  s.namespace_name  = st.colText(i++);
  s.dataset_type    = st.colText(i++);
  s.cid             = st.colText(i++);
  s.merkle_root     = st.colText(i++);
  s.target_spec_cid = st.colText(i++);
  s.started_at      = st.colI64(i++);
  s.finished_at     = st.colI64(i++);
  s.tool            = st.colText(i++);
  s.version         = st.colText(i++);
  s.vantage         = st.colText(i++);
  s.manifest_sha256 = st.colText(i++);
  s.extra           = st.colBlob(i++);
  s.timestamp       = st.colI64(i++);
  s.processed_at    = st.colOptI64(i++);
  s.status          = status_from_string(st.colText(i++)).value_or(SubmissionStatus::Pending);
  s.error_message   = st.colText(i++);
  s.block_number    = static_cast<uint64_t>(st.colI64(i++));
  s.created_at      = st.colI64(i++);
  return s;
}

bool upsert(sqlite3* db, const Submission& s) {
  // The WHERE clause keeps completed/failed rows from being reverted to a
  // non-terminal status.
  static const char* sql = R"SQL(
    INSERT INTO submissions
      (uid, submitter, job_id, namespace, dataset_type, cid, merkle_root, target_spec_cid,
       started_at, finished_at, tool, version, vantage, manifest_sha256, extra, timestamp,
       processed_at, status, error_message, block_number, created_at)
    VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)
    ON CONFLICT(uid) DO UPDATE SET
      submitter=excluded.submitter, job_id=excluded.job_id, namespace=excluded.namespace,
      dataset_type=excluded.dataset_type, cid=excluded.cid, merkle_root=excluded.merkle_root,
      target_spec_cid=excluded.target_spec_cid, started_at=excluded.started_at,
      finished_at=excluded.finished_at, tool=excluded.tool, version=excluded.version,
      vantage=excluded.vantage, manifest_sha256=excluded.manifest_sha256, extra=excluded.extra,
      timestamp=excluded.timestamp, processed_at=excluded.processed_at, status=excluded.status,
      error_message=excluded.error_message, block_number=excluded.block_number
    WHERE submissions.status NOT IN ('completed','failed')
       OR excluded.status IN ('completed','failed')
  )SQL";
  Statement st(db, sql, "upsertSubmission");
  int i = 1;
  st.text(i++, s.uid);
  st.text(i++, s.submitter);
  st.text(i++, s.job_id);
  st.text(i++, s.namespace_name);
  st.text(i++, s.dataset_type);
  st.text(i++, s.cid);
  st.text(i++, s.merkle_root);
  st.text(i++, s.target_spec_cid);
  st.i64(i++, s.started_at);
  st.i64(i++, s.finished_at);
  st.text(i++, s.tool);
  st.text(i++, s.version);
  st.text(i++, s.vantage);
  st.text(i++, s.manifest_sha256);
  st.blob(i++, s.extra);
  st.i64(i++, s.timestamp);
  st.i64(i++, s.processed_at);
  st.text(i++, std::string(to_string(s.status)));
  if (s.error_message.empty()) sqlite3_bind_null(st.get(), i++);
  else st.text(i++, s.error_message);
  st.i64(i++, static_cast<int64_t>(s.block_number));
  st.i64(i++, s.created_at ? s.created_at : unix_now());
  st.run();
  return sqlite3_changes(db) > 0;
}

void insertRecord(Statement& st, const std::string& uid, const ScanRecord& r) {
  sqlite3_reset(st.get());
  sqlite3_clear_bindings(st.get());
  int i = 1;
  st.text(i++, uid);
  st.i64(i++, r.timestamp);
  st.text(i++, r.ip);
  st.i64(i++, static_cast<int64_t>(r.port));
  st.text(i++, r.protocol);
  st.text(i++, r.state);
  st.text(i++, r.service);
  st.text(i++, r.product);
  st.text(i++, r.version);
  st.text(i++, r.banner_sha256);
  st.text(i++, r.cert_fpr);
  st.text(i++, r.tls_ja3);
  st.i64(i++, r.latency_ms);
  st.text(i++, r.tool);
  st.text(i++, r.tool_version);
  st.text(i++, r.options);
  st.text(i++, r.vantage);
  st.run();
}

} // namespace

IndexStore::IndexStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw IndexerError(ErrorKind::Storage, "failed to open db " + dbPath + ": " + msg);
  }
  db_ = db;
  try {
    // foreign_keys is per connection; cascading deletes depend on it.
    exec(db, "PRAGMA foreign_keys=ON;");
    exec(db, "PRAGMA busy_timeout=5000;");
  } catch (...) {
    sqlite3_close(db);
    throw;
  }
}

IndexStore::~IndexStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

bool IndexStore::upsertSubmission(const Submission& s) {
  auto* db = static_cast<sqlite3*>(db_);
  Transaction tx(db);
  bool written = upsert(db, s);
  tx.commit();
  return written;
}

bool IndexStore::commitSubmission(const Submission& s, const std::vector<ScanRecord>& records) {
  auto* db = static_cast<sqlite3*>(db_);
  Transaction tx(db);
  bool written = upsert(db, s);
  if (written) {
    Statement del(db, "DELETE FROM records WHERE submission_uid = ?", "deleteRecords");
    del.text(1, s.uid);
    del.run();

    Statement ins(db, R"SQL(
      INSERT INTO records
        (submission_uid, timestamp, ip, port, protocol, state, service, product, version,
         banner_sha256, cert_fpr, tls_ja3, latency_ms, tool, tool_version, options, vantage)
      VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)
    )SQL", "insertRecord");
    for (const auto& r : records) insertRecord(ins, s.uid, r);
  }
  tx.commit();
  return written;
}

void IndexStore::deleteSubmission(const std::string& uid) {
  auto* db = static_cast<sqlite3*>(db_);
  Transaction tx(db);
  Statement st(db, "DELETE FROM submissions WHERE uid = ?", "deleteSubmission");
  st.text(1, uid);
  st.run();
  tx.commit();
}

std::optional<Submission> IndexStore::findSubmission(const std::string& uid) {
  auto* db = static_cast<sqlite3*>(db_);
  const std::string sql = std::string("SELECT ") + kSubmissionColumns + " FROM submissions WHERE uid = ?";
  Statement st(db, sql.c_str(), "findSubmission");
  st.text(1, uid);
  if (!st.step()) return std::nullopt;
  return readSubmission(st);
}

std::vector<Submission> IndexStore::listUnfinished() {
  auto* db = static_cast<sqlite3*>(db_);
  const std::string sql = std::string("SELECT ") + kSubmissionColumns +
    " FROM submissions WHERE status NOT IN ('completed','failed') ORDER BY block_number, created_at";
  Statement st(db, sql.c_str(), "listUnfinished");
  std::vector<Submission> out;
  while (st.step()) out.push_back(readSubmission(st));
  return out;
}

std::vector<std::string> IndexStore::loadTerminalUids() {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, "SELECT uid FROM submissions WHERE status IN ('completed','failed')", "loadTerminalUids");
  std::vector<std::string> out;
  while (st.step()) out.push_back(st.colText(0));
  return out;
}

std::vector<ScanRecord> IndexStore::recordsFor(const std::string& uid) {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, R"SQL(
    SELECT timestamp, ip, port, protocol, state, service, product, version, banner_sha256,
           cert_fpr, tls_ja3, latency_ms, tool, tool_version, options, vantage
    FROM records WHERE submission_uid = ? ORDER BY id
  )SQL", "recordsFor");
  st.text(1, uid);
  std::vector<ScanRecord> out;
  while (st.step()) {
    ScanRecord r;
    int i = 0;
    r.timestamp     = st.colI64(i++);
    r.ip            = st.colText(i++);
    r.port          = static_cast<int>(st.colI64(i++));
    r.protocol      = st.colText(i++);
    r.state         = st.colText(i++);
    r.service       = st.colOptText(i++);
    r.product       = st.colOptText(i++);
    r.version       = st.colOptText(i++);
    r.banner_sha256 = st.colOptText(i++);
    r.cert_fpr      = st.colOptText(i++);
    r.tls_ja3       = st.colOptText(i++);
    r.latency_ms    = st.colOptI64(i++);
    r.tool          = st.colText(i++);
    r.tool_version  = st.colText(i++);
    r.options       = st.colText(i++);
    r.vantage       = st.colText(i++);
    out.push_back(std::move(r));
  }
  return out;
}

int64_t IndexStore::countRecords(const std::string& uid) {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, "SELECT COUNT(*) FROM records WHERE submission_uid = ?", "countRecords");
  st.text(1, uid);
  return st.step() ? st.colI64(0) : 0;
}

int64_t IndexStore::countAllRecords() {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, "SELECT COUNT(*) FROM records", "countAllRecords");
  return st.step() ? st.colI64(0) : 0;
}

std::optional<CheckpointState> IndexStore::loadCheckpoint() {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, R"SQL(
    SELECT last_block, last_attestation_uid, processed_count, error_count, updated_at
    FROM indexer_state WHERE id = 1
  )SQL", "loadCheckpoint");
  if (!st.step()) return std::nullopt;
  CheckpointState c;
  if (auto b = st.colOptI64(0)) c.last_block = static_cast<uint64_t>(*b);
  c.last_attestation_uid = st.colText(1);
  c.processed_count      = st.colI64(2);
  c.error_count          = st.colI64(3);
  c.updated_at           = st.colI64(4);
  return c;
}

void IndexStore::recordOutcome(const std::string& uid, bool failed, int64_t at) {
  auto* db = static_cast<sqlite3*>(db_);
  Transaction tx(db);
  Statement st(db, R"SQL(
    INSERT INTO indexer_state (id, last_block, last_attestation_uid, processed_count, error_count, updated_at)
    VALUES (1, NULL, ?1, 1, ?2, ?3)
    ON CONFLICT(id) DO UPDATE SET
      last_attestation_uid = excluded.last_attestation_uid,
      processed_count = indexer_state.processed_count + 1,
      error_count = indexer_state.error_count + excluded.error_count,
      updated_at = excluded.updated_at
  )SQL", "recordOutcome");
  st.text(1, uid);
  st.i64(2, failed ? 1 : 0);
  st.i64(3, at);
  st.run();
  tx.commit();
}

void IndexStore::advanceCursor(uint64_t block, int64_t at) {
  auto* db = static_cast<sqlite3*>(db_);
  Transaction tx(db);
  Statement st(db, R"SQL(
    INSERT INTO indexer_state (id, last_block, updated_at) VALUES (1, ?1, ?2)
    ON CONFLICT(id) DO UPDATE SET
      last_block = CASE
        WHEN indexer_state.last_block IS NULL OR indexer_state.last_block < excluded.last_block
        THEN excluded.last_block ELSE indexer_state.last_block END,
      updated_at = excluded.updated_at
  )SQL", "advanceCursor");
  st.i64(1, static_cast<int64_t>(block));
  st.i64(2, at);
  st.run();
  tx.commit();
}

IndexerStats IndexStore::stats() {
  auto* db = static_cast<sqlite3*>(db_);
  IndexerStats out;
  {
    Statement st(db, "SELECT status, COUNT(*) FROM submissions GROUP BY status", "stats");
    while (st.step()) out.submissions_by_status[st.colText(0)] = st.colI64(1);
  }
  out.total_records = countAllRecords();
  out.checkpoint = loadCheckpoint();
  return out;
}

std::vector<FailureInfo> IndexStore::recentFailures(int limit) {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, R"SQL(
    SELECT uid, error_message, processed_at FROM submissions
    WHERE status = 'failed'
    ORDER BY COALESCE(processed_at, created_at) DESC, uid
    LIMIT ?
  )SQL", "recentFailures");
  st.i64(1, static_cast<int64_t>(limit));
  std::vector<FailureInfo> out;
  while (st.step()) {
    FailureInfo f;
    f.uid           = st.colText(0);
    f.error_message = st.colText(1);
    f.processed_at  = st.colOptI64(2);
    out.push_back(std::move(f));
  }
  return out;
}

} // namespace sai
