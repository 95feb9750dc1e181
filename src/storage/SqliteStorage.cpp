#include "bountygate/storage/SqliteStorage.hpp"

#include <filesystem>
#include <stdexcept>

#include <sqlite3.h>

#include "bountygate/infra/Logger.hpp"

namespace bountygate {

namespace {

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS runs (
    run_id TEXT PRIMARY KEY,
    target TEXT NOT NULL,
    mode TEXT NOT NULL,
    output_dir TEXT NOT NULL,
    start_time INTEGER NOT NULL,
    end_time INTEGER,
    status TEXT DEFAULT 'running',
    findings_count INTEGER DEFAULT 0
);

CREATE TABLE IF NOT EXISTS findings (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    run_id TEXT NOT NULL,
    target TEXT NOT NULL,
    name TEXT NOT NULL,
    severity TEXT,
    description TEXT,
    evidence TEXT,
    scanner_kind TEXT,
    matched_at TEXT,
    ml_score REAL,
    llm_score REAL,
    final_score REAL,
    confidence REAL,
    severity_adjusted TEXT,
    is_false_positive INTEGER DEFAULT 0,
    explanation TEXT,
    created_at INTEGER NOT NULL,
    FOREIGN KEY (run_id) REFERENCES runs(run_id)
);

CREATE TABLE IF NOT EXISTS policy_decisions (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    target TEXT NOT NULL,
    action TEXT NOT NULL,
    decision TEXT NOT NULL,
    reason TEXT,
    confidence REAL,
    timestamp INTEGER NOT NULL,
    digest TEXT
);

CREATE TABLE IF NOT EXISTS llm_responses (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    prompt TEXT NOT NULL,
    response TEXT NOT NULL,
    model TEXT,
    timestamp INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_findings_run_id ON findings(run_id);
CREATE INDEX IF NOT EXISTS idx_findings_score ON findings(final_score DESC);
CREATE INDEX IF NOT EXISTS idx_policy_target ON policy_decisions(target);
CREATE INDEX IF NOT EXISTS idx_policy_timestamp ON policy_decisions(timestamp);
)SQL";

// Prepared statement, finalized on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            stmt_ = nullptr;
        }
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return stmt_ != nullptr; }

    void bind_text(int i, const std::string& s) {
        sqlite3_bind_text(stmt_, i, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
    }
    void bind_real(int i, double v) { sqlite3_bind_double(stmt_, i, v); }
    void bind_int(int i, int64_t v) { sqlite3_bind_int64(stmt_, i, static_cast<sqlite3_int64>(v)); }

    int step() { return sqlite3_step(stmt_); }

    std::string text(int col) const {
        const unsigned char* p = sqlite3_column_text(stmt_, col);
        return p ? std::string(reinterpret_cast<const char*>(p)) : std::string();
    }
    double real(int col) const { return sqlite3_column_double(stmt_, col); }
    int64_t integer(int col) const { return static_cast<int64_t>(sqlite3_column_int64(stmt_, col)); }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

RunStatus run_status_from_string(const std::string& s) {
    if (s == "completed") return RunStatus::Completed;
    if (s == "failed") return RunStatus::Failed;
    return RunStatus::Running;
}

} // namespace

SqliteStorage::SqliteStorage(const std::string& path, Logger& log)
    : log_(log)
{
    if (path != ":memory:") {
        const auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw std::runtime_error("cannot create database directory " + parent.string() +
                                         ": " + ec.message());
            }
        }
    }

    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("cannot open database " + path + ": " + msg);
    }

    sqlite3_busy_timeout(db_, 5000);
    if (!exec(kSchema)) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("cannot initialise database schema in " + path);
    }
    log_.debug("DB", "database ready: " + path);
}

SqliteStorage::~SqliteStorage() {
    if (db_) sqlite3_close(db_);
}

bool SqliteStorage::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        report(err ? err : "sqlite3_exec failed");
        sqlite3_free(err);
        return false;
    }
    return true;
}

void SqliteStorage::report(const std::string& what) {
    log_.error("DB", what);
}

// ---------------------------------------------------------------------------
// Runs
// ---------------------------------------------------------------------------

bool SqliteStorage::create_run(const RunRecord& run) {
    std::lock_guard<std::mutex> lock(mtx_);
    Statement st(db_,
        "INSERT INTO runs (run_id, target, mode, output_dir, start_time, status, findings_count) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)");
    if (!st.ok()) {
        report(std::string("create_run prepare: ") + sqlite3_errmsg(db_));
        return false;
    }
    st.bind_text(1, run.run_id);
    st.bind_text(2, run.target);
    st.bind_text(3, to_string(run.mode));
    st.bind_text(4, run.output_location);
    st.bind_int(5, run.start_time_ms);
    st.bind_text(6, to_string(run.status));
    st.bind_int(7, run.findings_count);
    if (st.step() != SQLITE_DONE) {
        report("create_run " + run.run_id + ": " + sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool SqliteStorage::update_run_status(const std::string& run_id, RunStatus status,
                                      uint32_t findings_count) {
    std::lock_guard<std::mutex> lock(mtx_);
    Statement st(db_,
        "UPDATE runs SET status = ?, end_time = ?, findings_count = ? WHERE run_id = ?");
    if (!st.ok()) {
        report(std::string("update_run_status prepare: ") + sqlite3_errmsg(db_));
        return false;
    }
    st.bind_text(1, to_string(status));
    st.bind_int(2, wall_clock_ms());
    st.bind_int(3, findings_count);
    st.bind_text(4, run_id);
    if (st.step() != SQLITE_DONE) {
        report("update_run_status " + run_id + ": " + sqlite3_errmsg(db_));
        return false;
    }
    if (sqlite3_changes(db_) == 0) {
        report("update_run_status: no run " + run_id);
        return false;
    }
    return true;
}

std::optional<RunRecord> SqliteStorage::get_run(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    Statement st(db_,
        "SELECT run_id, target, mode, output_dir, start_time, end_time, status, findings_count "
        "FROM runs WHERE run_id = ?");
    if (!st.ok()) {
        report(std::string("get_run prepare: ") + sqlite3_errmsg(db_));
        return std::nullopt;
    }
    st.bind_text(1, run_id);
    if (st.step() != SQLITE_ROW) return std::nullopt;

    RunRecord r;
    r.run_id = st.text(0);
    r.target = st.text(1);
    r.mode = scan_mode_from_string(st.text(2)).value_or(ScanMode::SafeScan);
    r.output_location = st.text(3);
    r.start_time_ms = st.integer(4);
    r.end_time_ms = st.integer(5);
    r.status = run_status_from_string(st.text(6));
    r.findings_count = static_cast<uint32_t>(st.integer(7));
    return r;
}

// ---------------------------------------------------------------------------
// Findings
// ---------------------------------------------------------------------------

bool SqliteStorage::save_finding(const std::string& run_id, const FindingRecord& f) {
    std::lock_guard<std::mutex> lock(mtx_);
    Statement st(db_,
        "INSERT INTO findings (run_id, target, name, severity, description, evidence, "
        "scanner_kind, matched_at, ml_score, llm_score, final_score, confidence, "
        "severity_adjusted, is_false_positive, explanation, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!st.ok()) {
        report(std::string("save_finding prepare: ") + sqlite3_errmsg(db_));
        return false;
    }
    st.bind_text(1, run_id);
    st.bind_text(2, f.target);
    st.bind_text(3, f.name);
    st.bind_text(4, f.severity);
    st.bind_text(5, f.description);
    st.bind_text(6, f.evidence.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    st.bind_text(7, f.scanner_kind);
    st.bind_text(8, f.matched_at);
    st.bind_real(9, f.ml_score);
    st.bind_real(10, f.llm_score);
    st.bind_real(11, f.final_score);
    st.bind_real(12, f.confidence);
    st.bind_text(13, f.severity_adjusted);
    st.bind_int(14, f.is_false_positive ? 1 : 0);
    st.bind_text(15, f.explanation);
    st.bind_int(16, wall_clock_ms());
    if (st.step() != SQLITE_DONE) {
        report("save_finding " + run_id + ": " + sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<FindingRecord> SqliteStorage::list_findings(const std::string& run_id) {
    std::vector<FindingRecord> out;
    std::lock_guard<std::mutex> lock(mtx_);
    Statement st(db_,
        "SELECT target, name, severity, description, evidence, scanner_kind, matched_at, "
        "ml_score, llm_score, final_score, confidence, severity_adjusted, is_false_positive, "
        "explanation FROM findings WHERE run_id = ? ORDER BY final_score DESC, id ASC");
    if (!st.ok()) {
        report(std::string("list_findings prepare: ") + sqlite3_errmsg(db_));
        return out;
    }
    st.bind_text(1, run_id);

    while (st.step() == SQLITE_ROW) {
        FindingRecord f;
        f.target = st.text(0);
        f.name = st.text(1);
        f.severity = st.text(2);
        f.description = st.text(3);
        f.evidence = nlohmann::json::parse(st.text(4), nullptr, false);
        if (f.evidence.is_discarded()) f.evidence = nlohmann::json::object();
        f.scanner_kind = st.text(5);
        f.matched_at = st.text(6);
        f.ml_score = st.real(7);
        f.llm_score = st.real(8);
        f.final_score = st.real(9);
        f.confidence = st.real(10);
        f.severity_adjusted = st.text(11);
        f.is_false_positive = st.integer(12) != 0;
        f.explanation = st.text(13);
        out.push_back(std::move(f));
    }
    return out;
}

// ---------------------------------------------------------------------------
// Audit and advisory exchanges
// ---------------------------------------------------------------------------

bool SqliteStorage::append_policy_decision(const AuditRecord& r) {
    std::lock_guard<std::mutex> lock(mtx_);
    Statement st(db_,
        "INSERT INTO policy_decisions (target, action, decision, reason, confidence, timestamp, digest) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)");
    if (!st.ok()) {
        report(std::string("append_policy_decision prepare: ") + sqlite3_errmsg(db_));
        return false;
    }
    st.bind_text(1, r.target);
    st.bind_text(2, r.action_kind);
    st.bind_text(3, to_string(r.decision));
    st.bind_text(4, r.reason);
    st.bind_real(5, r.confidence);
    st.bind_int(6, r.timestamp_ms);
    st.bind_text(7, r.digest);
    if (st.step() != SQLITE_DONE) {
        report(std::string("append_policy_decision: ") + sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool SqliteStorage::store_advisory_exchange(const std::string& prompt, const std::string& response,
                                            const std::string& model) {
    std::lock_guard<std::mutex> lock(mtx_);
    Statement st(db_,
        "INSERT INTO llm_responses (prompt, response, model, timestamp) VALUES (?, ?, ?, ?)");
    if (!st.ok()) {
        report(std::string("store_advisory_exchange prepare: ") + sqlite3_errmsg(db_));
        return false;
    }
    st.bind_text(1, prompt);
    st.bind_text(2, response);
    st.bind_text(3, model);
    st.bind_int(4, wall_clock_ms());
    if (st.step() != SQLITE_DONE) {
        report(std::string("store_advisory_exchange: ") + sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<AuditRecord> SqliteStorage::list_policy_decisions(const std::string& target) {
    std::vector<AuditRecord> out;
    std::lock_guard<std::mutex> lock(mtx_);
    Statement st(db_, target.empty()
        ? "SELECT target, action, decision, reason, confidence, timestamp, digest "
          "FROM policy_decisions ORDER BY id ASC"
        : "SELECT target, action, decision, reason, confidence, timestamp, digest "
          "FROM policy_decisions WHERE target = ? ORDER BY id ASC");
    if (!st.ok()) {
        report(std::string("list_policy_decisions prepare: ") + sqlite3_errmsg(db_));
        return out;
    }
    if (!target.empty()) st.bind_text(1, target);

    while (st.step() == SQLITE_ROW) {
        AuditRecord r;
        r.target = st.text(0);
        r.action_kind = st.text(1);
        r.decision = decision_from_string(st.text(2)).value_or(Decision::Unknown);
        r.reason = st.text(3);
        r.confidence = st.real(4);
        r.timestamp_ms = st.integer(5);
        r.digest = st.text(6);
        out.push_back(std::move(r));
    }
    return out;
}

size_t SqliteStorage::count_advisory_exchanges() {
    std::lock_guard<std::mutex> lock(mtx_);
    Statement st(db_, "SELECT COUNT(*) FROM llm_responses");
    if (!st.ok() || st.step() != SQLITE_ROW) return 0;
    return static_cast<size_t>(st.integer(0));
}

} // namespace bountygate
