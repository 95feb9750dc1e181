#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "bountygate/storage/Storage.hpp"

struct sqlite3;

namespace bountygate {

class Logger;

// ---------------------------------------------------------------------------
// SQLite-backed Storage.
//
// Tables: runs, findings, policy_decisions, llm_responses. Timestamps are
// epoch milliseconds. One connection guarded by a mutex; every statement is
// prepared and bound, never string-formatted.
// ---------------------------------------------------------------------------
class SqliteStorage : public Storage {
public:
    // Creates the parent directory and the schema. ":memory:" is accepted.
    // Throws std::runtime_error when the database cannot be opened.
    SqliteStorage(const std::string& path, Logger& log);
    ~SqliteStorage() override;

    SqliteStorage(const SqliteStorage&) = delete;
    SqliteStorage& operator=(const SqliteStorage&) = delete;

    bool create_run(const RunRecord& run) override;
    bool update_run_status(const std::string& run_id, RunStatus status,
                           uint32_t findings_count) override;
    std::optional<RunRecord> get_run(const std::string& run_id) override;

    bool save_finding(const std::string& run_id, const FindingRecord& finding) override;
    std::vector<FindingRecord> list_findings(const std::string& run_id) override;

    bool append_policy_decision(const AuditRecord& record) override;
    bool store_advisory_exchange(const std::string& prompt, const std::string& response,
                                 const std::string& model) override;

    // Insertion order. Empty `target` lists every decision.
    std::vector<AuditRecord> list_policy_decisions(const std::string& target = "");
    size_t count_advisory_exchanges();

private:
    bool exec(const char* sql);
    void report(const std::string& what);

    sqlite3* db_ = nullptr;
    Logger& log_;
    std::mutex mtx_;
};

} // namespace bountygate
