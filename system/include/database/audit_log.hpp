// ============= include/database/audit_log.hpp =============
/*
 * Audit Log - SQLite Backend (append-only)
 *
 * Registra cada transición del ciclo de enrolamiento y cada
 * decisión de reconocimiento.
 *
 * SCHEMA:
 * CREATE TABLE audit (
 *   id INTEGER PRIMARY KEY AUTOINCREMENT,
 *   timestamp INTEGER NOT NULL,         -- epoch ms
 *   action TEXT NOT NULL,               -- "enrollment.approved", "resolve.match", ...
 *   subject_kind TEXT NOT NULL,         -- "request" | "identity" | "index" | "resolution"
 *   subject_id INTEGER,
 *   actor TEXT,                         -- reviewer / "system"
 *   details TEXT,
 *   score REAL                          -- similarity cuando aplica
 * );
 */

#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace faceattend {

struct AuditRecord {
    std::string action;
    std::string subject_kind;
    int64_t subject_id = -1;
    std::string actor = "system";
    std::string details;
    double score = -1.0;
    int64_t timestamp = 0;             // 0 = ahora
};

class AuditSink {
public:
    virtual ~AuditSink() = default;

    // Never throws: audit failures are logged at critical and counted
    virtual void record(const AuditRecord& entry) = 0;

    virtual uint64_t failed_writes() const { return 0; }
};

class SqliteAuditLog : public AuditSink {
public:
    explicit SqliteAuditLog(const std::string& db_path);
    ~SqliteAuditLog() override;

    SqliteAuditLog(const SqliteAuditLog&) = delete;
    SqliteAuditLog& operator=(const SqliteAuditLog&) = delete;

    void record(const AuditRecord& entry) override;

    // Estadísticas / consulta
    int count_total();
    int count(const std::string& action);
    std::vector<AuditRecord> recent(int limit);

    int entries_logged() const { return logged; }
    uint64_t failed_writes() const override { return failures.load(); }

private:
    sqlite3* db = nullptr;
    sqlite3_stmt* insert_stmt = nullptr;
    std::string db_path;
    std::mutex db_mutex;
    int logged = 0;
    std::atomic<uint64_t> failures{0};

    void create_table();
    void close();
};

} // namespace faceattend
