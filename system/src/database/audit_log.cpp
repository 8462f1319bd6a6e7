// ============= src/database/audit_log.cpp =============
#include "database/audit_log.hpp"
#include "database/sqlite_helpers.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>

namespace faceattend {

SqliteAuditLog::SqliteAuditLog(const std::string& db_path)
    : db_path(db_path)
{
    if (db_path != ":memory:") {
        std::filesystem::path p(db_path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }
    }

    if (sqlite3_open(db_path.c_str(), &db) != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        close();
        throw StorageError("No se pudo abrir audit log " + db_path + ": " + msg);
    }

    try {
        sqlite::configure_connection(db);
        create_table();
    } catch (...) {
        close();
        throw;
    }

    const char* sql = R"(
        INSERT INTO audit (timestamp, action, subject_kind, subject_id, actor, details, score)
        VALUES (?, ?, ?, ?, ?, ?, ?)
    )";
    if (sqlite3_prepare_v2(db, sql, -1, &insert_stmt, nullptr) != SQLITE_OK) {
        std::string msg = sqlite3_errmsg(db);
        close();
        throw StorageError("❌ Error preparando statement: " + msg);
    }

    spdlog::info("📝 Audit log inicializado");
    spdlog::info("   Database: {}", db_path);
}

SqliteAuditLog::~SqliteAuditLog() {
    close();
}

void SqliteAuditLog::create_table() {
    sqlite::exec(db, R"(
        CREATE TABLE IF NOT EXISTS audit (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp INTEGER NOT NULL,
            action TEXT NOT NULL,
            subject_kind TEXT NOT NULL,
            subject_id INTEGER,
            actor TEXT,
            details TEXT,
            score REAL
        );

        CREATE INDEX IF NOT EXISTS idx_audit_action ON audit(action);
        CREATE INDEX IF NOT EXISTS idx_audit_subject ON audit(subject_kind, subject_id);
        CREATE INDEX IF NOT EXISTS idx_audit_timestamp ON audit(timestamp);
    )");
}

void SqliteAuditLog::close() {
    if (insert_stmt) {
        sqlite3_finalize(insert_stmt);
        insert_stmt = nullptr;
    }
    if (db) {
        sqlite3_close(db);
        db = nullptr;
    }
}

void SqliteAuditLog::record(const AuditRecord& entry) {
    std::lock_guard<std::mutex> lock(db_mutex);

    sqlite3_reset(insert_stmt);
    sqlite3_bind_int64(insert_stmt, 1, entry.timestamp ? entry.timestamp : now_ms());
    sqlite3_bind_text(insert_stmt, 2, entry.action.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt, 3, entry.subject_kind.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(insert_stmt, 4, entry.subject_id);
    sqlite3_bind_text(insert_stmt, 5, entry.actor.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt, 6, entry.details.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insert_stmt, 7, entry.score);

    if (sqlite3_step(insert_stmt) != SQLITE_DONE) {
        failures++;
        spdlog::critical("❌ Audit perdido ({} subject {}): {} [{} fallos]",
                         entry.action, entry.subject_id, sqlite3_errmsg(db), failures.load());
        sqlite3_reset(insert_stmt);
        return;
    }

    logged++;
}

int SqliteAuditLog::count_total() {
    std::lock_guard<std::mutex> lock(db_mutex);

    sqlite::Statement stmt(db, "SELECT COUNT(*) FROM audit");
    return stmt.step() ? static_cast<int>(stmt.column_int64(0)) : 0;
}

int SqliteAuditLog::count(const std::string& action) {
    std::lock_guard<std::mutex> lock(db_mutex);

    sqlite::Statement stmt(db, "SELECT COUNT(*) FROM audit WHERE action = ?");
    stmt.bind_text(1, action);
    return stmt.step() ? static_cast<int>(stmt.column_int64(0)) : 0;
}

std::vector<AuditRecord> SqliteAuditLog::recent(int limit) {
    std::lock_guard<std::mutex> lock(db_mutex);

    sqlite::Statement stmt(db, R"(
        SELECT timestamp, action, subject_kind, subject_id, actor, details, score
        FROM audit ORDER BY id DESC LIMIT ?
    )");
    stmt.bind_int(1, limit);

    std::vector<AuditRecord> out;
    while (stmt.step()) {
        AuditRecord r;
        r.timestamp = stmt.column_int64(0);
        r.action = stmt.column_text(1);
        r.subject_kind = stmt.column_text(2);
        r.subject_id = stmt.column_int64(3);
        r.actor = stmt.column_text(4);
        r.details = stmt.column_text(5);
        r.score = stmt.column_double(6);
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace faceattend
