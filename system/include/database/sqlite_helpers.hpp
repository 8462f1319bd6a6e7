// ============= include/database/sqlite_helpers.hpp =============
/*
 * RAII sobre la API C de SQLite
 * - Statement: prepare / bind / step / finalize
 * - Transaction: BEGIN IMMEDIATE, ROLLBACK si no se hizo commit
 *
 * Los errores se lanzan como StorageError con el mensaje de sqlite.
 */

#pragma once
#include "core/errors.hpp"
#include "core/types.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <cstring>
#include <string>

namespace faceattend {
namespace sqlite {

inline void exec(sqlite3* db, const char* sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : sqlite3_errmsg(db);
        sqlite3_free(err_msg);
        throw StorageError(std::string("SQL error: ") + msg);
    }
}

// WAL + synchronous NORMAL, como en el logger de producción
inline void configure_connection(sqlite3* db) {
    exec(db, "PRAGMA journal_mode=WAL;");
    exec(db, "PRAGMA synchronous=NORMAL;");
    sqlite3_busy_timeout(db, 5000);
}

class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_text(int idx, const std::string& value) {
        sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bind_int(int idx, int64_t value) {
        sqlite3_bind_int64(stmt, idx, value);
    }

    void bind_double(int idx, double value) {
        sqlite3_bind_double(stmt, idx, value);
    }

    void bind_blob(int idx, const Embedding& embedding) {
        sqlite3_bind_blob(stmt, idx, embedding.data(),
                          static_cast<int>(embedding.size() * sizeof(float)), SQLITE_TRANSIENT);
    }

    // true = row available, false = done
    bool step() {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StorageError(std::string("Step failed: ") + sqlite3_errmsg(db));
    }

    void run() {
        while (step()) {}
    }

    int64_t column_int64(int col) const {
        return sqlite3_column_int64(stmt, col);
    }

    double column_double(int col) const {
        return sqlite3_column_double(stmt, col);
    }

    std::string column_text(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt, col);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    Embedding column_embedding(int col) const {
        const void* blob = sqlite3_column_blob(stmt, col);
        int size = sqlite3_column_bytes(stmt, col);
        Embedding emb(size / sizeof(float));
        if (blob && size > 0) {
            std::memcpy(emb.data(), blob, emb.size() * sizeof(float));
        }
        return emb;
    }

private:
    sqlite3* db;
    sqlite3_stmt* stmt = nullptr;
};

class Transaction {
public:
    explicit Transaction(sqlite3* db) : db(db) {
        exec(db, "BEGIN IMMEDIATE;");
    }

    ~Transaction() {
        if (!done) {
            if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
                spdlog::error("ROLLBACK failed: {}", sqlite3_errmsg(db));
            }
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec(db, "COMMIT;");
        done = true;
    }

private:
    sqlite3* db;
    bool done = false;
};

} // namespace sqlite
} // namespace faceattend
