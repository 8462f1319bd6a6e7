// ============= src/database/sqlite_identity_store.cpp =============
#include "database/sqlite_identity_store.hpp"
#include "database/sqlite_helpers.hpp"
#include "core/embedding_math.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <unordered_map>

namespace faceattend {

using sqlite::Statement;
using sqlite::Transaction;

namespace {

const char* REQUEST_COLUMNS =
    "id, name, external_id, email, department, designation, phone, status, "
    "embedding_count, submitted_at, processed_at, processed_by, rejection_reason, identity_id";

const char* IDENTITY_COLUMNS =
    "id, request_id, name, external_id, department, designation, status, created_at, updated_at";

const char* ATTENDANCE_COLUMNS =
    "id, identity_id, timestamp, date, confidence, check_type, location";

EnrollmentRequest read_request(const Statement& stmt) {
    EnrollmentRequest r;
    r.id = stmt.column_int64(0);
    r.candidate.name = stmt.column_text(1);
    r.candidate.external_id = stmt.column_text(2);
    r.candidate.email = stmt.column_text(3);
    r.candidate.department = stmt.column_text(4);
    r.candidate.designation = stmt.column_text(5);
    r.candidate.phone = stmt.column_text(6);
    r.status = request_status_from_string(stmt.column_text(7));
    r.embedding_count = static_cast<int>(stmt.column_int64(8));
    r.submitted_at = stmt.column_int64(9);
    r.processed_at = stmt.column_int64(10);
    r.processed_by = stmt.column_text(11);
    r.rejection_reason = stmt.column_text(12);
    r.identity_id = stmt.column_int64(13);
    return r;
}

Identity read_identity(const Statement& stmt) {
    Identity i;
    i.id = stmt.column_int64(0);
    i.request_id = stmt.column_int64(1);
    i.name = stmt.column_text(2);
    i.external_id = stmt.column_text(3);
    i.department = stmt.column_text(4);
    i.designation = stmt.column_text(5);
    i.status = identity_status_from_string(stmt.column_text(6));
    i.created_at = stmt.column_int64(7);
    i.updated_at = stmt.column_int64(8);
    return i;
}

AttendanceEvent read_attendance(const Statement& stmt) {
    AttendanceEvent e;
    e.id = stmt.column_int64(0);
    e.identity_id = stmt.column_int64(1);
    e.timestamp = stmt.column_int64(2);
    e.date = stmt.column_text(3);
    e.confidence = static_cast<float>(stmt.column_double(4));
    e.check_type = check_type_from_string(stmt.column_text(5));
    e.location = stmt.column_text(6);
    return e;
}

std::string select_from(const char* columns, const char* table, const char* tail) {
    return std::string("SELECT ") + columns + " FROM " + table + " " + tail;
}

} // namespace

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

SqliteIdentityStore::SqliteIdentityStore(const std::string& db_path,
                                         int embedding_dim,
                                         int min_images)
    : db_path(db_path), embedding_dim(embedding_dim), min_images(min_images)
{
    spdlog::info("🗄️  Inicializando Identity Store");
    spdlog::info("   Path: {}", db_path);
    spdlog::info("   Embedding size: {} | min images: {}", embedding_dim, min_images);

    if (db_path != ":memory:") {
        std::filesystem::path p(db_path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }
    }

    if (sqlite3_open(db_path.c_str(), &db) != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        db = nullptr;
        throw StorageError("Cannot open database " + db_path + ": " + msg);
    }

    try {
        sqlite::configure_connection(db);
        create_tables();
        load_status_cache();
    } catch (...) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }

    spdlog::info("✓ Identity Store ready ({} active identities)",
                 count_identities(IdentityStatus::Active));
}

SqliteIdentityStore::~SqliteIdentityStore() {
    if (db) {
        sqlite3_close(db);
    }
}

// ==================== INITIALIZATION ====================

void SqliteIdentityStore::create_tables() {
    sqlite::exec(db, R"(
        CREATE TABLE IF NOT EXISTS enrollment_requests (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL,
            external_id TEXT NOT NULL DEFAULT '',
            email TEXT NOT NULL DEFAULT '',
            department TEXT NOT NULL DEFAULT '',
            designation TEXT NOT NULL DEFAULT '',
            phone TEXT NOT NULL DEFAULT '',
            status TEXT NOT NULL DEFAULT 'submitted',
            embedding_count INTEGER NOT NULL DEFAULT 0,
            submitted_at INTEGER NOT NULL,
            processed_at INTEGER NOT NULL DEFAULT 0,
            processed_by TEXT NOT NULL DEFAULT '',
            rejection_reason TEXT NOT NULL DEFAULT '',
            identity_id INTEGER NOT NULL DEFAULT -1
        );

        CREATE TABLE IF NOT EXISTS request_embeddings (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            request_id INTEGER NOT NULL REFERENCES enrollment_requests(id),
            seq INTEGER NOT NULL,
            embedding BLOB NOT NULL,
            quality REAL NOT NULL DEFAULT -1
        );

        CREATE TABLE IF NOT EXISTS identities (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            request_id INTEGER NOT NULL UNIQUE REFERENCES enrollment_requests(id),
            name TEXT NOT NULL,
            external_id TEXT NOT NULL DEFAULT '',
            department TEXT NOT NULL DEFAULT '',
            designation TEXT NOT NULL DEFAULT '',
            status TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS identity_embeddings (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            identity_id INTEGER NOT NULL REFERENCES identities(id),
            seq INTEGER NOT NULL,
            embedding BLOB NOT NULL
        );

        CREATE TABLE IF NOT EXISTS attendance (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            identity_id INTEGER NOT NULL REFERENCES identities(id),
            timestamp INTEGER NOT NULL,
            date TEXT NOT NULL,
            confidence REAL NOT NULL,
            check_type TEXT NOT NULL,
            location TEXT NOT NULL DEFAULT ''
        );

        CREATE INDEX IF NOT EXISTS idx_requests_status ON enrollment_requests(status);
        CREATE INDEX IF NOT EXISTS idx_requests_external ON enrollment_requests(external_id);
        CREATE INDEX IF NOT EXISTS idx_request_emb ON request_embeddings(request_id);
        CREATE INDEX IF NOT EXISTS idx_identities_status ON identities(status);
        CREATE INDEX IF NOT EXISTS idx_identities_external ON identities(external_id);
        CREATE INDEX IF NOT EXISTS idx_identity_emb ON identity_embeddings(identity_id);
        CREATE INDEX IF NOT EXISTS idx_attendance_lookup ON attendance(identity_id, date, check_type);
    )");
}

// ==================== STATUS CACHE ====================

void SqliteIdentityStore::load_status_cache() {
    Statement stmt(db, "SELECT id, status FROM identities");

    std::unique_lock<std::shared_mutex> lock(status_mutex);
    status_cache.clear();
    while (stmt.step()) {
        status_cache[stmt.column_int64(0)] = identity_status_from_string(stmt.column_text(1));
    }
}

void SqliteIdentityStore::cache_status(IdentityId identity_id, IdentityStatus status) {
    std::unique_lock<std::shared_mutex> lock(status_mutex);
    status_cache[identity_id] = status;
}

// ==================== LOADERS ====================

std::optional<EnrollmentRequest> SqliteIdentityStore::load_request(RequestId request_id,
                                                                   bool with_embeddings) {
    Statement stmt(db, select_from(REQUEST_COLUMNS, "enrollment_requests", "WHERE id = ?").c_str());
    stmt.bind_int(1, request_id);
    if (!stmt.step()) {
        return std::nullopt;
    }

    EnrollmentRequest request = read_request(stmt);

    if (with_embeddings) {
        Statement emb(db, "SELECT embedding FROM request_embeddings WHERE request_id = ? ORDER BY seq");
        emb.bind_int(1, request_id);
        while (emb.step()) {
            request.embeddings.push_back(emb.column_embedding(0));
        }
    }

    return request;
}

std::vector<Embedding> SqliteIdentityStore::load_identity_embeddings(IdentityId identity_id) {
    std::vector<Embedding> out;
    Statement stmt(db, "SELECT embedding FROM identity_embeddings WHERE identity_id = ? ORDER BY seq");
    stmt.bind_int(1, identity_id);
    while (stmt.step()) {
        out.push_back(stmt.column_embedding(0));
    }
    return out;
}

std::optional<Identity> SqliteIdentityStore::load_identity(IdentityId identity_id,
                                                           bool with_embeddings) {
    Statement stmt(db, select_from(IDENTITY_COLUMNS, "identities", "WHERE id = ?").c_str());
    stmt.bind_int(1, identity_id);
    if (!stmt.step()) {
        return std::nullopt;
    }

    Identity identity = read_identity(stmt);
    if (with_embeddings) {
        identity.embeddings = load_identity_embeddings(identity_id);
    }
    return identity;
}

// ==================== ENROLLMENT REQUESTS ====================

EnrollmentRequest SqliteIdentityStore::create_pending(const CandidateInfo& candidate) {
    if (candidate.name.empty()) {
        throw ValidationError("Name is required");
    }

    std::lock_guard<std::mutex> lock(db_mutex);

    Statement stmt(db, R"(
        INSERT INTO enrollment_requests
            (name, external_id, email, department, designation, phone, status, submitted_at)
        VALUES (?, ?, ?, ?, ?, ?, 'submitted', ?)
    )");
    stmt.bind_text(1, candidate.name);
    stmt.bind_text(2, candidate.external_id);
    stmt.bind_text(3, candidate.email);
    stmt.bind_text(4, candidate.department);
    stmt.bind_text(5, candidate.designation);
    stmt.bind_text(6, candidate.phone);
    stmt.bind_int(7, now_ms());
    stmt.run();

    RequestId id = sqlite3_last_insert_rowid(db);
    spdlog::debug("Enrollment request {} creada para {}", id, candidate.name);

    auto request = load_request(id, false);
    if (!request) {
        throw StorageError("Request " + std::to_string(id) + " vanished after insert");
    }
    return *request;
}

void SqliteIdentityStore::attach_embedding(RequestId request_id,
                                           const Embedding& embedding,
                                           float quality_score) {
    if (static_cast<int>(embedding.size()) != embedding_dim) {
        throw ValidationError("Invalid embedding size: " + std::to_string(embedding.size()) +
                              " (expected " + std::to_string(embedding_dim) + ")");
    }
    if (!is_finite(embedding)) {
        throw ValidationError("Embedding contains non-finite values");
    }

    std::lock_guard<std::mutex> lock(db_mutex);
    Transaction tx(db);

    auto request = load_request(request_id, false);
    if (!request) {
        throw NotFoundError("Request " + std::to_string(request_id) + " not found");
    }
    if (is_terminal(request->status)) {
        throw AlreadyFinalizedError(request_id, to_string(request->status));
    }

    Statement insert(db, R"(
        INSERT INTO request_embeddings (request_id, seq, embedding, quality)
        VALUES (?, ?, ?, ?)
    )");
    insert.bind_int(1, request_id);
    insert.bind_int(2, request->embedding_count);
    insert.bind_blob(3, l2_normalized(embedding));
    insert.bind_double(4, quality_score);
    insert.run();

    Statement bump(db, "UPDATE enrollment_requests SET embedding_count = embedding_count + 1 WHERE id = ?");
    bump.bind_int(1, request_id);
    bump.run();

    tx.commit();
}

void SqliteIdentityStore::begin_review(RequestId request_id) {
    std::lock_guard<std::mutex> lock(db_mutex);
    Transaction tx(db);

    Statement stmt(db, R"(
        UPDATE enrollment_requests SET status = 'under_review'
        WHERE id = ? AND status = 'submitted'
    )");
    stmt.bind_int(1, request_id);
    stmt.run();

    if (sqlite3_changes(db) == 0) {
        auto request = load_request(request_id, false);
        if (!request) {
            throw NotFoundError("Request " + std::to_string(request_id) + " not found");
        }
        if (is_terminal(request->status)) {
            throw AlreadyFinalizedError(request_id, to_string(request->status));
        }
        // ya estaba under_review
    }

    tx.commit();
}

PromoteResult SqliteIdentityStore::promote(RequestId request_id, const std::string& reviewer) {
    std::lock_guard<std::mutex> lock(db_mutex);
    Transaction tx(db);

    auto request = load_request(request_id, false);
    if (!request) {
        throw NotFoundError("Request " + std::to_string(request_id) + " not found");
    }

    // Idempotente: segunda aprobación devuelve la misma identidad
    if (request->status == RequestStatus::Approved) {
        auto existing = load_identity(request->identity_id, true);
        if (!existing) {
            throw InconsistentStateError("Request " + std::to_string(request_id) +
                                         " approved without identity");
        }
        PromoteResult result;
        result.identity = std::move(*existing);
        result.newly_promoted = false;
        return result;
    }
    if (request->status == RequestStatus::Rejected) {
        throw AlreadyFinalizedError(request_id, to_string(request->status));
    }

    if (request->embedding_count < min_images) {
        throw ValidationError("Request " + std::to_string(request_id) + " has " +
                              std::to_string(request->embedding_count) +
                              " embeddings, minimum is " + std::to_string(min_images));
    }

    int64_t now = now_ms();

    Statement approve(db, R"(
        UPDATE enrollment_requests
        SET status = 'approved', processed_at = ?, processed_by = ?
        WHERE id = ? AND status IN ('submitted', 'under_review')
    )");
    approve.bind_int(1, now);
    approve.bind_text(2, reviewer);
    approve.bind_int(3, request_id);
    approve.run();

    if (sqlite3_changes(db) != 1) {
        throw AlreadyFinalizedError(request_id, "finalized");
    }

    PromoteResult result;
    result.newly_promoted = true;

    // Re-enrolamiento: la identidad activa anterior queda suspendida
    if (!request->candidate.external_id.empty()) {
        Statement prev(db, R"(
            SELECT id FROM identities WHERE external_id = ? AND status = 'active'
            ORDER BY id DESC LIMIT 1
        )");
        prev.bind_text(1, request->candidate.external_id);
        if (prev.step()) {
            result.superseded_id = prev.column_int64(0);

            Statement suspend(db, R"(
                UPDATE identities SET status = 'suspended', updated_at = ?
                WHERE id = ? AND status = 'active'
            )");
            suspend.bind_int(1, now);
            suspend.bind_int(2, result.superseded_id);
            suspend.run();
        }
    }

    Statement insert(db, R"(
        INSERT INTO identities
            (request_id, name, external_id, department, designation, status, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, 'active', ?, ?)
    )");
    insert.bind_int(1, request_id);
    insert.bind_text(2, request->candidate.name);
    insert.bind_text(3, request->candidate.external_id);
    insert.bind_text(4, request->candidate.department);
    insert.bind_text(5, request->candidate.designation);
    insert.bind_int(6, now);
    insert.bind_int(7, now);
    insert.run();

    IdentityId identity_id = sqlite3_last_insert_rowid(db);

    Statement copy(db, R"(
        INSERT INTO identity_embeddings (identity_id, seq, embedding)
        SELECT ?, seq, embedding FROM request_embeddings WHERE request_id = ? ORDER BY seq
    )");
    copy.bind_int(1, identity_id);
    copy.bind_int(2, request_id);
    copy.run();

    Statement link(db, "UPDATE enrollment_requests SET identity_id = ? WHERE id = ?");
    link.bind_int(1, identity_id);
    link.bind_int(2, request_id);
    link.run();

    Statement drop(db, "DELETE FROM request_embeddings WHERE request_id = ?");
    drop.bind_int(1, request_id);
    drop.run();

    auto identity = load_identity(identity_id, true);
    if (!identity) {
        throw StorageError("Identity " + std::to_string(identity_id) + " vanished after insert");
    }

    tx.commit();

    if (result.superseded_id >= 0) {
        cache_status(result.superseded_id, IdentityStatus::Suspended);
    }
    cache_status(identity_id, IdentityStatus::Active);

    result.identity = std::move(*identity);
    return result;
}

RejectionRecord SqliteIdentityStore::reject(RequestId request_id,
                                            const std::string& reason,
                                            const std::string& reviewer) {
    std::lock_guard<std::mutex> lock(db_mutex);
    Transaction tx(db);

    int64_t now = now_ms();

    Statement stmt(db, R"(
        UPDATE enrollment_requests
        SET status = 'rejected', processed_at = ?, processed_by = ?, rejection_reason = ?
        WHERE id = ? AND status IN ('submitted', 'under_review')
    )");
    stmt.bind_int(1, now);
    stmt.bind_text(2, reviewer);
    stmt.bind_text(3, reason);
    stmt.bind_int(4, request_id);
    stmt.run();

    if (sqlite3_changes(db) == 0) {
        auto request = load_request(request_id, false);
        if (!request) {
            throw NotFoundError("Request " + std::to_string(request_id) + " not found");
        }
        throw AlreadyFinalizedError(request_id, to_string(request->status));
    }

    Statement drop(db, "DELETE FROM request_embeddings WHERE request_id = ?");
    drop.bind_int(1, request_id);
    drop.run();

    tx.commit();

    RejectionRecord record;
    record.request_id = request_id;
    record.reason = reason;
    record.reviewer = reviewer;
    record.processed_at = now;
    return record;
}

std::optional<EnrollmentRequest> SqliteIdentityStore::get_request(RequestId request_id) {
    std::lock_guard<std::mutex> lock(db_mutex);
    return load_request(request_id, true);
}

std::vector<EnrollmentRequest> SqliteIdentityStore::list_requests(RequestStatus status) {
    std::lock_guard<std::mutex> lock(db_mutex);

    Statement stmt(db, select_from(REQUEST_COLUMNS, "enrollment_requests",
                                   "WHERE status = ? ORDER BY submitted_at, id").c_str());
    stmt.bind_text(1, to_string(status));

    std::vector<EnrollmentRequest> out;
    while (stmt.step()) {
        out.push_back(read_request(stmt));
    }
    return out;
}

bool SqliteIdentityStore::has_pending_request(const std::string& external_id) {
    if (external_id.empty()) return false;

    std::lock_guard<std::mutex> lock(db_mutex);

    Statement stmt(db, R"(
        SELECT 1 FROM enrollment_requests
        WHERE external_id = ? AND status IN ('submitted', 'under_review') LIMIT 1
    )");
    stmt.bind_text(1, external_id);
    return stmt.step();
}

// ==================== IDENTITIES ====================

std::vector<Identity> SqliteIdentityStore::list_active() {
    std::lock_guard<std::mutex> lock(db_mutex);

    std::vector<Identity> out;
    std::unordered_map<IdentityId, size_t> position;

    Statement stmt(db, select_from(IDENTITY_COLUMNS, "identities",
                                   "WHERE status = 'active' ORDER BY id").c_str());
    while (stmt.step()) {
        position[stmt.column_int64(0)] = out.size();
        out.push_back(read_identity(stmt));
    }

    Statement emb(db, R"(
        SELECT e.identity_id, e.embedding FROM identity_embeddings e
        JOIN identities i ON i.id = e.identity_id
        WHERE i.status = 'active'
        ORDER BY e.identity_id, e.seq
    )");
    while (emb.step()) {
        auto it = position.find(emb.column_int64(0));
        if (it != position.end()) {
            out[it->second].embeddings.push_back(emb.column_embedding(1));
        }
    }

    return out;
}

std::optional<Identity> SqliteIdentityStore::get_identity(IdentityId identity_id) {
    std::lock_guard<std::mutex> lock(db_mutex);
    return load_identity(identity_id, true);
}

bool SqliteIdentityStore::identity_status(IdentityId identity_id, IdentityStatus& status) {
    {
        std::shared_lock<std::shared_mutex> lock(status_mutex);
        auto it = status_cache.find(identity_id);
        if (it != status_cache.end()) {
            status = it->second;
            return true;
        }
    }

    // Miss: solo ids que el índice no debería tener
    std::lock_guard<std::mutex> lock(db_mutex);

    Statement stmt(db, "SELECT status FROM identities WHERE id = ?");
    stmt.bind_int(1, identity_id);
    if (!stmt.step()) {
        return false;
    }
    status = identity_status_from_string(stmt.column_text(0));
    cache_status(identity_id, status);
    return true;
}

bool SqliteIdentityStore::deactivate(IdentityId identity_id) {
    std::lock_guard<std::mutex> lock(db_mutex);
    Transaction tx(db);

    Statement stmt(db, R"(
        UPDATE identities SET status = 'suspended', updated_at = ?
        WHERE id = ? AND status = 'active'
    )");
    stmt.bind_int(1, now_ms());
    stmt.bind_int(2, identity_id);
    stmt.run();

    bool changed = sqlite3_changes(db) > 0;
    if (!changed && !load_identity(identity_id, false)) {
        throw NotFoundError("Identity " + std::to_string(identity_id) + " not found");
    }

    tx.commit();

    if (changed) {
        cache_status(identity_id, IdentityStatus::Suspended);
    }
    return changed;
}

size_t SqliteIdentityStore::count_identities(IdentityStatus status) {
    std::lock_guard<std::mutex> lock(db_mutex);

    Statement stmt(db, "SELECT COUNT(*) FROM identities WHERE status = ?");
    stmt.bind_text(1, to_string(status));
    return stmt.step() ? static_cast<size_t>(stmt.column_int64(0)) : 0;
}

// ==================== ATTENDANCE ====================

AttendanceEvent SqliteIdentityStore::insert_attendance(const AttendanceEvent& event) {
    AttendanceEvent stored = event;
    if (stored.timestamp == 0) stored.timestamp = now_ms();
    if (stored.date.empty()) stored.date = utc_date(stored.timestamp);

    Statement stmt(db, R"(
        INSERT INTO attendance (identity_id, timestamp, date, confidence, check_type, location)
        VALUES (?, ?, ?, ?, ?, ?)
    )");
    stmt.bind_int(1, stored.identity_id);
    stmt.bind_int(2, stored.timestamp);
    stmt.bind_text(3, stored.date);
    stmt.bind_double(4, stored.confidence);
    stmt.bind_text(5, to_string(stored.check_type));
    stmt.bind_text(6, stored.location);
    stmt.run();

    stored.id = sqlite3_last_insert_rowid(db);
    return stored;
}

std::optional<AttendanceEvent> SqliteIdentityStore::lookup_attendance(IdentityId identity_id,
                                                                      const std::string& date,
                                                                      CheckType check_type) {
    Statement stmt(db, select_from(ATTENDANCE_COLUMNS, "attendance",
                                   "WHERE identity_id = ? AND date = ? AND check_type = ? "
                                   "ORDER BY id LIMIT 1").c_str());
    stmt.bind_int(1, identity_id);
    stmt.bind_text(2, date);
    stmt.bind_text(3, to_string(check_type));
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_attendance(stmt);
}

AttendanceEvent SqliteIdentityStore::append_attendance(const AttendanceEvent& event) {
    std::lock_guard<std::mutex> lock(db_mutex);
    return insert_attendance(event);
}

AttendanceRecordResult SqliteIdentityStore::record_attendance(const AttendanceEvent& event,
                                                              bool dedupe) {
    std::lock_guard<std::mutex> lock(db_mutex);
    Transaction tx(db);

    AttendanceRecordResult result;

    if (dedupe) {
        std::string date = event.date.empty()
            ? utc_date(event.timestamp ? event.timestamp : now_ms())
            : event.date;
        auto existing = lookup_attendance(event.identity_id, date, event.check_type);
        if (existing) {
            result.event = *existing;
            result.duplicate = true;
            tx.commit();
            return result;
        }
    }

    result.event = insert_attendance(event);
    tx.commit();
    return result;
}

std::optional<AttendanceEvent> SqliteIdentityStore::find_attendance(IdentityId identity_id,
                                                                    const std::string& date,
                                                                    CheckType check_type) {
    std::lock_guard<std::mutex> lock(db_mutex);
    return lookup_attendance(identity_id, date, check_type);
}

std::vector<AttendanceEvent> SqliteIdentityStore::list_attendance(IdentityId identity_id, int limit) {
    std::lock_guard<std::mutex> lock(db_mutex);

    Statement stmt(db, select_from(ATTENDANCE_COLUMNS, "attendance",
                                   "WHERE identity_id = ? ORDER BY timestamp DESC, id DESC LIMIT ?").c_str());
    stmt.bind_int(1, identity_id);
    stmt.bind_int(2, limit > 0 ? limit : -1);

    std::vector<AttendanceEvent> out;
    while (stmt.step()) {
        out.push_back(read_attendance(stmt));
    }
    return out;
}

} // namespace faceattend
