// ============= include/database/sqlite_identity_store.hpp =============
/*
 * Identity Store - SQLite Backend
 *
 * SCHEMA:
 *   enrollment_requests   (candidato + status + revisión)
 *   request_embeddings    (embeddings hasta la aprobación, BLOB float32)
 *   identities            (una fila por aprobación, status)
 *   identity_embeddings   (copiados al aprobar, inmutables)
 *   attendance            (append-only)
 *
 * CONCURRENCIA:
 * - Una conexión protegida por db_mutex
 * - Transiciones: UPDATE ... WHERE status IN (...) + sqlite3_changes()
 * - identity_status() se responde desde un cache en memoria (shared_mutex),
 *   sin pasar por db_mutex; se actualiza después de cada commit
 *
 * db_path ":memory:" para tests.
 */

#pragma once
#include "database/identity_store.hpp"
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

struct sqlite3;

namespace faceattend {

class SqliteIdentityStore : public IdentityStore {
public:
    SqliteIdentityStore(const std::string& db_path, int embedding_dim, int min_images);
    ~SqliteIdentityStore() override;

    SqliteIdentityStore(const SqliteIdentityStore&) = delete;
    SqliteIdentityStore& operator=(const SqliteIdentityStore&) = delete;

    // ===== ENROLLMENT REQUESTS =====

    EnrollmentRequest create_pending(const CandidateInfo& candidate) override;
    void attach_embedding(RequestId request_id, const Embedding& embedding,
                          float quality_score) override;
    void begin_review(RequestId request_id) override;

    PromoteResult promote(RequestId request_id, const std::string& reviewer) override;
    RejectionRecord reject(RequestId request_id, const std::string& reason,
                           const std::string& reviewer) override;

    std::optional<EnrollmentRequest> get_request(RequestId request_id) override;
    std::vector<EnrollmentRequest> list_requests(RequestStatus status) override;
    bool has_pending_request(const std::string& external_id) override;

    // ===== IDENTITIES =====

    std::vector<Identity> list_active() override;
    std::optional<Identity> get_identity(IdentityId identity_id) override;
    bool identity_status(IdentityId identity_id, IdentityStatus& status) override;
    bool deactivate(IdentityId identity_id) override;
    size_t count_identities(IdentityStatus status) override;

    // ===== ATTENDANCE =====

    AttendanceEvent append_attendance(const AttendanceEvent& event) override;
    AttendanceRecordResult record_attendance(const AttendanceEvent& event, bool dedupe) override;
    std::optional<AttendanceEvent> find_attendance(IdentityId identity_id,
                                                   const std::string& date,
                                                   CheckType check_type) override;
    std::vector<AttendanceEvent> list_attendance(IdentityId identity_id, int limit) override;

    const std::string& path() const { return db_path; }

private:
    sqlite3* db = nullptr;
    std::string db_path;
    int embedding_dim;
    int min_images;
    std::mutex db_mutex;

    mutable std::shared_mutex status_mutex;
    std::unordered_map<IdentityId, IdentityStatus> status_cache;

    void create_tables();
    void load_status_cache();
    void cache_status(IdentityId identity_id, IdentityStatus status);

    // Requieren db_mutex tomado
    std::optional<EnrollmentRequest> load_request(RequestId request_id, bool with_embeddings);
    std::optional<Identity> load_identity(IdentityId identity_id, bool with_embeddings);
    std::vector<Embedding> load_identity_embeddings(IdentityId identity_id);
    std::optional<AttendanceEvent> lookup_attendance(IdentityId identity_id,
                                                     const std::string& date,
                                                     CheckType check_type);
    AttendanceEvent insert_attendance(const AttendanceEvent& event);
};

} // namespace faceattend
