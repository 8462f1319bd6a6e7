// ============= include/database/identity_store.hpp =============
/*
 * Identity Store - fuente de verdad de identidades y solicitudes
 *
 * TRANSICIONES (compare-and-set, una sola gana):
 *   submitted -> under_review -> approved | rejected
 *   identity: active -> suspended
 *
 * El índice vectorial se reconstruye siempre desde list_active().
 */

#pragma once
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace faceattend {

struct PromoteResult {
    Identity identity;
    bool newly_promoted = false;
    IdentityId superseded_id = -1;     // identidad anterior con el mismo external_id
};

struct AttendanceRecordResult {
    AttendanceEvent event;
    bool duplicate = false;            // ya existía una marca para (identidad, día, tipo)
};

class IdentityStore {
public:
    virtual ~IdentityStore() = default;

    // ===== ENROLLMENT REQUESTS =====

    virtual EnrollmentRequest create_pending(const CandidateInfo& candidate) = 0;
    virtual void attach_embedding(RequestId request_id, const Embedding& embedding,
                                  float quality_score) = 0;
    virtual void begin_review(RequestId request_id) = 0;

    virtual PromoteResult promote(RequestId request_id, const std::string& reviewer) = 0;
    virtual RejectionRecord reject(RequestId request_id, const std::string& reason,
                                   const std::string& reviewer) = 0;

    virtual std::optional<EnrollmentRequest> get_request(RequestId request_id) = 0;
    virtual std::vector<EnrollmentRequest> list_requests(RequestStatus status) = 0;
    virtual bool has_pending_request(const std::string& external_id) = 0;

    // ===== IDENTITIES =====

    virtual std::vector<Identity> list_active() = 0;
    virtual std::optional<Identity> get_identity(IdentityId identity_id) = 0;

    // false si la identidad no existe
    virtual bool identity_status(IdentityId identity_id, IdentityStatus& status) = 0;

    virtual bool deactivate(IdentityId identity_id) = 0;
    virtual size_t count_identities(IdentityStatus status) = 0;

    // ===== ATTENDANCE =====

    virtual AttendanceEvent append_attendance(const AttendanceEvent& event) = 0;
    virtual AttendanceRecordResult record_attendance(const AttendanceEvent& event, bool dedupe) = 0;
    virtual std::optional<AttendanceEvent> find_attendance(IdentityId identity_id,
                                                           const std::string& date,
                                                           CheckType check_type) = 0;
    virtual std::vector<AttendanceEvent> list_attendance(IdentityId identity_id, int limit) = 0;
};

} // namespace faceattend
