// ============= include/core/types.hpp =============
/*
 * Tipos compartidos del motor de asistencia
 *
 * MODELO:
 * - Identity: persona enrolada (1..N embeddings, status)
 * - EnrollmentRequest: solicitud pendiente de revisión
 * - AttendanceEvent: marca de asistencia (append-only)
 *
 * Los embeddings son inmutables una vez aceptados.
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace faceattend {

using Embedding = std::vector<float>;
using IdentityId = int64_t;
using RequestId = int64_t;

// ==================== STATUS ====================

enum class IdentityStatus {
    Pending,
    Active,
    Rejected,
    Suspended
};

enum class RequestStatus {
    Submitted,
    UnderReview,
    Approved,
    Rejected
};

enum class CheckType {
    In,
    Out
};

const char* to_string(IdentityStatus status);
const char* to_string(RequestStatus status);
const char* to_string(CheckType type);

// Throw ValidationError on unknown text
IdentityStatus identity_status_from_string(const std::string& text);
RequestStatus request_status_from_string(const std::string& text);
CheckType check_type_from_string(const std::string& text);

inline bool is_terminal(RequestStatus status) {
    return status == RequestStatus::Approved || status == RequestStatus::Rejected;
}

// ==================== RECORDS ====================

struct CandidateInfo {
    std::string name;
    std::string external_id;           // employee id / matrícula
    std::string email;
    std::string department;
    std::string designation;
    std::string phone;
};

struct ImageReport {
    int image_index = 0;               // 1-based, como en el formulario
    bool accepted = false;
    std::string reason;                // vacío si se aceptó
    float quality_score = -1.0f;
};

struct EnrollmentRequest {
    RequestId id = -1;
    CandidateInfo candidate;
    RequestStatus status = RequestStatus::Submitted;

    std::vector<Embedding> embeddings; // solo hasta la aprobación
    int embedding_count = 0;

    int64_t submitted_at = 0;          // epoch ms
    int64_t processed_at = 0;
    std::string processed_by;
    std::string rejection_reason;
    IdentityId identity_id = -1;       // set al aprobar
};

struct Identity {
    IdentityId id = -1;
    RequestId request_id = -1;
    std::string name;
    std::string external_id;
    std::string department;
    std::string designation;
    IdentityStatus status = IdentityStatus::Pending;
    std::vector<Embedding> embeddings;
    int64_t created_at = 0;
    int64_t updated_at = 0;
};

struct RejectionRecord {
    RequestId request_id = -1;
    std::string reason;
    std::string reviewer;
    int64_t processed_at = 0;
};

struct AttendanceEvent {
    int64_t id = -1;
    IdentityId identity_id = -1;
    int64_t timestamp = 0;             // epoch ms
    std::string date;                  // YYYY-MM-DD (UTC)
    float confidence = 0.0f;
    CheckType check_type = CheckType::In;
    std::string location;
};

// ==================== TIME ====================

int64_t now_ms();
std::string utc_date(int64_t epoch_ms);
std::string format_timestamp(int64_t epoch_ms);

} // namespace faceattend
