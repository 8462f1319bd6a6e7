// ============= include/enrollment/enrollment_manager.hpp =============
/*
 * Enrollment Lifecycle Manager
 *
 * ESTADOS:
 *   submitted -> under_review -> approved | rejected
 *
 * - Único componente que escribe identidades
 * - Aprobación: promote en el store + insert inmediato en el índice
 *   (si el insert falla el índice queda dirty)
 * - Ningún embedding de una solicitud entra al índice antes de "approved"
 * - Cada transición queda en el audit log
 */

#pragma once
#include "core/config.hpp"
#include "core/types.hpp"
#include "database/audit_log.hpp"
#include "database/identity_store.hpp"
#include "database/index_maintenance.hpp"
#include "embedding/embedding_executor.hpp"
#include "enrollment/identity_lifecycle.hpp"
#include <optional>
#include <string>
#include <vector>

namespace faceattend {

struct SubmissionReceipt {
    RequestId request_id = -1;
    RequestStatus status = RequestStatus::Submitted;
    std::vector<ImageReport> reports;
    int accepted_count = 0;
};

enum class ReviewAction {
    Approve,
    Reject
};

struct ReviewDecision {
    ReviewAction action = ReviewAction::Approve;
    std::string reason;
    std::string reviewer;

    static ReviewDecision approve(const std::string& reviewer) {
        return {ReviewAction::Approve, "", reviewer};
    }
    static ReviewDecision reject(const std::string& reason, const std::string& reviewer) {
        return {ReviewAction::Reject, reason, reviewer};
    }
};

struct ReviewOutcome {
    ReviewAction action = ReviewAction::Approve;
    std::optional<Identity> identity;          // approve
    std::optional<RejectionRecord> rejection;  // reject
    bool newly_promoted = false;
    bool indexed = false;
    IdentityId superseded_id = -1;
};

class EnrollmentManager {
public:
    EnrollmentManager(IdentityStore& store,
                      EmbeddingExecutor& executor,
                      IndexMaintenance& maintenance,
                      AuditSink& audit,
                      const EnrollmentConfig& config);

    // Throws ValidationError (nada queda creado)
    SubmissionReceipt submit_enrollment(const CandidateInfo& candidate,
                                        const std::vector<cv::Mat>& images,
                                        const CancellationToken* token = nullptr);

    void begin_review(RequestId request_id);

    // AlreadyFinalizedError se propaga sin reintentos
    ReviewOutcome review_enrollment(RequestId request_id, const ReviewDecision& decision);

    bool deactivate_identity(IdentityId identity_id,
                             const std::string& reason,
                             const std::string& actor = "system");

    const EnrollmentConfig& settings() const { return config; }

private:
    IdentityStore& store;
    EmbeddingExecutor& executor;
    IndexMaintenance& maintenance;
    AuditSink& audit;
    EnrollmentConfig config;
    IdentityLifecycle lifecycle;

    void validate_submission(const CandidateInfo& candidate, size_t image_count);
    ReviewOutcome approve(RequestId request_id, const ReviewDecision& decision);
    ReviewOutcome reject(RequestId request_id, const ReviewDecision& decision);
    void audit_event(const std::string& action, const std::string& kind, int64_t subject_id,
                     const std::string& actor, const std::string& details);
};

} // namespace faceattend
