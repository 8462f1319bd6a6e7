// ============= src/enrollment/enrollment_manager.cpp =============
#include "enrollment/enrollment_manager.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

namespace faceattend {

namespace {

std::string trimmed(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return start < end ? std::string(start, end) : std::string();
}

} // namespace

EnrollmentManager::EnrollmentManager(IdentityStore& store,
                                     EmbeddingExecutor& executor,
                                     IndexMaintenance& maintenance,
                                     AuditSink& audit,
                                     const EnrollmentConfig& config)
    : store(store), executor(executor), maintenance(maintenance), audit(audit), config(config),
      lifecycle(store, maintenance, audit)
{
    spdlog::info("📋 Enrollment manager: {}..{} imágenes por solicitud",
                 config.min_images, config.max_images);
}

void EnrollmentManager::audit_event(const std::string& action, const std::string& kind,
                                    int64_t subject_id, const std::string& actor,
                                    const std::string& details) {
    AuditRecord entry;
    entry.action = action;
    entry.subject_kind = kind;
    entry.subject_id = subject_id;
    entry.actor = actor.empty() ? "system" : actor;
    entry.details = details;
    audit.record(entry);
}

// ==================== SUBMIT ====================

void EnrollmentManager::validate_submission(const CandidateInfo& candidate, size_t image_count) {
    std::vector<std::string> errors;

    if (trimmed(candidate.name).empty()) {
        errors.push_back("Name is required");
    }
    if (image_count < static_cast<size_t>(config.min_images)) {
        errors.push_back(fmt::format("Please upload at least {} images (got {})",
                                     config.min_images, image_count));
    }
    if (image_count > static_cast<size_t>(config.max_images)) {
        errors.push_back(fmt::format("Maximum {} images allowed (got {})",
                                     config.max_images, image_count));
    }

    if (!errors.empty()) {
        throw ValidationError(errors.front(), errors);
    }

    if (store.has_pending_request(candidate.external_id)) {
        throw ValidationError("A pending enrollment request already exists for " +
                              candidate.external_id);
    }
}

SubmissionReceipt EnrollmentManager::submit_enrollment(const CandidateInfo& candidate,
                                                       const std::vector<cv::Mat>& images,
                                                       const CancellationToken* token) {
    validate_submission(candidate, images.size());

    spdlog::info("📥 Enrollment: {} ({} imágenes)", candidate.name, images.size());

    auto results = executor.embed_batch(images, token);

    SubmissionReceipt receipt;
    std::vector<std::string> problems;

    for (size_t i = 0; i < results.size(); ++i) {
        ImageReport report;
        report.image_index = static_cast<int>(i) + 1;
        report.accepted = results[i].ok();
        report.quality_score = results[i].quality_score;
        if (!report.accepted) {
            report.reason = to_string(results[i].failure);
            problems.push_back(fmt::format("Image {}: {}", report.image_index, report.reason));
        } else {
            receipt.accepted_count++;
        }
        receipt.reports.push_back(report);
    }

    if (receipt.accepted_count < config.min_images) {
        spdlog::warn("Enrollment de {} rechazado: {} de {} imágenes válidas",
                     candidate.name, receipt.accepted_count, images.size());
        throw ValidationError(fmt::format("Only {} valid face images, at least {} required",
                                          receipt.accepted_count, config.min_images),
                              problems);
    }

    EnrollmentRequest request = store.create_pending(candidate);
    receipt.request_id = request.id;
    receipt.status = request.status;

    try {
        for (size_t i = 0; i < results.size(); ++i) {
            if (results[i].ok()) {
                store.attach_embedding(request.id, results[i].embedding, results[i].quality_score);
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("❌ Enrollment {} incompleto: {}", request.id, e.what());
        store.reject(request.id, "incomplete submission", "system");
        throw;
    }

    audit_event("enrollment.submitted", "request", request.id, candidate.email,
                fmt::format("name={} external_id={} accepted={}/{}", candidate.name,
                            candidate.external_id, receipt.accepted_count, images.size()));

    spdlog::info("✓ Solicitud {} creada ({} embeddings)", request.id, receipt.accepted_count);
    return receipt;
}

// ==================== REVIEW ====================

void EnrollmentManager::begin_review(RequestId request_id) {
    store.begin_review(request_id);
    audit_event("enrollment.under_review", "request", request_id, "", "");
}

ReviewOutcome EnrollmentManager::review_enrollment(RequestId request_id, const ReviewDecision& decision) {
    try {
        return decision.action == ReviewAction::Approve
            ? approve(request_id, decision)
            : reject(request_id, decision);
    } catch (const AlreadyFinalizedError& e) {
        spdlog::warn("Revisión de solicitud {} descartada: {}", request_id, e.what());
        audit_event("enrollment.review_conflict", "request", request_id, decision.reviewer, e.what());
        throw;
    }
}

ReviewOutcome EnrollmentManager::approve(RequestId request_id, const ReviewDecision& decision) {
    PromoteResult promoted = store.promote(request_id, decision.reviewer);

    ReviewOutcome outcome;
    outcome.action = ReviewAction::Approve;
    outcome.newly_promoted = promoted.newly_promoted;
    outcome.superseded_id = promoted.superseded_id;

    if (!promoted.newly_promoted) {
        spdlog::info("Solicitud {} ya aprobada (identity {})", request_id, promoted.identity.id);
        outcome.identity = std::move(promoted.identity);
        return outcome;
    }

    if (promoted.superseded_id >= 0) {
        maintenance.remove_identity(promoted.superseded_id);
        audit_event("identity.superseded", "identity", promoted.superseded_id, decision.reviewer,
                    fmt::format("replaced by request {}", request_id));
    }

    outcome.indexed = maintenance.insert_identity(promoted.identity);

    audit_event("enrollment.approved", "request", request_id, decision.reviewer,
                fmt::format("identity={} embeddings={} indexed={}", promoted.identity.id,
                            promoted.identity.embeddings.size(), outcome.indexed));

    spdlog::info("✅ Solicitud {} aprobada por {} -> identity {} ({})",
                 request_id, decision.reviewer, promoted.identity.id, promoted.identity.name);

    outcome.identity = std::move(promoted.identity);
    return outcome;
}

ReviewOutcome EnrollmentManager::reject(RequestId request_id, const ReviewDecision& decision) {
    RejectionRecord record = store.reject(request_id, decision.reason, decision.reviewer);

    audit_event("enrollment.rejected", "request", request_id, decision.reviewer,
                decision.reason.empty() ? "-" : decision.reason);
    spdlog::info("❌ Solicitud {} rechazada por {}: {}", request_id, decision.reviewer,
                 decision.reason.empty() ? "-" : decision.reason);

    ReviewOutcome outcome;
    outcome.action = ReviewAction::Reject;
    outcome.rejection = record;
    return outcome;
}

// ==================== DEACTIVATE ====================

bool EnrollmentManager::deactivate_identity(IdentityId identity_id,
                                            const std::string& reason,
                                            const std::string& actor) {
    return lifecycle.deactivate_identity(identity_id, reason, actor);
}

} // namespace faceattend
