// ============= src/attendance_engine.cpp =============
#include "attendance_engine.hpp"
#include "core/errors.hpp"
#include "database/sqlite_identity_store.hpp"
#include <spdlog/spdlog.h>

namespace faceattend {

AttendanceEngine::AttendanceEngine(const EngineConfig& config, EmbeddingProvider& provider)
    : AttendanceEngine(config, provider,
                       std::make_unique<SqliteIdentityStore>(config.storage.db_path,
                                                             config.embedding.dimension,
                                                             config.enrollment.min_images),
                       std::make_unique<SqliteAuditLog>(config.storage.audit_path))
{
}

AttendanceEngine::AttendanceEngine(const EngineConfig& config,
                                   EmbeddingProvider& provider,
                                   std::unique_ptr<IdentityStore> store,
                                   std::unique_ptr<AuditSink> audit)
    : config(config), identity_store(std::move(store)), audit_sink(std::move(audit))
{
    config.validate();

    if (!identity_store || !audit_sink) {
        throw ValidationError("AttendanceEngine requires a store and an audit sink");
    }

    spdlog::info("========================================");
    spdlog::info("  FaceAttend engine");
    spdlog::info("========================================");

    wire(provider);

    spdlog::info("✓ Engine listo");
}

AttendanceEngine::~AttendanceEngine() {
    stop();
}

void AttendanceEngine::wire(EmbeddingProvider& provider) {
    EmbeddingProvider* effective = &provider;
    if (config.quality.enabled) {
        quality_gate = std::make_unique<QualityCheckedProvider>(provider, config.quality.threshold);
        effective = quality_gate.get();
    }

    executor = std::make_unique<EmbeddingExecutor>(*effective, config.embedding);
    vector_index = std::make_unique<VectorIndex>(config.index);
    maintenance = std::make_unique<IndexMaintenance>(*vector_index, *identity_store,
                                                     *audit_sink, config.index);
    resolver = std::make_unique<Resolver>(*executor, *vector_index, *identity_store,
                                          *audit_sink, config.recognition);
    enrollment = std::make_unique<EnrollmentManager>(*identity_store, *executor, *maintenance,
                                                     *audit_sink, config.enrollment);

    IndexMaintenance* m = maintenance.get();
    resolver->on_inconsistency([m](IdentityId identity_id) {
        m->request_rebuild("index references unknown identity " + std::to_string(identity_id));
    });
}

// ==================== LIFECYCLE ====================

RebuildStats AttendanceEngine::start() {
    RebuildStats stats = maintenance->warm_start();
    maintenance->start();
    return stats;
}

void AttendanceEngine::stop() {
    if (maintenance) {
        maintenance->stop();
    }
}

// ==================== ENROLLMENT ====================

SubmissionReceipt AttendanceEngine::submit_enrollment(const CandidateInfo& candidate,
                                                      const std::vector<cv::Mat>& images) {
    return enrollment->submit_enrollment(candidate, images);
}

void AttendanceEngine::begin_review(RequestId request_id) {
    enrollment->begin_review(request_id);
}

ReviewOutcome AttendanceEngine::review_enrollment(RequestId request_id, const ReviewDecision& decision) {
    return enrollment->review_enrollment(request_id, decision);
}

bool AttendanceEngine::deactivate_identity(IdentityId identity_id, const std::string& reason,
                                           const std::string& actor) {
    return enrollment->deactivate_identity(identity_id, reason, actor);
}

// ==================== RECOGNITION ====================

Resolution AttendanceEngine::resolve_face(const cv::Mat& image,
                                          CheckType check_type,
                                          const CancellationToken* token,
                                          const std::string& location) {
    return resolver->resolve(image, check_type, token, location);
}

// ==================== INDEX ====================

RebuildStats AttendanceEngine::rebuild_index() {
    return maintenance->rebuild("requested");
}

EngineStats AttendanceEngine::stats() {
    EngineStats s;
    s.active_identities = identity_store->count_identities(IdentityStatus::Active);
    s.suspended_identities = identity_store->count_identities(IdentityStatus::Suspended);
    s.pending_requests = identity_store->list_requests(RequestStatus::Submitted).size() +
                         identity_store->list_requests(RequestStatus::UnderReview).size();
    s.index_entries = vector_index->size();
    s.indexed_identities = vector_index->identity_count();
    s.index_ready = vector_index->is_ready();
    s.index_dirty = maintenance->is_dirty();
    s.rebuilds = maintenance->rebuild_count();
    s.audit_failures = audit_sink->failed_writes();
    s.resolutions = resolver->stats();
    return s;
}

} // namespace faceattend
