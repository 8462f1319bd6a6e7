// ============= include/attendance_engine.hpp =============
/*
 * AttendanceEngine - fachada del núcleo
 *
 * Arma todos los componentes a partir de EngineConfig:
 *
 *   EmbeddingProvider (externo)
 *        └─ QualityCheckedProvider (opcional) ─ EmbeddingExecutor
 *   IdentityStore (SQLite) ── VectorIndex (HNSW) ── IndexMaintenance
 *   Resolver / EnrollmentManager
 *   AuditSink (SQLite)
 *
 * USO:
 *   AttendanceEngine engine(config, provider);
 *   engine.start();                       // warm start + maintenance loop
 *   auto r = engine.resolve_face(frame, CheckType::In);
 */

#pragma once
#include "core/config.hpp"
#include "database/audit_log.hpp"
#include "database/identity_store.hpp"
#include "database/index_maintenance.hpp"
#include "database/vector_index.hpp"
#include "embedding/embedding_executor.hpp"
#include "embedding/quality_gate.hpp"
#include "enrollment/enrollment_manager.hpp"
#include "recognition/resolver.hpp"
#include <memory>

namespace faceattend {

struct EngineStats {
    size_t active_identities = 0;
    size_t suspended_identities = 0;
    size_t pending_requests = 0;
    size_t index_entries = 0;
    size_t indexed_identities = 0;
    bool index_ready = false;
    bool index_dirty = false;
    uint64_t rebuilds = 0;
    uint64_t audit_failures = 0;
    Resolver::Stats resolutions;
};

class AttendanceEngine {
public:
    AttendanceEngine(const EngineConfig& config, EmbeddingProvider& provider);

    // Store / audit inyectados (tests, backends alternativos)
    AttendanceEngine(const EngineConfig& config,
                     EmbeddingProvider& provider,
                     std::unique_ptr<IdentityStore> store,
                     std::unique_ptr<AuditSink> audit);

    ~AttendanceEngine();

    AttendanceEngine(const AttendanceEngine&) = delete;
    AttendanceEngine& operator=(const AttendanceEngine&) = delete;

    // ===== LIFECYCLE =====

    RebuildStats start();
    void stop();

    // ===== ENROLLMENT =====

    SubmissionReceipt submit_enrollment(const CandidateInfo& candidate,
                                        const std::vector<cv::Mat>& images);
    void begin_review(RequestId request_id);
    ReviewOutcome review_enrollment(RequestId request_id, const ReviewDecision& decision);
    bool deactivate_identity(IdentityId identity_id, const std::string& reason,
                             const std::string& actor = "system");

    // ===== RECOGNITION =====

    Resolution resolve_face(const cv::Mat& image,
                            CheckType check_type,
                            const CancellationToken* token = nullptr,
                            const std::string& location = "");

    // ===== INDEX =====

    RebuildStats rebuild_index();
    EngineStats stats();

    IdentityStore& store() { return *identity_store; }
    VectorIndex& index() { return *vector_index; }
    IndexMaintenance& index_maintenance() { return *maintenance; }
    const EngineConfig& settings() const { return config; }

private:
    EngineConfig config;

    std::unique_ptr<QualityCheckedProvider> quality_gate;
    std::unique_ptr<IdentityStore> identity_store;
    std::unique_ptr<AuditSink> audit_sink;
    std::unique_ptr<EmbeddingExecutor> executor;
    std::unique_ptr<VectorIndex> vector_index;
    std::unique_ptr<IndexMaintenance> maintenance;
    std::unique_ptr<Resolver> resolver;
    std::unique_ptr<EnrollmentManager> enrollment;

    void wire(EmbeddingProvider& provider);
};

} // namespace faceattend
