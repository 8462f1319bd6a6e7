// ============= include/recognition/resolver.hpp =============
/*
 * Resolver - imagen capturada -> identidad (o ninguna)
 *
 * PIPELINE:
 * 1. embedding (executor, timeout + cancelación)
 * 2. top-k en el índice
 * 3. filtrar candidatos no activos en el store
 * 4. threshold + guard de ambigüedad
 * 5. marca de asistencia (dedupe por día / tipo)
 *
 * IndexUnavailableError se propaga: no es un "no match".
 */

#pragma once
#include "core/config.hpp"
#include "core/types.hpp"
#include "database/audit_log.hpp"
#include "database/identity_store.hpp"
#include "database/vector_index.hpp"
#include "embedding/embedding_executor.hpp"
#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace faceattend {

enum class ResolutionKind {
    Match,
    NoMatch,
    EmbeddingFailure
};

const char* to_string(ResolutionKind kind);

struct Resolution {
    ResolutionKind kind = ResolutionKind::NoMatch;
    IdentityId identity_id = -1;
    float confidence = 0.0f;           // mejor similarity activa (0 si no hubo)
    EmbeddingFailure failure = EmbeddingFailure::None;
    std::string reason;                // "below_threshold", "ambiguous", "no_candidates", ...

    std::optional<AttendanceEvent> event;
    bool duplicate_event = false;

    std::vector<SearchResult> candidates;  // candidatos activos, en orden
    int64_t elapsed_us = 0;

    bool matched() const { return kind == ResolutionKind::Match; }
};

class Resolver {
public:
    using InconsistencyHandler = std::function<void(IdentityId)>;

    Resolver(EmbeddingExecutor& executor,
             VectorIndex& index,
             IdentityStore& store,
             AuditSink& audit,
             const RecognitionConfig& config);

    Resolution resolve(const cv::Mat& image,
                       CheckType check_type,
                       const CancellationToken* token = nullptr,
                       const std::string& location = "");

    // Mismo pipeline a partir del paso 2
    Resolution resolve_embedding(const Embedding& query,
                                 CheckType check_type,
                                 const CancellationToken* token = nullptr,
                                 const std::string& location = "");

    // Llamado cuando el índice referencia una identidad que el store no conoce
    void on_inconsistency(InconsistencyHandler handler) { inconsistency_handler = std::move(handler); }

    struct Stats {
        uint64_t total = 0;
        uint64_t matches = 0;
        uint64_t no_matches = 0;
        uint64_t failures = 0;
    };
    Stats stats() const;

    const RecognitionConfig& settings() const { return config; }

private:
    EmbeddingExecutor& executor;
    VectorIndex& index;
    IdentityStore& store;
    AuditSink& audit;
    RecognitionConfig config;
    InconsistencyHandler inconsistency_handler;

    std::atomic<uint64_t> total_count{0};
    std::atomic<uint64_t> match_count{0};
    std::atomic<uint64_t> no_match_count{0};
    std::atomic<uint64_t> failure_count{0};

    Resolution decide(const Embedding& query, CheckType check_type,
                      const CancellationToken* token, const std::string& location);
    std::vector<SearchResult> active_candidates(const std::vector<SearchResult>& found);
    void report_inconsistency(IdentityId identity_id);
    void record_decision(const Resolution& resolution, CheckType check_type);
};

} // namespace faceattend
