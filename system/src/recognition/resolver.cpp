// ============= src/recognition/resolver.cpp =============
#include "recognition/resolver.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <chrono>
#include <string>
#include <vector>

namespace faceattend {

const char* to_string(ResolutionKind kind) {
    switch (kind) {
        case ResolutionKind::Match:            return "match";
        case ResolutionKind::NoMatch:          return "no_match";
        case ResolutionKind::EmbeddingFailure: return "embedding_failure";
    }
    return "unknown";
}

Resolver::Resolver(EmbeddingExecutor& executor,
                   VectorIndex& index,
                   IdentityStore& store,
                   AuditSink& audit,
                   const RecognitionConfig& config)
    : executor(executor), index(index), store(store), audit(audit), config(config)
{
    spdlog::info("🎯 Resolver: threshold {:.2f} | top_k {} | ambiguity margin {:.3f}",
                 config.threshold, config.top_k, config.ambiguity_margin);
}

// ==================== RESOLVE ====================

Resolution Resolver::resolve(const cv::Mat& image,
                             CheckType check_type,
                             const CancellationToken* token,
                             const std::string& location) {
    auto t0 = std::chrono::steady_clock::now();

    EmbeddingResult embedded = executor.embed(image, token, TaskPriority::High);

    // Cancelado durante el embedding: no se toca nada
    if (embedded.ok() && token && token->is_cancelled()) {
        embedded = EmbeddingResult::fail(EmbeddingFailure::Cancelled);
    }

    if (!embedded.ok()) {
        Resolution r;
        r.kind = ResolutionKind::EmbeddingFailure;
        r.failure = embedded.failure;
        r.reason = to_string(embedded.failure);
        r.elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - t0).count();

        total_count++;
        failure_count++;
        spdlog::debug("Resolve: embedding failure ({})", r.reason);
        record_decision(r, check_type);
        return r;
    }

    Resolution r = decide(embedded.embedding, check_type, token, location);
    r.elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - t0).count();
    return r;
}

Resolution Resolver::resolve_embedding(const Embedding& query,
                                       CheckType check_type,
                                       const CancellationToken* token,
                                       const std::string& location) {
    auto t0 = std::chrono::steady_clock::now();

    if (static_cast<int>(query.size()) != executor.dimension()) {
        throw ValidationError("Query embedding has " + std::to_string(query.size()) +
                              " values, expected " + std::to_string(executor.dimension()));
    }

    Resolution r = decide(query, check_type, token, location);
    r.elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - t0).count();
    return r;
}

// ==================== DECISION POLICY ====================

std::vector<SearchResult> Resolver::active_candidates(const std::vector<SearchResult>& found) {
    std::vector<SearchResult> active;
    for (const auto& candidate : found) {
        IdentityStatus status;
        if (!store.identity_status(candidate.identity_id, status)) {
            report_inconsistency(candidate.identity_id);
            continue;
        }
        if (status != IdentityStatus::Active) {
            spdlog::debug("Candidato {} ignorado (status {})", candidate.identity_id, to_string(status));
            continue;
        }
        active.push_back(candidate);
    }
    return active;
}

Resolution Resolver::decide(const Embedding& query,
                            CheckType check_type,
                            const CancellationToken* token,
                            const std::string& location) {
    total_count++;

    auto found = index.search(query, config.top_k);

    Resolution r;
    r.candidates = active_candidates(found);

    if (r.candidates.empty()) {
        r.kind = ResolutionKind::NoMatch;
        r.reason = "no_candidates";
    } else {
        const SearchResult& best = r.candidates.front();
        r.confidence = best.similarity;

        if (best.similarity < config.threshold) {
            r.kind = ResolutionKind::NoMatch;
            r.reason = "below_threshold";
        } else if (r.candidates.size() > 1 &&
                   best.similarity - r.candidates[1].similarity < config.ambiguity_margin) {
            r.kind = ResolutionKind::NoMatch;
            r.reason = "ambiguous";
        } else {
            r.kind = ResolutionKind::Match;
            r.identity_id = best.identity_id;
        }
    }

    // Último punto de cancelación antes de escribir
    if (token && token->is_cancelled()) {
        Resolution cancelled;
        cancelled.kind = ResolutionKind::EmbeddingFailure;
        cancelled.failure = EmbeddingFailure::Cancelled;
        cancelled.reason = to_string(EmbeddingFailure::Cancelled);
        cancelled.confidence = r.confidence;
        failure_count++;
        record_decision(cancelled, check_type);
        return cancelled;
    }

    if (r.matched()) {
        AttendanceEvent event;
        event.identity_id = r.identity_id;
        event.timestamp = now_ms();
        event.date = utc_date(event.timestamp);
        event.confidence = r.confidence;
        event.check_type = check_type;
        event.location = location;

        auto recorded = store.record_attendance(event, config.dedupe_per_day);
        r.event = recorded.event;
        r.duplicate_event = recorded.duplicate;

        match_count++;
        spdlog::info("✓ Match: identity {} ({:.3f}) check-{}{}",
                     r.identity_id, r.confidence, to_string(check_type),
                     recorded.duplicate ? " [ya marcado hoy]" : "");
    } else {
        no_match_count++;
        if (r.candidates.empty()) {
            spdlog::debug("No match: {}", r.reason);
        } else {
            spdlog::debug("No match: {} (best identity {} {:.3f})",
                          r.reason, r.candidates.front().identity_id, r.confidence);
        }
    }

    record_decision(r, check_type);
    return r;
}

// ==================== INCONSISTENCY ====================

void Resolver::report_inconsistency(IdentityId identity_id) {
    InconsistentStateError error("Index references identity " + std::to_string(identity_id) +
                                 " which does not exist in the store");
    spdlog::critical("❌ {}", error.what());

    AuditRecord entry;
    entry.action = "index.inconsistent";
    entry.subject_kind = "identity";
    entry.subject_id = identity_id;
    entry.details = error.what();
    audit.record(entry);

    if (inconsistency_handler) {
        inconsistency_handler(identity_id);
    }
}

// ==================== AUDIT ====================

void Resolver::record_decision(const Resolution& resolution, CheckType check_type) {
    AuditRecord entry;
    entry.action = std::string("resolve.") + to_string(resolution.kind);
    entry.subject_kind = "identity";
    entry.subject_id = resolution.identity_id;
    entry.score = resolution.confidence;

    // Sin match: el sujeto es el mejor candidato (si lo hubo)
    if (entry.subject_id < 0 && !resolution.candidates.empty()) {
        entry.subject_id = resolution.candidates.front().identity_id;
    }

    std::string details = fmt::format("check={} reason={} candidates={}",
                                      to_string(check_type),
                                      resolution.reason.empty() ? "-" : resolution.reason,
                                      resolution.candidates.size());
    if (!resolution.candidates.empty()) {
        std::vector<std::string> scored;
        for (const auto& c : resolution.candidates) {
            scored.push_back(fmt::format("{}:{:.3f}", c.identity_id, c.similarity));
        }
        details += fmt::format(" cands={}", fmt::join(scored, ","));
    }
    if (resolution.event) {
        details += fmt::format(" event={}{}", resolution.event->id,
                               resolution.duplicate_event ? " (duplicate)" : "");
    }
    entry.details = details;
    audit.record(entry);
}

Resolver::Stats Resolver::stats() const {
    Stats s;
    s.total = total_count.load();
    s.matches = match_count.load();
    s.no_matches = no_match_count.load();
    s.failures = failure_count.load();
    return s;
}

} // namespace faceattend
