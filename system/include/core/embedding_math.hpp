// ============= include/core/embedding_math.hpp =============
/*
 * Operaciones sobre embeddings
 *
 * MÉTRICA ÚNICA: cosine distance sobre vectores L2-normalizados
 *   similarity = dot(a, b)        (clamp [-1, 1])
 *   distance   = 1 - similarity
 *
 * Índice, resolver y store usan estas funciones. No mezclar con L2.
 */

#pragma once
#include "core/types.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace faceattend {

inline void l2_normalize(Embedding& embedding) {
    float norm = 0.0f;
    for (float val : embedding) {
        norm += val * val;
    }
    norm = std::sqrt(norm);

    if (norm > 0) {
        for (float& val : embedding) {
            val /= norm;
        }
    }
}

inline Embedding l2_normalized(Embedding embedding) {
    l2_normalize(embedding);
    return embedding;
}

// Assumes normalized embeddings of equal size
inline float cosine_similarity(const Embedding& a, const Embedding& b) {
    float dot = 0.0f;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += a[i] * b[i];
    }
    return std::max(-1.0f, std::min(1.0f, dot));
}

inline float cosine_distance(const Embedding& a, const Embedding& b) {
    return 1.0f - cosine_similarity(a, b);
}

inline bool is_finite(const Embedding& embedding) {
    return std::all_of(embedding.begin(), embedding.end(),
                       [](float v) { return std::isfinite(v); });
}

// Mean of the samples, re-normalized. Empty input -> empty vector.
inline Embedding centroid(const std::vector<Embedding>& samples) {
    if (samples.empty()) return {};

    Embedding mean(samples.front().size(), 0.0f);
    for (const auto& s : samples) {
        for (size_t i = 0; i < mean.size() && i < s.size(); ++i) {
            mean[i] += s[i];
        }
    }
    for (float& v : mean) {
        v /= static_cast<float>(samples.size());
    }

    l2_normalize(mean);
    return mean;
}

} // namespace faceattend
