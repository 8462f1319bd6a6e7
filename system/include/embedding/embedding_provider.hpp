// ============= include/embedding/embedding_provider.hpp =============
/*
 * Embedding Provider - contrato del extractor de features
 *
 * embed(image) -> vector de D floats, o un fallo tipado.
 * Los fallos son terminales para esa imagen: el llamador debe
 * enviar otra imagen, nunca se continúa con un vector degradado.
 *
 * El modelo neuronal vive fuera de este repositorio.
 */

#pragma once
#include "core/types.hpp"
#include <opencv2/core.hpp>
#include <atomic>
#include <utility>

namespace faceattend {

enum class EmbeddingFailure {
    None,
    NoFaceDetected,
    LowQuality,
    MultipleFacesDetected,
    Timeout,
    Cancelled
};

const char* to_string(EmbeddingFailure failure);

struct EmbeddingResult {
    EmbeddingFailure failure = EmbeddingFailure::None;
    Embedding embedding;
    float quality_score = -1.0f;       // -1 = no evaluado

    bool ok() const { return failure == EmbeddingFailure::None; }

    static EmbeddingResult success(Embedding embedding, float quality = -1.0f) {
        EmbeddingResult r;
        r.embedding = std::move(embedding);
        r.quality_score = quality;
        return r;
    }

    static EmbeddingResult fail(EmbeddingFailure failure, float quality = -1.0f) {
        EmbeddingResult r;
        r.failure = failure;
        r.quality_score = quality;
        return r;
    }
};

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual EmbeddingResult embed(const cv::Mat& image) = 0;
    virtual int dimension() const = 0;
};

class CancellationToken {
public:
    void cancel() { cancelled.store(true); }
    bool is_cancelled() const { return cancelled.load(); }

private:
    std::atomic<bool> cancelled{false};
};

} // namespace faceattend
