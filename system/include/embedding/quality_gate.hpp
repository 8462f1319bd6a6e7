// ============= include/embedding/quality_gate.hpp =============
/*
 * Quality gate para imágenes de rostro
 *
 * MÉTRICAS:
 * - sharpness:  varianza del Laplaciano / 100   (cap 1.0)
 * - brightness: media / 255
 * - contrast:   stddev / 128
 *
 * score = 0.4*sharpness + 0.3*(1 - min(|brightness-0.5|*2, 1)) + 0.3*min(contrast, 1)
 */

#pragma once
#include "embedding/embedding_provider.hpp"
#include <opencv2/core.hpp>

namespace faceattend {

struct ImageQuality {
    float sharpness = 0.0f;
    float brightness = 0.0f;
    float contrast = 0.0f;
    float quality_score = 0.0f;
};

ImageQuality assess_image_quality(const cv::Mat& image);

// Decorador: rechaza imágenes pobres antes de llamar al modelo
class QualityCheckedProvider : public EmbeddingProvider {
public:
    QualityCheckedProvider(EmbeddingProvider& inner, float threshold);

    EmbeddingResult embed(const cv::Mat& image) override;
    int dimension() const override { return inner.dimension(); }

    float threshold() const { return min_quality; }

private:
    EmbeddingProvider& inner;
    float min_quality;
};

} // namespace faceattend
