// ============= src/embedding/quality_gate.cpp =============
#include "embedding/quality_gate.hpp"
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace faceattend {

ImageQuality assess_image_quality(const cv::Mat& image) {
    ImageQuality q;
    if (image.empty()) {
        return q;
    }

    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image;
    }

    if (gray.depth() != CV_8U) {
        gray.convertTo(gray, CV_8U);
    }

    // Sharpness (Laplacian variance)
    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);
    cv::Scalar lap_mean, lap_stddev;
    cv::meanStdDev(laplacian, lap_mean, lap_stddev);
    double variance = lap_stddev[0] * lap_stddev[0];
    q.sharpness = static_cast<float>(std::min(variance / 100.0, 1.0));

    // Brightness / contrast
    cv::Scalar mean, stddev;
    cv::meanStdDev(gray, mean, stddev);
    q.brightness = static_cast<float>(mean[0] / 255.0);
    q.contrast = static_cast<float>(stddev[0] / 128.0);

    float brightness_score = 1.0f - std::min(std::fabs(q.brightness - 0.5f) * 2.0f, 1.0f);
    q.quality_score = 0.4f * q.sharpness +
                      0.3f * brightness_score +
                      0.3f * std::min(q.contrast, 1.0f);
    return q;
}

// ==================== QUALITY CHECKED PROVIDER ====================

QualityCheckedProvider::QualityCheckedProvider(EmbeddingProvider& inner, float threshold)
    : inner(inner), min_quality(threshold)
{
    spdlog::info("🔎 Quality gate activo (threshold {:.2f})", threshold);
}

EmbeddingResult QualityCheckedProvider::embed(const cv::Mat& image) {
    if (image.empty()) {
        return EmbeddingResult::fail(EmbeddingFailure::NoFaceDetected);
    }

    ImageQuality q = assess_image_quality(image);
    if (q.quality_score < min_quality) {
        spdlog::debug("Imagen rechazada: quality {:.3f} (sharp {:.2f}, bright {:.2f}, contrast {:.2f})",
                      q.quality_score, q.sharpness, q.brightness, q.contrast);
        return EmbeddingResult::fail(EmbeddingFailure::LowQuality, q.quality_score);
    }

    EmbeddingResult result = inner.embed(image);
    result.quality_score = q.quality_score;
    return result;
}

} // namespace faceattend
