#include <gtest/gtest.h>
#include "embedding/quality_gate.hpp"
#include "test_support.hpp"
#include <opencv2/core.hpp>

using namespace faceattend;
using namespace faceattend::testing_support;

namespace {

cv::Mat noise_image(int size = 112) {
    cv::Mat image(size, size, CV_8UC1);
    cv::RNG rng(1234);
    rng.fill(image, cv::RNG::UNIFORM, 0, 256);
    return image;
}

cv::Mat flat_image(int value, int size = 112) {
    return cv::Mat(size, size, CV_8UC1, cv::Scalar(value));
}

} // namespace

TEST(QualityGateTest, SharpWellExposedImageScoresHigh) {
    ImageQuality q = assess_image_quality(noise_image());

    EXPECT_FLOAT_EQ(q.sharpness, 1.0f);
    EXPECT_NEAR(q.brightness, 0.5f, 0.05f);
    EXPECT_GT(q.contrast, 0.4f);
    EXPECT_GT(q.quality_score, 0.8f);
}

TEST(QualityGateTest, FlatImageHasNoSharpnessOrContrast) {
    ImageQuality q = assess_image_quality(flat_image(128));

    EXPECT_FLOAT_EQ(q.sharpness, 0.0f);
    EXPECT_FLOAT_EQ(q.contrast, 0.0f);
    EXPECT_NEAR(q.quality_score, 0.3f, 0.01f);

    ImageQuality dark = assess_image_quality(flat_image(0));
    EXPECT_NEAR(dark.quality_score, 0.0f, 1e-6f);
}

TEST(QualityGateTest, ColorImagesAreConvertedToGray) {
    cv::Mat gray = noise_image(64);
    cv::Mat color;
    cv::Mat channels[] = {gray, gray, gray};
    cv::merge(channels, 3, color);

    ImageQuality a = assess_image_quality(gray);
    ImageQuality b = assess_image_quality(color);
    EXPECT_NEAR(a.quality_score, b.quality_score, 1e-3f);
}

TEST(QualityGateTest, EmptyImageScoresZero) {
    ImageQuality q = assess_image_quality(cv::Mat());
    EXPECT_FLOAT_EQ(q.quality_score, 0.0f);
}

TEST(QualityCheckedProviderTest, RejectsPoorImagesBeforeCallingTheModel) {
    ScriptedEmbeddingProvider inner;
    inner.set_default(unit_vector(0));
    QualityCheckedProvider gate(inner, 0.4f);

    EXPECT_EQ(gate.dimension(), kDim);
    EXPECT_FLOAT_EQ(gate.threshold(), 0.4f);

    EmbeddingResult flat = gate.embed(flat_image(128));
    EXPECT_EQ(flat.failure, EmbeddingFailure::LowQuality);
    EXPECT_NEAR(flat.quality_score, 0.3f, 0.01f);

    EmbeddingResult empty = gate.embed(cv::Mat());
    EXPECT_EQ(empty.failure, EmbeddingFailure::NoFaceDetected);

    EXPECT_EQ(inner.call_count(), 0);
}

TEST(QualityCheckedProviderTest, PassesGoodImagesThroughWithScore) {
    ScriptedEmbeddingProvider inner;
    inner.set_default(unit_vector(3));
    QualityCheckedProvider gate(inner, 0.4f);

    EmbeddingResult result = gate.embed(noise_image());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.embedding, unit_vector(3));
    EXPECT_GT(result.quality_score, 0.8f);
    EXPECT_EQ(inner.call_count(), 1);
}
