// ============= test/test_support.hpp =============
/*
 * Helpers compartidos por los tests
 *
 * - ScriptedEmbeddingProvider: provider falso. Cada imagen es un
 *   cv::Mat 1x1 CV_32SC1 con un "tag"; el tag decide el vector,
 *   el fallo, la demora o la excepción que se devuelve.
 * - RecordingAuditSink: audit en memoria para contar acciones
 * - Vectores de prueba en dimensión 16
 */

#pragma once
#include "core/config.hpp"
#include "core/embedding_math.hpp"
#include "database/audit_log.hpp"
#include "embedding/embedding_provider.hpp"
#include <opencv2/core.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace faceattend {
namespace testing_support {

constexpr int kDim = 16;
constexpr int kNoiseAxis = 15;   // eje reservado para variar muestras

// ==================== VECTORS ====================

inline Embedding unit_vector(int axis, int dim = kDim) {
    Embedding v(dim, 0.0f);
    v[axis] = 1.0f;
    return v;
}

// Vector unitario con similarity exacta `similarity` respecto de e_axis
inline Embedding blend(int axis, int other_axis, float similarity, int dim = kDim) {
    Embedding v(dim, 0.0f);
    v[axis] = similarity;
    v[other_axis] = std::sqrt(std::max(0.0f, 1.0f - similarity * similarity));
    return v;
}

// Muestra k de la persona `axis`: la primera es e_axis exacto
inline Embedding sample_vector(int axis, int k) {
    if (k == 0) return unit_vector(axis);
    return blend(axis, kNoiseAxis, 1.0f - 0.01f * static_cast<float>(k));
}

inline cv::Mat tagged_image(int tag) {
    return cv::Mat(1, 1, CV_32SC1, cv::Scalar(tag));
}

inline int image_tag(int axis, int k) {
    return axis * 100 + k;
}

// ==================== PROVIDER ====================

class ScriptedEmbeddingProvider : public EmbeddingProvider {
public:
    explicit ScriptedEmbeddingProvider(int dim = kDim) : dim(dim) {}

    void set_vector(int tag, const Embedding& vector) {
        std::lock_guard<std::mutex> lock(mutex);
        scripts[tag].vector = vector;
        scripts[tag].failure = EmbeddingFailure::None;
    }

    void set_failure(int tag, EmbeddingFailure failure) {
        std::lock_guard<std::mutex> lock(mutex);
        scripts[tag].failure = failure;
    }

    void set_delay(int tag, int delay_ms) {
        std::lock_guard<std::mutex> lock(mutex);
        scripts[tag].delay_ms = delay_ms;
    }

    void set_throws(int tag) {
        std::lock_guard<std::mutex> lock(mutex);
        scripts[tag].throws = true;
    }

    // Imágenes reales (no tagged) reciben este vector
    void set_default(const Embedding& vector) {
        std::lock_guard<std::mutex> lock(mutex);
        fallback = vector;
    }

    // Registra `count` imágenes válidas de la persona `axis`
    std::vector<cv::Mat> person_images(int axis, int count) {
        std::vector<cv::Mat> images;
        for (int k = 0; k < count; ++k) {
            set_vector(image_tag(axis, k), sample_vector(axis, k));
            images.push_back(tagged_image(image_tag(axis, k)));
        }
        return images;
    }

    EmbeddingResult embed(const cv::Mat& image) override {
        calls++;

        if (image.empty()) {
            return EmbeddingResult::fail(EmbeddingFailure::NoFaceDetected);
        }

        Script script;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (image.type() != CV_32SC1 || image.total() != 1) {
                if (fallback.empty()) {
                    return EmbeddingResult::fail(EmbeddingFailure::NoFaceDetected);
                }
                return EmbeddingResult::success(fallback, 0.9f);
            }

            auto it = scripts.find(image.at<int>(0, 0));
            if (it == scripts.end()) {
                return EmbeddingResult::fail(EmbeddingFailure::NoFaceDetected);
            }
            script = it->second;
        }

        if (script.delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(script.delay_ms));
        }
        if (script.throws) {
            throw std::runtime_error("model crashed");
        }
        if (script.failure != EmbeddingFailure::None) {
            return EmbeddingResult::fail(script.failure, 0.1f);
        }
        return EmbeddingResult::success(script.vector, 0.9f);
    }

    int dimension() const override { return dim; }

    int call_count() const { return calls.load(); }

private:
    struct Script {
        Embedding vector;
        EmbeddingFailure failure = EmbeddingFailure::None;
        int delay_ms = 0;
        bool throws = false;
    };

    int dim;
    std::mutex mutex;
    std::map<int, Script> scripts;
    Embedding fallback;
    std::atomic<int> calls{0};
};

// ==================== AUDIT ====================

class RecordingAuditSink : public AuditSink {
public:
    void record(const AuditRecord& entry) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (rejecting) {
            failures++;
            return;
        }
        records.push_back(entry);
    }

    // Simula un backend caído: descarta y cuenta
    void reject_writes(bool on) {
        std::lock_guard<std::mutex> lock(mutex);
        rejecting = on;
    }

    uint64_t failed_writes() const override {
        std::lock_guard<std::mutex> lock(mutex);
        return failures;
    }

    int count(const std::string& action) const {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<int>(std::count_if(records.begin(), records.end(),
            [&](const AuditRecord& r) { return r.action == action; }));
    }

    std::vector<AuditRecord> all() const {
        std::lock_guard<std::mutex> lock(mutex);
        return records;
    }

private:
    mutable std::mutex mutex;
    std::vector<AuditRecord> records;
    bool rejecting = false;
    uint64_t failures = 0;
};

// ==================== CONFIG ====================

inline EngineConfig make_config() {
    EngineConfig config;
    config.embedding.dimension = kDim;
    config.embedding.timeout_ms = 2000;
    config.embedding.worker_threads = 4;
    config.index.dimension = kDim;
    config.quality.enabled = false;
    config.storage.db_path = ":memory:";
    config.storage.audit_path = ":memory:";
    config.logging.level = "warn";
    return config;
}

// Espera activa acotada (loops en background)
template<typename Pred>
bool eventually(Pred pred, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace testing_support
} // namespace faceattend
