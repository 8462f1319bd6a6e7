// ============= src/embedding/embedding_executor.cpp =============
#include "embedding/embedding_executor.hpp"
#include "core/embedding_math.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace faceattend {

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(10);

} // namespace

const char* to_string(EmbeddingFailure failure) {
    switch (failure) {
        case EmbeddingFailure::None:                  return "none";
        case EmbeddingFailure::NoFaceDetected:        return "no_face_detected";
        case EmbeddingFailure::LowQuality:            return "low_quality";
        case EmbeddingFailure::MultipleFacesDetected: return "multiple_faces_detected";
        case EmbeddingFailure::Timeout:               return "timeout";
        case EmbeddingFailure::Cancelled:             return "cancelled";
    }
    return "unknown";
}

EmbeddingExecutor::EmbeddingExecutor(EmbeddingProvider& provider, const EmbeddingConfig& config)
    : provider(provider), config(config), workers(static_cast<size_t>(config.worker_threads))
{
    if (provider.dimension() != config.dimension) {
        throw ValidationError("Provider dimension " + std::to_string(provider.dimension()) +
                              " != embedding.dimension " + std::to_string(config.dimension));
    }

    spdlog::info("🧠 Embedding executor: dim {} | {} workers | timeout {} ms",
                 config.dimension, config.worker_threads, config.timeout_ms);
}

EmbeddingExecutor::Pending EmbeddingExecutor::dispatch(const cv::Mat& image, TaskPriority priority) {
    Pending pending;
    pending.slot = std::make_shared<TaskSlot>();
    pending.dispatched_at = now_ms();

    auto slot = pending.slot;
    EmbeddingProvider* target = &provider;
    cv::Mat frame = image;  // refcount, sin copia de pixels

    pending.result = workers.submit([target, frame, slot]() {
        TaskState expected = TaskState::Queued;
        if (!slot->state.compare_exchange_strong(expected, TaskState::Running)) {
            // El caller ya se fue
            return EmbeddingResult::fail(EmbeddingFailure::Timeout);
        }
        slot->started_at.store(now_ms());
        return target->embed(frame);
    }, priority);

    return pending;
}

bool EmbeddingExecutor::abandon(Pending& pending) {
    TaskState expected = TaskState::Queued;
    return pending.slot->state.compare_exchange_strong(expected, TaskState::Abandoned);
}

EmbeddingResult EmbeddingExecutor::await(Pending& pending, const CancellationToken* token) {
    while (true) {
        if (token && token->is_cancelled()) {
            abandon(pending);
            return EmbeddingResult::fail(EmbeddingFailure::Cancelled);
        }

        if (pending.result.wait_for(POLL_INTERVAL) == std::future_status::ready) {
            try {
                return validated(pending.result.get());
            } catch (const ProviderError&) {
                throw;
            } catch (const std::exception& e) {
                throw ProviderError(std::string("Embedding provider failed: ") + e.what());
            }
        }

        if (config.timeout_ms <= 0) {
            continue;
        }

        int64_t now = now_ms();
        if (pending.slot->state.load() == TaskState::Queued) {
            // Pool saturado: no esperar más que el timeout en cola
            if (now - pending.dispatched_at > config.timeout_ms && abandon(pending)) {
                spdlog::warn("⏱️  Embedding timeout en cola ({} ms)", config.timeout_ms);
                return EmbeddingResult::fail(EmbeddingFailure::Timeout);
            }
            continue;
        }

        int64_t started = pending.slot->started_at.load();
        if (started > 0 && now - started > config.timeout_ms) {
            spdlog::warn("⏱️  Embedding timeout ({} ms)", config.timeout_ms);
            return EmbeddingResult::fail(EmbeddingFailure::Timeout);
        }
    }
}

EmbeddingResult EmbeddingExecutor::validated(EmbeddingResult result) const {
    if (!result.ok()) {
        result.embedding.clear();
        return result;
    }

    if (static_cast<int>(result.embedding.size()) != config.dimension) {
        throw ProviderError("Provider returned " + std::to_string(result.embedding.size()) +
                            " values, expected " + std::to_string(config.dimension));
    }
    if (!is_finite(result.embedding)) {
        throw ProviderError("Provider returned non-finite values");
    }

    l2_normalize(result.embedding);
    return result;
}

EmbeddingResult EmbeddingExecutor::embed(const cv::Mat& image,
                                         const CancellationToken* token,
                                         TaskPriority priority) {
    if (token && token->is_cancelled()) {
        return EmbeddingResult::fail(EmbeddingFailure::Cancelled);
    }

    Pending pending = dispatch(image, priority);
    return await(pending, token);
}

std::vector<EmbeddingResult> EmbeddingExecutor::embed_batch(const std::vector<cv::Mat>& images,
                                                            const CancellationToken* token) {
    std::vector<Pending> pending;
    pending.reserve(images.size());
    for (const auto& image : images) {
        pending.push_back(dispatch(image, TaskPriority::Normal));
    }

    std::vector<EmbeddingResult> results;
    results.reserve(images.size());
    for (auto& p : pending) {
        results.push_back(await(p, token));
    }
    return results;
}

} // namespace faceattend
