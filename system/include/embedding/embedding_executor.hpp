// ============= include/embedding/embedding_executor.hpp =============
/*
 * Ejecuta el EmbeddingProvider sobre el ThreadPool
 *
 * - timeout por imagen (medido desde que el worker empieza)
 * - una tarea que sigue en cola al vencer el timeout se abandona:
 *   el worker la descarta sin llamar al provider
 * - cancelación cooperativa (token revisado cada 10ms)
 * - batch en paralelo, resultados en el orden de entrada
 * - valida dimensión / valores finitos y normaliza L2
 */

#pragma once
#include "core/config.hpp"
#include "database/thread_pool.hpp"
#include "embedding/embedding_provider.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <vector>

namespace faceattend {

class EmbeddingExecutor {
public:
    EmbeddingExecutor(EmbeddingProvider& provider, const EmbeddingConfig& config);

    EmbeddingResult embed(const cv::Mat& image,
                          const CancellationToken* token = nullptr,
                          TaskPriority priority = TaskPriority::High);

    std::vector<EmbeddingResult> embed_batch(const std::vector<cv::Mat>& images,
                                             const CancellationToken* token = nullptr);

    int dimension() const { return config.dimension; }
    ThreadPool& pool() { return workers; }

private:
    enum class TaskState : int { Queued, Running, Abandoned };

    struct TaskSlot {
        std::atomic<TaskState> state{TaskState::Queued};
        std::atomic<int64_t> started_at{0};
    };

    struct Pending {
        std::future<EmbeddingResult> result;
        std::shared_ptr<TaskSlot> slot;
        int64_t dispatched_at = 0;
    };

    EmbeddingProvider& provider;
    EmbeddingConfig config;
    ThreadPool workers;

    Pending dispatch(const cv::Mat& image, TaskPriority priority);
    EmbeddingResult await(Pending& pending, const CancellationToken* token);
    static bool abandon(Pending& pending);
    EmbeddingResult validated(EmbeddingResult result) const;
};

} // namespace faceattend
