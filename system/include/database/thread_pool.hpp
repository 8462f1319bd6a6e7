// ============= include/database/thread_pool.hpp =============
/*
 * Thread Pool con prioridades
 *
 * USOS:
 * - Embedding de imágenes (enrollment y reconocimiento)
 * - Rebuild del índice en background (Low)
 *
 * ORDEN: prioridad mayor primero, FIFO dentro de la misma prioridad
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace faceattend {

enum class TaskPriority : int {
    Low = -10,
    Normal = 0,
    High = 10
};

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Submit task (returns future). Throws std::runtime_error after stop()
    template<typename F>
    auto submit(F&& f, TaskPriority priority = TaskPriority::Normal)
        -> std::future<decltype(f())>;

    // Fire-and-forget
    void post(std::function<void()> task, TaskPriority priority = TaskPriority::Normal);

    // Stats
    size_t pending_tasks() const;
    size_t busy_threads() const { return active_count.load(); }
    size_t thread_count() const { return workers.size(); }
    bool is_stopped() const { return stop_flag.load(); }

    // Control
    void wait_all();
    void stop();

private:
    struct Task {
        std::function<void()> func;
        int priority = 0;
        uint64_t sequence = 0;

        bool operator<(const Task& other) const {
            if (priority != other.priority) return priority < other.priority;  // Max heap
            return sequence > other.sequence;
        }
    };

    std::vector<std::thread> workers;
    std::priority_queue<Task> tasks;
    uint64_t next_sequence = 0;

    mutable std::mutex queue_mutex;
    std::condition_variable condition;
    std::condition_variable idle_condition;
    std::atomic<bool> stop_flag{false};
    std::atomic<size_t> active_count{0};

    void enqueue(std::function<void()> func, TaskPriority priority);
    void worker_thread();
};

// ==================== IMPLEMENTATION ====================

template<typename F>
auto ThreadPool::submit(F&& f, TaskPriority priority) -> std::future<decltype(f())> {
    using return_type = decltype(f());

    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> result = task->get_future();

    enqueue([task]() { (*task)(); }, priority);
    return result;
}

} // namespace faceattend
