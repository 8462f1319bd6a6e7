#include <gtest/gtest.h>
#include "database/thread_pool.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace faceattend;

TEST(ThreadPoolTest, SubmitReturnsValues) {
    ThreadPool pool(4);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 50; ++i) {
        results.push_back(pool.submit([i]() { return i * i; }));
    }

    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
    EXPECT_EQ(pool.thread_count(), 4u);
}

TEST(ThreadPoolTest, HigherPriorityRunsFirstAndFifoWithinPriority) {
    ThreadPool pool(1);

    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    pool.post([opened]() { opened.wait(); });

    // Esperar a que el worker tome la tarea bloqueante
    while (pool.busy_threads() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    std::mutex order_mutex;
    std::vector<std::string> order;
    auto note = [&](const std::string& name) {
        return [&, name]() {
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(name);
        };
    };

    pool.post(note("low"), TaskPriority::Low);
    pool.post(note("normal-1"), TaskPriority::Normal);
    pool.post(note("high"), TaskPriority::High);
    pool.post(note("normal-2"), TaskPriority::Normal);

    gate.set_value();
    pool.wait_all();

    std::vector<std::string> expected = {"high", "normal-1", "normal-2", "low"};
    EXPECT_EQ(order, expected);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(2);
    auto f = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);

    // El worker sigue vivo
    EXPECT_EQ(pool.submit([]() { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, WaitAllDrainsQueue) {
    ThreadPool pool(3);
    std::atomic<int> done{0};

    for (int i = 0; i < 100; ++i) {
        pool.post([&done]() {
            std::this_thread::sleep_for(std::chrono::microseconds(200));
            done++;
        });
    }

    pool.wait_all();
    EXPECT_EQ(done.load(), 100);
    EXPECT_EQ(pool.pending_tasks(), 0u);
}

TEST(ThreadPoolTest, SubmitAfterStopThrows) {
    ThreadPool pool(2);
    pool.stop();
    pool.stop();

    EXPECT_TRUE(pool.is_stopped());
    EXPECT_THROW(pool.submit([]() { return 1; }), std::runtime_error);
    EXPECT_THROW(pool.post([]() {}), std::runtime_error);
}
