#ifndef CONDUIT_THREAD_POOL_HPP
#define CONDUIT_THREAD_POOL_HPP

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace concurrency {
    class ThreadPool {
       public:
        explicit ThreadPool(size_t num_threads);

        ~ThreadPool();
        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;
        ThreadPool(ThreadPool&&) = delete;
        ThreadPool& operator=(ThreadPool&&) = delete;

        // Returns false once shutdown() has started; the task is not queued.
        [[nodiscard]] bool enqueue(std::function<void()> next_task);
        void wait_all();

        // Runs every queued task, then joins the workers. Idempotent.
        void shutdown();

        [[nodiscard]] bool is_stopping() const { return stop_; }
        [[nodiscard]] size_t size() const { return threads_.size(); }

       private:
        void worker_loop();

        std::vector<std::thread> threads_;
        std::queue<std::function<void()> > tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_variable_;
        std::atomic<bool> stop_ = false;
        std::atomic<size_t> active_tasks_ = 0;
        std::condition_variable completion_cv_;
    };
}  // namespace concurrency

#endif
