#include "thread_pool.hpp"

#include <condition_variable>
#include <exception>
#include <stdexcept>
#include <queue>
#include <thread>
#include <vector>

#include "../utils/logging.hpp"

namespace concurrency {

    ThreadPool::ThreadPool(size_t num_threads) {
        if (num_threads == 0) {
            throw std::invalid_argument("Thread pool needs at least one thread");
        }

        threads_.reserve(num_threads);

        for (size_t i = 0; i < num_threads; ++i) {
            threads_.emplace_back([this] { worker_loop(); });
        }
    }

    ThreadPool::~ThreadPool() { shutdown(); }

    void ThreadPool::worker_loop() {
        while (true) {
            std::function<void()> activate_task_from_queue;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);

                condition_variable_.wait(lock, [this]() { return !tasks_.empty() || stop_; });

                if (stop_ && tasks_.empty()) {
                    return;
                }

                activate_task_from_queue = std::move(tasks_.front());
                tasks_.pop();

                ++active_tasks_;
            }

            try {
                activate_task_from_queue();
            } catch (const std::exception& e) {
                logging::get()->error("Task escaped the thread pool with an exception: {}", e.what());
            }

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                --active_tasks_;
            }
            completion_cv_.notify_all();
        }
    }

    bool ThreadPool::enqueue(std::function<void()> next_task) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                return false;
            }
            tasks_.emplace(std::move(next_task));
        }

        condition_variable_.notify_one();
        return true;
    }

    void ThreadPool::wait_all() {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        completion_cv_.wait(lock, [this]() { return tasks_.empty() && active_tasks_ == 0; });
    }

    void ThreadPool::shutdown() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }

        condition_variable_.notify_all();

        for (auto& thread : threads_) {
            if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
                thread.join();
            }
        }
    }
}  // namespace concurrency
