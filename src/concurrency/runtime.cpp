#include "runtime.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "../utils/logging.hpp"

namespace concurrency {

    //
    // AbortHandle implementation
    //

    AbortHandle::AbortHandle(std::weak_ptr<ITask> task) : state_(std::make_shared<State>()) { state_->task_ = std::move(task); }

    void AbortHandle::abort() {
        if (state_ == nullptr || state_->aborted_.exchange(true)) {
            return;
        }

        auto task = state_->task_.lock();
        if (task == nullptr) {
            return;
        }

        task->strand()->post([task]() { task->cancel(); });
    }

    bool AbortHandle::is_aborted() const { return state_ != nullptr && state_->aborted_; }

    //
    // Runtime implementation
    //

    Runtime::Runtime(size_t worker_threads) : pool_(std::make_shared<ThreadPool>(worker_threads)) {}

    Runtime::~Runtime() { shutdown(); }

    std::shared_ptr<Strand> Runtime::make_strand() { return std::make_shared<Strand>(pool_); }

    SpawnOutcome Runtime::spawn(const std::shared_ptr<ITask>& task) {
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            if (shutting_down_) {
                return SpawnOutcome{};
            }
            registry_.emplace(task.get(), task);
        }

        if (!task->strand()->post([task]() { task->start(); })) {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            registry_.erase(task.get());
            return SpawnOutcome{};
        }

        return SpawnOutcome{.result_ = SpawnResult::RUNNING, .abort_handle_ = AbortHandle(task)};
    }

    void Runtime::release(const ITask* task) {
        std::shared_ptr<ITask> released;
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            auto it = registry_.find(task);
            if (it == registry_.end()) {
                return;
            }
            // Destroy outside the lock, the task may be the last owner of itself.
            released = std::move(it->second);
            registry_.erase(it);
        }
        registry_cv_.notify_all();
    }

    TimerId Runtime::schedule_after(std::chrono::milliseconds delay, std::function<void()> callback) {
        return timers_.schedule_after(delay, std::move(callback));
    }

    bool Runtime::cancel_timer(TimerId id) { return timers_.cancel(id); }

    size_t Runtime::live_tasks() const {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        return registry_.size();
    }

    void Runtime::shutdown() {
        std::vector<std::shared_ptr<ITask> > live;
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            if (shutting_down_.exchange(true)) {
                return;
            }
            live.reserve(registry_.size());
            for (const auto& [key, task] : registry_) {
                live.push_back(task);
            }
        }

        if (!live.empty()) {
            logging::get()->debug("Runtime shutting down, cancelling {} live task(s)", live.size());
        }

        for (const auto& task : live) {
            if (!task->strand()->post([task]() { task->cancel(); })) {
                release(task.get());
            }
        }
        live.clear();

        {
            std::unique_lock<std::mutex> lock(registry_mutex_);
            registry_cv_.wait(lock, [this]() { return registry_.empty(); });
        }

        pool_->wait_all();
        timers_.stop();
        pool_->shutdown();
    }
}  // namespace concurrency
