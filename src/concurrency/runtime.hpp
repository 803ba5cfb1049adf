#ifndef CONDUIT_RUNTIME_HPP
#define CONDUIT_RUNTIME_HPP

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "strand.hpp"
#include "thread_pool.hpp"
#include "timer_service.hpp"

namespace concurrency {
    enum class SpawnResult { RUNNING, REJECTED };

    // A unit of work owned by the runtime from spawn() until it calls
    // Runtime::release(). Both hooks are invoked on the task's strand.
    class ITask {
       public:
        ITask() = default;
        virtual ~ITask() = default;
        ITask(const ITask&) = delete;
        ITask& operator=(const ITask&) = delete;
        ITask(ITask&&) = delete;
        ITask& operator=(ITask&&) = delete;

        [[nodiscard]] virtual std::shared_ptr<Strand> strand() const = 0;
        virtual void start() = 0;

        // Abort or runtime shutdown. May arrive after the task finished.
        virtual void cancel() = 0;
    };

    // Hard-abort control for one spawned task. Only the first abort() has an effect.
    class AbortHandle {
       public:
        AbortHandle() = default;
        explicit AbortHandle(std::weak_ptr<ITask> task);

        void abort();
        [[nodiscard]] bool is_aborted() const;

       private:
        struct State {
            std::atomic<bool> aborted_ = false;
            std::weak_ptr<ITask> task_;
        };

        std::shared_ptr<State> state_;
    };

    struct SpawnOutcome {
        SpawnResult result_ = SpawnResult::REJECTED;
        AbortHandle abort_handle_;
    };

    class Runtime {
       public:
        explicit Runtime(size_t worker_threads);

        ~Runtime();
        Runtime(const Runtime&) = delete;
        Runtime& operator=(const Runtime&) = delete;
        Runtime(Runtime&&) = delete;
        Runtime& operator=(Runtime&&) = delete;

        [[nodiscard]] std::shared_ptr<Strand> make_strand();

        // REJECTED means the runtime is shutting down: the task never starts and
        // neither of its hooks will be called.
        SpawnOutcome spawn(const std::shared_ptr<ITask>& task);

        // Called by a task once it has finished for good.
        void release(const ITask* task);

        TimerId schedule_after(std::chrono::milliseconds delay, std::function<void()> callback);
        bool cancel_timer(TimerId id);

        // Cancels every live task, waits for them to release, then stops the
        // workers. Must not be called from a task.
        void shutdown();

        [[nodiscard]] size_t live_tasks() const;
        [[nodiscard]] bool is_shutting_down() const { return shutting_down_; }

       private:
        std::shared_ptr<ThreadPool> pool_;
        TimerService timers_;
        mutable std::mutex registry_mutex_;
        std::condition_variable registry_cv_;
        std::unordered_map<const ITask*, std::shared_ptr<ITask> > registry_;
        std::atomic<bool> shutting_down_ = false;
    };
}  // namespace concurrency

#endif
