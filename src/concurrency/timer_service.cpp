#include "timer_service.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <mutex>

#include "../utils/logging.hpp"

namespace concurrency {

    TimerService::TimerService() : thread_([this] { run(); }) {}

    TimerService::~TimerService() { stop(); }

    TimerId TimerService::schedule_after(std::chrono::milliseconds delay, std::function<void()> callback) {
        TimerId id = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            id = next_id_++;
            const auto deadline = Clock::now() + delay;
            deadlines_.emplace(deadline, Entry{.id_ = id, .callback_ = std::move(callback)});
            index_.emplace(id, deadline);
        }
        wakeup_.notify_one();
        return id;
    }

    bool TimerService::cancel(TimerId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(id);
        if (it == index_.end()) {
            return false;
        }

        auto [first, last] = deadlines_.equal_range(it->second);
        for (auto entry = first; entry != last; ++entry) {
            if (entry->second.id_ == id) {
                deadlines_.erase(entry);
                break;
            }
        }
        index_.erase(it);
        return true;
    }

    void TimerService::stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) {
                return;
            }
            stop_ = true;
            deadlines_.clear();
            index_.clear();
        }
        wakeup_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void TimerService::run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stop_) {
            if (deadlines_.empty()) {
                wakeup_.wait(lock, [this]() { return stop_ || !deadlines_.empty(); });
                continue;
            }

            auto next = deadlines_.begin();
            if (Clock::now() < next->first) {
                wakeup_.wait_until(lock, next->first);
                continue;
            }

            auto callback = std::move(next->second.callback_);
            index_.erase(next->second.id_);
            deadlines_.erase(next);

            lock.unlock();
            try {
                callback();
            } catch (const std::exception& e) {
                logging::get()->error("Timer callback threw: {}", e.what());
            }
            lock.lock();
        }
    }
}  // namespace concurrency
