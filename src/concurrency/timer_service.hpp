#ifndef CONDUIT_TIMER_SERVICE_HPP
#define CONDUIT_TIMER_SERVICE_HPP

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace concurrency {
    using TimerId = std::uint64_t;

    class TimerService {
       public:
        TimerService();

        ~TimerService();
        TimerService(const TimerService&) = delete;
        TimerService& operator=(const TimerService&) = delete;
        TimerService(TimerService&&) = delete;
        TimerService& operator=(TimerService&&) = delete;

        // The callback runs on the timer thread and must only hand work off.
        TimerId schedule_after(std::chrono::milliseconds delay, std::function<void()> callback);

        // Returns false if the timer already fired or was never scheduled.
        bool cancel(TimerId id);

        void stop();

       private:
        using Clock = std::chrono::steady_clock;

        struct Entry {
            TimerId id_;
            std::function<void()> callback_;
        };

        void run();

        std::mutex mutex_;
        std::condition_variable wakeup_;
        std::multimap<Clock::time_point, Entry> deadlines_;
        std::unordered_map<TimerId, Clock::time_point> index_;
        TimerId next_id_ = 1;
        bool stop_ = false;
        std::thread thread_;
    };
}  // namespace concurrency

#endif
