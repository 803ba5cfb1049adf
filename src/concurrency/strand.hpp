#ifndef CONDUIT_STRAND_HPP
#define CONDUIT_STRAND_HPP

#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <mutex>

#include "thread_pool.hpp"

namespace concurrency {
    // Serial executor on top of the shared pool: handlers posted to one strand
    // never run concurrently and run in posting order.
    class Strand : public std::enable_shared_from_this<Strand> {
       public:
        // The strand does not keep the pool alive.
        explicit Strand(const std::shared_ptr<ThreadPool>& pool);

        ~Strand() = default;
        Strand(const Strand&) = delete;
        Strand& operator=(const Strand&) = delete;
        Strand(Strand&&) = delete;
        Strand& operator=(Strand&&) = delete;

        // Returns false if the pool is gone or no longer accepts work; the
        // handler is dropped.
        bool post(std::function<void()> handler);

       private:
        static constexpr size_t MAX_BATCH = 64;

        void drain();
        [[nodiscard]] bool schedule();

        std::weak_ptr<ThreadPool> pool_;
        std::mutex mutex_;
        std::deque<std::function<void()> > pending_;
        bool scheduled_ = false;
    };
}  // namespace concurrency

#endif
