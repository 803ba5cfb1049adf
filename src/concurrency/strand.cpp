#include "strand.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <mutex>

#include "../utils/logging.hpp"

namespace concurrency {

    Strand::Strand(const std::shared_ptr<ThreadPool>& pool) : pool_(pool) {}

    bool Strand::schedule() {
        auto pool = pool_.lock();
        return pool != nullptr && pool->enqueue([self = shared_from_this()]() { self->drain(); });
    }

    bool Strand::post(std::function<void()> handler) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.emplace_back(std::move(handler));
            if (scheduled_) {
                return true;
            }
            scheduled_ = true;
        }

        if (schedule()) {
            return true;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        scheduled_ = false;
        pending_.clear();
        return false;
    }

    void Strand::drain() {
        for (size_t ran = 0; ran < MAX_BATCH; ++ran) {
            std::function<void()> handler;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (pending_.empty()) {
                    scheduled_ = false;
                    return;
                }
                handler = std::move(pending_.front());
                pending_.pop_front();
            }

            try {
                handler();
            } catch (const std::exception& e) {
                logging::get()->error("Strand handler threw: {}", e.what());
            }
        }

        // Yield the worker to other strands, keep our place in line.
        if (!schedule()) {
            std::lock_guard<std::mutex> lock(mutex_);
            scheduled_ = false;
            pending_.clear();
        }
    }
}  // namespace concurrency
