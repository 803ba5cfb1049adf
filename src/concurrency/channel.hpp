#ifndef CONDUIT_CHANNEL_HPP
#define CONDUIT_CHANNEL_HPP

#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

namespace concurrency {
    enum class RecvStatus { ITEM, EMPTY, CLOSED };

    // Unbounded single-producer/single-consumer queue. Either end closes it:
    // closing the sender lets the receiver drain what is queued and then report
    // CLOSED, closing the receiver drops the queue and makes every send fail.
    // Destroying an end closes it.
    template <typename T>
    class Channel {
        struct State {
            std::mutex mutex_;
            std::deque<T> items_;
            bool sender_closed_ = false;
            bool receiver_closed_ = false;
            std::function<void()> notify_;
        };

        static void notify(const std::shared_ptr<State>& state) {
            std::function<void()> notify;
            {
                std::lock_guard<std::mutex> lock(state->mutex_);
                notify = state->notify_;
            }
            if (notify) {
                notify();
            }
        }

       public:
        class Sender {
           public:
            Sender() = default;
            explicit Sender(std::shared_ptr<State> state) : state_(std::move(state)) {}

            ~Sender() { close(); }
            Sender(const Sender&) = delete;
            Sender& operator=(const Sender&) = delete;
            Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}
            Sender& operator=(Sender&& other) noexcept {
                if (this != &other) {
                    close();
                    state_ = std::move(other.state_);
                }
                return *this;
            }

            [[nodiscard]] bool send(T item) {
                if (state_ == nullptr) {
                    return false;
                }
                {
                    std::lock_guard<std::mutex> lock(state_->mutex_);
                    if (state_->sender_closed_ || state_->receiver_closed_) {
                        return false;
                    }
                    state_->items_.emplace_back(std::move(item));
                }
                notify(state_);
                return true;
            }

            void close() {
                if (state_ == nullptr) {
                    return;
                }
                {
                    std::lock_guard<std::mutex> lock(state_->mutex_);
                    if (state_->sender_closed_) {
                        return;
                    }
                    state_->sender_closed_ = true;
                }
                notify(state_);
            }

            [[nodiscard]] bool is_closed() const {
                if (state_ == nullptr) {
                    return true;
                }
                std::lock_guard<std::mutex> lock(state_->mutex_);
                return state_->sender_closed_ || state_->receiver_closed_;
            }

           private:
            std::shared_ptr<State> state_;
        };

        class Receiver {
           public:
            Receiver() = default;
            explicit Receiver(std::shared_ptr<State> state) : state_(std::move(state)) {}

            ~Receiver() { close(); }
            Receiver(const Receiver&) = delete;
            Receiver& operator=(const Receiver&) = delete;
            Receiver(Receiver&& other) noexcept : state_(std::move(other.state_)) {}
            Receiver& operator=(Receiver&& other) noexcept {
                if (this != &other) {
                    close();
                    state_ = std::move(other.state_);
                }
                return *this;
            }

            RecvStatus try_recv(T& out) {
                if (state_ == nullptr) {
                    return RecvStatus::CLOSED;
                }
                std::lock_guard<std::mutex> lock(state_->mutex_);
                if (!state_->items_.empty()) {
                    out = std::move(state_->items_.front());
                    state_->items_.pop_front();
                    return RecvStatus::ITEM;
                }
                return state_->sender_closed_ || state_->receiver_closed_ ? RecvStatus::CLOSED : RecvStatus::EMPTY;
            }

            // Called after every send and on sender close, outside the queue lock.
            void set_notify(std::function<void()> notify) {
                if (state_ == nullptr) {
                    return;
                }
                std::lock_guard<std::mutex> lock(state_->mutex_);
                state_->notify_ = std::move(notify);
            }

            void close() {
                if (state_ == nullptr) {
                    return;
                }
                std::lock_guard<std::mutex> lock(state_->mutex_);
                state_->receiver_closed_ = true;
                state_->items_.clear();
                state_->notify_ = nullptr;
            }

           private:
            std::shared_ptr<State> state_;
        };

        static std::pair<Sender, Receiver> create() {
            auto state = std::make_shared<State>();
            return {Sender(state), Receiver(state)};
        }
    };
}  // namespace concurrency

#endif
