#include "upload_channel.hpp"

#include <algorithm>
#include <cstring>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>

namespace http::request {
    UploadChannel::FeedResult UploadChannel::feed(std::string data, std::function<void()> on_accepted) {
        std::function<void()> waker;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return FeedResult::CLOSED;
            }
            if (pending_.has_value()) {
                throw std::logic_error("UploadChannel::feed called while a feed is pending");
            }
            if (data.empty()) {
                return FeedResult::ACCEPTED;
            }
            if (slot_full_) {
                pending_ = std::move(data);
                on_accepted_ = std::move(on_accepted);
                return FeedResult::PENDING;
            }
            slot_ = std::move(data);
            slot_offset_ = 0;
            slot_full_ = true;
            waker = waker_;
        }

        if (waker) {
            waker();
        }
        return FeedResult::ACCEPTED;
    }

    void UploadChannel::close() {
        std::function<void()> waker;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            pending_.reset();
            on_accepted_ = nullptr;
            waker = waker_;
        }

        if (waker) {
            waker();
        }
    }

    bool UploadChannel::is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    UploadChannel::ReadResult UploadChannel::read(char* dest, size_t capacity) {
        std::function<void()> accepted;
        ReadResult result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!slot_full_) {
                result.status_ = closed_ ? ReadStatus::END : ReadStatus::WOULD_BLOCK;
                return result;
            }

            const size_t n = std::min(capacity, slot_.size() - slot_offset_);
            std::memcpy(dest, slot_.data() + slot_offset_, n);
            slot_offset_ += n;
            result.status_ = ReadStatus::DATA;
            result.bytes_ = n;

            if (slot_offset_ == slot_.size()) {
                slot_.clear();
                slot_offset_ = 0;
                slot_full_ = false;
                if (pending_.has_value()) {
                    slot_ = std::move(*pending_);
                    pending_.reset();
                    slot_full_ = true;
                    accepted = std::move(on_accepted_);
                    on_accepted_ = nullptr;
                }
            }
        }

        if (accepted) {
            accepted();
        }
        return result;
    }

    void UploadChannel::set_consumer_waker(std::function<void()> waker) {
        std::lock_guard<std::mutex> lock(mutex_);
        waker_ = std::move(waker);
    }
}  // namespace http::request
