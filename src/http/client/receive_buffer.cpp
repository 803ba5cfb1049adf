#include "receive_buffer.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace http::client {
    bool ReceiveBuffer::append(std::string_view data) {
        std::function<void(BodyChunk)> waiter;
        BodyChunk chunk;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (data_.size() >= limit_) {
                paused_ = true;
                return false;
            }
            data_.append(data);
            if (!waiter_) {
                return true;
            }
            waiter = std::move(waiter_);
            waiter_ = nullptr;
            chunk.status_ = ChunkStatus::DATA;
            chunk.data_ = std::move(data_);
            data_.clear();
        }

        waiter(std::move(chunk));
        return true;
    }

    void ReceiveBuffer::finish(std::optional<http::http_error::RequestError> error) {
        std::function<void(BodyChunk)> waiter;
        BodyChunk chunk;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (error.has_value()) {
                error_ = std::move(error);
            } else {
                eof_ = true;
            }
            // Buffered data goes out first; a parked waiter implies none is left.
            if (!waiter_ || !data_.empty()) {
                return;
            }
            waiter = std::move(waiter_);
            waiter_ = nullptr;
            chunk.status_ = error_.has_value() ? ChunkStatus::ERROR : ChunkStatus::END;
            chunk.error_ = error_;
        }
        waiter(std::move(chunk));
    }

    ReceiveBuffer::Pull ReceiveBuffer::next_chunk(std::function<void(BodyChunk)> on_chunk) {
        std::lock_guard<std::mutex> lock(mutex_);
        Pull pull;
        if (!data_.empty()) {
            BodyChunk chunk;
            chunk.status_ = ChunkStatus::DATA;
            chunk.data_ = std::move(data_);
            data_.clear();
            pull.chunk_ = std::move(chunk);
            pull.resume_ = paused_;
            paused_ = false;
        } else if (error_.has_value()) {
            pull.chunk_ = BodyChunk{.status_ = ChunkStatus::ERROR, .data_ = {}, .error_ = error_};
        } else if (eof_) {
            pull.chunk_ = BodyChunk{.status_ = ChunkStatus::END, .data_ = {}, .error_ = {}};
        } else {
            waiter_ = std::move(on_chunk);
        }
        return pull;
    }

    void ReceiveBuffer::drop_waiter() {
        std::lock_guard<std::mutex> lock(mutex_);
        waiter_ = nullptr;
    }

    bool ReceiveBuffer::is_paused() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return paused_;
    }

    size_t ReceiveBuffer::buffered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }
}  // namespace http::client
