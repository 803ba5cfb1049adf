#include "reply.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../../utils/logging.hpp"

namespace http::request {
    const char* to_string(ReplyKind kind) {
        switch (kind) {
            case ReplyKind::NEXT:
                return "next";
            case ReplyKind::REPLY:
                return "reply";
            case ReplyKind::CHUNK:
                return "chunk";
            case ReplyKind::FIN:
                return "fin";
            case ReplyKind::ERROR:
                return "error";
        }
        return "error";
    }

    //
    // ReplyQueue implementation
    //

    bool ReplyQueue::deliver(Reply reply) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            replies_.emplace_back(std::move(reply));
        }
        available_.notify_all();
        return true;
    }

    bool ReplyQueue::is_reachable() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !closed_;
    }

    std::optional<Reply> ReplyQueue::try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (replies_.empty()) {
            return std::nullopt;
        }
        Reply reply = std::move(replies_.front());
        replies_.pop_front();
        return reply;
    }

    std::optional<Reply> ReplyQueue::wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!available_.wait_for(lock, timeout, [this]() { return !replies_.empty(); })) {
            return std::nullopt;
        }
        Reply reply = std::move(replies_.front());
        replies_.pop_front();
        return reply;
    }

    void ReplyQueue::close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        replies_.clear();
    }

    size_t ReplyQueue::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return replies_.size();
    }

    //
    // CallbackSink implementation
    //

    CallbackSink::CallbackSink(std::function<void(Reply)> callback) : callback_(std::move(callback)) {}

    bool CallbackSink::deliver(Reply reply) {
        callback_(std::move(reply));
        return true;
    }

    //
    // ReplySlot implementation
    //

    ReplySlot::ReplySlot(CorrelationToken token, std::shared_ptr<IReplySink> sink) : token_(std::move(token)), sink_(std::move(sink)) {}

    bool ReplySlot::is_caller_reachable() const { return sink_ != nullptr && sink_->is_reachable(); }

    void ReplySlot::send_next() { send(Reply{.token_ = token_, .kind_ = ReplyKind::NEXT}); }

    void ReplySlot::send_partial(http::model::Response head) {
        head.body_.reset();
        send(Reply{.token_ = token_, .kind_ = ReplyKind::REPLY, .response_ = std::move(head)});
    }

    void ReplySlot::send_chunk(std::string data) { send(Reply{.token_ = token_, .kind_ = ReplyKind::CHUNK, .data_ = std::move(data)}); }

    void ReplySlot::reply(http::model::Response response) {
        send_final(Reply{.token_ = token_, .kind_ = ReplyKind::REPLY, .terminal_ = true, .response_ = std::move(response)});
    }

    void ReplySlot::fin(std::string data) { send_final(Reply{.token_ = token_, .kind_ = ReplyKind::FIN, .terminal_ = true, .data_ = std::move(data)}); }

    void ReplySlot::error(http::http_error::RequestError error) {
        send_final(Reply{.token_ = token_, .kind_ = ReplyKind::ERROR, .terminal_ = true, .error_ = std::move(error)});
    }

    void ReplySlot::release() { sink_.reset(); }

    void ReplySlot::send(Reply reply) {
        if (sink_ == nullptr) {
            return;
        }
        const ReplyKind kind = reply.kind_;
        if (!sink_->deliver(std::move(reply))) {
            logging::get()->debug("Caller is gone, dropped '{}' message", to_string(kind));
        }
    }

    void ReplySlot::send_final(Reply reply) {
        // Empty the slot before delivering so a re-entrant sink cannot reply twice.
        auto sink = std::move(sink_);
        sink_.reset();
        if (sink == nullptr) {
            return;
        }
        const ReplyKind kind = reply.kind_;
        if (!sink->deliver(std::move(reply))) {
            logging::get()->debug("Caller is gone, dropped final '{}' message", to_string(kind));
        }
    }
}  // namespace http::request
