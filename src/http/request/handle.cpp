#include "handle.hpp"

#include <mutex>
#include <string>
#include <utility>

#include "../error/http_error.hpp"

namespace http::request {
    using http::http_error::HandleError;

    RequestHandle::RequestHandle(concurrency::AbortHandle abort, std::optional<CommandChannel::Sender> commands, std::optional<ReadChannel::Sender> reads)
        : abort_(std::move(abort)), commands_(std::move(commands)), reads_(std::move(reads)) {}

    void RequestHandle::cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        abort_.abort();
    }

    void RequestHandle::cancel_stream() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (commands_.has_value()) {
            commands_->close();
        }
        if (reads_.has_value()) {
            reads_->close();
        }
    }

    void RequestHandle::send(std::string data) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!commands_.has_value()) {
            throw HandleError("send: the request body is not streamed");
        }
        if (!commands_->send(http::model::UploadCommand::send(std::move(data)))) {
            throw HandleError("send: the request body stream is closed");
        }
    }

    void RequestHandle::finish_send() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!commands_.has_value()) {
            throw HandleError("finish_send: the request body is not streamed");
        }
        if (!commands_->send(http::model::UploadCommand::finish_send())) {
            throw HandleError("finish_send: the request body stream is closed");
        }
        commands_->close();
    }

    void RequestHandle::read(http::model::ReadRequest read) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!reads_.has_value()) {
            throw HandleError("read: the response body is not streamed");
        }
        if (!reads_->send(read)) {
            throw HandleError("read: the response body stream is closed");
        }
    }
}  // namespace http::request
