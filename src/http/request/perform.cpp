#include "perform.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <utility>

#include "../error/http_error.hpp"
#include "reply.hpp"

namespace http::request {
    using http::http_error::ErrorCode;
    using http::http_error::RequestError;
    using http::http_error::RequestFailedError;

    namespace {
        constexpr std::chrono::milliseconds WAIT_SLICE{1000};
        constexpr const char* PERFORM_TOKEN = "perform";
    }  // namespace

    http::model::Response perform(http::client::Client& client, http::model::Request request, std::optional<std::chrono::milliseconds> wait_limit) {
        if (request.body_.mode_ == http::model::BodyMode::STREAM) {
            throw http::http_error::BadArgumentError("perform: a streamed request body needs a handle");
        }
        request.response_body_ = http::model::ResponseBodyMode::COMPLETE;

        auto replies = std::make_shared<ReplyQueue>();
        auto handle = client.start(std::move(request), PERFORM_TOKEN, replies);

        const auto deadline = wait_limit.has_value() ? std::optional(std::chrono::steady_clock::now() + *wait_limit) : std::nullopt;
        while (true) {
            auto wait = WAIT_SLICE;
            if (deadline.has_value()) {
                const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now());
                if (remaining <= std::chrono::milliseconds::zero()) {
                    handle->cancel_stream();
                    handle->cancel();
                    replies->close();
                    throw RequestFailedError(RequestError::from_reason(ErrorCode::TIMEOUT, "no reply within the wait limit"));
                }
                wait = std::min(wait, remaining);
            }

            auto reply = replies->wait_for(wait);
            if (!reply.has_value() || !reply->terminal_) {
                continue;
            }
            if (reply->kind_ == ReplyKind::ERROR) {
                throw RequestFailedError(reply->error_.value_or(RequestError{}));
            }
            return std::move(*reply->response_);
        }
    }
}  // namespace http::request
