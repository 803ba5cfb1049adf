#ifndef CONDUIT_PERFORM_HPP
#define CONDUIT_PERFORM_HPP

#include <chrono>
#include <optional>

#include "../client/client.hpp"
#include "../model/model.hpp"

namespace http::request {
    // Runs a request with a complete response body and blocks for the outcome.
    // Throws RequestFailedError for an error reply, including TIMEOUT when
    // wait_limit elapses first (the request is then cancelled), and
    // BadArgumentError for a streamed request body.
    [[nodiscard]] http::model::Response perform(http::client::Client& client, http::model::Request request,
                                                std::optional<std::chrono::milliseconds> wait_limit = std::nullopt);
}  // namespace http::request

#endif
