#ifndef CONDUIT_REQUEST_BUILDER_HPP
#define CONDUIT_REQUEST_BUILDER_HPP

#include <stdexcept>

#include "../error/http_error.hpp"
#include "../model/model.hpp"

namespace http::request {
    struct BuildError : public std::runtime_error {
        http::http_error::RequestError error_;
        explicit BuildError(http::http_error::RequestError error);
    };

    // Validates a descriptor and assembles the transport-ready request. Throws
    // BuildError with code URL for a malformed URL and REQUEST for a malformed
    // header or body.
    [[nodiscard]] http::model::PreparedRequest build_request(http::model::Request request);
}  // namespace http::request

#endif
