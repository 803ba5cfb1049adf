#ifndef CONDUIT_REQUEST_OPTIONS_HPP
#define CONDUIT_REQUEST_OPTIONS_HPP

#include <simdjson.h>

#include <string_view>

#include "../model/model.hpp"

namespace http::request {
    // Decodes a request options object:
    //   url, method (required); headers, body, response_body, timeout (optional).
    // Throws BadOptionError for an unknown key and BadArgumentError for a
    // missing or mistyped value. A body array holding a non-string segment is
    // kept and flagged, to be rejected by the build phase.
    [[nodiscard]] http::model::Request parse_request_options(simdjson::ondemand::document& doc);
    [[nodiscard]] http::model::Request parse_request_options(std::string_view json);

    // Decodes a read options object: length (positive integer), period
    // (milliseconds, "infinity" or null). Same exceptions as above.
    [[nodiscard]] http::model::ReadRequest parse_read_options(std::string_view json);
}  // namespace http::request

#endif
