#include "request_builder.hpp"

#include <stdexcept>
#include <string>

#include "../../utils/string_utils.hpp"
#include "../model/url.hpp"

namespace http::request {
    using http::http_error::ErrorCode;
    using http::http_error::RequestError;

    BuildError::BuildError(RequestError error) : std::runtime_error(error.reason_), error_(std::move(error)) {}

    http::model::PreparedRequest build_request(http::model::Request request) {
        http::model::PreparedRequest prepared;
        prepared.method_ = request.method_;

        try {
            prepared.url_ = http::model::parse_url(request.url_).normalized_;
        } catch (const std::invalid_argument& e) {
            throw BuildError(RequestError::from_reason(ErrorCode::URL, e.what()));
        }

        prepared.headers_.reserve(request.headers_.size());
        for (auto& [name, value] : request.headers_) {
            if (!string_utils::is_token(name)) {
                throw BuildError(RequestError::from_reason(ErrorCode::REQUEST, "invalid HTTP header name: \"" + name + "\""));
            }
            if (!string_utils::is_valid_header_value(value)) {
                throw BuildError(RequestError::from_reason(ErrorCode::REQUEST, "failed to parse header value for \"" + name + "\""));
            }
            prepared.headers_.emplace_back(string_utils::to_lower(name), std::move(value));
        }

        prepared.body_mode_ = request.body_.mode_;
        if (request.body_.mode_ == http::model::BodyMode::COMPLETE) {
            if (!request.body_.well_formed_) {
                throw BuildError(RequestError::from_reason(ErrorCode::REQUEST, "bad request body"));
            }
            prepared.body_ = request.body_.concatenate();
        }

        prepared.timeout_ = request.timeout_;
        return prepared;
    }
}  // namespace http::request
