#ifndef CONDUIT_HTTP_ERROR_HPP
#define CONDUIT_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

namespace http::http_error {
    enum class ErrorCode { CANCELLED, URL, REQUEST, REDIRECT, CONNECT, TIMEOUT, BODY, UNKNOWN };

    [[nodiscard]] const char* to_string(ErrorCode code);

    // Terminal failure of a request, delivered to the caller as an error reply.
    struct RequestError {
        ErrorCode code_ = ErrorCode::UNKNOWN;
        std::string reason_;

        [[nodiscard]] static RequestError from_reason(ErrorCode code, std::string reason) { return RequestError{.code_ = code, .reason_ = std::move(reason)}; }
    };

    // Missing or mistyped required argument.
    struct BadArgumentError : public std::runtime_error {
        explicit BadArgumentError(const std::string& msg);
    };

    // Unrecognized option key.
    struct BadOptionError : public std::runtime_error {
        std::string key_;
        explicit BadOptionError(std::string key);
    };

    // The handle's channel is absent or closed; the request is no longer controllable.
    struct HandleError : public std::runtime_error {
        explicit HandleError(const std::string& msg);
    };

    struct RuntimeShutdownError : public std::runtime_error {
        RuntimeShutdownError();
    };

    struct ClientClosedError : public std::runtime_error {
        ClientClosedError();
    };

    struct ConfigError : public std::runtime_error {
        explicit ConfigError(const std::string& msg);
    };

    // Thrown by the blocking API when the request ends with an error reply.
    struct RequestFailedError : public std::runtime_error {
        RequestError error_;
        explicit RequestFailedError(RequestError error);
    };
}  // namespace http::http_error

#endif
