#include "http_error.hpp"

#include <stdexcept>
#include <string>

namespace http::http_error {
    const char *to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::CANCELLED:
                return "cancelled";
            case ErrorCode::URL:
                return "url";
            case ErrorCode::REQUEST:
                return "request";
            case ErrorCode::REDIRECT:
                return "redirect";
            case ErrorCode::CONNECT:
                return "connect";
            case ErrorCode::TIMEOUT:
                return "timeout";
            case ErrorCode::BODY:
                return "body";
            case ErrorCode::UNKNOWN:
                return "unknown";
        }
        return "unknown";
    }

    BadArgumentError::BadArgumentError(const std::string &msg) : std::runtime_error(msg) {}

    BadOptionError::BadOptionError(std::string key) : std::runtime_error("bad_opt: " + key), key_(std::move(key)) {}

    HandleError::HandleError(const std::string &msg) : std::runtime_error(msg) {}

    RuntimeShutdownError::RuntimeShutdownError() : std::runtime_error("bad_runtime: the runtime is shutting down") {}

    ClientClosedError::ClientClosedError() : std::runtime_error("the client was closed") {}

    ConfigError::ConfigError(const std::string &msg) : std::runtime_error(msg) {}

    RequestFailedError::RequestFailedError(RequestError error)
        : std::runtime_error(std::string(to_string(error.code_)) + ": " + error.reason_), error_(std::move(error)) {}
}  // namespace http::http_error
