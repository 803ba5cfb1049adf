#ifndef CONDUIT_MODEL_HPP
#define CONDUIT_MODEL_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../../utils/constants.hpp"

namespace http::model {
    enum class Method { OPTIONS, GET, POST, PUT, DELETE, HEAD, TRACE, CONNECT, PATCH };

    [[nodiscard]] const char* to_string(Method method);

    // Case-insensitive. std::nullopt for anything outside the enumeration.
    [[nodiscard]] std::optional<Method> parse_method(std::string_view sv);

    using Header = std::pair<std::string, std::string>;
    using HeaderList = std::vector<Header>;

    enum class BodyMode { NONE, COMPLETE, STREAM };

    enum class ResponseBodyMode { COMPLETE, STREAM };

    struct RequestBody {
        BodyMode mode_ = BodyMode::NONE;

        // COMPLETE only: the body is the concatenation of the segments.
        std::vector<std::string> segments_;

        // Set by the option decoder when a segment was not a byte string.
        bool well_formed_ = true;

        [[nodiscard]] static RequestBody none() { return {}; }
        [[nodiscard]] static RequestBody complete(std::string bytes);
        [[nodiscard]] static RequestBody stream();
        [[nodiscard]] size_t size() const;
        [[nodiscard]] std::string concatenate() const;
    };

    struct Request {
        Method method_ = Method::GET;
        std::string url_;
        HeaderList headers_;
        RequestBody body_;
        ResponseBodyMode response_body_ = ResponseBodyMode::COMPLETE;
        std::optional<std::chrono::milliseconds> timeout_;
    };

    // Output of the build phase: validated, canonical and ready for a transport.
    struct PreparedRequest {
        Method method_ = Method::GET;
        std::string url_;
        HeaderList headers_;
        BodyMode body_mode_ = BodyMode::NONE;
        std::string body_;
        std::optional<std::chrono::milliseconds> timeout_;
    };

    struct Response {
        long status_ = 0;
        HeaderList headers_;
        std::optional<std::string> body_;
    };

    struct ReadRequest {
        // Zero takes everything buffered.
        size_t length_ = constants::DEFAULT_READ_LENGTH;
        std::optional<std::chrono::milliseconds> period_;
    };

    enum class UploadCommandKind { SEND, FINISH_SEND };

    struct UploadCommand {
        UploadCommandKind kind_ = UploadCommandKind::SEND;
        std::string data_;

        [[nodiscard]] static UploadCommand send(std::string data) { return UploadCommand{.kind_ = UploadCommandKind::SEND, .data_ = std::move(data)}; }
        [[nodiscard]] static UploadCommand finish_send() { return UploadCommand{.kind_ = UploadCommandKind::FINISH_SEND, .data_ = {}}; }
    };
}  // namespace http::model

#endif
