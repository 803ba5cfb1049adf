#include "model.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include "../../utils/string_utils.hpp"

namespace http::model {
    namespace {
        struct MethodName {
            Method method_;
            const char* name_;
        };

        constexpr std::array<MethodName, 9> METHOD_NAMES = {{
            {Method::OPTIONS, "OPTIONS"},
            {Method::GET, "GET"},
            {Method::POST, "POST"},
            {Method::PUT, "PUT"},
            {Method::DELETE, "DELETE"},
            {Method::HEAD, "HEAD"},
            {Method::TRACE, "TRACE"},
            {Method::CONNECT, "CONNECT"},
            {Method::PATCH, "PATCH"},
        }};
    }  // namespace

    const char* to_string(Method method) {
        for (const auto& entry : METHOD_NAMES) {
            if (entry.method_ == method) {
                return entry.name_;
            }
        }
        return "GET";
    }

    std::optional<Method> parse_method(std::string_view sv) {
        for (const auto& entry : METHOD_NAMES) {
            if (string_utils::iequals(sv, entry.name_)) {
                return entry.method_;
            }
        }
        return std::nullopt;
    }

    RequestBody RequestBody::complete(std::string bytes) {
        RequestBody body;
        body.mode_ = BodyMode::COMPLETE;
        body.segments_.emplace_back(std::move(bytes));
        return body;
    }

    RequestBody RequestBody::stream() {
        RequestBody body;
        body.mode_ = BodyMode::STREAM;
        return body;
    }

    size_t RequestBody::size() const {
        size_t total = 0;
        for (const auto& segment : segments_) {
            total += segment.size();
        }
        return total;
    }

    std::string RequestBody::concatenate() const {
        if (segments_.size() == 1) {
            return segments_.front();
        }
        std::string out;
        out.reserve(size());
        for (const auto& segment : segments_) {
            out += segment;
        }
        return out;
    }
}  // namespace http::model
