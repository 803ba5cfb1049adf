#include "head_parser.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

#include "../../utils/string_utils.hpp"

namespace http::client {
    namespace {
        constexpr long HTTP_INFORMATIONAL_MIN = 100;
        constexpr long HTTP_INFORMATIONAL_MAX = 199;
        constexpr long HTTP_REDIRECT_MIN = 300;
        constexpr long HTTP_REDIRECT_MAX = 399;
        constexpr std::string_view STATUS_LINE_PREFIX = "HTTP/";
        constexpr std::string_view LOCATION = "location";
    }  // namespace

    bool HeadParser::on_line(std::string_view line, long status) {
        if (complete_ || line.empty()) {
            // Trailers.
            return false;
        }

        if (line.starts_with(STATUS_LINE_PREFIX)) {
            headers_.clear();
            return false;
        }

        if (line == "\r\n" || line == "\n") {
            if (status == 0 || (status >= HTTP_INFORMATIONAL_MIN && status <= HTTP_INFORMATIONAL_MAX) || is_followed_redirect(status)) {
                headers_.clear();
                return false;
            }
            return true;
        }

        if ((line.front() == ' ' || line.front() == '\t') && !headers_.empty()) {
            // obs-fold continuation
            headers_.back().second += " " + string_utils::trim(std::string(line));
            return false;
        }

        std::string name;
        std::string value;
        if (string_utils::split_header_line(line, name, value)) {
            headers_.emplace_back(string_utils::to_lower(name), std::move(value));
        }
        return false;
    }

    ResponseHead HeadParser::take_head(long status) {
        complete_ = true;
        ResponseHead head{.status_ = status, .headers_ = std::move(headers_)};
        headers_.clear();
        return head;
    }

    bool HeadParser::is_followed_redirect(long status) const {
        if (!follow_redirects_ || status < HTTP_REDIRECT_MIN || status > HTTP_REDIRECT_MAX) {
            return false;
        }
        return std::ranges::any_of(headers_, [](const http::model::Header& header) { return header.first == LOCATION; });
    }
}  // namespace http::client
