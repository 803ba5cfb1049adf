#ifndef CONDUIT_URL_HPP
#define CONDUIT_URL_HPP

#include <string>
#include <string_view>

namespace http::model {
    struct Url {
        std::string normalized_;
        std::string scheme_;
        std::string host_;
    };

    // Parses an absolute URL with libcurl's URL API. Throws std::invalid_argument
    // carrying libcurl's reason when the text is not a valid absolute URL.
    [[nodiscard]] Url parse_url(std::string_view text);
}  // namespace http::model

#endif
