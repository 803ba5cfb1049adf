#ifndef CONDUIT_HEAD_PARSER_HPP
#define CONDUIT_HEAD_PARSER_HPP

#include <string_view>

#include "../model/model.hpp"
#include "interface.hpp"

namespace http::client {
    // Collects the final response head from raw header lines as libcurl hands
    // them over, status line and terminating blank line included. Interim (1xx),
    // proxy CONNECT (status 0) and followed redirect blocks are discarded.
    class HeadParser {
       public:
        explicit HeadParser(bool follow_redirects) : follow_redirects_(follow_redirects) {}

        // status is the code of the block the line belongs to. Returns true when
        // the line completes the final head; take_head() then hands it out.
        bool on_line(std::string_view line, long status);

        // Also used when the body or the transfer end arrives without a blank line.
        [[nodiscard]] ResponseHead take_head(long status);

        [[nodiscard]] bool is_complete() const { return complete_; }

       private:
        [[nodiscard]] bool is_followed_redirect(long status) const;

        const bool follow_redirects_;
        http::model::HeaderList headers_;
        bool complete_ = false;
    };
}  // namespace http::client

#endif
