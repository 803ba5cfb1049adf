#ifndef CONDUIT_STRING_UTILS_HPP
#define CONDUIT_STRING_UTILS_HPP

#include <string>
#include <string_view>

namespace string_utils {
    bool iequals(std::string_view a, std::string_view b);

    std::string trim(std::string s);

    std::string to_lower(std::string_view sv);

    // RFC 7230 "token": one or more tchar.
    bool is_token(std::string_view sv);

    bool is_valid_header_value(std::string_view sv);

    // Splits "Name: value\r\n" into its parts. Returns false for lines without a colon.
    bool split_header_line(std::string_view line, std::string& name, std::string& value);
}  // namespace string_utils

#endif
