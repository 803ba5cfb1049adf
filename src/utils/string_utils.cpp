#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

#include "constants.hpp"

namespace string_utils {
    bool iequals(std::string_view a, std::string_view b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char l, char r) {
                   return std::tolower(static_cast<unsigned char>(l)) == std::tolower(static_cast<unsigned char>(r));
               });
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string to_lower(std::string_view sv) {
        std::string out(sv);
        for (auto &c : out) {
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c | constants::ASCII_LOWERCASE_BIT);
            }
        }
        return out;
    }

    bool is_token(std::string_view sv) {
        if (sv.empty()) {
            return false;
        }
        static constexpr std::string_view TCHAR_SYMBOLS = "!#$%&'*+-.^_`|~";
        return std::ranges::all_of(sv, [](unsigned char c) { return std::isalnum(c) != 0 || TCHAR_SYMBOLS.find(static_cast<char>(c)) != std::string_view::npos; });
    }

    bool is_valid_header_value(std::string_view sv) {
        return std::ranges::none_of(sv, [](unsigned char c) { return (c < 0x20 && c != '\t') || c == 0x7f; });
    }

    bool split_header_line(std::string_view line, std::string &name, std::string &value) {
        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return false;
        }
        name = trim(std::string(line.substr(0, colon)));
        value = trim(std::string(line.substr(colon + 1)));
        return !name.empty();
    }
}  // namespace string_utils
