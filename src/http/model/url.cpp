#include "url.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace http::model {
    namespace {
        struct UrlDeleter {
            void operator()(CURLU* handle) const { curl_url_cleanup(handle); }
        };

        struct CurlStringDeleter {
            void operator()(char* p) const { curl_free(p); }
        };

        using UrlHandle = std::unique_ptr<CURLU, UrlDeleter>;
        using CurlString = std::unique_ptr<char, CurlStringDeleter>;

        std::string get_part(CURLU* handle, CURLUPart part) {
            char* raw = nullptr;
            const CURLUcode rc = curl_url_get(handle, part, &raw, 0);
            CurlString owned(raw);
            if (rc != CURLUE_OK || owned == nullptr) {
                return {};
            }
            return {owned.get()};
        }
    }  // namespace

    Url parse_url(std::string_view text) {
        if (text.empty()) {
            throw std::invalid_argument("empty URL");
        }
        if (text.find('\0') != std::string_view::npos) {
            throw std::invalid_argument("URL contains a NUL byte");
        }

        UrlHandle handle(curl_url());
        if (handle == nullptr) {
            throw std::runtime_error("Failed to create CURL URL handle");
        }

        const std::string owned(text);
        const CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, owned.c_str(), CURLU_NON_SUPPORT_SCHEME);
        if (rc != CURLUE_OK) {
            throw std::invalid_argument(std::string("invalid URL: ") + curl_url_strerror(rc));
        }

        Url url;
        url.normalized_ = get_part(handle.get(), CURLUPART_URL);
        url.scheme_ = get_part(handle.get(), CURLUPART_SCHEME);
        url.host_ = get_part(handle.get(), CURLUPART_HOST);

        if (url.host_.empty() && url.scheme_ != "file") {
            throw std::invalid_argument("invalid URL: empty host");
        }

        return url;
    }
}  // namespace http::model
