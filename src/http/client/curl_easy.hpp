#ifndef CONDUIT_CURL_EASY_HPP
#define CONDUIT_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <string>

#include "../config/client_config.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    // Maps a libcurl result onto the request error taxonomy.
    [[nodiscard]] http::http_error::ErrorCode classify(CURLcode code);

    // Header line in libcurl's syntax; an empty value is sent as "name;".
    [[nodiscard]] std::string format_header_line(const http::model::Header& header);

    // Owns one easy handle and everything it points into (header list, error
    // buffer). Not thread-safe: used by the transport thread only.
    class CurlEasy {
       public:
        CurlEasy();

        ~CurlEasy();
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        [[nodiscard]] CURL* get() const { return handle_; }

        // Applies client-wide defaults, then the request itself. A streamed body
        // is read through the read callback with unknown length.
        void configure(const http::model::PreparedRequest& request, const http::config::ClientConfig& config);

        void set_private(void* pointer);
        void set_header_callback(curl_write_callback callback, void* userdata);
        void set_write_callback(curl_write_callback callback, void* userdata);
        void set_read_callback(curl_read_callback callback, void* userdata);

        [[nodiscard]] long response_code() const;
        [[nodiscard]] http::http_error::RequestError make_error(CURLcode code) const;

       private:
        template <typename T>
        void setopt(CURLoption option, T value);

        void set_defaults(const http::config::ClientConfig& config);
        void set_method(const http::model::PreparedRequest& request);
        void set_headers(const http::model::PreparedRequest& request);

        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};
        CURL* handle_{};
    };
}  // namespace http::client

#endif
