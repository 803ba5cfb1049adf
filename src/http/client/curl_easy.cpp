#include "curl_easy.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <stdexcept>
#include <string>

#include "../../utils/string_utils.hpp"

namespace http::client {
    using http::http_error::ErrorCode;

    struct CurlDefaults {
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long TCP_KEEPIDLE = 120L;
        static constexpr long TCP_KEEPINTVL = 60L;
        static constexpr curl_off_t UNKNOWN_SIZE = -1;
        static constexpr const char* HTTPS_ONLY = "https";
        static constexpr const char* NO_EXPECT = "Expect:";
    };

    ErrorCode classify(CURLcode code) {
        switch (code) {
            case CURLE_OPERATION_TIMEDOUT:
                return ErrorCode::TIMEOUT;
            case CURLE_TOO_MANY_REDIRECTS:
                return ErrorCode::REDIRECT;
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_COULDNT_CONNECT:
            case CURLE_SSL_CONNECT_ERROR:
            case CURLE_PEER_FAILED_VERIFICATION:
                return ErrorCode::CONNECT;
            case CURLE_URL_MALFORMAT:
            case CURLE_UNSUPPORTED_PROTOCOL:
                return ErrorCode::URL;
            case CURLE_SEND_ERROR:
            case CURLE_READ_ERROR:
                return ErrorCode::REQUEST;
            case CURLE_RECV_ERROR:
            case CURLE_PARTIAL_FILE:
            case CURLE_BAD_CONTENT_ENCODING:
            case CURLE_WRITE_ERROR:
                return ErrorCode::BODY;
            default:
                return ErrorCode::UNKNOWN;
        }
    }

    std::string format_header_line(const http::model::Header& header) {
        if (header.second.empty()) {
            return header.first + ";";
        }
        return header.first + ": " + header.second;
    }

    CurlEasy::CurlEasy() : handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }
    }

    CurlEasy::~CurlEasy() {
        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }

        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }
    }

    template <typename T>
    void CurlEasy::setopt(CURLoption option, T value) {
        const auto rc = curl_easy_setopt(handle_, option, value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }

    void CurlEasy::configure(const http::model::PreparedRequest& request, const http::config::ClientConfig& config) {
        error_buf_[0] = '\0';

        set_defaults(config);
        setopt(CURLOPT_URL, request.url_.c_str());

        const auto timeout = request.timeout_.value_or(config.timeout_);
        setopt(CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));

        set_method(request);
        set_headers(request);
    }

    void CurlEasy::set_defaults(const http::config::ClientConfig& config) {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
        setopt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config.connect_timeout_.count()));
        setopt(CURLOPT_FOLLOWLOCATION, config.follow_redirects_ ? 1L : 0L);
        setopt(CURLOPT_MAXREDIRS, config.max_redirects_);
        setopt(CURLOPT_USERAGENT, config.user_agent_.c_str());
        setopt(CURLOPT_SSL_VERIFYPEER, config.verify_tls_ ? 1L : 0L);
        setopt(CURLOPT_SSL_VERIFYHOST, config.verify_tls_ ? 2L : 0L);

        if (config.accept_encoding_.has_value()) {
            // Empty string => accept all supported encodings (gzip/deflate/br)
            setopt(CURLOPT_ACCEPT_ENCODING, config.accept_encoding_->c_str());
        }
        if (config.tcp_keepalive_) {
            setopt(CURLOPT_TCP_KEEPALIVE, 1L);
            setopt(CURLOPT_TCP_KEEPIDLE, CurlDefaults::TCP_KEEPIDLE);
            setopt(CURLOPT_TCP_KEEPINTVL, CurlDefaults::TCP_KEEPINTVL);
        }
        // A libcurl built without HTTP/2 refuses 2TLS; fall back to 1.1 there.
        if (!config.http2_ || curl_easy_setopt(handle_, CURLOPT_HTTP_VERSION, static_cast<long>(CURL_HTTP_VERSION_2TLS)) != CURLE_OK) {
            setopt(CURLOPT_HTTP_VERSION, static_cast<long>(CURL_HTTP_VERSION_1_1));
        }

        if (config.proxy_.has_value()) {
            setopt(CURLOPT_PROXY, config.proxy_->c_str());
        }
        if (config.ca_file_.has_value()) {
            setopt(CURLOPT_CAINFO, config.ca_file_->c_str());
        }
        if (config.ca_path_.has_value()) {
            setopt(CURLOPT_CAPATH, config.ca_path_->c_str());
        }
        if (config.https_only_) {
            setopt(CURLOPT_PROTOCOLS_STR, CurlDefaults::HTTPS_ONLY);
            setopt(CURLOPT_REDIR_PROTOCOLS_STR, CurlDefaults::HTTPS_ONLY);
        }
    }

    void CurlEasy::set_method(const http::model::PreparedRequest& request) {
        const char* method = http::model::to_string(request.method_);

        switch (request.body_mode_) {
            case http::model::BodyMode::STREAM:
                setopt(CURLOPT_UPLOAD, 1L);
                setopt(CURLOPT_INFILESIZE_LARGE, CurlDefaults::UNKNOWN_SIZE);
                setopt(CURLOPT_CUSTOMREQUEST, method);
                return;

            case http::model::BodyMode::COMPLETE:
                setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body_.size()));
                setopt(CURLOPT_COPYPOSTFIELDS, request.body_.c_str());
                if (request.method_ != http::model::Method::POST) {
                    setopt(CURLOPT_CUSTOMREQUEST, method);
                }
                return;

            case http::model::BodyMode::NONE:
                break;
        }

        if (request.method_ == http::model::Method::GET) {
            setopt(CURLOPT_HTTPGET, 1L);
        } else if (request.method_ == http::model::Method::HEAD) {
            setopt(CURLOPT_NOBODY, 1L);
        } else {
            setopt(CURLOPT_CUSTOMREQUEST, method);
        }
    }

    void CurlEasy::set_headers(const http::model::PreparedRequest& request) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }

        for (const auto& header : request.headers_) {
            headers_ = curl_slist_append(headers_, format_header_line(header).c_str());
        }

        // libcurl would otherwise wait for "100 Continue" before sending the body.
        const bool has_expect =
            std::ranges::any_of(request.headers_, [](const http::model::Header& header) { return string_utils::iequals(header.first, "expect"); });
        if (request.body_mode_ != http::model::BodyMode::NONE && !has_expect) {
            headers_ = curl_slist_append(headers_, CurlDefaults::NO_EXPECT);
        }

        if (headers_ != nullptr) {
            setopt(CURLOPT_HTTPHEADER, headers_);
        }
    }

    void CurlEasy::set_private(void* pointer) { setopt(CURLOPT_PRIVATE, pointer); }

    void CurlEasy::set_header_callback(curl_write_callback callback, void* userdata) {
        setopt(CURLOPT_HEADERFUNCTION, callback);
        setopt(CURLOPT_HEADERDATA, userdata);
    }

    void CurlEasy::set_write_callback(curl_write_callback callback, void* userdata) {
        setopt(CURLOPT_WRITEFUNCTION, callback);
        setopt(CURLOPT_WRITEDATA, userdata);
    }

    void CurlEasy::set_read_callback(curl_read_callback callback, void* userdata) {
        setopt(CURLOPT_READFUNCTION, callback);
        setopt(CURLOPT_READDATA, userdata);
    }

    long CurlEasy::response_code() const {
        long code = 0;
        if (curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code) != CURLE_OK) {
            return 0;
        }
        return code;
    }

    http::http_error::RequestError CurlEasy::make_error(CURLcode code) const {
        std::string reason = error_buf_[0] != '\0' ? std::string(error_buf_.data()) : std::string(curl_easy_strerror(code));
        return http::http_error::RequestError::from_reason(classify(code), std::move(reason));
    }

}  // namespace http::client
