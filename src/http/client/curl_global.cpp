#include "curl_global.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>

#include "../../utils/logging.hpp"

namespace http::client {

    std::mutex CurlGlobal::mutex_;
    size_t CurlGlobal::users_ = 0;

    CurlGlobal::CurlGlobal() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (users_ == 0) {
            const auto rc = curl_global_init(CURL_GLOBAL_ALL);
            if (rc != CURLE_OK) {
                throw std::runtime_error(std::string("Failed to initialize libcurl: ") + curl_easy_strerror(rc));
            }
            logging::get()->debug("libcurl initialized: {}", curl_version());
        }
        ++users_;
    }

    CurlGlobal::~CurlGlobal() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (--users_ == 0) {
            curl_global_cleanup();
        }
    }

}  // namespace http::client
