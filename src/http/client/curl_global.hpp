#ifndef CONDUIT_CURL_GLOBAL_HPP
#define CONDUIT_CURL_GLOBAL_HPP

#include <cstddef>
#include <mutex>

namespace http::client {

    // Scoped libcurl global state. The first live instance initializes libcurl,
    // the last one to go cleans it up, so several transports can coexist.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;

       private:
        static std::mutex mutex_;
        static size_t users_;
    };

}  // namespace http::client

#endif
