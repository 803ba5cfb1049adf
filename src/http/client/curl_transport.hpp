#ifndef CONDUIT_CURL_TRANSPORT_HPP
#define CONDUIT_CURL_TRANSPORT_HPP

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "../config/client_config.hpp"
#include "curl_global.hpp"
#include "interface.hpp"

namespace http::client {
    struct Transfer;

    // ITransport over a libcurl multi handle. All libcurl calls happen on one
    // dedicated thread; engines reach it through commands and exchange objects.
    class CurlTransport : public ITransport, public std::enable_shared_from_this<CurlTransport> {
       public:
        explicit CurlTransport(http::config::ClientConfig config);

        ~CurlTransport() override;
        CurlTransport(const CurlTransport&) = delete;
        CurlTransport& operator=(const CurlTransport&) = delete;
        CurlTransport(CurlTransport&&) = delete;
        CurlTransport& operator=(CurlTransport&&) = delete;

        std::unique_ptr<IExchange> send(http::model::PreparedRequest request, std::shared_ptr<http::request::UploadChannel> upload,
                                        std::function<void(HeadResult)> on_head) override;

        // Runs fn on the transport thread. False once the transport is stopping.
        // Commands never outlive the transport, so they capture it by raw pointer.
        bool post(std::function<void()> fn);

        // Transport thread only.
        void remove(const std::shared_ptr<Transfer>& transfer);
        void resume(const std::shared_ptr<Transfer>& transfer);

       private:
        void run();
        void run_commands();
        void read_info();
        void add(const std::shared_ptr<Transfer>& transfer);

        CurlGlobal global_;
        const http::config::ClientConfig config_;
        std::shared_ptr<spdlog::logger> logger_;

        CURLM* multi_{};
        std::unordered_map<CURL*, std::shared_ptr<Transfer> > active_;

        std::mutex commands_mutex_;
        std::deque<std::function<void()> > commands_;
        std::atomic<bool> stopping_ = false;
        std::thread thread_;
    };
}  // namespace http::client

#endif
