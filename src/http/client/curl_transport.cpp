#include "curl_transport.hpp"

#include <curl/curl.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "curl_easy.hpp"
#include "head_parser.hpp"
#include "receive_buffer.hpp"

namespace http::client {
    using http::http_error::ErrorCode;
    using http::http_error::RequestError;

    // Per-request libcurl state. head_ is touched by the transport thread only;
    // received_ is shared with the engine.
    struct Transfer {
        CurlEasy easy_;
        std::shared_ptr<http::request::UploadChannel> upload_;

        std::function<void(HeadResult)> on_head_;
        HeadParser head_;
        ReceiveBuffer received_;
        bool active_ = false;

        Transfer(std::shared_ptr<http::request::UploadChannel> upload, std::function<void(HeadResult)> on_head, const http::config::ClientConfig& config)
            : upload_(std::move(upload)), on_head_(std::move(on_head)), head_(config.follow_redirects_), received_(config.receive_buffer_limit_) {}

        void deliver_head(HeadResult result) {
            auto callback = std::move(on_head_);
            on_head_ = nullptr;
            if (callback) {
                callback(std::move(result));
            }
        }

        void deliver_head_ok() {
            HeadResult result;
            result.head_ = head_.take_head(easy_.response_code());
            deliver_head(std::move(result));
        }

        void on_header_line(std::string_view line) {
            if (head_.on_line(line, easy_.response_code())) {
                deliver_head_ok();
            }
        }

        size_t on_body(const char* data, size_t bytes) {
            if (!head_.is_complete()) {
                deliver_head_ok();
            }
            if (!received_.append(std::string_view(data, bytes))) {
                return CURL_WRITEFUNC_PAUSE;
            }
            return bytes;
        }

        size_t on_upload(char* buffer, size_t capacity) {
            const auto result = upload_->read(buffer, capacity);
            switch (result.status_) {
                case http::request::UploadChannel::ReadStatus::DATA:
                    return result.bytes_;
                case http::request::UploadChannel::ReadStatus::END:
                    return 0;
                case http::request::UploadChannel::ReadStatus::WOULD_BLOCK:
                    break;
            }
            return CURL_READFUNC_PAUSE;
        }

        void done(CURLcode result) {
            if (result == CURLE_OK) {
                if (!head_.is_complete()) {
                    deliver_head_ok();
                }
                received_.finish(std::nullopt);
                return;
            }

            RequestError error = easy_.make_error(result);
            if (!head_.is_complete()) {
                HeadResult head;
                head.error_ = std::move(error);
                deliver_head(std::move(head));
                return;
            }
            received_.finish(std::move(error));
        }

        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
            const size_t bytes = size * n_items;
            static_cast<Transfer*>(userdata)->on_header_line(std::string_view(buffer, bytes));
            return bytes;
        }

        static size_t write_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
            return static_cast<Transfer*>(userdata)->on_body(buffer, size * n_items);
        }

        static size_t read_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
            return static_cast<Transfer*>(userdata)->on_upload(buffer, size * n_items);
        }
    };

    namespace {
        class CurlExchange : public IExchange {
           public:
            CurlExchange(std::shared_ptr<CurlTransport> transport, std::shared_ptr<Transfer> transfer)
                : transport_(std::move(transport)), transfer_(std::move(transfer)) {}

            ~CurlExchange() override {
                transfer_->received_.drop_waiter();
                if (!transport_->post([transport = transport_.get(), transfer = transfer_]() { transport->remove(transfer); })) {
                    logging::get()->debug("transport stopping; transfer removed at shutdown");
                }
            }

            CurlExchange(const CurlExchange&) = delete;
            CurlExchange& operator=(const CurlExchange&) = delete;
            CurlExchange(CurlExchange&&) = delete;
            CurlExchange& operator=(CurlExchange&&) = delete;

            void next_chunk(std::function<void(BodyChunk)> on_chunk) override {
                auto pull = transfer_->received_.next_chunk(on_chunk);
                if (!pull.chunk_.has_value()) {
                    return;
                }

                BodyChunk chunk = std::move(*pull.chunk_);
                if (pull.resume_ && !transport_->post([transport = transport_.get(), transfer = transfer_]() { transport->resume(transfer); })) {
                    chunk.status_ = ChunkStatus::ERROR;
                    chunk.data_.clear();
                    chunk.error_ = RequestError::from_reason(ErrorCode::UNKNOWN, "transport stopped");
                }
                on_chunk(std::move(chunk));
            }

           private:
            std::shared_ptr<CurlTransport> transport_;
            std::shared_ptr<Transfer> transfer_;
        };
    }  // namespace

    CurlTransport::CurlTransport(http::config::ClientConfig config) : config_(std::move(config)), logger_(logging::get()), multi_(curl_multi_init()) {
        if (multi_ == nullptr) {
            throw std::runtime_error("Failed to create CURL multi handle");
        }
        thread_ = std::thread([this]() { run(); });
    }

    CurlTransport::~CurlTransport() {
        stopping_ = true;
        curl_multi_wakeup(multi_);
        if (thread_.joinable()) {
            thread_.join();
        }

        for (auto& [handle, transfer] : active_) {
            curl_multi_remove_handle(multi_, handle);
            transfer->active_ = false;
        }
        active_.clear();
        curl_multi_cleanup(multi_);
    }

    std::unique_ptr<IExchange> CurlTransport::send(http::model::PreparedRequest request, std::shared_ptr<http::request::UploadChannel> upload,
                                                   std::function<void(HeadResult)> on_head) {
        auto transfer = std::make_shared<Transfer>(upload, std::move(on_head), config_);

        transfer->easy_.configure(request, config_);
        transfer->easy_.set_private(transfer.get());
        transfer->easy_.set_header_callback(&Transfer::header_cb, transfer.get());
        transfer->easy_.set_write_callback(&Transfer::write_cb, transfer.get());

        if (upload != nullptr) {
            transfer->easy_.set_read_callback(&Transfer::read_cb, transfer.get());
            upload->set_consumer_waker([weak_transport = weak_from_this(), weak_transfer = std::weak_ptr<Transfer>(transfer)]() {
                auto transport = weak_transport.lock();
                auto transfer = weak_transfer.lock();
                if (transport == nullptr || transfer == nullptr) {
                    return;
                }
                if (!transport->post([raw = transport.get(), transfer]() { raw->resume(transfer); })) {
                    transport->logger_->debug("upload wake-up after transport stop ignored");
                }
            });
        }

        if (!post([this, transfer]() { add(transfer); })) {
            throw std::runtime_error("transport is shutting down");
        }
        return std::make_unique<CurlExchange>(shared_from_this(), transfer);
    }

    bool CurlTransport::post(std::function<void()> fn) {
        {
            std::lock_guard<std::mutex> lock(commands_mutex_);
            if (stopping_) {
                return false;
            }
            commands_.push_back(std::move(fn));
        }
        curl_multi_wakeup(multi_);
        return true;
    }

    void CurlTransport::add(const std::shared_ptr<Transfer>& transfer) {
        const CURLMcode mcode = curl_multi_add_handle(multi_, transfer->easy_.get());
        if (mcode != CURLM_OK) {
            logger_->error("curl_multi_add_handle() failed: {}", curl_multi_strerror(mcode));
            HeadResult head;
            head.error_ = RequestError::from_reason(ErrorCode::UNKNOWN, curl_multi_strerror(mcode));
            transfer->deliver_head(std::move(head));
            return;
        }

        transfer->active_ = true;
        active_.emplace(transfer->easy_.get(), transfer);
    }

    void CurlTransport::remove(const std::shared_ptr<Transfer>& transfer) {
        if (!transfer->active_) {
            return;
        }

        curl_multi_remove_handle(multi_, transfer->easy_.get());
        transfer->active_ = false;
        active_.erase(transfer->easy_.get());
    }

    void CurlTransport::resume(const std::shared_ptr<Transfer>& transfer) {
        if (!transfer->active_) {
            return;
        }

        const CURLcode rc = curl_easy_pause(transfer->easy_.get(), transfer->received_.is_paused() ? CURLPAUSE_RECV : CURLPAUSE_CONT);
        if (rc != CURLE_OK) {
            logger_->warn("curl_easy_pause() failed: {}", curl_easy_strerror(rc));
        }
    }

    void CurlTransport::run_commands() {
        std::deque<std::function<void()> > commands;
        {
            std::lock_guard<std::mutex> lock(commands_mutex_);
            commands.swap(commands_);
        }

        for (auto& command : commands) {
            command();
        }
    }

    void CurlTransport::read_info() {
        CURLMsg* msg = nullptr;
        int msgs_in_queue = 0;

        while ((msg = curl_multi_info_read(multi_, &msgs_in_queue)) != nullptr) {
            if (msg->msg != CURLMSG_DONE) {
                continue;
            }

            auto it = active_.find(msg->easy_handle);
            if (it == active_.end()) {
                continue;
            }

            std::shared_ptr<Transfer> transfer = it->second;
            const CURLcode result = msg->data.result;
            remove(transfer);

            if (result != CURLE_OK) {
                logger_->debug("transfer finished: {}", curl_easy_strerror(result));
            }
            transfer->done(result);
        }
    }

    void CurlTransport::run() {
        while (!stopping_) {
            run_commands();

            int running_handles = 0;
            const CURLMcode mcode = curl_multi_perform(multi_, &running_handles);
            if (mcode != CURLM_OK) {
                logger_->error("curl_multi_perform() failed: {}", curl_multi_strerror(mcode));
            }

            read_info();

            const CURLMcode pcode = curl_multi_poll(multi_, nullptr, 0, static_cast<int>(constants::MAX_POLL_TIMEOUT_MS), nullptr);
            if (pcode != CURLM_OK) {
                logger_->error("curl_multi_poll() failed: {}", curl_multi_strerror(pcode));
            }
        }
    }
}  // namespace http::client
