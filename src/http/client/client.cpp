#include "client.hpp"

#include <memory>
#include <utility>

#include "../../utils/logging.hpp"
#include "../error/http_error.hpp"
#include "curl_transport.hpp"

namespace http::client {
    namespace {
        void apply_log_level(const http::config::ClientConfig& config) {
            if (config.log_level_.has_value()) {
                logging::init(config.log_level_);
            }
        }
    }  // namespace

    Client::Client(http::config::ClientConfig config) : config_(std::move(config)) {
        apply_log_level(config_);
        runtime_ = std::make_unique<concurrency::Runtime>(config_.worker_threads_);
        transport_ = std::make_shared<CurlTransport>(config_);
        logging::get()->debug("client started with {} worker thread(s)", config_.worker_threads_);
    }

    Client::Client(http::config::ClientConfig config, std::shared_ptr<ITransport> transport)
        : config_(std::move(config)), transport_(std::move(transport)) {
        apply_log_level(config_);
        runtime_ = std::make_unique<concurrency::Runtime>(config_.worker_threads_);
    }

    Client::~Client() {
        shutdown();
        transport_.reset();
    }

    std::shared_ptr<http::request::RequestHandle> Client::start(http::model::Request request, http::request::CorrelationToken token,
                                                                std::shared_ptr<http::request::IReplySink> caller) {
        if (closed_) {
            throw http::http_error::ClientClosedError();
        }

        http::request::TimesliceHook hook;
        {
            std::lock_guard<std::mutex> lock(hook_mutex_);
            hook = timeslice_hook_;
        }
        return http::request::start_request(*runtime_, transport_, std::move(request), std::move(token), std::move(caller), hook);
    }

    void Client::set_timeslice_hook(http::request::TimesliceHook hook) {
        std::lock_guard<std::mutex> lock(hook_mutex_);
        timeslice_hook_ = std::move(hook);
    }

    void Client::close() { closed_ = true; }

    void Client::shutdown() {
        closed_ = true;
        runtime_->shutdown();
    }
}  // namespace http::client
