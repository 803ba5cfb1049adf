#ifndef CONDUIT_CLIENT_HPP
#define CONDUIT_CLIENT_HPP

#include <atomic>
#include <memory>
#include <mutex>

#include "../../concurrency/runtime.hpp"
#include "../config/client_config.hpp"
#include "../model/model.hpp"
#include "../request/handle.hpp"
#include "../request/reply.hpp"
#include "../request/request.hpp"
#include "interface.hpp"

namespace http::client {
    // Owns the runtime and the transport shared by every request it starts.
    class Client {
       public:
        explicit Client(http::config::ClientConfig config = {});

        // Uses the given transport instead of libcurl.
        Client(http::config::ClientConfig config, std::shared_ptr<ITransport> transport);

        ~Client();
        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;
        Client(Client&&) = delete;
        Client& operator=(Client&&) = delete;

        // Throws ClientClosedError once closed, RuntimeShutdownError if the
        // runtime stopped concurrently.
        [[nodiscard]] std::shared_ptr<http::request::RequestHandle> start(http::model::Request request, http::request::CorrelationToken token,
                                                                          std::shared_ptr<http::request::IReplySink> caller);

        void set_timeslice_hook(http::request::TimesliceHook hook);

        // Refuses new requests; running ones are unaffected.
        void close();
        [[nodiscard]] bool is_closed() const { return closed_; }

        // Cancels every running request and waits for each to finish.
        void shutdown();

        [[nodiscard]] const http::config::ClientConfig& config() const { return config_; }
        [[nodiscard]] size_t running_requests() const { return runtime_->live_tasks(); }

       private:
        const http::config::ClientConfig config_;
        // Declared before transport_ so the transport, and any callback thread
        // it runs, goes away while the runtime's pool is still alive.
        std::unique_ptr<concurrency::Runtime> runtime_;
        std::shared_ptr<ITransport> transport_;
        std::atomic<bool> closed_ = false;

        std::mutex hook_mutex_;
        http::request::TimesliceHook timeslice_hook_;
    };
}  // namespace http::client

#endif
