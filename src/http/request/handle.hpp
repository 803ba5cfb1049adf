#ifndef CONDUIT_HANDLE_HPP
#define CONDUIT_HANDLE_HPP

#include <mutex>
#include <optional>
#include <string>

#include "../../concurrency/runtime.hpp"
#include "../model/model.hpp"
#include "engine.hpp"

namespace http::request {
    // The caller's control surface over one running request. It never touches
    // engine state directly: everything goes through the abort handle and the
    // two queues. Destroying the handle closes both queues. Safe to share
    // between threads.
    class RequestHandle {
       public:
        RequestHandle(concurrency::AbortHandle abort, std::optional<CommandChannel::Sender> commands, std::optional<ReadChannel::Sender> reads);

        ~RequestHandle() = default;
        RequestHandle(const RequestHandle&) = delete;
        RequestHandle& operator=(const RequestHandle&) = delete;
        RequestHandle(RequestHandle&&) = delete;
        RequestHandle& operator=(RequestHandle&&) = delete;

        // Hard abort; idempotent and harmless after the terminal reply.
        void cancel();

        // Closes the upload and read queues only.
        void cancel_stream();

        // Each throws HandleError when the matching queue is absent or closed.
        void send(std::string data);
        void finish_send();
        void read(http::model::ReadRequest read = {});

       private:
        std::mutex mutex_;
        concurrency::AbortHandle abort_;
        std::optional<CommandChannel::Sender> commands_;
        std::optional<ReadChannel::Sender> reads_;
    };
}  // namespace http::request

#endif
