#ifndef CONDUIT_RECEIVE_BUFFER_HPP
#define CONDUIT_RECEIVE_BUFFER_HPP

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "../error/http_error.hpp"
#include "interface.hpp"

namespace http::client {
    // Response bytes between the transport thread (producer) and the engine
    // pulling chunks (consumer). Once limit bytes are waiting, further data is
    // refused and the producer must pause until the consumer drains it.
    // Thread-safe.
    class ReceiveBuffer {
       public:
        struct Pull {
            // Unset when the callback was parked for the next event.
            std::optional<BodyChunk> chunk_;
            // The producer was paused and may continue now.
            bool resume_ = false;
        };

        explicit ReceiveBuffer(size_t limit) : limit_(limit) {}

        // False means the data was not taken and the receive side is now paused.
        bool append(std::string_view data);

        // Ends the body; error set means it failed.
        void finish(std::optional<http::http_error::RequestError> error);

        // Hands out what is ready, or parks on_chunk until append() or finish().
        Pull next_chunk(std::function<void(BodyChunk)> on_chunk);

        void drop_waiter();

        [[nodiscard]] bool is_paused() const;
        [[nodiscard]] size_t buffered() const;

       private:
        const size_t limit_;

        mutable std::mutex mutex_;
        std::string data_;
        bool paused_ = false;
        bool eof_ = false;
        std::optional<http::http_error::RequestError> error_;
        std::function<void(BodyChunk)> waiter_;
    };
}  // namespace http::client

#endif
