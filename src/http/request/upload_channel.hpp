#ifndef CONDUIT_UPLOAD_CHANNEL_HPP
#define CONDUIT_UPLOAD_CHANNEL_HPP

#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace http::request {
    // Request body pipe between an engine (producer) and the transport
    // (consumer). Holds one chunk; a second feed waits until the transport has
    // drained the first. Closing marks the end of the body.
    class UploadChannel {
       public:
        enum class FeedResult { ACCEPTED, PENDING, CLOSED };
        enum class ReadStatus { DATA, WOULD_BLOCK, END };

        struct ReadResult {
            ReadStatus status_ = ReadStatus::WOULD_BLOCK;
            size_t bytes_ = 0;
        };

        UploadChannel() = default;

        ~UploadChannel() = default;
        UploadChannel(const UploadChannel&) = delete;
        UploadChannel& operator=(const UploadChannel&) = delete;
        UploadChannel(UploadChannel&&) = delete;
        UploadChannel& operator=(UploadChannel&&) = delete;

        // PENDING: on_accepted runs (on the consumer's thread) once the chunk
        // moves into the channel. Only one feed may be pending at a time.
        FeedResult feed(std::string data, std::function<void()> on_accepted);

        // Ends the body. A pending feed is abandoned and its callback dropped.
        void close();
        [[nodiscard]] bool is_closed() const;

        ReadResult read(char* dest, size_t capacity);

        // Invoked whenever data becomes readable or the channel closes.
        void set_consumer_waker(std::function<void()> waker);

       private:
        mutable std::mutex mutex_;
        std::string slot_;
        size_t slot_offset_ = 0;
        bool slot_full_ = false;
        std::optional<std::string> pending_;
        std::function<void()> on_accepted_;
        bool closed_ = false;
        std::function<void()> waker_;
    };
}  // namespace http::request

#endif
