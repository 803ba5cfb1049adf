#ifndef CONDUIT_ENGINE_HPP
#define CONDUIT_ENGINE_HPP

#pragma once

#include <spdlog/spdlog.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "../../concurrency/channel.hpp"
#include "../../concurrency/runtime.hpp"
#include "../client/interface.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"
#include "reply.hpp"
#include "upload_channel.hpp"

namespace http::request {
    using CommandChannel = concurrency::Channel<http::model::UploadCommand>;
    using ReadChannel = concurrency::Channel<http::model::ReadRequest>;

    // Runs one request from descriptor to terminal reply. Every state change
    // happens on the engine's strand; the transport, the upload channel, the
    // timers and the handle's queues only post events to it.
    //
    // Reply discipline: the slot is consumed exactly once, by a terminal reply
    // (reply, fin, error) or by silent abandonment when the caller closed the
    // queue the engine was waiting on. cancel() sends "cancelled" if the slot is
    // still open.
    class RequestEngine : public concurrency::ITask, public std::enable_shared_from_this<RequestEngine> {
       public:
        RequestEngine(concurrency::Runtime& runtime, std::shared_ptr<http::client::ITransport> transport, http::model::Request request, ReplySlot slot,
                      std::optional<CommandChannel::Receiver> commands, std::optional<ReadChannel::Receiver> reads);

        ~RequestEngine() override = default;
        RequestEngine(const RequestEngine&) = delete;
        RequestEngine& operator=(const RequestEngine&) = delete;
        RequestEngine(RequestEngine&&) = delete;
        RequestEngine& operator=(RequestEngine&&) = delete;

        [[nodiscard]] std::shared_ptr<concurrency::Strand> strand() const override { return strand_; }
        void start() override;
        void cancel() override;

       private:
        enum class Phase { CREATED, RACING, AWAITING_HEAD, READING_BODY, STREAMING_IDLE, STREAMING_READ, DONE };

        // Events, always on the strand.
        void on_commands_ready();
        void on_reads_ready();
        void on_feed_accepted(std::uint64_t feed_id);
        void on_head(http::client::HeadResult result);
        void on_chunk(http::client::BodyChunk chunk);
        void on_period_elapsed(std::uint64_t read_id);

        // Upload race.
        void poll_commands();
        void handle_command(http::model::UploadCommand command);
        void finish_race(http::client::HeadResult result);

        // Response.
        void begin_response(http::client::ResponseHead head);
        void request_chunk();
        void poll_reads();
        void start_read(const http::model::ReadRequest& read);
        void flush_chunk();
        void send_fin();
        [[nodiscard]] bool exceeds_read_length() const;

        // Termination.
        void fail(const http::http_error::RequestError& error);
        void abandon(const char* why);
        void teardown_transport();
        void cancel_period_timer();
        void finish();

        template <typename Handler>
        std::function<void()> make_event(Handler handler);

        concurrency::Runtime& runtime_;
        std::shared_ptr<http::client::ITransport> transport_;
        std::shared_ptr<concurrency::Strand> strand_;
        std::shared_ptr<spdlog::logger> logger_;
        const std::uint64_t id_;

        Phase phase_ = Phase::CREATED;
        std::optional<http::model::Request> request_;
        http::model::ResponseBodyMode response_mode_ = http::model::ResponseBodyMode::COMPLETE;
        ReplySlot slot_;

        std::optional<CommandChannel::Receiver> commands_;
        std::optional<ReadChannel::Receiver> reads_;
        std::shared_ptr<UploadChannel> upload_;
        std::unique_ptr<http::client::IExchange> exchange_;

        // Upload race state.
        bool finish_seen_ = false;
        bool feeding_ = false;
        std::uint64_t feed_id_ = 0;
        std::optional<http::client::HeadResult> held_head_;

        // Response state.
        http::model::Response response_;
        std::string buffer_;
        bool chunk_outstanding_ = false;
        bool body_end_ = false;
        std::optional<http::http_error::RequestError> body_error_;
        size_t read_length_ = constants::DEFAULT_READ_LENGTH;
        std::uint64_t read_id_ = 0;
        std::optional<concurrency::TimerId> period_timer_;
    };
}  // namespace http::request

#endif
