#include "engine.hpp"

#include <atomic>
#include <exception>
#include <memory>
#include <string>
#include <utility>

#include "../../utils/logging.hpp"
#include "request_builder.hpp"

namespace http::request {
    using http::client::BodyChunk;
    using http::client::ChunkStatus;
    using http::client::HeadResult;
    using http::client::ResponseHead;
    using http::http_error::ErrorCode;
    using http::http_error::RequestError;
    using http::model::ReadRequest;
    using http::model::UploadCommand;
    using http::model::UploadCommandKind;

    namespace {
        std::atomic<std::uint64_t> next_engine_id{1};
    }  // namespace

    RequestEngine::RequestEngine(concurrency::Runtime& runtime, std::shared_ptr<http::client::ITransport> transport, http::model::Request request,
                                 ReplySlot slot, std::optional<CommandChannel::Receiver> commands, std::optional<ReadChannel::Receiver> reads)
        : runtime_(runtime),
          transport_(std::move(transport)),
          strand_(runtime.make_strand()),
          logger_(logging::get()),
          id_(next_engine_id++),
          request_(std::move(request)),
          slot_(std::move(slot)),
          commands_(std::move(commands)),
          reads_(std::move(reads)) {}

    template <typename Handler>
    std::function<void()> RequestEngine::make_event(Handler handler) {
        return [weak = weak_from_this(), handler = std::move(handler)]() {
            if (auto self = weak.lock()) {
                self->strand_->post([self, handler]() { handler(*self); });
            }
        };
    }

    //
    // Build phase
    //

    void RequestEngine::start() {
        if (phase_ != Phase::CREATED) {
            return;
        }

        http::model::Request request = std::move(*request_);
        request_.reset();
        response_mode_ = request.response_body_;

        http::model::PreparedRequest prepared;
        try {
            prepared = build_request(std::move(request));
        } catch (const BuildError& e) {
            logger_->debug("request {}: build failed: {}", id_, e.what());
            fail(e.error_);
            return;
        }

        const bool streamed_body = prepared.body_mode_ == http::model::BodyMode::STREAM;
        if (streamed_body) {
            upload_ = std::make_shared<UploadChannel>();
        }

        if (commands_.has_value()) {
            commands_->set_notify(make_event([](RequestEngine& self) { self.on_commands_ready(); }));
        }
        if (reads_.has_value()) {
            reads_->set_notify(make_event([](RequestEngine& self) { self.on_reads_ready(); }));
        }

        logger_->debug("request {}: {} {}", id_, http::model::to_string(prepared.method_), prepared.url_);

        auto weak = weak_from_this();
        try {
            exchange_ = transport_->send(std::move(prepared), upload_, [weak](HeadResult result) {
                if (auto self = weak.lock()) {
                    self->strand_->post([self, result = std::move(result)]() mutable { self->on_head(std::move(result)); });
                }
            });
        } catch (const std::exception& e) {
            logger_->error("request {}: transport refused the request: {}", id_, e.what());
            fail(RequestError::from_reason(ErrorCode::UNKNOWN, e.what()));
            return;
        }

        if (streamed_body && commands_.has_value()) {
            phase_ = Phase::RACING;
            poll_commands();
        } else {
            phase_ = Phase::AWAITING_HEAD;
        }
    }

    //
    // Upload race
    //

    void RequestEngine::on_commands_ready() {
        if (phase_ == Phase::RACING) {
            poll_commands();
        }
    }

    void RequestEngine::poll_commands() {
        while (phase_ == Phase::RACING && !feeding_ && !finish_seen_) {
            UploadCommand command;
            switch (commands_->try_recv(command)) {
                case concurrency::RecvStatus::EMPTY:
                    return;
                case concurrency::RecvStatus::CLOSED:
                    // Without a finish signal the caller never asked for a reply.
                    abandon("upload stream closed before finish_send");
                    return;
                case concurrency::RecvStatus::ITEM:
                    break;
            }

            if (held_head_.has_value()) {
                // The response arrived while idle; any command means the caller still wants it.
                HeadResult result = std::move(*held_head_);
                held_head_.reset();
                finish_race(std::move(result));
                return;
            }

            handle_command(std::move(command));
        }
    }

    void RequestEngine::handle_command(UploadCommand command) {
        if (command.kind_ == UploadCommandKind::FINISH_SEND) {
            upload_->close();
            finish_seen_ = true;
            logger_->debug("request {}: request body complete", id_);
            return;
        }

        const std::uint64_t feed_id = ++feed_id_;
        feeding_ = true;
        const auto result = upload_->feed(std::move(command.data_), make_event([feed_id](RequestEngine& self) { self.on_feed_accepted(feed_id); }));

        switch (result) {
            case UploadChannel::FeedResult::ACCEPTED:
                feeding_ = false;
                slot_.send_next();
                break;
            case UploadChannel::FeedResult::PENDING:
                break;
            case UploadChannel::FeedResult::CLOSED:
                // Nothing can accept the chunk any more; only the response can end the race.
                logger_->debug("request {}: upload channel closed under a pending send", id_);
                break;
        }
    }

    void RequestEngine::on_feed_accepted(std::uint64_t feed_id) {
        if (phase_ != Phase::RACING || !feeding_ || feed_id != feed_id_) {
            return;
        }
        feeding_ = false;
        slot_.send_next();
        poll_commands();
    }

    void RequestEngine::on_head(HeadResult result) {
        if (phase_ == Phase::AWAITING_HEAD) {
            finish_race(std::move(result));
            return;
        }
        if (phase_ != Phase::RACING) {
            return;
        }

        if (feeding_) {
            // The server answered before taking the chunk: the response wins and
            // the rest of the upload is moot.
            feeding_ = false;
            if (result.head_.has_value()) {
                upload_->close();
            }
            finish_race(std::move(result));
        } else if (finish_seen_) {
            finish_race(std::move(result));
        } else {
            held_head_ = std::move(result);
            poll_commands();
        }
    }

    void RequestEngine::finish_race(HeadResult result) {
        if (result.error_.has_value()) {
            fail(*result.error_);
            return;
        }

        if (upload_ != nullptr) {
            upload_->close();
        }
        commands_.reset();
        begin_response(std::move(*result.head_));
    }

    //
    // Response phase
    //

    void RequestEngine::begin_response(ResponseHead head) {
        response_.status_ = head.status_;
        response_.headers_ = std::move(head.headers_);
        logger_->debug("request {}: status {}", id_, response_.status_);

        if (response_mode_ == http::model::ResponseBodyMode::COMPLETE) {
            phase_ = Phase::READING_BODY;
            request_chunk();
            return;
        }

        slot_.send_partial(std::move(response_));
        response_ = {};
        phase_ = Phase::STREAMING_IDLE;
        poll_reads();
    }

    void RequestEngine::request_chunk() {
        if (chunk_outstanding_ || body_end_ || body_error_.has_value() || exchange_ == nullptr) {
            return;
        }

        chunk_outstanding_ = true;
        auto weak = weak_from_this();
        exchange_->next_chunk([weak](BodyChunk chunk) {
            if (auto self = weak.lock()) {
                self->strand_->post([self, chunk = std::move(chunk)]() mutable { self->on_chunk(std::move(chunk)); });
            }
        });
    }

    void RequestEngine::on_chunk(BodyChunk chunk) {
        chunk_outstanding_ = false;

        switch (phase_) {
            case Phase::READING_BODY:
                if (chunk.status_ == ChunkStatus::DATA) {
                    buffer_ += chunk.data_;
                    request_chunk();
                } else if (chunk.status_ == ChunkStatus::END) {
                    response_.body_ = std::move(buffer_);
                    buffer_.clear();
                    exchange_.reset();
                    slot_.reply(std::move(response_));
                    finish();
                } else {
                    fail(chunk.error_.value_or(RequestError::from_reason(ErrorCode::BODY, "response body failed")));
                }
                return;

            case Phase::STREAMING_READ:
                if (chunk.status_ == ChunkStatus::DATA) {
                    buffer_ += chunk.data_;
                    if (buffer_.size() >= read_length_) {
                        flush_chunk();
                    } else {
                        request_chunk();
                    }
                } else if (chunk.status_ == ChunkStatus::END) {
                    body_end_ = true;
                    send_fin();
                } else {
                    fail(chunk.error_.value_or(RequestError::from_reason(ErrorCode::BODY, "response body failed")));
                }
                return;

            case Phase::STREAMING_IDLE:
                // Arrived after a period flush; kept for the next pull.
                if (chunk.status_ == ChunkStatus::DATA) {
                    buffer_ += chunk.data_;
                } else if (chunk.status_ == ChunkStatus::END) {
                    body_end_ = true;
                } else {
                    body_error_ = chunk.error_.value_or(RequestError::from_reason(ErrorCode::BODY, "response body failed"));
                }
                return;

            default:
                return;
        }
    }

    void RequestEngine::on_reads_ready() {
        if (phase_ == Phase::STREAMING_IDLE) {
            poll_reads();
        }
    }

    void RequestEngine::poll_reads() {
        if (phase_ != Phase::STREAMING_IDLE) {
            return;
        }

        ReadRequest read;
        switch (reads_->try_recv(read)) {
            case concurrency::RecvStatus::EMPTY:
                return;
            case concurrency::RecvStatus::CLOSED:
                abandon("read stream closed between reads");
                return;
            case concurrency::RecvStatus::ITEM:
                start_read(read);
                return;
        }
    }

    void RequestEngine::start_read(const ReadRequest& read) {
        phase_ = Phase::STREAMING_READ;
        read_length_ = read.length_;
        const std::uint64_t read_id = ++read_id_;

        if (!buffer_.empty() && buffer_.size() >= read_length_) {
            flush_chunk();
            return;
        }
        if (body_error_.has_value()) {
            fail(*body_error_);
            return;
        }
        if (body_end_) {
            send_fin();
            return;
        }

        if (read.period_.has_value()) {
            period_timer_ =
                runtime_.schedule_after(*read.period_, make_event([read_id](RequestEngine& self) { self.on_period_elapsed(read_id); }));
        }
        request_chunk();
    }

    void RequestEngine::on_period_elapsed(std::uint64_t read_id) {
        if (phase_ != Phase::STREAMING_READ || read_id != read_id_) {
            return;
        }
        period_timer_.reset();
        // A chunk pull may still be in flight; whatever it brings lands in the next read.
        flush_chunk();
    }

    void RequestEngine::flush_chunk() {
        cancel_period_timer();
        phase_ = Phase::STREAMING_IDLE;

        std::string out;
        if (exceeds_read_length()) {
            out = buffer_.substr(0, read_length_);
            buffer_.erase(0, read_length_);
        } else {
            out = std::move(buffer_);
            buffer_.clear();
        }

        slot_.send_chunk(std::move(out));
        poll_reads();
    }

    // Length zero takes whatever is buffered.
    bool RequestEngine::exceeds_read_length() const { return read_length_ != 0 && buffer_.size() > read_length_; }

    void RequestEngine::send_fin() {
        if (exceeds_read_length()) {
            // More than one pull's worth is already here; the tail goes out later.
            flush_chunk();
            return;
        }

        cancel_period_timer();
        reads_.reset();
        exchange_.reset();
        std::string out = std::move(buffer_);
        buffer_.clear();
        logger_->debug("request {}: response body complete", id_);
        slot_.fin(std::move(out));
        finish();
    }

    //
    // Termination
    //

    void RequestEngine::fail(const RequestError& error) {
        if (error.code_ != ErrorCode::URL && error.code_ != ErrorCode::REQUEST) {
            logger_->warn("request {}: {} error: {}", id_, http::http_error::to_string(error.code_), error.reason_);
        }
        teardown_transport();
        reads_.reset();
        slot_.error(error);
        finish();
    }

    void RequestEngine::abandon(const char* why) {
        logger_->debug("request {}: abandoned without reply ({})", id_, why);
        teardown_transport();
        slot_.release();
        finish();
    }

    void RequestEngine::teardown_transport() {
        cancel_period_timer();
        // The exchange goes first: closing the upload channel tells the
        // transport the body is complete.
        exchange_.reset();
        if (upload_ != nullptr) {
            upload_->close();
        }
    }

    void RequestEngine::cancel_period_timer() {
        if (period_timer_.has_value()) {
            runtime_.cancel_timer(*period_timer_);
            period_timer_.reset();
        }
    }

    void RequestEngine::finish() {
        phase_ = Phase::DONE;
        commands_.reset();
        reads_.reset();
        held_head_.reset();
        runtime_.release(this);
    }

    void RequestEngine::cancel() {
        if (phase_ == Phase::DONE) {
            return;
        }

        teardown_transport();
        commands_.reset();
        reads_.reset();

        if (slot_.is_open() && slot_.is_caller_reachable()) {
            logger_->debug("request {}: cancelled", id_);
            slot_.error(RequestError::from_reason(ErrorCode::CANCELLED, "request cancelled"));
        } else {
            slot_.release();
        }
        finish();
    }
}  // namespace http::request
