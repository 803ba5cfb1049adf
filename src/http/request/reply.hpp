#ifndef CONDUIT_REPLY_HPP
#define CONDUIT_REPLY_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../error/http_error.hpp"
#include "../model/model.hpp"

namespace http::request {
    // Opaque caller value, returned unchanged in every reply.
    using CorrelationToken = std::string;

    enum class ReplyKind { NEXT, REPLY, CHUNK, FIN, ERROR };

    [[nodiscard]] const char* to_string(ReplyKind kind);

    struct Reply {
        CorrelationToken token_;
        ReplyKind kind_ = ReplyKind::NEXT;
        bool terminal_ = false;
        std::optional<http::model::Response> response_;
        std::string data_;
        std::optional<http::http_error::RequestError> error_;
    };

    // The caller's address. deliver() returns false when the caller is gone.
    class IReplySink {
       public:
        IReplySink() = default;
        virtual ~IReplySink() = default;
        IReplySink(const IReplySink&) = delete;
        IReplySink& operator=(const IReplySink&) = delete;
        IReplySink(IReplySink&&) = delete;
        IReplySink& operator=(IReplySink&&) = delete;

        virtual bool deliver(Reply reply) = 0;
        [[nodiscard]] virtual bool is_reachable() const = 0;
    };

    // Mailbox for callers that block on replies.
    class ReplyQueue : public IReplySink {
       public:
        bool deliver(Reply reply) override;
        [[nodiscard]] bool is_reachable() const override;

        [[nodiscard]] std::optional<Reply> try_pop();
        [[nodiscard]] std::optional<Reply> wait_for(std::chrono::milliseconds timeout);

        // Marks the caller as gone; queued replies are dropped.
        void close();
        [[nodiscard]] size_t size() const;

       private:
        mutable std::mutex mutex_;
        std::condition_variable available_;
        std::deque<Reply> replies_;
        bool closed_ = false;
    };

    class CallbackSink : public IReplySink {
       public:
        explicit CallbackSink(std::function<void(Reply)> callback);

        bool deliver(Reply reply) override;
        [[nodiscard]] bool is_reachable() const override { return true; }

       private:
        std::function<void(Reply)> callback_;
    };

    // Holds the token and caller address until the terminal reply. After a
    // terminal reply or release() the slot is empty and every send is ignored.
    class ReplySlot {
       public:
        ReplySlot(CorrelationToken token, std::shared_ptr<IReplySink> sink);

        [[nodiscard]] bool is_open() const { return sink_ != nullptr; }
        [[nodiscard]] bool is_caller_reachable() const;

        void send_next();
        void send_partial(http::model::Response head);
        void send_chunk(std::string data);

        void reply(http::model::Response response);
        void fin(std::string data);
        void error(http::http_error::RequestError error);

        // Silent abandonment: the caller can no longer observe a reply.
        void release();

       private:
        void send(Reply reply);
        void send_final(Reply reply);

        CorrelationToken token_;
        std::shared_ptr<IReplySink> sink_;
    };
}  // namespace http::request

#endif
