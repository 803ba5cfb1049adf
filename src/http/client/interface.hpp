#ifndef CONDUIT_CLIENT_INTERFACE_HPP
#define CONDUIT_CLIENT_INTERFACE_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "../error/http_error.hpp"
#include "../model/model.hpp"
#include "../request/upload_channel.hpp"

namespace http::client {
    struct ResponseHead {
        long status_ = 0;
        http::model::HeaderList headers_;
    };

    // Exactly one of head_ / error_ is set.
    struct HeadResult {
        std::optional<ResponseHead> head_;
        std::optional<http::http_error::RequestError> error_;
    };

    enum class ChunkStatus { DATA, END, ERROR };

    struct BodyChunk {
        ChunkStatus status_ = ChunkStatus::END;
        std::string data_;
        std::optional<http::http_error::RequestError> error_;
    };

    // One in-flight request/response exchange. Destroying it aborts the
    // transfer. Callbacks may run on any thread, even after destruction has
    // begun, and must only hand the result off.
    class IExchange {
       public:
        IExchange() = default;
        virtual ~IExchange() = default;
        IExchange(const IExchange&) = delete;
        IExchange& operator=(const IExchange&) = delete;
        IExchange(IExchange&&) = delete;
        IExchange& operator=(IExchange&&) = delete;

        // Requests the next piece of the response body. At most one request may
        // be outstanding; the callback fires exactly once unless the exchange is
        // destroyed first. Only valid after the head was delivered.
        virtual void next_chunk(std::function<void(BodyChunk)> on_chunk) = 0;
    };

    // Shared by every engine; implementations are internally synchronized.
    class ITransport {
       public:
        ITransport() = default;
        virtual ~ITransport() = default;
        ITransport(const ITransport&) = delete;
        ITransport& operator=(const ITransport&) = delete;
        ITransport(ITransport&&) = delete;
        ITransport& operator=(ITransport&&) = delete;

        // Starts the exchange. upload is non-null for streamed bodies and is
        // read until closed. on_head fires exactly once unless the exchange is
        // destroyed first.
        virtual std::unique_ptr<IExchange> send(http::model::PreparedRequest request, std::shared_ptr<http::request::UploadChannel> upload,
                                                std::function<void(HeadResult)> on_head) = 0;
    };
}  // namespace http::client

#endif
