#include "request.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <utility>

#include "../../utils/constants.hpp"
#include "../error/http_error.hpp"
#include "engine.hpp"

namespace http::request {
    int estimate_timeslice_percent(size_t header_count) {
        const size_t cost = static_cast<size_t>(constants::TIMESLICE_BASE) + static_cast<size_t>(constants::TIMESLICE_PER_HEADER) * header_count;
        return static_cast<int>(std::min(cost / static_cast<size_t>(constants::TIMESLICE_DIVISOR), static_cast<size_t>(constants::TIMESLICE_MAX_PERCENT)));
    }

    std::shared_ptr<RequestHandle> start_request(concurrency::Runtime& runtime, std::shared_ptr<http::client::ITransport> transport,
                                                 http::model::Request request, CorrelationToken token, std::shared_ptr<IReplySink> caller,
                                                 const TimesliceHook& on_timeslice) {
        if (on_timeslice) {
            const int percent = estimate_timeslice_percent(request.headers_.size());
            if (percent > 0) {
                on_timeslice(percent);
            }
        }

        std::optional<CommandChannel::Sender> command_sender;
        std::optional<CommandChannel::Receiver> command_receiver;
        if (request.body_.mode_ == http::model::BodyMode::STREAM) {
            auto [sender, receiver] = CommandChannel::create();
            command_sender.emplace(std::move(sender));
            command_receiver.emplace(std::move(receiver));
        }

        std::optional<ReadChannel::Sender> read_sender;
        std::optional<ReadChannel::Receiver> read_receiver;
        if (request.response_body_ == http::model::ResponseBodyMode::STREAM) {
            auto [sender, receiver] = ReadChannel::create();
            read_sender.emplace(std::move(sender));
            read_receiver.emplace(std::move(receiver));
        }

        auto engine = std::make_shared<RequestEngine>(runtime, std::move(transport), std::move(request), ReplySlot(std::move(token), std::move(caller)),
                                                      std::move(command_receiver), std::move(read_receiver));

        auto outcome = runtime.spawn(engine);
        if (outcome.result_ == concurrency::SpawnResult::REJECTED) {
            throw http::http_error::RuntimeShutdownError();
        }

        return std::make_shared<RequestHandle>(std::move(outcome.abort_handle_), std::move(command_sender), std::move(read_sender));
    }
}  // namespace http::request
