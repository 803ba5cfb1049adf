#ifndef CONDUIT_REQUEST_HPP
#define CONDUIT_REQUEST_HPP

#include <functional>
#include <memory>

#include "../../concurrency/runtime.hpp"
#include "../client/interface.hpp"
#include "../model/model.hpp"
#include "handle.hpp"
#include "reply.hpp"

namespace http::request {
    // Host scheduler accounting: receives the estimated cost of starting a
    // request, as a percentage of a scheduler timeslice.
    using TimesliceHook = std::function<void(int percent)>;

    [[nodiscard]] int estimate_timeslice_percent(size_t header_count);

    // Spawns an engine for the request and returns the caller's handle. Upload
    // and read queues exist only for streamed request and response bodies.
    // Throws RuntimeShutdownError when the runtime no longer accepts tasks; no
    // reply is ever sent in that case.
    [[nodiscard]] std::shared_ptr<RequestHandle> start_request(concurrency::Runtime& runtime, std::shared_ptr<http::client::ITransport> transport,
                                                               http::model::Request request, CorrelationToken token,
                                                               std::shared_ptr<IReplySink> caller, const TimesliceHook& on_timeslice = nullptr);
}  // namespace http::request

#endif
