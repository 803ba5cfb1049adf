#ifndef CONDUIT_LOGGING_HPP
#define CONDUIT_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>

namespace logging {
    // Creates (or reconfigures) the shared "conduit" logger. The level comes from
    // the argument, then CONDUIT_LOG_LEVEL, then defaults to "warn".
    void init(const std::optional<std::string>& level = std::nullopt);

    std::shared_ptr<spdlog::logger> get();
}  // namespace logging

#endif
