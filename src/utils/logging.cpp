#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>

#include "constants.hpp"

namespace logging {
    namespace {
        std::mutex logger_mutex;

        spdlog::level::level_enum resolve_level(const std::optional<std::string>& level) {
            if (level.has_value()) {
                return spdlog::level::from_str(*level);
            }
            if (const char* env = std::getenv(constants::LOG_LEVEL_ENV); env != nullptr) {
                return spdlog::level::from_str(env);
            }
            return spdlog::level::warn;
        }

        std::shared_ptr<spdlog::logger> create_locked() {
            auto logger = spdlog::get(constants::LOGGER_NAME);
            if (logger == nullptr) {
                logger = spdlog::stderr_color_mt(constants::LOGGER_NAME);
                logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [tid %t] %v");
                logger->set_level(resolve_level(std::nullopt));
            }
            return logger;
        }
    }  // namespace

    void init(const std::optional<std::string>& level) {
        std::lock_guard<std::mutex> lock(logger_mutex);
        create_locked()->set_level(resolve_level(level));
    }

    std::shared_ptr<spdlog::logger> get() {
        std::lock_guard<std::mutex> lock(logger_mutex);
        return create_locked();
    }
}  // namespace logging
