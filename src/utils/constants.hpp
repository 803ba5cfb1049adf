#ifndef CONDUIT_CONSTANTS_HPP
#define CONDUIT_CONSTANTS_HPP

#include <cstddef>

namespace constants {
    inline constexpr int ASCII_LOWERCASE_BIT = 0x20;
    inline constexpr size_t DEFAULT_READ_LENGTH = 8UL * 1024UL * 1024UL;
    inline constexpr size_t RECEIVE_HIGH_WATERMARK = 1024UL * 1024UL;
    inline constexpr long MAX_POLL_TIMEOUT_MS = 1000L;
    inline constexpr int TIMESLICE_BASE = 300;
    inline constexpr int TIMESLICE_PER_HEADER = 6;
    inline constexpr int TIMESLICE_DIVISOR = 100;
    inline constexpr int TIMESLICE_MAX_PERCENT = 100;
    inline constexpr const char* LOGGER_NAME = "conduit";
    inline constexpr const char* LOG_LEVEL_ENV = "CONDUIT_LOG_LEVEL";
    inline constexpr const char* INFINITY_KEY = "infinity";
}  // namespace constants

#endif
