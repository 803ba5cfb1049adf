#ifndef CONDUIT_CLIENT_CONFIG_HPP
#define CONDUIT_CLIENT_CONFIG_HPP

#include <simdjson.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "../../utils/constants.hpp"

namespace http::config {
    struct ClientConfig {
        size_t worker_threads_ = 4;
        std::chrono::milliseconds connect_timeout_{10'000};

        // Applied to requests that carry no timeout of their own. Zero means none.
        std::chrono::milliseconds timeout_{30'000};

        bool follow_redirects_ = true;
        long max_redirects_ = 10;
        std::optional<std::string> proxy_;
        std::optional<std::string> ca_file_;
        std::optional<std::string> ca_path_;
        bool verify_tls_ = true;
        bool https_only_ = false;
        std::string user_agent_ = "conduit/1.0";

        // Empty string: every encoding libcurl supports. nullopt: no Accept-Encoding.
        std::optional<std::string> accept_encoding_ = std::string{};

        bool tcp_keepalive_ = true;
        bool http2_ = true;
        std::optional<std::string> log_level_;

        // Response bytes buffered per exchange before the transfer is paused.
        size_t receive_buffer_limit_ = constants::RECEIVE_HIGH_WATERMARK;
    };

    // Throws ConfigError for unknown keys, mistyped values and unreadable files.
    [[nodiscard]] ClientConfig parse_client_config(simdjson::ondemand::document& doc);
    [[nodiscard]] ClientConfig parse_client_config(std::string_view json);
    [[nodiscard]] ClientConfig load_client_config(const std::filesystem::path& path);
}  // namespace http::config

#endif
