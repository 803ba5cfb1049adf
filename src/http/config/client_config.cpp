#include "client_config.hpp"

#include <simdjson.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "../error/http_error.hpp"

namespace http::config {
    using http::http_error::ConfigError;

    namespace parser {
        template <typename T>
        static T parse_value(simdjson::simdjson_result<T> result, std::string_view key) {
            if (result.error() != simdjson::error_code::SUCCESS) {
                throw ConfigError("invalid value for '" + std::string(key) + "': " + simdjson::error_message(result.error()));
            }
            return result.value();
        }

        static bool is_null(simdjson::ondemand::value& value) {
            simdjson::ondemand::json_type type{};
            return value.type().get(type) == simdjson::error_code::SUCCESS && type == simdjson::ondemand::json_type::null;
        }

        static std::string parse_string(simdjson::ondemand::value& value, std::string_view key) {
            return std::string(parse_value(value.get_string(), key));
        }

        static std::optional<std::string> parse_optional_string(simdjson::ondemand::value& value, std::string_view key) {
            if (is_null(value)) {
                return std::nullopt;
            }
            return parse_string(value, key);
        }

        static int64_t parse_non_negative(simdjson::ondemand::value& value, std::string_view key) {
            const int64_t parsed = parse_value(value.get_int64(), key);
            if (parsed < 0) {
                throw ConfigError("'" + std::string(key) + "' must not be negative");
            }
            return parsed;
        }
    }  // namespace parser

    ClientConfig parse_client_config(simdjson::ondemand::document& doc) {
        ClientConfig config;

        simdjson::ondemand::object object;
        if (doc.get_object().get(object) != simdjson::error_code::SUCCESS) {
            throw ConfigError("client configuration must be a JSON object");
        }

        for (auto raw_field : object) {
            simdjson::ondemand::field field;
            std::string_view raw_key;
            if (std::move(raw_field).get(field) != simdjson::error_code::SUCCESS || field.unescaped_key().get(raw_key) != simdjson::error_code::SUCCESS) {
                throw ConfigError("invalid key in client configuration");
            }
            const std::string key(raw_key);
            simdjson::ondemand::value& value = field.value();

            if (key == "worker_threads") {
                const int64_t threads = parser::parse_non_negative(value, key);
                if (threads == 0) {
                    throw ConfigError("'worker_threads' must be positive");
                }
                config.worker_threads_ = static_cast<size_t>(threads);
            } else if (key == "connect_timeout_ms") {
                config.connect_timeout_ = std::chrono::milliseconds(parser::parse_non_negative(value, key));
            } else if (key == "timeout_ms") {
                config.timeout_ = std::chrono::milliseconds(parser::parse_non_negative(value, key));
            } else if (key == "follow_redirects") {
                config.follow_redirects_ = parser::parse_value(value.get_bool(), key);
            } else if (key == "max_redirects") {
                config.max_redirects_ = static_cast<long>(parser::parse_non_negative(value, key));
            } else if (key == "proxy") {
                config.proxy_ = parser::parse_optional_string(value, key);
            } else if (key == "ca_file") {
                config.ca_file_ = parser::parse_optional_string(value, key);
            } else if (key == "ca_path") {
                config.ca_path_ = parser::parse_optional_string(value, key);
            } else if (key == "verify_tls") {
                config.verify_tls_ = parser::parse_value(value.get_bool(), key);
            } else if (key == "https_only") {
                config.https_only_ = parser::parse_value(value.get_bool(), key);
            } else if (key == "user_agent") {
                config.user_agent_ = parser::parse_string(value, key);
            } else if (key == "accept_encoding") {
                config.accept_encoding_ = parser::parse_optional_string(value, key);
            } else if (key == "tcp_keepalive") {
                config.tcp_keepalive_ = parser::parse_value(value.get_bool(), key);
            } else if (key == "http2") {
                config.http2_ = parser::parse_value(value.get_bool(), key);
            } else if (key == "log_level") {
                config.log_level_ = parser::parse_optional_string(value, key);
            } else if (key == "receive_buffer_limit") {
                const int64_t limit = parser::parse_non_negative(value, key);
                if (limit == 0) {
                    throw ConfigError("'receive_buffer_limit' must be positive");
                }
                config.receive_buffer_limit_ = static_cast<size_t>(limit);
            } else {
                throw ConfigError("unknown client configuration key '" + key + "'");
            }
        }

        return config;
    }

    ClientConfig parse_client_config(std::string_view json) {
        simdjson::ondemand::parser parser;
        simdjson::padded_string padded(json);
        simdjson::ondemand::document doc;
        if (auto error = parser.iterate(padded).get(doc); error != simdjson::error_code::SUCCESS) {
            throw ConfigError(std::string("malformed client configuration: ") + simdjson::error_message(error));
        }
        return parse_client_config(doc);
    }

    ClientConfig load_client_config(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path) || !std::filesystem::is_regular_file(path)) {
            throw ConfigError("client configuration file not found: " + path.string());
        }

        simdjson::padded_string contents;
        if (simdjson::padded_string::load(path.string()).get(contents) != simdjson::error_code::SUCCESS) {
            throw ConfigError("cannot read client configuration: " + path.string());
        }

        simdjson::ondemand::parser parser;
        simdjson::ondemand::document doc;
        if (auto error = parser.iterate(contents).get(doc); error != simdjson::error_code::SUCCESS) {
            throw ConfigError(std::string("malformed client configuration: ") + simdjson::error_message(error));
        }
        return parse_client_config(doc);
    }
}  // namespace http::config
