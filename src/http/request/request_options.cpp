#include "request_options.hpp"

#include <simdjson.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../../utils/constants.hpp"
#include "../error/http_error.hpp"

namespace http::request {
    using http::http_error::BadArgumentError;
    using http::http_error::BadOptionError;

    namespace parser {
        template <typename T>
        static T parse_value(simdjson::simdjson_result<T> result, std::string_view key) {
            if (result.error() != simdjson::error_code::SUCCESS) {
                throw BadArgumentError("invalid value for '" + std::string(key) + "'");
            }
            return result.value();
        }

        static simdjson::ondemand::json_type type_of(simdjson::ondemand::value& value, std::string_view key) {
            return parse_value(value.type(), key);
        }

        // Milliseconds, at least min_ms; null gives nullopt, "infinity" gives `infinite`.
        static std::optional<std::chrono::milliseconds> parse_duration(simdjson::ondemand::value& value, std::string_view key,
                                                                       std::optional<std::chrono::milliseconds> infinite, int64_t min_ms) {
            switch (type_of(value, key)) {
                case simdjson::ondemand::json_type::null:
                    return std::nullopt;
                case simdjson::ondemand::json_type::string:
                    if (parse_value(value.get_string(), key) == constants::INFINITY_KEY) {
                        return infinite;
                    }
                    break;
                case simdjson::ondemand::json_type::number: {
                    const int64_t ms = parse_value(value.get_int64(), key);
                    if (ms >= min_ms) {
                        return std::chrono::milliseconds(ms);
                    }
                    break;
                }
                default:
                    break;
            }
            throw BadArgumentError("'" + std::string(key) + "' must be an integer >= " + std::to_string(min_ms) + " or \"infinity\"");
        }

        static http::model::HeaderList parse_headers(simdjson::ondemand::value& value) {
            simdjson::ondemand::array pairs;
            if (value.get_array().get(pairs) != simdjson::error_code::SUCCESS) {
                throw BadArgumentError("'headers' must be an array of [name, value] pairs");
            }

            http::model::HeaderList headers;
            for (auto raw_pair : pairs) {
                simdjson::ondemand::array pair;
                if (raw_pair.get_array().get(pair) != simdjson::error_code::SUCCESS) {
                    throw BadArgumentError("'headers' must be an array of [name, value] pairs");
                }

                std::vector<std::string> parts;
                for (auto part : pair) {
                    std::string_view text;
                    if (part.get_string().get(text) != simdjson::error_code::SUCCESS) {
                        throw BadArgumentError("header names and values must be strings");
                    }
                    parts.emplace_back(text);
                }
                if (parts.size() != 2) {
                    throw BadArgumentError("each header must be a [name, value] pair");
                }
                headers.emplace_back(std::move(parts[0]), std::move(parts[1]));
            }
            return headers;
        }

        static http::model::RequestBody parse_body(simdjson::ondemand::value& value) {
            switch (type_of(value, "body")) {
                case simdjson::ondemand::json_type::null:
                    return http::model::RequestBody::none();

                case simdjson::ondemand::json_type::string:
                    return http::model::RequestBody::complete(std::string(parse_value(value.get_string(), "body")));

                case simdjson::ondemand::json_type::array: {
                    http::model::RequestBody body;
                    body.mode_ = http::model::BodyMode::COMPLETE;
                    for (auto segment : parse_value(value.get_array(), "body")) {
                        std::string_view text;
                        if (segment.get_string().get(text) != simdjson::error_code::SUCCESS) {
                            body.well_formed_ = false;
                            continue;
                        }
                        body.segments_.emplace_back(text);
                    }
                    return body;
                }

                case simdjson::ondemand::json_type::object: {
                    bool stream = false;
                    for (auto raw_field : parse_value(value.get_object(), "body")) {
                        simdjson::ondemand::field field;
                        std::string_view key;
                        if (std::move(raw_field).get(field) != simdjson::error_code::SUCCESS || field.unescaped_key().get(key) != simdjson::error_code::SUCCESS) {
                            throw BadArgumentError("invalid value for 'body'");
                        }
                        if (key != "stream") {
                            throw BadOptionError("body." + std::string(key));
                        }
                        stream = parse_value(field.value().get_bool(), "body.stream");
                    }
                    if (!stream) {
                        throw BadArgumentError("'body' object must be {\"stream\": true}");
                    }
                    return http::model::RequestBody::stream();
                }

                default:
                    throw BadArgumentError("'body' must be a string, an array of strings or {\"stream\": true}");
            }
        }

        static http::model::ResponseBodyMode parse_response_body(simdjson::ondemand::value& value) {
            const std::string_view mode = parse_value(value.get_string(), "response_body");
            if (mode == "complete") {
                return http::model::ResponseBodyMode::COMPLETE;
            }
            if (mode == "stream") {
                return http::model::ResponseBodyMode::STREAM;
            }
            throw BadArgumentError("'response_body' must be \"complete\" or \"stream\"");
        }

        static simdjson::ondemand::document iterate(simdjson::ondemand::parser& parser, const simdjson::padded_string& json) {
            simdjson::ondemand::document doc;
            if (parser.iterate(json).get(doc) != simdjson::error_code::SUCCESS) {
                throw BadArgumentError("options are not valid JSON");
            }
            return doc;
        }
    }  // namespace parser

    http::model::Request parse_request_options(simdjson::ondemand::document& doc) {
        simdjson::ondemand::object object;
        if (doc.get_object().get(object) != simdjson::error_code::SUCCESS) {
            throw BadArgumentError("request options must be a JSON object");
        }

        http::model::Request request;
        bool has_url = false;
        bool has_method = false;

        for (auto raw_field : object) {
            simdjson::ondemand::field field;
            std::string_view raw_key;
            if (std::move(raw_field).get(field) != simdjson::error_code::SUCCESS || field.unescaped_key().get(raw_key) != simdjson::error_code::SUCCESS) {
                throw BadArgumentError("invalid key in request options");
            }
            const std::string key(raw_key);
            simdjson::ondemand::value& value = field.value();

            if (key == "url") {
                request.url_ = std::string(parser::parse_value(value.get_string(), key));
                has_url = true;
            } else if (key == "method") {
                const auto method = http::model::parse_method(parser::parse_value(value.get_string(), key));
                if (!method.has_value()) {
                    throw BadArgumentError("unsupported method");
                }
                request.method_ = *method;
                has_method = true;
            } else if (key == "headers") {
                request.headers_ = parser::parse_headers(value);
            } else if (key == "body") {
                request.body_ = parser::parse_body(value);
            } else if (key == "response_body") {
                request.response_body_ = parser::parse_response_body(value);
            } else if (key == "timeout") {
                // "infinity" is the only way to lift the limit; it reaches libcurl as zero.
                request.timeout_ = parser::parse_duration(value, key, std::chrono::milliseconds::zero(), 1);
            } else {
                throw BadOptionError(key);
            }
        }

        if (!has_url) {
            throw BadArgumentError("missing required option 'url'");
        }
        if (!has_method) {
            throw BadArgumentError("missing required option 'method'");
        }
        return request;
    }

    http::model::Request parse_request_options(std::string_view json) {
        simdjson::ondemand::parser json_parser;
        const simdjson::padded_string padded(json);
        simdjson::ondemand::document doc = parser::iterate(json_parser, padded);
        return parse_request_options(doc);
    }

    http::model::ReadRequest parse_read_options(std::string_view json) {
        simdjson::ondemand::parser json_parser;
        const simdjson::padded_string padded(json);
        simdjson::ondemand::document doc = parser::iterate(json_parser, padded);

        simdjson::ondemand::object object;
        if (doc.get_object().get(object) != simdjson::error_code::SUCCESS) {
            throw BadArgumentError("read options must be a JSON object");
        }

        http::model::ReadRequest read;
        for (auto raw_field : object) {
            simdjson::ondemand::field field;
            std::string_view raw_key;
            if (std::move(raw_field).get(field) != simdjson::error_code::SUCCESS || field.unescaped_key().get(raw_key) != simdjson::error_code::SUCCESS) {
                throw BadArgumentError("invalid key in read options");
            }
            const std::string key(raw_key);
            simdjson::ondemand::value& value = field.value();

            if (key == "length") {
                const int64_t length = parser::parse_value(value.get_int64(), key);
                if (length < 0) {
                    throw BadArgumentError("'length' must be a non-negative integer");
                }
                read.length_ = static_cast<size_t>(length);
            } else if (key == "period") {
                read.period_ = parser::parse_duration(value, key, std::nullopt, 0);
            } else {
                throw BadOptionError(key);
            }
        }
        return read;
    }
}  // namespace http::request
