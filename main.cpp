#include <simdjson.h>

#include <array>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "src/http/client/client.hpp"
#include "src/http/config/client_config.hpp"
#include "src/http/error/http_error.hpp"
#include "src/http/request/reply.hpp"
#include "src/http/request/request_options.hpp"
#include "src/utils/logging.hpp"

namespace {
    constexpr size_t STDIN_CHUNK_SIZE = 64UL * 1024UL;
    constexpr std::chrono::milliseconds REPLY_POLL{1000};
    constexpr const char* CLI_TOKEN = "cli";
    constexpr int EXIT_REQUEST_ERROR = 2;

    struct CliArgs {
        std::optional<std::string> config_path_;
        std::optional<std::string> read_path_;
        std::string request_path_;
    };

    std::optional<CliArgs> parse_args(int argc, char** argv) {
        CliArgs args;
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                args.config_path_ = argv[++i];
            } else if (arg == "--read" && i + 1 < argc) {
                args.read_path_ = argv[++i];
            } else if (args.request_path_.empty() && !arg.starts_with("--")) {
                args.request_path_ = arg;
            } else {
                return std::nullopt;
            }
        }
        if (args.request_path_.empty()) {
            return std::nullopt;
        }
        return args;
    }

    std::string load_text(const std::string& path) {
        simdjson::padded_string contents;
        if (simdjson::padded_string::load(path).get(contents) != simdjson::error_code::SUCCESS) {
            throw std::runtime_error("cannot read " + path);
        }
        return std::string(std::string_view(contents));
    }

    void print_head(const http::model::Response& response) {
        std::cerr << "HTTP " << response.status_ << "\n";
        for (const auto& [name, value] : response.headers_) {
            std::cerr << name << ": " << value << "\n";
        }
    }

    // Sends the next piece of stdin, or finishes the body at end of input.
    // Returns false once nothing more will be uploaded.
    bool pump_stdin(http::request::RequestHandle& handle) {
        std::array<char, STDIN_CHUNK_SIZE> buffer{};
        std::cin.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto n = static_cast<size_t>(std::cin.gcount());

        try {
            if (n == 0) {
                handle.finish_send();
                return false;
            }
            handle.send(std::string(buffer.data(), n));
            return true;
        } catch (const http::http_error::HandleError& e) {
            // The response arrived first; the rest of the body is not wanted.
            logging::get()->debug("upload stopped: {}", e.what());
            return false;
        }
    }
}  // namespace

int main(int argc, char** argv) {
    const auto args = parse_args(argc, argv);
    if (!args.has_value()) {
        std::cerr << "usage: conduit [--config file] [--read <read-options.json>] <request.json>" << std::endl;
        return 1;
    }

    try {
        //
        // Collect
        //

        http::config::ClientConfig config;
        if (args->config_path_.has_value()) {
            config = http::config::load_client_config(*args->config_path_);
        }
        logging::init(config.log_level_);

        http::model::Request request = http::request::parse_request_options(load_text(args->request_path_));
        const bool upload_stdin = request.body_.mode_ == http::model::BodyMode::STREAM;
        const http::model::ReadRequest read =
            args->read_path_.has_value() ? http::request::parse_read_options(load_text(*args->read_path_)) : http::model::ReadRequest{};

        //
        // Run
        //

        http::client::Client client(config);
        auto replies = std::make_shared<http::request::ReplyQueue>();
        auto handle = client.start(std::move(request), CLI_TOKEN, replies);

        bool uploading = upload_stdin && pump_stdin(*handle);

        while (true) {
            auto reply = replies->wait_for(REPLY_POLL);
            if (!reply.has_value()) {
                continue;
            }

            switch (reply->kind_) {
                case http::request::ReplyKind::NEXT:
                    if (uploading) {
                        uploading = pump_stdin(*handle);
                    }
                    break;

                case http::request::ReplyKind::REPLY:
                    uploading = false;
                    print_head(*reply->response_);
                    if (reply->terminal_) {
                        std::cout << reply->response_->body_.value_or("") << std::flush;
                        return 0;
                    }
                    handle->read(read);
                    break;

                case http::request::ReplyKind::CHUNK:
                    std::cout << reply->data_ << std::flush;
                    handle->read(read);
                    break;

                case http::request::ReplyKind::FIN:
                    std::cout << reply->data_ << std::flush;
                    return 0;

                case http::request::ReplyKind::ERROR: {
                    const auto error = reply->error_.value_or(http::http_error::RequestError{});
                    std::cerr << "Request Error: " << http::http_error::to_string(error.code_) << ": " << error.reason_ << std::endl;
                    return EXIT_REQUEST_ERROR;
                }
            }
        }
    } catch (const http::http_error::BadOptionError& e) {
        std::cerr << "Bad Option: " << e.key_ << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }
}
