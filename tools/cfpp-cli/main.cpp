// ─────────────────────────────────────────────────────────────────────────────
// cfpp-cli - Cloudflare API Command-Line Client
// ─────────────────────────────────────────────────────────────────────────────
// Sends requests through the full resilience pipeline (rate limiter, circuit
// breaker, retries, timeouts) and prints the decoded result.
//
// Usage:
//   export CLOUDFLARE_API_TOKEN=xxxx CLOUDFLARE_ACCOUNT_ID=yyyy
//
//   cfpp-cli --get user/tokens/verify
//   cfpp-cli --list zones --per-page 50
//   cfpp-cli --list 'accounts/{account_id}/storage/kv/namespaces/NS/keys' --cursor
//   cfpp-cli --raw 'accounts/{account_id}/storage/kv/namespaces/NS/values/key'
//   cfpp-cli --post 'zones/ZONE/purge_cache' --data '{"purge_everything":true}'
//
// Ctrl-C cancels the running operation, including queued waits and backoff.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include <asio/bind_cancellation_slot.hpp>
#include <asio/cancellation_signal.hpp>
#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include "cfpp/client/api_client.hpp"
#include "cfpp/log/spdlog_logger.hpp"

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace cfpp;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_pipeline_error(const PipelineError& error) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset)
              << color::c(color::bold) << "[" << to_string(error.category()) << "] "
              << color::c(color::reset) << error.describe() << "\n";
    if (error.retry_after.has_value()) {
        std::cerr << color::c(color::dim) << "  retry after " << error.retry_after->count() << "ms"
                  << color::c(color::reset) << "\n";
    }
}

void print_json(const Json& j, bool compact) {
    if (compact) {
        std::cout << j.dump() << "\n";
    } else {
        std::cout << j.dump(2) << "\n";
    }
}

void print_stats(Pipeline& pipeline) {
    const auto breaker = pipeline.circuit_breaker().stats();
    const auto limiter = pipeline.rate_limiter_stats();
    std::cerr << color::c(color::dim)
              << "circuit: " << to_string(breaker.current_state)
              << " (ok " << breaker.successful_requests
              << ", failed " << breaker.failed_requests
              << ", rejected " << breaker.rejected_requests << ")\n"
              << "limiter: admitted " << limiter.admitted
              << ", queued " << limiter.queued
              << ", rejected " << limiter.rejected << "\n";
    if (auto quota = pipeline.quota().snapshot()) {
        std::cerr << "quota:   " << quota->remaining << "/" << quota->limit << "\n";
    }
    std::cerr << color::c(color::reset);
}

// ═══════════════════════════════════════════════════════════════════════════
// Helper Functions
// ═══════════════════════════════════════════════════════════════════════════

// Parse header string "Name: Value" into pair
std::pair<std::string, std::string> parse_header(const std::string& header) {
    auto colon_pos = header.find(':');
    if (colon_pos == std::string::npos) {
        return {header, ""};
    }
    std::string name = header.substr(0, colon_pos);
    std::string value = header.substr(colon_pos + 1);
    auto start = value.find_first_not_of(" \t");
    if (start != std::string::npos) {
        value = value.substr(start);
    }
    return {name, value};
}

std::string get_env(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

// Replace "{account_id}" in a path with the configured account
std::optional<std::string> expand_path(std::string path, const ClientOptions& options) {
    static const std::string placeholder = "{account_id}";
    const auto pos = path.find(placeholder);
    if (pos == std::string::npos) {
        return path;
    }
    if (options.account_id.has_value() == false) {
        return std::nullopt;
    }
    path.replace(pos, placeholder.size(), *options.account_id);
    return path;
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

struct Command {
    enum class Kind { Get, Raw, List, Post, Put, Patch, Delete };

    Kind kind{Kind::Get};
    std::string path;
    Json payload;
    PaginationStrategy strategy{PaginationStrategy::PageNumber};
    int per_page{0};
    int start_page{1};
    std::size_t max_items{0};  // 0 = all
    bool compact{false};
};

asio::awaitable<int> cmd_single(ApiClient& client, const Command& command) {
    Outcome<Json> result = tl::unexpected(PipelineError::cancelled());
    switch (command.kind) {
        case Command::Kind::Get:    result = co_await client.get<Json>(command.path); break;
        case Command::Kind::Post:   result = co_await client.post<Json>(command.path, command.payload); break;
        case Command::Kind::Put:    result = co_await client.put<Json>(command.path, command.payload); break;
        case Command::Kind::Patch:  result = co_await client.patch<Json>(command.path, command.payload); break;
        case Command::Kind::Delete: result = co_await client.del<Json>(command.path); break;
        case Command::Kind::Raw:
        case Command::Kind::List:
            break;
    }

    if (!result) {
        print_pipeline_error(result.error());
        co_return 1;
    }
    print_json(*result, command.compact);
    co_return 0;
}

asio::awaitable<int> cmd_raw(ApiClient& client, const Command& command) {
    auto result = co_await client.get_raw(command.path);
    if (!result) {
        print_pipeline_error(result.error());
        co_return 1;
    }
    if (result->has_value() == false) {
        std::cerr << color::c(color::yellow) << "Not found" << color::c(color::reset) << "\n";
        co_return 2;
    }
    std::cout << **result;
    co_return 0;
}

asio::awaitable<int> cmd_list(ApiClient& client, const Command& command) {
    const std::string path = command.path;
    const bool by_cursor = (command.strategy == PaginationStrategy::Cursor);
    auto paginator = client.paginate<Json>(
        command.strategy,
        [path, by_cursor](const PageState& state) {
            QueryParams query;
            if (state.per_page > 0) {
                query.add("per_page", state.per_page);
            }
            if (by_cursor) {
                query.add_if("cursor", state.cursor);
            } else {
                query.add("page", state.page);
            }
            return RequestDescriptor::get(query.append_to(path));
        },
        PageState{command.start_page, command.per_page, std::nullopt});

    Json items = Json::array();
    while (auto item = co_await paginator.next()) {
        if (item->has_value() == false) {
            // Print what arrived before the failure, then report it
            print_json(items, command.compact);
            print_pipeline_error(item->error());
            co_return 1;
        }
        items.push_back(std::move(**item));
        if (command.max_items > 0 && items.size() >= command.max_items) {
            break;
        }
    }

    print_json(items, command.compact);
    std::cerr << color::c(color::dim) << items.size() << " item(s) in "
              << paginator.pages_fetched() << " page(s)" << color::c(color::reset) << "\n";
    co_return 0;
}

asio::awaitable<int> run_command(ApiClient& client, Command command) {
    switch (command.kind) {
        case Command::Kind::Raw:  co_return co_await cmd_raw(client, command);
        case Command::Kind::List: co_return co_await cmd_list(client, command);
        default:                  co_return co_await cmd_single(client, command);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("cfpp-cli", "Cloudflare API client");

    options.add_options()
        // Commands
        ("get", "GET an enveloped resource", cxxopts::value<std::string>())
        ("raw", "GET a raw (non-enveloped) body", cxxopts::value<std::string>())
        ("list", "List every item of a paginated endpoint", cxxopts::value<std::string>())
        ("post", "POST --data to a path", cxxopts::value<std::string>())
        ("put", "PUT --data to a path", cxxopts::value<std::string>())
        ("patch", "PATCH --data to a path", cxxopts::value<std::string>())
        ("delete", "DELETE a path", cxxopts::value<std::string>())
        ("d,data", "JSON payload for --post/--put/--patch", cxxopts::value<std::string>()->default_value("{}"))

        // Listing
        ("cursor", "Use cursor pagination instead of page numbers")
        ("per-page", "Items per page (0 = server default)", cxxopts::value<int>()->default_value("0"))
        ("page", "First page number", cxxopts::value<int>()->default_value("1"))
        ("max-items", "Stop after this many items (0 = all)", cxxopts::value<std::size_t>()->default_value("0"))

        // Connection
        ("config", "JSON client options file", cxxopts::value<std::string>())
        ("token", "API token (or CLOUDFLARE_API_TOKEN)", cxxopts::value<std::string>())
        ("account", "Account ID for {account_id} (or CLOUDFLARE_ACCOUNT_ID)", cxxopts::value<std::string>())
        ("base-url", "API base URL", cxxopts::value<std::string>())
        ("H,header", "Extra header (repeatable, 'Name: Value')", cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("insecure", "Skip TLS certificate verification")

        // Resilience
        ("retries", "Retries after the first attempt", cxxopts::value<std::size_t>())
        ("attempt-timeout", "Per-attempt timeout in ms (0 = off)", cxxopts::value<long>())
        ("total-timeout", "Whole-operation timeout in ms (0 = off)", cxxopts::value<long>())
        ("permits", "Concurrent requests allowed", cxxopts::value<std::size_t>())
        ("queue", "Requests allowed to wait for a permit", cxxopts::value<std::size_t>())
        ("retry-429", "Retry HTTP 429 responses")
        ("throttle", "Slow down when the server quota runs low")

        // Output
        ("l,log-level", "trace, debug, info, warn, error, off", cxxopts::value<std::string>()->default_value("warn"))
        ("log-file", "Write logs to a file instead of stderr", cxxopts::value<std::string>())
        ("stats", "Print pipeline statistics afterwards")
        ("c,compact", "Single-line JSON output")
        ("no-color", "Disable colored output")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    cfpp-cli --get user/tokens/verify\n";
            std::cout << "    cfpp-cli --list zones --per-page 50 --stats\n";
            std::cout << "    cfpp-cli --list 'accounts/{account_id}/storage/kv/namespaces/NS/keys' --cursor\n";
            std::cout << "    cfpp-cli --post 'zones/ZONE/purge_cache' -d '{\"purge_everything\":true}'\n";
            return 0;
        }

        color::enabled = !result.count("no-color");

        // Logging
        const auto level = parse_log_level(result["log-level"].as<std::string>());
        if (!level) {
            print_error("Unknown log level: " + result["log-level"].as<std::string>());
            return 1;
        }
        if (result.count("log-file")) {
            set_logger(make_spdlog_file_logger(result["log-file"].as<std::string>(), *level));
        } else {
            set_logger(make_spdlog_console_logger(*level));
        }

        // Client options: file first, then flags and environment
        ClientOptions client_options;
        if (result.count("config")) {
            const auto path = result["config"].as<std::string>();
            std::ifstream file(path);
            if (!file) {
                print_error("Cannot open config file: " + path);
                return 1;
            }
            const Json document = Json::parse(file, nullptr, false);
            if (document.is_discarded()) {
                print_error("Config file is not valid JSON: " + path);
                return 1;
            }
            auto parsed = ClientOptions::from_json(document);
            if (!parsed) {
                print_error(parsed.error());
                return 1;
            }
            client_options = std::move(*parsed);
        }

        if (result.count("token")) {
            client_options.with_bearer_token(result["token"].as<std::string>());
        } else if (client_options.api_token.empty()) {
            client_options.with_bearer_token(get_env("CLOUDFLARE_API_TOKEN"));
        }
        if (result.count("account")) {
            client_options.with_account_id(result["account"].as<std::string>());
        } else if (auto account = get_env("CLOUDFLARE_ACCOUNT_ID"); account.empty() == false) {
            client_options.with_account_id(account);
        }
        if (result.count("base-url")) {
            client_options.with_base_url(result["base-url"].as<std::string>());
        }
        for (const auto& header : result["header"].as<std::vector<std::string>>()) {
            if (!header.empty()) {
                auto [name, value] = parse_header(header);
                client_options.with_header(name, value);
            }
        }
        if (result.count("insecure")) {
            client_options.with_verify_ssl(false);
        }

        auto& resilience = client_options.resilience;
        if (result.count("retries")) {
            resilience.with_max_retries(result["retries"].as<std::size_t>());
        }
        if (result.count("attempt-timeout")) {
            resilience.with_attempt_timeout(std::chrono::milliseconds{result["attempt-timeout"].as<long>()});
        }
        if (result.count("total-timeout")) {
            resilience.with_total_timeout(std::chrono::milliseconds{result["total-timeout"].as<long>()});
        }
        if (result.count("permits") || result.count("queue")) {
            resilience.with_permits(
                result.count("permits") ? result["permits"].as<std::size_t>() : resilience.permit_limit,
                result.count("queue") ? result["queue"].as<std::size_t>() : resilience.queue_limit);
        }
        if (result.count("retry-429")) {
            resilience.with_rate_limit_retry(true);
        }
        if (result.count("throttle")) {
            resilience.with_proactive_throttling(resilience.quota_low_threshold, resilience.max_throttle_delay);
        }

        // Command
        Command command;
        command.compact = result.count("compact") > 0;
        command.per_page = result["per-page"].as<int>();
        command.start_page = result["page"].as<int>();
        command.max_items = result["max-items"].as<std::size_t>();
        if (result.count("cursor")) {
            command.strategy = PaginationStrategy::Cursor;
        }

        const std::pair<const char*, Command::Kind> kinds[] = {
            {"get", Command::Kind::Get},     {"raw", Command::Kind::Raw},
            {"list", Command::Kind::List},   {"post", Command::Kind::Post},
            {"put", Command::Kind::Put},     {"patch", Command::Kind::Patch},
            {"delete", Command::Kind::Delete}
        };
        std::size_t selected = 0;
        for (const auto& [flag, kind] : kinds) {
            if (result.count(flag)) {
                command.kind = kind;
                command.path = result[flag].as<std::string>();
                ++selected;
            }
        }
        if (selected != 1) {
            print_error("Specify exactly one of --get, --raw, --list, --post, --put, --patch, --delete");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }

        auto path = expand_path(command.path, client_options);
        if (!path) {
            print_error("Path uses {account_id} but no account is configured (--account or CLOUDFLARE_ACCOUNT_ID)");
            return 1;
        }
        command.path = std::move(*path);

        const bool has_payload = command.kind == Command::Kind::Post ||
                                 command.kind == Command::Kind::Put ||
                                 command.kind == Command::Kind::Patch;
        if (has_payload) {
            command.payload = Json::parse(result["data"].as<std::string>(), nullptr, false);
            if (command.payload.is_discarded()) {
                print_error("--data is not valid JSON");
                return 1;
            }
        }

        auto client = ApiClient::create(std::move(client_options));
        if (!client) {
            print_error(client.error());
            return 1;
        }

        // Run, with Ctrl-C wired to the operation's cancellation slot
        asio::io_context io;
        asio::cancellation_signal cancel;
        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&cancel](const asio::error_code& ec, int) {
            if (!ec) {
                std::cerr << color::c(color::yellow) << "Cancelling..." << color::c(color::reset) << "\n";
                cancel.emit(asio::cancellation_type::terminal);
            }
        });

        int exit_code = 1;
        asio::co_spawn(
            io,
            run_command(**client, std::move(command)),
            asio::bind_cancellation_slot(cancel.slot(),
                [&](std::exception_ptr error, int code) {
                    signals.cancel();
                    if (error) {
                        try {
                            std::rethrow_exception(error);
                        } catch (const std::exception& e) {
                            print_error(std::string("Unexpected failure: ") + e.what());
                        }
                        exit_code = 1;
                        return;
                    }
                    exit_code = code;
                }));
        io.run();

        if (result.count("stats")) {
            print_stats((*client)->pipeline());
        }
        set_logger(nullptr);
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
