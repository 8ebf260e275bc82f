// Example 01: List Zones
//
// Walks every zone of the account behind CLOUDFLARE_API_TOKEN, page by page,
// through the resilience pipeline. Ctrl+C cancels the walk cleanly.

#include <cfpp/client/api_client.hpp>
#include <cfpp/log/spdlog_logger.hpp>

#include <asio/bind_cancellation_slot.hpp>
#include <asio/cancellation_signal.hpp>
#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace cfpp;

struct Zone {
    std::string id;
    std::string name;
    std::string status;
};

void from_json(const Json& j, Zone& zone) {
    zone.id = j.at("id").get<std::string>();
    zone.name = j.value("name", "");
    zone.status = j.value("status", "");
}

asio::awaitable<int> run(ApiClient& client) {
    auto zones = client.paginate<Zone>(PaginationStrategy::PageNumber,
        [](const PageState& state) {
            return RequestDescriptor::get(QueryParams{}
                .add("page", state.page)
                .add("per_page", state.per_page)
                .append_to("zones"));
        },
        PageState{1, 50});

    std::size_t count = 0;
    while (auto zone = co_await zones.next()) {
        if (zone->has_value() == false) {
            std::cerr << "ERROR: " << zone->error().describe() << "\n";
            co_return 1;
        }
        const Zone& z = **zone;
        std::cout << "  " << z.id << "  " << z.name << " (" << z.status << ")\n";
        ++count;
    }

    std::cout << "\n" << count << " zone(s) in " << zones.pages_fetched() << " page(s)\n";
    co_return 0;
}

int main() {
    const char* token = std::getenv("CLOUDFLARE_API_TOKEN");
    if (token == nullptr) {
        std::cerr << "Set CLOUDFLARE_API_TOKEN first\n";
        return 1;
    }

    set_logger(make_spdlog_console_logger(LogLevel::Info));

    ClientOptions options;
    options.with_bearer_token(token);
    options.resilience.with_max_retries(3).with_proactive_throttling(0.1, std::chrono::seconds{5});

    auto client = ApiClient::create(options);
    if (!client) {
        std::cerr << client.error() << "\n";
        return 1;
    }

    try {
        asio::io_context io;
        asio::cancellation_signal cancel;
        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&cancel](const asio::error_code& ec, int) {
            if (!ec) {
                cancel.emit(asio::cancellation_type::terminal);
            }
        });

        int exit_code = 0;
        asio::co_spawn(io, run(**client),
            asio::bind_cancellation_slot(cancel.slot(),
                [&](std::exception_ptr error, int code) {
                    signals.cancel();
                    if (error) {
                        std::rethrow_exception(error);
                    }
                    exit_code = code;
                }));
        io.run();

        set_logger(nullptr);
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        set_logger(nullptr);
        return 1;
    }
}
