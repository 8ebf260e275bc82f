// Example 02: Workers KV Round Trip
//
// Creates a KV namespace, writes a value, reads it back through a raw
// (non-enveloped) request, lists the keys with cursor pagination and deletes
// the namespace again.
//
// Needs CLOUDFLARE_API_TOKEN and CLOUDFLARE_ACCOUNT_ID.

#include <cfpp/client/api_client.hpp>
#include <cfpp/log/spdlog_logger.hpp>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

using namespace cfpp;

asio::awaitable<int> run(ApiClient& client) {
    const auto namespaces = *client.account_path("storage/kv/namespaces");

    // 1. Create (POST is never retried)
    auto created = co_await client.post<Json>(namespaces, Json{{"title", "cfpp-example"}});
    if (!created) {
        std::cerr << "Create failed: " << created.error().describe() << "\n";
        co_return 1;
    }
    const std::string ns = (*created)["id"].get<std::string>();
    std::cout << "Created namespace " << ns << "\n";

    int exit_code = 0;

    // 2. Write a value. The values endpoint takes the raw body.
    auto write = RequestDescriptor::get(namespaces + "/" + ns + "/values/greeting");
    write.method = HttpMethod::Put;
    write.with_body("hello from cfpp", "text/plain");
    auto written = co_await client.pipeline().execute<Json>(write, envelope_decoder<Json>());
    if (!written) {
        std::cerr << "Write failed: " << written.error().describe() << "\n";
        exit_code = 1;
    }

    // 3. Read it back
    auto value = co_await client.get_raw(namespaces + "/" + ns + "/values/greeting");
    if (value && value->has_value()) {
        std::cout << "greeting = " << **value << "\n";
    } else if (value) {
        std::cout << "greeting not found\n";
    } else {
        std::cerr << "Read failed: " << value.error().describe() << "\n";
        exit_code = 1;
    }

    // 4. List keys
    auto keys = client.paginate<Json>(PaginationStrategy::Cursor,
        [&](const PageState& state) {
            return RequestDescriptor::get(QueryParams{}
                .add_if("cursor", state.cursor)
                .append_to(namespaces + "/" + ns + "/keys"));
        });
    auto all = co_await keys.collect();
    if (all) {
        for (const auto& key : *all) {
            std::cout << "  key: " << key.value("name", "") << "\n";
        }
    } else {
        std::cerr << "List failed: " << all.error().describe() << "\n";
        exit_code = 1;
    }

    // 5. Clean up
    auto removed = co_await client.del<Json>(namespaces + "/" + ns);
    if (!removed) {
        std::cerr << "Delete failed: " << removed.error().describe() << "\n";
        exit_code = 1;
    }

    const auto stats = client.pipeline().circuit_breaker().stats();
    std::cout << "\nbreaker: " << to_string(stats.current_state)
              << ", " << stats.total_requests << " operation(s), "
              << stats.failed_requests << " failed\n";
    co_return exit_code;
}

int main() {
    const char* token = std::getenv("CLOUDFLARE_API_TOKEN");
    const char* account = std::getenv("CLOUDFLARE_ACCOUNT_ID");
    if (token == nullptr || account == nullptr) {
        std::cerr << "Set CLOUDFLARE_API_TOKEN and CLOUDFLARE_ACCOUNT_ID first\n";
        return 1;
    }

    set_logger(make_spdlog_console_logger(LogLevel::Warn));

    ClientOptions options;
    options.with_bearer_token(token).with_account_id(account);

    auto client = ApiClient::create(options);
    if (!client) {
        std::cerr << client.error() << "\n";
        return 1;
    }

    try {
        asio::io_context io;
        int exit_code = 0;

        asio::co_spawn(io,
            [&]() -> asio::awaitable<void> {
                exit_code = co_await run(**client);
            },
            asio::detached
        );
        io.run();

        set_logger(nullptr);
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        set_logger(nullptr);
        return 1;
    }
}
