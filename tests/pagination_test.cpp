// ─────────────────────────────────────────────────────────────────────────────
// Pagination Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "cfpp/pagination/paginator.hpp"
#include "helpers/capture_logger.hpp"
#include "helpers/run_coro.hpp"
#include "mocks/mock_http_client.hpp"

#include <asio/io_context.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace cfpp;
using namespace cfpp::testing;
using namespace std::chrono_literals;

namespace {

PipelineOptions quick_options() {
    PipelineOptions options;
    options.name = "pages";
    options.max_retries = 0;
    options.attempt_timeout = 1s;
    options.total_timeout = 2s;
    return options;
}

struct PaginationFixture {
    PaginationFixture() {
        auto client = std::make_unique<MockHttpClient>();
        mock = client.get();
        pipeline = std::make_unique<Pipeline>(std::move(client), quick_options(), std::make_shared<NoBackoff>());
    }

    /// Serve a fixed body per request target; unknown targets answer 404
    void serve(std::map<std::string, std::string> pages) {
        mock->set_response_handler([pages = std::move(pages)](const RecordedRequest& request)
                                       -> HttpClientResult<HttpClientResponse> {
            const auto it = pages.find(request.target);
            if (it == pages.end()) {
                return HttpClientResponse{404, {}, R"({"success":false,"errors":[{"code":7003,"message":"No route"}]})"};
            }
            return HttpClientResponse{200, {{"Content-Type", "application/json"}}, it->second};
        });
    }

    asio::io_context io;
    MockHttpClient* mock{nullptr};
    std::unique_ptr<Pipeline> pipeline;
};

RequestDescriptor page_request(const PageState& state) {
    auto query = QueryParams{}.add("page", state.page);
    if (state.per_page > 0) {
        query.add("per_page", state.per_page);
    }
    return RequestDescriptor::get(query.append_to("zones"));
}

RequestDescriptor cursor_request(const PageState& state) {
    return RequestDescriptor::get(QueryParams{}.add_if("cursor", state.cursor).append_to("keys"));
}

std::string page_body(const std::string& items, const std::string& result_info) {
    return R"({"success":true,"errors":[],"messages":[],"result":)" + items +
           R"(,"result_info":)" + result_info + "}";
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Page Numbers
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Page-number listing follows total_pages", "[pagination][page]") {
    PaginationFixture fx;
    fx.serve({
        {"zones?page=1&per_page=2", page_body("[1,2]", R"({"page":1,"per_page":2,"count":2,"total_pages":3})")},
        {"zones?page=2&per_page=2", page_body("[3,4]", R"({"page":2,"per_page":2,"count":2,"total_pages":3})")},
        {"zones?page=3&per_page=2", page_body("[5]", R"({"page":3,"per_page":2,"count":1,"total_pages":3})")},
    });

    Paginator<int> pages(*fx.pipeline, PaginationStrategy::PageNumber, page_request, page_decoder<int>(), PageState{1, 2});
    auto items = run_coro(fx.io, pages.collect());

    REQUIRE(items.has_value());
    REQUIRE(*items == std::vector<int>{1, 2, 3, 4, 5});
    REQUIRE(pages.pages_fetched() == 3);
    REQUIRE(pages.items_yielded() == 5);
    REQUIRE(pages.finished());
}

TEST_CASE("Without total_pages a short page ends the listing", "[pagination][page]") {
    PaginationFixture fx;
    fx.serve({
        {"zones?page=1&per_page=3", page_body("[1,2,3]", R"({"page":1,"per_page":3,"count":3})")},
        {"zones?page=2&per_page=3", page_body("[4]", R"({"page":2,"per_page":3,"count":1})")},
    });

    Paginator<int> pages(*fx.pipeline, PaginationStrategy::PageNumber, page_request, page_decoder<int>(), PageState{1, 3});
    auto items = run_coro(fx.io, pages.collect());

    REQUIRE(*items == std::vector<int>{1, 2, 3, 4});
    REQUIRE(fx.mock->request_count() == 2);
}

TEST_CASE("An empty page ends the listing", "[pagination][page]") {
    PaginationFixture fx;
    fx.serve({
        {"zones?page=1&per_page=2", page_body("[1,2]", R"({"page":1,"per_page":2})")},
        {"zones?page=2&per_page=2", page_body("[]", R"({"page":2,"per_page":2})")},
    });

    Paginator<int> pages(*fx.pipeline, PaginationStrategy::PageNumber, page_request, page_decoder<int>(), PageState{1, 2});
    auto items = run_coro(fx.io, pages.collect());

    REQUIRE(*items == std::vector<int>{1, 2});
    REQUIRE(pages.pages_fetched() == 2);
}

TEST_CASE("Missing metadata and per_page means a single page", "[pagination][page]") {
    PaginationFixture fx;
    fx.serve({{"zones?page=1", R"({"success":true,"result":[7,8]})"}});

    Paginator<int> pages(*fx.pipeline, PaginationStrategy::PageNumber, page_request);
    auto items = run_coro(fx.io, pages.collect());

    REQUIRE(*items == std::vector<int>{7, 8});
    REQUIRE(fx.mock->request_count() == 1);
}

TEST_CASE("Start page below one is clamped", "[pagination][page]") {
    PaginationFixture fx;
    Paginator<int> pages(*fx.pipeline, PaginationStrategy::PageNumber, page_request, page_decoder<int>(), PageState{-4, 10});

    REQUIRE(pages.state().page == 1);
}

TEST_CASE("Pages are requested lazily", "[pagination][page]") {
    PaginationFixture fx;
    fx.serve({
        {"zones?page=1&per_page=2", page_body("[1,2]", R"({"page":1,"per_page":2,"total_pages":2})")},
        {"zones?page=2&per_page=2", page_body("[3]", R"({"page":2,"per_page":2,"total_pages":2})")},
    });

    Paginator<int> pages(*fx.pipeline, PaginationStrategy::PageNumber, page_request, page_decoder<int>(), PageState{1, 2});

    auto first = run_coro(fx.io, pages.next());
    REQUIRE(first.has_value());
    REQUIRE(**first == 1);
    REQUIRE(fx.mock->request_count() == 1);

    REQUIRE(**run_coro(fx.io, pages.next()) == 2);
    REQUIRE(fx.mock->request_count() == 1);

    REQUIRE(**run_coro(fx.io, pages.next()) == 3);
    REQUIRE(fx.mock->request_count() == 2);

    REQUIRE_FALSE(run_coro(fx.io, pages.next()).has_value());
    REQUIRE_FALSE(run_coro(fx.io, pages.next()).has_value());
    REQUIRE(fx.mock->request_count() == 2);
}

TEST_CASE("An empty page before total_pages does not end the listing", "[pagination][page]") {
    PaginationFixture fx;
    fx.serve({
        {"zones?page=1&per_page=2", page_body("[1,2]", R"({"page":1,"per_page":2,"total_pages":3})")},
        {"zones?page=2&per_page=2", page_body("[]", R"({"page":2,"per_page":2,"total_pages":3})")},
        {"zones?page=3&per_page=2", page_body("[5]", R"({"page":3,"per_page":2,"total_pages":3})")},
    });

    Paginator<int> pages(*fx.pipeline, PaginationStrategy::PageNumber, page_request, page_decoder<int>(), PageState{1, 2});
    auto items = run_coro(fx.io, pages.collect());

    REQUIRE(*items == std::vector<int>{1, 2, 5});
    REQUIRE(fx.mock->request_count() == 3);
}

TEST_CASE("Page numbers advance locally whatever page the server echoes", "[pagination][page]") {
    PaginationFixture fx;
    const std::string stale = page_body("[0,0]", R"({"page":1,"per_page":2,"total_pages":3})");
    fx.serve({
        {"zones?page=1&per_page=2", stale},
        {"zones?page=2&per_page=2", stale},
        {"zones?page=3&per_page=2", stale},
    });

    Paginator<int> pages(*fx.pipeline, PaginationStrategy::PageNumber, page_request, page_decoder<int>(), PageState{1, 2});
    auto items = run_coro(fx.io, pages.collect());

    REQUIRE(items->size() == 6);
    REQUIRE(fx.mock->request_count() == 3);
    REQUIRE(fx.mock->last_request()->target == "zones?page=3&per_page=2");
}

// ═══════════════════════════════════════════════════════════════════════════
// Cursors
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Cursor listing follows the cursor until it disappears", "[pagination][cursor]") {
    PaginationFixture fx;
    fx.serve({
        {"keys", page_body(R"(["a","b"])", R"({"count":2,"cursor":"c1"})")},
        {"keys?cursor=c1", page_body(R"(["c"])", R"({"count":1,"cursor":"c2"})")},
        {"keys?cursor=c2", page_body(R"(["d"])", R"({"count":1,"cursor":""})")},
    });

    Paginator<std::string> keys(*fx.pipeline, PaginationStrategy::Cursor, cursor_request, page_decoder<std::string>());
    auto items = run_coro(fx.io, keys.collect());

    REQUIRE(items.has_value());
    REQUIRE(*items == std::vector<std::string>{"a", "b", "c", "d"});
    REQUIRE(keys.pages_fetched() == 3);
}

TEST_CASE("Cursor listing with an empty first page", "[pagination][cursor]") {
    PaginationFixture fx;
    fx.serve({{"keys", R"({"success":true,"result":[],"result_info":{"count":0,"cursor":null}})"}});

    Paginator<std::string> keys(*fx.pipeline, PaginationStrategy::Cursor, cursor_request, page_decoder<std::string>());
    auto items = run_coro(fx.io, keys.collect());

    REQUIRE(items->empty());
    REQUIRE(keys.finished());
}

TEST_CASE("Start cursor is ignored", "[pagination][cursor]") {
    PaginationFixture fx;
    PageState start;
    start.cursor = "stale";
    Paginator<std::string> keys(*fx.pipeline, PaginationStrategy::Cursor, cursor_request, page_decoder<std::string>(), start);

    REQUIRE_FALSE(keys.state().cursor.has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Failures
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("A failed page is yielded once as the last element", "[pagination][errors]") {
    ScopedCaptureLogger capture;
    PaginationFixture fx;
    fx.serve({
        {"zones?page=1&per_page=1", page_body("[1]", R"({"page":1,"per_page":1,"total_pages":5})")},
    });

    Paginator<int> pages(*fx.pipeline, PaginationStrategy::PageNumber, page_request, page_decoder<int>(), PageState{1, 1});

    REQUIRE(**run_coro(fx.io, pages.next()) == 1);

    auto failed = run_coro(fx.io, pages.next());
    REQUIRE(failed.has_value());
    REQUIRE_FALSE(failed->has_value());
    REQUIRE(failed->error().http_status == 404);

    REQUIRE_FALSE(run_coro(fx.io, pages.next()).has_value());
    REQUIRE(capture->count(LogLevel::Warn, "pages:Paginator") == 1);
}

TEST_CASE("collect reports the first error", "[pagination][errors]") {
    PaginationFixture fx;
    fx.serve({});

    Paginator<int> pages(*fx.pipeline, PaginationStrategy::PageNumber, page_request);
    auto items = run_coro(fx.io, pages.collect());

    REQUIRE_FALSE(items.has_value());
    REQUIRE(items.error().code == PipelineError::Code::HttpError);
}

TEST_CASE("Cancellation ends the walk with Cancelled", "[pagination][cancellation]") {
    PaginationFixture fx;
    fx.mock->set_default_delay(2s);

    Paginator<int> pages(*fx.pipeline, PaginationStrategy::PageNumber, page_request);
    auto item = run_coro_cancelled_after(fx.io, pages.next(), 30ms);

    REQUIRE(item.has_value());
    REQUIRE(item->error().code == PipelineError::Code::Cancelled);
    REQUIRE_FALSE(run_coro(fx.io, pages.next()).has_value());
}

TEST_CASE("Two pages of one item each take exactly two requests", "[pagination][page]") {
    PaginationFixture fx;
    fx.serve({
        {"zones?page=1&per_page=1", page_body(R"([10])", R"({"page":1,"per_page":1,"total_pages":2})")},
        {"zones?page=2&per_page=1", page_body(R"([20])", R"({"page":2,"per_page":1,"total_pages":2})")},
    });

    Paginator<int> pages(*fx.pipeline, PaginationStrategy::PageNumber, page_request, page_decoder<int>(), PageState{1, 1});
    auto items = run_coro(fx.io, pages.collect());

    REQUIRE(*items == std::vector<int>{10, 20});
    REQUIRE(fx.mock->request_count() == 2);
}

TEST_CASE("Cursor requests keep caller filters unchanged", "[pagination][cursor]") {
    PaginationFixture fx;
    fx.serve({
        {"keys?prefix=user%3A", page_body(R"(["user:1"])", R"({"count":1,"cursor":"n1"})")},
        {"keys?prefix=user%3A&cursor=n1", page_body(R"(["user:2"])", R"({"count":1})")},
    });

    Paginator<std::string> keys(*fx.pipeline, PaginationStrategy::Cursor,
        [](const PageState& state) {
            return RequestDescriptor::get(QueryParams{}
                .add("prefix", "user:")
                .add_if("cursor", state.cursor)
                .append_to("keys"));
        },
        page_decoder<std::string>());
    auto items = run_coro(fx.io, keys.collect());

    REQUIRE(items.has_value());
    REQUIRE(items->size() == 2);
    for (const auto& request : fx.mock->requests()) {
        REQUIRE(request.target.starts_with("keys?prefix=user%3A"));
    }
}

TEST_CASE("collect_into keeps the items fetched before a failure", "[pagination][errors]") {
    PaginationFixture fx;
    fx.serve({
        {"zones?page=1&per_page=2", page_body("[1,2]", R"({"page":1,"per_page":2,"total_pages":3})")},
    });

    Paginator<int> pages(*fx.pipeline, PaginationStrategy::PageNumber, page_request, page_decoder<int>(), PageState{1, 2});
    std::vector<int> items;
    auto drained = run_coro(fx.io, pages.collect_into(items));

    REQUIRE_FALSE(drained.has_value());
    REQUIRE(drained.error().http_status == 404);
    REQUIRE(items == std::vector<int>{1, 2});
}
