#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Paginator
// ═══════════════════════════════════════════════════════════════════════════
// Lazily walks a paginated listing, one page per pipeline execution. Items are
// handed out one at a time; the next page is requested only once the current
// one is drained. Forward-only and not restartable.
//
// Termination:
//   PageNumber  continue while page < total_pages, even past an empty page.
//               Without total_pages, continue while the page was full
//               (count >= per_page), so a short or empty page ends the walk.
//               Pages are counted locally; the echoed page number is ignored.
//   Cursor      continue while the server returned a non-empty cursor.
//
// A failed page fetch is yielded once, as the last element.
//
// Usage:
//   Paginator<Zone> zones(pipeline, PaginationStrategy::PageNumber,
//       [](const PageState& s) {
//           return RequestDescriptor::get(QueryParams{}
//               .add("page", s.page).add("per_page", s.per_page)
//               .append_to("zones"));
//       },
//       page_decoder<Zone>(), PageState{1, 50});
//
//   while (auto item = co_await zones.next()) {
//       if (!*item) { report(item->error()); break; }
//       use(**item);
//   }

#include "cfpp/envelope/envelope.hpp"
#include "cfpp/log/logger.hpp"
#include "cfpp/resilience/pipeline.hpp"
#include "cfpp/transport/http_types.hpp"

#include <asio/awaitable.hpp>
#include <asio/this_coro.hpp>

#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cfpp {

enum class PaginationStrategy {
    PageNumber,
    Cursor
};

[[nodiscard]] constexpr std::string_view to_string(PaginationStrategy strategy) noexcept {
    switch (strategy) {
        case PaginationStrategy::PageNumber: return "page";
        case PaginationStrategy::Cursor:     return "cursor";
    }
    return "unknown";
}

/// What the request builder needs to address the next page
struct PageState {
    int page{1};
    int per_page{0};                      // 0 = server default
    std::optional<std::string> cursor;    // nullopt on the first cursor page
};

using RequestBuilder = std::function<RequestDescriptor(const PageState& state)>;

template <typename T>
class Paginator {
public:
    Paginator(
        Pipeline& pipeline,
        PaginationStrategy strategy,
        RequestBuilder build_request,
        Decoder<Page<T>> decoder = page_decoder<T>(),
        PageState start = {}
    )
        : pipeline_(pipeline)
        , strategy_(strategy)
        , build_request_(std::move(build_request))
        , decoder_(std::move(decoder))
        , state_(std::move(start))
        , log_(pipeline.options().name + ":Paginator")
    {
        if (strategy_ == PaginationStrategy::Cursor) {
            state_.cursor.reset();
        }
        if (state_.page < 1) {
            state_.page = 1;
        }
    }

    Paginator(const Paginator&) = delete;
    Paginator& operator=(const Paginator&) = delete;
    Paginator(Paginator&&) = default;

    /// Next item, an error as the terminal element, or nullopt when done
    [[nodiscard]] asio::awaitable<std::optional<Outcome<T>>> next() {
        co_await asio::this_coro::throw_if_cancelled(false);

        while (buffer_.empty()) {
            if (finished_) {
                co_return std::nullopt;
            }

            const auto cancel_state = co_await asio::this_coro::cancellation_state;
            if (cancel_state.cancelled() != asio::cancellation_type::none) {
                finished_ = true;
                co_return Outcome<T>{tl::unexpected(PipelineError::cancelled())};
            }

            log_.debug("Fetching {} page {} ({} fetched so far)",
                       to_string(strategy_), describe_position(), pages_fetched_);

            auto page = co_await pipeline_.template execute<Page<T>>(build_request_(state_), decoder_);
            ++pages_fetched_;
            if (page.has_value() == false) {
                finished_ = true;
                log_.warn("Page fetch failed after {} page(s): {}", pages_fetched_ - 1, page.error().describe());
                co_return Outcome<T>{tl::unexpected(std::move(page.error()))};
            }

            advance(*page);
            for (auto& item : page->items) {
                buffer_.push_back(std::move(item));
            }
        }

        T item = std::move(buffer_.front());
        buffer_.pop_front();
        ++items_yielded_;
        co_return Outcome<T>{std::move(item)};
    }

    /// Append every remaining item to `items`. On error, whatever was fetched
    /// before the failing page stays in `items`.
    [[nodiscard]] asio::awaitable<Outcome<void>> collect_into(std::vector<T>& items) {
        while (true) {
            auto item = co_await next();
            if (item.has_value() == false) {
                co_return Outcome<void>{};
            }
            if (item->has_value() == false) {
                co_return tl::unexpected(std::move(item->error()));
            }
            items.push_back(std::move(**item));
        }
    }

    /// All-or-nothing: use collect_into() to keep items gathered before an error
    [[nodiscard]] asio::awaitable<Outcome<std::vector<T>>> collect() {
        std::vector<T> items;
        auto drained = co_await collect_into(items);
        if (drained.has_value() == false) {
            co_return tl::unexpected(std::move(drained.error()));
        }
        co_return items;
    }

    [[nodiscard]] bool finished() const noexcept { return finished_ && buffer_.empty(); }
    [[nodiscard]] std::size_t pages_fetched() const noexcept { return pages_fetched_; }
    [[nodiscard]] std::size_t items_yielded() const noexcept { return items_yielded_; }
    [[nodiscard]] const PageState& state() const noexcept { return state_; }
    [[nodiscard]] PaginationStrategy strategy() const noexcept { return strategy_; }

private:
    void advance(const Page<T>& page) {
        if (strategy_ == PaginationStrategy::Cursor) {
            auto cursor = next_cursor(page.pagination);
            if (cursor.has_value() == false) {
                finished_ = true;
                return;
            }
            state_.cursor = std::move(cursor);
            return;
        }

        const auto count = static_cast<int>(page.items.size());
        const int current = state_.page;
        int total_pages = 0;
        int per_page = 0;
        if (const auto* info = std::get_if<PageInfo>(&page.pagination)) {
            total_pages = info->total_pages;
            per_page = info->per_page;
        } else if (const auto* info = std::get_if<CursorInfo>(&page.pagination)) {
            per_page = info->per_page;
        }

        bool more = false;
        if (total_pages > 0) {
            more = current < total_pages;
        } else {
            if (per_page <= 0) {
                per_page = state_.per_page;
            }
            more = per_page > 0 && count >= per_page;
        }

        if (more == false) {
            finished_ = true;
            return;
        }
        state_.page = current + 1;
    }

    [[nodiscard]] std::string describe_position() const {
        if (strategy_ == PaginationStrategy::Cursor) {
            return state_.cursor.value_or("<first>");
        }
        return std::to_string(state_.page);
    }

    Pipeline& pipeline_;
    PaginationStrategy strategy_;
    RequestBuilder build_request_;
    Decoder<Page<T>> decoder_;
    PageState state_;
    ComponentLogger log_;

    std::deque<T> buffer_;
    bool finished_{false};
    std::size_t pages_fetched_{0};
    std::size_t items_yielded_{0};
};

}  // namespace cfpp
