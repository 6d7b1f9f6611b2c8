#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "duckdb.hpp"
#include "link_header.hpp"
#include "restkit_exceptions.hpp"
#include "restkit_tracing.hpp"

namespace restkit {

template <typename TItem>
class PagedSequence;

// Knows how to fetch and deserialize one page by url. Transport errors thrown
// here reach the caller of Next()/Previous() unchanged.
template <typename TItem>
class PageFetcher {
public:
    virtual ~PageFetcher() = default;

    virtual std::shared_ptr<PagedSequence<TItem>> FetchByUrl(const std::string &url) = 0;
};

struct PaginationOptions {
    bool auto_advance = true;
};

// ----------------------------------------------------------------------

// Link state of one page. Links are derived once from the response headers.
class PaginationState {
public:
    explicit PaginationState(const HeaderMap &headers);

    bool HasLink(PageDirection direction) const;
    const std::optional<std::string> &Link(PageDirection direction) const;

    // Throws NoSuchPageException if the page has no link in that direction.
    const std::string &RequireLink(PageDirection direction, size_t local_size) const;

    const PaginationLinks &Links() const { return links; }

private:
    PaginationLinks links;
    std::optional<std::string> next_link;
    std::optional<std::string> previous_link;
};

// ----------------------------------------------------------------------

// Cache slot for a neighboring page. The page that fetched a neighbor owns it;
// the neighbor only refers back. A back-reference to a released page reads as empty.
template <typename TPage>
class AdjacentPage {
public:
    std::shared_ptr<TPage> Get() const
    {
        if (owned) {
            return owned;
        }
        return borrowed.lock();
    }

    void Own(std::shared_ptr<TPage> page)
    {
        owned = std::move(page);
        borrowed.reset();
    }

    void Borrow(std::weak_ptr<TPage> page)
    {
        owned.reset();
        borrowed = std::move(page);
    }

    // Gives up ownership of the neighbor, if any, and returns it.
    std::shared_ptr<TPage> Release()
    {
        return std::move(owned);
    }

private:
    std::shared_ptr<TPage> owned;
    std::weak_ptr<TPage> borrowed;
};

// ----------------------------------------------------------------------

/**
 * One fetched page of a cursor-paginated result set.
 *
 * Next()/Previous() return the cached neighbor when there is one, whatever
 * the no_cache flag says; no_cache only decides whether a newly fetched page
 * is kept. Item iteration continues into following pages in auto-advance mode
 * and caches every page it visits.
 *
 * Not thread-safe: navigation mutates the adjacency cache.
 */
template <typename TItem>
class PagedSequence : public std::enable_shared_from_this<PagedSequence<TItem>> {
public:
    using Page = PagedSequence<TItem>;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = TItem;
        using difference_type = std::ptrdiff_t;
        using pointer = const TItem *;
        using reference = const TItem &;

        iterator() = default;

        explicit iterator(Page *start)
            : page(start), index(0)
        {
            SkipExhaustedPages(page, index);
        }

        reference operator*() const { return page->items[index]; }
        pointer operator->() const { return &page->items[index]; }

        // If fetching the next page throws, the iterator stays on the current item
        // and a later increment retries the fetch.
        iterator &operator++()
        {
            auto next_page = page;
            auto next_index = index + 1;
            SkipExhaustedPages(next_page, next_index);
            page = next_page;
            index = next_index;
            return *this;
        }

        iterator operator++(int)
        {
            iterator previous = *this;
            ++(*this);
            return previous;
        }

        bool operator==(const iterator &other) const { return page == other.page && index == other.index; }
        bool operator!=(const iterator &other) const { return !(*this == other); }

    private:
        static void SkipExhaustedPages(Page *&page, size_t &index)
        {
            while (page != nullptr && index >= page->items.size()) {
                if (!page->auto_advance || !page->HasNext()) {
                    page = nullptr;
                    index = 0;
                    return;
                }
                // Cached by the current page, which keeps it alive for us
                page = page->Next().get();
                index = 0;
            }
        }

        Page *page = nullptr;
        size_t index = 0;
    };

    PagedSequence(std::vector<TItem> items, const HeaderMap &headers,
                  std::shared_ptr<PageFetcher<TItem>> fetcher,
                  PaginationOptions options = PaginationOptions())
        : items(std::move(items))
        , headers(headers)
        , fetcher(std::move(fetcher))
        , state(headers)
        , auto_advance(options.auto_advance)
    {
        if (this->fetcher == nullptr) {
            throw MissingPageFetcherException();
        }
    }

    // Cached neighbors form an ownership chain as long as the result set. Unlink
    // it page by page so releasing the head does not recurse once per page.
    ~PagedSequence()
    {
        std::vector<std::shared_ptr<Page>> pending;
        ReleaseNeighbors(pending);
        while (!pending.empty()) {
            auto page = std::move(pending.back());
            pending.pop_back();
            if (page.use_count() == 1) {
                page->ReleaseNeighbors(pending);
            }
        }
    }

    PagedSequence(const PagedSequence &) = delete;
    PagedSequence &operator=(const PagedSequence &) = delete;

    bool HasPrevious() const { return state.HasLink(PageDirection::PREVIOUS); }
    bool HasNext() const { return state.HasLink(PageDirection::NEXT); }

    const std::optional<std::string> &PreviousLink() const { return state.Link(PageDirection::PREVIOUS); }
    const std::optional<std::string> &NextLink() const { return state.Link(PageDirection::NEXT); }

    std::shared_ptr<Page> Previous(bool no_cache = false) { return Navigate(PageDirection::PREVIOUS, no_cache); }
    std::shared_ptr<Page> Next(bool no_cache = false) { return Navigate(PageDirection::NEXT, no_cache); }

    std::shared_ptr<Page> CachedPrevious() const { return previous_page.Get(); }
    std::shared_ptr<Page> CachedNext() const { return next_page.Get(); }

    // Items reachable by auto-advancing, counting only pages already fetched.
    size_t Size() const
    {
        size_t total = items.size();
        for (auto page = CachedNext(); page; page = page->CachedNext()) {
            total += page->items.size();
        }
        return total;
    }

    size_t LocalSize() const { return items.size(); }
    const std::vector<TItem> &Items() const { return items; }

    const HeaderMap &Headers() const { return headers; }
    const PaginationLinks &Links() const { return state.Links(); }

    bool IsAutoAdvance() const { return auto_advance; }
    void SetAutoAdvance(bool value) { auto_advance = value; }

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    std::shared_ptr<Page> Navigate(PageDirection direction, bool no_cache)
    {
        auto &slot = direction == PageDirection::NEXT ? next_page : previous_page;
        if (auto cached = slot.Get()) {
            return cached;
        }

        const auto &url = state.RequireLink(direction, items.size());
        RESTKIT_TRACE_DEBUG("PAGINATION", "Fetching " + PageDirectionToString(direction) + " page: " + url);

        auto page = fetcher->FetchByUrl(url);
        if (page == nullptr) {
            throw duckdb::InternalException("Page fetcher returned no page for " + url);
        }
        page->auto_advance = auto_advance;

        if (!no_cache) {
            slot.Own(page);
            auto &back_slot = direction == PageDirection::NEXT ? page->previous_page : page->next_page;
            back_slot.Borrow(this->weak_from_this());
        } else {
            RESTKIT_TRACE_TRACE("PAGINATION", "Not caching " + PageDirectionToString(direction) + " page: " + url);
        }

        return page;
    }

    void ReleaseNeighbors(std::vector<std::shared_ptr<Page>> &released)
    {
        for (auto *slot : {&next_page, &previous_page}) {
            if (auto page = slot->Release()) {
                released.push_back(std::move(page));
            }
        }
    }

    std::vector<TItem> items;
    HeaderMap headers;
    std::shared_ptr<PageFetcher<TItem>> fetcher;
    PaginationState state;
    bool auto_advance;

    AdjacentPage<Page> next_page;
    AdjacentPage<Page> previous_page;
};

} // namespace restkit
