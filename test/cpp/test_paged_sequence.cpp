#include "catch.hpp"
#include "paged_sequence.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace restkit;
using namespace restkit::test;

static const std::string P1_URL = "https://shop.test/orders?page_info=p1";
static const std::string P2_URL = "https://shop.test/orders?page_info=p2";
static const std::string P3_URL = "https://shop.test/orders?page_info=p3";

TEST_CASE("PagedSequence requires a page fetcher", "[paged_sequence]") {
    REQUIRE_THROWS_AS(PagedSequence<std::string>({"a"}, HeaderMap(), nullptr), MissingPageFetcherException);
}

TEST_CASE("PagedSequence derives links from the Link header", "[paged_sequence]") {
    auto fetcher = ThreePageFetcher();

    SECTION("First page") {
        auto p1 = fetcher->Load(P1_URL);
        REQUIRE(p1->HasNext());
        REQUIRE_FALSE(p1->HasPrevious());
        REQUIRE(p1->NextLink() == P2_URL);
        REQUIRE_FALSE(p1->PreviousLink().has_value());
    }

    SECTION("Middle page") {
        auto p2 = fetcher->Load(P2_URL);
        REQUIRE(p2->HasNext());
        REQUIRE(p2->HasPrevious());
        REQUIRE(p2->Links().All().size() == 2);
    }

    SECTION("Page without headers has no links") {
        auto page = std::make_shared<PagedSequence<std::string>>(std::vector<std::string>{"x"}, HeaderMap(), fetcher);
        REQUIRE_FALSE(page->HasNext());
        REQUIRE_FALSE(page->HasPrevious());
        REQUIRE(page->Links().Empty());
    }
}

TEST_CASE("PagedSequence navigation at the ends", "[paged_sequence]") {
    auto fetcher = ThreePageFetcher();
    auto p3 = fetcher->Load(P3_URL);

    REQUIRE_FALSE(p3->HasNext());
    REQUIRE_THROWS_AS(p3->Next(), NoSuchPageException);
    REQUIRE_THROWS_AS(p3->Next(true), NoSuchPageException);

    auto p1 = fetcher->Load(P1_URL);
    REQUIRE_THROWS_AS(p1->Previous(), NoSuchPageException);
    REQUIRE(fetcher->FetchCount() == 0);

    SECTION("The exception carries the direction") {
        try {
            p1->Previous();
            FAIL("Expected NoSuchPageException");
        } catch (const NoSuchPageException &e) {
            REQUIRE(e.Direction() == PageDirection::PREVIOUS);
        }
    }

    SECTION("End of data is an out-of-range error") {
        REQUIRE_THROWS_AS(p3->Next(), duckdb::OutOfRangeException);
    }
}

TEST_CASE("PagedSequence caches fetched neighbors", "[paged_sequence]") {
    auto fetcher = ThreePageFetcher();
    auto p1 = fetcher->Load(P1_URL);

    SECTION("Next is fetched once and linked both ways") {
        auto p2 = p1->Next();
        REQUIRE(p2->Items() == std::vector<std::string>{"order-3", "order-4"});
        REQUIRE(fetcher->FetchCount(P2_URL) == 1);

        REQUIRE(p1->Next() == p2);
        REQUIRE(fetcher->FetchCount(P2_URL) == 1);

        REQUIRE(p1->CachedNext() == p2);
        REQUIRE(p2->CachedPrevious() == p1);
        REQUIRE(p2->Previous() == p1);
        REQUIRE(fetcher->FetchCount(P1_URL) == 0);
    }

    SECTION("Previous caches symmetrically") {
        auto p3 = fetcher->Load(P3_URL);
        auto p2 = p3->Previous();
        REQUIRE(p3->CachedPrevious() == p2);
        REQUIRE(p2->CachedNext() == p3);
        REQUIRE(p2->Next() == p3);
        REQUIRE(p3->Previous() == p2);
        REQUIRE(fetcher->FetchCount() == 1);
    }

    SECTION("The cached page stays alive while the origin page does") {
        std::weak_ptr<PagedSequence<std::string>> weak_p2 = p1->Next();
        REQUIRE_FALSE(weak_p2.expired());
        p1.reset();
        REQUIRE(weak_p2.expired());
    }

    SECTION("A back-reference to a released page reads as uncached") {
        auto p2 = p1->Next();
        p1.reset();
        REQUIRE(p2->CachedPrevious() == nullptr);

        auto p1_again = p2->Previous();
        REQUIRE(p1_again->Items() == std::vector<std::string>{"order-1", "order-2"});
        REQUIRE(fetcher->FetchCount(P1_URL) == 1);
    }
}

TEST_CASE("PagedSequence no_cache fetches", "[paged_sequence]") {
    auto fetcher = ThreePageFetcher();
    auto p1 = fetcher->Load(P1_URL);

    SECTION("Two uncached calls fetch twice and leave the cache empty") {
        auto first = p1->Next(true);
        auto second = p1->Next(true);
        REQUIRE(fetcher->FetchCount(P2_URL) == 2);
        REQUIRE(first != second);
        REQUIRE(p1->CachedNext() == nullptr);
        REQUIRE(first->CachedPrevious() == nullptr);
    }

    SECTION("An existing cache entry wins over no_cache") {
        // Documented behavior: no_cache only affects newly fetched pages
        auto cached = p1->Next();
        REQUIRE(p1->Next(true) == cached);
        REQUIRE(fetcher->FetchCount(P2_URL) == 1);
    }

    SECTION("Uncached pages are released with the caller's handle") {
        auto page = p1->Next(true);
        REQUIRE(fetcher->LiveFetchedPages() == 1);
        page.reset();
        REQUIRE(fetcher->LiveFetchedPages() == 0);
    }
}

TEST_CASE("PagedSequence propagates fetch errors", "[paged_sequence]") {
    auto fetcher = ThreePageFetcher();
    fetcher->FailOn(P2_URL);
    auto p1 = fetcher->Load(P1_URL);

    REQUIRE_THROWS_AS(p1->Next(), duckdb::IOException);
    REQUIRE(p1->CachedNext() == nullptr);

    // No retries: each call reaches the fetcher exactly once
    REQUIRE_THROWS_AS(p1->Next(), duckdb::IOException);
    REQUIRE(fetcher->FetchCount(P2_URL) == 2);
}

TEST_CASE("PagedSequence item iteration", "[paged_sequence]") {
    auto fetcher = ThreePageFetcher();
    auto p1 = fetcher->Load(P1_URL);

    SECTION("Auto-advance yields every page in link order") {
        std::vector<std::string> items(p1->begin(), p1->end());
        REQUIRE(items == std::vector<std::string>{"order-1", "order-2", "order-3", "order-4", "order-5"});
        REQUIRE(fetcher->FetchCount() == 2);
    }

    SECTION("Repeated iteration reuses the cached pages") {
        std::vector<std::string> first(p1->begin(), p1->end());
        std::vector<std::string> second(p1->begin(), p1->end());
        REQUIRE(first == second);
        REQUIRE(fetcher->FetchCount() == 2);
    }

    SECTION("Without auto-advance only local items are yielded") {
        p1->SetAutoAdvance(false);
        std::vector<std::string> items;
        for (const auto &item : *p1) {
            items.push_back(item);
        }
        REQUIRE(items == std::vector<std::string>{"order-1", "order-2"});
        REQUIRE(fetcher->FetchCount() == 0);
    }

    SECTION("Auto-advance can be disabled at construction") {
        PaginationOptions options;
        options.auto_advance = false;
        PagedSequence<std::string> page({"a", "b"}, LinkHeaders(NextLink(P2_URL)), fetcher, options);
        std::vector<std::string> items(page.begin(), page.end());
        REQUIRE(items == std::vector<std::string>{"a", "b"});
        REQUIRE_FALSE(page.IsAutoAdvance());
    }

    SECTION("Fetched pages inherit the auto-advance flag") {
        p1->SetAutoAdvance(false);
        REQUIRE_FALSE(p1->Next()->IsAutoAdvance());
    }

    SECTION("Empty pages in the middle are skipped") {
        auto sparse = std::make_shared<FakePageFetcher>();
        sparse->AddPage("a", {"1"}, LinkHeaders(NextLink("b")));
        sparse->AddPage("b", {}, LinkHeaders(NextLink("c")));
        sparse->AddPage("c", {"2"});
        auto first = sparse->Load("a");
        std::vector<std::string> items(first->begin(), first->end());
        REQUIRE(items == std::vector<std::string>{"1", "2"});
    }

    SECTION("A failing fetch surfaces from the iterator") {
        fetcher->FailOn(P3_URL);
        auto it = p1->begin();
        REQUIRE(*it == "order-1");
        ++it;
        ++it;
        REQUIRE(*it == "order-3");
        ++it;
        REQUIRE(*it == "order-4");
        REQUIRE_THROWS_AS(++it, duckdb::IOException);
    }

    SECTION("The iterator stays on the last item after a failing fetch") {
        fetcher->FailOn(P2_URL);
        auto it = p1->begin();
        ++it;
        REQUIRE(*it == "order-2");
        REQUIRE_THROWS_AS(++it, duckdb::IOException);
        REQUIRE(it != p1->end());
        REQUIRE(*it == "order-2");
        REQUIRE_THROWS_AS(++it, duckdb::IOException);
        REQUIRE(fetcher->FetchCount(P2_URL) == 2);
    }
}

// Serves page-0 .. page-(count - 1), one item each, linked by next links.
class GeneratedPageFetcher : public PageFetcher<std::string>,
                             public std::enable_shared_from_this<GeneratedPageFetcher> {
public:
    explicit GeneratedPageFetcher(size_t count) : count(count) { }

    std::shared_ptr<PagedSequence<std::string>> Load(size_t number)
    {
        HeaderMap headers;
        if (number + 1 < count) {
            headers = LinkHeaders(NextLink("page-" + std::to_string(number + 1)));
        }
        auto page = std::make_shared<PagedSequence<std::string>>(
            std::vector<std::string>{"item-" + std::to_string(number)}, headers, shared_from_this());
        last_page = page;
        return page;
    }

    std::shared_ptr<PagedSequence<std::string>> FetchByUrl(const std::string &url) override
    {
        return Load(std::stoul(url.substr(5)));
    }

    std::weak_ptr<PagedSequence<std::string>> last_page;

private:
    size_t count;
};

TEST_CASE("PagedSequence handles long chains of cached pages", "[paged_sequence]") {
    const size_t page_count = 100000;
    auto fetcher = std::make_shared<GeneratedPageFetcher>(page_count);
    auto first = fetcher->Load(0);

    size_t visited = 0;
    std::string last_item;
    for (const auto &item : *first) {
        last_item = item;
        ++visited;
    }
    REQUIRE(visited == page_count);
    REQUIRE(last_item == "item-99999");
    REQUIRE(first->Size() == page_count);

    auto tail = fetcher->last_page;
    REQUIRE_FALSE(tail.expired());
    first.reset();
    REQUIRE(tail.expired());
}

TEST_CASE("Releasing a page keeps neighbors held elsewhere alive", "[paged_sequence]") {
    auto fetcher = ThreePageFetcher();
    auto p1 = fetcher->Load(P1_URL);
    std::vector<std::string> all(p1->begin(), p1->end());

    auto p2 = p1->CachedNext();
    p1.reset();
    REQUIRE(p2->Size() == 3);
    REQUIRE(p2->CachedNext()->Items() == std::vector<std::string>{"order-5"});
    REQUIRE(p2->CachedPrevious() == nullptr);
    REQUIRE(fetcher->LiveFetchedPages() == 2);
}

TEST_CASE("PagedSequence size counts cached pages only", "[paged_sequence]") {
    auto fetcher = ThreePageFetcher();
    auto p1 = fetcher->Load(P1_URL);

    REQUIRE(p1->Size() == 2);
    REQUIRE(p1->LocalSize() == 2);
    REQUIRE(fetcher->FetchCount() == 0);

    p1->Next();
    REQUIRE(p1->Size() == 4);

    std::vector<std::string> all(p1->begin(), p1->end());
    REQUIRE(p1->Size() == 5);
    REQUIRE(fetcher->FetchCount() == 2);
}
