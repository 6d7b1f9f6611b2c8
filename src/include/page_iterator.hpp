#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <utility>

#include "duckdb.hpp"
#include "paged_sequence.hpp"

namespace restkit {

/**
 * Page-at-a-time traversal that keeps a single fetched page in memory.
 *
 * Usage:
 *   for (auto &page : PageIterator<Order>(first_page)) {
 *       for (auto &order : *page) {
 *           Process(order);
 *       }
 *   }
 *
 * The starting page is switched to no-auto-advance so iterating a page only
 * yields its own items. Later pages are fetched with Next(true) and are never
 * cached, so releasing a yielded page frees it.
 */
template <typename TItem>
class PageIterator {
public:
    using Page = PagedSequence<TItem>;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::shared_ptr<Page>;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::shared_ptr<Page> *;
        using reference = const std::shared_ptr<Page> &;

        iterator() = default;
        explicit iterator(std::shared_ptr<Page> start) : current(std::move(start)) { }

        reference operator*() const { return current; }
        pointer operator->() const { return &current; }

        iterator &operator++()
        {
            try {
                current = current->Next(true);
            } catch (const NoSuchPageException &) {
                // End of the result set
                current.reset();
            }
            return *this;
        }

        bool operator==(const iterator &other) const { return current == other.current; }
        bool operator!=(const iterator &other) const { return !(*this == other); }

    private:
        std::shared_ptr<Page> current;
    };

    explicit PageIterator(std::shared_ptr<Page> sequence)
        : sequence(std::move(sequence))
    {
        if (this->sequence == nullptr) {
            throw duckdb::InvalidInputException("PageIterator expects a PagedSequence instance");
        }
        this->sequence->SetAutoAdvance(false);
    }

    iterator begin() const { return iterator(sequence); }
    iterator end() const { return iterator(); }

private:
    std::shared_ptr<Page> sequence;
};

} // namespace restkit
