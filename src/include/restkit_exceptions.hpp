#pragma once

#include <string>
#include "duckdb.hpp"

namespace restkit {

enum class PageDirection {
    PREVIOUS,
    NEXT
};

std::string PageDirectionToString(PageDirection direction);

// ----------------------------------------------------------------------

// Raised while building a ScopeSet; no partial set is ever produced.
class InvalidScopeException : public duckdb::InvalidInputException {
public:
    explicit InvalidScopeException(const std::string &scope);

    const std::string &Scope() const { return scope; }

private:
    std::string scope;
};

// ----------------------------------------------------------------------

// End-of-data signal for Previous()/Next() on a page without the matching link.
class NoSuchPageException : public duckdb::OutOfRangeException {
public:
    NoSuchPageException(PageDirection direction, const std::string &message);

    PageDirection Direction() const { return direction; }

private:
    PageDirection direction;
};

// ----------------------------------------------------------------------

class MissingPageFetcherException : public duckdb::InvalidInputException {
public:
    MissingPageFetcherException();
};

} // namespace restkit
