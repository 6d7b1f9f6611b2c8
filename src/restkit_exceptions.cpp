#include "restkit_exceptions.hpp"

namespace restkit {

std::string PageDirectionToString(PageDirection direction)
{
    switch (direction) {
        case PageDirection::PREVIOUS: return "previous";
        case PageDirection::NEXT: return "next";
        default: return "unknown";
    }
}

// ----------------------------------------------------------------------

InvalidScopeException::InvalidScopeException(const std::string &scope)
    : duckdb::InvalidInputException("'" + scope + "' is not a valid access scope"), scope(scope)
{ }

// ----------------------------------------------------------------------

NoSuchPageException::NoSuchPageException(PageDirection direction, const std::string &message)
    : duckdb::OutOfRangeException(message), direction(direction)
{ }

// ----------------------------------------------------------------------

MissingPageFetcherException::MissingPageFetcherException()
    : duckdb::InvalidInputException("Cursor-based pagination requires a page fetcher; none was provided")
{ }

} // namespace restkit
