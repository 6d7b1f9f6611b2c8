#include "paged_sequence.hpp"
#include "error_context.hpp"

namespace restkit {

PaginationState::PaginationState(const HeaderMap &headers)
    : links(PaginationLinks::FromHeaders(headers))
    , next_link(links.Next())
    , previous_link(links.Previous())
{
    if (!links.Empty()) {
        RESTKIT_TRACE_TRACE("PAGINATION", "Page links: next=" + next_link.value_or("<none>") +
                            ", previous=" + previous_link.value_or("<none>"));
    }
}

bool PaginationState::HasLink(PageDirection direction) const
{
    return Link(direction).has_value();
}

const std::optional<std::string> &PaginationState::Link(PageDirection direction) const
{
    return direction == PageDirection::NEXT ? next_link : previous_link;
}

const std::string &PaginationState::RequireLink(PageDirection direction, size_t local_size) const
{
    const auto &link = Link(direction);
    if (!link) {
        auto message = ErrorContext()
            .Set("direction", PageDirectionToString(direction))
            .Set("items", local_size)
            .Format("No " + PageDirectionToString(direction) + " page");
        RESTKIT_TRACE_DEBUG("PAGINATION", message);
        throw NoSuchPageException(direction, message);
    }
    return *link;
}

} // namespace restkit
