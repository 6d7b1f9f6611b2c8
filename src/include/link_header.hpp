#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "duckdb.hpp"

namespace restkit {

using HeaderMap = duckdb::case_insensitive_map_t<std::string>;

class LinkHeader {
public:
    static constexpr const char *HEADER_NAME = "Link";

    // Parses `<url>; rel="name", <url2>; rel="name2"` into rel -> url.
    // A rel list such as rel="next last" registers the url under each name.
    // Malformed segments are skipped.
    static std::map<std::string, std::string> Parse(const std::string &header_value);

private:
    static std::vector<std::string> SplitLinkValues(const std::string &header_value);
    static std::vector<std::string> ParseRelNames(const std::string &params);
};

// ----------------------------------------------------------------------

class PaginationLinks {
public:
    static constexpr const char *REL_NEXT = "next";
    static constexpr const char *REL_PREVIOUS = "previous";

    static PaginationLinks FromHeaders(const HeaderMap &headers);

    PaginationLinks() = default;
    explicit PaginationLinks(std::map<std::string, std::string> links);

    std::optional<std::string> Next() const { return Get(REL_NEXT); }
    std::optional<std::string> Previous() const { return Get(REL_PREVIOUS); }
    std::optional<std::string> Get(const std::string &rel) const;

    const std::map<std::string, std::string> &All() const { return links; }
    bool Empty() const { return links.empty(); }

private:
    std::map<std::string, std::string> links;
};

} // namespace restkit
