#include "link_header.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>
#include "duckdb.hpp"
#include "restkit_tracing.hpp"

namespace restkit {

static std::string Strip(const std::string &value)
{
    size_t start = 0;
    size_t end = value.size();
    while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::vector<std::string> LinkHeader::SplitLinkValues(const std::string &header_value)
{
    // Commas inside <...> belong to the url
    std::vector<std::string> values;
    std::string current;
    bool in_url = false;
    bool in_quotes = false;

    for (char c : header_value) {
        if (c == '<' && !in_quotes) {
            in_url = true;
        } else if (c == '>' && !in_quotes) {
            in_url = false;
        } else if (c == '"' && !in_url) {
            in_quotes = !in_quotes;
        } else if (c == ',' && !in_url && !in_quotes) {
            values.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    values.push_back(current);

    return values;
}

std::vector<std::string> LinkHeader::ParseRelNames(const std::string &params)
{
    std::vector<std::string> rel_names;

    for (const auto &param : duckdb::StringUtil::Split(params, ';')) {
        auto eq_pos = param.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        auto key = duckdb::StringUtil::Lower(Strip(param.substr(0, eq_pos)));
        if (key != "rel") {
            continue;
        }

        auto value = Strip(param.substr(eq_pos + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        std::istringstream names(value);
        std::string name;
        while (names >> name) {
            rel_names.push_back(name);
        }
        break;
    }

    return rel_names;
}

std::map<std::string, std::string> LinkHeader::Parse(const std::string &header_value)
{
    std::map<std::string, std::string> result;

    for (const auto &raw_value : SplitLinkValues(header_value)) {
        auto value = Strip(raw_value);
        if (value.empty()) {
            continue;
        }

        auto url_start = value.find('<');
        auto url_end = value.find('>', url_start == std::string::npos ? 0 : url_start);
        if (url_start != 0 || url_end == std::string::npos) {
            RESTKIT_TRACE_WARN("LINK_HEADER", "Skipping link value without <url>: " + value);
            continue;
        }

        auto url = Strip(value.substr(url_start + 1, url_end - url_start - 1));
        auto rel_names = ParseRelNames(value.substr(url_end + 1));
        if (rel_names.empty()) {
            RESTKIT_TRACE_WARN("LINK_HEADER", "Skipping link value without rel: " + value);
            continue;
        }

        for (const auto &rel : rel_names) {
            result[rel] = url;
        }
    }

    return result;
}

// ----------------------------------------------------------------------

PaginationLinks::PaginationLinks(std::map<std::string, std::string> links)
    : links(std::move(links))
{ }

PaginationLinks PaginationLinks::FromHeaders(const HeaderMap &headers)
{
    auto it = headers.find(LinkHeader::HEADER_NAME);
    if (it == headers.end() || it->second.empty()) {
        return PaginationLinks();
    }

    auto links = LinkHeader::Parse(it->second);
    RESTKIT_TRACE_DEBUG_DATA("LINK_HEADER", "Parsed " + std::to_string(links.size()) + " pagination links", it->second);
    return PaginationLinks(std::move(links));
}

std::optional<std::string> PaginationLinks::Get(const std::string &rel) const
{
    auto it = links.find(rel);
    if (it == links.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace restkit
