#include "scope_set.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>
#include "duckdb.hpp"
#include "restkit_exceptions.hpp"
#include "restkit_tracing.hpp"

namespace restkit {

static constexpr const char *WRITE_TOKEN = "write_";
static constexpr const char *READ_TOKEN = "read_";

static bool ConsumePrefix(const std::string &value, size_t &pos, const std::string &prefix)
{
    if (value.compare(pos, prefix.size(), prefix) != 0) {
        return false;
    }
    pos += prefix.size();
    return true;
}

static std::string TrimWhitespace(const std::string &value)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto first = std::find_if_not(value.begin(), value.end(), is_space);
    auto last = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    if (first >= last) {
        return "";
    }
    return std::string(first, last);
}

// ----------------------------------------------------------------------

ApiScope::ApiScope(bool unauthenticated, ScopeVerb verb, std::string resource)
    : unauthenticated(unauthenticated), verb(verb), resource(std::move(resource))
{ }

// Grammar: [unauthenticated_](write|read)_<resource>, where the resource is a
// non-empty run of characters without line breaks. Single linear scan, so the
// length of the input is not bounded by stack depth.
std::optional<ApiScope> ApiScope::Parse(const std::string &scope)
{
    size_t pos = 0;
    bool unauthenticated = ConsumePrefix(scope, pos, UNAUTHENTICATED_PREFIX);

    ScopeVerb verb;
    if (ConsumePrefix(scope, pos, WRITE_TOKEN)) {
        verb = ScopeVerb::WRITE;
    } else if (ConsumePrefix(scope, pos, READ_TOKEN)) {
        verb = ScopeVerb::READ;
    } else {
        return std::nullopt;
    }

    if (pos >= scope.size() || scope.find_first_of("\r\n", pos) != std::string::npos) {
        return std::nullopt;
    }
    return ApiScope(unauthenticated, verb, scope.substr(pos));
}

std::optional<ApiScope> ApiScope::ImpliedScope() const
{
    if (verb != ScopeVerb::WRITE) {
        return std::nullopt;
    }
    return ApiScope(unauthenticated, ScopeVerb::READ, resource);
}

std::string ApiScope::ToString() const
{
    std::string result = unauthenticated ? UNAUTHENTICATED_PREFIX : "";
    result += verb == ScopeVerb::WRITE ? "write_" : "read_";
    result += resource;
    return result;
}

// ----------------------------------------------------------------------

ScopeSet ScopeSet::FromDelimitedString(const std::string &scopes)
{
    return ScopeSet(duckdb::StringUtil::Split(scopes, SCOPE_DELIMITER));
}

ScopeSet ScopeSet::FromCollection(const std::vector<std::string> &scopes)
{
    return ScopeSet(scopes);
}

ScopeSet::ScopeSet(const std::vector<std::string> &raw_scopes)
{
    auto sanitized_scopes = SanitizeScopes(raw_scopes);
    ValidateScopes(sanitized_scopes);

    std::set<std::string> implied_scopes;
    for (const auto &scope : sanitized_scopes) {
        auto implied = ApiScope::Parse(scope)->ImpliedScope();
        if (implied) {
            implied_scopes.insert(implied->ToString());
        }
    }

    std::set_difference(sanitized_scopes.begin(), sanitized_scopes.end(),
                        implied_scopes.begin(), implied_scopes.end(),
                        std::inserter(compressed_scopes, compressed_scopes.end()));
    std::set_union(sanitized_scopes.begin(), sanitized_scopes.end(),
                   implied_scopes.begin(), implied_scopes.end(),
                   std::inserter(expanded_scopes, expanded_scopes.end()));

    RESTKIT_TRACE_DEBUG("SCOPE_SET", "Stored " + std::to_string(compressed_scopes.size()) + " compressed and " +
                        std::to_string(expanded_scopes.size()) + " expanded scopes");
}

std::set<std::string> ScopeSet::SanitizeScopes(const std::vector<std::string> &raw_scopes)
{
    std::set<std::string> sanitized;
    for (const auto &raw_scope : raw_scopes) {
        auto scope = TrimWhitespace(raw_scope);
        if (!scope.empty()) {
            sanitized.insert(std::move(scope));
        }
    }
    return sanitized;
}

void ScopeSet::ValidateScopes(const std::set<std::string> &scopes)
{
    for (const auto &scope : scopes) {
        if (!ApiScope::Parse(scope)) {
            RESTKIT_TRACE_WARN("SCOPE_SET", "Rejected access scope: " + scope);
            throw InvalidScopeException(scope);
        }
    }
}

bool ScopeSet::Covers(const ScopeSet &other) const
{
    return std::includes(expanded_scopes.begin(), expanded_scopes.end(),
                         other.compressed_scopes.begin(), other.compressed_scopes.end());
}

bool ScopeSet::Contains(const std::string &scope) const
{
    return expanded_scopes.count(scope) > 0;
}

std::string ScopeSet::ToString() const
{
    std::vector<std::string> scopes(compressed_scopes.begin(), compressed_scopes.end());
    return duckdb::StringUtil::Join(scopes, std::string(1, SCOPE_DELIMITER));
}

bool ScopeSet::operator==(const ScopeSet &other) const
{
    return compressed_scopes == other.compressed_scopes;
}

bool ScopeSet::operator!=(const ScopeSet &other) const
{
    return !(*this == other);
}

std::ostream &operator<<(std::ostream &os, const ScopeSet &scopes)
{
    return os << scopes.ToString();
}

} // namespace restkit
