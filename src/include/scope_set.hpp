#pragma once

#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace restkit {

enum class ScopeVerb {
    READ,
    WRITE
};

// Parsed view of a single access scope: [unauthenticated_]<write|read>_<resource>
class ApiScope {
public:
    static constexpr const char *UNAUTHENTICATED_PREFIX = "unauthenticated_";

    // Returns std::nullopt if the text is not a well-formed scope.
    static std::optional<ApiScope> Parse(const std::string &scope);

    ApiScope(bool unauthenticated, ScopeVerb verb, std::string resource);

    bool IsUnauthenticated() const { return unauthenticated; }
    ScopeVerb Verb() const { return verb; }
    const std::string &Resource() const { return resource; }

    // The read scope granted by holding this write scope. Read scopes imply nothing.
    std::optional<ApiScope> ImpliedScope() const;

    std::string ToString() const;

private:
    bool unauthenticated;
    ScopeVerb verb;
    std::string resource;
};

// ----------------------------------------------------------------------

/**
 * Immutable set of access scopes.
 *
 * Holding write_X implies read_X (with the same unauthenticated_ prefix), so
 * the set keeps two views of its input:
 *  - compressed: the input without any scope implied by another member
 *  - expanded:   the input plus every implied scope
 *
 * Equality and ToString() use the compressed view; Covers() checks the other
 * set's compressed view against this set's expanded view.
 *
 * Construction throws InvalidScopeException on the first malformed entry.
 */
class ScopeSet {
public:
    static constexpr char SCOPE_DELIMITER = ',';

    using const_iterator = std::set<std::string>::const_iterator;

    // Splits on SCOPE_DELIMITER. A delimiter inside a scope is not supported.
    static ScopeSet FromDelimitedString(const std::string &scopes);
    static ScopeSet FromCollection(const std::vector<std::string> &scopes);

    ScopeSet() = default;

    // True iff every scope required by `other` is granted by this set.
    bool Covers(const ScopeSet &other) const;
    bool Contains(const std::string &scope) const;

    const std::set<std::string> &Compressed() const { return compressed_scopes; }
    const std::set<std::string> &Expanded() const { return expanded_scopes; }

    size_t Size() const { return compressed_scopes.size(); }
    bool Empty() const { return compressed_scopes.empty(); }

    std::string ToString() const;

    const_iterator begin() const { return compressed_scopes.begin(); }
    const_iterator end() const { return compressed_scopes.end(); }

    bool operator==(const ScopeSet &other) const;
    bool operator!=(const ScopeSet &other) const;

private:
    explicit ScopeSet(const std::vector<std::string> &raw_scopes);

    static std::set<std::string> SanitizeScopes(const std::vector<std::string> &raw_scopes);
    static void ValidateScopes(const std::set<std::string> &scopes);

    std::set<std::string> compressed_scopes;
    std::set<std::string> expanded_scopes;
};

std::ostream &operator<<(std::ostream &os, const ScopeSet &scopes);

} // namespace restkit
