#pragma once

#include <string>
#include <utility>
#include <vector>

namespace restkit {

/**
 * Error Context Helper
 *
 * Collects key/value details about a failing operation and renders them
 * after the base message, in insertion order.
 *
 * Usage:
 *   auto message = ErrorContext()
 *       .Set("direction", "next")
 *       .Set("items", 25)
 *       .Format("No next page");
 *   // "No next page [direction: next, items: 25]"
 */
class ErrorContext {
public:
    ErrorContext() = default;

    /**
     * Set a context variable. Setting an existing key replaces its value
     * but keeps its first position.
     *
     * @return Reference to this context (for chaining)
     */
    ErrorContext& Set(const std::string& key, const std::string& value);
    ErrorContext& Set(const std::string& key, size_t value);

    /**
     * Build a formatted error message with context appended
     */
    std::string Format(const std::string& base_message) const;

private:
    std::vector<std::pair<std::string, std::string>> context_;
};

} // namespace restkit
