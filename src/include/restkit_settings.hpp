#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "restkit_tracing.hpp"

namespace restkit {

/**
 * Tracer configuration.
 *
 * Values come from the environment (see FromEnvironment) and are pushed into
 * the RestkitTracer singleton with Apply(). Unset variables keep the defaults
 * below. Malformed values throw duckdb::InvalidInputException.
 *
 *   RESTKIT_TRACE_ENABLED        true|false|1|0|on|off|yes|no
 *   RESTKIT_TRACE_LEVEL          NONE|ERROR|WARN|INFO|DEBUG|TRACE
 *   RESTKIT_TRACE_OUTPUT         console|file|both
 *   RESTKIT_TRACE_DIRECTORY      directory of restkit_trace.log
 *   RESTKIT_TRACE_MAX_FILE_SIZE  bytes, non-negative
 *   RESTKIT_TRACE_ROTATION       boolean
 */
struct TraceSettings {
    static constexpr const char *ENV_ENABLED = "RESTKIT_TRACE_ENABLED";
    static constexpr const char *ENV_LEVEL = "RESTKIT_TRACE_LEVEL";
    static constexpr const char *ENV_OUTPUT = "RESTKIT_TRACE_OUTPUT";
    static constexpr const char *ENV_DIRECTORY = "RESTKIT_TRACE_DIRECTORY";
    static constexpr const char *ENV_MAX_FILE_SIZE = "RESTKIT_TRACE_MAX_FILE_SIZE";
    static constexpr const char *ENV_ROTATION = "RESTKIT_TRACE_ROTATION";

    static constexpr int64_t DEFAULT_MAX_FILE_SIZE = 10485760; // 10MB

    bool enabled = false;
    TraceLevel level = TraceLevel::INFO;
    std::string output_mode = "console";
    std::optional<std::string> directory = std::nullopt;
    int64_t max_file_size = DEFAULT_MAX_FILE_SIZE;
    bool rotation = true;

    static TraceSettings FromEnvironment();

    void Apply() const;
    std::string ToString() const;
};

TraceLevel StringToTraceLevel(const std::string &level_str);
std::string ValidateOutputMode(const std::string &output);
bool ParseBoolSetting(const std::string &name, const std::string &value);
int64_t ParseSizeSetting(const std::string &name, const std::string &value);

} // namespace restkit
