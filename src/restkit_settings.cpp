#include "restkit_settings.hpp"

#include <cstdlib>
#include <sstream>
#include "duckdb.hpp"

namespace restkit {

static std::optional<std::string> GetEnv(const char *name)
{
    const char *value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

TraceLevel StringToTraceLevel(const std::string &level_str)
{
    auto level_str_upper = duckdb::StringUtil::Upper(level_str);

    if (level_str_upper == "NONE") {
        return TraceLevel::NONE;
    } else if (level_str_upper == "ERROR") {
        return TraceLevel::ERROR;
    } else if (level_str_upper == "WARN") {
        return TraceLevel::WARN;
    } else if (level_str_upper == "INFO") {
        return TraceLevel::INFO;
    } else if (level_str_upper == "DEBUG") {
        return TraceLevel::DEBUG_LEVEL;
    } else if (level_str_upper == "TRACE") {
        return TraceLevel::TRACE;
    }

    throw duckdb::InvalidInputException("Invalid trace level: " + level_str + ". Valid levels are: NONE, ERROR, WARN, INFO, DEBUG, TRACE");
}

std::string ValidateOutputMode(const std::string &output)
{
    auto output_upper = duckdb::StringUtil::Upper(output);
    if (output_upper != "CONSOLE" && output_upper != "FILE" && output_upper != "BOTH") {
        throw duckdb::InvalidInputException("Invalid trace output: " + output + ". Valid outputs are: console, file, both");
    }

    // The tracer compares against lower-case mode names
    return duckdb::StringUtil::Lower(output);
}

bool ParseBoolSetting(const std::string &name, const std::string &value)
{
    auto value_lower = duckdb::StringUtil::Lower(value);
    if (value_lower == "true" || value_lower == "1" || value_lower == "on" || value_lower == "yes") {
        return true;
    }
    if (value_lower == "false" || value_lower == "0" || value_lower == "off" || value_lower == "no") {
        return false;
    }
    throw duckdb::InvalidInputException("Setting " + name + " expects a boolean, got: " + value);
}

int64_t ParseSizeSetting(const std::string &name, const std::string &value)
{
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception &) {
        throw duckdb::InvalidInputException("Setting " + name + " expects an integer, got: " + value);
    }

    if (consumed != value.size()) {
        throw duckdb::InvalidInputException("Setting " + name + " expects an integer, got: " + value);
    }
    if (parsed < 0) {
        throw duckdb::InvalidInputException("Setting " + name + " must be non-negative");
    }
    return static_cast<int64_t>(parsed);
}

TraceSettings TraceSettings::FromEnvironment()
{
    TraceSettings settings;

    if (auto enabled = GetEnv(ENV_ENABLED)) {
        settings.enabled = ParseBoolSetting(ENV_ENABLED, *enabled);
    }
    if (auto level = GetEnv(ENV_LEVEL)) {
        settings.level = StringToTraceLevel(*level);
    }
    if (auto output = GetEnv(ENV_OUTPUT)) {
        settings.output_mode = ValidateOutputMode(*output);
    }
    if (auto directory = GetEnv(ENV_DIRECTORY)) {
        if (!directory->empty()) {
            settings.directory = *directory;
        }
    }
    if (auto max_size = GetEnv(ENV_MAX_FILE_SIZE)) {
        settings.max_file_size = ParseSizeSetting(ENV_MAX_FILE_SIZE, *max_size);
    }
    if (auto rotation = GetEnv(ENV_ROTATION)) {
        settings.rotation = ParseBoolSetting(ENV_ROTATION, *rotation);
    }

    return settings;
}

void TraceSettings::Apply() const
{
    auto &tracer = RestkitTracer::Instance();

    // Destination first, so enabling opens the right file
    tracer.SetOutputMode(output_mode);
    if (directory) {
        tracer.SetTraceDirectory(*directory);
    }
    tracer.SetMaxFileSize(max_file_size);
    tracer.SetRotation(rotation);
    tracer.SetLevel(level);
    tracer.SetEnabled(enabled);
}

std::string TraceSettings::ToString() const
{
    std::stringstream ss;
    ss << "TraceSettings(enabled=" << (enabled ? "true" : "false")
       << ", level=" << RestkitTracer::LevelToString(level)
       << ", output=" << output_mode
       << ", directory=" << directory.value_or(".")
       << ", max_file_size=" << max_file_size
       << ", rotation=" << (rotation ? "true" : "false") << ")";
    return ss.str();
}

} // namespace restkit
