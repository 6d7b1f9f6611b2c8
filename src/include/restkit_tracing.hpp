#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <sstream>
#include <iostream>

namespace restkit {

enum class TraceLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG_LEVEL = 4,
    TRACE = 5
};

class RestkitTracer {
public:
    static constexpr const char *TRACE_FILE_NAME = "restkit_trace.log";

    static RestkitTracer& Instance();

    void SetEnabled(bool enabled);
    void SetLevel(TraceLevel level);
    void SetTraceDirectory(const std::string& directory);
    void SetOutputMode(const std::string& output_mode);
    void SetMaxFileSize(int64_t max_size);
    void SetRotation(bool rotation);

    bool IsEnabled() const { return enabled; }
    TraceLevel GetLevel() const { return level; }
    std::string GetOutputMode() const { return output_mode; }
    std::string GetTraceDirectory() const { return trace_directory; }
    int64_t GetMaxFileSize() const { return max_file_size; }
    bool GetRotation() const { return rotation_enabled; }
    std::string GetTraceFilePath() const;

    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message);
    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data);

    // Convenience methods for different trace levels
    void Error(const std::string& component, const std::string& message);
    void Error(const std::string& component, const std::string& message, const std::string& data);
    void Warn(const std::string& component, const std::string& message);
    void Warn(const std::string& component, const std::string& message, const std::string& data);
    void Info(const std::string& component, const std::string& message);
    void Info(const std::string& component, const std::string& message, const std::string& data);
    void Debug(const std::string& component, const std::string& message);
    void Debug(const std::string& component, const std::string& message, const std::string& data);
    void Trace(const std::string& component, const std::string& message);
    void Trace(const std::string& component, const std::string& message, const std::string& data);

    static std::string LevelToString(TraceLevel level);

private:
    RestkitTracer() = default;
    ~RestkitTracer() = default;
    RestkitTracer(const RestkitTracer&) = delete;
    RestkitTracer& operator=(const RestkitTracer&) = delete;

    // Callers must hold trace_mutex.
    void Emit(const std::string& log_message);
    void OpenTraceFile();
    void RotateIfNeeded(size_t incoming_bytes);
    std::string GetTimestamp();

    bool enabled = false;
    TraceLevel level = TraceLevel::INFO;
    std::string trace_directory = ".";
    std::string output_mode = "console";
    int64_t max_file_size = 10485760; // 10MB default
    bool rotation_enabled = true;
    std::unique_ptr<std::ofstream> trace_file;
    std::mutex trace_mutex;
};

// Convenience macros for tracing
#define RESTKIT_TRACE_ERROR(component, message) \
    ::restkit::RestkitTracer::Instance().Error(component, message)

#define RESTKIT_TRACE_ERROR_DATA(component, message, data) \
    ::restkit::RestkitTracer::Instance().Error(component, message, data)

#define RESTKIT_TRACE_WARN(component, message) \
    ::restkit::RestkitTracer::Instance().Warn(component, message)

#define RESTKIT_TRACE_WARN_DATA(component, message, data) \
    ::restkit::RestkitTracer::Instance().Warn(component, message, data)

#define RESTKIT_TRACE_INFO(component, message) \
    ::restkit::RestkitTracer::Instance().Info(component, message)

#define RESTKIT_TRACE_INFO_DATA(component, message, data) \
    ::restkit::RestkitTracer::Instance().Info(component, message, data)

#define RESTKIT_TRACE_DEBUG(component, message) \
    ::restkit::RestkitTracer::Instance().Debug(component, message)

#define RESTKIT_TRACE_DEBUG_DATA(component, message, data) \
    ::restkit::RestkitTracer::Instance().Debug(component, message, data)

#define RESTKIT_TRACE_TRACE(component, message) \
    ::restkit::RestkitTracer::Instance().Trace(component, message)

#define RESTKIT_TRACE_TRACE_DATA(component, message, data) \
    ::restkit::RestkitTracer::Instance().Trace(component, message, data)

} // namespace restkit
