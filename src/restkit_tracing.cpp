#include "restkit_tracing.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>

namespace restkit {

RestkitTracer& RestkitTracer::Instance() {
    static RestkitTracer instance;
    return instance;
}

std::string RestkitTracer::GetTraceFilePath() const {
    std::filesystem::path trace_path = trace_directory;
    trace_path /= TRACE_FILE_NAME;
    return trace_path.string();
}

void RestkitTracer::SetEnabled(bool enabled) {
    if (!enabled) {
        // Last message goes out while the sinks are still open
        Info("TRACER", "Tracing disabled");
    }

    bool opened = false;
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->enabled = enabled;

        if (enabled && !trace_file && output_mode != "console") {
            OpenTraceFile();
            opened = trace_file->is_open();
        } else if (!enabled && trace_file) {
            trace_file->close();
            trace_file.reset();
        }
    }

    if (opened) {
        Info("TRACER", "Tracing enabled, writing to: " + GetTraceFilePath());
    }
}

void RestkitTracer::SetLevel(TraceLevel level) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->level = level;
    }
    Info("TRACER", "Trace level set to: " + LevelToString(level));
}

void RestkitTracer::SetTraceDirectory(const std::string& directory) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        trace_directory = directory;

        std::filesystem::path dir_path(directory);
        if (!std::filesystem::exists(dir_path)) {
            std::filesystem::create_directories(dir_path);
        }

        // Reopen trace file if tracing is enabled
        if (trace_file) {
            trace_file->close();
            trace_file.reset();
        }
        if (enabled && output_mode != "console") {
            OpenTraceFile();
        }
    }
    Info("TRACER", "Trace directory set to: " + directory);
}

void RestkitTracer::SetOutputMode(const std::string& output_mode) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->output_mode = output_mode;

        if (output_mode == "console" && trace_file) {
            trace_file->close();
            trace_file.reset();
        } else if (output_mode != "console" && enabled && !trace_file) {
            OpenTraceFile();
        }
    }
    Info("TRACER", "Trace output mode set to: " + output_mode);
}

void RestkitTracer::SetMaxFileSize(int64_t max_size) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        max_file_size = max_size;
    }
    Info("TRACER", "Trace max file size set to: " + std::to_string(max_size));
}

void RestkitTracer::SetRotation(bool rotation) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        rotation_enabled = rotation;
    }
    Info("TRACER", "Trace rotation " + std::string(rotation ? "enabled" : "disabled"));
}

void RestkitTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message) {
    Trace(msg_level, component, message, std::string());
}

void RestkitTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data) {
    std::lock_guard<std::mutex> lock(trace_mutex);
    if (!enabled || msg_level > level || msg_level == TraceLevel::NONE) {
        return;
    }

    std::string log_message;
    log_message.reserve(100 + component.length() + message.length() + data.length());

    log_message += GetTimestamp();
    log_message += " [";
    log_message += LevelToString(msg_level);
    log_message += "] [";
    log_message += component;
    log_message += "] ";
    log_message += message;

    if (!data.empty()) {
        log_message += "\nData: ";
        log_message += data;
    }

    Emit(log_message);
}

void RestkitTracer::Error(const std::string& component, const std::string& message) {
    Trace(TraceLevel::ERROR, component, message);
}

void RestkitTracer::Error(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::ERROR, component, message, data);
}

void RestkitTracer::Warn(const std::string& component, const std::string& message) {
    Trace(TraceLevel::WARN, component, message);
}

void RestkitTracer::Warn(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::WARN, component, message, data);
}

void RestkitTracer::Info(const std::string& component, const std::string& message) {
    Trace(TraceLevel::INFO, component, message);
}

void RestkitTracer::Info(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::INFO, component, message, data);
}

void RestkitTracer::Debug(const std::string& component, const std::string& message) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message);
}

void RestkitTracer::Debug(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message, data);
}

void RestkitTracer::Trace(const std::string& component, const std::string& message) {
    Trace(TraceLevel::TRACE, component, message);
}

void RestkitTracer::Trace(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::TRACE, component, message, data);
}

void RestkitTracer::Emit(const std::string& log_message) {
    if (output_mode != "file") {
        std::cout << log_message << std::endl;
    }

    if (output_mode == "console") {
        return;
    }

    RotateIfNeeded(log_message.size() + 1);
    if (trace_file && trace_file->is_open()) {
        *trace_file << log_message << std::endl;
        trace_file->flush();
    }
}

void RestkitTracer::OpenTraceFile() {
    auto trace_path = GetTraceFilePath();
    trace_file = std::make_unique<std::ofstream>(trace_path, std::ios::app);
    if (!trace_file->is_open()) {
        std::cerr << "Failed to open trace file: " << trace_path << std::endl;
    }
}

void RestkitTracer::RotateIfNeeded(size_t incoming_bytes) {
    if (!rotation_enabled || max_file_size <= 0 || !trace_file) {
        return;
    }

    std::error_code ec;
    auto trace_path = GetTraceFilePath();
    auto current_size = std::filesystem::file_size(trace_path, ec);
    if (ec) {
        return;
    }
    if (current_size + incoming_bytes <= static_cast<uint64_t>(max_file_size)) {
        return;
    }

    trace_file->close();
    std::filesystem::rename(trace_path, trace_path + ".1", ec);
    if (ec) {
        std::cerr << "Failed to rotate trace file " << trace_path << ": " << ec.message() << std::endl;
    }
    trace_file->open(trace_path, std::ios::trunc);
}

std::string RestkitTracer::GetTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buffer[32];
    std::strftime(time_buffer, sizeof(time_buffer), "%Y-%m-%d %H:%M:%S", std::localtime(&time_t));

    std::ostringstream timestamp;
    timestamp << time_buffer << "." << std::setw(3) << std::setfill('0') << ms.count();
    return timestamp.str();
}

std::string RestkitTracer::LevelToString(TraceLevel level) {
    switch (level) {
        case TraceLevel::NONE: return "NONE";
        case TraceLevel::ERROR: return "ERROR";
        case TraceLevel::WARN: return "WARN";
        case TraceLevel::INFO: return "INFO";
        case TraceLevel::DEBUG_LEVEL: return "DEBUG";
        case TraceLevel::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

} // namespace restkit
