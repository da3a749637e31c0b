#include "engine_log.hpp"
#include <iostream>

namespace logwindow {

EngineLog::Sink EngineLog::sink_ = EngineLog::console_sink;
LogLevel EngineLog::level_ = LogLevel::Info;
std::mutex EngineLog::mutex_;

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

void EngineLog::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? std::move(sink) : console_sink;
}

void EngineLog::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel EngineLog::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void EngineLog::debug(const std::string& component, const std::string& message) {
    write(LogLevel::Debug, component, message);
}

void EngineLog::info(const std::string& component, const std::string& message) {
    write(LogLevel::Info, component, message);
}

void EngineLog::warning(const std::string& component, const std::string& message) {
    write(LogLevel::Warning, component, message);
}

void EngineLog::error(const std::string& component, const std::string& message) {
    write(LogLevel::Error, component, message);
}

void EngineLog::write(LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(level_)) return;
    if (sink_) {
        sink_(level, component, message);
    }
}

void EngineLog::console_sink(LogLevel level, const std::string& component,
                             const std::string& message) {
    if (level >= LogLevel::Warning) {
        std::cerr << "[" << component << "] " << message << std::endl;
    } else {
        std::cout << "[" << component << "] " << message << std::endl;
    }
}

} // namespace logwindow
