#pragma once

#include <string>
#include <functional>
#include <mutex>

namespace logwindow {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

const char* log_level_name(LogLevel level);

// Process-wide diagnostic sink for the engine's own messages.
// Defaults to stdout/stderr; an embedding application may install its own.
class EngineLog {
public:
    using Sink = std::function<void(LogLevel level,
                                    const std::string& component,
                                    const std::string& message)>;

    static void set_sink(Sink sink);
    static void set_level(LogLevel level);
    static LogLevel level();

    static void debug(const std::string& component, const std::string& message);
    static void info(const std::string& component, const std::string& message);
    static void warning(const std::string& component, const std::string& message);
    static void error(const std::string& component, const std::string& message);

    // Writes "[Component] message", warnings and errors to cerr
    static void console_sink(LogLevel level, const std::string& component,
                             const std::string& message);

private:
    static void write(LogLevel level, const std::string& component, const std::string& message);

    static Sink sink_;
    static LogLevel level_;
    static std::mutex mutex_;
};

} // namespace logwindow
