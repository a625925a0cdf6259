#pragma once

#include <fmt/format.h>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace jwtkit {

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3, Off = 4 };

/// Receives every message at or above the current level
using LogSink = std::function<void(LogLevel, std::string_view)>;

[[nodiscard]] std::string_view toString(LogLevel level);

/// Set the minimum level that reaches the sink (default: Warning)
void setLogLevel(LogLevel level);
[[nodiscard]] LogLevel logLevel();

/// Install a sink; an empty function restores the stderr sink
void setLogSink(LogSink sink);

namespace log {

[[nodiscard]] bool enabled(LogLevel level);
void write(LogLevel level, std::string_view message);

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(LogLevel::Debug)) {
        write(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(LogLevel::Info)) {
        write(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void warning(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(LogLevel::Warning)) {
        write(LogLevel::Warning, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(LogLevel::Error)) {
        write(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
    }
}

} // namespace log
} // namespace jwtkit
