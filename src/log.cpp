#include "jwtkit/log.hpp"
#include <atomic>
#include <cstdio>
#include <mutex>

namespace jwtkit {

namespace {
    std::atomic<LogLevel> current_level{LogLevel::Warning};
    std::mutex sink_mutex;
    LogSink current_sink;

    void stderrSink(LogLevel level, std::string_view message) {
        fmt::print(stderr, "[jwtkit] [{}] {}\n", toString(level), message);
    }
}

std::string_view toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

void setLogLevel(LogLevel level) {
    current_level.store(level, std::memory_order_relaxed);
}

LogLevel logLevel() {
    return current_level.load(std::memory_order_relaxed);
}

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex);
    current_sink = std::move(sink);
}

namespace log {

bool enabled(LogLevel level) {
    auto current = logLevel();
    return current != LogLevel::Off && level >= current;
}

void write(LogLevel level, std::string_view message) {
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex);
        sink = current_sink;
    }

    // Called unlocked: a sink may log or install another sink
    if (sink) {
        sink(level, message);
    } else {
        stderrSink(level, message);
    }
}

} // namespace log
} // namespace jwtkit
