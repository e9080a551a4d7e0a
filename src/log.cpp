#include "blockplan/log.hpp"

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <vector>

namespace blockplan {

namespace {
    std::mutex g_log_mutex;
    LogLevel g_threshold = LogLevel::Info;
    LogSink g_sink;
    std::vector<LogSink> g_saved_sinks;

    void default_sink(LogLevel level, const std::string& message) {
        std::fprintf(stderr, "[Blockplan] %s: %s", log_level_name(level), message.c_str());
        if (message.empty() || message.back() != '\n') {
            std::fputc('\n', stderr);
        }
    }
}

void log_msg(LogLevel level, const char* fmt, ...) {
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (level < g_threshold) return;
        sink = g_sink;
    }

    va_list va;
    va_start(va, fmt);
    va_list copy;
    va_copy(copy, va);
    int needed = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);

    std::string message;
    if (needed > 0) {
        message.resize(static_cast<size_t>(needed) + 1);
        std::vsnprintf(message.data(), message.size(), fmt, va);
        message.resize(static_cast<size_t>(needed));
    }
    va_end(va);

    if (sink) {
        sink(level, message);
    } else {
        default_sink(level, message);
    }
}

void set_log_level(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_threshold = level;
}

LogLevel log_level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_threshold;
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_sink = std::move(sink);
}

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        default:              return "?";
    }
}

ScopedLogSink::ScopedLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_saved_sinks.push_back(g_sink);
    g_sink = std::move(sink);
}

ScopedLogSink::~ScopedLogSink() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_saved_sinks.empty()) {
        g_sink = std::move(g_saved_sinks.back());
        g_saved_sinks.pop_back();
    }
}

} // namespace blockplan
