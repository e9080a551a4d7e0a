#pragma once

#include <functional>
#include <string>

namespace blockplan {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

/// Receives every formatted message at or above the current threshold
using LogSink = std::function<void(LogLevel, const std::string&)>;

/// printf-style logging, prefixed with "[Blockplan]"
void log_msg(LogLevel level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

/// Messages below this level are dropped (default: Info)
void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

/// Replace the output sink (default writes to stderr). Pass nullptr to restore.
void set_log_sink(LogSink sink);

[[nodiscard]] const char* log_level_name(LogLevel level) noexcept;

/// RAII guard that captures log output for the lifetime of the guard
class ScopedLogSink {
public:
    explicit ScopedLogSink(LogSink sink);
    ~ScopedLogSink();

    ScopedLogSink(const ScopedLogSink&) = delete;
    ScopedLogSink& operator=(const ScopedLogSink&) = delete;
};

} // namespace blockplan
