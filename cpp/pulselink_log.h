#pragma once

// Lightweight printf-style logger with levels (optionally colored).
// Each line carries a [sec.msec] timestamp since process start and a level
// tag. Output is serialized and goes to stderr unless a sink is installed.

#include <functional>
#include <string>

namespace pulselink {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error,
    Fatal
};

// Receives the formatted line (without header) instead of stderr.
using LogSink = std::function<void(LogLevel, const std::string&)>;

void setLogLevel(LogLevel level);
LogLevel logLevel();

// Pass an empty sink to restore stderr output.
void setLogSink(LogSink sink);

#if defined(__GNUC__) || defined(__clang__)
void logPrint(LogLevel level, const char* format, ...) __attribute__((format(printf, 2, 3)));
#else
void logPrint(LogLevel level, const char* format, ...);
#endif

} // namespace pulselink

#define PL_LOG_DEBUG(fmt, ...) ::pulselink::logPrint(::pulselink::LogLevel::Debug, fmt, ##__VA_ARGS__)
#define PL_LOG_INFO(fmt, ...)  ::pulselink::logPrint(::pulselink::LogLevel::Info, fmt, ##__VA_ARGS__)
#define PL_LOG_WARN(fmt, ...)  ::pulselink::logPrint(::pulselink::LogLevel::Warn, fmt, ##__VA_ARGS__)
#define PL_LOG_ERROR(fmt, ...) ::pulselink::logPrint(::pulselink::LogLevel::Error, fmt, ##__VA_ARGS__)
#define PL_LOG_FATAL(fmt, ...) ::pulselink::logPrint(::pulselink::LogLevel::Fatal, fmt, ##__VA_ARGS__)
