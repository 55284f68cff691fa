#include "pulselink_log.h"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <vector>

namespace pulselink {

namespace {

std::atomic<int> g_level {static_cast<int>(LogLevel::Info)};
std::mutex g_mutex;
LogSink g_sink;

const std::chrono::steady_clock::time_point g_start = std::chrono::steady_clock::now();

// Fixed width keeps columns aligned
const char* kLevelStrings[] = {"DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"};

#ifdef PULSELINK_COLORED_LOG
const char* kLevelColors[] = {"\033[36m", "\033[32m", "\033[33m", "\033[31m", "\033[35m"};
const char* kColorReset = "\033[0m";
#else
const char* kLevelColors[] = {"", "", "", "", ""};
const char* kColorReset = "";
#endif

std::string vformat(const char* format, va_list args) {
    va_list copy;
    va_copy(copy, args);
    int n = std::vsnprintf(nullptr, 0, format, copy);
    va_end(copy);
    if (n <= 0) return std::string();
    std::vector<char> buf(static_cast<size_t>(n) + 1);
    std::vsnprintf(buf.data(), buf.size(), format, args);
    return std::string(buf.data(), static_cast<size_t>(n));
}

} // namespace

void setLogLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(g_level.load());
}

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_sink = std::move(sink);
}

void logPrint(LogLevel level, const char* format, ...) {
    if (static_cast<int>(level) < g_level.load()) return;

    va_list args;
    va_start(args, format);
    std::string msg = vformat(format, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_sink) {
        g_sink(level, msg);
        return;
    }

    auto elapsed = std::chrono::steady_clock::now() - g_start;
    auto msTotal = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    unsigned long seconds = static_cast<unsigned long>(msTotal / 1000);
    unsigned long millis = static_cast<unsigned long>(msTotal % 1000);
    const int idx = static_cast<int>(level);

    // Header: [sec.msec] [LEVEL]
    std::fprintf(stderr, "%s[%5lu.%03lu] [%s]%s %s\n",
                 kLevelColors[idx], seconds, millis, kLevelStrings[idx], kColorReset, msg.c_str());
}

} // namespace pulselink
