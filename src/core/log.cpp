#include <vkframe/log.hpp>

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>

namespace vkframe {

namespace {

LogLevel g_level = LogLevel::Info;
LogSink  g_sink;

void writeStderr(LogLevel level, std::string_view message) {
    std::fprintf(stderr, "vkframe [%s]: %.*s\n", logLevelName(level),
                 static_cast<int>(message.size()), message.data());
}

} // namespace

void setLogLevel(LogLevel level) { g_level = level; }

LogLevel logLevel() { return g_level; }

bool shouldLog(LogLevel level) {
    return static_cast<std::uint8_t>(level) <= static_cast<std::uint8_t>(g_level);
}

void initializeLogLevelFromEnvironment() {
    const char* value = std::getenv("VKFRAME_LOG");
    if (value == nullptr) return;

    if (std::strcmp(value, "error") == 0) {
        g_level = LogLevel::Error;
    } else if (std::strcmp(value, "warn") == 0) {
        g_level = LogLevel::Warn;
    } else if (std::strcmp(value, "info") == 0) {
        g_level = LogLevel::Info;
    } else if (std::strcmp(value, "debug") == 0) {
        g_level = LogLevel::Debug;
    } else {
        std::fprintf(stderr, "vkframe [warn]: ignoring unknown VKFRAME_LOG value '%s'\n", value);
    }
}

void setLogSink(LogSink sink) { g_sink = std::move(sink); }

const char* logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Error: return "error";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Info:  return "info";
    case LogLevel::Debug: return "debug";
    }
    return "?";
}

void log(LogLevel level, const char* fmt, ...) {
    if (!shouldLog(level)) return;

    char stackBuf[512];
    va_list args;
    va_start(args, fmt);
    va_list copy;
    va_copy(copy, args);
    int needed = std::vsnprintf(stackBuf, sizeof(stackBuf), fmt, args);
    va_end(args);

    std::string heapBuf;
    std::string_view message;
    if (needed < 0) {
        message = fmt;
    } else if (static_cast<std::size_t>(needed) < sizeof(stackBuf)) {
        message = std::string_view(stackBuf, static_cast<std::size_t>(needed));
    } else {
        heapBuf.resize(static_cast<std::size_t>(needed) + 1);
        std::vsnprintf(heapBuf.data(), heapBuf.size(), fmt, copy);
        heapBuf.resize(static_cast<std::size_t>(needed));
        message = heapBuf;
    }
    va_end(copy);

    if (g_sink) {
        g_sink(level, message);
    } else {
        writeStderr(level, message);
    }
}

} // namespace vkframe
