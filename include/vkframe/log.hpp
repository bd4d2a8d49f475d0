#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

namespace vkframe {

enum class LogLevel : std::uint8_t {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

// Receives every message that passes the level filter. The message has no
// trailing newline.
using LogSink = std::function<void(LogLevel, std::string_view)>;

void setLogLevel(LogLevel level);
[[nodiscard]] LogLevel logLevel();
[[nodiscard]] bool shouldLog(LogLevel level);

// Reads VKFRAME_LOG (error|warn|info|debug). Unknown values are ignored.
void initializeLogLevelFromEnvironment();

// Replace the output sink. An empty sink restores the stderr writer.
void setLogSink(LogSink sink);

[[nodiscard]] const char* logLevelName(LogLevel level);

// printf-style. Messages below the current level are dropped before formatting.
#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 2, 3)))
#endif
void log(LogLevel level, const char* fmt, ...);

} // namespace vkframe
