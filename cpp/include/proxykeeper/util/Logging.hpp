#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace proxykeeper::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error,
    off
};

void initLogging(LogLevel level);
bool shouldLog(LogLevel level);
void log(LogLevel level, const std::string& message);

// Accepts trace/debug/info/warn/error plus "none" and "off".
std::optional<LogLevel> parseLogLevel(std::string_view text);

} // namespace proxykeeper::util
