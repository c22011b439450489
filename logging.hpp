#pragma once

#include <format>
#include <functional>
#include <string>
#include <string_view>

namespace marshal
{

enum class LogLevel { debug, info, warning, error };

std::string_view toString(LogLevel level) noexcept;

/// Receives every log line at or above the current level
using LogSink = std::function<void(LogLevel, std::string_view)>;

/**
 * @brief Replaces the process-wide log sink
 *
 * The default sink writes "[marshal] warning: ..." lines to std::clog.
 * Passing an empty function restores the default. Returns the previous sink.
 */
LogSink setLogSink(LogSink sink);

/// Sets the minimum level that reaches the sink (default: LogLevel::warning)
void setLogLevel(LogLevel level) noexcept;
LogLevel logLevel() noexcept;

namespace detail
{
void emitLog(LogLevel level, std::string_view message);
}

/// Formats and logs a message if level passes the threshold
template <typename... Args>
void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args)
{
    if (level < logLevel())
        return;

    detail::emitLog(level, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace marshal
