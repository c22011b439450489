#include "logging.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <utility>

namespace marshal
{
namespace
{
std::atomic<LogLevel> currentLevel { LogLevel::warning };

std::mutex& sinkLock()
{
    static std::mutex lock;
    return lock;
}

LogSink& currentSink()
{
    static LogSink sink;
    return sink;
}
}

std::string_view toString(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::debug:   return "debug";
    case LogLevel::info:    return "info";
    case LogLevel::warning: return "warning";
    case LogLevel::error:   return "error";
    }

    return "log";
}

LogSink setLogSink(LogSink sink)
{
    std::lock_guard<std::mutex> guard(sinkLock());
    return std::exchange(currentSink(), std::move(sink));
}

void setLogLevel(LogLevel level) noexcept
{
    currentLevel.store(level);
}

LogLevel logLevel() noexcept
{
    return currentLevel.load();
}

namespace detail
{
void emitLog(LogLevel level, std::string_view message)
{
    LogSink sink;

    {
        std::lock_guard<std::mutex> guard(sinkLock());

        if (! currentSink())
        {
            std::clog << "[marshal] " << toString(level) << ": " << message << std::endl;
            return;
        }

        sink = currentSink();
    }

    // called unlocked so a sink may log itself
    sink(level, message);
}
}
} // namespace marshal
