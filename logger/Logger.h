#pragma once

#include <atomic>
#include <cinttypes> // PRIu64 and friends for callers
#include <cstdarg>
#include <cstddef>
#include <cstdio>

#define RTCSTACK_LOG_FORMAT __attribute__((format(printf, 1, 3)))

namespace logger
{
enum class Level
{
    ERROR,
    WARN,
    INFO,
    DBG
};

extern std::atomic<Level> _logLevel;

// Opens the file sink in append mode. A null or empty file name logs to the console sinks only.
void setup(const char* logToFile, bool logToStdOut, bool logToStdErr, Level level);
void stop();
void setLevel(Level level);
bool parseLevel(const char* name, Level& level);
const char* toString(Level level);

inline bool isEnabled(Level level)
{
    return level <= _logLevel.load(std::memory_order_relaxed);
}

// Number of lines written to any sink since setup.
uint64_t getLineCount();

void logv(Level level, const char* logGroup, const char* format, va_list args);
void flushLog();

RTCSTACK_LOG_FORMAT inline void error(const char* format, const char* logGroup, ...)
{
    va_list args;
    va_start(args, logGroup);
    logv(Level::ERROR, logGroup, format, args);
    va_end(args);
}

RTCSTACK_LOG_FORMAT inline void warn(const char* format, const char* logGroup, ...)
{
    if (!isEnabled(Level::WARN))
    {
        return;
    }
    va_list args;
    va_start(args, logGroup);
    logv(Level::WARN, logGroup, format, args);
    va_end(args);
}

RTCSTACK_LOG_FORMAT inline void info(const char* format, const char* logGroup, ...)
{
    if (!isEnabled(Level::INFO))
    {
        return;
    }
    va_list args;
    va_start(args, logGroup);
    logv(Level::INFO, logGroup, format, args);
    va_end(args);
}

RTCSTACK_LOG_FORMAT inline void debug(const char* format, const char* logGroup, ...)
{
    if (!isEnabled(Level::DBG))
    {
        return;
    }
    va_list args;
    va_start(args, logGroup);
    logv(Level::DBG, logGroup, format, args);
    va_end(args);
}

/**
 * Log group name of one component instance, "<prefix>-<n>" where n is unique per process unless
 * given explicitly.
 */
class LoggableId
{
public:
    explicit LoggableId(const char* prefix) : LoggableId(prefix, nextInstanceId()) {}

    LoggableId(const char* prefix, size_t instanceId) : _instanceId(instanceId)
    {
        snprintf(_name, sizeof(_name), "%s-%zu", prefix, instanceId);
    }

    const char* c_str() const { return _name; }
    size_t getInstanceId() const { return _instanceId; }

    static size_t nextInstanceId() { return ++_instanceCounter; }

private:
    static std::atomic<size_t> _instanceCounter;
    size_t _instanceId;
    char _name[64];
};

} // namespace logger
