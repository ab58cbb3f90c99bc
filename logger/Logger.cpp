#include "logger/Logger.h"
#include "utils/ScopedFileHandle.h"
#include "utils/Time.h"
#include <cstring>
#include <ctime>
#include <memory>
#include <mutex>
#include <pthread.h>

namespace logger
{

std::atomic<Level> _logLevel(Level::INFO);
std::atomic<size_t> LoggableId::_instanceCounter(0);

namespace
{
struct LogSink
{
    LogSink(const char* fileName, bool stdOut, bool stdErr)
        : logFile(utils::ScopedFileHandle::open(fileName ? fileName : "", "a")),
          logToStdOut(stdOut),
          logToStdErr(stdErr)
    {
    }

    utils::ScopedFileHandle logFile;
    const bool logToStdOut;
    const bool logToStdErr;
};

std::mutex _sinkLock;
std::unique_ptr<LogSink> _sink;
std::atomic<uint64_t> _lineCount(0);

void formatTime(const std::chrono::system_clock::time_point timestamp, char out[32])
{
    using namespace std::chrono;
    const std::time_t currentTime = system_clock::to_time_t(timestamp);
    tm currentLocalTime = {};
    localtime_r(&currentTime, &currentLocalTime);
    const auto msPart = duration_cast<milliseconds>(timestamp.time_since_epoch()).count() % 1000;

    snprintf(out,
        32,
        "%04d-%02d-%02d %02d:%02d:%02d.%03d",
        currentLocalTime.tm_year + 1900,
        currentLocalTime.tm_mon + 1,
        currentLocalTime.tm_mday,
        currentLocalTime.tm_hour,
        currentLocalTime.tm_min,
        currentLocalTime.tm_sec,
        static_cast<int>(msPart));
}
} // namespace

void setup(const char* logFileName, bool logToStdOut, bool logToStdErr, Level level)
{
    std::lock_guard<std::mutex> lock(_sinkLock);
    _logLevel = level;
    _lineCount = 0;
    _sink.reset(new LogSink(logFileName, logToStdOut, logToStdErr));
}

void setLevel(Level level)
{
    _logLevel = level;
}

const char* toString(Level level)
{
    switch (level)
    {
    case Level::ERROR:
        return "ERROR";
    case Level::WARN:
        return "WARN";
    case Level::INFO:
        return "INFO";
    case Level::DBG:
        return "DEBUG";
    }
    return "?";
}

uint64_t getLineCount()
{
    return _lineCount.load();
}

void stop()
{
    std::lock_guard<std::mutex> lock(_sinkLock);
    _sink.reset();
}

bool parseLevel(const char* name, Level& level)
{
    if (std::strcmp(name, "ERROR") == 0)
    {
        level = Level::ERROR;
    }
    else if (std::strcmp(name, "WARN") == 0)
    {
        level = Level::WARN;
    }
    else if (std::strcmp(name, "INFO") == 0)
    {
        level = Level::INFO;
    }
    else if (std::strcmp(name, "DEBUG") == 0 || std::strcmp(name, "DBG") == 0)
    {
        level = Level::DBG;
    }
    else
    {
        return false;
    }
    return true;
}

void logv(Level level, const char* logGroup, const char* format, va_list args)
{
    char message[4096];
    vsnprintf(message, sizeof(message), format, args);

    char timeString[32];
    formatTime(utils::Time::now(), timeString);
    const auto threadId = reinterpret_cast<void*>(pthread_self());

    const char* logLevel = toString(level);
    std::lock_guard<std::mutex> lock(_sinkLock);
    if (!_sink)
    {
        return;
    }
    ++_lineCount;

    if (_sink->logFile)
    {
        fprintf(_sink->logFile.get(), "%s %s [%p][%s] %s\n", timeString, logLevel, threadId, logGroup, message);
    }
    if (_sink->logToStdOut)
    {
        fprintf(stdout, "%s %s [%p][%s] %s\n", timeString, logLevel, threadId, logGroup, message);
    }
    if (_sink->logToStdErr && level <= Level::WARN)
    {
        fprintf(stderr, "%s %s [%p][%s] %s\n", timeString, logLevel, threadId, logGroup, message);
    }
}

void flushLog()
{
    std::lock_guard<std::mutex> lock(_sinkLock);
    if (_sink && _sink->logFile)
    {
        fflush(_sink->logFile.get());
    }
    fflush(stdout);
}

} // namespace logger
