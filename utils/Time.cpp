#include "utils/Time.h"
#include <ctime>

namespace utils
{

namespace Time
{
namespace
{
uint64_t monotonicNs()
{
    timespec timeSpec = {};
    clock_gettime(CLOCK_MONOTONIC, &timeSpec);
    return static_cast<uint64_t>(timeSpec.tv_sec) * sec + static_cast<uint64_t>(timeSpec.tv_nsec);
}

class SystemClock final : public TimeSource
{
public:
    uint64_t getAbsoluteTime() const override { return monotonicNs(); }
    std::chrono::system_clock::time_point wallClock() const override { return std::chrono::system_clock::now(); }
};

SystemClock systemClock;
TimeSource* timeSource = &systemClock;
} // namespace

void initialize()
{
    timeSource = &systemClock;
}

void initialize(TimeSource& source)
{
    timeSource = &source;
}

uint64_t getAbsoluteTime()
{
    return timeSource->getAbsoluteTime();
}

std::chrono::system_clock::time_point now()
{
    return timeSource->wallClock();
}

uint64_t toNtp(const std::chrono::system_clock::time_point timestamp)
{
    using namespace std::chrono;
    // 1900 to 1970, 17 leap days
    constexpr int64_t epochOffsetSeconds = (70 * 365 + 17) * 86400ll;
    const auto sinceEpoch = duration_cast<microseconds>(timestamp.time_since_epoch()).count();
    const uint64_t seconds = static_cast<uint64_t>(sinceEpoch / 1000000 + epochOffsetSeconds);
    const uint64_t micros = static_cast<uint64_t>(sinceEpoch % 1000000);
    return (seconds << 32) | ((micros << 32) / 1000000);
}

} // namespace Time

} // namespace utils
