#pragma once
#include <chrono>
#include <cstdint>

namespace utils
{

// Clock used by every protocol object that does not get its timestamps passed in.
class TimeSource
{
public:
    virtual ~TimeSource() = default;

    // monotonic nanoseconds
    virtual uint64_t getAbsoluteTime() const = 0;
    virtual std::chrono::system_clock::time_point wallClock() const = 0;
};

namespace Time
{

constexpr uint64_t us = 1000;
constexpr uint64_t ms = 1000 * us;
constexpr uint64_t sec = ms * 1000;

// installs the system clock
void initialize();
void initialize(TimeSource& timeSource);

uint64_t getAbsoluteTime();
std::chrono::system_clock::time_point now();

// 32.32 fixed point seconds since 1900
uint64_t toNtp(std::chrono::system_clock::time_point timestamp);

// middle 32 bits, as carried in LSR and DLSR
inline uint32_t toNtp32(const uint64_t ntpTimestamp)
{
    return static_cast<uint32_t>(ntpTimestamp >> 16);
}

inline uint32_t toNtp32(const std::chrono::system_clock::time_point timestamp)
{
    return toNtp32(toNtp(timestamp));
}

// signed distance from a to b, valid across wrap of the 64 bit clock
constexpr int64_t diff(const uint64_t a, const uint64_t b)
{
    return static_cast<int64_t>(b - a);
}

constexpr bool diffGT(const uint64_t a, const uint64_t b, const uint64_t value)
{
    return diff(a, b) > static_cast<int64_t>(value);
}

constexpr bool diffGE(const uint64_t a, const uint64_t b, const uint64_t value)
{
    return diff(a, b) >= static_cast<int64_t>(value);
}

} // namespace Time

} // namespace utils
