#pragma once

#include "utils/Time.h"
#include <algorithm>
#include <cstdint>
#include <limits>

namespace sctp
{

// Single shot deadline. Times are ns on the clock passed to processTimeout.
class Timer
{
public:
    static constexpr int64_t NEVER = std::numeric_limits<int64_t>::max();

    void start(uint64_t now, uint64_t duration)
    {
        _deadline = now + duration;
        _running = true;
    }

    void stop() { _running = false; }
    bool isRunning() const { return _running; }

    int64_t timeToExpiry(uint64_t now) const
    {
        return _running ? std::max(int64_t(0), utils::Time::diff(now, _deadline)) : NEVER;
    }

    bool hasExpired(uint64_t now) const { return _running && timeToExpiry(now) == 0; }

private:
    uint64_t _deadline = 0;
    bool _running = false;
};

} // namespace sctp
