#pragma once

#include <algorithm>
#include <cstdint>

namespace logger
{

// Lets the first passThroughLimit events log, then every logEveryNth.
class PruneSpam
{
public:
    PruneSpam(uint32_t passThroughLimit, uint32_t logEveryNth)
        : _passThrough(passThroughLimit),
          _logEvery(std::max(1u, logEveryNth)),
          _eventCount(0)
    {
    }

    bool canLog()
    {
        const uint64_t event = _eventCount++;
        return event < _passThrough || ((event - _passThrough) % _logEvery) == 0;
    }

    uint64_t getEventCount() const { return _eventCount; }

private:
    const uint32_t _passThrough;
    const uint32_t _logEvery;
    uint64_t _eventCount;
};

} // namespace logger
