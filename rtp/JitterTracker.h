#pragma once

#include "utils/Time.h"
#include <algorithm>
#include <cstdint>
#include <cstdlib>

namespace rtp
{

// RFC 3550 A.8 interarrival jitter estimate, in RTP timestamp units. Kept in 1/16 units so the
// running average loses no precision. Arrival times are ns.
class JitterTracker
{
public:
    explicit JitterTracker(uint32_t rtpFrequency) : _rtpFrequency(rtpFrequency ? rtpFrequency : 90000) {}

    void update(uint64_t arrivalTime, uint32_t rtpTimestamp)
    {
        if (_packets++ > 0)
        {
            const int64_t arrivalDelta = utils::Time::diff(_lastArrival, arrivalTime) * _rtpFrequency /
                static_cast<int64_t>(utils::Time::sec);
            const int64_t sendDelta = static_cast<int32_t>(rtpTimestamp - _lastRtpTimestamp);
            const int64_t transitDelta = std::abs(arrivalDelta - sendDelta);

            const int64_t ceiling = int64_t(_rtpFrequency) * MAX_JITTER_SECONDS * 16;
            _scaledJitter = std::max(int64_t(0), std::min(ceiling, _scaledJitter + transitDelta - ((_scaledJitter + 8) >> 4)));
        }
        _lastArrival = arrivalTime;
        _lastRtpTimestamp = rtpTimestamp;
    }

    uint32_t get() const { return static_cast<uint32_t>(_scaledJitter >> 4); }
    uint32_t getRtpFrequency() const { return _rtpFrequency; }

private:
    static constexpr int64_t MAX_JITTER_SECONDS = 3;

    const uint32_t _rtpFrequency;
    uint64_t _packets = 0;
    uint64_t _lastArrival = 0;
    uint32_t _lastRtpTimestamp = 0;
    int64_t _scaledJitter = 0;
};

} // namespace rtp
