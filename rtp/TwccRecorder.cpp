#include "rtp/TwccRecorder.h"
#include "rtp/RtcpTransportFeedback.h"
#include <algorithm>

namespace rtp
{

TwccRecorder::TwccRecorder(uint32_t reporterSsrc)
    : _reporterSsrc(reporterSsrc),
      _mediaSsrc(0),
      _feedbackPacketCount(0),
      _hasUnwrapped(false),
      _lastUnwrapped(0),
      _lastReported(-1)
{
}

int64_t TwccRecorder::unwrap(const uint16_t sequenceNumber)
{
    if (!_hasUnwrapped)
    {
        _hasUnwrapped = true;
        _lastUnwrapped = sequenceNumber;
        return _lastUnwrapped;
    }

    const auto diff = static_cast<int16_t>(sequenceNumber - static_cast<uint16_t>(_lastUnwrapped));
    const int64_t unwrapped = _lastUnwrapped + diff;
    if (unwrapped > _lastUnwrapped)
    {
        _lastUnwrapped = unwrapped;
    }
    return unwrapped;
}

void TwccRecorder::onPacketReceived(const uint32_t mediaSsrc,
    const uint16_t transportSequenceNumber,
    const uint64_t arrivalUs)
{
    const int64_t sequenceNumber = unwrap(transportSequenceNumber);
    if (sequenceNumber <= _lastReported)
    {
        return;
    }

    _mediaSsrc = mediaSsrc;
    if (_arrivals.size() >= MAX_RECORDS)
    {
        _arrivals.erase(_arrivals.begin());
    }
    _arrivals.emplace(sequenceNumber, arrivalUs);
}

size_t TwccRecorder::buildFeedback(uint8_t* buffer, const size_t bufferSize, const size_t maxPacketSize)
{
    size_t written = 0;
    while (!_arrivals.empty())
    {
        const size_t room = std::min(maxPacketSize, bufferSize - written);
        auto it = _arrivals.begin();
        TransportFeedbackBuilder builder(_reporterSsrc,
            _mediaSsrc,
            _feedbackPacketCount,
            static_cast<uint16_t>(it->first),
            it->second,
            room);

        auto lastAdded = _arrivals.end();
        for (; it != _arrivals.end(); ++it)
        {
            if (!builder.addReceivedPacket(static_cast<uint16_t>(it->first), it->second))
            {
                break;
            }
            lastAdded = it;
        }

        if (builder.getPacketCount() == 0)
        {
            break;
        }

        const size_t packetSize = builder.build(buffer + written, room);
        if (packetSize == 0)
        {
            break;
        }

        written += packetSize;
        ++_feedbackPacketCount;
        _lastReported = lastAdded->first;
        _arrivals.erase(_arrivals.begin(), it);
    }

    return written;
}

} // namespace rtp
