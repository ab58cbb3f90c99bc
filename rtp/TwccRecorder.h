#pragma once

#include <cstddef>
#include <cstdint>
#include <map>

namespace rtp
{

/**
 * Records arrival times of packets carrying the transport wide sequence number extension and turns them
 * into transport feedback packets. Sequence numbers are unwrapped so reports span the 16 bit wrap.
 */
class TwccRecorder
{
public:
    explicit TwccRecorder(uint32_t reporterSsrc);

    void onPacketReceived(uint32_t mediaSsrc, uint16_t transportSequenceNumber, uint64_t arrivalUs);
    bool empty() const { return _arrivals.empty(); }
    size_t size() const { return _arrivals.size(); }

    // Writes as many feedback packets as fit into buffer, one after another. Reported records are removed.
    // Returns bytes written.
    size_t buildFeedback(uint8_t* buffer, size_t bufferSize, size_t maxPacketSize);

    uint8_t getFeedbackPacketCount() const { return _feedbackPacketCount; }

private:
    static constexpr size_t MAX_RECORDS = 8192;

    int64_t unwrap(uint16_t sequenceNumber);

    uint32_t _reporterSsrc;
    uint32_t _mediaSsrc;
    uint8_t _feedbackPacketCount;
    bool _hasUnwrapped;
    int64_t _lastUnwrapped;
    int64_t _lastReported;
    std::map<int64_t, uint64_t> _arrivals;
};

} // namespace rtp
