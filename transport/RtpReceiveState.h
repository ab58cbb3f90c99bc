#pragma once

#include "rtp/JitterTracker.h"
#include "transport/PacketCounters.h"
#include <cstdint>

namespace memory
{
class Packet;
} // namespace memory

namespace rtp
{
class ReportBlock;
class RtcpSenderReport;
} // namespace rtp

namespace transport
{

/**
 * Statistics of one inbound ssrc. Sequence tracking follows RFC 3550 appendix A.1 and the report
 * block values appendix A.3.
 */
class RtpReceiveState
{
public:
    explicit RtpReceiveState(uint32_t rtpFrequency);

    void onRtpReceived(const memory::Packet& packet, uint64_t timestamp);
    void onSenderReportReceived(const rtp::RtcpSenderReport& senderReport, uint64_t timestamp);
    void fillInReportBlock(uint64_t timestamp, rtp::ReportBlock& reportBlock);

    bool hasReceived() const { return _initialized; }
    uint64_t getLastActive() const { return _activeAt; }
    uint32_t getExtendedSequenceNumber() const { return _cycles + _maxSequenceNumber; }
    uint32_t getCumulativeLoss() const;
    uint32_t getJitter() const { return _jitterTracker.get(); }
    uint32_t getRtpFrequency() const { return _jitterTracker.getRtpFrequency(); }
    uint8_t getPayloadType() const { return _payloadType; }
    uint64_t getLastSenderReportNtp() const { return _lastSenderReportNtp; }
    PacketCounters getCounters() const;

private:
    bool updateSequenceNumber(uint16_t sequenceNumber);
    void resetSequence(uint16_t sequenceNumber);
    uint32_t getExpected() const { return getExtendedSequenceNumber() - _baseSequenceNumber + 1; }

    bool _initialized;
    uint8_t _payloadType;
    uint16_t _maxSequenceNumber;
    uint32_t _cycles;
    uint32_t _baseSequenceNumber;
    uint32_t _badSequenceNumber;
    uint32_t _received;
    uint32_t _expectedPrior;
    uint32_t _receivedPrior;
    uint64_t _octets;
    uint64_t _headerOctets;
    uint64_t _activeAt;

    uint64_t _lastSenderReportNtp;
    uint64_t _lastSenderReportReceiveTime;

    rtp::JitterTracker _jitterTracker;
};

} // namespace transport
