#pragma once

#include "transport/PacketCounters.h"
#include "utils/Time.h"
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
struct ReportSummary
{
    bool empty() const { return packetsSent == 0; }
    uint64_t getRtt() const { return (static_cast<uint64_t>(rttNtp) * utils::Time::sec) >> 16; }

    uint32_t lostPackets = 0;
    double lossFraction = 0;
    uint32_t extendedSeqNoReceived = 0;
    uint32_t sequenceNumberSent = 0;
    uint32_t rttNtp = 0;
    uint32_t packetsSent = 0;
    uint32_t rtpTimestamp = 0;
    uint64_t octets = 0;
    uint32_t rtpFrequency = 0;
};

/**
 * Statistics of one local ssrc. Feeds sender reports and digests the report blocks the peer returns.
 */
class RtpSenderState
{
public:
    explicit RtpSenderState(uint32_t rtpFrequency);

    void onRtpSent(uint64_t timestamp, const memory::Packet& packet);
    void onRetransmissionSent() { ++_retransmissions; }
    void onSenderReportSent(uint64_t timestamp, const rtp::RtcpSenderReport& report);
    void onReceiverBlockReceived(uint64_t timestamp, uint32_t wallClockNtp32, const rtp::ReportBlock& report);

    bool hasSent() const { return _packets > 0; }
    uint64_t getLastSendTime() const { return _rtpSendTime; }
    uint64_t getLastSenderReportTime() const { return _senderReportSendTime; }
    uint32_t getLastSenderReportNtp32() const { return _senderReportNtp32; }
    uint32_t getSentPacketsCount() const { return _packets; }
    uint32_t getRtpFrequency() const { return _rtpFrequency; }
    uint32_t getRtpTimestamp(uint64_t timestamp) const;
    void fillInReport(rtp::RtcpSenderReport& report, uint64_t timestamp, uint64_t wallClockNtp) const;

    ReportSummary getSummary() const;
    PacketCounters getCounters() const;
    // ~0 until a report block referencing one of our sender reports arrives
    uint32_t getRttNtp() const { return _rttNtp; }

private:
    uint32_t _rtpFrequency;
    uint64_t _rtpSendTime;
    uint32_t _rtpTimestamp;
    uint32_t _extendedSequenceNumber;
    uint32_t _packets;
    uint64_t _payloadOctets;
    uint64_t _headerOctets;
    uint32_t _retransmissions;

    uint64_t _senderReportSendTime;
    uint32_t _senderReportNtp32;

    uint32_t _rttNtp;
    uint32_t _remoteCumulativeLoss;
    double _remoteLossFraction;
    uint32_t _remoteExtendedSequenceNumber;
};

} // namespace transport
