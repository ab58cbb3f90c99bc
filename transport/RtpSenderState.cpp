#include "transport/RtpSenderState.h"
#include "logger/Logger.h"
#include "memory/Packet.h"
#include "rtp/RtcpHeader.h"
#include "rtp/RtpHeader.h"

namespace transport
{

RtpSenderState::RtpSenderState(uint32_t rtpFrequency)
    : _rtpFrequency(rtpFrequency > 0 ? rtpFrequency : 90000),
      _rtpSendTime(0),
      _rtpTimestamp(0),
      _extendedSequenceNumber(0),
      _packets(0),
      _payloadOctets(0),
      _headerOctets(0),
      _retransmissions(0),
      _senderReportSendTime(0),
      _senderReportNtp32(0),
      _rttNtp(~0u),
      _remoteCumulativeLoss(0),
      _remoteLossFraction(0),
      _remoteExtendedSequenceNumber(0)
{
}

void RtpSenderState::onRtpSent(const uint64_t timestamp, const memory::Packet& packet)
{
    auto* header = rtp::RtpHeader::fromPacket(packet);
    if (!header)
    {
        return;
    }

    _rtpSendTime = timestamp;
    _rtpTimestamp = header->timestamp.get();

    if (_packets == 0)
    {
        _extendedSequenceNumber = header->sequenceNumber.get();
    }
    else
    {
        const int16_t sequenceDiff = header->sequenceNumber.get() - (_extendedSequenceNumber & 0xFFFFu);
        if (sequenceDiff > 0)
        {
            _extendedSequenceNumber += sequenceDiff;
        }
    }

    _payloadOctets += header->getPayloadLength(packet.getLength());
    _headerOctets += header->headerLength();
    ++_packets;
}

void RtpSenderState::onSenderReportSent(const uint64_t timestamp, const rtp::RtcpSenderReport& report)
{
    _senderReportSendTime = timestamp;
    _senderReportNtp32 = utils::Time::toNtp32(report.getNtp());
}

// extrapolates from the last sent packet at the stream clock rate
uint32_t RtpSenderState::getRtpTimestamp(const uint64_t timestamp) const
{
    const auto diff = static_cast<int64_t>(timestamp - _rtpSendTime) / 1000;
    return _rtpTimestamp + static_cast<uint32_t>(_rtpFrequency * diff / 1000000ll);
}

void RtpSenderState::fillInReport(rtp::RtcpSenderReport& report, uint64_t timestamp, uint64_t wallClockNtp) const
{
    report.octetCount = static_cast<uint32_t>(_payloadOctets);
    report.packetCount = _packets;
    report.rtpTimestamp = getRtpTimestamp(timestamp);
    report.setNtp(wallClockNtp);
}

// A report block may reference a sender report older than our latest. RTT is computed from what the
// block carries regardless, as LSR and DLSR are self contained.
void RtpSenderState::onReceiverBlockReceived(const uint64_t timestamp,
    const uint32_t receiveTimeNtp32,
    const rtp::ReportBlock& report)
{
    if (report.lastSR.get() != 0)
    {
        _rttNtp = receiveTimeNtp32 - report.lastSR.get() - report.delaySinceLastSR.get();
    }

    if (report.getCumulativeLoss() + 1 < _remoteCumulativeLoss)
    {
        logger::debug("negative loss reported %u, %u",
            "RtpSenderState",
            report.getCumulativeLoss(),
            _remoteCumulativeLoss);
    }
    _remoteCumulativeLoss = report.getCumulativeLoss();
    _remoteLossFraction = report.getFractionLost();
    _remoteExtendedSequenceNumber = report.extendedSeqNoReceived.get();
}

ReportSummary RtpSenderState::getSummary() const
{
    ReportSummary s;
    s.extendedSeqNoReceived = _remoteExtendedSequenceNumber;
    s.sequenceNumberSent = _extendedSequenceNumber;
    s.lostPackets = _remoteCumulativeLoss;
    s.lossFraction = _remoteLossFraction;
    s.packetsSent = _packets;
    s.rttNtp = (_rttNtp == ~0u ? 0 : _rttNtp);
    s.rtpTimestamp = _rtpTimestamp;
    s.octets = _payloadOctets + _headerOctets;
    s.rtpFrequency = _rtpFrequency;
    return s;
}

PacketCounters RtpSenderState::getCounters() const
{
    PacketCounters counters;
    counters.packets = _packets;
    counters.lostPackets = _remoteCumulativeLoss;
    counters.octets = _payloadOctets;
    counters.headerOctets = _headerOctets;
    counters.retransmissions = _retransmissions;
    return counters;
}

} // namespace transport
