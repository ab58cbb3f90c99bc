#include "transport/RtpReceiveState.h"
#include "memory/Packet.h"
#include "rtp/RtcpHeader.h"
#include "rtp/RtpHeader.h"
#include "utils/Time.h"
#include <algorithm>

namespace
{
const uint16_t MAX_DROPOUT = 3000;
const uint16_t MAX_MISORDER = 100;
const uint32_t SEQUENCE_MODULO = 0x10000;
const uint32_t MAX_CUMULATIVE_LOSS = 0x7FFFFF;
} // namespace

namespace transport
{

RtpReceiveState::RtpReceiveState(uint32_t rtpFrequency)
    : _initialized(false),
      _payloadType(0xFF),
      _maxSequenceNumber(0),
      _cycles(0),
      _baseSequenceNumber(0),
      _badSequenceNumber(SEQUENCE_MODULO + 1),
      _received(0),
      _expectedPrior(0),
      _receivedPrior(0),
      _octets(0),
      _headerOctets(0),
      _activeAt(0),
      _lastSenderReportNtp(0),
      _lastSenderReportReceiveTime(0),
      _jitterTracker(rtpFrequency)
{
}

void RtpReceiveState::resetSequence(uint16_t sequenceNumber)
{
    _baseSequenceNumber = sequenceNumber;
    _maxSequenceNumber = sequenceNumber;
    _badSequenceNumber = SEQUENCE_MODULO + 1;
    _cycles = 0;
    _received = 0;
    _receivedPrior = 0;
    _expectedPrior = 0;
}

// false if the packet is considered out of sequence and must not be counted
bool RtpReceiveState::updateSequenceNumber(const uint16_t sequenceNumber)
{
    const uint16_t delta = sequenceNumber - _maxSequenceNumber;
    if (delta < MAX_DROPOUT)
    {
        if (sequenceNumber < _maxSequenceNumber)
        {
            _cycles += SEQUENCE_MODULO;
        }
        _maxSequenceNumber = sequenceNumber;
    }
    else if (delta <= SEQUENCE_MODULO - MAX_MISORDER)
    {
        if (sequenceNumber == _badSequenceNumber)
        {
            // two sequential packets after a large jump, the sender restarted
            resetSequence(sequenceNumber);
        }
        else
        {
            _badSequenceNumber = (sequenceNumber + 1) & (SEQUENCE_MODULO - 1);
            return false;
        }
    }

    ++_received;
    return true;
}

void RtpReceiveState::onRtpReceived(const memory::Packet& packet, const uint64_t timestamp)
{
    auto rtpHeader = rtp::RtpHeader::fromPacket(packet);
    if (!rtpHeader)
    {
        return;
    }

    const uint16_t sequenceNumber = rtpHeader->sequenceNumber.get();
    if (!_initialized)
    {
        _initialized = true;
        _payloadType = rtpHeader->payloadType;
        resetSequence(sequenceNumber);
        ++_received;
    }
    else if (!updateSequenceNumber(sequenceNumber))
    {
        return;
    }

    _activeAt = timestamp;
    _octets += rtpHeader->getPayloadLength(packet.getLength());
    _headerOctets += rtpHeader->headerLength();
    _jitterTracker.update(timestamp, rtpHeader->timestamp.get());
}

void RtpReceiveState::onSenderReportReceived(const rtp::RtcpSenderReport& senderReport, const uint64_t timestamp)
{
    _activeAt = timestamp;
    _lastSenderReportNtp = senderReport.getNtp();
    _lastSenderReportReceiveTime = timestamp;
}

uint32_t RtpReceiveState::getCumulativeLoss() const
{
    if (!_initialized)
    {
        return 0;
    }

    const int64_t lost = static_cast<int64_t>(getExpected()) - _received;
    return static_cast<uint32_t>(std::min(static_cast<int64_t>(MAX_CUMULATIVE_LOSS), std::max(int64_t(0), lost)));
}

void RtpReceiveState::fillInReportBlock(const uint64_t timestamp, rtp::ReportBlock& reportBlock)
{
    reportBlock.extendedSeqNoReceived = getExtendedSequenceNumber();
    reportBlock.interarrivalJitter = _jitterTracker.get();
    reportBlock.setCumulativeLoss(getCumulativeLoss());

    const uint32_t expected = getExpected();
    const uint32_t expectedInterval = expected - _expectedPrior;
    const uint32_t receivedInterval = _received - _receivedPrior;
    const int64_t lostInterval = static_cast<int64_t>(expectedInterval) - receivedInterval;
    _expectedPrior = expected;
    _receivedPrior = _received;
    if (expectedInterval == 0 || lostInterval <= 0)
    {
        reportBlock.setFractionLost(0);
    }
    else
    {
        reportBlock.setFractionLost(static_cast<double>(lostInterval) / expectedInterval);
    }

    if (_lastSenderReportNtp != 0)
    {
        reportBlock.lastSR = utils::Time::toNtp32(_lastSenderReportNtp);
        reportBlock.setDelaySinceLastSR(timestamp - _lastSenderReportReceiveTime);
    }
    else
    {
        reportBlock.lastSR = 0;
        reportBlock.delaySinceLastSR = 0;
    }
}

PacketCounters RtpReceiveState::getCounters() const
{
    PacketCounters counters;
    counters.packets = _received;
    counters.lostPackets = getCumulativeLoss();
    counters.octets = _octets;
    counters.headerOctets = _headerOctets;
    return counters;
}

} // namespace transport
