#include "transport/RtcpReportsProducer.h"
#include "rtp/RtcpHeader.h"
#include <algorithm>

namespace
{
const size_t SENDER_REPORT_MIN_SIZE = sizeof(rtp::RtcpHeader) + 6 * sizeof(uint32_t);
const size_t RECEIVER_REPORT_MIN_SIZE = sizeof(rtp::RtcpHeader) + sizeof(uint32_t);
const size_t NO_SPACE = ~size_t(0);
} // namespace

namespace transport
{

RtcpReportsProducer::RtcpReportsProducer(const logger::LoggableId& loggableId,
    const size_t mtu,
    const std::string& cname,
    RtcpSender& sender)
    : _loggableId(loggableId),
      _packetLimit(std::min(mtu, memory::Packet::maxLength())),
      _cname(cname.substr(0, 255)),
      _rtcpSender(sender),
      _packetsSent(0)
{
    _reportSsrcs.reserve(rtp::MAX_REPORT_BLOCKS);
}

size_t RtcpReportsProducer::getSdesSize(const size_t chunkCount) const
{
    const size_t chunkSize = (sizeof(uint32_t) + 2 + _cname.size() + 1 + 3) & ~size_t(3);
    return sizeof(rtp::RtcpHeader) + chunkCount * chunkSize;
}

// number of report blocks that fit after a report of reportSize, NO_SPACE if the report itself does not fit
size_t RtcpReportsProducer::getReportBlockSpace(const size_t reportSize, const size_t remainingBlocks) const
{
    if (_reportSsrcs.size() >= rtp::MAX_REPORT_BLOCKS)
    {
        return NO_SPACE;
    }

    const size_t needed = _packet.getLength() + reportSize + getSdesSize(_reportSsrcs.size() + 1);
    if (needed > _packetLimit)
    {
        return NO_SPACE;
    }

    const size_t blocks = std::min({remainingBlocks,
        static_cast<size_t>(rtp::MAX_REPORT_BLOCKS),
        (_packetLimit - needed) / sizeof(rtp::ReportBlock)});
    if (blocks == 0 && remainingBlocks > 0 && _packet.getLength() > 0)
    {
        return NO_SPACE;
    }
    return blocks;
}

void RtcpReportsProducer::flush(const uint64_t timestamp)
{
    if (_packet.getLength() == 0)
    {
        return;
    }

    auto* sdes = rtp::RtcpSourceDescription::create(_packet.get() + _packet.getLength());
    for (const auto ssrc : _reportSsrcs)
    {
        if (!sdes->addChunk(ssrc, _cname, _packetLimit - _packet.getLength()))
        {
            logger::warn("SDES chunk for %u does not fit", _loggableId.c_str(), ssrc);
            break;
        }
    }
    _packet.setLength(_packet.getLength() + sdes->size());

    _rtcpSender.sendRtcp(_packet, timestamp);
    ++_packetsSent;
    _packet.setLength(0);
    _reportSsrcs.clear();
}

// Each sender report ntp is offset 1/65536 sec to make them unique, as report blocks reference
// the SR by its middle 32 bits of ntp.
size_t RtcpReportsProducer::sendReports(const uint64_t timestamp,
    const uint64_t wallClockNtp,
    const SenderStates& outbound,
    const ReceiveStates& inbound,
    const uint32_t receiveReportSsrc)
{
    static constexpr uint64_t ntp32Tick = 0x10000u;

    ReceiveStates blocks;
    for (auto& it : inbound)
    {
        if (it.second->hasReceived())
        {
            blocks.push_back(it);
        }
    }

    _packetsSent = 0;
    _packet.setLength(0);
    _reportSsrcs.clear();

    auto nextBlock = blocks.cbegin();
    uint64_t wallClockNtpReport = wallClockNtp;
    for (auto& it : outbound)
    {
        if (!it.second->hasSent())
        {
            continue;
        }

        size_t blockCount = getReportBlockSpace(SENDER_REPORT_MIN_SIZE, blocks.cend() - nextBlock);
        if (blockCount == NO_SPACE)
        {
            flush(timestamp);
            blockCount = getReportBlockSpace(SENDER_REPORT_MIN_SIZE, blocks.cend() - nextBlock);
            if (blockCount == NO_SPACE)
            {
                logger::error("mtu %zu too small for sender report", _loggableId.c_str(), _packetLimit);
                return _packetsSent;
            }
        }

        auto* senderReport = rtp::RtcpSenderReport::create(_packet.get() + _packet.getLength());
        senderReport->ssrc = it.first;
        it.second->fillInReport(*senderReport, timestamp, wallClockNtpReport);
        wallClockNtpReport += ntp32Tick;
        for (size_t i = 0; i < blockCount; ++i, ++nextBlock)
        {
            auto& block = senderReport->addReportBlock(nextBlock->first);
            nextBlock->second->fillInReportBlock(timestamp, block);
        }
        _packet.setLength(_packet.getLength() + senderReport->size());
        _reportSsrcs.push_back(it.first);
        it.second->onSenderReportSent(timestamp, *senderReport);
    }

    while (nextBlock != blocks.cend())
    {
        size_t blockCount = getReportBlockSpace(RECEIVER_REPORT_MIN_SIZE, blocks.cend() - nextBlock);
        if (blockCount == NO_SPACE)
        {
            flush(timestamp);
            blockCount = getReportBlockSpace(RECEIVER_REPORT_MIN_SIZE, blocks.cend() - nextBlock);
            if (blockCount == NO_SPACE || blockCount == 0)
            {
                logger::error("mtu %zu too small for receiver report", _loggableId.c_str(), _packetLimit);
                return _packetsSent;
            }
        }

        auto* receiverReport = rtp::RtcpReceiverReport::create(_packet.get() + _packet.getLength());
        receiverReport->ssrc = receiveReportSsrc;
        for (size_t i = 0; i < blockCount; ++i, ++nextBlock)
        {
            auto& block = receiverReport->addReportBlock(nextBlock->first);
            nextBlock->second->fillInReportBlock(timestamp, block);
        }
        _packet.setLength(_packet.getLength() + receiverReport->header.size());
        if (std::find(_reportSsrcs.begin(), _reportSsrcs.end(), receiveReportSsrc) == _reportSsrcs.end())
        {
            _reportSsrcs.push_back(receiveReportSsrc);
        }
    }

    flush(timestamp);
    return _packetsSent;
}

} // namespace transport
