#include "rtp/RtcpHeader.h"
#include "utils/Time.h"
#include <algorithm>
#include <cstring>

namespace rtp
{
namespace
{
// fixed words after the common header, ssrc included
const size_t SENDER_REPORT_WORDS = 6;
const size_t RECEIVER_REPORT_WORDS = 1;

// count field entries of the given size plus the fixed part must fit in length
bool itemsFit(const RtcpHeader& header, size_t fixedBytes, size_t itemSize)
{
    return header.isValid() &&
        fixedBytes + header.fmtCount * itemSize + header.getPaddingSize() <= header.size() - sizeof(RtcpHeader);
}

template <typename ReportT>
const ReportT* castReport(const void* p, size_t length, RtcpPacketType type, size_t fixedWords)
{
    const auto* header = RtcpHeader::fromPtr(p, length);
    if (!header || length < sizeof(RtcpHeader) + fixedWords * sizeof(uint32_t) || header->packetType != type ||
        header->size() > length || !itemsFit(*header, fixedWords * sizeof(uint32_t), sizeof(ReportBlock)))
    {
        return nullptr;
    }
    return reinterpret_cast<const ReportT*>(p);
}

ReportBlock& appendBlock(RtcpHeader& header, ReportBlock* blocks, uint32_t ssrc)
{
    auto& block = blocks[header.fmtCount];
    std::memset(&block, 0, sizeof(ReportBlock));
    block.ssrc = ssrc;
    header.appendItem(sizeof(ReportBlock) / sizeof(uint32_t));
    return block;
}
} // namespace

RtcpHeader* RtcpHeader::fromPtr(void* p, size_t length)
{
    return (p && length >= sizeof(RtcpHeader)) ? reinterpret_cast<RtcpHeader*>(p) : nullptr;
}

const RtcpHeader* RtcpHeader::fromPtr(const void* p, size_t length)
{
    return (p && length >= sizeof(RtcpHeader)) ? reinterpret_cast<const RtcpHeader*>(p) : nullptr;
}

size_t RtcpHeader::getPaddingSize() const
{
    return padding ? reinterpret_cast<const uint8_t*>(this)[size() - 1] : 0;
}

bool RtcpHeader::isValid() const
{
    if (version != 2)
    {
        return false;
    }
    if (!padding)
    {
        return true;
    }
    const size_t paddingSize = getPaddingSize();
    return length.get() > 0 && paddingSize > 0 && paddingSize <= length.get() * sizeof(uint32_t);
}

void RtcpHeader::addPadding(size_t wordCount)
{
    if (padding || wordCount == 0 || wordCount * sizeof(uint32_t) > 255)
    {
        return;
    }

    auto* tail = reinterpret_cast<uint8_t*>(this) + size();
    const size_t paddingBytes = wordCount * sizeof(uint32_t);
    std::memset(tail, 0, paddingBytes);
    tail[paddingBytes - 1] = static_cast<uint8_t>(paddingBytes);
    length = static_cast<uint16_t>(length.get() + wordCount);
    padding = 1;
}

void RtcpHeader::appendItem(size_t words)
{
    fmtCount = fmtCount + 1;
    length = static_cast<uint16_t>(length.get() + words);
}

CompoundRtcpPacket::CompoundRtcpPacket(const void* p, size_t length)
    : _first(RtcpHeader::fromPtr(p, length)),
      _end(_first ? reinterpret_cast<const RtcpHeader*>(reinterpret_cast<const uint8_t*>(p) + length) : nullptr)
{
}

bool CompoundRtcpPacket::isValid(const void* p, size_t length)
{
    if (!p || length < sizeof(RtcpHeader) || length % sizeof(uint32_t) != 0)
    {
        return false;
    }

    const auto* cursor = reinterpret_cast<const uint8_t*>(p);
    const auto* end = cursor + length;
    while (cursor < end)
    {
        if (cursor + sizeof(RtcpHeader) > end)
        {
            return false;
        }
        const auto* header = reinterpret_cast<const RtcpHeader*>(cursor);
        const auto* next = cursor + header->size();
        if (next > end || !header->isValid() || (header->padding && next != end))
        {
            return false;
        }
        cursor = next;
    }
    return true;
}

RtcpSourceDescription* RtcpSourceDescription::create(void* buffer)
{
    auto* sdes = reinterpret_cast<RtcpSourceDescription*>(buffer);
    sdes->header = RtcpHeader(SOURCE_DESCRIPTION);
    return sdes;
}

bool RtcpSourceDescription::addChunk(uint32_t ssrc, const std::string& cname, size_t maxSize)
{
    const size_t valueLength = std::min(cname.size(), size_t(255));
    // ssrc, CNAME item, at least one null octet, padded to 32 bits
    const size_t chunkWords = (sizeof(uint32_t) + 2 + valueLength + 1 + 3) / sizeof(uint32_t);
    const size_t chunkSize = chunkWords * sizeof(uint32_t);
    if (header.fmtCount == MAX_REPORT_BLOCKS || size() + chunkSize > maxSize)
    {
        return false;
    }

    auto* chunk = reinterpret_cast<uint8_t*>(this) + size();
    std::memset(chunk, 0, chunkSize);
    const nwuint32_t networkSsrc(ssrc);
    std::memcpy(chunk, &networkSsrc, sizeof(networkSsrc));
    chunk[4] = SDESItem::CNAME;
    chunk[5] = static_cast<uint8_t>(valueLength);
    std::memcpy(chunk + 6, cname.data(), valueLength);
    header.appendItem(chunkWords);
    return true;
}

bool RtcpSourceDescription::getChunks(std::vector<SdesChunk>& chunks) const
{
    if (!header.isValid())
    {
        return false;
    }

    const auto* base = reinterpret_cast<const uint8_t*>(this);
    const uint8_t* end = base + size() - header.getPaddingSize();
    const uint8_t* cursor = base + sizeof(RtcpHeader);
    for (int i = 0; i < header.fmtCount; ++i)
    {
        if (cursor + sizeof(uint32_t) > end)
        {
            return false;
        }

        const uint8_t* chunkStart = cursor;
        SdesChunk chunk{reinterpret_cast<const nwuint32_t*>(cursor)->get(), std::string()};
        cursor += sizeof(uint32_t);

        const uint8_t* next = nullptr;
        for (auto& item : utils::TlvCollectionConst<SDESItem>(cursor, end))
        {
            const auto* itemStart = reinterpret_cast<const uint8_t*>(&item);
            if (item.empty())
            {
                // null octets run to the next 32 bit boundary of the chunk
                next = chunkStart + ((itemStart - chunkStart + 4) & ~ptrdiff_t(3));
                break;
            }
            if (itemStart + 2 > end || itemStart + item.size() > end)
            {
                return false;
            }
            if (item.type == SDESItem::CNAME)
            {
                chunk.cname = item.getValue();
            }
        }

        if (!next || next > end)
        {
            return false;
        }
        cursor = next;
        chunks.push_back(chunk);
    }
    return true;
}

void ReportBlock::setFractionLost(double fraction)
{
    const auto raw = static_cast<uint32_t>(std::min(255.0, std::max(0.0, fraction * 256.0)));
    lossInfo = (lossInfo.get() & 0xFFFFFFu) | (raw << 24);
}

void ReportBlock::setCumulativeLoss(uint32_t count)
{
    // positive range of the signed 24 bit field
    lossInfo = (lossInfo.get() & 0xFF000000u) | std::min(count, 0x7FFFFFu);
}

void ReportBlock::setDelaySinceLastSR(uint64_t ns)
{
    // ns * 65536 / 1e9 without overflow, 1e9 = 512 * 1953125
    delaySinceLastSR = static_cast<uint32_t>(ns * (0x10000 / 512) / (utils::Time::sec / 512));
}

uint64_t ReportBlock::getDelaySinceLastSR() const
{
    return uint64_t(delaySinceLastSR.get()) * utils::Time::sec / 0x10000;
}

RtcpReceiverReport* RtcpReceiverReport::create(void* buffer)
{
    auto* report = reinterpret_cast<RtcpReceiverReport*>(buffer);
    std::memset(buffer, 0, sizeof(RtcpHeader) + RECEIVER_REPORT_WORDS * sizeof(uint32_t));
    report->header = RtcpHeader(RECEIVER_REPORT);
    report->header.length = static_cast<uint16_t>(RECEIVER_REPORT_WORDS);
    return report;
}

const RtcpReceiverReport* RtcpReceiverReport::fromPtr(const void* p, size_t length)
{
    return castReport<RtcpReceiverReport>(p, length, RECEIVER_REPORT, RECEIVER_REPORT_WORDS);
}

ReportBlock& RtcpReceiverReport::addReportBlock(uint32_t blockSsrc)
{
    return appendBlock(header, reportBlocks, blockSsrc);
}

RtcpSenderReport* RtcpSenderReport::create(void* buffer)
{
    auto* report = reinterpret_cast<RtcpSenderReport*>(buffer);
    std::memset(buffer, 0, sizeof(RtcpHeader) + SENDER_REPORT_WORDS * sizeof(uint32_t));
    report->header = RtcpHeader(SENDER_REPORT);
    report->header.length = static_cast<uint16_t>(SENDER_REPORT_WORDS);
    return report;
}

const RtcpSenderReport* RtcpSenderReport::fromPtr(const void* p, size_t length)
{
    return castReport<RtcpSenderReport>(p, length, SENDER_REPORT, SENDER_REPORT_WORDS);
}

ReportBlock& RtcpSenderReport::addReportBlock(uint32_t blockSsrc)
{
    return appendBlock(header, reportBlocks, blockSsrc);
}

RtcpGoodbye* RtcpGoodbye::create(void* buffer, uint32_t firstSsrc)
{
    auto* bye = reinterpret_cast<RtcpGoodbye*>(buffer);
    bye->header = RtcpHeader(GOODBYE);
    bye->addSsrc(firstSsrc);
    return bye;
}

const RtcpGoodbye* RtcpGoodbye::fromPtr(const void* p, size_t length)
{
    const auto* header = RtcpHeader::fromPtr(p, length);
    if (!header || header->packetType != GOODBYE || header->size() > length ||
        !itemsFit(*header, 0, sizeof(uint32_t)))
    {
        return nullptr;
    }
    return reinterpret_cast<const RtcpGoodbye*>(p);
}

void RtcpGoodbye::addSsrc(uint32_t byeSsrc)
{
    if (header.fmtCount < MAX_REPORT_BLOCKS)
    {
        ssrc[header.fmtCount] = byeSsrc;
        header.appendItem(1);
    }
}

} // namespace rtp
