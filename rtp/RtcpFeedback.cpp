#include "rtp/RtcpFeedback.h"
#include <cstring>

namespace rtp
{

RtcpFeedback& RtcpFeedback::create(void* area,
    uint8_t packetType,
    uint8_t format,
    uint32_t senderSsrc,
    uint32_t mediaSsrc)
{
    auto& feedback = *reinterpret_cast<RtcpFeedback*>(area);
    feedback.header = RtcpHeader(static_cast<RtcpPacketType>(packetType));
    feedback.header.fmtCount = format;
    feedback.header.length = static_cast<uint16_t>(sizeof(RtcpFeedback) / sizeof(uint32_t) - 1);
    feedback.senderSsrc = senderSsrc;
    feedback.mediaSsrc = mediaSsrc;
    return feedback;
}

const RtcpFeedback* RtcpFeedback::fromPtr(const void* p, size_t length)
{
    const auto* header = RtcpHeader::fromPtr(p, length);
    if (!header || length < sizeof(RtcpFeedback) || header->size() > length || header->size() < sizeof(RtcpFeedback) ||
        !header->isValid() || header->size() - sizeof(RtcpFeedback) < header->getPaddingSize())
    {
        return nullptr;
    }
    return reinterpret_cast<const RtcpFeedback*>(p);
}

size_t getNackItemCount(const RtcpFeedback& feedback)
{
    return feedback.getControlInfoSize() / sizeof(NackItem);
}

const NackItem* getNackItems(const RtcpFeedback& feedback)
{
    return reinterpret_cast<const NackItem*>(&feedback + 1);
}

RtcpFeedback& createPli(void* area, uint32_t senderSsrc, uint32_t mediaSsrc)
{
    return RtcpFeedback::create(area, PAYLOADSPECIFIC_FB, FB_PLI, senderSsrc, mediaSsrc);
}

bool isPli(const void* p, size_t length)
{
    const auto* feedback = RtcpFeedback::fromPtr(p, length);
    return feedback && feedback->is(PAYLOADSPECIFIC_FB, FB_PLI);
}

bool isNack(const void* p, size_t length)
{
    const auto* feedback = RtcpFeedback::fromPtr(p, length);
    return feedback && feedback->is(RTPTRANSPORT_FB, FB_GENERIC_NACK);
}

RtcpFirFeedback& RtcpFirFeedback::create(void* area, uint32_t senderSsrc)
{
    auto& fir = *reinterpret_cast<RtcpFirFeedback*>(area);
    RtcpFeedback::create(area, PAYLOADSPECIFIC_FB, FB_FIR, senderSsrc, 0);
    return fir;
}

const RtcpFirFeedback* RtcpFirFeedback::fromPtr(const void* p, size_t length)
{
    const auto* feedback = RtcpFeedback::fromPtr(p, length);
    if (!feedback || !feedback->is(PAYLOADSPECIFIC_FB, FB_FIR))
    {
        return nullptr;
    }
    return reinterpret_cast<const RtcpFirFeedback*>(p);
}

void RtcpFirFeedback::addEntry(uint32_t ssrc, uint8_t sequenceNumber)
{
    auto& entry = reinterpret_cast<Entry*>(this + 1)[getCount()];
    std::memset(&entry, 0, sizeof(Entry));
    entry.ssrc = ssrc;
    entry.sequenceNumber = sequenceNumber;
    base.header.length = static_cast<uint16_t>(base.header.length.get() + sizeof(Entry) / sizeof(uint32_t));
}

RtcpRembFeedback& RtcpRembFeedback::create(void* area, uint32_t senderSsrc)
{
    auto& remb = *reinterpret_cast<RtcpRembFeedback*>(area);
    RtcpFeedback::create(area, PAYLOADSPECIFIC_FB, FB_APPLICATION, senderSsrc, 0);
    std::memcpy(remb.identifier, "REMB", 4);
    remb.ssrcCount = 0;
    std::memset(remb.bitrate, 0, sizeof(remb.bitrate));
    remb.base.header.length = static_cast<uint16_t>(remb.base.header.length.get() + 2);
    return remb;
}

const RtcpRembFeedback* RtcpRembFeedback::fromPtr(const void* p, size_t length)
{
    const auto* feedback = RtcpFeedback::fromPtr(p, length);
    if (!feedback || !feedback->is(PAYLOADSPECIFIC_FB, FB_APPLICATION) || feedback->getControlInfoSize() < 8)
    {
        return nullptr;
    }

    const auto* remb = reinterpret_cast<const RtcpRembFeedback*>(p);
    if (std::memcmp(remb->identifier, "REMB", 4) != 0 ||
        feedback->getControlInfoSize() < 8 + remb->ssrcCount * sizeof(uint32_t))
    {
        return nullptr;
    }
    return remb;
}

uint64_t RtcpRembFeedback::getBitrate() const
{
    const uint32_t exponent = bitrate[0] >> 2;
    const uint64_t mantissa = (uint64_t(bitrate[0] & 0x3u) << 16) | (uint64_t(bitrate[1]) << 8) | bitrate[2];
    return exponent > 46 ? UINT64_MAX : mantissa << exponent;
}

void RtcpRembFeedback::setBitrate(uint64_t bps)
{
    const uint64_t maxMantissa = 0x3FFFFu;
    uint32_t exponent = 0;
    while ((bps >> exponent) > maxMantissa && exponent < 63)
    {
        ++exponent;
    }
    const auto mantissa = static_cast<uint32_t>(bps >> exponent);
    bitrate[0] = static_cast<uint8_t>((exponent << 2) | (mantissa >> 16));
    bitrate[1] = static_cast<uint8_t>(mantissa >> 8);
    bitrate[2] = static_cast<uint8_t>(mantissa);
}

void RtcpRembFeedback::addSsrc(uint32_t ssrc)
{
    if (ssrcCount == 255)
    {
        return;
    }
    ssrcFeedback[ssrcCount++] = ssrc;
    base.header.length = static_cast<uint16_t>(base.header.length.get() + 1);
}

} // namespace rtp
