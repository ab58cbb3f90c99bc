#pragma once

#include "rtp/RtcpHeader.h"
#include "utils/ByteOrder.h"
#include <cstddef>
#include <cstdint>

namespace rtp
{

// rfc4585 6.1 feedback message types, carried in the count field
enum TransportFeedbackFormat : uint8_t
{
    FB_GENERIC_NACK = 1,
    FB_TRANSPORT_CC = 15
};

enum PayloadFeedbackFormat : uint8_t
{
    FB_PLI = 1,
    FB_FIR = 4,
    FB_APPLICATION = 15
};

// rfc4585 6.1 common feedback packet head, followed by feedback control information
struct RtcpFeedback
{
    RtcpHeader header;
    nwuint32_t senderSsrc;
    nwuint32_t mediaSsrc;

    static RtcpFeedback& create(void* area, uint8_t packetType, uint8_t format, uint32_t senderSsrc, uint32_t mediaSsrc);
    static const RtcpFeedback* fromPtr(const void* p, size_t length);

    bool is(uint8_t packetType, uint8_t format) const
    {
        return header.packetType == packetType && header.fmtCount == format;
    }

    size_t getControlInfoSize() const { return header.size() - sizeof(RtcpFeedback) - header.getPaddingSize(); }
};

// rfc4585 6.2.1 generic NACK entry
struct NackItem
{
    nwuint16_t pid;
    nwuint16_t blp;

    // invokes f for pid and every sequence number flagged in blp, ascending
    template <typename F>
    void forEachLost(F&& f) const
    {
        const uint16_t first = pid.get();
        const uint16_t mask = blp.get();
        f(first);
        for (uint16_t bit = 0; bit < 16; ++bit)
        {
            if (mask & (1u << bit))
            {
                f(static_cast<uint16_t>(first + bit + 1));
            }
        }
    }
};

size_t getNackItemCount(const RtcpFeedback& feedback);
const NackItem* getNackItems(const RtcpFeedback& feedback);

RtcpFeedback& createPli(void* area, uint32_t senderSsrc, uint32_t mediaSsrc);
bool isPli(const void* p, size_t length);
bool isNack(const void* p, size_t length);

// rfc5104 4.3.1 full intra request
struct RtcpFirFeedback
{
    struct Entry
    {
        nwuint32_t ssrc;
        uint8_t sequenceNumber;
        uint8_t reserved[3];
    };

    RtcpFeedback base; // media ssrc is zero

    static RtcpFirFeedback& create(void* area, uint32_t senderSsrc);
    static const RtcpFirFeedback* fromPtr(const void* p, size_t length);

    void addEntry(uint32_t ssrc, uint8_t sequenceNumber);
    size_t getCount() const { return base.getControlInfoSize() / sizeof(Entry); }
    const Entry& getEntry(size_t index) const { return reinterpret_cast<const Entry*>(this + 1)[index]; }
};

// draft-alvestrand-rmcat-remb receiver estimated max bitrate
struct RtcpRembFeedback
{
    RtcpFeedback base; // media ssrc is zero
    char identifier[4];
    uint8_t ssrcCount;
    uint8_t bitrate[3]; // 6 bit exponent, 18 bit mantissa
    nwuint32_t ssrcFeedback[255];

    static RtcpRembFeedback& create(void* area, uint32_t senderSsrc);
    static const RtcpRembFeedback* fromPtr(const void* p, size_t length);

    uint64_t getBitrate() const;
    // values above the 18 bit mantissa range are rounded down
    void setBitrate(uint64_t bps);
    void addSsrc(uint32_t ssrc);
};

} // namespace rtp
