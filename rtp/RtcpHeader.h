#pragma once

#include "memory/Packet.h"
#include "utils/ByteOrder.h"
#include "utils/TlvIterator.h"
#include <cstdint>
#include <string>
#include <vector>

namespace rtp
{

enum RtcpPacketType : uint8_t
{
    SENDER_REPORT = 200,
    RECEIVER_REPORT = 201,
    SOURCE_DESCRIPTION = 202,
    GOODBYE = 203,
    APP_SPECIFIC = 204,
    RTPTRANSPORT_FB = 205,
    PAYLOADSPECIFIC_FB = 206
};

// the 5 bit count field limits report blocks, SDES chunks and BYE sources
const uint32_t MAX_REPORT_BLOCKS = 31;

// rfc3550 6.4.1 common header. The count field doubles as feedback message type (rfc4585).
struct RtcpHeader
{
    uint8_t fmtCount : 5;
    uint8_t padding : 1;
    uint8_t version : 2;
    uint8_t packetType;
    nwuint16_t length; // in 32 bit words, minus one

    RtcpHeader() : fmtCount(0), padding(0), version(2), packetType(0) {}
    explicit RtcpHeader(RtcpPacketType type) : fmtCount(0), padding(0), version(2), packetType(type) {}

    static constexpr size_t headerSize() { return 4; }
    size_t size() const { return (length.get() + 1) * sizeof(uint32_t); }
    size_t getPaddingSize() const;
    bool isValid() const;

    // Pads to 32 bit words. Only once, and only on the last packet of a compound.
    void addPadding(size_t wordCount);
    // grows length by the given number of 32 bit words and bumps the count field
    void appendItem(size_t words);

    static RtcpHeader* fromPtr(void* p, size_t length);
    static const RtcpHeader* fromPtr(const void* p, size_t length);
    static RtcpHeader* fromPacket(memory::Packet& p) { return fromPtr(p.get(), p.getLength()); }
    static const RtcpHeader* fromPacket(const memory::Packet& p) { return fromPtr(p.get(), p.getLength()); }
};

// Iterates the packets of a compound RTCP datagram. Check isValid first on untrusted input.
class CompoundRtcpPacket
{
public:
    typedef utils::TlvIterator<const RtcpHeader> const_iterator;

    CompoundRtcpPacket(const void* p, size_t length);

    const_iterator begin() const { return const_iterator(_first, _end); }
    const_iterator end() const { return const_iterator(_end, _end); }
    bool empty() const { return _first == _end; }

    // Headers are version 2, lengths add up to the datagram and only the last packet is padded.
    static bool isValid(const void* p, size_t length);

private:
    const RtcpHeader* _first;
    const RtcpHeader* _end;
};

struct SDESItem
{
    enum Type : uint8_t
    {
        END = 0,
        CNAME = 1,
        NAME,
        EMAIL,
        PHONE,
        LOC,
        TOOL,
        NOTE,
        PRIV
    };

    uint8_t type;
    uint8_t length;
    char data[255];

    static constexpr size_t headerSize() { return 1; }
    size_t size() const { return type == END ? 1 : length + 2; }
    bool empty() const { return type == END; }
    std::string getValue() const { return std::string(data, length); }
};

struct SdesChunk
{
    uint32_t ssrc;
    std::string cname;
};

class RtcpSourceDescription
{
public:
    RtcpHeader header;

    RtcpSourceDescription(const RtcpSourceDescription&) = delete;
    static RtcpSourceDescription* create(void* buffer);

    size_t size() const { return header.size(); }
    int getChunkCount() const { return header.fmtCount; }

    // chunk with a single CNAME item, false if it would grow the packet beyond maxSize
    bool addChunk(uint32_t ssrc, const std::string& cname, size_t maxSize);
    // chunks without CNAME get an empty cname
    bool getChunks(std::vector<SdesChunk>& chunks) const;
};

// rfc3550 6.4.1 reception report block
struct ReportBlock
{
    nwuint32_t ssrc;
    nwuint32_t lossInfo; // 8 bit fraction lost, 24 bit signed cumulative loss
    nwuint32_t extendedSeqNoReceived;
    nwuint32_t interarrivalJitter;
    nwuint32_t lastSR;
    nwuint32_t delaySinceLastSR; // 1/65536 s

    uint8_t getFractionLostRaw() const { return static_cast<uint8_t>(lossInfo.get() >> 24); }
    double getFractionLost() const { return getFractionLostRaw() / 256.0; }
    uint32_t getCumulativeLoss() const { return lossInfo.get() & 0xFFFFFFu; }
    void setFractionLost(double fraction);
    void setCumulativeLoss(uint32_t count);

    void setDelaySinceLastSR(uint64_t ns);
    uint64_t getDelaySinceLastSR() const;
};

struct RtcpReceiverReport
{
    RtcpHeader header;
    nwuint32_t ssrc;
    ReportBlock reportBlocks[MAX_REPORT_BLOCKS];

    RtcpReceiverReport(const RtcpReceiverReport&) = delete;
    static RtcpReceiverReport* create(void* buffer);
    static const RtcpReceiverReport* fromPtr(const void* p, size_t length);

    ReportBlock& addReportBlock(uint32_t ssrc);
};

struct RtcpSenderReport
{
    RtcpHeader header;
    nwuint32_t ssrc;
    nwuint32_t ntpSeconds;
    nwuint32_t ntpFractions;
    nwuint32_t rtpTimestamp;
    nwuint32_t packetCount;
    nwuint32_t octetCount;
    ReportBlock reportBlocks[MAX_REPORT_BLOCKS];

    RtcpSenderReport(const RtcpSenderReport&) = delete;
    static RtcpSenderReport* create(void* buffer);
    static const RtcpSenderReport* fromPtr(const void* p, size_t length);

    size_t size() const { return header.size(); }
    uint64_t getNtp() const { return (uint64_t(ntpSeconds.get()) << 32) | ntpFractions.get(); }
    void setNtp(uint64_t ntp)
    {
        ntpSeconds = static_cast<uint32_t>(ntp >> 32);
        ntpFractions = static_cast<uint32_t>(ntp);
    }

    ReportBlock& addReportBlock(uint32_t ssrc);
};

struct RtcpGoodbye
{
    RtcpHeader header;
    nwuint32_t ssrc[MAX_REPORT_BLOCKS];

    static RtcpGoodbye* create(void* buffer, uint32_t ssrc);
    static const RtcpGoodbye* fromPtr(const void* p, size_t length);

    void addSsrc(uint32_t ssrc);
    uint32_t getSsrcCount() const { return header.fmtCount; }
};

// rfc5761 4, RTP payload types 64-95 are avoided so 192-223 identifies RTCP
inline bool isRtcpPacket(const void* buffer, size_t length)
{
    if (length < 8)
    {
        return false;
    }
    const auto* header = reinterpret_cast<const RtcpHeader*>(buffer);
    return header->version == 2 && header->packetType >= 192 && header->packetType <= 223;
}

inline bool isRtcpPacket(const memory::Packet& packet)
{
    return isRtcpPacket(packet.get(), packet.getLength());
}

inline bool isValidRtcpPacket(const memory::Packet& packet)
{
    return CompoundRtcpPacket::isValid(packet.get(), packet.getLength());
}

} // namespace rtp
