#pragma once

#include "memory/Packet.h"
#include "utils/ByteOrder.h"
#include "utils/TlvIterator.h"
#include <cstddef>
#include <cstdint>

namespace rtp
{

/**
 * rfc8285 one-byte element. Id 0 is a padding byte, id 15 terminates the list.
 */
class GeneralExtension1Byteheader
{
    uint8_t _length : 4;
    uint8_t _id : 4;

public:
    uint8_t data[16];

    enum : uint8_t
    {
        PADDING = 0,
        EOL = 15
    };

    uint8_t getId() const { return _id; }
    uint8_t getDataLength() const { return _id == PADDING ? 0 : _length + 1; }
    size_t size() const { return _id == PADDING ? 1 : 2 + _length; }
    static constexpr size_t headerSize() { return 1; }
};

/**
 * rfc8285 two-byte element. Id 0 is a padding byte.
 */
class GeneralExtension2Byteheader
{
    uint8_t _id;
    uint8_t _length;

public:
    uint8_t data[255];

    uint8_t getId() const { return _id; }
    uint8_t getDataLength() const { return _id == 0 ? 0 : _length; }
    size_t size() const { return _id == 0 ? 1 : 2 + _length; }
    static constexpr size_t headerSize() { return 1; }
};

struct RtpHeaderExtension
{
    enum PROFILE : uint16_t
    {
        GENERAL1 = 0xBEDE,
        GENERAL2 = 0x1000 // low 4 bits are app bits
    };

    nwuint16_t profile;
    nwuint16_t length; // 32 bit words of element data

    size_t size() const { return minSize() + length.get() * sizeof(uint32_t); }
    constexpr static size_t minSize() { return 2 * sizeof(uint16_t); }
    bool empty() const { return length.get() == 0; }

    bool isOneByteProfile() const { return profile.get() == GENERAL1; }
    bool isTwoByteProfile() const { return (profile.get() & 0xFFF0) == GENERAL2; }

    const uint8_t* data() const { return reinterpret_cast<const uint8_t*>(this) + minSize(); }
    uint8_t* data() { return reinterpret_cast<uint8_t*>(this) + minSize(); }

    utils::TlvCollectionConst<GeneralExtension1Byteheader> extensions1Byte() const;
    utils::TlvCollectionConst<GeneralExtension2Byteheader> extensions2Byte() const;

    // locates element payload, either form
    bool find(uint8_t id, const uint8_t*& elementData, uint8_t& elementLength) const;
    bool isValid() const;
};

const size_t MIN_RTP_HEADER_SIZE = 12;
// bit layout assumes a little endian target
struct RtpHeader
{
    uint16_t csrcCount : 4;
    uint16_t extension : 1;
    uint16_t padding : 1;
    uint16_t version : 2;
    uint16_t payloadType : 7;
    uint16_t marker : 1;
    nwuint16_t sequenceNumber;
    nwuint32_t timestamp;
    nwuint32_t ssrc;
    nwuint32_t csrc[15];

    static RtpHeader* fromPtr(void* p, size_t len);
    inline static const RtpHeader* fromPtr(const void* p, size_t len) { return fromPtr(const_cast<void*>(p), len); }
    template <typename PacketType>
    inline static RtpHeader* fromPacket(PacketType& p)
    {
        return fromPtr(p.get(), p.getLength());
    }
    template <typename PacketType>
    inline static const RtpHeader* fromPacket(const PacketType& p)
    {
        return fromPtr(p.get(), p.getLength());
    }
    static RtpHeader* create(void* p, size_t len);

    size_t headerLength() const;
    uint8_t* getPayload() { return reinterpret_cast<uint8_t*>(this) + headerLength(); }
    const uint8_t* getPayload() const { return const_cast<RtpHeader*>(this)->getPayload(); }
    // payload bytes in a packet of packetLength, excluding rtp padding
    size_t getPayloadLength(size_t packetLength) const;

    RtpHeaderExtension* getExtensionHeader();
    const RtpHeaderExtension* getExtensionHeader() const { return const_cast<RtpHeader*>(this)->getExtensionHeader(); }
};

inline bool isRtpPacket(const void* buffer, const uint32_t length)
{
    if (length < MIN_RTP_HEADER_SIZE)
    {
        return false;
    }

    const auto header = reinterpret_cast<const RtpHeader*>(buffer);
    return header->version == 2 && (header->payloadType < 64 || header->payloadType >= 96);
}

inline bool isRtpPacket(const memory::Packet& packet)
{
    return isRtpPacket(packet.get(), packet.getLength());
}

// Writes or replaces a header extension element. The payload is moved if the extension block grows.
// The one-byte form is kept as long as every element fits it.
bool setExtension(memory::Packet& packet, uint8_t extensionId, const uint8_t* data, uint8_t length);
bool getExtension(const memory::Packet& packet, uint8_t extensionId, const uint8_t*& data, uint8_t& length);

bool setTransportWideSequenceNumber(memory::Packet& packet, uint8_t extensionId, uint16_t sequenceNumber);
bool getTransportWideSequenceNumber(const memory::Packet& packet, uint8_t extensionId, uint16_t& sequenceNumber);

} // namespace rtp
