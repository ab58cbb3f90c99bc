#pragma once

#include "codec/RtpPayload.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace codec
{

namespace H265Header
{
enum NalUnitType : uint8_t
{
    IDR_W_RADL = 19,
    IDR_N_LP = 20,
    CRA = 21,
    VPS = 32,
    SPS = 33,
    PPS = 34,
    AUD = 35,
    FILLER = 38,
    AP = 48,
    FU = 49,
    PACI = 50
};

constexpr size_t HEADER_SIZE = 2;
constexpr size_t FU_HEADER_SIZE = 1;
constexpr size_t DONL_SIZE = 2;
constexpr size_t DOND_SIZE = 1;
constexpr size_t LENGTH_SIZE = 2;
constexpr uint8_t FU_START = 0x80;
constexpr uint8_t FU_END = 0x40;

// F(1) Type(6) LayerId(6) TID(3)
constexpr uint8_t getNalUnitType(const uint8_t firstByte)
{
    return (firstByte >> 1) & 0x3F;
}
constexpr bool isForbiddenBitSet(const uint8_t firstByte)
{
    return (firstByte & 0x80) != 0;
}
constexpr uint8_t getLayerId(const uint8_t firstByte, const uint8_t secondByte)
{
    return static_cast<uint8_t>(((firstByte & 0x01) << 5) | (secondByte >> 3));
}
constexpr uint8_t getTid(const uint8_t secondByte)
{
    return secondByte & 0x07;
}
constexpr bool isParameterSet(const uint8_t type)
{
    return type == VPS || type == SPS || type == PPS;
}
} // namespace H265Header

/**
 * RFC 7798 packetization. Parameter sets are aggregated into one AP sent ahead of the next NAL unit,
 * NAL units that fit are sent as single NAL unit packets and larger ones as FUs. With DONL enabled,
 * sprop-max-don-diff > 0, every packet carries the decoding order number of its first NAL unit.
 */
class H265Packetizer
{
public:
    explicit H265Packetizer(bool withDonl = false);

    void packetize(const uint8_t* data, size_t length, size_t mtu, std::vector<Payload>& payloads);

private:
    void emit(const uint8_t* nalUnit, size_t length, size_t mtu, std::vector<Payload>& payloads);
    void emitParameterSets(size_t mtu, std::vector<Payload>& payloads);
    void appendDonl(Payload& payload, uint16_t don) const;

    bool _withDonl;
    uint16_t _decodingOrderNumber;
    std::vector<Payload> _parameterSets;
};

/**
 * Rebuilds Annex-B NAL units from single NAL unit, AP, FU and PACI payloads. The PACI header and its
 * extensions are stripped and the contained payload is processed as if sent alone.
 */
class H265Depacketizer
{
public:
    explicit H265Depacketizer(bool withDonl = false);

    DepacketizeResult depacketize(const uint8_t* payload, size_t length, Payload& out);

    uint16_t getLastDonl() const { return _lastDonl; }
    bool hasPendingFragment() const { return _fragmenting; }

private:
    DepacketizeResult depacketizeAggregation(const uint8_t* payload, size_t length, Payload& out);
    DepacketizeResult depacketizeFragment(const uint8_t* payload, size_t length, Payload& out);
    DepacketizeResult depacketizePaci(const uint8_t* payload, size_t length, Payload& out);

    bool _withDonl;
    uint16_t _lastDonl;
    bool _fragmenting;
    Payload _fragment;
};

} // namespace codec
