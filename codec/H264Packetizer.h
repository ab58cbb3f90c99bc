#pragma once

#include "codec/RtpPayload.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace codec
{

/**
 * RFC 6184 packetization mode 1. Annex-B access units are split into NAL units. SPS and PPS are held back
 * and sent in a STAP-A ahead of the next NAL unit, or singly when the STAP-A exceeds the mtu. NAL units
 * that fit are sent as single NAL unit packets, larger ones as FU-A fragments. AUD and filler data are
 * dropped.
 */
class H264Packetizer
{
public:
    void packetize(const uint8_t* data, size_t length, size_t mtu, std::vector<Payload>& payloads);

private:
    void emit(const uint8_t* nalUnit, size_t length, size_t mtu, std::vector<Payload>& payloads);
    void emitUnit(const uint8_t* nalUnit, size_t length, size_t mtu, std::vector<Payload>& payloads);

    Payload _sps;
    Payload _pps;
};

/**
 * Rebuilds NAL units from single NAL unit, STAP-A and FU-A payloads, as Annex-B or as 32 bit length
 * prefixed (avc) units. Parameter sets signalled out of band, sprop-parameter-sets, are written ahead of
 * an IDR unless the stream carried its own since the previous IDR.
 */
class H264Depacketizer
{
public:
    enum class Format
    {
        AnnexB,
        Avc
    };

    explicit H264Depacketizer(Format format = Format::AnnexB);

    void setParameterSets(const Payload& sps, const Payload& pps);
    DepacketizeResult depacketize(const uint8_t* payload, size_t length, Payload& out);

    // false for FU-A continuation fragments
    static bool isPartitionHead(const uint8_t* payload, size_t length);
    bool hasPendingFragment() const { return _fragmenting; }

private:
    void appendNalUnit(const uint8_t* nalUnit, size_t length, Payload& out);
    void appendUnitPrefix(size_t unitLength, Payload& out) const;

    Format _format;
    Payload _sps;
    Payload _pps;
    bool _inbandParameterSets;
    bool _fragmenting;
    Payload _fragment;
};

} // namespace codec
