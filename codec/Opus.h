#pragma once

#include "codec/RtpPayload.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace codec
{

namespace Opus
{

constexpr uint32_t sampleRate = 48000;
constexpr uint32_t channelsPerFrame = 2;
constexpr uint32_t payloadType = 111;
constexpr uint32_t packetsPerSecond = 50; // default ptime

// TOC byte, RFC 6716 3.1
inline uint8_t getConfig(uint8_t toc)
{
    return toc >> 3;
}
inline bool isStereo(uint8_t toc)
{
    return (toc & 0x04) != 0;
}
inline uint8_t getFrameCountCode(uint8_t toc)
{
    return toc & 0x03;
}

// Samples per channel at 48kHz of one Opus packet, 0 if the packet is malformed
uint32_t getSampleCount(const uint8_t* packet, size_t length);

} // namespace Opus

/**
 * RFC 7587. An Opus packet goes into exactly one RTP payload and is never fragmented.
 */
class OpusPacketizer
{
public:
    bool packetize(const uint8_t* data, size_t length, size_t mtu, std::vector<Payload>& payloads) const;
};

class OpusDepacketizer
{
public:
    DepacketizeResult depacketize(const uint8_t* payload, size_t length, Payload& out) const;
};

} // namespace codec
