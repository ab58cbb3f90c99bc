#include "codec/Opus.h"

namespace codec
{

namespace Opus
{
namespace
{
uint32_t getSamplesPerFrame(const uint8_t toc)
{
    const uint8_t config = getConfig(toc);
    if (config < 12)
    {
        // SILK 10, 20, 40, 60 ms
        const uint32_t durations[] = {480, 960, 1920, 2880};
        return durations[config & 0x03];
    }
    if (config < 16)
    {
        // hybrid 10, 20 ms
        return (config & 0x01) ? 960 : 480;
    }
    // CELT 2.5, 5, 10, 20 ms
    const uint32_t durations[] = {120, 240, 480, 960};
    return durations[config & 0x03];
}
} // namespace

uint32_t getSampleCount(const uint8_t* packet, const size_t length)
{
    if (length == 0)
    {
        return 0;
    }

    uint32_t frameCount = 0;
    switch (getFrameCountCode(packet[0]))
    {
    case 0:
        frameCount = 1;
        break;
    case 1:
    case 2:
        frameCount = 2;
        break;
    default:
        if (length < 2)
        {
            return 0;
        }
        frameCount = packet[1] & 0x3F;
        break;
    }

    const uint32_t samples = frameCount * getSamplesPerFrame(packet[0]);
    // at most 120 ms per packet
    return samples > 5760 ? 0 : samples;
}

} // namespace Opus

bool OpusPacketizer::packetize(const uint8_t* data,
    const size_t length,
    const size_t mtu,
    std::vector<Payload>& payloads) const
{
    if (length == 0 || length > mtu)
    {
        return false;
    }

    payloads.emplace_back(data, data + length);
    return true;
}

DepacketizeResult OpusDepacketizer::depacketize(const uint8_t* payload, const size_t length, Payload& out) const
{
    if (length == 0)
    {
        return DepacketizeResult::ShortPacket;
    }
    if (Opus::getSampleCount(payload, length) == 0)
    {
        return DepacketizeResult::Malformed;
    }

    out.insert(out.end(), payload, payload + length);
    return DepacketizeResult::Ok;
}

} // namespace codec
