#pragma once

#include <cstddef>
#include <cstdint>

namespace codec::H264Header
{

enum NalUnitType : uint8_t
{
    IDR = 5,
    SEI = 6,
    SPS = 7,
    PPS = 8,
    AUD = 9,
    FILLER = 12,
    STAP_A = 24,
    STAP_B = 25,
    MTAP16 = 26,
    MTAP24 = 27,
    FU_A = 28,
    FU_B = 29
};

constexpr uint8_t TYPE_MASK = 0x1F;
constexpr uint8_t NRI_MASK = 0x60;
constexpr uint8_t FORBIDDEN_MASK = 0x80;
constexpr uint8_t FU_START = 0x80;
constexpr uint8_t FU_END = 0x40;
constexpr size_t FU_A_HEADER_SIZE = 2;
constexpr size_t STAP_A_HEADER_SIZE = 1;
constexpr size_t STAP_A_LENGTH_SIZE = 2;
// F 0, NRI 3, type STAP-A
constexpr uint8_t STAP_A_INDICATOR = 0x78;

constexpr uint8_t getNalUnitType(const uint8_t nalHeader)
{
    return nalHeader & TYPE_MASK;
}

inline bool isKeyFrame(const uint8_t* payload, const size_t payloadSize)
{
    if (payloadSize <= 1)
    {
        return false;
    }

    switch (getNalUnitType(payload[0]))
    {
    case SPS:
    case IDR:
        return true;
    case STAP_A:
    {
        size_t offset = STAP_A_HEADER_SIZE;
        while (offset + STAP_A_LENGTH_SIZE < payloadSize)
        {
            const size_t naluSize = (static_cast<size_t>(payload[offset]) << 8) | payload[offset + 1];
            offset += STAP_A_LENGTH_SIZE;
            const uint8_t type = getNalUnitType(payload[offset]);
            if (type == SPS || type == IDR)
            {
                return true;
            }
            offset += naluSize;
        }
        return false;
    }
    case FU_A:
    case FU_B:
    {
        const uint8_t type = getNalUnitType(payload[1]);
        return (type == SPS || type == IDR) && (payload[1] & FU_START) != 0;
    }
    default:
        return false;
    }
}

} // namespace codec::H264Header
