#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace codec
{

typedef std::vector<uint8_t> Payload;

// reassembly of a fragmented NAL unit is abandoned beyond this size
constexpr size_t MAX_FRAGMENTED_UNIT_SIZE = 4 * 1024 * 1024;

enum class DepacketizeResult
{
    Ok, // output holds one or more complete units
    Incomplete, // fragment buffered, nothing to output yet
    ShortPacket,
    Malformed,
    Unsupported
};

const char* toString(DepacketizeResult result);

// Annex-B byte stream helpers, start codes are 00 00 01 or 00 00 00 01
namespace AnnexB
{
constexpr uint8_t startCode[] = {0, 0, 0, 1};

struct NalUnit
{
    const uint8_t* data;
    size_t length;
};

// A buffer without start codes is returned as one unit
std::vector<NalUnit> split(const uint8_t* data, size_t length);
void appendStartCode(Payload& out);
} // namespace AnnexB

} // namespace codec
