#include "codec/RtpPayload.h"

namespace codec
{

const char* toString(const DepacketizeResult result)
{
    switch (result)
    {
    case DepacketizeResult::Ok:
        return "ok";
    case DepacketizeResult::Incomplete:
        return "incomplete";
    case DepacketizeResult::ShortPacket:
        return "short packet";
    case DepacketizeResult::Malformed:
        return "malformed";
    case DepacketizeResult::Unsupported:
        return "unsupported";
    }
    return "unknown";
}

namespace AnnexB
{
namespace
{
// returns offset of next start code at or after position, and its length in startCodeLength
size_t findStartCode(const uint8_t* data, const size_t length, const size_t position, size_t& startCodeLength)
{
    size_t zeroCount = 0;
    for (size_t i = position; i < length; ++i)
    {
        if (data[i] == 0)
        {
            ++zeroCount;
            continue;
        }
        if (data[i] == 1 && zeroCount >= 2)
        {
            startCodeLength = zeroCount + 1;
            return i - zeroCount;
        }
        zeroCount = 0;
    }
    startCodeLength = 0;
    return length;
}
} // namespace

std::vector<NalUnit> split(const uint8_t* data, const size_t length)
{
    std::vector<NalUnit> units;
    size_t startCodeLength = 0;
    size_t start = findStartCode(data, length, 0, startCodeLength);
    if (start == length)
    {
        if (length > 0)
        {
            units.push_back(NalUnit{data, length});
        }
        return units;
    }

    while (start < length)
    {
        const size_t unitStart = start + startCodeLength;
        const size_t next = findStartCode(data, length, unitStart, startCodeLength);
        if (next > unitStart)
        {
            units.push_back(NalUnit{data + unitStart, next - unitStart});
        }
        start = next;
    }
    return units;
}

void appendStartCode(Payload& out)
{
    out.insert(out.end(), startCode, startCode + sizeof(startCode));
}

} // namespace AnnexB
} // namespace codec
