#include "rtp/RtcpTransportFeedback.h"
#include <algorithm>
#include <cstring>

static_assert(sizeof(rtp::RtcpTransportFeedback) == 20, "transport feedback fixed part must be 20 bytes");

namespace
{
const size_t ONE_BIT_VECTOR_CAPACITY = 14;
const size_t TWO_BIT_VECTOR_CAPACITY = 7;

int64_t roundToDeltaUnits(int64_t deltaUs)
{
    const int64_t unit = rtp::RtcpTransportFeedback::DELTA_UNIT_US;
    return deltaUs >= 0 ? (deltaUs + unit / 2) / unit : -((-deltaUs + unit / 2) / unit);
}

void writeUint16(uint8_t* target, uint16_t value)
{
    target[0] = value >> 8;
    target[1] = value & 0xFFu;
}

uint16_t readUint16(const uint8_t* source)
{
    return (static_cast<uint16_t>(source[0]) << 8) | source[1];
}
} // namespace

namespace rtp
{

const RtcpTransportFeedback* RtcpTransportFeedback::fromPtr(const void* p, size_t length)
{
    if (!isTransportFeedback(p, length))
    {
        return nullptr;
    }
    return reinterpret_cast<const RtcpTransportFeedback*>(p);
}

bool isTransportFeedback(const void* p, size_t length)
{
    auto* header = RtcpHeader::fromPtr(p, length);
    return header && length >= sizeof(RtcpTransportFeedback) && header->packetType == RTPTRANSPORT_FB &&
        header->fmtCount == 15 && header->size() >= sizeof(RtcpTransportFeedback) && header->size() <= length;
}

bool parseTransportFeedback(const RtcpTransportFeedback& feedback, std::vector<TransportFeedbackStatus>& statuses)
{
    const size_t statusCount = feedback.packetStatusCount.get();
    const uint8_t* cursor = feedback.getChunks();
    const uint8_t* end =
        reinterpret_cast<const uint8_t*>(&feedback) + feedback.header.size() - feedback.header.getPaddingSize();

    std::vector<uint8_t> symbols;
    symbols.reserve(statusCount);
    while (symbols.size() < statusCount)
    {
        if (cursor + 2 > end)
        {
            return false;
        }
        const uint16_t chunk = readUint16(cursor);
        cursor += 2;

        if ((chunk & 0x8000) == 0)
        {
            const auto symbol = static_cast<uint8_t>((chunk >> 13) & 0x3);
            const size_t runLength = std::min<size_t>(chunk & RtcpTransportFeedback::MAX_RUN_LENGTH,
                statusCount - symbols.size());
            symbols.insert(symbols.end(), runLength, symbol);
        }
        else if ((chunk & 0x4000) == 0)
        {
            for (size_t i = 0; i < ONE_BIT_VECTOR_CAPACITY && symbols.size() < statusCount; ++i)
            {
                symbols.push_back((chunk >> (ONE_BIT_VECTOR_CAPACITY - 1 - i)) & 0x1);
            }
        }
        else
        {
            for (size_t i = 0; i < TWO_BIT_VECTOR_CAPACITY && symbols.size() < statusCount; ++i)
            {
                symbols.push_back((chunk >> (2 * (TWO_BIT_VECTOR_CAPACITY - 1 - i))) & 0x3);
            }
        }
    }

    int64_t timeUs = static_cast<int64_t>(feedback.referenceTime.get()) * RtcpTransportFeedback::REFERENCE_TIME_UNIT_US;
    uint16_t sequenceNumber = feedback.baseSequenceNumber.get();
    for (const auto symbol : symbols)
    {
        TransportFeedbackStatus status{sequenceNumber++, false, 0};
        if (symbol == RtcpTransportFeedback::SMALL_DELTA)
        {
            if (cursor + 1 > end)
            {
                return false;
            }
            timeUs += static_cast<int64_t>(*cursor) * RtcpTransportFeedback::DELTA_UNIT_US;
            ++cursor;
            status.received = true;
        }
        else if (symbol == RtcpTransportFeedback::LARGE_DELTA)
        {
            if (cursor + 2 > end)
            {
                return false;
            }
            timeUs += static_cast<int64_t>(static_cast<int16_t>(readUint16(cursor))) * RtcpTransportFeedback::DELTA_UNIT_US;
            cursor += 2;
            status.received = true;
        }
        else if (symbol != RtcpTransportFeedback::NOT_RECEIVED)
        {
            return false;
        }

        if (status.received)
        {
            status.arrivalUs = timeUs;
        }
        statuses.push_back(status);
    }

    return true;
}

TransportFeedbackBuilder::TransportFeedbackBuilder(uint32_t reporterSsrc,
    uint32_t mediaSsrc,
    uint8_t feedbackPacketCount,
    uint16_t baseSequenceNumber,
    uint64_t baseArrivalUs,
    size_t maxSize)
    : _reporterSsrc(reporterSsrc),
      _mediaSsrc(mediaSsrc),
      _feedbackPacketCount(feedbackPacketCount),
      _baseSequenceNumber(baseSequenceNumber),
      _referenceTime((baseArrivalUs / RtcpTransportFeedback::REFERENCE_TIME_UNIT_US) & 0xFFFFFFu),
      _lastTimeUs(static_cast<int64_t>(baseArrivalUs / RtcpTransportFeedback::REFERENCE_TIME_UNIT_US) *
          RtcpTransportFeedback::REFERENCE_TIME_UNIT_US),
      _maxSize(maxSize),
      _deltaBytes(0)
{
}

bool TransportFeedbackBuilder::addReceivedPacket(const uint16_t sequenceNumber, const uint64_t arrivalUs)
{
    const uint16_t expected = static_cast<uint16_t>(_baseSequenceNumber + _symbols.size());
    const uint16_t gap = static_cast<uint16_t>(sequenceNumber - expected);
    if (gap >= 0x8000 || _symbols.size() + gap + 1 > 0xFFFF)
    {
        return false;
    }

    const int64_t units = roundToDeltaUnits(static_cast<int64_t>(arrivalUs) - _lastTimeUs);
    if (units < INT16_MIN || units > INT16_MAX)
    {
        return false;
    }

    const bool small = units >= 0 && units <= 0xFF;
    const size_t previousSymbolCount = _symbols.size();
    _symbols.insert(_symbols.end(), gap, RtcpTransportFeedback::NOT_RECEIVED);
    _symbols.push_back(small ? RtcpTransportFeedback::SMALL_DELTA : RtcpTransportFeedback::LARGE_DELTA);
    _deltaBytes += small ? 1 : 2;
    if (getSize() > _maxSize)
    {
        _symbols.resize(previousSymbolCount);
        _deltaBytes -= small ? 1 : 2;
        return false;
    }

    _deltas.push_back(static_cast<int16_t>(units));
    _lastTimeUs += units * RtcpTransportFeedback::DELTA_UNIT_US;
    return true;
}

std::vector<uint16_t> TransportFeedbackBuilder::getChunks() const
{
    std::vector<uint16_t> chunks;
    const size_t count = _symbols.size();
    for (size_t i = 0; i < count;)
    {
        size_t run = 1;
        while (i + run < count && _symbols[i + run] == _symbols[i] && run < RtcpTransportFeedback::MAX_RUN_LENGTH)
        {
            ++run;
        }

        if (run >= TWO_BIT_VECTOR_CAPACITY || i + run == count)
        {
            chunks.push_back(makeRunLengthChunk(static_cast<RtcpTransportFeedback::Symbol>(_symbols[i]),
                static_cast<uint16_t>(run)));
            i += run;
            continue;
        }

        const size_t window = std::min(ONE_BIT_VECTOR_CAPACITY, count - i);
        const bool hasLargeDelta = std::any_of(_symbols.begin() + i,
            _symbols.begin() + i + window,
            [](uint8_t symbol) { return symbol == RtcpTransportFeedback::LARGE_DELTA; });

        if (!hasLargeDelta)
        {
            uint16_t chunk = 0x8000;
            for (size_t k = 0; k < window; ++k)
            {
                chunk |= static_cast<uint16_t>(_symbols[i + k]) << (ONE_BIT_VECTOR_CAPACITY - 1 - k);
            }
            chunks.push_back(chunk);
            i += window;
        }
        else
        {
            const size_t symbolCount = std::min(TWO_BIT_VECTOR_CAPACITY, count - i);
            uint16_t chunk = 0xC000;
            for (size_t k = 0; k < symbolCount; ++k)
            {
                chunk |= static_cast<uint16_t>(_symbols[i + k]) << (2 * (TWO_BIT_VECTOR_CAPACITY - 1 - k));
            }
            chunks.push_back(chunk);
            i += symbolCount;
        }
    }
    return chunks;
}

size_t TransportFeedbackBuilder::getSize() const
{
    const size_t size = sizeof(RtcpTransportFeedback) + getChunks().size() * sizeof(uint16_t) + _deltaBytes;
    return (size + 3) & ~size_t(3);
}

size_t TransportFeedbackBuilder::build(uint8_t* buffer, const size_t bufferSize) const
{
    const auto chunks = getChunks();
    const size_t unpaddedSize = sizeof(RtcpTransportFeedback) + chunks.size() * sizeof(uint16_t) + _deltaBytes;
    const size_t size = (unpaddedSize + 3) & ~size_t(3);
    if (_symbols.empty() || size > bufferSize)
    {
        return 0;
    }

    std::memset(buffer, 0, size);
    auto& feedback = *reinterpret_cast<RtcpTransportFeedback*>(buffer);
    feedback.header = RtcpHeader();
    feedback.header.packetType = RTPTRANSPORT_FB;
    feedback.header.fmtCount = 15;
    feedback.header.length = static_cast<uint16_t>(size / sizeof(uint32_t) - 1);
    feedback.reporterSsrc = _reporterSsrc;
    feedback.mediaSsrc = _mediaSsrc;
    feedback.baseSequenceNumber = _baseSequenceNumber;
    feedback.packetStatusCount = static_cast<uint16_t>(_symbols.size());
    feedback.referenceTime = _referenceTime;
    feedback.feedbackPacketCount = _feedbackPacketCount;

    uint8_t* cursor = buffer + sizeof(RtcpTransportFeedback);
    for (const auto chunk : chunks)
    {
        writeUint16(cursor, chunk);
        cursor += 2;
    }

    for (const auto delta : _deltas)
    {
        if (delta >= 0 && delta <= 0xFF)
        {
            *cursor++ = static_cast<uint8_t>(delta);
        }
        else
        {
            writeUint16(cursor, static_cast<uint16_t>(delta));
            cursor += 2;
        }
    }

    // rfc3550 6.4.1, last padding octet holds the pad count
    if (size > unpaddedSize)
    {
        feedback.header.padding = 1;
        buffer[size - 1] = static_cast<uint8_t>(size - unpaddedSize);
    }
    return size;
}

} // namespace rtp
