#include "rtp/NackGenerator.h"

namespace
{
const uint16_t HALF_RANGE = 0x8000;

uint16_t roundToValidSize(uint16_t size)
{
    uint32_t validSize = rtp::NackGenerator::MIN_SIZE;
    while (validSize < size && validSize < rtp::NackGenerator::MAX_SIZE)
    {
        validSize <<= 1;
    }
    return static_cast<uint16_t>(validSize);
}
} // namespace

namespace rtp
{

NackGenerator::NackGenerator(const uint16_t size)
    : _size(roundToValidSize(size)),
      _end(0),
      _lastConsecutive(0),
      _started(false)
{
    _received.resize(_size / 64, 0);
}

bool NackGenerator::isValidSize(const uint32_t size)
{
    return size >= MIN_SIZE && size <= MAX_SIZE && (size & (size - 1)) == 0;
}

void NackGenerator::onPacketReceived(const uint16_t sequenceNumber)
{
    if (!_started)
    {
        setReceived(sequenceNumber);
        _end = sequenceNumber;
        _lastConsecutive = sequenceNumber;
        _started = true;
        return;
    }

    const uint16_t diff = sequenceNumber - _end;
    if (diff == 0)
    {
        return;
    }

    if (diff < HALF_RANGE)
    {
        // bits between the old end and the new packet may hold state from a previous lap of the buffer
        const uint16_t clearCount = diff - 1 < _size ? diff - 1 : _size;
        for (uint16_t i = 1; i <= clearCount; ++i)
        {
            clearReceived(_end + i);
        }
        _end = sequenceNumber;

        if (static_cast<uint16_t>(_lastConsecutive + 1) == sequenceNumber)
        {
            _lastConsecutive = sequenceNumber;
        }
        else if (static_cast<uint16_t>(sequenceNumber - _lastConsecutive) > _size)
        {
            _lastConsecutive = sequenceNumber - _size;
            extendLastConsecutive();
        }
        setReceived(sequenceNumber);
        return;
    }

    // reordered packet older than end
    if (static_cast<uint16_t>(_end - sequenceNumber) >= _size)
    {
        return;
    }

    setReceived(sequenceNumber);
    if (static_cast<uint16_t>(_lastConsecutive + 1) == sequenceNumber)
    {
        _lastConsecutive = sequenceNumber;
        extendLastConsecutive();
    }
}

std::vector<uint16_t> NackGenerator::getMissingSequenceNumbers(const uint16_t skipLastN) const
{
    std::vector<uint16_t> missing;
    if (!_started)
    {
        return missing;
    }

    const uint16_t until = _end - skipLastN;
    if (static_cast<uint16_t>(until - _lastConsecutive) >= HALF_RANGE)
    {
        return missing;
    }

    for (uint16_t i = _lastConsecutive + 1; i != static_cast<uint16_t>(until + 1); ++i)
    {
        if (!getReceived(i))
        {
            missing.push_back(i);
        }
    }
    return missing;
}

bool NackGenerator::isReceived(const uint16_t sequenceNumber) const
{
    if (!_started || static_cast<uint16_t>(_end - sequenceNumber) >= _size)
    {
        return false;
    }
    return getReceived(sequenceNumber);
}

void NackGenerator::setReceived(const uint16_t sequenceNumber)
{
    const uint16_t position = sequenceNumber % _size;
    _received[position / 64] |= uint64_t(1) << (position % 64);
}

void NackGenerator::clearReceived(const uint16_t sequenceNumber)
{
    const uint16_t position = sequenceNumber % _size;
    _received[position / 64] &= ~(uint64_t(1) << (position % 64));
}

bool NackGenerator::getReceived(const uint16_t sequenceNumber) const
{
    const uint16_t position = sequenceNumber % _size;
    return (_received[position / 64] & (uint64_t(1) << (position % 64))) != 0;
}

void NackGenerator::extendLastConsecutive()
{
    uint16_t i = _lastConsecutive + 1;
    for (; i != static_cast<uint16_t>(_end + 1) && getReceived(i); ++i) {}
    _lastConsecutive = i - 1;
}

} // namespace rtp
