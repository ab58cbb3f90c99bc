#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rtp
{

/**
 * Tracks received sequence numbers of one inbound stream in a circular bitmap and lists the ones missing
 * between the last consecutively received packet and the newest packet. All sequence arithmetic is modulo 2^16.
 */
class NackGenerator
{
public:
    static constexpr uint16_t MIN_SIZE = 64;
    static constexpr uint16_t MAX_SIZE = 32768;

    // size is rounded up to a power of two within MIN_SIZE..MAX_SIZE
    explicit NackGenerator(uint16_t size);

    void onPacketReceived(uint16_t sequenceNumber);

    // missing sequence numbers in (lastConsecutive, end - skipLastN] in ascending order
    std::vector<uint16_t> getMissingSequenceNumbers(uint16_t skipLastN) const;
    bool isReceived(uint16_t sequenceNumber) const;

    bool isStarted() const { return _started; }
    uint16_t getLastConsecutive() const { return _lastConsecutive; }
    uint16_t getEnd() const { return _end; }
    uint16_t getSize() const { return _size; }

    static bool isValidSize(uint32_t size);

private:
    void setReceived(uint16_t sequenceNumber);
    void clearReceived(uint16_t sequenceNumber);
    bool getReceived(uint16_t sequenceNumber) const;
    void extendLastConsecutive();

    std::vector<uint64_t> _received;
    uint16_t _size;
    uint16_t _end;
    uint16_t _lastConsecutive;
    bool _started;
};

} // namespace rtp
