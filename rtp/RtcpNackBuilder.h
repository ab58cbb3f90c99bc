#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace rtp
{

/**
 * Collects lost sequence numbers into one generic NACK (rfc4585 6.2.1). Each item covers a PID
 * and the 16 sequence numbers after it. Sequence numbers are added in ascending order modulo 2^16.
 */
class RtcpNackBuilder
{
public:
    static constexpr size_t MAX_ITEMS = 16;

    RtcpNackBuilder(uint32_t senderSsrc, uint32_t mediaSsrc);

    // false if the number needs a new item and all MAX_ITEMS are used
    bool add(uint16_t sequenceNumber);

    bool empty() const { return _count == 0; }
    size_t getItemCount() const { return _count; }
    size_t size() const;

    // writes the NACK packet, returns bytes written or 0 if capacity is too small
    size_t write(void* target, size_t capacity) const;

private:
    struct Item
    {
        uint16_t pid;
        uint16_t blp;
    };

    const uint32_t _senderSsrc;
    const uint32_t _mediaSsrc;
    std::array<Item, MAX_ITEMS> _items;
    size_t _count;
};

} // namespace rtp
