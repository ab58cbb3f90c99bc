#include "rtp/RtcpNackBuilder.h"
#include "rtp/RtcpFeedback.h"

namespace rtp
{

RtcpNackBuilder::RtcpNackBuilder(uint32_t senderSsrc, uint32_t mediaSsrc)
    : _senderSsrc(senderSsrc),
      _mediaSsrc(mediaSsrc),
      _items(),
      _count(0)
{
}

bool RtcpNackBuilder::add(uint16_t sequenceNumber)
{
    if (_count > 0)
    {
        auto& last = _items[_count - 1];
        const uint16_t distance = static_cast<uint16_t>(sequenceNumber - last.pid);
        if (distance == 0)
        {
            return true;
        }
        if (distance <= 16)
        {
            last.blp = static_cast<uint16_t>(last.blp | (1u << (distance - 1)));
            return true;
        }
    }

    if (_count == MAX_ITEMS)
    {
        return false;
    }
    _items[_count++] = Item{sequenceNumber, 0};
    return true;
}

size_t RtcpNackBuilder::size() const
{
    return sizeof(RtcpFeedback) + _count * sizeof(NackItem);
}

size_t RtcpNackBuilder::write(void* target, size_t capacity) const
{
    const size_t packetSize = size();
    if (capacity < packetSize)
    {
        return 0;
    }

    auto& feedback = RtcpFeedback::create(target, RTPTRANSPORT_FB, FB_GENERIC_NACK, _senderSsrc, _mediaSsrc);
    auto* items = reinterpret_cast<NackItem*>(&feedback + 1);
    for (size_t i = 0; i < _count; ++i)
    {
        items[i].pid = _items[i].pid;
        items[i].blp = _items[i].blp;
    }
    feedback.header.length = static_cast<uint16_t>(packetSize / sizeof(uint32_t) - 1);
    return packetSize;
}

} // namespace rtp
