#include "rtp/NackResponder.h"
#include "rtp/RtpHeader.h"
#include <cstring>

namespace rtp
{

NackResponder::NackResponder(const uint16_t size) : _size(1)
{
    while (_size < size && _size < MAX_SIZE)
    {
        _size <<= 1;
    }
    _entries.resize(_size);
}

void NackResponder::onPacketSent(const memory::Packet& packet)
{
    auto* header = RtpHeader::fromPacket(packet);
    if (!header)
    {
        return;
    }

    const uint16_t sequenceNumber = header->sequenceNumber.get();
    auto& entry = _entries[sequenceNumber % _size];
    if (!entry.packet)
    {
        entry.packet = std::make_unique<memory::Packet>();
    }

    std::memcpy(entry.packet->get(), packet.get(), packet.getLength());
    entry.packet->setLength(packet.getLength());
    entry.sequenceNumber = sequenceNumber;
    entry.valid = true;
}

const memory::Packet* NackResponder::getPacket(const uint16_t sequenceNumber) const
{
    const auto& entry = _entries[sequenceNumber % _size];
    if (!entry.valid || entry.sequenceNumber != sequenceNumber)
    {
        return nullptr;
    }
    return entry.packet.get();
}

} // namespace rtp
