#pragma once

#include "memory/Packet.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace rtp
{

/**
 * Keeps copies of the most recently sent packets of one outbound stream, indexed by sequence number modulo
 * the buffer size, so retransmission requests can be served.
 */
class NackResponder
{
public:
    static constexpr uint16_t MAX_SIZE = 8192;

    // size is rounded up to a power of two, at most MAX_SIZE
    explicit NackResponder(uint16_t size);

    void onPacketSent(const memory::Packet& packet);
    // nullptr if the packet was never stored or has been overwritten
    const memory::Packet* getPacket(uint16_t sequenceNumber) const;

    uint16_t getSize() const { return _size; }

private:
    struct Entry
    {
        uint16_t sequenceNumber = 0;
        bool valid = false;
        std::unique_ptr<memory::Packet> packet;
    };

    uint16_t _size;
    std::vector<Entry> _entries;
};

} // namespace rtp
