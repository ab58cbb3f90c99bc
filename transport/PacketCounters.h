#pragma once
#include <algorithm>
#include <cinttypes>

namespace transport
{
struct PacketCounters
{
    bool empty() const { return octets == 0 && packets == 0 && lostPackets == 0; }

    double getLossRatio() const
    {
        return static_cast<double>(lostPackets) / std::max(uint64_t(1), packets + lostPackets);
    }

    PacketCounters& operator+=(const PacketCounters& b)
    {
        packets += b.packets;
        lostPackets += b.lostPackets;
        octets += b.octets;
        headerOctets += b.headerOctets;
        retransmissions += b.retransmissions;
        return *this;
    }

    uint64_t octets = 0; // payload octets
    uint64_t headerOctets = 0;
    uint64_t packets = 0;
    uint64_t lostPackets = 0;
    uint64_t retransmissions = 0;
};

inline PacketCounters operator+(PacketCounters a, const PacketCounters& b)
{
    a += b;
    return a;
}

} // namespace transport
