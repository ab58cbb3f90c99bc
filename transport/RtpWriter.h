#pragma once

#include "memory/Packet.h"
#include <cstdint>

namespace transport
{

// Receives every protected RTP and RTCP datagram an RtpSession produces
class RtpWriter
{
public:
    virtual ~RtpWriter() = default;

    virtual bool writeRtpDatagram(const memory::Packet& packet, uint64_t timestamp) = 0;
};

} // namespace transport
