#pragma once

#include "transport/sctp/SctpAssociation.h"
#include <cstddef>
#include <cstdint>

namespace webrtc
{
// What a data channel needs from the SCTP association it runs on.
class DataStreamTransport
{
public:
    virtual ~DataStreamTransport() = default;

    virtual bool openSctpStream(uint16_t streamId) = 0;
    virtual bool sendSctp(uint16_t streamId, uint32_t protocolId, const void* data, size_t length) = 0;
    virtual bool setSctpReliability(uint16_t streamId,
        sctp::SctpAssociation::Reliability reliability,
        uint32_t value,
        bool unordered) = 0;
    virtual bool resetSctpStream(uint16_t streamId) = 0;

    virtual size_t getBufferedAmount(uint16_t streamId) const = 0;
    virtual void setBufferedAmountLowThreshold(uint16_t streamId, size_t threshold) = 0;
};
} // namespace webrtc
