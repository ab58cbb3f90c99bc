#pragma once

#include "rtp/RtcpHeader.h"
#include "utils/ByteOrder.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace rtp
{

/**
 * Transport wide congestion control feedback, draft-holmer-rmcat-transport-wide-cc-extensions-01.
 * Chunks follow the fixed part, then receive deltas, then zero padding to 32 bits.
 */
struct RtcpTransportFeedback
{
    static constexpr uint32_t REFERENCE_TIME_UNIT_US = 64000;
    static constexpr uint32_t DELTA_UNIT_US = 250;
    static constexpr uint32_t MAX_RUN_LENGTH = 0x1FFF;

    enum Symbol : uint8_t
    {
        NOT_RECEIVED = 0,
        SMALL_DELTA = 1,
        LARGE_DELTA = 2
    };

    RtcpHeader header;
    nwuint32_t reporterSsrc;
    nwuint32_t mediaSsrc;
    nwuint16_t baseSequenceNumber;
    nwuint16_t packetStatusCount;
    nwuint24_t referenceTime;
    uint8_t feedbackPacketCount;

    static const RtcpTransportFeedback* fromPtr(const void* p, size_t length);
    const uint8_t* getChunks() const { return reinterpret_cast<const uint8_t*>(this + 1); }
};

bool isTransportFeedback(const void* p, size_t length);

struct TransportFeedbackStatus
{
    uint16_t sequenceNumber;
    bool received;
    int64_t arrivalUs; // reference time based, only set if received
};

// Expands chunks and deltas into one status per reported sequence number.
bool parseTransportFeedback(const RtcpTransportFeedback& feedback, std::vector<TransportFeedbackStatus>& statuses);

// run length chunk: 0 | symbol(2) | length(13)
inline uint16_t makeRunLengthChunk(RtcpTransportFeedback::Symbol symbol, uint16_t length)
{
    return (static_cast<uint16_t>(symbol) << 13) | (length & RtcpTransportFeedback::MAX_RUN_LENGTH);
}

/**
 * Builds one feedback packet from packets added in ascending sequence order. Gaps in sequence numbers
 * are reported as not received.
 */
class TransportFeedbackBuilder
{
public:
    TransportFeedbackBuilder(uint32_t reporterSsrc,
        uint32_t mediaSsrc,
        uint8_t feedbackPacketCount,
        uint16_t baseSequenceNumber,
        uint64_t baseArrivalUs,
        size_t maxSize);

    // false if the packet does not fit, either size or delta range. The builder is left unchanged.
    bool addReceivedPacket(uint16_t sequenceNumber, uint64_t arrivalUs);
    size_t getPacketCount() const { return _symbols.size(); }

    // returns bytes written, 0 if buffer is too small
    size_t build(uint8_t* buffer, size_t bufferSize) const;

    uint32_t getReferenceTime() const { return _referenceTime; }
    std::vector<uint16_t> getChunks() const;
    const std::vector<int16_t>& getDeltas() const { return _deltas; }

private:
    size_t getSize() const;

    uint32_t _reporterSsrc;
    uint32_t _mediaSsrc;
    uint8_t _feedbackPacketCount;
    uint16_t _baseSequenceNumber;
    uint32_t _referenceTime;
    int64_t _lastTimeUs;
    size_t _maxSize;
    size_t _deltaBytes;

    std::vector<uint8_t> _symbols;
    std::vector<int16_t> _deltas;
};

} // namespace rtp
