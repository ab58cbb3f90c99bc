#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <tuple>

namespace sctp
{
struct SctpConfig;
class SctpPacket;
class SctpServerPort;

// Non-blocking SCTP association. Feed it packets with onPacketReceived and call processTimeout
// when nextTimeout has elapsed. All output goes through the SctpServerPort transport.
// All timestamps in nanoseconds.
class SctpAssociation
{
public:
    virtual ~SctpAssociation() {}
    enum class State
    {
        CLOSED,
        COOKIE_WAIT,
        COOKIE_ECHOED,
        ESTABLISHED,
        SHUTDOWN_PENDING,
        SHUTDOWN_SENT,
        SHUTDOWN_RECEIVED,
        SHUTDOWN_ACK_SENT
    };

    enum class Reliability
    {
        Reliable,
        PartialReliableRexmit, // value is max retransmissions
        PartialReliableTimed // value is lifetime in ms
    };

    enum class CloseReason
    {
        Shutdown,
        PeerAbort,
        InitTimeout,
        CookieTimeout,
        RetransmitLimit,
        ShutdownTimeout,
        LocalAbort,
        ProtocolError
    };

    struct StreamHandle
    {
        StreamHandle() : id(0), generation(0) {}
        StreamHandle(uint16_t id_, uint32_t generation_) : id(id_), generation(generation_) {}

        bool operator==(const StreamHandle& o) const { return id == o.id && generation == o.generation; }

        uint16_t id;
        uint32_t generation; // 0 is never valid
    };

    struct Stats
    {
        uint64_t bytesSent = 0;
        uint64_t bytesReceived = 0;
        uint64_t messagesSent = 0;
        uint64_t messagesReceived = 0;
        uint64_t packetsSent = 0;
        uint64_t packetsReceived = 0;
        uint32_t retransmits = 0;
        uint32_t fastRetransmits = 0;
        uint32_t t3Timeouts = 0;
        uint32_t abandonedChunks = 0;
        uint32_t forwardTsnSent = 0;
        uint32_t duplicateTsnsReceived = 0;
        uint32_t congestionWindow = 0;
        uint32_t slowStartThreshold = 0;
        bool inFastRecovery = false;
        uint32_t peerReceiveWindow = 0;
        uint64_t rtoMs = 0;
    };

    class IEvents
    {
    public:
        virtual ~IEvents() = default;

        virtual void onSctpStateChanged(SctpAssociation* session, State state) = 0;
        virtual void onSctpMessageReceived(SctpAssociation* session,
            uint16_t streamId,
            uint16_t streamSequenceNumber,
            uint32_t payloadProtocol,
            const void* buffer,
            size_t length,
            uint64_t timestamp) = 0;
        virtual void onSctpEstablished(SctpAssociation* session) = 0;
        // called exactly once when the association terminates
        virtual void onSctpClosed(SctpAssociation* session, CloseReason reason) = 0;
        virtual void onSctpChunkDropped(SctpAssociation* session, size_t size) = 0;
        // peer reset its outgoing stream. Data sent before the reset has been delivered.
        virtual void onSctpStreamReset(SctpAssociation* session, uint16_t streamId) = 0;
        virtual void onSctpBufferedAmountLow(SctpAssociation* session, uint16_t streamId) = 0;
    };

    // must be called once on an association created from a COOKIE ECHO
    virtual void onCookieEcho(const SctpPacket& sctpPacket, uint64_t timestamp) = 0;

    virtual void connect(uint16_t inboundStreamCount, uint16_t outboundStreamCount, uint64_t timestamp) = 0;

    virtual StreamHandle openStream(uint16_t streamId, Reliability reliability, uint32_t value, bool unordered) = 0;
    virtual bool isValid(const StreamHandle& handle) const = 0;
    virtual StreamHandle getStreamHandle(uint16_t streamId) const = 0;
    virtual bool setReliability(uint16_t streamId, Reliability reliability, uint32_t value, bool unordered) = 0;

    virtual bool sendMessage(uint16_t streamId,
        uint32_t payloadProtocol,
        const void* payloadData,
        size_t length,
        uint64_t timestamp) = 0;

    virtual size_t getBufferedAmount(uint16_t streamId) const = 0;
    virtual void setBufferedAmountLowThreshold(uint16_t streamId, size_t threshold) = 0;
    virtual size_t outboundPendingSize() const = 0;

    // Delivered message bytes count against the receive window until the consumer releases them.
    virtual void releaseReceiveBuffer(size_t bytes, uint64_t timestamp) = 0;
    virtual size_t getReceiveBufferUsed() const = 0;

    // sends an outgoing SSN reset request after all data queued on the stream
    virtual bool resetStream(uint16_t streamId, uint64_t timestamp) = 0;

    virtual void shutdown(uint64_t timestamp) = 0;
    virtual void abort(uint64_t timestamp) = 0;

    virtual int64_t nextTimeout(uint64_t timestamp) = 0;
    virtual int64_t processTimeout(uint64_t timestamp) = 0;
    virtual int64_t onPacketReceived(const SctpPacket& sctpPacket, uint64_t timestamp) = 0;

    virtual State getState() const = 0;
    virtual Stats getStats() const = 0;

    virtual std::tuple<uint16_t, uint16_t> getPortPair() const = 0;
    virtual std::tuple<uint32_t, uint32_t> getTags() const = 0;

    virtual uint32_t getScptMTU() const = 0;
    virtual size_t getMaxMessageSize() const = 0;
    virtual size_t getStreamCount() const = 0;
    virtual uint16_t getOutboundStreamLimit() const = 0;
    virtual bool isForwardTsnEnabled() const = 0;
};

const char* toString(SctpAssociation::State state);
const char* toString(SctpAssociation::CloseReason reason);

std::unique_ptr<SctpAssociation> createSctpAssociation(size_t logId,
    SctpServerPort& transport,
    uint16_t remotePort,
    SctpAssociation::IEvents* listener,
    const SctpConfig& config);

std::unique_ptr<SctpAssociation> createSctpAssociation(size_t logId,
    SctpServerPort& transport,
    const SctpPacket& cookieEcho,
    SctpAssociation::IEvents* listener,
    const SctpConfig& config);

} // namespace sctp
