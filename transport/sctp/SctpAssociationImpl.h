#pragma once
#include "SctpAssociation.h"
#include "SctpTimer.h"
#include "Sctprotocol.h"
#include "logger/Logger.h"
#include <atomic>
#include <deque>
#include <map>
#include <set>
#include <vector>

namespace sctp
{
class SctpServerPort;
class OutboundPackets;

// Session state for a connection between client and peer
//
// Unsupported features:
//  - multi homed hosts
//  - association restart
//  - ASCONF and AUTH
class SctpAssociationImpl : public SctpAssociation
{
    struct OutboundChunk
    {
        OutboundChunk()
            : messageId(0),
              transmissionSequenceNumber(0),
              streamId(0),
              streamSequenceNumber(0),
              payloadProtocol(0),
              unordered(false),
              fragmentBegin(false),
              fragmentEnd(false),
              resetMarker(false),
              firstSent(0),
              lastSent(0),
              transmitCount(0),
              missIndicator(0),
              acked(false),
              abandoned(false),
              retransmit(false)
        {
        }

        uint64_t messageId;
        uint32_t transmissionSequenceNumber;
        uint16_t streamId;
        uint16_t streamSequenceNumber;
        uint32_t payloadProtocol;
        bool unordered;
        bool fragmentBegin;
        bool fragmentEnd;
        bool resetMarker; // queued stream reset, carries no data
        std::vector<uint8_t> payload;

        uint64_t firstSent;
        uint64_t lastSent;
        uint32_t transmitCount;
        uint32_t missIndicator;
        bool acked;
        bool abandoned;
        bool retransmit;

        size_t size() const { return payload.size(); }
        size_t fullSize() const { return payload.size() + PayloadDataChunk::HEADER_SIZE; }
    };

    struct ReceivedChunk
    {
        ReceivedChunk(const PayloadDataChunk& chunk);

        uint32_t transmissionSequenceNumber;
        uint16_t streamSequenceNumber;
        uint32_t payloadProtocol;
        bool fragmentBegin;
        bool fragmentEnd;
        std::vector<uint8_t> data;
    };
    typedef std::vector<ReceivedChunk> ChunkSet; // sorted on TSN

    class TsnLess
    {
    public:
        bool operator()(uint32_t tsnA, uint32_t tsnB) const { return diff(tsnA, tsnB) > 0; }
    };
    class SsnLess
    {
    public:
        bool operator()(uint16_t ssnA, uint16_t ssnB) const { return diff16(ssnA, ssnB) > 0; }
    };

    struct Stream
    {
        Stream(uint16_t streamId_, uint32_t generation_)
            : streamId(streamId_),
              generation(generation_),
              reliability(Reliability::Reliable),
              reliabilityValue(0),
              unordered(false),
              nextSsn(0),
              bufferedAmount(0),
              bufferedAmountLowThreshold(0),
              writeClosed(false),
              writeResetDone(false),
              readClosed(false),
              inboundNextSsn(0)
        {
        }

        uint16_t streamId;
        uint32_t generation;
        Reliability reliability;
        uint32_t reliabilityValue;
        bool unordered;
        uint16_t nextSsn;
        size_t bufferedAmount;
        size_t bufferedAmountLowThreshold;
        bool writeClosed;
        bool writeResetDone;
        bool readClosed;

        uint16_t inboundNextSsn;
        std::map<uint16_t, ChunkSet, SsnLess> orderedChunks;
        ChunkSet unorderedChunks;
    };

    struct InboundEvent
    {
        enum Type
        {
            Message,
            StreamReset,
            BufferedAmountLow
        };

        InboundEvent(Type type_, uint16_t streamId_) : type(type_), streamId(streamId_), ssn(0), payloadProtocol(0) {}

        Type type;
        uint16_t streamId;
        uint16_t ssn;
        uint32_t payloadProtocol;
        std::vector<uint8_t> data;
    };

    struct ResetRequest
    {
        uint32_t senderLastTsn = 0;
        std::vector<uint16_t> streams;
    };

public:
    SctpAssociationImpl(size_t logId,
        SctpServerPort& transport,
        uint16_t remotePort,
        IEvents* listener,
        const SctpConfig& config);

    SctpAssociationImpl(size_t logId,
        SctpServerPort& transport,
        const SctpPacket& cookieEcho,
        IEvents* listener,
        const SctpConfig& config);

    void onCookieEcho(const SctpPacket& sctpPacket, uint64_t timestamp) override;

    void connect(uint16_t inboundStreamCount, uint16_t outboundStreamCount, uint64_t timestamp) override;

    StreamHandle openStream(uint16_t streamId, Reliability reliability, uint32_t value, bool unordered) override;
    bool isValid(const StreamHandle& handle) const override;
    StreamHandle getStreamHandle(uint16_t streamId) const override;
    bool setReliability(uint16_t streamId, Reliability reliability, uint32_t value, bool unordered) override;

    bool sendMessage(uint16_t streamId,
        uint32_t payloadProtocol,
        const void* payloadData,
        size_t length,
        uint64_t timestamp) override;

    size_t getBufferedAmount(uint16_t streamId) const override;
    void setBufferedAmountLowThreshold(uint16_t streamId, size_t threshold) override;
    size_t outboundPendingSize() const override;
    void releaseReceiveBuffer(size_t bytes, uint64_t timestamp) override;
    size_t getReceiveBufferUsed() const override { return _receiveQueueBytes; }

    bool resetStream(uint16_t streamId, uint64_t timestamp) override;
    void shutdown(uint64_t timestamp) override;
    void abort(uint64_t timestamp) override;

    int64_t nextTimeout(uint64_t timestamp) override;
    int64_t processTimeout(uint64_t timestamp) override;
    int64_t onPacketReceived(const SctpPacket& sctpPacket, uint64_t timestamp) override;

    State getState() const override { return _state.load(); }
    Stats getStats() const override;

    std::tuple<uint16_t, uint16_t> getPortPair() const override;
    std::tuple<uint32_t, uint32_t> getTags() const override;

    uint32_t getScptMTU() const override { return _mtu; }
    size_t getMaxMessageSize() const override;
    size_t getStreamCount() const override { return _streams.size(); }
    uint16_t getOutboundStreamLimit() const override { return _local.outboundStreamCount; }
    bool isForwardTsnEnabled() const override { return _useForwardTsn; }

private:
    void setState(State newState);
    void close(CloseReason reason);
    void sendInit();
    void sendCookieEcho();
    void sendAbort(ErrorCause cause, const char* reason);
    void sendAbort(ErrorCause cause, const void* info, size_t infoLength);
    void sendShutdown();
    void sendShutdownAck();
    void startHeartbeat(uint64_t timestamp);
    void sendHeartbeat(uint64_t timestamp);
    void sendUnrecognizedChunksError(const std::vector<const Chunk*>& chunks);

    void dispatchChunks(const SctpPacket& sctpPacket, uint64_t timestamp, bool skipCookieEcho);
    void dispatchEvents(uint64_t timestamp);

    void onInitAck(const SctpPacket& packet, const InitAckChunk& initAckChunk, uint64_t timestamp);
    void onCookieAckReceived(uint64_t timestamp);
    void onAbortReceived(const AbortChunk& chunk);
    void onErrorReceived(const ErrorChunk& chunk);
    void onShutDownReceived(const ShutdownChunk& chunk, uint64_t timestamp);
    void onShutDownAckReceived(uint64_t timestamp);
    void onShutDownCompleteReceived(uint64_t timestamp);
    bool onDataReceived(const PayloadDataChunk& chunk, uint64_t timestamp);
    void onSackReceived(const SelectiveAckChunk& chunk, uint64_t timestamp);
    void onForwardTsnReceived(const ForwardTsnChunk& chunk, uint64_t timestamp);
    void onReconfigReceived(const ReconfigChunk& chunk, uint64_t timestamp);
    void onUnexpectedCookieEcho(const SctpPacket& sctpPacket, uint64_t timestamp);
    void onUnexpectedInitReceived(const SctpPacket& sctpPacket, uint64_t timestamp);
    void onHeartbeatRequest(const Chunk& chunk);
    void onHeartbeatResponse(const Chunk& chunk, uint64_t timestamp);

    // outbound
    void processOutboundChunks(uint64_t timestamp);
    void writeSack(OutboundPackets& packets);
    void writeForwardTsn(OutboundPackets& packets);
    void writeReconfigRequests(OutboundPackets& packets, bool retransmitAll, uint64_t timestamp);
    void writeRetransmissions(OutboundPackets& packets, uint64_t timestamp);
    void writeFastRetransmissions(OutboundPackets& packets, uint64_t timestamp);
    void writeNewData(OutboundPackets& packets, uint64_t timestamp);
    bool checkPartialReliability(OutboundChunk& chunk, uint64_t timestamp);
    void abandonMessage(uint64_t messageId);
    void advanceForwardTsnPoint();
    void onOutboundChunkDone(OutboundChunk& chunk);
    void measureRtt(const OutboundChunk& chunk, uint64_t timestamp);
    uint32_t popAckedChunks(uint32_t cumulativeAck, uint64_t timestamp);
    void onRetransmitTimeout(uint64_t timestamp);
    size_t getBytesOutstanding() const;
    OutboundChunk* getInflight(uint32_t tsn);
    bool canSendData() const;
    void checkShutdownProgress(uint64_t timestamp);

    // inbound
    uint32_t getReceiveWindow() const;
    void advancePeerLastTsn();
    void scheduleAck(bool immediate, uint64_t timestamp);
    static bool isComplete(const ChunkSet& chunks);
    void emitMessage(uint16_t streamId, uint16_t ssn, const ChunkSet& chunks);
    void collectMessages(Stream& stream);
    void collectAllMessages();
    void retryResetRequests();
    ReconfigResult performInboundReset(const ResetRequest& request);
    void onOutboundResetDone(uint16_t streamId);
    Stream* getStream(uint16_t streamId);
    const Stream* getStream(uint16_t streamId) const;
    Stream& createStream(uint16_t streamId);
    void eraseStreamIfClosed(uint16_t streamId);

    logger::LoggableId _loggableId;
    const SctpConfig& _config;
    SctpServerPort& _transport;
    IEvents* _listener;

    std::atomic<State> _state;
    bool _closeReported = false;
    uint32_t _mtu;

    // Transmission Control Block
    struct TransmissionControlBlock
    {
        TransmissionControlBlock(uint16_t port_,
            uint32_t tag_,
            uint32_t receiveWindow,
            uint16_t inboundStreams_,
            uint16_t outboundStreams_);

        uint16_t port;
        uint32_t tag;
        uint32_t advertisedReceiveWindow;
        uint16_t inboundStreamCount;
        uint16_t outboundStreamCount;
    };
    TransmissionControlBlock _local;
    TransmissionControlBlock _peer;
    bool _useForwardTsn = false;
    bool _peerSupportsReconfig = false;

    struct GenericCookie
    {
        size_t maxSize() const;
        void set(const ChunkParameter& param);

        uint8_t cookie[512] = {0};
        size_t length = 0;
    };

    struct ConnectionEstablishment
    {
        int retransmitCount = 0;
        Timer initTimer;
        Timer cookieTimer;
        GenericCookie echoedCookie;
        uint64_t timeout = 0;
    } _connect;

    class RTT // in ns, rfc6298
    {
    public:
        explicit RTT(const SctpConfig& config);
        void update(uint64_t rttns);
        uint64_t getRto() const { return _rto; }
        void backOff();
        double getSmoothed() const { return _smoothed; }

    private:
        const SctpConfig& _config;
        bool _measured;
        double _smoothed;
        double _variance;
        uint64_t _rto;
    } _rtt;

    // sender side
    uint32_t _nextTsn = 0;
    uint32_t _cumulativeAckPoint = 0;
    uint32_t _advancedPeerAckPoint = 0;
    uint32_t _minTsnToMeasureRtt = 0;
    uint64_t _messageIdCounter = 0;
    std::deque<OutboundChunk> _pendingChunks;
    std::deque<OutboundChunk> _inflightChunks; // front is _cumulativeAckPoint + 1
    bool _sendForwardTsn = false;
    bool _fastRetransmitPending = false;
    int _retransmitCount = 0; // consecutive T3 expiries

    class CongestionControl
    {
    public:
        CongestionControl();
        void reset(uint32_t mtu, uint32_t slowStartThreshold_);

        void onCumulativeAckAdvanced(uint32_t mtu, uint32_t bytesAcked, bool hasPendingData);
        void onFastRetransmit(uint32_t mtu, uint32_t exitPoint);
        void onTransmitTimeout(uint32_t mtu);

        uint32_t congestionWindow;
        uint32_t slowStartThreshold;
        uint32_t partialBytesAcked;
        bool inFastRecovery;
        uint32_t fastRecoveryExitPoint;
        Timer retransmitTimer;
    } _flow;

    // receiver side
    uint32_t _peerLastTsn = 0; // cumulative TSN we ack
    uint32_t _highestReceivedTsn = 0;
    std::set<uint32_t, TsnLess> _receivedTsns; // above _peerLastTsn
    std::vector<uint32_t> _duplicateTsns;
    size_t _receiveQueueBytes = 0;
    bool _ackPending = false;
    int _packetsSinceAck = 0;
    Timer _ackTimer;

    // stream reset
    uint32_t _nextRequestSn = 1;
    uint32_t _peerLastRequestSn = 0;
    bool _peerRequestSeen = false;
    std::map<uint32_t, ResetRequest> _outgoingResetRequests;
    std::map<uint32_t, ResetRequest> _incomingResetRequests;
    std::vector<std::pair<uint32_t, ReconfigResult>> _pendingResponses;
    std::vector<uint32_t> _unsentResetRequests;
    Timer _reconfigTimer;

    struct Shutdown
    {
        int retransmitCount = 0;
        Timer timer; // T2
    } _shutdown;

    struct Heartbeat
    {
        int outstanding = 0;
        uint64_t nonce = 0;
        Timer timer;
    } _heartbeat;

    std::map<uint16_t, Stream> _streams;
    uint32_t _streamGeneration = 0;
    std::vector<InboundEvent> _events;
    bool _dispatching = false;
    Stats _stats;
};

} // namespace sctp
