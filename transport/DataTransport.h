#pragma once

#include "logger/Logger.h"
#include "logger/PruneSpam.h"
#include "transport/DatagramSocket.h"
#include "transport/dtls/DtlsConfig.h"
#include "transport/dtls/DtlsConnection.h"
#include "transport/dtls/DtlsWriteListener.h"
#include "transport/sctp/SctpAssociation.h"
#include "transport/sctp/SctpConfig.h"
#include "transport/sctp/SctpServerPort.h"
#include "webrtc/DataChannel.h"
#include "webrtc/DataStreamTransport.h"
#include "webrtc/WebRtcDataStream.h"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace config
{
class RtcConfig;
}

namespace transport
{

struct DataTransportConfig
{
    DtlsConfig dtls;
    sctp::SctpConfig sctp;
    uint16_t sctpPort = 5000;
    uint32_t connectTimeoutMs = 10000;
    uint32_t readTimeoutMs = 0; // 0 is unbounded
    uint32_t writeTimeoutMs = 10000;
};

// dtls credentials and callbacks are left to the caller
bool readDataTransportConfig(const config::RtcConfig& rtcConfig, DataTransportConfig& transportConfig);

/**
 * Blocking data channel API over DTLS and SCTP on a DatagramSocket.
 * A reader thread owns the socket receive side and drives the DTLS and SCTP timers. All protocol state is
 * guarded by one mutex. Datagrams produced under the mutex are queued and written to the socket after it is
 * released, in production order.
 *
 * Stream objects are handles, an id and a generation, resolved through the transport on every call.
 * The transport must outlive its streams.
 */
class DataTransport : private DtlsWriteListener,
                      private DtlsConnection::IEvents,
                      private sctp::DatagramTransport,
                      private sctp::SctpServerPort::IEvents,
                      private sctp::SctpAssociation::IEvents,
                      private webrtc::DataStreamTransport,
                      private webrtc::WebRtcDataStream::Listener
{
public:
    enum class Result
    {
        Ok,
        Timeout,
        Closed,
        WouldBlock,
        Error
    };

    enum class State
    {
        Idle,
        Connecting,
        Connected,
        Closing,
        Closed,
        Failed
    };

    struct Message
    {
        std::vector<uint8_t> data;
        uint32_t payloadProtocol = 0;

        bool isString() const { return webrtc::isStringPpid(payloadProtocol); }
    };

    class Stream
    {
    public:
        Result write(const void* data, size_t length, uint32_t payloadProtocol);
        Result writeString(const std::string& text);
        // uses the configured read timeout
        Result read(Message& message);
        // timeoutMs 0 waits until a message arrives or the stream closes
        Result read(Message& message, uint32_t timeoutMs);
        Result setReliability(sctp::SctpAssociation::Reliability reliability, uint32_t value, bool unordered);
        size_t getBufferedAmount() const;
        // callback runs on the reader thread without the transport lock held
        void onBufferedAmountLow(size_t threshold, std::function<void()> callback);
        void close();

        bool isOpen() const;
        uint16_t getId() const { return _id; }
        std::string getLabel() const;
        std::string getProtocol() const;
        webrtc::WebRtcDataStream::Stats getStats() const;

    private:
        friend class DataTransport;
        Stream(DataTransport& transport, uint16_t id, uint32_t generation)
            : _transport(transport),
              _id(id),
              _generation(generation)
        {
        }

        DataTransport& _transport;
        const uint16_t _id;
        const uint32_t _generation;
    };

    DataTransport(size_t logId, const DataTransportConfig& config, DatagramSocket& socket);
    ~DataTransport();

    DataTransport(const DataTransport&) = delete;
    DataTransport& operator=(const DataTransport&) = delete;

    // runs the DTLS handshake and sets up the association. The DTLS client also initiates SCTP.
    Result connect();
    Result openStream(uint16_t streamId, const webrtc::DataChannelConfig& channelConfig, std::unique_ptr<Stream>& stream);
    // waits for a channel the peer opened. timeoutMs 0 waits until the transport closes.
    Result acceptStream(uint32_t timeoutMs, std::unique_ptr<Stream>& stream);

    // orderly SHUTDOWN, waits at most one RTO for the peer before closing the socket
    void close();
    // ABORT and close the socket
    void abort();

    State getState() const;
    std::string getFailureReason() const;
    sctp::SctpAssociation::Stats getSctpStats() const;
    // received message bytes not yet read by the application
    size_t getReceiveBufferUsed() const;
    std::string getPeerCertificateFingerprint() const;
    std::string getLocalFingerprint() const;
    srtp::Profile getSelectedSrtpProfile() const;
    uint16_t getCipherSuite() const;
    bool exportKeyingMaterial(const std::string& label, size_t length, std::vector<uint8_t>& keyingMaterial) const;
    const logger::LoggableId& getLoggableId() const { return _loggableId; }

private:
    struct StreamState
    {
        std::unique_ptr<webrtc::WebRtcDataStream> dataStream;
        uint32_t generation = 0;
        bool inbound = false;
        bool announced = false;
        bool readClosed = false;
        std::deque<Message> messages;
        std::function<void()> bufferedAmountLow;
    };

    static constexpr size_t MAX_STREAMS = 1024;

    void run();
    void shutdownTransport(bool abortive);
    void flush(std::unique_lock<std::mutex>& lock);
    void processTimers(uint64_t timestamp);
    uint64_t getReceiveTimeout(uint64_t timestamp) const;
    void fail(const std::string& reason);
    void closeAllStreams();
    StreamState* findStream(uint16_t streamId, uint32_t generation);
    const StreamState* findStream(uint16_t streamId, uint32_t generation) const;
    StreamState& createStreamState(uint16_t streamId, bool inbound);
    void discardMessages(StreamState& state);
    void eraseStream(uint16_t streamId);
    bool isUsable() const { return _state == State::Connected; }

    Result writeStream(const Stream& stream, const void* data, size_t length, uint32_t payloadProtocol);
    Result readStream(const Stream& stream, Message& message, uint32_t timeoutMs);
    Result setStreamReliability(const Stream& stream,
        sctp::SctpAssociation::Reliability reliability,
        uint32_t value,
        bool unordered);
    size_t getStreamBufferedAmount(const Stream& stream) const;
    void setStreamBufferedAmountLow(const Stream& stream, size_t threshold, std::function<void()> callback);
    void closeStream(const Stream& stream);
    bool isStreamOpen(const Stream& stream) const;
    std::string getStreamLabel(const Stream& stream) const;
    std::string getStreamProtocol(const Stream& stream) const;
    webrtc::WebRtcDataStream::Stats getStreamStats(const Stream& stream) const;

    // DtlsWriteListener
    int32_t sendDtls(const char* buffer, uint32_t length) override;

    // DtlsConnection::IEvents
    void onDtlsConnected(DtlsConnection& connection) override;
    void onDtlsApplicationData(DtlsConnection& connection, const uint8_t* data, size_t length) override;
    void onDtlsFailed(DtlsConnection& connection, dtls::AlertDescription alert) override;
    void onDtlsClosed(DtlsConnection& connection) override;

    // sctp::DatagramTransport
    bool sendSctpPacket(const void* data, size_t length) override;

    // sctp::SctpServerPort::IEvents
    sctp::SctpServerPort::InitDecision onSctpInitReceived(sctp::SctpServerPort* serverPort,
        uint16_t srcPort,
        const sctp::SctpPacket& sctpPacket,
        uint64_t timestamp) override;
    void onSctpCookieEchoReceived(sctp::SctpServerPort* serverPort,
        uint16_t srcPort,
        const sctp::SctpPacket& packet,
        uint64_t timestamp) override;
    void onSctpReceived(sctp::SctpServerPort* serverPort,
        uint16_t srcPort,
        const sctp::SctpPacket& sctpPacket,
        uint64_t timestamp) override;

    // sctp::SctpAssociation::IEvents
    void onSctpStateChanged(sctp::SctpAssociation* session, sctp::SctpAssociation::State state) override;
    void onSctpMessageReceived(sctp::SctpAssociation* session,
        uint16_t streamId,
        uint16_t streamSequenceNumber,
        uint32_t payloadProtocol,
        const void* buffer,
        size_t length,
        uint64_t timestamp) override;
    void onSctpEstablished(sctp::SctpAssociation* session) override;
    void onSctpClosed(sctp::SctpAssociation* session, sctp::SctpAssociation::CloseReason reason) override;
    void onSctpChunkDropped(sctp::SctpAssociation* session, size_t size) override;
    void onSctpStreamReset(sctp::SctpAssociation* session, uint16_t streamId) override;
    void onSctpBufferedAmountLow(sctp::SctpAssociation* session, uint16_t streamId) override;

    // webrtc::DataStreamTransport
    bool openSctpStream(uint16_t streamId) override;
    bool sendSctp(uint16_t streamId, uint32_t protocolId, const void* data, size_t length) override;
    bool setSctpReliability(uint16_t streamId,
        sctp::SctpAssociation::Reliability reliability,
        uint32_t value,
        bool unordered) override;
    bool resetSctpStream(uint16_t streamId) override;
    size_t getBufferedAmount(uint16_t streamId) const override;
    void setBufferedAmountLowThreshold(uint16_t streamId, size_t threshold) override;

    // webrtc::WebRtcDataStream::Listener
    void onWebRtcDataStreamOpen(webrtc::WebRtcDataStream& stream) override;
    void onWebRtcData(webrtc::WebRtcDataStream& stream,
        uint32_t payloadProtocol,
        const void* data,
        size_t length,
        bool isString) override;
    void onWebRtcDataStreamClosed(webrtc::WebRtcDataStream& stream) override;

    logger::LoggableId _loggableId;
    const DataTransportConfig _config;
    DatagramSocket& _socket;

    mutable std::mutex _mutex;
    std::mutex _sendMutex; // taken before _mutex is released, keeps socket writes in production order
    std::condition_variable _condition;

    DtlsConnection _dtls;
    std::unique_ptr<sctp::SctpServerPort> _sctpPort;
    std::unique_ptr<sctp::SctpAssociation> _association;
    std::map<uint16_t, StreamState> _streams;
    std::deque<std::pair<uint16_t, uint32_t>> _acceptQueue;
    uint32_t _streamGeneration;
    size_t _deliveredBytes;

    std::vector<std::vector<uint8_t>> _outbound;
    std::vector<std::function<void()>> _pendingCallbacks;

    State _state;
    std::string _failureReason;
    uint64_t _timestamp;
    bool _running;
    std::thread _thread;
    logger::PruneSpam _dropLogLimiter;
};

const char* toString(DataTransport::Result result);
const char* toString(DataTransport::State state);

} // namespace transport
