#pragma once

#include "logger/Logger.h"
#include "webrtc/DataChannel.h"
#include <cstdint>
#include <string>

namespace webrtc
{
class DataStreamTransport;

// One data channel on one SCTP stream. Runs DCEP and maps the channel type onto SCTP stream reliability.
// Not thread safe, the owner serializes access together with the association.
class WebRtcDataStream
{
public:
    class Listener
    {
    public:
        virtual ~Listener() = default;

        virtual void onWebRtcDataStreamOpen(WebRtcDataStream& stream) = 0;
        // empty messages arrive with length 0
        virtual void onWebRtcData(WebRtcDataStream& stream,
            uint32_t payloadProtocol,
            const void* data,
            size_t length,
            bool isString) = 0;
        virtual void onWebRtcDataStreamClosed(WebRtcDataStream& stream) = 0;
    };

    enum State
    {
        CLOSED = 0,
        OPENING,
        OPEN
    };

    struct Stats
    {
        uint64_t messagesSent = 0;
        uint64_t messagesReceived = 0;
        uint64_t bytesSent = 0;
        uint64_t bytesReceived = 0;
    };

    WebRtcDataStream(size_t logId, webrtc::DataStreamTransport& transport);

    // outbound channel. Sends DATA_CHANNEL_OPEN unless the channel is pre-negotiated.
    bool open(uint16_t streamId, const DataChannelConfig& config);
    // pre-negotiated inbound channel. Without this the first DCEP OPEN on the stream configures it.
    void accept(uint16_t streamId, const DataChannelConfig& config);

    bool isOpen() const { return _state == State::OPEN; }
    bool sendString(const char* string, const size_t length);
    bool sendData(const void* data, size_t length);
    bool send(const void* data, size_t length, bool isString);
    void close();

    uint16_t getStreamId() const { return _streamId; };
    std::string getLabel() const { return _config.label; }
    std::string getProtocol() const { return _config.protocol; }
    const DataChannelConfig& getConfig() const { return _config; }

    size_t getBufferedAmount() const;
    void setBufferedAmountLowThreshold(size_t threshold);

    void onSctpMessage(webrtc::DataStreamTransport* sender,
        uint16_t streamId,
        uint16_t streamSequenceNumber,
        uint32_t payloadProtocol,
        const void* data,
        size_t length);
    // peer reset the stream
    void onStreamReset();

    State getState() const { return _state; }
    Stats getStats() const { return _stats; }

    void setListener(Listener* listener) { _listener = listener; }

private:
    void onDcepMessage(webrtc::DataStreamTransport* sender, uint16_t streamId, const void* data, size_t length);
    void commitReliability();

    logger::LoggableId _loggableId;
    uint16_t _streamId;
    webrtc::DataStreamTransport& _transport;
    State _state;
    DataChannelConfig _config;
    Stats _stats;
    Listener* _listener;
};

} // namespace webrtc
