#include "WebRtcDataStream.h"
#include "webrtc/DataStreamTransport.h"

namespace webrtc
{

WebRtcDataStream::WebRtcDataStream(const size_t logId, webrtc::DataStreamTransport& transport)
    : _loggableId("WebRtcStream", logId),
      _streamId(0),
      _transport(transport),
      _state(State::CLOSED),
      _listener(nullptr)
{
}

bool WebRtcDataStream::open(uint16_t streamId, const DataChannelConfig& config)
{
    if (_state != State::CLOSED)
    {
        return false;
    }

    if (!_transport.openSctpStream(streamId))
    {
        logger::warn("failed to open sctp stream %u", _loggableId.c_str(), streamId);
        return false;
    }

    _streamId = streamId;
    _config = config;
    if (config.negotiated)
    {
        commitReliability();
        _state = State::OPEN;
        return true;
    }

    const auto message = makeOpenMessage(config);
    if (!_transport.sendSctp(_streamId, DataChannelPpid::WEBRTC_ESTABLISH, message.data(), message.size()))
    {
        return false;
    }
    _state = State::OPENING;
    logger::debug("opening data channel %u '%s' %s",
        _loggableId.c_str(),
        streamId,
        config.label.c_str(),
        toString(config.channelType));
    return true;
}

void WebRtcDataStream::accept(uint16_t streamId, const DataChannelConfig& config)
{
    _streamId = streamId;
    _config = config;
    _config.negotiated = true;
    commitReliability();
    _state = State::OPEN;
}

bool WebRtcDataStream::sendString(const char* string, const size_t length)
{
    return send(string, length, true);
}

bool WebRtcDataStream::sendData(const void* data, size_t length)
{
    return send(data, length, false);
}

// SCTP cannot carry empty user messages. One zero byte is sent with the empty PPID instead.
bool WebRtcDataStream::send(const void* data, size_t length, bool isString)
{
    if (_state == State::CLOSED)
    {
        return false;
    }

    bool sent = false;
    if (length == 0)
    {
        const uint8_t zero = 0;
        sent = _transport.sendSctp(_streamId,
            isString ? DataChannelPpid::WEBRTC_STRING_EMPTY : DataChannelPpid::WEBRTC_BINARY_EMPTY,
            &zero,
            1);
    }
    else
    {
        sent = _transport.sendSctp(_streamId,
            isString ? DataChannelPpid::WEBRTC_STRING : DataChannelPpid::WEBRTC_BINARY,
            data,
            length);
    }

    if (sent)
    {
        ++_stats.messagesSent;
        _stats.bytesSent += length;
    }
    return sent;
}

void WebRtcDataStream::close()
{
    if (_state == State::CLOSED)
    {
        return;
    }

    _state = State::CLOSED;
    _transport.resetSctpStream(_streamId);
}

size_t WebRtcDataStream::getBufferedAmount() const
{
    return _transport.getBufferedAmount(_streamId);
}

void WebRtcDataStream::setBufferedAmountLowThreshold(size_t threshold)
{
    _transport.setBufferedAmountLowThreshold(_streamId, threshold);
}

void WebRtcDataStream::onSctpMessage(webrtc::DataStreamTransport* sender,
    uint16_t streamId,
    uint16_t streamSequenceNumber,
    uint32_t payloadProtocol,
    const void* data,
    size_t length)
{
    if (payloadProtocol == webrtc::DataChannelPpid::WEBRTC_ESTABLISH)
    {
        onDcepMessage(sender, streamId, data, length);
        return;
    }

    if (_state != State::OPEN)
    {
        // data may overtake the ACK on unordered channels
        if (_state == State::OPENING)
        {
            commitReliability();
            _state = State::OPEN;
            if (_listener)
            {
                _listener->onWebRtcDataStreamOpen(*this);
            }
        }
        else
        {
            logger::debug("data on closed stream %u dropped", _loggableId.c_str(), streamId);
            return;
        }
    }

    const size_t messageLength = isEmptyMessage(payloadProtocol, data, length) ? 0 : length;
    ++_stats.messagesReceived;
    _stats.bytesReceived += messageLength;
    if (_listener)
    {
        _listener->onWebRtcData(*this, payloadProtocol, data, messageLength, isStringPpid(payloadProtocol));
    }
}

void WebRtcDataStream::onDcepMessage(webrtc::DataStreamTransport* sender,
    uint16_t streamId,
    const void* data,
    size_t length)
{
    if (length == 0)
    {
        return;
    }

    const auto messageType = *reinterpret_cast<const uint8_t*>(data);
    if (messageType == DataChannelMessageType::DATA_CHANNEL_OPEN)
    {
        auto* message = DataChannelOpenMessage::parse(data, length);
        if (!message)
        {
            logger::warn("malformed DATA_CHANNEL_OPEN on stream %u", _loggableId.c_str(), streamId);
            return;
        }

        if (_state == State::CLOSED)
        {
            _streamId = streamId;
            message->getConfig(_config);
        }

        uint8_t ack[] = {webrtc::DATA_CHANNEL_ACK};
        sender->sendSctp(streamId, webrtc::DataChannelPpid::WEBRTC_ESTABLISH, ack, 1);
        if (_state != State::OPEN)
        {
            commitReliability();
            _state = State::OPEN;
            logger::info("Data channel open. stream %u '%s'", _loggableId.c_str(), streamId, _config.label.c_str());
            if (_listener)
            {
                _listener->onWebRtcDataStreamOpen(*this);
            }
        }
    }
    else if (messageType == DataChannelMessageType::DATA_CHANNEL_ACK)
    {
        if (_state == State::OPENING)
        {
            commitReliability();
            _state = State::OPEN;
            logger::info("Data channel open acknowledged. stream %u", _loggableId.c_str(), streamId);
            if (_listener)
            {
                _listener->onWebRtcDataStreamOpen(*this);
            }
        }
    }
    else
    {
        logger::warn("unknown DCEP message %u on stream %u", _loggableId.c_str(), messageType, streamId);
    }
}

void WebRtcDataStream::onStreamReset()
{
    const bool wasClosed = (_state == State::CLOSED);
    _state = State::CLOSED;
    if (!wasClosed)
    {
        // the association resets our outgoing side in response
        logger::info("Data channel closed by peer. stream %u", _loggableId.c_str(), _streamId);
    }
    if (_listener)
    {
        _listener->onWebRtcDataStreamClosed(*this);
    }
}

void WebRtcDataStream::commitReliability()
{
    const auto reliability = toSctpReliability(_config);
    _transport.setSctpReliability(_streamId, reliability.reliability, reliability.value, reliability.unordered);
}

} // namespace webrtc
