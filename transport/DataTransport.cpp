#include "transport/DataTransport.h"
#include "config/RtcConfig.h"
#include "transport/sctp/Sctprotocol.h"
#include "utils/Time.h"
#include <algorithm>
#include <chrono>
#include <cinttypes>

namespace transport
{

namespace
{
// rfc7983 demultiplexing, DTLS records start with 20..63
bool isDtlsRecord(const uint8_t* data, size_t length)
{
    return length > 0 && data[0] >= 20 && data[0] <= 63;
}

constexpr size_t RECEIVE_BUFFER_SIZE = 64 * 1024;
constexpr uint64_t MAX_RECEIVE_WAIT = 100 * utils::Time::ms;
} // namespace

bool readDataTransportConfig(const config::RtcConfig& rtcConfig, DataTransportConfig& transportConfig)
{
    if (!readDtlsConfig(rtcConfig, transportConfig.dtls) || !sctp::readSctpConfig(rtcConfig, transportConfig.sctp))
    {
        return false;
    }

    transportConfig.connectTimeoutMs = rtcConfig.connectTimeoutMs;
    transportConfig.readTimeoutMs = rtcConfig.readTimeoutMs;
    transportConfig.writeTimeoutMs = rtcConfig.writeTimeoutMs;
    return true;
}

const char* toString(const DataTransport::Result result)
{
    switch (result)
    {
    case DataTransport::Result::Ok:
        return "Ok";
    case DataTransport::Result::Timeout:
        return "Timeout";
    case DataTransport::Result::Closed:
        return "Closed";
    case DataTransport::Result::WouldBlock:
        return "WouldBlock";
    case DataTransport::Result::Error:
        return "Error";
    }
    return "unknown";
}

const char* toString(const DataTransport::State state)
{
    switch (state)
    {
    case DataTransport::State::Idle:
        return "Idle";
    case DataTransport::State::Connecting:
        return "Connecting";
    case DataTransport::State::Connected:
        return "Connected";
    case DataTransport::State::Closing:
        return "Closing";
    case DataTransport::State::Closed:
        return "Closed";
    case DataTransport::State::Failed:
        return "Failed";
    }
    return "unknown";
}

DataTransport::Result DataTransport::Stream::write(const void* data, size_t length, uint32_t payloadProtocol)
{
    return _transport.writeStream(*this, data, length, payloadProtocol);
}

DataTransport::Result DataTransport::Stream::writeString(const std::string& text)
{
    return _transport.writeStream(*this, text.c_str(), text.size(), webrtc::WEBRTC_STRING);
}

DataTransport::Result DataTransport::Stream::read(Message& message)
{
    return _transport.readStream(*this, message, _transport._config.readTimeoutMs);
}

DataTransport::Result DataTransport::Stream::read(Message& message, uint32_t timeoutMs)
{
    return _transport.readStream(*this, message, timeoutMs);
}

DataTransport::Result DataTransport::Stream::setReliability(sctp::SctpAssociation::Reliability reliability,
    uint32_t value,
    bool unordered)
{
    return _transport.setStreamReliability(*this, reliability, value, unordered);
}

size_t DataTransport::Stream::getBufferedAmount() const
{
    return _transport.getStreamBufferedAmount(*this);
}

void DataTransport::Stream::onBufferedAmountLow(size_t threshold, std::function<void()> callback)
{
    _transport.setStreamBufferedAmountLow(*this, threshold, std::move(callback));
}

void DataTransport::Stream::close()
{
    _transport.closeStream(*this);
}

bool DataTransport::Stream::isOpen() const
{
    return _transport.isStreamOpen(*this);
}

std::string DataTransport::Stream::getLabel() const
{
    return _transport.getStreamLabel(*this);
}

std::string DataTransport::Stream::getProtocol() const
{
    return _transport.getStreamProtocol(*this);
}

webrtc::WebRtcDataStream::Stats DataTransport::Stream::getStats() const
{
    return _transport.getStreamStats(*this);
}

DataTransport::DataTransport(size_t logId, const DataTransportConfig& config, DatagramSocket& socket)
    : _loggableId("DataTransport", logId),
      _config(config),
      _socket(socket),
      _dtls(logId, _config.dtls, *this, this),
      _streamGeneration(0),
      _deliveredBytes(0),
      _state(State::Idle),
      _timestamp(utils::Time::getAbsoluteTime()),
      _running(false),
      _dropLogLimiter(10, 100)
{
    _sctpPort = std::make_unique<sctp::SctpServerPort>(logId,
        static_cast<sctp::DatagramTransport*>(this),
        static_cast<sctp::SctpServerPort::IEvents*>(this),
        _config.sctpPort,
        _config.sctp,
        _timestamp);
}

DataTransport::~DataTransport()
{
    shutdownTransport(false);
    if (_thread.joinable())
    {
        // destroyed from one of its own callbacks
        _thread.detach();
    }
}

DataTransport::Result DataTransport::connect()
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (_state != State::Idle)
    {
        logger::warn("connect in state %s", _loggableId.c_str(), toString(_state));
        return Result::Error;
    }

    _timestamp = utils::Time::getAbsoluteTime();
    _state = State::Connecting;
    if (!_dtls.start(_timestamp))
    {
        fail("dtls start failed");
        return Result::Error;
    }

    _running = true;
    _thread = std::thread([this]() { run(); });
    flush(lock);

    lock.lock();
    const bool done = _condition.wait_for(lock, std::chrono::milliseconds(_config.connectTimeoutMs), [this]() {
        return _state != State::Connecting;
    });

    if (!done)
    {
        fail("connect timed out");
        if (_association)
        {
            _association->abort(_timestamp);
        }
        flush(lock);
        return Result::Timeout;
    }

    switch (_state)
    {
    case State::Connected:
        logger::info("connected, cipher suite 0x%04x", _loggableId.c_str(), _dtls.getCipherSuite());
        return Result::Ok;
    case State::Failed:
        return Result::Error;
    default:
        return Result::Closed;
    }
}

DataTransport::Result DataTransport::openStream(uint16_t streamId,
    const webrtc::DataChannelConfig& channelConfig,
    std::unique_ptr<Stream>& stream)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (!isUsable() || !_association)
    {
        return Result::Closed;
    }

    auto it = _streams.find(streamId);
    if (it != _streams.end() &&
        (it->second.dataStream->getState() != webrtc::WebRtcDataStream::CLOSED || !it->second.messages.empty()))
    {
        logger::warn("stream %u already open", _loggableId.c_str(), streamId);
        return Result::Error;
    }
    if (it == _streams.end() && _streams.size() >= MAX_STREAMS)
    {
        logger::warn("stream limit reached, cannot open %u", _loggableId.c_str(), streamId);
        return Result::Error;
    }

    auto& state = createStreamState(streamId, false);
    if (!state.dataStream->open(streamId, channelConfig))
    {
        eraseStream(streamId);
        flush(lock);
        return Result::Error;
    }

    state.announced = true;
    stream.reset(new Stream(*this, streamId, state.generation));
    flush(lock);
    return Result::Ok;
}

DataTransport::Result DataTransport::acceptStream(uint32_t timeoutMs, std::unique_ptr<Stream>& stream)
{
    std::unique_lock<std::mutex> lock(_mutex);
    auto ready = [this]() {
        return !_acceptQueue.empty() || (_state != State::Connecting && _state != State::Connected);
    };

    if (timeoutMs == 0)
    {
        _condition.wait(lock, ready);
    }
    else if (!_condition.wait_for(lock, std::chrono::milliseconds(timeoutMs), ready))
    {
        return Result::Timeout;
    }

    while (!_acceptQueue.empty())
    {
        const auto entry = _acceptQueue.front();
        _acceptQueue.pop_front();
        if (findStream(entry.first, entry.second))
        {
            stream.reset(new Stream(*this, entry.first, entry.second));
            return Result::Ok;
        }
    }
    return Result::Closed;
}

void DataTransport::close()
{
    shutdownTransport(false);
}

void DataTransport::abort()
{
    shutdownTransport(true);
}

void DataTransport::shutdownTransport(const bool abortive)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (!_running)
    {
        if (_state != State::Failed)
        {
            _state = State::Closed;
        }
        closeAllStreams();
        _condition.notify_all();
        lock.unlock();
        if (_thread.joinable() && _thread.get_id() != std::this_thread::get_id())
        {
            _thread.join();
        }
        return;
    }

    _timestamp = utils::Time::getAbsoluteTime();
    if (_state == State::Connected || _state == State::Connecting)
    {
        _state = State::Closing;
    }
    closeAllStreams();
    _condition.notify_all();

    if (_association)
    {
        if (abortive)
        {
            _association->abort(_timestamp);
        }
        else
        {
            _association->shutdown(_timestamp);
        }
    }
    flush(lock);

    lock.lock();
    if (!abortive && _association)
    {
        const auto rtoMs = std::max<uint64_t>(_association->getStats().rtoMs, _config.sctp.RTO.initial);
        _condition.wait_for(lock, std::chrono::milliseconds(rtoMs), [this]() {
            return _association->getState() == sctp::SctpAssociation::State::CLOSED;
        });
    }

    _dtls.close();
    if (_state != State::Failed)
    {
        _state = State::Closed;
    }
    _running = false;
    _condition.notify_all();
    flush(lock);

    _socket.close();
    if (_thread.joinable() && _thread.get_id() != std::this_thread::get_id())
    {
        _thread.join();
    }
    logger::info("closed", _loggableId.c_str());
}

DataTransport::State DataTransport::getState() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
}

std::string DataTransport::getFailureReason() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _failureReason;
}

sctp::SctpAssociation::Stats DataTransport::getSctpStats() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _association ? _association->getStats() : sctp::SctpAssociation::Stats();
}

size_t DataTransport::getReceiveBufferUsed() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _association ? _association->getReceiveBufferUsed() : 0;
}

std::string DataTransport::getPeerCertificateFingerprint() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _dtls.getPeerCertificateFingerprint();
}

std::string DataTransport::getLocalFingerprint() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _dtls.getLocalFingerprint();
}

srtp::Profile DataTransport::getSelectedSrtpProfile() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _dtls.getSelectedSrtpProfile();
}

uint16_t DataTransport::getCipherSuite() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _dtls.getCipherSuite();
}

bool DataTransport::exportKeyingMaterial(const std::string& label,
    size_t length,
    std::vector<uint8_t>& keyingMaterial) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _dtls.exportKeyingMaterial(label, length, keyingMaterial);
}

void DataTransport::run()
{
    std::vector<uint8_t> buffer(RECEIVE_BUFFER_SIZE);
    for (;;)
    {
        uint64_t timeout = MAX_RECEIVE_WAIT;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!_running)
            {
                break;
            }
            timeout = getReceiveTimeout(utils::Time::getAbsoluteTime());
        }

        const int received = _socket.receive(buffer.data(), buffer.size(), timeout);

        std::unique_lock<std::mutex> lock(_mutex);
        _timestamp = utils::Time::getAbsoluteTime();
        if (received < 0)
        {
            if (_running && _state != State::Closing)
            {
                fail("socket closed");
                closeAllStreams();
                _running = false;
            }
            _condition.notify_all();
            break;
        }

        if (received > 0)
        {
            if (isDtlsRecord(buffer.data(), received))
            {
                _dtls.onPacketReceived(buffer.data(), received, _timestamp);
            }
            else if (_dropLogLimiter.canLog())
            {
                logger::debug("dropped non dtls datagram %dB", _loggableId.c_str(), received);
            }
        }

        processTimers(_timestamp);
        _condition.notify_all();
        flush(lock);
    }
    logger::debug("reader stopped", _loggableId.c_str());
}

void DataTransport::flush(std::unique_lock<std::mutex>& lock)
{
    std::vector<std::vector<uint8_t>> datagrams;
    std::vector<std::function<void()>> callbacks;
    std::unique_lock<std::mutex> sendLock(_sendMutex);
    datagrams.swap(_outbound);
    callbacks.swap(_pendingCallbacks);
    lock.unlock();

    for (const auto& datagram : datagrams)
    {
        if (_socket.send(datagram.data(), datagram.size()) < 0 && _dropLogLimiter.canLog())
        {
            logger::warn("failed to send %zuB", _loggableId.c_str(), datagram.size());
        }
    }
    sendLock.unlock();

    for (auto& callback : callbacks)
    {
        callback();
    }
}

void DataTransport::processTimers(const uint64_t timestamp)
{
    _dtls.processTimeout(timestamp);
    if (_association)
    {
        _association->processTimeout(timestamp);
    }
}

uint64_t DataTransport::getReceiveTimeout(const uint64_t timestamp) const
{
    int64_t timeout = MAX_RECEIVE_WAIT;
    const auto dtlsTimeout = _dtls.nextTimeout(timestamp);
    if (dtlsTimeout >= 0)
    {
        timeout = std::min(timeout, dtlsTimeout);
    }
    if (_association)
    {
        const auto sctpTimeout = _association->nextTimeout(timestamp);
        if (sctpTimeout >= 0)
        {
            timeout = std::min(timeout, sctpTimeout);
        }
    }
    return static_cast<uint64_t>(std::max<int64_t>(timeout, 0));
}

void DataTransport::fail(const std::string& reason)
{
    if (_state == State::Failed)
    {
        return;
    }

    logger::error("%s", _loggableId.c_str(), reason.c_str());
    _failureReason = reason;
    _state = State::Failed;
    _condition.notify_all();
}

void DataTransport::closeAllStreams()
{
    for (auto& entry : _streams)
    {
        entry.second.readClosed = true;
    }
}

DataTransport::StreamState* DataTransport::findStream(uint16_t streamId, uint32_t generation)
{
    auto it = _streams.find(streamId);
    if (it == _streams.end() || it->second.generation != generation)
    {
        return nullptr;
    }
    return &it->second;
}

const DataTransport::StreamState* DataTransport::findStream(uint16_t streamId, uint32_t generation) const
{
    auto it = _streams.find(streamId);
    if (it == _streams.end() || it->second.generation != generation)
    {
        return nullptr;
    }
    return &it->second;
}

void DataTransport::discardMessages(StreamState& state)
{
    size_t bytes = 0;
    for (const auto& message : state.messages)
    {
        bytes += message.data.size();
    }
    state.messages.clear();
    if (bytes > 0 && _association)
    {
        _association->releaseReceiveBuffer(bytes, _timestamp);
    }
}

void DataTransport::eraseStream(uint16_t streamId)
{
    auto it = _streams.find(streamId);
    if (it != _streams.end())
    {
        discardMessages(it->second);
        _streams.erase(it);
    }
}

DataTransport::StreamState& DataTransport::createStreamState(uint16_t streamId, bool inbound)
{
    eraseStream(streamId);
    auto& state = _streams[streamId];
    state.dataStream = std::make_unique<webrtc::WebRtcDataStream>(_loggableId.getInstanceId(),
        static_cast<webrtc::DataStreamTransport&>(*this));
    state.dataStream->setListener(this);
    state.generation = ++_streamGeneration;
    state.inbound = inbound;
    return state;
}

// writeTimeoutMs 0 refuses at once when the transmit buffer is full
DataTransport::Result DataTransport::writeStream(const Stream& stream,
    const void* data,
    size_t length,
    uint32_t payloadProtocol)
{
    std::unique_lock<std::mutex> lock(_mutex);
    auto* state = findStream(stream._id, stream._generation);
    if (!state || !isUsable() || !_association ||
        state->dataStream->getState() == webrtc::WebRtcDataStream::CLOSED)
    {
        return Result::Closed;
    }
    if (length > _association->getMaxMessageSize())
    {
        logger::warn("message %zuB exceeds max message size %zu",
            _loggableId.c_str(),
            length,
            _association->getMaxMessageSize());
        return Result::Error;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(_config.writeTimeoutMs);
    const size_t needed = std::max<size_t>(length, 1);
    while (_association->outboundPendingSize() + needed > _config.sctp.maxTransmitBufferSize)
    {
        if (_condition.wait_until(lock, deadline) == std::cv_status::timeout &&
            _association->outboundPendingSize() + needed > _config.sctp.maxTransmitBufferSize)
        {
            return Result::WouldBlock;
        }

        state = findStream(stream._id, stream._generation);
        if (!state || !isUsable() || state->dataStream->getState() == webrtc::WebRtcDataStream::CLOSED)
        {
            return Result::Closed;
        }
    }

    const bool sent = state->dataStream->send(data, length, webrtc::isStringPpid(payloadProtocol));
    flush(lock);
    return sent ? Result::Ok : Result::Error;
}

DataTransport::Result DataTransport::readStream(const Stream& stream, Message& message, uint32_t timeoutMs)
{
    std::unique_lock<std::mutex> lock(_mutex);
    auto ready = [this, &stream]() {
        auto* state = findStream(stream._id, stream._generation);
        return !state || !state->messages.empty() || state->readClosed;
    };

    if (timeoutMs == 0)
    {
        _condition.wait(lock, ready);
    }
    else if (!_condition.wait_for(lock, std::chrono::milliseconds(timeoutMs), ready))
    {
        return Result::Timeout;
    }

    auto* state = findStream(stream._id, stream._generation);
    if (!state || state->messages.empty())
    {
        return Result::Closed;
    }

    message = std::move(state->messages.front());
    state->messages.pop_front();
    if (_association)
    {
        _association->releaseReceiveBuffer(message.data.size(), utils::Time::getAbsoluteTime());
        flush(lock);
    }
    return Result::Ok;
}

DataTransport::Result DataTransport::setStreamReliability(const Stream& stream,
    sctp::SctpAssociation::Reliability reliability,
    uint32_t value,
    bool unordered)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto* state = findStream(stream._id, stream._generation);
    if (!state || !_association || state->dataStream->getState() == webrtc::WebRtcDataStream::CLOSED)
    {
        return Result::Closed;
    }
    return _association->setReliability(stream._id, reliability, value, unordered) ? Result::Ok : Result::Error;
}

size_t DataTransport::getStreamBufferedAmount(const Stream& stream) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto* state = findStream(stream._id, stream._generation);
    return state ? state->dataStream->getBufferedAmount() : 0;
}

void DataTransport::setStreamBufferedAmountLow(const Stream& stream, size_t threshold, std::function<void()> callback)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto* state = findStream(stream._id, stream._generation);
    if (!state)
    {
        return;
    }
    state->bufferedAmountLow = std::move(callback);
    state->dataStream->setBufferedAmountLowThreshold(threshold);
}

void DataTransport::closeStream(const Stream& stream)
{
    std::unique_lock<std::mutex> lock(_mutex);
    auto* state = findStream(stream._id, stream._generation);
    if (!state)
    {
        return;
    }

    state->dataStream->close();
    state->readClosed = true;
    discardMessages(*state);
    _condition.notify_all();
    flush(lock);
}

bool DataTransport::isStreamOpen(const Stream& stream) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto* state = findStream(stream._id, stream._generation);
    return state && state->dataStream->isOpen();
}

std::string DataTransport::getStreamLabel(const Stream& stream) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto* state = findStream(stream._id, stream._generation);
    return state ? state->dataStream->getLabel() : "";
}

std::string DataTransport::getStreamProtocol(const Stream& stream) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto* state = findStream(stream._id, stream._generation);
    return state ? state->dataStream->getProtocol() : "";
}

webrtc::WebRtcDataStream::Stats DataTransport::getStreamStats(const Stream& stream) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto* state = findStream(stream._id, stream._generation);
    return state ? state->dataStream->getStats() : webrtc::WebRtcDataStream::Stats();
}

int32_t DataTransport::sendDtls(const char* buffer, uint32_t length)
{
    _outbound.emplace_back(buffer, buffer + length);
    return static_cast<int32_t>(length);
}

void DataTransport::onDtlsConnected(DtlsConnection& connection)
{
    logger::info("DTLS connected, srtp profile %s, peer %s",
        _loggableId.c_str(),
        srtp::toString(connection.getSelectedSrtpProfile()),
        connection.getPeerCertificateFingerprint().c_str());

    if (connection.isClient() && !_association)
    {
        _association = sctp::createSctpAssociation(_loggableId.getInstanceId(),
            *_sctpPort,
            _config.sctpPort,
            this,
            _config.sctp);
        _association->connect(_config.sctp.streamCount, _config.sctp.streamCount, _timestamp);
    }
    _condition.notify_all();
}

void DataTransport::onDtlsApplicationData(DtlsConnection& connection, const uint8_t* data, size_t length)
{
    _sctpPort->onPacketReceived(data, length, _timestamp);
}

void DataTransport::onDtlsFailed(DtlsConnection& connection, dtls::AlertDescription alert)
{
    if (alert == dtls::NO_ALERT)
    {
        fail("dtls handshake timed out");
    }
    else
    {
        fail(std::string("dtls alert ") + dtls::toString(alert));
    }
    closeAllStreams();
}

void DataTransport::onDtlsClosed(DtlsConnection& connection)
{
    logger::info("DTLS closed by peer", _loggableId.c_str());
    if (_state == State::Connecting || _state == State::Connected)
    {
        _state = State::Closed;
    }
    if (_association)
    {
        _association->abort(_timestamp);
    }
    closeAllStreams();
    _condition.notify_all();
}

bool DataTransport::sendSctpPacket(const void* data, size_t length)
{
    return _dtls.sendApplicationData(data, length);
}

sctp::SctpServerPort::InitDecision DataTransport::onSctpInitReceived(sctp::SctpServerPort* serverPort,
    uint16_t srcPort,
    const sctp::SctpPacket& sctpPacket,
    uint64_t timestamp)
{
    if (_association)
    {
        logger::info("unexpected INIT received", _loggableId.c_str());
        _association->onPacketReceived(sctpPacket, timestamp);
        return {false, 0, 0};
    }
    if (_state != State::Connecting)
    {
        return {false, 0, 0};
    }

    return {true, _config.sctp.streamCount, _config.sctp.streamCount};
}

void DataTransport::onSctpCookieEchoReceived(sctp::SctpServerPort* serverPort,
    uint16_t srcPort,
    const sctp::SctpPacket& packet,
    uint64_t timestamp)
{
    if (_association)
    {
        _association->onPacketReceived(packet, timestamp);
    }
    else if (_state == State::Connecting)
    {
        _association =
            sctp::createSctpAssociation(_loggableId.getInstanceId(), *serverPort, packet, this, _config.sctp);
        _association->onCookieEcho(packet, timestamp);
    }
}

void DataTransport::onSctpReceived(sctp::SctpServerPort* serverPort,
    uint16_t srcPort,
    const sctp::SctpPacket& sctpPacket,
    uint64_t timestamp)
{
    if (_association)
    {
        _association->onPacketReceived(sctpPacket, timestamp);
    }
}

void DataTransport::onSctpStateChanged(sctp::SctpAssociation* session, sctp::SctpAssociation::State state)
{
    logger::debug("SCTP state %s", _loggableId.c_str(), sctp::toString(state));
    _condition.notify_all();
}

void DataTransport::onSctpMessageReceived(sctp::SctpAssociation* session,
    uint16_t streamId,
    uint16_t streamSequenceNumber,
    uint32_t payloadProtocol,
    const void* buffer,
    size_t length,
    uint64_t timestamp)
{
    auto it = _streams.find(streamId);
    if (it != _streams.end() && payloadProtocol == webrtc::WEBRTC_ESTABLISH &&
        it->second.dataStream->getState() == webrtc::WebRtcDataStream::CLOSED && it->second.readClosed &&
        it->second.messages.empty())
    {
        // stream id reused after a reset
        _streams.erase(it);
        it = _streams.end();
    }

    // bytes not queued for the application leave the receive window right away
    _deliveredBytes = 0;
    if (it == _streams.end())
    {
        if (_streams.size() >= MAX_STREAMS)
        {
            if (_dropLogLimiter.canLog())
            {
                logger::debug("stream limit reached, message on %u discarded", _loggableId.c_str(), streamId);
            }
            session->releaseReceiveBuffer(length, timestamp);
            return;
        }

        auto& state = createStreamState(streamId, true);
        state.dataStream->onSctpMessage(this, streamId, streamSequenceNumber, payloadProtocol, buffer, length);
        if (state.dataStream->getState() == webrtc::WebRtcDataStream::CLOSED)
        {
            eraseStream(streamId);
            _deliveredBytes = 0;
        }
    }
    else
    {
        it->second.dataStream->onSctpMessage(this, streamId, streamSequenceNumber, payloadProtocol, buffer, length);
    }

    session->releaseReceiveBuffer(length - std::min(length, _deliveredBytes), timestamp);
    _deliveredBytes = 0;
}

void DataTransport::onSctpEstablished(sctp::SctpAssociation* session)
{
    logger::info("SCTP established", _loggableId.c_str());
    if (_state == State::Connecting)
    {
        _state = State::Connected;
    }
    _condition.notify_all();
}

void DataTransport::onSctpClosed(sctp::SctpAssociation* session, sctp::SctpAssociation::CloseReason reason)
{
    logger::info("SCTP closed, %s", _loggableId.c_str(), sctp::toString(reason));
    if (reason != sctp::SctpAssociation::CloseReason::Shutdown &&
        reason != sctp::SctpAssociation::CloseReason::LocalAbort)
    {
        fail(std::string("sctp closed: ") + sctp::toString(reason));
    }
    else if (_state == State::Connecting || _state == State::Connected)
    {
        _state = State::Closed;
    }
    closeAllStreams();
    _condition.notify_all();
}

void DataTransport::onSctpChunkDropped(sctp::SctpAssociation* session, size_t size)
{
    if (_dropLogLimiter.canLog())
    {
        logger::warn("SCTP chunk dropped %zuB, receive buffer full. %" PRIu64 " drop events",
            _loggableId.c_str(),
            size,
            _dropLogLimiter.getEventCount());
    }
}

void DataTransport::onSctpStreamReset(sctp::SctpAssociation* session, uint16_t streamId)
{
    auto it = _streams.find(streamId);
    if (it != _streams.end())
    {
        it->second.dataStream->onStreamReset();
    }
}

void DataTransport::onSctpBufferedAmountLow(sctp::SctpAssociation* session, uint16_t streamId)
{
    auto it = _streams.find(streamId);
    if (it != _streams.end() && it->second.bufferedAmountLow)
    {
        _pendingCallbacks.push_back(it->second.bufferedAmountLow);
    }
    _condition.notify_all();
}

bool DataTransport::openSctpStream(uint16_t streamId)
{
    if (!_association)
    {
        return false;
    }
    if (_association->getStreamHandle(streamId).generation != 0)
    {
        return true;
    }
    return _association->openStream(streamId, sctp::SctpAssociation::Reliability::Reliable, 0, false).generation != 0;
}

bool DataTransport::sendSctp(uint16_t streamId, uint32_t protocolId, const void* data, size_t length)
{
    return _association && _association->sendMessage(streamId, protocolId, data, length, _timestamp);
}

bool DataTransport::setSctpReliability(uint16_t streamId,
    sctp::SctpAssociation::Reliability reliability,
    uint32_t value,
    bool unordered)
{
    return _association && _association->setReliability(streamId, reliability, value, unordered);
}

bool DataTransport::resetSctpStream(uint16_t streamId)
{
    return _association && _association->resetStream(streamId, _timestamp);
}

size_t DataTransport::getBufferedAmount(uint16_t streamId) const
{
    return _association ? _association->getBufferedAmount(streamId) : 0;
}

void DataTransport::setBufferedAmountLowThreshold(uint16_t streamId, size_t threshold)
{
    if (_association)
    {
        _association->setBufferedAmountLowThreshold(streamId, threshold);
    }
}

void DataTransport::onWebRtcDataStreamOpen(webrtc::WebRtcDataStream& stream)
{
    auto it = _streams.find(stream.getStreamId());
    if (it == _streams.end() || it->second.dataStream.get() != &stream)
    {
        return;
    }

    auto& state = it->second;
    if (state.inbound && !state.announced)
    {
        state.announced = true;
        _acceptQueue.emplace_back(stream.getStreamId(), state.generation);
    }
    _condition.notify_all();
}

void DataTransport::onWebRtcData(webrtc::WebRtcDataStream& stream,
    uint32_t payloadProtocol,
    const void* data,
    size_t length,
    bool isString)
{
    auto it = _streams.find(stream.getStreamId());
    if (it == _streams.end() || it->second.dataStream.get() != &stream)
    {
        return;
    }

    auto* bytes = reinterpret_cast<const uint8_t*>(data);
    Message message;
    message.data.assign(bytes, bytes + length);
    message.payloadProtocol = payloadProtocol;
    if (it->second.readClosed)
    {
        return;
    }
    it->second.messages.push_back(std::move(message));
    _deliveredBytes += length;
    _condition.notify_all();
}

void DataTransport::onWebRtcDataStreamClosed(webrtc::WebRtcDataStream& stream)
{
    auto it = _streams.find(stream.getStreamId());
    if (it != _streams.end() && it->second.dataStream.get() == &stream)
    {
        it->second.readClosed = true;
    }
    _condition.notify_all();
}

} // namespace transport
