#include "SctpAssociationImpl.h"
#include "SctpConfig.h"
#include "SctpServerPort.h"
#include "Sctprotocol.h"
#include "logger/Logger.h"
#include "utils/Time.h"
#include <algorithm>
#include <cinttypes>
#include <cmath>
#include <cstring>

#define SCTP_LOG_ENABLE 0

#if SCTP_LOG_ENABLE
#define SCTP_LOG(fmt, ...) logger::debug(fmt, ##__VA_ARGS__)
#else
// silence compiler warnings
#define SCTP_LOG(fmt, logId, ...) (void)logId;
#endif

namespace sctp
{
namespace
{
const uint32_t DCEP_PPID = 50; // DCEP control messages are never abandoned
const uint32_t MAX_TSN_GAP = 0xFFFF; // gap ack blocks use 16 bit offsets

template <typename T>
void appendPayloadData(SctpPacketWriter& packet, const T& chunk)
{
    auto& payloadChunk = packet.appendChunk<PayloadDataChunk>(chunk.streamId,
        chunk.streamSequenceNumber,
        chunk.payloadProtocol,
        chunk.transmissionSequenceNumber);
    payloadChunk.writeData(chunk.payload.data(), chunk.payload.size(), chunk.fragmentBegin, chunk.fragmentEnd);
    if (chunk.unordered)
    {
        payloadChunk.setUnordered();
    }
    packet.commitAppendedChunk();
}
} // namespace

// Collects chunks into MTU sized packets and sends each packet when it is full.
class OutboundPackets
{
public:
    OutboundPackets(SctpServerPort& transport,
        uint32_t tag,
        uint16_t srcPort,
        uint16_t dstPort,
        size_t mtu,
        SctpAssociation::Stats& stats)
        : _transport(transport),
          _packet(tag, srcPort, dstPort, _area, std::min(mtu, SCTP_MAX_PACKET_SIZE) + sizeof(uint32_t)),
          _stats(stats)
    {
    }

    ~OutboundPackets() { flush(); }

    SctpPacketWriter& packet() { return _packet; }

    // sends current packet if a chunk of this size does not fit
    void reserve(size_t chunkSize)
    {
        if (_packet.capacity() < chunkSize)
        {
            flush();
        }
    }

    void flush()
    {
        if (!_packet.empty())
        {
            _transport.send(_packet);
            ++_stats.packetsSent;
            _packet.clear();
        }
    }

private:
    uint8_t _area[SCTP_MAX_PACKET_SIZE + sizeof(uint32_t)];
    SctpServerPort& _transport;
    SctpPacketWriter _packet;
    SctpAssociation::Stats& _stats;
};

const char* toString(SctpAssociation::State state)
{
    switch (state)
    {
    case SctpAssociation::State::CLOSED:
        return "CLOSED";
    case SctpAssociation::State::COOKIE_ECHOED:
        return "COOKIE_ECHOED";
    case SctpAssociation::State::COOKIE_WAIT:
        return "COOKIE_WAIT";
    case SctpAssociation::State::ESTABLISHED:
        return "ESTABLISHED";
    case SctpAssociation::State::SHUTDOWN_ACK_SENT:
        return "SHUTDOWN_ACK_SENT";
    case SctpAssociation::State::SHUTDOWN_PENDING:
        return "SHUTDOWN_PENDING";
    case SctpAssociation::State::SHUTDOWN_RECEIVED:
        return "SHUTDOWN_RECEIVED";
    case SctpAssociation::State::SHUTDOWN_SENT:
        return "SHUTDOWN_SENT";
    }
    return "unknown";
}

const char* toString(SctpAssociation::CloseReason reason)
{
    switch (reason)
    {
    case SctpAssociation::CloseReason::Shutdown:
        return "Shutdown";
    case SctpAssociation::CloseReason::PeerAbort:
        return "PeerAbort";
    case SctpAssociation::CloseReason::InitTimeout:
        return "InitTimeout";
    case SctpAssociation::CloseReason::CookieTimeout:
        return "CookieTimeout";
    case SctpAssociation::CloseReason::RetransmitLimit:
        return "RetransmitLimit";
    case SctpAssociation::CloseReason::ShutdownTimeout:
        return "ShutdownTimeout";
    case SctpAssociation::CloseReason::LocalAbort:
        return "LocalAbort";
    case SctpAssociation::CloseReason::ProtocolError:
        return "ProtocolError";
    }
    return "unknown";
}

SctpAssociationImpl::RTT::RTT(const SctpConfig& config)
    : _config(config),
      _measured(false),
      _smoothed(0),
      _variance(0),
      _rto(config.RTO.initial * utils::Time::ms)
{
}

void SctpAssociationImpl::RTT::update(uint64_t rttns)
{
    const auto rtt = static_cast<double>(std::min(rttns, _config.RTO.max * utils::Time::ms));
    if (!_measured)
    {
        _measured = true;
        _smoothed = rtt;
        _variance = rtt / 2;
    }
    else
    {
        _variance = (1.0 - _config.RTO.beta) * _variance + _config.RTO.beta * std::abs(_smoothed - rtt);
        _smoothed = (1.0 - _config.RTO.alpha) * _smoothed + _config.RTO.alpha * rtt;
    }

    const auto rto = static_cast<uint64_t>(_smoothed + 4 * _variance);
    _rto = std::max(_config.RTO.min * utils::Time::ms, std::min(rto, _config.RTO.max * utils::Time::ms));
}

void SctpAssociationImpl::RTT::backOff()
{
    _rto = std::min(_rto * 2, _config.RTO.max * utils::Time::ms);
}

SctpAssociationImpl::ReceivedChunk::ReceivedChunk(const PayloadDataChunk& chunk)
    : transmissionSequenceNumber(chunk.transmissionSequenceNumber),
      streamSequenceNumber(chunk.streamSequenceNumber),
      payloadProtocol(chunk.payloadProtocol),
      fragmentBegin(chunk.isBegin()),
      fragmentEnd(chunk.isEnd()),
      data(chunk.data(), chunk.data() + chunk.payloadSize())
{
}

SctpAssociationImpl::TransmissionControlBlock::TransmissionControlBlock(uint16_t port_,
    uint32_t tag_,
    uint32_t receiveWindow,
    uint16_t inboundStreams_,
    uint16_t outboundStreams_)
    : port(port_),
      tag(tag_),
      advertisedReceiveWindow(receiveWindow),
      inboundStreamCount(inboundStreams_),
      outboundStreamCount(outboundStreams_)
{
}

size_t SctpAssociationImpl::GenericCookie::maxSize() const
{
    return sizeof(cookie);
}

void SctpAssociationImpl::GenericCookie::set(const ChunkParameter& param)
{
    std::memcpy(cookie, param.data(), std::min(static_cast<size_t>(param.dataSize()), sizeof(cookie)));
    length = std::min(static_cast<size_t>(param.dataSize()), sizeof(cookie));
}

SctpAssociationImpl::CongestionControl::CongestionControl()
    : congestionWindow(4380),
      slowStartThreshold(0xFFFFFFFFu),
      partialBytesAcked(0),
      inFastRecovery(false),
      fastRecoveryExitPoint(0)
{
}

void SctpAssociationImpl::CongestionControl::reset(uint32_t mtu, uint32_t slowStartThreshold_)
{
    congestionWindow = std::min(4 * mtu, std::max(2 * mtu, 4380u));
    slowStartThreshold = slowStartThreshold_;
    partialBytesAcked = 0;
    inFastRecovery = false;
}

// rfc4960 7.2.1 and 7.2.2. Call only if SACK advanced the cumulative ack.
void SctpAssociationImpl::CongestionControl::onCumulativeAckAdvanced(uint32_t mtu,
    uint32_t bytesAcked,
    bool hasPendingData)
{
    if (congestionWindow <= slowStartThreshold)
    {
        if (!inFastRecovery && hasPendingData)
        {
            congestionWindow += std::min(bytesAcked, congestionWindow);
        }
    }
    else
    {
        partialBytesAcked += bytesAcked;
        if (partialBytesAcked >= congestionWindow && hasPendingData)
        {
            partialBytesAcked -= congestionWindow;
            congestionWindow += mtu;
        }
    }
}

void SctpAssociationImpl::CongestionControl::onFastRetransmit(uint32_t mtu, uint32_t exitPoint)
{
    inFastRecovery = true;
    fastRecoveryExitPoint = exitPoint;
    slowStartThreshold = std::max(congestionWindow / 2, 4 * mtu);
    congestionWindow = slowStartThreshold;
    partialBytesAcked = 0;
}

void SctpAssociationImpl::CongestionControl::onTransmitTimeout(uint32_t mtu)
{
    slowStartThreshold = std::max(congestionWindow / 2, 4 * mtu);
    congestionWindow = mtu;
    partialBytesAcked = 0;
}

SctpAssociationImpl::SctpAssociationImpl(size_t logId,
    SctpServerPort& transport,
    uint16_t remotePort,
    IEvents* listener,
    const SctpConfig& config)
    : _loggableId("SctpAssociation", logId),
      _config(config),
      _transport(transport),
      _listener(listener),
      _state(State::CLOSED),
      _mtu(std::min(config.mtu, static_cast<uint32_t>(SCTP_MAX_PACKET_SIZE))),
      _local(transport.getPort(), transport.generateTag(), config.maxReceiveBufferSize, config.streamCount, config.streamCount),
      _peer(remotePort, 0, 0, 0, 0),
      _rtt(config)
{
    _nextTsn = transport.generateInitialTsn();
    _cumulativeAckPoint = _nextTsn - 1;
    _advancedPeerAckPoint = _cumulativeAckPoint;
    _minTsnToMeasureRtt = _nextTsn;
    _flow.reset(_mtu, 0xFFFFFFFFu);
}

SctpAssociationImpl::SctpAssociationImpl(size_t logId,
    SctpServerPort& transport,
    const SctpPacket& cookieEcho,
    IEvents* listener,
    const SctpConfig& config)
    : _loggableId("SctpAssociation", logId),
      _config(config),
      _transport(transport),
      _listener(listener),
      _state(State::CLOSED),
      _mtu(std::min(config.mtu, static_cast<uint32_t>(SCTP_MAX_PACKET_SIZE))),
      _local(cookieEcho.getHeader().destinationPort,
          cookieEcho.getHeader().verificationTag,
          config.maxReceiveBufferSize,
          0,
          0),
      _peer(cookieEcho.getHeader().sourcePort, 0, 0, 0, 0),
      _rtt(config)
{
    auto cookieChunk = cookieEcho.getChunk<CookieEchoChunk>(ChunkType::COOKIE_ECHO);
    if (cookieChunk && cookieChunk->cookieSize() == sizeof(SctpCookie))
    {
        const auto cookie = cookieChunk->getCookie<SctpCookie>();
        _local.tag = cookie.localTag.get();
        _peer.tag = cookie.peerTag.get();
        _nextTsn = cookie.localTsn.get();
        _peerLastTsn = cookie.peerTsn.get() - 1;
        _peer.advertisedReceiveWindow = cookie.peerReceiveWindow.get();
        _local.inboundStreamCount = cookie.inboundStreams.get();
        _local.outboundStreamCount = cookie.outboundStreams.get();
        _useForwardTsn = cookie.has(SctpCookie::FORWARD_TSN);
        _peerSupportsReconfig = cookie.has(SctpCookie::RECONFIG);
    }
    else
    {
        logger::error("association created without valid cookie", _loggableId.c_str());
    }

    _highestReceivedTsn = _peerLastTsn;
    _cumulativeAckPoint = _nextTsn - 1;
    _advancedPeerAckPoint = _cumulativeAckPoint;
    _minTsnToMeasureRtt = _nextTsn;
    _flow.reset(_mtu, _peer.advertisedReceiveWindow);
}

// must only be called once and immediately after creation due to COOKIE ECHO received
void SctpAssociationImpl::onCookieEcho(const SctpPacket& cookieEcho, const uint64_t timestamp)
{
    if (_state != State::CLOSED || _closeReported || _peer.tag == 0)
    {
        return;
    }

    SctpPacketWriter outboundPacket(_peer.tag, _local.port, _peer.port);
    outboundPacket.addChunk<GenericChunk>(ChunkType::COOKIE_ACK);
    _transport.send(outboundPacket);
    ++_stats.packetsSent;

    setState(State::ESTABLISHED);
    startHeartbeat(timestamp);

    dispatchChunks(cookieEcho, timestamp, true);
    collectAllMessages();
    processOutboundChunks(timestamp);
    dispatchEvents(timestamp);
}

void SctpAssociationImpl::connect(uint16_t inboundStreamCount, uint16_t outboundStreamCount, const uint64_t timestamp)
{
    if (_state != State::CLOSED || _closeReported)
    {
        return;
    }

    _local.inboundStreamCount = inboundStreamCount;
    _local.outboundStreamCount = outboundStreamCount;
    _connect.retransmitCount = 0;
    _connect.timeout = _rtt.getRto();

    sendInit();
    _connect.initTimer.start(timestamp, _connect.timeout);
    setState(State::COOKIE_WAIT);
}

void SctpAssociationImpl::sendInit()
{
    SctpPacketWriter sctpPacket(0, _local.port, _peer.port);

    auto& initChunk = sctpPacket.appendChunk<InitChunk>();
    initChunk.inboundStreams = _local.inboundStreamCount;
    initChunk.outboundStreams = _local.outboundStreamCount;
    initChunk.initTag = _local.tag;
    initChunk.initTSN = _nextTsn;
    initChunk.advertisedReceiverWindow = getReceiveWindow();
    initChunk.add(ChunkParameter(ForwardTsnSupport));
    auto& supported = appendParameter<SupportedExtensionsParameter>(initChunk);
    supported.add(ChunkType::FORWARDTSN);
    supported.add(ChunkType::RE_CONFIG);
    initChunk.commitAppendedParameter();

    sctpPacket.commitAppendedChunk();
    _transport.send(sctpPacket);
    ++_stats.packetsSent;
    logger::info("SCTP sending INIT", _loggableId.c_str());
}

void SctpAssociationImpl::sendCookieEcho()
{
    SctpPacketWriter outboundPacket(_peer.tag, _local.port, _peer.port);
    auto& echoChunk = outboundPacket.appendChunk<CookieEchoChunk>();
    echoChunk.setCookie(_connect.echoedCookie.cookie, _connect.echoedCookie.length);
    outboundPacket.commitAppendedChunk();
    _transport.send(outboundPacket);
    ++_stats.packetsSent;
}

void SctpAssociationImpl::sendAbort(ErrorCause cause, const char* reason)
{
    sendAbort(cause, reason, std::strlen(reason));
}

void SctpAssociationImpl::sendAbort(ErrorCause cause, const void* info, size_t infoLength)
{
    SctpPacketWriter response(_peer.tag, _local.port, _peer.port);
    auto& abortChunk = response.appendChunk<AbortChunk>(false);
    appendErrorCause(abortChunk, cause, info, infoLength, _mtu - SctpPacketWriter::HEADER_SIZE - abortChunk.size());
    response.commitAppendedChunk();
    _transport.send(response);
    ++_stats.packetsSent;
}

void SctpAssociationImpl::sendShutdown()
{
    SctpPacketWriter packet(_peer.tag, _local.port, _peer.port);
    packet.addChunk<ShutdownChunk>(_peerLastTsn);
    _transport.send(packet);
    ++_stats.packetsSent;
}

void SctpAssociationImpl::sendShutdownAck()
{
    SctpPacketWriter packet(_peer.tag, _local.port, _peer.port);
    packet.addChunk<GenericChunk>(ChunkType::SHUTDOWN_ACK);
    _transport.send(packet);
    ++_stats.packetsSent;
}

void SctpAssociationImpl::startHeartbeat(uint64_t timestamp)
{
    if (_config.heartbeat.interval > 0)
    {
        _heartbeat.outstanding = 0;
        _heartbeat.timer.start(timestamp, _config.heartbeat.interval * utils::Time::ms + _rtt.getRto());
    }
}

void SctpAssociationImpl::sendHeartbeat(const uint64_t timestamp)
{
    SctpPacketWriter packet(_peer.tag, _local.port, _peer.port);
    auto& heartbeat = packet.appendChunk<GenericChunk>(ChunkType::HEARTBEAT);

    _heartbeat.nonce = (static_cast<uint64_t>(_transport.generateTag()) << 32) | _transport.generateTag();
    auto& info = appendParameter<HeartbeatInfoParameter>(heartbeat);
    info.timestamp = timestamp;
    info.mtu = static_cast<uint16_t>(_mtu);
    info.sequenceNumber = 0;
    info.nonce = _heartbeat.nonce;
    heartbeat.commitAppendedParameter();
    packet.commitAppendedChunk();

    ++_heartbeat.outstanding;
    _heartbeat.timer.start(timestamp, _config.heartbeat.interval * utils::Time::ms + _rtt.getRto());
    _transport.send(packet);
    ++_stats.packetsSent;
}

void SctpAssociationImpl::sendUnrecognizedChunksError(const std::vector<const Chunk*>& chunks)
{
    SctpPacketWriter packet(_peer.tag, _local.port, _peer.port);
    auto& errorChunk = packet.appendChunk<ErrorChunk>();
    for (auto* chunk : chunks)
    {
        const size_t causeSize = ChunkParameter::HEADER_SIZE + chunk->size();
        if (SctpPacketWriter::HEADER_SIZE + errorChunk.size() + causeSize > _mtu)
        {
            break;
        }
        appendErrorCause(errorChunk, ErrorCause::UnrecognizedChunkType, chunk, chunk->header.length, causeSize);
    }
    packet.commitAppendedChunk();
    _transport.send(packet);
    ++_stats.packetsSent;
}

void SctpAssociationImpl::setState(State newState)
{
    if (newState != _state)
    {
        logger::debug("state %s -> %s", _loggableId.c_str(), toString(_state.load()), toString(newState));
        _state = newState;
        _listener->onSctpStateChanged(this, newState);
        if (_state == State::ESTABLISHED)
        {
            _listener->onSctpEstablished(this);
        }
    }
}

void SctpAssociationImpl::close(CloseReason reason)
{
    if (_closeReported)
    {
        return;
    }

    _connect.initTimer.stop();
    _connect.cookieTimer.stop();
    _flow.retransmitTimer.stop();
    _shutdown.timer.stop();
    _reconfigTimer.stop();
    _ackTimer.stop();
    _heartbeat.timer.stop();
    _pendingChunks.clear();
    _inflightChunks.clear();
    for (auto& streamItem : _streams)
    {
        streamItem.second.bufferedAmount = 0;
    }

    if (reason == CloseReason::Shutdown || reason == CloseReason::LocalAbort)
    {
        logger::info("SCTP association closed, %s", _loggableId.c_str(), toString(reason));
    }
    else
    {
        logger::warn("SCTP association closed, %s", _loggableId.c_str(), toString(reason));
    }

    setState(State::CLOSED);
    _closeReported = true;
    _listener->onSctpClosed(this, reason);
}

SctpAssociation::StreamHandle SctpAssociationImpl::openStream(uint16_t streamId,
    Reliability reliability,
    uint32_t value,
    bool unordered)
{
    if (_state == State::CLOSED && _closeReported)
    {
        return StreamHandle();
    }
    if (_local.outboundStreamCount > 0 && streamId >= _local.outboundStreamCount)
    {
        logger::warn("stream %u exceeds negotiated stream count %u",
            _loggableId.c_str(),
            streamId,
            _local.outboundStreamCount);
        return StreamHandle();
    }
    if (getStream(streamId))
    {
        logger::warn("stream %u already in use", _loggableId.c_str(), streamId);
        return StreamHandle();
    }

    auto& stream = createStream(streamId);
    stream.reliability = reliability;
    stream.reliabilityValue = value;
    stream.unordered = unordered;
    return StreamHandle(streamId, stream.generation);
}

bool SctpAssociationImpl::isValid(const StreamHandle& handle) const
{
    auto* stream = getStream(handle.id);
    return stream && handle.generation != 0 && stream->generation == handle.generation;
}

SctpAssociation::StreamHandle SctpAssociationImpl::getStreamHandle(uint16_t streamId) const
{
    auto* stream = getStream(streamId);
    if (!stream)
    {
        return StreamHandle();
    }
    return StreamHandle(streamId, stream->generation);
}

bool SctpAssociationImpl::setReliability(uint16_t streamId, Reliability reliability, uint32_t value, bool unordered)
{
    auto* stream = getStream(streamId);
    if (!stream)
    {
        return false;
    }
    stream->reliability = reliability;
    stream->reliabilityValue = value;
    stream->unordered = unordered;
    return true;
}

bool SctpAssociationImpl::sendMessage(uint16_t streamId,
    uint32_t payloadProtocol,
    const void* payloadData,
    size_t length,
    uint64_t timestamp)
{
    if (_state != State::ESTABLISHED && _state != State::COOKIE_WAIT && _state != State::COOKIE_ECHOED)
    {
        logger::debug("cannot send in state %s", _loggableId.c_str(), toString(_state.load()));
        return false;
    }
    auto* stream = getStream(streamId);
    if (!stream || stream->writeClosed)
    {
        logger::warn("SCTP stream not open %u, count %zu", _loggableId.c_str(), streamId, _streams.size());
        return false;
    }
    if (length == 0 || length > _config.maxMessageSize)
    {
        logger::warn("SCTP message size %zu not allowed, max %zu",
            _loggableId.c_str(),
            length,
            _config.maxMessageSize);
        return false;
    }
    if (outboundPendingSize() + length > _config.maxTransmitBufferSize)
    {
        SCTP_LOG("transmit buffer full", _loggableId.c_str());
        return false;
    }

    const size_t maxPayload = _mtu - PAYLOAD_DATA_OVERHEAD;
    const auto messageId = ++_messageIdCounter;
    auto* payloadBytes = reinterpret_cast<const uint8_t*>(payloadData);
    for (size_t offset = 0; offset < length;)
    {
        const auto toWrite = std::min(length - offset, maxPayload);
        OutboundChunk chunk;
        chunk.messageId = messageId;
        chunk.streamId = streamId;
        chunk.streamSequenceNumber = stream->nextSsn;
        chunk.payloadProtocol = payloadProtocol;
        chunk.unordered = stream->unordered;
        chunk.fragmentBegin = (offset == 0);
        chunk.fragmentEnd = (offset + toWrite == length);
        chunk.payload.assign(payloadBytes + offset, payloadBytes + offset + toWrite);
        _pendingChunks.push_back(std::move(chunk));
        offset += toWrite;
    }

    if (!stream->unordered)
    {
        ++stream->nextSsn;
    }
    stream->bufferedAmount += length;
    ++_stats.messagesSent;
    _stats.bytesSent += length;

    if (_state == State::ESTABLISHED)
    {
        processOutboundChunks(timestamp);
    }
    return true;
}

size_t SctpAssociationImpl::getBufferedAmount(uint16_t streamId) const
{
    auto* stream = getStream(streamId);
    return stream ? stream->bufferedAmount : 0;
}

void SctpAssociationImpl::setBufferedAmountLowThreshold(uint16_t streamId, size_t threshold)
{
    auto* stream = getStream(streamId);
    if (stream)
    {
        stream->bufferedAmountLowThreshold = threshold;
    }
}

size_t SctpAssociationImpl::outboundPendingSize() const
{
    size_t count = 0;
    for (auto& chunk : _pendingChunks)
    {
        count += chunk.size();
    }
    for (auto& chunk : _inflightChunks)
    {
        count += chunk.size();
    }
    return count;
}

bool SctpAssociationImpl::resetStream(uint16_t streamId, uint64_t timestamp)
{
    auto* stream = getStream(streamId);
    if (!stream || stream->writeClosed)
    {
        return false;
    }
    if (!canSendData())
    {
        return false;
    }
    if (!_peerSupportsReconfig)
    {
        logger::warn("peer does not support stream reset, stream %u", _loggableId.c_str(), streamId);
        return false;
    }

    stream->writeClosed = true;
    OutboundChunk marker;
    marker.resetMarker = true;
    marker.streamId = streamId;
    _pendingChunks.push_back(std::move(marker));
    processOutboundChunks(timestamp);
    return true;
}

void SctpAssociationImpl::shutdown(uint64_t timestamp)
{
    switch (_state.load())
    {
    case State::COOKIE_WAIT:
    case State::COOKIE_ECHOED:
        close(CloseReason::Shutdown);
        break;
    case State::ESTABLISHED:
        setState(State::SHUTDOWN_PENDING);
        processOutboundChunks(timestamp);
        break;
    default:
        break;
    }
}

void SctpAssociationImpl::abort(uint64_t timestamp)
{
    if (_state == State::CLOSED)
    {
        close(CloseReason::LocalAbort);
        return;
    }

    if (_peer.tag != 0)
    {
        sendAbort(ErrorCause::UserInitiatedAbort, "local abort");
    }
    close(CloseReason::LocalAbort);
}

int64_t SctpAssociationImpl::nextTimeout(const uint64_t timestamp)
{
    if (_state == State::CLOSED)
    {
        return -1;
    }
    int64_t minTimeout = 30 * utils::Time::sec;

    minTimeout = std::min(minTimeout, _connect.cookieTimer.timeToExpiry(timestamp));
    minTimeout = std::min(minTimeout, _connect.initTimer.timeToExpiry(timestamp));
    minTimeout = std::min(minTimeout, _flow.retransmitTimer.timeToExpiry(timestamp));
    minTimeout = std::min(minTimeout, _shutdown.timer.timeToExpiry(timestamp));
    minTimeout = std::min(minTimeout, _reconfigTimer.timeToExpiry(timestamp));
    minTimeout = std::min(minTimeout, _ackTimer.timeToExpiry(timestamp));
    minTimeout = std::min(minTimeout, _heartbeat.timer.timeToExpiry(timestamp));
    return minTimeout;
}

int64_t SctpAssociationImpl::processTimeout(const uint64_t timestamp)
{
    const auto toSleep = nextTimeout(timestamp);
    if (toSleep != 0)
    {
        return toSleep;
    }

    if (_connect.initTimer.hasExpired(timestamp))
    {
        if (_state != State::COOKIE_WAIT)
        {
            _connect.initTimer.stop();
        }
        else if (_connect.retransmitCount >= _config.init.maxRetransmits)
        {
            close(CloseReason::InitTimeout);
        }
        else
        {
            ++_connect.retransmitCount;
            _connect.timeout = std::min(_connect.timeout * 2, _config.RTO.max * utils::Time::ms);
            _connect.initTimer.start(timestamp, _connect.timeout);
            sendInit();
        }
    }

    if (_connect.cookieTimer.hasExpired(timestamp))
    {
        if (_state != State::COOKIE_ECHOED)
        {
            _connect.cookieTimer.stop();
        }
        else if (_connect.retransmitCount >= _config.init.maxRetransmits)
        {
            close(CloseReason::CookieTimeout);
        }
        else
        {
            ++_connect.retransmitCount;
            _connect.timeout = std::min(_connect.timeout * 2, _config.RTO.max * utils::Time::ms);
            _connect.cookieTimer.start(timestamp, _connect.timeout);
            sendCookieEcho();
        }
    }

    if (_flow.retransmitTimer.hasExpired(timestamp))
    {
        onRetransmitTimeout(timestamp);
    }

    if (_shutdown.timer.hasExpired(timestamp))
    {
        if (++_shutdown.retransmitCount > _config.flow.maxRetransmits)
        {
            sendAbort(ErrorCause::ProtocolError, "shutdown timeout");
            close(CloseReason::ShutdownTimeout);
        }
        else
        {
            _rtt.backOff();
            _shutdown.timer.start(timestamp, _rtt.getRto());
            if (_state == State::SHUTDOWN_SENT)
            {
                sendShutdown();
            }
            else if (_state == State::SHUTDOWN_ACK_SENT)
            {
                sendShutdownAck();
            }
            else
            {
                _shutdown.timer.stop();
            }
        }
    }

    if (_reconfigTimer.hasExpired(timestamp))
    {
        if (_outgoingResetRequests.empty() || _state == State::CLOSED)
        {
            _reconfigTimer.stop();
        }
        else
        {
            logger::debug("retransmitting %zu stream reset requests",
                _loggableId.c_str(),
                _outgoingResetRequests.size());
            _reconfigTimer.start(timestamp, _rtt.getRto());
            OutboundPackets packets(_transport, _peer.tag, _local.port, _peer.port, _mtu, _stats);
            writeReconfigRequests(packets, true, timestamp);
        }
    }

    if (_ackTimer.hasExpired(timestamp))
    {
        _ackTimer.stop();
        _ackPending = true;
        processOutboundChunks(timestamp);
    }

    if (_heartbeat.timer.hasExpired(timestamp))
    {
        if (_state != State::ESTABLISHED)
        {
            _heartbeat.timer.stop();
        }
        else if (_heartbeat.outstanding > _config.flow.maxRetransmits)
        {
            sendAbort(ErrorCause::ProtocolError, "heartbeat timeout");
            close(CloseReason::RetransmitLimit);
        }
        else
        {
            sendHeartbeat(timestamp);
        }
    }

    dispatchEvents(timestamp);
    return nextTimeout(timestamp);
}

// returns time to next timeout event
int64_t SctpAssociationImpl::onPacketReceived(const SctpPacket& sctpPacket, const uint64_t timestamp)
{
    if (!sctpPacket.isValid())
    {
        logger::debug("malformed SCTP packet %zuB", _loggableId.c_str(), sctpPacket.size());
        _listener->onSctpChunkDropped(this, sctpPacket.size());
        return nextTimeout(timestamp);
    }

    const auto& requestHeader = sctpPacket.getHeader();
    if (_local.port != requestHeader.destinationPort || _peer.port != requestHeader.sourcePort)
    {
        _listener->onSctpChunkDropped(this, sctpPacket.size());
        return nextTimeout(timestamp);
    }

    if (!sctpPacket.hasChunk(ChunkType::INIT) && requestHeader.verificationTag != _local.tag)
    {
        // T bit reflects the peer tag in ABORT and SHUTDOWN COMPLETE
        const auto& firstChunk = *sctpPacket.chunks().begin();
        const bool reflected = (firstChunk.header.type == ChunkType::ABORT ||
                                   firstChunk.header.type == ChunkType::SHUTDOWN_COMPLETE) &&
            (firstChunk.header.flags & 0x01) && requestHeader.verificationTag == _peer.tag;
        if (!reflected)
        {
            logger::debug("verification tag mismatch %x", _loggableId.c_str(), requestHeader.verificationTag.get());
            _listener->onSctpChunkDropped(this, sctpPacket.size());
            return nextTimeout(timestamp);
        }
    }

    if (_closeReported)
    {
        return nextTimeout(timestamp);
    }

    ++_stats.packetsReceived;
    dispatchChunks(sctpPacket, timestamp, false);
    collectAllMessages();
    processOutboundChunks(timestamp);
    dispatchEvents(timestamp);
    return nextTimeout(timestamp);
}

void SctpAssociationImpl::dispatchChunks(const SctpPacket& sctpPacket, const uint64_t timestamp, bool skipCookieEcho)
{
    bool dataReceived = false;
    bool immediateAck = false;
    std::vector<const Chunk*> unrecognizedChunks;

    for (const Chunk& chunk : sctpPacket.chunks())
    {
        if (_closeReported)
        {
            return;
        }

        bool stopProcessing = false;
        switch (chunk.header.type)
        {
        case ChunkType::INIT_ACK:
            onInitAck(sctpPacket, reinterpret_cast<const InitAckChunk&>(chunk), timestamp);
            break;
        case ChunkType::COOKIE_ACK:
            onCookieAckReceived(timestamp);
            break;
        case ChunkType::COOKIE_ECHO:
            if (!skipCookieEcho)
            {
                onUnexpectedCookieEcho(sctpPacket, timestamp);
            }
            break;
        case ChunkType::INIT:
            onUnexpectedInitReceived(sctpPacket, timestamp);
            break;
        case ChunkType::ABORT:
            onAbortReceived(reinterpret_cast<const AbortChunk&>(chunk));
            return;
        case ChunkType::ERROR:
            onErrorReceived(reinterpret_cast<const ErrorChunk&>(chunk));
            break;
        case ChunkType::SHUTDOWN:
            if (chunk.header.length >= ShutdownChunk::HEADER_SIZE)
            {
                onShutDownReceived(reinterpret_cast<const ShutdownChunk&>(chunk), timestamp);
            }
            break;
        case ChunkType::SHUTDOWN_ACK:
            onShutDownAckReceived(timestamp);
            break;
        case ChunkType::SHUTDOWN_COMPLETE:
            onShutDownCompleteReceived(timestamp);
            break;
        case ChunkType::DATA:
            if (chunk.header.length >= PayloadDataChunk::HEADER_SIZE)
            {
                dataReceived = true;
                immediateAck |= onDataReceived(reinterpret_cast<const PayloadDataChunk&>(chunk), timestamp);
            }
            break;
        case ChunkType::SACK:
        {
            auto& sack = reinterpret_cast<const SelectiveAckChunk&>(chunk);
            if (chunk.header.length >= SelectiveAckChunk::HEADER_SIZE && sack.isConsistent())
            {
                onSackReceived(sack, timestamp);
            }
            break;
        }
        case ChunkType::HEARTBEAT:
            onHeartbeatRequest(chunk);
            break;
        case ChunkType::HEARTBEAT_ACK:
            onHeartbeatResponse(chunk, timestamp);
            break;
        case ChunkType::FORWARDTSN:
            if (chunk.header.length >= ForwardTsnChunk::HEADER_SIZE)
            {
                onForwardTsnReceived(reinterpret_cast<const ForwardTsnChunk&>(chunk), timestamp);
            }
            break;
        case ChunkType::RE_CONFIG:
            onReconfigReceived(reinterpret_cast<const ReconfigChunk&>(chunk), timestamp);
            break;
        default:
        {
            const auto action = getUnrecognizedAction(chunk.header.type);
            logger::warn("unrecognized chunk %u", _loggableId.c_str(), chunk.header.type);
            _listener->onSctpChunkDropped(this, chunk.size());
            if (shouldReport(action))
            {
                unrecognizedChunks.push_back(&chunk);
            }
            stopProcessing = (action == UnrecognizedAction::Stop || action == UnrecognizedAction::StopAndReport);
        }
        }

        if (stopProcessing)
        {
            break;
        }
    }

    if (!unrecognizedChunks.empty() && _peer.tag != 0)
    {
        sendUnrecognizedChunksError(unrecognizedChunks);
    }

    if (dataReceived)
    {
        scheduleAck(immediateAck, timestamp);
    }
}

void SctpAssociationImpl::dispatchEvents(const uint64_t timestamp)
{
    if (_dispatching)
    {
        return;
    }

    _dispatching = true;
    while (!_events.empty())
    {
        std::vector<InboundEvent> events;
        events.swap(_events);
        for (auto& event : events)
        {
            switch (event.type)
            {
            case InboundEvent::Message:
                _listener->onSctpMessageReceived(this,
                    event.streamId,
                    event.ssn,
                    event.payloadProtocol,
                    event.data.data(),
                    event.data.size(),
                    timestamp);
                break;
            case InboundEvent::StreamReset:
                _listener->onSctpStreamReset(this, event.streamId);
                break;
            case InboundEvent::BufferedAmountLow:
                _listener->onSctpBufferedAmountLow(this, event.streamId);
                break;
            }
        }
    }
    _dispatching = false;
}

SctpAssociation::Stats SctpAssociationImpl::getStats() const
{
    auto stats = _stats;
    stats.congestionWindow = _flow.congestionWindow;
    stats.slowStartThreshold = _flow.slowStartThreshold;
    stats.inFastRecovery = _flow.inFastRecovery;
    stats.peerReceiveWindow = _peer.advertisedReceiveWindow;
    stats.rtoMs = _rtt.getRto() / utils::Time::ms;
    return stats;
}

std::tuple<uint16_t, uint16_t> SctpAssociationImpl::getPortPair() const
{
    return std::tuple<uint16_t, uint16_t>(_local.port, _peer.port);
}

std::tuple<uint32_t, uint32_t> SctpAssociationImpl::getTags() const
{
    return std::tuple<uint32_t, uint32_t>(_local.tag, _peer.tag);
}

size_t SctpAssociationImpl::getMaxMessageSize() const
{
    return _config.maxMessageSize;
}

void SctpAssociationImpl::onInitAck(const SctpPacket& packet,
    const InitAckChunk& initAckChunk,
    const uint64_t timestamp)
{
    if (_state != State::COOKIE_WAIT)
    {
        return; // collision, ignore it [rfc4960]
    }
    if (initAckChunk.header.length < InitAckChunk::HEADER_SIZE || initAckChunk.initTag == 0)
    {
        logger::warn("invalid INIT ACK", _loggableId.c_str());
        return;
    }

    auto params = initAckChunk.params();
    auto param = getParameter<ChunkParameter>(params, ChunkParameterType::StateCookie);
    if (!param)
    {
        logger::error("INIT ACK without cookie", _loggableId.c_str());
        _peer.tag = initAckChunk.initTag;
        // one missing parameter followed by its type, rfc4960 3.3.10.2
        uint8_t missing[6];
        const nwuint32_t count(1);
        const nwuint16_t missingType(ChunkParameterType::StateCookie);
        std::memcpy(missing, &count, sizeof(count));
        std::memcpy(missing + sizeof(count), &missingType, sizeof(missingType));
        sendAbort(ErrorCause::MissingMandatoryParameter, missing, sizeof(missing));
        close(CloseReason::ProtocolError);
        return;
    }
    if (param->dataSize() > _connect.echoedCookie.maxSize())
    {
        logger::error("Cookie received is too large!", _loggableId.c_str());
        close(CloseReason::ProtocolError);
        return;
    }

    _peer.tag = initAckChunk.initTag;
    _peerLastTsn = initAckChunk.initTSN - 1;
    _highestReceivedTsn = _peerLastTsn;
    _peer.advertisedReceiveWindow = initAckChunk.advertisedReceiverWindow;
    _local.outboundStreamCount = std::min(_local.outboundStreamCount, initAckChunk.inboundStreams.get());
    _local.inboundStreamCount = std::min(_local.inboundStreamCount, initAckChunk.outboundStreams.get());
    _useForwardTsn = initAckChunk.supportsForwardTsn();
    _peerSupportsReconfig = initAckChunk.supportsReconfig();
    _flow.reset(_mtu, _peer.advertisedReceiveWindow);
    _connect.echoedCookie.set(*param);

    SctpPacketWriter outboundPacket(_peer.tag, _local.port, _peer.port);
    auto& echoChunk = outboundPacket.appendChunk<CookieEchoChunk>();
    echoChunk.setCookie(_connect.echoedCookie.cookie, _connect.echoedCookie.length);
    outboundPacket.commitAppendedChunk();

    std::vector<const ChunkParameter*> unrecognizedParams;
    for (auto& initParam : params)
    {
        if (isKnownInitParameter(initParam.type))
        {
            continue;
        }
        const auto action = getUnrecognizedParameterAction(initParam.type);
        if (shouldReport(action))
        {
            unrecognizedParams.push_back(&initParam);
        }
        if (action == UnrecognizedAction::Stop || action == UnrecognizedAction::StopAndReport)
        {
            break;
        }
    }
    if (!unrecognizedParams.empty())
    {
        auto& errorChunk = outboundPacket.appendChunk<ErrorChunk>();
        for (auto* unrecognized : unrecognizedParams)
        {
            const size_t causeSize = ChunkParameter::HEADER_SIZE + unrecognized->size();
            if (errorChunk.size() + causeSize > outboundPacket.capacity())
            {
                break;
            }
            appendErrorCause(errorChunk,
                ErrorCause::UnrecognizedParameters,
                unrecognized,
                unrecognized->length,
                causeSize);
        }
        outboundPacket.commitAppendedChunk();
    }

    _transport.send(outboundPacket);
    ++_stats.packetsSent;

    _connect.retransmitCount = 0;
    _connect.initTimer.stop();
    _connect.timeout = _rtt.getRto();
    _connect.cookieTimer.start(timestamp, _connect.timeout);
    setState(State::COOKIE_ECHOED);
}

void SctpAssociationImpl::onCookieAckReceived(const uint64_t timestamp)
{
    if (_state == State::COOKIE_ECHOED)
    {
        _connect.cookieTimer.stop();
        setState(State::ESTABLISHED);
        startHeartbeat(timestamp);
    }
    // discard in all other states
}

// cookies should be used to start up associations.
// This is anomaly condition that has to be resolved
void SctpAssociationImpl::onUnexpectedCookieEcho(const SctpPacket& sctpPacket, const uint64_t timestamp)
{
    auto* cookieChunk = sctpPacket.getChunk<CookieEchoChunk>(ChunkType::COOKIE_ECHO);
    if (!cookieChunk || cookieChunk->cookieSize() != sizeof(SctpCookie))
    {
        return;
    }

    const auto cookie = cookieChunk->getCookie<SctpCookie>();
    if (cookie.localTag.get() == _local.tag && cookie.peerTag.get() == _peer.tag)
    {
        // (D) peer did not get our COOKIE ACK
        if (_state == State::COOKIE_ECHOED)
        {
            _connect.cookieTimer.stop();
            setState(State::ESTABLISHED);
            startHeartbeat(timestamp);
        }
        SctpPacketWriter outPacket(_peer.tag, _local.port, _peer.port);
        outPacket.addChunk<GenericChunk>(ChunkType::COOKIE_ACK);
        _transport.send(outPacket);
        ++_stats.packetsSent;
    }
    else if (cookie.localTag.get() == _local.tag && (_state == State::COOKIE_WAIT || _state == State::COOKIE_ECHOED) &&
        _transport.verifyCookie(cookie, _peer.port))
    {
        // INIT collision. Peer answered the INIT ACK we sent for its INIT.
        _peer.tag = cookie.peerTag.get();
        _peerLastTsn = cookie.peerTsn.get() - 1;
        _highestReceivedTsn = _peerLastTsn;
        _peer.advertisedReceiveWindow = cookie.peerReceiveWindow.get();
        _local.inboundStreamCount = std::min(_local.inboundStreamCount, cookie.inboundStreams.get());
        _local.outboundStreamCount = std::min(_local.outboundStreamCount, cookie.outboundStreams.get());
        _useForwardTsn = cookie.has(SctpCookie::FORWARD_TSN);
        _peerSupportsReconfig = cookie.has(SctpCookie::RECONFIG);
        _flow.reset(_mtu, _peer.advertisedReceiveWindow);
        _connect.initTimer.stop();
        _connect.cookieTimer.stop();

        SctpPacketWriter outPacket(_peer.tag, _local.port, _peer.port);
        outPacket.addChunk<GenericChunk>(ChunkType::COOKIE_ACK);
        _transport.send(outPacket);
        ++_stats.packetsSent;
        setState(State::ESTABLISHED);
        startHeartbeat(timestamp);
    }
    else
    {
        logger::debug("discarding stale COOKIE ECHO", _loggableId.c_str());
    }
}

void SctpAssociationImpl::onUnexpectedInitReceived(const SctpPacket& sctpPacket, const uint64_t timestamp)
{
    auto initChunk = sctpPacket.getChunk<InitChunk>(ChunkType::INIT);
    if (!initChunk || initChunk->header.length < InitChunk::HEADER_SIZE)
    {
        return;
    }

    if (_state != State::COOKIE_WAIT && _state != State::COOKIE_ECHOED)
    {
        logger::info("INIT received in state %s. Association restart not supported",
            _loggableId.c_str(),
            toString(_state.load()));
        return;
    }

    // respond with INIT_ACK with info from original INIT, but combine with new info
    // do not change internal state
    const uint32_t newPeerTag = initChunk->initTag;
    SctpPacketWriter initAckPacket(newPeerTag, _local.port, _peer.port);

    auto& initAck = initAckPacket.appendChunk<InitAckChunk>();
    initAck.inboundStreams = _local.inboundStreamCount;
    initAck.outboundStreams = _local.outboundStreamCount;
    initAck.initTag = _local.tag;
    initAck.initTSN = _nextTsn;
    initAck.advertisedReceiverWindow = getReceiveWindow();

    SctpCookie cookie(timestamp, _local.tag, _nextTsn, _local.inboundStreamCount, _local.outboundStreamCount, *initChunk);
    _transport.signCookie(cookie, _peer.port);
    SctpServerPort::appendInitAckParameters(initAck, cookie);
    initAckPacket.commitAppendedChunk();

    _transport.send(initAckPacket);
    ++_stats.packetsSent;
}

void SctpAssociationImpl::onAbortReceived(const AbortChunk& chunk)
{
    logger::debug("abort chunk received", _loggableId.c_str());
    for (auto& cause : chunk.causes())
    {
        if (cause.getCause() == ErrorCause::ProtocolError || cause.getCause() == ErrorCause::UserInitiatedAbort)
        {
            logger::warn("SCTP abort received %s", _loggableId.c_str(), cause.getReason().c_str());
        }
        else
        {
            logger::warn("SCTP abort cause code %u %s",
                _loggableId.c_str(),
                cause.getCause(),
                toString(cause.getCause()));
        }
    }
    close(CloseReason::PeerAbort);
}

void SctpAssociationImpl::onErrorReceived(const ErrorChunk& chunk)
{
    for (auto& cause : chunk.causes())
    {
        logger::warn("SCTP error received, cause %u %s",
            _loggableId.c_str(),
            cause.getCause(),
            toString(cause.getCause()));

        if (cause.getCause() == ErrorCause::UnrecognizedChunkType && cause.dataSize() > 0)
        {
            const auto chunkType = cause.data()[0];
            if (chunkType == ChunkType::FORWARDTSN)
            {
                _useForwardTsn = false;
            }
            else if (chunkType == ChunkType::RE_CONFIG)
            {
                _peerSupportsReconfig = false;
            }
        }
    }
}

void SctpAssociationImpl::onShutDownReceived(const ShutdownChunk& chunk, const uint64_t timestamp)
{
    logger::info("SCTP shutdown received", _loggableId.c_str());
    const uint32_t cumulativeAck = chunk.cumulativeTsnAck;
    if (diff(_cumulativeAckPoint, cumulativeAck) > 0 && diff(cumulativeAck, _nextTsn - 1) >= 0)
    {
        popAckedChunks(cumulativeAck, timestamp);
        _flow.retransmitTimer.stop();
        if (!_inflightChunks.empty())
        {
            _flow.retransmitTimer.start(timestamp, _rtt.getRto());
        }
    }

    switch (_state.load())
    {
    case State::ESTABLISHED:
    case State::SHUTDOWN_PENDING:
        setState(State::SHUTDOWN_RECEIVED);
        break;
    case State::SHUTDOWN_SENT:
        _shutdown.retransmitCount = 0;
        _shutdown.timer.start(timestamp, _rtt.getRto());
        setState(State::SHUTDOWN_ACK_SENT);
        sendShutdownAck();
        break;
    case State::SHUTDOWN_ACK_SENT:
        sendShutdownAck();
        break;
    default:
        break;
    }
}

void SctpAssociationImpl::onShutDownAckReceived(const uint64_t timestamp)
{
    if (_state == State::SHUTDOWN_SENT || _state == State::SHUTDOWN_ACK_SENT)
    {
        SctpPacketWriter packet(_peer.tag, _local.port, _peer.port);
        packet.addChunk<GenericChunk>(ChunkType::SHUTDOWN_COMPLETE);
        _transport.send(packet);
        ++_stats.packetsSent;
        close(CloseReason::Shutdown);
    }
}

void SctpAssociationImpl::onShutDownCompleteReceived(const uint64_t timestamp)
{
    if (_state == State::SHUTDOWN_ACK_SENT)
    {
        close(CloseReason::Shutdown);
    }
}

void SctpAssociationImpl::onHeartbeatRequest(const Chunk& heartbeatChunk)
{
    auto params = heartbeatChunk.params();
    auto param = getParameter(params, ChunkParameterType::HeartbeatInfo);
    if (param && param->size() + Chunk::BASE_HEADER_SIZE + SctpPacketWriter::HEADER_SIZE <= SCTP_MAX_PACKET_SIZE)
    {
        SctpPacketWriter response(_peer.tag, _local.port, _peer.port);
        auto& heartbeatAck = response.appendChunk<GenericChunk>(ChunkType::HEARTBEAT_ACK);
        heartbeatAck.add(*param);
        response.commitAppendedChunk();
        _transport.send(response);
        ++_stats.packetsSent;
    }
}

void SctpAssociationImpl::onHeartbeatResponse(const Chunk& heartbeatChunk, const uint64_t timestamp)
{
    auto params = heartbeatChunk.params();
    auto* info = getParameter<HeartbeatInfoParameter>(params, ChunkParameterType::HeartbeatInfo);
    if (info && info->length >= HeartbeatInfoParameter::HEADER_SIZE && info->nonce == _heartbeat.nonce)
    {
        _rtt.update(timestamp - info->timestamp);
        _heartbeat.outstanding = 0;
    }
}

bool SctpAssociationImpl::onDataReceived(const PayloadDataChunk& chunk, const uint64_t timestamp)
{
    if (_state != State::ESTABLISHED && _state != State::SHUTDOWN_PENDING && _state != State::SHUTDOWN_SENT)
    {
        return false;
    }

    const uint32_t tsn = chunk.transmissionSequenceNumber;
    if (chunk.payloadSize() == 0)
    {
        logger::error("empty DATA CHUNK received %x", _loggableId.c_str(), tsn);
        const nwuint32_t emptyTsn(tsn);
        sendAbort(ErrorCause::NoUserData, &emptyTsn, sizeof(emptyTsn));
        close(CloseReason::ProtocolError);
        return false;
    }

    if (diff(tsn, _peerLastTsn) >= 0 || _receivedTsns.count(tsn) > 0)
    {
        SCTP_LOG("duplicate data chunk %x received", _loggableId.c_str(), tsn);
        if (_duplicateTsns.size() < _config.maxDuplicateTsnReports)
        {
            _duplicateTsns.push_back(tsn);
        }
        ++_stats.duplicateTsnsReceived;
        return true;
    }

    if (chunk.streamId >= _local.inboundStreamCount)
    {
        logger::debug("DATA on stream %u beyond inbound stream count %u, discarded",
            _loggableId.c_str(),
            chunk.streamId.get(),
            _local.inboundStreamCount);
        _listener->onSctpChunkDropped(this, chunk.size());
        return false;
    }

    if (static_cast<uint32_t>(diff(_peerLastTsn, tsn)) > MAX_TSN_GAP ||
        (getReceiveWindow() == 0 && diff(_highestReceivedTsn, tsn) > 0))
    {
        SCTP_LOG("no room for chunk %x", _loggableId.c_str(), tsn);
        _listener->onSctpChunkDropped(this, chunk.size());
        return false;
    }

    auto* stream = getStream(chunk.streamId);
    if (!stream)
    {
        stream = &createStream(chunk.streamId);
    }
    stream->readClosed = false;

    if (chunk.isUnordered())
    {
        auto& chunks = stream->unorderedChunks;
        auto it = std::find_if(chunks.begin(), chunks.end(), [tsn](const ReceivedChunk& c) {
            return diff(c.transmissionSequenceNumber, tsn) < 0;
        });
        chunks.insert(it, ReceivedChunk(chunk));
        _receiveQueueBytes += chunk.payloadSize();
    }
    else if (diff16(chunk.streamSequenceNumber, stream->inboundNextSsn) > 0)
    {
        SCTP_LOG("stale ssn %u on stream %u", _loggableId.c_str(), chunk.streamSequenceNumber.get(), stream->streamId);
    }
    else
    {
        auto& chunks = stream->orderedChunks[chunk.streamSequenceNumber];
        auto it = std::find_if(chunks.begin(), chunks.end(), [tsn](const ReceivedChunk& c) {
            return diff(c.transmissionSequenceNumber, tsn) < 0;
        });
        chunks.insert(it, ReceivedChunk(chunk));
        _receiveQueueBytes += chunk.payloadSize();
    }

    if (diff(_highestReceivedTsn, tsn) > 0)
    {
        _highestReceivedTsn = tsn;
    }
    if (tsn == _peerLastTsn + 1)
    {
        _peerLastTsn = tsn;
        advancePeerLastTsn();
    }
    else
    {
        _receivedTsns.insert(tsn);
    }

    return chunk.isImmediateAck();
}

void SctpAssociationImpl::scheduleAck(bool immediate, const uint64_t timestamp)
{
    ++_packetsSinceAck;
    if (immediate || !_receivedTsns.empty() || _packetsSinceAck >= 2 || _state == State::SHUTDOWN_SENT ||
        _config.delayedAck == 0)
    {
        _ackPending = true;
        _ackTimer.stop();
    }
    else if (!_ackTimer.isRunning())
    {
        _ackTimer.start(timestamp, _config.delayedAck * utils::Time::ms);
    }
}

void SctpAssociationImpl::releaseReceiveBuffer(const size_t bytes, const uint64_t timestamp)
{
    const uint32_t windowBefore = getReceiveWindow();
    _receiveQueueBytes -= std::min(bytes, _receiveQueueBytes);

    // rfc4960 6.2, window update once a closed window has room for a full packet again
    if (windowBefore < _mtu && getReceiveWindow() >= _mtu && _state == State::ESTABLISHED)
    {
        _ackPending = true;
        processOutboundChunks(timestamp);
    }
}

uint32_t SctpAssociationImpl::getReceiveWindow() const
{
    if (_receiveQueueBytes >= _config.maxReceiveBufferSize)
    {
        return 0;
    }
    return static_cast<uint32_t>(_config.maxReceiveBufferSize - _receiveQueueBytes);
}

void SctpAssociationImpl::advancePeerLastTsn()
{
    while (!_receivedTsns.empty() && diff(*_receivedTsns.begin(), _peerLastTsn + 1) >= 0)
    {
        if (*_receivedTsns.begin() == _peerLastTsn + 1)
        {
            ++_peerLastTsn;
        }
        _receivedTsns.erase(_receivedTsns.begin());
    }
    retryResetRequests();
}

void SctpAssociationImpl::onForwardTsnReceived(const ForwardTsnChunk& chunk, const uint64_t timestamp)
{
    const uint32_t newCumulativeTsn = chunk.newCumulativeTsn;
    _ackPending = true;
    if (diff(newCumulativeTsn, _peerLastTsn) >= 0)
    {
        SCTP_LOG("old forward TSN %x", _loggableId.c_str(), newCumulativeTsn);
        return;
    }
    if (static_cast<uint32_t>(diff(_peerLastTsn, newCumulativeTsn)) > MAX_TSN_GAP)
    {
        logger::warn("forward TSN %x too far ahead of %x", _loggableId.c_str(), newCumulativeTsn, _peerLastTsn);
        return;
    }

    _peerLastTsn = newCumulativeTsn;
    if (diff(_highestReceivedTsn, newCumulativeTsn) > 0)
    {
        _highestReceivedTsn = newCumulativeTsn;
    }

    for (size_t i = 0; i < chunk.getStreamCount(); ++i)
    {
        const auto entry = chunk.getStream(i);
        auto* stream = getStream(entry.streamId);
        if (!stream)
        {
            if (entry.streamId >= _local.inboundStreamCount)
            {
                continue;
            }
            // all messages so far on this stream were abandoned
            stream = &createStream(entry.streamId);
        }

        const uint16_t lastSsn = entry.streamSequenceNumber;
        for (auto it = stream->orderedChunks.begin();
             it != stream->orderedChunks.end() && diff16(it->first, lastSsn) >= 0;)
        {
            if (isComplete(it->second))
            {
                emitMessage(stream->streamId, it->first, it->second);
            }
            else
            {
                for (auto& received : it->second)
                {
                    _receiveQueueBytes -= received.data.size();
                }
            }
            it = stream->orderedChunks.erase(it);
        }
        if (diff16(stream->inboundNextSsn, lastSsn) >= 0)
        {
            stream->inboundNextSsn = lastSsn + 1;
        }
    }

    for (auto& streamItem : _streams)
    {
        auto& chunks = streamItem.second.unorderedChunks;
        for (auto it = chunks.begin(); it != chunks.end();)
        {
            if (diff(it->transmissionSequenceNumber, newCumulativeTsn) >= 0)
            {
                _receiveQueueBytes -= it->data.size();
                it = chunks.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    advancePeerLastTsn();
}

bool SctpAssociationImpl::isComplete(const ChunkSet& chunks)
{
    if (chunks.empty() || !chunks.front().fragmentBegin || !chunks.back().fragmentEnd)
    {
        return false;
    }
    for (size_t i = 1; i < chunks.size(); ++i)
    {
        if (chunks[i].transmissionSequenceNumber != chunks[i - 1].transmissionSequenceNumber + 1 ||
            chunks[i].fragmentBegin || chunks[i - 1].fragmentEnd)
        {
            return false;
        }
    }
    return true;
}

void SctpAssociationImpl::emitMessage(uint16_t streamId, uint16_t ssn, const ChunkSet& chunks)
{
    InboundEvent event(InboundEvent::Message, streamId);
    event.ssn = ssn;
    event.payloadProtocol = chunks.front().payloadProtocol;
    size_t size = 0;
    for (auto& chunk : chunks)
    {
        size += chunk.data.size();
    }
    event.data.reserve(size);
    for (auto& chunk : chunks)
    {
        event.data.insert(event.data.end(), chunk.data.begin(), chunk.data.end());
    }

    ++_stats.messagesReceived;
    _stats.bytesReceived += size;
    _events.push_back(std::move(event));
}

void SctpAssociationImpl::collectMessages(Stream& stream)
{
    auto& unordered = stream.unorderedChunks;
    for (size_t i = 0; i < unordered.size();)
    {
        if (!unordered[i].fragmentBegin)
        {
            ++i;
            continue;
        }

        size_t end = i;
        bool complete = unordered[i].fragmentEnd;
        while (!complete && end + 1 < unordered.size() &&
            unordered[end + 1].transmissionSequenceNumber == unordered[end].transmissionSequenceNumber + 1 &&
            !unordered[end + 1].fragmentBegin)
        {
            ++end;
            complete = unordered[end].fragmentEnd;
        }

        if (complete)
        {
            ChunkSet message(std::make_move_iterator(unordered.begin() + i),
                std::make_move_iterator(unordered.begin() + end + 1));
            unordered.erase(unordered.begin() + i, unordered.begin() + end + 1);
            emitMessage(stream.streamId, message.front().streamSequenceNumber, message);
        }
        else
        {
            i = end + 1;
        }
    }

    for (auto it = stream.orderedChunks.find(stream.inboundNextSsn);
         it != stream.orderedChunks.end() && isComplete(it->second);
         it = stream.orderedChunks.find(stream.inboundNextSsn))
    {
        emitMessage(stream.streamId, it->first, it->second);
        stream.orderedChunks.erase(it);
        ++stream.inboundNextSsn;
    }
}

void SctpAssociationImpl::collectAllMessages()
{
    for (auto& streamItem : _streams)
    {
        collectMessages(streamItem.second);
    }
}

void SctpAssociationImpl::onReconfigReceived(const ReconfigChunk& chunk, const uint64_t timestamp)
{
    for (auto& param : chunk.params())
    {
        if (param.type == ChunkParameterType::SsnResetOutbound &&
            param.length >= OutgoingResetRequestParameter::HEADER_SIZE)
        {
            auto& request = reinterpret_cast<const OutgoingResetRequestParameter&>(param);
            const uint32_t requestSn = request.requestSequenceNumber;
            if (_incomingResetRequests.find(requestSn) == _incomingResetRequests.end())
            {
                if (_peerRequestSeen && diff(requestSn, _peerLastRequestSn) >= 0)
                {
                    // retransmission of a request we already performed
                    _pendingResponses.push_back(std::make_pair(requestSn, ReconfigResult::SuccessPerformed));
                    continue;
                }

                ResetRequest resetRequest;
                resetRequest.senderLastTsn = request.senderLastTsn;
                for (size_t i = 0; i < request.getStreamCount(); ++i)
                {
                    resetRequest.streams.push_back(request.getStream(i));
                }
                _incomingResetRequests[requestSn] = resetRequest;
                _peerLastRequestSn = requestSn;
                _peerRequestSeen = true;
            }

            auto requestIt = _incomingResetRequests.find(requestSn);
            const auto result = performInboundReset(requestIt->second);
            if (result != ReconfigResult::InProgress)
            {
                _incomingResetRequests.erase(requestIt);
            }
            _pendingResponses.push_back(std::make_pair(requestSn, result));
        }
        else if (param.type == ChunkParameterType::ReconfigResponse &&
            param.length >= ReconfigResponseParameter::HEADER_SIZE)
        {
            auto& response = reinterpret_cast<const ReconfigResponseParameter&>(param);
            auto requestIt = _outgoingResetRequests.find(response.responseSequenceNumber);
            if (requestIt == _outgoingResetRequests.end())
            {
                continue;
            }

            const auto result = response.getResult();
            if (result == ReconfigResult::InProgress)
            {
                SCTP_LOG("stream reset %u in progress", _loggableId.c_str(), response.responseSequenceNumber.get());
                continue;
            }
            if (result != ReconfigResult::SuccessPerformed && result != ReconfigResult::SuccessNothingToDo)
            {
                logger::warn("stream reset request %u failed, %s",
                    _loggableId.c_str(),
                    response.responseSequenceNumber.get(),
                    toString(result));
            }

            const auto streams = requestIt->second.streams;
            _outgoingResetRequests.erase(requestIt);
            for (auto streamId : streams)
            {
                onOutboundResetDone(streamId);
            }
            if (_outgoingResetRequests.empty())
            {
                _reconfigTimer.stop();
            }
        }
        else
        {
            logger::debug("unsupported reconfig parameter %u", _loggableId.c_str(), param.type.get());
        }
    }
}

void SctpAssociationImpl::retryResetRequests()
{
    for (auto it = _incomingResetRequests.begin(); it != _incomingResetRequests.end();)
    {
        const auto result = performInboundReset(it->second);
        if (result == ReconfigResult::InProgress)
        {
            ++it;
            continue;
        }
        _pendingResponses.push_back(std::make_pair(it->first, result));
        it = _incomingResetRequests.erase(it);
    }
}

// rfc6525 5.2.2. The peer resets its outgoing streams once we have all data up to senderLastTsn.
ReconfigResult SctpAssociationImpl::performInboundReset(const ResetRequest& request)
{
    if (diff(request.senderLastTsn, _peerLastTsn) < 0)
    {
        return ReconfigResult::InProgress;
    }

    std::vector<uint16_t> streamIds = request.streams;
    if (streamIds.empty())
    {
        for (auto& streamItem : _streams)
        {
            streamIds.push_back(streamItem.first);
        }
    }

    for (auto streamId : streamIds)
    {
        auto* stream = getStream(streamId);
        if (!stream)
        {
            continue;
        }

        collectMessages(*stream);
        for (auto& setItem : stream->orderedChunks)
        {
            for (auto& received : setItem.second)
            {
                _receiveQueueBytes -= received.data.size();
            }
        }
        for (auto& received : stream->unorderedChunks)
        {
            _receiveQueueBytes -= received.data.size();
        }
        stream->orderedChunks.clear();
        stream->unorderedChunks.clear();
        stream->inboundNextSsn = 0;
        stream->readClosed = true;
        _events.push_back(InboundEvent(InboundEvent::StreamReset, streamId));

        if (!stream->writeClosed && _peerSupportsReconfig && canSendData())
        {
            stream->writeClosed = true;
            OutboundChunk marker;
            marker.resetMarker = true;
            marker.streamId = streamId;
            _pendingChunks.push_back(std::move(marker));
        }
        else if (!stream->writeClosed)
        {
            stream->writeClosed = true;
            stream->writeResetDone = true;
        }
        eraseStreamIfClosed(streamId);
    }
    return ReconfigResult::SuccessPerformed;
}

void SctpAssociationImpl::onOutboundResetDone(uint16_t streamId)
{
    auto* stream = getStream(streamId);
    if (stream)
    {
        stream->nextSsn = 0;
        stream->writeResetDone = true;
        eraseStreamIfClosed(streamId);
    }
}

SctpAssociationImpl::Stream* SctpAssociationImpl::getStream(uint16_t streamId)
{
    auto it = _streams.find(streamId);
    return it == _streams.end() ? nullptr : &it->second;
}

const SctpAssociationImpl::Stream* SctpAssociationImpl::getStream(uint16_t streamId) const
{
    auto it = _streams.find(streamId);
    return it == _streams.end() ? nullptr : &it->second;
}

SctpAssociationImpl::Stream& SctpAssociationImpl::createStream(uint16_t streamId)
{
    auto result = _streams.emplace(streamId, Stream(streamId, ++_streamGeneration));
    return result.first->second;
}

void SctpAssociationImpl::eraseStreamIfClosed(uint16_t streamId)
{
    auto it = _streams.find(streamId);
    if (it != _streams.end() && it->second.readClosed && it->second.writeResetDone)
    {
        logger::debug("stream %u closed", _loggableId.c_str(), streamId);
        _streams.erase(it);
    }
}

bool SctpAssociationImpl::canSendData() const
{
    return _state == State::ESTABLISHED || _state == State::SHUTDOWN_PENDING || _state == State::SHUTDOWN_RECEIVED;
}

SctpAssociationImpl::OutboundChunk* SctpAssociationImpl::getInflight(uint32_t tsn)
{
    const uint32_t index = tsn - (_cumulativeAckPoint + 1);
    if (index >= _inflightChunks.size())
    {
        return nullptr;
    }
    return &_inflightChunks[index];
}

size_t SctpAssociationImpl::getBytesOutstanding() const
{
    size_t count = 0;
    for (auto& chunk : _inflightChunks)
    {
        if (!chunk.acked)
        {
            count += chunk.size();
        }
    }
    return count;
}

void SctpAssociationImpl::processOutboundChunks(const uint64_t timestamp)
{
    if (_state == State::CLOSED || _state == State::COOKIE_WAIT || _state == State::COOKIE_ECHOED)
    {
        return;
    }

    {
        OutboundPackets packets(_transport, _peer.tag, _local.port, _peer.port, _mtu, _stats);
        if (_ackPending)
        {
            writeSack(packets);
        }
        if (_sendForwardTsn)
        {
            writeForwardTsn(packets);
        }
        writeReconfigRequests(packets, false, timestamp);

        if (canSendData())
        {
            if (_fastRetransmitPending)
            {
                writeFastRetransmissions(packets, timestamp);
            }
            writeRetransmissions(packets, timestamp);
            writeNewData(packets, timestamp);

            if (!_unsentResetRequests.empty())
            {
                packets.flush();
                writeReconfigRequests(packets, false, timestamp);
            }
        }
    }

    if (!_inflightChunks.empty() && !_flow.retransmitTimer.isRunning())
    {
        _flow.retransmitTimer.start(timestamp, _rtt.getRto());
    }
    checkShutdownProgress(timestamp);
}

void SctpAssociationImpl::checkShutdownProgress(const uint64_t timestamp)
{
    if (!_pendingChunks.empty() || !_inflightChunks.empty())
    {
        return;
    }

    if (_state == State::SHUTDOWN_PENDING)
    {
        sendShutdown();
        _shutdown.retransmitCount = 0;
        _shutdown.timer.start(timestamp, _rtt.getRto());
        setState(State::SHUTDOWN_SENT);
    }
    else if (_state == State::SHUTDOWN_RECEIVED)
    {
        sendShutdownAck();
        _shutdown.retransmitCount = 0;
        _shutdown.timer.start(timestamp, _rtt.getRto());
        setState(State::SHUTDOWN_ACK_SENT);
    }
}

void SctpAssociationImpl::writeSack(OutboundPackets& packets)
{
    alignas(8) uint8_t sackArea[SCTP_MAX_PACKET_SIZE];
    SackBuilder sackBuilder(sackArea, _mtu - SctpPacketWriter::HEADER_SIZE);
    sackBuilder.ack.cumulativeTsnAck = _peerLastTsn;
    sackBuilder.ack.advertisedReceiverWindow = getReceiveWindow();

    if (!_receivedTsns.empty())
    {
        auto it = _receivedTsns.begin();
        uint32_t blockStart = *it;
        uint32_t nextTsn = blockStart + 1;
        bool full = false;
        for (++it; it != _receivedTsns.end() && !full; ++it)
        {
            if (*it != nextTsn)
            {
                full = !sackBuilder.addAck(blockStart, nextTsn);
                blockStart = *it;
            }
            nextTsn = *it + 1;
        }
        if (!full)
        {
            sackBuilder.addAck(blockStart, nextTsn);
        }
    }

    for (auto tsn : _duplicateTsns)
    {
        if (!sackBuilder.addDuplicate(tsn))
        {
            break;
        }
    }

    SCTP_LOG("ack up to %x", _loggableId.c_str(), _peerLastTsn);
    packets.reserve(sackBuilder.size());
    packets.packet().add(sackBuilder.ack);

    _duplicateTsns.clear();
    _ackPending = false;
    _packetsSinceAck = 0;
    _ackTimer.stop();
}

void SctpAssociationImpl::writeForwardTsn(OutboundPackets& packets)
{
    _sendForwardTsn = false;
    if (diff(_cumulativeAckPoint, _advancedPeerAckPoint) <= 0)
    {
        return;
    }

    // last SSN per ordered stream among the skipped chunks
    std::map<uint16_t, uint16_t> streamSsn;
    for (uint32_t tsn = _cumulativeAckPoint + 1; diff(tsn, _advancedPeerAckPoint) >= 0; ++tsn)
    {
        auto* chunk = getInflight(tsn);
        if (!chunk)
        {
            break;
        }
        if (!chunk->unordered)
        {
            streamSsn[chunk->streamId] = chunk->streamSequenceNumber;
        }
    }

    packets.reserve(ForwardTsnChunk::HEADER_SIZE + streamSsn.size() * sizeof(ForwardTsnChunk::StreamEntry));
    auto& forwardTsn = packets.packet().appendChunk<ForwardTsnChunk>(_advancedPeerAckPoint);
    for (auto& entry : streamSsn)
    {
        forwardTsn.addStream(entry.first, entry.second);
    }
    packets.packet().commitAppendedChunk();
    ++_stats.forwardTsnSent;
    SCTP_LOG("forward TSN %x", _loggableId.c_str(), _advancedPeerAckPoint);
}

void SctpAssociationImpl::writeReconfigRequests(OutboundPackets& packets, bool retransmitAll, uint64_t timestamp)
{
    for (auto& response : _pendingResponses)
    {
        packets.reserve(Chunk::BASE_HEADER_SIZE + ReconfigResponseParameter::HEADER_SIZE);
        auto& chunk = packets.packet().appendChunk<ReconfigChunk>();
        chunk.add(ReconfigResponseParameter(response.first, response.second));
        packets.packet().commitAppendedChunk();
    }
    _pendingResponses.clear();

    std::vector<uint32_t> requestSns;
    if (retransmitAll)
    {
        for (auto& request : _outgoingResetRequests)
        {
            requestSns.push_back(request.first);
        }
    }
    else
    {
        requestSns.swap(_unsentResetRequests);
    }

    for (auto requestSn : requestSns)
    {
        auto it = _outgoingResetRequests.find(requestSn);
        if (it == _outgoingResetRequests.end())
        {
            continue;
        }

        const auto& request = it->second;
        packets.reserve(Chunk::BASE_HEADER_SIZE + OutgoingResetRequestParameter::HEADER_SIZE +
            request.streams.size() * sizeof(uint16_t) + 2);
        auto& chunk = packets.packet().appendChunk<ReconfigChunk>();
        auto& param = appendParameter<OutgoingResetRequestParameter>(chunk,
            requestSn,
            _peerLastRequestSn,
            request.senderLastTsn);
        for (auto streamId : request.streams)
        {
            param.addStream(streamId);
        }
        chunk.commitAppendedParameter();
        packets.packet().commitAppendedChunk();
    }

    if (!_outgoingResetRequests.empty() && !_reconfigTimer.isRunning())
    {
        _reconfigTimer.start(timestamp, _rtt.getRto());
    }
}

void SctpAssociationImpl::writeFastRetransmissions(OutboundPackets& packets, const uint64_t timestamp)
{
    _fastRetransmitPending = false;
    size_t packetBytes = SctpPacketWriter::HEADER_SIZE;
    for (auto& chunk : _inflightChunks)
    {
        if (chunk.acked || chunk.abandoned || chunk.transmitCount > 1 || chunk.missIndicator < 3)
        {
            continue;
        }
        if (packetBytes + chunk.fullSize() > _mtu)
        {
            break;
        }

        packetBytes += chunk.fullSize();
        packets.reserve(chunk.fullSize());
        appendPayloadData(packets.packet(), chunk);
        chunk.lastSent = timestamp;
        chunk.retransmit = false;
        ++chunk.transmitCount;
        ++_stats.retransmits;
        ++_stats.fastRetransmits;
        logger::debug("fast retransmit %x", _loggableId.c_str(), chunk.transmissionSequenceNumber);
        checkPartialReliability(chunk, timestamp);
    }
}

void SctpAssociationImpl::writeRetransmissions(OutboundPackets& packets, const uint64_t timestamp)
{
    const size_t window = std::min(_flow.congestionWindow, _peer.advertisedReceiveWindow);
    size_t bytesSent = 0;
    for (size_t i = 0; i < _inflightChunks.size(); ++i)
    {
        auto& chunk = _inflightChunks[i];
        if (!chunk.retransmit)
        {
            continue;
        }
        if (chunk.acked || chunk.abandoned)
        {
            chunk.retransmit = false;
            continue;
        }

        bool zeroWindowProbe = false;
        if (i == 0 && _peer.advertisedReceiveWindow < chunk.size())
        {
            zeroWindowProbe = true;
        }
        else if (bytesSent + chunk.size() > window)
        {
            break;
        }

        packets.reserve(chunk.fullSize());
        appendPayloadData(packets.packet(), chunk);
        bytesSent += chunk.size();
        chunk.retransmit = false;
        chunk.lastSent = timestamp;
        ++chunk.transmitCount;
        ++_stats.retransmits;
        SCTP_LOG("retransmitted chunk %x, %u", _loggableId.c_str(), chunk.transmissionSequenceNumber, chunk.transmitCount);
        checkPartialReliability(chunk, timestamp);
        if (zeroWindowProbe)
        {
            break;
        }
    }
}

void SctpAssociationImpl::writeNewData(OutboundPackets& packets, const uint64_t timestamp)
{
    bool dataSent = false;
    while (!_pendingChunks.empty())
    {
        if (_pendingChunks.front().resetMarker)
        {
            ResetRequest request;
            request.senderLastTsn = _nextTsn - 1;
            while (!_pendingChunks.empty() && _pendingChunks.front().resetMarker)
            {
                request.streams.push_back(_pendingChunks.front().streamId);
                _pendingChunks.pop_front();
            }
            const auto requestSn = _nextRequestSn++;
            _outgoingResetRequests[requestSn] = request;
            _unsentResetRequests.push_back(requestSn);
            continue;
        }

        auto& pending = _pendingChunks.front();
        const bool zeroWindowProbe = !dataSent && _inflightChunks.empty();
        if (!zeroWindowProbe &&
            (getBytesOutstanding() + pending.size() > _flow.congestionWindow ||
                pending.size() > _peer.advertisedReceiveWindow))
        {
            break;
        }

        _inflightChunks.push_back(std::move(pending));
        _pendingChunks.pop_front();

        auto& chunk = _inflightChunks.back();
        chunk.transmissionSequenceNumber = _nextTsn++;
        chunk.firstSent = timestamp;
        chunk.lastSent = timestamp;
        chunk.transmitCount = 1;
        _peer.advertisedReceiveWindow -= std::min(_peer.advertisedReceiveWindow, static_cast<uint32_t>(chunk.size()));

        packets.reserve(chunk.fullSize());
        appendPayloadData(packets.packet(), chunk);
        dataSent = true;
        checkPartialReliability(chunk, timestamp);
    }
}

// rfc3758 3.5 A1. Returns true if the chunk is abandoned.
bool SctpAssociationImpl::checkPartialReliability(OutboundChunk& chunk, const uint64_t timestamp)
{
    if (!_useForwardTsn || chunk.abandoned || chunk.payloadProtocol == DCEP_PPID)
    {
        return chunk.abandoned;
    }

    auto* stream = getStream(chunk.streamId);
    if (!stream)
    {
        return false;
    }

    bool abandon = false;
    if (stream->reliability == Reliability::PartialReliableRexmit)
    {
        abandon = chunk.transmitCount > stream->reliabilityValue;
    }
    else if (stream->reliability == Reliability::PartialReliableTimed)
    {
        abandon = utils::Time::diffGT(chunk.firstSent, timestamp, stream->reliabilityValue * utils::Time::ms);
    }

    if (abandon)
    {
        abandonMessage(chunk.messageId);
    }
    return abandon;
}

// all fragments of a message are abandoned together
void SctpAssociationImpl::abandonMessage(uint64_t messageId)
{
    for (auto& chunk : _inflightChunks)
    {
        if (chunk.messageId == messageId && !chunk.abandoned)
        {
            chunk.abandoned = true;
            chunk.retransmit = false;
            ++_stats.abandonedChunks;
        }
    }

    for (auto it = _pendingChunks.begin(); it != _pendingChunks.end();)
    {
        if (it->messageId == messageId && !it->resetMarker)
        {
            ++_stats.abandonedChunks;
            onOutboundChunkDone(*it);
            it = _pendingChunks.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

// rfc3758 3.5 C1-C3
void SctpAssociationImpl::advanceForwardTsnPoint()
{
    if (!_useForwardTsn)
    {
        return;
    }

    if (diff(_advancedPeerAckPoint, _cumulativeAckPoint) > 0)
    {
        _advancedPeerAckPoint = _cumulativeAckPoint;
    }

    for (auto* chunk = getInflight(_advancedPeerAckPoint + 1); chunk && chunk->abandoned;
         chunk = getInflight(_advancedPeerAckPoint + 1))
    {
        ++_advancedPeerAckPoint;
    }

    if (diff(_cumulativeAckPoint, _advancedPeerAckPoint) > 0)
    {
        _sendForwardTsn = true;
    }
}

void SctpAssociationImpl::onOutboundChunkDone(OutboundChunk& chunk)
{
    if (chunk.resetMarker)
    {
        return;
    }
    auto* stream = getStream(chunk.streamId);
    if (!stream)
    {
        return;
    }

    const auto before = stream->bufferedAmount;
    stream->bufferedAmount -= std::min(stream->bufferedAmount, chunk.size());
    if (before > stream->bufferedAmountLowThreshold && stream->bufferedAmount <= stream->bufferedAmountLowThreshold)
    {
        _events.push_back(InboundEvent(InboundEvent::BufferedAmountLow, chunk.streamId));
    }
}

void SctpAssociationImpl::measureRtt(const OutboundChunk& chunk, const uint64_t timestamp)
{
    // Karn's algorithm. One measurement per round trip.
    if (chunk.transmitCount == 1 && diff(_minTsnToMeasureRtt, chunk.transmissionSequenceNumber) >= 0)
    {
        _rtt.update(timestamp - chunk.firstSent);
        _minTsnToMeasureRtt = _nextTsn;
    }
}

uint32_t SctpAssociationImpl::popAckedChunks(uint32_t cumulativeAck, const uint64_t timestamp)
{
    uint32_t bytesAcked = 0;
    while (!_inflightChunks.empty() && diff(_inflightChunks.front().transmissionSequenceNumber, cumulativeAck) >= 0)
    {
        auto& chunk = _inflightChunks.front();
        if (!chunk.acked)
        {
            bytesAcked += chunk.size();
            measureRtt(chunk, timestamp);
        }
        onOutboundChunkDone(chunk);
        _inflightChunks.pop_front();
    }

    if (diff(_cumulativeAckPoint, cumulativeAck) > 0)
    {
        _cumulativeAckPoint = cumulativeAck;
        _retransmitCount = 0;
    }
    if (diff(_advancedPeerAckPoint, _cumulativeAckPoint) > 0)
    {
        _advancedPeerAckPoint = _cumulativeAckPoint;
    }
    return bytesAcked;
}

void SctpAssociationImpl::onSackReceived(const SelectiveAckChunk& ackChunk, const uint64_t timestamp)
{
    if (!canSendData() && _state != State::SHUTDOWN_SENT && _state != State::SHUTDOWN_ACK_SENT)
    {
        return;
    }

    const uint32_t cumulativeAck = ackChunk.cumulativeTsnAck;
    if (diff(_cumulativeAckPoint, cumulativeAck) < 0)
    {
        SCTP_LOG("received old ack %x", _loggableId.c_str(), cumulativeAck);
        return;
    }
    if (diff(cumulativeAck, _nextTsn - 1) < 0)
    {
        logger::warn("SACK for unsent TSN %x, next %x", _loggableId.c_str(), cumulativeAck, _nextTsn);
        return;
    }

    const bool cumulativeAckAdvanced = (cumulativeAck != _cumulativeAckPoint);
    uint32_t bytesAcked = popAckedChunks(cumulativeAck, timestamp);

    uint32_t highestNewlyAcked = cumulativeAck;
    for (int i = 0; i < ackChunk.gapAckBlockCount.get(); ++i)
    {
        const auto block = ackChunk.getAck(i);
        for (uint32_t tsn = block.start; diff(tsn, block.end) >= 0; ++tsn)
        {
            auto* chunk = getInflight(tsn);
            if (!chunk)
            {
                break;
            }
            if (!chunk->acked)
            {
                chunk->acked = true;
                chunk->retransmit = false;
                bytesAcked += chunk->size();
                measureRtt(*chunk, timestamp);
                if (diff(highestNewlyAcked, tsn) > 0)
                {
                    highestNewlyAcked = tsn;
                }
            }
        }
    }

    if (_flow.inFastRecovery && diff(_flow.fastRecoveryExitPoint, cumulativeAck) >= 0)
    {
        logger::debug("exit fast recovery", _loggableId.c_str());
        _flow.inFastRecovery = false;
    }

    const uint32_t advertisedWindow = ackChunk.advertisedReceiverWindow;
    const auto outstanding = getBytesOutstanding();
    _peer.advertisedReceiveWindow = advertisedWindow > outstanding ? advertisedWindow - outstanding : 0;

    if (cumulativeAckAdvanced)
    {
        _flow.onCumulativeAckAdvanced(_mtu, bytesAcked, !_pendingChunks.empty());
        _flow.retransmitTimer.stop();
    }

    // rfc4960 7.2.4 HTNA
    if (!_flow.inFastRecovery || cumulativeAckAdvanced)
    {
        const uint32_t maxTsn = _flow.inFastRecovery ? _nextTsn : highestNewlyAcked;
        for (uint32_t tsn = _cumulativeAckPoint + 1; diff(tsn, maxTsn) > 0; ++tsn)
        {
            auto* chunk = getInflight(tsn);
            if (!chunk)
            {
                break;
            }
            if (!chunk->acked && !chunk->abandoned && chunk->missIndicator < 3)
            {
                ++chunk->missIndicator;
                if (chunk->missIndicator == 3 && !_flow.inFastRecovery)
                {
                    logger::debug("entering fast recovery at %x", _loggableId.c_str(), tsn);
                    _flow.onFastRetransmit(_mtu, highestNewlyAcked);
                    _fastRetransmitPending = true;
                }
            }
        }
    }
    if (_flow.inFastRecovery && cumulativeAckAdvanced)
    {
        _fastRetransmitPending = true;
    }

    if (!_inflightChunks.empty())
    {
        if (!_flow.retransmitTimer.isRunning())
        {
            _flow.retransmitTimer.start(timestamp, _rtt.getRto());
        }
    }
    else
    {
        _flow.retransmitTimer.stop();
    }

    advanceForwardTsnPoint();
    SCTP_LOG("sack %x rwnd %u cwnd %u inflight %zu",
        _loggableId.c_str(),
        cumulativeAck,
        _peer.advertisedReceiveWindow,
        _flow.congestionWindow,
        _inflightChunks.size());
}

void SctpAssociationImpl::onRetransmitTimeout(const uint64_t timestamp)
{
    if (_inflightChunks.empty() || !canSendData())
    {
        _flow.retransmitTimer.stop();
        return;
    }

    ++_stats.t3Timeouts;
    if (++_retransmitCount > _config.flow.maxRetransmits)
    {
        logger::warn("max retransmits reached %d", _loggableId.c_str(), _retransmitCount);
        sendAbort(ErrorCause::ProtocolError, "retransmit limit");
        close(CloseReason::RetransmitLimit);
        return;
    }

    logger::debug("retransmit timer expired %" PRIu64 "ms", _loggableId.c_str(), _rtt.getRto() / utils::Time::ms);
    _flow.onTransmitTimeout(_mtu);
    for (auto& chunk : _inflightChunks)
    {
        if (!chunk.acked && !chunk.abandoned)
        {
            chunk.retransmit = !checkPartialReliability(chunk, timestamp);
        }
    }
    advanceForwardTsnPoint();

    _rtt.backOff();
    _flow.retransmitTimer.start(timestamp, _rtt.getRto());
    processOutboundChunks(timestamp);
}

std::unique_ptr<SctpAssociation> createSctpAssociation(size_t logId,
    SctpServerPort& transport,
    uint16_t remotePort,
    SctpAssociation::IEvents* listener,
    const SctpConfig& config)
{
    return std::make_unique<SctpAssociationImpl>(logId, transport, remotePort, listener, config);
}

std::unique_ptr<SctpAssociation> createSctpAssociation(size_t logId,
    SctpServerPort& transport,
    const SctpPacket& cookieEcho,
    SctpAssociation::IEvents* listener,
    const SctpConfig& config)
{
    return std::make_unique<SctpAssociationImpl>(logId, transport, cookieEcho, listener, config);
}
} // namespace sctp
