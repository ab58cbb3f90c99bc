#include "transport/sctp/SctpServerPort.h"
#include "transport/sctp/SctpConfig.h"
#include "transport/sctp/Sctprotocol.h"
#include "utils/Time.h"
#include <cinttypes>
#include <cstring>

namespace sctp
{

SctpServerPort::SctpServerPort(size_t logId,
    DatagramTransport* transport,
    IEvents* listener,
    uint16_t localPort,
    const SctpConfig& config,
    uint64_t timestamp)
    : _loggableId("SctpPort", logId),
      _config(config),
      _localPort(localPort),
      _transport(transport),
      _listener(listener),
      _keys(_random),
      _keyRotationTime(timestamp + _config.cookieLifeTime * utils::Time::ms),
      _initialTsn(0),
      _fixedInitialTsn(false)
{
    // both slots hold fresh keys from the start
    for (int i = 0; i < 2; ++i)
    {
        if (!_keys.rotate())
        {
            logger::warn("OS random unavailable, cookie key from fallback generator", _loggableId.c_str());
        }
    }
}

void SctpServerPort::maybeRotateKeys(uint64_t timestamp)
{
    if (!utils::Time::diffGE(_keyRotationTime, timestamp, 0))
    {
        return;
    }

    if (!_keys.rotate())
    {
        logger::warn("OS random unavailable, cookie key from fallback generator", _loggableId.c_str());
    }
    _keyRotationTime = timestamp + _config.cookieLifeTime * utils::Time::ms;
}

uint32_t SctpServerPort::generateTag()
{
    for (;;)
    {
        const uint32_t tag = _random.next();
        if (tag != 0)
        {
            return tag;
        }
    }
}

uint32_t SctpServerPort::generateInitialTsn()
{
    return _fixedInitialTsn ? _initialTsn : _random.next();
}

void SctpServerPort::send(SctpPacketWriter& packet)
{
    packet.commitCheckSum();
    if (!_transport->sendSctpPacket(packet.get(), packet.size()))
    {
        logger::debug("send failed, %zu bytes", _loggableId.c_str(), packet.size());
    }
}

void SctpServerPort::appendInitAckParameters(InitAckChunk& initAck, const SctpCookie& cookie)
{
    initAck.add(CookieParameter<SctpCookie>(cookie));
    initAck.add(ChunkParameter(ForwardTsnSupport));
    auto& extensions = appendParameter<SupportedExtensionsParameter>(initAck);
    extensions.add(ChunkType::FORWARDTSN);
    extensions.add(ChunkType::RE_CONFIG);
    initAck.commitAppendedParameter();
}

void SctpServerPort::onPacketReceived(const void* data, size_t length, uint64_t timestamp)
{
    maybeRotateKeys(timestamp);

    SctpPacket packet(data, length);
    if (!packet.isValid())
    {
        logger::warn("malformed SCTP packet, %zu bytes", _loggableId.c_str(), length);
        return;
    }

    const auto& header = packet.getHeader();
    if (header.destinationPort.get() != _localPort)
    {
        logger::warn("packet for port %u, expected %u",
            _loggableId.c_str(),
            header.destinationPort.get(),
            _localPort);
        return;
    }

    if (packet.getChunk(ChunkType::INIT))
    {
        onInit(packet, timestamp);
        return;
    }
    if (packet.getChunk(ChunkType::COOKIE_ECHO))
    {
        onCookieEcho(packet, timestamp);
        return;
    }
    _listener->onSctpReceived(this, header.sourcePort.get(), packet, timestamp);
}

void SctpServerPort::onInit(const SctpPacket& packet, uint64_t timestamp)
{
    const uint16_t peerPort = packet.getHeader().sourcePort.get();
    const auto* init = packet.getChunk<InitChunk>(ChunkType::INIT);
    if (!init || init->header.length < InitChunk::HEADER_SIZE || init->initTag == 0)
    {
        logger::warn("invalid INIT from port %u", _loggableId.c_str(), peerPort);
        return;
    }

    const auto decision = _listener->onSctpInitReceived(this, peerPort, packet, timestamp);
    if (!decision.accept)
    {
        logger::info("INIT from port %u not accepted", _loggableId.c_str(), peerPort);
        return;
    }
    if (decision.inboundStreams == 0 || decision.outboundStreams == 0)
    {
        logger::warn("INIT rejected, stream limits %u/%u",
            _loggableId.c_str(),
            decision.inboundStreams,
            decision.outboundStreams);
        return;
    }

    const uint32_t localTag = generateTag();
    SctpCookie cookie(timestamp, localTag, generateInitialTsn(), decision.inboundStreams, decision.outboundStreams, *init);
    _keys.sign(cookie, peerPort);

    SctpPacketWriter response(init->initTag, _localPort, peerPort);
    auto& initAck = response.appendChunk<InitAckChunk>();
    initAck.initTag = localTag;
    initAck.initTSN = cookie.localTsn.get();
    initAck.advertisedReceiverWindow = _config.maxReceiveBufferSize;
    initAck.inboundStreams = cookie.inboundStreams.get();
    initAck.outboundStreams = cookie.outboundStreams.get();
    appendInitAckParameters(initAck, cookie);
    reportUnknownParameters(packet, initAck);
    response.commitAppendedChunk();

    logger::debug("INIT-ACK to port %u", _loggableId.c_str(), peerPort);
    send(response);
}

// RFC 4960 3.2.1, the two high bits of an unknown parameter type select skip or stop and report
void SctpServerPort::reportUnknownParameters(const SctpPacket& packet, InitAckChunk& initAck)
{
    const auto* init = packet.getChunk<InitChunk>(ChunkType::INIT);
    for (auto& param : init->params())
    {
        if (isKnownInitParameter(param.type))
        {
            continue;
        }

        const auto action = getUnrecognizedParameterAction(param.type);
        const size_t reportSize = ChunkParameter::HEADER_SIZE + param.size();
        if (shouldReport(action) && initAck.size() + reportSize + SctpPacketWriter::HEADER_SIZE <= _config.mtu)
        {
            auto& report = appendParameter<ChunkParameter>(initAck, ChunkParameterType::UnrecognizedParameter);
            std::memcpy(report.data(), &param, param.length);
            report.length = ChunkParameter::HEADER_SIZE + param.length;
            initAck.commitAppendedParameter();
        }
        if (action == UnrecognizedAction::Stop || action == UnrecognizedAction::StopAndReport)
        {
            return;
        }
    }
}

void SctpServerPort::onCookieEcho(const SctpPacket& packet, uint64_t timestamp)
{
    const auto& header = packet.getHeader();
    const uint16_t peerPort = header.sourcePort.get();
    const auto* echo = packet.getChunk<CookieEchoChunk>(ChunkType::COOKIE_ECHO);
    if (!echo)
    {
        return;
    }
    if (echo->cookieSize() != sizeof(SctpCookie))
    {
        logger::warn("COOKIE-ECHO with %zu byte cookie", _loggableId.c_str(), echo->cookieSize());
        return;
    }

    const auto cookie = echo->getCookie<SctpCookie>();
    if (header.verificationTag.get() != cookie.localTag.get())
    {
        logger::warn("COOKIE-ECHO verification tag mismatch", _loggableId.c_str());
        return;
    }

    const uint64_t lifeTime = _config.cookieLifeTime * utils::Time::ms;
    if (utils::Time::diffGT(cookie.createdAt.get(), timestamp, lifeTime))
    {
        logger::warn("stale cookie, age %" PRId64 "ms",
            _loggableId.c_str(),
            utils::Time::diff(cookie.createdAt.get(), timestamp) / static_cast<int64_t>(utils::Time::ms));
        return;
    }
    if (!_keys.verify(cookie, peerPort))
    {
        logger::warn("cookie signature invalid, port %u", _loggableId.c_str(), peerPort);
        return;
    }

    _listener->onSctpCookieEchoReceived(this, peerPort, packet, timestamp);
}

} // namespace sctp
