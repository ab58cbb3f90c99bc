#pragma once

#include "logger/Logger.h"
#include "transport/sctp/SctpCookie.h"
#include "utils/MersienneRandom.h"
#include <cstddef>
#include <cstdint>

namespace sctp
{
struct SctpConfig;
class SctpPacket;
class SctpPacketWriter;
class InitAckChunk;

class DatagramTransport
{
public:
    virtual ~DatagramTransport() = default;
    virtual bool sendSctpPacket(const void* data, size_t length) = 0;
};

/**
 * Local SCTP port. Packets the owner cannot route to an association land here.
 * An INIT is answered statelessly with an INIT-ACK carrying a signed cookie. A COOKIE-ECHO that
 * verifies is passed to the owner, which creates the association from it.
 * Associations send all their packets through the port.
 * Timestamps are in nanoseconds.
 */
class SctpServerPort
{
public:
    struct InitDecision
    {
        bool accept;
        uint16_t inboundStreams;
        uint16_t outboundStreams;
    };

    class IEvents
    {
    public:
        virtual ~IEvents() = default;

        virtual InitDecision onSctpInitReceived(SctpServerPort* port,
            uint16_t srcPort,
            const SctpPacket& packet,
            uint64_t timestamp) = 0;

        // the cookie in packet has been verified
        virtual void onSctpCookieEchoReceived(SctpServerPort* port,
            uint16_t srcPort,
            const SctpPacket& packet,
            uint64_t timestamp) = 0;

        virtual void onSctpReceived(SctpServerPort* port,
            uint16_t srcPort,
            const SctpPacket& packet,
            uint64_t timestamp) = 0;
    };

    SctpServerPort(size_t logId,
        DatagramTransport* transport,
        IEvents* listener,
        uint16_t localPort,
        const SctpConfig& config,
        uint64_t timestamp);

    void onPacketReceived(const void* data, size_t length, uint64_t timestamp);
    void send(SctpPacketWriter& packet);

    uint16_t getPort() const { return _localPort; }
    const SctpConfig& getConfig() const { return _config; }

    // random non zero
    uint32_t generateTag();
    uint32_t generateInitialTsn();
    // associations created on this port start at this TSN instead of a random one
    void setInitialTsn(uint32_t tsn)
    {
        _initialTsn = tsn;
        _fixedInitialTsn = true;
    }

    void signCookie(SctpCookie& cookie, uint16_t peerPort) const { _keys.sign(cookie, peerPort); }
    bool verifyCookie(const SctpCookie& cookie, uint16_t peerPort) const { return _keys.verify(cookie, peerPort); }

    // Cookie parameter plus the FORWARD-TSN and RE-CONFIG extensions we support.
    static void appendInitAckParameters(InitAckChunk& initAck, const SctpCookie& cookie);

private:
    void maybeRotateKeys(uint64_t timestamp);
    void onInit(const SctpPacket& packet, uint64_t timestamp);
    void onCookieEcho(const SctpPacket& packet, uint64_t timestamp);
    void reportUnknownParameters(const SctpPacket& packet, InitAckChunk& initAck);

    logger::LoggableId _loggableId;
    const SctpConfig& _config;
    const uint16_t _localPort;
    DatagramTransport* _transport;
    IEvents* _listener;
    utils::MersienneRandom<uint32_t> _random;
    CookieKeyRing _keys;
    uint64_t _keyRotationTime;
    uint32_t _initialTsn;
    bool _fixedInitialTsn;
};

} // namespace sctp
