#pragma once

#include "utils/ByteOrder.h"
#include "utils/MersienneRandom.h"
#include <cstddef>
#include <cstdint>

namespace sctp
{
class InitChunk;

// Association parameters handed to the peer in INIT-ACK and echoed back in COOKIE-ECHO.
// Fixed layout in network order, copied in and out of chunks with memcpy.
struct SctpCookie
{
    enum Feature : uint8_t
    {
        FORWARD_TSN = 1,
        RECONFIG = 2
    };

    static constexpr size_t MAC_SIZE = 20;

    SctpCookie();
    // Stream counts are the minimum of the local limits and what the INIT offers.
    SctpCookie(uint64_t createdAt,
        uint32_t localTag,
        uint32_t localTsn,
        uint16_t maxInboundStreams,
        uint16_t maxOutboundStreams,
        const InitChunk& peerInit);

    bool has(Feature feature) const { return (features & feature) != 0; }

    nwuint64_t createdAt;
    nwuint32_t localTag;
    nwuint32_t peerTag;
    nwuint32_t localTsn;
    nwuint32_t peerTsn;
    nwuint32_t peerReceiveWindow;
    nwuint16_t inboundStreams;
    nwuint16_t outboundStreams;
    uint8_t features;
    uint8_t padding[3];
    uint8_t mac[MAC_SIZE];
};

static_assert(sizeof(SctpCookie) == 56, "SctpCookie layout must be packed");

// Current and previous HMAC key for cookie signing. A cookie signed with the previous key is
// accepted until the next rotation.
class CookieKeyRing
{
public:
    static constexpr size_t KEY_SIZE = 20;

    explicit CookieKeyRing(utils::MersienneRandom<uint32_t>& fallbackRandom);

    // false if the OS random source failed and the fallback generator was used
    bool rotate();

    void sign(SctpCookie& cookie, uint16_t peerPort) const;
    bool verify(const SctpCookie& cookie, uint16_t peerPort) const;

private:
    static void computeMac(const uint8_t* key, const SctpCookie& cookie, uint16_t peerPort, uint8_t* macOut);

    utils::MersienneRandom<uint32_t>& _fallbackRandom;
    uint8_t _current[KEY_SIZE];
    uint8_t _previous[KEY_SIZE];
};

} // namespace sctp
