#include "transport/sctp/SctpCookie.h"
#include "crypto/SslHelper.h"
#include "transport/sctp/Sctprotocol.h"
#include <algorithm>
#include <cstring>

namespace sctp
{

SctpCookie::SctpCookie() : features(0)
{
    std::memset(padding, 0, sizeof(padding));
    std::memset(mac, 0, sizeof(mac));
}

SctpCookie::SctpCookie(uint64_t createdAt_,
    uint32_t localTag_,
    uint32_t localTsn_,
    uint16_t maxInboundStreams,
    uint16_t maxOutboundStreams,
    const InitChunk& peerInit)
    : SctpCookie()
{
    createdAt = createdAt_;
    localTag = localTag_;
    peerTag = peerInit.initTag.get();
    localTsn = localTsn_;
    peerTsn = peerInit.initTSN.get();
    peerReceiveWindow = peerInit.advertisedReceiverWindow.get();
    inboundStreams = std::min(maxInboundStreams, peerInit.outboundStreams.get());
    outboundStreams = std::min(maxOutboundStreams, peerInit.inboundStreams.get());
    if (peerInit.supportsForwardTsn())
    {
        features |= FORWARD_TSN;
    }
    if (peerInit.supportsReconfig())
    {
        features |= RECONFIG;
    }
}

CookieKeyRing::CookieKeyRing(utils::MersienneRandom<uint32_t>& fallbackRandom) : _fallbackRandom(fallbackRandom)
{
    std::memset(_current, 0, sizeof(_current));
    std::memset(_previous, 0, sizeof(_previous));
}

bool CookieKeyRing::rotate()
{
    std::memcpy(_previous, _current, KEY_SIZE);
    if (crypto::randomBytes(_current, KEY_SIZE))
    {
        return true;
    }

    for (size_t i = 0; i < KEY_SIZE; i += sizeof(uint32_t))
    {
        const uint32_t word = _fallbackRandom.next();
        std::memcpy(_current + i, &word, sizeof(word));
    }
    return false;
}

void CookieKeyRing::computeMac(const uint8_t* key, const SctpCookie& cookie, uint16_t peerPort, uint8_t* macOut)
{
    crypto::HMAC signer(key, KEY_SIZE);
    signer.add(&cookie, static_cast<int>(offsetof(SctpCookie, mac)));
    signer.add(peerPort);
    signer.compute(macOut);
}

void CookieKeyRing::sign(SctpCookie& cookie, uint16_t peerPort) const
{
    computeMac(_current, cookie, peerPort, cookie.mac);
}

bool CookieKeyRing::verify(const SctpCookie& cookie, uint16_t peerPort) const
{
    uint8_t expected[SctpCookie::MAC_SIZE];
    computeMac(_current, cookie, peerPort, expected);
    if (crypto::constantTimeEquals(expected, cookie.mac, SctpCookie::MAC_SIZE))
    {
        return true;
    }
    computeMac(_previous, cookie, peerPort, expected);
    return crypto::constantTimeEquals(expected, cookie.mac, SctpCookie::MAC_SIZE);
}

} // namespace sctp
