#include "transport/sctp/SctpCookie.h"
#include <gtest/gtest.h>

namespace
{
sctp::SctpCookie makeCookie()
{
    sctp::SctpCookie cookie;
    cookie.createdAt = uint64_t(1000000);
    cookie.localTag = 0x11223344u;
    cookie.peerTag = 0x55667788u;
    cookie.localTsn = 100u;
    cookie.peerTsn = 2000u;
    cookie.peerReceiveWindow = 65536u;
    cookie.inboundStreams = uint16_t(16);
    cookie.outboundStreams = uint16_t(16);
    cookie.features = sctp::SctpCookie::FORWARD_TSN;
    return cookie;
}
} // namespace

TEST(SctpCookieTest, signedCookieVerifies)
{
    utils::MersienneRandom<uint32_t> random(7);
    sctp::CookieKeyRing keys(random);
    keys.rotate();

    auto cookie = makeCookie();
    keys.sign(cookie, 5000);
    EXPECT_TRUE(keys.verify(cookie, 5000));
    EXPECT_FALSE(keys.verify(cookie, 5001));
    EXPECT_TRUE(cookie.has(sctp::SctpCookie::FORWARD_TSN));
    EXPECT_FALSE(cookie.has(sctp::SctpCookie::RECONFIG));
}

TEST(SctpCookieTest, tamperedFieldFailsVerification)
{
    utils::MersienneRandom<uint32_t> random(7);
    sctp::CookieKeyRing keys(random);
    keys.rotate();

    auto cookie = makeCookie();
    keys.sign(cookie, 5000);
    cookie.inboundStreams = uint16_t(1024);
    EXPECT_FALSE(keys.verify(cookie, 5000));

    auto flagged = makeCookie();
    keys.sign(flagged, 5000);
    flagged.features |= sctp::SctpCookie::RECONFIG;
    EXPECT_FALSE(keys.verify(flagged, 5000));
}

TEST(SctpCookieTest, previousKeyIsAcceptedForOneRotation)
{
    utils::MersienneRandom<uint32_t> random(7);
    sctp::CookieKeyRing keys(random);
    keys.rotate();

    auto cookie = makeCookie();
    keys.sign(cookie, 5000);

    keys.rotate();
    EXPECT_TRUE(keys.verify(cookie, 5000));
    keys.rotate();
    EXPECT_FALSE(keys.verify(cookie, 5000));
}
