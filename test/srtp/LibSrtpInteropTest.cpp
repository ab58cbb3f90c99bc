#include "memory/Packet.h"
#include "rtp/RtpHeader.h"
#include "transport/srtp/SrtpContext.h"
#include <cstring>
#include <gtest/gtest.h>
#include <memory>
#include <srtp2/srtp.h>

// Cross checks SrtpContext against libsrtp. Built only when pkg-config finds libsrtp2.

namespace
{
srtp::AesKey makeKey(srtp::Profile profile, uint8_t seed)
{
    srtp::AesKey key;
    key.profile = profile;
    for (uint32_t i = 0; i < key.getLength(); ++i)
    {
        key.keySalt[i] = static_cast<uint8_t>(seed * 13 + i);
    }
    return key;
}

void makeRtp(memory::Packet& packet, uint32_t ssrc, uint16_t sequenceNumber)
{
    auto header = rtp::RtpHeader::create(packet.get(), memory::Packet::size);
    header->ssrc = ssrc;
    header->sequenceNumber = sequenceNumber;
    header->timestamp = 90000u + sequenceNumber * 3000u;
    header->payloadType = 111;
    auto* payload = header->getPayload();
    for (size_t i = 0; i < 160; ++i)
    {
        payload[i] = static_cast<uint8_t>(i * 3 + sequenceNumber);
    }
    packet.setLength(header->headerLength() + 160);
}

void makeReceiverReport(memory::Packet& packet, uint32_t ssrc)
{
    const uint8_t report[] = {0x80,
        201,
        0x00,
        0x01,
        static_cast<uint8_t>(ssrc >> 24),
        static_cast<uint8_t>(ssrc >> 16),
        static_cast<uint8_t>(ssrc >> 8),
        static_cast<uint8_t>(ssrc)};
    packet.assign(report, sizeof(report));
}

struct LibSrtpSession
{
    LibSrtpSession() : context(nullptr) {}
    ~LibSrtpSession()
    {
        if (context)
        {
            srtp_dealloc(context);
        }
    }

    bool create(const srtp::AesKey& key, bool outbound)
    {
        srtp_policy_t policy;
        std::memset(&policy, 0, sizeof(policy));
        switch (key.profile)
        {
        case srtp::AES128_CM_SHA1_80:
            srtp_crypto_policy_set_aes_cm_128_hmac_sha1_80(&policy.rtp);
            srtp_crypto_policy_set_aes_cm_128_hmac_sha1_80(&policy.rtcp);
            break;
        case srtp::AES128_CM_SHA1_32:
            srtp_crypto_policy_set_aes_cm_128_hmac_sha1_32(&policy.rtp);
            srtp_crypto_policy_set_aes_cm_128_hmac_sha1_80(&policy.rtcp);
            break;
        case srtp::AEAD_AES_128_GCM:
            srtp_crypto_policy_set_aes_gcm_128_16_auth(&policy.rtp);
            srtp_crypto_policy_set_aes_gcm_128_16_auth(&policy.rtcp);
            break;
        default:
            return false;
        }

        std::memcpy(keyMaterial, key.keySalt, key.getLength());
        policy.key = keyMaterial;
        policy.ssrc.type = outbound ? ssrc_any_outbound : ssrc_any_inbound;
        policy.window_size = 128;
        policy.next = nullptr;
        return srtp_create(&context, &policy) == srtp_err_status_ok;
    }

    srtp_t context;
    uint8_t keyMaterial[64];
};
} // namespace

class LibSrtpInteropTest : public ::testing::TestWithParam<srtp::Profile>
{
public:
    static void SetUpTestSuite() { ASSERT_EQ(srtp_init(), srtp_err_status_ok); }
    static void TearDownTestSuite() { srtp_shutdown(); }

    void SetUp() override
    {
        _localKey = makeKey(GetParam(), 1);
        _remoteKey = makeKey(GetParam(), 2);
        transport::SrtpConfig config;
        config.profile = GetParam();
        _context = std::make_unique<transport::SrtpContext>(1, config, _localKey, _remoteKey);
        ASSERT_TRUE(_context->isValid());

        // the peer unprotects with our local key and protects with our remote key
        if (!_peerInbound.create(_localKey, false) || !_peerOutbound.create(_remoteKey, true))
        {
            GTEST_SKIP() << "libsrtp lacks " << srtp::toString(GetParam());
        }
    }

protected:
    srtp::AesKey _localKey;
    srtp::AesKey _remoteKey;
    std::unique_ptr<transport::SrtpContext> _context;
    LibSrtpSession _peerInbound;
    LibSrtpSession _peerOutbound;
};

TEST_P(LibSrtpInteropTest, libSrtpUnprotectsOurRtp)
{
    for (uint16_t sequenceNumber = 65530; sequenceNumber != 6; ++sequenceNumber)
    {
        memory::Packet packet;
        makeRtp(packet, 0x11223344, sequenceNumber);
        memory::Packet plain;
        packet.copyTo(plain);

        ASSERT_EQ(_context->encryptRtp(packet), transport::SrtpContext::Result::Ok);
        int length = static_cast<int>(packet.getLength());
        ASSERT_EQ(srtp_unprotect(_peerInbound.context, packet.get(), &length), srtp_err_status_ok);
        ASSERT_EQ(static_cast<size_t>(length), plain.getLength());
        EXPECT_EQ(0, std::memcmp(packet.get(), plain.get(), plain.getLength()));
    }
}

TEST_P(LibSrtpInteropTest, weUnprotectLibSrtpRtp)
{
    for (uint16_t sequenceNumber = 100; sequenceNumber < 110; ++sequenceNumber)
    {
        memory::Packet packet;
        makeRtp(packet, 0x55667788, sequenceNumber);
        memory::Packet plain;
        packet.copyTo(plain);

        int length = static_cast<int>(packet.getLength());
        ASSERT_EQ(srtp_protect(_peerOutbound.context, packet.get(), &length), srtp_err_status_ok);
        packet.setLength(length);

        ASSERT_EQ(_context->decryptRtp(packet), transport::SrtpContext::Result::Ok);
        ASSERT_EQ(packet.getLength(), plain.getLength());
        EXPECT_EQ(0, std::memcmp(packet.get(), plain.get(), plain.getLength()));
    }
}

TEST_P(LibSrtpInteropTest, rtcpBothWays)
{
    memory::Packet outbound;
    makeReceiverReport(outbound, 0x01020304);
    ASSERT_EQ(_context->encryptRtcp(outbound), transport::SrtpContext::Result::Ok);
    int length = static_cast<int>(outbound.getLength());
    ASSERT_EQ(srtp_unprotect_rtcp(_peerInbound.context, outbound.get(), &length), srtp_err_status_ok);
    EXPECT_EQ(length, 8);

    memory::Packet inbound;
    makeReceiverReport(inbound, 0x0A0B0C0D);
    length = static_cast<int>(inbound.getLength());
    ASSERT_EQ(srtp_protect_rtcp(_peerOutbound.context, inbound.get(), &length), srtp_err_status_ok);
    inbound.setLength(length);
    ASSERT_EQ(_context->decryptRtcp(inbound), transport::SrtpContext::Result::Ok);
    ASSERT_EQ(inbound.getLength(), 8u);
    EXPECT_EQ(inbound.get()[7], 0x0D);
}

INSTANTIATE_TEST_SUITE_P(Profiles,
    LibSrtpInteropTest,
    ::testing::Values(srtp::AES128_CM_SHA1_80, srtp::AES128_CM_SHA1_32, srtp::AEAD_AES_128_GCM));
