#include "config/RtcConfig.h"
#include "rtp/RtpSessionConfig.h"
#include "transport/DataTransport.h"
#include "transport/dtls/DtlsConfig.h"
#include "transport/sctp/SctpConfig.h"
#include "transport/srtp/SrtpConfig.h"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <gtest/gtest.h>
#include <unistd.h>

namespace
{
void writeSampleConfig(std::ostream& s)
{
    s << "{" << std::endl;
    s << "  \"connectTimeoutMs\": 3000," << std::endl;
    s << "  \"dtls.role\": \"server\"," << std::endl;
    s << "  \"dtls.mtu\": 1100," << std::endl;
    s << "  \"dtls.clientAuth\": \"requireAndVerify\"," << std::endl;
    s << "  \"dtls.cipherSuites\": \"TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384, TLS_PSK_WITH_AES_128_GCM_SHA256\","
      << std::endl;
    s << "  \"dtls.srtpProfiles\": \"SRTP_AES128_CM_HMAC_SHA1_80,AEAD_AES_256_GCM\"," << std::endl;
    s << "  \"sctp.rtoMaxMs\": 20000," << std::endl;
    s << "  \"log.level\": \"DEBUG\"" << std::endl;
    s << "}" << std::endl;
}

void verifySampleConfig(const config::RtcConfig& cfg)
{
    ASSERT_EQ(cfg.connectTimeoutMs, 3000u);
    ASSERT_EQ(cfg.writeTimeoutMs, 10000u);
    ASSERT_STREQ(cfg.dtls.role.get().c_str(), "server");
    ASSERT_EQ(cfg.dtls.mtu, 1100u);
    ASSERT_EQ(cfg.dtls.flightIntervalMs, 1000u);
    ASSERT_EQ(cfg.sctp.rtoMaxMs, 20000u);
    ASSERT_EQ(cfg.sctp.rtoInitialMs, 1000u);
    ASSERT_STREQ(cfg.log.level.get().c_str(), "DEBUG");
    ASSERT_EQ(cfg.srtp.replayWindowSize, 64u);
}
} // namespace

TEST(RtcConfigTest, canReadFromFile)
{
    char tmpConfigFname[11] = "cfg-XXXXXX";
    const auto tmpHandle = mkstemp(tmpConfigFname);
    ASSERT_GT(tmpHandle, 0);

    std::ofstream tmpFs(tmpConfigFname);
    writeSampleConfig(tmpFs);
    tmpFs.close();

    config::RtcConfig cfg;
    ASSERT_TRUE(cfg.readFromFile(tmpConfigFname));
    verifySampleConfig(cfg);

    close(tmpHandle);
    remove(tmpConfigFname);
}

TEST(RtcConfigTest, canReadFromString)
{
    std::ostringstream ss;
    writeSampleConfig(ss);

    config::RtcConfig cfg;
    ASSERT_TRUE(cfg.readFromString(ss.str()));
    verifySampleConfig(cfg);
}

TEST(RtcConfigTest, brokenJsonKeepsDefaults)
{
    config::RtcConfig cfg;
    ASSERT_FALSE(cfg.readFromString("{ dtls.role: }"));
    ASSERT_STREQ(cfg.dtls.role.get().c_str(), "client");
    ASSERT_EQ(cfg.rtp.nackIntervalMs, 100u);
}

TEST(RtcConfigTest, dtlsConfigFromRtcConfig)
{
    std::ostringstream ss;
    writeSampleConfig(ss);
    config::RtcConfig cfg;
    ASSERT_TRUE(cfg.readFromString(ss.str()));

    transport::DtlsConfig dtlsConfig;
    ASSERT_TRUE(transport::readDtlsConfig(cfg, dtlsConfig));
    EXPECT_FALSE(dtlsConfig.isClient());
    EXPECT_EQ(1100u, dtlsConfig.mtu);
    EXPECT_EQ(transport::DtlsConfig::ClientAuth::RequireAndVerifyClientCert, dtlsConfig.clientAuth);
    EXPECT_EQ(transport::DtlsConfig::ExtendedMasterSecret::Request, dtlsConfig.extendedMasterSecret);

    ASSERT_EQ(2u, dtlsConfig.cipherSuites.size());
    EXPECT_EQ(dtls::CipherSuiteId::TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384, dtlsConfig.cipherSuites[0]);
    EXPECT_EQ(dtls::CipherSuiteId::TLS_PSK_WITH_AES_128_GCM_SHA256, dtlsConfig.cipherSuites[1]);

    ASSERT_EQ(2u, dtlsConfig.srtpProfiles.size());
    EXPECT_EQ(srtp::AES128_CM_SHA1_80, dtlsConfig.srtpProfiles[0]);
    EXPECT_EQ(srtp::AEAD_AES_256_GCM, dtlsConfig.srtpProfiles[1]);
}

TEST(RtcConfigTest, dtlsDefaults)
{
    config::RtcConfig cfg;
    transport::DtlsConfig dtlsConfig;
    ASSERT_TRUE(transport::readDtlsConfig(cfg, dtlsConfig));

    EXPECT_TRUE(dtlsConfig.isClient());
    EXPECT_TRUE(dtlsConfig.cipherSuites.empty());
    ASSERT_EQ(4u, dtlsConfig.srtpProfiles.size());
    EXPECT_EQ(srtp::AEAD_AES_128_GCM, dtlsConfig.srtpProfiles[0]);
    EXPECT_EQ(5u, dtlsConfig.maxRetransmissions);
}

TEST(RtcConfigTest, dtlsRejectsUnknownValues)
{
    config::RtcConfig cfg;
    transport::DtlsConfig dtlsConfig;

    ASSERT_TRUE(cfg.readFromString(R"({"dtls.cipherSuites": "TLS_RSA_WITH_RC4_128_MD5"})"));
    EXPECT_FALSE(transport::readDtlsConfig(cfg, dtlsConfig));

    config::RtcConfig roleCfg;
    ASSERT_TRUE(roleCfg.readFromString(R"({"dtls.role": "peer"})"));
    EXPECT_FALSE(transport::readDtlsConfig(roleCfg, dtlsConfig));

    config::RtcConfig emsCfg;
    ASSERT_TRUE(emsCfg.readFromString(R"({"dtls.extendedMasterSecret": "always"})"));
    EXPECT_FALSE(transport::readDtlsConfig(emsCfg, dtlsConfig));

    config::RtcConfig srtpCfg;
    ASSERT_TRUE(srtpCfg.readFromString(R"({"dtls.srtpProfiles": "SRTP_NULL"})"));
    EXPECT_FALSE(transport::readDtlsConfig(srtpCfg, dtlsConfig));
}

TEST(RtcConfigTest, sctpConfigFromRtcConfig)
{
    config::RtcConfig cfg;
    ASSERT_TRUE(cfg.readFromString(R"({"sctp.mtu": 1300, "sctp.rtoInitialMs": 3000, "sctp.heartbeatIntervalMs": 0})"));

    sctp::SctpConfig sctpConfig;
    ASSERT_TRUE(sctp::readSctpConfig(cfg, sctpConfig));
    EXPECT_EQ(1300u, sctpConfig.mtu);
    EXPECT_EQ(3000u, sctpConfig.RTO.initial);
    EXPECT_EQ(1000u, sctpConfig.RTO.min);
    EXPECT_EQ(0u, sctpConfig.heartbeat.interval);
    EXPECT_EQ(64u * 1024, sctpConfig.maxMessageSize);

    config::RtcConfig badRto;
    ASSERT_TRUE(badRto.readFromString(R"({"sctp.rtoMinMs": 5000, "sctp.rtoMaxMs": 2000})"));
    EXPECT_FALSE(sctp::readSctpConfig(badRto, sctpConfig));

    config::RtcConfig badMessageSize;
    ASSERT_TRUE(badMessageSize.readFromString(R"({"sctp.maxMessageSize": 2000000})"));
    EXPECT_FALSE(sctp::readSctpConfig(badMessageSize, sctpConfig));
}

TEST(RtcConfigTest, srtpConfigFromRtcConfig)
{
    config::RtcConfig cfg;
    transport::SrtpConfig srtpConfig;
    ASSERT_TRUE(transport::readSrtpConfig(cfg, srtpConfig));
    EXPECT_EQ(srtp::AES128_CM_SHA1_80, srtpConfig.profile);
    EXPECT_FALSE(srtpConfig.disableReplay);

    config::RtcConfig gcm;
    ASSERT_TRUE(gcm.readFromString(R"({"srtp.profile": "AEAD_AES_256_GCM", "srtp.replayWindowSize": 1024})"));
    ASSERT_TRUE(transport::readSrtpConfig(gcm, srtpConfig));
    EXPECT_EQ(srtp::AEAD_AES_256_GCM, srtpConfig.profile);
    EXPECT_EQ(1024u, srtpConfig.replayWindowSize);

    config::RtcConfig unknown;
    ASSERT_TRUE(unknown.readFromString(R"({"srtp.profile": "NULL"})"));
    EXPECT_FALSE(transport::readSrtpConfig(unknown, srtpConfig));
}

TEST(RtcConfigTest, rtpSessionConfigFromRtcConfig)
{
    config::RtcConfig cfg;
    ASSERT_TRUE(cfg.readFromString(
        R"({"rtp.nackBufferSize": 2048, "rtp.twccExtensionId": 5, "rtp.cname": "alice", "dtls.mtu": 1000})"));

    rtp::RtpSessionConfig rtpConfig;
    ASSERT_TRUE(rtp::readRtpSessionConfig(cfg, rtpConfig));
    EXPECT_EQ(2048u, rtpConfig.nackBufferSize);
    EXPECT_EQ(5u, rtpConfig.twccExtensionId);
    EXPECT_EQ("alice", rtpConfig.cname);
    EXPECT_EQ(1000u, rtpConfig.sendMtu);

    config::RtcConfig notPowerOfTwo;
    ASSERT_TRUE(notPowerOfTwo.readFromString(R"({"rtp.nackBufferSize": 1000})"));
    EXPECT_FALSE(rtp::readRtpSessionConfig(notPowerOfTwo, rtpConfig));

    config::RtcConfig badExtension;
    ASSERT_TRUE(badExtension.readFromString(R"({"rtp.twccExtensionId": 300})"));
    EXPECT_FALSE(rtp::readRtpSessionConfig(badExtension, rtpConfig));
}

TEST(RtcConfigTest, dataTransportConfigFromRtcConfig)
{
    std::ostringstream ss;
    writeSampleConfig(ss);
    config::RtcConfig cfg;
    ASSERT_TRUE(cfg.readFromString(ss.str()));

    transport::DataTransportConfig transportConfig;
    ASSERT_TRUE(transport::readDataTransportConfig(cfg, transportConfig));
    EXPECT_EQ(3000u, transportConfig.connectTimeoutMs);
    EXPECT_EQ(0u, transportConfig.readTimeoutMs);
    EXPECT_EQ(20000u, transportConfig.sctp.RTO.max);
    EXPECT_FALSE(transportConfig.dtls.isClient());
}

TEST(RtcConfigTest, nestedObjectsMatchDottedKeys)
{
    config::RtcConfig cfg;
    ASSERT_TRUE(cfg.readFromString(R"({"dtls": {"role": "server", "mtu": 1000}, "sctp": {"rtoMaxMs": 9000}})"));
    EXPECT_STREQ(cfg.dtls.role.get().c_str(), "server");
    EXPECT_EQ(cfg.dtls.mtu, 1000u);
    EXPECT_EQ(cfg.sctp.rtoMaxMs, 9000u);
    EXPECT_EQ(cfg.sctp.rtoMinMs, 1000u);
}

TEST(RtcConfigTest, flatKeyWinsOverNestedObject)
{
    config::RtcConfig cfg;
    ASSERT_TRUE(cfg.readFromString(R"({"dtls.mtu": 1100, "dtls": {"mtu": 900}})"));
    EXPECT_EQ(cfg.dtls.mtu, 1100u);
}

TEST(RtcConfigTest, wrongTypeIsReportedAndDefaulted)
{
    config::RtcConfig cfg;
    ASSERT_FALSE(cfg.readFromString(R"({"sctp.mtu": "large", "dtls.role": "server"})"));
    EXPECT_EQ(cfg.sctp.mtu, 1200u);
    EXPECT_STREQ(cfg.dtls.role.get().c_str(), "server");
    ASSERT_EQ(cfg.getInvalidKeys().size(), 1u);
    EXPECT_EQ(cfg.getInvalidKeys()[0], "sctp.mtu");
}

TEST(RtcConfigTest, nonObjectRootIsRejected)
{
    config::RtcConfig cfg;
    EXPECT_FALSE(cfg.readFromString("[1, 2, 3]"));
    EXPECT_EQ(cfg.connectTimeoutMs, 10000u);
}

namespace
{
class PeerConfig : public config::ConfigReader
{
public:
    CFG_MANDATORY_PROP(std::string, fingerprint);

    CFG_GROUP()
    CFG_MANDATORY_PROP(uint32_t, port);
    CFG_PROP(uint32_t, streams, 16);
    CFG_GROUP_END(sctp);
};
} // namespace

TEST(RtcConfigTest, mandatoryKeysAreReportedWhenAbsent)
{
    PeerConfig cfg;
    EXPECT_FALSE(cfg.readFromString(R"({"sctp": {"streams": 4}})"));
    ASSERT_EQ(cfg.getMissingKeys().size(), 2u);
    EXPECT_EQ(cfg.getMissingKeys()[0], "fingerprint");
    EXPECT_EQ(cfg.getMissingKeys()[1], "sctp.port");
    EXPECT_TRUE(cfg.getInvalidKeys().empty());
    EXPECT_EQ(cfg.sctp.streams, 4u);

    EXPECT_TRUE(cfg.readFromString(R"({"fingerprint": "sha-256 AB:CD", "sctp.port": 5000})"));
    EXPECT_TRUE(cfg.getMissingKeys().empty());
    EXPECT_EQ(cfg.sctp.port, 5000u);
    EXPECT_EQ(cfg.sctp.streams, 16u);
    EXPECT_EQ(cfg.fingerprint.get(), "sha-256 AB:CD");
}
