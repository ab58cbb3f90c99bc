#include "crypto/Certificate.h"
#include "transport/dtls/DtlsConnection.h"
#include "transport/dtls/DtlsWriteListener.h"
#include "utils/Time.h"
#include <cstring>
#include <deque>
#include <gtest/gtest.h>
#include <memory>
#include <string>

using namespace transport;

namespace
{
// DTLS connection on an in-memory link. Datagrams queue up until forwarded to the peer.
class DtlsEndpoint : public DtlsWriteListener, public DtlsConnection::IEvents
{
public:
    DtlsEndpoint(size_t id, const DtlsConfig& config) : connection(id, config, *this, this) {}

    int32_t sendDtls(const char* buffer, uint32_t length) override
    {
        ++sentCount;
        if (dropOutgoing)
        {
            return length;
        }
        sendQueue.emplace_back(buffer, buffer + length);
        return length;
    }

    void onDtlsConnected(DtlsConnection& conn) override { ++connectedCount; }
    void onDtlsApplicationData(DtlsConnection& conn, const uint8_t* data, size_t length) override
    {
        received.emplace_back(reinterpret_cast<const char*>(data), length);
    }
    void onDtlsFailed(DtlsConnection& conn, dtls::AlertDescription alert) override
    {
        ++failedCount;
        failAlert = alert;
    }
    void onDtlsClosed(DtlsConnection& conn) override { ++closedCount; }

    bool forwardPackets(DtlsEndpoint& target, uint64_t timestamp)
    {
        const bool any = !sendQueue.empty();
        while (!sendQueue.empty())
        {
            auto datagram = std::move(sendQueue.front());
            sendQueue.pop_front();
            target.connection.onPacketReceived(datagram.data(), datagram.size(), timestamp);
        }
        return any;
    }

    DtlsConnection connection;
    std::deque<std::vector<uint8_t>> sendQueue;
    std::vector<std::string> received;
    bool dropOutgoing = false;
    int sentCount = 0;
    int connectedCount = 0;
    int failedCount = 0;
    int closedCount = 0;
    dtls::AlertDescription failAlert = dtls::NO_ALERT;
};

bool sameKey(const srtp::AesKey& a, const srtp::AesKey& b)
{
    return a.profile == b.profile && a.getLength() == b.getLength() &&
        std::memcmp(a.keySalt, b.keySalt, a.getLength()) == 0;
}
} // namespace

class DtlsHandshakeTest : public ::testing::Test
{
public:
    static void SetUpTestSuite()
    {
        _serverIdentity = new crypto::CertificateIdentity(crypto::CertificateIdentity::generate("server"));
        _clientIdentity = new crypto::CertificateIdentity(crypto::CertificateIdentity::generate("client"));
    }

    static void TearDownTestSuite()
    {
        delete _serverIdentity;
        delete _clientIdentity;
        _serverIdentity = nullptr;
        _clientIdentity = nullptr;
    }

    void SetUp() override
    {
        _timestamp = 5000 * utils::Time::sec;

        _clientConfig.role = DtlsConfig::Role::Client;
        _clientConfig.insecureSkipVerify = true;
        _clientConfig.srtpProfiles = {srtp::AEAD_AES_128_GCM, srtp::AES128_CM_SHA1_80};

        _serverConfig.role = DtlsConfig::Role::Server;
        _serverConfig.identity = *_serverIdentity;
        _serverConfig.insecureSkipVerify = true;
        _serverConfig.srtpProfiles = {srtp::AES128_CM_SHA1_80, srtp::AEAD_AES_128_GCM};
    }

protected:
    void createEndpoints()
    {
        _client = std::make_unique<DtlsEndpoint>(1, _clientConfig);
        _server = std::make_unique<DtlsEndpoint>(2, _serverConfig);
    }

    void start()
    {
        createEndpoints();
        ASSERT_TRUE(_server->connection.start(_timestamp));
        ASSERT_TRUE(_client->connection.start(_timestamp));
    }

    // exchanges queued datagrams until the link is quiet
    void pump()
    {
        for (int i = 0; i < 50; ++i)
        {
            _timestamp += utils::Time::ms;
            const bool clientSent = _client->forwardPackets(*_server, _timestamp);
            const bool serverSent = _server->forwardPackets(*_client, _timestamp);
            if (!clientSent && !serverSent)
            {
                return;
            }
        }
    }

    // jumps to the earliest pending timer of either side and services both
    bool advanceToNextTimeout()
    {
        const auto clientTimeout = _client->connection.nextTimeout(_timestamp);
        const auto serverTimeout = _server->connection.nextTimeout(_timestamp);
        int64_t timeout = -1;
        if (clientTimeout >= 0)
        {
            timeout = clientTimeout;
        }
        if (serverTimeout >= 0 && (timeout < 0 || serverTimeout < timeout))
        {
            timeout = serverTimeout;
        }
        if (timeout < 0)
        {
            return false;
        }

        _timestamp += timeout;
        _client->connection.processTimeout(_timestamp);
        _server->connection.processTimeout(_timestamp);
        return true;
    }

    bool connect()
    {
        start();
        pump();
        return _client->connection.isConnected() && _server->connection.isConnected();
    }

    static crypto::CertificateIdentity* _serverIdentity;
    static crypto::CertificateIdentity* _clientIdentity;

    uint64_t _timestamp = 0;
    DtlsConfig _clientConfig;
    DtlsConfig _serverConfig;
    std::unique_ptr<DtlsEndpoint> _client;
    std::unique_ptr<DtlsEndpoint> _server;
};

crypto::CertificateIdentity* DtlsHandshakeTest::_serverIdentity = nullptr;
crypto::CertificateIdentity* DtlsHandshakeTest::_clientIdentity = nullptr;

TEST_F(DtlsHandshakeTest, certificateHandshake)
{
    ASSERT_TRUE(connect());

    EXPECT_EQ(1, _client->connectedCount);
    EXPECT_EQ(1, _server->connectedCount);
    EXPECT_EQ(_client->connection.getCipherSuite(), _server->connection.getCipherSuite());
    EXPECT_EQ(static_cast<uint16_t>(dtls::CipherSuiteId::TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256),
        _client->connection.getCipherSuite());
    EXPECT_TRUE(_client->connection.isExtendedMasterSecret());
    EXPECT_TRUE(_server->connection.isExtendedMasterSecret());

    // server preference wins
    EXPECT_EQ(srtp::AES128_CM_SHA1_80, _client->connection.getSelectedSrtpProfile());
    EXPECT_EQ(_server->connection.getLocalFingerprint(), _client->connection.getPeerCertificateFingerprint());
    EXPECT_TRUE(_server->connection.getPeerCertificates().empty());
    EXPECT_EQ(0u, _client->connection.getRetransmissionCount());
}

TEST_F(DtlsHandshakeTest, helloVerifyRoundTrip)
{
    start();

    _client->forwardPackets(*_server, _timestamp);
    ASSERT_EQ(1u, _server->sendQueue.size());
    // a bare HelloVerifyRequest, the server keeps no timer for it
    EXPECT_LT(_server->sendQueue.front().size(), 100u);
    EXPECT_EQ(static_cast<int64_t>(30 * utils::Time::sec), _server->connection.nextTimeout(_timestamp));
    _server->forwardPackets(*_client, _timestamp);
    EXPECT_EQ(2, _client->connection.getFlight());

    pump();
    EXPECT_TRUE(_client->connection.isConnected());
}

TEST_F(DtlsHandshakeTest, skipHelloVerify)
{
    _serverConfig.insecureSkipHelloVerify = true;
    start();

    _client->forwardPackets(*_server, _timestamp);
    EXPECT_EQ(4, _server->connection.getFlight());
    pump();
    EXPECT_TRUE(_client->connection.isConnected());
    EXPECT_TRUE(_server->connection.isConnected());
}

TEST_F(DtlsHandshakeTest, applicationDataBothWays)
{
    ASSERT_TRUE(connect());

    const std::string hello = "hello server";
    const std::string reply = "hello client";
    EXPECT_TRUE(_client->connection.sendApplicationData(hello.data(), hello.size()));
    EXPECT_TRUE(_server->connection.sendApplicationData(reply.data(), reply.size()));
    pump();

    ASSERT_EQ(1u, _server->received.size());
    EXPECT_EQ(hello, _server->received[0]);
    ASSERT_EQ(1u, _client->received.size());
    EXPECT_EQ(reply, _client->received[0]);
}

TEST_F(DtlsHandshakeTest, sendBeforeConnectedFails)
{
    start();
    const char data[] = "early";
    EXPECT_FALSE(_client->connection.sendApplicationData(data, sizeof(data)));
}

TEST_F(DtlsHandshakeTest, keyExportIsSymmetric)
{
    ASSERT_TRUE(connect());

    std::vector<uint8_t> clientMaterial;
    std::vector<uint8_t> serverMaterial;
    ASSERT_TRUE(_client->connection.exportKeyingMaterial("EXPORTER-test", 40, clientMaterial));
    ASSERT_TRUE(_server->connection.exportKeyingMaterial("EXPORTER-test", 40, serverMaterial));
    EXPECT_EQ(40u, clientMaterial.size());
    EXPECT_EQ(clientMaterial, serverMaterial);

    srtp::AesKey clientLocal;
    srtp::AesKey clientRemote;
    srtp::AesKey serverLocal;
    srtp::AesKey serverRemote;
    ASSERT_TRUE(_client->connection.getSrtpKeys(clientLocal, clientRemote));
    ASSERT_TRUE(_server->connection.getSrtpKeys(serverLocal, serverRemote));
    EXPECT_EQ(30u, clientLocal.getLength());
    EXPECT_TRUE(sameKey(clientLocal, serverRemote));
    EXPECT_TRUE(sameKey(serverLocal, clientRemote));
    EXPECT_FALSE(sameKey(clientLocal, clientRemote));
}

TEST_F(DtlsHandshakeTest, gcmSrtpProfileKeyLength)
{
    _serverConfig.srtpProfiles = {srtp::AEAD_AES_256_GCM};
    _clientConfig.srtpProfiles = {srtp::AEAD_AES_128_GCM, srtp::AEAD_AES_256_GCM};
    ASSERT_TRUE(connect());

    srtp::AesKey local;
    srtp::AesKey remote;
    ASSERT_TRUE(_client->connection.getSrtpKeys(local, remote));
    EXPECT_EQ(srtp::AEAD_AES_256_GCM, local.profile);
    EXPECT_EQ(44u, local.getLength());
}

TEST_F(DtlsHandshakeTest, srtpProfileMismatch)
{
    _clientConfig.srtpProfiles = {srtp::AES128_CM_SHA1_32};
    _serverConfig.srtpProfiles = {srtp::AEAD_AES_128_GCM};
    start();
    pump();

    EXPECT_EQ(DtlsConnection::State::FAILED, _server->connection.getState());
    EXPECT_EQ(dtls::INSUFFICIENT_SECURITY, _server->failAlert);
    EXPECT_EQ(DtlsConnection::State::FAILED, _client->connection.getState());
    EXPECT_EQ(dtls::INSUFFICIENT_SECURITY, _client->failAlert);
}

TEST_F(DtlsHandshakeTest, noSrtpWhenNotOffered)
{
    _clientConfig.srtpProfiles.clear();
    ASSERT_TRUE(connect());

    srtp::AesKey local;
    srtp::AesKey remote;
    EXPECT_EQ(srtp::NULL_CIPHER, _server->connection.getSelectedSrtpProfile());
    EXPECT_FALSE(_client->connection.getSrtpKeys(local, remote));
}

TEST_F(DtlsHandshakeTest, cbcCipherSuite)
{
    _clientConfig.cipherSuites = {dtls::CipherSuiteId::TLS_ECDHE_ECDSA_WITH_AES_256_CBC_SHA};
    ASSERT_TRUE(connect());
    EXPECT_EQ(static_cast<uint16_t>(dtls::CipherSuiteId::TLS_ECDHE_ECDSA_WITH_AES_256_CBC_SHA),
        _server->connection.getCipherSuite());

    const std::string text(500, 'x');
    EXPECT_TRUE(_server->connection.sendApplicationData(text.data(), text.size()));
    pump();
    ASSERT_EQ(1u, _client->received.size());
    EXPECT_EQ(text, _client->received[0]);
}

TEST_F(DtlsHandshakeTest, noCommonCipherSuite)
{
    _clientConfig.cipherSuites = {dtls::CipherSuiteId::TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256};
    start();
    pump();

    EXPECT_EQ(dtls::INSUFFICIENT_SECURITY, _server->failAlert);
    EXPECT_EQ(DtlsConnection::State::FAILED, _client->connection.getState());
}

TEST_F(DtlsHandshakeTest, smallMtuFragmentsCertificate)
{
    _clientConfig.mtu = 200;
    _serverConfig.mtu = 200;
    start();

    for (int i = 0; i < 50 && !_client->connection.isConnected(); ++i)
    {
        _timestamp += utils::Time::ms;
        for (auto& datagram : _server->sendQueue)
        {
            EXPECT_LE(datagram.size(), 200u);
        }
        _client->forwardPackets(*_server, _timestamp);
        _server->forwardPackets(*_client, _timestamp);
    }
    EXPECT_TRUE(_client->connection.isConnected());
    EXPECT_TRUE(_server->connection.isConnected());
}

TEST_F(DtlsHandshakeTest, verifyCallback)
{
    const auto expected = _serverIdentity->chain.front()->fingerprint(crypto::DigestType::SHA256);
    _clientConfig.insecureSkipVerify = false;
    _clientConfig.verifyPeerCertificate = [expected](const std::vector<std::vector<uint8_t>>& chain) {
        return crypto::Certificate::fromDer(chain.front()).fingerprint(crypto::DigestType::SHA256) == expected;
    };
    ASSERT_TRUE(connect());
    EXPECT_TRUE(_client->connection.isPeerCertificateVerified());
}

TEST_F(DtlsHandshakeTest, verifyCallbackRejects)
{
    _clientConfig.insecureSkipVerify = false;
    _clientConfig.verifyPeerCertificate = [](const std::vector<std::vector<uint8_t>>& chain) { return false; };
    start();
    pump();

    EXPECT_EQ(dtls::BAD_CERTIFICATE, _client->failAlert);
    EXPECT_EQ(dtls::BAD_CERTIFICATE, _server->failAlert);
    EXPECT_EQ(1, _client->failedCount);
    EXPECT_EQ(0, _client->connectedCount);
}

TEST_F(DtlsHandshakeTest, noVerifierFailsClosed)
{
    _clientConfig.insecureSkipVerify = false;
    start();
    pump();
    EXPECT_EQ(DtlsConnection::State::FAILED, _client->connection.getState());
    EXPECT_EQ(dtls::BAD_CERTIFICATE, _client->failAlert);
}

TEST_F(DtlsHandshakeTest, extendedMasterSecretRequiredButDisabled)
{
    _clientConfig.extendedMasterSecret = DtlsConfig::ExtendedMasterSecret::Disable;
    _serverConfig.extendedMasterSecret = DtlsConfig::ExtendedMasterSecret::Require;
    start();
    pump();

    EXPECT_EQ(dtls::HANDSHAKE_FAILURE, _server->failAlert);
    EXPECT_EQ(dtls::HANDSHAKE_FAILURE, _client->failAlert);
}

TEST_F(DtlsHandshakeTest, extendedMasterSecretDisabled)
{
    _serverConfig.extendedMasterSecret = DtlsConfig::ExtendedMasterSecret::Disable;
    ASSERT_TRUE(connect());
    EXPECT_FALSE(_client->connection.isExtendedMasterSecret());
    EXPECT_FALSE(_server->connection.isExtendedMasterSecret());
}

TEST_F(DtlsHandshakeTest, clientRequiresExtendedMasterSecret)
{
    _serverConfig.extendedMasterSecret = DtlsConfig::ExtendedMasterSecret::Disable;
    _clientConfig.extendedMasterSecret = DtlsConfig::ExtendedMasterSecret::Require;
    start();
    pump();

    EXPECT_EQ(dtls::HANDSHAKE_FAILURE, _client->failAlert);
    EXPECT_EQ(DtlsConnection::State::FAILED, _server->connection.getState());
}

TEST_F(DtlsHandshakeTest, mutualAuthentication)
{
    _serverConfig.clientAuth = DtlsConfig::ClientAuth::RequireAndVerifyClientCert;
    _clientConfig.identity = *_clientIdentity;
    ASSERT_TRUE(connect());

    ASSERT_EQ(1u, _server->connection.getPeerCertificates().size());
    EXPECT_EQ(_client->connection.getLocalFingerprint(), _server->connection.getPeerCertificateFingerprint());
}

TEST_F(DtlsHandshakeTest, requiredClientCertificateMissing)
{
    _serverConfig.clientAuth = DtlsConfig::ClientAuth::RequireAnyClientCert;
    start();
    pump();

    EXPECT_EQ(dtls::NO_CERTIFICATE, _server->failAlert);
    EXPECT_EQ(DtlsConnection::State::FAILED, _client->connection.getState());
}

TEST_F(DtlsHandshakeTest, requestedClientCertificateOptional)
{
    _serverConfig.clientAuth = DtlsConfig::ClientAuth::RequestClientCert;
    ASSERT_TRUE(connect());
    EXPECT_TRUE(_server->connection.getPeerCertificates().empty());
}

TEST_F(DtlsHandshakeTest, pskHandshake)
{
    const std::vector<uint8_t> psk = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16};
    const std::vector<uint8_t> hint = {'h', 'i', 'n', 't'};
    const std::vector<uint8_t> identity = {'c', 'l', 'i', 'e', 'n', 't'};

    _serverConfig.identity = crypto::CertificateIdentity();
    _serverConfig.pskIdentityHint = hint;
    _serverConfig.pskCallback = [psk, identity](const std::vector<uint8_t>& peerIdentity, std::vector<uint8_t>& key) {
        if (peerIdentity != identity)
        {
            return false;
        }
        key = psk;
        return true;
    };
    _clientConfig.pskIdentity = identity;
    _clientConfig.pskCallback = [psk](const std::vector<uint8_t>& serverHint, std::vector<uint8_t>& key) {
        key = psk;
        return true;
    };

    ASSERT_TRUE(connect());
    EXPECT_EQ(static_cast<uint16_t>(dtls::CipherSuiteId::TLS_PSK_WITH_AES_128_GCM_SHA256),
        _client->connection.getCipherSuite());
    EXPECT_EQ(hint, _client->connection.getPeerIdentityHint());
    EXPECT_EQ(identity, _server->connection.getPeerIdentityHint());
    EXPECT_TRUE(_client->connection.getPeerCertificates().empty());

    const std::string text = "psk data";
    EXPECT_TRUE(_client->connection.sendApplicationData(text.data(), text.size()));
    pump();
    ASSERT_EQ(1u, _server->received.size());
    EXPECT_EQ(text, _server->received[0]);
}

TEST_F(DtlsHandshakeTest, pskUnknownIdentity)
{
    _serverConfig.identity = crypto::CertificateIdentity();
    _serverConfig.pskCallback = [](const std::vector<uint8_t>& peerIdentity, std::vector<uint8_t>& key) {
        return false;
    };
    _clientConfig.pskIdentity = {'x'};
    _clientConfig.pskCallback = [](const std::vector<uint8_t>& serverHint, std::vector<uint8_t>& key) {
        key.assign(16, 0x55);
        return true;
    };
    start();
    pump();

    EXPECT_EQ(dtls::UNKNOWN_PSK_IDENTITY, _server->failAlert);
    EXPECT_EQ(dtls::UNKNOWN_PSK_IDENTITY, _client->failAlert);
}

TEST_F(DtlsHandshakeTest, lostServerFlightIsRetransmitted)
{
    start();

    // ClientHello, HelloVerifyRequest, ClientHello with cookie
    _client->forwardPackets(*_server, _timestamp);
    _server->forwardPackets(*_client, _timestamp);
    _client->forwardPackets(*_server, _timestamp);
    EXPECT_EQ(4, _server->connection.getFlight());
    _server->sendQueue.clear();

    ASSERT_TRUE(advanceToNextTimeout());
    pump();

    EXPECT_TRUE(_client->connection.isConnected());
    EXPECT_TRUE(_server->connection.isConnected());
    EXPECT_GT(_client->connection.getRetransmissionCount() + _server->connection.getRetransmissionCount(), 0u);
}

TEST_F(DtlsHandshakeTest, lostFinalFlightIsRecovered)
{
    start();
    for (int i = 0; i < 10 && !_server->connection.isConnected(); ++i)
    {
        _client->forwardPackets(*_server, _timestamp);
        if (!_server->connection.isConnected())
        {
            _server->forwardPackets(*_client, _timestamp);
        }
    }
    ASSERT_TRUE(_server->connection.isConnected());
    EXPECT_EQ(DtlsConnection::State::CONNECTING, _client->connection.getState());
    _server->sendQueue.clear();

    // client repeats flight 5, server answers with its last flight
    ASSERT_TRUE(advanceToNextTimeout());
    pump();
    EXPECT_TRUE(_client->connection.isConnected());
    EXPECT_EQ(1, _server->connectedCount);
}

TEST_F(DtlsHandshakeTest, handshakeTimesOut)
{
    _clientConfig.maxRetransmissions = 3;
    createEndpoints();
    _client->dropOutgoing = true;
    ASSERT_TRUE(_client->connection.start(_timestamp));

    const auto startTime = _timestamp;
    while (_client->connection.nextTimeout(_timestamp) >= 0)
    {
        _timestamp += _client->connection.nextTimeout(_timestamp);
        _client->connection.processTimeout(_timestamp);
    }

    EXPECT_EQ(DtlsConnection::State::FAILED, _client->connection.getState());
    EXPECT_EQ(dtls::NO_ALERT, _client->failAlert);
    EXPECT_EQ(4, _client->sentCount);
    // 1 + 2 + 4 + 8 seconds of backoff
    EXPECT_EQ(15 * utils::Time::sec, _timestamp - startTime);
}

TEST_F(DtlsHandshakeTest, closeNotify)
{
    ASSERT_TRUE(connect());

    _client->connection.close();
    EXPECT_EQ(DtlsConnection::State::CLOSED, _client->connection.getState());
    pump();

    EXPECT_EQ(1, _server->closedCount);
    EXPECT_EQ(0, _client->closedCount);
    EXPECT_EQ(DtlsConnection::State::CLOSED, _server->connection.getState());
    EXPECT_LT(_server->connection.nextTimeout(_timestamp), 0);

    const char data[] = "late";
    EXPECT_FALSE(_server->connection.sendApplicationData(data, sizeof(data)));
}

TEST_F(DtlsHandshakeTest, serverWithoutCredentialsRefusesToStart)
{
    _serverConfig.identity = crypto::CertificateIdentity();
    createEndpoints();
    EXPECT_FALSE(_server->connection.start(_timestamp));
}
