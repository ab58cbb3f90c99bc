#include "crypto/Certificate.h"
#include "transport/DataTransport.h"
#include "transport/LoopbackSocket.h"
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <thread>

using namespace transport;

namespace
{
std::string toText(const DataTransport::Message& message)
{
    return std::string(message.data.begin(), message.data.end());
}
} // namespace

class DataTransportTest : public ::testing::Test
{
public:
    static void SetUpTestSuite()
    {
        _identity = new crypto::CertificateIdentity(crypto::CertificateIdentity::generate("data-server"));
    }

    static void TearDownTestSuite()
    {
        delete _identity;
        _identity = nullptr;
    }

    void SetUp() override
    {
        _clientConfig.dtls.role = DtlsConfig::Role::Client;
        _clientConfig.dtls.insecureSkipVerify = true;
        _clientConfig.connectTimeoutMs = 5000;
        _clientConfig.readTimeoutMs = 2000;

        _serverConfig.dtls.role = DtlsConfig::Role::Server;
        _serverConfig.dtls.identity = *_identity;
        _serverConfig.dtls.insecureSkipVerify = true;
        _serverConfig.connectTimeoutMs = 5000;
        _serverConfig.readTimeoutMs = 2000;
    }

protected:
    void connectBoth()
    {
        _client = std::make_unique<DataTransport>(1, _clientConfig, _link.first());
        _server = std::make_unique<DataTransport>(2, _serverConfig, _link.second());

        auto serverResult = std::async(std::launch::async, [this]() { return _server->connect(); });
        const auto clientResult = _client->connect();
        ASSERT_EQ(DataTransport::Result::Ok, clientResult);
        ASSERT_EQ(DataTransport::Result::Ok, serverResult.get());
    }

    void openChat(std::unique_ptr<DataTransport::Stream>& local, std::unique_ptr<DataTransport::Stream>& remote)
    {
        webrtc::DataChannelConfig config;
        config.label = "chat";
        config.protocol = "text";
        ASSERT_EQ(DataTransport::Result::Ok, _client->openStream(1, config, local));
        ASSERT_EQ(DataTransport::Result::Ok, _server->acceptStream(2000, remote));
    }

    static crypto::CertificateIdentity* _identity;
    LoopbackSocketPair _link;
    DataTransportConfig _clientConfig;
    DataTransportConfig _serverConfig;
    std::unique_ptr<DataTransport> _client;
    std::unique_ptr<DataTransport> _server;
};

crypto::CertificateIdentity* DataTransportTest::_identity = nullptr;

TEST_F(DataTransportTest, connectAgreesOnKeys)
{
    connectBoth();
    EXPECT_EQ(DataTransport::State::Connected, _client->getState());
    EXPECT_EQ(DataTransport::State::Connected, _server->getState());
    EXPECT_EQ(_server->getLocalFingerprint(), _client->getPeerCertificateFingerprint());
    EXPECT_NE(0, _client->getCipherSuite());
    EXPECT_EQ(_client->getCipherSuite(), _server->getCipherSuite());

    std::vector<uint8_t> clientKeys;
    std::vector<uint8_t> serverKeys;
    ASSERT_TRUE(_client->exportKeyingMaterial("EXPORTER-test", 32, clientKeys));
    ASSERT_TRUE(_server->exportKeyingMaterial("EXPORTER-test", 32, serverKeys));
    EXPECT_EQ(32u, clientKeys.size());
    EXPECT_EQ(clientKeys, serverKeys);
}

TEST_F(DataTransportTest, streamCarriesStringAndBinaryMessages)
{
    connectBoth();
    std::unique_ptr<DataTransport::Stream> local;
    std::unique_ptr<DataTransport::Stream> remote;
    openChat(local, remote);

    EXPECT_EQ(1, remote->getId());
    EXPECT_EQ("chat", remote->getLabel());
    EXPECT_EQ("text", remote->getProtocol());

    ASSERT_EQ(DataTransport::Result::Ok, local->writeString("hello"));
    const uint8_t binary[] = {0, 1, 2, 0xFF};
    ASSERT_EQ(DataTransport::Result::Ok, local->write(binary, sizeof(binary), webrtc::WEBRTC_BINARY));
    ASSERT_EQ(DataTransport::Result::Ok, local->writeString(""));

    DataTransport::Message message;
    ASSERT_EQ(DataTransport::Result::Ok, remote->read(message));
    EXPECT_TRUE(message.isString());
    EXPECT_EQ("hello", toText(message));

    ASSERT_EQ(DataTransport::Result::Ok, remote->read(message));
    EXPECT_FALSE(message.isString());
    EXPECT_EQ(std::vector<uint8_t>(binary, binary + sizeof(binary)), message.data);

    ASSERT_EQ(DataTransport::Result::Ok, remote->read(message));
    EXPECT_TRUE(message.isString());
    EXPECT_EQ(webrtc::WEBRTC_STRING_EMPTY, message.payloadProtocol);
    EXPECT_TRUE(message.data.empty());

    ASSERT_EQ(DataTransport::Result::Ok, remote->writeString("reply"));
    ASSERT_EQ(DataTransport::Result::Ok, local->read(message));
    EXPECT_EQ("reply", toText(message));

    EXPECT_EQ(3u, local->getStats().messagesSent);
    EXPECT_EQ(3u, remote->getStats().messagesReceived);
    EXPECT_EQ(9u, remote->getStats().bytesReceived);
}

TEST_F(DataTransportTest, readTimesOutWithoutData)
{
    connectBoth();
    std::unique_ptr<DataTransport::Stream> local;
    std::unique_ptr<DataTransport::Stream> remote;
    openChat(local, remote);

    DataTransport::Message message;
    EXPECT_EQ(DataTransport::Result::Timeout, remote->read(message, 50));

    std::unique_ptr<DataTransport::Stream> none;
    EXPECT_EQ(DataTransport::Result::Timeout, _client->acceptStream(50, none));
    EXPECT_EQ(nullptr, none);
}

TEST_F(DataTransportTest, oversizedMessageIsRefused)
{
    _clientConfig.sctp.maxMessageSize = 1024;
    connectBoth();
    std::unique_ptr<DataTransport::Stream> local;
    std::unique_ptr<DataTransport::Stream> remote;
    openChat(local, remote);

    std::vector<uint8_t> large(4096, 0xAB);
    EXPECT_EQ(DataTransport::Result::Error, local->write(large.data(), large.size(), webrtc::WEBRTC_BINARY));
    EXPECT_EQ(DataTransport::Result::Ok, local->write(large.data(), 1000, webrtc::WEBRTC_BINARY));

    DataTransport::Message message;
    ASSERT_EQ(DataTransport::Result::Ok, remote->read(message));
    EXPECT_EQ(1000u, message.data.size());
}

TEST_F(DataTransportTest, reopeningAnOpenStreamFails)
{
    connectBoth();
    std::unique_ptr<DataTransport::Stream> local;
    std::unique_ptr<DataTransport::Stream> remote;
    openChat(local, remote);

    std::unique_ptr<DataTransport::Stream> again;
    webrtc::DataChannelConfig config;
    EXPECT_EQ(DataTransport::Result::Error, _client->openStream(1, config, again));
}

TEST_F(DataTransportTest, negotiatedChannelSkipsHandshake)
{
    connectBoth();
    webrtc::DataChannelConfig config;
    config.negotiated = true;
    config.label = "pre";

    std::unique_ptr<DataTransport::Stream> clientSide;
    std::unique_ptr<DataTransport::Stream> serverSide;
    ASSERT_EQ(DataTransport::Result::Ok, _server->openStream(4, config, serverSide));
    ASSERT_EQ(DataTransport::Result::Ok, _client->openStream(4, config, clientSide));

    ASSERT_EQ(DataTransport::Result::Ok, clientSide->writeString("direct"));
    DataTransport::Message message;
    ASSERT_EQ(DataTransport::Result::Ok, serverSide->read(message));
    EXPECT_EQ("direct", toText(message));

    std::unique_ptr<DataTransport::Stream> none;
    EXPECT_EQ(DataTransport::Result::Timeout, _server->acceptStream(50, none));
}

TEST_F(DataTransportTest, closedStreamEndsPeerReads)
{
    connectBoth();
    std::unique_ptr<DataTransport::Stream> local;
    std::unique_ptr<DataTransport::Stream> remote;
    openChat(local, remote);

    ASSERT_EQ(DataTransport::Result::Ok, local->writeString("last"));
    local->close();
    EXPECT_FALSE(local->isOpen());
    EXPECT_EQ(DataTransport::Result::Closed, local->writeString("late"));

    DataTransport::Message message;
    ASSERT_EQ(DataTransport::Result::Ok, remote->read(message));
    EXPECT_EQ("last", toText(message));
    EXPECT_EQ(DataTransport::Result::Closed, remote->read(message));
}

TEST_F(DataTransportTest, transportCloseEndsEverything)
{
    connectBoth();
    std::unique_ptr<DataTransport::Stream> local;
    std::unique_ptr<DataTransport::Stream> remote;
    openChat(local, remote);

    _client->close();
    EXPECT_EQ(DataTransport::State::Closed, _client->getState());

    DataTransport::Message message;
    EXPECT_EQ(DataTransport::Result::Closed, remote->read(message));
    EXPECT_EQ(DataTransport::Result::Closed, _client->openStream(2, webrtc::DataChannelConfig(), local));

    std::unique_ptr<DataTransport::Stream> none;
    EXPECT_EQ(DataTransport::Result::Closed, _server->acceptStream(0, none));
}

TEST_F(DataTransportTest, connectTimesOutWithoutPeer)
{
    _clientConfig.connectTimeoutMs = 300;
    _clientConfig.dtls.flightIntervalMs = 100;
    DataTransport client(1, _clientConfig, _link.first());
    EXPECT_EQ(DataTransport::Result::Timeout, client.connect());
    EXPECT_EQ(DataTransport::State::Failed, client.getState());
    EXPECT_FALSE(client.getFailureReason().empty());
    EXPECT_EQ(DataTransport::Result::Error, client.connect());
}

TEST_F(DataTransportTest, binaryAbcOverDtlsAndSctp)
{
    connectBoth();
    std::unique_ptr<DataTransport::Stream> local;
    std::unique_ptr<DataTransport::Stream> remote;
    openChat(local, remote);

    const uint8_t abc[] = {'A', 'B', 'C'};
    ASSERT_EQ(DataTransport::Result::Ok, local->write(abc, sizeof(abc), webrtc::WEBRTC_BINARY));

    DataTransport::Message message;
    ASSERT_EQ(DataTransport::Result::Ok, remote->read(message));
    EXPECT_EQ(webrtc::WEBRTC_BINARY, message.payloadProtocol);
    EXPECT_EQ("ABC", toText(message));
}

TEST_F(DataTransportTest, largeMessageIsFragmentedAndAcknowledged)
{
    connectBoth();
    std::unique_ptr<DataTransport::Stream> local;
    std::unique_ptr<DataTransport::Stream> remote;
    openChat(local, remote);

    const auto packetsBefore = _client->getSctpStats().packetsSent;
    std::vector<uint8_t> data(2000);
    for (size_t i = 0; i < data.size(); ++i)
    {
        data[i] = static_cast<uint8_t>(i * 7);
    }
    ASSERT_EQ(DataTransport::Result::Ok, local->write(data.data(), data.size(), webrtc::WEBRTC_BINARY));

    DataTransport::Message message;
    ASSERT_EQ(DataTransport::Result::Ok, remote->read(message));
    EXPECT_EQ(data, message.data);
    EXPECT_GE(_client->getSctpStats().packetsSent - packetsBefore, 2u);

    for (int i = 0; i < 100 && local->getBufferedAmount() > 0; ++i)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(0u, local->getBufferedAmount());
}

TEST_F(DataTransportTest, lossyLinkStillDeliversInOrder)
{
    _clientConfig.sctp.RTO.initial = 100;
    _clientConfig.sctp.RTO.min = 100;
    _clientConfig.readTimeoutMs = 5000;
    _serverConfig.readTimeoutMs = 5000;
    connectBoth();
    std::unique_ptr<DataTransport::Stream> local;
    std::unique_ptr<DataTransport::Stream> remote;
    openChat(local, remote);

    int counter = 0;
    _link.setDropFilter(0, [&counter](const uint8_t*, size_t) { return (++counter % 4) == 0; });

    for (int i = 0; i < 40; ++i)
    {
        ASSERT_EQ(DataTransport::Result::Ok, local->writeString("message " + std::to_string(i)));
    }

    for (int i = 0; i < 40; ++i)
    {
        DataTransport::Message message;
        ASSERT_EQ(DataTransport::Result::Ok, remote->read(message));
        EXPECT_EQ("message " + std::to_string(i), toText(message));
    }
    EXPECT_GT(_link.getDroppedCount(0), 0u);
    EXPECT_GT(_client->getSctpStats().retransmits, 0u);
}

TEST_F(DataTransportTest, unreadMessagesCloseTheReceiveWindow)
{
    const size_t receiveBufferSize = 64 * 1024;
    const size_t messageSize = 8000;
    const int messageCount = 40;
    _serverConfig.sctp.maxReceiveBufferSize = receiveBufferSize;
    _clientConfig.sctp.RTO.initial = 200;
    _clientConfig.sctp.RTO.min = 200;
    _serverConfig.readTimeoutMs = 10000;
    connectBoth();
    std::unique_ptr<DataTransport::Stream> local;
    std::unique_ptr<DataTransport::Stream> remote;
    openChat(local, remote);

    for (int i = 0; i < messageCount; ++i)
    {
        std::vector<uint8_t> data(messageSize, static_cast<uint8_t>(i));
        ASSERT_EQ(DataTransport::Result::Ok, local->write(data.data(), data.size(), webrtc::WEBRTC_BINARY));
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    EXPECT_GT(_server->getReceiveBufferUsed(), 0u);
    EXPECT_LE(_server->getReceiveBufferUsed(), receiveBufferSize + messageSize);
    EXPECT_GT(local->getBufferedAmount(), 0u);

    for (int i = 0; i < messageCount; ++i)
    {
        DataTransport::Message message;
        ASSERT_EQ(DataTransport::Result::Ok, remote->read(message));
        ASSERT_EQ(messageSize, message.data.size());
        EXPECT_EQ(static_cast<uint8_t>(i), message.data[0]);
        EXPECT_LE(_server->getReceiveBufferUsed(), receiveBufferSize + messageSize);
    }
    EXPECT_EQ(0u, _server->getReceiveBufferUsed());
}
