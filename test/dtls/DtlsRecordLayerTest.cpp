#include "transport/dtls/DtlsPrf.h"
#include "transport/dtls/DtlsRecordLayer.h"
#include "transport/dtls/DtlsWriteListener.h"
#include <gtest/gtest.h>
#include <vector>

using namespace dtls;

namespace
{
class DatagramCollector : public transport::DtlsWriteListener
{
public:
    int32_t sendDtls(const char* buffer, uint32_t length) override
    {
        datagrams.emplace_back(buffer, buffer + length);
        return length;
    }

    std::vector<std::vector<uint8_t>> datagrams;
};

class RecordSink : public DtlsRecordLayer::IEvents
{
public:
    void onDtlsHandshakeMessage(const HandshakeMessage& message, uint16_t epoch) override
    {
        messages.push_back(message);
    }
    void onDtlsHandshakeRetransmission(uint16_t messageSeq, uint16_t epoch) override { ++retransmissions; }
    void onDtlsChangeCipherSpec(uint16_t epoch) override { ++changeCipherSpecs; }
    void onDtlsAlert(AlertLevel level, AlertDescription description) override { alerts.push_back(description); }
    void onDtlsApplicationData(const uint8_t* data, size_t length) override
    {
        applicationData.emplace_back(data, data + length);
    }

    std::vector<HandshakeMessage> messages;
    std::vector<std::vector<uint8_t>> applicationData;
    std::vector<AlertDescription> alerts;
    int retransmissions = 0;
    int changeCipherSpecs = 0;
};

HandshakeMessage makeMessage(HandshakeType type, uint16_t seq, size_t size)
{
    HandshakeMessage message;
    message.type = type;
    message.messageSeq = seq;
    message.body.resize(size);
    for (size_t i = 0; i < size; ++i)
    {
        message.body[i] = static_cast<uint8_t>(i * 7);
    }
    return message;
}

void installCiphers(DtlsRecordLayer& client, DtlsRecordLayer& server)
{
    auto suite = findCipherSuite(static_cast<uint16_t>(CipherSuiteId::TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256));
    Random clientRandom;
    Random serverRandom;
    clientRandom.fill(3);
    serverRandom.fill(4);
    const auto keys = computeKeyMaterial(*suite, std::vector<uint8_t>(48, 9), clientRandom, serverRandom);
    client.setPendingCipher(createRecordCipher(*suite, keys, true), createRecordCipher(*suite, keys, false));
    server.setPendingCipher(createRecordCipher(*suite, keys, false), createRecordCipher(*suite, keys, true));
}
} // namespace

class DtlsRecordLayerTest : public ::testing::Test
{
public:
    DtlsRecordLayerTest()
        : _loggableId("RecordTest"),
          _sender(_loggableId, _sendLink, _senderEvents, 300),
          _receiver(_loggableId, _receiveLink, _receiverEvents, 300)
    {
    }

protected:
    void deliver(size_t index) { _receiver.onRecordsReceived(_sendLink.datagrams[index].data(), _sendLink.datagrams[index].size()); }

    logger::LoggableId _loggableId;
    DatagramCollector _sendLink;
    DatagramCollector _receiveLink;
    RecordSink _senderEvents;
    RecordSink _receiverEvents;
    DtlsRecordLayer _sender;
    DtlsRecordLayer _receiver;
};

TEST(HandshakeReassemblerTest, reverseOrderFragments)
{
    HandshakeReassembler reassembler;
    const auto message = makeMessage(CERTIFICATE, 0, 90);

    HandshakeFragmentHeader header;
    header.type = CERTIFICATE;
    header.length = 90;
    header.messageSeq = 0;

    for (int offset = 60; offset >= 0; offset -= 30)
    {
        header.fragmentOffset = offset;
        header.fragmentLength = 30;
        ASSERT_TRUE(reassembler.addFragment(header, message.body.data() + offset));
        HandshakeMessage result;
        if (offset > 0)
        {
            EXPECT_FALSE(reassembler.pop(result));
        }
        else
        {
            ASSERT_TRUE(reassembler.pop(result));
            EXPECT_EQ(message.body, result.body);
            EXPECT_EQ(1, reassembler.getNextSeq());
        }
    }
}

TEST(HandshakeReassemblerTest, overlappingAndOutOfSequence)
{
    HandshakeReassembler reassembler;
    const auto first = makeMessage(SERVER_HELLO, 0, 40);
    const auto second = makeMessage(SERVER_HELLO_DONE, 1, 20);

    HandshakeFragmentHeader header;
    header.type = SERVER_HELLO_DONE;
    header.length = 20;
    header.messageSeq = 1;
    header.fragmentOffset = 0;
    header.fragmentLength = 20;
    ASSERT_TRUE(reassembler.addFragment(header, second.body.data()));

    HandshakeMessage result;
    EXPECT_FALSE(reassembler.pop(result));

    header.type = SERVER_HELLO;
    header.length = 40;
    header.messageSeq = 0;
    header.fragmentOffset = 0;
    header.fragmentLength = 25;
    ASSERT_TRUE(reassembler.addFragment(header, first.body.data()));
    header.fragmentOffset = 10;
    header.fragmentLength = 30;
    ASSERT_TRUE(reassembler.addFragment(header, first.body.data() + 10));

    ASSERT_TRUE(reassembler.pop(result));
    EXPECT_EQ(SERVER_HELLO, result.type);
    EXPECT_EQ(first.body, result.body);
    ASSERT_TRUE(reassembler.pop(result));
    EXPECT_EQ(SERVER_HELLO_DONE, result.type);

    // conflicting total length for a known sequence number
    header.messageSeq = 2;
    header.length = 40;
    header.fragmentOffset = 0;
    header.fragmentLength = 10;
    ASSERT_TRUE(reassembler.addFragment(header, first.body.data()));
    header.length = 50;
    EXPECT_FALSE(reassembler.addFragment(header, first.body.data()));
}

TEST(HandshakeReassemblerTest, oversizedMessageIsRefused)
{
    HandshakeReassembler reassembler;
    const uint8_t byte = 0;

    HandshakeFragmentHeader header;
    header.type = CERTIFICATE;
    header.length = 0xFFFFFF;
    header.messageSeq = 0;
    header.fragmentOffset = 0;
    header.fragmentLength = 1;
    EXPECT_FALSE(reassembler.addFragment(header, &byte));
    EXPECT_EQ(0u, reassembler.getPendingCount());

    header.length = HandshakeReassembler::MAX_MESSAGE_SIZE;
    EXPECT_TRUE(reassembler.addFragment(header, &byte));
    EXPECT_EQ(1u, reassembler.getPendingCount());
}

TEST(HandshakeReassemblerTest, messagesFarAheadAreNotBuffered)
{
    HandshakeReassembler reassembler;
    const uint8_t byte = 0;

    HandshakeFragmentHeader header;
    header.type = CERTIFICATE;
    header.length = 1000;
    header.fragmentOffset = 0;
    header.fragmentLength = 1;
    for (uint32_t seq = 1; seq <= 64; ++seq)
    {
        header.messageSeq = static_cast<uint16_t>(seq);
        EXPECT_TRUE(reassembler.addFragment(header, &byte));
    }
    EXPECT_EQ(HandshakeReassembler::MAX_MESSAGES_AHEAD - 1u, reassembler.getPendingCount());
}

TEST_F(DtlsRecordLayerTest, fragmentsToMtu)
{
    const auto message = makeMessage(CERTIFICATE, 0, 1000);
    ASSERT_TRUE(_sender.writeHandshake(message));
    _sender.flush();

    ASSERT_GT(_sendLink.datagrams.size(), 3u);
    for (auto& datagram : _sendLink.datagrams)
    {
        EXPECT_LE(datagram.size(), 300u);
    }

    for (size_t i = _sendLink.datagrams.size(); i > 0; --i)
    {
        deliver(i - 1);
    }
    ASSERT_EQ(1u, _receiverEvents.messages.size());
    EXPECT_EQ(message.body, _receiverEvents.messages[0].body);
}

TEST_F(DtlsRecordLayerTest, packsSmallRecords)
{
    ASSERT_TRUE(_sender.writeHandshake(makeMessage(SERVER_HELLO, 0, 50)));
    ASSERT_TRUE(_sender.writeHandshake(makeMessage(SERVER_KEY_EXCHANGE, 1, 60)));
    ASSERT_TRUE(_sender.writeHandshake(makeMessage(SERVER_HELLO_DONE, 2, 0)));
    _sender.flush();

    ASSERT_EQ(1u, _sendLink.datagrams.size());
    deliver(0);
    ASSERT_EQ(3u, _receiverEvents.messages.size());
    EXPECT_EQ(SERVER_HELLO_DONE, _receiverEvents.messages[2].type);
    EXPECT_TRUE(_receiverEvents.messages[2].body.empty());

    deliver(0);
    EXPECT_EQ(3u, _receiverEvents.messages.size());
}

TEST_F(DtlsRecordLayerTest, retransmittedMessagesAreReported)
{
    const auto message = makeMessage(CLIENT_HELLO, 0, 80);
    _sender.writeHandshake(message);
    _sender.flush();
    _sender.writeHandshake(message);
    _sender.flush();

    deliver(0);
    deliver(1);
    EXPECT_EQ(1u, _receiverEvents.messages.size());
    EXPECT_EQ(1, _receiverEvents.retransmissions);
}

TEST_F(DtlsRecordLayerTest, epochChange)
{
    installCiphers(_sender, _receiver);

    _sender.writeHandshake(makeMessage(CLIENT_KEY_EXCHANGE, 0, 33));
    ASSERT_TRUE(_sender.writeChangeCipherSpec());
    EXPECT_EQ(1, _sender.getWriteEpoch());
    _sender.writeHandshake(makeMessage(FINISHED, 1, 12));
    const uint8_t text[] = {'h', 'i'};
    ASSERT_TRUE(_sender.writeApplicationData(text, sizeof(text)));
    _sender.flush();
    ASSERT_EQ(1u, _sendLink.datagrams.size());

    deliver(0);
    EXPECT_EQ(1, _receiverEvents.changeCipherSpecs);
    ASSERT_EQ(1u, _receiverEvents.messages.size());
    // epoch 1 records wait for the read cipher
    EXPECT_TRUE(_receiverEvents.applicationData.empty());

    ASSERT_TRUE(_receiver.activateReadCipher());
    EXPECT_EQ(1, _receiver.getReadEpoch());
    ASSERT_EQ(2u, _receiverEvents.messages.size());
    EXPECT_EQ(FINISHED, _receiverEvents.messages[1].type);
    ASSERT_EQ(1u, _receiverEvents.applicationData.size());
    EXPECT_EQ(2u, _receiverEvents.applicationData[0].size());
}

TEST_F(DtlsRecordLayerTest, replayedAndCorruptRecordsDropped)
{
    installCiphers(_sender, _receiver);
    _sender.activateWriteCipher();
    _receiver.activateReadCipher();

    const uint8_t text[] = {1, 2, 3, 4};
    _sender.writeApplicationData(text, sizeof(text));
    _sender.flush();

    deliver(0);
    deliver(0);
    EXPECT_EQ(1u, _receiverEvents.applicationData.size());

    _sender.writeApplicationData(text, sizeof(text));
    _sender.flush();
    auto corrupt = _sendLink.datagrams[1];
    corrupt.back() ^= 1;
    EXPECT_EQ(NO_ALERT, _receiver.onRecordsReceived(corrupt.data(), corrupt.size()));
    EXPECT_EQ(1u, _receiverEvents.applicationData.size());

    deliver(1);
    EXPECT_EQ(2u, _receiverEvents.applicationData.size());
}

TEST_F(DtlsRecordLayerTest, plaintextApplicationDataIgnored)
{
    const uint8_t text[] = {1, 2, 3};
    _sender.writeApplicationData(text, sizeof(text));
    _sender.writeAlert(WARNING, USER_CANCELED);
    _sender.flush();

    deliver(0);
    EXPECT_TRUE(_receiverEvents.applicationData.empty());
    ASSERT_EQ(1u, _receiverEvents.alerts.size());
    EXPECT_EQ(USER_CANCELED, _receiverEvents.alerts[0]);
}

TEST_F(DtlsRecordLayerTest, maxApplicationDataSize)
{
    EXPECT_EQ(300u - RECORD_HEADER_SIZE, _sender.getMaxApplicationDataSize());
    installCiphers(_sender, _receiver);
    _sender.activateWriteCipher();
    EXPECT_EQ(300u - RECORD_HEADER_SIZE - 8 - 16, _sender.getMaxApplicationDataSize());

    std::vector<uint8_t> tooLarge(DtlsRecordLayer::MAX_PLAINTEXT_SIZE + 1);
    EXPECT_FALSE(_sender.writeApplicationData(tooLarge.data(), tooLarge.size()));
}
