#include "memory/Packet.h"
#include "mocks/RtpSessionEventsMock.h"
#include "rtp/RtcpFeedback.h"
#include "rtp/RtcpHeader.h"
#include "rtp/RtpHeader.h"
#include "transport/RtpSession.h"
#include "transport/RtpWriter.h"
#include "utils/Time.h"
#include <algorithm>
#include <cstring>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

using namespace testing;
using transport::RtpPacketAttributes;
using transport::RtpSession;

namespace
{
const uint64_t START_TIME = utils::Time::sec * 100;
const uint32_t AUDIO_SSRC = 0x0A0A0A0A;

struct PacketCollector : public transport::RtpWriter
{
    bool writeRtpDatagram(const memory::Packet& packet, uint64_t timestamp) override
    {
        packets.push_back(packet);
        return true;
    }

    std::vector<memory::Packet> packets;
};

memory::Packet makeRtp(uint32_t ssrc, uint16_t sequenceNumber, size_t payloadLength = 160)
{
    memory::Packet packet;
    auto* header = rtp::RtpHeader::create(packet.get(), memory::Packet::size);
    header->ssrc = ssrc;
    header->sequenceNumber = sequenceNumber;
    header->timestamp = sequenceNumber * 960u;
    header->payloadType = 111;
    std::memset(header->getPayload(), sequenceNumber & 0xFF, payloadLength);
    packet.setLength(rtp::MIN_RTP_HEADER_SIZE + payloadLength);
    return packet;
}

srtp::AesKey makeKey(uint8_t seed)
{
    srtp::AesKey key;
    key.profile = srtp::AES128_CM_SHA1_80;
    for (uint32_t i = 0; i < key.getLength(); ++i)
    {
        key.keySalt[i] = static_cast<uint8_t>(seed ^ (i * 13));
    }
    return key;
}
} // namespace

class RtpSessionTest : public ::testing::Test
{
public:
    void SetUp() override { createSessions(rtp::RtpSessionConfig()); }

    void createSessions(const rtp::RtpSessionConfig& config)
    {
        _sender = std::make_unique<RtpSession>(1, config, _senderOut, &_senderEvents);
        _receiver = std::make_unique<RtpSession>(2, config, _receiverOut, &_receiverEvents);

        ON_CALL(_receiverEvents, onRtpReceived(_, _, _))
            .WillByDefault(Invoke([this](RtpSession&, memory::Packet&, const RtpPacketAttributes& attributes) {
                _received.push_back(attributes);
            }));
    }

    void protectSessions()
    {
        transport::SrtpConfig config;
        _sender->setSrtpContext(std::make_unique<transport::SrtpContext>(1, config, makeKey(1), makeKey(2)));
        _receiver->setSrtpContext(std::make_unique<transport::SrtpContext>(2, config, makeKey(2), makeKey(1)));
    }

    // hands everything one side wrote to the other, optionally skipping by index
    void deliver(PacketCollector& from, RtpSession& to, uint64_t timestamp, std::vector<size_t> skip = {})
    {
        for (size_t i = 0; i < from.packets.size(); ++i)
        {
            if (std::find(skip.begin(), skip.end(), i) == skip.end())
            {
                to.onPacketReceived(from.packets[i], timestamp);
            }
        }
        from.packets.clear();
    }

protected:
    PacketCollector _senderOut;
    PacketCollector _receiverOut;
    NiceMock<test::RtpSessionEventsMock> _senderEvents;
    NiceMock<test::RtpSessionEventsMock> _receiverEvents;
    std::unique_ptr<RtpSession> _sender;
    std::unique_ptr<RtpSession> _receiver;
    std::vector<RtpPacketAttributes> _received;
};

TEST_F(RtpSessionTest, plainRtpIsDemuxedBySsrc)
{
    for (uint16_t i = 0; i < 3; ++i)
    {
        auto packet = makeRtp(AUDIO_SSRC, 100 + i);
        ASSERT_TRUE(_sender->writeRtp(packet, START_TIME));
        auto video = makeRtp(0xBBBB, 5000 + i, 1000);
        ASSERT_TRUE(_sender->writeRtp(video, START_TIME));
    }
    ASSERT_EQ(6u, _senderOut.packets.size());
    deliver(_senderOut, *_receiver, START_TIME);

    ASSERT_EQ(6u, _received.size());
    EXPECT_EQ(AUDIO_SSRC, _received[0].ssrc);
    EXPECT_EQ(100, _received[0].sequenceNumber);
    EXPECT_EQ(160u, _received[0].payloadLength);
    EXPECT_EQ(12u, _received[0].headerLength);
    EXPECT_FALSE(_received[0].hasTransportSequenceNumber);
    EXPECT_EQ(1000u, _received[1].payloadLength);

    EXPECT_EQ(2u, _receiver->getRemoteSsrcs().size());
    ASSERT_NE(nullptr, _receiver->getReceiveState(AUDIO_SSRC));
    EXPECT_EQ(102u, _receiver->getReceiveState(AUDIO_SSRC)->getExtendedSequenceNumber());
    ASSERT_NE(nullptr, _sender->getSenderState(0xBBBB));
    EXPECT_EQ(3u, _sender->getSenderState(0xBBBB)->getSentPacketsCount());
}

TEST_F(RtpSessionTest, lostPacketIsNackedAndRetransmitted)
{
    for (uint16_t sequenceNumber = 1; sequenceNumber <= 4; ++sequenceNumber)
    {
        auto packet = makeRtp(AUDIO_SSRC, sequenceNumber);
        ASSERT_TRUE(_sender->writeRtp(packet, START_TIME));
    }
    deliver(_senderOut, *_receiver, START_TIME, {2});
    ASSERT_EQ(3u, _received.size());

    _receiver->processTimeout(START_TIME + utils::Time::ms * 101);
    ASSERT_EQ(1u, _receiverOut.packets.size());
    const auto& nack = _receiverOut.packets[0];
    ASSERT_TRUE(rtp::isNack(nack.get(), nack.getLength()));
    EXPECT_EQ(1u, _receiver->getNackCount());

    deliver(_receiverOut, *_sender, START_TIME + utils::Time::ms * 120);
    ASSERT_EQ(1u, _senderOut.packets.size());
    EXPECT_EQ(1u, _sender->getRetransmissionCount());
    EXPECT_EQ(1u, _sender->getSenderState(AUDIO_SSRC)->getCounters().retransmissions);

    deliver(_senderOut, *_receiver, START_TIME + utils::Time::ms * 140);
    ASSERT_EQ(4u, _received.size());
    EXPECT_EQ(3, _received[3].sequenceNumber);

    // nothing missing any more
    _receiver->processTimeout(START_TIME + utils::Time::ms * 202);
    EXPECT_TRUE(_receiverOut.packets.empty());
}

TEST_F(RtpSessionTest, transportWideFeedbackReachesSender)
{
    rtp::RtpSessionConfig config;
    config.twccExtensionId = 5;
    createSessions(config);

    for (uint16_t i = 0; i < 5; ++i)
    {
        auto packet = makeRtp(AUDIO_SSRC, 40 + i);
        ASSERT_TRUE(_sender->writeRtp(packet, START_TIME + i * utils::Time::ms));
        _receiver->onPacketReceived(_senderOut.packets.back(), START_TIME + i * utils::Time::ms * 2);
    }
    ASSERT_EQ(5u, _received.size());
    EXPECT_TRUE(_received[4].hasTransportSequenceNumber);
    EXPECT_EQ(4, _received[4].transportSequenceNumber);
    _senderOut.packets.clear();

    std::vector<rtp::TransportFeedbackStatus> statuses;
    EXPECT_CALL(_senderEvents, onTransportFeedback(_, AUDIO_SSRC, _)).WillOnce(SaveArg<2>(&statuses));

    _receiver->processTimeout(START_TIME + utils::Time::ms * 101);
    ASSERT_EQ(1u, _receiverOut.packets.size());
    deliver(_receiverOut, *_sender, START_TIME + utils::Time::ms * 110);

    ASSERT_EQ(5u, statuses.size());
    for (uint16_t i = 0; i < 5; ++i)
    {
        EXPECT_EQ(i, statuses[i].sequenceNumber);
        EXPECT_TRUE(statuses[i].received);
    }
    EXPECT_EQ(statuses[1].arrivalUs - statuses[0].arrivalUs, 2000);
}

TEST_F(RtpSessionTest, reportsFlowBothWays)
{
    for (uint16_t sequenceNumber = 10; sequenceNumber <= 12; ++sequenceNumber)
    {
        auto packet = makeRtp(AUDIO_SSRC, sequenceNumber);
        ASSERT_TRUE(_sender->writeRtp(packet, START_TIME));
    }
    deliver(_senderOut, *_receiver, START_TIME);

    const uint64_t reportTime = START_TIME + utils::Time::ms * 5001;
    _sender->processTimeout(reportTime);
    ASSERT_EQ(1u, _senderOut.packets.size());
    const auto* senderReport = rtp::RtcpHeader::fromPacket(_senderOut.packets[0]);
    ASSERT_NE(nullptr, senderReport);
    EXPECT_EQ(rtp::SENDER_REPORT, senderReport->packetType);
    deliver(_senderOut, *_receiver, reportTime);
    EXPECT_NE(0u, _receiver->getReceiveState(AUDIO_SSRC)->getLastSenderReportNtp());

    _receiver->processTimeout(reportTime);
    ASSERT_EQ(1u, _receiverOut.packets.size());
    const auto* receiverReport = rtp::RtcpReceiverReport::fromPtr(_receiverOut.packets[0].get(),
        _receiverOut.packets[0].getLength());
    ASSERT_NE(nullptr, receiverReport);
    EXPECT_EQ(_receiver->getSessionSsrc(), receiverReport->ssrc.get());
    deliver(_receiverOut, *_sender, reportTime + utils::Time::ms * 10);

    const auto summary = _sender->getSenderState(AUDIO_SSRC)->getSummary();
    EXPECT_EQ(12u, summary.extendedSeqNoReceived);
    EXPECT_EQ(0u, summary.lostPackets);
}

TEST_F(RtpSessionTest, protectedSessionDropsTamperedPackets)
{
    protectSessions();
    EXPECT_TRUE(_sender->isProtected());

    auto first = makeRtp(AUDIO_SSRC, 1);
    auto second = makeRtp(AUDIO_SSRC, 2);
    ASSERT_TRUE(_sender->writeRtp(first, START_TIME));
    ASSERT_TRUE(_sender->writeRtp(second, START_TIME));
    ASSERT_EQ(2u, _senderOut.packets.size());
    EXPECT_EQ(12u + 160u + 10u, _senderOut.packets[0].getLength());

    _senderOut.packets[1].get()[30] ^= 0xFF;
    EXPECT_CALL(_receiverEvents, onProtectionFailure(_, transport::SrtpContext::Result::AuthFailed, false)).Times(1);
    deliver(_senderOut, *_receiver, START_TIME);

    ASSERT_EQ(1u, _received.size());
    EXPECT_EQ(1, _received[0].sequenceNumber);
    EXPECT_EQ(160u, _received[0].payloadLength);
}

TEST_F(RtpSessionTest, protectedRtcpKeyFrameRequest)
{
    protectSessions();
    auto packet = makeRtp(AUDIO_SSRC, 1);
    ASSERT_TRUE(_sender->writeRtp(packet, START_TIME));
    deliver(_senderOut, *_receiver, START_TIME);

    EXPECT_CALL(_senderEvents, onKeyFrameRequested(_, AUDIO_SSRC)).Times(1);
    ASSERT_TRUE(_receiver->requestKeyFrame(AUDIO_SSRC, START_TIME));
    ASSERT_EQ(1u, _receiverOut.packets.size());
    // plain PLI is 12 bytes
    EXPECT_GT(_receiverOut.packets[0].getLength(), 12u);
    deliver(_receiverOut, *_sender, START_TIME);
}

TEST_F(RtpSessionTest, removedLocalStreamEndsRemoteStream)
{
    _sender->addLocalStream(AUDIO_SSRC, 48000);
    auto packet = makeRtp(AUDIO_SSRC, 1);
    ASSERT_TRUE(_sender->writeRtp(packet, START_TIME));
    deliver(_senderOut, *_receiver, START_TIME);
    ASSERT_EQ(1u, _receiver->getRemoteSsrcs().size());

    EXPECT_CALL(_receiverEvents, onRemoteSsrcEnded(_, AUDIO_SSRC)).Times(1);
    _sender->removeLocalStream(AUDIO_SSRC, START_TIME);
    EXPECT_EQ(nullptr, _sender->getSenderState(AUDIO_SSRC));
    ASSERT_EQ(1u, _senderOut.packets.size());
    deliver(_senderOut, *_receiver, START_TIME);

    EXPECT_TRUE(_receiver->getRemoteSsrcs().empty());
}

TEST_F(RtpSessionTest, inboundStreamCountIsLimited)
{
    for (uint32_t ssrc = 1; ssrc <= RtpSession::MAX_INBOUND_STREAMS + 10; ++ssrc)
    {
        auto packet = makeRtp(ssrc, 1, 20);
        _receiver->onPacketReceived(packet, START_TIME);
    }
    EXPECT_EQ(RtpSession::MAX_INBOUND_STREAMS, _receiver->getRemoteSsrcs().size());
    EXPECT_EQ(RtpSession::MAX_INBOUND_STREAMS, _received.size());
}

TEST_F(RtpSessionTest, oversizedPacketIsRefused)
{
    auto packet = makeRtp(AUDIO_SSRC, 1, 1250);
    EXPECT_FALSE(_sender->writeRtp(packet, START_TIME));
    EXPECT_TRUE(_senderOut.packets.empty());

    memory::Packet garbage;
    const uint8_t bytes[] = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c};
    garbage.append(bytes, sizeof(bytes));
    _receiver->onPacketReceived(garbage, START_TIME);
    EXPECT_TRUE(_received.empty());
}

TEST_F(RtpSessionTest, generatedCnameAndSsrc)
{
    EXPECT_NE(0u, _sender->getSessionSsrc());
    EXPECT_EQ(16u, _sender->getCname().size());
    EXPECT_NE(_sender->getCname(), _receiver->getCname());

    rtp::RtpSessionConfig config;
    config.cname = "user@host";
    PacketCollector out;
    RtpSession named(3, config, out, nullptr);
    EXPECT_EQ("user@host", named.getCname());
}
