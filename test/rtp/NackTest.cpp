#include "memory/Packet.h"
#include "rtp/NackGenerator.h"
#include "rtp/NackResponder.h"
#include "rtp/RtpHeader.h"
#include <gtest/gtest.h>

using Missing = std::vector<uint16_t>;

TEST(NackGeneratorTest, reportsGapsAcrossWrap)
{
    rtp::NackGenerator generator(1024);
    for (uint16_t sequenceNumber : {65533, 65534, 0, 1, 3})
    {
        generator.onPacketReceived(sequenceNumber);
    }

    EXPECT_EQ(Missing({65535, 2}), generator.getMissingSequenceNumbers(0));
    EXPECT_EQ(65534, generator.getLastConsecutive());
    EXPECT_EQ(3, generator.getEnd());
}

TEST(NackGeneratorTest, lateArrivalClearsGap)
{
    rtp::NackGenerator generator(1024);
    generator.onPacketReceived(10);
    generator.onPacketReceived(13);
    EXPECT_EQ(Missing({11, 12}), generator.getMissingSequenceNumbers(0));

    generator.onPacketReceived(11);
    EXPECT_EQ(Missing({12}), generator.getMissingSequenceNumbers(0));
    EXPECT_EQ(11, generator.getLastConsecutive());

    generator.onPacketReceived(12);
    EXPECT_TRUE(generator.getMissingSequenceNumbers(0).empty());
    EXPECT_EQ(13, generator.getLastConsecutive());
}

TEST(NackGeneratorTest, skipLastN)
{
    rtp::NackGenerator generator(1024);
    generator.onPacketReceived(100);
    generator.onPacketReceived(102);
    generator.onPacketReceived(104);
    EXPECT_EQ(Missing({101, 103}), generator.getMissingSequenceNumbers(0));
    EXPECT_EQ(Missing({101}), generator.getMissingSequenceNumbers(2));
    EXPECT_TRUE(generator.getMissingSequenceNumbers(4).empty());
}

TEST(NackGeneratorTest, duplicatesAndAncientPacketsAreIgnored)
{
    rtp::NackGenerator generator(64);
    generator.onPacketReceived(1000);
    generator.onPacketReceived(1000);
    generator.onPacketReceived(1001);
    generator.onPacketReceived(900);
    EXPECT_EQ(1001, generator.getEnd());
    EXPECT_EQ(1001, generator.getLastConsecutive());
    EXPECT_FALSE(generator.isReceived(900));
}

TEST(NackGeneratorTest, jumpBeyondWindowLimitsReport)
{
    rtp::NackGenerator generator(64);
    EXPECT_EQ(64, generator.getSize());
    generator.onPacketReceived(0);
    generator.onPacketReceived(1000);

    const auto missing = generator.getMissingSequenceNumbers(0);
    ASSERT_EQ(63u, missing.size());
    EXPECT_EQ(937, missing.front());
    EXPECT_EQ(999, missing.back());
}

TEST(NackGeneratorTest, sizeValidation)
{
    EXPECT_TRUE(rtp::NackGenerator::isValidSize(64));
    EXPECT_TRUE(rtp::NackGenerator::isValidSize(32768));
    EXPECT_FALSE(rtp::NackGenerator::isValidSize(32));
    EXPECT_FALSE(rtp::NackGenerator::isValidSize(1000));
    EXPECT_EQ(1024, rtp::NackGenerator(1000).getSize());
}

namespace
{
void sendPacket(rtp::NackResponder& responder, uint16_t sequenceNumber)
{
    memory::Packet packet;
    auto* header = rtp::RtpHeader::create(packet.get(), memory::Packet::size);
    header->sequenceNumber = sequenceNumber;
    header->ssrc = 1;
    header->payloadType = 96;
    header->getPayload()[0] = static_cast<uint8_t>(sequenceNumber);
    packet.setLength(rtp::MIN_RTP_HEADER_SIZE + 1);
    responder.onPacketSent(packet);
}
} // namespace

TEST(NackResponderTest, storesRecentPackets)
{
    rtp::NackResponder responder(16);
    for (uint16_t sequenceNumber = 65530; sequenceNumber != 11; ++sequenceNumber)
    {
        sendPacket(responder, sequenceNumber);
    }

    auto* packet = responder.getPacket(5);
    ASSERT_NE(nullptr, packet);
    EXPECT_EQ(5, rtp::RtpHeader::fromPacket(*packet)->getPayload()[0]);
    ASSERT_NE(nullptr, responder.getPacket(65535));

    // slot reused by sequence number 10
    EXPECT_EQ(nullptr, responder.getPacket(65530));
    ASSERT_NE(nullptr, responder.getPacket(10));
    EXPECT_EQ(nullptr, responder.getPacket(11));
}

TEST(NackResponderTest, sizeIsPowerOfTwo)
{
    EXPECT_EQ(1024, rtp::NackResponder(1000).getSize());
    EXPECT_EQ(rtp::NackResponder::MAX_SIZE, rtp::NackResponder(20000).getSize());
}
