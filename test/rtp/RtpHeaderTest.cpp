#include "memory/Packet.h"
#include "rtp/RtpHeader.h"
#include <cstring>
#include <gtest/gtest.h>

namespace
{
void makePacket(memory::Packet& packet, size_t payloadLength)
{
    auto* header = rtp::RtpHeader::create(packet.get(), memory::Packet::size);
    header->ssrc = 4711;
    header->sequenceNumber = 100;
    header->payloadType = 100;
    for (size_t i = 0; i < payloadLength; ++i)
    {
        header->getPayload()[i] = static_cast<uint8_t>(i);
    }
    packet.setLength(rtp::MIN_RTP_HEADER_SIZE + payloadLength);
}

bool payloadIntact(const memory::Packet& packet, size_t payloadLength)
{
    auto* header = rtp::RtpHeader::fromPacket(packet);
    if (!header || header->getPayloadLength(packet.getLength()) != payloadLength)
    {
        return false;
    }
    for (size_t i = 0; i < payloadLength; ++i)
    {
        if (header->getPayload()[i] != static_cast<uint8_t>(i))
        {
            return false;
        }
    }
    return true;
}
} // namespace

TEST(RtpHeaderTest, createAndParse)
{
    memory::Packet packet;
    makePacket(packet, 20);
    EXPECT_TRUE(rtp::isRtpPacket(packet));

    auto* header = rtp::RtpHeader::fromPacket(packet);
    ASSERT_NE(nullptr, header);
    EXPECT_EQ(2, header->version);
    EXPECT_EQ(12u, header->headerLength());
    EXPECT_EQ(4711u, header->ssrc.get());
    EXPECT_EQ(nullptr, header->getExtensionHeader());
    EXPECT_TRUE(payloadIntact(packet, 20));

    EXPECT_EQ(nullptr, rtp::RtpHeader::fromPtr(packet.get(), 8));
}

TEST(RtpHeaderTest, paddingIsExcludedFromPayload)
{
    memory::Packet packet;
    makePacket(packet, 20);
    auto* header = rtp::RtpHeader::fromPacket(packet);
    header->padding = 1;
    packet.get()[packet.getLength() - 1] = 4;
    EXPECT_EQ(16u, header->getPayloadLength(packet.getLength()));
}

TEST(RtpHeaderTest, oneByteExtensionIsAddedAndReplaced)
{
    memory::Packet packet;
    makePacket(packet, 30);

    ASSERT_TRUE(rtp::setTransportWideSequenceNumber(packet, 3, 0x1234));
    auto* header = rtp::RtpHeader::fromPacket(packet);
    ASSERT_NE(nullptr, header->getExtensionHeader());
    EXPECT_TRUE(header->getExtensionHeader()->isOneByteProfile());
    EXPECT_EQ(0, header->headerLength() % 4);
    EXPECT_TRUE(payloadIntact(packet, 30));

    uint16_t sequenceNumber = 0;
    ASSERT_TRUE(rtp::getTransportWideSequenceNumber(packet, 3, sequenceNumber));
    EXPECT_EQ(0x1234, sequenceNumber);

    const size_t length = packet.getLength();
    ASSERT_TRUE(rtp::setTransportWideSequenceNumber(packet, 3, 0x4321));
    EXPECT_EQ(length, packet.getLength());
    ASSERT_TRUE(rtp::getTransportWideSequenceNumber(packet, 3, sequenceNumber));
    EXPECT_EQ(0x4321, sequenceNumber);

    EXPECT_FALSE(rtp::getTransportWideSequenceNumber(packet, 4, sequenceNumber));
}

TEST(RtpHeaderTest, largeElementSwitchesToTwoByteForm)
{
    memory::Packet packet;
    makePacket(packet, 10);
    const uint8_t audioLevel = 0x85;
    ASSERT_TRUE(rtp::setExtension(packet, 1, &audioLevel, 1));

    uint8_t large[20];
    std::memset(large, 0xAB, sizeof(large));
    ASSERT_TRUE(rtp::setExtension(packet, 2, large, sizeof(large)));

    auto* header = rtp::RtpHeader::fromPacket(packet);
    ASSERT_NE(nullptr, header->getExtensionHeader());
    EXPECT_TRUE(header->getExtensionHeader()->isTwoByteProfile());
    EXPECT_TRUE(payloadIntact(packet, 10));

    const uint8_t* data = nullptr;
    uint8_t length = 0;
    ASSERT_TRUE(rtp::getExtension(packet, 1, data, length));
    ASSERT_EQ(1, length);
    EXPECT_EQ(0x85, data[0]);
    ASSERT_TRUE(rtp::getExtension(packet, 2, data, length));
    ASSERT_EQ(20, length);
    EXPECT_EQ(0, std::memcmp(large, data, sizeof(large)));
}

TEST(RtpHeaderTest, extensionIdZeroIsRejected)
{
    memory::Packet packet;
    makePacket(packet, 10);
    const uint8_t value = 1;
    EXPECT_FALSE(rtp::setExtension(packet, 0, &value, 1));
    EXPECT_EQ(22u, packet.getLength());
}
