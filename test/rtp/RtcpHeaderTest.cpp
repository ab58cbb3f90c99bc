#include "memory/Packet.h"
#include "rtp/RtcpHeader.h"
#include "rtp/RtpHeader.h"
#include "utils/Time.h"
#include <gtest/gtest.h>
#include <vector>

using namespace rtp;

TEST(RtcpHeaderTest, sourceDescriptionChunks)
{
    alignas(4) uint8_t buffer[256];
    auto* sdes = RtcpSourceDescription::create(buffer);
    ASSERT_TRUE(sdes->addChunk(1001, "rtcstack", sizeof(buffer)));
    EXPECT_EQ(20u, sdes->size());
    ASSERT_TRUE(sdes->addChunk(1002, "second.source", sizeof(buffer)));
    EXPECT_EQ(40u, sdes->size());
    EXPECT_EQ(2, sdes->getChunkCount());
    EXPECT_FALSE(sdes->addChunk(1003, "no room", 44));

    std::vector<SdesChunk> chunks;
    ASSERT_TRUE(sdes->getChunks(chunks));
    ASSERT_EQ(2u, chunks.size());
    EXPECT_EQ(1001u, chunks[0].ssrc);
    EXPECT_EQ("rtcstack", chunks[0].cname);
    EXPECT_EQ(1002u, chunks[1].ssrc);
    EXPECT_EQ("second.source", chunks[1].cname);
}

TEST(RtcpHeaderTest, sourceDescriptionWithoutTerminatorIsRejected)
{
    alignas(4) uint8_t buffer[64];
    auto* sdes = RtcpSourceDescription::create(buffer);
    ASSERT_TRUE(sdes->addChunk(1001, "abc", sizeof(buffer)));
    // overwrite the terminating null octets with another item header
    buffer[4 + 4 + 2 + 3] = SDESItem::NOTE;
    buffer[4 + 4 + 2 + 4] = 10;

    std::vector<SdesChunk> chunks;
    EXPECT_FALSE(sdes->getChunks(chunks));
}

TEST(RtcpHeaderTest, goodbyeListsSources)
{
    alignas(4) uint8_t buffer[64];
    auto* bye = RtcpGoodbye::create(buffer, 5);
    bye->addSsrc(6);
    EXPECT_EQ(12u, bye->header.size());

    auto* parsed = RtcpGoodbye::fromPtr(buffer, bye->header.size());
    ASSERT_NE(nullptr, parsed);
    EXPECT_EQ(2u, parsed->getSsrcCount());
    EXPECT_EQ(5u, parsed->ssrc[0].get());
    EXPECT_EQ(6u, parsed->ssrc[1].get());
    EXPECT_EQ(nullptr, RtcpGoodbye::fromPtr(buffer, 8));
}

TEST(RtcpHeaderTest, compoundIteration)
{
    alignas(4) uint8_t buffer[512] = {};
    auto* report = RtcpSenderReport::create(buffer);
    report->ssrc = 10;
    auto& block = report->addReportBlock(20);
    block.setFractionLost(0.25);
    block.setCumulativeLoss(300);
    size_t length = report->size();

    auto* sdes = RtcpSourceDescription::create(buffer + length);
    sdes->addChunk(10, "cname", sizeof(buffer) - length);
    length += sdes->size();

    auto* bye = RtcpGoodbye::create(buffer + length, 10);
    length += bye->header.size();

    ASSERT_TRUE(CompoundRtcpPacket::isValid(buffer, length));
    CompoundRtcpPacket compound(buffer, length);
    std::vector<uint8_t> types;
    for (auto& header : compound)
    {
        types.push_back(header.packetType);
    }
    EXPECT_EQ(std::vector<uint8_t>({SENDER_REPORT, SOURCE_DESCRIPTION, GOODBYE}), types);

    auto* sr = RtcpSenderReport::fromPtr(buffer, length);
    ASSERT_NE(nullptr, sr);
    EXPECT_EQ(52u, sr->size());
    EXPECT_EQ(64u, sr->reportBlocks[0].getFractionLostRaw());
    EXPECT_EQ(300u, sr->reportBlocks[0].getCumulativeLoss());

    EXPECT_FALSE(CompoundRtcpPacket::isValid(buffer, length - 4));
    EXPECT_FALSE(CompoundRtcpPacket::isValid(buffer, length + 4));
}

TEST(RtcpHeaderTest, paddingOnlyOnLastPacket)
{
    alignas(4) uint8_t buffer[128] = {};
    auto* first = RtcpGoodbye::create(buffer, 1);
    auto* second = RtcpGoodbye::create(buffer + 8, 2);
    second->header.addPadding(2);
    EXPECT_EQ(8u, second->header.getPaddingSize());
    EXPECT_TRUE(CompoundRtcpPacket::isValid(buffer, 8 + second->header.size()));

    first->header.padding = 1;
    EXPECT_FALSE(CompoundRtcpPacket::isValid(buffer, 8 + second->header.size()));
}

TEST(RtcpHeaderTest, rtpAndRtcpShareAPort)
{
    memory::Packet rtpPacket;
    auto* rtpHeader = RtpHeader::create(rtpPacket.get(), memory::Packet::size);
    rtpHeader->payloadType = 96;
    rtpPacket.setLength(100);
    EXPECT_TRUE(isRtpPacket(rtpPacket));
    EXPECT_FALSE(isRtcpPacket(rtpPacket));

    memory::Packet rtcpPacket;
    auto* report = RtcpReceiverReport::create(rtcpPacket.get());
    report->ssrc = 1;
    rtcpPacket.setLength(report->header.size());
    EXPECT_TRUE(isRtcpPacket(rtcpPacket));
    EXPECT_FALSE(isRtpPacket(rtcpPacket));
    EXPECT_TRUE(isValidRtcpPacket(rtcpPacket));
}

TEST(RtcpHeaderTest, delaySinceLastSenderReport)
{
    ReportBlock block;
    block.setDelaySinceLastSR(utils::Time::sec * 3 / 2);
    EXPECT_EQ(0x18000u, block.delaySinceLastSR.get());
    EXPECT_EQ(utils::Time::sec * 3 / 2, block.getDelaySinceLastSR());
}
