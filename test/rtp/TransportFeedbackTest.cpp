#include "rtp/RtcpHeader.h"
#include "rtp/RtcpTransportFeedback.h"
#include "rtp/TwccRecorder.h"
#include <gtest/gtest.h>
#include <vector>

namespace
{
const uint64_t BASE_US = rtp::RtcpTransportFeedback::REFERENCE_TIME_UNIT_US;

std::vector<rtp::TransportFeedbackStatus> parse(const uint8_t* data, size_t length)
{
    std::vector<rtp::TransportFeedbackStatus> statuses;
    auto* feedback = rtp::RtcpTransportFeedback::fromPtr(data, length);
    EXPECT_NE(nullptr, feedback);
    if (feedback)
    {
        EXPECT_TRUE(rtp::parseTransportFeedback(*feedback, statuses));
    }
    return statuses;
}
} // namespace

TEST(TransportFeedbackTest, runLengthChunks)
{
    rtp::TransportFeedbackBuilder builder(1, 2, 0, 0, BASE_US, 1200);
    for (uint16_t i = 0; i < 7; ++i)
    {
        ASSERT_TRUE(builder.addReceivedPacket(i, BASE_US + i * 250));
    }
    ASSERT_TRUE(builder.addReceivedPacket(7, BASE_US + 65500));

    EXPECT_EQ(1u, builder.getReferenceTime());
    EXPECT_EQ(std::vector<uint16_t>({0x2007, 0x4001}), builder.getChunks());
    EXPECT_EQ(std::vector<int16_t>({0, 1, 1, 1, 1, 1, 1, 256}), builder.getDeltas());

    uint8_t buffer[256];
    const size_t size = builder.build(buffer, sizeof(buffer));
    ASSERT_EQ(36u, size);

    auto* feedback = rtp::RtcpTransportFeedback::fromPtr(buffer, size);
    ASSERT_NE(nullptr, feedback);
    EXPECT_EQ(0, feedback->baseSequenceNumber.get());
    EXPECT_EQ(8, feedback->packetStatusCount.get());
    EXPECT_EQ(1, feedback->header.padding);
    EXPECT_EQ(3u, feedback->header.getPaddingSize());
    EXPECT_EQ(3, buffer[size - 1]);
    EXPECT_EQ(1u, feedback->reporterSsrc.get());
    EXPECT_EQ(2u, feedback->mediaSsrc.get());

    const auto statuses = parse(buffer, size);
    ASSERT_EQ(8u, statuses.size());
    for (size_t i = 0; i < 7; ++i)
    {
        EXPECT_TRUE(statuses[i].received);
        EXPECT_EQ(static_cast<int64_t>(BASE_US + i * 250), statuses[i].arrivalUs);
    }
    EXPECT_EQ(static_cast<int64_t>(BASE_US + 65500), statuses[7].arrivalUs);
}

TEST(TransportFeedbackTest, statusVectorWithLosses)
{
    rtp::TransportFeedbackBuilder builder(1, 2, 5, 100, BASE_US * 3, 1200);
    ASSERT_TRUE(builder.addReceivedPacket(100, BASE_US * 3));
    ASSERT_TRUE(builder.addReceivedPacket(102, BASE_US * 3 + 1000));
    ASSERT_TRUE(builder.addReceivedPacket(103, BASE_US * 3 + 2000));
    ASSERT_TRUE(builder.addReceivedPacket(105, BASE_US * 3 + 3000));

    const auto chunks = builder.getChunks();
    ASSERT_EQ(1u, chunks.size());
    // one bit vector: received, lost, received, received, lost, received
    EXPECT_EQ(0x8000 | 0x2000 | 0x0800 | 0x0400 | 0x0100, chunks[0]);

    uint8_t buffer[256];
    const size_t size = builder.build(buffer, sizeof(buffer));
    ASSERT_EQ(28u, size);
    EXPECT_EQ(1, reinterpret_cast<const rtp::RtcpHeader*>(buffer)->padding);
    EXPECT_EQ(2, buffer[size - 1]);

    const auto statuses = parse(buffer, size);
    ASSERT_EQ(6u, statuses.size());
    EXPECT_EQ(100, statuses[0].sequenceNumber);
    EXPECT_FALSE(statuses[1].received);
    EXPECT_TRUE(statuses[2].received);
    EXPECT_FALSE(statuses[4].received);
    EXPECT_EQ(static_cast<int64_t>(BASE_US * 3 + 3000), statuses[5].arrivalUs);
}

TEST(TransportFeedbackTest, negativeDeltaUsesTwoBitVector)
{
    rtp::TransportFeedbackBuilder builder(1, 2, 0, 0, BASE_US, 1200);
    ASSERT_TRUE(builder.addReceivedPacket(0, BASE_US + 5000));
    ASSERT_TRUE(builder.addReceivedPacket(1, BASE_US + 4000));
    ASSERT_TRUE(builder.addReceivedPacket(2, BASE_US + 4250));

    const auto chunks = builder.getChunks();
    ASSERT_EQ(1u, chunks.size());
    EXPECT_EQ(0xC000 | (1 << 12) | (2 << 10) | (1 << 8), chunks[0]);

    uint8_t buffer[256];
    const auto statuses = parse(buffer, builder.build(buffer, sizeof(buffer)));
    ASSERT_EQ(3u, statuses.size());
    EXPECT_EQ(static_cast<int64_t>(BASE_US + 4000), statuses[1].arrivalUs);
}

TEST(TransportFeedbackTest, alignedFeedbackHasNoPadding)
{
    rtp::TransportFeedbackBuilder builder(1, 2, 0, 0, BASE_US, 1200);
    for (uint16_t i = 0; i < 6; ++i)
    {
        ASSERT_TRUE(builder.addReceivedPacket(i, BASE_US + i * 250));
    }

    uint8_t buffer[256];
    const size_t size = builder.build(buffer, sizeof(buffer));
    ASSERT_EQ(28u, size);
    EXPECT_EQ(0, reinterpret_cast<const rtp::RtcpHeader*>(buffer)->padding);
    EXPECT_EQ(6u, parse(buffer, size).size());
}

TEST(TransportFeedbackTest, builderRejectsPacketBeyondSizeLimit)
{
    rtp::TransportFeedbackBuilder builder(1, 2, 0, 0, BASE_US, 24);
    EXPECT_TRUE(builder.addReceivedPacket(0, BASE_US));
    EXPECT_TRUE(builder.addReceivedPacket(1, BASE_US + 250));
    EXPECT_FALSE(builder.addReceivedPacket(2, BASE_US + 70000));
    EXPECT_EQ(2u, builder.getPacketCount());
}

TEST(TransportFeedbackTest, truncatedFeedbackFailsToParse)
{
    rtp::TransportFeedbackBuilder builder(1, 2, 0, 0, BASE_US, 1200);
    for (uint16_t i = 0; i < 4; ++i)
    {
        ASSERT_TRUE(builder.addReceivedPacket(i, BASE_US + i * 250));
    }
    uint8_t buffer[256];
    const size_t size = builder.build(buffer, sizeof(buffer));
    ASSERT_EQ(28u, size);

    auto* feedback = reinterpret_cast<rtp::RtcpTransportFeedback*>(buffer);
    feedback->packetStatusCount = 40;
    std::vector<rtp::TransportFeedbackStatus> statuses;
    EXPECT_FALSE(rtp::parseTransportFeedback(*feedback, statuses));
}

TEST(TwccRecorderTest, feedbackSpansSequenceWrap)
{
    rtp::TwccRecorder recorder(0x1111);
    recorder.onPacketReceived(0x2222, 65534, BASE_US);
    recorder.onPacketReceived(0x2222, 65535, BASE_US + 1000);
    recorder.onPacketReceived(0x2222, 1, BASE_US + 3000);
    recorder.onPacketReceived(0x2222, 0, BASE_US + 2500);
    EXPECT_EQ(4u, recorder.size());

    uint8_t buffer[1500];
    const size_t size = recorder.buildFeedback(buffer, sizeof(buffer), 1200);
    ASSERT_GT(size, 0u);
    EXPECT_TRUE(recorder.empty());
    EXPECT_EQ(1, recorder.getFeedbackPacketCount());

    auto* feedback = rtp::RtcpTransportFeedback::fromPtr(buffer, size);
    ASSERT_NE(nullptr, feedback);
    EXPECT_EQ(size, feedback->header.size());
    EXPECT_EQ(65534, feedback->baseSequenceNumber.get());
    EXPECT_EQ(0x2222u, feedback->mediaSsrc.get());
    EXPECT_EQ(0, feedback->feedbackPacketCount);

    const auto statuses = parse(buffer, size);
    ASSERT_EQ(4u, statuses.size());
    EXPECT_EQ(0, statuses[2].sequenceNumber);
    EXPECT_EQ(static_cast<int64_t>(BASE_US + 2500), statuses[2].arrivalUs);
    EXPECT_TRUE(statuses[3].received);

    // already reported
    recorder.onPacketReceived(0x2222, 65535, BASE_US + 5000);
    EXPECT_TRUE(recorder.empty());
}

TEST(TwccRecorderTest, splitsIntoSeveralPackets)
{
    rtp::TwccRecorder recorder(1);
    for (uint16_t i = 0; i < 100; ++i)
    {
        // large deltas only, two bytes each
        recorder.onPacketReceived(2, i, BASE_US + i * 100000);
    }

    uint8_t buffer[4096];
    const size_t size = recorder.buildFeedback(buffer, sizeof(buffer), 120);
    ASSERT_GT(size, 0u);
    EXPECT_TRUE(recorder.empty());

    size_t reported = 0;
    size_t packetCount = 0;
    for (const auto& header : rtp::CompoundRtcpPacket(buffer, size))
    {
        EXPECT_LE(header.size(), 120u);
        reported += parse(reinterpret_cast<const uint8_t*>(&header), header.size()).size();
        ++packetCount;
    }
    EXPECT_EQ(100u, reported);
    EXPECT_GT(packetCount, 1u);
    EXPECT_EQ(packetCount, recorder.getFeedbackPacketCount());
}
