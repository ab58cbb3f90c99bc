#include "rtp/RtcpNackBuilder.h"
#include "rtp/RtcpFeedback.h"
#include <gtest/gtest.h>
#include <utility>
#include <vector>

namespace
{
std::vector<std::pair<uint16_t, uint16_t>> writeAndParse(const rtp::RtcpNackBuilder& builder)
{
    alignas(4) uint8_t buffer[256];
    const size_t size = builder.write(buffer, sizeof(buffer));
    EXPECT_EQ(builder.size(), size);
    EXPECT_TRUE(rtp::isNack(buffer, size));

    std::vector<std::pair<uint16_t, uint16_t>> items;
    auto* feedback = rtp::RtcpFeedback::fromPtr(buffer, size);
    if (!feedback)
    {
        return items;
    }
    EXPECT_EQ(1u, feedback->senderSsrc.get());
    EXPECT_EQ(2u, feedback->mediaSsrc.get());
    EXPECT_EQ(size, feedback->header.size());

    const auto* nackItems = rtp::getNackItems(*feedback);
    for (size_t i = 0; i < rtp::getNackItemCount(*feedback); ++i)
    {
        items.emplace_back(nackItems[i].pid.get(), nackItems[i].blp.get());
    }
    return items;
}
} // namespace

TEST(RtcpNackBuilderTest, singleSequenceNumber)
{
    rtp::RtcpNackBuilder builder(1, 2);
    EXPECT_TRUE(builder.empty());
    EXPECT_TRUE(builder.add(1234));
    EXPECT_FALSE(builder.empty());
    ASSERT_EQ(sizeof(rtp::RtcpFeedback) + 4, builder.size());

    alignas(4) uint8_t data[64];
    ASSERT_EQ(16u, builder.write(data, sizeof(data)));
    EXPECT_EQ(0x81, data[0]);
    EXPECT_EQ(205, data[1]);
    EXPECT_EQ(0x04, data[12]);
    EXPECT_EQ(0xD2, data[13]);
    EXPECT_EQ(0x00, data[14]);
    EXPECT_EQ(0x00, data[15]);
}

TEST(RtcpNackBuilderTest, followingSequenceNumbersGoIntoBitmask)
{
    rtp::RtcpNackBuilder builder(1, 2);
    EXPECT_TRUE(builder.add(1234));
    EXPECT_TRUE(builder.add(1235));
    EXPECT_TRUE(builder.add(1235));
    EXPECT_TRUE(builder.add(1250));

    const auto items = writeAndParse(builder);
    ASSERT_EQ(1u, items.size());
    EXPECT_EQ(1234, items[0].first);
    EXPECT_EQ(0x8001, items[0].second);
}

TEST(RtcpNackBuilderTest, distantSequenceNumberStartsNewItem)
{
    rtp::RtcpNackBuilder builder(1, 2);
    EXPECT_TRUE(builder.add(1234));
    EXPECT_TRUE(builder.add(1251));

    const auto items = writeAndParse(builder);
    ASSERT_EQ(2u, items.size());
    EXPECT_EQ(1234, items[0].first);
    EXPECT_EQ(0, items[0].second);
    EXPECT_EQ(1251, items[1].first);
    EXPECT_EQ(0, items[1].second);
}

TEST(RtcpNackBuilderTest, bitmaskSpansSequenceWrap)
{
    rtp::RtcpNackBuilder builder(1, 2);
    EXPECT_TRUE(builder.add(65535));
    EXPECT_TRUE(builder.add(2));

    const auto items = writeAndParse(builder);
    ASSERT_EQ(1u, items.size());
    EXPECT_EQ(65535, items[0].first);
    EXPECT_EQ(0x0004, items[0].second);
}

TEST(RtcpNackBuilderTest, fullBuilderRejectsNewItem)
{
    rtp::RtcpNackBuilder builder(1, 2);
    for (size_t i = 0; i < rtp::RtcpNackBuilder::MAX_ITEMS; ++i)
    {
        EXPECT_TRUE(builder.add(static_cast<uint16_t>(i * 17)));
    }

    EXPECT_FALSE(builder.add(300));
    // still fits the bitmask of the last item
    EXPECT_TRUE(builder.add(15 * 17 + 3));
    EXPECT_EQ(rtp::RtcpNackBuilder::MAX_ITEMS, writeAndParse(builder).size());
}

TEST(RtcpNackBuilderTest, writeNeedsRoomForWholePacket)
{
    rtp::RtcpNackBuilder builder(1, 2);
    builder.add(10);
    builder.add(40);
    alignas(4) uint8_t data[64];
    EXPECT_EQ(0u, builder.write(data, 19));
    EXPECT_EQ(20u, builder.write(data, 20));
}
