#include "codec/H265Packetizer.h"
#include <gtest/gtest.h>

using namespace codec;

namespace
{
Payload annexB(std::initializer_list<Payload> nalUnits)
{
    Payload stream;
    for (const auto& nalUnit : nalUnits)
    {
        AnnexB::appendStartCode(stream);
        stream.insert(stream.end(), nalUnit.begin(), nalUnit.end());
    }
    return stream;
}

const Payload vps = {0x40, 0x01, 0xAA};
const Payload sps = {0x42, 0x01, 0xBB};
const Payload pps = {0x44, 0x01, 0xCC};
const Payload idr = {0x26, 0x01, 0xDD, 0xEE};
} // namespace

TEST(H265Packetizer, parameterSetsAreAggregated)
{
    H265Packetizer packetizer;
    const auto stream = annexB({vps, sps, pps, idr});
    std::vector<Payload> payloads;
    packetizer.packetize(stream.data(), stream.size(), 1200, payloads);

    ASSERT_EQ(2u, payloads.size());
    EXPECT_EQ(Payload({0x60,
                  0x01,
                  0x00,
                  0x03,
                  0x40,
                  0x01,
                  0xAA,
                  0x00,
                  0x03,
                  0x42,
                  0x01,
                  0xBB,
                  0x00,
                  0x03,
                  0x44,
                  0x01,
                  0xCC}),
        payloads[0]);
    EXPECT_EQ(idr, payloads[1]);

    H265Depacketizer depacketizer;
    Payload out;
    ASSERT_EQ(DepacketizeResult::Ok, depacketizer.depacketize(payloads[0].data(), payloads[0].size(), out));
    ASSERT_EQ(DepacketizeResult::Ok, depacketizer.depacketize(payloads[1].data(), payloads[1].size(), out));
    EXPECT_EQ(stream, out);
}

TEST(H265Packetizer, decodingOrderNumbersWithDonl)
{
    H265Packetizer packetizer(true);
    const auto stream = annexB({vps, sps, pps, idr});
    std::vector<Payload> payloads;
    packetizer.packetize(stream.data(), stream.size(), 1200, payloads);

    ASSERT_EQ(2u, payloads.size());
    EXPECT_EQ(Payload({0x60,
                  0x01,
                  0x00,
                  0x00,
                  0x00,
                  0x03,
                  0x40,
                  0x01,
                  0xAA,
                  0x00,
                  0x00,
                  0x03,
                  0x42,
                  0x01,
                  0xBB,
                  0x00,
                  0x00,
                  0x03,
                  0x44,
                  0x01,
                  0xCC}),
        payloads[0]);
    EXPECT_EQ(Payload({0x26, 0x01, 0x00, 0x03, 0xDD, 0xEE}), payloads[1]);

    H265Depacketizer depacketizer(true);
    Payload out;
    ASSERT_EQ(DepacketizeResult::Ok, depacketizer.depacketize(payloads[0].data(), payloads[0].size(), out));
    EXPECT_EQ(0, depacketizer.getLastDonl());
    ASSERT_EQ(DepacketizeResult::Ok, depacketizer.depacketize(payloads[1].data(), payloads[1].size(), out));
    EXPECT_EQ(3, depacketizer.getLastDonl());
    EXPECT_EQ(stream, out);
}

TEST(H265Packetizer, largeUnitIsFragmented)
{
    const Payload nalUnit = {0x26, 0x01, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    H265Packetizer packetizer;
    std::vector<Payload> payloads;
    packetizer.packetize(nalUnit.data(), nalUnit.size(), 7, payloads);

    ASSERT_EQ(3u, payloads.size());
    EXPECT_EQ(Payload({0x62, 0x01, 0x93, 1, 2, 3, 4}), payloads[0]);
    EXPECT_EQ(Payload({0x62, 0x01, 0x13, 5, 6, 7, 8}), payloads[1]);
    EXPECT_EQ(Payload({0x62, 0x01, 0x53, 9, 10}), payloads[2]);

    H265Depacketizer depacketizer;
    Payload out;
    EXPECT_EQ(DepacketizeResult::Incomplete, depacketizer.depacketize(payloads[0].data(), payloads[0].size(), out));
    EXPECT_EQ(DepacketizeResult::Incomplete, depacketizer.depacketize(payloads[1].data(), payloads[1].size(), out));
    EXPECT_TRUE(depacketizer.hasPendingFragment());
    EXPECT_EQ(DepacketizeResult::Ok, depacketizer.depacketize(payloads[2].data(), payloads[2].size(), out));
    EXPECT_EQ(annexB({nalUnit}), out);
}

TEST(H265Depacketizer, paciPayloadIsUnwrapped)
{
    H265Depacketizer depacketizer;
    const Payload paci = {0x64, 0x01, 0x26, 0x00, 0xDD, 0xEE};
    Payload out;
    ASSERT_EQ(DepacketizeResult::Ok, depacketizer.depacketize(paci.data(), paci.size(), out));
    EXPECT_EQ(annexB({idr}), out);

    const Payload paciWithExtensions = {0x64, 0x01, 0x26, 0x20, 0x55, 0x66, 0xDD, 0xEE};
    out.clear();
    ASSERT_EQ(DepacketizeResult::Ok, depacketizer.depacketize(paciWithExtensions.data(), paciWithExtensions.size(), out));
    EXPECT_EQ(annexB({idr}), out);
}

TEST(H265Depacketizer, oversizedFragmentedUnitIsDropped)
{
    H265Depacketizer depacketizer;
    Payload out;
    Payload fragment(60000, 0x11);
    fragment[0] = 0x62;
    fragment[1] = 0x01;
    fragment[2] = 0x93;
    ASSERT_EQ(DepacketizeResult::Incomplete, depacketizer.depacketize(fragment.data(), fragment.size(), out));

    fragment[2] = 0x13;
    size_t buffered = fragment.size() - 1;
    while (buffered + fragment.size() - 3 <= MAX_FRAGMENTED_UNIT_SIZE)
    {
        ASSERT_EQ(DepacketizeResult::Incomplete, depacketizer.depacketize(fragment.data(), fragment.size(), out));
        buffered += fragment.size() - 3;
    }
    EXPECT_EQ(DepacketizeResult::Malformed, depacketizer.depacketize(fragment.data(), fragment.size(), out));
    EXPECT_FALSE(depacketizer.hasPendingFragment());
    EXPECT_EQ(DepacketizeResult::Malformed, depacketizer.depacketize(fragment.data(), fragment.size(), out));
    EXPECT_TRUE(out.empty());

    const Payload whole = {0x62, 0x01, 0xD3, 0xDD, 0xEE};
    ASSERT_EQ(DepacketizeResult::Ok, depacketizer.depacketize(whole.data(), whole.size(), out));
    EXPECT_EQ(annexB({idr}), out);
}

TEST(H265Depacketizer, invalidPayloads)
{
    H265Depacketizer depacketizer;
    Payload out;

    const Payload tiny = {0x26, 0x01};
    EXPECT_EQ(DepacketizeResult::ShortPacket, depacketizer.depacketize(tiny.data(), tiny.size(), out));

    const Payload forbidden = {0xA6, 0x01, 0xDD};
    EXPECT_EQ(DepacketizeResult::Malformed, depacketizer.depacketize(forbidden.data(), forbidden.size(), out));

    const Payload continuation = {0x62, 0x01, 0x13, 0x05};
    EXPECT_EQ(DepacketizeResult::Malformed, depacketizer.depacketize(continuation.data(), continuation.size(), out));

    const Payload truncatedAggregation = {0x60, 0x01, 0x00, 0x09, 0x40, 0x01};
    EXPECT_EQ(DepacketizeResult::Malformed,
        depacketizer.depacketize(truncatedAggregation.data(), truncatedAggregation.size(), out));

    const Payload nestedPaci = {0x64, 0x01, 0x64, 0x00, 0xDD};
    EXPECT_EQ(DepacketizeResult::Malformed, depacketizer.depacketize(nestedPaci.data(), nestedPaci.size(), out));
    EXPECT_TRUE(out.empty());
}
