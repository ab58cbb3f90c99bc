#include "codec/H264Header.h"
#include "codec/H264Packetizer.h"
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
} // namespace

TEST(H264Packetizer, smallUnitIsSentWhole)
{
    H264Packetizer packetizer;
    const Payload nalUnit = {0x90, 0x90, 0x90};
    std::vector<Payload> payloads;
    packetizer.packetize(nalUnit.data(), nalUnit.size(), 5, payloads);

    ASSERT_EQ(1u, payloads.size());
    EXPECT_EQ(nalUnit, payloads[0]);
}

TEST(H264Packetizer, largeUnitIsFragmented)
{
    H264Packetizer packetizer;
    Payload nalUnit = {0x00};
    for (uint8_t i = 1; i <= 0x15; ++i)
    {
        nalUnit.push_back(i);
    }

    std::vector<Payload> payloads;
    packetizer.packetize(nalUnit.data(), nalUnit.size(), 5, payloads);

    ASSERT_EQ(7u, payloads.size());
    EXPECT_EQ(Payload({0x1C, 0x80, 0x01, 0x02, 0x03}), payloads[0]);
    EXPECT_EQ(Payload({0x1C, 0x00, 0x04, 0x05, 0x06}), payloads[1]);
    EXPECT_EQ(Payload({0x1C, 0x00, 0x10, 0x11, 0x12}), payloads[5]);
    EXPECT_EQ(Payload({0x1C, 0x40, 0x13, 0x14, 0x15}), payloads[6]);
}

TEST(H264Packetizer, parameterSetsGoInStapA)
{
    H264Packetizer packetizer;
    const auto stream = annexB({{0x67, 0xAA}, {0x68, 0xBB}, {0x09, 0x10}, {0x65, 0xCC, 0xDD}});
    std::vector<Payload> payloads;
    packetizer.packetize(stream.data(), stream.size(), 1200, payloads);

    ASSERT_EQ(2u, payloads.size());
    EXPECT_EQ(Payload({0x78, 0x00, 0x02, 0x67, 0xAA, 0x00, 0x02, 0x68, 0xBB}), payloads[0]);
    EXPECT_EQ(Payload({0x65, 0xCC, 0xDD}), payloads[1]);
    EXPECT_TRUE(H264Header::isKeyFrame(payloads[0].data(), payloads[0].size()));
}

TEST(H264Packetizer, parameterSetsCarryOverToNextAccessUnit)
{
    H264Packetizer packetizer;
    const auto parameterSets = annexB({{0x67, 0xAA}, {0x68, 0xBB}});
    std::vector<Payload> payloads;
    packetizer.packetize(parameterSets.data(), parameterSets.size(), 1200, payloads);
    EXPECT_TRUE(payloads.empty());

    const auto frame = annexB({{0x65, 0xCC}});
    packetizer.packetize(frame.data(), frame.size(), 1200, payloads);
    ASSERT_EQ(2u, payloads.size());
    EXPECT_EQ(H264Header::STAP_A, H264Header::getNalUnitType(payloads[0][0]));
}

TEST(H264Packetizer, parameterSetsSentSinglyWhenStapAExceedsMtu)
{
    H264Packetizer packetizer;
    const auto stream = annexB({{0x67, 0xAA, 0xBB}, {0x68, 0xCC}, {0x65, 0x01}});
    std::vector<Payload> payloads;
    packetizer.packetize(stream.data(), stream.size(), 5, payloads);

    ASSERT_EQ(3u, payloads.size());
    EXPECT_EQ(Payload({0x67, 0xAA, 0xBB}), payloads[0]);
    EXPECT_EQ(Payload({0x68, 0xCC}), payloads[1]);
    EXPECT_EQ(Payload({0x65, 0x01}), payloads[2]);
}

TEST(H264Depacketizer, stapAAndSingleUnit)
{
    H264Depacketizer depacketizer;
    const Payload stapA = {0x78, 0x00, 0x02, 0x67, 0xAA, 0x00, 0x02, 0x68, 0xBB};
    const Payload idr = {0x65, 0xCC, 0xDD};

    Payload out;
    ASSERT_EQ(DepacketizeResult::Ok, depacketizer.depacketize(stapA.data(), stapA.size(), out));
    ASSERT_EQ(DepacketizeResult::Ok, depacketizer.depacketize(idr.data(), idr.size(), out));
    EXPECT_EQ(annexB({{0x67, 0xAA}, {0x68, 0xBB}, {0x65, 0xCC, 0xDD}}), out);
}

TEST(H264Depacketizer, outOfBandParameterSetsPrecedeIdr)
{
    H264Depacketizer depacketizer;
    depacketizer.setParameterSets({0x67, 0x01}, {0x68, 0x02});

    const Payload idr = {0x65, 0xCC, 0xDD};
    const Payload slice = {0x41, 0xEE, 0xFF};
    Payload out;
    ASSERT_EQ(DepacketizeResult::Ok, depacketizer.depacketize(idr.data(), idr.size(), out));
    EXPECT_EQ(annexB({{0x67, 0x01}, {0x68, 0x02}, {0x65, 0xCC, 0xDD}}), out);

    out.clear();
    ASSERT_EQ(DepacketizeResult::Ok, depacketizer.depacketize(slice.data(), slice.size(), out));
    EXPECT_EQ(annexB({{0x41, 0xEE, 0xFF}}), out);

    out.clear();
    ASSERT_EQ(DepacketizeResult::Ok, depacketizer.depacketize(idr.data(), idr.size(), out));
    EXPECT_EQ(annexB({{0x67, 0x01}, {0x68, 0x02}, {0x65, 0xCC, 0xDD}}), out);
}

TEST(H264Depacketizer, fragmentsAreReassembled)
{
    const Payload nalUnit = {0x65, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    H264Packetizer packetizer;
    std::vector<Payload> payloads;
    packetizer.packetize(nalUnit.data(), nalUnit.size(), 6, payloads);
    ASSERT_EQ(3u, payloads.size());
    EXPECT_EQ(0x7C, payloads[0][0]);
    EXPECT_EQ(0x85, payloads[0][1]);
    EXPECT_TRUE(H264Depacketizer::isPartitionHead(payloads[0].data(), payloads[0].size()));
    EXPECT_FALSE(H264Depacketizer::isPartitionHead(payloads[1].data(), payloads[1].size()));
    EXPECT_TRUE(H264Header::isKeyFrame(payloads[0].data(), payloads[0].size()));
    EXPECT_FALSE(H264Header::isKeyFrame(payloads[2].data(), payloads[2].size()));

    H264Depacketizer depacketizer(H264Depacketizer::Format::Avc);
    Payload out;
    EXPECT_EQ(DepacketizeResult::Incomplete, depacketizer.depacketize(payloads[0].data(), payloads[0].size(), out));
    EXPECT_TRUE(depacketizer.hasPendingFragment());
    EXPECT_EQ(DepacketizeResult::Incomplete, depacketizer.depacketize(payloads[1].data(), payloads[1].size(), out));
    EXPECT_EQ(DepacketizeResult::Ok, depacketizer.depacketize(payloads[2].data(), payloads[2].size(), out));
    EXPECT_FALSE(depacketizer.hasPendingFragment());

    Payload expected = {0, 0, 0, 11};
    expected.insert(expected.end(), nalUnit.begin(), nalUnit.end());
    EXPECT_EQ(expected, out);
}

TEST(H264Depacketizer, oversizedFragmentedUnitIsDropped)
{
    H264Depacketizer depacketizer;
    Payload out;
    Payload fragment(60000, 0x11);
    fragment[0] = 0x7C;
    fragment[1] = 0x85;
    ASSERT_EQ(DepacketizeResult::Incomplete, depacketizer.depacketize(fragment.data(), fragment.size(), out));

    fragment[1] = 0x05;
    size_t buffered = fragment.size() - 1;
    while (buffered + fragment.size() - 2 <= MAX_FRAGMENTED_UNIT_SIZE)
    {
        ASSERT_EQ(DepacketizeResult::Incomplete, depacketizer.depacketize(fragment.data(), fragment.size(), out));
        buffered += fragment.size() - 2;
    }
    EXPECT_EQ(DepacketizeResult::Malformed, depacketizer.depacketize(fragment.data(), fragment.size(), out));
    EXPECT_FALSE(depacketizer.hasPendingFragment());
    EXPECT_EQ(DepacketizeResult::Malformed, depacketizer.depacketize(fragment.data(), fragment.size(), out));
    EXPECT_TRUE(out.empty());

    const Payload whole = {0x7C, 0xC5, 0x01, 0x02};
    ASSERT_EQ(DepacketizeResult::Ok, depacketizer.depacketize(whole.data(), whole.size(), out));
    EXPECT_EQ(annexB({{0x65, 0x01, 0x02}}), out);
}

TEST(H264Depacketizer, invalidPayloads)
{
    H264Depacketizer depacketizer;
    Payload out;

    const Payload tiny = {0x65, 0x01};
    EXPECT_EQ(DepacketizeResult::ShortPacket, depacketizer.depacketize(tiny.data(), tiny.size(), out));

    const Payload continuation = {0x7C, 0x05, 0x01, 0x02};
    EXPECT_EQ(DepacketizeResult::Malformed, depacketizer.depacketize(continuation.data(), continuation.size(), out));

    const Payload truncatedStapA = {0x78, 0x00, 0x05, 0x67, 0xAA};
    EXPECT_EQ(DepacketizeResult::Malformed,
        depacketizer.depacketize(truncatedStapA.data(), truncatedStapA.size(), out));

    const Payload fuB = {0x1D, 0x85, 0x00, 0x01};
    EXPECT_EQ(DepacketizeResult::Unsupported, depacketizer.depacketize(fuB.data(), fuB.size(), out));
    EXPECT_TRUE(out.empty());
}

TEST(H264Header, keyFrameDetection)
{
    const Payload sps = {0x67, 0x00};
    const Payload slice = {0x41, 0x00};
    const Payload fuStartOfSps = {0x1C, 0x87};
    const Payload fuMiddle = {0x1C, 0x07};
    const Payload stapA = {0x18, 0x00, 0x01, 0x41, 0x00, 0x01, 0x67, 0x00};

    EXPECT_TRUE(H264Header::isKeyFrame(sps.data(), sps.size()));
    EXPECT_FALSE(H264Header::isKeyFrame(slice.data(), slice.size()));
    EXPECT_TRUE(H264Header::isKeyFrame(fuStartOfSps.data(), fuStartOfSps.size()));
    EXPECT_FALSE(H264Header::isKeyFrame(fuMiddle.data(), fuMiddle.size()));
    EXPECT_TRUE(H264Header::isKeyFrame(stapA.data(), stapA.size()));
}
