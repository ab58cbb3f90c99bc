#include "crypto/SslHelper.h"
#include "transport/dtls/DtlsCipherSuite.h"
#include "transport/dtls/DtlsPrf.h"
#include <algorithm>
#include <gtest/gtest.h>
#include <string>

using namespace dtls;

namespace
{
std::vector<uint8_t> makeBytes(size_t count, uint8_t start)
{
    std::vector<uint8_t> bytes(count);
    for (size_t i = 0; i < count; ++i)
    {
        bytes[i] = static_cast<uint8_t>(start + i);
    }
    return bytes;
}

KeyMaterial makeKeys(const CipherSuiteInfo& suite)
{
    Random clientRandom;
    Random serverRandom;
    clientRandom.fill(1);
    serverRandom.fill(2);
    return computeKeyMaterial(suite, makeBytes(48, 7), clientRandom, serverRandom);
}

RecordHeader makeHeader(uint64_t sequence, size_t length)
{
    RecordHeader header;
    header.contentType = APPLICATION_DATA;
    header.epoch = 1;
    header.sequenceNumber = sequence;
    header.length = length;
    return header;
}
} // namespace

TEST(DtlsPrfTest, sha256Vector)
{
    const auto secret = crypto::fromHexString("9bbe436ba940f017b17652849a71db35");
    const auto seed = crypto::fromHexString("a0ba9f936cda311827a6f796ffd5198c");
    const auto output = prf(crypto::DigestType::SHA256, secret, "test label", seed, 100);

    EXPECT_EQ("e3f229ba727be17b8d122620557cd453c2aab21d07c3d495329b52d4e61edb5a6b301791e90d35c9c9a46b4e14baf9af0fa0"
              "22f7077def17abfd3797c0564bab4fbc91666e9def9b97fce34f796789baa48082d122ee42c5a72e5a5110fff70187347b66",
        crypto::toHexString(output.data(), output.size()));
}

TEST(DtlsPrfTest, outputIsPrefixStable)
{
    const auto secret = makeBytes(16, 0);
    const auto seed = makeBytes(16, 100);
    const auto shortOut = prf(crypto::DigestType::SHA384, secret, "label", seed, 20);
    const auto longOut = prf(crypto::DigestType::SHA384, secret, "label", seed, 120);

    ASSERT_EQ(20u, shortOut.size());
    ASSERT_EQ(120u, longOut.size());
    EXPECT_TRUE(std::equal(shortOut.begin(), shortOut.end(), longOut.begin()));
}

TEST(DtlsPrfTest, masterSecretModes)
{
    Random clientRandom;
    Random serverRandom;
    clientRandom.fill(0x11);
    serverRandom.fill(0x22);
    const auto preMaster = makeBytes(32, 3);

    const auto master = computeMasterSecret(crypto::DigestType::SHA256, preMaster, clientRandom, serverRandom);
    const auto extended =
        computeExtendedMasterSecret(crypto::DigestType::SHA256, preMaster, makeBytes(32, 9));
    EXPECT_EQ(MASTER_SECRET_SIZE, master.size());
    EXPECT_EQ(MASTER_SECRET_SIZE, extended.size());
    EXPECT_NE(master, extended);

    // swapping the randoms must change the secret
    EXPECT_NE(master, computeMasterSecret(crypto::DigestType::SHA256, preMaster, serverRandom, clientRandom));
}

TEST(DtlsPrfTest, verifyDataDiffersBySide)
{
    const auto master = makeBytes(48, 1);
    const auto hash = makeBytes(32, 50);
    const auto client = computeVerifyData(crypto::DigestType::SHA256, master, true, hash);
    const auto server = computeVerifyData(crypto::DigestType::SHA256, master, false, hash);

    EXPECT_EQ(VERIFY_DATA_SIZE, client.size());
    EXPECT_NE(client, server);
}

TEST(DtlsPrfTest, pskPreMasterSecret)
{
    const std::vector<uint8_t> psk = {0xAA, 0xBB, 0xCC};
    const auto secret = makePskPreMasterSecret(psk);

    const std::vector<uint8_t> expected = {0, 3, 0, 0, 0, 0, 3, 0xAA, 0xBB, 0xCC};
    EXPECT_EQ(expected, secret);
}

TEST(DtlsPrfTest, keyMaterialLengths)
{
    auto gcm = findCipherSuite(static_cast<uint16_t>(CipherSuiteId::TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384));
    ASSERT_NE(nullptr, gcm);
    auto keys = makeKeys(*gcm);
    EXPECT_TRUE(keys.clientMacKey.empty());
    EXPECT_EQ(32u, keys.clientKey.size());
    EXPECT_EQ(4u, keys.serverIv.size());
    EXPECT_NE(keys.clientKey, keys.serverKey);

    auto cbc = findCipherSuite(static_cast<uint16_t>(CipherSuiteId::TLS_ECDHE_RSA_WITH_AES_256_CBC_SHA));
    ASSERT_NE(nullptr, cbc);
    keys = makeKeys(*cbc);
    EXPECT_EQ(20u, keys.serverMacKey.size());
    EXPECT_EQ(32u, keys.serverKey.size());
}

TEST(DtlsCipherSuiteTest, lookup)
{
    auto suite = findCipherSuite("TLS_PSK_WITH_AES_128_GCM_SHA256");
    ASSERT_NE(nullptr, suite);
    EXPECT_TRUE(suite->isPsk());
    EXPECT_FALSE(suite->requiresCertificate());
    EXPECT_EQ(0x00A8, static_cast<uint16_t>(suite->id));

    EXPECT_EQ(nullptr, findCipherSuite(0x0035));
    EXPECT_EQ(nullptr, findCipherSuite("TLS_RSA_WITH_AES_128_CBC_SHA"));
    EXPECT_EQ(8u, allCipherSuites().size());
}

class DtlsRecordCipherTest : public ::testing::TestWithParam<CipherSuiteId>
{
};

TEST_P(DtlsRecordCipherTest, protectAndTamper)
{
    auto suite = findCipherSuite(static_cast<uint16_t>(GetParam()));
    ASSERT_NE(nullptr, suite);
    const auto keys = makeKeys(*suite);
    auto clientWrite = createRecordCipher(*suite, keys, true);
    auto serverRead = createRecordCipher(*suite, keys, true);
    auto serverWrite = createRecordCipher(*suite, keys, false);
    ASSERT_TRUE(clientWrite && serverRead && serverWrite);

    const std::string text = "datagram transport layer security";
    std::vector<uint8_t> fragment;
    ASSERT_TRUE(clientWrite->encrypt(makeHeader(5, text.size()),
        reinterpret_cast<const uint8_t*>(text.data()),
        text.size(),
        fragment));
    EXPECT_LE(fragment.size(), text.size() + clientWrite->overhead());

    std::vector<uint8_t> plaintext;
    ASSERT_TRUE(serverRead->decrypt(makeHeader(5, fragment.size()), fragment.data(), fragment.size(), plaintext));
    EXPECT_EQ(text, std::string(plaintext.begin(), plaintext.end()));

    // sequence number is authenticated
    EXPECT_FALSE(serverRead->decrypt(makeHeader(6, fragment.size()), fragment.data(), fragment.size(), plaintext));

    fragment[fragment.size() / 2] ^= 0x40;
    EXPECT_FALSE(serverRead->decrypt(makeHeader(5, fragment.size()), fragment.data(), fragment.size(), plaintext));

    std::vector<uint8_t> serverFragment;
    ASSERT_TRUE(serverWrite->encrypt(makeHeader(5, text.size()),
        reinterpret_cast<const uint8_t*>(text.data()),
        text.size(),
        serverFragment));
    EXPECT_FALSE(
        serverRead->decrypt(makeHeader(5, serverFragment.size()), serverFragment.data(), serverFragment.size(), plaintext));
}

INSTANTIATE_TEST_SUITE_P(AllSuites,
    DtlsRecordCipherTest,
    ::testing::Values(CipherSuiteId::TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256,
        CipherSuiteId::TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384,
        CipherSuiteId::TLS_ECDHE_ECDSA_WITH_AES_256_CBC_SHA,
        CipherSuiteId::TLS_PSK_WITH_AES_128_CBC_SHA256));
