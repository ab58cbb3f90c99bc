#include "crypto/SslHelper.h"
#include <cstring>
#include <gtest/gtest.h>
#include <vector>

using crypto::fromHexString;
using crypto::toHexString;

// FIPS-197 appendix C.1
TEST(AES, ecbBlock)
{
    const auto key = fromHexString("000102030405060708090a0b0c0d0e0f");
    const auto plaintext = fromHexString("00112233445566778899aabbccddeeff");
    crypto::AES aes(crypto::AES::Mode::ECB, key.data(), key.size());
    ASSERT_TRUE(aes.isValid());

    uint8_t out[crypto::AES::BLOCK_SIZE];
    ASSERT_TRUE(aes.ecbEncryptBlock(plaintext.data(), out));
    EXPECT_EQ(toHexString(out, sizeof(out)), "69c4e0d86a7b0430d8cdb78070b4c55a");
}

// SP 800-38A F.5.1
TEST(AES, counterMode)
{
    const auto key = fromHexString("2b7e151628aed2a6abf7158809cf4f3c");
    const auto counter = fromHexString("f0f1f2f3f4f5f6f7f8f9fafbfcfdfeff");
    auto data = fromHexString("6bc1bee22e409f96e93d7e117393172a");
    crypto::AES aes(crypto::AES::Mode::CTR, key.data(), key.size());

    ASSERT_TRUE(aes.ctrTransform(counter.data(), data.data(), data.data(), data.size()));
    EXPECT_EQ(toHexString(data.data(), data.size()), "874d6191b620e3261bef6864990db6ce");

    ASSERT_TRUE(aes.ctrTransform(counter.data(), data.data(), data.data(), data.size()));
    EXPECT_EQ(toHexString(data.data(), data.size()), "6bc1bee22e409f96e93d7e117393172a");
}

// SP 800-38A F.2.1
TEST(AES, cbcMode)
{
    const auto key = fromHexString("2b7e151628aed2a6abf7158809cf4f3c");
    const auto iv = fromHexString("000102030405060708090a0b0c0d0e0f");
    const auto plaintext = fromHexString("6bc1bee22e409f96e93d7e117393172a");
    crypto::AES aes(crypto::AES::Mode::CBC, key.data(), key.size());

    uint8_t cipherText[16];
    ASSERT_TRUE(aes.cbcEncrypt(iv.data(), plaintext.data(), cipherText, sizeof(cipherText)));
    EXPECT_EQ(toHexString(cipherText, sizeof(cipherText)), "7649abac8119b246cee98e9b12e9197d");

    uint8_t decrypted[16];
    ASSERT_TRUE(aes.cbcDecrypt(iv.data(), cipherText, decrypted, sizeof(decrypted)));
    EXPECT_EQ(0, std::memcmp(decrypted, plaintext.data(), sizeof(decrypted)));
}

// GCM spec test cases 1 and 2
TEST(AES, gcmZeroKey)
{
    const std::vector<uint8_t> key(16, 0);
    const std::vector<uint8_t> iv(12, 0);
    crypto::AES aes(crypto::AES::Mode::GCM, key.data(), key.size());

    uint8_t tagOnly[crypto::AES::GCM_TAG_SIZE];
    ASSERT_TRUE(aes.gcmEncrypt(iv.data(), iv.size(), nullptr, 0, nullptr, 0, tagOnly));
    EXPECT_EQ(toHexString(tagOnly, sizeof(tagOnly)), "58e2fccefa7e3061367f1d57a4e7455a");

    const std::vector<uint8_t> plaintext(16, 0);
    uint8_t out[16 + crypto::AES::GCM_TAG_SIZE];
    ASSERT_TRUE(aes.gcmEncrypt(iv.data(), iv.size(), nullptr, 0, plaintext.data(), plaintext.size(), out));
    EXPECT_EQ(toHexString(out, 16), "0388dace60b6a392f328c2b971b2fe78");
    EXPECT_EQ(toHexString(out + 16, 16), "ab6e47d42cec13bdf53a67b21257bddf");

    uint8_t decrypted[16];
    ASSERT_TRUE(aes.gcmDecrypt(iv.data(), iv.size(), nullptr, 0, out, sizeof(out), decrypted));
    EXPECT_EQ(0, std::memcmp(decrypted, plaintext.data(), sizeof(decrypted)));

    out[20] ^= 1;
    EXPECT_FALSE(aes.gcmDecrypt(iv.data(), iv.size(), nullptr, 0, out, sizeof(out), decrypted));
}

TEST(AES, gcmAuthenticatesAad)
{
    const auto key = fromHexString("000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f");
    const auto iv = fromHexString("51753c6580c2726f20718414");
    const std::string aad = "header";
    const std::string text = "Hello AES world!";
    crypto::AES aes(crypto::AES::Mode::GCM, key.data(), key.size());
    ASSERT_TRUE(aes.isValid());

    std::vector<uint8_t> sealed(text.size() + crypto::AES::GCM_TAG_SIZE);
    ASSERT_TRUE(aes.gcmEncrypt(iv.data(),
        iv.size(),
        reinterpret_cast<const uint8_t*>(aad.data()),
        aad.size(),
        reinterpret_cast<const uint8_t*>(text.data()),
        text.size(),
        sealed.data()));

    std::vector<uint8_t> opened(text.size());
    ASSERT_TRUE(aes.gcmDecrypt(iv.data(),
        iv.size(),
        reinterpret_cast<const uint8_t*>(aad.data()),
        aad.size(),
        sealed.data(),
        sealed.size(),
        opened.data()));
    EXPECT_EQ(std::string(opened.begin(), opened.end()), text);

    const std::string otherAad = "Header";
    EXPECT_FALSE(aes.gcmDecrypt(iv.data(),
        iv.size(),
        reinterpret_cast<const uint8_t*>(otherAad.data()),
        otherAad.size(),
        sealed.data(),
        sealed.size(),
        opened.data()));
}

TEST(AES, rejectsBadKeyLength)
{
    const std::vector<uint8_t> key(20, 1);
    crypto::AES aes(crypto::AES::Mode::CTR, key.data(), key.size());
    EXPECT_FALSE(aes.isValid());
}

// rfc2202 test case 1
TEST(HMAC, sha1)
{
    const std::vector<uint8_t> key(20, 0x0b);
    crypto::HMAC hmac(key.data(), static_cast<int>(key.size()));
    hmac.add("Hi There", 8);
    uint8_t digest[20];
    hmac.compute(digest);
    EXPECT_EQ(toHexString(digest, sizeof(digest)), "b617318655057264e28bc0b6fb378c8ef146be00");

    ASSERT_TRUE(hmac.reset());
    hmac.add("Hi There", 8);
    uint8_t again[20];
    hmac.compute(again);
    EXPECT_TRUE(crypto::constantTimeEquals(digest, again, sizeof(digest)));
}

TEST(Hash, sha256)
{
    crypto::Hash hash(crypto::DigestType::SHA256);
    hash.add("abc", 3);
    const auto digest = hash.compute();
    EXPECT_EQ(toHexString(digest.data(), digest.size()),
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Crc32, ieee)
{
    crypto::Crc32Polynomial polynomial(0x04C11DB7);
    crypto::Crc32 crc(polynomial);
    crc.add("ABC", 3);
    EXPECT_EQ(crc.compute(), 0xa3830348u);
}

// rfc4960 appendix B, crc32c check value
TEST(Crc32, castagnoli)
{
    crypto::Crc32Polynomial polynomial(0x1EDC6F41u);
    crypto::Crc32 crc(polynomial);
    crc.add("123456789", 9);
    EXPECT_EQ(crc.compute(), 0xE3069283u);
}
