#pragma once

#include <cstddef>
#include <cstdint>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/opensslv.h>
#include <string>
#include <vector>

namespace crypto
{

enum class DigestType
{
    SHA1,
    SHA256,
    SHA384
};

const EVP_MD* toEvpMd(DigestType type);
size_t digestLength(DigestType type);

class HMAC
{
public:
    HMAC();
    HMAC(const void* key, int keyLength, DigestType digest = DigestType::SHA1);
    HMAC(const HMAC&) = delete;
    ~HMAC();

    HMAC& operator=(const HMAC&) = delete;

    void add(const void* data, int length);

    // writes digestLength() bytes
    void compute(uint8_t* sha) const;
    bool init(const void* key, int keyLength, DigestType digest = DigestType::SHA1);
    bool reset();
    size_t digestSize() const { return digestLength(_digest); }

    template <typename IntType>
    void add(const IntType& data)
    {
        add(&data, sizeof(IntType));
    }

private:
#if OPENSSL_VERSION_MAJOR >= 3
    EVP_MAC* _mac = nullptr;
    EVP_MAC_CTX* _ctx;
#else
    hmac_ctx_st* _ctx;
#endif
    std::vector<uint8_t> _key;
    DigestType _digest;

#if OPENSSL_VERSION_MAJOR >= 3
    [[nodiscard]] bool macInit();
#endif
};

class Hash
{
public:
    explicit Hash(DigestType type);
    Hash(const Hash&) = delete;
    ~Hash();

    void add(const void* data, size_t length);
    void add(const std::vector<uint8_t>& data) { add(data.data(), data.size()); }
    std::vector<uint8_t> compute() const;
    void reset();

private:
    DigestType _type;
    struct evp_md_ctx_st* _ctx;
};

class Crc32Polynomial
{
public:
    // polynomial in normal (msb first) notation, e.g. 0x1EDC6F41 for crc32c
    explicit Crc32Polynomial(uint32_t polynomial);
    uint32_t operator[](uint8_t index) const { return _table[index]; }

private:
    uint32_t _table[256];
};

class Crc32
{
public:
    explicit Crc32(const Crc32Polynomial& polynomial);

    void add(const void* data, size_t length);
    uint32_t compute() const;
    void reset();

    template <typename IntType>
    void add(const IntType& data)
    {
        add(&data, sizeof(IntType));
    }

private:
    const Crc32Polynomial& _polynomial;
    uint32_t _crc;
};

/**
 * AES in the modes used by DTLS and SRTP. Key length selects AES-128 or AES-256.
 * CBC works on whole blocks without padding, the record layer pads itself.
 * GCM always uses a 16 byte tag.
 */
class AES
{
public:
    enum class Mode
    {
        CTR,
        CBC,
        GCM,
        ECB
    };

    static constexpr size_t BLOCK_SIZE = 16;
    static constexpr size_t GCM_TAG_SIZE = 16;

    AES(Mode mode, const void* key, size_t keyLength);
    AES(const AES&) = delete;
    ~AES();

    bool isValid() const { return _valid; }
    Mode getMode() const { return _mode; }

    // CTR is symmetric. iv is the 16 byte initial counter block. in and out may alias.
    bool ctrTransform(const uint8_t* iv, const uint8_t* in, uint8_t* out, size_t length);

    bool cbcEncrypt(const uint8_t* iv, const uint8_t* in, uint8_t* out, size_t length);
    bool cbcDecrypt(const uint8_t* iv, const uint8_t* in, uint8_t* out, size_t length);

    bool ecbEncryptBlock(const uint8_t* in, uint8_t* out);

    // out receives length bytes of ciphertext followed by the tag
    bool gcmEncrypt(const uint8_t* iv,
        size_t ivLength,
        const uint8_t* aad,
        size_t aadLength,
        const uint8_t* plaintext,
        size_t length,
        uint8_t* out);
    // in holds ciphertext followed by the tag, length includes the tag
    bool gcmDecrypt(const uint8_t* iv,
        size_t ivLength,
        const uint8_t* aad,
        size_t aadLength,
        const uint8_t* in,
        size_t length,
        uint8_t* plaintext);

private:
    const EVP_CIPHER* selectCipher(size_t keyLength) const;

    Mode _mode;
    evp_cipher_ctx_st* _encryptCtx;
    evp_cipher_ctx_st* _decryptCtx;
    bool _valid;
};

bool randomBytes(void* target, size_t length);
std::string toHexString(const void* src, size_t len);
std::vector<uint8_t> fromHexString(const std::string& hex);
bool constantTimeEquals(const void* a, const void* b, size_t length);
} // namespace crypto
