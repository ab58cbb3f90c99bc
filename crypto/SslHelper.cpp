#include "crypto/SslHelper.h"
#include "logger/Logger.h"
#include <array>
#include <cstring>
#include <openssl/crypto.h>
#include <openssl/rand.h>
#if OPENSSL_VERSION_MAJOR >= 3
#include <openssl/core_names.h>
#include <openssl/params.h>
#endif

namespace
{
const char* digestName(crypto::DigestType type)
{
    switch (type)
    {
    case crypto::DigestType::SHA256:
        return "SHA256";
    case crypto::DigestType::SHA384:
        return "SHA384";
    default:
        return "SHA1";
    }
}
} // namespace

namespace crypto
{
const EVP_MD* toEvpMd(DigestType type)
{
    switch (type)
    {
    case DigestType::SHA256:
        return EVP_sha256();
    case DigestType::SHA384:
        return EVP_sha384();
    default:
        return EVP_sha1();
    }
}

size_t digestLength(DigestType type)
{
    switch (type)
    {
    case DigestType::SHA256:
        return 32;
    case DigestType::SHA384:
        return 48;
    default:
        return 20;
    }
}

std::string toHexString(const void* srcData, size_t len)
{
    auto src = reinterpret_cast<const uint8_t*>(srcData);
    const char hexmap[16] = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::string s;
    s.reserve(len * 2);
    for (size_t i = 0; i < len; ++i)
    {
        s += hexmap[src[i] >> 4];
        s += hexmap[src[i] & 0x0F];
    }
    return s;
}

std::vector<uint8_t> fromHexString(const std::string& hex)
{
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    };

    std::vector<uint8_t> result;
    int high = -1;
    for (char c : hex)
    {
        const int value = nibble(c);
        if (value < 0)
        {
            continue;
        }
        if (high < 0)
        {
            high = value;
        }
        else
        {
            result.push_back(static_cast<uint8_t>((high << 4) | value));
            high = -1;
        }
    }
    return result;
}

bool randomBytes(void* target, size_t length)
{
    if (RAND_bytes(reinterpret_cast<unsigned char*>(target), static_cast<int>(length)) != 1)
    {
        logger::error("RAND_bytes failed", "SslHelper");
        return false;
    }
    return true;
}

bool constantTimeEquals(const void* a, const void* b, size_t length)
{
    return CRYPTO_memcmp(a, b, length) == 0;
}

HMAC::HMAC() : _ctx(nullptr), _digest(DigestType::SHA1)
{
#if OPENSSL_VERSION_MAJOR >= 3
    _mac = EVP_MAC_fetch(nullptr, "HMAC", nullptr);
    if (_mac)
    {
        _ctx = EVP_MAC_CTX_new(_mac);
    }
#else
    _ctx = HMAC_CTX_new();
#endif
    if (!_ctx)
    {
        logger::error("failed to allocate HMAC context", "SslHelper");
    }
}

HMAC::HMAC(const void* key, int keyLength, DigestType digest) : HMAC()
{
    init(key, keyLength, digest);
}

bool HMAC::init(const void* key, int keyLength, DigestType digest)
{
    _digest = digest;
    if (!_ctx || key == nullptr || keyLength <= 0)
    {
        _key.clear();
        return false;
    }

#if OPENSSL_VERSION_MAJOR >= 3
    _key.resize(static_cast<size_t>(keyLength));
    std::memcpy(_key.data(), key, _key.size());
    return macInit();
#else
    return HMAC_Init_ex(_ctx, key, keyLength, toEvpMd(digest), nullptr) == 1;
#endif
}

#if OPENSSL_VERSION_MAJOR >= 3
bool HMAC::macInit()
{
    char digestString[16];
    std::strncpy(digestString, digestName(_digest), sizeof(digestString) - 1);
    digestString[sizeof(digestString) - 1] = 0;
    std::array<OSSL_PARAM, 2> params{
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digestString, 0),
        OSSL_PARAM_construct_end()};
    return EVP_MAC_init(_ctx, _key.data(), _key.size(), params.data()) == 1;
}
#endif

/**
 * Resets calculation and prepares for another run off add, add, compute.
 */
bool HMAC::reset()
{
    if (!_ctx)
    {
        return false;
    }
#if OPENSSL_VERSION_MAJOR >= 3
    if (_key.empty())
    {
        return false;
    }
    return macInit();
#else
    return HMAC_Init_ex(_ctx, nullptr, 0, nullptr, nullptr) == 1;
#endif
}

HMAC::~HMAC()
{
#if OPENSSL_VERSION_MAJOR >= 3
    EVP_MAC_CTX_free(_ctx);
    EVP_MAC_free(_mac);
#else
    HMAC_CTX_free(_ctx);
#endif
}

void HMAC::add(const void* data, int length)
{
    if (length <= 0 || !_ctx)
    {
        return;
    }
#if OPENSSL_VERSION_MAJOR >= 3
    EVP_MAC_update(_ctx, reinterpret_cast<const uint8_t*>(data), length);
#else
    HMAC_Update(_ctx, reinterpret_cast<const uint8_t*>(data), length);
#endif
}

void HMAC::compute(uint8_t* sha) const
{
    if (!_ctx)
    {
        std::memset(sha, 0, digestSize());
        return;
    }
#if OPENSSL_VERSION_MAJOR >= 3
    size_t outLen = digestSize();
    EVP_MAC_final(_ctx, sha, &outLen, outLen);
#else
    uint32_t outLen = 0;
    HMAC_Final(_ctx, sha, &outLen);
#endif
}

Hash::Hash(DigestType type) : _type(type), _ctx(EVP_MD_CTX_new())
{
    reset();
}

Hash::~Hash()
{
    EVP_MD_CTX_free(_ctx);
}

void Hash::add(const void* data, size_t length)
{
    EVP_DigestUpdate(_ctx, data, length);
}

// Computes on a copy so more data can be added after an intermediate digest.
std::vector<uint8_t> Hash::compute() const
{
    std::vector<uint8_t> result(digestLength(_type));
    auto copy = EVP_MD_CTX_new();
    unsigned int length = 0;
    if (EVP_MD_CTX_copy_ex(copy, _ctx) != 1 || EVP_DigestFinal_ex(copy, result.data(), &length) != 1)
    {
        logger::error("digest computation failed", "SslHelper");
        result.clear();
    }
    EVP_MD_CTX_free(copy);
    return result;
}

void Hash::reset()
{
    EVP_DigestInit_ex(_ctx, toEvpMd(_type), nullptr);
}

// Table for the reflected (lsb first) form of the polynomial, as used by crc32 and crc32c.
Crc32Polynomial::Crc32Polynomial(uint32_t polynomial)
{
    uint32_t reflected = 0;
    for (int bit = 0; bit < 32; ++bit)
    {
        if (polynomial & (1u << bit))
        {
            reflected |= 1u << (31 - bit);
        }
    }

    for (uint32_t index = 0; index < 256; ++index)
    {
        uint32_t value = index;
        for (int bit = 0; bit < 8; ++bit)
        {
            value = (value & 1) ? (value >> 1) ^ reflected : value >> 1;
        }
        _table[index] = value;
    }
}

Crc32::Crc32(const Crc32Polynomial& polynomial) : _polynomial(polynomial), _crc(~0u) {}

void Crc32::reset()
{
    _crc = ~0u;
}

void Crc32::add(const void* data, size_t length)
{
    const auto* bytes = static_cast<const uint8_t*>(data);
    for (size_t i = 0; i < length; ++i)
    {
        _crc = _polynomial[static_cast<uint8_t>(_crc ^ bytes[i])] ^ (_crc >> 8);
    }
}

uint32_t Crc32::compute() const
{
    return ~_crc;
}

AES::AES(Mode mode, const void* key, size_t keyLength)
    : _mode(mode),
      _encryptCtx(EVP_CIPHER_CTX_new()),
      _decryptCtx(EVP_CIPHER_CTX_new()),
      _valid(false)
{
    const EVP_CIPHER* cipher = selectCipher(keyLength);
    if (!cipher || !_encryptCtx || !_decryptCtx || !key)
    {
        logger::error("unsupported AES key length %zu", "AES", keyLength);
        return;
    }

    const auto k = reinterpret_cast<const unsigned char*>(key);
    _valid = EVP_EncryptInit_ex(_encryptCtx, cipher, nullptr, k, nullptr) == 1 &&
        EVP_DecryptInit_ex(_decryptCtx, cipher, nullptr, k, nullptr) == 1;
    if (_valid && _mode != Mode::GCM)
    {
        EVP_CIPHER_CTX_set_padding(_encryptCtx, 0);
        EVP_CIPHER_CTX_set_padding(_decryptCtx, 0);
    }
}

AES::~AES()
{
    EVP_CIPHER_CTX_free(_encryptCtx);
    EVP_CIPHER_CTX_free(_decryptCtx);
}

const EVP_CIPHER* AES::selectCipher(size_t keyLength) const
{
    const bool aes256 = (keyLength == 32);
    if (keyLength != 16 && keyLength != 32)
    {
        return nullptr;
    }

    switch (_mode)
    {
    case Mode::CTR:
        return aes256 ? EVP_aes_256_ctr() : EVP_aes_128_ctr();
    case Mode::CBC:
        return aes256 ? EVP_aes_256_cbc() : EVP_aes_128_cbc();
    case Mode::GCM:
        return aes256 ? EVP_aes_256_gcm() : EVP_aes_128_gcm();
    case Mode::ECB:
        return aes256 ? EVP_aes_256_ecb() : EVP_aes_128_ecb();
    }
    return nullptr;
}

bool AES::ctrTransform(const uint8_t* iv, const uint8_t* in, uint8_t* out, size_t length)
{
    if (!_valid || _mode != Mode::CTR)
    {
        return false;
    }

    int outLength = 0;
    if (!EVP_EncryptInit_ex(_encryptCtx, nullptr, nullptr, nullptr, iv))
    {
        return false;
    }
    if (length > 0 && !EVP_EncryptUpdate(_encryptCtx, out, &outLength, in, static_cast<int>(length)))
    {
        return false;
    }
    int finalLength = 0;
    return EVP_EncryptFinal_ex(_encryptCtx, out + outLength, &finalLength) == 1;
}

bool AES::cbcEncrypt(const uint8_t* iv, const uint8_t* in, uint8_t* out, size_t length)
{
    if (!_valid || _mode != Mode::CBC || length % BLOCK_SIZE != 0)
    {
        return false;
    }

    int outLength = 0;
    int finalLength = 0;
    return EVP_EncryptInit_ex(_encryptCtx, nullptr, nullptr, nullptr, iv) == 1 &&
        EVP_EncryptUpdate(_encryptCtx, out, &outLength, in, static_cast<int>(length)) == 1 &&
        EVP_EncryptFinal_ex(_encryptCtx, out + outLength, &finalLength) == 1;
}

bool AES::cbcDecrypt(const uint8_t* iv, const uint8_t* in, uint8_t* out, size_t length)
{
    if (!_valid || _mode != Mode::CBC || length % BLOCK_SIZE != 0)
    {
        return false;
    }

    int outLength = 0;
    int finalLength = 0;
    return EVP_DecryptInit_ex(_decryptCtx, nullptr, nullptr, nullptr, iv) == 1 &&
        EVP_DecryptUpdate(_decryptCtx, out, &outLength, in, static_cast<int>(length)) == 1 &&
        EVP_DecryptFinal_ex(_decryptCtx, out + outLength, &finalLength) == 1;
}

bool AES::ecbEncryptBlock(const uint8_t* in, uint8_t* out)
{
    if (!_valid || _mode != Mode::ECB)
    {
        return false;
    }
    int outLength = 0;
    return EVP_EncryptUpdate(_encryptCtx, out, &outLength, in, BLOCK_SIZE) == 1;
}

// Note: IV MUST be unique for each plaintext encrypted with the same key
bool AES::gcmEncrypt(const uint8_t* iv,
    size_t ivLength,
    const uint8_t* aad,
    size_t aadLength,
    const uint8_t* plaintext,
    size_t length,
    uint8_t* out)
{
    if (!_valid || _mode != Mode::GCM)
    {
        return false;
    }

    int tmpLength = 0;
    if (!EVP_CIPHER_CTX_ctrl(_encryptCtx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(ivLength), nullptr) ||
        !EVP_EncryptInit_ex(_encryptCtx, nullptr, nullptr, nullptr, iv))
    {
        return false;
    }

    if (aad && aadLength > 0 && !EVP_EncryptUpdate(_encryptCtx, nullptr, &tmpLength, aad, static_cast<int>(aadLength)))
    {
        return false;
    }

    int cipherLength = 0;
    if (length > 0 && !EVP_EncryptUpdate(_encryptCtx, out, &cipherLength, plaintext, static_cast<int>(length)))
    {
        return false;
    }

    if (!EVP_EncryptFinal_ex(_encryptCtx, out + cipherLength, &tmpLength))
    {
        return false;
    }
    cipherLength += tmpLength;

    return EVP_CIPHER_CTX_ctrl(_encryptCtx, EVP_CTRL_GCM_GET_TAG, GCM_TAG_SIZE, out + cipherLength) == 1;
}

// Note: IV has to be the same used in the encryption
bool AES::gcmDecrypt(const uint8_t* iv,
    size_t ivLength,
    const uint8_t* aad,
    size_t aadLength,
    const uint8_t* in,
    size_t length,
    uint8_t* plaintext)
{
    if (!_valid || _mode != Mode::GCM || length < GCM_TAG_SIZE)
    {
        return false;
    }

    const size_t cipherLength = length - GCM_TAG_SIZE;
    uint8_t tag[GCM_TAG_SIZE];
    std::memcpy(tag, in + cipherLength, GCM_TAG_SIZE);

    int tmpLength = 0;
    if (!EVP_CIPHER_CTX_ctrl(_decryptCtx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(ivLength), nullptr) ||
        !EVP_DecryptInit_ex(_decryptCtx, nullptr, nullptr, nullptr, iv))
    {
        return false;
    }

    if (aad && aadLength > 0 && !EVP_DecryptUpdate(_decryptCtx, nullptr, &tmpLength, aad, static_cast<int>(aadLength)))
    {
        return false;
    }

    int plainLength = 0;
    if (cipherLength > 0 &&
        !EVP_DecryptUpdate(_decryptCtx, plaintext, &plainLength, in, static_cast<int>(cipherLength)))
    {
        return false;
    }

    if (!EVP_CIPHER_CTX_ctrl(_decryptCtx, EVP_CTRL_GCM_SET_TAG, GCM_TAG_SIZE, tag))
    {
        return false;
    }

    return EVP_DecryptFinal_ex(_decryptCtx, plaintext + plainLength, &tmpLength) == 1;
}
} // namespace crypto
