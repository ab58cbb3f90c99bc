#include "transport/dtls/DtlsCipherSuite.h"
#include <cstring>

namespace dtls
{

namespace
{
using crypto::DigestType;

const CipherSuiteInfo cipherSuites[] = {
    {CipherSuiteId::TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256,
        "TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256",
        KeyExchange::ECDHE_ECDSA,
        BulkCipher::AES_GCM,
        16,
        0,
        4,
        DigestType::SHA256,
        DigestType::SHA256},
    {CipherSuiteId::TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384,
        "TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384",
        KeyExchange::ECDHE_ECDSA,
        BulkCipher::AES_GCM,
        32,
        0,
        4,
        DigestType::SHA384,
        DigestType::SHA384},
    {CipherSuiteId::TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256,
        "TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256",
        KeyExchange::ECDHE_RSA,
        BulkCipher::AES_GCM,
        16,
        0,
        4,
        DigestType::SHA256,
        DigestType::SHA256},
    {CipherSuiteId::TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384,
        "TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384",
        KeyExchange::ECDHE_RSA,
        BulkCipher::AES_GCM,
        32,
        0,
        4,
        DigestType::SHA384,
        DigestType::SHA384},
    {CipherSuiteId::TLS_ECDHE_ECDSA_WITH_AES_256_CBC_SHA,
        "TLS_ECDHE_ECDSA_WITH_AES_256_CBC_SHA",
        KeyExchange::ECDHE_ECDSA,
        BulkCipher::AES_CBC,
        32,
        20,
        16,
        DigestType::SHA1,
        DigestType::SHA256},
    {CipherSuiteId::TLS_ECDHE_RSA_WITH_AES_256_CBC_SHA,
        "TLS_ECDHE_RSA_WITH_AES_256_CBC_SHA",
        KeyExchange::ECDHE_RSA,
        BulkCipher::AES_CBC,
        32,
        20,
        16,
        DigestType::SHA1,
        DigestType::SHA256},
    {CipherSuiteId::TLS_PSK_WITH_AES_128_GCM_SHA256,
        "TLS_PSK_WITH_AES_128_GCM_SHA256",
        KeyExchange::PSK,
        BulkCipher::AES_GCM,
        16,
        0,
        4,
        DigestType::SHA256,
        DigestType::SHA256},
    {CipherSuiteId::TLS_PSK_WITH_AES_128_CBC_SHA256,
        "TLS_PSK_WITH_AES_128_CBC_SHA256",
        KeyExchange::PSK,
        BulkCipher::AES_CBC,
        16,
        32,
        16,
        DigestType::SHA256,
        DigestType::SHA256}};

// seq_num(8) + type(1) + version(2) + length(2)
const size_t ADDITIONAL_DATA_SIZE = 13;

void writeAdditionalData(const RecordHeader& header, uint16_t length, uint8_t* target)
{
    const uint64_t sequence = (uint64_t(header.epoch) << 48) | (header.sequenceNumber & MAX_SEQUENCE_NUMBER);
    for (int i = 0; i < 8; ++i)
    {
        target[i] = static_cast<uint8_t>(sequence >> (56 - 8 * i));
    }
    target[8] = header.contentType;
    target[9] = header.version >> 8;
    target[10] = header.version & 0xFF;
    target[11] = length >> 8;
    target[12] = length & 0xFF;
}
} // namespace

const CipherSuiteInfo* findCipherSuite(uint16_t id)
{
    for (auto& suite : cipherSuites)
    {
        if (static_cast<uint16_t>(suite.id) == id)
        {
            return &suite;
        }
    }
    return nullptr;
}

const CipherSuiteInfo* findCipherSuite(const std::string& name)
{
    for (auto& suite : cipherSuites)
    {
        if (name == suite.name)
        {
            return &suite;
        }
    }
    return nullptr;
}

const std::vector<CipherSuiteId>& allCipherSuites()
{
    static const std::vector<CipherSuiteId> suites = {CipherSuiteId::TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256,
        CipherSuiteId::TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384,
        CipherSuiteId::TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256,
        CipherSuiteId::TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384,
        CipherSuiteId::TLS_ECDHE_ECDSA_WITH_AES_256_CBC_SHA,
        CipherSuiteId::TLS_ECDHE_RSA_WITH_AES_256_CBC_SHA,
        CipherSuiteId::TLS_PSK_WITH_AES_128_GCM_SHA256,
        CipherSuiteId::TLS_PSK_WITH_AES_128_CBC_SHA256};
    return suites;
}

GcmRecordCipher::GcmRecordCipher(const std::vector<uint8_t>& key, const std::vector<uint8_t>& fixedIv)
    : _aes(crypto::AES::Mode::GCM, key.data(), key.size()),
      _fixedIv(fixedIv)
{
}

// The explicit nonce is the epoch and sequence number, unique per key
bool GcmRecordCipher::encrypt(const RecordHeader& header,
    const uint8_t* plaintext,
    size_t length,
    std::vector<uint8_t>& out)
{
    if (!_aes.isValid() || _fixedIv.size() != 4)
    {
        return false;
    }

    uint8_t nonce[12];
    std::memcpy(nonce, _fixedIv.data(), 4);
    const uint64_t explicitNonce = (uint64_t(header.epoch) << 48) | (header.sequenceNumber & MAX_SEQUENCE_NUMBER);
    for (int i = 0; i < 8; ++i)
    {
        nonce[4 + i] = static_cast<uint8_t>(explicitNonce >> (56 - 8 * i));
    }

    uint8_t additionalData[ADDITIONAL_DATA_SIZE];
    writeAdditionalData(header, length, additionalData);

    out.resize(EXPLICIT_NONCE_SIZE + length + crypto::AES::GCM_TAG_SIZE);
    std::memcpy(out.data(), nonce + 4, EXPLICIT_NONCE_SIZE);
    return _aes.gcmEncrypt(nonce,
        sizeof(nonce),
        additionalData,
        sizeof(additionalData),
        plaintext,
        length,
        out.data() + EXPLICIT_NONCE_SIZE);
}

bool GcmRecordCipher::decrypt(const RecordHeader& header,
    const uint8_t* fragment,
    size_t length,
    std::vector<uint8_t>& plaintext)
{
    if (!_aes.isValid() || length < overhead())
    {
        return false;
    }

    uint8_t nonce[12];
    std::memcpy(nonce, _fixedIv.data(), 4);
    std::memcpy(nonce + 4, fragment, EXPLICIT_NONCE_SIZE);

    const size_t plainLength = length - overhead();
    uint8_t additionalData[ADDITIONAL_DATA_SIZE];
    writeAdditionalData(header, plainLength, additionalData);

    plaintext.resize(plainLength);
    return _aes.gcmDecrypt(nonce,
        sizeof(nonce),
        additionalData,
        sizeof(additionalData),
        fragment + EXPLICIT_NONCE_SIZE,
        length - EXPLICIT_NONCE_SIZE,
        plaintext.data());
}

CbcRecordCipher::CbcRecordCipher(const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& macKey,
    crypto::DigestType macDigest)
    : _aes(crypto::AES::Mode::CBC, key.data(), key.size()),
      _macKey(macKey),
      _macDigest(macDigest),
      _hmac(macKey.data(), macKey.size(), macDigest)
{
}

size_t CbcRecordCipher::overhead() const
{
    // iv, mac and up to a full block of padding
    return crypto::AES::BLOCK_SIZE + crypto::digestLength(_macDigest) + crypto::AES::BLOCK_SIZE;
}

void CbcRecordCipher::computeMac(const RecordHeader& header, const uint8_t* data, size_t length, uint8_t* mac)
{
    uint8_t additionalData[ADDITIONAL_DATA_SIZE];
    writeAdditionalData(header, length, additionalData);
    _hmac.reset();
    _hmac.add(additionalData, sizeof(additionalData));
    _hmac.add(data, length);
    _hmac.compute(mac);
}

bool CbcRecordCipher::encrypt(const RecordHeader& header,
    const uint8_t* plaintext,
    size_t length,
    std::vector<uint8_t>& out)
{
    if (!_aes.isValid())
    {
        return false;
    }

    const size_t macLength = crypto::digestLength(_macDigest);
    const size_t contentLength = length + macLength;
    const size_t padLength = crypto::AES::BLOCK_SIZE - (contentLength % crypto::AES::BLOCK_SIZE);

    std::vector<uint8_t> block(contentLength + padLength);
    if (length > 0)
    {
        std::memcpy(block.data(), plaintext, length);
    }
    computeMac(header, plaintext, length, block.data() + length);
    std::memset(block.data() + contentLength, static_cast<int>(padLength - 1), padLength);

    out.resize(crypto::AES::BLOCK_SIZE + block.size());
    if (!crypto::randomBytes(out.data(), crypto::AES::BLOCK_SIZE))
    {
        return false;
    }
    return _aes.cbcEncrypt(out.data(), block.data(), out.data() + crypto::AES::BLOCK_SIZE, block.size());
}

bool CbcRecordCipher::decrypt(const RecordHeader& header,
    const uint8_t* fragment,
    size_t length,
    std::vector<uint8_t>& plaintext)
{
    const size_t macLength = crypto::digestLength(_macDigest);
    if (!_aes.isValid() || length < 2 * crypto::AES::BLOCK_SIZE || (length % crypto::AES::BLOCK_SIZE) != 0)
    {
        return false;
    }

    const size_t blockLength = length - crypto::AES::BLOCK_SIZE;
    std::vector<uint8_t> block(blockLength);
    if (!_aes.cbcDecrypt(fragment, fragment + crypto::AES::BLOCK_SIZE, block.data(), blockLength))
    {
        return false;
    }

    const size_t padLength = block.back() + 1;
    if (padLength + macLength > blockLength)
    {
        return false;
    }

    bool paddingOk = true;
    for (size_t i = blockLength - padLength; i < blockLength; ++i)
    {
        paddingOk &= (block[i] == block.back());
    }

    const size_t contentLength = blockLength - padLength - macLength;
    uint8_t mac[64];
    computeMac(header, block.data(), contentLength, mac);
    const bool macOk = crypto::constantTimeEquals(mac, block.data() + contentLength, macLength);
    if (!paddingOk || !macOk)
    {
        return false;
    }

    plaintext.assign(block.begin(), block.begin() + contentLength);
    return true;
}

std::unique_ptr<RecordCipher> createRecordCipher(const CipherSuiteInfo& suite,
    const KeyMaterial& keys,
    bool clientWrite)
{
    const auto& key = clientWrite ? keys.clientKey : keys.serverKey;
    if (suite.cipher == BulkCipher::AES_GCM)
    {
        return std::make_unique<GcmRecordCipher>(key, clientWrite ? keys.clientIv : keys.serverIv);
    }
    return std::make_unique<CbcRecordCipher>(key, clientWrite ? keys.clientMacKey : keys.serverMacKey, suite.macDigest);
}

} // namespace dtls
