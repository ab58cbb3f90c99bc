#pragma once

#include "crypto/SslHelper.h"
#include "transport/dtls/DtlsProtocol.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dtls
{

enum class CipherSuiteId : uint16_t
{
    TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256 = 0xC02B,
    TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384 = 0xC02C,
    TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256 = 0xC02F,
    TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384 = 0xC030,
    TLS_ECDHE_ECDSA_WITH_AES_256_CBC_SHA = 0xC00A,
    TLS_ECDHE_RSA_WITH_AES_256_CBC_SHA = 0xC014,
    TLS_PSK_WITH_AES_128_GCM_SHA256 = 0x00A8,
    TLS_PSK_WITH_AES_128_CBC_SHA256 = 0x00AE
};

enum class KeyExchange
{
    ECDHE_ECDSA,
    ECDHE_RSA,
    PSK
};

enum class BulkCipher
{
    AES_GCM,
    AES_CBC
};

struct CipherSuiteInfo
{
    CipherSuiteId id;
    const char* name;
    KeyExchange keyExchange;
    BulkCipher cipher;
    size_t keyLength;
    size_t macKeyLength; // 0 for AEAD
    size_t ivLength; // fixed iv from the key block
    crypto::DigestType macDigest;
    crypto::DigestType prfDigest;

    bool isPsk() const { return keyExchange == KeyExchange::PSK; }
    bool isEcdhe() const { return keyExchange != KeyExchange::PSK; }
    bool requiresCertificate() const { return keyExchange != KeyExchange::PSK; }
};

// nullptr for suites we do not implement
const CipherSuiteInfo* findCipherSuite(uint16_t id);
const CipherSuiteInfo* findCipherSuite(const std::string& name);
const std::vector<CipherSuiteId>& allCipherSuites();

struct KeyMaterial
{
    std::vector<uint8_t> clientMacKey;
    std::vector<uint8_t> serverMacKey;
    std::vector<uint8_t> clientKey;
    std::vector<uint8_t> serverKey;
    std::vector<uint8_t> clientIv;
    std::vector<uint8_t> serverIv;
};

// Protects records of one direction in one epoch
class RecordCipher
{
public:
    virtual ~RecordCipher() = default;

    // header.length is the plaintext length. out receives the record fragment.
    virtual bool encrypt(const RecordHeader& header, const uint8_t* plaintext, size_t length, std::vector<uint8_t>& out) = 0;
    // header.length is the protected fragment length
    virtual bool decrypt(const RecordHeader& header,
        const uint8_t* fragment,
        size_t length,
        std::vector<uint8_t>& plaintext) = 0;

    // upper bound of bytes added to a plaintext
    virtual size_t overhead() const = 0;
};

class GcmRecordCipher : public RecordCipher
{
public:
    GcmRecordCipher(const std::vector<uint8_t>& key, const std::vector<uint8_t>& fixedIv);

    bool encrypt(const RecordHeader& header, const uint8_t* plaintext, size_t length, std::vector<uint8_t>& out) override;
    bool decrypt(const RecordHeader& header,
        const uint8_t* fragment,
        size_t length,
        std::vector<uint8_t>& plaintext) override;
    size_t overhead() const override { return EXPLICIT_NONCE_SIZE + crypto::AES::GCM_TAG_SIZE; }

    static constexpr size_t EXPLICIT_NONCE_SIZE = 8;

private:
    crypto::AES _aes;
    std::vector<uint8_t> _fixedIv;
};

// MAC then pad then encrypt with a random explicit IV per record
class CbcRecordCipher : public RecordCipher
{
public:
    CbcRecordCipher(const std::vector<uint8_t>& key, const std::vector<uint8_t>& macKey, crypto::DigestType macDigest);

    bool encrypt(const RecordHeader& header, const uint8_t* plaintext, size_t length, std::vector<uint8_t>& out) override;
    bool decrypt(const RecordHeader& header,
        const uint8_t* fragment,
        size_t length,
        std::vector<uint8_t>& plaintext) override;
    size_t overhead() const override;

private:
    void computeMac(const RecordHeader& header, const uint8_t* data, size_t length, uint8_t* mac);

    crypto::AES _aes;
    std::vector<uint8_t> _macKey;
    crypto::DigestType _macDigest;
    crypto::HMAC _hmac;
};

std::unique_ptr<RecordCipher> createRecordCipher(const CipherSuiteInfo& suite,
    const KeyMaterial& keys,
    bool clientWrite);

} // namespace dtls
