#pragma once

#include "crypto/SslHelper.h"
#include <cstdint>
#include <memory>
#include <openssl/x509.h>
#include <string>
#include <vector>

namespace crypto
{

// TLS SignatureScheme code points
enum class SignatureScheme : uint16_t
{
    RSA_PKCS1_SHA1 = 0x0201,
    ECDSA_SHA1 = 0x0203,
    RSA_PKCS1_SHA256 = 0x0401,
    ECDSA_SECP256R1_SHA256 = 0x0403,
    RSA_PKCS1_SHA384 = 0x0501,
    ECDSA_SECP384R1_SHA384 = 0x0503,
    UNKNOWN = 0
};

enum class KeyType
{
    ECDSA,
    RSA,
    UNKNOWN
};

DigestType signatureDigest(SignatureScheme scheme);
bool isEcdsaScheme(SignatureScheme scheme);

class PrivateKey
{
public:
    PrivateKey() : _key(nullptr) {}
    explicit PrivateKey(EVP_PKEY* key) : _key(key) {}
    PrivateKey(const PrivateKey&) = delete;
    PrivateKey(PrivateKey&& other) noexcept : _key(other._key) { other._key = nullptr; }
    ~PrivateKey();

    PrivateKey& operator=(const PrivateKey&) = delete;
    PrivateKey& operator=(PrivateKey&& other) noexcept;

    static PrivateKey generateEcdsaP256();
    static PrivateKey fromPem(const std::string& pem);

    bool isValid() const { return _key != nullptr; }
    KeyType getType() const;
    SignatureScheme defaultScheme() const;

    bool sign(SignatureScheme scheme, const void* data, size_t length, std::vector<uint8_t>& signature) const;

    EVP_PKEY* get() const { return _key; }

private:
    EVP_PKEY* _key;
};

class Certificate
{
public:
    Certificate() : _certificate(nullptr) {}
    explicit Certificate(X509* certificate) : _certificate(certificate) {}
    Certificate(const Certificate&) = delete;
    Certificate(Certificate&& other) noexcept : _certificate(other._certificate) { other._certificate = nullptr; }
    ~Certificate();

    Certificate& operator=(const Certificate&) = delete;
    Certificate& operator=(Certificate&& other) noexcept;

    static Certificate selfSigned(const PrivateKey& key, const std::string& commonName);
    static Certificate fromDer(const std::vector<uint8_t>& der);
    static Certificate fromPem(const std::string& pem);

    bool isValid() const { return _certificate != nullptr; }
    std::vector<uint8_t> toDer() const;
    KeyType getKeyType() const;

    // "sha-256" style fingerprint, upper case hex bytes separated by colon
    std::string fingerprint(DigestType digest = DigestType::SHA256) const;

    bool verify(SignatureScheme scheme,
        const void* data,
        size_t length,
        const uint8_t* signature,
        size_t signatureLength) const;

    bool isCurrentlyValid() const;

    X509* get() const { return _certificate; }

private:
    X509* _certificate;
};

struct CertificateIdentity
{
    std::vector<std::shared_ptr<Certificate>> chain;
    std::shared_ptr<PrivateKey> privateKey;

    static CertificateIdentity generate(const std::string& commonName);
    bool isValid() const { return !chain.empty() && chain.front()->isValid() && privateKey && privateKey->isValid(); }
};

} // namespace crypto
