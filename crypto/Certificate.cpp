#include "crypto/Certificate.h"
#include "logger/Logger.h"
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

namespace crypto
{

DigestType signatureDigest(SignatureScheme scheme)
{
    switch (scheme)
    {
    case SignatureScheme::RSA_PKCS1_SHA1:
    case SignatureScheme::ECDSA_SHA1:
        return DigestType::SHA1;
    case SignatureScheme::RSA_PKCS1_SHA384:
    case SignatureScheme::ECDSA_SECP384R1_SHA384:
        return DigestType::SHA384;
    default:
        return DigestType::SHA256;
    }
}

bool isEcdsaScheme(SignatureScheme scheme)
{
    return scheme == SignatureScheme::ECDSA_SHA1 || scheme == SignatureScheme::ECDSA_SECP256R1_SHA256 ||
        scheme == SignatureScheme::ECDSA_SECP384R1_SHA384;
}

namespace
{
KeyType keyTypeOf(EVP_PKEY* key)
{
    if (!key)
    {
        return KeyType::UNKNOWN;
    }
    switch (EVP_PKEY_base_id(key))
    {
    case EVP_PKEY_EC:
        return KeyType::ECDSA;
    case EVP_PKEY_RSA:
        return KeyType::RSA;
    default:
        return KeyType::UNKNOWN;
    }
}

bool schemeMatchesKey(SignatureScheme scheme, KeyType keyType)
{
    if (keyType == KeyType::ECDSA)
    {
        return isEcdsaScheme(scheme);
    }
    if (keyType == KeyType::RSA)
    {
        return scheme == SignatureScheme::RSA_PKCS1_SHA1 || scheme == SignatureScheme::RSA_PKCS1_SHA256 ||
            scheme == SignatureScheme::RSA_PKCS1_SHA384;
    }
    return false;
}
} // namespace

PrivateKey::~PrivateKey()
{
    EVP_PKEY_free(_key);
}

PrivateKey& PrivateKey::operator=(PrivateKey&& other) noexcept
{
    if (this != &other)
    {
        EVP_PKEY_free(_key);
        _key = other._key;
        other._key = nullptr;
    }
    return *this;
}

PrivateKey PrivateKey::generateEcdsaP256()
{
    EVP_PKEY* key = nullptr;
    auto ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
    if (!ctx)
    {
        return PrivateKey();
    }

    if (EVP_PKEY_keygen_init(ctx) != 1 || EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx, NID_X9_62_prime256v1) != 1 ||
        EVP_PKEY_keygen(ctx, &key) != 1)
    {
        logger::error("failed to generate ECDSA key", "Certificate");
        key = nullptr;
    }
    EVP_PKEY_CTX_free(ctx);
    return PrivateKey(key);
}

PrivateKey PrivateKey::fromPem(const std::string& pem)
{
    auto bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio)
    {
        return PrivateKey();
    }
    auto key = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    return PrivateKey(key);
}

KeyType PrivateKey::getType() const
{
    return keyTypeOf(_key);
}

SignatureScheme PrivateKey::defaultScheme() const
{
    switch (getType())
    {
    case KeyType::ECDSA:
        return SignatureScheme::ECDSA_SECP256R1_SHA256;
    case KeyType::RSA:
        return SignatureScheme::RSA_PKCS1_SHA256;
    default:
        return SignatureScheme::UNKNOWN;
    }
}

bool PrivateKey::sign(SignatureScheme scheme, const void* data, size_t length, std::vector<uint8_t>& signature) const
{
    if (!_key || !schemeMatchesKey(scheme, getType()))
    {
        return false;
    }

    auto mdCtx = EVP_MD_CTX_new();
    size_t signatureLength = 0;
    bool success = EVP_DigestSignInit(mdCtx, nullptr, toEvpMd(signatureDigest(scheme)), nullptr, _key) == 1 &&
        EVP_DigestSign(mdCtx, nullptr, &signatureLength, reinterpret_cast<const unsigned char*>(data), length) == 1;
    if (success)
    {
        signature.resize(signatureLength);
        success = EVP_DigestSign(mdCtx,
                      signature.data(),
                      &signatureLength,
                      reinterpret_cast<const unsigned char*>(data),
                      length) == 1;
        signature.resize(signatureLength);
    }
    EVP_MD_CTX_free(mdCtx);
    return success;
}

Certificate::~Certificate()
{
    X509_free(_certificate);
}

Certificate& Certificate::operator=(Certificate&& other) noexcept
{
    if (this != &other)
    {
        X509_free(_certificate);
        _certificate = other._certificate;
        other._certificate = nullptr;
    }
    return *this;
}

Certificate Certificate::selfSigned(const PrivateKey& key, const std::string& commonName)
{
    if (!key.isValid())
    {
        return Certificate();
    }

    auto certificate = X509_new();
    if (!certificate)
    {
        return Certificate();
    }
    Certificate result(certificate);

    uint64_t serial = 0;
    if (!randomBytes(&serial, sizeof(serial)))
    {
        return Certificate();
    }

    if (X509_set_version(certificate, 2) == 0 ||
        ASN1_INTEGER_set(X509_get_serialNumber(certificate), static_cast<long>(serial >> 1)) == 0)
    {
        return Certificate();
    }

    if (X509_gmtime_adj(X509_getm_notBefore(certificate), -24 * 3600) == 0 ||
        X509_gmtime_adj(X509_getm_notAfter(certificate), 30 * 24 * 3600) == 0)
    {
        return Certificate();
    }

    if (X509_set_pubkey(certificate, key.get()) == 0)
    {
        return Certificate();
    }

    auto certificateName = X509_get_subject_name(certificate);
    if (!certificateName ||
        X509_NAME_add_entry_by_txt(certificateName,
            "CN",
            MBSTRING_ASC,
            reinterpret_cast<const unsigned char*>(commonName.c_str()),
            -1,
            -1,
            0) == 0)
    {
        return Certificate();
    }

    if (X509_set_issuer_name(certificate, certificateName) == 0 || X509_sign(certificate, key.get(), EVP_sha256()) == 0)
    {
        logger::error("failed to sign certificate", "Certificate");
        return Certificate();
    }

    return result;
}

Certificate Certificate::fromDer(const std::vector<uint8_t>& der)
{
    const unsigned char* p = der.data();
    auto certificate = d2i_X509(nullptr, &p, static_cast<long>(der.size()));
    return Certificate(certificate);
}

Certificate Certificate::fromPem(const std::string& pem)
{
    auto bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio)
    {
        return Certificate();
    }
    auto certificate = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    return Certificate(certificate);
}

std::vector<uint8_t> Certificate::toDer() const
{
    std::vector<uint8_t> result;
    if (!_certificate)
    {
        return result;
    }

    const int length = i2d_X509(_certificate, nullptr);
    if (length <= 0)
    {
        return result;
    }
    result.resize(length);
    unsigned char* p = result.data();
    i2d_X509(_certificate, &p);
    return result;
}

KeyType Certificate::getKeyType() const
{
    return _certificate ? keyTypeOf(X509_get0_pubkey(_certificate)) : KeyType::UNKNOWN;
}

std::string Certificate::fingerprint(DigestType digest) const
{
    if (!_certificate)
    {
        return "";
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLength = 0;
    if (X509_digest(_certificate, toEvpMd(digest), md, &mdLength) != 1)
    {
        return "";
    }

    const char hexmap[16] = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};
    std::string result;
    for (unsigned int i = 0; i < mdLength; ++i)
    {
        if (i > 0)
        {
            result += ':';
        }
        result += hexmap[md[i] >> 4];
        result += hexmap[md[i] & 0x0F];
    }
    return result;
}

bool Certificate::verify(SignatureScheme scheme,
    const void* data,
    size_t length,
    const uint8_t* signature,
    size_t signatureLength) const
{
    if (!_certificate)
    {
        return false;
    }

    auto publicKey = X509_get0_pubkey(_certificate);
    if (!publicKey || !schemeMatchesKey(scheme, keyTypeOf(publicKey)))
    {
        return false;
    }

    auto mdCtx = EVP_MD_CTX_new();
    const bool success =
        EVP_DigestVerifyInit(mdCtx, nullptr, toEvpMd(signatureDigest(scheme)), nullptr, publicKey) == 1 &&
        EVP_DigestVerify(mdCtx, signature, signatureLength, reinterpret_cast<const unsigned char*>(data), length) ==
            1;
    EVP_MD_CTX_free(mdCtx);
    return success;
}

bool Certificate::isCurrentlyValid() const
{
    if (!_certificate)
    {
        return false;
    }
    return X509_cmp_current_time(X509_get0_notBefore(_certificate)) < 0 &&
        X509_cmp_current_time(X509_get0_notAfter(_certificate)) > 0;
}

CertificateIdentity CertificateIdentity::generate(const std::string& commonName)
{
    CertificateIdentity identity;
    identity.privateKey = std::make_shared<PrivateKey>(PrivateKey::generateEcdsaP256());
    auto certificate = std::make_shared<Certificate>(Certificate::selfSigned(*identity.privateKey, commonName));
    if (certificate->isValid())
    {
        identity.chain.push_back(certificate);
    }
    return identity;
}

} // namespace crypto
