#pragma once

#include <cstdint>
#include <openssl/evp.h>
#include <vector>

namespace crypto
{

// TLS NamedGroup code points
enum class NamedCurve : uint16_t
{
    SECP256R1 = 23,
    SECP384R1 = 24,
    X25519 = 29,
    UNKNOWN = 0
};

bool isSupportedCurve(uint16_t curve);

// Ephemeral key pair for ECDHE. Public key is in TLS wire form, uncompressed point for NIST curves and the
// raw 32 bytes for X25519.
class EcdhKey
{
public:
    explicit EcdhKey(NamedCurve curve);
    EcdhKey(const EcdhKey&) = delete;
    ~EcdhKey();

    EcdhKey& operator=(const EcdhKey&) = delete;

    bool isValid() const { return _key != nullptr; }
    NamedCurve getCurve() const { return _curve; }
    const std::vector<uint8_t>& getPublicKey() const { return _publicKey; }

    bool deriveSecret(const std::vector<uint8_t>& peerPublicKey, std::vector<uint8_t>& secret) const;

private:
    EVP_PKEY* loadPeerKey(const std::vector<uint8_t>& peerPublicKey) const;

    NamedCurve _curve;
    EVP_PKEY* _key;
    std::vector<uint8_t> _publicKey;
};

} // namespace crypto
