#include "crypto/EcdhKey.h"
#include "logger/Logger.h"
#include <openssl/ec.h>
#include <openssl/objects.h>

namespace
{
int curveNid(crypto::NamedCurve curve)
{
    switch (curve)
    {
    case crypto::NamedCurve::SECP256R1:
        return NID_X9_62_prime256v1;
    case crypto::NamedCurve::SECP384R1:
        return NID_secp384r1;
    default:
        return NID_undef;
    }
}

EVP_PKEY* generateEcParameters(int nid)
{
    EVP_PKEY* parameters = nullptr;
    auto ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
    if (!ctx)
    {
        return nullptr;
    }
    if (EVP_PKEY_paramgen_init(ctx) != 1 || EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx, nid) != 1 ||
        EVP_PKEY_paramgen(ctx, &parameters) != 1)
    {
        parameters = nullptr;
    }
    EVP_PKEY_CTX_free(ctx);
    return parameters;
}
} // namespace

namespace crypto
{

bool isSupportedCurve(uint16_t curve)
{
    return curve == static_cast<uint16_t>(NamedCurve::X25519) || curve == static_cast<uint16_t>(NamedCurve::SECP256R1) ||
        curve == static_cast<uint16_t>(NamedCurve::SECP384R1);
}

EcdhKey::EcdhKey(NamedCurve curve) : _curve(curve), _key(nullptr)
{
    EVP_PKEY_CTX* ctx = nullptr;
    if (curve == NamedCurve::X25519)
    {
        ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr);
        if (ctx && (EVP_PKEY_keygen_init(ctx) != 1 || EVP_PKEY_keygen(ctx, &_key) != 1))
        {
            _key = nullptr;
        }
        if (_key)
        {
            size_t length = 32;
            _publicKey.resize(length);
            if (EVP_PKEY_get_raw_public_key(_key, _publicKey.data(), &length) != 1)
            {
                EVP_PKEY_free(_key);
                _key = nullptr;
            }
            _publicKey.resize(length);
        }
    }
    else
    {
        auto parameters = generateEcParameters(curveNid(curve));
        if (parameters)
        {
            ctx = EVP_PKEY_CTX_new(parameters, nullptr);
            if (ctx && (EVP_PKEY_keygen_init(ctx) != 1 || EVP_PKEY_keygen(ctx, &_key) != 1))
            {
                _key = nullptr;
            }
            EVP_PKEY_free(parameters);
        }

        if (_key)
        {
            unsigned char* point = nullptr;
#if OPENSSL_VERSION_MAJOR >= 3
            const size_t length = EVP_PKEY_get1_encoded_public_key(_key, &point);
#else
            const size_t length = EVP_PKEY_get1_tls_encodedpoint(_key, &point);
#endif
            if (length > 0 && point)
            {
                _publicKey.assign(point, point + length);
            }
            OPENSSL_free(point);
            if (_publicKey.empty())
            {
                EVP_PKEY_free(_key);
                _key = nullptr;
            }
        }
    }
    EVP_PKEY_CTX_free(ctx);

    if (!_key)
    {
        logger::error("failed to generate ECDHE key on curve %u", "EcdhKey", static_cast<uint32_t>(curve));
    }
}

EcdhKey::~EcdhKey()
{
    EVP_PKEY_free(_key);
}

EVP_PKEY* EcdhKey::loadPeerKey(const std::vector<uint8_t>& peerPublicKey) const
{
    if (_curve == NamedCurve::X25519)
    {
        if (peerPublicKey.size() != 32)
        {
            return nullptr;
        }
        return EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, peerPublicKey.data(), peerPublicKey.size());
    }

    auto peerKey = generateEcParameters(curveNid(_curve));
    if (!peerKey)
    {
        return nullptr;
    }
#if OPENSSL_VERSION_MAJOR >= 3
    const int success = EVP_PKEY_set1_encoded_public_key(peerKey, peerPublicKey.data(), peerPublicKey.size());
#else
    const int success = EVP_PKEY_set1_tls_encodedpoint(peerKey, peerPublicKey.data(), peerPublicKey.size());
#endif
    if (success != 1)
    {
        EVP_PKEY_free(peerKey);
        return nullptr;
    }
    return peerKey;
}

bool EcdhKey::deriveSecret(const std::vector<uint8_t>& peerPublicKey, std::vector<uint8_t>& secret) const
{
    if (!_key)
    {
        return false;
    }

    auto peerKey = loadPeerKey(peerPublicKey);
    if (!peerKey)
    {
        logger::warn("invalid peer ECDHE public key, %zu bytes", "EcdhKey", peerPublicKey.size());
        return false;
    }

    auto ctx = EVP_PKEY_CTX_new(_key, nullptr);
    size_t secretLength = 0;
    bool success = ctx && EVP_PKEY_derive_init(ctx) == 1 && EVP_PKEY_derive_set_peer(ctx, peerKey) == 1 &&
        EVP_PKEY_derive(ctx, nullptr, &secretLength) == 1;
    if (success)
    {
        secret.resize(secretLength);
        success = EVP_PKEY_derive(ctx, secret.data(), &secretLength) == 1;
        secret.resize(secretLength);
    }

    EVP_PKEY_CTX_free(ctx);
    EVP_PKEY_free(peerKey);
    return success;
}

} // namespace crypto
