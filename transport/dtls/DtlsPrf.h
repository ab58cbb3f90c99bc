#pragma once

#include "crypto/SslHelper.h"
#include "transport/dtls/DtlsCipherSuite.h"
#include "transport/dtls/DtlsProtocol.h"
#include <cstdint>
#include <string>
#include <vector>

namespace dtls
{

// TLS 1.2 PRF, P_hash over the given digest, rfc5246 section 5
std::vector<uint8_t> prf(crypto::DigestType digest,
    const std::vector<uint8_t>& secret,
    const std::string& label,
    const std::vector<uint8_t>& seed,
    size_t length);

std::vector<uint8_t> computeMasterSecret(crypto::DigestType digest,
    const std::vector<uint8_t>& preMasterSecret,
    const Random& clientRandom,
    const Random& serverRandom);

// rfc7627, sessionHash is the transcript hash up to and including ClientKeyExchange
std::vector<uint8_t> computeExtendedMasterSecret(crypto::DigestType digest,
    const std::vector<uint8_t>& preMasterSecret,
    const std::vector<uint8_t>& sessionHash);

// key block is expanded with server random first
KeyMaterial computeKeyMaterial(const CipherSuiteInfo& suite,
    const std::vector<uint8_t>& masterSecret,
    const Random& clientRandom,
    const Random& serverRandom);

std::vector<uint8_t> computeVerifyData(crypto::DigestType digest,
    const std::vector<uint8_t>& masterSecret,
    bool isClient,
    const std::vector<uint8_t>& handshakeHash);

// rfc5705 without context
std::vector<uint8_t> exportKeyingMaterial(crypto::DigestType digest,
    const std::vector<uint8_t>& masterSecret,
    const std::string& label,
    const Random& clientRandom,
    const Random& serverRandom,
    size_t length);

// rfc4279 section 2, other_secret is zeros of the psk length for plain PSK
std::vector<uint8_t> makePskPreMasterSecret(const std::vector<uint8_t>& psk,
    const std::vector<uint8_t>& otherSecret = std::vector<uint8_t>());

} // namespace dtls
