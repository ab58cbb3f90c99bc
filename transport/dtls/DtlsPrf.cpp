#include "transport/dtls/DtlsPrf.h"
#include "utils/ByteBuffer.h"

namespace dtls
{

namespace
{
std::vector<uint8_t> concatRandoms(const Random& first, const Random& second)
{
    std::vector<uint8_t> seed(first.begin(), first.end());
    seed.insert(seed.end(), second.begin(), second.end());
    return seed;
}
} // namespace

std::vector<uint8_t> prf(crypto::DigestType digest,
    const std::vector<uint8_t>& secret,
    const std::string& label,
    const std::vector<uint8_t>& seed,
    size_t length)
{
    std::vector<uint8_t> labelSeed(label.begin(), label.end());
    labelSeed.insert(labelSeed.end(), seed.begin(), seed.end());

    crypto::HMAC hmac(secret.data(), secret.size(), digest);
    const size_t digestSize = hmac.digestSize();

    std::vector<uint8_t> result;
    result.reserve(length + digestSize);

    // A(1) = HMAC(secret, seed), A(i) = HMAC(secret, A(i-1))
    std::vector<uint8_t> a(digestSize);
    hmac.add(labelSeed.data(), labelSeed.size());
    hmac.compute(a.data());

    std::vector<uint8_t> output(digestSize);
    while (result.size() < length)
    {
        hmac.reset();
        hmac.add(a.data(), a.size());
        hmac.add(labelSeed.data(), labelSeed.size());
        hmac.compute(output.data());
        result.insert(result.end(), output.begin(), output.end());

        hmac.reset();
        hmac.add(a.data(), a.size());
        hmac.compute(a.data());
    }

    result.resize(length);
    return result;
}

std::vector<uint8_t> computeMasterSecret(crypto::DigestType digest,
    const std::vector<uint8_t>& preMasterSecret,
    const Random& clientRandom,
    const Random& serverRandom)
{
    return prf(digest, preMasterSecret, "master secret", concatRandoms(clientRandom, serverRandom), MASTER_SECRET_SIZE);
}

std::vector<uint8_t> computeExtendedMasterSecret(crypto::DigestType digest,
    const std::vector<uint8_t>& preMasterSecret,
    const std::vector<uint8_t>& sessionHash)
{
    return prf(digest, preMasterSecret, "extended master secret", sessionHash, MASTER_SECRET_SIZE);
}

KeyMaterial computeKeyMaterial(const CipherSuiteInfo& suite,
    const std::vector<uint8_t>& masterSecret,
    const Random& clientRandom,
    const Random& serverRandom)
{
    const size_t length = 2 * (suite.macKeyLength + suite.keyLength + suite.ivLength);
    const auto block =
        prf(suite.prfDigest, masterSecret, "key expansion", concatRandoms(serverRandom, clientRandom), length);

    KeyMaterial keys;
    utils::ByteReader reader(block.data(), block.size());
    reader.readVector(keys.clientMacKey, suite.macKeyLength);
    reader.readVector(keys.serverMacKey, suite.macKeyLength);
    reader.readVector(keys.clientKey, suite.keyLength);
    reader.readVector(keys.serverKey, suite.keyLength);
    reader.readVector(keys.clientIv, suite.ivLength);
    reader.readVector(keys.serverIv, suite.ivLength);
    return keys;
}

std::vector<uint8_t> computeVerifyData(crypto::DigestType digest,
    const std::vector<uint8_t>& masterSecret,
    bool isClient,
    const std::vector<uint8_t>& handshakeHash)
{
    return prf(digest,
        masterSecret,
        isClient ? "client finished" : "server finished",
        handshakeHash,
        VERIFY_DATA_SIZE);
}

std::vector<uint8_t> exportKeyingMaterial(crypto::DigestType digest,
    const std::vector<uint8_t>& masterSecret,
    const std::string& label,
    const Random& clientRandom,
    const Random& serverRandom,
    size_t length)
{
    return prf(digest, masterSecret, label, concatRandoms(clientRandom, serverRandom), length);
}

std::vector<uint8_t> makePskPreMasterSecret(const std::vector<uint8_t>& psk, const std::vector<uint8_t>& otherSecret)
{
    std::vector<uint8_t> result;
    utils::ByteWriter writer(result);
    if (otherSecret.empty())
    {
        writer.writeOpaque(std::vector<uint8_t>(psk.size(), 0), 2);
    }
    else
    {
        writer.writeOpaque(otherSecret, 2);
    }
    writer.writeOpaque(psk, 2);
    return result;
}

} // namespace dtls
