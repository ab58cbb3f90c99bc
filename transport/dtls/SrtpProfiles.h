#pragma once
#include <cstdint>
#include <string>

namespace srtp
{
enum Profile // ordered after preference
{
    NULL_CIPHER = 0,
    AES128_CM_SHA1_80,
    AES128_CM_SHA1_32,
    AEAD_AES_128_GCM,
    AEAD_AES_256_GCM,
    PROFILE_LAST
};

uint32_t getKeyLength(Profile profile);
uint32_t getSaltLength(Profile profile);
// bytes of authentication tag appended to SRTP packets
uint32_t getAuthTagLength(Profile profile);
bool isAeadProfile(Profile profile);

// use_srtp protection profile code points, rfc5764 and rfc7714
uint16_t toDtlsProfileId(Profile profile);
Profile fromDtlsProfileId(uint16_t profileId);

const char* toString(Profile profile);
// accepts both the rfc4568 and the rfc5764 naming
Profile fromString(const std::string& name);

struct AesKey
{
    srtp::Profile profile = srtp::Profile::NULL_CIPHER;
    unsigned char keySalt[64];

    uint32_t getLength() const { return getKeyLength() + getSaltLength(); };
    uint32_t getKeyLength() const { return srtp::getKeyLength(profile); }
    uint32_t getSaltLength() const { return srtp::getSaltLength(profile); }
};

} // namespace srtp
