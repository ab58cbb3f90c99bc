#include "SrtpProfiles.h"

namespace srtp
{
uint32_t getKeyLength(Profile profile)
{
    switch (profile)
    {
    case srtp::Profile::AES128_CM_SHA1_32:
    case srtp::Profile::AES128_CM_SHA1_80:
    case srtp::Profile::AEAD_AES_128_GCM:
        return 16;
    case srtp::Profile::AEAD_AES_256_GCM:
        return 32;
    default:
        return 0;
    }
}

uint32_t getSaltLength(Profile profile)
{
    switch (profile)
    {
    case srtp::Profile::AES128_CM_SHA1_32:
    case srtp::Profile::AES128_CM_SHA1_80:
        return 14;
    case srtp::Profile::AEAD_AES_128_GCM:
    case srtp::Profile::AEAD_AES_256_GCM:
        return 12;
    default:
        return 0;
    }
}

uint32_t getAuthTagLength(Profile profile)
{
    switch (profile)
    {
    case srtp::Profile::AES128_CM_SHA1_80:
        return 10;
    case srtp::Profile::AES128_CM_SHA1_32:
        return 4;
    case srtp::Profile::AEAD_AES_128_GCM:
    case srtp::Profile::AEAD_AES_256_GCM:
        return 16;
    default:
        return 0;
    }
}

bool isAeadProfile(Profile profile)
{
    return profile == Profile::AEAD_AES_128_GCM || profile == Profile::AEAD_AES_256_GCM;
}

uint16_t toDtlsProfileId(Profile profile)
{
    switch (profile)
    {
    case srtp::Profile::AES128_CM_SHA1_80:
        return 0x0001;
    case srtp::Profile::AES128_CM_SHA1_32:
        return 0x0002;
    case srtp::Profile::AEAD_AES_128_GCM:
        return 0x0007;
    case srtp::Profile::AEAD_AES_256_GCM:
        return 0x0008;
    default:
        return 0;
    }
}

Profile fromDtlsProfileId(uint16_t profileId)
{
    switch (profileId)
    {
    case 0x0001:
        return Profile::AES128_CM_SHA1_80;
    case 0x0002:
        return Profile::AES128_CM_SHA1_32;
    case 0x0007:
        return Profile::AEAD_AES_128_GCM;
    case 0x0008:
        return Profile::AEAD_AES_256_GCM;
    default:
        return Profile::NULL_CIPHER;
    }
}

const char* toString(Profile profile)
{
    switch (profile)
    {
    case srtp::Profile::AES128_CM_SHA1_80:
        return "AES_CM_128_HMAC_SHA1_80";
    case srtp::Profile::AES128_CM_SHA1_32:
        return "AES_CM_128_HMAC_SHA1_32";
    case srtp::Profile::AEAD_AES_128_GCM:
        return "AEAD_AES_128_GCM";
    case srtp::Profile::AEAD_AES_256_GCM:
        return "AEAD_AES_256_GCM";
    default:
        return "NULL";
    }
}

Profile fromString(const std::string& name)
{
    if (name == "AES_CM_128_HMAC_SHA1_80" || name == "SRTP_AES128_CM_HMAC_SHA1_80")
    {
        return Profile::AES128_CM_SHA1_80;
    }
    if (name == "AES_CM_128_HMAC_SHA1_32" || name == "SRTP_AES128_CM_HMAC_SHA1_32")
    {
        return Profile::AES128_CM_SHA1_32;
    }
    if (name == "AEAD_AES_128_GCM" || name == "SRTP_AEAD_AES_128_GCM")
    {
        return Profile::AEAD_AES_128_GCM;
    }
    if (name == "AEAD_AES_256_GCM" || name == "SRTP_AEAD_AES_256_GCM")
    {
        return Profile::AEAD_AES_256_GCM;
    }
    return Profile::NULL_CIPHER;
}
} // namespace srtp
