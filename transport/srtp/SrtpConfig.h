#pragma once

#include "transport/dtls/SrtpProfiles.h"
#include <cstdint>

namespace config
{
class RtcConfig;
}

namespace transport
{

struct SrtpConfig
{
    srtp::Profile profile = srtp::AES128_CM_SHA1_80;
    uint32_t replayWindowSize = 64;
    bool disableReplay = false;
};

bool readSrtpConfig(const config::RtcConfig& rtcConfig, SrtpConfig& srtpConfig);

} // namespace transport
