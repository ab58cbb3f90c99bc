#include "transport/srtp/SrtpConfig.h"
#include "config/RtcConfig.h"
#include "logger/Logger.h"

namespace transport
{

bool readSrtpConfig(const config::RtcConfig& rtcConfig, SrtpConfig& srtpConfig)
{
    const auto profile = srtp::fromString(rtcConfig.srtp.profile.get());
    if (profile == srtp::NULL_CIPHER)
    {
        logger::error("invalid srtp.profile '%s'", "SrtpConfig", rtcConfig.srtp.profile.get().c_str());
        return false;
    }

    if (rtcConfig.srtp.replayWindowSize < 1 || rtcConfig.srtp.replayWindowSize > 0x8000)
    {
        logger::error("invalid srtp.replayWindowSize %u", "SrtpConfig", rtcConfig.srtp.replayWindowSize.get());
        return false;
    }

    srtpConfig.profile = profile;
    srtpConfig.replayWindowSize = rtcConfig.srtp.replayWindowSize;
    srtpConfig.disableReplay = rtcConfig.srtp.disableReplay;
    return true;
}

} // namespace transport
