#pragma once

#include <cstdint>
#include <string>

namespace config
{
class RtcConfig;
}

namespace rtp
{

struct RtpSessionConfig
{
    uint32_t receiveMtu = 1460;
    uint32_t nackIntervalMs = 100;
    uint16_t nackSkipLastN = 0;
    uint16_t nackBufferSize = 1024;
    uint16_t responderBufferSize = 1024;
    uint32_t reportIntervalMs = 5000;
    uint32_t twccIntervalMs = 100;
    uint8_t twccExtensionId = 0;
    uint32_t sendMtu = 1200;
    std::string cname;
};

bool readRtpSessionConfig(const config::RtcConfig& rtcConfig, RtpSessionConfig& rtpConfig);

} // namespace rtp
