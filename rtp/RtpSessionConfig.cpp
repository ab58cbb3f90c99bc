#include "rtp/RtpSessionConfig.h"
#include "config/RtcConfig.h"
#include "logger/Logger.h"
#include "rtp/NackGenerator.h"
#include "rtp/NackResponder.h"

namespace rtp
{

bool readRtpSessionConfig(const config::RtcConfig& rtcConfig, RtpSessionConfig& rtpConfig)
{
    const auto& group = rtcConfig.rtp;
    if (!NackGenerator::isValidSize(group.nackBufferSize.get()))
    {
        logger::error("rtp.nackBufferSize %u must be a power of two in 64..32768",
            "RtpSessionConfig",
            group.nackBufferSize.get());
        return false;
    }

    const uint32_t responderSize = group.responderBufferSize.get();
    if (responderSize == 0 || responderSize > NackResponder::MAX_SIZE || (responderSize & (responderSize - 1)) != 0)
    {
        logger::error("rtp.responderBufferSize %u must be a power of two up to %u",
            "RtpSessionConfig",
            responderSize,
            static_cast<uint32_t>(NackResponder::MAX_SIZE));
        return false;
    }

    if (group.twccExtensionId.get() > 255)
    {
        logger::error("rtp.twccExtensionId %u out of range", "RtpSessionConfig", group.twccExtensionId.get());
        return false;
    }

    if (group.nackSkipLastN.get() >= group.nackBufferSize.get() || group.receiveMtu.get() < 64 ||
        group.nackIntervalMs.get() == 0 || group.reportIntervalMs.get() == 0 || group.twccIntervalMs.get() == 0)
    {
        logger::error("invalid rtp settings", "RtpSessionConfig");
        return false;
    }

    rtpConfig.receiveMtu = group.receiveMtu.get();
    rtpConfig.nackIntervalMs = group.nackIntervalMs.get();
    rtpConfig.nackSkipLastN = static_cast<uint16_t>(group.nackSkipLastN.get());
    rtpConfig.nackBufferSize = static_cast<uint16_t>(group.nackBufferSize.get());
    rtpConfig.responderBufferSize = static_cast<uint16_t>(responderSize);
    rtpConfig.reportIntervalMs = group.reportIntervalMs.get();
    rtpConfig.twccIntervalMs = group.twccIntervalMs.get();
    rtpConfig.twccExtensionId = static_cast<uint8_t>(group.twccExtensionId.get());
    rtpConfig.sendMtu = rtcConfig.dtls.mtu;
    rtpConfig.cname = group.cname.get();
    return true;
}

} // namespace rtp
