#include "transport/sctp/SctpConfig.h"
#include "config/RtcConfig.h"
#include "logger/Logger.h"

namespace sctp
{

bool readSctpConfig(const config::RtcConfig& rtcConfig, SctpConfig& sctpConfig)
{
    const auto& group = rtcConfig.sctp;
    if (group.mtu.get() < 576 || group.mtu.get() > 9000)
    {
        logger::error("invalid sctp.mtu %u", "SctpConfig", group.mtu.get());
        return false;
    }
    if (group.rtoMinMs.get() == 0 || group.rtoMinMs.get() > group.rtoMaxMs.get() ||
        group.rtoInitialMs.get() < group.rtoMinMs.get() || group.rtoInitialMs.get() > group.rtoMaxMs.get())
    {
        logger::error("invalid sctp rto range initial %u min %u max %u",
            "SctpConfig",
            group.rtoInitialMs.get(),
            group.rtoMinMs.get(),
            group.rtoMaxMs.get());
        return false;
    }
    if (group.maxMessageSize.get() == 0 || group.maxReceiveBufferSize.get() < group.maxMessageSize.get())
    {
        logger::error("invalid sctp.maxMessageSize %u, receive buffer %u",
            "SctpConfig",
            group.maxMessageSize.get(),
            group.maxReceiveBufferSize.get());
        return false;
    }

    sctpConfig.mtu = group.mtu.get();
    sctpConfig.RTO.initial = group.rtoInitialMs.get();
    sctpConfig.RTO.min = group.rtoMinMs.get();
    sctpConfig.RTO.max = group.rtoMaxMs.get();
    sctpConfig.init.maxRetransmits = static_cast<int>(group.maxInitRetransmits.get());
    sctpConfig.flow.maxRetransmits = static_cast<int>(group.maxRetransmits.get());
    sctpConfig.delayedAck = group.delayedAckMs.get();
    sctpConfig.heartbeat.interval = group.heartbeatIntervalMs.get();
    sctpConfig.cookieLifeTime = group.cookieLifeTimeMs.get();
    sctpConfig.maxReceiveBufferSize = group.maxReceiveBufferSize.get();
    sctpConfig.maxMessageSize = group.maxMessageSize.get();
    return true;
}

} // namespace sctp
