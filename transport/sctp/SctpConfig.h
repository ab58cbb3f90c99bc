#pragma once
#include <cstddef>
#include <cstdint>

namespace config
{
class RtcConfig;
}

namespace sctp
{

struct SctpConfig
{
    struct // in ms, rfc6298
    {
        uint64_t initial = 1000;
        uint64_t min = 1000;
        uint64_t max = 60000;
        double alpha = 0.125;
        double beta = 0.25;
    } RTO;

    struct
    {
        int maxRetransmits = 8;
    } init;

    struct
    {
        uint32_t interval = 30000; // ms, 0 disables
    } heartbeat;

    uint32_t cookieLifeTime = 60000; // ms

    struct
    {
        int maxRetransmits = 10; // consecutive T3-rtx expiries before the association fails
    } flow;

    uint32_t delayedAck = 200; // ms
    uint32_t mtu = 1200;

    size_t maxReceiveBufferSize = 1024 * 1024;
    size_t maxMessageSize = 64 * 1024;
    size_t maxTransmitBufferSize = 4 * 1024 * 1024; // queued and unacked bytes
    size_t maxDuplicateTsnReports = 16;
    uint16_t streamCount = 1024;
};

bool readSctpConfig(const config::RtcConfig& rtcConfig, SctpConfig& sctpConfig);

} // namespace sctp
