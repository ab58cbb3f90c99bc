#pragma once

#include "logger/Logger.h"
#include "memory/Packet.h"
#include "transport/RtpReceiveState.h"
#include "transport/RtpSenderState.h"
#include <string>
#include <utility>
#include <vector>

namespace transport
{

/**
 * Builds compound RTCP packets with sender reports for local ssrcs that have sent media, report blocks
 * for every remote ssrc and an SDES CNAME chunk per reporting ssrc. Packets never exceed the mtu.
 */
class RtcpReportsProducer
{
public:
    struct RtcpSender
    {
        virtual ~RtcpSender() = default;
        virtual void sendRtcp(memory::Packet& packet, uint64_t timestamp) = 0;
    };

    typedef std::vector<std::pair<uint32_t, RtpSenderState*>> SenderStates;
    typedef std::vector<std::pair<uint32_t, RtpReceiveState*>> ReceiveStates;

    RtcpReportsProducer(const logger::LoggableId& loggableId, size_t mtu, const std::string& cname, RtcpSender& sender);

    // @return number of compound packets sent
    size_t sendReports(uint64_t timestamp,
        uint64_t wallClockNtp,
        const SenderStates& outbound,
        const ReceiveStates& inbound,
        uint32_t receiveReportSsrc);

    const std::string& getCname() const { return _cname; }

private:
    size_t getSdesSize(size_t chunkCount) const;
    size_t getReportBlockSpace(size_t reportSize, size_t remainingBlocks) const;
    void flush(uint64_t timestamp);

    const logger::LoggableId& _loggableId;
    const size_t _packetLimit;
    const std::string _cname;
    RtcpSender& _rtcpSender;

    memory::Packet _packet;
    std::vector<uint32_t> _reportSsrcs;
    size_t _packetsSent;
};

} // namespace transport
