#pragma once

#include "logger/Logger.h"
#include "logger/PruneSpam.h"
#include "memory/Packet.h"
#include "rtp/NackGenerator.h"
#include "rtp/NackResponder.h"
#include "rtp/RtcpTransportFeedback.h"
#include "rtp/RtpSessionConfig.h"
#include "rtp/TwccRecorder.h"
#include "transport/RtcpReportsProducer.h"
#include "transport/RtpReceiveState.h"
#include "transport/RtpSenderState.h"
#include "transport/sctp/SctpTimer.h"
#include "transport/srtp/SrtpContext.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace rtp
{
struct RtcpHeader;
class ReportBlock;
} // namespace rtp

namespace transport
{
class RtpWriter;

struct RtpPacketAttributes
{
    uint32_t ssrc = 0;
    uint16_t sequenceNumber = 0;
    uint32_t extendedSequenceNumber = 0;
    uint32_t rtpTimestamp = 0;
    uint8_t payloadType = 0;
    bool marker = false;
    uint64_t receiveTime = 0;
    bool hasTransportSequenceNumber = false;
    uint16_t transportSequenceNumber = 0;
    size_t headerLength = 0;
    size_t payloadLength = 0;
};

/**
 * RTP and RTCP on one transport. Inbound streams are created on their first packet. Missing packets are
 * requested with generic NACK, arrivals are reported in transport wide feedback when the extension is
 * negotiated and sender and receiver reports go out every report interval.
 * When an SrtpContext is installed every packet is protected before it reaches the RtpWriter and
 * unprotected on receipt. Packets failing authentication are dropped and reported.
 *
 * Not thread safe. All timestamps in nanoseconds.
 */
class RtpSession : private RtcpReportsProducer::RtcpSender
{
public:
    class IEvents
    {
    public:
        virtual ~IEvents() = default;

        virtual void onRtpReceived(RtpSession& session, memory::Packet& packet, const RtpPacketAttributes& attributes) = 0;
        virtual void onRtcpReceived(RtpSession& session, const rtp::RtcpHeader& header, uint64_t timestamp) = 0;
        virtual void onKeyFrameRequested(RtpSession& session, uint32_t mediaSsrc) = 0;
        virtual void onTransportFeedback(RtpSession& session,
            uint32_t mediaSsrc,
            const std::vector<rtp::TransportFeedbackStatus>& statuses) = 0;
        virtual void onEstimatedBitrate(RtpSession& session, uint64_t bitrateBps) = 0;
        virtual void onRemoteSsrcEnded(RtpSession& session, uint32_t ssrc) = 0;
        virtual void onProtectionFailure(RtpSession& session, SrtpContext::Result result, bool isRtcp) = 0;
    };

    static constexpr size_t MAX_INBOUND_STREAMS = 256;
    static constexpr uint32_t DEFAULT_RTP_FREQUENCY = 90000;

    RtpSession(size_t logId, const rtp::RtpSessionConfig& config, RtpWriter& writer, IEvents* listener);

    void setSrtpContext(std::unique_ptr<SrtpContext> srtpContext);
    bool isProtected() const { return !!_srtp; }

    // registers clock rates, streams not registered use DEFAULT_RTP_FREQUENCY
    void addLocalStream(uint32_t ssrc, uint32_t rtpFrequency);
    void addRemoteStream(uint32_t ssrc, uint32_t rtpFrequency);
    // sends BYE for the stream and forgets it
    void removeLocalStream(uint32_t ssrc, uint64_t timestamp);

    // The packet is stamped with the transport wide sequence number and protected in place
    bool writeRtp(memory::Packet& packet, uint64_t timestamp);
    // protected in place
    bool writeRtcp(memory::Packet& packet, uint64_t timestamp);
    bool requestKeyFrame(uint32_t mediaSsrc, uint64_t timestamp);

    void onPacketReceived(memory::Packet& packet, uint64_t timestamp);

    int64_t nextTimeout(uint64_t timestamp) const;
    int64_t processTimeout(uint64_t timestamp);

    uint32_t getSessionSsrc() const { return _sessionSsrc; }
    const std::string& getCname() const { return _reportsProducer.getCname(); }
    const logger::LoggableId& getLoggableId() const { return _loggableId; }
    const RtpReceiveState* getReceiveState(uint32_t ssrc) const;
    const RtpSenderState* getSenderState(uint32_t ssrc) const;
    std::vector<uint32_t> getRemoteSsrcs() const;
    uint64_t getNackCount() const { return _nacksSent; }
    uint64_t getRetransmissionCount() const { return _retransmissionsSent; }

private:
    struct InboundStream
    {
        InboundStream(uint32_t rtpFrequency, uint16_t nackBufferSize)
            : receiveState(rtpFrequency),
              nackGenerator(nackBufferSize)
        {
        }

        RtpReceiveState receiveState;
        rtp::NackGenerator nackGenerator;
    };

    struct OutboundStream
    {
        OutboundStream(uint32_t rtpFrequency, uint16_t responderBufferSize)
            : senderState(rtpFrequency),
              nackResponder(responderBufferSize)
        {
        }

        RtpSenderState senderState;
        rtp::NackResponder nackResponder;
    };

    // RtcpReportsProducer::RtcpSender
    void sendRtcp(memory::Packet& packet, uint64_t timestamp) override;

    void startTimers(uint64_t timestamp);
    InboundStream* getInboundStream(uint32_t ssrc);
    OutboundStream& getOutboundStream(uint32_t ssrc);

    void onRtpReceived(memory::Packet& packet, uint64_t timestamp);
    void onRtcpReceived(memory::Packet& packet, uint64_t timestamp);
    void onReportBlocks(const rtp::ReportBlock* blocks, size_t count, uint64_t timestamp, uint32_t ntp32);
    void onNackReceived(const rtp::RtcpHeader& header, uint64_t timestamp);
    void onPayloadSpecificFeedback(const rtp::RtcpHeader& header);
    void onTransportWideFeedback(const rtp::RtcpHeader& header);
    void onGoodbye(const rtp::RtcpHeader& header);

    void sendNacks(uint64_t timestamp);
    void sendTransportFeedback(uint64_t timestamp);
    void sendReports(uint64_t timestamp);
    size_t getMaxRtcpSize() const;

    logger::LoggableId _loggableId;
    rtp::RtpSessionConfig _config;
    RtpWriter& _writer;
    IEvents* _listener;
    std::unique_ptr<SrtpContext> _srtp;
    uint32_t _sessionSsrc;

    std::map<uint32_t, InboundStream> _inbound;
    std::map<uint32_t, OutboundStream> _outbound;
    std::map<uint32_t, uint32_t> _remoteFrequencies;

    rtp::TwccRecorder _twccRecorder;
    uint16_t _transportSequenceNumber;
    RtcpReportsProducer _reportsProducer;

    bool _timersStarted;
    sctp::Timer _nackTimer;
    sctp::Timer _twccTimer;
    sctp::Timer _reportTimer;

    uint64_t _nacksSent;
    uint64_t _retransmissionsSent;
    logger::PruneSpam _dropLog;
};

} // namespace transport
