#include "transport/RtpSession.h"
#include "rtp/RtcpFeedback.h"
#include "rtp/RtcpHeader.h"
#include "rtp/RtcpNackBuilder.h"
#include "rtp/RtpHeader.h"
#include "transport/RtpWriter.h"
#include "utils/MersienneRandom.h"
#include "utils/Time.h"
#include <algorithm>
#include <cstring>

namespace
{
// SRTCP index and the largest authentication tag
const size_t SRTCP_MAX_OVERHEAD = 4 + 16;
const size_t CNAME_LENGTH = 16;

std::string makeCname(const std::string& configured, utils::MersienneRandom<uint64_t>& random)
{
    if (!configured.empty())
    {
        return configured;
    }

    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789+/";
    std::string cname;
    for (size_t i = 0; i < CNAME_LENGTH; ++i)
    {
        cname.push_back(alphabet[random.next() % (sizeof(alphabet) - 1)]);
    }
    return cname;
}

uint32_t makeSsrc(utils::MersienneRandom<uint64_t>& random)
{
    uint32_t ssrc = 0;
    while (ssrc == 0)
    {
        ssrc = static_cast<uint32_t>(random.next());
    }
    return ssrc;
}

utils::MersienneRandom<uint64_t>& getRandom()
{
    static thread_local utils::MersienneRandom<uint64_t> random;
    return random;
}
} // namespace

namespace transport
{

RtpSession::RtpSession(size_t logId, const rtp::RtpSessionConfig& config, RtpWriter& writer, IEvents* listener)
    : _loggableId("RtpSession", logId),
      _config(config),
      _writer(writer),
      _listener(listener),
      _sessionSsrc(makeSsrc(getRandom())),
      _twccRecorder(_sessionSsrc),
      _transportSequenceNumber(0),
      _reportsProducer(_loggableId,
          config.sendMtu > SRTCP_MAX_OVERHEAD ? config.sendMtu - SRTCP_MAX_OVERHEAD : 0,
          makeCname(config.cname, getRandom()),
          *this),
      _timersStarted(false),
      _nacksSent(0),
      _retransmissionsSent(0),
      _dropLog(10, 500)
{
}

void RtpSession::setSrtpContext(std::unique_ptr<SrtpContext> srtpContext)
{
    _srtp = std::move(srtpContext);
    if (_srtp)
    {
        logger::info("protected by %s", _loggableId.c_str(), srtp::toString(_srtp->getProfile()));
    }
}

void RtpSession::addLocalStream(const uint32_t ssrc, const uint32_t rtpFrequency)
{
    auto it = _outbound.find(ssrc);
    if (it != _outbound.end())
    {
        logger::warn("local ssrc %u already added", _loggableId.c_str(), ssrc);
        return;
    }

    _outbound.emplace(ssrc, OutboundStream(rtpFrequency, _config.responderBufferSize));
}

void RtpSession::addRemoteStream(const uint32_t ssrc, const uint32_t rtpFrequency)
{
    _remoteFrequencies[ssrc] = rtpFrequency;
    auto it = _inbound.find(ssrc);
    if (it != _inbound.end() && !it->second.receiveState.hasReceived())
    {
        _inbound.erase(it);
    }
}

void RtpSession::removeLocalStream(const uint32_t ssrc, const uint64_t timestamp)
{
    auto it = _outbound.find(ssrc);
    if (it == _outbound.end())
    {
        return;
    }

    memory::Packet packet;
    auto* receiverReport = rtp::RtcpReceiverReport::create(packet.get());
    receiverReport->ssrc = ssrc;
    packet.setLength(receiverReport->header.size());
    auto* goodbye = rtp::RtcpGoodbye::create(packet.get() + packet.getLength(), ssrc);
    packet.setLength(packet.getLength() + goodbye->header.size());
    writeRtcp(packet, timestamp);

    _outbound.erase(it);
    if (_srtp)
    {
        _srtp->removeLocalSsrc(ssrc);
    }
}

RtpSession::OutboundStream& RtpSession::getOutboundStream(const uint32_t ssrc)
{
    auto it = _outbound.find(ssrc);
    if (it != _outbound.end())
    {
        return it->second;
    }

    logger::debug("local ssrc %u not added, assuming %u Hz", _loggableId.c_str(), ssrc, DEFAULT_RTP_FREQUENCY);
    return _outbound.emplace(ssrc, OutboundStream(DEFAULT_RTP_FREQUENCY, _config.responderBufferSize))
        .first->second;
}

RtpSession::InboundStream* RtpSession::getInboundStream(const uint32_t ssrc)
{
    auto it = _inbound.find(ssrc);
    if (it != _inbound.end())
    {
        return &it->second;
    }

    if (_inbound.size() >= MAX_INBOUND_STREAMS)
    {
        return nullptr;
    }

    auto frequencyIt = _remoteFrequencies.find(ssrc);
    const uint32_t rtpFrequency = frequencyIt != _remoteFrequencies.end() ? frequencyIt->second : DEFAULT_RTP_FREQUENCY;
    logger::info("new inbound ssrc %u, %u Hz", _loggableId.c_str(), ssrc, rtpFrequency);
    return &_inbound.emplace(ssrc, InboundStream(rtpFrequency, _config.nackBufferSize)).first->second;
}

void RtpSession::startTimers(const uint64_t timestamp)
{
    if (_timersStarted)
    {
        return;
    }

    _timersStarted = true;
    _nackTimer.start(timestamp, _config.nackIntervalMs * utils::Time::ms);
    if (_config.twccExtensionId != 0)
    {
        _twccTimer.start(timestamp, _config.twccIntervalMs * utils::Time::ms);
    }
    _reportTimer.start(timestamp, _config.reportIntervalMs * utils::Time::ms);
}

bool RtpSession::writeRtp(memory::Packet& packet, const uint64_t timestamp)
{
    startTimers(timestamp);
    auto* header = rtp::RtpHeader::fromPacket(packet);
    if (!header)
    {
        logger::warn("refusing to send malformed rtp packet", _loggableId.c_str());
        return false;
    }

    if (_config.twccExtensionId != 0 &&
        !rtp::setTransportWideSequenceNumber(packet, _config.twccExtensionId, _transportSequenceNumber))
    {
        logger::warn("no room for transport sequence number", _loggableId.c_str());
        return false;
    }

    const size_t overhead = _srtp ? _srtp->getRtpOverhead() : 0;
    if (packet.getLength() + overhead > _config.sendMtu)
    {
        logger::warn("rtp packet %zu exceeds mtu %u", _loggableId.c_str(), packet.getLength(), _config.sendMtu);
        return false;
    }

    header = rtp::RtpHeader::fromPacket(packet);
    auto& stream = getOutboundStream(header->ssrc.get());
    stream.nackResponder.onPacketSent(packet);
    stream.senderState.onRtpSent(timestamp, packet);
    if (_config.twccExtensionId != 0)
    {
        ++_transportSequenceNumber;
    }

    if (_srtp)
    {
        const auto result = _srtp->encryptRtp(packet);
        if (result != SrtpContext::Result::Ok)
        {
            logger::error("failed to protect rtp %s", _loggableId.c_str(), toString(result));
            return false;
        }
    }

    return _writer.writeRtpDatagram(packet, timestamp);
}

bool RtpSession::writeRtcp(memory::Packet& packet, const uint64_t timestamp)
{
    startTimers(timestamp);
    if (!rtp::isValidRtcpPacket(packet))
    {
        logger::warn("refusing to send malformed rtcp packet", _loggableId.c_str());
        return false;
    }

    if (_srtp)
    {
        const auto result = _srtp->encryptRtcp(packet);
        if (result != SrtpContext::Result::Ok)
        {
            logger::error("failed to protect rtcp %s", _loggableId.c_str(), toString(result));
            return false;
        }
    }

    return _writer.writeRtpDatagram(packet, timestamp);
}

void RtpSession::sendRtcp(memory::Packet& packet, const uint64_t timestamp)
{
    writeRtcp(packet, timestamp);
}

bool RtpSession::requestKeyFrame(const uint32_t mediaSsrc, const uint64_t timestamp)
{
    memory::Packet packet;
    auto& pli = rtp::createPli(packet.get(), _sessionSsrc, mediaSsrc);
    packet.setLength(pli.header.size());
    return writeRtcp(packet, timestamp);
}

void RtpSession::onPacketReceived(memory::Packet& packet, const uint64_t timestamp)
{
    startTimers(timestamp);
    if (packet.getLength() > _config.receiveMtu)
    {
        if (_dropLog.canLog())
        {
            logger::warn("dropping %zu bytes packet above mtu", _loggableId.c_str(), packet.getLength());
        }
        return;
    }

    if (rtp::isRtcpPacket(packet))
    {
        onRtcpReceived(packet, timestamp);
    }
    else if (rtp::isRtpPacket(packet))
    {
        onRtpReceived(packet, timestamp);
    }
    else if (_dropLog.canLog())
    {
        logger::debug("dropping non rtp packet of %zu bytes", _loggableId.c_str(), packet.getLength());
    }
}

void RtpSession::onRtpReceived(memory::Packet& packet, const uint64_t timestamp)
{
    if (_srtp)
    {
        const auto result = _srtp->decryptRtp(packet);
        if (result != SrtpContext::Result::Ok)
        {
            if (_dropLog.canLog())
            {
                logger::info("dropping rtp, %s", _loggableId.c_str(), toString(result));
            }
            if (_listener)
            {
                _listener->onProtectionFailure(*this, result, false);
            }
            return;
        }
    }

    auto* header = rtp::RtpHeader::fromPacket(packet);
    if (!header)
    {
        return;
    }

    const uint32_t ssrc = header->ssrc.get();
    auto* stream = getInboundStream(ssrc);
    if (!stream)
    {
        if (_dropLog.canLog())
        {
            logger::warn("too many inbound streams, dropping ssrc %u", _loggableId.c_str(), ssrc);
        }
        return;
    }

    stream->receiveState.onRtpReceived(packet, timestamp);
    stream->nackGenerator.onPacketReceived(header->sequenceNumber.get());

    RtpPacketAttributes attributes;
    attributes.ssrc = ssrc;
    attributes.sequenceNumber = header->sequenceNumber.get();
    attributes.extendedSequenceNumber = stream->receiveState.getExtendedSequenceNumber();
    attributes.rtpTimestamp = header->timestamp.get();
    attributes.payloadType = header->payloadType;
    attributes.marker = header->marker;
    attributes.receiveTime = timestamp;
    attributes.headerLength = header->headerLength();
    attributes.payloadLength = header->getPayloadLength(packet.getLength());

    if (_config.twccExtensionId != 0 &&
        rtp::getTransportWideSequenceNumber(packet, _config.twccExtensionId, attributes.transportSequenceNumber))
    {
        attributes.hasTransportSequenceNumber = true;
        _twccRecorder.onPacketReceived(ssrc, attributes.transportSequenceNumber, timestamp / utils::Time::us);
    }

    if (_listener)
    {
        _listener->onRtpReceived(*this, packet, attributes);
    }
}

void RtpSession::onRtcpReceived(memory::Packet& packet, const uint64_t timestamp)
{
    if (_srtp)
    {
        const auto result = _srtp->decryptRtcp(packet);
        if (result != SrtpContext::Result::Ok)
        {
            if (_dropLog.canLog())
            {
                logger::info("dropping rtcp, %s", _loggableId.c_str(), toString(result));
            }
            if (_listener)
            {
                _listener->onProtectionFailure(*this, result, true);
            }
            return;
        }
    }

    if (!rtp::isValidRtcpPacket(packet))
    {
        if (_dropLog.canLog())
        {
            logger::info("dropping malformed rtcp", _loggableId.c_str());
        }
        return;
    }

    const uint32_t ntp32 = utils::Time::toNtp32(utils::Time::now());
    const rtp::CompoundRtcpPacket compound(packet.get(), packet.getLength());
    for (auto& header : compound)
    {
        switch (header.packetType)
        {
        case rtp::SENDER_REPORT:
            if (auto* senderReport = rtp::RtcpSenderReport::fromPtr(&header, header.size()))
            {
                auto it = _inbound.find(senderReport->ssrc.get());
                if (it != _inbound.end())
                {
                    it->second.receiveState.onSenderReportReceived(*senderReport, timestamp);
                }
                onReportBlocks(senderReport->reportBlocks, header.fmtCount, timestamp, ntp32);
            }
            break;
        case rtp::RECEIVER_REPORT:
            if (auto* receiverReport = rtp::RtcpReceiverReport::fromPtr(&header, header.size()))
            {
                onReportBlocks(receiverReport->reportBlocks, header.fmtCount, timestamp, ntp32);
            }
            break;
        case rtp::GOODBYE:
            onGoodbye(header);
            break;
        case rtp::RTPTRANSPORT_FB:
            if (header.fmtCount == rtp::FB_GENERIC_NACK)
            {
                onNackReceived(header, timestamp);
            }
            else if (header.fmtCount == rtp::FB_TRANSPORT_CC)
            {
                onTransportWideFeedback(header);
            }
            break;
        case rtp::PAYLOADSPECIFIC_FB:
            onPayloadSpecificFeedback(header);
            break;
        default:
            break;
        }

        if (_listener)
        {
            _listener->onRtcpReceived(*this, header, timestamp);
        }
    }
}

void RtpSession::onReportBlocks(const rtp::ReportBlock* blocks,
    const size_t count,
    const uint64_t timestamp,
    const uint32_t ntp32)
{
    for (size_t i = 0; i < count; ++i)
    {
        auto it = _outbound.find(blocks[i].ssrc.get());
        if (it != _outbound.end())
        {
            it->second.senderState.onReceiverBlockReceived(timestamp, ntp32, blocks[i]);
        }
    }
}

void RtpSession::onNackReceived(const rtp::RtcpHeader& header, const uint64_t timestamp)
{
    auto* feedback = rtp::RtcpFeedback::fromPtr(&header, header.size());
    if (!feedback)
    {
        return;
    }

    auto it = _outbound.find(feedback->mediaSsrc.get());
    if (it == _outbound.end())
    {
        return;
    }

    auto& stream = it->second;
    const auto* items = rtp::getNackItems(*feedback);
    const size_t itemCount = rtp::getNackItemCount(*feedback);
    for (size_t i = 0; i < itemCount; ++i)
    {
        items[i].forEachLost([&](const uint16_t sequenceNumber) {
            auto* stored = stream.nackResponder.getPacket(sequenceNumber);
            if (!stored)
            {
                return;
            }

            memory::Packet packet;
            std::memcpy(packet.get(), stored->get(), stored->getLength());
            packet.setLength(stored->getLength());
            if (_srtp && _srtp->encryptRtp(packet) != SrtpContext::Result::Ok)
            {
                return;
            }

            if (_writer.writeRtpDatagram(packet, timestamp))
            {
                stream.senderState.onRetransmissionSent();
                ++_retransmissionsSent;
            }
        });
    }
}

void RtpSession::onPayloadSpecificFeedback(const rtp::RtcpHeader& header)
{
    if (!_listener)
    {
        return;
    }

    if (rtp::isPli(&header, header.size()))
    {
        auto* feedback = rtp::RtcpFeedback::fromPtr(&header, header.size());
        _listener->onKeyFrameRequested(*this, feedback->mediaSsrc.get());
    }
    else if (auto* fir = rtp::RtcpFirFeedback::fromPtr(&header, header.size()))
    {
        for (size_t i = 0; i < fir->getCount(); ++i)
        {
            _listener->onKeyFrameRequested(*this, fir->getEntry(i).ssrc.get());
        }
    }
    else if (auto* remb = rtp::RtcpRembFeedback::fromPtr(&header, header.size()))
    {
        _listener->onEstimatedBitrate(*this, remb->getBitrate());
    }
}

void RtpSession::onTransportWideFeedback(const rtp::RtcpHeader& header)
{
    auto* feedback = rtp::RtcpTransportFeedback::fromPtr(&header, header.size());
    if (!feedback)
    {
        return;
    }

    std::vector<rtp::TransportFeedbackStatus> statuses;
    if (!rtp::parseTransportFeedback(*feedback, statuses))
    {
        logger::info("malformed transport feedback", _loggableId.c_str());
        return;
    }

    if (_listener)
    {
        _listener->onTransportFeedback(*this, feedback->mediaSsrc.get(), statuses);
    }
}

void RtpSession::onGoodbye(const rtp::RtcpHeader& header)
{
    auto* goodbye = rtp::RtcpGoodbye::fromPtr(&header, header.size());
    if (!goodbye)
    {
        return;
    }

    for (uint32_t i = 0; i < goodbye->getSsrcCount(); ++i)
    {
        const uint32_t ssrc = goodbye->ssrc[i].get();
        auto it = _inbound.find(ssrc);
        if (it == _inbound.end())
        {
            continue;
        }

        logger::info("remote ssrc %u ended", _loggableId.c_str(), ssrc);
        _inbound.erase(it);
        if (_srtp)
        {
            _srtp->removeRemoteSsrc(ssrc);
        }
        if (_listener)
        {
            _listener->onRemoteSsrcEnded(*this, ssrc);
        }
    }
}

size_t RtpSession::getMaxRtcpSize() const
{
    const size_t mtu = std::min(static_cast<size_t>(_config.sendMtu), memory::Packet::maxLength());
    return mtu > SRTCP_MAX_OVERHEAD ? mtu - SRTCP_MAX_OVERHEAD : 0;
}

void RtpSession::sendNacks(const uint64_t timestamp)
{
    const size_t maxSize = getMaxRtcpSize();
    memory::Packet packet;
    for (auto& it : _inbound)
    {
        if (!it.second.nackGenerator.isStarted())
        {
            continue;
        }

        const auto missing = it.second.nackGenerator.getMissingSequenceNumbers(_config.nackSkipLastN);
        auto nextMissing = missing.cbegin();
        while (nextMissing != missing.cend())
        {
            rtp::RtcpNackBuilder builder(_sessionSsrc, it.first);
            while (nextMissing != missing.cend() && builder.add(*nextMissing))
            {
                ++nextMissing;
            }

            if (packet.getLength() + builder.size() > maxSize)
            {
                writeRtcp(packet, timestamp);
                packet.setLength(0);
            }
            const size_t written = builder.write(packet.get() + packet.getLength(), packet.getFreeSpace());
            packet.setLength(packet.getLength() + written);
            ++_nacksSent;
        }
    }

    if (packet.getLength() > 0)
    {
        writeRtcp(packet, timestamp);
    }
}

void RtpSession::sendTransportFeedback(const uint64_t timestamp)
{
    const size_t maxSize = getMaxRtcpSize();
    while (!_twccRecorder.empty())
    {
        memory::Packet packet;
        const size_t length = _twccRecorder.buildFeedback(packet.get(), maxSize, maxSize);
        if (length == 0)
        {
            logger::warn("failed to build transport feedback", _loggableId.c_str());
            return;
        }
        packet.setLength(length);
        writeRtcp(packet, timestamp);
    }
}

void RtpSession::sendReports(const uint64_t timestamp)
{
    RtcpReportsProducer::SenderStates senderStates;
    for (auto& it : _outbound)
    {
        senderStates.emplace_back(it.first, &it.second.senderState);
    }

    RtcpReportsProducer::ReceiveStates receiveStates;
    for (auto& it : _inbound)
    {
        receiveStates.emplace_back(it.first, &it.second.receiveState);
    }

    const auto wallClock = utils::Time::toNtp(utils::Time::now());
    _reportsProducer.sendReports(timestamp, wallClock, senderStates, receiveStates, _sessionSsrc);
}

int64_t RtpSession::nextTimeout(const uint64_t timestamp) const
{
    if (!_timersStarted)
    {
        return 0;
    }

    const int64_t remaining = std::min({_nackTimer.timeToExpiry(timestamp),
        _twccTimer.timeToExpiry(timestamp),
        _reportTimer.timeToExpiry(timestamp)});
    return std::max(int64_t(0), remaining);
}

int64_t RtpSession::processTimeout(const uint64_t timestamp)
{
    if (!_timersStarted)
    {
        startTimers(timestamp);
        return nextTimeout(timestamp);
    }

    if (_nackTimer.hasExpired(timestamp))
    {
        sendNacks(timestamp);
        _nackTimer.start(timestamp, _config.nackIntervalMs * utils::Time::ms);
    }

    if (_twccTimer.hasExpired(timestamp))
    {
        sendTransportFeedback(timestamp);
        _twccTimer.start(timestamp, _config.twccIntervalMs * utils::Time::ms);
    }

    if (_reportTimer.hasExpired(timestamp))
    {
        sendReports(timestamp);
        _reportTimer.start(timestamp, _config.reportIntervalMs * utils::Time::ms);
    }

    return nextTimeout(timestamp);
}

const RtpReceiveState* RtpSession::getReceiveState(const uint32_t ssrc) const
{
    auto it = _inbound.find(ssrc);
    return it != _inbound.end() ? &it->second.receiveState : nullptr;
}

const RtpSenderState* RtpSession::getSenderState(const uint32_t ssrc) const
{
    auto it = _outbound.find(ssrc);
    return it != _outbound.end() ? &it->second.senderState : nullptr;
}

std::vector<uint32_t> RtpSession::getRemoteSsrcs() const
{
    std::vector<uint32_t> ssrcs;
    for (auto& it : _inbound)
    {
        ssrcs.push_back(it.first);
    }
    return ssrcs;
}

} // namespace transport
