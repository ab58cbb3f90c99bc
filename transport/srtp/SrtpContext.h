#pragma once

#include "crypto/ReplayWindow.h"
#include "crypto/SslHelper.h"
#include "logger/Logger.h"
#include "memory/Packet.h"
#include "transport/dtls/SrtpProfiles.h"
#include "transport/srtp/SrtpConfig.h"
#include <memory>
#include <unordered_map>

namespace transport
{

/**
 * SRTP and SRTCP protection for one DTLS-SRTP association, rfc3711 and rfc7714.
 * The local key protects outbound packets, the remote key unprotects inbound packets.
 * Packets are transformed in place. Encrypt needs room for the trailer in the packet buffer.
 *
 * Not thread safe. Use one context per direction pair and serialize access.
 */
class SrtpContext
{
public:
    enum class Result
    {
        Ok,
        AuthFailed,
        Replayed,
        Malformed
    };

    static constexpr uint32_t SRTCP_MAX_INDEX = 0x7FFFFFFFu;
    static constexpr uint32_t SRTCP_E_FLAG = 0x80000000u;

    SrtpContext(size_t logId, const SrtpConfig& config, const srtp::AesKey& localKey, const srtp::AesKey& remoteKey);

    bool isValid() const { return _valid; }
    srtp::Profile getProfile() const { return _config.profile; }

    Result encryptRtp(memory::Packet& packet);
    Result decryptRtp(memory::Packet& packet);
    Result encryptRtcp(memory::Packet& packet);
    Result decryptRtcp(memory::Packet& packet);

    // presets the rollover counter of a stream that did not start at roc 0
    void setLocalRolloverCounter(uint32_t ssrc, uint32_t roc);
    void setRemoteRolloverCounter(uint32_t ssrc, uint32_t roc);
    uint32_t getLocalRolloverCounter(uint32_t ssrc) const;
    uint32_t getRemoteRolloverCounter(uint32_t ssrc) const;
    void removeLocalSsrc(uint32_t ssrc);
    void removeRemoteSsrc(uint32_t ssrc);

    // maximum bytes added by encryptRtp and encryptRtcp
    size_t getRtpOverhead() const;
    size_t getRtcpOverhead() const;

    // rfc3711 section 4.3.1 key derivation with kdr 0
    static bool deriveSessionKey(const uint8_t* masterKey,
        size_t masterKeyLength,
        const uint8_t* masterSalt,
        size_t masterSaltLength,
        uint8_t label,
        uint8_t* out,
        size_t outLength);
    // rfc3711 appendix A
    static uint32_t estimateRolloverCounter(uint32_t roc, uint16_t lastSequenceNumber, uint16_t sequenceNumber);

private:
    enum Label : uint8_t
    {
        RTP_ENCRYPTION = 0,
        RTP_AUTHENTICATION,
        RTP_SALT,
        RTCP_ENCRYPTION,
        RTCP_AUTHENTICATION,
        RTCP_SALT
    };

    static constexpr size_t AUTH_KEY_SIZE = 20;
    static constexpr size_t RTCP_AUTH_TAG_SIZE = 10;
    static constexpr size_t MAX_SALT_SIZE = 14;

    struct SessionKeys
    {
        std::unique_ptr<crypto::AES> rtpCipher;
        std::unique_ptr<crypto::AES> rtcpCipher;
        std::unique_ptr<crypto::HMAC> rtpAuth;
        std::unique_ptr<crypto::HMAC> rtcpAuth;
        uint8_t rtpSalt[MAX_SALT_SIZE] = {0};
        uint8_t rtcpSalt[MAX_SALT_SIZE] = {0};
    };

    struct StreamState
    {
        explicit StreamState(uint32_t windowSize) : roc(0), lastSequenceNumber(0), initialized(false), replay(windowSize)
        {
        }

        uint32_t roc;
        uint16_t lastSequenceNumber;
        bool initialized;
        crypto::ReplayWindow replay;
    };

    struct RtcpStreamState
    {
        explicit RtcpStreamState(uint32_t windowSize) : nextIndex(0), replay(windowSize, SRTCP_MAX_INDEX) {}

        uint32_t nextIndex;
        crypto::ReplayWindow replay;
    };

    bool setupKeys(const srtp::AesKey& key, SessionKeys& keys) const;
    bool deriveKeys(const srtp::AesKey& key, SessionKeys& keys, uint8_t* sessionKey, uint8_t* authKey) const;
    bool isAead() const { return srtp::isAeadProfile(_config.profile); }

    StreamState& getStream(std::unordered_map<uint32_t, StreamState>& streams, uint32_t ssrc);
    RtcpStreamState& getRtcpStream(std::unordered_map<uint32_t, RtcpStreamState>& streams, uint32_t ssrc);

    void computeRtpTag(SessionKeys& keys, const uint8_t* data, size_t length, uint32_t roc, uint8_t* tag);

    logger::LoggableId _loggableId;
    SrtpConfig _config;
    bool _valid;
    SessionKeys _localKeys;
    SessionKeys _remoteKeys;

    std::unordered_map<uint32_t, StreamState> _outbound;
    std::unordered_map<uint32_t, StreamState> _inbound;
    std::unordered_map<uint32_t, RtcpStreamState> _outboundRtcp;
    std::unordered_map<uint32_t, RtcpStreamState> _inboundRtcp;
};

const char* toString(SrtpContext::Result result);

} // namespace transport
