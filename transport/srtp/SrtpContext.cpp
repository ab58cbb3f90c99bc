#include "transport/srtp/SrtpContext.h"
#include "crypto/SrtpIv.h"
#include "rtp/RtpHeader.h"
#include <algorithm>
#include <array>
#include <cstring>
#include <openssl/crypto.h>

namespace
{
const size_t RTCP_FIXED_HEADER_SIZE = 8;
const size_t SRTCP_TRAILER_SIZE = 4;

void writeUint32(uint8_t* target, uint32_t value)
{
    target[0] = value >> 24;
    target[1] = (value >> 16) & 0xFF;
    target[2] = (value >> 8) & 0xFF;
    target[3] = value & 0xFF;
}

uint32_t readUint32(const uint8_t* source)
{
    return (uint32_t(source[0]) << 24) | (uint32_t(source[1]) << 16) | (uint32_t(source[2]) << 8) | source[3];
}

bool isRtcpHeader(const memory::Packet& packet)
{
    return packet.getLength() >= RTCP_FIXED_HEADER_SIZE && (packet.get()[0] >> 6) == 2;
}
} // namespace

namespace transport
{

SrtpContext::SrtpContext(size_t logId,
    const SrtpConfig& config,
    const srtp::AesKey& localKey,
    const srtp::AesKey& remoteKey)
    : _loggableId("SrtpContext", logId),
      _config(config),
      _valid(false)
{
    if (localKey.profile != srtp::NULL_CIPHER)
    {
        _config.profile = localKey.profile;
    }

    if (localKey.profile != remoteKey.profile)
    {
        logger::error("local and remote srtp profiles differ %s, %s",
            _loggableId.c_str(),
            srtp::toString(localKey.profile),
            srtp::toString(remoteKey.profile));
        return;
    }

    _valid = setupKeys(localKey, _localKeys) && setupKeys(remoteKey, _remoteKeys);
    if (!_valid)
    {
        logger::error("failed to derive session keys for %s", _loggableId.c_str(), srtp::toString(_config.profile));
        return;
    }

    logger::debug("srtp context %s, replay window %u%s",
        _loggableId.c_str(),
        srtp::toString(_config.profile),
        _config.replayWindowSize,
        _config.disableReplay ? " disabled" : "");
}

bool SrtpContext::deriveSessionKey(const uint8_t* masterKey,
    size_t masterKeyLength,
    const uint8_t* masterSalt,
    size_t masterSaltLength,
    uint8_t label,
    uint8_t* out,
    size_t outLength)
{
    crypto::AES aes(crypto::AES::Mode::CTR, masterKey, masterKeyLength);
    if (!aes.isValid())
    {
        return false;
    }

    // x = salt XOR (label << 48), salt left aligned in the 112 bit field and 12 byte salts zero padded
    uint8_t iv[crypto::AES::BLOCK_SIZE] = {0};
    std::memcpy(iv, masterSalt, std::min(masterSaltLength, MAX_SALT_SIZE));
    iv[7] ^= label;

    std::memset(out, 0, outLength);
    return aes.ctrTransform(iv, out, out, outLength);
}

uint32_t SrtpContext::estimateRolloverCounter(uint32_t roc, uint16_t lastSequenceNumber, uint16_t sequenceNumber)
{
    const int32_t seq = sequenceNumber;
    const int32_t lastSeq = lastSequenceNumber;

    if (lastSeq < 0x8000)
    {
        if (seq - lastSeq > 0x8000 && roc > 0)
        {
            return roc - 1;
        }
        return roc;
    }

    if (lastSeq - 0x8000 > seq)
    {
        return roc + 1;
    }
    return roc;
}

bool SrtpContext::setupKeys(const srtp::AesKey& key, SessionKeys& keys) const
{
    const auto keyLength = key.getKeyLength();
    const auto saltLength = key.getSaltLength();
    if (keyLength == 0 || saltLength == 0)
    {
        return false;
    }

    uint8_t sessionKey[32];
    uint8_t authKey[AUTH_KEY_SIZE];
    const bool derived = deriveKeys(key, keys, sessionKey, authKey);
    OPENSSL_cleanse(sessionKey, sizeof(sessionKey));
    OPENSSL_cleanse(authKey, sizeof(authKey));
    return derived && keys.rtpCipher->isValid() && keys.rtcpCipher->isValid();
}

// sessionKey holds 32 bytes, authKey AUTH_KEY_SIZE
bool SrtpContext::deriveKeys(const srtp::AesKey& key, SessionKeys& keys, uint8_t* sessionKey, uint8_t* authKey) const
{
    const auto keyLength = key.getKeyLength();
    const auto saltLength = key.getSaltLength();
    const uint8_t* masterKey = key.keySalt;
    const uint8_t* masterSalt = key.keySalt + keyLength;

    if (isAead())
    {
        if (!deriveSessionKey(masterKey, keyLength, masterSalt, saltLength, RTP_ENCRYPTION, sessionKey, keyLength) ||
            !deriveSessionKey(masterKey, keyLength, masterSalt, saltLength, RTP_SALT, keys.rtpSalt, saltLength))
        {
            return false;
        }
        keys.rtpCipher = std::make_unique<crypto::AES>(crypto::AES::Mode::GCM, sessionKey, keyLength);

        if (!deriveSessionKey(masterKey, keyLength, masterSalt, saltLength, RTCP_ENCRYPTION, sessionKey, keyLength) ||
            !deriveSessionKey(masterKey, keyLength, masterSalt, saltLength, RTCP_SALT, keys.rtcpSalt, saltLength))
        {
            return false;
        }
        keys.rtcpCipher = std::make_unique<crypto::AES>(crypto::AES::Mode::GCM, sessionKey, keyLength);
    }
    else
    {
        if (!deriveSessionKey(masterKey, keyLength, masterSalt, saltLength, RTP_ENCRYPTION, sessionKey, keyLength) ||
            !deriveSessionKey(masterKey, keyLength, masterSalt, saltLength, RTP_AUTHENTICATION, authKey, AUTH_KEY_SIZE) ||
            !deriveSessionKey(masterKey, keyLength, masterSalt, saltLength, RTP_SALT, keys.rtpSalt, saltLength))
        {
            return false;
        }
        keys.rtpCipher = std::make_unique<crypto::AES>(crypto::AES::Mode::CTR, sessionKey, keyLength);
        keys.rtpAuth = std::make_unique<crypto::HMAC>(authKey, AUTH_KEY_SIZE, crypto::DigestType::SHA1);

        if (!deriveSessionKey(masterKey, keyLength, masterSalt, saltLength, RTCP_ENCRYPTION, sessionKey, keyLength) ||
            !deriveSessionKey(masterKey,
                keyLength,
                masterSalt,
                saltLength,
                RTCP_AUTHENTICATION,
                authKey,
                AUTH_KEY_SIZE) ||
            !deriveSessionKey(masterKey, keyLength, masterSalt, saltLength, RTCP_SALT, keys.rtcpSalt, saltLength))
        {
            return false;
        }
        keys.rtcpCipher = std::make_unique<crypto::AES>(crypto::AES::Mode::CTR, sessionKey, keyLength);
        keys.rtcpAuth = std::make_unique<crypto::HMAC>(authKey, AUTH_KEY_SIZE, crypto::DigestType::SHA1);
    }

    return true;
}

SrtpContext::StreamState& SrtpContext::getStream(std::unordered_map<uint32_t, StreamState>& streams, uint32_t ssrc)
{
    auto it = streams.find(ssrc);
    if (it == streams.end())
    {
        it = streams.emplace(ssrc, StreamState(_config.replayWindowSize)).first;
    }
    return it->second;
}

SrtpContext::RtcpStreamState& SrtpContext::getRtcpStream(std::unordered_map<uint32_t, RtcpStreamState>& streams,
    uint32_t ssrc)
{
    auto it = streams.find(ssrc);
    if (it == streams.end())
    {
        it = streams.emplace(ssrc, RtcpStreamState(_config.replayWindowSize)).first;
    }
    return it->second;
}

void SrtpContext::computeRtpTag(SessionKeys& keys,
    const uint8_t* data,
    size_t length,
    uint32_t roc,
    uint8_t* tag)
{
    uint8_t rocBytes[4];
    writeUint32(rocBytes, roc);
    uint8_t digest[AUTH_KEY_SIZE];

    keys.rtpAuth->reset();
    keys.rtpAuth->add(data, length);
    keys.rtpAuth->add(rocBytes, sizeof(rocBytes));
    keys.rtpAuth->compute(digest);
    std::memcpy(tag, digest, srtp::getAuthTagLength(_config.profile));
}

SrtpContext::Result SrtpContext::encryptRtp(memory::Packet& packet)
{
    if (!_valid || packet.getLength() < rtp::MIN_RTP_HEADER_SIZE)
    {
        return Result::Malformed;
    }

    auto header = rtp::RtpHeader::fromPacket(packet);
    if (!header)
    {
        return Result::Malformed;
    }

    const size_t length = packet.getLength();
    const size_t headerLength = header->headerLength();
    const size_t tagLength = srtp::getAuthTagLength(_config.profile);
    if (headerLength > length || length + tagLength > memory::Packet::size)
    {
        logger::warn("cannot protect rtp packet of %zu bytes", _loggableId.c_str(), length);
        return Result::Malformed;
    }

    const uint32_t ssrc = header->ssrc.get();
    const uint16_t sequenceNumber = header->sequenceNumber.get();
    auto& stream = getStream(_outbound, ssrc);
    uint32_t roc = stream.roc;
    if (stream.initialized)
    {
        roc = estimateRolloverCounter(stream.roc, stream.lastSequenceNumber, sequenceNumber);
    }

    const uint64_t index = (uint64_t(roc) << 16) | sequenceNumber;
    const uint64_t highestIndex = (uint64_t(stream.roc) << 16) | stream.lastSequenceNumber;
    if (!stream.initialized || index > highestIndex)
    {
        stream.roc = roc;
        stream.lastSequenceNumber = sequenceNumber;
        stream.initialized = true;
    }

    uint8_t* payload = packet.get() + headerLength;
    const size_t payloadLength = length - headerLength;
    if (isAead())
    {
        uint8_t iv[crypto::GCM_IV_SIZE];
        crypto::makeGcmRtpIv(_localKeys.rtpSalt, ssrc, roc, sequenceNumber, iv);
        if (!_localKeys.rtpCipher->gcmEncrypt(iv, sizeof(iv), packet.get(), headerLength, payload, payloadLength, payload))
        {
            logger::error("gcm encrypt failed ssrc %u", _loggableId.c_str(), ssrc);
            return Result::Malformed;
        }
    }
    else
    {
        uint8_t iv[crypto::COUNTER_IV_SIZE];
        crypto::makeCounterIv(_localKeys.rtpSalt, ssrc, index, iv);
        if (!_localKeys.rtpCipher->ctrTransform(iv, payload, payload, payloadLength))
        {
            logger::error("aes-cm encrypt failed ssrc %u", _loggableId.c_str(), ssrc);
            return Result::Malformed;
        }
        computeRtpTag(_localKeys, packet.get(), length, roc, packet.get() + length);
    }

    packet.setLength(length + tagLength);
    return Result::Ok;
}

SrtpContext::Result SrtpContext::decryptRtp(memory::Packet& packet)
{
    if (!_valid || packet.getLength() < rtp::MIN_RTP_HEADER_SIZE)
    {
        return Result::Malformed;
    }

    auto header = rtp::RtpHeader::fromPacket(packet);
    if (!header)
    {
        return Result::Malformed;
    }

    const size_t length = packet.getLength();
    const size_t headerLength = header->headerLength();
    const size_t tagLength = srtp::getAuthTagLength(_config.profile);
    if (headerLength + tagLength > length)
    {
        return Result::Malformed;
    }

    const uint32_t ssrc = header->ssrc.get();
    const uint16_t sequenceNumber = header->sequenceNumber.get();
    auto& stream = getStream(_inbound, ssrc);
    uint32_t roc = stream.roc;
    if (stream.initialized)
    {
        roc = estimateRolloverCounter(stream.roc, stream.lastSequenceNumber, sequenceNumber);
    }
    const uint64_t index = (uint64_t(roc) << 16) | sequenceNumber;

    if (!_config.disableReplay && !stream.replay.check(index))
    {
        logger::debug("replayed rtp ssrc %u seq %u roc %u", _loggableId.c_str(), ssrc, sequenceNumber, roc);
        return Result::Replayed;
    }

    uint8_t* payload = packet.get() + headerLength;
    const size_t authenticatedLength = length - tagLength;
    if (isAead())
    {
        uint8_t iv[crypto::GCM_IV_SIZE];
        crypto::makeGcmRtpIv(_remoteKeys.rtpSalt, ssrc, roc, sequenceNumber, iv);
        if (!_remoteKeys.rtpCipher
                 ->gcmDecrypt(iv, sizeof(iv), packet.get(), headerLength, payload, length - headerLength, payload))
        {
            return Result::AuthFailed;
        }
    }
    else
    {
        uint8_t tag[AUTH_KEY_SIZE];
        computeRtpTag(_remoteKeys, packet.get(), authenticatedLength, roc, tag);
        if (!crypto::constantTimeEquals(tag, packet.get() + authenticatedLength, tagLength))
        {
            return Result::AuthFailed;
        }

        uint8_t iv[crypto::COUNTER_IV_SIZE];
        crypto::makeCounterIv(_remoteKeys.rtpSalt, ssrc, index, iv);
        if (!_remoteKeys.rtpCipher->ctrTransform(iv, payload, payload, authenticatedLength - headerLength))
        {
            logger::error("aes-cm decrypt failed ssrc %u", _loggableId.c_str(), ssrc);
            return Result::Malformed;
        }
    }

    stream.replay.accept(index);
    const uint64_t highestIndex = (uint64_t(stream.roc) << 16) | stream.lastSequenceNumber;
    if (!stream.initialized || index > highestIndex)
    {
        stream.roc = roc;
        stream.lastSequenceNumber = sequenceNumber;
        stream.initialized = true;
    }

    packet.setLength(authenticatedLength);
    return Result::Ok;
}

SrtpContext::Result SrtpContext::encryptRtcp(memory::Packet& packet)
{
    if (!_valid || !isRtcpHeader(packet))
    {
        return Result::Malformed;
    }

    const size_t length = packet.getLength();
    const size_t tagLength = isAead() ? crypto::AES::GCM_TAG_SIZE : RTCP_AUTH_TAG_SIZE;
    if (length + tagLength + SRTCP_TRAILER_SIZE > memory::Packet::size)
    {
        logger::warn("cannot protect rtcp packet of %zu bytes", _loggableId.c_str(), length);
        return Result::Malformed;
    }

    const uint32_t ssrc = readUint32(packet.get() + 4);
    auto& stream = getRtcpStream(_outboundRtcp, ssrc);
    if (stream.nextIndex > SRTCP_MAX_INDEX)
    {
        logger::error("srtcp index exhausted for ssrc %u, rekey needed", _loggableId.c_str(), ssrc);
        return Result::Malformed;
    }

    const uint32_t index = stream.nextIndex++;
    uint8_t trailer[SRTCP_TRAILER_SIZE];
    writeUint32(trailer, SRTCP_E_FLAG | index);

    uint8_t* encryptedPart = packet.get() + RTCP_FIXED_HEADER_SIZE;
    const size_t encryptedLength = length - RTCP_FIXED_HEADER_SIZE;
    if (isAead())
    {
        uint8_t iv[crypto::GCM_IV_SIZE];
        crypto::makeGcmRtcpIv(_localKeys.rtcpSalt, ssrc, index, iv);

        uint8_t aad[RTCP_FIXED_HEADER_SIZE + SRTCP_TRAILER_SIZE];
        std::memcpy(aad, packet.get(), RTCP_FIXED_HEADER_SIZE);
        std::memcpy(aad + RTCP_FIXED_HEADER_SIZE, trailer, SRTCP_TRAILER_SIZE);
        if (!_localKeys.rtcpCipher
                 ->gcmEncrypt(iv, sizeof(iv), aad, sizeof(aad), encryptedPart, encryptedLength, encryptedPart))
        {
            logger::error("gcm encrypt failed rtcp ssrc %u", _loggableId.c_str(), ssrc);
            return Result::Malformed;
        }
        std::memcpy(packet.get() + length + tagLength, trailer, SRTCP_TRAILER_SIZE);
    }
    else
    {
        uint8_t iv[crypto::COUNTER_IV_SIZE];
        crypto::makeCounterIv(_localKeys.rtcpSalt, ssrc, index, iv);
        if (!_localKeys.rtcpCipher->ctrTransform(iv, encryptedPart, encryptedPart, encryptedLength))
        {
            logger::error("aes-cm encrypt failed rtcp ssrc %u", _loggableId.c_str(), ssrc);
            return Result::Malformed;
        }
        std::memcpy(packet.get() + length, trailer, SRTCP_TRAILER_SIZE);

        uint8_t digest[AUTH_KEY_SIZE];
        _localKeys.rtcpAuth->reset();
        _localKeys.rtcpAuth->add(packet.get(), length + SRTCP_TRAILER_SIZE);
        _localKeys.rtcpAuth->compute(digest);
        std::memcpy(packet.get() + length + SRTCP_TRAILER_SIZE, digest, RTCP_AUTH_TAG_SIZE);
    }

    packet.setLength(length + tagLength + SRTCP_TRAILER_SIZE);
    return Result::Ok;
}

SrtpContext::Result SrtpContext::decryptRtcp(memory::Packet& packet)
{
    const size_t tagLength = isAead() ? crypto::AES::GCM_TAG_SIZE : RTCP_AUTH_TAG_SIZE;
    if (!_valid || !isRtcpHeader(packet) ||
        packet.getLength() < RTCP_FIXED_HEADER_SIZE + tagLength + SRTCP_TRAILER_SIZE)
    {
        return Result::Malformed;
    }

    const size_t length = packet.getLength();
    const uint32_t ssrc = readUint32(packet.get() + 4);
    // aead: header | ciphertext | tag | E index, aes-cm: header | ciphertext | E index | tag
    const size_t trailerOffset = isAead() ? length - SRTCP_TRAILER_SIZE : length - tagLength - SRTCP_TRAILER_SIZE;
    const uint32_t trailer = readUint32(packet.get() + trailerOffset);
    const bool encrypted = (trailer & SRTCP_E_FLAG) != 0;
    const uint32_t index = trailer & SRTCP_MAX_INDEX;

    auto& stream = getRtcpStream(_inboundRtcp, ssrc);
    if (!_config.disableReplay && !stream.replay.check(index))
    {
        logger::debug("replayed rtcp ssrc %u index %u", _loggableId.c_str(), ssrc, index);
        return Result::Replayed;
    }

    uint8_t* encryptedPart = packet.get() + RTCP_FIXED_HEADER_SIZE;
    size_t plainLength = 0;
    if (isAead())
    {
        uint8_t iv[crypto::GCM_IV_SIZE];
        crypto::makeGcmRtcpIv(_remoteKeys.rtcpSalt, ssrc, index, iv);
        plainLength = length - SRTCP_TRAILER_SIZE - tagLength;

        if (encrypted)
        {
            uint8_t aad[RTCP_FIXED_HEADER_SIZE + SRTCP_TRAILER_SIZE];
            std::memcpy(aad, packet.get(), RTCP_FIXED_HEADER_SIZE);
            std::memcpy(aad + RTCP_FIXED_HEADER_SIZE, packet.get() + trailerOffset, SRTCP_TRAILER_SIZE);
            if (!_remoteKeys.rtcpCipher->gcmDecrypt(iv,
                    sizeof(iv),
                    aad,
                    sizeof(aad),
                    encryptedPart,
                    trailerOffset - RTCP_FIXED_HEADER_SIZE,
                    encryptedPart))
            {
                return Result::AuthFailed;
            }
        }
        else
        {
            // whole packet is authenticated only, rfc7714 section 9.3
            std::array<uint8_t, memory::Packet::size> aad;
            std::memcpy(aad.data(), packet.get(), plainLength);
            std::memcpy(aad.data() + plainLength, packet.get() + trailerOffset, SRTCP_TRAILER_SIZE);
            uint8_t unused[crypto::AES::GCM_TAG_SIZE];
            if (!_remoteKeys.rtcpCipher->gcmDecrypt(iv,
                    sizeof(iv),
                    aad.data(),
                    plainLength + SRTCP_TRAILER_SIZE,
                    packet.get() + plainLength,
                    tagLength,
                    unused))
            {
                return Result::AuthFailed;
            }
        }
    }
    else
    {
        const size_t authenticatedLength = length - tagLength;
        uint8_t digest[AUTH_KEY_SIZE];
        _remoteKeys.rtcpAuth->reset();
        _remoteKeys.rtcpAuth->add(packet.get(), authenticatedLength);
        _remoteKeys.rtcpAuth->compute(digest);
        if (!crypto::constantTimeEquals(digest, packet.get() + authenticatedLength, tagLength))
        {
            return Result::AuthFailed;
        }

        plainLength = trailerOffset;
        if (encrypted)
        {
            uint8_t iv[crypto::COUNTER_IV_SIZE];
            crypto::makeCounterIv(_remoteKeys.rtcpSalt, ssrc, index, iv);
            if (!_remoteKeys.rtcpCipher->ctrTransform(iv,
                    encryptedPart,
                    encryptedPart,
                    plainLength - RTCP_FIXED_HEADER_SIZE))
            {
                logger::error("aes-cm decrypt failed rtcp ssrc %u", _loggableId.c_str(), ssrc);
                return Result::Malformed;
            }
        }
    }

    stream.replay.accept(index);
    packet.setLength(plainLength);
    return Result::Ok;
}

void SrtpContext::setLocalRolloverCounter(uint32_t ssrc, uint32_t roc)
{
    auto& stream = getStream(_outbound, ssrc);
    stream.roc = roc;
    stream.initialized = false;
}

void SrtpContext::setRemoteRolloverCounter(uint32_t ssrc, uint32_t roc)
{
    auto& stream = getStream(_inbound, ssrc);
    stream.roc = roc;
    stream.initialized = false;
}

uint32_t SrtpContext::getLocalRolloverCounter(uint32_t ssrc) const
{
    auto it = _outbound.find(ssrc);
    return it == _outbound.end() ? 0 : it->second.roc;
}

uint32_t SrtpContext::getRemoteRolloverCounter(uint32_t ssrc) const
{
    auto it = _inbound.find(ssrc);
    return it == _inbound.end() ? 0 : it->second.roc;
}

void SrtpContext::removeLocalSsrc(uint32_t ssrc)
{
    _outbound.erase(ssrc);
    _outboundRtcp.erase(ssrc);
}

void SrtpContext::removeRemoteSsrc(uint32_t ssrc)
{
    _inbound.erase(ssrc);
    _inboundRtcp.erase(ssrc);
}

size_t SrtpContext::getRtpOverhead() const
{
    return srtp::getAuthTagLength(_config.profile);
}

size_t SrtpContext::getRtcpOverhead() const
{
    return (isAead() ? crypto::AES::GCM_TAG_SIZE : RTCP_AUTH_TAG_SIZE) + SRTCP_TRAILER_SIZE;
}

const char* toString(SrtpContext::Result result)
{
    switch (result)
    {
    case SrtpContext::Result::Ok:
        return "ok";
    case SrtpContext::Result::AuthFailed:
        return "authFailed";
    case SrtpContext::Result::Replayed:
        return "replayed";
    case SrtpContext::Result::Malformed:
        return "malformed";
    }
    return "unknown";
}

} // namespace transport
