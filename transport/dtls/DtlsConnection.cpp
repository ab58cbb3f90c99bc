#include "transport/dtls/DtlsConnection.h"
#include "crypto/Certificate.h"
#include "transport/dtls/DtlsPrf.h"
#include "transport/dtls/DtlsWriteListener.h"
#include "utils/Time.h"
#include <algorithm>
#include <chrono>
#include <cstring>

namespace transport
{

namespace
{
const char* SRTP_EXPORTER_LABEL = "EXTRACTOR-dtls_srtp";

void makeRandom(dtls::Random& random)
{
    const auto now = static_cast<uint32_t>(std::chrono::system_clock::to_time_t(utils::Time::now()));
    random[0] = now >> 24;
    random[1] = (now >> 16) & 0xFF;
    random[2] = (now >> 8) & 0xFF;
    random[3] = now & 0xFF;
    crypto::randomBytes(random.data() + 4, random.size() - 4);
}

template <typename T>
bool contains(const std::vector<T>& values, T value)
{
    return std::find(values.begin(), values.end(), value) != values.end();
}

std::vector<uint8_t> signedParams(const dtls::Random& clientRandom,
    const dtls::Random& serverRandom,
    const dtls::ServerKeyExchange& exchange)
{
    std::vector<uint8_t> data(clientRandom.begin(), clientRandom.end());
    data.insert(data.end(), serverRandom.begin(), serverRandom.end());
    exchange.writeParams(data);
    return data;
}

bool isCertificateRequired(DtlsConfig::ClientAuth clientAuth)
{
    return clientAuth == DtlsConfig::ClientAuth::RequireAnyClientCert ||
        clientAuth == DtlsConfig::ClientAuth::RequireAndVerifyClientCert;
}

bool isCertificateVerified(DtlsConfig::ClientAuth clientAuth)
{
    return clientAuth == DtlsConfig::ClientAuth::VerifyClientCertIfGiven ||
        clientAuth == DtlsConfig::ClientAuth::RequireAndVerifyClientCert;
}
} // namespace

DtlsConnection::DtlsConnection(size_t logId, const DtlsConfig& config, DtlsWriteListener& writer, IEvents* listener)
    : _loggableId("DtlsConn", logId),
      _config(config),
      _listener(listener),
      _recordLayer(_loggableId, writer, *this, config.mtu),
      _state(State::IDLE),
      _flight(0),
      _timestamp(0),
      _clientRandom{},
      _serverRandom{},
      _suite(nullptr),
      _namedCurve(0),
      _extendedMasterSecret(false),
      _srtpProfile(srtp::NULL_CIPHER),
      _peerVerified(false),
      _certificateRequested(false),
      _clientCertificateVerified(false),
      _keyExchangeDone(false),
      _peerChangeCipherSpec(false),
      _sendSeq(0),
      _peerRetransmitted(false),
      _flightInterval(config.flightIntervalMs * utils::Time::ms),
      _retransmissions(0),
      _totalRetransmissions(0)
{
    _cookieSecret.resize(32);
    crypto::randomBytes(_cookieSecret.data(), _cookieSecret.size());
}

bool DtlsConnection::start(uint64_t timestamp)
{
    if (_state != State::IDLE)
    {
        return false;
    }

    if (!_config.usesPsk() && !isClient() && !_config.identity.isValid())
    {
        logger::error("server needs a certificate or a psk callback", _loggableId.c_str());
        return false;
    }

    _timestamp = timestamp;
    _state = State::CONNECTING;
    if (isClient())
    {
        makeRandom(_clientRandom);
        _flight = 0;
        sendClientHello();
    }
    else
    {
        _flight = 1;
    }
    logger::debug("started as %s", _loggableId.c_str(), isClient() ? "client" : "server");
    return true;
}

void DtlsConnection::onPacketReceived(const void* data, size_t length, uint64_t timestamp)
{
    _timestamp = timestamp;
    if (_state != State::CONNECTING && _state != State::CONNECTED)
    {
        return;
    }

    _peerRetransmitted = false;
    const auto alert = _recordLayer.onRecordsReceived(data, length);
    if (alert != dtls::NO_ALERT)
    {
        fail(alert, true);
        return;
    }

    if (_peerRetransmitted && !_lastFlight.empty() &&
        (_state == State::CONNECTING || _state == State::CONNECTED))
    {
        logger::debug("peer repeated its flight, resending flight %d", _loggableId.c_str(), _flight);
        retransmitFlight();
    }
}

bool DtlsConnection::sendApplicationData(const void* data, size_t length)
{
    if (_state != State::CONNECTED)
    {
        return false;
    }

    if (!_recordLayer.writeApplicationData(data, length))
    {
        return false;
    }
    _recordLayer.flush();
    return true;
}

void DtlsConnection::close()
{
    if (_state == State::CONNECTED || _state == State::CONNECTING)
    {
        _recordLayer.writeAlert(dtls::WARNING, dtls::CLOSE_NOTIFY);
        _recordLayer.flush();
    }
    _flightTimer.stop();
    if (_state != State::FAILED)
    {
        _state = State::CLOSED;
    }
}

int64_t DtlsConnection::nextTimeout(uint64_t timestamp) const
{
    if (_state == State::CLOSED || _state == State::FAILED)
    {
        return -1;
    }

    const int64_t minTimeout = 30 * utils::Time::sec;
    return std::min(minTimeout, _flightTimer.timeToExpiry(timestamp));
}

int64_t DtlsConnection::processTimeout(uint64_t timestamp)
{
    _timestamp = timestamp;
    const auto toSleep = nextTimeout(timestamp);
    if (toSleep != 0)
    {
        return toSleep;
    }

    if (_flightTimer.hasExpired(timestamp))
    {
        if (_retransmissions >= _config.maxRetransmissions)
        {
            logger::warn("flight %d not answered after %u retransmissions",
                _loggableId.c_str(),
                _flight,
                _retransmissions);
            fail(dtls::NO_ALERT, false);
            return nextTimeout(timestamp);
        }

        ++_retransmissions;
        _flightInterval = std::min(_flightInterval * 2, _config.maxFlightIntervalMs * utils::Time::ms);
        _flightTimer.start(timestamp, _flightInterval);
        logger::debug("retransmitting flight %d", _loggableId.c_str(), _flight);
        retransmitFlight();
    }

    return nextTimeout(timestamp);
}

std::string DtlsConnection::getPeerCertificateFingerprint() const
{
    if (_peerCertificates.empty())
    {
        return "";
    }

    const auto certificate = crypto::Certificate::fromDer(_peerCertificates.front());
    return certificate.isValid() ? certificate.fingerprint(crypto::DigestType::SHA256) : "";
}

std::string DtlsConnection::getLocalFingerprint() const
{
    if (!_config.identity.isValid())
    {
        return "";
    }
    return _config.identity.chain.front()->fingerprint(crypto::DigestType::SHA256);
}

bool DtlsConnection::exportKeyingMaterial(const std::string& label,
    size_t length,
    std::vector<uint8_t>& keyingMaterial) const
{
    if (_state != State::CONNECTED || !_suite || _masterSecret.empty())
    {
        return false;
    }

    keyingMaterial =
        dtls::exportKeyingMaterial(_suite->prfDigest, _masterSecret, label, _clientRandom, _serverRandom, length);
    return true;
}

bool DtlsConnection::getSrtpKeys(srtp::AesKey& localKey, srtp::AesKey& remoteKey) const
{
    if (_srtpProfile == srtp::NULL_CIPHER)
    {
        return false;
    }

    const size_t keyLength = srtp::getKeyLength(_srtpProfile);
    const size_t saltLength = srtp::getSaltLength(_srtpProfile);
    std::vector<uint8_t> material;
    if (!exportKeyingMaterial(SRTP_EXPORTER_LABEL, 2 * (keyLength + saltLength), material))
    {
        return false;
    }

    // client key, server key, client salt, server salt
    const uint8_t* clientKey = material.data();
    const uint8_t* serverKey = clientKey + keyLength;
    const uint8_t* clientSalt = serverKey + keyLength;
    const uint8_t* serverSalt = clientSalt + saltLength;

    localKey.profile = _srtpProfile;
    remoteKey.profile = _srtpProfile;
    std::memcpy(localKey.keySalt, isClient() ? clientKey : serverKey, keyLength);
    std::memcpy(localKey.keySalt + keyLength, isClient() ? clientSalt : serverSalt, saltLength);
    std::memcpy(remoteKey.keySalt, isClient() ? serverKey : clientKey, keyLength);
    std::memcpy(remoteKey.keySalt + keyLength, isClient() ? serverSalt : clientSalt, saltLength);
    return true;
}

void DtlsConnection::onDtlsHandshakeMessage(const dtls::HandshakeMessage& message, uint16_t epoch)
{
    if (_state != State::CONNECTING)
    {
        logger::debug("%s ignored after handshake", _loggableId.c_str(), dtls::toString(message.type));
        return;
    }

    if ((message.type == dtls::FINISHED) != (epoch > 0))
    {
        fail(dtls::UNEXPECTED_MESSAGE, true);
        return;
    }

    logger::debug("received %s seq %u", _loggableId.c_str(), dtls::toString(message.type), message.messageSeq);
    const auto alert = isClient() ? onClientHandshake(message) : onServerHandshake(message);
    if (alert != dtls::NO_ALERT)
    {
        fail(alert, true);
    }
}

void DtlsConnection::onDtlsHandshakeRetransmission(uint16_t messageSeq, uint16_t epoch)
{
    _peerRetransmitted = true;
}

void DtlsConnection::onDtlsChangeCipherSpec(uint16_t epoch)
{
    if (_state != State::CONNECTING || _peerChangeCipherSpec)
    {
        return;
    }

    const bool keysReady = isClient() ? (_flight == 5) : (_flight == 4 && _keyExchangeDone);
    if (!keysReady)
    {
        logger::debug("early ChangeCipherSpec dropped", _loggableId.c_str());
        return;
    }

    _peerChangeCipherSpec = true;
    if (!_recordLayer.activateReadCipher())
    {
        fail(dtls::INTERNAL_ERROR, true);
    }
}

void DtlsConnection::onDtlsAlert(dtls::AlertLevel level, dtls::AlertDescription description)
{
    if (_state == State::CLOSED || _state == State::FAILED)
    {
        return;
    }

    if (description == dtls::CLOSE_NOTIFY)
    {
        logger::info("peer sent close_notify", _loggableId.c_str());
        _recordLayer.writeAlert(dtls::WARNING, dtls::CLOSE_NOTIFY);
        _recordLayer.flush();
        _state = State::CLOSED;
        _flightTimer.stop();
        if (_listener)
        {
            _listener->onDtlsClosed(*this);
        }
        return;
    }

    if (level == dtls::FATAL)
    {
        logger::warn("fatal alert from peer, %s", _loggableId.c_str(), dtls::toString(description));
        _state = State::FAILED;
        _flightTimer.stop();
        if (_listener)
        {
            _listener->onDtlsFailed(*this, description);
        }
        return;
    }

    logger::info("warning alert from peer, %s", _loggableId.c_str(), dtls::toString(description));
}

void DtlsConnection::onDtlsApplicationData(const uint8_t* data, size_t length)
{
    if (_state != State::CONNECTED)
    {
        logger::debug("application data before handshake completed, %zu bytes dropped", _loggableId.c_str(), length);
        return;
    }

    if (_listener)
    {
        _listener->onDtlsApplicationData(*this, data, length);
    }
}

dtls::AlertDescription DtlsConnection::onClientHandshake(const dtls::HandshakeMessage& message)
{
    switch (message.type)
    {
    case dtls::HELLO_VERIFY_REQUEST:
        return onHelloVerifyRequest(message);
    case dtls::SERVER_HELLO:
        return onServerHello(message);
    case dtls::CERTIFICATE:
        return onServerCertificate(message);
    case dtls::SERVER_KEY_EXCHANGE:
        return onServerKeyExchange(message);
    case dtls::CERTIFICATE_REQUEST:
        return onCertificateRequest(message);
    case dtls::SERVER_HELLO_DONE:
        return onServerHelloDone(message);
    case dtls::FINISHED:
        return onServerFinished(message);
    case dtls::HELLO_REQUEST:
        return dtls::NO_ALERT;
    default:
        return dtls::UNEXPECTED_MESSAGE;
    }
}

dtls::AlertDescription DtlsConnection::onServerHandshake(const dtls::HandshakeMessage& message)
{
    switch (message.type)
    {
    case dtls::CLIENT_HELLO:
        return onClientHello(message);
    case dtls::CERTIFICATE:
        return onClientCertificate(message);
    case dtls::CLIENT_KEY_EXCHANGE:
        return onClientKeyExchange(message);
    case dtls::CERTIFICATE_VERIFY:
        return onCertificateVerify(message);
    case dtls::FINISHED:
        return onClientFinished(message);
    default:
        return dtls::UNEXPECTED_MESSAGE;
    }
}

std::vector<uint16_t> DtlsConnection::offeredCipherSuites() const
{
    const auto& candidates = _config.cipherSuites.empty() ? dtls::allCipherSuites() : _config.cipherSuites;

    std::vector<uint16_t> result;
    for (auto id : candidates)
    {
        auto suite = dtls::findCipherSuite(static_cast<uint16_t>(id));
        if (suite && suite->isPsk() == _config.usesPsk())
        {
            result.push_back(static_cast<uint16_t>(id));
        }
    }
    return result;
}

std::vector<uint16_t> DtlsConnection::signatureSchemes() const
{
    return {static_cast<uint16_t>(crypto::SignatureScheme::ECDSA_SECP256R1_SHA256),
        static_cast<uint16_t>(crypto::SignatureScheme::ECDSA_SECP384R1_SHA384),
        static_cast<uint16_t>(crypto::SignatureScheme::RSA_PKCS1_SHA256),
        static_cast<uint16_t>(crypto::SignatureScheme::RSA_PKCS1_SHA384)};
}

dtls::HandshakeMessage DtlsConnection::makeMessage(dtls::HandshakeType type, std::vector<uint8_t>&& body)
{
    dtls::HandshakeMessage message;
    message.type = type;
    message.messageSeq = _sendSeq++;
    message.body = std::move(body);
    return message;
}

void DtlsConnection::addToFlight(const dtls::HandshakeMessage& message)
{
    _lastFlight.push_back(FlightEntry{false, message, _recordLayer.getWriteEpoch()});
    _recordLayer.writeHandshake(message);
}

void DtlsConnection::addChangeCipherSpecToFlight()
{
    _lastFlight.push_back(FlightEntry{true, dtls::HandshakeMessage(), _recordLayer.getWriteEpoch()});
    _recordLayer.writeChangeCipherSpec();
}

void DtlsConnection::sendFlight(uint64_t timestamp, bool expectResponse)
{
    _recordLayer.flush();
    _retransmissions = 0;
    _flightInterval = _config.flightIntervalMs * utils::Time::ms;
    if (expectResponse)
    {
        _flightTimer.start(timestamp, _flightInterval);
    }
    else
    {
        _flightTimer.stop();
    }
}

void DtlsConnection::retransmitFlight()
{
    for (auto& entry : _lastFlight)
    {
        if (entry.changeCipherSpec)
        {
            _recordLayer.writeChangeCipherSpec(entry.epoch);
        }
        else
        {
            _recordLayer.writeHandshake(entry.message, entry.epoch);
        }
    }
    _recordLayer.flush();
    ++_totalRetransmissions;
}

void DtlsConnection::addToTranscript(const dtls::HandshakeMessage& message)
{
    message.writeUnfragmented(_transcript);
}

std::vector<uint8_t> DtlsConnection::transcriptHash() const
{
    crypto::Hash hash(_suite->prfDigest);
    hash.add(_transcript);
    return hash.compute();
}

bool DtlsConnection::verifyPeerChain(bool verify)
{
    const auto leaf = crypto::Certificate::fromDer(_peerCertificates.front());
    if (!leaf.isValid())
    {
        logger::warn("peer certificate does not parse", _loggableId.c_str());
        return false;
    }

    if (!verify)
    {
        return true;
    }

    if (_config.verifyPeerCertificate)
    {
        _peerVerified = _config.verifyPeerCertificate(_peerCertificates);
        return _peerVerified;
    }

    if (_config.insecureSkipVerify)
    {
        return true;
    }

    logger::warn("no means to verify the peer certificate", _loggableId.c_str());
    return false;
}

bool DtlsConnection::deriveKeys(const std::vector<uint8_t>& preMasterSecret)
{
    const auto digest = _suite->prfDigest;
    if (_extendedMasterSecret)
    {
        _masterSecret = dtls::computeExtendedMasterSecret(digest, preMasterSecret, transcriptHash());
    }
    else
    {
        _masterSecret = dtls::computeMasterSecret(digest, preMasterSecret, _clientRandom, _serverRandom);
    }

    const auto keys = dtls::computeKeyMaterial(*_suite, _masterSecret, _clientRandom, _serverRandom);
    auto writeCipher = dtls::createRecordCipher(*_suite, keys, isClient());
    auto readCipher = dtls::createRecordCipher(*_suite, keys, !isClient());
    if (!writeCipher || !readCipher)
    {
        return false;
    }
    _recordLayer.setPendingCipher(std::move(writeCipher), std::move(readCipher));
    return true;
}

std::vector<uint8_t> DtlsConnection::makeFinished(bool isClient) const
{
    return dtls::computeVerifyData(_suite->prfDigest, _masterSecret, isClient, transcriptHash());
}

bool DtlsConnection::checkFinished(const dtls::HandshakeMessage& message, bool peerIsClient) const
{
    const auto expected = makeFinished(peerIsClient);
    return message.body.size() == expected.size() &&
        crypto::constantTimeEquals(message.body.data(), expected.data(), expected.size());
}

void DtlsConnection::setConnected()
{
    _state = State::CONNECTED;
    logger::info("connected, %s, srtp %s%s",
        _loggableId.c_str(),
        _suite->name,
        srtp::toString(_srtpProfile),
        _extendedMasterSecret ? ", extended master secret" : "");
    if (_listener)
    {
        _listener->onDtlsConnected(*this);
    }
}

void DtlsConnection::fail(dtls::AlertDescription alert, bool sendAlert)
{
    if (_state == State::FAILED || _state == State::CLOSED)
    {
        return;
    }

    logger::warn("handshake failed in flight %d, %s", _loggableId.c_str(), _flight, dtls::toString(alert));
    if (sendAlert && alert != dtls::NO_ALERT)
    {
        _recordLayer.writeAlert(dtls::FATAL, alert);
        _recordLayer.flush();
    }
    _state = State::FAILED;
    _flightTimer.stop();
    if (_listener)
    {
        _listener->onDtlsFailed(*this, alert);
    }
}

void DtlsConnection::sendClientHello()
{
    dtls::ClientHello hello;
    hello.random = _clientRandom;
    hello.cookie = _cookie;
    hello.cipherSuites = offeredCipherSuites();

    auto& extensions = hello.extensions;
    if (!_config.usesPsk())
    {
        for (auto curve : _config.namedCurves)
        {
            if (crypto::isSupportedCurve(curve))
            {
                extensions.supportedGroups.push_back(curve);
            }
        }
        extensions.hasPointFormats = true;
        extensions.pointFormats = {dtls::EC_POINT_FORMAT_UNCOMPRESSED};
        extensions.signatureSchemes = signatureSchemes();
    }
    for (auto profile : _config.srtpProfiles)
    {
        extensions.srtpProfiles.push_back(srtp::toDtlsProfileId(profile));
    }
    extensions.extendedMasterSecret = (_config.extendedMasterSecret != DtlsConfig::ExtendedMasterSecret::Disable);
    extensions.renegotiationInfo = true;
    extensions.serverName = _config.serverName;

    std::vector<uint8_t> body;
    hello.serialize(body);
    const auto message = makeMessage(dtls::CLIENT_HELLO, std::move(body));

    // a ClientHello answered by HelloVerifyRequest is not part of the transcript
    _transcript.clear();
    addToTranscript(message);

    _lastFlight.clear();
    addToFlight(message);
    sendFlight(_timestamp, true);
}

dtls::AlertDescription DtlsConnection::onHelloVerifyRequest(const dtls::HandshakeMessage& message)
{
    if (_flight != 0 || _suite)
    {
        return dtls::UNEXPECTED_MESSAGE;
    }

    dtls::HelloVerifyRequest request;
    if (!request.parse(message.body))
    {
        return dtls::DECODE_ERROR;
    }
    if (request.cookie.empty() || request.cookie.size() > dtls::MAX_COOKIE_SIZE)
    {
        return dtls::ILLEGAL_PARAMETER;
    }

    _cookie = request.cookie;
    _flight = 2;
    sendClientHello();
    return dtls::NO_ALERT;
}

dtls::AlertDescription DtlsConnection::onServerHello(const dtls::HandshakeMessage& message)
{
    if ((_flight != 0 && _flight != 2) || _suite)
    {
        return dtls::UNEXPECTED_MESSAGE;
    }

    dtls::ServerHello hello;
    if (!hello.parse(message.body))
    {
        return dtls::DECODE_ERROR;
    }
    if (hello.version != dtls::DTLSv12)
    {
        return dtls::PROTOCOL_VERSION;
    }
    if (!contains(offeredCipherSuites(), hello.cipherSuite) || hello.compressionMethod != 0)
    {
        return dtls::ILLEGAL_PARAMETER;
    }

    if (hello.extensions.extendedMasterSecret)
    {
        if (_config.extendedMasterSecret == DtlsConfig::ExtendedMasterSecret::Disable)
        {
            return dtls::UNSUPPORTED_EXTENSION;
        }
        _extendedMasterSecret = true;
    }
    else if (_config.extendedMasterSecret == DtlsConfig::ExtendedMasterSecret::Require)
    {
        logger::warn("server does not support extended master secret", _loggableId.c_str());
        return dtls::HANDSHAKE_FAILURE;
    }

    if (!hello.extensions.srtpProfiles.empty())
    {
        const auto profile = srtp::fromDtlsProfileId(hello.extensions.srtpProfiles.front());
        if (hello.extensions.srtpProfiles.size() != 1 || !contains(_config.srtpProfiles, profile))
        {
            return dtls::ILLEGAL_PARAMETER;
        }
        _srtpProfile = profile;
    }
    else if (!_config.srtpProfiles.empty())
    {
        logger::warn("server did not select an srtp profile", _loggableId.c_str());
        return dtls::INSUFFICIENT_SECURITY;
    }

    _suite = dtls::findCipherSuite(hello.cipherSuite);
    _serverRandom = hello.random;
    _sessionId = hello.sessionId;
    _flightTimer.stop();
    addToTranscript(message);
    return dtls::NO_ALERT;
}

dtls::AlertDescription DtlsConnection::onServerCertificate(const dtls::HandshakeMessage& message)
{
    if (!_suite || _flight == 5 || !_suite->requiresCertificate() || !_peerCertificates.empty())
    {
        return dtls::UNEXPECTED_MESSAGE;
    }

    dtls::CertificateMessage certificate;
    if (!certificate.parse(message.body))
    {
        return dtls::DECODE_ERROR;
    }
    if (certificate.certificates.empty())
    {
        return dtls::NO_CERTIFICATE;
    }

    _peerCertificates = std::move(certificate.certificates);
    addToTranscript(message);
    return verifyPeerChain(true) ? dtls::NO_ALERT : dtls::BAD_CERTIFICATE;
}

dtls::AlertDescription DtlsConnection::onServerKeyExchange(const dtls::HandshakeMessage& message)
{
    if (!_suite || _flight == 5 || _keyExchangeDone || (_suite->requiresCertificate() && _peerCertificates.empty()))
    {
        return dtls::UNEXPECTED_MESSAGE;
    }

    dtls::ServerKeyExchange exchange;
    if (!exchange.parse(message.body, _suite->isPsk(), _suite->isEcdhe()))
    {
        return dtls::DECODE_ERROR;
    }

    if (_suite->isPsk())
    {
        _peerIdentityHint = exchange.identityHint;
    }

    if (_suite->isEcdhe())
    {
        if (!crypto::isSupportedCurve(exchange.namedCurve) || !contains(_config.namedCurves, exchange.namedCurve))
        {
            return dtls::ILLEGAL_PARAMETER;
        }

        const auto scheme = static_cast<crypto::SignatureScheme>(exchange.signatureScheme);
        const auto leaf = crypto::Certificate::fromDer(_peerCertificates.front());
        const auto data = signedParams(_clientRandom, _serverRandom, exchange);
        if (!contains(signatureSchemes(), exchange.signatureScheme) ||
            !leaf.verify(scheme, data.data(), data.size(), exchange.signature.data(), exchange.signature.size()))
        {
            logger::warn("ServerKeyExchange signature does not verify", _loggableId.c_str());
            return dtls::DECRYPT_ERROR;
        }

        _namedCurve = exchange.namedCurve;
        _peerPublicKey = exchange.publicKey;
    }

    _keyExchangeDone = true;
    addToTranscript(message);
    return dtls::NO_ALERT;
}

dtls::AlertDescription DtlsConnection::onCertificateRequest(const dtls::HandshakeMessage& message)
{
    if (!_suite || _flight == 5 || !_suite->requiresCertificate() || _certificateRequested)
    {
        return dtls::UNEXPECTED_MESSAGE;
    }

    dtls::CertificateRequest request;
    if (!request.parse(message.body))
    {
        return dtls::DECODE_ERROR;
    }

    _certificateRequested = true;
    addToTranscript(message);
    return dtls::NO_ALERT;
}

dtls::AlertDescription DtlsConnection::onServerHelloDone(const dtls::HandshakeMessage& message)
{
    if (!_suite || _flight == 5 || (_suite->isEcdhe() && _peerPublicKey.empty()))
    {
        return dtls::UNEXPECTED_MESSAGE;
    }
    if (!message.body.empty())
    {
        return dtls::DECODE_ERROR;
    }
    addToTranscript(message);

    _lastFlight.clear();
    bool sentCertificate = false;
    if (_certificateRequested)
    {
        dtls::CertificateMessage certificate;
        if (_config.identity.isValid())
        {
            for (auto& entry : _config.identity.chain)
            {
                certificate.certificates.push_back(entry->toDer());
            }
        }
        sentCertificate = !certificate.certificates.empty();

        std::vector<uint8_t> body;
        certificate.serialize(body);
        const auto certificateMessage = makeMessage(dtls::CERTIFICATE, std::move(body));
        addToTranscript(certificateMessage);
        addToFlight(certificateMessage);
    }

    std::vector<uint8_t> preMasterSecret;
    dtls::ClientKeyExchange keyExchange;
    if (_suite->isEcdhe())
    {
        _ecdhKey = std::make_unique<crypto::EcdhKey>(static_cast<crypto::NamedCurve>(_namedCurve));
        if (!_ecdhKey->isValid() || !_ecdhKey->deriveSecret(_peerPublicKey, preMasterSecret))
        {
            return dtls::ILLEGAL_PARAMETER;
        }
        keyExchange.publicKey = _ecdhKey->getPublicKey();
    }
    if (_suite->isPsk())
    {
        std::vector<uint8_t> psk;
        if (!_config.pskCallback(_peerIdentityHint, psk) || psk.empty())
        {
            logger::warn("no psk for the server hint", _loggableId.c_str());
            return dtls::HANDSHAKE_FAILURE;
        }
        preMasterSecret = dtls::makePskPreMasterSecret(psk);
        keyExchange.identity = _config.pskIdentity;
    }

    std::vector<uint8_t> body;
    keyExchange.serialize(body, _suite->isPsk(), _suite->isEcdhe());
    const auto keyExchangeMessage = makeMessage(dtls::CLIENT_KEY_EXCHANGE, std::move(body));
    addToTranscript(keyExchangeMessage);
    addToFlight(keyExchangeMessage);

    if (!deriveKeys(preMasterSecret))
    {
        return dtls::INTERNAL_ERROR;
    }

    if (sentCertificate)
    {
        const auto& privateKey = *_config.identity.privateKey;
        dtls::CertificateVerify verify;
        const auto scheme = privateKey.defaultScheme();
        verify.signatureScheme = static_cast<uint16_t>(scheme);
        if (!privateKey.sign(scheme, _transcript.data(), _transcript.size(), verify.signature))
        {
            return dtls::INTERNAL_ERROR;
        }

        std::vector<uint8_t> verifyBody;
        verify.serialize(verifyBody);
        const auto verifyMessage = makeMessage(dtls::CERTIFICATE_VERIFY, std::move(verifyBody));
        addToTranscript(verifyMessage);
        addToFlight(verifyMessage);
    }

    addChangeCipherSpecToFlight();
    const auto finished = makeMessage(dtls::FINISHED, makeFinished(true));
    addToTranscript(finished);
    addToFlight(finished);

    _flight = 5;
    sendFlight(_timestamp, true);
    return dtls::NO_ALERT;
}

dtls::AlertDescription DtlsConnection::onServerFinished(const dtls::HandshakeMessage& message)
{
    if (_flight != 5 || !_peerChangeCipherSpec)
    {
        return dtls::UNEXPECTED_MESSAGE;
    }
    if (!checkFinished(message, false))
    {
        return dtls::DECRYPT_ERROR;
    }

    addToTranscript(message);
    _flightTimer.stop();
    // the server flight is final, repeats of it need no answer
    _lastFlight.clear();
    setConnected();
    return dtls::NO_ALERT;
}

std::vector<uint8_t> DtlsConnection::makeCookie(const dtls::ClientHello& clientHello) const
{
    crypto::HMAC hmac(_cookieSecret.data(), _cookieSecret.size(), crypto::DigestType::SHA256);
    hmac.add(clientHello.random.data(), clientHello.random.size());
    hmac.add(clientHello.sessionId.data(), clientHello.sessionId.size());
    for (auto suite : clientHello.cipherSuites)
    {
        hmac.add(suite);
    }

    std::vector<uint8_t> cookie(hmac.digestSize());
    hmac.compute(cookie.data());
    return cookie;
}

uint16_t DtlsConnection::selectCurve(const std::vector<uint16_t>& offered) const
{
    for (auto curve : _config.namedCurves)
    {
        if (crypto::isSupportedCurve(curve) && (offered.empty() || contains(offered, curve)))
        {
            return curve;
        }
    }
    return 0;
}

const dtls::CipherSuiteInfo* DtlsConnection::selectCipherSuite(const dtls::ClientHello& clientHello) const
{
    const auto& candidates = _config.cipherSuites.empty() ? dtls::allCipherSuites() : _config.cipherSuites;
    const bool haveCurve = selectCurve(clientHello.extensions.supportedGroups) != 0;

    for (auto id : candidates)
    {
        if (!contains(clientHello.cipherSuites, static_cast<uint16_t>(id)))
        {
            continue;
        }

        auto suite = dtls::findCipherSuite(static_cast<uint16_t>(id));
        if (!suite)
        {
            continue;
        }

        if (suite->isPsk())
        {
            if (_config.usesPsk())
            {
                return suite;
            }
            continue;
        }

        if (!_config.identity.isValid() || !haveCurve)
        {
            continue;
        }
        const auto keyType = _config.identity.privateKey->getType();
        if ((suite->keyExchange == dtls::KeyExchange::ECDHE_ECDSA && keyType == crypto::KeyType::ECDSA) ||
            (suite->keyExchange == dtls::KeyExchange::ECDHE_RSA && keyType == crypto::KeyType::RSA))
        {
            return suite;
        }
    }
    return nullptr;
}

dtls::AlertDescription DtlsConnection::onClientHello(const dtls::HandshakeMessage& message)
{
    if (_flight != 1)
    {
        return dtls::UNEXPECTED_MESSAGE;
    }

    dtls::ClientHello hello;
    if (!hello.parse(message.body))
    {
        return dtls::DECODE_ERROR;
    }
    if (hello.version != dtls::DTLSv12 && hello.version != dtls::DTLSv10)
    {
        logger::warn("client version 0x%04x not supported", _loggableId.c_str(), hello.version);
        return dtls::PROTOCOL_VERSION;
    }
    if (!contains(hello.compressionMethods, uint8_t(0)))
    {
        return dtls::HANDSHAKE_FAILURE;
    }

    if (!_config.insecureSkipHelloVerify)
    {
        const auto cookie = makeCookie(hello);
        if (hello.cookie.size() != cookie.size() ||
            !crypto::constantTimeEquals(hello.cookie.data(), cookie.data(), cookie.size()))
        {
            dtls::HelloVerifyRequest request;
            request.version = dtls::DTLSv10;
            request.cookie = cookie;

            std::vector<uint8_t> body;
            request.serialize(body);
            _lastFlight.clear();
            addToFlight(makeMessage(dtls::HELLO_VERIFY_REQUEST, std::move(body)));
            sendFlight(_timestamp, false);
            return dtls::NO_ALERT;
        }
    }

    _clientRandom = hello.random;
    _transcript.clear();
    addToTranscript(message);
    return sendServerFlight(hello);
}

dtls::AlertDescription DtlsConnection::sendServerFlight(const dtls::ClientHello& clientHello)
{
    _suite = selectCipherSuite(clientHello);
    if (!_suite)
    {
        logger::warn("no common cipher suite", _loggableId.c_str());
        return dtls::INSUFFICIENT_SECURITY;
    }

    if (clientHello.extensions.extendedMasterSecret &&
        _config.extendedMasterSecret != DtlsConfig::ExtendedMasterSecret::Disable)
    {
        _extendedMasterSecret = true;
    }
    else if (_config.extendedMasterSecret == DtlsConfig::ExtendedMasterSecret::Require)
    {
        logger::warn("client does not support extended master secret", _loggableId.c_str());
        return dtls::HANDSHAKE_FAILURE;
    }

    if (!_config.srtpProfiles.empty() && !clientHello.extensions.srtpProfiles.empty())
    {
        for (auto profile : _config.srtpProfiles)
        {
            if (contains(clientHello.extensions.srtpProfiles, srtp::toDtlsProfileId(profile)))
            {
                _srtpProfile = profile;
                break;
            }
        }
        if (_srtpProfile == srtp::NULL_CIPHER)
        {
            logger::warn("no common srtp profile", _loggableId.c_str());
            return dtls::INSUFFICIENT_SECURITY;
        }
    }

    makeRandom(_serverRandom);
    _lastFlight.clear();

    dtls::ServerHello hello;
    hello.random = _serverRandom;
    hello.cipherSuite = static_cast<uint16_t>(_suite->id);
    hello.extensions.extendedMasterSecret = _extendedMasterSecret;
    hello.extensions.renegotiationInfo = clientHello.extensions.renegotiationInfo;
    if (_srtpProfile != srtp::NULL_CIPHER)
    {
        hello.extensions.srtpProfiles.push_back(srtp::toDtlsProfileId(_srtpProfile));
    }
    if (_suite->isEcdhe() && clientHello.extensions.hasPointFormats)
    {
        hello.extensions.hasPointFormats = true;
        hello.extensions.pointFormats = {dtls::EC_POINT_FORMAT_UNCOMPRESSED};
    }

    std::vector<uint8_t> body;
    hello.serialize(body);
    const auto helloMessage = makeMessage(dtls::SERVER_HELLO, std::move(body));
    addToTranscript(helloMessage);
    addToFlight(helloMessage);

    if (_suite->requiresCertificate())
    {
        dtls::CertificateMessage certificate;
        for (auto& entry : _config.identity.chain)
        {
            certificate.certificates.push_back(entry->toDer());
        }
        body.clear();
        certificate.serialize(body);
        const auto certificateMessage = makeMessage(dtls::CERTIFICATE, std::move(body));
        addToTranscript(certificateMessage);
        addToFlight(certificateMessage);
    }

    dtls::ServerKeyExchange exchange;
    body.clear();
    if (_suite->isEcdhe())
    {
        _namedCurve = selectCurve(clientHello.extensions.supportedGroups);
        _ecdhKey = std::make_unique<crypto::EcdhKey>(static_cast<crypto::NamedCurve>(_namedCurve));
        if (!_ecdhKey->isValid())
        {
            return dtls::INTERNAL_ERROR;
        }
        exchange.namedCurve = _namedCurve;
        exchange.publicKey = _ecdhKey->getPublicKey();

        const auto& privateKey = *_config.identity.privateKey;
        const auto scheme = privateKey.defaultScheme();
        if (!clientHello.extensions.signatureSchemes.empty() &&
            !contains(clientHello.extensions.signatureSchemes, static_cast<uint16_t>(scheme)))
        {
            return dtls::HANDSHAKE_FAILURE;
        }

        const auto data = signedParams(_clientRandom, _serverRandom, exchange);
        exchange.signatureScheme = static_cast<uint16_t>(scheme);
        if (!privateKey.sign(scheme, data.data(), data.size(), exchange.signature))
        {
            return dtls::INTERNAL_ERROR;
        }
        exchange.serialize(body, false, true);
    }
    else if (!_config.pskIdentityHint.empty())
    {
        exchange.identityHint = _config.pskIdentityHint;
        exchange.serialize(body, true, false);
    }

    if (!body.empty())
    {
        const auto exchangeMessage = makeMessage(dtls::SERVER_KEY_EXCHANGE, std::move(body));
        addToTranscript(exchangeMessage);
        addToFlight(exchangeMessage);
    }

    if (_suite->requiresCertificate() && _config.clientAuth != DtlsConfig::ClientAuth::NoClientCert)
    {
        dtls::CertificateRequest request;
        request.certificateTypes = {dtls::ECDSA_SIGN, dtls::RSA_SIGN};
        request.signatureSchemes = signatureSchemes();
        body.clear();
        request.serialize(body);
        const auto requestMessage = makeMessage(dtls::CERTIFICATE_REQUEST, std::move(body));
        addToTranscript(requestMessage);
        addToFlight(requestMessage);
        _certificateRequested = true;
    }

    const auto doneMessage = makeMessage(dtls::SERVER_HELLO_DONE, std::vector<uint8_t>());
    addToTranscript(doneMessage);
    addToFlight(doneMessage);

    _flight = 4;
    sendFlight(_timestamp, true);
    return dtls::NO_ALERT;
}

dtls::AlertDescription DtlsConnection::onClientCertificate(const dtls::HandshakeMessage& message)
{
    if (_flight != 4 || !_certificateRequested || _keyExchangeDone || !_peerCertificates.empty())
    {
        return dtls::UNEXPECTED_MESSAGE;
    }

    dtls::CertificateMessage certificate;
    if (!certificate.parse(message.body))
    {
        return dtls::DECODE_ERROR;
    }
    addToTranscript(message);
    _flightTimer.stop();

    if (certificate.certificates.empty())
    {
        return dtls::NO_ALERT;
    }

    _peerCertificates = std::move(certificate.certificates);
    return verifyPeerChain(isCertificateVerified(_config.clientAuth)) ? dtls::NO_ALERT : dtls::BAD_CERTIFICATE;
}

dtls::AlertDescription DtlsConnection::onClientKeyExchange(const dtls::HandshakeMessage& message)
{
    if (_flight != 4 || _keyExchangeDone)
    {
        return dtls::UNEXPECTED_MESSAGE;
    }
    if (isCertificateRequired(_config.clientAuth) && _peerCertificates.empty())
    {
        logger::warn("client certificate required", _loggableId.c_str());
        return dtls::NO_CERTIFICATE;
    }

    dtls::ClientKeyExchange keyExchange;
    if (!keyExchange.parse(message.body, _suite->isPsk(), _suite->isEcdhe()))
    {
        return dtls::DECODE_ERROR;
    }
    addToTranscript(message);
    _flightTimer.stop();

    std::vector<uint8_t> preMasterSecret;
    if (_suite->isEcdhe() && !_ecdhKey->deriveSecret(keyExchange.publicKey, preMasterSecret))
    {
        return dtls::ILLEGAL_PARAMETER;
    }
    if (_suite->isPsk())
    {
        std::vector<uint8_t> psk;
        _peerIdentityHint = keyExchange.identity;
        if (!_config.pskCallback(keyExchange.identity, psk) || psk.empty())
        {
            return dtls::UNKNOWN_PSK_IDENTITY;
        }
        preMasterSecret = dtls::makePskPreMasterSecret(psk);
    }

    _keyExchangeDone = true;
    return deriveKeys(preMasterSecret) ? dtls::NO_ALERT : dtls::INTERNAL_ERROR;
}

dtls::AlertDescription DtlsConnection::onCertificateVerify(const dtls::HandshakeMessage& message)
{
    if (_flight != 4 || !_keyExchangeDone || _peerCertificates.empty() || _clientCertificateVerified)
    {
        return dtls::UNEXPECTED_MESSAGE;
    }

    dtls::CertificateVerify verify;
    if (!verify.parse(message.body))
    {
        return dtls::DECODE_ERROR;
    }

    const auto scheme = static_cast<crypto::SignatureScheme>(verify.signatureScheme);
    const auto leaf = crypto::Certificate::fromDer(_peerCertificates.front());
    if (!contains(signatureSchemes(), verify.signatureScheme) ||
        !leaf.verify(scheme, _transcript.data(), _transcript.size(), verify.signature.data(), verify.signature.size()))
    {
        logger::warn("CertificateVerify signature does not verify", _loggableId.c_str());
        return dtls::DECRYPT_ERROR;
    }

    _clientCertificateVerified = true;
    addToTranscript(message);
    return dtls::NO_ALERT;
}

dtls::AlertDescription DtlsConnection::onClientFinished(const dtls::HandshakeMessage& message)
{
    if (_flight != 4 || !_keyExchangeDone || !_peerChangeCipherSpec)
    {
        return dtls::UNEXPECTED_MESSAGE;
    }
    if (!_peerCertificates.empty() && !_clientCertificateVerified)
    {
        logger::warn("client certificate without CertificateVerify", _loggableId.c_str());
        return dtls::HANDSHAKE_FAILURE;
    }
    if (!checkFinished(message, true))
    {
        return dtls::DECRYPT_ERROR;
    }
    addToTranscript(message);

    _lastFlight.clear();
    addChangeCipherSpecToFlight();
    const auto finished = makeMessage(dtls::FINISHED, makeFinished(false));
    addToTranscript(finished);
    addToFlight(finished);

    _flight = 6;
    sendFlight(_timestamp, false);
    setConnected();
    return dtls::NO_ALERT;
}

} // namespace transport
