#pragma once

#include "crypto/EcdhKey.h"
#include "crypto/SslHelper.h"
#include "logger/Logger.h"
#include "transport/dtls/DtlsConfig.h"
#include "transport/dtls/DtlsRecordLayer.h"
#include "transport/dtls/SrtpProfiles.h"
#include "transport/sctp/SctpTimer.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace transport
{
class DtlsWriteListener;

/**
 * DTLS 1.2 endpoint, client or server. Non-blocking: datagrams are fed through onPacketReceived and
 * timers are serviced by processTimeout. All records go out through the DtlsWriteListener.
 *
 * Client flights: 0 ClientHello, 2 ClientHello with cookie, 5 Certificate* ClientKeyExchange
 * CertificateVerify* ChangeCipherSpec Finished.
 * Server flights: 1 HelloVerifyRequest, 3 ServerHello Certificate* ServerKeyExchange CertificateRequest*
 * ServerHelloDone, 4 awaiting the client flight, 6 ChangeCipherSpec Finished.
 *
 * Not thread safe. All timestamps in nanoseconds.
 */
class DtlsConnection : private dtls::DtlsRecordLayer::IEvents
{
public:
    enum class State
    {
        IDLE,
        CONNECTING,
        CONNECTED,
        CLOSED,
        FAILED
    };

    class IEvents
    {
    public:
        virtual ~IEvents() = default;

        virtual void onDtlsConnected(DtlsConnection& connection) = 0;
        virtual void onDtlsApplicationData(DtlsConnection& connection, const uint8_t* data, size_t length) = 0;
        // alert is NO_ALERT when the handshake timed out
        virtual void onDtlsFailed(DtlsConnection& connection, dtls::AlertDescription alert) = 0;
        virtual void onDtlsClosed(DtlsConnection& connection) = 0;
    };

    DtlsConnection(size_t logId, const DtlsConfig& config, DtlsWriteListener& writer, IEvents* listener);

    // client sends its first flight, server starts listening
    bool start(uint64_t timestamp);
    void onPacketReceived(const void* data, size_t length, uint64_t timestamp);
    bool sendApplicationData(const void* data, size_t length);
    // best effort close_notify
    void close();

    int64_t nextTimeout(uint64_t timestamp) const;
    int64_t processTimeout(uint64_t timestamp);

    State getState() const { return _state; }
    bool isConnected() const { return _state == State::CONNECTED; }
    bool isClient() const { return _config.isClient(); }
    int getFlight() const { return _flight; }
    const logger::LoggableId& getLoggableId() const { return _loggableId; }

    uint16_t getCipherSuite() const { return _suite ? static_cast<uint16_t>(_suite->id) : 0; }
    srtp::Profile getSelectedSrtpProfile() const { return _srtpProfile; }
    bool isExtendedMasterSecret() const { return _extendedMasterSecret; }
    const std::vector<std::vector<uint8_t>>& getPeerCertificates() const { return _peerCertificates; }
    bool isPeerCertificateVerified() const { return _peerVerified; }
    // sha-256 of the peer leaf certificate, empty if the peer sent none
    std::string getPeerCertificateFingerprint() const;
    std::string getLocalFingerprint() const;
    const std::vector<uint8_t>& getPeerIdentityHint() const { return _peerIdentityHint; }
    uint32_t getRetransmissionCount() const { return _totalRetransmissions; }
    size_t getMaxApplicationDataSize() const { return _recordLayer.getMaxApplicationDataSize(); }

    bool exportKeyingMaterial(const std::string& label, size_t length, std::vector<uint8_t>& keyingMaterial) const;
    // EXTRACTOR-dtls_srtp split into this side's and the peer's key and salt
    bool getSrtpKeys(srtp::AesKey& localKey, srtp::AesKey& remoteKey) const;

private:
    struct FlightEntry
    {
        bool changeCipherSpec;
        dtls::HandshakeMessage message;
        uint16_t epoch;
    };

    // dtls::DtlsRecordLayer::IEvents
    void onDtlsHandshakeMessage(const dtls::HandshakeMessage& message, uint16_t epoch) override;
    void onDtlsHandshakeRetransmission(uint16_t messageSeq, uint16_t epoch) override;
    void onDtlsChangeCipherSpec(uint16_t epoch) override;
    void onDtlsAlert(dtls::AlertLevel level, dtls::AlertDescription description) override;
    void onDtlsApplicationData(const uint8_t* data, size_t length) override;

    dtls::AlertDescription onClientHandshake(const dtls::HandshakeMessage& message);
    dtls::AlertDescription onServerHandshake(const dtls::HandshakeMessage& message);

    // client
    void sendClientHello();
    dtls::AlertDescription onHelloVerifyRequest(const dtls::HandshakeMessage& message);
    dtls::AlertDescription onServerHello(const dtls::HandshakeMessage& message);
    dtls::AlertDescription onServerCertificate(const dtls::HandshakeMessage& message);
    dtls::AlertDescription onServerKeyExchange(const dtls::HandshakeMessage& message);
    dtls::AlertDescription onCertificateRequest(const dtls::HandshakeMessage& message);
    dtls::AlertDescription onServerHelloDone(const dtls::HandshakeMessage& message);
    dtls::AlertDescription onServerFinished(const dtls::HandshakeMessage& message);

    // server
    dtls::AlertDescription onClientHello(const dtls::HandshakeMessage& message);
    dtls::AlertDescription sendServerFlight(const dtls::ClientHello& clientHello);
    dtls::AlertDescription onClientCertificate(const dtls::HandshakeMessage& message);
    dtls::AlertDescription onClientKeyExchange(const dtls::HandshakeMessage& message);
    dtls::AlertDescription onCertificateVerify(const dtls::HandshakeMessage& message);
    dtls::AlertDescription onClientFinished(const dtls::HandshakeMessage& message);
    std::vector<uint8_t> makeCookie(const dtls::ClientHello& clientHello) const;
    const dtls::CipherSuiteInfo* selectCipherSuite(const dtls::ClientHello& clientHello) const;
    uint16_t selectCurve(const std::vector<uint16_t>& offered) const;

    // shared
    std::vector<uint16_t> offeredCipherSuites() const;
    std::vector<uint16_t> signatureSchemes() const;
    dtls::HandshakeMessage makeMessage(dtls::HandshakeType type, std::vector<uint8_t>&& body);
    void addToFlight(const dtls::HandshakeMessage& message);
    void addChangeCipherSpecToFlight();
    void sendFlight(uint64_t timestamp, bool expectResponse);
    void retransmitFlight();
    void addToTranscript(const dtls::HandshakeMessage& message);
    std::vector<uint8_t> transcriptHash() const;
    bool verifyPeerChain(bool required);
    bool deriveKeys(const std::vector<uint8_t>& preMasterSecret);
    std::vector<uint8_t> makeFinished(bool isClient) const;
    bool checkFinished(const dtls::HandshakeMessage& message, bool peerIsClient) const;
    void setConnected();
    void fail(dtls::AlertDescription alert, bool sendAlert);

    logger::LoggableId _loggableId;
    DtlsConfig _config;
    IEvents* _listener;
    dtls::DtlsRecordLayer _recordLayer;
    State _state;
    int _flight;
    uint64_t _timestamp;

    dtls::Random _clientRandom;
    dtls::Random _serverRandom;
    std::vector<uint8_t> _sessionId;
    std::vector<uint8_t> _cookie;
    std::vector<uint8_t> _cookieSecret;
    const dtls::CipherSuiteInfo* _suite;
    uint16_t _namedCurve;
    std::unique_ptr<crypto::EcdhKey> _ecdhKey;
    std::vector<uint8_t> _peerPublicKey;
    std::vector<uint8_t> _masterSecret;
    bool _extendedMasterSecret;
    srtp::Profile _srtpProfile;
    std::vector<uint8_t> _peerIdentityHint;
    std::vector<std::vector<uint8_t>> _peerCertificates;
    bool _peerVerified;
    bool _certificateRequested;
    bool _clientCertificateVerified;
    bool _keyExchangeDone;
    bool _peerChangeCipherSpec;

    uint16_t _sendSeq;
    std::vector<uint8_t> _transcript;
    std::vector<FlightEntry> _lastFlight;
    bool _peerRetransmitted;

    sctp::Timer _flightTimer;
    uint64_t _flightInterval;
    uint32_t _retransmissions;
    uint32_t _totalRetransmissions;
};

} // namespace transport
