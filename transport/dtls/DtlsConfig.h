#pragma once

#include "crypto/Certificate.h"
#include "transport/dtls/DtlsCipherSuite.h"
#include "transport/dtls/SrtpProfiles.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace config
{
class RtcConfig;
}

namespace transport
{

struct DtlsConfig
{
    enum class Role
    {
        Client,
        Server
    };

    enum class ClientAuth
    {
        NoClientCert,
        RequestClientCert,
        RequireAnyClientCert,
        VerifyClientCertIfGiven,
        RequireAndVerifyClientCert
    };

    enum class ExtendedMasterSecret
    {
        Disable,
        Request,
        Require
    };

    // psk for the identity hint given by the server, or for the identity chosen by the client
    using PskCallback = std::function<bool(const std::vector<uint8_t>& hintOrIdentity, std::vector<uint8_t>& psk)>;
    // DER chain, leaf first
    using VerifyCallback = std::function<bool(const std::vector<std::vector<uint8_t>>& chain)>;

    Role role = Role::Client;
    size_t mtu = 1200;
    uint32_t flightIntervalMs = 1000;
    uint32_t maxFlightIntervalMs = 60000;
    uint32_t maxRetransmissions = 5;
    ExtendedMasterSecret extendedMasterSecret = ExtendedMasterSecret::Request;
    ClientAuth clientAuth = ClientAuth::NoClientCert;
    bool insecureSkipVerify = false;
    bool insecureSkipHelloVerify = false;
    std::string serverName;

    std::vector<dtls::CipherSuiteId> cipherSuites; // empty means every suite the credentials allow
    std::vector<srtp::Profile> srtpProfiles; // in order of preference, empty offers none
    std::vector<uint16_t> namedCurves = {29, 23}; // X25519, secp256r1

    crypto::CertificateIdentity identity;

    std::vector<uint8_t> pskIdentity; // client
    std::vector<uint8_t> pskIdentityHint; // server
    PskCallback pskCallback;
    VerifyCallback verifyPeerCertificate;

    bool isClient() const { return role == Role::Client; }
    bool usesPsk() const { return static_cast<bool>(pskCallback); }
};

// fills the wire and timer parameters, credentials and callbacks are left to the caller
bool readDtlsConfig(const config::RtcConfig& rtcConfig, DtlsConfig& dtlsConfig);

const char* toString(DtlsConfig::ClientAuth clientAuth);

} // namespace transport
