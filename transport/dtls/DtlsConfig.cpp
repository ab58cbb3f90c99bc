#include "transport/dtls/DtlsConfig.h"
#include "config/RtcConfig.h"
#include "logger/Logger.h"

namespace transport
{

namespace
{
std::vector<std::string> splitList(const std::string& list)
{
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= list.size())
    {
        auto end = list.find(',', start);
        if (end == std::string::npos)
        {
            end = list.size();
        }

        auto item = list.substr(start, end - start);
        const auto first = item.find_first_not_of(' ');
        const auto last = item.find_last_not_of(' ');
        if (first != std::string::npos)
        {
            items.push_back(item.substr(first, last - first + 1));
        }
        start = end + 1;
    }
    return items;
}

bool parseClientAuth(const std::string& value, DtlsConfig::ClientAuth& clientAuth)
{
    if (value == "none")
    {
        clientAuth = DtlsConfig::ClientAuth::NoClientCert;
    }
    else if (value == "request")
    {
        clientAuth = DtlsConfig::ClientAuth::RequestClientCert;
    }
    else if (value == "requireAny")
    {
        clientAuth = DtlsConfig::ClientAuth::RequireAnyClientCert;
    }
    else if (value == "verifyIfGiven")
    {
        clientAuth = DtlsConfig::ClientAuth::VerifyClientCertIfGiven;
    }
    else if (value == "requireAndVerify")
    {
        clientAuth = DtlsConfig::ClientAuth::RequireAndVerifyClientCert;
    }
    else
    {
        return false;
    }
    return true;
}

bool parseExtendedMasterSecret(const std::string& value, DtlsConfig::ExtendedMasterSecret& mode)
{
    if (value == "disable")
    {
        mode = DtlsConfig::ExtendedMasterSecret::Disable;
    }
    else if (value == "request")
    {
        mode = DtlsConfig::ExtendedMasterSecret::Request;
    }
    else if (value == "require")
    {
        mode = DtlsConfig::ExtendedMasterSecret::Require;
    }
    else
    {
        return false;
    }
    return true;
}
} // namespace

bool readDtlsConfig(const config::RtcConfig& rtcConfig, DtlsConfig& dtlsConfig)
{
    const auto& role = rtcConfig.dtls.role.get();
    if (role == "client")
    {
        dtlsConfig.role = DtlsConfig::Role::Client;
    }
    else if (role == "server")
    {
        dtlsConfig.role = DtlsConfig::Role::Server;
    }
    else
    {
        logger::error("invalid dtls.role '%s'", "DtlsConfig", role.c_str());
        return false;
    }

    if (!parseClientAuth(rtcConfig.dtls.clientAuth.get(), dtlsConfig.clientAuth))
    {
        logger::error("invalid dtls.clientAuth '%s'", "DtlsConfig", rtcConfig.dtls.clientAuth.get().c_str());
        return false;
    }

    if (!parseExtendedMasterSecret(rtcConfig.dtls.extendedMasterSecret.get(), dtlsConfig.extendedMasterSecret))
    {
        logger::error("invalid dtls.extendedMasterSecret '%s'",
            "DtlsConfig",
            rtcConfig.dtls.extendedMasterSecret.get().c_str());
        return false;
    }

    dtlsConfig.mtu = rtcConfig.dtls.mtu;
    dtlsConfig.flightIntervalMs = rtcConfig.dtls.flightIntervalMs;
    dtlsConfig.maxFlightIntervalMs = rtcConfig.dtls.maxFlightIntervalMs;
    dtlsConfig.maxRetransmissions = rtcConfig.dtls.maxRetransmissions;
    dtlsConfig.insecureSkipVerify = rtcConfig.dtls.insecureSkipVerify;
    dtlsConfig.insecureSkipHelloVerify = rtcConfig.dtls.insecureSkipHelloVerify;
    dtlsConfig.serverName = rtcConfig.dtls.serverName.get();

    const auto& hint = rtcConfig.dtls.pskIdentityHint.get();
    dtlsConfig.pskIdentityHint.assign(hint.begin(), hint.end());

    dtlsConfig.cipherSuites.clear();
    for (auto& name : splitList(rtcConfig.dtls.cipherSuites.get()))
    {
        auto suite = dtls::findCipherSuite(name);
        if (!suite)
        {
            logger::error("unsupported cipher suite '%s'", "DtlsConfig", name.c_str());
            return false;
        }
        dtlsConfig.cipherSuites.push_back(suite->id);
    }

    dtlsConfig.srtpProfiles.clear();
    const auto profiles = splitList(rtcConfig.dtls.srtpProfiles.get());
    if (profiles.empty())
    {
        dtlsConfig.srtpProfiles = {srtp::AEAD_AES_128_GCM,
            srtp::AEAD_AES_256_GCM,
            srtp::AES128_CM_SHA1_80,
            srtp::AES128_CM_SHA1_32};
    }
    for (auto& name : profiles)
    {
        const auto profile = srtp::fromString(name);
        if (profile == srtp::NULL_CIPHER)
        {
            logger::error("unsupported srtp profile '%s'", "DtlsConfig", name.c_str());
            return false;
        }
        dtlsConfig.srtpProfiles.push_back(profile);
    }

    return true;
}

const char* toString(DtlsConfig::ClientAuth clientAuth)
{
    switch (clientAuth)
    {
    case DtlsConfig::ClientAuth::NoClientCert:
        return "NoClientCert";
    case DtlsConfig::ClientAuth::RequestClientCert:
        return "RequestClientCert";
    case DtlsConfig::ClientAuth::RequireAnyClientCert:
        return "RequireAnyClientCert";
    case DtlsConfig::ClientAuth::VerifyClientCertIfGiven:
        return "VerifyClientCertIfGiven";
    case DtlsConfig::ClientAuth::RequireAndVerifyClientCert:
        return "RequireAndVerifyClientCert";
    }
    return "unknown";
}

} // namespace transport
