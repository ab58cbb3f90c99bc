#pragma once

#include "config/ConfigReader.h"
#include <string>

namespace config
{

class RtcConfig : public ConfigReader
{
public:
    CFG_PROP(uint32_t, connectTimeoutMs, 10000);
    CFG_PROP(uint32_t, readTimeoutMs, 0); // 0 is unbounded
    CFG_PROP(uint32_t, writeTimeoutMs, 10000);

    CFG_GROUP()
    CFG_PROP(std::string, role, "client");
    CFG_PROP(uint32_t, mtu, 1200);
    CFG_PROP(uint32_t, flightIntervalMs, 1000);
    CFG_PROP(uint32_t, maxFlightIntervalMs, 60000);
    CFG_PROP(uint32_t, maxRetransmissions, 5);
    // disable, request, require
    CFG_PROP(std::string, extendedMasterSecret, "request");
    // none, request, requireAny, verifyIfGiven, requireAndVerify
    CFG_PROP(std::string, clientAuth, "none");
    CFG_PROP(bool, insecureSkipVerify, false);
    CFG_PROP(bool, insecureSkipHelloVerify, false);
    CFG_PROP(std::string, pskIdentityHint, "");
    // comma separated IANA names, empty means all supported
    CFG_PROP(std::string, cipherSuites, "");
    CFG_PROP(std::string, srtpProfiles, "");
    CFG_PROP(std::string, serverName, "");
    CFG_GROUP_END(dtls);

    CFG_GROUP()
    CFG_PROP(uint32_t, maxReceiveBufferSize, 1024 * 1024);
    CFG_PROP(uint32_t, maxMessageSize, 64 * 1024);
    CFG_PROP(uint32_t, mtu, 1200);
    CFG_PROP(uint32_t, rtoInitialMs, 1000);
    CFG_PROP(uint32_t, rtoMinMs, 1000);
    CFG_PROP(uint32_t, rtoMaxMs, 60000);
    CFG_PROP(uint32_t, maxInitRetransmits, 8);
    CFG_PROP(uint32_t, maxRetransmits, 10);
    CFG_PROP(uint32_t, delayedAckMs, 200);
    CFG_PROP(uint32_t, heartbeatIntervalMs, 30000);
    CFG_PROP(uint32_t, cookieLifeTimeMs, 60000);
    CFG_GROUP_END(sctp);

    CFG_GROUP()
    CFG_PROP(std::string, profile, "AES_CM_128_HMAC_SHA1_80");
    CFG_PROP(uint32_t, replayWindowSize, 64);
    CFG_PROP(bool, disableReplay, false);
    CFG_GROUP_END(srtp);

    CFG_GROUP()
    CFG_PROP(uint32_t, receiveMtu, 1460);
    CFG_PROP(uint32_t, nackIntervalMs, 100);
    CFG_PROP(uint32_t, nackSkipLastN, 0);
    CFG_PROP(uint32_t, nackBufferSize, 1024);
    CFG_PROP(uint32_t, responderBufferSize, 1024);
    CFG_PROP(uint32_t, reportIntervalMs, 5000);
    CFG_PROP(uint32_t, twccIntervalMs, 100);
    // rfc8285 id of the transport wide sequence number extension, 0 disables twcc
    CFG_PROP(uint32_t, twccExtensionId, 0);
    CFG_PROP(std::string, cname, "");
    CFG_GROUP_END(rtp);

    CFG_GROUP()
    CFG_PROP(std::string, file, "");
    CFG_PROP(bool, stdOut, true);
    CFG_PROP(std::string, level, "INFO");
    CFG_GROUP_END(log);
};

} // namespace config
