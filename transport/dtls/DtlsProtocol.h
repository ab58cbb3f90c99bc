#pragma once

#include "utils/ByteBuffer.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dtls
{
const size_t DEFAULT_MTU = 1200;
const size_t RECORD_HEADER_SIZE = 13;
const size_t HANDSHAKE_HEADER_SIZE = 12;
const size_t RANDOM_SIZE = 32;
const size_t MASTER_SECRET_SIZE = 48;
const size_t VERIFY_DATA_SIZE = 12;
const size_t MAX_COOKIE_SIZE = 255;
const uint64_t MAX_SEQUENCE_NUMBER = 0xFFFFFFFFFFFFull;

enum ContentType : uint8_t
{
    CHANGE_CIPHER_SPEC = 20,
    ALERT = 21,
    HANDSHAKE = 22,
    APPLICATION_DATA = 23
};

enum ProtocolVersion : uint16_t
{
    DTLSv10 = 0xFEFF,
    DTLSv12 = 0xFEFD
};

enum HandshakeType : uint8_t
{
    HELLO_REQUEST = 0,
    CLIENT_HELLO = 1,
    SERVER_HELLO = 2,
    HELLO_VERIFY_REQUEST = 3,
    CERTIFICATE = 11,
    SERVER_KEY_EXCHANGE = 12,
    CERTIFICATE_REQUEST = 13,
    SERVER_HELLO_DONE = 14,
    CERTIFICATE_VERIFY = 15,
    CLIENT_KEY_EXCHANGE = 16,
    FINISHED = 20
};

enum AlertLevel : uint8_t
{
    WARNING = 1,
    FATAL = 2
};

enum AlertDescription : uint8_t
{
    CLOSE_NOTIFY = 0,
    UNEXPECTED_MESSAGE = 10,
    BAD_RECORD_MAC = 20,
    RECORD_OVERFLOW = 22,
    HANDSHAKE_FAILURE = 40,
    NO_CERTIFICATE = 41,
    BAD_CERTIFICATE = 42,
    UNSUPPORTED_CERTIFICATE = 43,
    CERTIFICATE_EXPIRED = 45,
    CERTIFICATE_UNKNOWN = 46,
    ILLEGAL_PARAMETER = 47,
    UNKNOWN_CA = 48,
    ACCESS_DENIED = 49,
    DECODE_ERROR = 50,
    DECRYPT_ERROR = 51,
    PROTOCOL_VERSION = 70,
    INSUFFICIENT_SECURITY = 71,
    INTERNAL_ERROR = 80,
    USER_CANCELED = 90,
    NO_RENEGOTIATION = 100,
    UNSUPPORTED_EXTENSION = 110,
    UNKNOWN_PSK_IDENTITY = 115,
    NO_ALERT = 255 // local marker, never sent
};

enum ExtensionType : uint16_t
{
    SERVER_NAME = 0,
    SUPPORTED_GROUPS = 10,
    EC_POINT_FORMATS = 11,
    SIGNATURE_ALGORITHMS = 13,
    USE_SRTP = 14,
    EXTENDED_MASTER_SECRET = 23,
    RENEGOTIATION_INFO = 0xFF01
};

enum ClientCertificateType : uint8_t
{
    RSA_SIGN = 1,
    ECDSA_SIGN = 64
};

const uint8_t EC_CURVE_TYPE_NAMED = 3;
const uint8_t EC_POINT_FORMAT_UNCOMPRESSED = 0;

using Random = std::array<uint8_t, RANDOM_SIZE>;

struct RecordHeader
{
    uint8_t contentType = 0;
    uint16_t version = DTLSv12;
    uint16_t epoch = 0;
    uint64_t sequenceNumber = 0; // 48 bit
    uint16_t length = 0;

    bool read(utils::ByteReader& reader);
    void write(utils::ByteWriter& writer) const;
};

struct Alert
{
    AlertLevel level = FATAL;
    AlertDescription description = CLOSE_NOTIFY;
};

// A whole, reassembled handshake message
struct HandshakeMessage
{
    HandshakeType type = HELLO_REQUEST;
    uint16_t messageSeq = 0;
    std::vector<uint8_t> body;

    // header with fragment offset 0 and fragment length equal to length, followed by the body
    void writeUnfragmented(std::vector<uint8_t>& out) const;
};

struct HandshakeFragmentHeader
{
    HandshakeType type = HELLO_REQUEST;
    uint32_t length = 0; // 24 bit
    uint16_t messageSeq = 0;
    uint32_t fragmentOffset = 0; // 24 bit
    uint32_t fragmentLength = 0; // 24 bit

    bool read(utils::ByteReader& reader);
    void write(utils::ByteWriter& writer) const;
};

struct Extensions
{
    std::vector<uint16_t> supportedGroups;
    std::vector<uint8_t> pointFormats;
    std::vector<uint16_t> signatureSchemes;
    std::vector<uint16_t> srtpProfiles;
    std::vector<uint8_t> srtpMki;
    std::string serverName;
    bool hasPointFormats = false;
    bool extendedMasterSecret = false;
    bool renegotiationInfo = false;

    void write(utils::ByteWriter& writer) const;
    bool read(utils::ByteReader& reader);
};

struct ClientHello
{
    uint16_t version = DTLSv12;
    Random random = {};
    std::vector<uint8_t> sessionId;
    std::vector<uint8_t> cookie;
    std::vector<uint16_t> cipherSuites;
    std::vector<uint8_t> compressionMethods = {0};
    Extensions extensions;

    void serialize(std::vector<uint8_t>& out) const;
    bool parse(const std::vector<uint8_t>& body);
};

struct HelloVerifyRequest
{
    uint16_t version = DTLSv12;
    std::vector<uint8_t> cookie;

    void serialize(std::vector<uint8_t>& out) const;
    bool parse(const std::vector<uint8_t>& body);
};

struct ServerHello
{
    uint16_t version = DTLSv12;
    Random random = {};
    std::vector<uint8_t> sessionId;
    uint16_t cipherSuite = 0;
    uint8_t compressionMethod = 0;
    Extensions extensions;

    void serialize(std::vector<uint8_t>& out) const;
    bool parse(const std::vector<uint8_t>& body);
};

struct CertificateMessage
{
    std::vector<std::vector<uint8_t>> certificates; // DER, leaf first

    void serialize(std::vector<uint8_t>& out) const;
    bool parse(const std::vector<uint8_t>& body);
};

// ECDHE params with signature, PSK identity hint or both
struct ServerKeyExchange
{
    std::vector<uint8_t> identityHint;
    uint16_t namedCurve = 0;
    std::vector<uint8_t> publicKey;
    uint16_t signatureScheme = 0;
    std::vector<uint8_t> signature;

    // the part covered by the signature, after client and server random
    void writeParams(std::vector<uint8_t>& out) const;
    void serialize(std::vector<uint8_t>& out, bool psk, bool ecdhe) const;
    bool parse(const std::vector<uint8_t>& body, bool psk, bool ecdhe);
};

struct CertificateRequest
{
    std::vector<uint8_t> certificateTypes = {ECDSA_SIGN};
    std::vector<uint16_t> signatureSchemes;

    void serialize(std::vector<uint8_t>& out) const;
    bool parse(const std::vector<uint8_t>& body);
};

struct ClientKeyExchange
{
    std::vector<uint8_t> identity;
    std::vector<uint8_t> publicKey;

    void serialize(std::vector<uint8_t>& out, bool psk, bool ecdhe) const;
    bool parse(const std::vector<uint8_t>& body, bool psk, bool ecdhe);
};

struct CertificateVerify
{
    uint16_t signatureScheme = 0;
    std::vector<uint8_t> signature;

    void serialize(std::vector<uint8_t>& out) const;
    bool parse(const std::vector<uint8_t>& body);
};

// use_srtp protection profiles rfc5764 4.1.2
enum SrtpProtectionProfile : uint16_t
{
    SRTP_AES128_CM_HMAC_SHA1_80 = 0x0001,
    SRTP_AES128_CM_HMAC_SHA1_32 = 0x0002,
    SRTP_AEAD_AES_128_GCM = 0x0007,
    SRTP_AEAD_AES_256_GCM = 0x0008
};

inline bool isDtlsPacket(const void* data, size_t length)
{
    auto msg = reinterpret_cast<const uint8_t*>(data);
    return length >= RECORD_HEADER_SIZE && msg[0] >= 20 && msg[0] < 64;
}

const char* toString(HandshakeType type);
const char* toString(AlertDescription description);
const char* toString(ContentType type);

} // namespace dtls
