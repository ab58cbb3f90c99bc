#include "transport/dtls/DtlsProtocol.h"

namespace dtls
{

namespace
{
void writeUint16List(utils::ByteWriter& writer, const std::vector<uint16_t>& values, int prefixBytes)
{
    const auto lengthPos = writer.openLength(prefixBytes);
    for (auto value : values)
    {
        writer.write2(value);
    }
    writer.closeLength(lengthPos, prefixBytes);
}

bool readUint16List(utils::ByteReader& reader, std::vector<uint16_t>& values, int prefixBytes)
{
    std::vector<uint8_t> raw;
    if (!reader.readOpaque(raw, prefixBytes) || (raw.size() % 2) != 0)
    {
        return false;
    }

    values.clear();
    for (size_t i = 0; i < raw.size(); i += 2)
    {
        values.push_back((raw[i] << 8) | raw[i + 1]);
    }
    return true;
}

void writeExtensionHeader(utils::ByteWriter& writer, ExtensionType type, size_t& lengthPos)
{
    writer.write2(type);
    lengthPos = writer.openLength(2);
}
} // namespace

bool RecordHeader::read(utils::ByteReader& reader)
{
    contentType = reader.read1();
    version = reader.read2();
    epoch = reader.read2();
    sequenceNumber = reader.read6();
    length = reader.read2();
    return reader.isValid();
}

void RecordHeader::write(utils::ByteWriter& writer) const
{
    writer.write1(contentType);
    writer.write2(version);
    writer.write2(epoch);
    writer.write6(sequenceNumber & MAX_SEQUENCE_NUMBER);
    writer.write2(length);
}

void HandshakeMessage::writeUnfragmented(std::vector<uint8_t>& out) const
{
    utils::ByteWriter writer(out);
    HandshakeFragmentHeader header;
    header.type = type;
    header.length = body.size();
    header.messageSeq = messageSeq;
    header.fragmentOffset = 0;
    header.fragmentLength = body.size();
    header.write(writer);
    writer.writeBytes(body);
}

bool HandshakeFragmentHeader::read(utils::ByteReader& reader)
{
    type = static_cast<HandshakeType>(reader.read1());
    length = reader.read3();
    messageSeq = reader.read2();
    fragmentOffset = reader.read3();
    fragmentLength = reader.read3();
    return reader.isValid() && fragmentOffset + fragmentLength <= length;
}

void HandshakeFragmentHeader::write(utils::ByteWriter& writer) const
{
    writer.write1(type);
    writer.write3(length);
    writer.write2(messageSeq);
    writer.write3(fragmentOffset);
    writer.write3(fragmentLength);
}

void Extensions::write(utils::ByteWriter& writer) const
{
    const auto blockPos = writer.openLength(2);
    size_t lengthPos = 0;

    if (!serverName.empty())
    {
        writeExtensionHeader(writer, SERVER_NAME, lengthPos);
        const auto listPos = writer.openLength(2);
        writer.write1(0); // host_name
        writer.write2(serverName.size());
        writer.writeBytes(serverName.data(), serverName.size());
        writer.closeLength(listPos, 2);
        writer.closeLength(lengthPos, 2);
    }

    if (!supportedGroups.empty())
    {
        writeExtensionHeader(writer, SUPPORTED_GROUPS, lengthPos);
        writeUint16List(writer, supportedGroups, 2);
        writer.closeLength(lengthPos, 2);
    }

    if (hasPointFormats)
    {
        writeExtensionHeader(writer, EC_POINT_FORMATS, lengthPos);
        writer.writeOpaque(pointFormats, 1);
        writer.closeLength(lengthPos, 2);
    }

    if (!signatureSchemes.empty())
    {
        writeExtensionHeader(writer, SIGNATURE_ALGORITHMS, lengthPos);
        writeUint16List(writer, signatureSchemes, 2);
        writer.closeLength(lengthPos, 2);
    }

    if (!srtpProfiles.empty())
    {
        writeExtensionHeader(writer, USE_SRTP, lengthPos);
        writeUint16List(writer, srtpProfiles, 2);
        writer.writeOpaque(srtpMki, 1);
        writer.closeLength(lengthPos, 2);
    }

    if (extendedMasterSecret)
    {
        writeExtensionHeader(writer, EXTENDED_MASTER_SECRET, lengthPos);
        writer.closeLength(lengthPos, 2);
    }

    if (renegotiationInfo)
    {
        writeExtensionHeader(writer, RENEGOTIATION_INFO, lengthPos);
        writer.write1(0); // empty renegotiated_connection
        writer.closeLength(lengthPos, 2);
    }

    writer.closeLength(blockPos, 2);
}

// Unknown extensions are skipped
bool Extensions::read(utils::ByteReader& reader)
{
    std::vector<uint8_t> block;
    if (!reader.readOpaque(block, 2))
    {
        return false;
    }

    utils::ByteReader blockReader(block.data(), block.size());
    while (!blockReader.empty())
    {
        const uint16_t type = blockReader.read2();
        std::vector<uint8_t> data;
        if (!blockReader.readOpaque(data, 2))
        {
            return false;
        }

        utils::ByteReader extReader(data.data(), data.size());
        switch (type)
        {
        case SERVER_NAME:
            if (!data.empty())
            {
                extReader.read2();
                if (extReader.read1() == 0)
                {
                    std::vector<uint8_t> name;
                    if (!extReader.readOpaque(name, 2))
                    {
                        return false;
                    }
                    serverName.assign(name.begin(), name.end());
                }
            }
            break;
        case SUPPORTED_GROUPS:
            if (!readUint16List(extReader, supportedGroups, 2))
            {
                return false;
            }
            break;
        case EC_POINT_FORMATS:
            hasPointFormats = true;
            if (!extReader.readOpaque(pointFormats, 1))
            {
                return false;
            }
            break;
        case SIGNATURE_ALGORITHMS:
            if (!readUint16List(extReader, signatureSchemes, 2))
            {
                return false;
            }
            break;
        case USE_SRTP:
            if (!readUint16List(extReader, srtpProfiles, 2) || !extReader.readOpaque(srtpMki, 1))
            {
                return false;
            }
            break;
        case EXTENDED_MASTER_SECRET:
            extendedMasterSecret = true;
            break;
        case RENEGOTIATION_INFO:
            renegotiationInfo = true;
            break;
        default:
            break;
        }
    }
    return blockReader.isValid();
}

void ClientHello::serialize(std::vector<uint8_t>& out) const
{
    utils::ByteWriter writer(out);
    writer.write2(version);
    writer.writeBytes(random.data(), random.size());
    writer.writeOpaque(sessionId, 1);
    writer.writeOpaque(cookie, 1);
    writeUint16List(writer, cipherSuites, 2);
    writer.writeOpaque(compressionMethods, 1);
    extensions.write(writer);
}

bool ClientHello::parse(const std::vector<uint8_t>& body)
{
    utils::ByteReader reader(body.data(), body.size());
    version = reader.read2();
    reader.readBytes(random.data(), random.size());
    if (!reader.readOpaque(sessionId, 1) || !reader.readOpaque(cookie, 1) ||
        !readUint16List(reader, cipherSuites, 2) || !reader.readOpaque(compressionMethods, 1))
    {
        return false;
    }
    if (sessionId.size() > 32 || cookie.size() > MAX_COOKIE_SIZE)
    {
        return false;
    }

    if (!reader.empty() && !extensions.read(reader))
    {
        return false;
    }
    return reader.isValid();
}

void HelloVerifyRequest::serialize(std::vector<uint8_t>& out) const
{
    utils::ByteWriter writer(out);
    writer.write2(version);
    writer.writeOpaque(cookie, 1);
}

bool HelloVerifyRequest::parse(const std::vector<uint8_t>& body)
{
    utils::ByteReader reader(body.data(), body.size());
    version = reader.read2();
    return reader.readOpaque(cookie, 1) && reader.empty();
}

void ServerHello::serialize(std::vector<uint8_t>& out) const
{
    utils::ByteWriter writer(out);
    writer.write2(version);
    writer.writeBytes(random.data(), random.size());
    writer.writeOpaque(sessionId, 1);
    writer.write2(cipherSuite);
    writer.write1(compressionMethod);
    extensions.write(writer);
}

bool ServerHello::parse(const std::vector<uint8_t>& body)
{
    utils::ByteReader reader(body.data(), body.size());
    version = reader.read2();
    reader.readBytes(random.data(), random.size());
    if (!reader.readOpaque(sessionId, 1))
    {
        return false;
    }
    cipherSuite = reader.read2();
    compressionMethod = reader.read1();
    if (!reader.empty() && !extensions.read(reader))
    {
        return false;
    }
    return reader.isValid();
}

void CertificateMessage::serialize(std::vector<uint8_t>& out) const
{
    utils::ByteWriter writer(out);
    const auto listPos = writer.openLength(3);
    for (auto& certificate : certificates)
    {
        writer.writeOpaque(certificate, 3);
    }
    writer.closeLength(listPos, 3);
}

bool CertificateMessage::parse(const std::vector<uint8_t>& body)
{
    utils::ByteReader reader(body.data(), body.size());
    const uint32_t listLength = reader.read3();
    if (!reader.isValid() || listLength != reader.remaining())
    {
        return false;
    }

    certificates.clear();
    while (!reader.empty())
    {
        std::vector<uint8_t> certificate;
        if (!reader.readOpaque(certificate, 3) || certificate.empty())
        {
            return false;
        }
        certificates.push_back(std::move(certificate));
    }
    return true;
}

void ServerKeyExchange::writeParams(std::vector<uint8_t>& out) const
{
    utils::ByteWriter writer(out);
    writer.write1(EC_CURVE_TYPE_NAMED);
    writer.write2(namedCurve);
    writer.writeOpaque(publicKey, 1);
}

void ServerKeyExchange::serialize(std::vector<uint8_t>& out, bool psk, bool ecdhe) const
{
    utils::ByteWriter writer(out);
    if (psk)
    {
        writer.writeOpaque(identityHint, 2);
    }
    if (ecdhe)
    {
        writeParams(out);
        if (!psk)
        {
            writer.write2(signatureScheme);
            writer.writeOpaque(signature, 2);
        }
    }
}

bool ServerKeyExchange::parse(const std::vector<uint8_t>& body, bool psk, bool ecdhe)
{
    utils::ByteReader reader(body.data(), body.size());
    if (psk && !reader.readOpaque(identityHint, 2))
    {
        return false;
    }
    if (ecdhe)
    {
        if (reader.read1() != EC_CURVE_TYPE_NAMED)
        {
            return false;
        }
        namedCurve = reader.read2();
        if (!reader.readOpaque(publicKey, 1))
        {
            return false;
        }
        if (!psk)
        {
            signatureScheme = reader.read2();
            if (!reader.readOpaque(signature, 2))
            {
                return false;
            }
        }
    }
    return reader.isValid() && reader.empty();
}

void CertificateRequest::serialize(std::vector<uint8_t>& out) const
{
    utils::ByteWriter writer(out);
    writer.writeOpaque(certificateTypes, 1);
    writeUint16List(writer, signatureSchemes, 2);
    writer.write2(0); // no certificate authorities
}

bool CertificateRequest::parse(const std::vector<uint8_t>& body)
{
    utils::ByteReader reader(body.data(), body.size());
    if (!reader.readOpaque(certificateTypes, 1) || !readUint16List(reader, signatureSchemes, 2))
    {
        return false;
    }
    std::vector<uint8_t> authorities;
    return reader.readOpaque(authorities, 2) && reader.empty();
}

void ClientKeyExchange::serialize(std::vector<uint8_t>& out, bool psk, bool ecdhe) const
{
    utils::ByteWriter writer(out);
    if (psk)
    {
        writer.writeOpaque(identity, 2);
    }
    if (ecdhe)
    {
        writer.writeOpaque(publicKey, 1);
    }
}

bool ClientKeyExchange::parse(const std::vector<uint8_t>& body, bool psk, bool ecdhe)
{
    utils::ByteReader reader(body.data(), body.size());
    if (psk && !reader.readOpaque(identity, 2))
    {
        return false;
    }
    if (ecdhe && !reader.readOpaque(publicKey, 1))
    {
        return false;
    }
    return reader.isValid() && reader.empty();
}

void CertificateVerify::serialize(std::vector<uint8_t>& out) const
{
    utils::ByteWriter writer(out);
    writer.write2(signatureScheme);
    writer.writeOpaque(signature, 2);
}

bool CertificateVerify::parse(const std::vector<uint8_t>& body)
{
    utils::ByteReader reader(body.data(), body.size());
    signatureScheme = reader.read2();
    return reader.readOpaque(signature, 2) && reader.empty();
}

const char* toString(HandshakeType type)
{
    switch (type)
    {
    case HELLO_REQUEST:
        return "HelloRequest";
    case CLIENT_HELLO:
        return "ClientHello";
    case SERVER_HELLO:
        return "ServerHello";
    case HELLO_VERIFY_REQUEST:
        return "HelloVerifyRequest";
    case CERTIFICATE:
        return "Certificate";
    case SERVER_KEY_EXCHANGE:
        return "ServerKeyExchange";
    case CERTIFICATE_REQUEST:
        return "CertificateRequest";
    case SERVER_HELLO_DONE:
        return "ServerHelloDone";
    case CERTIFICATE_VERIFY:
        return "CertificateVerify";
    case CLIENT_KEY_EXCHANGE:
        return "ClientKeyExchange";
    case FINISHED:
        return "Finished";
    }
    return "unknown";
}

const char* toString(AlertDescription description)
{
    switch (description)
    {
    case CLOSE_NOTIFY:
        return "close_notify";
    case UNEXPECTED_MESSAGE:
        return "unexpected_message";
    case BAD_RECORD_MAC:
        return "bad_record_mac";
    case RECORD_OVERFLOW:
        return "record_overflow";
    case HANDSHAKE_FAILURE:
        return "handshake_failure";
    case NO_CERTIFICATE:
        return "no_certificate";
    case BAD_CERTIFICATE:
        return "bad_certificate";
    case UNSUPPORTED_CERTIFICATE:
        return "unsupported_certificate";
    case CERTIFICATE_EXPIRED:
        return "certificate_expired";
    case CERTIFICATE_UNKNOWN:
        return "certificate_unknown";
    case ILLEGAL_PARAMETER:
        return "illegal_parameter";
    case UNKNOWN_CA:
        return "unknown_ca";
    case ACCESS_DENIED:
        return "access_denied";
    case DECODE_ERROR:
        return "decode_error";
    case DECRYPT_ERROR:
        return "decrypt_error";
    case PROTOCOL_VERSION:
        return "protocol_version";
    case INSUFFICIENT_SECURITY:
        return "insufficient_security";
    case INTERNAL_ERROR:
        return "internal_error";
    case USER_CANCELED:
        return "user_canceled";
    case NO_RENEGOTIATION:
        return "no_renegotiation";
    case UNSUPPORTED_EXTENSION:
        return "unsupported_extension";
    case UNKNOWN_PSK_IDENTITY:
        return "unknown_psk_identity";
    case NO_ALERT:
        return "none";
    }
    return "unknown";
}

const char* toString(ContentType type)
{
    switch (type)
    {
    case CHANGE_CIPHER_SPEC:
        return "ChangeCipherSpec";
    case ALERT:
        return "Alert";
    case HANDSHAKE:
        return "Handshake";
    case APPLICATION_DATA:
        return "ApplicationData";
    }
    return "unknown";
}

} // namespace dtls
