#include "Sctprotocol.h"
#include "crypto/SslHelper.h"
#include <algorithm>
#include <cassert>
#include <cstddef>

namespace sctp
{

namespace
{
crypto::Crc32Polynomial crc32cPolynomial(0x1EDC6F41u);

template <typename T>
T readAt(const uint8_t* position)
{
    T value;
    std::memcpy(&value, position, sizeof(T));
    return value;
}
} // namespace

bool isKnownChunkType(uint8_t chunkType)
{
    static const uint8_t knownTypes[] = {ChunkType::DATA,
        ChunkType::INIT,
        ChunkType::INIT_ACK,
        ChunkType::SACK,
        ChunkType::HEARTBEAT,
        ChunkType::HEARTBEAT_ACK,
        ChunkType::ABORT,
        ChunkType::SHUTDOWN,
        ChunkType::SHUTDOWN_ACK,
        ChunkType::ERROR,
        ChunkType::COOKIE_ECHO,
        ChunkType::COOKIE_ACK,
        ChunkType::SHUTDOWN_COMPLETE,
        ChunkType::RE_CONFIG,
        ChunkType::FORWARDTSN};
    return std::find(std::begin(knownTypes), std::end(knownTypes), chunkType) != std::end(knownTypes);
}

bool isKnownInitParameter(uint16_t parameterType)
{
    if (parameterType >= ChunkParameterType::V4Address && parameterType <= ChunkParameterType::SupportedAddressTypes)
    {
        return parameterType != 10;
    }

    switch (parameterType)
    {
    case ChunkParameterType::Random:
    case ChunkParameterType::AuthChunkList:
    case ChunkParameterType::HMACAlgorithm:
    case ChunkParameterType::Padding:
    case ChunkParameterType::SupportedExtensions:
    case ChunkParameterType::ForwardTsnSupport:
        return true;
    default:
        return false;
    }
}

void ChunkParameter::zeroPad()
{
    std::memset(reinterpret_cast<uint8_t*>(this) + length, 0, size() - length);
}

ParameterList Chunk::params() const
{
    auto* begin = reinterpret_cast<const uint8_t*>(this);
    return ParameterList(begin + BASE_HEADER_SIZE, begin + size());
}

void Chunk::add(const ChunkParameter& parameter)
{
    auto* target = end();
    std::memcpy(target, &parameter, parameter.length);
    commitAppendedParameter();
}

void Chunk::commitAppendedParameter()
{
    auto* parameter = reinterpret_cast<ChunkParameter*>(end());
    parameter->zeroPad();
    header.length = static_cast<uint16_t>(size() + parameter->size());
}

void appendErrorCause(Chunk& chunk, ErrorCause cause, const void* info, size_t infoLength, size_t maxLength)
{
    if (maxLength < ChunkParameter::HEADER_SIZE)
    {
        return;
    }
    infoLength = std::min(infoLength, maxLength - ChunkParameter::HEADER_SIZE);

    auto& parameter = appendParameter<ErrorCauseParameter>(chunk, cause);
    if (infoLength > 0)
    {
        std::memcpy(parameter.data(), info, infoLength);
    }
    parameter.length = static_cast<uint16_t>(ChunkParameter::HEADER_SIZE + infoLength);
    chunk.commitAppendedParameter();
}

void appendErrorCause(Chunk& chunk, ErrorCause cause, const char* reason)
{
    const size_t maxLength = SCTP_MTU - SctpPacketWriter::HEADER_SIZE - chunk.size();
    appendErrorCause(chunk, cause, reason, std::strlen(reason), maxLength);
}

bool SupportedExtensionsParameter::contains(ChunkType chunkType) const
{
    return std::find(data(), data() + getCount(), chunkType) != data() + getCount();
}

void SupportedExtensionsParameter::add(ChunkType chunkType)
{
    data()[getCount()] = chunkType;
    length = static_cast<uint16_t>(length + 1);
}

bool InitChunk::supportsForwardTsn() const
{
    auto* found = params().findIf([](const ChunkParameter& param) {
        if (param.type == ChunkParameterType::ForwardTsnSupport)
        {
            return true;
        }
        return param.type == ChunkParameterType::SupportedExtensions &&
            reinterpret_cast<const SupportedExtensionsParameter&>(param).contains(ChunkType::FORWARDTSN);
    });
    return found != nullptr;
}

bool InitChunk::supportsReconfig() const
{
    auto* extensions = getParameter<SupportedExtensionsParameter>(params(), ChunkParameterType::SupportedExtensions);
    return extensions && extensions->contains(ChunkType::RE_CONFIG);
}

void CookieEchoChunk::setCookie(const void* cookieData, size_t length)
{
    std::memcpy(reinterpret_cast<uint8_t*>(this) + BASE_HEADER_SIZE, cookieData, length);
    header.length = static_cast<uint16_t>(BASE_HEADER_SIZE + length);
}

SctpPacket::SctpPacket(const void* packet, size_t size)
    : _packetSize(size),
      _commonHeader(reinterpret_cast<CommonHeader*>(const_cast<void*>(packet)))
{
}

utils::TlvCollectionConst<Chunk> SctpPacket::chunks() const
{
    auto* begin = reinterpret_cast<const uint8_t*>(_commonHeader);
    return utils::TlvCollectionConst<Chunk>(begin + sizeof(CommonHeader), begin + _packetSize);
}

uint32_t SctpPacket::calculateCheckSum() const
{
    crypto::Crc32 crc(crc32cPolynomial);
    crc.add(_commonHeader, offsetof(CommonHeader, checksum));
    crc.add(uint32_t(0));
    crc.add(_commonHeader + 1, _packetSize - sizeof(CommonHeader));
    return crc.compute();
}

bool SctpPacket::isValid() const
{
    if (_packetSize < sizeof(CommonHeader) + Chunk::BASE_HEADER_SIZE || _packetSize % 4 != 0)
    {
        return false;
    }
    if (_commonHeader->checksum != calculateCheckSum())
    {
        return false;
    }

    const bool zeroTag = (_commonHeader->verificationTag.get() == 0);
    size_t offset = sizeof(CommonHeader);
    size_t chunkCount = 0;
    for (auto& chunk : chunks())
    {
        if (chunk.header.length < Chunk::BASE_HEADER_SIZE || offset + chunk.size() > _packetSize)
        {
            return false;
        }

        // INIT is bundled with nothing and is the only chunk sent with zero tag
        const bool isInit = (chunk.header.type == ChunkType::INIT);
        if (isInit != zeroTag || (isInit && chunkCount > 0))
        {
            return false;
        }

        offset += chunk.size();
        ++chunkCount;
        if (isInit && offset != _packetSize)
        {
            return false;
        }
    }
    return chunkCount > 0 && offset == _packetSize;
}

SctpPacketWriter::SctpPacketWriter(uint32_t tag,
    uint16_t srcPort,
    uint16_t dstPort,
    uint8_t* dataArea,
    size_t areaSize)
    : SctpPacket(dataArea, HEADER_SIZE),
      _areaSize(areaSize)
{
    writeHeader(tag, srcPort, dstPort);
}

SctpPacketWriter::SctpPacketWriter(uint32_t tag, uint16_t srcPort, uint16_t dstPort)
    : SctpPacket(_ownArea, HEADER_SIZE),
      _areaSize(sizeof(_ownArea))
{
    writeHeader(tag, srcPort, dstPort);
}

void SctpPacketWriter::writeHeader(uint32_t tag, uint16_t srcPort, uint16_t dstPort)
{
    _commonHeader->sourcePort = srcPort;
    _commonHeader->destinationPort = dstPort;
    _commonHeader->verificationTag = tag;
    _commonHeader->checksum = 0;
}

bool SctpPacketWriter::add(const Chunk& chunk)
{
    if (chunk.size() > capacity())
    {
        return false;
    }

    auto* target = writePosition();
    std::memcpy(target, &chunk, chunk.header.length);
    std::memset(target + chunk.header.length, 0, chunk.size() - chunk.header.length);
    _packetSize += chunk.size();
    return true;
}

void SctpPacketWriter::commitAppendedChunk()
{
    auto* target = writePosition();
    auto& chunk = *reinterpret_cast<Chunk*>(target);
    std::memset(target + chunk.header.length, 0, chunk.size() - chunk.header.length);
    _packetSize += chunk.size();
    assert(_packetSize <= _areaSize);
}

ErrorCauseList AbortChunk::causes() const
{
    auto* begin = reinterpret_cast<const uint8_t*>(this);
    return ErrorCauseList(begin + BASE_HEADER_SIZE, begin + size());
}

ErrorCauseList ErrorChunk::causes() const
{
    auto* begin = reinterpret_cast<const uint8_t*>(this);
    return ErrorCauseList(begin + BASE_HEADER_SIZE, begin + size());
}

PayloadDataChunk::PayloadDataChunk(uint16_t streamIdentifier,
    uint16_t sequenceNumber,
    uint32_t protocolId,
    uint32_t tsn)
    : Chunk(ChunkType::DATA, HEADER_SIZE),
      transmissionSequenceNumber(tsn),
      streamId(streamIdentifier),
      streamSequenceNumber(sequenceNumber),
      payloadProtocol(protocolId)
{
}

void PayloadDataChunk::clear()
{
    new (this) PayloadDataChunk();
}

void PayloadDataChunk::writeData(const void* payload, size_t length, bool fragmentBegin, bool fragmentEnd)
{
    std::memcpy(reinterpret_cast<uint8_t*>(this) + HEADER_SIZE, payload, length);
    header.length = static_cast<uint16_t>(HEADER_SIZE + length);
    if (fragmentBegin)
    {
        setFragmentBegin();
    }
    if (fragmentEnd)
    {
        setFragmentEnd();
    }
}

ForwardTsnChunk::StreamEntry ForwardTsnChunk::getStream(size_t index) const
{
    return readAt<StreamEntry>(reinterpret_cast<const uint8_t*>(this) + HEADER_SIZE + index * sizeof(StreamEntry));
}

void ForwardTsnChunk::addStream(uint16_t id, uint16_t ssn)
{
    StreamEntry entry;
    entry.streamId = id;
    entry.streamSequenceNumber = ssn;
    std::memcpy(reinterpret_cast<uint8_t*>(this) + header.length, &entry, sizeof(entry));
    header.length = static_cast<uint16_t>(header.length + sizeof(entry));
}

uint16_t OutgoingResetRequestParameter::getStream(size_t index) const
{
    return readAt<nwuint16_t>(reinterpret_cast<const uint8_t*>(this) + HEADER_SIZE + index * sizeof(uint16_t)).get();
}

void OutgoingResetRequestParameter::addStream(uint16_t streamId)
{
    const nwuint16_t entry(streamId);
    std::memcpy(reinterpret_cast<uint8_t*>(this) + length, &entry, sizeof(entry));
    length = static_cast<uint16_t>(length + sizeof(entry));
}

AckRange SelectiveAckChunk::getAck(int index) const
{
    const auto block = readAt<RawGapAckBlock>(blocks() + index * sizeof(RawGapAckBlock));
    const uint32_t base = cumulativeTsnAck.get();
    return AckRange{base + block.start.get(), base + block.end.get()};
}

uint32_t SelectiveAckChunk::getDuplicate(int index) const
{
    const size_t offset = gapAckBlockCount.get() * sizeof(RawGapAckBlock) + index * sizeof(uint32_t);
    return readAt<nwuint32_t>(blocks() + offset).get();
}

bool SelectiveAckChunk::isConsistent() const
{
    const size_t required =
        HEADER_SIZE + gapAckBlockCount.get() * sizeof(RawGapAckBlock) + gapDuplicateCount.get() * sizeof(uint32_t);
    return header.length.get() >= required;
}

SackBuilder::SackBuilder(uint8_t* data, size_t areaSize) : ack(*new (data) SelectiveAckChunk()), _areaSize(areaSize) {}

bool SackBuilder::addAck(uint32_t startTsn, uint32_t endTsnExclusive)
{
    // gap blocks precede the duplicates in the chunk
    if (ack.gapDuplicateCount.get() > 0 || !fits(sizeof(SelectiveAckChunk::RawGapAckBlock)))
    {
        return false;
    }

    SelectiveAckChunk::RawGapAckBlock block;
    block.start = static_cast<uint16_t>(startTsn - ack.cumulativeTsnAck.get());
    block.end = static_cast<uint16_t>(endTsnExclusive - 1 - ack.cumulativeTsnAck.get());
    std::memcpy(ack.blocks() + ack.gapAckBlockCount.get() * sizeof(block), &block, sizeof(block));
    ack.gapAckBlockCount += 1;
    ack.header.length += sizeof(block);
    return true;
}

bool SackBuilder::addDuplicate(uint32_t transmissionSequenceNumber)
{
    if (!fits(sizeof(uint32_t)))
    {
        return false;
    }

    const nwuint32_t tsn(transmissionSequenceNumber);
    std::memcpy(reinterpret_cast<uint8_t*>(&ack) + ack.header.length, &tsn, sizeof(tsn));
    ack.gapDuplicateCount += 1;
    ack.header.length += sizeof(tsn);
    return true;
}

const char* toString(ErrorCause cause)
{
    static const char* const names[] = {"InvalidStreamIdentifier",
        "MissingMandatoryParameter",
        "StaleCookieError",
        "OutOfResource",
        "UnresolvableAddress",
        "UnrecognizedChunkType",
        "InvalidMandatoryParameter",
        "UnrecognizedParameters",
        "NoUserData",
        "CookieReceivedWhileShuttingDown",
        "RestartOfAnAssociationWithNewAddresses",
        "UserInitiatedAbort",
        "ProtocolError"};
    if (cause < ErrorCause::InvalidStreamIdentifier || cause > ErrorCause::ProtocolError)
    {
        return "UnknownCause";
    }
    return names[cause - 1];
}

const char* toString(ReconfigResult result)
{
    static const char* const names[] = {"SuccessNothingToDo",
        "SuccessPerformed",
        "Denied",
        "ErrorWrongSsn",
        "ErrorRequestAlreadyInProgress",
        "ErrorBadSequenceNumber",
        "InProgress"};
    if (result > ReconfigResult::InProgress)
    {
        return "UnknownResult";
    }
    return names[result];
}

const char* toString(ChunkType type)
{
    static const char* const coreNames[] = {"DATA",
        "INIT",
        "INIT_ACK",
        "SACK",
        "HEARTBEAT",
        "HEARTBEAT_ACK",
        "ABORT",
        "SHUTDOWN",
        "SHUTDOWN_ACK",
        "ERROR",
        "COOKIE_ECHO",
        "COOKIE_ACK",
        "ECNE",
        "CWR",
        "SHUTDOWN_COMPLETE",
        "AUTH"};
    if (type <= ChunkType::AUTH)
    {
        return coreNames[type];
    }

    switch (type)
    {
    case ChunkType::ASCONF_ACK:
        return "ASCONF_ACK";
    case ChunkType::RE_CONFIG:
        return "RE_CONFIG";
    case ChunkType::PADDING:
        return "PADDING";
    case ChunkType::FORWARDTSN:
        return "FORWARDTSN";
    case ChunkType::ASCONF:
        return "ASCONF";
    default:
        return "unknown";
    }
}
} // namespace sctp
