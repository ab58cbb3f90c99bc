#pragma once

#include "utils/ByteOrder.h"
#include "utils/TlvIterator.h"
#include <cstring>
#include <new>
#include <string>

// Wire layout of SCTP packets (rfc4960) with the extensions used by data channels:
// partial reliability (rfc3758), stream reconfiguration (rfc6525) and supported extensions (rfc5061).
// The structs below are overlays on packet memory. Multi byte fields are network ordered.
namespace sctp
{

const size_t SCTP_MTU = 1200;
const size_t SCTP_MAX_PACKET_SIZE = 1500;

inline size_t padTo4(size_t length)
{
    return (length + 3) & ~size_t(3);
}

enum ChunkType : uint8_t
{
    DATA = 0,
    INIT = 1,
    INIT_ACK = 2,
    SACK = 3,
    HEARTBEAT = 4,
    HEARTBEAT_ACK = 5,
    ABORT = 6,
    SHUTDOWN = 7,
    SHUTDOWN_ACK = 8,
    ERROR = 9,
    COOKIE_ECHO = 10,
    COOKIE_ACK = 11,
    ECNE = 12,
    SHUTDOWN_COMPLETE = 14,
    AUTH = 15,
    ASCONF_ACK = 128,
    RE_CONFIG = 130,
    PADDING = 132,
    FORWARDTSN = 192,
    ASCONF = 193
};

enum ChunkParameterType : uint16_t
{
    HeartbeatInfo = 1,
    V4Address = 5,
    V6Address = 6,
    StateCookie = 7,
    UnrecognizedParameter = 8,
    CookiePreservative = 9,
    HostName = 11,
    SupportedAddressTypes = 12,
    SsnResetOutbound = 13,
    SsnResetInbound = 14,
    SsnResetAll = 15,
    ReconfigResponse = 16,
    AddOutboundStreams = 17,
    AddInboundStreams = 18,
    Random = 0x8002,
    AuthChunkList = 0x8003,
    HMACAlgorithm = 0x8004,
    Padding = 0x8005,
    SupportedExtensions = 0x8008,
    ForwardTsnSupport = 0xC000
};

enum ErrorCause : uint16_t
{
    InvalidStreamIdentifier = 1,
    MissingMandatoryParameter = 2,
    StaleCookieError = 3,
    OutOfResource = 4,
    UnresolvableAddress = 5,
    UnrecognizedChunkType = 6,
    InvalidMandatoryParameter = 7,
    UnrecognizedParameters = 8,
    NoUserData = 9,
    CookieReceivedWhileShuttingDown = 10,
    RestartOfAnAssociationWithNewAddresses = 11,
    UserInitiatedAbort = 12,
    ProtocolError = 13
};

// result codes of a re-config response, rfc6525 4.4
enum ReconfigResult : uint32_t
{
    SuccessNothingToDo = 0,
    SuccessPerformed = 1,
    Denied = 2,
    ErrorWrongSsn = 3,
    ErrorRequestAlreadyInProgress = 4,
    ErrorBadSequenceNumber = 5,
    InProgress = 6
};

// Encoded in the two high bits of an unknown chunk or parameter type. rfc4960 3.2, 3.2.1
enum class UnrecognizedAction
{
    Stop,
    StopAndReport,
    Skip,
    SkipAndReport
};

inline UnrecognizedAction getUnrecognizedAction(uint8_t chunkType)
{
    return static_cast<UnrecognizedAction>(chunkType >> 6);
}

inline UnrecognizedAction getUnrecognizedParameterAction(uint16_t parameterType)
{
    return static_cast<UnrecognizedAction>(parameterType >> 14);
}

inline bool shouldReport(UnrecognizedAction action)
{
    return action == UnrecognizedAction::StopAndReport || action == UnrecognizedAction::SkipAndReport;
}

bool isKnownChunkType(uint8_t chunkType);
bool isKnownInitParameter(uint16_t parameterType);

struct CommonHeader
{
    nwuint16_t sourcePort;
    nwuint16_t destinationPort;
    nwuint32_t verificationTag;
    uint32_t checksum; // crc32c, little endian on the wire
};

class ChunkParameter
{
public:
    static constexpr size_t HEADER_SIZE = 2 * sizeof(uint16_t);
    static constexpr size_t headerSize() { return HEADER_SIZE; }

    explicit ChunkParameter(uint16_t parameterType) : type(parameterType), length(HEADER_SIZE) {}
    ChunkParameter(const ChunkParameter&) = delete;
    ChunkParameter& operator=(const ChunkParameter&) = delete;

    size_t size() const { return padTo4(length); }
    size_t dataSize() const { return length < HEADER_SIZE ? 0 : length - HEADER_SIZE; }
    const uint8_t* data() const { return reinterpret_cast<const uint8_t*>(this) + HEADER_SIZE; }
    uint8_t* data() { return reinterpret_cast<uint8_t*>(this) + HEADER_SIZE; }

    // zeroes the bytes between length and the padded size
    void zeroPad();

    const nwuint16_t type;
    nwuint16_t length;
};

using ParameterList = utils::TlvCollectionConst<ChunkParameter>;

class Chunk
{
protected:
    explicit Chunk(ChunkType chunkType, uint16_t chunkLength = BASE_HEADER_SIZE)
    {
        header.type = chunkType;
        header.length = chunkLength;
    }

public:
    static constexpr size_t BASE_HEADER_SIZE = 2 * sizeof(uint16_t);
    static constexpr size_t headerSize() { return BASE_HEADER_SIZE; }

    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;

    size_t size() const { return padTo4(header.length); }
    ParameterList params() const;

    // Copies a complete parameter behind the chunk. Caller makes sure it fits.
    void add(const ChunkParameter& parameter);
    // Accounts for a parameter constructed in place at end()
    void commitAppendedParameter();
    uint8_t* end() { return reinterpret_cast<uint8_t*>(this) + size(); }

    struct Header
    {
        uint8_t type = 0;
        uint8_t flags = 0;
        nwuint16_t length;
    };
    Header header;
};

template <typename T = ChunkParameter>
const T* getParameter(const ParameterList& params, ChunkParameterType type)
{
    auto* found = params.findIf([type](const ChunkParameter& p) { return p.type.get() == type; });
    return reinterpret_cast<const T*>(found);
}

// Constructs a parameter at the end of the chunk. Finish with chunk.commitAppendedParameter().
template <typename T, typename... Args>
T& appendParameter(Chunk& chunk, Args&&... args)
{
    return *new (chunk.end()) T(std::forward<Args>(args)...);
}

// chunk with nothing but the common chunk header, or with parameters only
class GenericChunk : public Chunk
{
public:
    explicit GenericChunk(ChunkType chunkType, uint8_t chunkFlags = 0) : Chunk(chunkType)
    {
        header.flags = chunkFlags;
    }
};

// error cause overlay, rfc4960 3.3.10. Same layout as a parameter.
class ErrorCauseParameter : public ChunkParameter
{
public:
    explicit ErrorCauseParameter(ErrorCause cause) : ChunkParameter(cause) {}

    ErrorCause getCause() const { return static_cast<ErrorCause>(type.get()); }
    std::string getReason() const { return std::string(reinterpret_cast<const char*>(data()), dataSize()); }
};

using ErrorCauseList = utils::TlvCollectionConst<ErrorCauseParameter>;

// Appends an error cause carrying opaque info to an ABORT or ERROR chunk.
// Info that does not fit in maxLength bytes of chunk growth is truncated.
void appendErrorCause(Chunk& chunk, ErrorCause cause, const void* info, size_t infoLength, size_t maxLength);
void appendErrorCause(Chunk& chunk, ErrorCause cause, const char* reason);

class SctpPacket
{
public:
    SctpPacket(const void* packet, size_t size);

    utils::TlvCollectionConst<Chunk> chunks() const;
    const CommonHeader& getHeader() const { return *_commonHeader; }

    template <typename T = Chunk>
    const T* getChunk(ChunkType type) const
    {
        auto* found = chunks().findIf([type](const Chunk& c) { return c.header.type == type; });
        return reinterpret_cast<const T*>(found);
    }
    bool hasChunk(ChunkType type) const { return getChunk(type) != nullptr; }

    const void* get() const { return _commonHeader; }
    size_t size() const { return _packetSize; }

    uint32_t calculateCheckSum() const;
    // checksum, chunk lengths and verification tag rules of rfc4960 8.5
    bool isValid() const;

protected:
    size_t _packetSize;
    CommonHeader* _commonHeader;
};

// Builds a packet in its own buffer or in a caller supplied area.
class SctpPacketWriter : public SctpPacket
{
public:
    static constexpr size_t HEADER_SIZE = sizeof(CommonHeader);

    SctpPacketWriter(uint32_t tag, uint16_t srcPort, uint16_t dstPort, uint8_t* dataArea, size_t areaSize);
    SctpPacketWriter(uint32_t tag, uint16_t srcPort, uint16_t dstPort);
    SctpPacketWriter(const SctpPacketWriter&) = delete;
    SctpPacketWriter& operator=(const SctpPacketWriter&) = delete;

    CommonHeader& getHeader() { return *_commonHeader; }

    // false if the chunk does not fit
    bool add(const Chunk& chunk);

    // Chunk is constructed at the end of the packet and must be committed before the next one.
    template <typename T, typename... Args>
    T& appendChunk(Args&&... args)
    {
        return *new (writePosition()) T(std::forward<Args>(args)...);
    }

    template <typename T, typename... Args>
    void addChunk(Args&&... args)
    {
        appendChunk<T>(std::forward<Args>(args)...);
        commitAppendedChunk();
    }

    void commitAppendedChunk();
    void commitCheckSum() { _commonHeader->checksum = calculateCheckSum(); }

    size_t capacity() const { return _areaSize - _packetSize; }
    bool empty() const { return _packetSize == HEADER_SIZE; }
    void clear() { _packetSize = HEADER_SIZE; }

private:
    void writeHeader(uint32_t tag, uint16_t srcPort, uint16_t dstPort);
    uint8_t* writePosition() { return reinterpret_cast<uint8_t*>(_commonHeader) + _packetSize; }

    const size_t _areaSize;
    alignas(8) uint8_t _ownArea[SCTP_MAX_PACKET_SIZE];
};

// State cookie parameter. T is copied bytewise since the parameter is only 32 bit aligned.
template <typename T>
class CookieParameter : public ChunkParameter
{
public:
    explicit CookieParameter(const T& cookie) : ChunkParameter(ChunkParameterType::StateCookie)
    {
        length = HEADER_SIZE + sizeof(T);
        std::memcpy(_cookie, &cookie, sizeof(T));
    }

private:
    uint8_t _cookie[sizeof(T)];
};

// rfc5061 4.2.7, list of chunk types the sender understands
class SupportedExtensionsParameter : public ChunkParameter
{
public:
    SupportedExtensionsParameter() : ChunkParameter(ChunkParameterType::SupportedExtensions) {}

    size_t getCount() const { return dataSize(); }
    bool contains(ChunkType chunkType) const;
    void add(ChunkType chunkType);
};

class InitChunk : public Chunk
{
public:
    static constexpr size_t HEADER_SIZE = Chunk::BASE_HEADER_SIZE + 4 * sizeof(uint32_t);

    explicit InitChunk(ChunkType chunkType = ChunkType::INIT)
        : Chunk(chunkType, HEADER_SIZE),
          initTag(0),
          advertisedReceiverWindow(0),
          outboundStreams(0),
          inboundStreams(0),
          initTSN(0)
    {
    }

    ParameterList params() const
    {
        return ParameterList(reinterpret_cast<const uint8_t*>(this) + HEADER_SIZE,
            reinterpret_cast<const uint8_t*>(this) + size());
    }

    bool supportsForwardTsn() const;
    bool supportsReconfig() const;

    nwuint32_t initTag;
    nwuint32_t advertisedReceiverWindow;
    nwuint16_t outboundStreams;
    nwuint16_t inboundStreams;
    nwuint32_t initTSN;
};

// carries the state cookie among its parameters
class InitAckChunk : public InitChunk
{
public:
    InitAckChunk() : InitChunk(ChunkType::INIT_ACK) {}
};

class CookieEchoChunk : public Chunk
{
public:
    CookieEchoChunk() : Chunk(ChunkType::COOKIE_ECHO) {}

    void setCookie(const void* cookie, size_t length);
    const uint8_t* cookie() const { return reinterpret_cast<const uint8_t*>(this) + BASE_HEADER_SIZE; }
    size_t cookieSize() const { return header.length - BASE_HEADER_SIZE; }

    template <typename T>
    T getCookie() const
    {
        T result;
        std::memcpy(&result, cookie(), sizeof(T));
        return result;
    }
};

struct AckRange
{
    uint32_t start;
    uint32_t end; // inclusive
};

// rfc4960 3.3.4. Gap blocks are stored as offsets from the cumulative ack.
class SelectiveAckChunk : public Chunk
{
public:
    static constexpr size_t HEADER_SIZE = Chunk::BASE_HEADER_SIZE + 3 * sizeof(uint32_t);

    struct RawGapAckBlock
    {
        nwuint16_t start;
        nwuint16_t end;
    };

    SelectiveAckChunk()
        : Chunk(ChunkType::SACK, HEADER_SIZE),
          cumulativeTsnAck(0),
          advertisedReceiverWindow(0),
          gapAckBlockCount(0),
          gapDuplicateCount(0)
    {
    }

    AckRange getAck(int index) const;
    uint32_t getDuplicate(int index) const;
    // the counts fit inside the chunk length
    bool isConsistent() const;

    nwuint32_t cumulativeTsnAck;
    nwuint32_t advertisedReceiverWindow;
    nwuint16_t gapAckBlockCount;
    nwuint16_t gapDuplicateCount;

private:
    friend class SackBuilder;
    const uint8_t* blocks() const { return reinterpret_cast<const uint8_t*>(this) + HEADER_SIZE; }
    uint8_t* blocks() { return reinterpret_cast<uint8_t*>(this) + HEADER_SIZE; }
};

// Writes a SACK into an area. Set cumulativeTsnAck first, then gap blocks, then duplicates.
class SackBuilder
{
public:
    SackBuilder(uint8_t* data, size_t areaSize);

    bool addAck(uint32_t startTsn, uint32_t endTsnExclusive);
    bool addDuplicate(uint32_t transmissionSequenceNumber);
    void clear() { ack.header.length = SelectiveAckChunk::HEADER_SIZE; }
    size_t size() const { return ack.size(); }

    SelectiveAckChunk& ack;

private:
    bool fits(size_t growth) const { return ack.header.length + growth <= _areaSize; }

    const size_t _areaSize;
};

class AbortChunk : public Chunk
{
public:
    // T flag set means the tag is the one of the receiver of the aborted packet
    explicit AbortChunk(bool tagIsReflected) : Chunk(ChunkType::ABORT) { header.flags = tagIsReflected ? 1 : 0; }

    ErrorCauseList causes() const;
};

class ErrorChunk : public Chunk
{
public:
    ErrorChunk() : Chunk(ChunkType::ERROR) {}

    ErrorCauseList causes() const;
};

class ShutdownChunk : public Chunk
{
public:
    static constexpr size_t HEADER_SIZE = Chunk::BASE_HEADER_SIZE + sizeof(uint32_t);

    explicit ShutdownChunk(uint32_t cumulativeAck) : Chunk(ChunkType::SHUTDOWN, HEADER_SIZE), cumulativeTsnAck(cumulativeAck)
    {
    }

    nwuint32_t cumulativeTsnAck;
};

class PayloadDataChunk : public Chunk
{
public:
    static constexpr size_t HEADER_SIZE = Chunk::BASE_HEADER_SIZE + 3 * sizeof(uint32_t);

    enum Flag : uint8_t
    {
        END_FRAGMENT = 0x01,
        BEGIN_FRAGMENT = 0x02,
        UNORDERED = 0x04,
        IMMEDIATE_ACK = 0x08
    };

    PayloadDataChunk() : PayloadDataChunk(0, 0, 0, 0) {}
    PayloadDataChunk(uint16_t streamId, uint16_t sequenceNumber, uint32_t payloadProtocol, uint32_t tsn);

    void setUnordered() { header.flags |= UNORDERED; }
    void setFragmentBegin() { header.flags |= BEGIN_FRAGMENT; }
    void setFragmentEnd() { header.flags |= END_FRAGMENT; }
    void setImmediateAck() { header.flags |= IMMEDIATE_ACK; }

    bool isUnordered() const { return header.flags & UNORDERED; }
    bool isBegin() const { return header.flags & BEGIN_FRAGMENT; }
    bool isEnd() const { return header.flags & END_FRAGMENT; }
    bool isImmediateAck() const { return header.flags & IMMEDIATE_ACK; }

    void clear();
    void writeData(const void* data, size_t length, bool fragmentBegin, bool fragmentEnd);
    const uint8_t* data() const { return reinterpret_cast<const uint8_t*>(this) + HEADER_SIZE; }
    size_t payloadSize() const { return header.length - HEADER_SIZE; }

    nwuint32_t transmissionSequenceNumber;
    nwuint16_t streamId;
    nwuint16_t streamSequenceNumber;
    nwuint32_t payloadProtocol;
};

const size_t PAYLOAD_DATA_OVERHEAD = SctpPacketWriter::HEADER_SIZE + PayloadDataChunk::HEADER_SIZE;

// rfc3758 3.2
class ForwardTsnChunk : public Chunk
{
public:
    static constexpr size_t HEADER_SIZE = Chunk::BASE_HEADER_SIZE + sizeof(uint32_t);

    struct StreamEntry
    {
        nwuint16_t streamId;
        nwuint16_t streamSequenceNumber;
    };

    explicit ForwardTsnChunk(uint32_t cumulativeTsn) : Chunk(ChunkType::FORWARDTSN, HEADER_SIZE), newCumulativeTsn(cumulativeTsn)
    {
    }

    size_t getStreamCount() const { return (header.length - HEADER_SIZE) / sizeof(StreamEntry); }
    StreamEntry getStream(size_t index) const;
    void addStream(uint16_t streamId, uint16_t streamSequenceNumber);

    nwuint32_t newCumulativeTsn;
};

// rfc6525 3.1, carries one or two request or response parameters
class ReconfigChunk : public Chunk
{
public:
    ReconfigChunk() : Chunk(ChunkType::RE_CONFIG) {}
};

// rfc6525 4.1
class OutgoingResetRequestParameter : public ChunkParameter
{
public:
    static constexpr size_t HEADER_SIZE = ChunkParameter::HEADER_SIZE + 3 * sizeof(uint32_t);

    OutgoingResetRequestParameter(uint32_t requestSn, uint32_t responseSn, uint32_t lastTsn)
        : ChunkParameter(ChunkParameterType::SsnResetOutbound),
          requestSequenceNumber(requestSn),
          responseSequenceNumber(responseSn),
          senderLastTsn(lastTsn)
    {
        length = HEADER_SIZE;
    }

    size_t getStreamCount() const { return (length - HEADER_SIZE) / sizeof(uint16_t); }
    uint16_t getStream(size_t index) const;
    void addStream(uint16_t streamId);

    nwuint32_t requestSequenceNumber;
    nwuint32_t responseSequenceNumber;
    nwuint32_t senderLastTsn;
};

// rfc6525 4.4
class ReconfigResponseParameter : public ChunkParameter
{
public:
    static constexpr size_t HEADER_SIZE = ChunkParameter::HEADER_SIZE + 2 * sizeof(uint32_t);

    ReconfigResponseParameter(uint32_t responseSn, ReconfigResult reconfigResult)
        : ChunkParameter(ChunkParameterType::ReconfigResponse),
          responseSequenceNumber(responseSn),
          result(reconfigResult)
    {
        length = HEADER_SIZE;
    }

    ReconfigResult getResult() const { return static_cast<ReconfigResult>(result.get()); }

    nwuint32_t responseSequenceNumber;
    nwuint32_t result;
};

// Opaque to the peer, echoed back in HEARTBEAT ACK
class HeartbeatInfoParameter : public ChunkParameter
{
public:
    static constexpr size_t HEADER_SIZE = ChunkParameter::HEADER_SIZE + 2 * sizeof(uint16_t) + 2 * sizeof(uint64_t);

    HeartbeatInfoParameter()
        : ChunkParameter(ChunkParameterType::HeartbeatInfo),
          sequenceNumber(0),
          mtu(0),
          timestamp(0),
          nonce(0)
    {
        length = HEADER_SIZE;
    }

    nwuint16_t sequenceNumber;
    nwuint16_t mtu;
    nwuint64_t timestamp;
    nwuint64_t nonce;
};

// serial number arithmetic rfc1982. Positive if b is after a.
inline int32_t diff(uint32_t a, uint32_t b)
{
    return static_cast<int32_t>(b - a);
}

inline int16_t diff16(uint16_t a, uint16_t b)
{
    return static_cast<int16_t>(static_cast<uint16_t>(b - a));
}

const char* toString(ErrorCause cause);
const char* toString(ReconfigResult result);
const char* toString(ChunkType type);
} // namespace sctp
