#pragma once
#include "transport/sctp/SctpAssociation.h"
#include "utils/ByteOrder.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace webrtc
{
enum DataChannelPpid : uint32_t
{
    WEBRTC_ESTABLISH = 50,
    WEBRTC_STRING = 51,
    WEBRTC_BINARY_PARTIAL = 52,
    WEBRTC_BINARY = 53,
    WEBRTC_STRING_PARTIAL = 54,
    WEBRTC_STRING_EMPTY = 56,
    WEBRTC_BINARY_EMPTY = 57
};

enum DataChannelMessageType : uint8_t
{
    DATA_CHANNEL_ACK = 2,
    DATA_CHANNEL_OPEN = 3
};

enum ChannelType : uint8_t
{
    DATA_CHANNEL_RELIABLE = 0,
    DATA_CHANNEL_PARTIAL_RELIABLE_REXMIT = 1, // # rtx
    DATA_CHANNEL_PARTIAL_RELIABLE_TIMED = 2, // lifetime ms
    DATA_CHANNEL_RELIABLE_UNORDERED = 0x80,
    DATA_CHANNEL_PARTIAL_RELIABLE_REXMIT_UNORDERED = 0x81, // # RTX
    DATA_CHANNEL_PARTIAL_RELIABLE_TIMED_UNORDERED = 0x82 // lifetime ms
};

bool isValidChannelType(uint8_t channelType);
const char* toString(ChannelType channelType);

struct DataChannelConfig
{
    ChannelType channelType = DATA_CHANNEL_RELIABLE;
    bool negotiated = false; // pre-negotiated channels skip DCEP
    uint16_t priority = 0;
    uint32_t reliabilityParameter = 0;
    std::string label;
    std::string protocol;
};

struct SctpReliability
{
    sctp::SctpAssociation::Reliability reliability;
    uint32_t value;
    bool unordered;
};

SctpReliability toSctpReliability(const DataChannelConfig& config);

inline bool isStringPpid(uint32_t ppid)
{
    return ppid == WEBRTC_STRING || ppid == WEBRTC_STRING_PARTIAL || ppid == WEBRTC_STRING_EMPTY;
}

inline bool isEmptyPpid(uint32_t ppid)
{
    return ppid == WEBRTC_STRING_EMPTY || ppid == WEBRTC_BINARY_EMPTY;
}

// Empty strings go out as 56. Some stacks send them as 54 with a single zero byte.
inline bool isEmptyMessage(uint32_t ppid, const void* data, size_t length)
{
    if (isEmptyPpid(ppid))
    {
        return true;
    }
    return ppid == WEBRTC_STRING_PARTIAL && length == 1 && *reinterpret_cast<const uint8_t*>(data) == 0;
}

// payloadProtocol used for this is 50
class DataChannelOpenMessage
{
public:
    DataChannelOpenMessage() = delete;
    DataChannelOpenMessage(const DataChannelOpenMessage&) = delete;
    DataChannelOpenMessage& operator=(const DataChannelOpenMessage&) = delete;

    static constexpr size_t HEADER_SIZE = 12;

    // location must hold HEADER_SIZE + label + protocol bytes
    static DataChannelOpenMessage& create(void* location, const DataChannelConfig& config);
    static const DataChannelOpenMessage* parse(const void* data, size_t length);

    std::string getLabel() const;
    std::string getProtocol() const;
    size_t size() const;
    void getConfig(DataChannelConfig& config) const;

    uint8_t messageType;
    uint8_t channelType;
    nwuint16_t priority;
    nwuint32_t reliability;
    nwuint16_t labelLength;
    nwuint16_t protocolLength;
};
static_assert(sizeof(DataChannelOpenMessage) == DataChannelOpenMessage::HEADER_SIZE,
    "DataChannelOpenMessage must be packed");

std::vector<uint8_t> makeOpenMessage(const DataChannelConfig& config);

// ACK is sent as one byte

} // namespace webrtc
