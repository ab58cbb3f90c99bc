#include "DataChannel.h"
#include <cstring>

namespace webrtc
{
bool isValidChannelType(uint8_t channelType)
{
    switch (channelType)
    {
    case DATA_CHANNEL_RELIABLE:
    case DATA_CHANNEL_PARTIAL_RELIABLE_REXMIT:
    case DATA_CHANNEL_PARTIAL_RELIABLE_TIMED:
    case DATA_CHANNEL_RELIABLE_UNORDERED:
    case DATA_CHANNEL_PARTIAL_RELIABLE_REXMIT_UNORDERED:
    case DATA_CHANNEL_PARTIAL_RELIABLE_TIMED_UNORDERED:
        return true;
    default:
        return false;
    }
}

const char* toString(ChannelType channelType)
{
    switch (channelType)
    {
    case DATA_CHANNEL_RELIABLE:
        return "Reliable";
    case DATA_CHANNEL_PARTIAL_RELIABLE_REXMIT:
        return "PartialReliableRexmit";
    case DATA_CHANNEL_PARTIAL_RELIABLE_TIMED:
        return "PartialReliableTimed";
    case DATA_CHANNEL_RELIABLE_UNORDERED:
        return "ReliableUnordered";
    case DATA_CHANNEL_PARTIAL_RELIABLE_REXMIT_UNORDERED:
        return "PartialReliableRexmitUnordered";
    case DATA_CHANNEL_PARTIAL_RELIABLE_TIMED_UNORDERED:
        return "PartialReliableTimedUnordered";
    }
    return "unknown";
}

SctpReliability toSctpReliability(const DataChannelConfig& config)
{
    using Reliability = sctp::SctpAssociation::Reliability;

    SctpReliability result{Reliability::Reliable, 0, (config.channelType & 0x80) != 0};
    switch (config.channelType & 0x7F)
    {
    case DATA_CHANNEL_PARTIAL_RELIABLE_REXMIT:
        result.reliability = Reliability::PartialReliableRexmit;
        result.value = config.reliabilityParameter;
        break;
    case DATA_CHANNEL_PARTIAL_RELIABLE_TIMED:
        result.reliability = Reliability::PartialReliableTimed;
        result.value = config.reliabilityParameter;
        break;
    default:
        break;
    }
    return result;
}

DataChannelOpenMessage& DataChannelOpenMessage::create(void* location, const DataChannelConfig& config)
{
    auto* m = reinterpret_cast<DataChannelOpenMessage*>(location);

    m->messageType = DATA_CHANNEL_OPEN;
    m->channelType = config.channelType;
    m->priority = config.priority;
    m->reliability = config.reliabilityParameter;
    m->labelLength = config.label.size();
    m->protocolLength = config.protocol.size();

    char* data = reinterpret_cast<char*>(&m->protocolLength + 1);
    std::memcpy(data, config.label.c_str(), config.label.size());
    std::memcpy(data + config.label.size(), config.protocol.c_str(), config.protocol.size());
    return *m;
}

const DataChannelOpenMessage* DataChannelOpenMessage::parse(const void* data, size_t length)
{
    if (length < HEADER_SIZE)
    {
        return nullptr;
    }

    auto* m = reinterpret_cast<const DataChannelOpenMessage*>(data);
    if (m->messageType != DATA_CHANNEL_OPEN || !isValidChannelType(m->channelType) || m->size() > length)
    {
        return nullptr;
    }
    return m;
}

std::string DataChannelOpenMessage::getLabel() const
{
    const char* data = reinterpret_cast<const char*>(&protocolLength + 1);
    return std::string(data, labelLength);
}

std::string DataChannelOpenMessage::getProtocol() const
{
    const char* data = reinterpret_cast<const char*>(&protocolLength + 1) + labelLength;
    return std::string(data, protocolLength);
}

size_t DataChannelOpenMessage::size() const
{
    return sizeof(DataChannelOpenMessage) + labelLength + protocolLength;
}

void DataChannelOpenMessage::getConfig(DataChannelConfig& config) const
{
    config.channelType = static_cast<ChannelType>(channelType);
    config.priority = priority;
    config.reliabilityParameter = reliability;
    config.label = getLabel();
    config.protocol = getProtocol();
    config.negotiated = false;
}

std::vector<uint8_t> makeOpenMessage(const DataChannelConfig& config)
{
    std::vector<uint8_t> buffer(DataChannelOpenMessage::HEADER_SIZE + config.label.size() + config.protocol.size());
    DataChannelOpenMessage::create(buffer.data(), config);
    return buffer;
}
} // namespace webrtc
