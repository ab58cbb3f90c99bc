#include "rtp/RtpHeader.h"
#include "logger/Logger.h"
#include <array>
#include <cstdio>
#include <vector>

namespace
{
void logPacketError(const void* p, const size_t len, const size_t baseHeaderLength)
{
    logger::debug("RTP packet header invalid. Length %zu, baseHeaderLength %zu", "RtpHeader", len, baseHeaderLength);
    const auto pBytes = reinterpret_cast<const uint8_t*>(p);
    std::array<char, 3 * rtp::MIN_RTP_HEADER_SIZE + 1> hexDump = {};
    size_t offset = 0;
    for (size_t i = 0; i < rtp::MIN_RTP_HEADER_SIZE && i < len; ++i)
    {
        offset += snprintf(hexDump.data() + offset, hexDump.size() - offset, "%02x ", pBytes[i]);
    }

    logger::debug("%s", "RtpHeader", hexDump.data());
}

const uint8_t* findOneByteExtensionsEnd(const uint8_t* data, const uint8_t* dataEnd)
{
    for (const uint8_t* cursor = data; cursor < dataEnd;)
    {
        const auto& item = *reinterpret_cast<const rtp::GeneralExtension1Byteheader*>(cursor);
        if (item.getId() == rtp::GeneralExtension1Byteheader::EOL || cursor + item.size() > dataEnd)
        {
            return cursor;
        }
        cursor += item.size();
    }
    return dataEnd;
}

struct ExtensionElement
{
    uint8_t id;
    std::vector<uint8_t> data;
};

template <typename ElementType>
void collectElements(utils::TlvCollectionConst<ElementType> collection,
    uint8_t skipId,
    std::vector<ExtensionElement>& elements)
{
    for (auto& item : collection)
    {
        if (item.getId() == 0 || item.getId() == skipId)
        {
            continue;
        }
        elements.push_back(ExtensionElement{item.getId(),
            std::vector<uint8_t>(item.data, item.data + item.getDataLength())});
    }
}

bool fitsOneByteForm(const ExtensionElement& element)
{
    return element.id > 0 && element.id < rtp::GeneralExtension1Byteheader::EOL && !element.data.empty() &&
        element.data.size() <= 16;
}

// element bytes padded to 32 bits, without the 4 byte block header
size_t serializeElements(const std::vector<ExtensionElement>& elements, bool oneByteForm, uint8_t* target)
{
    size_t offset = 0;
    for (const auto& element : elements)
    {
        if (oneByteForm)
        {
            target[offset++] = (element.id << 4) | static_cast<uint8_t>(element.data.size() - 1);
        }
        else
        {
            target[offset++] = element.id;
            target[offset++] = static_cast<uint8_t>(element.data.size());
        }
        if (!element.data.empty())
        {
            std::memcpy(target + offset, element.data.data(), element.data.size());
        }
        offset += element.data.size();
    }

    while (offset % sizeof(uint32_t))
    {
        target[offset++] = 0;
    }
    return offset;
}

} // namespace

namespace rtp
{

RtpHeader* RtpHeader::fromPtr(void* p, const size_t len)
{
    if (!p || len < MIN_RTP_HEADER_SIZE)
    {
        return nullptr;
    }

    auto header = reinterpret_cast<RtpHeader*>(p);
    const size_t baseHeaderLength = MIN_RTP_HEADER_SIZE + header->csrcCount * sizeof(uint32_t);
    if (header->version != 2 || !(header->payloadType < 64 || header->payloadType >= 96) || len < baseHeaderLength ||
        (header->extension && len < baseHeaderLength + RtpHeaderExtension::minSize()))
    {
        logPacketError(p, len, baseHeaderLength);
        return nullptr;
    }

    size_t fullHeaderLength = baseHeaderLength;
    if (header->extension)
    {
        auto rtpHeaderExtension =
            reinterpret_cast<const RtpHeaderExtension*>(reinterpret_cast<const char*>(p) + baseHeaderLength);
        fullHeaderLength += rtpHeaderExtension->size();
        if (len < fullHeaderLength)
        {
            logPacketError(p, len, baseHeaderLength);
            return nullptr;
        }
    }

    if (header->padding)
    {
        const uint8_t paddingLength = reinterpret_cast<const uint8_t*>(p)[len - 1];
        if (paddingLength == 0 || fullHeaderLength + paddingLength > len)
        {
            logPacketError(p, len, baseHeaderLength);
            return nullptr;
        }
    }
    return header;
}

RtpHeader* RtpHeader::create(void* p, size_t len)
{
    if (len < MIN_RTP_HEADER_SIZE)
    {
        return nullptr;
    }

    std::memset(p, 0, MIN_RTP_HEADER_SIZE);
    auto header = reinterpret_cast<RtpHeader*>(p);
    header->version = 2;
    return header;
}

size_t RtpHeader::headerLength() const
{
    const size_t baseHeaderLength = MIN_RTP_HEADER_SIZE + csrcCount * sizeof(uint32_t);
    if (extension)
    {
        auto rtpHeaderExtension =
            reinterpret_cast<const RtpHeaderExtension*>(reinterpret_cast<const char*>(this) + baseHeaderLength);
        return baseHeaderLength + rtpHeaderExtension->size();
    }
    return baseHeaderLength;
}

size_t RtpHeader::getPayloadLength(const size_t packetLength) const
{
    const size_t length = headerLength();
    if (packetLength <= length)
    {
        return 0;
    }

    size_t paddingLength = 0;
    if (padding)
    {
        paddingLength = reinterpret_cast<const uint8_t*>(this)[packetLength - 1];
    }
    return packetLength - length > paddingLength ? packetLength - length - paddingLength : 0;
}

RtpHeaderExtension* RtpHeader::getExtensionHeader()
{
    const size_t baseHeaderLength = MIN_RTP_HEADER_SIZE + csrcCount * sizeof(uint32_t);
    if (extension)
    {
        return reinterpret_cast<RtpHeaderExtension*>(reinterpret_cast<char*>(this) + baseHeaderLength);
    }
    return nullptr;
}

utils::TlvCollectionConst<GeneralExtension1Byteheader> RtpHeaderExtension::extensions1Byte() const
{
    if (!isOneByteProfile())
    {
        return utils::TlvCollectionConst<GeneralExtension1Byteheader>(data(), data());
    }

    return utils::TlvCollectionConst<GeneralExtension1Byteheader>(data(),
        findOneByteExtensionsEnd(data(), data() + length.get() * sizeof(uint32_t)));
}

utils::TlvCollectionConst<GeneralExtension2Byteheader> RtpHeaderExtension::extensions2Byte() const
{
    if (!isTwoByteProfile())
    {
        return utils::TlvCollectionConst<GeneralExtension2Byteheader>(data(), data());
    }

    return utils::TlvCollectionConst<GeneralExtension2Byteheader>(data(),
        data() + length.get() * sizeof(uint32_t));
}

bool RtpHeaderExtension::find(const uint8_t id, const uint8_t*& elementData, uint8_t& elementLength) const
{
    if (id == 0)
    {
        return false;
    }

    if (isOneByteProfile())
    {
        for (auto& item : extensions1Byte())
        {
            if (item.getId() == id)
            {
                elementData = item.data;
                elementLength = item.getDataLength();
                return true;
            }
        }
    }
    else if (isTwoByteProfile())
    {
        for (auto& item : extensions2Byte())
        {
            if (item.getId() == id)
            {
                elementData = item.data;
                elementLength = item.getDataLength();
                return true;
            }
        }
    }

    return false;
}

bool RtpHeaderExtension::isValid() const
{
    const uint8_t* dataEnd = data() + length.get() * sizeof(uint32_t);
    if (isOneByteProfile())
    {
        for (const uint8_t* cursor = data(); cursor < dataEnd;)
        {
            const auto& item = *reinterpret_cast<const GeneralExtension1Byteheader*>(cursor);
            if (item.getId() == GeneralExtension1Byteheader::EOL)
            {
                return true;
            }
            else if (cursor + item.size() > dataEnd)
            {
                return false;
            }
            cursor += item.size();
        }
        return true;
    }
    else if (isTwoByteProfile())
    {
        for (const uint8_t* cursor = data(); cursor < dataEnd;)
        {
            const auto& item = *reinterpret_cast<const GeneralExtension2Byteheader*>(cursor);
            if (cursor + item.size() > dataEnd)
            {
                return false;
            }
            cursor += item.size();
        }
        return true;
    }

    // unknown profiles are skipped by length
    return true;
}

bool setExtension(memory::Packet& packet, const uint8_t extensionId, const uint8_t* data, const uint8_t length)
{
    auto* rtpHeader = RtpHeader::fromPacket(packet);
    if (!rtpHeader || extensionId == 0 || (length > 0 && !data))
    {
        return false;
    }

    auto* extensionHeader = rtpHeader->getExtensionHeader();
    if (extensionHeader)
    {
        const uint8_t* current = nullptr;
        uint8_t currentLength = 0;
        if (extensionHeader->find(extensionId, current, currentLength) && currentLength == length)
        {
            std::memcpy(const_cast<uint8_t*>(current), data, length);
            return true;
        }
    }

    std::vector<ExtensionElement> elements;
    bool oneByteForm = true;
    if (extensionHeader)
    {
        if (extensionHeader->isOneByteProfile())
        {
            collectElements(extensionHeader->extensions1Byte(), extensionId, elements);
        }
        else if (extensionHeader->isTwoByteProfile())
        {
            collectElements(extensionHeader->extensions2Byte(), extensionId, elements);
            oneByteForm = false;
        }
        else
        {
            logger::warn("cannot add extension %u to profile 0x%04x", "RtpHeader", extensionId, extensionHeader->profile.get());
            return false;
        }
    }
    elements.push_back(ExtensionElement{extensionId, std::vector<uint8_t>(data, data + length)});

    for (const auto& element : elements)
    {
        oneByteForm = oneByteForm && fitsOneByteForm(element);
    }

    std::array<uint8_t, memory::Packet::size> block;
    const size_t elementBytes = serializeElements(elements, oneByteForm, block.data());
    const size_t newExtensionSize = RtpHeaderExtension::minSize() + elementBytes;
    const size_t oldExtensionSize = extensionHeader ? extensionHeader->size() : 0;
    const size_t oldHeaderLength = rtpHeader->headerLength();
    const size_t baseHeaderLength = oldHeaderLength - oldExtensionSize;
    const size_t payloadLength = packet.getLength() - oldHeaderLength;
    const size_t newPacketLength = baseHeaderLength + newExtensionSize + payloadLength;
    if (newPacketLength > memory::Packet::maxLength())
    {
        return false;
    }

    auto* buffer = packet.get();
    std::memmove(buffer + baseHeaderLength + newExtensionSize, buffer + oldHeaderLength, payloadLength);

    auto* newExtension = reinterpret_cast<RtpHeaderExtension*>(buffer + baseHeaderLength);
    newExtension->profile = static_cast<uint16_t>(oneByteForm ? RtpHeaderExtension::GENERAL1 : RtpHeaderExtension::GENERAL2);
    newExtension->length = static_cast<uint16_t>(elementBytes / sizeof(uint32_t));
    std::memcpy(newExtension->data(), block.data(), elementBytes);
    rtpHeader->extension = 1;
    packet.setLength(newPacketLength);
    return true;
}

bool getExtension(const memory::Packet& packet, const uint8_t extensionId, const uint8_t*& data, uint8_t& length)
{
    auto* rtpHeader = RtpHeader::fromPacket(packet);
    if (!rtpHeader)
    {
        return false;
    }

    auto* extensionHeader = rtpHeader->getExtensionHeader();
    return extensionHeader && extensionHeader->find(extensionId, data, length);
}

bool setTransportWideSequenceNumber(memory::Packet& packet, const uint8_t extensionId, const uint16_t sequenceNumber)
{
    const uint8_t data[2] = {static_cast<uint8_t>(sequenceNumber >> 8), static_cast<uint8_t>(sequenceNumber & 0xFFu)};
    return setExtension(packet, extensionId, data, sizeof(data));
}

bool getTransportWideSequenceNumber(const memory::Packet& packet, const uint8_t extensionId, uint16_t& sequenceNumber)
{
    const uint8_t* data = nullptr;
    uint8_t length = 0;
    if (!getExtension(packet, extensionId, data, length) || length != 2)
    {
        return false;
    }

    sequenceNumber = (static_cast<uint16_t>(data[0]) << 8) | data[1];
    return true;
}

} // namespace rtp
