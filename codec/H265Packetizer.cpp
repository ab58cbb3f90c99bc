#include "codec/H265Packetizer.h"
#include <algorithm>

namespace codec
{

H265Packetizer::H265Packetizer(bool withDonl) : _withDonl(withDonl), _decodingOrderNumber(0) {}

void H265Packetizer::appendDonl(Payload& payload, const uint16_t don) const
{
    if (_withDonl)
    {
        payload.push_back(static_cast<uint8_t>(don >> 8));
        payload.push_back(static_cast<uint8_t>(don & 0xFF));
    }
}

void H265Packetizer::packetize(const uint8_t* data,
    const size_t length,
    const size_t mtu,
    std::vector<Payload>& payloads)
{
    if (length == 0 || mtu == 0)
    {
        return;
    }

    for (const auto& nalUnit : AnnexB::split(data, length))
    {
        emit(nalUnit.data, nalUnit.length, mtu, payloads);
    }
}

void H265Packetizer::emitParameterSets(const size_t mtu, std::vector<Payload>& payloads)
{
    if (_parameterSets.empty())
    {
        return;
    }

    if (_parameterSets.size() > 1)
    {
        uint8_t layerId = 0x3F;
        uint8_t tid = 0x07;
        for (const auto& parameterSet : _parameterSets)
        {
            layerId = std::min(layerId, H265Header::getLayerId(parameterSet[0], parameterSet[1]));
            tid = std::min(tid, H265Header::getTid(parameterSet[1]));
        }

        Payload aggregation;
        aggregation.push_back(static_cast<uint8_t>((H265Header::AP << 1) | (layerId >> 5)));
        aggregation.push_back(static_cast<uint8_t>(((layerId & 0x1F) << 3) | tid));
        uint16_t don = _decodingOrderNumber;
        appendDonl(aggregation, don);
        for (size_t i = 0; i < _parameterSets.size(); ++i)
        {
            const auto& parameterSet = _parameterSets[i];
            if (i > 0 && _withDonl)
            {
                aggregation.push_back(0); // DOND, consecutive units
            }
            aggregation.push_back(static_cast<uint8_t>(parameterSet.size() >> 8));
            aggregation.push_back(static_cast<uint8_t>(parameterSet.size() & 0xFF));
            aggregation.insert(aggregation.end(), parameterSet.begin(), parameterSet.end());
        }

        if (aggregation.size() <= mtu)
        {
            payloads.push_back(std::move(aggregation));
            _decodingOrderNumber += static_cast<uint16_t>(_parameterSets.size());
            _parameterSets.clear();
            return;
        }
    }

    auto parameterSets = std::move(_parameterSets);
    _parameterSets.clear();
    for (const auto& parameterSet : parameterSets)
    {
        emit(parameterSet.data(), parameterSet.size(), mtu, payloads);
    }
}

void H265Packetizer::emit(const uint8_t* nalUnit, const size_t length, const size_t mtu, std::vector<Payload>& payloads)
{
    if (length <= H265Header::HEADER_SIZE)
    {
        return;
    }

    const uint8_t type = H265Header::getNalUnitType(nalUnit[0]);
    if (type == H265Header::AUD || type == H265Header::FILLER)
    {
        return;
    }

    if (H265Header::isParameterSet(type) && _parameterSets.size() < 3 && length + 2 < mtu)
    {
        _parameterSets.emplace_back(nalUnit, nalUnit + length);
        return;
    }
    emitParameterSets(mtu, payloads);

    const size_t donlSize = _withDonl ? H265Header::DONL_SIZE : 0;
    const uint16_t don = _decodingOrderNumber++;
    if (length + donlSize <= mtu)
    {
        Payload single(nalUnit, nalUnit + H265Header::HEADER_SIZE);
        appendDonl(single, don);
        single.insert(single.end(), nalUnit + H265Header::HEADER_SIZE, nalUnit + length);
        payloads.push_back(std::move(single));
        return;
    }

    const size_t headerSize = H265Header::HEADER_SIZE + H265Header::FU_HEADER_SIZE;
    if (mtu <= headerSize + donlSize)
    {
        return;
    }

    size_t offset = H265Header::HEADER_SIZE;
    while (offset < length)
    {
        const bool first = (offset == H265Header::HEADER_SIZE);
        const size_t fragmentSize = std::min(mtu - headerSize - (first ? donlSize : 0), length - offset);

        Payload fragment;
        fragment.reserve(headerSize + donlSize + fragmentSize);
        fragment.push_back(static_cast<uint8_t>((nalUnit[0] & 0x81) | (H265Header::FU << 1)));
        fragment.push_back(nalUnit[1]);
        uint8_t fuHeader = type;
        if (first)
        {
            fuHeader |= H265Header::FU_START;
        }
        if (offset + fragmentSize == length)
        {
            fuHeader |= H265Header::FU_END;
        }
        fragment.push_back(fuHeader);
        if (first)
        {
            appendDonl(fragment, don);
        }
        fragment.insert(fragment.end(), nalUnit + offset, nalUnit + offset + fragmentSize);
        payloads.push_back(std::move(fragment));
        offset += fragmentSize;
    }
}

H265Depacketizer::H265Depacketizer(bool withDonl) : _withDonl(withDonl), _lastDonl(0), _fragmenting(false) {}

DepacketizeResult H265Depacketizer::depacketize(const uint8_t* payload, const size_t length, Payload& out)
{
    if (length <= H265Header::HEADER_SIZE)
    {
        return DepacketizeResult::ShortPacket;
    }
    if (H265Header::isForbiddenBitSet(payload[0]))
    {
        return DepacketizeResult::Malformed;
    }

    switch (H265Header::getNalUnitType(payload[0]))
    {
    case H265Header::AP:
        return depacketizeAggregation(payload, length, out);
    case H265Header::FU:
        return depacketizeFragment(payload, length, out);
    case H265Header::PACI:
        return depacketizePaci(payload, length, out);
    default:
        break;
    }

    size_t offset = H265Header::HEADER_SIZE;
    if (_withDonl)
    {
        if (length <= offset + H265Header::DONL_SIZE)
        {
            return DepacketizeResult::ShortPacket;
        }
        _lastDonl = static_cast<uint16_t>((payload[offset] << 8) | payload[offset + 1]);
        offset += H265Header::DONL_SIZE;
    }

    AnnexB::appendStartCode(out);
    out.insert(out.end(), payload, payload + H265Header::HEADER_SIZE);
    out.insert(out.end(), payload + offset, payload + length);
    return DepacketizeResult::Ok;
}

DepacketizeResult H265Depacketizer::depacketizeAggregation(const uint8_t* payload, const size_t length, Payload& out)
{
    size_t offset = H265Header::HEADER_SIZE;
    if (_withDonl)
    {
        if (offset + H265Header::DONL_SIZE > length)
        {
            return DepacketizeResult::ShortPacket;
        }
        _lastDonl = static_cast<uint16_t>((payload[offset] << 8) | payload[offset + 1]);
        offset += H265Header::DONL_SIZE;
    }

    std::vector<AnnexB::NalUnit> units;
    while (offset < length)
    {
        if (!units.empty() && _withDonl)
        {
            offset += H265Header::DOND_SIZE;
        }
        if (offset + H265Header::LENGTH_SIZE > length)
        {
            return DepacketizeResult::Malformed;
        }

        const size_t unitSize = (static_cast<size_t>(payload[offset]) << 8) | payload[offset + 1];
        offset += H265Header::LENGTH_SIZE;
        if (unitSize < H265Header::HEADER_SIZE || offset + unitSize > length)
        {
            return DepacketizeResult::Malformed;
        }
        units.push_back(AnnexB::NalUnit{payload + offset, unitSize});
        offset += unitSize;
    }

    if (units.empty())
    {
        return DepacketizeResult::Malformed;
    }

    for (const auto& unit : units)
    {
        AnnexB::appendStartCode(out);
        out.insert(out.end(), unit.data, unit.data + unit.length);
    }
    return DepacketizeResult::Ok;
}

DepacketizeResult H265Depacketizer::depacketizeFragment(const uint8_t* payload, const size_t length, Payload& out)
{
    size_t offset = H265Header::HEADER_SIZE + H265Header::FU_HEADER_SIZE;
    if (length <= offset)
    {
        return DepacketizeResult::ShortPacket;
    }

    const uint8_t fuHeader = payload[H265Header::HEADER_SIZE];
    if (fuHeader & H265Header::FU_START)
    {
        if (_withDonl)
        {
            if (length <= offset + H265Header::DONL_SIZE)
            {
                return DepacketizeResult::ShortPacket;
            }
            _lastDonl = static_cast<uint16_t>((payload[offset] << 8) | payload[offset + 1]);
            offset += H265Header::DONL_SIZE;
        }

        _fragment.clear();
        _fragment.push_back(static_cast<uint8_t>((payload[0] & 0x81) | ((fuHeader & 0x3F) << 1)));
        _fragment.push_back(payload[1]);
        _fragmenting = true;
    }
    else if (!_fragmenting)
    {
        return DepacketizeResult::Malformed;
    }

    if (_fragment.size() + length - offset > MAX_FRAGMENTED_UNIT_SIZE)
    {
        _fragment.clear();
        _fragmenting = false;
        return DepacketizeResult::Malformed;
    }
    _fragment.insert(_fragment.end(), payload + offset, payload + length);
    if ((fuHeader & H265Header::FU_END) == 0)
    {
        return DepacketizeResult::Incomplete;
    }

    _fragmenting = false;
    AnnexB::appendStartCode(out);
    out.insert(out.end(), _fragment.begin(), _fragment.end());
    _fragment.clear();
    return DepacketizeResult::Ok;
}

// PayloadHdr(2) | A(1) cType(6) PHSsize(5) F0 F1 F2 Y(4) | PHES | contained payload without its header
DepacketizeResult H265Depacketizer::depacketizePaci(const uint8_t* payload, const size_t length, Payload& out)
{
    const size_t paciHeaderSize = H265Header::HEADER_SIZE + 2;
    if (length <= paciHeaderSize)
    {
        return DepacketizeResult::ShortPacket;
    }

    const uint16_t paciFields = static_cast<uint16_t>((payload[2] << 8) | payload[3]);
    const uint8_t forbidden = static_cast<uint8_t>(paciFields >> 15);
    const uint8_t containedType = (paciFields >> 9) & 0x3F;
    const size_t extensionsSize = (paciFields >> 4) & 0x1F;
    if (containedType == H265Header::PACI || length < paciHeaderSize + extensionsSize + 1)
    {
        return DepacketizeResult::Malformed;
    }

    Payload contained;
    contained.reserve(length - paciHeaderSize - extensionsSize + H265Header::HEADER_SIZE);
    contained.push_back(static_cast<uint8_t>((forbidden << 7) | (containedType << 1) | (payload[0] & 0x01)));
    contained.push_back(payload[1]);
    contained.insert(contained.end(), payload + paciHeaderSize + extensionsSize, payload + length);
    return depacketize(contained.data(), contained.size(), out);
}

} // namespace codec
