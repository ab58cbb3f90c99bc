#include "codec/H264Packetizer.h"
#include "codec/H264Header.h"
#include <algorithm>

namespace codec
{

void H264Packetizer::packetize(const uint8_t* data,
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

void H264Packetizer::emit(const uint8_t* nalUnit, const size_t length, const size_t mtu, std::vector<Payload>& payloads)
{
    if (length == 0)
    {
        return;
    }

    const uint8_t type = H264Header::getNalUnitType(nalUnit[0]);
    if (type == H264Header::AUD || type == H264Header::FILLER)
    {
        return;
    }
    else if (type == H264Header::SPS)
    {
        _sps.assign(nalUnit, nalUnit + length);
        return;
    }
    else if (type == H264Header::PPS)
    {
        _pps.assign(nalUnit, nalUnit + length);
        return;
    }

    if (!_sps.empty() && !_pps.empty())
    {
        Payload stapA;
        stapA.reserve(H264Header::STAP_A_HEADER_SIZE + 2 * H264Header::STAP_A_LENGTH_SIZE + _sps.size() +
            _pps.size());
        stapA.push_back(H264Header::STAP_A_INDICATOR);
        for (const auto* parameterSet : {&_sps, &_pps})
        {
            stapA.push_back(static_cast<uint8_t>(parameterSet->size() >> 8));
            stapA.push_back(static_cast<uint8_t>(parameterSet->size() & 0xFF));
            stapA.insert(stapA.end(), parameterSet->begin(), parameterSet->end());
        }
        if (stapA.size() <= mtu)
        {
            payloads.push_back(std::move(stapA));
        }
        else
        {
            emitUnit(_sps.data(), _sps.size(), mtu, payloads);
            emitUnit(_pps.data(), _pps.size(), mtu, payloads);
        }
        _sps.clear();
        _pps.clear();
    }

    emitUnit(nalUnit, length, mtu, payloads);
}

void H264Packetizer::emitUnit(const uint8_t* nalUnit,
    const size_t length,
    const size_t mtu,
    std::vector<Payload>& payloads)
{
    if (length <= mtu)
    {
        payloads.emplace_back(nalUnit, nalUnit + length);
        return;
    }

    const uint8_t type = H264Header::getNalUnitType(nalUnit[0]);
    const uint8_t nri = nalUnit[0] & H264Header::NRI_MASK;

    if (mtu <= H264Header::FU_A_HEADER_SIZE)
    {
        return;
    }

    // the NAL header is carried by the FU indicator and FU header
    const size_t maxFragmentSize = mtu - H264Header::FU_A_HEADER_SIZE;
    size_t offset = 1;
    while (offset < length)
    {
        const size_t fragmentSize = std::min(maxFragmentSize, length - offset);
        Payload fragment;
        fragment.reserve(H264Header::FU_A_HEADER_SIZE + fragmentSize);
        fragment.push_back(H264Header::FU_A | nri);

        uint8_t fuHeader = type;
        if (offset == 1)
        {
            fuHeader |= H264Header::FU_START;
        }
        else if (offset + fragmentSize == length)
        {
            fuHeader |= H264Header::FU_END;
        }
        fragment.push_back(fuHeader);
        fragment.insert(fragment.end(), nalUnit + offset, nalUnit + offset + fragmentSize);
        payloads.push_back(std::move(fragment));
        offset += fragmentSize;
    }
}

H264Depacketizer::H264Depacketizer(Format format) : _format(format), _inbandParameterSets(false), _fragmenting(false)
{
}

void H264Depacketizer::setParameterSets(const Payload& sps, const Payload& pps)
{
    _sps = sps;
    _pps = pps;
}

void H264Depacketizer::appendUnitPrefix(const size_t unitLength, Payload& out) const
{
    if (_format == Format::AnnexB)
    {
        AnnexB::appendStartCode(out);
        return;
    }

    out.push_back(static_cast<uint8_t>(unitLength >> 24));
    out.push_back(static_cast<uint8_t>(unitLength >> 16));
    out.push_back(static_cast<uint8_t>(unitLength >> 8));
    out.push_back(static_cast<uint8_t>(unitLength));
}

void H264Depacketizer::appendNalUnit(const uint8_t* nalUnit, const size_t length, Payload& out)
{
    const uint8_t type = H264Header::getNalUnitType(nalUnit[0]);
    if (type == H264Header::SPS || type == H264Header::PPS)
    {
        _inbandParameterSets = true;
    }
    else if (type == H264Header::IDR && !_inbandParameterSets && !_sps.empty() && !_pps.empty())
    {
        appendUnitPrefix(_sps.size(), out);
        out.insert(out.end(), _sps.begin(), _sps.end());
        appendUnitPrefix(_pps.size(), out);
        out.insert(out.end(), _pps.begin(), _pps.end());
        _inbandParameterSets = true;
    }
    else if (type != H264Header::IDR && type != H264Header::SEI)
    {
        _inbandParameterSets = false;
    }

    appendUnitPrefix(length, out);
    out.insert(out.end(), nalUnit, nalUnit + length);
}

DepacketizeResult H264Depacketizer::depacketize(const uint8_t* payload, const size_t length, Payload& out)
{
    if (length <= 2)
    {
        return DepacketizeResult::ShortPacket;
    }

    const uint8_t type = H264Header::getNalUnitType(payload[0]);
    if (type >= 1 && type <= 23)
    {
        appendNalUnit(payload, length, out);
        return DepacketizeResult::Ok;
    }

    if (type == H264Header::STAP_A)
    {
        size_t offset = H264Header::STAP_A_HEADER_SIZE;
        std::vector<AnnexB::NalUnit> units;
        while (offset < length)
        {
            if (offset + H264Header::STAP_A_LENGTH_SIZE > length)
            {
                return DepacketizeResult::Malformed;
            }
            const size_t unitSize = (static_cast<size_t>(payload[offset]) << 8) | payload[offset + 1];
            offset += H264Header::STAP_A_LENGTH_SIZE;
            if (unitSize == 0 || offset + unitSize > length)
            {
                return DepacketizeResult::Malformed;
            }
            units.push_back(AnnexB::NalUnit{payload + offset, unitSize});
            offset += unitSize;
        }

        for (const auto& unit : units)
        {
            appendNalUnit(unit.data, unit.length, out);
        }
        return DepacketizeResult::Ok;
    }

    if (type == H264Header::FU_A)
    {
        const uint8_t fuHeader = payload[1];
        if (fuHeader & H264Header::FU_START)
        {
            _fragment.clear();
            _fragment.push_back((payload[0] & (H264Header::FORBIDDEN_MASK | H264Header::NRI_MASK)) |
                H264Header::getNalUnitType(fuHeader));
            _fragmenting = true;
        }
        else if (!_fragmenting)
        {
            return DepacketizeResult::Malformed;
        }

        if (_fragment.size() + length - H264Header::FU_A_HEADER_SIZE > MAX_FRAGMENTED_UNIT_SIZE)
        {
            _fragment.clear();
            _fragmenting = false;
            return DepacketizeResult::Malformed;
        }
        _fragment.insert(_fragment.end(), payload + H264Header::FU_A_HEADER_SIZE, payload + length);
        if ((fuHeader & H264Header::FU_END) == 0)
        {
            return DepacketizeResult::Incomplete;
        }

        _fragmenting = false;
        appendNalUnit(_fragment.data(), _fragment.size(), out);
        _fragment.clear();
        return DepacketizeResult::Ok;
    }

    return DepacketizeResult::Unsupported;
}

bool H264Depacketizer::isPartitionHead(const uint8_t* payload, const size_t length)
{
    if (length < 2)
    {
        return false;
    }

    const uint8_t type = H264Header::getNalUnitType(payload[0]);
    if (type == H264Header::FU_A || type == H264Header::FU_B)
    {
        return (payload[1] & H264Header::FU_START) != 0;
    }
    return true;
}

} // namespace codec
