#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace memory
{

// Datagram buffer with room for one MTU sized packet and its SRTP trailer
template <size_t PacketSize>
class FixedPacket
{
public:
    FixedPacket() : _length(0) { _data[0] = 0; }

    static constexpr size_t size = PacketSize;
    static_assert(PacketSize % 8 == 0, "packet size must be 8B aligned");

    static constexpr size_t maxLength() { return PacketSize; }

    uint8_t* get() { return _data; }
    const uint8_t* get() const { return _data; }

    // clamped to the capacity
    void setLength(const size_t length) { _length = (length > size ? size : length); }
    size_t getLength() const { return _length; }
    size_t getFreeSpace() const { return size - _length; }

    void copyTo(FixedPacket<PacketSize>& dst) const
    {
        std::memcpy(dst._data, _data, _length);
        dst._length = _length;
    }

    bool assign(const void* data, const size_t length)
    {
        if (length > size)
        {
            return false;
        }
        std::memcpy(_data, data, length);
        _length = length;
        return true;
    }

    bool append(const void* data, const size_t length)
    {
        if (length > getFreeSpace())
        {
            return false;
        }
        std::memcpy(_data + _length, data, length);
        _length += length;
        return true;
    }

    void clear()
    {
        std::memset(_data, 0, size);
        _length = 0;
    }

private:
    uint8_t _data[size];
    size_t _length;
};

class Packet : public FixedPacket<1504>
{
};

} // namespace memory
