#pragma once
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace utils
{
// Big endian encode and decode of unsigned integers to and from unaligned memory.
template <typename IntT>
inline void writeBigEndian(IntT value, void* target)
{
    static_assert(std::is_unsigned<IntT>::value, "unsigned integer required");
    auto* bytes = static_cast<uint8_t*>(target);
    for (size_t i = sizeof(IntT); i > 0; --i)
    {
        bytes[i - 1] = static_cast<uint8_t>(value & 0xFF);
        value = static_cast<IntT>(value >> 8);
    }
}

template <typename IntT>
inline IntT readBigEndian(const void* source)
{
    static_assert(std::is_unsigned<IntT>::value, "unsigned integer required");
    const auto* bytes = static_cast<const uint8_t*>(source);
    IntT value = 0;
    for (size_t i = 0; i < sizeof(IntT); ++i)
    {
        value = static_cast<IntT>((value << 8) | bytes[i]);
    }
    return value;
}
} // namespace utils

// Integer kept in network byte order inside a wire overlay struct. It keeps the size and alignment
// of IntT so overlays match the packet layout.
template <typename IntT>
class NetworkOrdered
{
public:
    NetworkOrdered() { std::memset(&_storage, 0, sizeof(_storage)); }
    NetworkOrdered(const NetworkOrdered&) = default;
    explicit NetworkOrdered(IntT value) { utils::writeBigEndian(value, &_storage); }

    NetworkOrdered& operator=(const NetworkOrdered&) = default;
    NetworkOrdered& operator=(IntT value)
    {
        utils::writeBigEndian(value, &_storage);
        return *this;
    }

    NetworkOrdered& operator+=(IntT value) { return *this = static_cast<IntT>(get() + value); }

    operator IntT() const { return get(); }
    IntT get() const { return utils::readBigEndian<IntT>(&_storage); }

private:
    IntT _storage;
};

typedef NetworkOrdered<uint64_t> nwuint64_t;
typedef NetworkOrdered<uint32_t> nwuint32_t;
typedef NetworkOrdered<uint16_t> nwuint16_t;

// 24 bit field, DTLS handshake lengths and TWCC reference time
class nwuint24_t
{
public:
    nwuint24_t() { std::memset(_bytes, 0, sizeof(_bytes)); }

    nwuint24_t& operator=(uint32_t value)
    {
        _bytes[0] = static_cast<uint8_t>(value >> 16);
        _bytes[1] = static_cast<uint8_t>(value >> 8);
        _bytes[2] = static_cast<uint8_t>(value);
        return *this;
    }

    operator uint32_t() const { return get(); }
    uint32_t get() const { return (uint32_t(_bytes[0]) << 16) | (uint32_t(_bytes[1]) << 8) | _bytes[2]; }

private:
    uint8_t _bytes[3];
};

// 48 bit DTLS record sequence number
class nwuint48_t
{
public:
    nwuint48_t() { std::memset(_bytes, 0, sizeof(_bytes)); }

    nwuint48_t& operator=(uint64_t value)
    {
        for (int i = 5; i >= 0; --i)
        {
            _bytes[i] = static_cast<uint8_t>(value);
            value >>= 8;
        }
        return *this;
    }

    operator uint64_t() const { return get(); }
    uint64_t get() const
    {
        uint64_t value = 0;
        for (auto byte : _bytes)
        {
            value = (value << 8) | byte;
        }
        return value;
    }

private:
    uint8_t _bytes[6];
};

static_assert(sizeof(nwuint24_t) == 3, "nwuint24_t must be packed");
static_assert(sizeof(nwuint48_t) == 6, "nwuint48_t must be packed");
static_assert(sizeof(nwuint32_t) == 4 && alignof(nwuint32_t) == alignof(uint32_t), "layout of uint32_t");
