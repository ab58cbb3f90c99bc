#pragma once

#include <cstdint>
#include <cstring>
#include <vector>

namespace utils
{

// Sequential big endian reader over a byte range. A read that does not fit marks the reader as failed
// and returns zero, so a message parser can read all fields and check isValid() once at the end.
class ByteReader
{
public:
    ByteReader(const void* data, size_t length)
        : _data(reinterpret_cast<const uint8_t*>(data)),
          _length(length),
          _position(0),
          _failed(false)
    {
    }

    bool require(size_t count) const { return !_failed && _length - _position >= count; }
    bool isValid() const { return !_failed; }
    bool empty() const { return _position == _length; }
    size_t remaining() const { return _failed ? 0 : _length - _position; }
    size_t position() const { return _position; }
    const uint8_t* current() const { return _data + _position; }

    uint8_t read1()
    {
        if (!require(1))
        {
            _failed = true;
            return 0;
        }
        return _data[_position++];
    }

    uint16_t read2() { return static_cast<uint16_t>(readN(2)); }
    uint32_t read3() { return static_cast<uint32_t>(readN(3)); }
    uint32_t read4() { return static_cast<uint32_t>(readN(4)); }
    uint64_t read6() { return readN(6); }
    uint64_t read8() { return readN(8); }

    bool readBytes(void* target, size_t count)
    {
        if (!require(count))
        {
            _failed = true;
            return false;
        }
        std::memcpy(target, _data + _position, count);
        _position += count;
        return true;
    }

    // Returns a pointer to count bytes and advances, nullptr if not available.
    const uint8_t* take(size_t count)
    {
        if (!require(count))
        {
            _failed = true;
            return nullptr;
        }
        auto p = _data + _position;
        _position += count;
        return p;
    }

    bool readVector(std::vector<uint8_t>& target, size_t count)
    {
        auto p = take(count);
        if (!p)
        {
            return false;
        }
        target.assign(p, p + count);
        return true;
    }

    // length prefixed opaque, prefix of 1, 2 or 3 bytes
    bool readOpaque(std::vector<uint8_t>& target, int prefixBytes)
    {
        const size_t count = static_cast<size_t>(readN(prefixBytes));
        return isValid() && readVector(target, count);
    }

    void skip(size_t count)
    {
        if (!require(count))
        {
            _failed = true;
            return;
        }
        _position += count;
    }

private:
    uint64_t readN(int count)
    {
        if (!require(count))
        {
            _failed = true;
            return 0;
        }
        uint64_t value = 0;
        for (int i = 0; i < count; ++i)
        {
            value = (value << 8) | _data[_position++];
        }
        return value;
    }

    const uint8_t* _data;
    size_t _length;
    size_t _position;
    bool _failed;
};

// Appends big endian fields to a growing byte vector.
class ByteWriter
{
public:
    explicit ByteWriter(std::vector<uint8_t>& target) : _target(target) {}

    void write1(uint8_t value) { _target.push_back(value); }
    void write2(uint16_t value) { writeN(value, 2); }
    void write3(uint32_t value) { writeN(value, 3); }
    void write4(uint32_t value) { writeN(value, 4); }
    void write6(uint64_t value) { writeN(value, 6); }
    void write8(uint64_t value) { writeN(value, 8); }

    void writeBytes(const void* data, size_t count)
    {
        auto p = reinterpret_cast<const uint8_t*>(data);
        _target.insert(_target.end(), p, p + count);
    }

    void writeBytes(const std::vector<uint8_t>& data) { _target.insert(_target.end(), data.begin(), data.end()); }

    void writeOpaque(const std::vector<uint8_t>& data, int prefixBytes)
    {
        writeN(data.size(), prefixBytes);
        writeBytes(data);
    }

    // Reserves a length prefix to be filled in by closeLength once the body is written.
    size_t openLength(int prefixBytes)
    {
        const size_t position = _target.size();
        writeN(0, prefixBytes);
        return position;
    }

    void closeLength(size_t position, int prefixBytes)
    {
        uint64_t length = _target.size() - position - prefixBytes;
        for (int i = prefixBytes - 1; i >= 0; --i)
        {
            _target[position + i] = length & 0xFF;
            length >>= 8;
        }
    }

    size_t size() const { return _target.size(); }

private:
    void writeN(uint64_t value, int count)
    {
        for (int i = count - 1; i >= 0; --i)
        {
            _target.push_back(static_cast<uint8_t>(value >> (i * 8)));
        }
    }

    std::vector<uint8_t>& _target;
};

} // namespace utils
