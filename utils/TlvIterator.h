#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <type_traits>

namespace utils
{

// Walks a packed sequence of type-length-value records laid out in a byte buffer.
// T must provide static headerSize() and a size() giving the padded wire size of the record.
// A record that is truncated, claims zero size or extends past the buffer ends the walk.
template <typename T>
class TlvIterator
{
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::remove_const_t<T>;
    using difference_type = std::ptrdiff_t;
    using pointer = T*;
    using reference = T&;

    TlvIterator(const void* position, const void* end)
        : _position(static_cast<const uint8_t*>(position)),
          _end(static_cast<const uint8_t*>(end))
    {
        clampToEnd();
    }

    TlvIterator& operator++()
    {
        const size_t recordSize = get()->size();
        if (recordSize == 0 || recordSize > static_cast<size_t>(_end - _position))
        {
            _position = _end;
        }
        else
        {
            _position += recordSize;
            clampToEnd();
        }
        return *this;
    }

    T* operator->() const { return get(); }
    T& operator*() const { return *get(); }

    bool operator==(const TlvIterator& other) const { return _position == other._position; }
    bool operator!=(const TlvIterator& other) const { return _position != other._position; }

private:
    T* get() const { return reinterpret_cast<T*>(const_cast<uint8_t*>(_position)); }

    void clampToEnd()
    {
        if (_position > _end || static_cast<size_t>(_end - _position) < value_type::headerSize())
        {
            _position = _end;
        }
    }

    const uint8_t* _position;
    const uint8_t* _end;
};

// Read only view over TLV records between two addresses.
template <typename T>
class TlvCollectionConst
{
public:
    using const_iterator = TlvIterator<const T>;

    TlvCollectionConst(const void* beginPtr, const void* endPtr) : _begin(beginPtr), _end(endPtr) {}

    const_iterator begin() const { return const_iterator(_begin, _end); }
    const_iterator end() const { return const_iterator(_end, _end); }
    const_iterator cbegin() const { return begin(); }
    const_iterator cend() const { return end(); }

    bool empty() const { return begin() == end(); }

    size_t count() const
    {
        size_t n = 0;
        for (auto it = begin(); it != end(); ++it)
        {
            ++n;
        }
        return n;
    }

    template <typename Predicate>
    const T* findIf(Predicate&& predicate) const
    {
        for (auto& item : *this)
        {
            if (predicate(item))
            {
                return &item;
            }
        }
        return nullptr;
    }

private:
    const void* _begin;
    const void* _end;
};

} // namespace utils
