#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace crypto
{

/**
 * Sliding window replay detector over a monotonic 64 bit index space. The index is checked before the
 * packet is authenticated and committed after, so forged packets cannot move the window.
 * An index is rejected if it lies below the window or is already marked.
 */
class ReplayWindow
{
public:
    explicit ReplayWindow(uint32_t windowSize = 64, uint64_t maxIndex = ~uint64_t(0))
        : _windowSize(windowSize < 1 ? 1 : windowSize),
          _maxIndex(maxIndex),
          _latest(0),
          _bits((_windowSize + 63) / 64, 0),
          _initialized(false)
    {
    }

    bool check(uint64_t index) const
    {
        if (index > _maxIndex)
        {
            return false;
        }
        if (!_initialized || index > _latest)
        {
            return true;
        }

        const uint64_t behind = _latest - index;
        if (behind >= _windowSize)
        {
            return false;
        }
        return !isSet(behind);
    }

    void accept(uint64_t index)
    {
        if (!_initialized)
        {
            _initialized = true;
            _latest = index;
            clearAll();
            set(0);
            return;
        }

        if (index > _latest)
        {
            shift(index - _latest);
            _latest = index;
            set(0);
        }
        else
        {
            const uint64_t behind = _latest - index;
            if (behind < _windowSize)
            {
                set(behind);
            }
        }
    }

    uint64_t getLatest() const { return _latest; }
    bool isInitialized() const { return _initialized; }
    uint32_t getWindowSize() const { return _windowSize; }

private:
    bool isSet(uint64_t offset) const { return (_bits[offset / 64] >> (offset % 64)) & 1; }
    void set(uint64_t offset) { _bits[offset / 64] |= (uint64_t(1) << (offset % 64)); }

    void clearAll()
    {
        for (auto& word : _bits)
        {
            word = 0;
        }
    }

    // moves every marked offset count positions further back, dropping those leaving the window
    void shift(uint64_t count)
    {
        if (count >= _windowSize)
        {
            clearAll();
            return;
        }

        const size_t words = _bits.size();
        const size_t wordShift = count / 64;
        const size_t bitShift = count % 64;
        for (size_t i = words; i-- > 0;)
        {
            uint64_t value = 0;
            if (i >= wordShift)
            {
                value = _bits[i - wordShift] << bitShift;
                if (bitShift != 0 && i > wordShift)
                {
                    value |= _bits[i - wordShift - 1] >> (64 - bitShift);
                }
            }
            _bits[i] = value;
        }
    }

    const uint32_t _windowSize;
    const uint64_t _maxIndex;
    uint64_t _latest;
    std::vector<uint64_t> _bits;
    bool _initialized;
};

} // namespace crypto
