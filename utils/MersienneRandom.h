#pragma once

#include <cstdint>
#include <random>
#include <type_traits>

namespace utils
{

// Fast non cryptographic random numbers. Tags, TSNs and SSRCs use it. Key material does not.
template <typename IntType>
class MersienneRandom
{
    static_assert(std::is_unsigned<IntType>::value && sizeof(IntType) <= sizeof(uint64_t),
        "unsigned integer of at most 64 bit");

public:
    MersienneRandom() : _engine(seedFromDevice()) {}
    explicit MersienneRandom(uint64_t seed) : _engine(seed) {}

    IntType next() { return static_cast<IntType>(_engine()); }

private:
    static uint64_t seedFromDevice()
    {
        std::random_device device;
        return (uint64_t(device()) << 32) ^ device();
    }

    std::mt19937_64 _engine;
};

} // namespace utils
