#include "crypto/SrtpIv.h"
#include <cstring>

namespace crypto
{
namespace
{
// xors the low byteCount bytes of value, big endian, into target
void xorBigEndian(uint8_t* target, uint64_t value, size_t byteCount)
{
    for (size_t i = 0; i < byteCount; ++i)
    {
        target[byteCount - 1 - i] ^= static_cast<uint8_t>(value >> (8 * i));
    }
}
} // namespace

void makeCounterIv(const uint8_t* salt, uint32_t ssrc, uint64_t index, uint8_t* iv)
{
    std::memcpy(iv, salt, COUNTER_SALT_SIZE);
    iv[14] = 0;
    iv[15] = 0;
    xorBigEndian(iv + 4, ssrc, 4);
    xorBigEndian(iv + 8, index & 0xFFFFFFFFFFFFull, 6);
}

void makeGcmRtpIv(const uint8_t* salt, uint32_t ssrc, uint32_t rolloverCounter, uint16_t sequenceNumber, uint8_t* iv)
{
    std::memcpy(iv, salt, GCM_IV_SIZE);
    xorBigEndian(iv + 2, ssrc, 4);
    xorBigEndian(iv + 6, rolloverCounter, 4);
    xorBigEndian(iv + 10, sequenceNumber, 2);
}

void makeGcmRtcpIv(const uint8_t* salt, uint32_t ssrc, uint32_t srtcpIndex, uint8_t* iv)
{
    std::memcpy(iv, salt, GCM_IV_SIZE);
    xorBigEndian(iv + 2, ssrc, 4);
    xorBigEndian(iv + 8, srtcpIndex & 0x7FFFFFFFu, 4);
}

} // namespace crypto
