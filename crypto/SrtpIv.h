#pragma once

#include <cstddef>
#include <cstdint>

namespace crypto
{
const size_t GCM_IV_SIZE = 12;
const size_t COUNTER_IV_SIZE = 16;
const size_t COUNTER_SALT_SIZE = 14;

// rfc3711 4.1.1, (salt || 00 00) xor (00 00 00 00 || ssrc || index || 00 00). index is 48 bit.
void makeCounterIv(const uint8_t* salt, uint32_t ssrc, uint64_t index, uint8_t* iv);

// rfc7714 8.1, salt xor (00 00 || ssrc || roc || seq)
void makeGcmRtpIv(const uint8_t* salt, uint32_t ssrc, uint32_t rolloverCounter, uint16_t sequenceNumber, uint8_t* iv);

// rfc7714 9.1, salt xor (00 00 || ssrc || 00 00 || srtcp index). The E flag is masked out.
void makeGcmRtcpIv(const uint8_t* salt, uint32_t ssrc, uint32_t srtcpIndex, uint8_t* iv);

} // namespace crypto
