#pragma once

#include <cstdint>

namespace transport
{

// Receives every datagram the DTLS record layer produces
class DtlsWriteListener
{
public:
    virtual ~DtlsWriteListener() = default;

    virtual int32_t sendDtls(const char* buffer, uint32_t length) = 0;
};

} // namespace transport
