#pragma once

#include <cstddef>
#include <cstdint>

namespace transport
{

// Connected datagram socket the DTLS/SCTP stack runs on. Thread safe. close unblocks a pending receive.
class DatagramSocket
{
public:
    virtual ~DatagramSocket() = default;

    // bytes received, 0 on timeout, -1 when the socket is closed or failed
    virtual int receive(void* buffer, size_t size, uint64_t timeoutNs) = 0;
    // bytes sent, -1 on error
    virtual int send(const void* data, size_t length) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

} // namespace transport
