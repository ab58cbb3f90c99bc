#pragma once

#include "logger/Logger.h"
#include "transport/DatagramSocket.h"
#include "utils/SocketAddress.h"
#include <atomic>

namespace transport
{

// Connected UDP socket. Receive blocks in poll, close wakes it through an eventfd.
class UdpSocket : public DatagramSocket
{
public:
    UdpSocket();
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    // returns 0 on success else errno
    int open(const SocketAddress& localAddress);
    int connect(const SocketAddress& remoteAddress);
    int setReceiveBuffer(uint32_t size);
    int setSendBuffer(uint32_t size);

    int receive(void* buffer, size_t size, uint64_t timeoutNs) override;
    int send(const void* data, size_t length) override;
    void close() override;
    bool isOpen() const override { return _fd.load() != -1 && !_closed.load(); }

    SocketAddress getBoundPort() const { return _boundPort; }
    SocketAddress getPeer() const { return _peer; }

    static const char* explain(int errorCode);

private:
    int updateBoundPort();
    void releaseHandles();

    logger::LoggableId _loggableId;
    std::atomic_int _fd;
    int _wakeFd;
    std::atomic_bool _closed;
    SocketAddress _boundPort;
    SocketAddress _peer;
};

} // namespace transport
