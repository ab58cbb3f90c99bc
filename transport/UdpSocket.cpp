#include "transport/UdpSocket.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

namespace transport
{

UdpSocket::UdpSocket() : _loggableId("UdpSocket"), _fd(-1), _wakeFd(-1), _closed(false) {}

UdpSocket::~UdpSocket()
{
    close();
    releaseHandles();
}

int UdpSocket::open(const SocketAddress& localAddress)
{
    if (_fd.load() != -1)
    {
        return EISCONN;
    }

    const int fd = ::socket(localAddress.getFamily(), SOCK_DGRAM, 0);
    if (fd == -1)
    {
        return errno;
    }

    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1)
    {
        flags = 0;
    }
    if (0 != fcntl(fd, F_SETFL, flags | O_NONBLOCK))
    {
        const int errorCode = errno;
        ::close(fd);
        return errorCode;
    }

    if (::bind(fd, localAddress.getSockAddr(), localAddress.getSockAddrSize()))
    {
        const int errorCode = errno;
        ::close(fd);
        return errorCode;
    }

    _wakeFd = ::eventfd(0, EFD_NONBLOCK);
    if (_wakeFd == -1)
    {
        const int errorCode = errno;
        ::close(fd);
        return errorCode;
    }

    _fd = fd;
    _closed = false;
    return updateBoundPort();
}

int UdpSocket::connect(const SocketAddress& remoteAddress)
{
    if (_fd.load() == -1)
    {
        return ENOTSOCK;
    }

    if (::connect(_fd.load(), remoteAddress.getSockAddr(), remoteAddress.getSockAddrSize()) != 0)
    {
        return errno;
    }
    _peer = remoteAddress;
    logger::info("connected %s -> %s",
        _loggableId.c_str(),
        _boundPort.toString().c_str(),
        remoteAddress.toString().c_str());
    return updateBoundPort();
}

int UdpSocket::updateBoundPort()
{
    RawSockAddress localAddress;
    socklen_t addressSize = sizeof(localAddress);
    if (::getsockname(_fd.load(), &localAddress.gen, &addressSize) != 0)
    {
        return errno;
    }

    _boundPort = SocketAddress(&localAddress.gen);
    return 0;
}

int UdpSocket::setSendBuffer(uint32_t size)
{
    if (0 != ::setsockopt(_fd.load(), SOL_SOCKET, SO_SNDBUF, &size, sizeof(size)))
    {
        return errno;
    }
    return 0;
}

int UdpSocket::setReceiveBuffer(uint32_t size)
{
    if (0 != ::setsockopt(_fd.load(), SOL_SOCKET, SO_RCVBUF, &size, sizeof(size)))
    {
        return errno;
    }
    return 0;
}

int UdpSocket::receive(void* buffer, const size_t size, const uint64_t timeoutNs)
{
    const int fd = _fd.load();
    if (fd == -1 || _closed)
    {
        return -1;
    }

    pollfd descriptors[2];
    descriptors[0] = {fd, POLLIN, 0};
    descriptors[1] = {_wakeFd, POLLIN, 0};
    const int timeoutMs = static_cast<int>(std::min<uint64_t>((timeoutNs + 999999) / 1000000, 0x7FFFFFFF));
    const int rc = ::poll(descriptors, 2, timeoutMs);
    if (_closed)
    {
        return -1;
    }
    if (rc < 0)
    {
        return errno == EINTR ? 0 : -1;
    }
    if (rc == 0 || (descriptors[0].revents & POLLIN) == 0)
    {
        return 0;
    }

    const ssize_t received = ::recv(fd, buffer, size, MSG_DONTWAIT);
    if (received < 0)
    {
        const int errorCode = errno;
        if (errorCode == EAGAIN || errorCode == EWOULDBLOCK || errorCode == EINTR)
        {
            return 0;
        }
        // ICMP port unreachable on a connected socket, the peer may not be up yet
        if (errorCode == ECONNREFUSED)
        {
            logger::debug("receive %s", _loggableId.c_str(), explain(errorCode));
            return 0;
        }
        logger::warn("receive failed %s", _loggableId.c_str(), explain(errorCode));
        return -1;
    }
    return static_cast<int>(received);
}

int UdpSocket::send(const void* data, const size_t length)
{
    const int fd = _fd.load();
    if (fd == -1 || _closed)
    {
        return -1;
    }

    int errorCode = EWOULDBLOCK;
    for (int i = 0; i < 2 && (errorCode == EAGAIN || errorCode == EWOULDBLOCK); ++i)
    {
        const ssize_t rc = ::send(fd, data, length, MSG_DONTWAIT);
        if (rc >= 0)
        {
            return static_cast<int>(rc);
        }
        errorCode = errno;
    }

    if (errorCode == ECONNREFUSED)
    {
        // datagram semantics, reported by an earlier send
        return static_cast<int>(length);
    }
    logger::warn("send failed %s", _loggableId.c_str(), explain(errorCode));
    return -1;
}

void UdpSocket::close()
{
    if (_closed.exchange(true))
    {
        return;
    }

    if (_wakeFd != -1)
    {
        const uint64_t one = 1;
        if (::write(_wakeFd, &one, sizeof(one)) != sizeof(one))
        {
            logger::warn("failed to wake receiver", _loggableId.c_str());
        }
    }
}

void UdpSocket::releaseHandles()
{
    const int fd = _fd.exchange(-1);
    if (fd != -1)
    {
        ::close(fd);
    }
    if (_wakeFd != -1)
    {
        ::close(_wakeFd);
        _wakeFd = -1;
    }
}

const char* UdpSocket::explain(int errorCode)
{
    switch (errorCode)
    {
    case EADDRINUSE:
        return "address in use";
    case EADDRNOTAVAIL:
        return "address not available";
    case ECONNREFUSED:
        return "connection refused";
    case EHOSTUNREACH:
        return "host unreachable";
    case ENETUNREACH:
        return "network unreachable";
    case EMSGSIZE:
        return "message too large";
    case ENOBUFS:
        return "no buffer space";
    case ENOTSOCK:
        return "not a socket";
    default:
        return std::strerror(errorCode);
    }
}

} // namespace transport
