#include "utils/SocketAddress.h"
#include <cstring>

namespace transport
{

SocketAddress::SocketAddress()
{
    std::memset(&_address, 0, sizeof(_address));
    _address.gen.sa_family = AF_UNSPEC;
}

SocketAddress::SocketAddress(const sockaddr* original) : SocketAddress()
{
    if (!original)
    {
        return;
    }

    if (original->sa_family == AF_INET)
    {
        std::memcpy(&_address.v4, original, sizeof(sockaddr_in));
    }
    else if (original->sa_family == AF_INET6)
    {
        std::memcpy(&_address.v6, original, sizeof(sockaddr_in6));
    }
}

SocketAddress::SocketAddress(const uint32_t ipv4, const uint16_t port) : SocketAddress()
{
    _address.v4.sin_family = AF_INET;
    _address.v4.sin_addr.s_addr = htonl(ipv4);
    _address.v4.sin_port = htons(port);
}

uint16_t SocketAddress::getPort() const
{
    if (getFamily() == AF_INET6)
    {
        return ntohs(_address.v6.sin6_port);
    }
    return getFamily() == AF_INET ? ntohs(_address.v4.sin_port) : 0;
}

SocketAddress& SocketAddress::setPort(const uint16_t port)
{
    if (getFamily() == AF_INET6)
    {
        _address.v6.sin6_port = htons(port);
    }
    else if (getFamily() == AF_INET)
    {
        _address.v4.sin_port = htons(port);
    }
    return *this;
}

socklen_t SocketAddress::getSockAddrSize() const
{
    return getFamily() == AF_INET6 ? sizeof(sockaddr_in6) : sizeof(sockaddr_in);
}

std::string SocketAddress::ipToString() const
{
    char text[INET6_ADDRSTRLEN] = {};
    const void* source = (getFamily() == AF_INET6) ? static_cast<const void*>(&_address.v6.sin6_addr)
                                                   : static_cast<const void*>(&_address.v4.sin_addr);
    if (empty() || !::inet_ntop(getFamily(), source, text, sizeof(text)))
    {
        return std::string();
    }
    return std::string(text);
}

std::string SocketAddress::toString() const
{
    if (getFamily() == AF_INET6)
    {
        return "[" + ipToString() + "]:" + std::to_string(getPort());
    }
    return ipToString() + ":" + std::to_string(getPort());
}

SocketAddress SocketAddress::parse(const std::string& ip, const uint16_t port)
{
    RawSockAddress address;
    std::memset(&address, 0, sizeof(address));

    if (::inet_pton(AF_INET, ip.c_str(), &address.v4.sin_addr) == 1)
    {
        address.v4.sin_family = AF_INET;
        address.v4.sin_port = htons(port);
    }
    else if (::inet_pton(AF_INET6, ip.c_str(), &address.v6.sin6_addr) == 1)
    {
        address.v6.sin6_family = AF_INET6;
        address.v6.sin6_port = htons(port);
    }
    else
    {
        return SocketAddress();
    }

    return SocketAddress(&address.gen);
}

bool operator==(const SocketAddress& a, const SocketAddress& b)
{
    return a.getFamily() == b.getFamily() && a.getPort() == b.getPort() && a.ipToString() == b.ipToString();
}

bool operator!=(const SocketAddress& a, const SocketAddress& b)
{
    return !(a == b);
}

} // namespace transport
