#pragma once
#include <arpa/inet.h>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>

namespace transport
{
typedef union
{
    sockaddr gen;
    sockaddr_in v4;
    sockaddr_in6 v6;
} RawSockAddress;

// IPv4 or IPv6 address and port
class SocketAddress
{
public:
    SocketAddress();
    explicit SocketAddress(const sockaddr* original);
    SocketAddress(uint32_t ipv4, uint16_t port);

    int getFamily() const { return _address.gen.sa_family; }
    uint16_t getPort() const;
    SocketAddress& setPort(uint16_t port);

    const sockaddr* getSockAddr() const { return &_address.gen; }
    socklen_t getSockAddrSize() const;

    std::string ipToString() const;
    std::string toString() const;
    bool empty() const { return _address.gen.sa_family == AF_UNSPEC; }

    // unparsable text gives an empty address
    static SocketAddress parse(const std::string& ip, uint16_t port = 0);

private:
    RawSockAddress _address;
};

bool operator==(const SocketAddress& a, const SocketAddress& b);
bool operator!=(const SocketAddress& a, const SocketAddress& b);

} // namespace transport
