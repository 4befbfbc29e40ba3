#ifndef NETWORK_UTILS_HPP
#define NETWORK_UTILS_HPP

#include <string>
#include <cstring>
#include <fcntl.h>
#include <arpa/inet.h>
#include <sys/socket.h>

// Detect if an address string is IPv6
inline bool is_ipv6(const std::string &addr)
{
    struct in6_addr result;
    return inet_pton(AF_INET6, addr.c_str(), &result) == 1;
}

// Setup sockaddr_storage for a given address and port
inline void setup_sockaddr(sockaddr_storage &addr_storage, socklen_t &addr_len,
                           const std::string &addr, int port)
{
    memset(&addr_storage, 0, sizeof(addr_storage));

    if (is_ipv6(addr))
    {
        sockaddr_in6 *addr6 = (sockaddr_in6 *)&addr_storage;
        addr6->sin6_family = AF_INET6;
        addr6->sin6_port = htons(port);
        inet_pton(AF_INET6, addr.c_str(), &addr6->sin6_addr);
        addr_len = sizeof(sockaddr_in6);
    }
    else
    {
        sockaddr_in *addr4 = (sockaddr_in *)&addr_storage;
        addr4->sin_family = AF_INET;
        addr4->sin_port = htons(port);
        inet_pton(AF_INET, addr.c_str(), &addr4->sin_addr);
        addr_len = sizeof(sockaddr_in);
    }
}

inline bool set_nonblocking(int fd)
{
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0)
        return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// "host:port", with brackets around IPv6 literals
inline std::string join_host_port(const std::string &host, int port)
{
    if (is_ipv6(host))
        return "[" + host + "]:" + std::to_string(port);
    return host + ":" + std::to_string(port);
}

// Last octet of a dotted IPv4 address, 0 when the string is not one
inline int last_octet(const std::string &ip)
{
    struct in_addr parsed;
    if (inet_pton(AF_INET, ip.c_str(), &parsed) != 1)
        return 0;
    return ntohl(parsed.s_addr) & 0xff;
}

#endif
