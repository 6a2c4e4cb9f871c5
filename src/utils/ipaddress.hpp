#ifndef IP_ADDRESS_HPP
#define IP_ADDRESS_HPP
#include <arpa/inet.h>  // htonl(), htons(), ntohl(), ntohs()
#include <netinet/in.h> // sockaddr_in, sockaddr_in6
#include <sys/socket.h> // struct sockaddr, struct sockaddr_storage, AF_INET, AF_INET6
#include <string>
#include <stdint.h>
#include <stddef.h>
#include <cstring>

namespace cpp_rtmp
{
    // port is returned in host order
    inline std::string GetIpStr(const struct sockaddr *sa, uint16_t& port) {
        const socklen_t maxlen = 64;
        char s[maxlen];

        if (!sa) {
            return "";
        }

        std::memset(s, 0, maxlen);
        switch(sa->sa_family) {
            case AF_INET:
                inet_ntop(AF_INET, &(((struct sockaddr_in *)sa)->sin_addr),
                        s, maxlen);
                port = ntohs(((struct sockaddr_in *)sa)->sin_port);
                break;

            case AF_INET6:
                inet_ntop(AF_INET6, &(((struct sockaddr_in6 *)sa)->sin6_addr),
                        s, maxlen);
                port = ntohs(((struct sockaddr_in6 *)sa)->sin6_port);
                break;
        }

        return std::string(s);
    }

    inline bool IsIPv6(const std::string& ip) {
        struct in6_addr addr;
        return inet_pton(AF_INET6, ip.c_str(), &addr) == 1;
    }

    // decimal port in [1, 65535]
    inline bool ParsePort(const std::string& str, uint16_t& port) {
        uint32_t value = 0;

        if (str.empty() || str.length() > 5) {
            return false;
        }
        for (size_t i = 0; i < str.length(); i++) {
            if (str[i] < '0' || str[i] > '9') {
                return false;
            }
            value = value * 10 + (uint32_t)(str[i] - '0');
        }
        if (value == 0 || value > 65535) {
            return false;
        }
        port = (uint16_t)value;
        return true;
    }
}
#endif
