#pragma once

#include <cstdint>
#include <netinet/in.h>
#include <optional>
#include <string>

namespace apisim {
namespace network {

// IPv4 endpoint.
class InetAddress {
public:
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);
    explicit InetAddress(const struct sockaddr_in& addr)
        : addr_(addr) {}

    // Numeric dotted-quad only; nullopt when ip is not a valid IPv4 literal.
    static std::optional<InetAddress> FromIp(const std::string& ip, uint16_t port);
    // Blocking getaddrinfo lookup (IPv4). Used once per forwarder at startup.
    static std::optional<InetAddress> Resolve(const std::string& host, uint16_t port);

    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }

private:
    struct sockaddr_in addr_;
};

} // namespace network
} // namespace apisim
