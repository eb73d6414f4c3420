#pragma once

#include "DatagramLink.h"

#include <netinet/in.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace gavel {

struct Endpoint {
    uint32_t ip = 0;   // network order
    uint16_t port = 0; // network order

    bool operator==(const Endpoint& o) const { return ip == o.ip && port == o.port; }
    bool operator!=(const Endpoint& o) const { return !(*this == o); }

    sockaddr_in to_sockaddr() const;
    std::string to_string() const;

    static Endpoint from_sockaddr(const sockaddr_in& sa);
    static std::optional<Endpoint> parse(const std::string& ipv4, uint16_t port);
};

struct EndpointHash {
    size_t operator()(const Endpoint& k) const {
        return static_cast<size_t>(k.ip) * 1315423911u + k.port;
    }
};

// IPv4 UDP socket. Safe to send from several threads while one thread reads.
class UdpSocket {
public:
    UdpSocket() = default;
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    // Binds INADDR_ANY:port; port 0 picks an ephemeral port.
    bool open(uint16_t port);
    void close();
    bool is_open() const { return fd >= 0; }

    bool send_to(const Endpoint& to, const Bytes& bytes);

    // false on timeout or error
    bool recv_from(Endpoint& from, Bytes& out, std::chrono::milliseconds timeout);

    uint16_t local_port() const;

private:
    int fd = -1;
};

// Client side: one socket talking to one server endpoint. Datagrams from any
// other source are discarded.
class UdpLink : public DatagramLink {
public:
    UdpLink(UdpSocket& sock, const Endpoint& peer);

    bool send_datagram(const Bytes& bytes) override;
    std::optional<Bytes> recv_datagram(std::chrono::milliseconds timeout) override;

private:
    UdpSocket& sock;
    Endpoint peer;
};

} // namespace gavel
