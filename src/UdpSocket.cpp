#include "UdpSocket.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstdio>
#include <iostream>

using Clock = std::chrono::steady_clock;

namespace gavel {

sockaddr_in Endpoint::to_sockaddr() const {
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_addr.s_addr = ip;
    sa.sin_port = port;
    return sa;
}

std::string Endpoint::to_string() const {
    char buf[INET_ADDRSTRLEN] = {0};
    in_addr a{};
    a.s_addr = ip;
    inet_ntop(AF_INET, &a, buf, sizeof(buf));
    return std::string(buf) + ":" + std::to_string(ntohs(port));
}

Endpoint Endpoint::from_sockaddr(const sockaddr_in& sa) {
    return Endpoint{ sa.sin_addr.s_addr, sa.sin_port };
}

std::optional<Endpoint> Endpoint::parse(const std::string& ipv4, uint16_t port) {
    in_addr a{};
    if (inet_pton(AF_INET, ipv4.c_str(), &a) != 1) return std::nullopt;
    return Endpoint{ a.s_addr, htons(port) };
}

UdpSocket::~UdpSocket() {
    close();
}

bool UdpSocket::open(uint16_t port) {
    fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) { perror("socket"); return false; }

    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = htons(port);
    if (bind(fd, (sockaddr*)&local, sizeof(local)) < 0) {
        perror("bind");
        close();
        return false;
    }
    return true;
}

void UdpSocket::close() {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

bool UdpSocket::send_to(const Endpoint& to, const Bytes& bytes) {
    sockaddr_in sa = to.to_sockaddr();
    ssize_t n = sendto(fd, bytes.data(), bytes.size(), 0, (sockaddr*)&sa, sizeof(sa));
    if (n < 0) { perror("sendto"); return false; }
    if ((size_t)n != bytes.size()) {
        std::cerr << "Partial send!? sent=" << n << " expected=" << bytes.size() << "\n";
        return false;
    }
    return true;
}

bool UdpSocket::recv_from(Endpoint& from, Bytes& out, std::chrono::milliseconds timeout) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    int rc = poll(&pfd, 1, (int)timeout.count());
    if (rc < 0) {
        if (errno != EINTR) perror("poll");
        return false;
    }
    if (rc == 0) return false;

    out.resize(kMaxDatagram);
    sockaddr_in peer{};
    socklen_t alen = sizeof(peer);
    ssize_t n = recvfrom(fd, out.data(), out.size(), 0, (sockaddr*)&peer, &alen);
    if (n < 0) {
        if (errno != EWOULDBLOCK && errno != EAGAIN && errno != EINTR) perror("recvfrom");
        return false;
    }
    out.resize((size_t)n);
    from = Endpoint::from_sockaddr(peer);
    return true;
}

uint16_t UdpSocket::local_port() const {
    sockaddr_in sa{};
    socklen_t sl = sizeof(sa);
    if (getsockname(fd, (sockaddr*)&sa, &sl) == 0) return ntohs(sa.sin_port);
    return 0;
}

UdpLink::UdpLink(UdpSocket& s, const Endpoint& p) : sock(s), peer(p) {}

bool UdpLink::send_datagram(const Bytes& bytes) {
    return sock.send_to(peer, bytes);
}

std::optional<Bytes> UdpLink::recv_datagram(std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() < 0) left = std::chrono::milliseconds(0);

        Endpoint from;
        Bytes buf;
        if (sock.recv_from(from, buf, left)) {
            if (from == peer) return buf;
            continue;
        }
        if (Clock::now() >= deadline) return std::nullopt;
    }
}

} // namespace gavel
