#pragma once

#include "DatagramLink.h"
#include "ReliableChannel.h"
#include "UdpSocket.h"
#include "gavel_types.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gavel {

struct Peer {
    PeerId id = 0;
    Role role = Role::Unassigned;
    Endpoint endpoint;

    std::unique_ptr<QueuedLink> link;           // fed by the server's socket reader
    std::unique_ptr<FaultInjectingLink> lossy;  // only with simulated loss
    std::unique_ptr<ReliableChannel> channel;

    std::string label() const;                  // "Seller (ip:port)", "Buyer 2 (ip:port)"
};

struct Registration {
    Peer* peer = nullptr;                   // null when refused
    Rejection refusal = Rejection::None;
    bool fresh = false;                     // created by this call
};

// First contact becomes the seller, everyone after it a buyer, until the
// bidding window closes. One registrar per auction run; it owns every Peer
// and its channel for the lifetime of the server.
class RoleRegistrar {
public:
    using DatagramSender = std::function<bool(const Endpoint&, const Bytes&)>;

    RoleRegistrar(DatagramSender sender, ChannelOptions opts, size_t max_buyers = 0,
                  FaultProfile faults = FaultProfile{});

    RoleRegistrar(const RoleRegistrar&) = delete;
    RoleRegistrar& operator=(const RoleRegistrar&) = delete;

    // Idempotent for an endpoint that is already registered.
    Registration register_connection(const Endpoint& from);

    Peer* find(const Endpoint& from) const;
    Peer* find(PeerId id) const;
    Peer* seller() const;

    // Rejects every later newcomer with AuctionClosed.
    void close();
    bool closed() const;

    std::vector<Peer*> peers() const;
    size_t buyer_count() const;

private:
    Peer* create(Role role, PeerId id, const Endpoint& from);

    DatagramSender sender;
    ChannelOptions opts;
    size_t max_buyers;
    FaultProfile faults;

    mutable std::mutex mu;
    bool is_closed = false;
    Peer* seller_slot = nullptr;
    PeerId next_buyer = 1;
    std::vector<std::unique_ptr<Peer>> all;
    std::unordered_map<Endpoint, Peer*, EndpointHash> by_endpoint;
};

} // namespace gavel
