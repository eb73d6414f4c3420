#pragma once

#include "AuctionCoordinator.h"
#include "RoleRegistrar.h"
#include "UdpSocket.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace gavel {

struct ServerArgs {
    uint16_t port = 5000;          // UDP port to bind (0 = ephemeral)
    int rto_ms = 250;              // retransmission timeout
    int retries = 20;              // retransmissions before a peer is unresponsive
    size_t max_buyers = 0;         // 0 = unlimited
    double loss = 0.0;             // simulated datagram loss rate
    uint32_t seed = 1;             // loss simulation seed
    int poll_ms = 50;              // how often peer threads look at the auction state
    bool trace = false;
};

// Hosts one auction over one UDP socket. A reader thread demultiplexes
// datagrams by source address into per-peer mailboxes; every peer is served
// by its own thread that owns the peer's channel.
class AuctionServer {
public:
    explicit AuctionServer(const ServerArgs& args);
    ~AuctionServer();

    AuctionServer(const AuctionServer&) = delete;
    AuctionServer& operator=(const AuctionServer&) = delete;

    bool init();

    // Runs the auction to completion. false if the seller was lost before
    // submitting an item.
    bool run();

    uint16_t local_port() const { return sock.local_port(); }
    const AuctionCoordinator& coordinator() const { return coord; }
    const RoleRegistrar& registrar() const { return reg; }

private:
    void dispatch_loop();
    void serve(Peer& p);
    void serve_seller(Peer& p);
    void serve_buyer(Peer& p);
    bool greet(Peer& p);
    bool deliver_result(Peer& p);
    void hand_off(Peer& seller);
    void send_rst(const Endpoint& to, Rejection why);
    void join_workers();
    void shutdown();

    ServerArgs A;
    UdpSocket sock;
    RoleRegistrar reg;
    AuctionCoordinator coord;

    std::atomic<bool> stopping{false};
    std::thread reader;
    std::mutex workers_mu;
    std::vector<std::thread> workers;
};

} // namespace gavel
