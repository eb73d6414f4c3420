#pragma once

#include "DatagramLink.h"
#include "ReliableChannel.h"
#include "UdpSocket.h"
#include "gavel_messages.h"
#include "gavel_types.h"

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gavel {

struct ClientArgs {
    std::string server = "127.0.0.1";          // auctioneer IPv4
    uint16_t port = 5000;                      // auctioneer UDP port

    // Seller
    std::string item;                          // empty: prompt on stdin
    uint32_t reserve = 0;
    AuctionType type = AuctionType::FirstPrice;
    int duration_ms = 30000;                   // bidding window
    int close_after_ms = 0;                    // >0: ask the server to close early
    std::string file;                          // item-detail payload; empty: the item name

    // Buyer
    std::vector<uint32_t> bids;                // empty: read bids from stdin
    std::string out = "recved.file";           // where the won item details go

    int rto_ms = 250;
    int retries = 20;
    double loss = 0.0;                         // simulated datagram loss rate
    uint32_t seed = 1;
    bool trace = false;
};

class AuctionClient {
public:
    explicit AuctionClient(const ClientArgs& args);
    ~AuctionClient();

    AuctionClient(const AuctionClient&) = delete;
    AuctionClient& operator=(const AuctionClient&) = delete;

    bool init();
    bool run();

    Role role() const { return my_role; }
    const std::optional<Message>& result() const { return final_result; }
    bool handoff_ok() const { return handoff_done; }
    const Bytes& received() const { return payload_in; }

private:
    bool run_seller();
    bool run_buyer();
    bool read_item(AuctionItem& item);
    std::optional<uint32_t> next_bid(bool& exhausted);
    void read_stdin_in_background();
    std::optional<std::string> typed_line(bool& eof);
    std::optional<Message> await(std::chrono::milliseconds timeout);
    Bytes item_details(const AuctionItem& item) const;
    bool receive_item_details();
    void linger();

    ClientArgs A;
    UdpSocket sock;
    std::unique_ptr<UdpLink> link;
    std::unique_ptr<FaultInjectingLink> lossy;
    std::unique_ptr<ReliableChannel> ch;

    Role my_role = Role::Unassigned;
    std::optional<Message> final_result;
    bool handoff_done = false;
    Bytes payload_in;
    size_t next_arg_bid = 0;

    // Lines typed by the user; filled by a detached reader so the channel
    // keeps answering the server while nobody types.
    struct Lines {
        std::mutex mu;
        std::deque<std::string> queue;
        bool eof = false;
    };
    std::shared_ptr<Lines> typed;
};

} // namespace gavel
