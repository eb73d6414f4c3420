#pragma once

#include "DatagramLink.h"
#include "gavel_protocol.h"
#include "gavel_types.h"

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>

namespace gavel {

struct ChannelOptions {
    int rto_ms = 250;                       // fixed retransmission timeout
    int retries = 20;                       // retransmissions before PeerUnresponsive
    size_t max_payload = kMaxSegmentPayload;
    bool trace = false;                     // log every segment to stderr
    std::string name = "peer";              // label used in log lines
};

enum class SendStatus {
    Delivered,
    PeerUnresponsive,   // retry budget exhausted
    Refused,            // peer answered with RST
};

const char* to_string(SendStatus s);

// Exactly-once, in-order delivery of opaque payloads to one peer, using
// stop-and-wait ARQ with an alternating sequence bit. Both directions share
// the link: DATA arriving while a send is waiting for its ACK is delivered
// and acknowledged as usual.
//
// Not thread-safe; one flow of control drives a channel at a time.
class ReliableChannel {
public:
    ReliableChannel(DatagramLink& link, ChannelOptions opts);

    ReliableChannel(const ReliableChannel&) = delete;
    ReliableChannel& operator=(const ReliableChannel&) = delete;

    // Blocks until the payload is acknowledged or the retry budget runs out.
    // Throws std::invalid_argument if the payload exceeds max_payload.
    SendStatus send(const Bytes& payload);

    // Next in-order payload, or nullopt if none arrives within `timeout`.
    std::optional<Bytes> receive(std::chrono::milliseconds timeout);

    // Keeps answering retransmissions for `period`; call before going away
    // so a lost final ACK does not strand the other side.
    void linger(std::chrono::milliseconds period);

    // Upper bound on how long the peer may keep retransmitting one segment.
    std::chrono::milliseconds give_up_time() const;

    bool unresponsive() const { return dead; }
    bool refused() const { return reset; }
    Rejection refusal() const { return reset_reason; }
    const ChannelOptions& options() const { return opts; }

    struct Stats {
        uint64_t transmissions = 0;     // DATA segments put on the wire, first tries included
        uint64_t retransmissions = 0;
        uint64_t delivered = 0;         // payloads handed up
        uint64_t duplicates = 0;        // DATA re-acknowledged without delivery
        uint64_t stale_acks = 0;
        uint64_t dropped = 0;           // malformed or corrupt segments
    };
    const Stats& stats() const { return st; }

private:
    // Returns the segment type handled, or 0 if the datagram was dropped.
    uint8_t process(const Bytes& datagram, std::optional<SeqBit> awaiting_ack, bool& acked);
    void on_data(const Segment& s);
    void send_ack(SeqBit bit);

    DatagramLink& link;
    ChannelOptions opts;

    SeqBit send_bit = SeqBit::Zero;
    SeqBit expect_bit = SeqBit::Zero;
    bool delivered_any = false;

    std::deque<Bytes> inbox;   // delivered, not yet handed to receive()
    bool dead = false;
    bool reset = false;
    Rejection reset_reason = Rejection::None;
    Stats st;
};

} // namespace gavel
