#include "ReliableChannel.h"

#include <iostream>
#include <stdexcept>
#include <utility>

using Clock = std::chrono::steady_clock;

namespace gavel {

namespace {

std::chrono::milliseconds until(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

} // namespace

const char* to_string(SendStatus s) {
    switch (s) {
    case SendStatus::Delivered: return "delivered";
    case SendStatus::PeerUnresponsive: return "peer unresponsive";
    case SendStatus::Refused: return "refused";
    }
    return "?";
}

ReliableChannel::ReliableChannel(DatagramLink& l, ChannelOptions o) : link(l), opts(std::move(o)) {
    if (opts.rto_ms <= 0) throw std::invalid_argument("ReliableChannel: rto_ms must be > 0");
    if (opts.retries < 0) throw std::invalid_argument("ReliableChannel: retries must be >= 0");
    if (opts.max_payload < 1 || opts.max_payload > kMaxDatagram - sizeof(SegmentHeader))
        throw std::invalid_argument("ReliableChannel: max_payload out of range");
}

std::chrono::milliseconds ReliableChannel::give_up_time() const {
    return std::chrono::milliseconds(static_cast<int64_t>(opts.rto_ms) * (opts.retries + 1));
}

SendStatus ReliableChannel::send(const Bytes& payload) {
    if (payload.size() > opts.max_payload)
        throw std::invalid_argument("ReliableChannel::send: payload larger than max_payload");
    if (reset) return SendStatus::Refused;
    if (dead) return SendStatus::PeerUnresponsive;

    Segment seg;
    seg.type = SEG_DATA;
    seg.seq = send_bit;
    seg.payload = payload;
    const Bytes wire = encode_segment(seg);

    for (int attempt = 0; attempt <= opts.retries; ++attempt) {
        if (!link.send_datagram(wire)) {
            std::cerr << "[" << opts.name << "] link refused DATA seq=" << (int)to_wire(send_bit) << "\n";
        }
        ++st.transmissions;
        if (attempt > 0) ++st.retransmissions;

        if (opts.trace) {
            std::cerr << "[" << opts.name << "] DATA seq=" << (int)to_wire(send_bit)
                      << " len=" << payload.size() << " (try " << (attempt + 1) << ")\n";
        }

        auto deadline = Clock::now() + std::chrono::milliseconds(opts.rto_ms);
        while (Clock::now() < deadline) {
            auto d = link.recv_datagram(until(deadline));
            if (!d) break;

            bool acked = false;
            uint8_t type = process(*d, send_bit, acked);
            if (acked) {
                send_bit = flip(send_bit);
                return SendStatus::Delivered;
            }
            if (type == SEG_RST) return SendStatus::Refused;
        }
        if (opts.trace) {
            std::cerr << "[" << opts.name << "]   timeout waiting ACK seq=" << (int)to_wire(send_bit)
                      << " -> retransmit\n";
        }
    }

    dead = true;
    std::cerr << "[" << opts.name << "] no ACK for seq=" << (int)to_wire(send_bit) << " after "
              << (opts.retries + 1) << " tries, peer unresponsive\n";
    return SendStatus::PeerUnresponsive;
}

std::optional<Bytes> ReliableChannel::receive(std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    while (inbox.empty() && !reset) {
        auto d = link.recv_datagram(until(deadline));
        if (!d) break;

        bool acked = false;
        process(*d, std::nullopt, acked);
        if (Clock::now() >= deadline && inbox.empty()) break;
    }
    if (inbox.empty()) return std::nullopt;

    Bytes b = std::move(inbox.front());
    inbox.pop_front();
    return b;
}

void ReliableChannel::linger(std::chrono::milliseconds period) {
    auto deadline = Clock::now() + period;
    while (Clock::now() < deadline) {
        auto d = link.recv_datagram(until(deadline));
        if (!d) {
            if (link.closed()) break;
            continue;
        }
        bool acked = false;
        process(*d, std::nullopt, acked);
    }
}

uint8_t ReliableChannel::process(const Bytes& datagram, std::optional<SeqBit> awaiting_ack, bool& acked) {
    auto s = decode_segment(datagram);
    if (!s) {
        // Corruption looks exactly like loss to the sender
        ++st.dropped;
        if (opts.trace) std::cerr << "[" << opts.name << "] bad segment dropped\n";
        return 0;
    }

    switch (s->type) {
    case SEG_DATA:
        on_data(*s);
        break;
    case SEG_ACK:
        if (awaiting_ack && s->seq == *awaiting_ack) {
            acked = true;
            if (opts.trace) std::cerr << "[" << opts.name << "] ACK seq=" << (int)to_wire(s->seq) << "\n";
        } else {
            ++st.stale_acks;
            if (opts.trace) std::cerr << "[" << opts.name << "] stale ACK seq=" << (int)to_wire(s->seq) << " ignored\n";
        }
        break;
    case SEG_RST:
        reset = true;
        reset_reason = s->payload.empty() ? Rejection::None : static_cast<Rejection>(s->payload[0]);
        std::cerr << "[" << opts.name << "] RST received (" << to_string(reset_reason) << ")\n";
        break;
    }
    return s->type;
}

void ReliableChannel::on_data(const Segment& s) {
    if (s.seq == expect_bit) {
        inbox.push_back(s.payload);
        expect_bit = flip(expect_bit);
        delivered_any = true;
        ++st.delivered;
        send_ack(s.seq);
        if (opts.trace) {
            std::cerr << "[" << opts.name << "] DATA seq=" << (int)to_wire(s.seq)
                      << " len=" << s.payload.size() << " -> delivered\n";
        }
    } else if (delivered_any) {
        // Copy of the segment delivered last; its ACK was lost
        ++st.duplicates;
        send_ack(s.seq);
        if (opts.trace) std::cerr << "[" << opts.name << "] duplicate DATA seq=" << (int)to_wire(s.seq) << " -> re-ACK\n";
    } else if (opts.trace) {
        std::cerr << "[" << opts.name << "] DATA seq=" << (int)to_wire(s.seq)
                  << " before first delivery -> ignoring (no ACK)\n";
    }
}

void ReliableChannel::send_ack(SeqBit bit) {
    Segment ack;
    ack.type = SEG_ACK;
    ack.seq = bit;
    if (!link.send_datagram(encode_segment(ack))) {
        std::cerr << "[" << opts.name << "] failed to send ACK seq=" << (int)to_wire(bit) << "\n";
    }
}

} // namespace gavel
