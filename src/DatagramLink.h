#pragma once

#include "gavel_protocol.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <random>

namespace gavel {

// One peer's view of an unreliable datagram transport.
class DatagramLink {
public:
    virtual ~DatagramLink() = default;

    virtual bool send_datagram(const Bytes& bytes) = 0;

    // Waits up to `timeout` for the next datagram from the peer.
    // nullopt on timeout or once the link is closed.
    virtual std::optional<Bytes> recv_datagram(std::chrono::milliseconds timeout) = 0;

    // True once nothing more can arrive.
    virtual bool closed() const { return false; }
};

// Inbound datagrams are pushed by someone else (the server's socket reader,
// or the other end of an in-memory pair); outbound ones go to `sender`.
class QueuedLink : public DatagramLink {
public:
    using Sender = std::function<bool(const Bytes&)>;

    explicit QueuedLink(Sender sender);

    QueuedLink(const QueuedLink&) = delete;
    QueuedLink& operator=(const QueuedLink&) = delete;

    void deliver(Bytes bytes);
    void close();
    size_t pending() const;
    bool closed() const override;

    bool send_datagram(const Bytes& bytes) override;
    std::optional<Bytes> recv_datagram(std::chrono::milliseconds timeout) override;

private:
    Sender sender;
    mutable std::mutex mu;
    std::condition_variable cv;
    std::deque<Bytes> inbox;
    bool is_closed = false;
};

struct FaultProfile {
    double drop = 0.0;        // outbound datagrams silently lost
    double duplicate = 0.0;   // outbound datagrams sent twice
    double corrupt = 0.0;     // one bit flipped in an outbound datagram
    double reorder = 0.0;     // outbound datagram held back until after the next one
    double drop_inbound = 0.0;
    uint32_t seed = 1;

    bool any() const {
        return drop > 0 || duplicate > 0 || corrupt > 0 || reorder > 0 || drop_inbound > 0;
    }
    static FaultProfile loss(double rate, uint32_t seed) {
        FaultProfile p;
        p.drop = rate;
        p.drop_inbound = rate;
        p.seed = seed;
        return p;
    }
};

// Decorator that damages traffic below a channel. Used by tests and by the
// --loss option of the binaries.
class FaultInjectingLink : public DatagramLink {
public:
    FaultInjectingLink(DatagramLink& inner, const FaultProfile& profile);

    bool send_datagram(const Bytes& bytes) override;
    std::optional<Bytes> recv_datagram(std::chrono::milliseconds timeout) override;
    bool closed() const override { return inner.closed(); }

    struct Counters {
        uint64_t dropped = 0;
        uint64_t duplicated = 0;
        uint64_t corrupted = 0;
        uint64_t reordered = 0;
        uint64_t dropped_inbound = 0;
    };
    const Counters& counters() const { return count; }

private:
    bool chance(double p);

    DatagramLink& inner;
    FaultProfile P;
    std::mt19937 rng;
    std::optional<Bytes> held;
    Counters count;
};

} // namespace gavel
