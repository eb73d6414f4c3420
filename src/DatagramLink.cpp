#include "DatagramLink.h"

#include <stdexcept>
#include <utility>

using Clock = std::chrono::steady_clock;

namespace gavel {

QueuedLink::QueuedLink(Sender s) : sender(std::move(s)) {
    if (!sender) throw std::invalid_argument("QueuedLink: sender is empty");
}

void QueuedLink::deliver(Bytes bytes) {
    {
        std::lock_guard<std::mutex> lock(mu);
        if (is_closed) return;
        inbox.push_back(std::move(bytes));
    }
    cv.notify_all();
}

void QueuedLink::close() {
    {
        std::lock_guard<std::mutex> lock(mu);
        is_closed = true;
    }
    cv.notify_all();
}

size_t QueuedLink::pending() const {
    std::lock_guard<std::mutex> lock(mu);
    return inbox.size();
}

bool QueuedLink::closed() const {
    std::lock_guard<std::mutex> lock(mu);
    return is_closed;
}

bool QueuedLink::send_datagram(const Bytes& bytes) {
    return sender(bytes);
}

std::optional<Bytes> QueuedLink::recv_datagram(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu);
    if (!cv.wait_for(lock, timeout, [&] { return is_closed || !inbox.empty(); })) return std::nullopt;
    if (inbox.empty()) return std::nullopt;

    Bytes b = std::move(inbox.front());
    inbox.pop_front();
    return b;
}

FaultInjectingLink::FaultInjectingLink(DatagramLink& in, const FaultProfile& profile)
    : inner(in), P(profile), rng(profile.seed) {}

bool FaultInjectingLink::chance(double p) {
    if (p <= 0.0) return false;
    std::uniform_real_distribution<double> d(0.0, 1.0);
    return d(rng) < p;
}

bool FaultInjectingLink::send_datagram(const Bytes& bytes) {
    if (chance(P.drop)) {
        ++count.dropped;
        return true;
    }

    Bytes out = bytes;
    if (!out.empty() && chance(P.corrupt)) {
        std::uniform_int_distribution<size_t> bit(0, out.size() * 8 - 1);
        size_t b = bit(rng);
        out[b / 8] ^= static_cast<uint8_t>(1u << (b % 8));
        ++count.corrupted;
    }

    // A held datagram is released right after the next one, so the
    // displacement is never more than one position. With a one-bit sequence
    // a copy that lands behind the next sequence number reads as new data,
    // so such a copy is lost instead.
    if (held && out.size() >= 2 && held->size() >= 2 && (*held)[0] == out[0] && (*held)[1] != out[1]) {
        held.reset();
        ++count.dropped;
    }
    if (!held && chance(P.reorder)) {
        held = std::move(out);
        ++count.reordered;
        return true;
    }

    bool ok = inner.send_datagram(out);
    if (chance(P.duplicate)) {
        ++count.duplicated;
        ok = inner.send_datagram(out) && ok;
    }
    if (held) {
        Bytes late = std::move(*held);
        held.reset();
        ok = inner.send_datagram(late) && ok;
    }
    return ok;
}

std::optional<Bytes> FaultInjectingLink::recv_datagram(std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() < 0) left = std::chrono::milliseconds(0);

        auto d = inner.recv_datagram(left);
        if (!d) return std::nullopt;
        if (!chance(P.drop_inbound)) return d;
        ++count.dropped_inbound;
        if (Clock::now() >= deadline) return std::nullopt;
    }
}

} // namespace gavel
