#include "RoleRegistrar.h"

#include <stdexcept>
#include <utility>

namespace gavel {

std::string Peer::label() const {
    if (role == Role::Seller) return "Seller (" + endpoint.to_string() + ")";
    return "Buyer " + std::to_string(id) + " (" + endpoint.to_string() + ")";
}

RoleRegistrar::RoleRegistrar(DatagramSender s, ChannelOptions o, size_t max, FaultProfile f)
    : sender(std::move(s)), opts(std::move(o)), max_buyers(max), faults(f) {
    if (!sender) throw std::invalid_argument("RoleRegistrar: sender is empty");
}

Registration RoleRegistrar::register_connection(const Endpoint& from) {
    std::lock_guard<std::mutex> lock(mu);

    Registration r;
    auto it = by_endpoint.find(from);
    if (it != by_endpoint.end()) {
        r.peer = it->second;
        return r;
    }

    if (is_closed) {
        r.refusal = Rejection::AuctionClosed;
        return r;
    }

    if (!seller_slot) {
        seller_slot = create(Role::Seller, kSellerId, from);
        r.peer = seller_slot;
    } else {
        if (max_buyers > 0 && next_buyer > max_buyers) {
            r.refusal = Rejection::AuctionFull;
            return r;
        }
        r.peer = create(Role::Buyer, next_buyer++, from);
    }
    r.fresh = true;
    return r;
}

Peer* RoleRegistrar::create(Role role, PeerId id, const Endpoint& from) {
    auto p = std::make_unique<Peer>();
    p->id = id;
    p->role = role;
    p->endpoint = from;

    DatagramSender out = sender;
    p->link = std::make_unique<QueuedLink>([out, from](const Bytes& b) { return out(from, b); });

    ChannelOptions co = opts;
    co.name = p->label();

    DatagramLink* below = p->link.get();
    if (faults.any()) {
        FaultProfile fp = faults;
        fp.seed = faults.seed + id;
        p->lossy = std::make_unique<FaultInjectingLink>(*p->link, fp);
        below = p->lossy.get();
    }
    p->channel = std::make_unique<ReliableChannel>(*below, co);

    Peer* raw = p.get();
    by_endpoint[from] = raw;
    all.push_back(std::move(p));
    return raw;
}

Peer* RoleRegistrar::find(const Endpoint& from) const {
    std::lock_guard<std::mutex> lock(mu);
    auto it = by_endpoint.find(from);
    return it == by_endpoint.end() ? nullptr : it->second;
}

Peer* RoleRegistrar::find(PeerId id) const {
    std::lock_guard<std::mutex> lock(mu);
    for (auto& p : all) {
        if (p->id == id) return p.get();
    }
    return nullptr;
}

Peer* RoleRegistrar::seller() const {
    std::lock_guard<std::mutex> lock(mu);
    return seller_slot;
}

void RoleRegistrar::close() {
    std::lock_guard<std::mutex> lock(mu);
    is_closed = true;
}

bool RoleRegistrar::closed() const {
    std::lock_guard<std::mutex> lock(mu);
    return is_closed;
}

std::vector<Peer*> RoleRegistrar::peers() const {
    std::lock_guard<std::mutex> lock(mu);
    std::vector<Peer*> out;
    out.reserve(all.size());
    for (auto& p : all) out.push_back(p.get());
    return out;
}

size_t RoleRegistrar::buyer_count() const {
    std::lock_guard<std::mutex> lock(mu);
    return next_buyer - 1;
}

} // namespace gavel
