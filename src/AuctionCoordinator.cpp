#include "AuctionCoordinator.h"

#include <algorithm>

namespace gavel {

const char* to_string(AuctionState s) {
    switch (s) {
    case AuctionState::AwaitingItem: return "AwaitingItem";
    case AuctionState::BiddingOpen: return "BiddingOpen";
    case AuctionState::BiddingClosed: return "BiddingClosed";
    case AuctionState::ResultAnnounced: return "ResultAnnounced";
    case AuctionState::Done: return "Done";
    case AuctionState::Aborted: return "Aborted";
    }
    return "?";
}

void AuctionCoordinator::set_state(AuctionState s) {
    st = s;
    cv.notify_all();
}

Rejection AuctionCoordinator::submit_item(const AuctionItem& item, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mu);
    if (st != AuctionState::AwaitingItem) return Rejection::NotOpen;
    if (item.name.empty() || item.duration.count() <= 0) return Rejection::Malformed;

    offer = item;
    deadline = now + item.duration;
    set_state(AuctionState::BiddingOpen);
    return Rejection::None;
}

BidDecision AuctionCoordinator::submit_bid(PeerId buyer, uint32_t amount, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mu);

    BidDecision d;
    if (st == AuctionState::AwaitingItem) {
        d.reason = Rejection::NotOpen;
        return d;
    }
    if (st == AuctionState::BiddingOpen && now >= deadline) close_locked();
    if (st != AuctionState::BiddingOpen || gone.count(buyer)) {
        d.reason = Rejection::AuctionClosed;
        return d;
    }

    std::vector<Bid> standing = live_locked();
    auto own = live.find(buyer);
    uint32_t best = 0;
    for (auto& b : standing) best = std::max(best, b.amount);

    bool ok = amount > 0 && amount >= offer->reserve;
    if (ok && offer->type == AuctionType::FirstPrice && !standing.empty()) {
        ok = amount > best;
    }
    if (ok && offer->type == AuctionType::SecondPrice && own != live.end()) {
        ok = amount > accepted[own->second].amount;
    }

    if (!ok) {
        d.reason = Rejection::InvalidBid;
        if (offer->type == AuctionType::FirstPrice) d.standing = best;
        else if (own != live.end()) d.standing = accepted[own->second].amount;
        return d;
    }

    accepted.push_back(Bid{ buyer, amount, next_order++ });
    live[buyer] = accepted.size() - 1;
    d.accepted = true;
    d.standing = amount;
    return d;
}

bool AuctionCoordinator::close_bidding() {
    std::lock_guard<std::mutex> lock(mu);
    return close_locked();
}

bool AuctionCoordinator::expire(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mu);
    if (st != AuctionState::BiddingOpen || now < deadline) return false;
    return close_locked();
}

bool AuctionCoordinator::close_locked() {
    if (st != AuctionState::BiddingOpen) return false;
    outcome = compute_locked();
    set_state(AuctionState::BiddingClosed);
    return true;
}

void AuctionCoordinator::abort(const std::string& why) {
    std::lock_guard<std::mutex> lock(mu);
    if (st != AuctionState::AwaitingItem) return;
    why_aborted = why;
    set_state(AuctionState::Aborted);
}

AuctionState AuctionCoordinator::wait_for_close() {
    std::unique_lock<std::mutex> lock(mu);
    cv.wait(lock, [&] { return st != AuctionState::AwaitingItem; });

    while (st == AuctionState::BiddingOpen) {
        if (!cv.wait_until(lock, deadline, [&] { return st != AuctionState::BiddingOpen; })) {
            close_locked();
        }
    }
    return st;
}

void AuctionCoordinator::withdraw(PeerId peer) {
    std::lock_guard<std::mutex> lock(mu);
    gone.insert(peer);
    if (pending.erase(peer)) {
        failed.push_back(peer);
        if (pending.empty() && st == AuctionState::ResultAnnounced) set_state(AuctionState::Done);
    }
}

bool AuctionCoordinator::withdrawn(PeerId peer) const {
    std::lock_guard<std::mutex> lock(mu);
    return gone.count(peer) > 0;
}

AuctionResult AuctionCoordinator::announce(const std::vector<PeerId>& recipients) {
    std::lock_guard<std::mutex> lock(mu);
    if (st != AuctionState::BiddingClosed) return outcome;

    for (PeerId p : recipients) {
        if (!gone.count(p)) pending.insert(p);
    }
    set_state(pending.empty() ? AuctionState::Done : AuctionState::ResultAnnounced);
    return outcome;
}

void AuctionCoordinator::report_delivery(PeerId peer, bool delivered) {
    std::lock_guard<std::mutex> lock(mu);
    if (!pending.erase(peer)) return;
    if (!delivered) failed.push_back(peer);
    if (pending.empty() && st == AuctionState::ResultAnnounced) set_state(AuctionState::Done);
}

bool AuctionCoordinator::wait_done(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu);
    return cv.wait_for(lock, timeout, [&] { return st == AuctionState::Done; });
}

AuctionState AuctionCoordinator::state() const {
    std::lock_guard<std::mutex> lock(mu);
    return st;
}

std::optional<AuctionItem> AuctionCoordinator::item() const {
    std::lock_guard<std::mutex> lock(mu);
    return offer;
}

AuctionResult AuctionCoordinator::result() const {
    std::lock_guard<std::mutex> lock(mu);
    return outcome;
}

std::vector<Bid> AuctionCoordinator::bids() const {
    std::lock_guard<std::mutex> lock(mu);
    return accepted;
}

std::vector<Bid> AuctionCoordinator::live_bids() const {
    std::lock_guard<std::mutex> lock(mu);
    return live_locked();
}

std::vector<Bid> AuctionCoordinator::live_locked() const {
    std::vector<Bid> out;
    for (auto& kv : live) {
        if (!gone.count(kv.first)) out.push_back(accepted[kv.second]);
    }
    std::sort(out.begin(), out.end(), [](const Bid& a, const Bid& b) { return a.order < b.order; });
    return out;
}

AuctionResult AuctionCoordinator::compute_locked() const {
    std::vector<Bid> standing = live_locked();
    AuctionResult r;
    if (standing.empty()) return r;

    // Highest first; equal amounts keep arrival order
    std::stable_sort(standing.begin(), standing.end(),
                     [](const Bid& a, const Bid& b) { return a.amount > b.amount; });

    r.winner = standing[0].buyer;
    if (offer->type == AuctionType::SecondPrice && standing.size() > 1) {
        r.price = standing[1].amount;
    } else {
        r.price = standing[0].amount;
    }
    return r;
}

std::chrono::milliseconds AuctionCoordinator::time_left(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mu);
    if (st != AuctionState::BiddingOpen || now >= deadline) return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
}

std::vector<PeerId> AuctionCoordinator::unreachable() const {
    std::lock_guard<std::mutex> lock(mu);
    return failed;
}

std::string AuctionCoordinator::abort_reason() const {
    std::lock_guard<std::mutex> lock(mu);
    return why_aborted;
}

} // namespace gavel
