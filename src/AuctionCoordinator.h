#pragma once

#include "gavel_types.h"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace gavel {

enum class AuctionState {
    AwaitingItem,
    BiddingOpen,
    BiddingClosed,
    ResultAnnounced,
    Done,
    Aborted,        // seller lost before an item was submitted
};

const char* to_string(AuctionState s);

struct BidDecision {
    bool accepted = false;
    Rejection reason = Rejection::None;
    uint32_t standing = 0;   // best live bid (first-price) or the buyer's own live bid (second-price)
};

// The auction state machine. Every mutation happens under one mutex, so bid
// acceptance is serialized no matter which peer's thread submits. Time is
// passed in by the caller; the server uses steady_clock::now().
//
//   AwaitingItem -> BiddingOpen -> BiddingClosed -> ResultAnnounced -> Done
//
// Bid rules: the first bid must reach the reserve. A first-price auction is
// open and ascending, so later bids must beat the current best. A
// second-price auction is sealed, so a bid must reach the reserve and beat
// the same buyer's previous bid. Either way a buyer's latest accepted bid
// supersedes its earlier ones.
class AuctionCoordinator {
public:
    using Clock = std::chrono::steady_clock;

    AuctionCoordinator() = default;

    AuctionCoordinator(const AuctionCoordinator&) = delete;
    AuctionCoordinator& operator=(const AuctionCoordinator&) = delete;

    // None on success; NotOpen if an item was already taken; Malformed for an
    // empty name or a non-positive duration.
    Rejection submit_item(const AuctionItem& item, Clock::time_point now);

    BidDecision submit_bid(PeerId buyer, uint32_t amount, Clock::time_point now);

    // Seller-initiated close. True only for the call that closed bidding;
    // the timer and the seller can race and exactly one of them wins.
    bool close_bidding();

    // Closes bidding if the deadline has passed.
    bool expire(Clock::time_point now);

    // Fatal for the auction: the seller went away before submitting.
    void abort(const std::string& why);

    // Blocks until bidding is over (closing it when the deadline passes) or
    // the auction was aborted. Returns BiddingClosed or a later state, or
    // Aborted.
    AuctionState wait_for_close();

    // A peer left (unresponsive). While bidding is open a withdrawn buyer's
    // bids stop counting; after the announcement its delivery counts as failed.
    void withdraw(PeerId peer);
    bool withdrawn(PeerId peer) const;

    // BiddingClosed -> ResultAnnounced. `recipients` are the peers that must
    // acknowledge (or fail) the result before the auction is Done.
    AuctionResult announce(const std::vector<PeerId>& recipients);
    void report_delivery(PeerId peer, bool delivered);
    bool wait_done(std::chrono::milliseconds timeout);

    AuctionState state() const;
    std::optional<AuctionItem> item() const;
    AuctionResult result() const;
    std::vector<Bid> bids() const;        // every accepted bid, arrival order
    std::vector<Bid> live_bids() const;   // latest bid per active buyer, arrival order
    std::chrono::milliseconds time_left(Clock::time_point now) const;
    std::vector<PeerId> unreachable() const;
    std::string abort_reason() const;

private:
    bool close_locked();
    std::vector<Bid> live_locked() const;
    AuctionResult compute_locked() const;
    void set_state(AuctionState s);

    mutable std::mutex mu;
    std::condition_variable cv;

    AuctionState st = AuctionState::AwaitingItem;
    std::optional<AuctionItem> offer;
    Clock::time_point deadline{};
    std::vector<Bid> accepted;
    std::unordered_map<PeerId, size_t> live;   // buyer -> index into accepted
    std::set<PeerId> gone;
    uint64_t next_order = 1;

    AuctionResult outcome;
    std::set<PeerId> pending;
    std::vector<PeerId> failed;
    std::string why_aborted;
};

} // namespace gavel
