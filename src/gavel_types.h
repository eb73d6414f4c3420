#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace gavel {

using PeerId = uint32_t;                 // seller is 0, buyers are numbered from 1
constexpr PeerId kSellerId = 0;

enum class Role : uint8_t { Unassigned = 0, Seller = 1, Buyer = 2 };

enum class AuctionType : uint8_t { FirstPrice = 1, SecondPrice = 2 };

// Why a request was turned down. Carried in replies and in RST segments.
enum class Rejection : uint8_t {
    None          = 0,
    InvalidBid    = 1,
    AuctionClosed = 2,
    AuctionFull   = 3,
    Malformed     = 4,
    NotOpen       = 5,
};

struct AuctionItem {
    std::string name;
    uint32_t reserve = 0;                             // starting / reserve price
    AuctionType type = AuctionType::FirstPrice;
    std::chrono::milliseconds duration{0};            // bidding window
};

struct Bid {
    PeerId buyer = 0;
    uint32_t amount = 0;
    uint64_t order = 0;   // arrival order, 1-based
};

struct AuctionResult {
    std::optional<PeerId> winner;   // empty when nothing sold
    uint32_t price = 0;             // clearing price
    bool sold() const { return winner.has_value(); }
};

const char* to_string(Role r);
const char* to_string(AuctionType t);
const char* to_string(Rejection r);

} // namespace gavel
