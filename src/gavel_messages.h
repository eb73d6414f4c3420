#pragma once

#include "gavel_protocol.h"
#include "gavel_types.h"

#include <optional>
#include <string>

namespace gavel {

// Application messages, one per reliably delivered payload.
enum class MsgType : uint8_t {
    Hello         = 1,   // client -> server, first contact
    RoleAssigned  = 2,   // server -> client
    ItemSubmit    = 3,   // seller -> server
    ItemAccepted  = 4,
    ItemRejected  = 5,
    BiddingOpen   = 6,   // server -> buyer, item on offer and time left
    PlaceBid      = 7,   // buyer -> server
    BidAccepted   = 8,
    BidRejected   = 9,
    CloseBidding  = 10,  // seller -> server, early close
    Result        = 11,  // server -> every peer
    TransferStart = 12,  // total payload size
    TransferChunk = 13,
    TransferDone  = 14,  // server -> seller, handoff outcome
    ItemPrompt    = 15,  // server -> seller, still waiting for the item
};

enum class Outcome : uint8_t {
    Won         = 1,   // to the winner
    Lost        = 2,   // to the other buyers
    Sold        = 3,   // to the seller
    NotSold     = 4,   // to the seller, no qualifying bid
    AuctionOver = 5,   // to buyers when nothing sold
};

struct Message {
    MsgType type = MsgType::Hello;
    Role role = Role::Unassigned;          // RoleAssigned
    AuctionItem item;                      // ItemSubmit, BiddingOpen (duration = time left)
    uint32_t amount = 0;                   // PlaceBid, Bid*, Result price, TransferStart size
    Rejection reason = Rejection::None;    // ItemRejected, BidRejected
    Outcome outcome = Outcome::AuctionOver;
    std::string counterpart;               // Result: "ip:port" of the seller or the winner
    bool flag = false;                     // TransferChunk: final chunk; TransferDone: success
    Bytes data;                            // TransferChunk
};

constexpr size_t kChunkOverhead = 2;       // type + final marker

Bytes encode_message(const Message& m);
std::optional<Message> decode_message(const Bytes& b);

Message make_hello();
Message make_role(Role r);
Message make_item_submit(const AuctionItem& item);
Message make_bidding_open(const AuctionItem& item, std::chrono::milliseconds left);
Message make_bid(uint32_t amount);
Message make_bid_reply(bool accepted, Rejection reason, uint32_t best);
Message make_result(Outcome o, uint32_t price, const std::string& counterpart);
Message make_chunk(bool final_chunk, const uint8_t* data, size_t len);

const char* to_string(MsgType t);
const char* to_string(Outcome o);

} // namespace gavel
