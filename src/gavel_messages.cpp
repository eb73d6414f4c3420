#include "gavel_messages.h"

namespace gavel {

namespace {

bool valid_type(AuctionType t) {
    return t == AuctionType::FirstPrice || t == AuctionType::SecondPrice;
}

void put_item(Bytes& out, const AuctionItem& item) {
    out.push_back(static_cast<uint8_t>(item.type));
    put_u32(out, item.reserve);
    put_u32(out, static_cast<uint32_t>(item.duration.count()));
    put_u16(out, static_cast<uint16_t>(item.name.size()));
    out.insert(out.end(), item.name.begin(), item.name.end());
}

// p points after the message type byte, n is the bytes remaining
bool get_item(const uint8_t* p, size_t n, AuctionItem& item) {
    if (n < 11) return false;
    item.type = static_cast<AuctionType>(p[0]);
    if (!valid_type(item.type)) return false;
    item.reserve = get_u32(p + 1);
    item.duration = std::chrono::milliseconds(get_u32(p + 5));
    size_t len = get_u16(p + 9);
    if (n != 11 + len) return false;
    item.name.assign(reinterpret_cast<const char*>(p + 11), len);
    return true;
}

} // namespace

Bytes encode_message(const Message& m) {
    Bytes out;
    out.push_back(static_cast<uint8_t>(m.type));

    switch (m.type) {
    case MsgType::Hello:
    case MsgType::ItemAccepted:
    case MsgType::CloseBidding:
    case MsgType::ItemPrompt:
        break;
    case MsgType::RoleAssigned:
        out.push_back(static_cast<uint8_t>(m.role));
        break;
    case MsgType::ItemSubmit:
    case MsgType::BiddingOpen:
        put_item(out, m.item);
        break;
    case MsgType::ItemRejected:
        out.push_back(static_cast<uint8_t>(m.reason));
        break;
    case MsgType::PlaceBid:
    case MsgType::TransferStart:
        put_u32(out, m.amount);
        break;
    case MsgType::BidAccepted:
    case MsgType::BidRejected:
        out.push_back(static_cast<uint8_t>(m.reason));
        put_u32(out, m.amount);
        break;
    case MsgType::Result:
        out.push_back(static_cast<uint8_t>(m.outcome));
        put_u32(out, m.amount);
        put_u16(out, static_cast<uint16_t>(m.counterpart.size()));
        out.insert(out.end(), m.counterpart.begin(), m.counterpart.end());
        break;
    case MsgType::TransferChunk:
        out.push_back(m.flag ? 1 : 0);
        out.insert(out.end(), m.data.begin(), m.data.end());
        break;
    case MsgType::TransferDone:
        out.push_back(m.flag ? 1 : 0);
        break;
    }
    return out;
}

std::optional<Message> decode_message(const Bytes& b) {
    if (b.empty()) return std::nullopt;

    Message m;
    m.type = static_cast<MsgType>(b[0]);
    const uint8_t* p = b.data() + 1;
    size_t n = b.size() - 1;

    switch (m.type) {
    case MsgType::Hello:
    case MsgType::ItemAccepted:
    case MsgType::CloseBidding:
    case MsgType::ItemPrompt:
        if (n != 0) return std::nullopt;
        break;
    case MsgType::RoleAssigned:
        if (n != 1) return std::nullopt;
        m.role = static_cast<Role>(p[0]);
        if (m.role != Role::Seller && m.role != Role::Buyer) return std::nullopt;
        break;
    case MsgType::ItemSubmit:
    case MsgType::BiddingOpen:
        if (!get_item(p, n, m.item)) return std::nullopt;
        break;
    case MsgType::ItemRejected:
        if (n != 1) return std::nullopt;
        m.reason = static_cast<Rejection>(p[0]);
        break;
    case MsgType::PlaceBid:
    case MsgType::TransferStart:
        if (n != 4) return std::nullopt;
        m.amount = get_u32(p);
        break;
    case MsgType::BidAccepted:
    case MsgType::BidRejected:
        if (n != 5) return std::nullopt;
        m.reason = static_cast<Rejection>(p[0]);
        m.amount = get_u32(p + 1);
        break;
    case MsgType::Result: {
        if (n < 7) return std::nullopt;
        m.outcome = static_cast<Outcome>(p[0]);
        if (p[0] < static_cast<uint8_t>(Outcome::Won) || p[0] > static_cast<uint8_t>(Outcome::AuctionOver))
            return std::nullopt;
        m.amount = get_u32(p + 1);
        size_t len = get_u16(p + 5);
        if (n != 7 + len) return std::nullopt;
        m.counterpart.assign(reinterpret_cast<const char*>(p + 7), len);
        break;
    }
    case MsgType::TransferChunk:
        if (n < 1 || p[0] > 1) return std::nullopt;
        m.flag = p[0] == 1;
        m.data.assign(p + 1, p + n);
        break;
    case MsgType::TransferDone:
        if (n != 1 || p[0] > 1) return std::nullopt;
        m.flag = p[0] == 1;
        break;
    default:
        return std::nullopt;
    }
    return m;
}

Message make_hello() {
    return Message{};
}

Message make_role(Role r) {
    Message m;
    m.type = MsgType::RoleAssigned;
    m.role = r;
    return m;
}

Message make_item_submit(const AuctionItem& item) {
    Message m;
    m.type = MsgType::ItemSubmit;
    m.item = item;
    return m;
}

Message make_bidding_open(const AuctionItem& item, std::chrono::milliseconds left) {
    Message m;
    m.type = MsgType::BiddingOpen;
    m.item = item;
    m.item.duration = left;
    return m;
}

Message make_bid(uint32_t amount) {
    Message m;
    m.type = MsgType::PlaceBid;
    m.amount = amount;
    return m;
}

Message make_bid_reply(bool accepted, Rejection reason, uint32_t best) {
    Message m;
    m.type = accepted ? MsgType::BidAccepted : MsgType::BidRejected;
    m.reason = reason;
    m.amount = best;
    return m;
}

Message make_result(Outcome o, uint32_t price, const std::string& counterpart) {
    Message m;
    m.type = MsgType::Result;
    m.outcome = o;
    m.amount = price;
    m.counterpart = counterpart;
    return m;
}

Message make_chunk(bool final_chunk, const uint8_t* data, size_t len) {
    Message m;
    m.type = MsgType::TransferChunk;
    m.flag = final_chunk;
    if (len > 0) m.data.assign(data, data + len);
    return m;
}

const char* to_string(MsgType t) {
    switch (t) {
    case MsgType::Hello: return "HELLO";
    case MsgType::RoleAssigned: return "ROLE";
    case MsgType::ItemSubmit: return "ITEM";
    case MsgType::ItemAccepted: return "ITEM_OK";
    case MsgType::ItemRejected: return "ITEM_REJECTED";
    case MsgType::BiddingOpen: return "BIDDING_OPEN";
    case MsgType::PlaceBid: return "BID";
    case MsgType::BidAccepted: return "BID_OK";
    case MsgType::BidRejected: return "BID_REJECTED";
    case MsgType::CloseBidding: return "CLOSE";
    case MsgType::Result: return "RESULT";
    case MsgType::TransferStart: return "XFER_START";
    case MsgType::TransferChunk: return "XFER_CHUNK";
    case MsgType::TransferDone: return "XFER_DONE";
    case MsgType::ItemPrompt: return "PROMPT";
    }
    return "?";
}

const char* to_string(Outcome o) {
    switch (o) {
    case Outcome::Won: return "won";
    case Outcome::Lost: return "lost";
    case Outcome::Sold: return "sold";
    case Outcome::NotSold: return "not sold";
    case Outcome::AuctionOver: return "auction over";
    }
    return "?";
}

const char* to_string(Role r) {
    switch (r) {
    case Role::Seller: return "Seller";
    case Role::Buyer: return "Buyer";
    case Role::Unassigned: return "Unassigned";
    }
    return "?";
}

const char* to_string(AuctionType t) {
    return t == AuctionType::SecondPrice ? "second-price" : "first-price";
}

const char* to_string(Rejection r) {
    switch (r) {
    case Rejection::None: return "none";
    case Rejection::InvalidBid: return "InvalidBid";
    case Rejection::AuctionClosed: return "AuctionClosed";
    case Rejection::AuctionFull: return "AuctionFull";
    case Rejection::Malformed: return "Malformed";
    case Rejection::NotOpen: return "NotOpen";
    }
    return "?";
}

} // namespace gavel
