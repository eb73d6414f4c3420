#include "AuctionClient.h"

#include "FileHandoff.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

using Clock = std::chrono::steady_clock;

namespace gavel {

AuctionClient::AuctionClient(const ClientArgs& args) : A(args) {}

AuctionClient::~AuctionClient() = default;

bool AuctionClient::init() {
    auto server = Endpoint::parse(A.server, A.port);
    if (!server) {
        std::cerr << "Invalid --server IP: " << A.server << "\n";
        return false;
    }
    if (!sock.open(0)) return false;

    link = std::make_unique<UdpLink>(sock, *server);
    DatagramLink* below = link.get();
    if (A.loss > 0) {
        lossy = std::make_unique<FaultInjectingLink>(*link, FaultProfile::loss(A.loss, A.seed));
        below = lossy.get();
    }

    ChannelOptions o;
    o.rto_ms = A.rto_ms;
    o.retries = A.retries;
    o.trace = A.trace;
    o.name = "auctioneer " + server->to_string();
    ch = std::make_unique<ReliableChannel>(*below, o);

    std::cerr << "Client on :" << sock.local_port() << " -> " << server->to_string()
              << (A.loss > 0 ? " (simulated loss " + std::to_string(A.loss) + ")" : std::string())
              << "\n";
    return true;
}

bool AuctionClient::run() {
    SendStatus s = ch->send(encode_message(make_hello()));
    if (s == SendStatus::Refused) {
        std::cout << "Server is busy (" << to_string(ch->refusal()) << "). Try to connect again later.\n";
        return false;
    }
    if (s != SendStatus::Delivered) {
        std::cout << "Failed to connect to the Auctioneer server.\n";
        return false;
    }
    std::cout << "Connected to the Auctioneer server.\n";

    auto m = await(2 * ch->give_up_time());
    if (!m || m->type != MsgType::RoleAssigned) {
        std::cout << "Server did not assign a role.\n";
        return false;
    }
    my_role = m->role;
    std::cout << "Your role is: [" << to_string(my_role) << "]\n";

    return my_role == Role::Seller ? run_seller() : run_buyer();
}

std::optional<Message> AuctionClient::await(std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() <= 0 || ch->refused()) return std::nullopt;

        auto raw = ch->receive(left);
        if (!raw) return std::nullopt;
        auto m = decode_message(*raw);
        if (m) return m;
        std::cerr << "Malformed message from server ignored\n";
    }
}

bool AuctionClient::read_item(AuctionItem& item) {
    if (!A.item.empty()) {
        item.name = A.item;
        item.reserve = A.reserve;
        item.type = A.type;
        item.duration = std::chrono::milliseconds(A.duration_ms);
        return true;
    }

    // <type 1|2> <reserve> <duration_ms> <name...>
    if (!typed) read_stdin_in_background();
    std::cout << "Please submit auction request:\n";
    while (true) {
        bool eof = false;
        auto line = typed_line(eof);
        if (eof) return false;
        if (!line) {
            // Keep acknowledging the server while nobody types
            auto m = await(std::chrono::milliseconds(100));
            if (ch->refused()) return false;
            if (m && m->type == MsgType::ItemPrompt) std::cout << "Please submit auction request:\n";
            continue;
        }

        std::istringstream in(*line);
        int type = 0;
        long long reserve = -1, duration = 0;
        std::string name;
        if (in >> type >> reserve >> duration && std::getline(in >> std::ws, name) &&
            (type == 1 || type == 2) && reserve >= 0 && reserve <= UINT32_MAX && duration > 0) {
            item.type = static_cast<AuctionType>(type);
            item.reserve = static_cast<uint32_t>(reserve);
            item.duration = std::chrono::milliseconds(duration);
            item.name = name;
            return true;
        }
        std::cout << "Server: Invalid auction request!\n";
        std::cout << "Please submit auction request:\n";
    }
}

Bytes AuctionClient::item_details(const AuctionItem& item) const {
    if (A.file.empty()) {
        std::string text = "Item: " + item.name + "\n";
        return Bytes(text.begin(), text.end());
    }
    std::ifstream f(A.file, std::ios::binary);
    if (!f) {
        std::cerr << "Failed to open file: " << A.file << "\n";
        return Bytes{};
    }
    return Bytes(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

bool AuctionClient::run_seller() {
    AuctionItem item;
    while (true) {
        if (!read_item(item)) return false;
        if (ch->send(encode_message(make_item_submit(item))) != SendStatus::Delivered) {
            std::cout << "Server is unreachable.\n";
            return false;
        }
        auto reply = await(2 * ch->give_up_time());
        while (reply && reply->type == MsgType::ItemPrompt) reply = await(2 * ch->give_up_time());
        if (!reply) {
            std::cout << "Server did not answer the auction request.\n";
            return false;
        }
        if (reply->type == MsgType::ItemAccepted) break;

        std::cout << "Server: Invalid auction request! (" << to_string(reply->reason) << ")\n";
        if (!A.item.empty()) return false;
    }
    std::cout << "Server: Auction start.\n";

    // The server needs the whole window plus time to reach every peer
    auto give_up = Clock::now() + item.duration + 4 * ch->give_up_time();
    auto close_at = Clock::now() + std::chrono::milliseconds(A.close_after_ms);
    bool close_sent = A.close_after_ms <= 0;

    while (!final_result) {
        if (!close_sent && Clock::now() >= close_at) {
            Message close;
            close.type = MsgType::CloseBidding;
            if (ch->send(encode_message(close)) != SendStatus::Delivered) {
                std::cout << "Server is unreachable.\n";
                return false;
            }
            close_sent = true;
        }
        if (Clock::now() >= give_up) {
            std::cout << "Server did not respond with auction results.\n";
            return false;
        }
        auto m = await(std::chrono::milliseconds(100));
        if (m && m->type == MsgType::Result) final_result = m;
    }

    std::cout << "Auction finished!\n";
    if (final_result->outcome != Outcome::Sold) {
        std::cout << "Unfortunately, your item was not sold.\n";
        linger();
        return true;
    }

    std::cout << "Success! Your item " << item.name << " has been sold for $" << final_result->amount
              << ". Buyer: " << final_result->counterpart << "\n";

    Bytes details = item_details(item);
    std::cout << "Start sending item details (" << details.size() << " bytes).\n";
    FileHandoff handoff;
    if (handoff.send_payload(*ch, details) != SendStatus::Delivered) {
        std::cout << "Server is unreachable, item details not delivered.\n";
        return false;
    }

    auto done = await(8 * ch->give_up_time());
    while (done && done->type != MsgType::TransferDone) done = await(8 * ch->give_up_time());
    if (!done) {
        std::cout << "No handoff confirmation from the server.\n";
        return false;
    }
    handoff_done = done->flag;
    std::cout << (handoff_done ? "Item details delivered to the buyer.\n"
                               : "The buyer could not be reached for the item details.\n");
    linger();
    std::cout << "Disconnecting from the Auctioneer server. Auction is over!\n";
    return true;
}

void AuctionClient::read_stdin_in_background() {
    typed = std::make_shared<Lines>();
    std::shared_ptr<Lines> lines = typed;
    std::thread([lines] {
        std::string line;
        while (std::getline(std::cin, line)) {
            std::lock_guard<std::mutex> lock(lines->mu);
            lines->queue.push_back(line);
        }
        std::lock_guard<std::mutex> lock(lines->mu);
        lines->eof = true;
    }).detach();
}

std::optional<std::string> AuctionClient::typed_line(bool& eof) {
    std::lock_guard<std::mutex> lock(typed->mu);
    eof = false;
    if (typed->queue.empty()) {
        eof = typed->eof;
        return std::nullopt;
    }
    std::string line = std::move(typed->queue.front());
    typed->queue.pop_front();
    return line;
}

std::optional<uint32_t> AuctionClient::next_bid(bool& exhausted) {
    exhausted = false;
    if (!A.bids.empty()) {
        if (next_arg_bid >= A.bids.size()) {
            exhausted = true;
            return std::nullopt;
        }
        return A.bids[next_arg_bid++];
    }

    auto typed_bid = typed_line(exhausted);
    if (!typed_bid) return std::nullopt;
    const std::string& line = *typed_bid;
    try {
        size_t used = 0;
        unsigned long v = std::stoul(line, &used);
        if (used == line.size() && v > 0 && v <= UINT32_MAX) return static_cast<uint32_t>(v);
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    std::cout << "Invalid bid. Please submit a positive integer!\n";
    return std::nullopt;
}

bool AuctionClient::run_buyer() {
    std::cout << "The Auctioneer is still waiting for other Buyers to connect...\n";

    // Nothing to bid on until the item is announced
    while (!final_result) {
        auto m = await(std::chrono::hours(24));
        if (!m) {
            std::cout << "Server is busy. Try to connect again later.\n";
            return false;
        }
        if (m->type == MsgType::Result) {
            final_result = m;
            break;
        }
        if (m->type == MsgType::BiddingOpen) {
            std::cout << "The bidding has started! " << m->item.name << " (" << to_string(m->item.type)
                      << "), reserve $" << m->item.reserve << ", " << m->item.duration.count() / 1000.0
                      << " s left\n";
            break;
        }
    }

    bool bidding = !final_result;
    if (bidding && A.bids.empty()) {
        read_stdin_in_background();
        std::cout << "Please submit your bid:\n";
    }

    while (!final_result) {
        if (bidding) {
            bool exhausted = false;
            auto bid = next_bid(exhausted);
            if (exhausted) {
                bidding = false;
                std::cout << "Waiting for the auction result...\n";
                continue;
            }
            if (bid) {
                if (ch->send(encode_message(make_bid(*bid))) != SendStatus::Delivered) {
                    std::cout << "Server is unreachable.\n";
                    return false;
                }
                // One reply per bid; a result may overtake it when bidding just closed
                while (!final_result) {
                    auto m = await(2 * ch->give_up_time());
                    if (!m) {
                        std::cout << "Server did not answer the bid.\n";
                        return false;
                    }
                    if (m->type == MsgType::Result) { final_result = m; break; }
                    if (m->type == MsgType::BidAccepted) {
                        std::cout << "Server: Bid received ($" << *bid << "). Please wait...\n";
                        break;
                    }
                    if (m->type == MsgType::BidRejected) {
                        std::cout << "Server: Bid $" << *bid << " rejected (" << to_string(m->reason) << ")";
                        if (m->amount) std::cout << ", standing bid $" << m->amount;
                        std::cout << "\n";
                        if (m->reason == Rejection::AuctionClosed) bidding = false;
                        break;
                    }
                }
                continue;
            }
        }

        auto m = await(std::chrono::milliseconds(100));
        if (m && m->type == MsgType::Result) final_result = m;
    }

    std::cout << "Auction finished!\n";
    switch (final_result->outcome) {
    case Outcome::Won:
        std::cout << "You won the item! Your payment due is $" << final_result->amount
                  << ". Seller: " << final_result->counterpart << "\n";
        return receive_item_details();
    case Outcome::Lost:
        std::cout << "Unfortunately you did not win in the last round.\n";
        break;
    default:
        std::cout << "The item was not sold.\n";
        break;
    }
    linger();
    std::cout << "Disconnecting from the Auctioneer server. Auction is over!\n";
    return true;
}

bool AuctionClient::receive_item_details() {
    std::cout << "Start receiving item details.\n";
    auto t0 = Clock::now();

    FileHandoff handoff;
    auto payload = handoff.receive_payload(*ch, 8 * ch->give_up_time());
    if (!payload) {
        std::cout << "Item details were not received.\n";
        return false;
    }
    payload_in = std::move(*payload);

    double secs = std::chrono::duration<double>(Clock::now() - t0).count();
    std::cout << "All data received! Transmission finished: " << payload_in.size() << " bytes / "
              << secs << " seconds";
    if (secs > 0) std::cout << " = " << (payload_in.size() * 8) / secs << " bps";
    std::cout << "\n";

    if (!A.out.empty()) {
        std::ofstream ofs(A.out, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            std::cerr << "Failed to open --out file: " << A.out << "\n";
            return false;
        }
        ofs.write(reinterpret_cast<const char*>(payload_in.data()), (std::streamsize)payload_in.size());
    }
    linger();
    std::cout << "Disconnecting from the Auctioneer server. Auction is over!\n";
    return true;
}

void AuctionClient::linger() {
    ch->linger(std::min(ch->give_up_time(), std::chrono::milliseconds(2000)));
}

} // namespace gavel
