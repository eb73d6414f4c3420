#include "AuctionServer.h"

#include "FileHandoff.h"
#include "gavel_messages.h"

#include <exception>
#include <iostream>

using Clock = std::chrono::steady_clock;

namespace gavel {

namespace {

ChannelOptions channel_options(const ServerArgs& a) {
    ChannelOptions o;
    o.rto_ms = a.rto_ms;
    o.retries = a.retries;
    o.trace = a.trace;
    return o;
}

FaultProfile loss_profile(const ServerArgs& a) {
    return a.loss > 0 ? FaultProfile::loss(a.loss, a.seed) : FaultProfile{};
}

} // namespace

AuctionServer::AuctionServer(const ServerArgs& args)
    : A(args),
      reg([this](const Endpoint& to, const Bytes& b) { return sock.send_to(to, b); },
          channel_options(args), args.max_buyers, loss_profile(args)) {}

AuctionServer::~AuctionServer() {
    shutdown();
}

bool AuctionServer::init() {
    if (!sock.open(A.port)) return false;

    std::cerr << "Auctioneer bound on :" << sock.local_port()
              << " (rto=" << A.rto_ms << "ms, retries=" << A.retries
              << (A.max_buyers ? ", max buyers=" + std::to_string(A.max_buyers) : std::string())
              << (A.loss > 0 ? ", simulated loss=" + std::to_string(A.loss) : std::string())
              << ")\n";
    return true;
}

bool AuctionServer::run() {
    if (!sock.is_open()) {
        std::cerr << "run() before init()\n";
        return false;
    }
    reader = std::thread([this] { dispatch_loop(); });
    std::cerr << "Auctioneer is ready for hosting auctions!\n";

    AuctionState s = coord.wait_for_close();
    reg.close();

    if (s == AuctionState::Aborted) {
        std::cerr << "Auction aborted: " << coord.abort_reason() << "\n";
        join_workers();
        shutdown();
        return false;
    }

    auto bids = coord.bids();
    std::cerr << "Bidding closed: " << bids.size() << " accepted bid(s) from "
              << reg.buyer_count() << " buyer(s)\n";

    std::vector<PeerId> recipients;
    for (Peer* p : reg.peers()) recipients.push_back(p->id);
    AuctionResult r = coord.announce(recipients);

    if (r.sold()) {
        Peer* w = reg.find(*r.winner);
        std::cerr << ">> Item sold to " << (w ? w->label() : "?") << " for $" << r.price << "\n";
    } else {
        std::cerr << ">> Item not sold\n";
    }

    while (!coord.wait_done(std::chrono::seconds(1))) {}
    for (PeerId id : coord.unreachable()) {
        Peer* p = reg.find(id);
        std::cerr << "Result not acknowledged by " << (p ? p->label() : std::to_string(id)) << "\n";
    }

    join_workers();
    shutdown();
    std::cerr << "Auction is over.\n";
    return true;
}

void AuctionServer::dispatch_loop() {
    while (!stopping) {
        Endpoint from;
        Bytes buf;
        if (!sock.recv_from(from, buf, std::chrono::milliseconds(100))) continue;

        if (Peer* p = reg.find(from)) {
            p->link->deliver(std::move(buf));
            continue;
        }

        // Only a well-formed DATA segment opens a session
        auto seg = decode_segment(buf);
        if (!seg || seg->type != SEG_DATA) continue;

        Registration r = reg.register_connection(from);
        if (!r.peer) {
            std::cerr << "Refusing " << from.to_string() << ": " << to_string(r.refusal) << "\n";
            send_rst(from, r.refusal);
            continue;
        }

        Peer* p = r.peer;
        p->link->deliver(std::move(buf));
        if (r.fresh) {
            std::cerr << p->label() << " is connected\n";
            std::lock_guard<std::mutex> lock(workers_mu);
            workers.emplace_back([this, p] { serve(*p); });
        }
    }
}

void AuctionServer::serve(Peer& p) {
    try {
        if (p.role == Role::Seller) serve_seller(p);
        else serve_buyer(p);
    } catch (const std::exception& e) {
        std::cerr << p.label() << ": " << e.what() << "\n";
        if (p.role == Role::Seller) coord.abort(std::string("seller thread failed: ") + e.what());
        coord.withdraw(p.id);
    }
}

bool AuctionServer::greet(Peer& p) {
    ReliableChannel& ch = *p.channel;
    auto deadline = Clock::now() + 2 * ch.give_up_time();

    while (Clock::now() < deadline) {
        auto raw = ch.receive(std::chrono::milliseconds(A.poll_ms));
        if (!raw) continue;
        auto m = decode_message(*raw);
        if (m && m->type == MsgType::Hello) {
            return ch.send(encode_message(make_role(p.role))) == SendStatus::Delivered;
        }
        std::cerr << p.label() << ": expected HELLO, ignoring message\n";
    }
    return false;
}

void AuctionServer::serve_seller(Peer& p) {
    ReliableChannel& ch = *p.channel;
    const auto poll = std::chrono::milliseconds(A.poll_ms);

    if (!greet(p)) {
        coord.abort("seller unresponsive before item submission");
        return;
    }
    std::cerr << ">> New Seller Thread spawned for " << p.label() << "\n";

    // A silent seller is prompted again; one that stops acknowledging is lost
    auto quiet_since = Clock::now();
    while (coord.state() == AuctionState::AwaitingItem) {
        auto raw = ch.receive(poll);
        if (!raw) {
            if (Clock::now() - quiet_since < ch.give_up_time()) continue;
            Message prompt;
            prompt.type = MsgType::ItemPrompt;
            if (ch.send(encode_message(prompt)) != SendStatus::Delivered) {
                std::cerr << p.label() << " stopped answering before submitting an item\n";
                coord.abort("seller unresponsive before item submission");
                return;
            }
            quiet_since = Clock::now();
            continue;
        }
        quiet_since = Clock::now();

        auto m = decode_message(*raw);
        if (!m || m->type != MsgType::ItemSubmit) {
            Message bad;
            bad.type = MsgType::ItemRejected;
            bad.reason = Rejection::Malformed;
            if (ch.send(encode_message(bad)) != SendStatus::Delivered) {
                coord.abort("seller unresponsive before item submission");
                return;
            }
            continue;
        }

        Rejection why = coord.submit_item(m->item, Clock::now());
        Message reply;
        reply.type = why == Rejection::None ? MsgType::ItemAccepted : MsgType::ItemRejected;
        reply.reason = why;

        if (why == Rejection::None) {
            std::cerr << "Auction request received: '" << m->item.name << "' " << to_string(m->item.type)
                      << ", reserve $" << m->item.reserve << ", " << m->item.duration.count()
                      << " ms. Now accepting bids.\n";
        } else {
            std::cerr << "Invalid auction request from " << p.label() << ": " << to_string(why) << "\n";
        }

        if (ch.send(encode_message(reply)) != SendStatus::Delivered) {
            if (why != Rejection::None) {
                coord.abort("seller unresponsive before item submission");
            } else {
                coord.withdraw(p.id);
            }
            return;
        }
    }
    if (coord.state() == AuctionState::Aborted) return;

    while (coord.state() < AuctionState::ResultAnnounced) {
        auto raw = ch.receive(poll);
        if (!raw) continue;

        auto m = decode_message(*raw);
        if (m && m->type == MsgType::CloseBidding) {
            if (coord.close_bidding()) std::cerr << "Bidding closed early by the seller\n";
            else std::cerr << "Seller close ignored, bidding already closed\n";
        }
    }

    if (!deliver_result(p)) return;

    AuctionResult r = coord.result();
    if (r.sold()) hand_off(p);
}

void AuctionServer::serve_buyer(Peer& p) {
    ReliableChannel& ch = *p.channel;
    const auto poll = std::chrono::milliseconds(A.poll_ms);

    if (!greet(p)) {
        coord.withdraw(p.id);
        return;
    }
    std::cerr << p.label() << " is waiting for bidding to start\n";

    // BiddingOpen is sent again after a quiet spell; a buyer that no longer
    // acknowledges is withdrawn before the close
    bool told_open = false;
    auto quiet_since = Clock::now();
    while (true) {
        AuctionState s = coord.state();
        if (s >= AuctionState::ResultAnnounced) break;

        bool due = s == AuctionState::BiddingOpen &&
                   (!told_open || Clock::now() - quiet_since >= ch.give_up_time());
        if (due) {
            auto item = coord.item();
            auto msg = make_bidding_open(*item, coord.time_left(Clock::now()));
            if (ch.send(encode_message(msg)) != SendStatus::Delivered) {
                std::cerr << p.label() << " withdrawn\n";
                coord.withdraw(p.id);
                return;
            }
            told_open = true;
            quiet_since = Clock::now();
            continue;
        }

        auto raw = ch.receive(poll);
        if (!raw) continue;
        quiet_since = Clock::now();

        auto m = decode_message(*raw);
        Message reply;
        if (!m || m->type != MsgType::PlaceBid) {
            reply = make_bid_reply(false, Rejection::Malformed, 0);
        } else {
            BidDecision d = coord.submit_bid(p.id, m->amount, Clock::now());
            reply = make_bid_reply(d.accepted, d.reason, d.standing);
            if (d.accepted) {
                std::cerr << ">> " << p.label() << " bid $" << m->amount << "\n";
            } else {
                std::cerr << ">> " << p.label() << " bid $" << m->amount << " rejected: "
                          << to_string(d.reason) << "\n";
            }
        }
        if (ch.send(encode_message(reply)) != SendStatus::Delivered) {
            std::cerr << p.label() << " withdrawn\n";
            coord.withdraw(p.id);
            return;
        }
    }

    if (coord.state() == AuctionState::Aborted) {
        SendStatus s = ch.send(encode_message(make_result(Outcome::AuctionOver, 0, "")));
        if (s != SendStatus::Delivered) std::cerr << p.label() << " unreachable: " << to_string(s) << "\n";
        return;
    }
    deliver_result(p);
}

bool AuctionServer::deliver_result(Peer& p) {
    AuctionResult r = coord.result();
    Peer* winner = r.sold() ? reg.find(*r.winner) : nullptr;
    Peer* seller = reg.seller();

    Message m;
    if (p.role == Role::Seller) {
        m = r.sold() ? make_result(Outcome::Sold, r.price, winner ? winner->endpoint.to_string() : "")
                     : make_result(Outcome::NotSold, 0, "");
    } else if (!r.sold()) {
        m = make_result(Outcome::AuctionOver, 0, "");
    } else if (*r.winner == p.id) {
        m = make_result(Outcome::Won, r.price, seller ? seller->endpoint.to_string() : "");
    } else {
        m = make_result(Outcome::Lost, 0, "");
    }

    SendStatus s = p.channel->send(encode_message(m));
    bool ok = s == SendStatus::Delivered;
    if (ok) std::cerr << "Result (" << to_string(m.outcome) << ") delivered to " << p.label() << "\n";
    else std::cerr << p.label() << " unreachable for the result: " << to_string(s) << "\n";

    // Last use of a buyer's channel by its own thread
    coord.report_delivery(p.id, ok);
    return ok;
}

void AuctionServer::hand_off(Peer& seller) {
    ReliableChannel& ch = *seller.channel;
    const auto poll = std::chrono::milliseconds(A.poll_ms);

    AuctionResult r = coord.result();
    Peer* winner = reg.find(*r.winner);
    if (!winner) {
        std::cerr << "Handoff skipped: winner " << *r.winner << " is not registered\n";
        return;
    }

    // The winner's thread is finished with its channel once the auction is Done
    auto winner_ready = [&] {
        while (!coord.wait_done(poll)) {}
        return !winner->channel->unresponsive();
    };

    FileHandoff handoff;
    RelayOutcome moved = handoff.relay(seller, *winner, 4 * ch.give_up_time(), winner_ready, poll);
    if (!moved.received) std::cerr << "No complete item details from " << seller.label() << "\n";

    Message done;
    done.type = MsgType::TransferDone;
    done.flag = moved.ok();
    if (ch.send(encode_message(done)) != SendStatus::Delivered) {
        std::cerr << seller.label() << " did not acknowledge the handoff outcome\n";
    }
}

void AuctionServer::send_rst(const Endpoint& to, Rejection why) {
    Segment rst;
    rst.type = SEG_RST;
    rst.payload.push_back(static_cast<uint8_t>(why));
    sock.send_to(to, encode_segment(rst));
}

void AuctionServer::join_workers() {
    std::vector<std::thread> ws;
    {
        std::lock_guard<std::mutex> lock(workers_mu);
        ws.swap(workers);
    }
    for (auto& t : ws) {
        if (t.joinable()) t.join();
    }
}

void AuctionServer::shutdown() {
    stopping = true;
    if (reader.joinable()) reader.join();
    join_workers();
    for (Peer* p : reg.peers()) p->link->close();
}

} // namespace gavel
