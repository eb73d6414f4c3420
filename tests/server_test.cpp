#include "AuctionClient.h"
#include "AuctionServer.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace gavel {
namespace {

using namespace std::chrono_literals;

// Speaks the protocol by hand so a test can make it go silent at any point.
struct ScriptedPeer {
    ScriptedPeer(uint16_t port, int rto_ms, int retries) {
        if (!sock.open(0)) throw std::runtime_error("ScriptedPeer: no socket");
        link = std::make_unique<UdpLink>(sock, *Endpoint::parse("127.0.0.1", port));
        ChannelOptions o;
        o.rto_ms = rto_ms;
        o.retries = retries;
        o.name = "scripted";
        ch = std::make_unique<ReliableChannel>(*link, o);
    }

    bool say(const Message& m) { return ch->send(encode_message(m)) == SendStatus::Delivered; }

    std::optional<Message> next(std::chrono::milliseconds timeout) {
        auto raw = ch->receive(timeout);
        if (!raw) return std::nullopt;
        return decode_message(*raw);
    }

    UdpSocket sock;
    std::unique_ptr<UdpLink> link;
    std::unique_ptr<ReliableChannel> ch;
};

class LoopbackAuctionTest : public ::testing::Test {
protected:
    static ServerArgs server_args() {
        ServerArgs sa;
        sa.port = 0;
        sa.rto_ms = 50;
        sa.retries = 40;
        sa.poll_ms = 20;
        return sa;
    }

    void start(const ServerArgs& sa) {
        server = std::make_unique<AuctionServer>(sa);
        ASSERT_TRUE(server->init());
        server_thread = std::thread([this] { server_ok = server->run(); });
    }

    void TearDown() override {
        if (server_thread.joinable()) server_thread.join();
    }

    ClientArgs client() const {
        ClientArgs ca;
        ca.server = "127.0.0.1";
        ca.port = server->local_port();
        ca.rto_ms = 50;
        ca.retries = 40;
        return ca;
    }

    bool wait_for_bidding() {
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (std::chrono::steady_clock::now() < deadline) {
            if (server->coordinator().state() == AuctionState::BiddingOpen) return true;
            std::this_thread::sleep_for(10ms);
        }
        return false;
    }

    template <typename Pred>
    static bool eventually(Pred pred, std::chrono::milliseconds limit) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(10ms);
        }
        return pred();
    }

    static std::string path(const std::string& name) { return ::testing::TempDir() + name; }

    static std::string slurp(const std::string& file) {
        std::ifstream f(file, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    }

    std::unique_ptr<AuctionServer> server;
    std::thread server_thread;
    bool server_ok = false;
};

TEST_F(LoopbackAuctionTest, SecondPriceSaleHandsItemDetailsToTheWinner) {
    start(server_args());
    const std::string details = "Antique brass lamp, 1920s.\nShips from Lisbon.\n";
    const std::string item_file = path("gavel_lamp.txt");
    {
        std::ofstream f(item_file, std::ios::binary | std::ios::trunc);
        f << details;
    }

    ClientArgs sa = client();
    sa.item = "antique lamp";
    sa.reserve = 50;
    sa.type = AuctionType::SecondPrice;
    sa.duration_ms = 2000;
    sa.file = item_file;
    AuctionClient seller(sa);
    ASSERT_TRUE(seller.init());

    bool seller_ok = false;
    std::thread seller_thread([&] { seller_ok = seller.run(); });
    ASSERT_TRUE(wait_for_bidding());

    const std::vector<uint32_t> amounts = { 100, 150, 120 };
    std::vector<std::unique_ptr<AuctionClient>> buyers;
    for (size_t i = 0; i < amounts.size(); ++i) {
        ClientArgs ba = client();
        ba.bids = { amounts[i] };
        ba.out = path("gavel_recved_" + std::to_string(i) + ".file");
        buyers.push_back(std::make_unique<AuctionClient>(ba));
        ASSERT_TRUE(buyers.back()->init());
    }

    std::vector<char> buyer_ok(buyers.size(), 0);
    std::vector<std::thread> buyer_threads;
    for (size_t i = 0; i < buyers.size(); ++i) {
        buyer_threads.emplace_back([&, i] { buyer_ok[i] = buyers[i]->run(); });
    }
    for (auto& t : buyer_threads) t.join();
    seller_thread.join();
    server_thread.join();

    EXPECT_TRUE(server_ok);
    EXPECT_TRUE(seller_ok);
    EXPECT_EQ(seller.role(), Role::Seller);
    ASSERT_TRUE(seller.result().has_value());
    EXPECT_EQ(seller.result()->outcome, Outcome::Sold);
    EXPECT_EQ(seller.result()->amount, 120u);
    EXPECT_TRUE(seller.handoff_ok());

    for (size_t i = 0; i < buyers.size(); ++i) {
        EXPECT_TRUE(buyer_ok[i]) << "buyer bidding " << amounts[i];
        EXPECT_EQ(buyers[i]->role(), Role::Buyer);
        ASSERT_TRUE(buyers[i]->result().has_value());
    }

    // The 150 bidder wins and pays the runner-up's 120
    EXPECT_EQ(buyers[1]->result()->outcome, Outcome::Won);
    EXPECT_EQ(buyers[1]->result()->amount, 120u);
    EXPECT_EQ(std::string(buyers[1]->received().begin(), buyers[1]->received().end()), details);
    EXPECT_EQ(slurp(path("gavel_recved_1.file")), details);

    EXPECT_EQ(buyers[0]->result()->outcome, Outcome::Lost);
    EXPECT_EQ(buyers[2]->result()->outcome, Outcome::Lost);
    EXPECT_TRUE(buyers[0]->received().empty());

    EXPECT_EQ(server->coordinator().state(), AuctionState::Done);
    EXPECT_TRUE(server->coordinator().unreachable().empty());
}

TEST_F(LoopbackAuctionTest, SellerClosesEarlyWithNothingSold) {
    start(server_args());
    ClientArgs sa = client();
    sa.item = "chipped vase";
    sa.reserve = 500;
    sa.type = AuctionType::FirstPrice;
    sa.duration_ms = 30000;
    sa.close_after_ms = 800;
    AuctionClient seller(sa);
    ASSERT_TRUE(seller.init());

    bool seller_ok = false;
    std::thread seller_thread([&] { seller_ok = seller.run(); });
    ASSERT_TRUE(wait_for_bidding());

    ClientArgs ba = client();
    ba.bids = { 100 };
    ba.out.clear();
    AuctionClient buyer(ba);
    ASSERT_TRUE(buyer.init());
    bool buyer_ok = buyer.run();

    seller_thread.join();
    server_thread.join();

    EXPECT_TRUE(server_ok);
    EXPECT_TRUE(seller_ok);
    EXPECT_TRUE(buyer_ok);
    ASSERT_TRUE(seller.result().has_value());
    EXPECT_EQ(seller.result()->outcome, Outcome::NotSold);
    ASSERT_TRUE(buyer.result().has_value());
    EXPECT_EQ(buyer.result()->outcome, Outcome::AuctionOver);
    EXPECT_FALSE(server->coordinator().result().sold());
    EXPECT_TRUE(server->coordinator().bids().empty());
}

TEST_F(LoopbackAuctionTest, SellerVanishingBeforeTheItemAbortsTheAuction) {
    ServerArgs sa = server_args();
    sa.rto_ms = 30;
    sa.retries = 5;
    start(sa);

    auto seller = std::make_unique<ScriptedPeer>(server->local_port(), 30, 5);
    ASSERT_TRUE(seller->say(make_hello()));
    auto role = seller->next(2s);
    ASSERT_TRUE(role.has_value());
    EXPECT_EQ(role->type, MsgType::RoleAssigned);
    EXPECT_EQ(role->role, Role::Seller);

    // Gone without ever submitting an item
    auto t0 = std::chrono::steady_clock::now();
    seller.reset();
    ASSERT_TRUE(eventually([&] { return server->coordinator().state() == AuctionState::Aborted; }, 5s));
    server_thread.join();

    EXPECT_FALSE(server_ok);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);
    EXPECT_FALSE(server->coordinator().abort_reason().empty());
}

TEST_F(LoopbackAuctionTest, MultiChunkItemDetailsArriveIntactUnderLoss) {
    ServerArgs sv = server_args();
    sv.rto_ms = 20;
    sv.retries = 50;
    sv.loss = 0.1;
    sv.seed = 11;
    start(sv);

    // Large enough for many chunks at the default payload size
    std::string details(24 * 1024, '\0');
    for (size_t i = 0; i < details.size(); ++i) details[i] = static_cast<char>((i * 131 + 7) % 251);
    const std::string item_file = path("gavel_manual.bin");
    {
        std::ofstream f(item_file, std::ios::binary | std::ios::trunc);
        f << details;
    }

    auto lossy = [this](uint32_t seed) {
        ClientArgs ca = client();
        ca.rto_ms = 20;
        ca.retries = 50;
        ca.loss = 0.1;
        ca.seed = seed;
        return ca;
    };

    ClientArgs sa = lossy(21);
    sa.item = "service manual";
    sa.reserve = 10;
    sa.type = AuctionType::FirstPrice;
    sa.duration_ms = 3000;
    sa.file = item_file;
    AuctionClient seller(sa);
    ASSERT_TRUE(seller.init());

    bool seller_ok = false;
    std::thread seller_thread([&] { seller_ok = seller.run(); });
    ASSERT_TRUE(wait_for_bidding());

    ClientArgs wa = lossy(31);
    wa.bids = { 200 };
    wa.out = path("gavel_manual_recved.bin");
    AuctionClient winner(wa);
    ASSERT_TRUE(winner.init());

    ClientArgs la = lossy(41);
    la.bids = { 100 };
    la.out.clear();
    AuctionClient loser(la);
    ASSERT_TRUE(loser.init());

    bool winner_ok = false, loser_ok = false;
    std::thread winner_thread([&] { winner_ok = winner.run(); });
    loser_ok = loser.run();
    winner_thread.join();
    seller_thread.join();
    server_thread.join();

    EXPECT_TRUE(server_ok);
    EXPECT_TRUE(seller_ok);
    EXPECT_TRUE(winner_ok);
    EXPECT_TRUE(loser_ok);
    ASSERT_TRUE(winner.result().has_value());
    EXPECT_EQ(winner.result()->outcome, Outcome::Won);
    EXPECT_EQ(winner.result()->amount, 200u);

    EXPECT_TRUE(seller.handoff_ok());
    ASSERT_EQ(winner.received().size(), details.size());
    EXPECT_TRUE(std::equal(details.begin(), details.end(), winner.received().begin(),
                           [](char a, uint8_t b) { return static_cast<uint8_t>(a) == b; }));
    EXPECT_EQ(slurp(path("gavel_manual_recved.bin")), details);
}

TEST_F(LoopbackAuctionTest, BuyerVanishingMidBiddingLosesItsBid) {
    ServerArgs sv = server_args();
    sv.rto_ms = 30;
    sv.retries = 5;
    start(sv);

    ClientArgs sa = client();
    sa.item = "carriage clock";
    sa.reserve = 10;
    sa.type = AuctionType::SecondPrice;
    sa.duration_ms = 2500;
    AuctionClient seller(sa);
    ASSERT_TRUE(seller.init());

    bool seller_ok = false;
    std::thread seller_thread([&] { seller_ok = seller.run(); });
    ASSERT_TRUE(wait_for_bidding());

    auto quitter = std::make_unique<ScriptedPeer>(server->local_port(), 30, 5);
    ASSERT_TRUE(quitter->say(make_hello()));
    auto role = quitter->next(2s);
    ASSERT_TRUE(role.has_value());
    EXPECT_EQ(role->role, Role::Buyer);
    auto open = quitter->next(2s);
    ASSERT_TRUE(open.has_value());
    EXPECT_EQ(open->type, MsgType::BiddingOpen);

    ASSERT_TRUE(quitter->say(make_bid(900)));
    auto reply = quitter->next(2s);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->type, MsgType::BidAccepted);

    auto live = server->coordinator().live_bids();
    ASSERT_EQ(live.size(), 1u);
    const PeerId quitter_id = live[0].buyer;

    quitter.reset();
    EXPECT_TRUE(eventually([&] { return server->coordinator().withdrawn(quitter_id); }, 2s));
    EXPECT_TRUE(server->coordinator().live_bids().empty());

    ClientArgs ba = client();
    ba.bids = { 100 };
    ba.out.clear();
    AuctionClient buyer(ba);
    ASSERT_TRUE(buyer.init());
    bool buyer_ok = buyer.run();

    seller_thread.join();
    server_thread.join();

    EXPECT_TRUE(server_ok);
    EXPECT_TRUE(seller_ok);
    EXPECT_TRUE(buyer_ok);
    ASSERT_TRUE(buyer.result().has_value());
    EXPECT_EQ(buyer.result()->outcome, Outcome::Won);
    EXPECT_EQ(buyer.result()->amount, 100u);
    ASSERT_TRUE(seller.result().has_value());
    EXPECT_EQ(seller.result()->outcome, Outcome::Sold);
    EXPECT_EQ(seller.result()->amount, 100u);

    // The 900 was placed, but no longer counts
    EXPECT_EQ(server->coordinator().bids().size(), 2u);
    EXPECT_NE(*server->coordinator().result().winner, quitter_id);
}

TEST(AuctionServerTest, RunRequiresInit) {
    ServerArgs sa;
    sa.port = 0;
    AuctionServer server(sa);
    EXPECT_FALSE(server.run());
}

} // namespace
} // namespace gavel
