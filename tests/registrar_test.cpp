#include "RoleRegistrar.h"

#include <gtest/gtest.h>

#include <mutex>
#include <utility>
#include <vector>

namespace gavel {
namespace {

Endpoint ep(uint16_t port) {
    auto e = Endpoint::parse("127.0.0.1", port);
    EXPECT_TRUE(e.has_value());
    return *e;
}

class RegistrarTest : public ::testing::Test {
protected:
    RoleRegistrar::DatagramSender recorder() {
        return [this](const Endpoint& to, const Bytes& b) {
            std::lock_guard<std::mutex> lock(mu);
            sent.emplace_back(to, b);
            return true;
        };
    }

    ChannelOptions opts() {
        ChannelOptions o;
        o.rto_ms = 5;
        o.retries = 0;
        return o;
    }

    std::mutex mu;
    std::vector<std::pair<Endpoint, Bytes>> sent;
};

TEST_F(RegistrarTest, FirstContactIsTheSellerAndBuyersAreNumbered) {
    RoleRegistrar reg(recorder(), opts());

    auto s = reg.register_connection(ep(4001));
    ASSERT_NE(s.peer, nullptr);
    EXPECT_TRUE(s.fresh);
    EXPECT_EQ(s.peer->role, Role::Seller);
    EXPECT_EQ(s.peer->id, kSellerId);
    EXPECT_EQ(reg.seller(), s.peer);

    auto b1 = reg.register_connection(ep(4002));
    auto b2 = reg.register_connection(ep(4003));
    ASSERT_NE(b1.peer, nullptr);
    ASSERT_NE(b2.peer, nullptr);
    EXPECT_EQ(b1.peer->role, Role::Buyer);
    EXPECT_EQ(b1.peer->id, 1u);
    EXPECT_EQ(b2.peer->id, 2u);
    EXPECT_EQ(reg.buyer_count(), 2u);
    EXPECT_EQ(reg.peers().size(), 3u);

    EXPECT_EQ(b2.peer->label(), "Buyer 2 (127.0.0.1:4003)");
    EXPECT_EQ(s.peer->label(), "Seller (127.0.0.1:4001)");
}

TEST_F(RegistrarTest, RepeatedContactFromAnEndpointIsTheSamePeer) {
    RoleRegistrar reg(recorder(), opts());
    auto first = reg.register_connection(ep(4001));
    auto again = reg.register_connection(ep(4001));

    EXPECT_EQ(first.peer, again.peer);
    EXPECT_TRUE(first.fresh);
    EXPECT_FALSE(again.fresh);
    EXPECT_EQ(reg.buyer_count(), 0u);
    EXPECT_EQ(reg.find(ep(4001)), first.peer);
    EXPECT_EQ(reg.find(kSellerId), first.peer);
    EXPECT_EQ(reg.find(ep(4999)), nullptr);
}

TEST_F(RegistrarTest, NewcomersAreRefusedOnceClosed) {
    RoleRegistrar reg(recorder(), opts());
    auto seller = reg.register_connection(ep(4001));
    auto buyer = reg.register_connection(ep(4002));
    reg.close();
    EXPECT_TRUE(reg.closed());

    auto late = reg.register_connection(ep(4003));
    EXPECT_EQ(late.peer, nullptr);
    EXPECT_EQ(late.refusal, Rejection::AuctionClosed);

    // Peers that made it in keep their seats
    EXPECT_EQ(reg.register_connection(ep(4002)).peer, buyer.peer);
    EXPECT_EQ(reg.register_connection(ep(4001)).peer, seller.peer);
}

TEST_F(RegistrarTest, BuyerCapRefusesWithAuctionFull) {
    RoleRegistrar reg(recorder(), opts(), 2);
    reg.register_connection(ep(4001));
    EXPECT_NE(reg.register_connection(ep(4002)).peer, nullptr);
    EXPECT_NE(reg.register_connection(ep(4003)).peer, nullptr);

    auto third = reg.register_connection(ep(4004));
    EXPECT_EQ(third.peer, nullptr);
    EXPECT_EQ(third.refusal, Rejection::AuctionFull);
    EXPECT_EQ(reg.buyer_count(), 2u);
}

TEST_F(RegistrarTest, PeerChannelSendsToItsOwnEndpoint) {
    RoleRegistrar reg(recorder(), opts());
    reg.register_connection(ep(4001));
    Peer* buyer = reg.register_connection(ep(4002)).peer;
    ASSERT_NE(buyer, nullptr);

    // Nobody answers, so one try and then unresponsive
    EXPECT_EQ(buyer->channel->send(Bytes{ 1, 2, 3 }), SendStatus::PeerUnresponsive);
    EXPECT_EQ(buyer->channel->options().name, buyer->label());

    std::lock_guard<std::mutex> lock(mu);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].first, ep(4002));
    auto seg = decode_segment(sent[0].second);
    ASSERT_TRUE(seg.has_value());
    EXPECT_EQ(seg->payload, Bytes({ 1, 2, 3 }));
}

TEST_F(RegistrarTest, SimulatedLossSitsUnderEachChannel) {
    RoleRegistrar reg(recorder(), opts(), 0, FaultProfile::loss(0.5, 3));
    Peer* seller = reg.register_connection(ep(4001)).peer;
    ASSERT_NE(seller, nullptr);
    EXPECT_TRUE(seller->lossy != nullptr);

    RoleRegistrar clean(recorder(), opts());
    Peer* other = clean.register_connection(ep(4001)).peer;
    ASSERT_NE(other, nullptr);
    EXPECT_TRUE(other->lossy == nullptr);
}

} // namespace
} // namespace gavel
