#include "gavel_messages.h"
#include "gavel_protocol.h"

#include <gtest/gtest.h>

namespace gavel {
namespace {

Segment data_segment(SeqBit seq, const std::string& text) {
    Segment s;
    s.type = SEG_DATA;
    s.seq = seq;
    s.payload.assign(text.begin(), text.end());
    return s;
}

TEST(SegmentTest, WireLayoutIsTypeSeqLengthChecksumPayload) {
    Bytes wire = encode_segment(data_segment(SeqBit::One, "bid"));
    ASSERT_EQ(wire.size(), sizeof(SegmentHeader) + 3);
    EXPECT_EQ(wire[0], SEG_DATA);
    EXPECT_EQ(wire[1], 1);
    EXPECT_EQ(get_u16(wire.data() + 2), 3);
    EXPECT_EQ(std::string(wire.begin() + 6, wire.end()), "bid");
    EXPECT_TRUE(gavel_verify_checksum(wire.data(), wire.size()));
}

TEST(SegmentTest, DecodesWhatWasEncoded) {
    auto s = decode_segment(encode_segment(data_segment(SeqBit::One, "hello")));
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->type, SEG_DATA);
    EXPECT_EQ(s->seq, SeqBit::One);
    EXPECT_EQ(std::string(s->payload.begin(), s->payload.end()), "hello");
}

TEST(SegmentTest, AnySingleBitFlipIsDetected) {
    Bytes wire = encode_segment(data_segment(SeqBit::Zero, "item details"));
    for (size_t bit = 0; bit < wire.size() * 8; ++bit) {
        Bytes bad = wire;
        bad[bit / 8] ^= static_cast<uint8_t>(1u << (bit % 8));
        EXPECT_FALSE(decode_segment(bad).has_value()) << "bit " << bit;
    }
}

TEST(SegmentTest, RejectsTruncatedAndPaddedBuffers) {
    Bytes wire = encode_segment(data_segment(SeqBit::Zero, "abcdef"));

    Bytes shorter(wire.begin(), wire.end() - 1);
    EXPECT_FALSE(decode_segment(shorter).has_value());

    Bytes longer = wire;
    longer.push_back(0);
    EXPECT_FALSE(decode_segment(longer).has_value());

    EXPECT_FALSE(decode_segment(Bytes{ SEG_ACK, 0 }).has_value());
}

TEST(SegmentTest, RejectsUnknownTypeAndWideSequence) {
    Bytes wire = encode_segment(data_segment(SeqBit::Zero, "x"));

    Bytes bad_type = wire;
    bad_type[0] = 0x7F;
    gavel_set_checksum(bad_type.data(), bad_type.size());
    EXPECT_FALSE(decode_segment(bad_type).has_value());

    Bytes bad_seq = wire;
    bad_seq[1] = 2;
    gavel_set_checksum(bad_seq.data(), bad_seq.size());
    EXPECT_FALSE(decode_segment(bad_seq).has_value());
}

TEST(SegmentTest, SequenceBitAlternates) {
    EXPECT_EQ(flip(SeqBit::Zero), SeqBit::One);
    EXPECT_EQ(flip(flip(SeqBit::Zero)), SeqBit::Zero);
}

TEST(MessageTest, ItemSubmissionCarriesAllFields) {
    AuctionItem item;
    item.name = "antique lamp";
    item.reserve = 50;
    item.type = AuctionType::SecondPrice;
    item.duration = std::chrono::milliseconds(30000);

    auto m = decode_message(encode_message(make_item_submit(item)));
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->type, MsgType::ItemSubmit);
    EXPECT_EQ(m->item.name, "antique lamp");
    EXPECT_EQ(m->item.reserve, 50u);
    EXPECT_EQ(m->item.type, AuctionType::SecondPrice);
    EXPECT_EQ(m->item.duration.count(), 30000);
}

TEST(MessageTest, ResultCarriesCounterpart) {
    auto m = decode_message(encode_message(make_result(Outcome::Won, 120, "10.0.0.7:4000")));
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->outcome, Outcome::Won);
    EXPECT_EQ(m->amount, 120u);
    EXPECT_EQ(m->counterpart, "10.0.0.7:4000");
}

TEST(MessageTest, FinalChunkMarkerSurvives) {
    const uint8_t data[] = { 1, 2, 3 };
    auto m = decode_message(encode_message(make_chunk(true, data, sizeof(data))));
    ASSERT_TRUE(m.has_value());
    EXPECT_TRUE(m->flag);
    EXPECT_EQ(m->data, Bytes({ 1, 2, 3 }));
}

TEST(MessageTest, PromptIsABareTypeByte) {
    Message prompt;
    prompt.type = MsgType::ItemPrompt;
    Bytes wire = encode_message(prompt);
    EXPECT_EQ(wire, Bytes({ 15 }));
    auto m = decode_message(wire);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->type, MsgType::ItemPrompt);
    EXPECT_STREQ(to_string(m->type), "PROMPT");

    wire.push_back(0);
    EXPECT_FALSE(decode_message(wire).has_value());
}

TEST(MessageTest, RejectsMalformedPayloads) {
    EXPECT_FALSE(decode_message(Bytes{}).has_value());
    EXPECT_FALSE(decode_message(Bytes{ 0xEE }).has_value());

    // Bid without its amount
    EXPECT_FALSE(decode_message(Bytes{ static_cast<uint8_t>(MsgType::PlaceBid), 0, 0 }).has_value());

    // Item whose name length runs past the end
    Bytes item = encode_message(make_item_submit(AuctionItem{ "lamp", 5, AuctionType::FirstPrice,
                                                              std::chrono::milliseconds(10) }));
    item.pop_back();
    EXPECT_FALSE(decode_message(item).has_value());

    // Unknown auction type
    Bytes typed = encode_message(make_item_submit(AuctionItem{ "lamp", 5, AuctionType::FirstPrice,
                                                               std::chrono::milliseconds(10) }));
    typed[1] = 9;
    EXPECT_FALSE(decode_message(typed).has_value());

    // Role that is neither seller nor buyer
    EXPECT_FALSE(decode_message(Bytes{ static_cast<uint8_t>(MsgType::RoleAssigned), 0 }).has_value());
}

} // namespace
} // namespace gavel
