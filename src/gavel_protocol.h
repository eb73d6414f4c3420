#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace gavel {

using Bytes = std::vector<uint8_t>;

#pragma pack(push, 1)
struct SegmentHeader {
    uint8_t  type;      // SEG_DATA / SEG_ACK / SEG_RST
    uint8_t  seq;       // Alternating bit, 0 or 1
    uint16_t length;    // Payload length (network order)
    uint16_t checksum;  // Internet checksum over header and payload (see gavel_set_checksum)
};
#pragma pack(pop)

static_assert(sizeof(SegmentHeader) == 6, "SegmentHeader must be 6 bytes");

// Segment types
enum : uint8_t {
    SEG_DATA = 0x01,
    SEG_ACK  = 0x02,
    SEG_RST  = 0x03,  // payload: one refusal reason byte
};

constexpr size_t kMaxSegmentPayload = 1400;            // keeps a segment inside one Ethernet frame
constexpr size_t kMaxDatagram = 65507;                 // largest IPv4 UDP payload

// Stop-and-wait sequence state. Two-valued on purpose: there is never more
// than one segment in flight.
enum class SeqBit : uint8_t { Zero = 0, One = 1 };

inline SeqBit flip(SeqBit b) { return b == SeqBit::Zero ? SeqBit::One : SeqBit::Zero; }
inline uint8_t to_wire(SeqBit b) { return static_cast<uint8_t>(b); }

struct Segment {
    uint8_t type = SEG_DATA;
    SeqBit seq = SeqBit::Zero;
    Bytes payload;
};

// Utilities
uint16_t gavel_checksum16(const void* data, size_t len);
void gavel_set_checksum(uint8_t* segment, size_t len);
bool gavel_verify_checksum(const uint8_t* segment, size_t len);

Bytes encode_segment(const Segment& s);

// Returns nullopt for anything that is not a well-formed segment: short
// buffers, length mismatch, unknown type, bad sequence value or checksum.
std::optional<Segment> decode_segment(const uint8_t* data, size_t len);
inline std::optional<Segment> decode_segment(const Bytes& b) { return decode_segment(b.data(), b.size()); }

// Big-endian field helpers shared with the message codec.
void put_u16(Bytes& out, uint16_t v);
void put_u32(Bytes& out, uint32_t v);
uint16_t get_u16(const uint8_t* p);
uint32_t get_u32(const uint8_t* p);

} // namespace gavel
