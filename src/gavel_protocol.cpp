#include "gavel_protocol.h"

#include <arpa/inet.h>

#include <cstring>

namespace gavel {

uint16_t gavel_checksum16(const void* data, size_t len) {
    // Internet checksum (RFC 1071) over big-endian 16-bit words
    uint32_t sum = 0;
    const uint8_t* p = static_cast<const uint8_t*>(data);

    while (len > 1) {
        sum += (static_cast<uint32_t>(p[0]) << 8) | p[1];
        p += 2;
        len -= 2;
    }
    if (len == 1) {
        sum += static_cast<uint32_t>(p[0]) << 8;
    }
    while (sum >> 16) {
        sum = (sum & 0xFFFFu) + (sum >> 16);
    }
    return static_cast<uint16_t>(~sum);
}

static constexpr size_t kChecksumOffset = offsetof(SegmentHeader, checksum);

void gavel_set_checksum(uint8_t* segment, size_t len) {
    segment[kChecksumOffset] = 0;
    segment[kChecksumOffset + 1] = 0;
    uint16_t sum = htons(gavel_checksum16(segment, len));
    std::memcpy(segment + kChecksumOffset, &sum, sizeof(sum));
}

bool gavel_verify_checksum(const uint8_t* segment, size_t len) {
    if (len < sizeof(SegmentHeader)) return false;
    Bytes tmp(segment, segment + len);
    uint16_t stored;
    std::memcpy(&stored, segment + kChecksumOffset, sizeof(stored));
    tmp[kChecksumOffset] = 0;
    tmp[kChecksumOffset + 1] = 0;
    return ntohs(stored) == gavel_checksum16(tmp.data(), tmp.size());
}

Bytes encode_segment(const Segment& s) {
    SegmentHeader h{};
    h.type = s.type;
    h.seq = to_wire(s.seq);
    h.length = htons(static_cast<uint16_t>(s.payload.size()));
    h.checksum = 0;

    Bytes out(sizeof(SegmentHeader) + s.payload.size());
    std::memcpy(out.data(), &h, sizeof(h));
    if (!s.payload.empty()) std::memcpy(out.data() + sizeof(h), s.payload.data(), s.payload.size());
    gavel_set_checksum(out.data(), out.size());
    return out;
}

std::optional<Segment> decode_segment(const uint8_t* data, size_t len) {
    if (len < sizeof(SegmentHeader)) return std::nullopt;

    SegmentHeader h{};
    std::memcpy(&h, data, sizeof(h));
    if (ntohs(h.length) != len - sizeof(SegmentHeader)) return std::nullopt;
    if (h.type != SEG_DATA && h.type != SEG_ACK && h.type != SEG_RST) return std::nullopt;
    if (h.seq > 1) return std::nullopt;
    if (!gavel_verify_checksum(data, len)) return std::nullopt;

    Segment s;
    s.type = h.type;
    s.seq = h.seq ? SeqBit::One : SeqBit::Zero;
    s.payload.assign(data + sizeof(SegmentHeader), data + len);
    return s;
}

void put_u16(Bytes& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void put_u32(Bytes& out, uint32_t v) {
    put_u16(out, static_cast<uint16_t>(v >> 16));
    put_u16(out, static_cast<uint16_t>(v & 0xFFFF));
}

uint16_t get_u16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(get_u16(p)) << 16) | get_u16(p + 2);
}

} // namespace gavel
