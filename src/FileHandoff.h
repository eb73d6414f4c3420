#pragma once

#include "ReliableChannel.h"
#include "RoleRegistrar.h"
#include "gavel_protocol.h"

#include <chrono>
#include <functional>
#include <optional>

namespace gavel {

struct RelayOutcome {
    bool received = false;    // the source finished a well-formed transfer
    bool forwarded = false;   // dest acknowledged every piece, final chunk included
    size_t bytes = 0;

    bool ok() const { return received && forwarded; }
};

// Moves the item-detail payload after the auction. A transfer is a
// TransferStart carrying the total size, then the chunks in order, the last
// one flagged final. Stop-and-wait underneath means chunk i+1 never leaves
// before chunk i is acknowledged.
class FileHandoff {
public:
    // chunk_size 0 means "as large as the channel allows".
    explicit FileHandoff(size_t chunk_size = 0);

    SendStatus send_payload(ReliableChannel& ch, const Bytes& payload);

    // Reassembles one transfer. nullopt if nothing arrives for `idle`, if the
    // peer resets, or if the framing is inconsistent.
    std::optional<Bytes> receive_payload(ReliableChannel& ch, std::chrono::milliseconds idle);

    // Delivers `payload`, received from `source`, to `dest` over dest's channel.
    SendStatus transfer(const Peer& source, Peer& dest, const Bytes& payload);

    // Streams one transfer from `source` to `dest` while it is still being
    // uploaded: each piece is forwarded as soon as it arrives. `dest_ready`
    // runs on the forwarding thread before dest's channel is touched; false
    // means dest is gone and the upload is only drained. The calling thread
    // owns source's channel and keeps answering it until forwarding ends.
    RelayOutcome relay(Peer& source, Peer& dest, std::chrono::milliseconds idle,
                       const std::function<bool()>& dest_ready,
                       std::chrono::milliseconds poll = std::chrono::milliseconds(50));

    size_t chunk_capacity(const ReliableChannel& ch) const;

private:
    size_t chunk_size;
};

} // namespace gavel
