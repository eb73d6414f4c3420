#include "FileHandoff.h"

#include "gavel_messages.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

using Clock = std::chrono::steady_clock;

namespace gavel {

namespace {

// Receiving-side bookkeeping for one transfer.
struct Framing {
    enum Step { Ignore, Start, Chunk, Final, Broken };

    Step accept(const Message& m, const std::string& name) {
        if (m.type == MsgType::TransferStart) {
            expected = m.amount;
            got = 0;
            return Start;
        }
        if (m.type != MsgType::TransferChunk) {
            std::cerr << "[" << name << "] ignoring " << to_string(m.type) << " during transfer\n";
            return Ignore;
        }
        if (!expected) {
            std::cerr << "[" << name << "] chunk before transfer start\n";
            return Broken;
        }
        got += m.data.size();
        if (got > *expected) {
            std::cerr << "[" << name << "] transfer overran its size: " << got << " > " << *expected << "\n";
            return Broken;
        }
        if (!m.flag) return Chunk;
        if (got != *expected) {
            std::cerr << "[" << name << "] final chunk at " << got << " bytes, expected " << *expected << "\n";
            return Broken;
        }
        return Final;
    }

    std::optional<uint32_t> expected;
    size_t got = 0;
};

// Hands decoded messages from the receiving thread to the forwarding one.
class Pipe {
public:
    void push(Message m) {
        {
            std::lock_guard<std::mutex> lock(mu);
            queue.push_back(std::move(m));
        }
        cv.notify_one();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mu);
            closed = true;
        }
        cv.notify_one();
    }

    // nullopt once closed and empty
    std::optional<Message> pop() {
        std::unique_lock<std::mutex> lock(mu);
        cv.wait(lock, [&] { return closed || !queue.empty(); });
        if (queue.empty()) return std::nullopt;
        Message m = std::move(queue.front());
        queue.pop_front();
        return m;
    }

private:
    std::mutex mu;
    std::condition_variable cv;
    std::deque<Message> queue;
    bool closed = false;
};

} // namespace

FileHandoff::FileHandoff(size_t cs) : chunk_size(cs) {}

size_t FileHandoff::chunk_capacity(const ReliableChannel& ch) const {
    size_t cap = ch.options().max_payload;
    if (cap <= kChunkOverhead) throw std::invalid_argument("FileHandoff: channel payload too small for chunks");
    cap -= kChunkOverhead;
    return chunk_size == 0 ? cap : std::min(chunk_size, cap);
}

SendStatus FileHandoff::send_payload(ReliableChannel& ch, const Bytes& payload) {
    Message start;
    start.type = MsgType::TransferStart;
    start.amount = static_cast<uint32_t>(payload.size());

    SendStatus s = ch.send(encode_message(start));
    if (s != SendStatus::Delivered) return s;

    const size_t cap = chunk_capacity(ch);
    size_t off = 0;
    do {
        size_t n = std::min(cap, payload.size() - off);
        bool last = off + n == payload.size();
        s = ch.send(encode_message(make_chunk(last, payload.data() + off, n)));
        if (s != SendStatus::Delivered) {
            std::cerr << "[" << ch.options().name << "] transfer failed at byte " << off
                      << "/" << payload.size() << ": " << to_string(s) << "\n";
            return s;
        }
        off += n;
    } while (off < payload.size());

    return SendStatus::Delivered;
}

std::optional<Bytes> FileHandoff::receive_payload(ReliableChannel& ch, std::chrono::milliseconds idle) {
    Framing framing;
    Bytes out;

    while (true) {
        auto raw = ch.receive(idle);
        if (!raw) {
            std::cerr << "[" << ch.options().name << "] transfer stalled after " << out.size() << " bytes\n";
            return std::nullopt;
        }

        auto m = decode_message(*raw);
        if (!m) continue;

        switch (framing.accept(*m, ch.options().name)) {
        case Framing::Ignore:
            break;
        case Framing::Start:
            out.clear();
            out.reserve(m->amount);
            break;
        case Framing::Chunk:
            out.insert(out.end(), m->data.begin(), m->data.end());
            break;
        case Framing::Final:
            out.insert(out.end(), m->data.begin(), m->data.end());
            return out;
        case Framing::Broken:
            return std::nullopt;
        }
    }
}

SendStatus FileHandoff::transfer(const Peer& source, Peer& dest, const Bytes& payload) {
    auto t0 = Clock::now();
    std::cerr << "Handoff: " << payload.size() << " bytes from " << source.label()
              << " to " << dest.label() << "\n";

    SendStatus s = send_payload(*dest.channel, payload);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0).count();
    std::cerr << "Handoff " << to_string(s) << " in " << ms << " ms\n";
    return s;
}

RelayOutcome FileHandoff::relay(Peer& source, Peer& dest, std::chrono::milliseconds idle,
                                const std::function<bool()>& dest_ready, std::chrono::milliseconds poll) {
    ReliableChannel& in = *source.channel;
    ReliableChannel& out = *dest.channel;
    const size_t cap = chunk_capacity(out);
    auto t0 = Clock::now();
    std::cerr << "Handoff: relaying item details from " << source.label() << " to " << dest.label() << "\n";

    RelayOutcome result;
    Pipe pipe;
    std::atomic<bool> finished{false};

    std::thread mover([&] {
        SendStatus s = SendStatus::Delivered;
        if (!dest_ready()) {
            std::cerr << "Handoff: " << dest.label() << " is gone, draining the upload\n";
            s = SendStatus::PeerUnresponsive;
        }
        bool final_sent = false;

        while (auto m = pipe.pop()) {
            if (s != SendStatus::Delivered) continue;
            if (m->type == MsgType::TransferStart) {
                s = out.send(encode_message(*m));
                continue;
            }
            // Split again in case dest's channel carries less than source's
            size_t off = 0;
            do {
                size_t n = std::min(cap, m->data.size() - off);
                bool last = m->flag && off + n == m->data.size();
                s = out.send(encode_message(make_chunk(last, m->data.data() + off, n)));
                off += n;
                if (s == SendStatus::Delivered && last) final_sent = true;
            } while (s == SendStatus::Delivered && off < m->data.size());

            if (s != SendStatus::Delivered) {
                std::cerr << "Handoff to " << dest.label() << " failed: " << to_string(s) << "\n";
            }
        }
        result.forwarded = final_sent;
        finished = true;
    });

    Framing framing;
    while (true) {
        auto raw = in.receive(idle);
        if (!raw) {
            std::cerr << "[" << in.options().name << "] transfer stalled after " << framing.got << " bytes\n";
            break;
        }
        auto m = decode_message(*raw);
        if (!m) continue;

        Framing::Step step = framing.accept(*m, in.options().name);
        if (step == Framing::Ignore) continue;
        if (step == Framing::Broken) break;
        pipe.push(std::move(*m));
        if (step == Framing::Final) {
            result.received = true;
            break;
        }
    }
    result.bytes = framing.got;
    pipe.close();

    // Keep answering the source while the last pieces go out
    while (!finished) in.linger(poll);
    mover.join();

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0).count();
    std::cerr << "Handoff " << (result.ok() ? "delivered" : "failed") << ": " << result.bytes
              << " bytes in " << ms << " ms\n";
    return result;
}

} // namespace gavel
