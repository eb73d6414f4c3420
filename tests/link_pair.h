#pragma once

#include "DatagramLink.h"

#include <memory>
#include <string>

namespace gavel {
namespace test_support {

// Two in-memory endpoints wired back to back: what `a` sends arrives at `b`
// and the other way round. Optional fault injection sits on each sender.
struct LinkPair {
    LinkPair(const FaultProfile& a_faults = FaultProfile{}, const FaultProfile& b_faults = FaultProfile{}) {
        a_raw = std::make_unique<QueuedLink>([this](const Bytes& d) { b_raw->deliver(d); return true; });
        b_raw = std::make_unique<QueuedLink>([this](const Bytes& d) { a_raw->deliver(d); return true; });
        a_faulty = std::make_unique<FaultInjectingLink>(*a_raw, a_faults);
        b_faulty = std::make_unique<FaultInjectingLink>(*b_raw, b_faults);
    }

    DatagramLink& a() { return *a_faulty; }
    DatagramLink& b() { return *b_faulty; }

    std::unique_ptr<QueuedLink> a_raw;
    std::unique_ptr<QueuedLink> b_raw;
    std::unique_ptr<FaultInjectingLink> a_faulty;
    std::unique_ptr<FaultInjectingLink> b_faulty;
};

inline Bytes bytes_of(const std::string& s) { return Bytes(s.begin(), s.end()); }

} // namespace test_support
} // namespace gavel
