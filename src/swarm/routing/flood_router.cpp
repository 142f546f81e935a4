/**
 * @file flood_router.cpp
 * @brief Dedup cache and TTL forwarding.
 */
#include "swarm/routing/flood_router.hpp"

#include <array>
#include <limits>

namespace swarm::routing {

std::string FloodRouter::next_message_id() {
    static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                  '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::string id;
    id.reserve(32);
    for (int word = 0; word < 2; ++word) {
        uint64_t bits = rng_.next_below(std::numeric_limits<uint64_t>::max());
        for (int i = 0; i < 16; ++i) {
            id.push_back(kHex[bits & 0xF]);
            bits >>= 4;
        }
    }
    return id;
}

wire::RoutedMessage FloodRouter::make_message(const state::DeviceName& dest, wire::Bytes payload,
                                              Clock::time_point now) {
    wire::RoutedMessage m;
    m.message_id = next_message_id();
    m.source_id  = self_;
    m.dest_id    = dest;
    m.ttl        = cfg_.default_ttl;
    m.payload    = std::move(payload);

    std::lock_guard<std::mutex> lk(mu_);
    seen_[m.key()] = now;
    return m;
}

FloodDecision FloodRouter::handle_incoming(const wire::RoutedMessage& msg, Clock::time_point now) {
    FloodDecision out;
    if (msg.ttl <= 0) {
        out.verdict = FloodVerdict::Expired;
        return out;
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        const auto [it, inserted] = seen_.try_emplace(msg.key(), now);
        if (!inserted) {
            out.verdict = FloodVerdict::Duplicate;
            return out;
        }
    }

    if (msg.dest_id == self_) {
        out.deliver = true;
        return out;
    }
    out.deliver = msg.is_broadcast();
    if (msg.ttl - 1 > 0) {
        out.forward = msg;
        out.forward->ttl = msg.ttl - 1;
    }
    return out;
}

std::size_t FloodRouter::sweep(Clock::time_point now) {
    const auto ttl = std::chrono::milliseconds{cfg_.seen_ttl_ms};
    std::lock_guard<std::mutex> lk(mu_);
    return std::erase_if(seen_, [&](const auto& kv) { return now - kv.second >= ttl; });
}

std::size_t FloodRouter::seen_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return seen_.size();
}

} // namespace swarm::routing
