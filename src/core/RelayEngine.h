#pragma once

#include "transport/Endpoint.h"
#include "transport/Packet.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace facilitator::core {

struct RelayQuota {
    std::uint64_t bytes_per_second = 256 * 1024;
    std::uint64_t datagrams_per_second = 500;
    std::uint64_t burst_bytes = 64 * 1024;
    std::uint64_t burst_datagrams = 100;
    std::size_t max_backlog = 256;  // reliable frames queued per leg
};

struct RelayLimits {
    std::size_t max_links = 512;
    RelayQuota quota;
};

// One leg of a relayed link: the session at that end and where it is reached.
struct RelayLeg {
    std::string session_id;
    transport::Endpoint endpoint;
};

// Application payload carried through the relay. `seq` is per channel leg.
struct RelayFrame {
    std::uint32_t channel_id = 0;
    std::uint32_t seq = 0;
    transport::Delivery delivery = transport::Delivery::Unreliable;
    transport::Bytes payload;
};

struct RelayOutgoing {
    transport::Endpoint to;
    RelayFrame frame;
};

enum class ForwardResult { Forwarded, Queued, Dropped, NoChannel };

const char* to_string(ForwardResult r) noexcept;

struct RelayStats {
    std::uint64_t forwarded_datagrams = 0;
    std::uint64_t forwarded_bytes = 0;
    std::uint64_t dropped = 0;
    std::size_t backlog = 0;
};

// Forwarding state for relayed links.
//
// Every frame is re-stamped with the destination leg's own sequence counter, so
// the legs never share sequence state. A channel draws from one token bucket
// (bytes and datagrams). Over quota, unreliable frames are dropped and reliable
// frames wait in a bounded per-leg backlog that drain() releases in order.
class RelayEngine {
public:
    using Clock = std::chrono::steady_clock;

    explicit RelayEngine(RelayLimits limits);

    // Throws CapacityError when max_links channels are open.
    std::uint32_t open_channel(const std::string& link_id, RelayLeg a, RelayLeg b, Clock::time_point now);

    // Releases the channel and its backlog; false if it was already gone.
    bool close_channel(std::uint32_t channel_id);

    // A frame from `from` on `channel_id`. NoChannel when the channel is gone or
    // the sender is not one of its legs.
    ForwardResult forward(std::uint32_t channel_id, const transport::Endpoint& from,
                          transport::Delivery delivery, transport::Bytes payload,
                          Clock::time_point now, std::vector<RelayOutgoing>& out);

    // Refills buckets and releases backlog the quota now allows.
    void drain(Clock::time_point now, std::vector<RelayOutgoing>& out);

    std::optional<RelayStats> stats(std::uint32_t channel_id) const;
    std::size_t channel_count() const;

private:
    struct Leg {
        RelayLeg peer;
        std::uint32_t next_seq = 1;
        std::deque<RelayFrame> backlog;  // frames waiting to be sent to this leg
    };

    struct Channel {
        std::string link_id;
        Leg legs[2];
        double byte_tokens = 0;
        double datagram_tokens = 0;
        Clock::time_point refilled_at;
        RelayStats stats;
    };

    void refill(Channel& ch, Clock::time_point now) const;
    bool take(Channel& ch, std::size_t bytes) const;
    void emit(Channel& ch, Leg& to, RelayFrame frame, std::vector<RelayOutgoing>& out);

    const RelayLimits limits_;

    mutable std::mutex mu_;
    std::uint32_t next_channel_ = 1;
    std::unordered_map<std::uint32_t, Channel> channels_;
};

} // namespace facilitator::core
