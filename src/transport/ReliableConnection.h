#pragma once

#include "transport/Packet.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <vector>

namespace facilitator::transport {

struct ReliabilityConfig {
    std::chrono::milliseconds retransmit_base{100};
    std::chrono::milliseconds retransmit_max{2000};
    unsigned max_attempts = 8;
    std::uint32_t reorder_window = 64;
    std::size_t max_pending = 1024;
    // A peer with nothing in flight is dropped after this long without traffic
    // either way. Keep it above the session liveness timeout.
    std::chrono::milliseconds idle_timeout{60000};
};

struct Delivered {
    Bytes payload;
    Delivery delivery;
};

// Reliability state for one remote endpoint. Does no I/O: datagrams to write are
// appended to `out` and payloads ready for the application to `delivered`.
//
// Each reliable mode has its own sequence space starting at 1. Unreliable data
// is passed through untouched. Reliable packets are retransmitted with
// exponential backoff until acked; once a packet has been sent max_attempts
// times without an ack the connection reports itself failed.
class ReliableConnection {
public:
    using Clock = std::chrono::steady_clock;

    ReliableConnection(ReliabilityConfig config, Clock::time_point now);

    // False when the reliable send queue is full; nothing is written then.
    bool send(const Bytes& payload, Delivery mode, Clock::time_point now, std::vector<Bytes>& out);

    void receive(const Packet& packet, Clock::time_point now,
                 std::vector<Bytes>& out, std::vector<Delivered>& delivered);

    // Retransmits what is due. Returns false once the connection has failed.
    bool poll(Clock::time_point now, std::vector<Bytes>& out);

    Clock::time_point last_received() const noexcept { return last_received_; }
    // Nothing pending and no datagram sent or received for idle_timeout.
    bool idle(Clock::time_point now) const noexcept;
    std::size_t pending() const noexcept;
    bool failed() const noexcept { return failed_; }

private:
    struct Pending {
        Bytes datagram;
        unsigned attempts = 0;
        Clock::time_point next_send;
    };

    struct SendChannel {
        std::uint32_t next_sequence = 1;
        std::map<std::uint32_t, Pending> pending;
    };

    SendChannel& channel(Delivery mode);
    Clock::duration backoff(unsigned attempts) const;

    void on_data(const Packet& packet, std::vector<Bytes>& out, std::vector<Delivered>& delivered);
    void on_ack(const PacketHeader& header);
    void on_resend_request(const PacketHeader& header, Clock::time_point now, std::vector<Bytes>& out);

    static Bytes control(PacketType type, Delivery mode, std::uint32_t sequence);

    ReliabilityConfig config_;

    SendChannel unordered_out_;
    SendChannel ordered_out_;

    // Every unordered sequence <= floor has been delivered; `seen` holds the rest.
    std::uint32_t unordered_floor_ = 0;
    std::set<std::uint32_t> unordered_seen_;

    std::uint32_t ordered_next_ = 1;
    std::map<std::uint32_t, Bytes> ordered_buffer_;

    Clock::time_point last_received_;
    Clock::time_point last_sent_;
    bool failed_ = false;
};

} // namespace facilitator::transport
