#pragma once

#include "core/IDGenerator.hpp"
#include "core/RelayEngine.h"
#include "transport/Endpoint.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace facilitator::core {

enum class LinkState { Negotiating, Direct, Relayed, Failed };

const char* to_string(LinkState s) noexcept;

// Connectivity between two sessions of one room. session_a is always the
// lexicographically smaller id and punches first.
struct PeerLink {
    using Clock = std::chrono::steady_clock;

    std::string link_id;
    std::string room_id;
    std::string session_a;
    std::string session_b;
    transport::Endpoint endpoint_a;  // observed endpoints, used for relay legs
    transport::Endpoint endpoint_b;

    LinkState state = LinkState::Negotiating;
    unsigned attempts = 0;  // negotiations started, including the first
    Clock::time_point last_transition{};
    Clock::time_point deadline{};  // end of the punch window while negotiating

    bool punched_a = false;  // a reported a punch received from b
    bool punched_b = false;
    bool force_relay = false;

    std::optional<std::uint32_t> channel_id;  // set exactly while relayed
    std::string reason;                       // why the link failed

    bool involves(const std::string& session_id) const noexcept {
        return session_a == session_id || session_b == session_id;
    }
    const std::string& other(const std::string& session_id) const noexcept {
        return session_a == session_id ? session_b : session_a;
    }
    bool initiator(const std::string& session_id) const noexcept { return session_a == session_id; }
};

struct LinkEndpoint {
    std::string session_id;
    transport::Endpoint endpoint;
};

struct RendezvousLimits {
    std::chrono::milliseconds negotiation_window{3000};
    unsigned retry_cap = 3;
};

// PeerLink state machine: negotiating -> {direct, relayed, failed}.
//
// A link still negotiating when its window runs out gets a relay channel; if the
// relay has no capacity left the link fails. Failed links can be retried up to
// retry_cap times.
class RendezvousCoordinator {
public:
    using Clock = PeerLink::Clock;

    RendezvousCoordinator(RelayEngine& relay, RendezvousLimits limits);

    // Creates the link between two sessions of `room_id`. With force_relay the
    // link skips negotiation. Throws AlreadyMemberError if they are already linked.
    PeerLink create_link(const std::string& room_id, const LinkEndpoint& x, const LinkEndpoint& y,
                         bool force_relay, Clock::time_point now);

    // `session_id` received a punch from its peer. Returns the link when both
    // sides have reported and it became direct. Reports on links no longer
    // negotiating are ignored. Throws LinkNotFoundError or NotMemberError.
    std::optional<PeerLink> report_punch(const std::string& link_id, const std::string& session_id,
                                         Clock::time_point now);

    // Moves links whose window elapsed to relayed (or failed); returns them.
    std::vector<PeerLink> expire(Clock::time_point now);

    // Restarts negotiation of a failed link between the two sessions. Throws
    // LinkNotFoundError, ProtocolError when the link is not failed, RetryLimitError.
    PeerLink retry(const std::string& session_id, const std::string& peer_session_id,
                   Clock::time_point now);

    // Removes every link touching the session and releases their relay channels.
    std::vector<PeerLink> remove_links_for(const std::string& session_id);

    std::optional<PeerLink> find(const std::string& link_id) const;
    std::optional<PeerLink> find_between(const std::string& x, const std::string& y) const;
    std::vector<PeerLink> links_for(const std::string& session_id) const;
    std::size_t size() const;

private:
    void begin_negotiation(PeerLink& link, Clock::time_point now);
    void start_relay(PeerLink& link, Clock::time_point now);
    PeerLink* find_between_locked(const std::string& x, const std::string& y);

    RelayEngine& relay_;
    const RendezvousLimits limits_;
    IDGenerator idgen_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, PeerLink> links_;
};

} // namespace facilitator::core
