#pragma once

#include "core/IDGenerator.hpp"
#include "core/Session.h"
#include "core/TokenVerifier.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace facilitator::core {

struct RegisterRequest {
    std::string token;
    std::string name;
    std::string platform;
    std::string request_id;
    std::vector<transport::Endpoint> local_endpoints;
    bool force_relay = false;
};

struct Registration {
    Session session;
    bool replayed = false;  // same Register seen again; nothing changed
};

struct SessionLimits {
    std::size_t max_sessions = 1024;
    std::chrono::milliseconds liveness_timeout{30000};
};

// The table of connected sessions. All reads return copies taken under the lock,
// so callers never see a session half-way through an update.
class SessionRegistry {
public:
    using Clock = Session::Clock;

    SessionRegistry(std::shared_ptr<const TokenVerifier> verifier, SessionLimits limits);

    // Throws AuthenticationError for a rejected token or one already bound to a
    // live session, CapacityError when max_sessions are connected. A repeat of the
    // Register that created the live session (same endpoint and requestId) is
    // answered with that session and replayed = true.
    Registration register_session(const RegisterRequest& request,
                                  const transport::Endpoint& observed,
                                  Clock::time_point now);

    // Liveness update; false for unknown sessions.
    bool touch(const std::string& session_id, Clock::time_point now);

    void set_room(const std::string& session_id, std::optional<std::string> room_id);

    // Removes the session and returns it marked disconnected.
    std::optional<Session> remove(const std::string& session_id);

    // Removes and returns every session silent for longer than the liveness timeout.
    std::vector<Session> expire_sweep(Clock::time_point now);

    std::optional<Session> find(const std::string& session_id) const;
    std::optional<Session> find_by_endpoint(const transport::Endpoint& endpoint) const;
    std::vector<Session> snapshot() const;
    std::size_t size() const;

private:
    Session erase_locked(std::unordered_map<std::string, Session>::iterator it);

    std::shared_ptr<const TokenVerifier> verifier_;
    const SessionLimits limits_;
    IDGenerator idgen_;

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, Session> sessions_;
    std::unordered_map<std::string, std::string> by_token_;
    std::unordered_map<transport::Endpoint, std::string, transport::EndpointHash> by_endpoint_;
};

} // namespace facilitator::core
