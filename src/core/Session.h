#pragma once

#include "transport/Endpoint.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace facilitator::core {

enum class SessionState { Connected, Disconnected };

const char* to_string(SessionState state) noexcept;

// One registered client. The registry owns these; everything else holds a copy
// or the session id.
struct Session {
    using Clock = std::chrono::steady_clock;
    static constexpr std::size_t kMaxNameLen = 24;

    std::string session_id;  // "session-<ulid>"
    std::string token;
    std::string name;
    std::string platform;
    std::string request_id;  // requestId of the Register that created it

    std::optional<std::string> room_id;

    transport::Endpoint observed;                 // source address seen by the server
    std::vector<transport::Endpoint> candidates;  // declared local endpoints + observed
    bool force_relay = false;

    SessionState state = SessionState::Connected;
    Clock::time_point connected_at{};
    Clock::time_point last_seen{};

    void touch(Clock::time_point now) noexcept { last_seen = now; }
};

// Trims whitespace, caps at kMaxNameLen and falls back to "guest".
std::string sanitize_name(std::string name);

} // namespace facilitator::core
