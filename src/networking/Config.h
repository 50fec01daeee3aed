#pragma once

#include "core/RelayEngine.h"
#include "core/RendezvousCoordinator.h"
#include "core/RoomDirectory.h"
#include "core/SessionRegistry.h"
#include "core/TokenVerifier.h"
#include "transport/ReliableConnection.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace facilitator::networking {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct AuthConfig {
    enum class Mode { Any, Static, Hmac };

    Mode mode = Mode::Any;
    std::vector<std::string> tokens;  // Static
    std::string secret;               // Hmac
};

struct FacilitatorConfig {
    static constexpr std::uint16_t kDefaultPort = 9009;

    std::string bind_address = "0.0.0.0";
    std::uint16_t port = kDefaultPort;
    unsigned worker_threads = 2;
    bool verbose = false;
    std::chrono::milliseconds tick_interval{50};

    transport::ReliabilityConfig transport;

    core::SessionLimits sessions;
    std::chrono::milliseconds sweep_interval{1000};

    core::RoomLimits rooms;
    core::RendezvousLimits rendezvous;
    bool force_relay = false;

    core::RelayLimits relay;
    AuthConfig auth;
};

// Parses a JSON document. Keys left out keep their defaults; unknown keys,
// wrong types and zero limits throw ConfigError.
FacilitatorConfig parse_config(const std::string& text);
FacilitatorConfig load_config(const std::string& path);

std::shared_ptr<const core::TokenVerifier> make_verifier(const AuthConfig& auth);

} // namespace facilitator::networking
