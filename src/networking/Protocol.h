#pragma once

#include "core/RelayEngine.h"
#include "transport/Endpoint.h"

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace facilitator::networking {

using transport::Bytes;

// First byte of every application payload.
enum class MessageKind : std::uint8_t {
    Register = 1,
    RegisterAck,
    AuthError,
    Unregister,
    CreateRoom,
    RoomCreated,
    JoinRoom,
    RoomJoined,
    RoomFull,
    RoomNotFound,
    LeaveRoom,
    RoomLeft,
    ListRooms,
    RoomList,
    PeerJoined,
    PeerLeft,
    HostChanged,
    CandidateExchange,
    PunchProbe,
    PunchAck,
    PunchResult,
    LinkDirect,
    RelayEstablished,
    RelayData,  // binary
    PeerData,   // binary
    LinkFailed,
    RetryLink,
    Heartbeat,
    HeartbeatAck,
    Error,
    DiscoveryRequest,
    DiscoveryResponse,
};

const char* to_string(MessageKind kind) noexcept;

// Application data sent straight to a peer over a direct link.
struct PeerDataFrame {
    std::string sender;  // sender session id
    Bytes payload;
};

struct Message {
    MessageKind kind = MessageKind::Error;
    boost::json::object body;                // control messages
    std::optional<core::RelayFrame> relay;   // RelayData
    std::optional<PeerDataFrame> peer_data;  // PeerData
};

Bytes encode(MessageKind kind, const boost::json::object& body = {});
Bytes encode_relay(const core::RelayFrame& frame);
Bytes encode_peer_data(const PeerDataFrame& frame);

// Throws core::ProtocolError for anything malformed.
Message decode(const Bytes& payload);

// Body field access; the required forms throw core::ProtocolError.
std::string get_string(const boost::json::object& body, const char* key);
std::string opt_string(const boost::json::object& body, const char* key, const std::string& fallback = {});
std::int64_t get_int(const boost::json::object& body, const char* key);
std::int64_t opt_int(const boost::json::object& body, const char* key, std::int64_t fallback);
bool opt_bool(const boost::json::object& body, const char* key, bool fallback);

boost::json::array endpoints_to_json(const std::vector<transport::Endpoint>& endpoints);
std::vector<transport::Endpoint> endpoints_from_json(const boost::json::value& value);

} // namespace facilitator::networking
