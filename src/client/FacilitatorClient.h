#pragma once

#include "core/RoomDirectory.h"
#include "transport/Endpoint.h"
#include "transport/Packet.h"
#include "transport/ReliableConnection.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace facilitator::client {

struct ClientOptions {
    transport::Endpoint server;
    std::string token;
    std::string name;
    std::string platform = "desktop";
    bool force_relay = false;

    boost::asio::ip::udp::endpoint bind{boost::asio::ip::address_v4::any(), 0};
    // Advertised as local candidates besides the address the server observes.
    std::vector<transport::Endpoint> local_endpoints;

    transport::ReliabilityConfig reliability;
    std::chrono::milliseconds request_timeout{5000};
    std::chrono::milliseconds register_retry{250};
    std::chrono::milliseconds heartbeat_interval{10000};
    std::chrono::milliseconds punch_interval{50};
    std::chrono::milliseconds responder_delay{50};  // non-initiator starts punching this much later
    bool verbose = false;
};

enum class PeerPath { None, Negotiating, Direct, Relayed, Failed };

const char* to_string(PeerPath path) noexcept;

struct RoomMember {
    std::string session_id;
    std::string name;
};

struct RoomInfo {
    std::string room_id;
    std::string name;
    std::size_t capacity = 0;
    std::size_t member_count = 0;
    std::string visibility;
    std::string host_session_id;
    std::vector<RoomMember> members;  // join order; only filled by joins
};

struct PeerEvent {
    enum class Kind { Joined, Left, HostChanged, Connected, LinkFailed };

    Kind kind = Kind::Joined;
    std::string room_id;
    std::string session_id;  // the peer, or the new host for HostChanged
    PeerPath path = PeerPath::None;
    std::string reason;
};

// Session-layer API over the Facilitator: connect, rooms, and peer messaging.
//
// Paths to peers are negotiated automatically once both share a room: hole
// punching first, the relay when the server says so. Requests return futures
// that fail with the typed core errors the server reported.
class FacilitatorClient {
public:
    using OnPeerMessage = std::function<void(const std::string& peer, transport::Bytes payload, transport::Delivery mode)>;
    using OnPeerEvent   = std::function<void(const PeerEvent& event)>;
    // Return false to suppress a punch packet to `to`.
    using ProbeFilter   = std::function<bool(const transport::Endpoint& to)>;

    FacilitatorClient(boost::asio::io_context& ioc, ClientOptions options);
    ~FacilitatorClient();

    FacilitatorClient(const FacilitatorClient&) = delete;
    FacilitatorClient& operator=(const FacilitatorClient&) = delete;

    void set_on_peer_message(OnPeerMessage cb);
    void set_on_peer_event(OnPeerEvent cb);
    void set_probe_filter(ProbeFilter filter);

    // Resolves to the session id.
    std::future<std::string> connect();
    void disconnect();

    std::future<RoomInfo> create_room(const core::RoomConfig& config);
    std::future<RoomInfo> join_room(const std::string& room_id, const std::string& password = {});
    std::future<RoomInfo> join_matching(const core::JoinCriteria& criteria);
    std::future<void> leave_room();
    std::future<std::vector<RoomInfo>> list_rooms(const core::RoomFilter& filter);
    void retry_link(const std::string& peer_session_id);

    // False when there is no usable path to the peer yet or the send queue is full.
    bool send_to_peer(const std::string& peer_session_id, const transport::Bytes& payload,
                      transport::Delivery mode);

    PeerPath path_to(const std::string& peer_session_id) const;
    std::string session_id() const;
    transport::Endpoint local_endpoint() const;
    std::optional<std::chrono::milliseconds> average_rtt() const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace facilitator::client
