#pragma once

#include "core/Errors.h"
#include "core/RelayEngine.h"
#include "core/RendezvousCoordinator.h"
#include "core/RoomDirectory.h"
#include "core/SessionRegistry.h"
#include "networking/Config.h"
#include "networking/Protocol.h"
#include "transport/Endpoint.h"
#include "transport/Packet.h"

#include <boost/json.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace facilitator::networking {

// Where the service writes. The server backs it with the UDP transport; tests
// record into memory.
class Outbox {
public:
    virtual ~Outbox() = default;
    virtual void send(const transport::Endpoint& to, const Bytes& payload, transport::Delivery mode) = 0;
    // Drops transport state for an endpoint whose session is gone or starting over.
    virtual void forget(const transport::Endpoint& peer) = 0;
};

// Protocol logic of the Facilitator, independent of sockets and clocks.
//
// handle() may be called from several threads at once. Control messages are
// serialised on one mutex so a cascade (leave, disconnect) is never interleaved
// with another; RelayData and Heartbeat stay off that mutex.
class FacilitatorService {
public:
    using Clock = std::chrono::steady_clock;

    FacilitatorService(FacilitatorConfig config, Outbox& outbox);

    FacilitatorService(const FacilitatorService&) = delete;
    FacilitatorService& operator=(const FacilitatorService&) = delete;

    void handle(const transport::Endpoint& from, const Bytes& payload,
                transport::Delivery mode, Clock::time_point now);

    // Liveness sweep, negotiation windows, empty rooms and relay backlog.
    void tick(Clock::time_point now);

    // The transport gave up retransmitting to `peer`.
    void on_peer_failed(const transport::Endpoint& peer, Clock::time_point now);

    const FacilitatorConfig& config() const noexcept { return config_; }
    const core::SessionRegistry& sessions() const noexcept { return sessions_; }
    const core::RoomDirectory& rooms() const noexcept { return rooms_; }
    const core::RendezvousCoordinator& links() const noexcept { return links_; }
    const core::RelayEngine& relay() const noexcept { return relay_; }

private:
    using json_object = boost::json::object;

    void on_register(const transport::Endpoint& from, const json_object& body, Clock::time_point now);
    void on_control(const core::Session& session, Message& msg, Clock::time_point now);
    void on_relay_data(const transport::Endpoint& from, core::RelayFrame frame, Clock::time_point now);

    void create_room(const core::Session& session, const json_object& body, const std::string& request_id,
                     Clock::time_point now);
    void join_room(const core::Session& session, const json_object& body, const std::string& request_id,
                   Clock::time_point now);
    void leave_room(const core::Session& session, const std::string& request_id, Clock::time_point now);
    void list_rooms(const core::Session& session, const json_object& body, const std::string& request_id);
    void punch_result(const core::Session& session, const json_object& body, Clock::time_point now);
    void retry_link(const core::Session& session, const json_object& body, Clock::time_point now);

    // Cascades; the caller holds control_mu_.
    void disconnect(const core::Session& session, const char* cause, Clock::time_point now, bool still_registered);
    void leave_current_room(const std::string& session_id, const char* reason, Clock::time_point now);
    void tear_down_links(const std::string& session_id, const char* reason);
    void announce_link(const core::PeerLink& link);

    void send_control(const transport::Endpoint& to, MessageKind kind, json_object body,
                      const std::string& request_id = {});
    void send_unreliable(const transport::Endpoint& to, MessageKind kind, json_object body,
                         const std::string& request_id = {});
    void send_error(const transport::Endpoint& to, const core::FacilitatorError& e,
                    const std::string& request_id);
    void send_relay(std::vector<core::RelayOutgoing>& out);

    json_object room_json(const core::Room& room) const;
    std::optional<transport::Endpoint> endpoint_of(const std::string& session_id) const;

    const FacilitatorConfig config_;
    Outbox& outbox_;

    core::SessionRegistry sessions_;
    core::RoomDirectory rooms_;
    core::RelayEngine relay_;
    core::RendezvousCoordinator links_;

    std::mutex control_mu_;
    // Held from relay_.forward()/drain() until their frames are in the outbox, so
    // the transport sequences frames in the order the relay stamped them.
    std::mutex relay_mu_;
    std::optional<Clock::time_point> last_sweep_;
};

} // namespace facilitator::networking
