#include "networking/FacilitatorService.h"

#include <iostream>
#include <utility>

namespace facilitator::networking {

namespace json = boost::json;
using transport::Delivery;
using transport::Endpoint;

namespace {

std::string request_id_of(const json::object& body) {
    const auto* v = body.if_contains("requestId");
    if (!v || !v->is_string()) return {};
    return std::string(v->get_string());
}

} // namespace

FacilitatorService::FacilitatorService(FacilitatorConfig config, Outbox& outbox)
    : config_(std::move(config)),
      outbox_(outbox),
      sessions_(make_verifier(config_.auth), config_.sessions),
      rooms_(config_.rooms),
      relay_(config_.relay),
      links_(relay_, config_.rendezvous) {}

void FacilitatorService::handle(const Endpoint& from, const Bytes& payload, Delivery mode,
                                Clock::time_point now) {
    Message msg;
    try {
        msg = decode(payload);
    } catch (const core::ProtocolError& e) {
        std::cerr << "[facilitator] dropped datagram from " << from.to_string() << ": " << e.what() << "\n";
        return;
    }

    if (config_.verbose) {
        std::cout << "[facilitator] " << to_string(msg.kind) << " from " << from.to_string()
                  << " (" << transport::to_string(mode) << ")\n";
    }

    if (msg.kind == MessageKind::DiscoveryRequest) {
        send_unreliable(from, MessageKind::DiscoveryResponse,
                        {{"port", config_.port}, {"name", "facilitator"}}, request_id_of(msg.body));
        return;
    }

    if (msg.kind == MessageKind::Register) {
        std::lock_guard<std::mutex> lk(control_mu_);
        try {
            on_register(from, msg.body, now);
        } catch (const core::ProtocolError& e) {
            send_unreliable(from, MessageKind::Error,
                            {{"code", core::error_code_name(e.code())}, {"message", e.what()}},
                            request_id_of(msg.body));
        }
        return;
    }

    auto session = sessions_.find_by_endpoint(from);
    if (!session) {
        send_unreliable(from, MessageKind::Error,
                        {{"code", core::error_code_name(core::ErrorCode::NotRegistered)},
                         {"message", "register first"}},
                        request_id_of(msg.body));
        return;
    }
    sessions_.touch(session->session_id, now);

    if (msg.kind == MessageKind::Heartbeat) {
        json::object ack;
        if (const auto* sent = msg.body.if_contains("sentAt")) ack["sentAt"] = *sent;
        send_unreliable(from, MessageKind::HeartbeatAck, std::move(ack));
        return;
    }
    if (msg.kind == MessageKind::RelayData) {
        on_relay_data(from, std::move(*msg.relay), now);
        return;
    }

    std::lock_guard<std::mutex> lk(control_mu_);
    // A cascade may have removed the session while we waited for the lock.
    session = sessions_.find(session->session_id);
    if (!session) return;

    try {
        on_control(*session, msg, now);
    } catch (const core::FacilitatorError& e) {
        if (config_.verbose) {
            std::cerr << "[facilitator] " << to_string(msg.kind) << " from " << session->session_id
                      << " failed: " << e.what() << "\n";
        }
        send_error(from, e, request_id_of(msg.body));
    }
}

void FacilitatorService::on_register(const Endpoint& from, const json_object& body, Clock::time_point now) {
    core::RegisterRequest req;
    req.token = opt_string(body, "token");
    req.name = opt_string(body, "name");
    req.platform = opt_string(body, "platform");
    req.request_id = opt_string(body, "requestId");
    req.force_relay = opt_bool(body, "forceRelay", false);
    if (const auto* eps = body.if_contains("localEndpoints")) req.local_endpoints = endpoints_from_json(*eps);

    // A client restarted on the same address with a different token replaces its old session.
    if (auto existing = sessions_.find_by_endpoint(from); existing && existing->token != req.token) {
        disconnect(*existing, "replaced", now, true);
    }

    core::Registration reg;
    try {
        reg = sessions_.register_session(req, from, now);
    } catch (const core::AuthenticationError& e) {
        std::cerr << "[facilitator] register from " << from.to_string() << " rejected: " << e.what() << "\n";
        send_unreliable(from, MessageKind::AuthError, {{"reason", e.what()}}, req.request_id);
        return;
    } catch (const core::CapacityError& e) {
        std::cerr << "[facilitator] register from " << from.to_string() << " rejected: " << e.what() << "\n";
        send_unreliable(from, MessageKind::Error,
                        {{"code", core::error_code_name(e.code())}, {"message", e.what()}}, req.request_id);
        return;
    }

    const auto& s = reg.session;
    if (!reg.replayed) {
        // Fresh sequence space on both ends; the client forgets us before registering.
        outbox_.forget(from);
        std::cout << "[facilitator] session " << s.session_id << " (" << s.name << ") registered from "
                  << from.to_string() << (s.force_relay ? " [force relay]" : "") << "\n";
    }

    send_unreliable(from, MessageKind::RegisterAck,
                    {{"sessionId", s.session_id},
                     {"name", s.name},
                     {"publicEndpoint", json::value_from(s.observed)}},
                    req.request_id);
}

void FacilitatorService::on_control(const core::Session& session, Message& msg, Clock::time_point now) {
    const auto request_id = request_id_of(msg.body);

    switch (msg.kind) {
        case MessageKind::Unregister:
            disconnect(session, "unregistered", now, true);
            break;
        case MessageKind::CreateRoom:
            create_room(session, msg.body, request_id, now);
            break;
        case MessageKind::JoinRoom:
            join_room(session, msg.body, request_id, now);
            break;
        case MessageKind::LeaveRoom:
            leave_room(session, request_id, now);
            break;
        case MessageKind::ListRooms:
            list_rooms(session, msg.body, request_id);
            break;
        case MessageKind::PunchResult:
            punch_result(session, msg.body, now);
            break;
        case MessageKind::RetryLink:
            retry_link(session, msg.body, now);
            break;
        default:
            throw core::ProtocolError(std::string("unexpected message ") + to_string(msg.kind));
    }
}

void FacilitatorService::create_room(const core::Session& session, const json_object& body,
                                     const std::string& request_id, Clock::time_point now) {
    const json_object* cfg = &body;
    if (const auto* v = body.if_contains("config")) {
        cfg = v->if_object();
        if (!cfg) throw core::ProtocolError("config must be an object");
    }

    core::RoomConfig rc;
    rc.name = opt_string(*cfg, "name");
    const auto capacity = opt_int(*cfg, "capacity", 0);
    if (capacity < 0) throw core::ProtocolError("capacity must not be negative");
    rc.capacity = static_cast<std::size_t>(capacity);

    const auto visibility = core::visibility_from_string(opt_string(*cfg, "visibility", "public"));
    if (!visibility) throw core::ProtocolError("visibility must be public, private or password");
    rc.visibility = *visibility;
    rc.password = opt_string(*cfg, "password");
    if (rc.visibility == core::Visibility::Password && rc.password.empty()) {
        throw core::ProtocolError("a password room needs a password");
    }

    const auto room = rooms_.create_room(rc, now);
    std::cout << "[facilitator] room " << room.room_id << " (" << room.name << ", capacity " << room.capacity
              << ", " << core::to_string(room.visibility) << ") created by " << session.session_id << "\n";
    send_control(session.observed, MessageKind::RoomCreated, room_json(room), request_id);
}

void FacilitatorService::join_room(const core::Session& session, const json_object& body,
                                   const std::string& request_id, Clock::time_point now) {
    const auto room_id = opt_string(body, "roomId");

    core::Room room;
    try {
        if (!room_id.empty()) {
            room = rooms_.join_room(session.session_id, room_id, opt_string(body, "password"));
        } else {
            core::JoinCriteria criteria;
            if (const auto* v = body.if_contains("criteria")) {
                const auto* c = v->if_object();
                if (!c) throw core::ProtocolError("criteria must be an object");
                criteria.name = opt_string(*c, "name");
            }
            room = rooms_.join_matching(session.session_id, criteria);
        }
    } catch (const core::RoomFullError& e) {
        send_control(session.observed, MessageKind::RoomFull, {{"roomId", room_id}, {"message", e.what()}}, request_id);
        return;
    } catch (const core::RoomNotFoundError& e) {
        send_control(session.observed, MessageKind::RoomNotFound, {{"roomId", room_id}, {"message", e.what()}}, request_id);
        return;
    }

    sessions_.set_room(session.session_id, room.room_id);
    std::cout << "[facilitator] session " << session.session_id << " joined room " << room.room_id
              << " (" << room.members.size() << "/" << room.capacity << ")\n";

    json::array members;
    for (const auto& id : room.members) {
        const auto member = sessions_.find(id);
        members.push_back(json::object{{"sessionId", id}, {"name", member ? member->name : std::string("guest")}});
    }
    auto reply = room_json(room);
    reply["members"] = std::move(members);
    send_control(session.observed, MessageKind::RoomJoined, std::move(reply), request_id);

    // Full mesh: one link between the joiner and every member already present.
    for (const auto& id : room.members) {
        if (id == session.session_id) continue;
        const auto peer = sessions_.find(id);
        if (!peer) continue;

        send_control(peer->observed, MessageKind::PeerJoined,
                     {{"roomId", room.room_id}, {"sessionId", session.session_id}, {"name", session.name}});

        const bool force_relay = config_.force_relay || session.force_relay || peer->force_relay;
        const auto link = links_.create_link(room.room_id,
                                             {session.session_id, session.observed},
                                             {peer->session_id, peer->observed},
                                             force_relay, now);
        announce_link(link);
    }
}

void FacilitatorService::leave_room(const core::Session& session, const std::string& request_id,
                                    Clock::time_point now) {
    const auto room_id = rooms_.room_of(session.session_id);
    if (!room_id) throw core::NotMemberError("not a member of any room");

    leave_current_room(session.session_id, "peer_left", now);
    send_control(session.observed, MessageKind::RoomLeft, {{"roomId", *room_id}}, request_id);
}

void FacilitatorService::list_rooms(const core::Session& session, const json_object& body,
                                    const std::string& request_id) {
    const json_object* f = &body;
    if (const auto* v = body.if_contains("filter")) {
        f = v->if_object();
        if (!f) throw core::ProtocolError("filter must be an object");
    }

    core::RoomFilter filter;
    filter.name = opt_string(*f, "name");
    filter.has_space = opt_bool(*f, "hasSpace", false);
    filter.include_private = opt_bool(*f, "includePrivate", false);

    json::array rooms;
    for (const auto& room : rooms_.list_rooms(filter)) rooms.push_back(room_json(room));
    send_control(session.observed, MessageKind::RoomList, {{"rooms", std::move(rooms)}}, request_id);
}

void FacilitatorService::punch_result(const core::Session& session, const json_object& body,
                                      Clock::time_point now) {
    const auto link = links_.report_punch(get_string(body, "linkId"), session.session_id, now);
    if (link) announce_link(*link);
}

void FacilitatorService::retry_link(const core::Session& session, const json_object& body,
                                    Clock::time_point now) {
    const auto link = links_.retry(session.session_id, get_string(body, "peerSessionId"), now);
    announce_link(link);
}

void FacilitatorService::on_relay_data(const Endpoint& from, core::RelayFrame frame, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(relay_mu_);
    std::vector<core::RelayOutgoing> out;
    const auto channel = frame.channel_id;
    const auto result = relay_.forward(channel, from, frame.delivery, std::move(frame.payload), now, out);

    // A missing channel means the link was torn down while the frame was in flight.
    if (config_.verbose && result != core::ForwardResult::Forwarded) {
        std::cout << "[relay] channel " << channel << " from " << from.to_string() << ": "
                  << core::to_string(result) << "\n";
    }
    send_relay(out);
}

void FacilitatorService::tick(Clock::time_point now) {
    std::vector<core::RelayOutgoing> out;
    {
        std::lock_guard<std::mutex> lk(control_mu_);

        if (!last_sweep_ || now - *last_sweep_ >= config_.sweep_interval) {
            last_sweep_ = now;
            for (const auto& s : sessions_.expire_sweep(now)) {
                disconnect(s, "liveness timeout", now, false);
            }
            for (const auto& id : rooms_.sweep_empty(now)) {
                std::cout << "[facilitator] room " << id << " destroyed after staying empty\n";
            }
        }

        for (const auto& link : links_.expire(now)) announce_link(link);
    }

    std::lock_guard<std::mutex> lk(relay_mu_);
    relay_.drain(now, out);
    send_relay(out);
}

void FacilitatorService::on_peer_failed(const Endpoint& peer, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(control_mu_);
    if (auto s = sessions_.find_by_endpoint(peer)) disconnect(*s, "transport failure", now, true);
}

void FacilitatorService::disconnect(const core::Session& session, const char* cause, Clock::time_point now,
                                    bool still_registered) {
    if (still_registered) sessions_.remove(session.session_id);
    leave_current_room(session.session_id, "peer_disconnected", now);
    outbox_.forget(session.observed);
    std::cout << "[facilitator] session " << session.session_id << " disconnected (" << cause << ")\n";
}

void FacilitatorService::leave_current_room(const std::string& session_id, const char* reason,
                                            Clock::time_point now) {
    tear_down_links(session_id, reason);

    if (!rooms_.room_of(session_id)) return;
    const auto left = rooms_.leave_room(session_id, now);
    sessions_.set_room(session_id, std::nullopt);

    for (const auto& member : left.room.members) {
        const auto ep = endpoint_of(member);
        if (!ep) continue;
        send_control(*ep, MessageKind::PeerLeft,
                     {{"roomId", left.room.room_id}, {"sessionId", session_id}, {"reason", reason}});
        if (left.new_host) {
            send_control(*ep, MessageKind::HostChanged,
                         {{"roomId", left.room.room_id}, {"hostSessionId", *left.new_host}});
        }
    }

    std::cout << "[facilitator] session " << session_id << " left room " << left.room.room_id;
    if (left.new_host) std::cout << ", host is now " << *left.new_host;
    if (left.room.members.empty()) std::cout << ", room empty";
    std::cout << "\n";
}

void FacilitatorService::tear_down_links(const std::string& session_id, const char* reason) {
    for (const auto& link : links_.remove_links_for(session_id)) {
        const auto& to = link.initiator(session_id) ? link.endpoint_b : link.endpoint_a;
        send_control(to, MessageKind::LinkFailed,
                     {{"peerSessionId", session_id},
                      {"linkId", link.link_id},
                      {"reason", reason},
                      {"retryable", false}});
        if (link.channel_id) {
            std::cout << "[relay] channel " << *link.channel_id << " released (" << link.link_id << ")\n";
        }
    }
}

void FacilitatorService::announce_link(const core::PeerLink& link) {
    std::cout << "[rendezvous] link " << link.link_id << " " << link.session_a << " <-> " << link.session_b
              << ": " << core::to_string(link.state);
    if (link.channel_id) std::cout << " channel " << *link.channel_id;
    if (!link.reason.empty()) std::cout << " (" << link.reason << ")";
    std::cout << "\n";

    switch (link.state) {
        case core::LinkState::Negotiating: {
            const auto a = sessions_.find(link.session_a);
            const auto b = sessions_.find(link.session_b);
            if (!a || !b) return;
            const auto window = config_.rendezvous.negotiation_window.count();
            send_control(link.endpoint_a, MessageKind::CandidateExchange,
                         {{"peerSessionId", b->session_id}, {"linkId", link.link_id},
                          {"endpoints", endpoints_to_json(b->candidates)},
                          {"initiator", true}, {"windowMs", window}, {"attempt", link.attempts}});
            send_control(link.endpoint_b, MessageKind::CandidateExchange,
                         {{"peerSessionId", a->session_id}, {"linkId", link.link_id},
                          {"endpoints", endpoints_to_json(a->candidates)},
                          {"initiator", false}, {"windowMs", window}, {"attempt", link.attempts}});
            break;
        }
        case core::LinkState::Direct:
            send_control(link.endpoint_a, MessageKind::LinkDirect,
                         {{"peerSessionId", link.session_b}, {"linkId", link.link_id}});
            send_control(link.endpoint_b, MessageKind::LinkDirect,
                         {{"peerSessionId", link.session_a}, {"linkId", link.link_id}});
            break;
        case core::LinkState::Relayed:
            send_control(link.endpoint_a, MessageKind::RelayEstablished,
                         {{"peerSessionId", link.session_b}, {"linkId", link.link_id},
                          {"channelId", *link.channel_id}});
            send_control(link.endpoint_b, MessageKind::RelayEstablished,
                         {{"peerSessionId", link.session_a}, {"linkId", link.link_id},
                          {"channelId", *link.channel_id}});
            break;
        case core::LinkState::Failed: {
            const bool retryable = link.attempts <= config_.rendezvous.retry_cap;
            send_control(link.endpoint_a, MessageKind::LinkFailed,
                         {{"peerSessionId", link.session_b}, {"linkId", link.link_id},
                          {"reason", link.reason}, {"retryable", retryable}});
            send_control(link.endpoint_b, MessageKind::LinkFailed,
                         {{"peerSessionId", link.session_a}, {"linkId", link.link_id},
                          {"reason", link.reason}, {"retryable", retryable}});
            break;
        }
    }
}

void FacilitatorService::send_control(const Endpoint& to, MessageKind kind, json_object body,
                                      const std::string& request_id) {
    if (!request_id.empty()) body["requestId"] = request_id;
    outbox_.send(to, encode(kind, body), Delivery::ReliableOrdered);
}

void FacilitatorService::send_unreliable(const Endpoint& to, MessageKind kind, json_object body,
                                         const std::string& request_id) {
    if (!request_id.empty()) body["requestId"] = request_id;
    outbox_.send(to, encode(kind, body), Delivery::Unreliable);
}

void FacilitatorService::send_error(const Endpoint& to, const core::FacilitatorError& e,
                                    const std::string& request_id) {
    switch (e.code()) {
        case core::ErrorCode::RoomFull:
            send_control(to, MessageKind::RoomFull, {{"message", e.what()}}, request_id);
            break;
        case core::ErrorCode::RoomNotFound:
            send_control(to, MessageKind::RoomNotFound, {{"message", e.what()}}, request_id);
            break;
        case core::ErrorCode::Authentication:
            send_control(to, MessageKind::AuthError, {{"reason", e.what()}}, request_id);
            break;
        default:
            send_control(to, MessageKind::Error,
                         {{"code", core::error_code_name(e.code())}, {"message", e.what()}}, request_id);
            break;
    }
}

void FacilitatorService::send_relay(std::vector<core::RelayOutgoing>& out) {
    for (auto& o : out) outbox_.send(o.to, encode_relay(o.frame), o.frame.delivery);
}

FacilitatorService::json_object FacilitatorService::room_json(const core::Room& room) const {
    json_object obj{
        {"roomId", room.room_id},
        {"name", room.name},
        {"capacity", room.capacity},
        {"memberCount", room.members.size()},
        {"visibility", core::to_string(room.visibility)},
    };
    const auto host = room.host();
    obj["hostSessionId"] = host ? json::value(*host) : json::value(nullptr);
    return obj;
}

std::optional<Endpoint> FacilitatorService::endpoint_of(const std::string& session_id) const {
    const auto s = sessions_.find(session_id);
    if (!s) return std::nullopt;
    return s->observed;
}

} // namespace facilitator::networking
