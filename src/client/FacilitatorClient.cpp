#include "client/FacilitatorClient.h"

#include "core/Errors.h"
#include "networking/Protocol.h"
#include "transport/UdpTransport.h"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/json.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <deque>
#include <exception>
#include <iostream>
#include <mutex>
#include <numeric>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace facilitator::client {

namespace asio = boost::asio;
namespace json = boost::json;
using networking::Message;
using networking::MessageKind;
using transport::Bytes;
using transport::Delivery;
using transport::Endpoint;
using Clock = std::chrono::steady_clock;

const char* to_string(PeerPath path) noexcept {
    switch (path) {
        case PeerPath::None:        return "none";
        case PeerPath::Negotiating: return "negotiating";
        case PeerPath::Direct:      return "direct";
        case PeerPath::Relayed:     return "relayed";
        case PeerPath::Failed:      return "failed";
    }
    return "unknown";
}

namespace {

constexpr std::size_t kLatencySamples = 64;

RoomInfo room_from_json(const json::object& o) {
    RoomInfo r;
    r.room_id = networking::get_string(o, "roomId");
    r.name = networking::opt_string(o, "name");
    r.capacity = static_cast<std::size_t>(networking::opt_int(o, "capacity", 0));
    r.member_count = static_cast<std::size_t>(networking::opt_int(o, "memberCount", 0));
    r.visibility = networking::opt_string(o, "visibility", "public");
    r.host_session_id = networking::opt_string(o, "hostSessionId");

    if (const auto* members = o.if_contains("members")) {
        const auto* arr = members->if_array();
        if (!arr) throw core::ProtocolError("members must be an array");
        for (const auto& m : *arr) {
            const auto* mo = m.if_object();
            if (!mo) throw core::ProtocolError("member must be an object");
            r.members.push_back({networking::get_string(*mo, "sessionId"), networking::opt_string(*mo, "name")});
        }
    }
    return r;
}

bool is_error_reply(MessageKind kind) {
    return kind == MessageKind::AuthError || kind == MessageKind::RoomFull ||
           kind == MessageKind::RoomNotFound || kind == MessageKind::Error;
}

std::exception_ptr error_from(const Message& msg) {
    try {
        switch (msg.kind) {
            case MessageKind::AuthError:
                core::throw_error(core::ErrorCode::Authentication,
                                  networking::opt_string(msg.body, "reason", "authentication failed"));
            case MessageKind::RoomFull:
                core::throw_error(core::ErrorCode::RoomFull, networking::opt_string(msg.body, "message", "room is full"));
            case MessageKind::RoomNotFound:
                core::throw_error(core::ErrorCode::RoomNotFound,
                                  networking::opt_string(msg.body, "message", "room not found"));
            default: {
                const auto text = networking::opt_string(msg.body, "message", "request failed");
                if (auto code = core::error_code_from_name(networking::opt_string(msg.body, "code"))) {
                    core::throw_error(*code, text);
                }
                throw std::runtime_error(text);
            }
        }
    } catch (const std::exception&) {
        return std::current_exception();
    }
}

std::string request_id_of(const json::object& body) {
    const auto* v = body.if_contains("requestId");
    if (!v || !v->is_string()) return {};
    return std::string(v->get_string());
}

} // namespace

class FacilitatorClient::Impl : public std::enable_shared_from_this<FacilitatorClient::Impl> {
public:
    Impl(asio::io_context& ioc, ClientOptions options)
        : options_(std::move(options)),
          transport_(ioc, options_.bind, options_.reliability),
          strand_(asio::make_strand(ioc)),
          timer_(ioc),
          epoch_(Clock::now()) {}

    void start() {
        std::weak_ptr<Impl> weak = weak_from_this();
        transport_.set_verbose(options_.verbose);
        transport_.set_on_receive([weak](const Endpoint& from, Bytes payload, Delivery mode) {
            if (auto self = weak.lock()) self->on_receive(from, payload, mode);
        });
        transport_.set_on_peer_failed([weak](const Endpoint& peer) {
            if (auto self = weak.lock()) self->on_transport_failed(peer);
        });

        running_ = true;
        transport_.start();
        asio::post(strand_, [self = shared_from_this()] { self->schedule_tick(); });
    }

    void stop() {
        if (!running_.exchange(false)) return;
        transport_.stop();
        asio::post(strand_, [self = shared_from_this()] { self->timer_.cancel(); });

        std::lock_guard<std::mutex> lk(mu_);
        fail_pending(std::make_exception_ptr(std::runtime_error("client stopped")));
    }

    std::future<std::string> connect() {
        auto promise = std::make_shared<std::promise<std::string>>();
        auto future = promise->get_future();
        const auto now = Clock::now();

        std::lock_guard<std::mutex> lk(mu_);
        // Start a new sequence space toward the server; it does the same when it registers us.
        transport_.forget(options_.server);
        reset_session_locked();

        const auto id = next_request_id();
        json::object body{
            {"token", options_.token},
            {"name", options_.name},
            {"platform", options_.platform},
            {"forceRelay", options_.force_relay},
            {"localEndpoints", networking::endpoints_to_json(options_.local_endpoints)},
            {"requestId", id},
        };

        Pending p;
        p.success = MessageKind::RegisterAck;
        p.resolve = [this, promise](const Message& m) {
            session_id_ = networking::get_string(m.body, "sessionId");
            last_heartbeat_ = Clock::now();
            std::cout << "[client] registered as " << session_id_ << "\n";
            promise->set_value(session_id_);
        };
        p.reject = [promise](std::exception_ptr e) { promise->set_exception(e); };
        p.deadline = now + options_.request_timeout;
        p.resend = networking::encode(MessageKind::Register, body);
        p.next_resend = now + options_.register_retry;

        transport_.send(options_.server, *p.resend, Delivery::Unreliable);
        pending_.emplace(id, std::move(p));
        return future;
    }

    void disconnect() {
        std::lock_guard<std::mutex> lk(mu_);
        if (session_id_.empty()) return;
        transport_.send(options_.server, networking::encode(MessageKind::Unregister), Delivery::ReliableOrdered);
        std::cout << "[client] " << session_id_ << " unregistered\n";
        reset_session_locked();
    }

    std::future<RoomInfo> create_room(const core::RoomConfig& config) {
        json::object cfg{
            {"name", config.name},
            {"capacity", config.capacity},
            {"visibility", core::to_string(config.visibility)},
        };
        if (!config.password.empty()) cfg["password"] = config.password;
        return room_request(MessageKind::CreateRoom, {{"config", std::move(cfg)}}, MessageKind::RoomCreated);
    }

    std::future<RoomInfo> join_room(const std::string& room_id, const std::string& password) {
        json::object body{{"roomId", room_id}};
        if (!password.empty()) body["password"] = password;
        return room_request(MessageKind::JoinRoom, std::move(body), MessageKind::RoomJoined);
    }

    std::future<RoomInfo> join_matching(const core::JoinCriteria& criteria) {
        return room_request(MessageKind::JoinRoom, {{"criteria", json::object{{"name", criteria.name}}}},
                            MessageKind::RoomJoined);
    }

    std::future<void> leave_room() {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();
        request(MessageKind::LeaveRoom, {}, MessageKind::RoomLeft,
                [this, promise](const Message&) {
                    links_.clear();
                    channels_.clear();
                    promise->set_value();
                },
                [promise](std::exception_ptr e) { promise->set_exception(e); });
        return future;
    }

    std::future<std::vector<RoomInfo>> list_rooms(const core::RoomFilter& filter) {
        auto promise = std::make_shared<std::promise<std::vector<RoomInfo>>>();
        auto future = promise->get_future();
        json::object f{
            {"name", filter.name},
            {"hasSpace", filter.has_space},
            {"includePrivate", filter.include_private},
        };
        request(MessageKind::ListRooms, {{"filter", std::move(f)}}, MessageKind::RoomList,
                [promise](const Message& m) {
                    std::vector<RoomInfo> rooms;
                    const auto* arr = m.body.if_contains("rooms");
                    if (!arr || !arr->is_array()) throw core::ProtocolError("RoomList without rooms");
                    for (const auto& r : arr->get_array()) {
                        const auto* o = r.if_object();
                        if (!o) throw core::ProtocolError("room entry must be an object");
                        rooms.push_back(room_from_json(*o));
                    }
                    promise->set_value(std::move(rooms));
                },
                [promise](std::exception_ptr e) { promise->set_exception(e); });
        return future;
    }

    void retry_link(const std::string& peer) {
        std::lock_guard<std::mutex> lk(mu_);
        if (session_id_.empty()) return;
        transport_.send(options_.server,
                        networking::encode(MessageKind::RetryLink, {{"peerSessionId", peer}}),
                        Delivery::ReliableOrdered);
    }

    bool send_to_peer(const std::string& peer, const Bytes& payload, Delivery mode) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = links_.find(peer);
        if (it == links_.end()) return false;
        const auto& link = it->second;

        if (link.path == PeerPath::Direct && link.punched) {
            return transport_.send(*link.punched, networking::encode_peer_data({session_id_, payload}), mode);
        }
        if (link.path == PeerPath::Relayed && link.channel_id) {
            core::RelayFrame frame;
            frame.channel_id = *link.channel_id;
            frame.delivery = mode;
            frame.payload = payload;
            return transport_.send(options_.server, networking::encode_relay(frame), mode);
        }
        return false;
    }

    PeerPath path_to(const std::string& peer) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = links_.find(peer);
        return it == links_.end() ? PeerPath::None : it->second.path;
    }

    std::string session_id() const {
        std::lock_guard<std::mutex> lk(mu_);
        return session_id_;
    }

    Endpoint local_endpoint() const { return transport_.local_endpoint(); }

    std::optional<std::chrono::milliseconds> average_rtt() const {
        std::lock_guard<std::mutex> lk(mu_);
        if (rtt_samples_.empty()) return std::nullopt;
        const auto total = std::accumulate(rtt_samples_.begin(), rtt_samples_.end(), std::int64_t{0});
        return std::chrono::milliseconds(total / static_cast<std::int64_t>(rtt_samples_.size()));
    }

    void set_on_peer_message(OnPeerMessage cb) {
        std::lock_guard<std::mutex> lk(mu_);
        on_peer_message_ = std::move(cb);
    }

    void set_on_peer_event(OnPeerEvent cb) {
        std::lock_guard<std::mutex> lk(mu_);
        on_peer_event_ = std::move(cb);
    }

    // Called with the client lock held; must not call back into the client.
    void set_probe_filter(ProbeFilter filter) {
        std::lock_guard<std::mutex> lk(mu_);
        probe_filter_ = std::move(filter);
    }

private:
    struct Pending {
        MessageKind success = MessageKind::Error;
        std::function<void(const Message&)> resolve;
        std::function<void(std::exception_ptr)> reject;
        Clock::time_point deadline;
        std::optional<Bytes> resend;  // Register goes out unreliably until answered
        Clock::time_point next_resend;
    };

    struct PunchAttempt {
        Endpoint to;
        Clock::time_point next_send;
        bool active = true;
    };

    struct Link {
        std::string link_id;
        PeerPath path = PeerPath::Negotiating;
        bool initiator = false;
        Clock::time_point start;
        Clock::time_point deadline;
        std::vector<PunchAttempt> attempts;
        std::optional<Endpoint> punched;  // first candidate a punch arrived from
        bool reported = false;
        std::optional<std::uint32_t> channel_id;
    };

    using Deferred = std::vector<std::function<void()>>;

    std::future<RoomInfo> room_request(MessageKind kind, json::object body, MessageKind success) {
        auto promise = std::make_shared<std::promise<RoomInfo>>();
        auto future = promise->get_future();
        request(kind, std::move(body), success,
                [promise](const Message& m) { promise->set_value(room_from_json(m.body)); },
                [promise](std::exception_ptr e) { promise->set_exception(e); });
        return future;
    }

    void request(MessageKind kind, json::object body, MessageKind success,
                 std::function<void(const Message&)> resolve,
                 std::function<void(std::exception_ptr)> reject) {
        std::lock_guard<std::mutex> lk(mu_);
        if (session_id_.empty()) {
            reject(std::make_exception_ptr(core::NotRegisteredError("not connected")));
            return;
        }

        const auto id = next_request_id();
        body["requestId"] = id;
        if (!transport_.send(options_.server, networking::encode(kind, body), Delivery::ReliableOrdered)) {
            reject(std::make_exception_ptr(std::runtime_error("send queue to the facilitator is full")));
            return;
        }

        Pending p;
        p.success = success;
        p.resolve = std::move(resolve);
        p.reject = std::move(reject);
        p.deadline = Clock::now() + options_.request_timeout;
        pending_.emplace(id, std::move(p));
    }

    std::string next_request_id() { return "req-" + std::to_string(++request_seq_); }

    void reset_session_locked() {
        session_id_.clear();
        links_.clear();
        channels_.clear();
    }

    void fail_pending(std::exception_ptr e) {
        for (auto& [id, p] : pending_) p.reject(e);
        pending_.clear();
    }

    // ---- receive path ----

    void on_receive(const Endpoint& from, const Bytes& payload, Delivery mode) {
        Message msg;
        try {
            msg = networking::decode(payload);
        } catch (const core::ProtocolError& e) {
            std::cerr << "[client] dropped datagram from " << from.to_string() << ": " << e.what() << "\n";
            return;
        }

        Deferred deferred;
        {
            std::lock_guard<std::mutex> lk(mu_);
            try {
                if (from == options_.server) on_server_message(msg, deferred);
                else on_peer_datagram(from, msg, mode, deferred);
            } catch (const core::ProtocolError& e) {
                std::cerr << "[client] bad " << networking::to_string(msg.kind) << " from "
                          << from.to_string() << ": " << e.what() << "\n";
            }
        }
        for (auto& f : deferred) f();
    }

    void on_server_message(Message& msg, Deferred& deferred) {
        if (options_.verbose) std::cout << "[client] <- " << networking::to_string(msg.kind) << "\n";

        const auto rid = request_id_of(msg.body);
        if (!rid.empty()) {
            auto it = pending_.find(rid);
            if (it != pending_.end() && (msg.kind == it->second.success || is_error_reply(msg.kind))) {
                Pending p = std::move(it->second);
                pending_.erase(it);
                if (msg.kind == p.success) {
                    try {
                        p.resolve(msg);
                    } catch (const core::ProtocolError&) {
                        p.reject(std::current_exception());
                    }
                } else {
                    p.reject(error_from(msg));
                }
                return;
            }
        }

        switch (msg.kind) {
            case MessageKind::HeartbeatAck: {
                const auto sent = networking::opt_int(msg.body, "sentAt", -1);
                if (sent < 0) break;
                rtt_samples_.push_back(std::max<std::int64_t>(0, since_epoch_ms() - sent));
                if (rtt_samples_.size() > kLatencySamples) rtt_samples_.pop_front();
                break;
            }
            case MessageKind::PeerJoined:
                emit(deferred, PeerEvent::Kind::Joined, networking::get_string(msg.body, "sessionId"),
                     networking::opt_string(msg.body, "roomId"));
                break;
            case MessageKind::PeerLeft: {
                const auto peer = networking::get_string(msg.body, "sessionId");
                drop_link(peer);
                emit(deferred, PeerEvent::Kind::Left, peer, networking::opt_string(msg.body, "roomId"),
                     PeerPath::None, networking::opt_string(msg.body, "reason"));
                break;
            }
            case MessageKind::HostChanged:
                emit(deferred, PeerEvent::Kind::HostChanged, networking::get_string(msg.body, "hostSessionId"),
                     networking::opt_string(msg.body, "roomId"));
                break;
            case MessageKind::CandidateExchange:
                begin_punch(msg.body);
                break;
            case MessageKind::LinkDirect:
                on_link_direct(msg.body, deferred);
                break;
            case MessageKind::RelayEstablished:
                on_relay_established(msg.body, deferred);
                break;
            case MessageKind::LinkFailed:
                on_link_failed(msg.body, deferred);
                break;
            case MessageKind::RelayData: {
                auto& frame = *msg.relay;
                auto it = channels_.find(frame.channel_id);
                if (it == channels_.end()) break;  // channel already released
                deliver(deferred, it->second, std::move(frame.payload), frame.delivery);
                break;
            }
            case MessageKind::Error:
                std::cerr << "[client] facilitator error " << networking::opt_string(msg.body, "code") << ": "
                          << networking::opt_string(msg.body, "message") << "\n";
                break;
            default:
                // Late answers to resent Registers and the like.
                break;
        }
    }

    void on_peer_datagram(const Endpoint& from, Message& msg, Delivery mode, Deferred& deferred) {
        switch (msg.kind) {
            case MessageKind::PunchProbe:
            case MessageKind::PunchAck: {
                const auto link_id = networking::get_string(msg.body, "linkId");
                auto it = links_.find(networking::get_string(msg.body, "sessionId"));
                if (it == links_.end() || it->second.link_id != link_id) return;
                auto& link = it->second;
                if (msg.kind == MessageKind::PunchProbe) send_punch(from, MessageKind::PunchAck, link);
                on_punched(link, from);
                break;
            }
            case MessageKind::PeerData: {
                auto& frame = *msg.peer_data;
                // Only the endpoint the punch succeeded with may speak for the peer.
                auto it = links_.find(frame.sender);
                if (it == links_.end() || !it->second.punched || *it->second.punched != from) {
                    if (options_.verbose) {
                        std::cerr << "[client] PeerData for " << frame.sender << " from unexpected "
                                  << from.to_string() << "\n";
                    }
                    return;
                }
                deliver(deferred, frame.sender, std::move(frame.payload), mode);
                break;
            }
            case MessageKind::Heartbeat:
                break;
            default:
                if (options_.verbose) {
                    std::cerr << "[client] unexpected " << networking::to_string(msg.kind) << " from "
                              << from.to_string() << "\n";
                }
                break;
        }
    }

    // ---- links ----

    void begin_punch(const json::object& body) {
        const auto peer = networking::get_string(body, "peerSessionId");
        const auto* endpoints = body.if_contains("endpoints");
        if (!endpoints) throw core::ProtocolError("CandidateExchange without endpoints");

        const auto now = Clock::now();
        Link link;
        link.link_id = networking::get_string(body, "linkId");
        link.initiator = networking::opt_bool(body, "initiator", false);
        link.start = link.initiator ? now : now + options_.responder_delay;
        link.deadline = now + std::chrono::milliseconds(networking::opt_int(body, "windowMs", 3000));
        for (const auto& ep : networking::endpoints_from_json(*endpoints)) {
            link.attempts.push_back({ep, link.start, true});
        }

        drop_link(peer);
        links_.emplace(peer, std::move(link));
    }

    // First success wins: the other candidates stop being probed.
    void on_punched(Link& link, const Endpoint& from) {
        if (link.path != PeerPath::Negotiating) return;
        if (!link.punched) {
            link.punched = from;
            for (auto& a : link.attempts) a.active = a.to == from;
        }
        if (!link.reported) {
            link.reported = true;
            transport_.send(options_.server,
                            networking::encode(MessageKind::PunchResult, {{"linkId", link.link_id}}),
                            Delivery::ReliableOrdered);
        }
    }

    void on_link_direct(const json::object& body, Deferred& deferred) {
        const auto peer = networking::get_string(body, "peerSessionId");
        auto it = links_.find(peer);
        if (it == links_.end()) return;
        auto& link = it->second;
        if (!link.punched) {
            // The server saw both reports but our own winner was lost; use the first candidate.
            if (link.attempts.empty()) return;
            link.punched = link.attempts.front().to;
        }
        link.path = PeerPath::Direct;
        link.attempts.clear();
        emit(deferred, PeerEvent::Kind::Connected, peer, {}, PeerPath::Direct);
    }

    void on_relay_established(const json::object& body, Deferred& deferred) {
        const auto peer = networking::get_string(body, "peerSessionId");
        const auto channel = static_cast<std::uint32_t>(networking::get_int(body, "channelId"));

        auto& link = links_[peer];  // forced relays skip CandidateExchange
        link.link_id = networking::opt_string(body, "linkId", link.link_id);
        link.path = PeerPath::Relayed;
        link.attempts.clear();
        link.channel_id = channel;
        channels_[channel] = peer;
        emit(deferred, PeerEvent::Kind::Connected, peer, {}, PeerPath::Relayed);
    }

    void on_link_failed(const json::object& body, Deferred& deferred) {
        const auto peer = networking::get_string(body, "peerSessionId");
        const auto reason = networking::opt_string(body, "reason");

        if (networking::opt_bool(body, "retryable", false)) {
            auto& link = links_[peer];
            link.link_id = networking::opt_string(body, "linkId", link.link_id);
            link.path = PeerPath::Failed;
            link.attempts.clear();
            if (link.channel_id) channels_.erase(*link.channel_id);
            link.channel_id.reset();
        } else {
            drop_link(peer);
        }
        emit(deferred, PeerEvent::Kind::LinkFailed, peer, {}, PeerPath::Failed, reason);
    }

    void drop_link(const std::string& peer) {
        auto it = links_.find(peer);
        if (it == links_.end()) return;
        if (it->second.channel_id) channels_.erase(*it->second.channel_id);
        links_.erase(it);
    }

    void send_punch(const Endpoint& to, MessageKind kind, const Link& link) {
        if (probe_filter_ && !probe_filter_(to)) return;
        transport_.send(to,
                        networking::encode(kind, {{"linkId", link.link_id}, {"sessionId", session_id_}}),
                        Delivery::Unreliable);
    }

    void emit(Deferred& deferred, PeerEvent::Kind kind, std::string session_id, std::string room_id,
              PeerPath path = PeerPath::None, std::string reason = {}) {
        PeerEvent ev;
        ev.kind = kind;
        ev.session_id = std::move(session_id);
        ev.room_id = std::move(room_id);
        ev.path = path;
        ev.reason = std::move(reason);
        deferred.push_back([cb = on_peer_event_, ev = std::move(ev)] {
            if (cb) cb(ev);
        });
    }

    void deliver(Deferred& deferred, const std::string& peer, Bytes payload, Delivery mode) {
        deferred.push_back([cb = on_peer_message_, peer, payload = std::move(payload), mode]() mutable {
            if (cb) cb(peer, std::move(payload), mode);
        });
    }

    void on_transport_failed(const Endpoint& peer) {
        Deferred deferred;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (peer == options_.server) {
                std::cerr << "[client] facilitator " << peer.to_string() << " stopped answering\n";
                reset_session_locked();
                fail_pending(std::make_exception_ptr(std::runtime_error("facilitator unreachable")));
                return;
            }
            for (auto& [id, link] : links_) {
                if (link.path == PeerPath::Direct && link.punched && *link.punched == peer) {
                    link.path = PeerPath::Failed;
                    emit(deferred, PeerEvent::Kind::LinkFailed, id, {}, PeerPath::Failed, "transport_failure");
                }
            }
        }
        for (auto& f : deferred) f();
    }

    // ---- timers ----

    void schedule_tick() {
        timer_.expires_after(options_.punch_interval);
        timer_.async_wait(asio::bind_executor(strand_, [self = shared_from_this()](boost::system::error_code ec) {
            if (ec || !self->running_) return;
            self->on_tick();
            self->schedule_tick();
        }));
    }

    void on_tick() {
        const auto now = Clock::now();
        std::lock_guard<std::mutex> lk(mu_);

        for (auto it = pending_.begin(); it != pending_.end();) {
            auto& p = it->second;
            if (now >= p.deadline) {
                p.reject(std::make_exception_ptr(std::runtime_error("request timed out")));
                it = pending_.erase(it);
                continue;
            }
            if (p.resend && now >= p.next_resend) {
                transport_.send(options_.server, *p.resend, Delivery::Unreliable);
                p.next_resend = now + options_.register_retry;
            }
            ++it;
        }

        if (!session_id_.empty() && now - last_heartbeat_ >= options_.heartbeat_interval) {
            last_heartbeat_ = now;
            transport_.send(options_.server,
                            networking::encode(MessageKind::Heartbeat, {{"sentAt", since_epoch_ms()}}),
                            Delivery::Unreliable);
            // Keeps the transport state of direct links from going idle.
            for (const auto& [peer, link] : links_) {
                if (link.path == PeerPath::Direct && link.punched) {
                    transport_.send(*link.punched, networking::encode(MessageKind::Heartbeat), Delivery::Unreliable);
                }
            }
        }

        // Parallel attempts: every live candidate is probed each interval.
        for (auto& [peer, link] : links_) {
            if (link.path != PeerPath::Negotiating || now < link.start || now >= link.deadline) continue;
            for (auto& a : link.attempts) {
                if (!a.active || now < a.next_send) continue;
                a.next_send = now + options_.punch_interval;
                send_punch(a.to, MessageKind::PunchProbe, link);
            }
        }
    }

    std::int64_t since_epoch_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - epoch_).count();
    }

    const ClientOptions options_;
    transport::UdpTransport transport_;
    asio::strand<asio::io_context::executor_type> strand_;
    asio::steady_timer timer_;
    const Clock::time_point epoch_;
    std::atomic<bool> running_{false};

    mutable std::mutex mu_;
    std::string session_id_;
    std::uint64_t request_seq_ = 0;
    std::unordered_map<std::string, Pending> pending_;
    std::unordered_map<std::string, Link> links_;  // by peer session id
    std::unordered_map<std::uint32_t, std::string> channels_;
    Clock::time_point last_heartbeat_{};
    std::deque<std::int64_t> rtt_samples_;

    OnPeerMessage on_peer_message_;
    OnPeerEvent on_peer_event_;
    ProbeFilter probe_filter_;
};

// ---- FacilitatorClient wrapper ----

FacilitatorClient::FacilitatorClient(asio::io_context& ioc, ClientOptions options)
    : impl_(std::make_shared<Impl>(ioc, std::move(options))) {
    impl_->start();
}

FacilitatorClient::~FacilitatorClient() { impl_->stop(); }

void FacilitatorClient::set_on_peer_message(OnPeerMessage cb) { impl_->set_on_peer_message(std::move(cb)); }
void FacilitatorClient::set_on_peer_event(OnPeerEvent cb) { impl_->set_on_peer_event(std::move(cb)); }
void FacilitatorClient::set_probe_filter(ProbeFilter filter) { impl_->set_probe_filter(std::move(filter)); }

std::future<std::string> FacilitatorClient::connect() { return impl_->connect(); }
void FacilitatorClient::disconnect() { impl_->disconnect(); }

std::future<RoomInfo> FacilitatorClient::create_room(const core::RoomConfig& config) {
    return impl_->create_room(config);
}

std::future<RoomInfo> FacilitatorClient::join_room(const std::string& room_id, const std::string& password) {
    return impl_->join_room(room_id, password);
}

std::future<RoomInfo> FacilitatorClient::join_matching(const core::JoinCriteria& criteria) {
    return impl_->join_matching(criteria);
}

std::future<void> FacilitatorClient::leave_room() { return impl_->leave_room(); }

std::future<std::vector<RoomInfo>> FacilitatorClient::list_rooms(const core::RoomFilter& filter) {
    return impl_->list_rooms(filter);
}

void FacilitatorClient::retry_link(const std::string& peer_session_id) { impl_->retry_link(peer_session_id); }

bool FacilitatorClient::send_to_peer(const std::string& peer_session_id, const transport::Bytes& payload,
                                     transport::Delivery mode) {
    return impl_->send_to_peer(peer_session_id, payload, mode);
}

PeerPath FacilitatorClient::path_to(const std::string& peer_session_id) const {
    return impl_->path_to(peer_session_id);
}

std::string FacilitatorClient::session_id() const { return impl_->session_id(); }

transport::Endpoint FacilitatorClient::local_endpoint() const { return impl_->local_endpoint(); }

std::optional<std::chrono::milliseconds> FacilitatorClient::average_rtt() const { return impl_->average_rtt(); }

} // namespace facilitator::client
