#include "networking/Protocol.h"

#include "core/Errors.h"

#include <boost/endian/conversion.hpp>

#include <cstring>
#include <exception>
#include <limits>
#include <string>

namespace facilitator::networking {

namespace json = boost::json;
namespace endian = boost::endian;

namespace {

// kind | u32 channel | u32 seq | u8 delivery | payload
constexpr std::size_t kRelayHeader = 1 + 4 + 4 + 1;

const json::value* field(const json::object& body, const char* key) {
    return body.if_contains(key);
}

} // namespace

const char* to_string(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::Register:          return "Register";
        case MessageKind::RegisterAck:       return "RegisterAck";
        case MessageKind::AuthError:         return "AuthError";
        case MessageKind::Unregister:        return "Unregister";
        case MessageKind::CreateRoom:        return "CreateRoom";
        case MessageKind::RoomCreated:       return "RoomCreated";
        case MessageKind::JoinRoom:          return "JoinRoom";
        case MessageKind::RoomJoined:        return "RoomJoined";
        case MessageKind::RoomFull:          return "RoomFull";
        case MessageKind::RoomNotFound:      return "RoomNotFound";
        case MessageKind::LeaveRoom:         return "LeaveRoom";
        case MessageKind::RoomLeft:          return "RoomLeft";
        case MessageKind::ListRooms:         return "ListRooms";
        case MessageKind::RoomList:          return "RoomList";
        case MessageKind::PeerJoined:        return "PeerJoined";
        case MessageKind::PeerLeft:          return "PeerLeft";
        case MessageKind::HostChanged:       return "HostChanged";
        case MessageKind::CandidateExchange: return "CandidateExchange";
        case MessageKind::PunchProbe:        return "PunchProbe";
        case MessageKind::PunchAck:          return "PunchAck";
        case MessageKind::PunchResult:       return "PunchResult";
        case MessageKind::LinkDirect:        return "LinkDirect";
        case MessageKind::RelayEstablished:  return "RelayEstablished";
        case MessageKind::RelayData:         return "RelayData";
        case MessageKind::PeerData:          return "PeerData";
        case MessageKind::LinkFailed:        return "LinkFailed";
        case MessageKind::RetryLink:         return "RetryLink";
        case MessageKind::Heartbeat:         return "Heartbeat";
        case MessageKind::HeartbeatAck:      return "HeartbeatAck";
        case MessageKind::Error:             return "Error";
        case MessageKind::DiscoveryRequest:  return "DiscoveryRequest";
        case MessageKind::DiscoveryResponse: return "DiscoveryResponse";
    }
    return "Unknown";
}

Bytes encode(MessageKind kind, const json::object& body) {
    const std::string text = json::serialize(body);
    Bytes out;
    out.reserve(1 + text.size());
    out.push_back(static_cast<std::uint8_t>(kind));
    out.insert(out.end(), text.begin(), text.end());
    return out;
}

Bytes encode_relay(const core::RelayFrame& frame) {
    Bytes out(kRelayHeader + frame.payload.size());
    out[0] = static_cast<std::uint8_t>(MessageKind::RelayData);
    endian::store_big_u32(out.data() + 1, frame.channel_id);
    endian::store_big_u32(out.data() + 5, frame.seq);
    out[9] = static_cast<std::uint8_t>(frame.delivery);
    if (!frame.payload.empty()) {
        std::memcpy(out.data() + kRelayHeader, frame.payload.data(), frame.payload.size());
    }
    return out;
}

Bytes encode_peer_data(const PeerDataFrame& frame) {
    if (frame.sender.empty() || frame.sender.size() > 255) {
        throw core::ProtocolError("peer data sender id must be 1..255 bytes");
    }
    Bytes out;
    out.reserve(2 + frame.sender.size() + frame.payload.size());
    out.push_back(static_cast<std::uint8_t>(MessageKind::PeerData));
    out.push_back(static_cast<std::uint8_t>(frame.sender.size()));
    out.insert(out.end(), frame.sender.begin(), frame.sender.end());
    out.insert(out.end(), frame.payload.begin(), frame.payload.end());
    return out;
}

Message decode(const Bytes& payload) {
    if (payload.empty()) throw core::ProtocolError("empty message");

    const auto raw = payload[0];
    if (raw < static_cast<std::uint8_t>(MessageKind::Register) ||
        raw > static_cast<std::uint8_t>(MessageKind::DiscoveryResponse)) {
        throw core::ProtocolError("unknown message kind " + std::to_string(raw));
    }

    Message msg;
    msg.kind = static_cast<MessageKind>(raw);

    if (msg.kind == MessageKind::RelayData) {
        if (payload.size() < kRelayHeader) throw core::ProtocolError("short RelayData frame");
        if (payload[9] > static_cast<std::uint8_t>(transport::Delivery::ReliableOrdered)) {
            throw core::ProtocolError("bad RelayData delivery mode");
        }
        core::RelayFrame frame;
        frame.channel_id = endian::load_big_u32(payload.data() + 1);
        frame.seq = endian::load_big_u32(payload.data() + 5);
        frame.delivery = static_cast<transport::Delivery>(payload[9]);
        frame.payload.assign(payload.begin() + kRelayHeader, payload.end());
        msg.relay = std::move(frame);
        return msg;
    }

    if (msg.kind == MessageKind::PeerData) {
        if (payload.size() < 2) throw core::ProtocolError("short PeerData frame");
        const std::size_t id_len = payload[1];
        if (id_len == 0 || payload.size() < 2 + id_len) throw core::ProtocolError("bad PeerData sender");
        PeerDataFrame frame;
        frame.sender.assign(payload.begin() + 2, payload.begin() + 2 + id_len);
        frame.payload.assign(payload.begin() + 2 + id_len, payload.end());
        msg.peer_data = std::move(frame);
        return msg;
    }

    if (payload.size() == 1) return msg;  // empty body

    boost::system::error_code ec;
    auto value = json::parse(json::string_view(reinterpret_cast<const char*>(payload.data()) + 1,
                                               payload.size() - 1), ec);
    if (ec) throw core::ProtocolError(std::string("invalid json: ") + ec.message());
    auto* obj = value.if_object();
    if (!obj) throw core::ProtocolError("message body must be an object");
    msg.body = std::move(*obj);
    return msg;
}

std::string get_string(const json::object& body, const char* key) {
    const auto* v = field(body, key);
    if (!v || !v->is_string()) throw core::ProtocolError(std::string("missing string field '") + key + "'");
    return std::string(v->get_string());
}

std::string opt_string(const json::object& body, const char* key, const std::string& fallback) {
    const auto* v = field(body, key);
    if (!v || v->is_null()) return fallback;
    if (!v->is_string()) throw core::ProtocolError(std::string("field '") + key + "' must be a string");
    return std::string(v->get_string());
}

std::int64_t get_int(const json::object& body, const char* key) {
    const auto* v = field(body, key);
    if (!v) throw core::ProtocolError(std::string("missing integer field '") + key + "'");
    if (v->is_int64()) return v->get_int64();
    if (v->is_uint64() && v->get_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return static_cast<std::int64_t>(v->get_uint64());
    }
    throw core::ProtocolError(std::string("field '") + key + "' must be an integer");
}

std::int64_t opt_int(const json::object& body, const char* key, std::int64_t fallback) {
    const auto* v = field(body, key);
    if (!v || v->is_null()) return fallback;
    return get_int(body, key);
}

bool opt_bool(const json::object& body, const char* key, bool fallback) {
    const auto* v = field(body, key);
    if (!v || v->is_null()) return fallback;
    if (!v->is_bool()) throw core::ProtocolError(std::string("field '") + key + "' must be a boolean");
    return v->get_bool();
}

json::array endpoints_to_json(const std::vector<transport::Endpoint>& endpoints) {
    json::array out;
    for (const auto& ep : endpoints) out.push_back(json::value_from(ep));
    return out;
}

std::vector<transport::Endpoint> endpoints_from_json(const json::value& value) {
    const auto* arr = value.if_array();
    if (!arr) throw core::ProtocolError("endpoints must be an array");

    std::vector<transport::Endpoint> out;
    out.reserve(arr->size());
    for (const auto& v : *arr) {
        try {
            out.push_back(json::value_to<transport::Endpoint>(v));
        } catch (const std::exception& e) {
            throw core::ProtocolError(std::string("bad endpoint: ") + e.what());
        }
    }
    return out;
}

} // namespace facilitator::networking
