#include "transport/Endpoint.h"

#include <functional>
#include <stdexcept>

namespace facilitator::transport {

namespace json = boost::json;

Endpoint Endpoint::from_udp(const boost::asio::ip::udp::endpoint& ep, EndpointClass cls) {
    Endpoint out;
    out.address = ep.address();
    out.port = ep.port();
    out.cls = cls;
    return out;
}

std::optional<Endpoint> Endpoint::parse(const std::string& text, EndpointClass cls) {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) return std::nullopt;

    std::string host = text.substr(0, colon);
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }

    unsigned long port = 0;
    try {
        std::size_t used = 0;
        port = std::stoul(text.substr(colon + 1), &used);
        if (used != text.size() - colon - 1) return std::nullopt;
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (port == 0 || port > 65535) return std::nullopt;

    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(host, ec);
    if (ec) return std::nullopt;

    Endpoint out;
    out.address = addr;
    out.port = static_cast<std::uint16_t>(port);
    out.cls = cls;
    return out;
}

boost::asio::ip::udp::endpoint Endpoint::to_udp() const {
    return {address, port};
}

std::string Endpoint::to_string() const {
    if (address.is_v6()) return "[" + address.to_string() + "]:" + std::to_string(port);
    return address.to_string() + ":" + std::to_string(port);
}

bool Endpoint::operator==(const Endpoint& other) const noexcept {
    return port == other.port && kind == other.kind && address == other.address;
}

std::size_t EndpointHash::operator()(const Endpoint& ep) const noexcept {
    std::size_t h = std::hash<std::string>{}(ep.address.to_string());
    h ^= std::hash<std::uint32_t>{}((std::uint32_t(ep.port) << 8) | std::uint32_t(ep.kind)) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

const char* to_string(EndpointClass cls) noexcept {
    switch (cls) {
        case EndpointClass::Local:  return "local";
        case EndpointClass::Public: return "public";
        case EndpointClass::Relay:  return "relay";
    }
    return "public";
}

std::optional<EndpointClass> endpoint_class_from_string(const std::string& s) {
    if (s == "local")  return EndpointClass::Local;
    if (s == "public") return EndpointClass::Public;
    if (s == "relay")  return EndpointClass::Relay;
    return std::nullopt;
}

void tag_invoke(json::value_from_tag, json::value& jv, const Endpoint& ep) {
    jv = json::object{
        {"address", ep.address.to_string()},
        {"port", ep.port},
        {"class", to_string(ep.cls)}
    };
}

Endpoint tag_invoke(json::value_to_tag<Endpoint>, const json::value& jv) {
    const auto& obj = jv.as_object();

    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(json::value_to<std::string>(obj.at("address")), ec);
    if (ec) throw std::invalid_argument("bad endpoint address");

    const auto port = json::value_to<std::int64_t>(obj.at("port"));
    if (port <= 0 || port > 65535) throw std::invalid_argument("bad endpoint port");

    Endpoint ep;
    ep.address = addr;
    ep.port = static_cast<std::uint16_t>(port);
    if (auto* cls = obj.if_contains("class")) {
        auto parsed = endpoint_class_from_string(json::value_to<std::string>(*cls));
        if (!parsed) throw std::invalid_argument("bad endpoint class");
        ep.cls = *parsed;
    }
    return ep;
}

} // namespace facilitator::transport
