#pragma once

#include <boost/asio/ip/udp.hpp>
#include <boost/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace facilitator::transport {

using Bytes = std::vector<std::uint8_t>;

enum class EndpointClass : std::uint8_t { Local, Public, Relay };

// Only UDP is carried today; the tag is kept on the wire so candidates can grow.
enum class TransportKind : std::uint8_t { Udp };

struct Endpoint {
    boost::asio::ip::address address;
    std::uint16_t port = 0;
    TransportKind kind = TransportKind::Udp;
    EndpointClass cls = EndpointClass::Public;

    static Endpoint from_udp(const boost::asio::ip::udp::endpoint& ep,
                             EndpointClass cls = EndpointClass::Public);
    // "1.2.3.4:5000" or "[::1]:5000"
    static std::optional<Endpoint> parse(const std::string& text,
                                         EndpointClass cls = EndpointClass::Public);

    boost::asio::ip::udp::endpoint to_udp() const;
    std::string to_string() const;

    // Identity is the transport address; the classification tag does not take part.
    bool operator==(const Endpoint& other) const noexcept;
    bool operator!=(const Endpoint& other) const noexcept { return !(*this == other); }
};

struct EndpointHash {
    std::size_t operator()(const Endpoint& ep) const noexcept;
};

const char* to_string(EndpointClass cls) noexcept;
std::optional<EndpointClass> endpoint_class_from_string(const std::string& s);

// Boost.JSON conversions: {"address": "...", "port": N, "class": "local"}
void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const Endpoint& ep);
Endpoint tag_invoke(boost::json::value_to_tag<Endpoint>, const boost::json::value& jv);

} // namespace facilitator::transport
