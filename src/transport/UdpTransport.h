#pragma once

#include "transport/Endpoint.h"
#include "transport/Packet.h"
#include "transport/ReliableConnection.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>

namespace facilitator::transport {

// Framed UDP endpoint with per-peer reliability.
//
// Payloads from one peer are delivered in arrival order (release order for
// reliable-ordered) on that peer's strand; different peers are delivered
// concurrently when the io_context runs on several threads.
//
// Per-peer state exists only once reliable data has gone either way, and is
// dropped again after ReliabilityConfig::idle_timeout with nothing in flight.
class UdpTransport {
public:
    using Clock        = std::chrono::steady_clock;
    using OnReceive    = std::function<void(const Endpoint& from, Bytes payload, Delivery mode)>;
    using OnPeerFailed = std::function<void(const Endpoint& peer)>;

    UdpTransport(boost::asio::io_context& ioc,
                 const boost::asio::ip::udp::endpoint& bind,
                 ReliabilityConfig config,
                 std::chrono::milliseconds tick_interval = std::chrono::milliseconds(20));
    ~UdpTransport();

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    void set_on_receive(OnReceive cb);
    void set_on_peer_failed(OnPeerFailed cb);
    void set_verbose(bool verbose);

    void start();
    void stop();

    // False when the peer's reliable queue is full or the peer already failed.
    bool send(const Endpoint& to, const Bytes& payload, Delivery mode);

    // Drops all sequence/retransmit state for the peer; the next datagram starts fresh.
    void forget(const Endpoint& peer);

    std::optional<Clock::time_point> last_received(const Endpoint& peer) const;
    std::size_t peer_count() const;
    Endpoint local_endpoint() const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace facilitator::transport
