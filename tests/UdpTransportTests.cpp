#include "transport/UdpTransport.h"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/address.hpp>

#include <gtest/gtest.h>

#include <array>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

using namespace facilitator::transport;
using namespace std::chrono_literals;
namespace asio = boost::asio;
using udp = asio::ip::udp;

namespace {

Bytes bytes_of(const std::string& s) { return Bytes(s.begin(), s.end()); }

class UdpTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        ReliabilityConfig config;
        config.idle_timeout = 200ms;
        transport_ = std::make_unique<UdpTransport>(
            ioc_, udp::endpoint(asio::ip::make_address("127.0.0.1"), 0), config, 20ms);
        transport_->set_on_receive([this](const Endpoint& from, Bytes payload, Delivery mode) {
            std::lock_guard<std::mutex> lk(mu_);
            received_.push_back({from, std::move(payload), mode});
            cv_.notify_all();
        });
        transport_->start();
        thread_ = std::thread([this] { ioc_.run(); });
    }

    void TearDown() override {
        transport_.reset();
        work_.reset();
        thread_.join();
    }

    // A plain socket standing in for a remote client.
    udp::socket remote() {
        udp::socket s(ioc_);
        s.open(udp::v4());
        s.bind(udp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        return s;
    }

    void send_from(udp::socket& s, Delivery mode, std::uint32_t seq, const std::string& text) {
        PacketHeader h;
        h.delivery = mode;
        h.sequence = seq;
        const auto datagram = encode_packet(h, bytes_of(text));
        s.send_to(asio::buffer(datagram), transport_->local_endpoint().to_udp());
    }

    bool wait_received(std::size_t n) {
        std::unique_lock<std::mutex> lk(mu_);
        return cv_.wait_for(lk, 5s, [&] { return received_.size() >= n; });
    }

    bool wait_peer_count(std::size_t n) {
        for (int i = 0; i < 100; ++i) {
            if (transport_->peer_count() == n) return true;
            std::this_thread::sleep_for(20ms);
        }
        return false;
    }

    struct Received {
        Endpoint from;
        Bytes payload;
        Delivery mode;
    };

    asio::io_context ioc_;
    asio::executor_work_guard<asio::io_context::executor_type> work_{asio::make_work_guard(ioc_)};
    std::thread thread_;
    std::unique_ptr<UdpTransport> transport_;

    std::mutex mu_;
    std::condition_variable cv_;
    std::vector<Received> received_;
};

} // namespace

TEST_F(UdpTransportTest, UnreliableSourcesLeaveNoPeerState) {
    std::vector<udp::socket> sources;
    for (int i = 0; i < 20; ++i) {
        sources.push_back(remote());
        send_from(sources.back(), Delivery::Unreliable, 0, "hello-" + std::to_string(i));
    }

    ASSERT_TRUE(wait_received(sources.size()));
    EXPECT_EQ(transport_->peer_count(), 0u);
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& r : received_) EXPECT_EQ(r.mode, Delivery::Unreliable);
    }

    // Unreliable replies to those sources do not open state either.
    for (auto& s : sources) {
        const auto to = Endpoint::from_udp(s.local_endpoint());
        EXPECT_TRUE(transport_->send(to, bytes_of("ack"), Delivery::Unreliable));
    }
    EXPECT_EQ(transport_->peer_count(), 0u);
    EXPECT_FALSE(transport_->last_received(Endpoint::from_udp(sources[0].local_endpoint())));
}

TEST_F(UdpTransportTest, ReliablePeerIsDroppedOnceIdle) {
    auto s = remote();
    send_from(s, Delivery::ReliableOrdered, 1, "join");

    ASSERT_TRUE(wait_received(1));
    EXPECT_EQ(transport_->peer_count(), 1u);

    // The transport acks the datagram; the peer has nothing in flight and goes idle.
    std::array<std::uint8_t, 64> buf{};
    udp::endpoint sender;
    const auto n = s.receive_from(asio::buffer(buf), sender);
    auto ack = decode_packet(buf.data(), n);
    ASSERT_TRUE(ack);
    EXPECT_EQ(ack->header.type, PacketType::Ack);

    EXPECT_TRUE(wait_peer_count(0));
}

TEST_F(UdpTransportTest, StrayAcksFromUnknownSourcesAreIgnored) {
    auto s = remote();
    PacketHeader h;
    h.type = PacketType::Ack;
    h.delivery = Delivery::ReliableOrdered;
    h.sequence = 7;
    const auto datagram = encode_packet(h, nullptr, 0);
    s.send_to(asio::buffer(datagram), transport_->local_endpoint().to_udp());

    send_from(s, Delivery::Unreliable, 0, "after");
    ASSERT_TRUE(wait_received(1));
    EXPECT_EQ(transport_->peer_count(), 0u);
}
