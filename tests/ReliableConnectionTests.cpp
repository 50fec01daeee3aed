#include "transport/ReliableConnection.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <string>

using namespace facilitator::transport;
using Clock = ReliableConnection::Clock;

namespace {

Bytes bytes_of(const std::string& s) { return Bytes(s.begin(), s.end()); }

// Drops, duplicates and reorders datagrams with a fixed seed.
class LossyLink {
public:
    explicit LossyLink(unsigned seed) : rng_(seed) {}

    std::vector<Bytes> carry(std::vector<Bytes> in) {
        std::vector<Bytes> out;
        std::uniform_real_distribution<double> roll(0.0, 1.0);
        for (auto& d : in) {
            if (roll(rng_) < 0.25) continue;
            if (roll(rng_) < 0.15) out.push_back(d);
            out.push_back(std::move(d));
        }
        std::shuffle(out.begin(), out.end(), rng_);
        return out;
    }

private:
    std::mt19937 rng_;
};

void feed(ReliableConnection& to, const std::vector<Bytes>& datagrams, Clock::time_point now,
          std::vector<Bytes>& replies, std::vector<Delivered>& delivered) {
    for (const auto& d : datagrams) {
        auto packet = decode_packet(d.data(), d.size());
        ASSERT_TRUE(packet);
        to.receive(*packet, now, replies, delivered);
    }
}

} // namespace

TEST(ReliableConnection, UnreliableIsPassedThrough) {
    auto now = Clock::now();
    ReliableConnection a({}, now), b({}, now);

    std::vector<Bytes> out;
    ASSERT_TRUE(a.send(bytes_of("pose"), Delivery::Unreliable, now, out));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(a.pending(), 0u);

    std::vector<Bytes> replies;
    std::vector<Delivered> delivered;
    feed(b, out, now, replies, delivered);
    EXPECT_TRUE(replies.empty());
    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].payload, bytes_of("pose"));
    EXPECT_EQ(delivered[0].delivery, Delivery::Unreliable);
}

TEST(ReliableConnection, OrderedDeliveryIsExactlyOnceOverLossyLink) {
    ReliabilityConfig config;
    config.max_attempts = 64;

    auto now = Clock::now();
    ReliableConnection sender(config, now), receiver(config, now);
    LossyLink forward(7), backward(11);

    std::vector<Bytes> expected;
    std::vector<Bytes> wire;
    for (int i = 0; i < 40; ++i) {
        expected.push_back(bytes_of("msg-" + std::to_string(i)));
        ASSERT_TRUE(sender.send(expected.back(), Delivery::ReliableOrdered, now, wire));
    }

    std::vector<Bytes> received;
    for (int step = 0; step < 500 && (received.size() < expected.size() || sender.pending() > 0); ++step) {
        std::vector<Bytes> acks;
        std::vector<Delivered> delivered;
        feed(receiver, forward.carry(std::move(wire)), now, acks, delivered);
        for (auto& d : delivered) {
            EXPECT_EQ(d.delivery, Delivery::ReliableOrdered);
            received.push_back(std::move(d.payload));
        }

        wire.clear();
        std::vector<Delivered> none;
        feed(sender, backward.carry(std::move(acks)), now, wire, none);
        EXPECT_TRUE(none.empty());

        now += std::chrono::milliseconds(100);
        ASSERT_TRUE(sender.poll(now, wire));
    }

    EXPECT_EQ(received, expected);
    EXPECT_EQ(sender.pending(), 0u);
}

TEST(ReliableConnection, UnorderedDeliversEachPayloadOnce) {
    ReliabilityConfig config;
    config.max_attempts = 64;

    auto now = Clock::now();
    ReliableConnection sender(config, now), receiver(config, now);
    LossyLink forward(3), backward(5);

    std::vector<Bytes> wire;
    for (int i = 0; i < 30; ++i) {
        ASSERT_TRUE(sender.send(bytes_of(std::to_string(i)), Delivery::ReliableUnordered, now, wire));
    }

    std::vector<std::string> received;
    for (int step = 0; step < 500 && sender.pending() > 0; ++step) {
        std::vector<Bytes> acks;
        std::vector<Delivered> delivered;
        feed(receiver, forward.carry(std::move(wire)), now, acks, delivered);
        for (auto& d : delivered) received.emplace_back(d.payload.begin(), d.payload.end());

        wire.clear();
        std::vector<Delivered> none;
        feed(sender, backward.carry(std::move(acks)), now, wire, none);
        now += std::chrono::milliseconds(100);
        ASSERT_TRUE(sender.poll(now, wire));
    }

    ASSERT_EQ(received.size(), 30u);
    std::sort(received.begin(), received.end());
    EXPECT_EQ(std::unique(received.begin(), received.end()), received.end());
}

TEST(ReliableConnection, FarAheadPacketTriggersResendRequest) {
    auto now = Clock::now();
    ReliableConnection receiver({}, now);

    Packet p;
    p.header.delivery = Delivery::ReliableOrdered;
    p.header.sequence = 500;
    p.payload = bytes_of("late");

    std::vector<Bytes> out;
    std::vector<Delivered> delivered;
    receiver.receive(p, now, out, delivered);

    EXPECT_TRUE(delivered.empty());
    ASSERT_EQ(out.size(), 1u);
    auto reply = decode_packet(out[0].data(), out[0].size());
    ASSERT_TRUE(reply);
    EXPECT_EQ(reply->header.type, PacketType::ResendRequest);
    EXPECT_EQ(reply->header.sequence, 1u);
}

TEST(ReliableConnection, FailsAfterMaxAttempts) {
    ReliabilityConfig config;
    config.max_attempts = 4;

    auto now = Clock::now();
    ReliableConnection conn(config, now);

    std::vector<Bytes> out;
    ASSERT_TRUE(conn.send(bytes_of("hello"), Delivery::ReliableOrdered, now, out));

    bool alive = true;
    for (int i = 0; i < 10 && alive; ++i) {
        now += config.retransmit_max;
        alive = conn.poll(now, out);
    }
    EXPECT_FALSE(alive);
    EXPECT_TRUE(conn.failed());
    EXPECT_EQ(out.size(), 4u);
    EXPECT_FALSE(conn.send(bytes_of("again"), Delivery::ReliableOrdered, now, out));
}

TEST(ReliableConnection, SendQueueIsBounded) {
    ReliabilityConfig config;
    config.max_pending = 2;

    auto now = Clock::now();
    ReliableConnection conn(config, now);
    std::vector<Bytes> out;

    EXPECT_TRUE(conn.send(bytes_of("1"), Delivery::ReliableOrdered, now, out));
    EXPECT_TRUE(conn.send(bytes_of("2"), Delivery::ReliableUnordered, now, out));
    EXPECT_FALSE(conn.send(bytes_of("3"), Delivery::ReliableOrdered, now, out));
    EXPECT_TRUE(conn.send(bytes_of("4"), Delivery::Unreliable, now, out));
    EXPECT_EQ(out.size(), 3u);
}

TEST(ReliableConnection, UnorderedFarAheadIsRefusedWithResendRequest) {
    auto now = Clock::now();
    ReliableConnection receiver({}, now);

    Packet p;
    p.header.delivery = Delivery::ReliableUnordered;
    p.header.sequence = 500;
    p.payload = bytes_of("stray");

    std::vector<Bytes> out;
    std::vector<Delivered> delivered;
    receiver.receive(p, now, out, delivered);

    EXPECT_TRUE(delivered.empty());
    ASSERT_EQ(out.size(), 1u);
    auto reply = decode_packet(out[0].data(), out[0].size());
    ASSERT_TRUE(reply);
    EXPECT_EQ(reply->header.type, PacketType::ResendRequest);
    EXPECT_EQ(reply->header.delivery, Delivery::ReliableUnordered);
    EXPECT_EQ(reply->header.sequence, 1u);

    // Within the window the same receiver still accepts out-of-order packets.
    p.header.sequence = 3;
    out.clear();
    receiver.receive(p, now, out, delivered);
    ASSERT_EQ(delivered.size(), 1u);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(decode_packet(out[0].data(), out[0].size())->header.type, PacketType::Ack);
}

TEST(ReliableConnection, UnorderedResendRequestRetransmitsPending) {
    auto now = Clock::now();
    ReliableConnection sender({}, now);

    std::vector<Bytes> out;
    ASSERT_TRUE(sender.send(bytes_of("a"), Delivery::ReliableUnordered, now, out));
    ASSERT_TRUE(sender.send(bytes_of("b"), Delivery::ReliableUnordered, now, out));
    ASSERT_TRUE(sender.send(bytes_of("c"), Delivery::ReliableOrdered, now, out));
    out.clear();

    Packet request;
    request.header.type = PacketType::ResendRequest;
    request.header.delivery = Delivery::ReliableUnordered;
    request.header.sequence = 1;

    std::vector<Delivered> delivered;
    sender.receive(request, now, out, delivered);
    ASSERT_EQ(out.size(), 2u);
    for (const auto& d : out) {
        auto packet = decode_packet(d.data(), d.size());
        ASSERT_TRUE(packet);
        EXPECT_EQ(packet->header.delivery, Delivery::ReliableUnordered);
    }
}

TEST(ReliableConnection, IdleOnlyWithNothingInFlightAndNoTraffic) {
    ReliabilityConfig config;
    config.idle_timeout = std::chrono::milliseconds(1000);

    auto now = Clock::now();
    ReliableConnection conn(config, now);
    EXPECT_FALSE(conn.idle(now));
    EXPECT_TRUE(conn.idle(now + config.idle_timeout));

    std::vector<Bytes> out;
    ASSERT_TRUE(conn.send(bytes_of("x"), Delivery::ReliableOrdered, now, out));
    EXPECT_FALSE(conn.idle(now + 10 * config.idle_timeout));

    Packet ack;
    ack.header.type = PacketType::Ack;
    ack.header.delivery = Delivery::ReliableOrdered;
    ack.header.sequence = 1;
    std::vector<Delivered> delivered;
    const auto later = now + std::chrono::milliseconds(500);
    conn.receive(ack, later, out, delivered);
    EXPECT_EQ(conn.pending(), 0u);
    EXPECT_FALSE(conn.idle(later + std::chrono::milliseconds(900)));
    EXPECT_TRUE(conn.idle(later + config.idle_timeout));
}
