#include "core/Errors.h"
#include "core/SessionRegistry.h"

#include <gtest/gtest.h>

using namespace facilitator::core;
using facilitator::transport::Endpoint;
using facilitator::transport::EndpointClass;
using Clock = SessionRegistry::Clock;

namespace {

Endpoint ep(const std::string& text) { return *Endpoint::parse(text); }

RegisterRequest request(const std::string& token, const std::string& request_id = "req-1") {
    RegisterRequest r;
    r.token = token;
    r.name = "player";
    r.platform = "quest";
    r.request_id = request_id;
    return r;
}

class SessionRegistryTest : public ::testing::Test {
protected:
    SessionRegistry registry{std::make_shared<AcceptAnyVerifier>(), SessionLimits{4, std::chrono::seconds(30)}};
    Clock::time_point t0 = Clock::now();
};

} // namespace

TEST_F(SessionRegistryTest, RegisterCreatesConnectedSession) {
    auto req = request("T1");
    req.local_endpoints = {ep("192.168.0.10:5000"), ep("203.0.113.5:6000")};

    auto reg = registry.register_session(req, ep("203.0.113.5:6000"), t0);
    EXPECT_FALSE(reg.replayed);

    const auto& s = reg.session;
    EXPECT_EQ(s.session_id.rfind("session-", 0), 0u);
    EXPECT_EQ(s.state, SessionState::Connected);
    EXPECT_FALSE(s.room_id);

    // The observed endpoint is not repeated as a local candidate.
    ASSERT_EQ(s.candidates.size(), 2u);
    EXPECT_EQ(s.candidates[0].cls, EndpointClass::Local);
    EXPECT_EQ(s.candidates[1], ep("203.0.113.5:6000"));
    EXPECT_EQ(s.candidates[1].cls, EndpointClass::Public);

    EXPECT_EQ(registry.find_by_endpoint(ep("203.0.113.5:6000"))->session_id, s.session_id);
}

TEST_F(SessionRegistryTest, SecondRegisterWithBoundTokenIsRejected) {
    registry.register_session(request("T1", "req-1"), ep("10.0.0.1:4000"), t0);

    EXPECT_THROW(registry.register_session(request("T1", "req-2"), ep("10.0.0.1:4000"), t0),
                 AuthenticationError);
    EXPECT_THROW(registry.register_session(request("T1", "req-1"), ep("10.0.0.2:4000"), t0),
                 AuthenticationError);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(SessionRegistryTest, RetransmittedRegisterIsReplayed) {
    auto first = registry.register_session(request("T1", "req-7"), ep("10.0.0.1:4000"), t0);
    auto again = registry.register_session(request("T1", "req-7"), ep("10.0.0.1:4000"), t0 + std::chrono::seconds(1));

    EXPECT_TRUE(again.replayed);
    EXPECT_EQ(again.session.session_id, first.session.session_id);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(SessionRegistryTest, InvalidTokenIsRejected) {
    SessionRegistry strict(std::make_shared<StaticTokenVerifier>(std::vector<std::string>{"good"}), {});
    EXPECT_THROW(strict.register_session(request("bad"), ep("10.0.0.1:4000"), t0), AuthenticationError);
    EXPECT_NO_THROW(strict.register_session(request("good"), ep("10.0.0.1:4000"), t0));
}

TEST_F(SessionRegistryTest, EndpointCannotHoldTwoSessions) {
    registry.register_session(request("T1"), ep("10.0.0.1:4000"), t0);
    EXPECT_THROW(registry.register_session(request("T2"), ep("10.0.0.1:4000"), t0), AuthenticationError);
}

TEST_F(SessionRegistryTest, CapacityIsEnforced) {
    for (int i = 0; i < 4; ++i) {
        registry.register_session(request("T" + std::to_string(i)), ep("10.0.0.1:" + std::to_string(4000 + i)), t0);
    }
    EXPECT_THROW(registry.register_session(request("T9"), ep("10.0.0.9:4000"), t0), CapacityError);
}

TEST_F(SessionRegistryTest, RepeatedTouchOnlyMovesLiveness) {
    auto s = registry.register_session(request("T1"), ep("10.0.0.1:4000"), t0).session;
    registry.set_room(s.session_id, std::string("room-1"));

    for (int i = 1; i <= 3; ++i) {
        EXPECT_TRUE(registry.touch(s.session_id, t0 + std::chrono::seconds(i)));
    }

    auto after = *registry.find(s.session_id);
    EXPECT_EQ(after.last_seen, t0 + std::chrono::seconds(3));
    EXPECT_EQ(after.room_id, std::optional<std::string>("room-1"));
    EXPECT_EQ(after.candidates.size(), s.candidates.size());
    EXPECT_EQ(after.state, SessionState::Connected);
    EXPECT_EQ(after.connected_at, s.connected_at);

    EXPECT_FALSE(registry.touch("session-unknown", t0));
}

TEST_F(SessionRegistryTest, ExpireSweepRemovesSilentSessions) {
    auto quiet = registry.register_session(request("T1"), ep("10.0.0.1:4000"), t0).session;
    auto chatty = registry.register_session(request("T2"), ep("10.0.0.2:4000"), t0).session;

    registry.touch(chatty.session_id, t0 + std::chrono::seconds(20));
    auto expired = registry.expire_sweep(t0 + std::chrono::seconds(31));

    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired[0].session_id, quiet.session_id);
    EXPECT_EQ(expired[0].state, SessionState::Disconnected);
    EXPECT_FALSE(registry.find(quiet.session_id));
    EXPECT_TRUE(registry.find(chatty.session_id));

    // The token and endpoint are free again.
    EXPECT_NO_THROW(registry.register_session(request("T1", "req-9"), ep("10.0.0.1:4000"), t0 + std::chrono::seconds(32)));
}

TEST_F(SessionRegistryTest, RemoveReturnsDisconnectedSession) {
    auto s = registry.register_session(request("T1"), ep("10.0.0.1:4000"), t0).session;
    auto removed = registry.remove(s.session_id);
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed->state, SessionState::Disconnected);
    EXPECT_FALSE(registry.remove(s.session_id));
    EXPECT_EQ(registry.size(), 0u);
}
