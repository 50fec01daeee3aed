#include "core/Errors.h"
#include "core/RendezvousCoordinator.h"

#include <gtest/gtest.h>

using namespace facilitator::core;
using facilitator::transport::Endpoint;
using Clock = RendezvousCoordinator::Clock;
using namespace std::chrono_literals;

namespace {

LinkEndpoint member(const std::string& id, int port) {
    return {id, *Endpoint::parse("198.51.100.7:" + std::to_string(port))};
}

class RendezvousTest : public ::testing::Test {
protected:
    explicit RendezvousTest(std::size_t max_links = 8)
        : relay(RelayLimits{max_links, RelayQuota{}}),
          links(relay, RendezvousLimits{3000ms, 2}) {}

    RelayEngine relay;
    RendezvousCoordinator links;
    Clock::time_point t0 = Clock::now();
};

class SaturatedRelayTest : public RendezvousTest {
protected:
    SaturatedRelayTest() : RendezvousTest(1) {}
};

} // namespace

TEST_F(RendezvousTest, SmallerSessionIdInitiates) {
    auto link = links.create_link("room-1", member("session-b", 2000), member("session-a", 1000), false, t0);

    EXPECT_EQ(link.session_a, "session-a");
    EXPECT_EQ(link.session_b, "session-b");
    EXPECT_EQ(link.endpoint_a.port, 1000);
    EXPECT_TRUE(link.initiator("session-a"));
    EXPECT_FALSE(link.initiator("session-b"));
    EXPECT_EQ(link.state, LinkState::Negotiating);
    EXPECT_EQ(link.attempts, 1u);
    EXPECT_EQ(link.deadline, t0 + 3000ms);
}

TEST_F(RendezvousTest, DuplicateLinkIsRejected) {
    links.create_link("room-1", member("session-a", 1000), member("session-b", 2000), false, t0);
    EXPECT_THROW(links.create_link("room-1", member("session-b", 2000), member("session-a", 1000), false, t0),
                 AlreadyMemberError);
}

TEST_F(RendezvousTest, BothSidesMustReportBeforeDirect) {
    auto link = links.create_link("room-1", member("session-a", 1000), member("session-b", 2000), false, t0);

    EXPECT_FALSE(links.report_punch(link.link_id, "session-b", t0 + 100ms));
    EXPECT_FALSE(links.report_punch(link.link_id, "session-b", t0 + 150ms));

    auto direct = links.report_punch(link.link_id, "session-a", t0 + 200ms);
    ASSERT_TRUE(direct);
    EXPECT_EQ(direct->state, LinkState::Direct);
    EXPECT_EQ(direct->last_transition, t0 + 200ms);

    // A late report on a settled link changes nothing.
    EXPECT_FALSE(links.report_punch(link.link_id, "session-a", t0 + 300ms));
    EXPECT_TRUE(links.expire(t0 + 10s).empty());
    EXPECT_EQ(links.find(link.link_id)->state, LinkState::Direct);
}

TEST_F(RendezvousTest, ReportErrors) {
    auto link = links.create_link("room-1", member("session-a", 1000), member("session-b", 2000), false, t0);
    EXPECT_THROW(links.report_punch("link-missing", "session-a", t0), LinkNotFoundError);
    EXPECT_THROW(links.report_punch(link.link_id, "session-z", t0), NotMemberError);
}

TEST_F(RendezvousTest, EveryLinkSettlesOnceTheWindowElapses) {
    const std::vector<std::string> ids{"session-1", "session-2", "session-3", "session-4"};
    for (std::size_t i = 0; i < ids.size(); ++i) {
        for (std::size_t j = i + 1; j < ids.size(); ++j) {
            links.create_link("room-1", member(ids[i], 1000 + int(i)), member(ids[j], 1000 + int(j)), false,
                              t0 + std::chrono::milliseconds(10 * j));
        }
    }
    const auto one = links.find_between("session-1", "session-2");
    links.report_punch(one->link_id, "session-1", t0 + 50ms);
    links.report_punch(one->link_id, "session-2", t0 + 60ms);

    EXPECT_TRUE(links.expire(t0 + 2999ms).empty());
    auto changed = links.expire(t0 + 3100ms);
    EXPECT_EQ(changed.size(), 5u);

    for (const auto& id : ids) {
        for (const auto& link : links.links_for(id)) {
            EXPECT_NE(link.state, LinkState::Negotiating);
            if (link.state == LinkState::Relayed) {
                ASSERT_TRUE(link.channel_id);
            } else {
                EXPECT_FALSE(link.channel_id);
            }
        }
    }
    EXPECT_EQ(relay.channel_count(), 5u);
}

TEST_F(RendezvousTest, ForceRelaySkipsNegotiation) {
    auto link = links.create_link("room-1", member("session-a", 1000), member("session-b", 2000), true, t0);
    EXPECT_EQ(link.state, LinkState::Relayed);
    ASSERT_TRUE(link.channel_id);
    EXPECT_EQ(relay.channel_count(), 1u);
}

TEST_F(RendezvousTest, RemovingLinksReleasesRelayChannels) {
    links.create_link("room-1", member("session-a", 1000), member("session-b", 2000), true, t0);
    links.create_link("room-1", member("session-a", 1000), member("session-c", 3000), false, t0);
    links.create_link("room-1", member("session-b", 2000), member("session-c", 3000), true, t0);

    auto removed = links.remove_links_for("session-a");
    EXPECT_EQ(removed.size(), 2u);
    EXPECT_EQ(links.size(), 1u);
    EXPECT_EQ(relay.channel_count(), 1u);
    EXPECT_TRUE(links.links_for("session-a").empty());
}

TEST_F(SaturatedRelayTest, RelayExhaustionFailsTheLink) {
    auto first = links.create_link("room-1", member("session-a", 1000), member("session-b", 2000), false, t0);
    auto second = links.create_link("room-1", member("session-a", 1000), member("session-c", 3000), false, t0 + 1ms);

    auto changed = links.expire(t0 + 5s);
    ASSERT_EQ(changed.size(), 2u);

    int relayed = 0;
    int failed = 0;
    for (const auto& link : changed) {
        if (link.state == LinkState::Relayed) ++relayed;
        if (link.state == LinkState::Failed) {
            ++failed;
            EXPECT_EQ(link.reason, "relay_capacity");
            EXPECT_FALSE(link.channel_id);
        }
    }
    EXPECT_EQ(relayed, 1);
    EXPECT_EQ(failed, 1);
}

TEST_F(SaturatedRelayTest, FailedLinksRetryUpToTheCap) {
    links.create_link("room-1", member("session-a", 1000), member("session-b", 2000), true, t0);
    auto link = links.create_link("room-1", member("session-a", 1000), member("session-c", 3000), true, t0);
    ASSERT_EQ(link.state, LinkState::Failed);

    EXPECT_THROW(links.retry("session-a", "session-b", t0), ProtocolError);
    EXPECT_THROW(links.retry("session-b", "session-c", t0), LinkNotFoundError);

    // retry_cap is 2: attempts 2 and 3 are allowed, the next is not.
    for (unsigned attempt = 2; attempt <= 3; ++attempt) {
        auto again = links.retry("session-c", "session-a", t0 + 1s);
        EXPECT_EQ(again.attempts, attempt);
        EXPECT_EQ(again.state, LinkState::Failed);  // forced relay, still no capacity
    }
    EXPECT_THROW(links.retry("session-c", "session-a", t0 + 2s), RetryLimitError);
}

TEST_F(SaturatedRelayTest, RetryRenegotiatesWhenCapacityReturns) {
    auto blocker = links.create_link("room-1", member("session-a", 1000), member("session-b", 2000), true, t0);
    auto link = links.create_link("room-1", member("session-a", 1000), member("session-c", 3000), false, t0);
    links.expire(t0 + 4s);
    ASSERT_EQ(links.find(link.link_id)->state, LinkState::Failed);

    links.remove_links_for("session-b");
    ASSERT_EQ(relay.channel_count(), 0u);

    auto again = links.retry("session-a", "session-c", t0 + 5s);
    EXPECT_EQ(again.state, LinkState::Negotiating);
    EXPECT_TRUE(again.reason.empty());
    EXPECT_EQ(again.deadline, t0 + 8s);

    auto changed = links.expire(t0 + 8s);
    ASSERT_EQ(changed.size(), 1u);
    EXPECT_EQ(changed[0].state, LinkState::Relayed);
    (void)blocker;
}
