#include "core/TokenVerifier.h"
#include "networking/Config.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

using namespace facilitator::networking;
using namespace std::chrono_literals;

TEST(Config, EmptyDocumentKeepsDefaults) {
    auto cfg = parse_config("{}");
    EXPECT_EQ(cfg.bind_address, "0.0.0.0");
    EXPECT_EQ(cfg.port, FacilitatorConfig::kDefaultPort);
    EXPECT_EQ(cfg.sessions.liveness_timeout, 30000ms);
    EXPECT_EQ(cfg.rooms.default_capacity, 9u);
    EXPECT_EQ(cfg.rendezvous.negotiation_window, 3000ms);
    EXPECT_FALSE(cfg.force_relay);
    EXPECT_EQ(cfg.auth.mode, AuthConfig::Mode::Any);
}

TEST(Config, ReadsEverySection) {
    auto cfg = parse_config(R"({
        "bind_address": "127.0.0.1",
        "port": 9100,
        "worker_threads": 4,
        "verbose": true,
        "tick_interval_ms": 25,
        "transport": {"retransmit_base_ms": 50, "retransmit_max_ms": 800, "max_attempts": 6,
                      "reorder_window": 32, "max_pending": 128},
        "sessions": {"liveness_timeout_ms": 10000, "sweep_interval_ms": 500, "max_sessions": 64},
        "rooms": {"default_capacity": 4, "max_capacity": 8, "max_rooms": 10, "empty_room_ttl_ms": 5000},
        "rendezvous": {"negotiation_window_ms": 1500, "retry_cap": 5, "force_relay": true},
        "relay": {"max_links": 20, "bytes_per_second": 1000, "datagrams_per_second": 50,
                  "burst_bytes": 2000, "burst_datagrams": 10, "max_backlog": 16},
        "auth": {"mode": "static", "tokens": ["a", "b"]}
    })");

    EXPECT_EQ(cfg.bind_address, "127.0.0.1");
    EXPECT_EQ(cfg.port, 9100);
    EXPECT_EQ(cfg.worker_threads, 4u);
    EXPECT_TRUE(cfg.verbose);
    EXPECT_EQ(cfg.tick_interval, 25ms);
    EXPECT_EQ(cfg.transport.retransmit_base, 50ms);
    EXPECT_EQ(cfg.transport.max_attempts, 6u);
    EXPECT_EQ(cfg.sessions.max_sessions, 64u);
    EXPECT_EQ(cfg.sweep_interval, 500ms);
    EXPECT_EQ(cfg.rooms.max_rooms, 10u);
    EXPECT_EQ(cfg.rooms.empty_room_ttl, 5000ms);
    EXPECT_EQ(cfg.rendezvous.retry_cap, 5u);
    EXPECT_TRUE(cfg.force_relay);
    EXPECT_EQ(cfg.relay.max_links, 20u);
    EXPECT_EQ(cfg.relay.quota.max_backlog, 16u);
    EXPECT_EQ(cfg.auth.mode, AuthConfig::Mode::Static);
    EXPECT_EQ(cfg.auth.tokens.size(), 2u);
}

TEST(Config, RejectsBadDocuments) {
    EXPECT_THROW(parse_config("not json"), ConfigError);
    EXPECT_THROW(parse_config("[]"), ConfigError);
    EXPECT_THROW(parse_config(R"({"prot": 9009})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"port": "9009"})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"port": 70000})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"bind_address": "localhost"})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"sessions": {"liveness_timeout_ms": 0}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"rooms": {"max_rooms": -1}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"rooms": {"default_capacity": 20, "max_capacity": 10}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"transport": {"retransmit_base_ms": 500, "retransmit_max_ms": 100}})"),
                 ConfigError);
    EXPECT_THROW(parse_config(R"({"relay": {"unknown": 1}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"auth": {"mode": "static"}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"auth": {"mode": "hmac"}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"auth": {"mode": "kerberos"}})"), ConfigError);
}

TEST(Config, PeerIdleTimeoutOutlastsSessionLiveness) {
    EXPECT_EQ(parse_config("{}").transport.idle_timeout, 60000ms);

    auto cfg = parse_config(R"({"transport": {"idle_timeout_ms": 20000},
                                "sessions": {"liveness_timeout_ms": 15000}})");
    EXPECT_EQ(cfg.transport.idle_timeout, 20000ms);

    EXPECT_THROW(parse_config(R"({"transport": {"idle_timeout_ms": 30000}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"sessions": {"liveness_timeout_ms": 90000}})"), ConfigError);
}

TEST(Config, MakesTheConfiguredVerifier) {
    AuthConfig any;
    EXPECT_TRUE(make_verifier(any)->verify("whatever"));

    AuthConfig listed;
    listed.mode = AuthConfig::Mode::Static;
    listed.tokens = {"vip"};
    auto v = make_verifier(listed);
    EXPECT_TRUE(v->verify("vip"));
    EXPECT_FALSE(v->verify("other"));

    AuthConfig hmac;
    hmac.mode = AuthConfig::Mode::Hmac;
    hmac.secret = "k";
    EXPECT_TRUE(make_verifier(hmac)->verify(facilitator::core::HmacTokenVerifier("k").sign("u1")));
}

TEST(Config, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "facilitator_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"port": 9555})";
    }
    EXPECT_EQ(load_config(path).port, 9555);
    std::remove(path.c_str());

    EXPECT_THROW(load_config(path), ConfigError);
}
