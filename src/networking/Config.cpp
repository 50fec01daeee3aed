#include "networking/Config.h"

#include <boost/asio/ip/address.hpp>
#include <boost/json.hpp>

#include <fstream>
#include <initializer_list>
#include <limits>
#include <sstream>
#include <utility>

namespace facilitator::networking {

namespace json = boost::json;

namespace {

// One JSON object of the configuration, with key paths for error messages.
class Section {
public:
    Section(const json::value& v, std::string path)
        : path_(std::move(path)) {
        obj_ = v.if_object();
        if (!obj_) throw ConfigError(where() + " must be an object");
    }

    void allow_only(std::initializer_list<const char*> keys) const {
        for (const auto& kv : *obj_) {
            bool known = false;
            for (const char* k : keys) known = known || kv.key() == k;
            if (!known) throw ConfigError("unknown key '" + key_path(std::string(kv.key())) + "'");
        }
    }

    const json::value* get(const char* key) const { return obj_->if_contains(key); }

    void read(const char* key, std::string& out) const {
        const auto* v = get(key);
        if (!v) return;
        if (!v->is_string()) throw ConfigError(key_path(key) + " must be a string");
        out = std::string(v->get_string());
    }

    void read(const char* key, bool& out) const {
        const auto* v = get(key);
        if (!v) return;
        if (!v->is_bool()) throw ConfigError(key_path(key) + " must be a boolean");
        out = v->get_bool();
    }

    // Positive integers only.
    std::uint64_t positive(const char* key, std::uint64_t current, std::uint64_t max) const {
        const auto* v = get(key);
        if (!v) return current;

        std::uint64_t n = 0;
        if (v->is_uint64()) n = v->get_uint64();
        else if (v->is_int64() && v->get_int64() >= 0) n = static_cast<std::uint64_t>(v->get_int64());
        else throw ConfigError(key_path(key) + " must be a non-negative integer");

        if (n == 0) throw ConfigError(key_path(key) + " must be greater than zero");
        if (n > max) throw ConfigError(key_path(key) + " is out of range");
        return n;
    }

    template <class T>
    void read_count(const char* key, T& out) const {
        out = static_cast<T>(positive(key, out, std::numeric_limits<T>::max()));
    }

    void read_ms(const char* key, std::chrono::milliseconds& out) const {
        out = std::chrono::milliseconds(positive(key, static_cast<std::uint64_t>(out.count()),
                                                 std::numeric_limits<std::uint32_t>::max()));
    }

    std::string key_path(const std::string& key) const { return path_.empty() ? key : path_ + "." + key; }

private:
    std::string where() const { return path_.empty() ? "configuration" : "'" + path_ + "'"; }

    const json::object* obj_ = nullptr;
    std::string path_;
};

void read_transport(const Section& s, transport::ReliabilityConfig& t) {
    s.allow_only({"retransmit_base_ms", "retransmit_max_ms", "max_attempts", "reorder_window", "max_pending",
                  "idle_timeout_ms"});
    s.read_ms("retransmit_base_ms", t.retransmit_base);
    s.read_ms("retransmit_max_ms", t.retransmit_max);
    s.read_count("max_attempts", t.max_attempts);
    s.read_count("reorder_window", t.reorder_window);
    s.read_count("max_pending", t.max_pending);
    s.read_ms("idle_timeout_ms", t.idle_timeout);
    if (t.retransmit_max < t.retransmit_base) {
        throw ConfigError("transport.retransmit_max_ms must not be below retransmit_base_ms");
    }
}

void read_sessions(const Section& s, FacilitatorConfig& cfg) {
    s.allow_only({"liveness_timeout_ms", "sweep_interval_ms", "max_sessions"});
    s.read_ms("liveness_timeout_ms", cfg.sessions.liveness_timeout);
    s.read_ms("sweep_interval_ms", cfg.sweep_interval);
    s.read_count("max_sessions", cfg.sessions.max_sessions);
}

void read_rooms(const Section& s, core::RoomLimits& r) {
    s.allow_only({"default_capacity", "max_capacity", "max_rooms", "empty_room_ttl_ms"});
    s.read_count("default_capacity", r.default_capacity);
    s.read_count("max_capacity", r.max_capacity);
    s.read_count("max_rooms", r.max_rooms);
    s.read_ms("empty_room_ttl_ms", r.empty_room_ttl);
    if (r.default_capacity > r.max_capacity) {
        throw ConfigError("rooms.default_capacity must not exceed rooms.max_capacity");
    }
}

void read_rendezvous(const Section& s, FacilitatorConfig& cfg) {
    s.allow_only({"negotiation_window_ms", "retry_cap", "force_relay"});
    s.read_ms("negotiation_window_ms", cfg.rendezvous.negotiation_window);
    s.read_count("retry_cap", cfg.rendezvous.retry_cap);
    s.read("force_relay", cfg.force_relay);
}

void read_relay(const Section& s, core::RelayLimits& r) {
    s.allow_only({"max_links", "bytes_per_second", "datagrams_per_second",
                  "burst_bytes", "burst_datagrams", "max_backlog"});
    s.read_count("max_links", r.max_links);
    s.read_count("bytes_per_second", r.quota.bytes_per_second);
    s.read_count("datagrams_per_second", r.quota.datagrams_per_second);
    s.read_count("burst_bytes", r.quota.burst_bytes);
    s.read_count("burst_datagrams", r.quota.burst_datagrams);
    s.read_count("max_backlog", r.quota.max_backlog);
}

void read_auth(const Section& s, AuthConfig& a) {
    s.allow_only({"mode", "tokens", "secret"});

    std::string mode = "any";
    s.read("mode", mode);
    if (mode == "any") a.mode = AuthConfig::Mode::Any;
    else if (mode == "static") a.mode = AuthConfig::Mode::Static;
    else if (mode == "hmac") a.mode = AuthConfig::Mode::Hmac;
    else throw ConfigError("auth.mode must be one of any, static, hmac");

    if (const auto* tokens = s.get("tokens")) {
        const auto* arr = tokens->if_array();
        if (!arr) throw ConfigError("auth.tokens must be an array of strings");
        for (const auto& t : *arr) {
            if (!t.is_string() || t.get_string().empty()) {
                throw ConfigError("auth.tokens must be an array of non-empty strings");
            }
            a.tokens.emplace_back(t.get_string());
        }
    }
    s.read("secret", a.secret);

    if (a.mode == AuthConfig::Mode::Static && a.tokens.empty()) {
        throw ConfigError("auth.mode static needs auth.tokens");
    }
    if (a.mode == AuthConfig::Mode::Hmac && a.secret.empty()) {
        throw ConfigError("auth.mode hmac needs auth.secret");
    }
}

} // namespace

FacilitatorConfig parse_config(const std::string& text) {
    boost::system::error_code ec;
    json::value root = json::parse(text, ec);
    if (ec) throw ConfigError("configuration is not valid JSON: " + ec.message());

    FacilitatorConfig cfg;
    Section top(root, "");
    top.allow_only({"bind_address", "port", "worker_threads", "verbose", "tick_interval_ms",
                    "transport", "sessions", "rooms", "rendezvous", "relay", "auth"});

    top.read("bind_address", cfg.bind_address);
    boost::system::error_code addr_ec;
    boost::asio::ip::make_address(cfg.bind_address, addr_ec);
    if (addr_ec) throw ConfigError("bind_address '" + cfg.bind_address + "' is not an IP address");

    cfg.port = static_cast<std::uint16_t>(top.positive("port", cfg.port, 65535));
    top.read_count("worker_threads", cfg.worker_threads);
    top.read("verbose", cfg.verbose);
    top.read_ms("tick_interval_ms", cfg.tick_interval);

    if (const auto* v = top.get("transport"))  read_transport(Section(*v, "transport"), cfg.transport);
    if (const auto* v = top.get("sessions"))   read_sessions(Section(*v, "sessions"), cfg);
    if (const auto* v = top.get("rooms"))      read_rooms(Section(*v, "rooms"), cfg.rooms);
    if (const auto* v = top.get("rendezvous")) read_rendezvous(Section(*v, "rendezvous"), cfg);
    if (const auto* v = top.get("relay"))      read_relay(Section(*v, "relay"), cfg.relay);
    if (const auto* v = top.get("auth"))       read_auth(Section(*v, "auth"), cfg.auth);

    if (cfg.transport.idle_timeout <= cfg.sessions.liveness_timeout) {
        throw ConfigError("transport.idle_timeout_ms must exceed sessions.liveness_timeout_ms");
    }
    return cfg;
}

FacilitatorConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open configuration file " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_config(ss.str());
}

std::shared_ptr<const core::TokenVerifier> make_verifier(const AuthConfig& auth) {
    switch (auth.mode) {
        case AuthConfig::Mode::Any:
            return std::make_shared<core::AcceptAnyVerifier>();
        case AuthConfig::Mode::Static:
            return std::make_shared<core::StaticTokenVerifier>(auth.tokens);
        case AuthConfig::Mode::Hmac:
            return std::make_shared<core::HmacTokenVerifier>(auth.secret);
    }
    throw ConfigError("unknown auth mode");
}

} // namespace facilitator::networking
