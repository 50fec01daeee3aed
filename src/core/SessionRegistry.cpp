#include "core/SessionRegistry.h"

#include "core/Errors.h"

#include <iterator>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace facilitator::core {

SessionRegistry::SessionRegistry(std::shared_ptr<const TokenVerifier> verifier, SessionLimits limits)
    : verifier_(std::move(verifier)),
      limits_(limits) {
    if (!verifier_) throw std::invalid_argument("session registry needs a token verifier");
}

Registration SessionRegistry::register_session(const RegisterRequest& request,
                                               const transport::Endpoint& observed,
                                               Clock::time_point now) {
    if (!verifier_->verify(request.token)) {
        throw AuthenticationError("invalid session token");
    }

    std::unique_lock<std::shared_mutex> lk(mu_);

    auto bound = by_token_.find(request.token);
    if (bound != by_token_.end()) {
        auto& existing = sessions_.at(bound->second);
        if (!request.request_id.empty() && existing.request_id == request.request_id &&
            existing.observed == observed) {
            existing.touch(now);
            return {existing, true};
        }
        throw AuthenticationError("token already bound to an active session");
    }

    if (by_endpoint_.count(observed) != 0) {
        throw AuthenticationError("endpoint already bound to an active session");
    }
    if (sessions_.size() >= limits_.max_sessions) {
        throw CapacityError("session limit reached");
    }

    Session s;
    s.session_id = idgen_.sessionID();
    s.token = request.token;
    s.name = sanitize_name(request.name);
    s.platform = request.platform;
    s.request_id = request.request_id;
    s.observed = observed;
    s.observed.cls = transport::EndpointClass::Public;
    s.force_relay = request.force_relay;
    s.connected_at = now;
    s.last_seen = now;

    for (auto ep : request.local_endpoints) {
        ep.cls = transport::EndpointClass::Local;
        if (ep != s.observed) s.candidates.push_back(ep);
    }
    s.candidates.push_back(s.observed);

    by_token_.emplace(s.token, s.session_id);
    by_endpoint_.emplace(s.observed, s.session_id);
    auto it = sessions_.emplace(s.session_id, std::move(s)).first;
    return {it->second, false};
}

bool SessionRegistry::touch(const std::string& session_id, Clock::time_point now) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return false;
    it->second.touch(now);
    return true;
}

void SessionRegistry::set_room(const std::string& session_id, std::optional<std::string> room_id) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) it->second.room_id = std::move(room_id);
}

Session SessionRegistry::erase_locked(std::unordered_map<std::string, Session>::iterator it) {
    Session s = std::move(it->second);
    sessions_.erase(it);
    by_token_.erase(s.token);
    by_endpoint_.erase(s.observed);
    s.state = SessionState::Disconnected;
    return s;
}

std::optional<Session> SessionRegistry::remove(const std::string& session_id) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return std::nullopt;
    return erase_locked(it);
}

std::vector<Session> SessionRegistry::expire_sweep(Clock::time_point now) {
    std::vector<Session> expired;

    std::unique_lock<std::shared_mutex> lk(mu_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now - it->second.last_seen > limits_.liveness_timeout) {
            auto next = std::next(it);
            expired.push_back(erase_locked(it));
            it = next;
        } else {
            ++it;
        }
    }
    return expired;
}

std::optional<Session> SessionRegistry::find(const std::string& session_id) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

std::optional<Session> SessionRegistry::find_by_endpoint(const transport::Endpoint& endpoint) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = by_endpoint_.find(endpoint);
    if (it == by_endpoint_.end()) return std::nullopt;
    return sessions_.at(it->second);
}

std::vector<Session> SessionRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    std::vector<Session> out;
    out.reserve(sessions_.size());
    for (const auto& [id, s] : sessions_) out.push_back(s);
    return out;
}

std::size_t SessionRegistry::size() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return sessions_.size();
}

} // namespace facilitator::core
