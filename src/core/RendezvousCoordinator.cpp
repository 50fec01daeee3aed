#include "core/RendezvousCoordinator.h"

#include "core/Errors.h"

#include <iostream>
#include <utility>

namespace facilitator::core {

const char* to_string(LinkState s) noexcept {
    switch (s) {
        case LinkState::Negotiating: return "negotiating";
        case LinkState::Direct:      return "direct";
        case LinkState::Relayed:     return "relayed";
        case LinkState::Failed:      return "failed";
    }
    return "unknown";
}

RendezvousCoordinator::RendezvousCoordinator(RelayEngine& relay, RendezvousLimits limits)
    : relay_(relay),
      limits_(limits) {}

void RendezvousCoordinator::begin_negotiation(PeerLink& link, Clock::time_point now) {
    link.state = LinkState::Negotiating;
    link.attempts += 1;
    link.punched_a = false;
    link.punched_b = false;
    link.reason.clear();
    link.last_transition = now;
    link.deadline = now + limits_.negotiation_window;
}

void RendezvousCoordinator::start_relay(PeerLink& link, Clock::time_point now) {
    link.last_transition = now;
    try {
        link.channel_id = relay_.open_channel(link.link_id,
                                              {link.session_a, link.endpoint_a},
                                              {link.session_b, link.endpoint_b}, now);
        link.state = LinkState::Relayed;
    } catch (const CapacityError& e) {
        std::cerr << "[rendezvous] link " << link.link_id << " failed: " << e.what() << "\n";
        link.state = LinkState::Failed;
        link.reason = "relay_capacity";
    }
}

PeerLink RendezvousCoordinator::create_link(const std::string& room_id, const LinkEndpoint& x,
                                            const LinkEndpoint& y, bool force_relay,
                                            Clock::time_point now) {
    const bool x_first = x.session_id < y.session_id;
    const auto& a = x_first ? x : y;
    const auto& b = x_first ? y : x;

    PeerLink link;
    link.link_id = idgen_.linkID();
    link.room_id = room_id;
    link.session_a = a.session_id;
    link.session_b = b.session_id;
    link.endpoint_a = a.endpoint;
    link.endpoint_b = b.endpoint;
    link.force_relay = force_relay;

    std::lock_guard<std::mutex> lk(mu_);
    if (find_between_locked(a.session_id, b.session_id)) {
        throw AlreadyMemberError("sessions are already linked");
    }

    begin_negotiation(link, now);
    if (force_relay) start_relay(link, now);

    return links_.emplace(link.link_id, std::move(link)).first->second;
}

std::optional<PeerLink> RendezvousCoordinator::report_punch(const std::string& link_id,
                                                            const std::string& session_id,
                                                            Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = links_.find(link_id);
    if (it == links_.end()) throw LinkNotFoundError("link " + link_id + " not found");
    auto& link = it->second;
    if (!link.involves(session_id)) throw NotMemberError("session is not part of link " + link_id);

    if (link.state != LinkState::Negotiating) return std::nullopt;

    if (link.initiator(session_id)) link.punched_a = true;
    else link.punched_b = true;

    if (!(link.punched_a && link.punched_b)) return std::nullopt;

    link.state = LinkState::Direct;
    link.last_transition = now;
    return link;
}

std::vector<PeerLink> RendezvousCoordinator::expire(Clock::time_point now) {
    std::vector<PeerLink> changed;

    std::lock_guard<std::mutex> lk(mu_);
    for (auto& [id, link] : links_) {
        if (link.state != LinkState::Negotiating || now < link.deadline) continue;
        start_relay(link, now);
        changed.push_back(link);
    }
    return changed;
}

PeerLink RendezvousCoordinator::retry(const std::string& session_id, const std::string& peer_session_id,
                                      Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);

    auto* link = find_between_locked(session_id, peer_session_id);
    if (!link) throw LinkNotFoundError("no link with " + peer_session_id);
    if (link->state != LinkState::Failed) {
        throw ProtocolError(std::string("link is ") + to_string(link->state) + ", not failed");
    }
    if (link->attempts > limits_.retry_cap) {
        throw RetryLimitError("retry limit reached for link " + link->link_id);
    }

    begin_negotiation(*link, now);
    if (link->force_relay) start_relay(*link, now);
    return *link;
}

std::vector<PeerLink> RendezvousCoordinator::remove_links_for(const std::string& session_id) {
    std::vector<PeerLink> removed;

    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = links_.begin(); it != links_.end();) {
        if (!it->second.involves(session_id)) {
            ++it;
            continue;
        }
        auto& link = it->second;
        if (link.channel_id) relay_.close_channel(*link.channel_id);
        removed.push_back(std::move(link));
        it = links_.erase(it);
    }
    return removed;
}

PeerLink* RendezvousCoordinator::find_between_locked(const std::string& x, const std::string& y) {
    for (auto& [id, link] : links_) {
        if (link.involves(x) && link.involves(y) && x != y) return &link;
    }
    return nullptr;
}

std::optional<PeerLink> RendezvousCoordinator::find(const std::string& link_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = links_.find(link_id);
    if (it == links_.end()) return std::nullopt;
    return it->second;
}

std::optional<PeerLink> RendezvousCoordinator::find_between(const std::string& x, const std::string& y) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, link] : links_) {
        if (link.involves(x) && link.involves(y) && x != y) return link;
    }
    return std::nullopt;
}

std::vector<PeerLink> RendezvousCoordinator::links_for(const std::string& session_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<PeerLink> out;
    for (const auto& [id, link] : links_) {
        if (link.involves(session_id)) out.push_back(link);
    }
    return out;
}

std::size_t RendezvousCoordinator::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return links_.size();
}

} // namespace facilitator::core
