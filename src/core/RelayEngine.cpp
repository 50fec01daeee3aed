#include "core/RelayEngine.h"

#include "core/Errors.h"

#include <algorithm>
#include <utility>

namespace facilitator::core {

const char* to_string(ForwardResult r) noexcept {
    switch (r) {
        case ForwardResult::Forwarded: return "forwarded";
        case ForwardResult::Queued:    return "queued";
        case ForwardResult::Dropped:   return "dropped";
        case ForwardResult::NoChannel: return "no-channel";
    }
    return "unknown";
}

RelayEngine::RelayEngine(RelayLimits limits)
    : limits_(limits) {}

std::uint32_t RelayEngine::open_channel(const std::string& link_id, RelayLeg a, RelayLeg b,
                                        Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);
    if (channels_.size() >= limits_.max_links) throw CapacityError("relay link limit reached");

    // Channel ids skip 0 and any id still in use after wraparound.
    std::uint32_t id = next_channel_;
    while (id == 0 || channels_.count(id) != 0) ++id;
    next_channel_ = id + 1;

    Channel ch;
    ch.link_id = link_id;
    ch.legs[0].peer = std::move(a);
    ch.legs[1].peer = std::move(b);
    ch.byte_tokens = static_cast<double>(limits_.quota.burst_bytes);
    ch.datagram_tokens = static_cast<double>(limits_.quota.burst_datagrams);
    ch.refilled_at = now;
    channels_.emplace(id, std::move(ch));
    return id;
}

bool RelayEngine::close_channel(std::uint32_t channel_id) {
    std::lock_guard<std::mutex> lk(mu_);
    return channels_.erase(channel_id) != 0;
}

void RelayEngine::refill(Channel& ch, Clock::time_point now) const {
    if (now <= ch.refilled_at) return;
    const double secs = std::chrono::duration<double>(now - ch.refilled_at).count();
    ch.refilled_at = now;

    const auto& q = limits_.quota;
    ch.byte_tokens = std::min<double>(static_cast<double>(q.burst_bytes),
                                      ch.byte_tokens + secs * static_cast<double>(q.bytes_per_second));
    ch.datagram_tokens = std::min<double>(static_cast<double>(q.burst_datagrams),
                                          ch.datagram_tokens + secs * static_cast<double>(q.datagrams_per_second));
}

bool RelayEngine::take(Channel& ch, std::size_t bytes) const {
    // A frame larger than the byte burst can still pass once the bucket is full.
    const double need = std::min<double>(static_cast<double>(bytes),
                                         static_cast<double>(limits_.quota.burst_bytes));
    if (ch.datagram_tokens < 1.0 || ch.byte_tokens < need) return false;
    ch.datagram_tokens -= 1.0;
    ch.byte_tokens -= need;
    return true;
}

void RelayEngine::emit(Channel& ch, Leg& to, RelayFrame frame, std::vector<RelayOutgoing>& out) {
    frame.seq = to.next_seq++;
    ch.stats.forwarded_datagrams += 1;
    ch.stats.forwarded_bytes += frame.payload.size();
    out.push_back({to.peer.endpoint, std::move(frame)});
}

ForwardResult RelayEngine::forward(std::uint32_t channel_id, const transport::Endpoint& from,
                                   transport::Delivery delivery, transport::Bytes payload,
                                   Clock::time_point now, std::vector<RelayOutgoing>& out) {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = channels_.find(channel_id);
    if (it == channels_.end()) return ForwardResult::NoChannel;
    auto& ch = it->second;

    Leg* to = nullptr;
    if (ch.legs[0].peer.endpoint == from) to = &ch.legs[1];
    else if (ch.legs[1].peer.endpoint == from) to = &ch.legs[0];
    if (!to) return ForwardResult::NoChannel;

    RelayFrame frame;
    frame.channel_id = channel_id;
    frame.delivery = delivery;
    frame.payload = std::move(payload);

    refill(ch, now);

    const bool reliable = transport::is_reliable(delivery);
    // Reliable frames never overtake ones already waiting for this leg.
    if (reliable && !to->backlog.empty()) {
        if (to->backlog.size() >= limits_.quota.max_backlog) {
            ch.stats.dropped += 1;
            return ForwardResult::Dropped;
        }
        to->backlog.push_back(std::move(frame));
        ch.stats.backlog += 1;
        return ForwardResult::Queued;
    }

    if (take(ch, frame.payload.size())) {
        emit(ch, *to, std::move(frame), out);
        return ForwardResult::Forwarded;
    }

    if (!reliable || to->backlog.size() >= limits_.quota.max_backlog) {
        ch.stats.dropped += 1;
        return ForwardResult::Dropped;
    }
    to->backlog.push_back(std::move(frame));
    ch.stats.backlog += 1;
    return ForwardResult::Queued;
}

void RelayEngine::drain(Clock::time_point now, std::vector<RelayOutgoing>& out) {
    std::lock_guard<std::mutex> lk(mu_);

    for (auto& [id, ch] : channels_) {
        if (ch.legs[0].backlog.empty() && ch.legs[1].backlog.empty()) continue;
        refill(ch, now);

        // Alternate legs so one direction cannot starve the other.
        bool progressed = true;
        while (progressed) {
            progressed = false;
            for (auto& leg : ch.legs) {
                if (leg.backlog.empty()) continue;
                if (!take(ch, leg.backlog.front().payload.size())) break;
                RelayFrame frame = std::move(leg.backlog.front());
                leg.backlog.pop_front();
                ch.stats.backlog -= 1;
                emit(ch, leg, std::move(frame), out);
                progressed = true;
            }
        }
    }
}

std::optional<RelayStats> RelayEngine::stats(std::uint32_t channel_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = channels_.find(channel_id);
    if (it == channels_.end()) return std::nullopt;
    return it->second.stats;
}

std::size_t RelayEngine::channel_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return channels_.size();
}

} // namespace facilitator::core
