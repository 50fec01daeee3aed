#include "transport/ReliableConnection.h"

#include <algorithm>

namespace facilitator::transport {

ReliableConnection::ReliableConnection(ReliabilityConfig config, Clock::time_point now)
    : config_(config),
      last_received_(now),
      last_sent_(now) {}

ReliableConnection::SendChannel& ReliableConnection::channel(Delivery mode) {
    return mode == Delivery::ReliableOrdered ? ordered_out_ : unordered_out_;
}

ReliableConnection::Clock::duration ReliableConnection::backoff(unsigned attempts) const {
    Clock::duration d = config_.retransmit_base;
    for (unsigned i = 1; i < attempts && d < config_.retransmit_max; ++i) d *= 2;
    return std::min<Clock::duration>(d, config_.retransmit_max);
}

std::size_t ReliableConnection::pending() const noexcept {
    return unordered_out_.pending.size() + ordered_out_.pending.size();
}

bool ReliableConnection::idle(Clock::time_point now) const noexcept {
    return pending() == 0 && now - std::max(last_received_, last_sent_) >= config_.idle_timeout;
}

Bytes ReliableConnection::control(PacketType type, Delivery mode, std::uint32_t sequence) {
    PacketHeader h;
    h.type = type;
    h.delivery = mode;
    h.sequence = sequence;
    return encode_packet(h, nullptr, 0);
}

bool ReliableConnection::send(const Bytes& payload, Delivery mode, Clock::time_point now,
                              std::vector<Bytes>& out) {
    PacketHeader h;
    h.delivery = mode;
    last_sent_ = now;

    if (!is_reliable(mode)) {
        out.push_back(encode_packet(h, payload));
        return true;
    }
    if (failed_ || pending() >= config_.max_pending) return false;

    auto& ch = channel(mode);
    h.sequence = ch.next_sequence++;

    Pending p;
    p.datagram = encode_packet(h, payload);
    p.attempts = 1;
    p.next_send = now + backoff(1);
    out.push_back(p.datagram);
    ch.pending.emplace(h.sequence, std::move(p));
    return true;
}

void ReliableConnection::receive(const Packet& packet, Clock::time_point now,
                                 std::vector<Bytes>& out, std::vector<Delivered>& delivered) {
    last_received_ = now;

    switch (packet.header.type) {
        case PacketType::Data:
            on_data(packet, out, delivered);
            break;
        case PacketType::Ack:
            on_ack(packet.header);
            break;
        case PacketType::ResendRequest:
            on_resend_request(packet.header, now, out);
            break;
    }
}

void ReliableConnection::on_data(const Packet& packet, std::vector<Bytes>& out,
                                 std::vector<Delivered>& delivered) {
    const auto mode = packet.header.delivery;
    const auto seq = packet.header.sequence;

    if (mode == Delivery::Unreliable) {
        delivered.push_back({packet.payload, mode});
        return;
    }

    if (mode == Delivery::ReliableUnordered) {
        if (seq > unordered_floor_ && seq - unordered_floor_ > config_.reorder_window) {
            out.push_back(control(PacketType::ResendRequest, mode, unordered_floor_ + 1));
            return;
        }
        // Duplicates are acked again: the first ack may have been lost.
        out.push_back(control(PacketType::Ack, mode, seq));
        if (seq <= unordered_floor_ || !unordered_seen_.insert(seq).second) return;

        delivered.push_back({packet.payload, mode});
        auto it = unordered_seen_.begin();
        while (it != unordered_seen_.end() && *it == unordered_floor_ + 1) {
            ++unordered_floor_;
            it = unordered_seen_.erase(it);
        }
        return;
    }

    // Reliable-ordered
    if (seq < ordered_next_) {
        out.push_back(control(PacketType::Ack, mode, seq));
        return;
    }
    if (seq - ordered_next_ >= config_.reorder_window) {
        // Too far ahead to buffer: drop without ack and ask for the gap.
        out.push_back(control(PacketType::ResendRequest, mode, ordered_next_));
        return;
    }

    out.push_back(control(PacketType::Ack, mode, seq));
    ordered_buffer_.emplace(seq, packet.payload);

    auto it = ordered_buffer_.begin();
    while (it != ordered_buffer_.end() && it->first == ordered_next_) {
        delivered.push_back({std::move(it->second), mode});
        ++ordered_next_;
        it = ordered_buffer_.erase(it);
    }
}

void ReliableConnection::on_ack(const PacketHeader& header) {
    channel(header.delivery).pending.erase(header.sequence);
}

void ReliableConnection::on_resend_request(const PacketHeader& header, Clock::time_point now,
                                           std::vector<Bytes>& out) {
    if (!is_reliable(header.delivery)) return;

    const std::uint32_t first = header.sequence;
    auto& pending = channel(header.delivery).pending;
    for (auto it = pending.lower_bound(first);
         it != pending.end() && it->first - first < config_.reorder_window; ++it) {
        auto& p = it->second;
        if (p.attempts >= config_.max_attempts) continue; // poll() reports the failure
        out.push_back(p.datagram);
        ++p.attempts;
        p.next_send = now + backoff(p.attempts);
    }
}

bool ReliableConnection::poll(Clock::time_point now, std::vector<Bytes>& out) {
    if (failed_) return false;

    for (auto* ch : {&unordered_out_, &ordered_out_}) {
        for (auto& [seq, p] : ch->pending) {
            if (now < p.next_send) continue;
            if (p.attempts >= config_.max_attempts) {
                failed_ = true;
                return false;
            }
            out.push_back(p.datagram);
            ++p.attempts;
            p.next_send = now + backoff(p.attempts);
        }
    }
    return true;
}

} // namespace facilitator::transport
