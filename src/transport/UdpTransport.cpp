#include "transport/UdpTransport.h"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <array>
#include <atomic>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace facilitator::transport {

namespace asio = boost::asio;
using udp = asio::ip::udp;

class UdpTransport::Impl : public std::enable_shared_from_this<UdpTransport::Impl> {
public:
    using Strand = asio::strand<asio::io_context::executor_type>;

    Impl(asio::io_context& ioc, const udp::endpoint& bind, ReliabilityConfig config,
         std::chrono::milliseconds tick_interval)
        : ioc_(ioc),
          socket_(ioc),
          strand_(asio::make_strand(ioc)),
          timer_(ioc),
          config_(config),
          tick_interval_(tick_interval) {
        socket_.open(bind.protocol());
        socket_.bind(bind);
    }

    void start() {
        running_ = true;
        asio::post(strand_, [self = shared_from_this()] {
            self->do_receive();
            self->schedule_tick();
        });
    }

    void stop() {
        running_ = false;
        asio::post(strand_, [self = shared_from_this()] {
            boost::system::error_code ec;
            self->socket_.close(ec);
            self->timer_.cancel();
        });
    }

    bool send(const Endpoint& to, const Bytes& payload, Delivery mode) {
        if (!running_) return false;

        const auto now = Clock::now();
        std::vector<Bytes> out;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = peers_.find(to);
            if (it != peers_.end()) {
                if (!it->second.conn.send(payload, mode, now, out)) return false;
            } else if (!is_reliable(mode)) {
                PacketHeader h;
                h.delivery = mode;
                out.push_back(encode_packet(h, payload));
            } else {
                if (!add_peer(to, now).conn.send(payload, mode, now, out)) return false;
            }
        }
        write(to, std::move(out));
        return true;
    }

    void forget(const Endpoint& peer) {
        std::lock_guard<std::mutex> lk(mu_);
        peers_.erase(peer);
    }

    std::optional<Clock::time_point> last_received(const Endpoint& peer) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = peers_.find(peer);
        if (it == peers_.end()) return std::nullopt;
        return it->second.conn.last_received();
    }

    std::size_t peer_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return peers_.size();
    }

    Endpoint local_endpoint() const {
        return Endpoint::from_udp(socket_.local_endpoint(), EndpointClass::Local);
    }

    OnReceive on_receive_;
    OnPeerFailed on_peer_failed_;
    std::atomic<bool> verbose_{false};

private:
    struct Peer {
        ReliableConnection conn;
        Strand strand;
    };

    Peer& add_peer(const Endpoint& ep, Clock::time_point now) {
        return peers_.emplace(ep, Peer{ReliableConnection(config_, now), asio::make_strand(ioc_)}).first->second;
    }

    template <class Executor>
    void deliver(const Executor& ex, const Endpoint& from, Bytes payload, Delivery mode) {
        asio::post(ex, [self = shared_from_this(), from, payload = std::move(payload), mode]() mutable {
            if (self->running_ && self->on_receive_) self->on_receive_(from, std::move(payload), mode);
        });
    }

    void do_receive() {
        socket_.async_receive_from(
            asio::buffer(recv_buf_), sender_,
            asio::bind_executor(
                strand_,
                [self = shared_from_this()](boost::system::error_code ec, std::size_t n) {
                    if (ec) {
                        if (ec == asio::error::operation_aborted || !self->running_) return;
                        std::cerr << "[transport] receive: " << ec.message() << "\n";
                    } else {
                        self->on_datagram(n);
                    }
                    if (self->running_) self->do_receive();
                }));
    }

    void on_datagram(std::size_t n) {
        const auto from = Endpoint::from_udp(sender_);
        auto packet = decode_packet(recv_buf_.data(), n);
        if (!packet) {
            if (verbose_) std::cerr << "[transport] dropped malformed datagram from " << from.to_string() << "\n";
            return;
        }

        const auto now = Clock::now();
        std::vector<Bytes> out;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = peers_.find(from);
            Peer* peer = it == peers_.end() ? nullptr : &it->second;
            if (!peer) {
                // Only reliable data opens per-peer state. Unreliable datagrams from
                // unknown endpoints are handed up as they are; stray acks are dropped.
                if (packet->header.type != PacketType::Data) return;
                if (!is_reliable(packet->header.delivery)) {
                    deliver(ioc_.get_executor(), from, std::move(packet->payload), packet->header.delivery);
                    return;
                }
                peer = &add_peer(from, now);
            }

            std::vector<Delivered> delivered;
            peer->conn.receive(*packet, now, out, delivered);
            for (auto& d : delivered) deliver(peer->strand, from, std::move(d.payload), d.delivery);
        }
        if (!out.empty()) write(from, std::move(out));
    }

    void schedule_tick() {
        timer_.expires_after(tick_interval_);
        timer_.async_wait(asio::bind_executor(
            strand_,
            [self = shared_from_this()](boost::system::error_code ec) {
                if (ec || !self->running_) return;
                self->on_tick();
                self->schedule_tick();
            }));
    }

    void on_tick() {
        const auto now = Clock::now();
        std::vector<std::pair<Endpoint, std::vector<Bytes>>> writes;
        std::vector<Endpoint> failed;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (auto it = peers_.begin(); it != peers_.end();) {
                std::vector<Bytes> out;
                const bool alive = it->second.conn.poll(now, out);
                if (!out.empty()) writes.emplace_back(it->first, std::move(out));
                if (!alive) {
                    failed.push_back(it->first);
                    it = peers_.erase(it);
                } else if (it->second.conn.idle(now)) {
                    if (verbose_) std::cout << "[transport] peer " << it->first.to_string() << " idle, dropped\n";
                    it = peers_.erase(it);
                } else {
                    ++it;
                }
            }
        }

        for (auto& [to, datagrams] : writes) write(to, std::move(datagrams));
        for (const auto& peer : failed) {
            std::cerr << "[transport] peer " << peer.to_string() << " failed: retransmit limit reached\n";
            asio::post(ioc_, [self = shared_from_this(), peer] {
                if (self->running_ && self->on_peer_failed_) self->on_peer_failed_(peer);
            });
        }
    }

    void write(const Endpoint& to, std::vector<Bytes> datagrams) {
        asio::post(
            strand_,
            [self = shared_from_this(), target = to.to_udp(), datagrams = std::move(datagrams)]() mutable {
                if (!self->running_) return;
                for (auto& d : datagrams) {
                    auto buf = std::make_shared<Bytes>(std::move(d));
                    self->socket_.async_send_to(
                        asio::buffer(*buf), target,
                        asio::bind_executor(self->strand_, [buf](boost::system::error_code ec, std::size_t) {
                            if (ec && ec != asio::error::operation_aborted) {
                                std::cerr << "[transport] send: " << ec.message() << "\n";
                            }
                        }));
                }
            });
    }

    asio::io_context& ioc_;
    udp::socket socket_;
    Strand strand_;
    asio::steady_timer timer_;

    const ReliabilityConfig config_;
    const std::chrono::milliseconds tick_interval_;
    std::atomic<bool> running_{false};

    std::array<std::uint8_t, 65536> recv_buf_{};
    udp::endpoint sender_;

    mutable std::mutex mu_;
    std::unordered_map<Endpoint, Peer, EndpointHash> peers_;
};

// ---- UdpTransport wrapper ----

UdpTransport::UdpTransport(asio::io_context& ioc, const udp::endpoint& bind,
                           ReliabilityConfig config, std::chrono::milliseconds tick_interval)
    : impl_(std::make_shared<Impl>(ioc, bind, config, tick_interval)) {}

UdpTransport::~UdpTransport() { impl_->stop(); }

void UdpTransport::set_on_receive(OnReceive cb) { impl_->on_receive_ = std::move(cb); }
void UdpTransport::set_on_peer_failed(OnPeerFailed cb) { impl_->on_peer_failed_ = std::move(cb); }
void UdpTransport::set_verbose(bool verbose) { impl_->verbose_ = verbose; }

void UdpTransport::start() { impl_->start(); }
void UdpTransport::stop() { impl_->stop(); }

bool UdpTransport::send(const Endpoint& to, const Bytes& payload, Delivery mode) {
    return impl_->send(to, payload, mode);
}

void UdpTransport::forget(const Endpoint& peer) { impl_->forget(peer); }

std::optional<UdpTransport::Clock::time_point> UdpTransport::last_received(const Endpoint& peer) const {
    return impl_->last_received(peer);
}

std::size_t UdpTransport::peer_count() const { return impl_->peer_count(); }

Endpoint UdpTransport::local_endpoint() const { return impl_->local_endpoint(); }

} // namespace facilitator::transport
