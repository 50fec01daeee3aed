#include "networking/FacilitatorServer.h"

#include "transport/UdpTransport.h"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <iostream>
#include <utility>

namespace facilitator::networking {

namespace asio = boost::asio;
using udp = asio::ip::udp;
using Clock = std::chrono::steady_clock;

namespace {

class TransportOutbox : public Outbox {
public:
    explicit TransportOutbox(transport::UdpTransport& transport)
        : transport_(transport) {}

    void send(const transport::Endpoint& to, const Bytes& payload, transport::Delivery mode) override {
        if (!transport_.send(to, payload, mode)) {
            std::cerr << "[facilitator] dropped " << transport::to_string(mode) << " send to "
                      << to.to_string() << ": peer queue full or failed\n";
        }
    }

    void forget(const transport::Endpoint& peer) override { transport_.forget(peer); }

private:
    transport::UdpTransport& transport_;
};

// Port 0 binds an ephemeral port; the service advertises the real one.
FacilitatorConfig with_bound_port(FacilitatorConfig config, const transport::UdpTransport& transport) {
    config.port = transport.local_endpoint().port;
    return config;
}

} // namespace

class FacilitatorServer::Impl : public std::enable_shared_from_this<FacilitatorServer::Impl> {
public:
    Impl(asio::io_context& ioc, FacilitatorConfig config)
        : transport_(ioc,
                     udp::endpoint(asio::ip::make_address(config.bind_address), config.port),
                     config.transport),
          outbox_(transport_),
          service_(with_bound_port(config, transport_), outbox_),
          strand_(asio::make_strand(ioc)),
          timer_(ioc),
          tick_interval_(config.tick_interval) {
        transport_.set_verbose(config.verbose);
    }

    void start() {
        std::weak_ptr<Impl> weak = weak_from_this();
        transport_.set_on_receive([weak](const transport::Endpoint& from, Bytes payload, transport::Delivery mode) {
            if (auto self = weak.lock()) self->service_.handle(from, payload, mode, Clock::now());
        });
        transport_.set_on_peer_failed([weak](const transport::Endpoint& peer) {
            if (auto self = weak.lock()) self->service_.on_peer_failed(peer, Clock::now());
        });

        running_ = true;
        transport_.start();
        asio::post(strand_, [self = shared_from_this()] { self->schedule_tick(); });
        std::cout << "[facilitator] listening on " << transport_.local_endpoint().to_string() << "\n";
    }

    void stop() {
        if (!running_.exchange(false)) return;
        transport_.stop();
        asio::post(strand_, [self = shared_from_this()] { self->timer_.cancel(); });
    }

    transport::Endpoint local_endpoint() const { return transport_.local_endpoint(); }

    const FacilitatorService& service() const { return service_; }

private:
    void schedule_tick() {
        timer_.expires_after(tick_interval_);
        timer_.async_wait(asio::bind_executor(strand_, [self = shared_from_this()](boost::system::error_code ec) {
            if (ec || !self->running_) return;
            self->service_.tick(Clock::now());
            self->schedule_tick();
        }));
    }

    transport::UdpTransport transport_;
    TransportOutbox outbox_;
    FacilitatorService service_;

    asio::strand<asio::io_context::executor_type> strand_;
    asio::steady_timer timer_;
    const std::chrono::milliseconds tick_interval_;
    std::atomic<bool> running_{false};
};

FacilitatorServer::FacilitatorServer(asio::io_context& ioc, FacilitatorConfig config)
    : impl_(std::make_shared<Impl>(ioc, std::move(config))) {}

FacilitatorServer::~FacilitatorServer() { impl_->stop(); }

void FacilitatorServer::start() { impl_->start(); }
void FacilitatorServer::stop() { impl_->stop(); }

transport::Endpoint FacilitatorServer::local_endpoint() const { return impl_->local_endpoint(); }

const FacilitatorService& FacilitatorServer::service() const { return impl_->service(); }

} // namespace facilitator::networking
