#pragma once

#include "networking/Config.h"
#include "networking/FacilitatorService.h"
#include "transport/Endpoint.h"

#include <boost/asio/io_context.hpp>

#include <memory>

namespace facilitator::networking {

// The Facilitator process shell: binds the UDP transport, feeds datagrams to the
// service and drives its periodic tick.
class FacilitatorServer {
public:
    FacilitatorServer(boost::asio::io_context& ioc, FacilitatorConfig config);
    ~FacilitatorServer();

    FacilitatorServer(const FacilitatorServer&) = delete;
    FacilitatorServer& operator=(const FacilitatorServer&) = delete;

    void start();
    void stop();

    // Bound address; the port is the real one when the config asked for 0.
    transport::Endpoint local_endpoint() const;

    const FacilitatorService& service() const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace facilitator::networking
