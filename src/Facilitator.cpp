#include "networking/Config.h"
#include "networking/FacilitatorServer.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <exception>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

int main(int argc, char** argv) {
    using namespace facilitator::networking;

    FacilitatorConfig config;
    if (argc > 1) {
        try {
            config = load_config(argv[1]);
        } catch (const ConfigError& e) {
            std::cerr << "[Facilitator] " << e.what() << "\n";
            return 1;
        }
    }

    boost::asio::io_context ioc;

    std::unique_ptr<FacilitatorServer> server;
    try {
        server = std::make_unique<FacilitatorServer>(ioc, config);
    } catch (const std::exception& e) {
        std::cerr << "[Facilitator] cannot start: " << e.what() << "\n";
        return 1;
    }
    server->start();

    // Graceful shutdown on Ctrl+C / SIGTERM
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        std::cout << "\n[Facilitator] shutting down...\n";
        server->stop();
        ioc.stop();
    });

    std::cout << "[Facilitator] running with " << config.worker_threads << " worker thread(s)\n";

    std::vector<std::thread> workers;
    for (unsigned i = 1; i < config.worker_threads; ++i) {
        workers.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : workers) t.join();

    std::cout << "[Facilitator] exit.\n";
    return 0;
}
