#include "actions/EmitActionHandler.h"
#include "actions/ToolRouter.h"
#include "config/Config.h"
#include "networking/HttpServer.h"
#include "relay/Relay.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <exception>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace sessionrelay;

    std::optional<config::Config> cfg;
    try {
        cfg = config::parse_command_line(argc, argv, std::cout);
    } catch (const std::exception& e) {
        std::cerr << "[SessionRelay] " << e.what() << "\n";
        return 1;
    }
    if (!cfg) return 0;  // --help

    boost::asio::io_context ioc(static_cast<int>(cfg->threads));

    relay::Relay relay(cfg->relay);
    actions::EmitActionHandler handler(relay);
    actions::ToolRouter tools(handler, relay);

    std::optional<networking::HttpServer> server;
    try {
        server.emplace(ioc, cfg->address, cfg->port, relay, tools);
    } catch (const std::exception& e) {
        std::cerr << "[SessionRelay] cannot listen on " << cfg->address << ":" << cfg->port
                  << ": " << e.what() << "\n";
        return 1;
    }
    server->start();

    // Graceful shutdown on Ctrl+C / SIGTERM
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        std::cout << "\n[SessionRelay] shutting down...\n";
        server->stop();
        ioc.stop();
    });

    std::cout << "[SessionRelay] listening on " << cfg->address << ":" << server->port()
              << " (heartbeat " << cfg->relay.heartbeat_interval.count() << "s, keeping "
              << cfg->relay.max_events_per_session << " events/session)\n";

    std::vector<std::thread> workers;
    workers.reserve(cfg->threads - 1);
    for (unsigned i = 1; i < cfg->threads; ++i) {
        workers.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : workers) t.join();

    std::cout << "[SessionRelay] exit.\n";
    return 0;
}
