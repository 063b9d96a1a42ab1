/**
 * @file main.cpp
 * @brief Netplay Signaling Server Entry Point
 *
 * Hosts netplay rooms, relays WebRTC signaling between peers and serves the
 * open-room listing.
 *
 * Usage:
 *   ./netplay_server [port]
 *   ./netplay_server 3000
 */

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <csignal>
#include <atomic>
#include <exception>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ip/address.hpp>

#include "server/ws_server.hpp"
#include "server/ws_session.hpp"
#include "services/room_registry.hpp"
#include "services/room_reaper.hpp"
#include "services/session_coordinator.hpp"
#include "utils/server_config.hpp"

namespace net = boost::asio;

int main(int argc, char* argv[]) {
    netplay::ServerConfig config;
    try {
        config = netplay::ServerConfig::fromArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        netplay::ServerConfig::printUsage(argv[0]);
        return 1;
    }
    if (config.showHelp) {
        netplay::ServerConfig::printUsage(argv[0]);
        return 0;
    }

    std::cout << "Netplay Signaling Server v1.0" << std::endl;

    try {
        // Declared before the io_context: sessions still queued in it at
        // shutdown call back into the coordinator when they are destroyed.
        std::atomic<bool> delivering{true};
        netplay::RoomRegistry registry;
        netplay::SessionDirectory directory;
        netplay::SessionCoordinator coordinator(
            registry,
            [&directory, &delivering](const std::string& connectionId, const std::string& message) {
                if (delivering.load(std::memory_order_acquire)) {
                    directory.send(connectionId, message);
                }
            });

        const int threads = config.threads;
        net::io_context ioc{threads};

        auto server = std::make_shared<netplay::WsServer>(
            ioc,
            net::ip::tcp::endpoint{
                net::ip::make_address(config.bindAddress),
                config.port
            },
            coordinator,
            directory
        );
        if (!server->run()) {
            std::cerr << "Failed to start listener on " << config.bindAddress
                      << ":" << config.port << std::endl;
            return 1;
        }

        auto reaper = std::make_shared<netplay::RoomReaper>(ioc, registry, config.reaperInterval);
        reaper->run();

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](boost::system::error_code const&, int sig) {
            std::cout << "\nReceived signal " << sig << ", shutting down..." << std::endl;
            server->stop();
            reaper->stop();
            ioc.stop();
        });

        std::cout << "Server started with " << threads << " thread(s), reaper every "
                  << config.reaperInterval.count() << "s" << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;

        std::vector<std::thread> v;
        v.reserve(threads - 1);
        for (auto i = threads - 1; i > 0; --i) {
            v.emplace_back([&ioc] {
                ioc.run();
            });
        }
        ioc.run();

        for (auto& t : v) {
            t.join();
        }
        delivering.store(false, std::memory_order_release);

        std::cout << "Server stopped." << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
