#include "host/host_server.hpp"
#include "sync/sync_config.hpp"
#include <csignal>
#include <functional>
#include <iostream>
#include <string>

std::function<void()> shutdown_handler;

void signal_handler(int signal) {
    std::cout << "\nReceived signal " << signal << ", shutting down..." << std::endl;
    if (shutdown_handler) {
        shutdown_handler();
    }
}

int main(int argc, char* argv[]) {
    quadsync::SyncConfig config;

    // Check for the config relative to the working directory, then one level up
    if (!config.load("data/sync.json") && !config.load("../data/sync.json")) {
        std::cerr << "No data/sync.json found, running with defaults" << std::endl;
    }

    uint16_t port = config.network().port;

    if (argc > 1) {
        try {
            port = static_cast<uint16_t>(std::stoi(argv[1]));
        } catch (const std::exception& e) {
            std::cerr << "Invalid port '" << argv[1] << "': " << e.what() << std::endl;
            return 1;
        }
    }

    try {
        asio::io_context io_context;

        quadsync::host::HostServer server(io_context, port, config);

        shutdown_handler = [&]() {
            asio::post(io_context, [&]() {
                server.stop();
                io_context.stop();
            });
        };

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        server.start();

        std::cout << "quadsync host running on port " << port << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;

        io_context.run();

    } catch (const std::exception& e) {
        std::cerr << "Host error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
