#include "guest/guest_client.hpp"
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

    if (!config.load("data/sync.json") && !config.load("../data/sync.json")) {
        std::cerr << "No data/sync.json found, running with defaults" << std::endl;
    }

    // quadsync_guest [host] [port]
    std::string host = config.network().host;
    uint16_t port = config.network().port;
    if (argc > 1) {
        host = argv[1];
    }
    if (argc > 2) {
        try {
            port = static_cast<uint16_t>(std::stoi(argv[2]));
        } catch (const std::exception& e) {
            std::cerr << "Invalid port '" << argv[2] << "': " << e.what() << std::endl;
            return 1;
        }
    }

    try {
        asio::io_context io_context;

        quadsync::guest::GuestClient client(io_context, config);
        if (!client.connect(host, port)) {
            return 1;
        }

        shutdown_handler = [&]() {
            asio::post(io_context, [&]() {
                client.stop();
                io_context.stop();
            });
        };

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        client.start();
        io_context.run();

    } catch (const std::exception& e) {
        std::cerr << "Guest error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
