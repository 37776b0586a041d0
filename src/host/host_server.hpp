#pragma once

#include "host/arena_director.hpp"
#include "host/host_session.hpp"
#include "host/world.hpp"
#include "net/peer_link.hpp"
#include "sync/sync_config.hpp"
#include <asio.hpp>
#include <chrono>
#include <memory>

namespace quadsync::host {

// Accepts a single guest and runs the host frame loop on the io_context
class HostServer {
public:
    using tcp = asio::ip::tcp;

    HostServer(asio::io_context& io_context, uint16_t port, const SyncConfig& config);
    ~HostServer();

    void start();
    void stop();

private:
    void accept();
    void game_loop();

    asio::io_context& io_context_;
    tcp::acceptor acceptor_;
    const SyncConfig& config_;
    World world_;
    HostSession session_;
    ArenaDirector director_;
    std::shared_ptr<net::PeerLink> guest_;

    asio::steady_timer tick_timer_;
    bool running_ = false;
    std::chrono::steady_clock::time_point last_tick_;
};

} // namespace quadsync::host
