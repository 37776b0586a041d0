#pragma once

#include "guest/guest_session.hpp"
#include "net/peer_link.hpp"
#include "sync/sync_config.hpp"
#include <asio.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace quadsync::guest {

// Connects to the host and runs the guest frame loop on the io_context.
// The local pilot flies a fixed pattern and fires at the nearest enemy.
class GuestClient {
public:
    GuestClient(asio::io_context& io_context, const SyncConfig& config);
    ~GuestClient();

    bool connect(const std::string& host, uint16_t port);
    void start();
    void stop();

    const GuestSession& session() const { return session_; }

private:
    void frame();
    void fly_local_pilot(const TickContext& ctx);
    void report(double now_ms);

    asio::io_context& io_context_;
    const SyncConfig& config_;
    GuestSession session_;
    std::shared_ptr<net::PeerLink> link_;

    asio::steady_timer frame_timer_;
    bool running_ = false;
    std::chrono::steady_clock::time_point last_frame_;
    float flight_time_ = 0.0f;
    double last_report_ms_ = 0.0;
};

} // namespace quadsync::guest
