#include "host_server.hpp"
#include "sync/tick_context.hpp"
#include <iostream>
#include <random>
#include <utility>

namespace quadsync::host {

HostServer::HostServer(asio::io_context& io_context, uint16_t port, const SyncConfig& config)
    : io_context_(io_context)
    , acceptor_(io_context, tcp::endpoint(tcp::v4(), port))
    , config_(config)
    , world_(config.world())
    , session_(world_, config)
    , director_(world_, std::random_device{}())
    , tick_timer_(io_context)
    , last_tick_(std::chrono::steady_clock::now()) {
}

HostServer::~HostServer() {
    stop();
}

void HostServer::start() {
    running_ = true;
    director_.start();
    accept();
    game_loop();
    std::cout << "[HostServer] Listening on port " << acceptor_.local_endpoint().port() << std::endl;
}

void HostServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    tick_timer_.cancel();

    asio::error_code ec;
    acceptor_.close(ec);

    if (guest_) {
        guest_->disconnect();
        guest_.reset();
    }
    session_.detach();
}

void HostServer::accept() {
    acceptor_.async_accept(
        [this](asio::error_code ec, tcp::socket socket) {
            if (!ec) {
                if (guest_ && guest_->is_ready()) {
                    std::cout << "[HostServer] Rejecting connection, a guest is already playing" << std::endl;
                    socket.close(ec);
                } else {
                    std::cout << "[HostServer] Guest connected from "
                              << socket.remote_endpoint(ec).address().to_string() << std::endl;
                    socket.set_option(tcp::no_delay(true), ec);

                    guest_ = std::make_shared<net::PeerLink>(std::move(socket),
                                                             config_.network().max_pending_writes);
                    guest_->set_close_handler([this]() { session_.detach(); });
                    session_.attach(guest_);
                    guest_->start();
                }
            }

            if (running_) {
                accept();
            }
        });
}

void HostServer::game_loop() {
    if (!running_) return;

    auto now = std::chrono::steady_clock::now();
    float dt = std::chrono::duration<float>(now - last_tick_).count();
    last_tick_ = now;

    TickContext ctx{wall_clock_ms(), dt};

    director_.update(ctx);
    world_.update(dt);
    session_.update(ctx);

    // The link is done once its peer hung up
    if (guest_ && !guest_->is_ready()) {
        guest_.reset();
    }

    tick_timer_.expires_after(std::chrono::milliseconds(
        static_cast<int>(config_.network().frame_interval_ms)));
    tick_timer_.async_wait([this](asio::error_code ec) {
        if (!ec && running_) {
            game_loop();
        }
    });
}

} // namespace quadsync::host
