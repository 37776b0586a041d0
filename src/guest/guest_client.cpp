#include "guest_client.hpp"
#include "sync/tick_context.hpp"
#include <cmath>
#include <iostream>

namespace quadsync::guest {

namespace {

constexpr double REPORT_INTERVAL_MS = 5000.0;

} // namespace

GuestClient::GuestClient(asio::io_context& io_context, const SyncConfig& config)
    : io_context_(io_context)
    , config_(config)
    , session_(config)
    , frame_timer_(io_context)
    , last_frame_(std::chrono::steady_clock::now()) {
}

GuestClient::~GuestClient() {
    stop();
}

bool GuestClient::connect(const std::string& host, uint16_t port) {
    link_ = net::PeerLink::connect(io_context_, host, port, config_.network().max_pending_writes);
    if (!link_) {
        return false;
    }

    link_->set_close_handler([this]() {
        std::cout << "[GuestClient] Host went away" << std::endl;
        asio::post(io_context_, [this]() { stop(); });
    });
    session_.attach(link_);
    link_->start();
    return true;
}

void GuestClient::start() {
    running_ = true;
    last_frame_ = std::chrono::steady_clock::now();
    frame();
}

void GuestClient::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    frame_timer_.cancel();

    if (link_) {
        link_->set_close_handler(nullptr);
        link_->disconnect();
    }
    session_.detach();
    session_.stop();
    link_.reset();
}

void GuestClient::frame() {
    if (!running_) return;

    auto now = std::chrono::steady_clock::now();
    float dt = std::chrono::duration<float>(now - last_frame_).count();
    last_frame_ = now;

    TickContext ctx{wall_clock_ms(), dt};

    fly_local_pilot(ctx);
    session_.update(ctx);
    report(ctx.now_ms);

    frame_timer_.expires_after(std::chrono::milliseconds(
        static_cast<int>(config_.network().frame_interval_ms)));
    frame_timer_.async_wait([this](asio::error_code ec) {
        if (!ec && running_) {
            frame();
        }
    });
}

void GuestClient::fly_local_pilot(const TickContext& ctx) {
    const auto& world = config_.world();
    flight_time_ += ctx.dt;

    // Figure eight on the right half of the arena
    float x = world.width * 0.7f + std::sin(flight_time_ * 0.6f) * 160.0f;
    float y = world.height * 0.5f + std::sin(flight_time_ * 1.2f) * 120.0f;

    glm::vec2 aim(-1.0f, 0.0f);
    float best = -1.0f;
    auto view = session_.registry().view<ecs::EnemyTag, ecs::Transform>();
    for (auto entity : view) {
        const auto& t = view.get<ecs::Transform>(entity);
        glm::vec2 to_enemy(t.x - x, t.y - y);
        float d = glm::length(to_enemy);
        if (d > 0.0f && (best < 0.0f || d < best)) {
            best = d;
            aim = to_enemy / d;
        }
    }

    float rotation = std::atan2(aim.y, aim.x);
    session_.send_pose(x, y, rotation, true, ctx.now_ms);

    if (best > 0.0f) {
        session_.fire(x, y, aim.x, aim.y, ctx.now_ms);
    }
}

void GuestClient::report(double now_ms) {
    if (now_ms - last_report_ms_ < REPORT_INTERVAL_MS) {
        return;
    }
    last_report_ms_ = now_ms;

    const auto& stats = session_.stats();
    const auto& run = session_.run_state();
    std::cout << "[GuestClient] wave " << run.wave
              << " score " << run.score
              << " enemies " << session_.enemy_count()
              << " | snapshots " << stats.snapshots_applied
              << " stale " << stats.stale_dropped
              << " | shots " << stats.shots_fired
              << " reconciled " << stats.shots_reconciled
              << " expired " << stats.shots_expired
              << " | latency " << session_.latency().average_ms() << "ms"
              << " jitter " << session_.latency().jitter_ms() << "ms"
              << " | dropped sends " << (link_ ? link_->dropped_sends() : 0) << std::endl;
}

} // namespace quadsync::guest
