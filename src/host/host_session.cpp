#include "host_session.hpp"
#include "protocol/protocol.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace quadsync::host {

using namespace quadsync::protocol;

namespace {

constexpr uint32_t GUEST_PILOT_ID = 2;

} // namespace

HostSession::HostSession(World& world, const SyncConfig& config)
    : world_(world)
    , broadcaster_(config.broadcast())
    , guest_pilot_(config.pilot_interpolation()) {
}

void HostSession::attach(std::shared_ptr<net::Transport> transport) {
    transport_ = std::move(transport);
    transport_->set_message_callback([this](MessageType type, std::span<const uint8_t> payload) {
        handle_message(type, payload);
    });
    broadcaster_.set_transport(transport_);
    broadcaster_.reset();
    guest_pilot_.clear();
    std::cout << "[HostSession] Guest attached" << std::endl;
}

void HostSession::detach() {
    if (!transport_) {
        return;
    }
    transport_->set_message_callback(nullptr);
    transport_.reset();
    broadcaster_.set_transport(nullptr);
    guest_pilot_.clear();
    world_.set_pilot_active(ecs::PilotSlot::P2, false);
    std::cout << "[HostSession] Guest detached" << std::endl;
}

void HostSession::handle_message(MessageType type, std::span<const uint8_t> payload) {
    try {
        switch (type) {
            case MessageType::FireRequest:
                on_fire_request(payload);
                break;

            case MessageType::PilotPose:
                on_pilot_pose(payload);
                break;

            default:
                std::cout << "[HostSession] Unexpected message: " << to_string(type) << std::endl;
                break;
        }
    } catch (const std::out_of_range& e) {
        ++stats_.malformed_dropped;
        std::cerr << "[HostSession] Malformed " << to_string(type) << ": " << e.what() << std::endl;
    }
}

void HostSession::on_fire_request(std::span<const uint8_t> payload) {
    FireRequest request;
    request.deserialize(payload);

    // Same creation path as the host's own trigger
    auto id = world_.spawn_player_bullet(glm::vec2(request.x, request.y),
                                         glm::vec2(request.dir_x, request.dir_y),
                                         ecs::Shooter::Guest);
    if (!id) {
        ++stats_.fire_requests_rejected;
        std::cerr << "[HostSession] Rejected fire request with invalid origin or direction" << std::endl;
        return;
    }
    ++stats_.fire_requests_applied;
}

void HostSession::on_pilot_pose(std::span<const uint8_t> payload) {
    PilotPoseMsg pose;
    pose.deserialize(payload);

    if (!std::isfinite(pose.x) || !std::isfinite(pose.y) || !std::isfinite(pose.rotation)) {
        ++stats_.malformed_dropped;
        return;
    }

    ++stats_.poses_received;
    guest_pilot_.update_target(GUEST_PILOT_ID, pose.x, pose.y, pose.rotation);
    world_.set_pilot_active(ecs::PilotSlot::P2, pose.active);
}

void HostSession::update(const TickContext& ctx) {
    if (auto pose = guest_pilot_.get_position(GUEST_PILOT_ID, ctx.dt)) {
        world_.set_pilot(ecs::PilotSlot::P2, pose->position.x, pose->position.y,
                         pose->rotation.value_or(0.0f));
    }

    broadcaster_.tick(ctx.now_ms, world_.networked_entity_count(), [this](double now_ms) {
        return world_.capture_snapshot(now_ms);
    });
}

} // namespace quadsync::host
