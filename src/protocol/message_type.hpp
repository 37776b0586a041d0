#pragma once

#include <cstdint>

namespace quadsync::protocol {

enum class MessageType : uint8_t {
    Disconnect = 2,

    // Guest -> Host
    PilotPose = 3,      // Guest pilot position, throttled
    FireRequest = 4,    // Guest fired; host spawns the authoritative bullet

    // Host -> Guest
    Snapshot = 14,      // Full game-state snapshot
};

inline const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::Disconnect:  return "Disconnect";
        case MessageType::PilotPose:   return "PilotPose";
        case MessageType::FireRequest: return "FireRequest";
        case MessageType::Snapshot:    return "Snapshot";
    }
    return "Unknown";
}

} // namespace quadsync::protocol
