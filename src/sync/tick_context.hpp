#pragma once

#include <chrono>

namespace quadsync {

// Per-frame timing handed to every sync call instead of ambient frame state
struct TickContext {
    double now_ms = 0.0;  // Wall clock, comparable across the two peers
    float dt = 0.0f;      // Seconds since the previous frame
};

inline double wall_clock_ms() {
    using namespace std::chrono;
    return duration<double, std::milli>(system_clock::now().time_since_epoch()).count();
}

} // namespace quadsync
