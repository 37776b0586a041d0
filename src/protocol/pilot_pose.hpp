#pragma once

#include "serializable.hpp"

namespace quadsync::protocol {

// Guest -> Host: where the guest is flying its own pilot
struct PilotPoseMsg : Serializable<PilotPoseMsg> {
    float x = 0.0f;
    float y = 0.0f;
    float rotation = 0.0f;
    bool active = true;
    double timestamp_ms = 0.0;  // Guest clock

    static constexpr size_t serialized_size() {
        return sizeof(float) * 3 + sizeof(uint8_t) + sizeof(double);
    }

    void serialize_impl(BufferWriter& w) const {
        w.write(x); w.write(y);
        w.write(rotation);
        w.write_bool(active);
        w.write(timestamp_ms);
    }

    void deserialize_impl(BufferReader& r) {
        x = r.read<float>(); y = r.read<float>();
        rotation = r.read<float>();
        active = r.read_bool();
        timestamp_ms = r.read<double>();
    }
};

} // namespace quadsync::protocol
