#pragma once

#include "serializable.hpp"

namespace quadsync::protocol {

// Guest -> Host: the guest pilot fired from (x, y) towards (dir_x, dir_y)
struct FireRequest : Serializable<FireRequest> {
    float x = 0.0f;
    float y = 0.0f;
    float dir_x = 1.0f;  // Normalized aim direction
    float dir_y = 0.0f;
    double timestamp_ms = 0.0;  // Guest clock

    static constexpr size_t serialized_size() {
        return sizeof(float) * 4 + sizeof(double);
    }

    void serialize_impl(BufferWriter& w) const {
        w.write(x); w.write(y);
        w.write(dir_x); w.write(dir_y);
        w.write(timestamp_ms);
    }

    void deserialize_impl(BufferReader& r) {
        x = r.read<float>(); y = r.read<float>();
        dir_x = r.read<float>(); dir_y = r.read<float>();
        timestamp_ms = r.read<double>();
    }
};

} // namespace quadsync::protocol
