#pragma once

#include "protocol/buffer_reader.hpp"
#include "protocol/buffer_writer.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace quadsync::protocol {

// CRTP base for all wire messages.
// Derived must implement:
//   size_t serialized_size() const  (or static constexpr)
//   void serialize_impl(BufferWriter& w) const
//   void deserialize_impl(BufferReader& r)
template<typename Derived>
struct Serializable {
    void serialize(BufferWriter& w) const {
        static_cast<const Derived*>(this)->serialize_impl(w);
    }

    // Serialize into a freshly allocated payload
    std::vector<uint8_t> to_bytes() const {
        std::vector<uint8_t> data;
        data.reserve(static_cast<const Derived*>(this)->serialized_size());
        BufferWriter w(data);
        serialize(w);
        return data;
    }

    void deserialize(std::span<const uint8_t> data) {
        BufferReader r(data);
        static_cast<Derived*>(this)->deserialize_impl(r);
    }

    void deserialize(BufferReader& r) {
        static_cast<Derived*>(this)->deserialize_impl(r);
    }

    size_t size() const {
        return static_cast<const Derived*>(this)->serialized_size();
    }
};

} // namespace quadsync::protocol
