#pragma once

#include "serializable.hpp"
#include "message_type.hpp"
#include <cstdint>
#include <vector>

namespace quadsync::protocol {

struct PacketHeader : Serializable<PacketHeader> {
    MessageType type = MessageType::Disconnect;
    uint32_t payload_size = 0;

    static constexpr size_t serialized_size() { return sizeof(MessageType) + sizeof(uint32_t); }

    void serialize_impl(BufferWriter& w) const {
        w.write(static_cast<uint8_t>(type));
        w.write(payload_size);
    }

    void deserialize_impl(BufferReader& r) {
        type = static_cast<MessageType>(r.read<uint8_t>());
        payload_size = r.read<uint32_t>();
    }
};

// Upper bound on a single payload; anything larger is treated as a corrupt stream
constexpr uint32_t MAX_PAYLOAD_SIZE = 1u << 20;

// Build a ready-to-send packet: header (5 bytes) + payload
inline std::vector<uint8_t> build_packet(MessageType type, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> data;
    data.reserve(PacketHeader::serialized_size() + payload.size());
    BufferWriter w(data);
    PacketHeader hdr;
    hdr.type = type;
    hdr.payload_size = static_cast<uint32_t>(payload.size());
    hdr.serialize(w);
    w.write_bytes(payload.data(), payload.size());
    return data;
}

} // namespace quadsync::protocol
