#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace quadsync::protocol {

// Appends wire fields to the end of a byte vector, growing it as needed.
// Strings and arrays carry a uint16_t length; anything longer throws
// std::length_error rather than being silently truncated.
class BufferWriter {
    std::vector<uint8_t>& buf_;

    uint8_t* grow(size_t n) {
        size_t at = buf_.size();
        buf_.resize(at + n);
        return buf_.data() + at;
    }

public:
    explicit BufferWriter(std::vector<uint8_t>& buf) : buf_(buf) {}

    template<typename T>
    void write(const T& val) {
        std::memcpy(grow(sizeof(T)), &val, sizeof(T));
    }

    void write_bool(bool val) { write<uint8_t>(val ? 1 : 0); }

    void write_bytes(const void* src, size_t len) {
        if (len == 0) {
            return;
        }
        std::memcpy(grow(len), src, len);
    }

    // uint16_t length + raw bytes, no terminator
    void write_string(const std::string& str) {
        if (str.size() > UINT16_MAX) {
            throw std::length_error("BufferWriter: string too long");
        }
        write<uint16_t>(static_cast<uint16_t>(str.size()));
        write_bytes(str.data(), str.size());
    }

    // Presence byte, then the value when present
    template<typename T>
    void write_optional(const std::optional<T>& val) {
        write_bool(val.has_value());
        if (val) {
            write(*val);
        }
    }

    template<typename T>
    void write_array(const std::vector<T>& items) {
        if (items.size() > UINT16_MAX) {
            throw std::length_error("BufferWriter: array too long");
        }
        write<uint16_t>(static_cast<uint16_t>(items.size()));
        for (const auto& item : items) {
            item.serialize(*this);
        }
    }

    size_t size() const { return buf_.size(); }
};

} // namespace quadsync::protocol
