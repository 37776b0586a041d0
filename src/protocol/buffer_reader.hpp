#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace quadsync::protocol {

// Bounds-checked reader over a received payload. Every read past the end
// throws std::out_of_range; callers drop the whole message in that case.
class BufferReader {
    std::span<const uint8_t> data_;
    size_t offset_ = 0;

    void check_bounds(size_t n) const {
        if (n > data_.size() - offset_) {
            throw std::out_of_range("BufferReader: read past end of buffer");
        }
    }

public:
    BufferReader(std::span<const uint8_t> data) : data_(data) {}

    template<typename T>
    T read() {
        check_bounds(sizeof(T));
        T val;
        std::memcpy(&val, data_.data() + offset_, sizeof(T));
        offset_ += sizeof(T);
        return val;
    }

    bool read_bool() { return read<uint8_t>() != 0; }

    std::string read_string() {
        uint16_t len = read<uint16_t>();
        check_bounds(len);
        std::string str(reinterpret_cast<const char*>(data_.data() + offset_), len);
        offset_ += len;
        return str;
    }

    template<typename T>
    std::optional<T> read_optional() {
        if (!read_bool()) {
            return std::nullopt;
        }
        return read<T>();
    }

    // Length-prefixed array of Serializable items
    template<typename T>
    std::vector<T> read_array() {
        uint16_t count = read<uint16_t>();
        std::vector<T> items;
        items.reserve(std::min<size_t>(count, remaining_size()));
        for (uint16_t i = 0; i < count; ++i) {
            T item;
            item.deserialize(*this);
            items.push_back(std::move(item));
        }
        return items;
    }

    size_t offset() const { return offset_; }
    size_t remaining_size() const { return data_.size() - offset_; }
};

} // namespace quadsync::protocol
