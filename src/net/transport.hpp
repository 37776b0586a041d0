#pragma once

#include "protocol/message_type.hpp"
#include <cstdint>
#include <functional>
#include <span>
#include <utility>
#include <vector>

namespace quadsync::net {

// Whatever carries framed messages between the two peers. Sends are
// fire-and-forget; received messages are delivered through the callback on the
// thread that drives the transport.
class Transport {
public:
    using MessageCallback = std::function<void(protocol::MessageType, std::span<const uint8_t>)>;

    virtual ~Transport() = default;

    virtual bool is_ready() const = 0;

    // Returns false if the message was not handed to the wire
    virtual bool send(protocol::MessageType type, const std::vector<uint8_t>& payload) = 0;

    template<typename Msg>
    bool send_message(protocol::MessageType type, const Msg& msg) {
        return send(type, msg.to_bytes());
    }

    void set_message_callback(MessageCallback callback) { message_callback_ = std::move(callback); }

protected:
    void dispatch(protocol::MessageType type, std::span<const uint8_t> payload) {
        if (message_callback_) {
            message_callback_(type, payload);
        }
    }

private:
    MessageCallback message_callback_;
};

} // namespace quadsync::net
