#pragma once

#include "net/transport.hpp"
#include "protocol/packet.hpp"
#include <asio.hpp>
#include <array>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace quadsync::net {

// TCP link to the other peer. Everything runs on the io_context thread that
// also drives the frame loop, so no locking.
class PeerLink : public Transport, public std::enable_shared_from_this<PeerLink> {
public:
    using tcp = asio::ip::tcp;

    PeerLink(tcp::socket socket, size_t max_pending_writes);
    ~PeerLink() override;

    // Blocking connect used by the guest. Returns nullptr on failure.
    static std::shared_ptr<PeerLink> connect(asio::io_context& io_context, const std::string& host,
                                             uint16_t port, size_t max_pending_writes);

    void start();

    // Best-effort Disconnect message, then close. With a write in flight the
    // message is queued behind it and the close happens after the queue drains.
    void disconnect();
    void close();

    bool is_ready() const override { return open_ && !closing_ && socket_.is_open(); }
    bool send(protocol::MessageType type, const std::vector<uint8_t>& payload) override;

    void set_close_handler(std::function<void()> handler) { close_handler_ = std::move(handler); }

    uint64_t dropped_sends() const { return dropped_sends_; }

private:
    void read_header();
    void read_payload();
    void handle_packet();
    void do_write();

    tcp::socket socket_;
    size_t max_pending_writes_;
    bool open_ = false;
    std::function<void()> close_handler_;

    // Read buffer
    std::array<uint8_t, protocol::PacketHeader::serialized_size()> header_buffer_;
    std::vector<uint8_t> payload_buffer_;
    protocol::PacketHeader current_header_;

    // Write queue
    std::deque<std::vector<uint8_t>> write_queue_;
    bool writing_ = false;
    bool closing_ = false;
    uint64_t dropped_sends_ = 0;
};

} // namespace quadsync::net
