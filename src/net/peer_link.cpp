#include "peer_link.hpp"
#include "protocol/protocol.hpp"
#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace quadsync::net {

using namespace quadsync::protocol;

PeerLink::PeerLink(tcp::socket socket, size_t max_pending_writes)
    : socket_(std::move(socket))
    , max_pending_writes_(max_pending_writes > 0 ? max_pending_writes : 1) {
}

PeerLink::~PeerLink() {
    asio::error_code ec;
    socket_.close(ec);
}

std::shared_ptr<PeerLink> PeerLink::connect(asio::io_context& io_context, const std::string& host,
                                            uint16_t port, size_t max_pending_writes) {
    try {
        tcp::resolver resolver(io_context);
        auto endpoints = resolver.resolve(host, std::to_string(port));

        tcp::socket socket(io_context);
        asio::connect(socket, endpoints);
        socket.set_option(tcp::no_delay(true));

        std::cout << "[PeerLink] Connected to host " << host << ":" << port << std::endl;
        return std::make_shared<PeerLink>(std::move(socket), max_pending_writes);
    } catch (const std::exception& e) {
        std::cerr << "[PeerLink] Connection failed: " << e.what() << std::endl;
        return nullptr;
    }
}

void PeerLink::start() {
    open_ = true;
    read_header();
}

bool PeerLink::send(MessageType type, const std::vector<uint8_t>& payload) {
    if (!is_ready()) {
        return false;
    }

    // A backed-up socket gets nothing new; the next frame carries fresher state
    if (write_queue_.size() >= max_pending_writes_) {
        ++dropped_sends_;
        return false;
    }

    write_queue_.push_back(build_packet(type, payload));
    if (!writing_) {
        writing_ = true;
        do_write();
    }
    return true;
}

void PeerLink::disconnect() {
    if (!is_ready()) {
        return;
    }

    // A frame may be half written; the goodbye goes behind it and the
    // socket closes once the queue drains
    if (writing_) {
        closing_ = true;
        write_queue_.push_back(build_packet(MessageType::Disconnect, {}));
        return;
    }

    auto data = build_packet(MessageType::Disconnect, {});
    asio::error_code ec;
    asio::write(socket_, asio::buffer(data), ec);
    close();
}

void PeerLink::close() {
    if (!open_) {
        return;
    }
    open_ = false;

    asio::error_code ec;
    socket_.close(ec);

    std::cout << "[PeerLink] Link closed" << std::endl;
    if (close_handler_) {
        close_handler_();
    }
}

void PeerLink::read_header() {
    auto self = shared_from_this();
    asio::async_read(socket_,
        asio::buffer(header_buffer_),
        [this, self](asio::error_code ec, std::size_t /*length*/) {
            if (ec) {
                if (open_) {
                    std::cout << "[PeerLink] Read error: " << ec.message() << std::endl;
                }
                close();
                return;
            }

            current_header_.deserialize(header_buffer_);
            if (current_header_.payload_size > MAX_PAYLOAD_SIZE) {
                std::cerr << "[PeerLink] Oversized payload (" << current_header_.payload_size
                          << " bytes), closing" << std::endl;
                close();
                return;
            }

            payload_buffer_.resize(current_header_.payload_size);
            if (current_header_.payload_size > 0) {
                read_payload();
            } else {
                handle_packet();
                if (open_) {
                    read_header();
                }
            }
        });
}

void PeerLink::read_payload() {
    auto self = shared_from_this();
    asio::async_read(socket_,
        asio::buffer(payload_buffer_),
        [this, self](asio::error_code ec, std::size_t /*length*/) {
            if (ec) {
                if (open_) {
                    std::cout << "[PeerLink] Payload read error: " << ec.message() << std::endl;
                }
                close();
                return;
            }

            handle_packet();
            if (open_) {
                read_header();
            }
        });
}

void PeerLink::handle_packet() {
    if (current_header_.type == MessageType::Disconnect) {
        std::cout << "[PeerLink] Peer disconnected" << std::endl;
        close();
        return;
    }
    dispatch(current_header_.type, payload_buffer_);
}

void PeerLink::do_write() {
    if (write_queue_.empty()) {
        writing_ = false;
        if (closing_) {
            close();
        }
        return;
    }

    auto self = shared_from_this();
    asio::async_write(socket_,
        asio::buffer(write_queue_.front()),
        [this, self](asio::error_code ec, std::size_t /*length*/) {
            if (ec) {
                if (open_) {
                    std::cout << "[PeerLink] Write error: " << ec.message() << std::endl;
                }
                close();
                return;
            }

            write_queue_.pop_front();
            do_write();
        });
}

} // namespace quadsync::net
