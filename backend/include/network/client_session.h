#pragma once

#include <asio.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

#include "network/connection.h"
#include "network/frame_codec.h"

/**
 * One accepted TCP client speaking length-prefixed JSON frames.
 *
 * The socket must be bound to a strand: every read, write and close runs on
 * it, and `send` from other threads is posted there.
 */
class ClientSession : public Connection,
                      public std::enable_shared_from_this<ClientSession> {
public:
    using MessageHandler = std::function<void(const ConnectionPtr&, const std::string&)>;
    using CloseHandler   = std::function<void(const ConnectionPtr&)>;

    /// A session whose unsent frames exceed `max_outbox_bytes` is closed.
    ClientSession(asio::ip::tcp::socket socket, std::size_t max_frame_bytes,
                  std::size_t max_outbox_bytes);

    /// Begin reading. `on_close` fires exactly once, whatever ends the session.
    void start(MessageHandler on_message, CloseHandler on_close);

    bool send(const std::string& frame) override;
    [[nodiscard]] bool is_open() const override { return open_.load(); }
    void close() override;
    [[nodiscard]] std::uint64_t id() const override { return id_; }
    [[nodiscard]] std::string remote_endpoint() const override { return remote_; }

private:
    void read_header();
    void read_body(std::uint32_t length);
    void write_next();
    void shutdown(const asio::error_code& ec);

    asio::ip::tcp::socket socket_;
    std::size_t max_frame_bytes_;
    std::size_t max_outbox_bytes_;
    std::uint64_t id_;
    std::string remote_;

    std::atomic<bool> open_{false};
    bool closed_{false};   // strand-confined

    frame_codec::Header header_{};
    std::string body_;
    std::deque<std::string> outbox_;
    std::atomic<std::size_t> outbox_bytes_{0};

    MessageHandler on_message_;
    CloseHandler on_close_;
};
