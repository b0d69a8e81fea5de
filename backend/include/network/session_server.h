#pragma once

#include <asio.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "network/client_session.h"
#include "network/connection.h"

/**
 * Async TCP server that accepts relay clients.
 *
 * Each accepted socket gets its own strand and ClientSession; session
 * events are forwarded through the callbacks below.
 */
class SessionServer {
public:
    using OpenCallback    = std::function<void(const ConnectionPtr&)>;
    using MessageCallback = std::function<void(const ConnectionPtr& connection,
                                               const std::string& payload)>;
    using CloseCallback   = std::function<void(const ConnectionPtr&)>;

    /// Binds immediately; throws asio::system_error when the address is unusable.
    SessionServer(asio::io_context& io,
                  const std::string& bind_address,
                  uint16_t port,
                  std::size_t max_frame_bytes,
                  std::size_t max_outbox_bytes);

    void start();

    /// Stop accepting and close every live session.
    void stop();

    void set_on_open(OpenCallback cb);
    void set_on_message(MessageCallback cb);
    void set_on_close(CloseCallback cb);

    /// Bound port (useful when constructed with port 0).
    [[nodiscard]] uint16_t local_port() const { return port_; }

    [[nodiscard]] std::size_t live_sessions() const;

private:
    void do_accept();
    void forget(std::uint64_t session_id);

    asio::io_context& io_;
    asio::ip::tcp::acceptor acceptor_;
    uint16_t port_;
    std::size_t max_frame_bytes_;
    std::size_t max_outbox_bytes_;

    OpenCallback on_open_;
    MessageCallback on_message_;
    CloseCallback on_close_;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::uint64_t, std::weak_ptr<ClientSession>> sessions_;
};
