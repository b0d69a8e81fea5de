#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

/**
 * Blocking TCP client for a relay, speaking the same length-prefixed frames.
 *
 * Every call runs its own private io_context for at most `timeout`; on
 * timeout the socket is closed and the client must reconnect.
 */
class RelayClient {
public:
    RelayClient();

    bool connect(const std::string& host, uint16_t port,
                 std::chrono::milliseconds timeout = std::chrono::seconds(5));

    bool send(const std::string& json_payload,
              std::chrono::milliseconds timeout = std::chrono::seconds(5));

    /// Next inbound frame, or nullopt on timeout, EOF or transport error.
    std::optional<std::string> receive(std::chrono::milliseconds timeout = std::chrono::seconds(5));

    void disconnect();

    [[nodiscard]] bool connected() const { return socket_.is_open(); }

private:
    void run(std::chrono::milliseconds timeout);

    asio::io_context io_;
    asio::ip::tcp::socket socket_;
};
