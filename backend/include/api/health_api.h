#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

/**
 * Minimal HTTP status probe for load balancers and uptime checks.
 *
 * `GET /health` returns the relay's status document; anything else is 404.
 * Read-only: it never touches relay state beyond the provider call.
 */
class HealthApi {
public:
    using StatusProvider = std::function<nlohmann::json()>;

    /// A client that has not been answered within `request_timeout` is dropped.
    HealthApi(asio::io_context& io, const std::string& bind_address, uint16_t port,
              StatusProvider status,
              std::chrono::steady_clock::duration request_timeout = std::chrono::seconds(5));

    void start();
    void stop();

    /// Full HTTP response for one request line, e.g. "GET /health HTTP/1.1".
    [[nodiscard]] std::string respond(const std::string& request_line) const;

    [[nodiscard]] uint16_t local_port() const { return port_; }

private:
    void do_accept();
    void handle_request(asio::ip::tcp::socket socket);

    asio::ip::tcp::acceptor acceptor_;
    uint16_t port_;
    StatusProvider status_;
    std::chrono::steady_clock::duration request_timeout_;
};
