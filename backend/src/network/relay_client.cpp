/**
 * RelayClient — Connects to a relay and exchanges frames synchronously.
 *
 * Each operation is an async asio call driven by `run()`, which bounds it
 * with a deadline.
 */

#include "network/relay_client.h"

#include <string>

#include <spdlog/spdlog.h>

#include "network/frame_codec.h"

RelayClient::RelayClient() : socket_(io_) {}

bool RelayClient::connect(const std::string& host, uint16_t port,
                          std::chrono::milliseconds timeout) {
    asio::error_code ec;
    asio::ip::tcp::resolver resolver(io_);
    const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        spdlog::warn("Cannot resolve {}: {}", host, ec.message());
        return false;
    }

    ec = asio::error::would_block;
    asio::async_connect(socket_, endpoints,
                        [&](const asio::error_code& result, const asio::ip::tcp::endpoint&) {
                            ec = result;
                        });
    run(timeout);
    if (ec) {
        spdlog::warn("Connect to {}:{} failed: {}", host, port, ec.message());
        disconnect();
        return false;
    }
    return true;
}

bool RelayClient::send(const std::string& json_payload, std::chrono::milliseconds timeout) {
    if (!socket_.is_open()) {
        return false;
    }
    const std::string frame = frame_codec::encode(json_payload);
    asio::error_code ec = asio::error::would_block;
    asio::async_write(socket_, asio::buffer(frame),
                      [&](const asio::error_code& result, std::size_t) { ec = result; });
    run(timeout);
    return !ec;
}

std::optional<std::string> RelayClient::receive(std::chrono::milliseconds timeout) {
    if (!socket_.is_open()) {
        return std::nullopt;
    }
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto remaining = [&] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
    };

    frame_codec::Header header{};
    asio::error_code ec = asio::error::would_block;
    asio::async_read(socket_, asio::buffer(header),
                     [&](const asio::error_code& result, std::size_t) { ec = result; });
    run(remaining());
    if (ec) {
        return std::nullopt;
    }

    std::string body(frame_codec::decode_header(header), '\0');
    if (body.empty()) {
        return body;
    }
    ec = asio::error::would_block;
    asio::async_read(socket_, asio::buffer(body),
                     [&](const asio::error_code& result, std::size_t) { ec = result; });
    run(remaining());
    if (ec) {
        return std::nullopt;
    }
    return body;
}

void RelayClient::disconnect() {
    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

void RelayClient::run(std::chrono::milliseconds timeout) {
    io_.restart();
    io_.run_for(timeout.count() > 0 ? timeout : std::chrono::milliseconds(1));
    if (!io_.stopped()) {
        // Deadline hit: abort the pending operation and let its handler run.
        asio::error_code ignored;
        socket_.close(ignored);
        io_.run();
    }
}
