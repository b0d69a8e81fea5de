#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

#include "network/connection.h"
#include "relay/account_directory.h"
#include "relay/account_locks.h"
#include "relay/message_router.h"
#include "relay/offline_queue.h"
#include "relay/protocol.h"

/**
 * Per-connection state kept by the relay, not by the transport.
 */
struct SessionContext {
    ConnectionPtr connection;
    std::string account_id;   // set by the most recent successful register
    std::chrono::system_clock::time_point connected_at;
};

/**
 * Owns the relay state and binds it to transport events.
 *
 * Transport-agnostic: the network layer (or a test) reports connect, frame
 * and close events and the relay answers through the Connection handles.
 * Several instances can coexist in one process.
 */
class RelayServer {
public:
    using Clock       = std::function<std::chrono::system_clock::time_point()>;
    using IdGenerator = MessageRouter::IdGenerator;

    explicit RelayServer(Clock clock = std::chrono::system_clock::now,
                         IdGenerator next_id = {});

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    void on_connect(const ConnectionPtr& connection);

    /// Decode and dispatch one inbound frame. Never throws for bad client input.
    void on_message(const ConnectionPtr& connection, const std::string& frame);

    /// Detach the connection from the account it was registered under.
    void on_close(const ConnectionPtr& connection);

    /// Health document: `{status, users, timestamp}`.
    [[nodiscard]] nlohmann::json status() const;

    /// Account bound to a live session, if it has registered.
    [[nodiscard]] std::optional<std::string> bound_account(std::uint64_t connection_id) const;

    [[nodiscard]] std::size_t session_count() const;

    [[nodiscard]] AccountDirectory& directory() { return directory_; }
    [[nodiscard]] const AccountDirectory& directory() const { return directory_; }
    [[nodiscard]] OfflineQueue& queue() { return queue_; }
    [[nodiscard]] const OfflineQueue& queue() const { return queue_; }

private:
    void dispatch(const ConnectionPtr& connection, const InboundMessage& message);
    void handle_register(const ConnectionPtr& connection, const nlohmann::json& body);
    void handle_send(const ConnectionPtr& connection, const nlohmann::json& body);
    void handle_get_public_key(const ConnectionPtr& connection, const nlohmann::json& body);

    /// Swap the session's bound account; returns the previous one.
    std::string rebind(const ConnectionPtr& connection, const std::string& account_id);

    Clock clock_;
    AccountDirectory directory_;
    OfflineQueue queue_;
    AccountLocks locks_;
    MessageRouter router_;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::uint64_t, SessionContext> sessions_;
};
