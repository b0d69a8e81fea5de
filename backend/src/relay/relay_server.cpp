/**
 * RelayServer — dispatch of client frames onto the relay state.
 *
 * Handles `register`, `sendMessage`, `getPublicKey` and `ping`. Unknown
 * kinds are logged and ignored. Undecodable frames get an `error` frame and
 * change nothing.
 */

#include "relay/relay_server.h"

#include <utility>

#include <spdlog/spdlog.h>

#include "relay/relay_error.h"

RelayServer::RelayServer(Clock clock, IdGenerator next_id)
    : clock_(std::move(clock)),
      directory_(clock_),
      router_(directory_, queue_, locks_, clock_, std::move(next_id)) {}

void RelayServer::on_connect(const ConnectionPtr& connection) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[connection->id()] = SessionContext{connection, {}, clock_()};
    }
    spdlog::info("New connection established: {}", connection->remote_endpoint());
}

void RelayServer::on_message(const ConnectionPtr& connection, const std::string& frame) {
    InboundMessage message;
    try {
        message = protocol::decode_inbound(frame);
    } catch (const ParseError& e) {
        spdlog::warn("Malformed frame from {}: {}", connection->remote_endpoint(), e.what());
        connection->send(protocol::error("Invalid message format"));
        return;
    }

    try {
        dispatch(connection, message);
    } catch (const RelayError& e) {
        spdlog::warn("Rejected '{}' from {}: {}", message.type, connection->remote_endpoint(),
                     e.what());
        connection->send(protocol::error(e.what()));
    }
}

void RelayServer::on_close(const ConnectionPtr& connection) {
    std::string account_id;
    std::chrono::system_clock::time_point connected_at = clock_();
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        const auto it = sessions_.find(connection->id());
        if (it != sessions_.end()) {
            account_id = std::move(it->second.account_id);
            connected_at = it->second.connected_at;
            sessions_.erase(it);
        }
    }
    const auto lifetime =
        std::chrono::duration_cast<std::chrono::seconds>(clock_() - connected_at);
    spdlog::info("Connection closed: {} after {}s", connection->remote_endpoint(),
                 lifetime.count());

    if (account_id.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(locks_.for_account(account_id));
    if (directory_.remove_connection(account_id, connection) == 0) {
        spdlog::info("User {} offline", account_id);
    }
}

nlohmann::json RelayServer::status() const {
    return nlohmann::json{
        {"status", "ok"},
        {"users", directory_.size()},
        {"timestamp", protocol::to_epoch_ms(clock_())},
    };
}

std::optional<std::string> RelayServer::bound_account(std::uint64_t connection_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    const auto it = sessions_.find(connection_id);
    if (it == sessions_.end() || it->second.account_id.empty()) {
        return std::nullopt;
    }
    return it->second.account_id;
}

std::size_t RelayServer::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void RelayServer::dispatch(const ConnectionPtr& connection, const InboundMessage& message) {
    switch (message.kind) {
        case InboundKind::register_account:
            handle_register(connection, message.body);
            break;
        case InboundKind::send_message:
            handle_send(connection, message.body);
            break;
        case InboundKind::get_public_key:
            handle_get_public_key(connection, message.body);
            break;
        case InboundKind::ping:
            connection->send(protocol::pong());
            break;
        case InboundKind::unknown:
            spdlog::warn("Unknown message type: '{}'", message.type);
            break;
    }
}

void RelayServer::handle_register(const ConnectionPtr& connection, const nlohmann::json& body) {
    const std::string account_id = protocol::string_field(body, "accountId");
    const nlohmann::json public_key = protocol::value_field(body, "publicKey");
    const std::string username = protocol::string_field(body, "username");
    if (account_id.empty() || !protocol::is_supplied(public_key)) {
        throw ValidationError("Missing accountId or publicKey");
    }

    // A handle belongs to one account at a time.
    const std::string previous = rebind(connection, account_id);
    if (!previous.empty() && previous != account_id) {
        std::lock_guard<std::mutex> lock(locks_.for_account(previous));
        directory_.remove_connection(previous, connection);
        spdlog::info("Connection {} moved from {} to {}", connection->remote_endpoint(),
                     previous, account_id);
    }

    std::lock_guard<std::mutex> lock(locks_.for_account(account_id));
    const std::size_t known = directory_.register_account(account_id, public_key, username,
                                                          connection);
    spdlog::info("User registered: {} ({})", account_id,
                 username.empty() ? "Anonymous" : username);
    connection->send(protocol::registered(account_id, known));
    router_.deliver_pending(account_id, connection);
}

void RelayServer::handle_send(const ConnectionPtr& connection, const nlohmann::json& body) {
    const RouteResult result = router_.route(protocol::string_field(body, "from"),
                                             protocol::string_field(body, "to"),
                                             protocol::value_field(body, "encryptedMessage"));
    connection->send(protocol::message_sent(result.message_id, result.status));
}

void RelayServer::handle_get_public_key(const ConnectionPtr& connection,
                                        const nlohmann::json& body) {
    const Account account = directory_.lookup(protocol::string_field(body, "accountId"));
    connection->send(protocol::public_key(account.id, account.public_key, account.username));
}

std::string RelayServer::rebind(const ConnectionPtr& connection, const std::string& account_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto& context = sessions_[connection->id()];
    if (!context.connection) {
        context.connection = connection;
        context.connected_at = clock_();
    }
    std::string previous = std::move(context.account_id);
    context.account_id = account_id;
    return previous;
}
