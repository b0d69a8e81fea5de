/**
 * MessageRouter — live fan-out or offline queueing for each send.
 */

#include "relay/message_router.h"

#include <mutex>
#include <utility>

#include <spdlog/spdlog.h>

#include "crypto/secure_random.h"
#include "relay/relay_error.h"

MessageRouter::MessageRouter(AccountDirectory& directory,
                             OfflineQueue& queue,
                             AccountLocks& locks,
                             Clock clock,
                             IdGenerator next_id)
    : directory_(directory),
      queue_(queue),
      locks_(locks),
      clock_(std::move(clock)),
      next_id_(std::move(next_id)) {
    if (!next_id_) {
        next_id_ = [] { return SecureRandom::hex_token(); };
    }
}

RouteResult MessageRouter::route(const std::string& from,
                                 const std::string& to,
                                 const nlohmann::json& encrypted_payload) {
    if (from.empty() || to.empty() || !protocol::is_supplied(encrypted_payload)) {
        throw ValidationError("Invalid message structure");
    }

    QueuedMessage packet{next_id_(), from, encrypted_payload, clock_()};
    RouteResult result;
    result.message_id = packet.id;

    std::lock_guard<std::mutex> lock(locks_.for_account(to));

    const auto recipients = directory_.open_connections(to);
    if (!recipients.empty()) {
        const std::string frame = protocol::new_message(
            packet.from, packet.encrypted_payload, packet.timestamp, packet.id);
        for (const auto& connection : recipients) {
            if (connection->send(frame)) {
                ++result.deliveries;
            }
        }
    }

    if (result.deliveries > 0) {
        result.status = DeliveryStatus::delivered;
        spdlog::info("Message delivered: {} -> {}", from, to);
        spdlog::debug("Message {} fanned out to {} session(s)", result.message_id,
                      result.deliveries);
        return result;
    }

    queue_.enqueue(to, std::move(packet));
    result.status = DeliveryStatus::queued;
    spdlog::info("Message queued: {} -> {}", from, to);
    return result;
}

std::size_t MessageRouter::deliver_pending(const std::string& account_id,
                                           const ConnectionPtr& connection) {
    const auto pending = queue_.flush(account_id);
    for (const auto& message : pending) {
        // No retry: once flushed, a failed write loses the message.
        if (!connection->send(protocol::new_message(message.from, message.encrypted_payload,
                                                    message.timestamp, message.id))) {
            spdlog::warn("Queued message {} for {} dropped: session closed during flush",
                         message.id, account_id);
        }
    }
    if (!pending.empty()) {
        spdlog::debug("Flushed {} queued message(s) to {}", pending.size(), account_id);
    }
    return pending.size();
}
