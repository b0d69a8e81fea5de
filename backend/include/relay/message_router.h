#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

#include "network/connection.h"
#include "relay/account_directory.h"
#include "relay/account_locks.h"
#include "relay/offline_queue.h"
#include "relay/protocol.h"

struct RouteResult {
    std::string message_id;
    DeliveryStatus status{DeliveryStatus::queued};
    std::size_t deliveries{0};   // open sessions the packet was handed to
};

/**
 * Decides per send whether to fan a message out live or park it offline.
 *
 * "Delivered" means handed to at least one open transport, not read by the
 * recipient. An unknown recipient is not an error: the message waits for a
 * registration that may come later.
 */
class MessageRouter {
public:
    using Clock       = std::function<std::chrono::system_clock::time_point()>;
    using IdGenerator = std::function<std::string()>;

    MessageRouter(AccountDirectory& directory,
                  OfflineQueue& queue,
                  AccountLocks& locks,
                  Clock clock = std::chrono::system_clock::now,
                  IdGenerator next_id = {});

    /// Throws ValidationError when `from`, `to` or the payload is missing.
    RouteResult route(const std::string& from,
                      const std::string& to,
                      const nlohmann::json& encrypted_payload);

    /// Write everything queued for `account_id` to `connection`, oldest first.
    /// The caller must hold the account's lock. Returns the number flushed.
    std::size_t deliver_pending(const std::string& account_id,
                                const ConnectionPtr& connection);

private:
    AccountDirectory& directory_;
    OfflineQueue& queue_;
    AccountLocks& locks_;
    Clock clock_;
    IdGenerator next_id_;
};
