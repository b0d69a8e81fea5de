#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

#include "network/connection.h"

/**
 * Snapshot of one account record.
 *
 * `public_key` and `username` are fixed by the first registration; later
 * registrations only grow the connection set.
 */
struct Account {
    std::string id;
    nlohmann::json public_key;
    std::string username;
    std::chrono::system_clock::time_point registered_at;
    std::vector<ConnectionPtr> connections;

    /// True when at least one handle's transport is still open.
    [[nodiscard]] bool online() const;
};

/**
 * In-memory map of account ids to account records and their live sessions.
 *
 * Accounts are created lazily on first registration and never deleted.
 * Each call is atomic on its own; callers that need several calls to act as
 * one step hold the account's lock from AccountLocks around them.
 */
class AccountDirectory {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit AccountDirectory(Clock clock = std::chrono::system_clock::now);

    /// Create the account if unknown, then attach `connection` (idempotent).
    /// Throws ValidationError when the id or key is missing.
    /// Returns the number of known account ids.
    std::size_t register_account(const std::string& id,
                                 const nlohmann::json& public_key,
                                 const std::string& username,
                                 const ConnectionPtr& connection);

    /// Throws NotFoundError for an unknown id.
    [[nodiscard]] Account lookup(const std::string& id) const;

    [[nodiscard]] std::optional<Account> find(const std::string& id) const;

    /// Handles of `id` whose transport is currently open.
    [[nodiscard]] std::vector<ConnectionPtr> open_connections(const std::string& id) const;

    /// Detach `connection` if present. Returns the handles left on the account.
    std::size_t remove_connection(const std::string& id, const ConnectionPtr& connection);

    [[nodiscard]] bool is_online(const std::string& id) const;

    /// Number of known account ids, online or not.
    [[nodiscard]] std::size_t size() const;

private:
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Account> accounts_;
};
