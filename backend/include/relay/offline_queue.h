#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * A message waiting for its recipient to come online. Immutable once queued.
 */
struct QueuedMessage {
    std::string id;
    std::string from;
    nlohmann::json encrypted_payload;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * Per-account FIFO buffers of undelivered messages.
 *
 * An account with nothing queued has no entry at all. Every operation runs
 * under one mutex, so an eviction sweep never interleaves with an enqueue or
 * a flush.
 */
class OfflineQueue {
public:
    void enqueue(const std::string& account_id, QueuedMessage message);

    /// Remove and return everything queued for `account_id`, oldest first.
    std::vector<QueuedMessage> flush(const std::string& account_id);

    /// Drop messages with `now - timestamp >= max_age`. Returns how many were dropped.
    std::size_t evict_expired(std::chrono::system_clock::time_point now,
                              std::chrono::seconds max_age);

    /// Copy of the pending messages for `account_id`, oldest first.
    [[nodiscard]] std::vector<QueuedMessage> peek(const std::string& account_id) const;

    [[nodiscard]] bool contains(const std::string& account_id) const;

    /// Accounts with at least one pending message.
    [[nodiscard]] std::size_t account_count() const;

    [[nodiscard]] std::size_t message_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<QueuedMessage>> queues_;
};
