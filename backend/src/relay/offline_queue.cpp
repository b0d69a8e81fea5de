/**
 * OfflineQueue — in-memory store-and-forward buffers.
 *
 * Nothing here survives a restart. A flush clears the buffer before the
 * caller writes the messages out, so a transport failure during that write
 * loses them.
 */

#include "relay/offline_queue.h"

#include <algorithm>
#include <iterator>
#include <utility>

void OfflineQueue::enqueue(const std::string& account_id, QueuedMessage message) {
    std::lock_guard<std::mutex> lock(mutex_);
    queues_[account_id].push_back(std::move(message));
}

std::vector<QueuedMessage> OfflineQueue::flush(const std::string& account_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = queues_.find(account_id);
    if (it == queues_.end()) {
        return {};
    }
    std::vector<QueuedMessage> out = std::move(it->second);
    queues_.erase(it);
    return out;
}

std::size_t OfflineQueue::evict_expired(std::chrono::system_clock::time_point now,
                                        std::chrono::seconds max_age) {
    std::size_t evicted = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = queues_.begin(); it != queues_.end();) {
        auto& messages = it->second;
        const auto keep_end = std::stable_partition(
            messages.begin(), messages.end(),
            [&](const QueuedMessage& m) { return now - m.timestamp < max_age; });
        evicted += static_cast<std::size_t>(std::distance(keep_end, messages.end()));
        messages.erase(keep_end, messages.end());

        if (messages.empty()) {
            it = queues_.erase(it);
        } else {
            ++it;
        }
    }
    return evicted;
}

std::vector<QueuedMessage> OfflineQueue::peek(const std::string& account_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = queues_.find(account_id);
    if (it == queues_.end()) {
        return {};
    }
    return it->second;
}

bool OfflineQueue::contains(const std::string& account_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queues_.count(account_id) != 0;
}

std::size_t OfflineQueue::account_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queues_.size();
}

std::size_t OfflineQueue::message_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& entry : queues_) {
        total += entry.second.size();
    }
    return total;
}
