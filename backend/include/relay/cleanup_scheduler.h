#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

#include "relay/offline_queue.h"

/**
 * Periodic sweep that evicts queued messages older than the retention window.
 *
 * Touches only the OfflineQueue; account records and live sessions are never
 * affected.
 */
class CleanupScheduler {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    CleanupScheduler(asio::io_context& io,
                     OfflineQueue& queue,
                     std::chrono::seconds interval,
                     std::chrono::seconds max_age,
                     Clock clock = std::chrono::system_clock::now);

    /// Arm the timer; the first sweep runs one interval from now.
    void start();
    void stop();

    /// Sweep immediately at the current clock time. Returns messages evicted.
    std::size_t run_once();

    [[nodiscard]] std::uint64_t sweep_count() const { return sweeps_.load(); }
    [[nodiscard]] std::chrono::seconds interval() const { return interval_; }
    [[nodiscard]] std::chrono::seconds max_age() const { return max_age_; }

private:
    void schedule();

    asio::strand<asio::io_context::executor_type> strand_;
    asio::steady_timer timer_;
    OfflineQueue& queue_;
    std::chrono::seconds interval_;
    std::chrono::seconds max_age_;
    Clock clock_;
    bool running_{false};   // strand-confined
    std::atomic<std::uint64_t> sweeps_{0};
};
