/**
 * CleanupScheduler — hourly (by default) retention sweep over the offline queue.
 *
 * Timer operations are confined to one strand so start/stop are safe from
 * any thread while the io_context runs on a pool.
 */

#include "relay/cleanup_scheduler.h"

#include <utility>

#include <spdlog/spdlog.h>

CleanupScheduler::CleanupScheduler(asio::io_context& io,
                                   OfflineQueue& queue,
                                   std::chrono::seconds interval,
                                   std::chrono::seconds max_age,
                                   Clock clock)
    : strand_(asio::make_strand(io)),
      timer_(strand_),
      queue_(queue),
      interval_(interval),
      max_age_(max_age),
      clock_(std::move(clock)) {}

void CleanupScheduler::start() {
    asio::dispatch(strand_, [this] {
        if (running_) {
            return;
        }
        running_ = true;
        spdlog::info("Cleanup every {}s, retention {}s", interval_.count(), max_age_.count());
        schedule();
    });
}

void CleanupScheduler::stop() {
    asio::dispatch(strand_, [this] {
        running_ = false;
        timer_.cancel();
    });
}

std::size_t CleanupScheduler::run_once() {
    const std::size_t evicted = queue_.evict_expired(clock_(), max_age_);
    ++sweeps_;
    spdlog::info("Cleanup complete. Evicted {} message(s). Queued accounts: {}", evicted,
                 queue_.account_count());
    return evicted;
}

void CleanupScheduler::schedule() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted || !running_) {
            return;
        }
        run_once();
        schedule();
    });
}
