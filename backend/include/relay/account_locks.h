#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>

/**
 * Striped per-account mutexes.
 *
 * Register, route and disconnect for one account run under that account's
 * stripe so they never observe each other half-done. Two ids may share a
 * stripe; callers never hold more than one stripe at a time.
 */
class AccountLocks {
public:
    static constexpr std::size_t kStripes = 64;

    std::mutex& for_account(const std::string& account_id) {
        return stripes_[std::hash<std::string>{}(account_id) % kStripes];
    }

private:
    std::array<std::mutex, kStripes> stripes_;
};
