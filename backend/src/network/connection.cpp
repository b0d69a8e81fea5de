#include "network/connection.h"

#include <atomic>

std::uint64_t Connection::next_id() {
    static std::atomic<std::uint64_t> counter{0};
    return ++counter;
}
