#include <chrono>
#include <iostream>
#include <string>

#include "relay/offline_queue.h"

namespace {

#define FAIL()                                                      \
  do {                                                              \
    std::cerr << "offline_queue_test failed at " << __FILE__ << ":" \
              << __LINE__ << "\n";                                  \
    return 1;                                                       \
  } while (false)

using std::chrono::hours;
using std::chrono::system_clock;

QueuedMessage make_message(const std::string& id, system_clock::time_point at) {
    return QueuedMessage{id, "alice", "cipher-" + id, at};
}

}  // namespace

int main() {
    const auto now = system_clock::now();
    const auto day = hours(24);

    {
        OfflineQueue queue;
        queue.enqueue("bob", make_message("m1", now));
        queue.enqueue("bob", make_message("m2", now));
        queue.enqueue("bob", make_message("m3", now));
        queue.enqueue("carol", make_message("c1", now));
        if (queue.account_count() != 2 || queue.message_count() != 4) {
            FAIL();
        }

        // Flush returns insertion order and clears the key entirely.
        const auto flushed = queue.flush("bob");
        if (flushed.size() != 3 || flushed[0].id != "m1" || flushed[1].id != "m2" ||
            flushed[2].id != "m3") {
            FAIL();
        }
        if (flushed[0].encrypted_payload != "cipher-m1") {
            FAIL();
        }
        if (queue.contains("bob") || !queue.flush("bob").empty()) {
            FAIL();
        }
        if (queue.account_count() != 1 || queue.message_count() != 1) {
            FAIL();
        }
        if (!queue.flush("nobody").empty()) {
            FAIL();
        }
    }

    {
        // Ages {0, 6d, 8d}: only the first two survive a 7 day window.
        OfflineQueue queue;
        queue.enqueue("bob", make_message("fresh", now));
        queue.enqueue("bob", make_message("six-days", now - 6 * day));
        queue.enqueue("bob", make_message("eight-days", now - 8 * day));
        const auto evicted = queue.evict_expired(now, 7 * day);
        if (evicted != 1) {
            FAIL();
        }
        const auto left = queue.peek("bob");
        if (left.size() != 2 || left[0].id != "fresh" || left[1].id != "six-days") {
            FAIL();
        }
    }

    {
        // An account whose messages all expire disappears from the map.
        OfflineQueue queue;
        queue.enqueue("bob", make_message("old-1", now - 8 * day));
        queue.enqueue("bob", make_message("old-2", now - 9 * day));
        queue.enqueue("carol", make_message("new", now));
        if (queue.evict_expired(now, 7 * day) != 2) {
            FAIL();
        }
        if (queue.contains("bob") || !queue.contains("carol") || queue.account_count() != 1) {
            FAIL();
        }
    }

    {
        // Exactly at the window boundary counts as expired.
        OfflineQueue queue;
        queue.enqueue("bob", make_message("edge", now - 7 * day));
        if (queue.evict_expired(now, 7 * day) != 1 || queue.contains("bob")) {
            FAIL();
        }
    }

    std::cout << "offline_queue_test passed\n";
    return 0;
}
