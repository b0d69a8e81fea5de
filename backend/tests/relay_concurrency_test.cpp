#include <atomic>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "fake_connection.h"
#include "relay/relay_server.h"

namespace {

#define FAIL()                                                          \
  do {                                                                  \
    std::cerr << "relay_concurrency_test failed at " << __FILE__ << ":" \
              << __LINE__ << "\n";                                      \
    return 1;                                                           \
  } while (false)

using json = nlohmann::json;

constexpr int kSenders = 4;
constexpr int kMessagesPerSender = 400;
constexpr int kReconnects = 150;

std::string register_frame(const std::string& id) {
    return json{{"type", "register"}, {"accountId", id}, {"publicKey", "pk-" + id}}.dump();
}

std::string send_frame(const std::string& from, const std::string& to, int n) {
    return json{{"type", "sendMessage"}, {"from", from}, {"to", to},
                {"encryptedMessage", from + "#" + std::to_string(n)}}.dump();
}

}  // namespace

int main() {
    auto counter = std::make_shared<std::atomic<int>>(0);
    RelayServer relay(std::chrono::system_clock::now,
                      [counter] { return "m-" + std::to_string(++*counter); });

    std::vector<std::shared_ptr<FakeConnection>> senders;
    for (int i = 0; i < kSenders; ++i) {
        auto c = make_fake_connection();
        relay.on_connect(c);
        relay.on_message(c, register_frame("sender-" + std::to_string(i)));
        senders.push_back(c);
    }

    // bob keeps reconnecting while messages for him are in flight, and the
    // retention sweep runs alongside.
    std::vector<std::shared_ptr<FakeConnection>> bob_sessions;
    std::atomic<bool> churning{true};
    std::thread churn([&] {
        for (int i = 0; i < kReconnects; ++i) {
            auto c = make_fake_connection();
            bob_sessions.push_back(c);
            relay.on_connect(c);
            relay.on_message(c, register_frame("bob"));
            std::this_thread::yield();
            c->close();
            relay.on_close(c);
        }
        churning = false;
    });
    std::thread sweeper([&] {
        while (churning) {
            relay.queue().evict_expired(std::chrono::system_clock::now(), std::chrono::hours(1));
            std::this_thread::yield();
        }
    });

    std::vector<std::thread> workers;
    for (int i = 0; i < kSenders; ++i) {
        workers.emplace_back([&, i] {
            const std::string from = "sender-" + std::to_string(i);
            for (int n = 0; n < kMessagesPerSender; ++n) {
                relay.on_message(senders[i], send_frame(from, "bob", n));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    churn.join();
    sweeper.join();

    // Every acknowledged id is either delivered to one bob session or still
    // queued for him, and never both or twice.
    std::map<std::string, std::string> acknowledged;
    for (const auto& sender : senders) {
        for (const auto& ack : sender->frames_of("messageSent")) {
            acknowledged[ack["messageId"].get<std::string>()] = ack["status"].get<std::string>();
        }
        if (!sender->frames_of("error").empty()) {
            FAIL();
        }
    }
    if (acknowledged.size() != static_cast<std::size_t>(kSenders * kMessagesPerSender)) {
        FAIL();
    }

    std::map<std::string, int> seen;
    std::map<std::string, int> delivered;
    for (const auto& session : bob_sessions) {
        for (const auto& msg : session->frames_of("newMessage")) {
            const std::string id = msg["id"].get<std::string>();
            ++seen[id];
            ++delivered[id];
        }
    }
    for (const auto& queued : relay.queue().peek("bob")) {
        ++seen[queued.id];
    }

    if (seen.size() != acknowledged.size()) {
        FAIL();
    }
    for (const auto& entry : acknowledged) {
        const auto it = seen.find(entry.first);
        if (it == seen.end() || it->second != 1) {
            FAIL();
        }
        if (entry.second == "delivered" && delivered.count(entry.first) == 0) {
            FAIL();
        }
    }

    if (relay.directory().is_online("bob") ||
        relay.session_count() != static_cast<std::size_t>(kSenders)) {
        FAIL();
    }

    std::cout << "relay_concurrency_test passed\n";
    return 0;
}
