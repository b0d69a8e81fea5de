/**
 * AccountDirectory — account records and their connection sets.
 */

#include "relay/account_directory.h"

#include <algorithm>
#include <utility>

#include "relay/protocol.h"
#include "relay/relay_error.h"

namespace {

constexpr const char* kDefaultUsername = "Anonymous";

bool same_handle(const ConnectionPtr& a, const ConnectionPtr& b) {
    return a.get() == b.get();
}

}  // namespace

bool Account::online() const {
    return std::any_of(connections.begin(), connections.end(),
                       [](const ConnectionPtr& c) { return c && c->is_open(); });
}

AccountDirectory::AccountDirectory(Clock clock) : clock_(std::move(clock)) {}

std::size_t AccountDirectory::register_account(const std::string& id,
                                               const nlohmann::json& public_key,
                                               const std::string& username,
                                               const ConnectionPtr& connection) {
    if (id.empty() || !protocol::is_supplied(public_key)) {
        throw ValidationError("Missing accountId or publicKey");
    }
    if (!connection) {
        throw ValidationError("Missing connection");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(id);
    if (it == accounts_.end()) {
        Account account;
        account.id = id;
        account.public_key = public_key;
        account.username = username.empty() ? kDefaultUsername : username;
        account.registered_at = clock_();
        it = accounts_.emplace(id, std::move(account)).first;
    }

    auto& connections = it->second.connections;
    const bool known = std::any_of(
        connections.begin(), connections.end(),
        [&](const ConnectionPtr& c) { return same_handle(c, connection); });
    if (!known) {
        connections.push_back(connection);
    }
    return accounts_.size();
}

Account AccountDirectory::lookup(const std::string& id) const {
    auto account = find(id);
    if (!account) {
        throw NotFoundError("User not found");
    }
    return std::move(*account);
}

std::optional<Account> AccountDirectory::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = accounts_.find(id);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ConnectionPtr> AccountDirectory::open_connections(const std::string& id) const {
    std::vector<ConnectionPtr> open;
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = accounts_.find(id);
    if (it == accounts_.end()) {
        return open;
    }
    for (const auto& connection : it->second.connections) {
        if (connection->is_open()) {
            open.push_back(connection);
        }
    }
    return open;
}

std::size_t AccountDirectory::remove_connection(const std::string& id,
                                                const ConnectionPtr& connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = accounts_.find(id);
    if (it == accounts_.end()) {
        return 0;
    }
    auto& connections = it->second.connections;
    connections.erase(
        std::remove_if(connections.begin(), connections.end(),
                       [&](const ConnectionPtr& c) { return same_handle(c, connection); }),
        connections.end());
    return connections.size();
}

bool AccountDirectory::is_online(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = accounts_.find(id);
    return it != accounts_.end() && it->second.online();
}

std::size_t AccountDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.size();
}
