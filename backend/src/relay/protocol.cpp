/**
 * protocol — JSON envelope decoding and outbound frame builders.
 *
 * Frames are compact single-line JSON objects. Field names follow the
 * client contract (`accountId`, `encryptedMessage`, `messageId`, …).
 */

#include "relay/protocol.h"

#include <utility>

#include "relay/relay_error.h"

namespace protocol {

namespace {

// Deeper documents are refused before they are built.
constexpr int kMaxNestingDepth = 64;

InboundKind kind_of(const std::string& type) {
    if (type == "register")     return InboundKind::register_account;
    if (type == "sendMessage")  return InboundKind::send_message;
    if (type == "getPublicKey") return InboundKind::get_public_key;
    if (type == "ping")         return InboundKind::ping;
    return InboundKind::unknown;
}

}  // namespace

InboundMessage decode_inbound(const std::string& text) {
    bool too_deep = false;
    const nlohmann::json::parser_callback_t depth_guard =
        [&too_deep](int depth, nlohmann::json::parse_event_t, nlohmann::json&) {
            if (depth > kMaxNestingDepth) {
                too_deep = true;
                return false;
            }
            return true;
        };

    nlohmann::json body = nlohmann::json::parse(text, depth_guard, false);
    if (too_deep) {
        throw ParseError("frame nests deeper than " + std::to_string(kMaxNestingDepth) +
                         " levels");
    }
    if (body.is_discarded()) {
        throw ParseError("frame is not valid JSON");
    }
    if (!body.is_object()) {
        throw ParseError("frame is not a JSON object");
    }

    InboundMessage message;
    const auto type = body.find("type");
    if (type != body.end() && type->is_string()) {
        message.type = type->get<std::string>();
        message.kind = kind_of(message.type);
    }
    message.body = std::move(body);
    return message;
}

bool is_supplied(const nlohmann::json& value) {
    if (value.is_null()) {
        return false;
    }
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number()) {
        return value != 0;
    }
    if (value.is_string()) {
        return !value.get_ref<const std::string&>().empty();
    }
    return true;
}

std::string string_field(const nlohmann::json& body, const char* key) {
    if (!body.is_object()) {
        return {};
    }
    const auto it = body.find(key);
    if (it == body.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

nlohmann::json value_field(const nlohmann::json& body, const char* key) {
    if (!body.is_object()) {
        return nullptr;
    }
    const auto it = body.find(key);
    return it == body.end() ? nlohmann::json() : *it;
}

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               time.time_since_epoch())
        .count();
}

const char* to_string(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::delivered: return "delivered";
        case DeliveryStatus::queued:    return "queued";
    }
    return "queued";
}

std::string registered(const std::string& account_id, std::size_t online_users) {
    return nlohmann::json{
        {"type", "registered"},
        {"accountId", account_id},
        {"onlineUsers", online_users},
    }.dump();
}

std::string public_key(const std::string& account_id,
                       const nlohmann::json& key,
                       const std::string& username) {
    return nlohmann::json{
        {"type", "publicKey"},
        {"accountId", account_id},
        {"publicKey", key},
        {"username", username},
    }.dump();
}

std::string new_message(const std::string& from,
                        const nlohmann::json& encrypted_message,
                        std::chrono::system_clock::time_point timestamp,
                        const std::string& id) {
    return nlohmann::json{
        {"type", "newMessage"},
        {"from", from},
        {"encryptedMessage", encrypted_message},
        {"timestamp", to_epoch_ms(timestamp)},
        {"id", id},
    }.dump();
}

std::string message_sent(const std::string& message_id, DeliveryStatus status) {
    return nlohmann::json{
        {"type", "messageSent"},
        {"messageId", message_id},
        {"status", to_string(status)},
    }.dump();
}

std::string error(const std::string& message) {
    return nlohmann::json{
        {"type", "error"},
        {"message", message},
    }.dump();
}

std::string pong() {
    return nlohmann::json{{"type", "pong"}}.dump();
}

}  // namespace protocol
