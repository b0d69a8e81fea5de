#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

enum class InboundKind {
    register_account,
    send_message,
    get_public_key,
    ping,
    unknown,
};

/**
 * One decoded client frame: the `type` discriminator plus the whole object.
 */
struct InboundMessage {
    InboundKind kind{InboundKind::unknown};
    std::string type;       // empty when the frame carries no string `type`
    nlohmann::json body;
};

enum class DeliveryStatus {
    delivered,
    queued,
};

/**
 * JSON envelope shared by the relay and its clients.
 *
 * Every frame is a flat object with a `type` field. Payloads and public keys
 * are opaque JSON values: the relay stores and echoes them verbatim.
 */
namespace protocol {

/// Decode one frame. Throws ParseError unless the text is a JSON object.
InboundMessage decode_inbound(const std::string& text);

/// False for null, false, 0 and "" (values a client cannot mean as "supplied").
bool is_supplied(const nlohmann::json& value);

/// `body[key]` when it holds a non-empty string, otherwise "".
std::string string_field(const nlohmann::json& body, const char* key);

/// `body[key]`, or null when the key is absent.
nlohmann::json value_field(const nlohmann::json& body, const char* key);

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point time);

const char* to_string(DeliveryStatus status);

// ── Outbound frames ─────────────────────────────────────────────────────────

std::string registered(const std::string& account_id, std::size_t online_users);

std::string public_key(const std::string& account_id,
                       const nlohmann::json& key,
                       const std::string& username);

std::string new_message(const std::string& from,
                        const nlohmann::json& encrypted_message,
                        std::chrono::system_clock::time_point timestamp,
                        const std::string& id);

std::string message_sent(const std::string& message_id, DeliveryStatus status);

std::string error(const std::string& message);

std::string pong();

}  // namespace protocol
