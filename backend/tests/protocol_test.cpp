#include <chrono>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "network/frame_codec.h"
#include "relay/protocol.h"
#include "relay/relay_error.h"

namespace {

#define FAIL()                                                  \
  do {                                                          \
    std::cerr << "protocol_test failed at " << __FILE__ << ":"  \
              << __LINE__ << "\n";                              \
    return 1;                                                   \
  } while (false)

using json = nlohmann::json;

bool rejects(const std::string& text) {
    try {
        protocol::decode_inbound(text);
    } catch (const ParseError& e) {
        return e.code() == RelayErrc::parse_error;
    }
    return false;
}

}  // namespace

int main() {
    // Kind detection.
    if (protocol::decode_inbound(R"({"type":"register"})").kind != InboundKind::register_account ||
        protocol::decode_inbound(R"({"type":"sendMessage"})").kind != InboundKind::send_message ||
        protocol::decode_inbound(R"({"type":"getPublicKey"})").kind != InboundKind::get_public_key ||
        protocol::decode_inbound(R"({"type":"ping"})").kind != InboundKind::ping) {
        FAIL();
    }
    const auto unknown = protocol::decode_inbound(R"({"type":"typing","to":"bob"})");
    if (unknown.kind != InboundKind::unknown || unknown.type != "typing" ||
        unknown.body["to"] != "bob") {
        FAIL();
    }
    const auto untyped = protocol::decode_inbound(R"({"type":7})");
    if (untyped.kind != InboundKind::unknown || !untyped.type.empty()) {
        FAIL();
    }

    // Anything that is not a JSON object is a parse error.
    if (!rejects("") || !rejects("{") || !rejects("null") || !rejects("\"register\"") ||
        !rejects("42")) {
        FAIL();
    }

    // Nesting depth is bounded, whatever the frame type.
    const std::string deep(400000, '[');
    const std::string deep_close(400000, ']');
    if (!rejects(R"({"type":"ping","pad":)" + deep + deep_close + "}") ||
        !rejects(R"({"type":"register","accountId":"a","publicKey":)" + deep + deep_close + "}")) {
        FAIL();
    }
    if (!rejects(R"({"type":"ping","pad":)" + std::string(70, '[') + std::string(70, ']') + "}")) {
        FAIL();
    }
    const auto nested = protocol::decode_inbound(R"({"type":"register","publicKey":)" +
                                                 std::string(32, '[') + "1" +
                                                 std::string(32, ']') + "}");
    if (nested.kind != InboundKind::register_account || !nested.body["publicKey"].is_array()) {
        FAIL();
    }

    // Presence rules.
    if (protocol::is_supplied(nullptr) || protocol::is_supplied(false) ||
        protocol::is_supplied(0) || protocol::is_supplied(0.0) || protocol::is_supplied("")) {
        FAIL();
    }
    if (!protocol::is_supplied("k") || !protocol::is_supplied(1) || !protocol::is_supplied(true) ||
        !protocol::is_supplied(json::object()) || !protocol::is_supplied(json::array())) {
        FAIL();
    }
    const json body{{"id", "alice"}, {"n", 3}};
    if (protocol::string_field(body, "id") != "alice" || !protocol::string_field(body, "n").empty() ||
        !protocol::string_field(body, "missing").empty()) {
        FAIL();
    }
    if (!protocol::value_field(body, "missing").is_null() || protocol::value_field(body, "n") != 3) {
        FAIL();
    }

    // Outbound frames.
    const auto at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1234));
    const json msg = json::parse(protocol::new_message("alice", json{{"ct", "x"}}, at, "abcd"));
    if (msg != json{{"type", "newMessage"}, {"from", "alice"}, {"encryptedMessage", {{"ct", "x"}}},
                    {"timestamp", 1234}, {"id", "abcd"}}) {
        FAIL();
    }
    if (json::parse(protocol::registered("bob", 3)) !=
        json{{"type", "registered"}, {"accountId", "bob"}, {"onlineUsers", 3}}) {
        FAIL();
    }
    if (json::parse(protocol::message_sent("m", DeliveryStatus::queued))["status"] != "queued" ||
        json::parse(protocol::message_sent("m", DeliveryStatus::delivered))["status"] != "delivered") {
        FAIL();
    }
    if (json::parse(protocol::public_key("bob", "pk", "Bob")) !=
        json{{"type", "publicKey"}, {"accountId", "bob"}, {"publicKey", "pk"}, {"username", "Bob"}}) {
        FAIL();
    }
    if (json::parse(protocol::error("boom")) != json{{"type", "error"}, {"message", "boom"}}) {
        FAIL();
    }

    // Frame codec.
    const auto header = frame_codec::encode_header(0x01020304u);
    if (header[0] != 1 || header[1] != 2 || header[2] != 3 || header[3] != 4 ||
        frame_codec::decode_header(header) != 0x01020304u) {
        FAIL();
    }
    const std::string framed = frame_codec::encode("{}");
    if (framed.size() != 6 || framed.substr(4) != "{}" || framed[3] != 2 || framed[0] != 0) {
        FAIL();
    }

    std::cout << "protocol_test passed\n";
    return 0;
}
