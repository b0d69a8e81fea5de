/**
 * relay_config — JSON config file + environment overrides.
 */

#include "config/relay_config.h"

#include <cstdlib>
#include <fstream>
#include <limits>

#include <spdlog/common.h>

namespace {

using json = nlohmann::json;

std::string key_name(const char* section, const char* key) {
    return std::string(section) + "." + key;
}

const json* section_of(const json& doc, const char* section) {
    const auto it = doc.find(section);
    if (it == doc.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw ConfigError(std::string("config section '") + section + "' must be an object");
    }
    return &*it;
}

std::uint64_t read_uint(const json* section, const char* section_name, const char* key,
                        std::uint64_t fallback, std::uint64_t min, std::uint64_t max) {
    if (section == nullptr || !section->contains(key)) {
        return fallback;
    }
    const json& value = section->at(key);
    if (!value.is_number_unsigned()) {
        throw ConfigError(key_name(section_name, key) + " must be a non-negative integer");
    }
    const auto n = value.get<std::uint64_t>();
    if (n < min || n > max) {
        throw ConfigError(key_name(section_name, key) + " must be between " +
                          std::to_string(min) + " and " + std::to_string(max));
    }
    return n;
}

std::string read_string(const json* section, const char* section_name, const char* key,
                        const std::string& fallback) {
    if (section == nullptr || !section->contains(key)) {
        return fallback;
    }
    const json& value = section->at(key);
    if (!value.is_string() || value.get_ref<const std::string&>().empty()) {
        throw ConfigError(key_name(section_name, key) + " must be a non-empty string");
    }
    return value.get<std::string>();
}

bool read_bool(const json* section, const char* section_name, const char* key, bool fallback) {
    if (section == nullptr || !section->contains(key)) {
        return fallback;
    }
    const json& value = section->at(key);
    if (!value.is_boolean()) {
        throw ConfigError(key_name(section_name, key) + " must be true or false");
    }
    return value.get<bool>();
}

std::string checked_level(const std::string& level, const std::string& origin) {
    if (spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
        throw ConfigError(origin + ": unknown log level '" + level + "'");
    }
    return level;
}

uint16_t parse_port(const char* text, const char* variable) {
    char* end = nullptr;
    const unsigned long value = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0' || value > std::numeric_limits<uint16_t>::max()) {
        throw ConfigError(std::string(variable) + " is not a valid port: '" + text + "'");
    }
    return static_cast<uint16_t>(value);
}

}  // namespace

RelayConfig load_relay_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }
    json doc = json::parse(file, nullptr, false);
    if (doc.is_discarded()) {
        throw ConfigError("Config file is not valid JSON: " + path);
    }
    return relay_config_from_json(doc);
}

RelayConfig relay_config_from_json(const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("config root must be an object");
    }

    RelayConfig config;
    constexpr std::uint64_t kMaxPort = std::numeric_limits<uint16_t>::max();

    const json* relay = section_of(doc, "relay");
    config.relay.bind_address = read_string(relay, "relay", "bind_address",
                                            config.relay.bind_address);
    config.relay.port = static_cast<uint16_t>(
        read_uint(relay, "relay", "port", config.relay.port, 0, kMaxPort));
    config.relay.worker_threads = static_cast<std::size_t>(
        read_uint(relay, "relay", "worker_threads", config.relay.worker_threads, 1, 256));
    config.relay.max_frame_bytes = static_cast<std::size_t>(
        read_uint(relay, "relay", "max_frame_bytes", config.relay.max_frame_bytes, 1,
                  std::numeric_limits<std::uint32_t>::max()));
    config.relay.max_outbox_bytes = static_cast<std::size_t>(
        read_uint(relay, "relay", "max_outbox_bytes", config.relay.max_outbox_bytes, 1,
                  std::numeric_limits<std::uint32_t>::max()));

    const json* health = section_of(doc, "health");
    config.health.enabled = read_bool(health, "health", "enabled", config.health.enabled);
    config.health.bind_address = read_string(health, "health", "bind_address",
                                             config.health.bind_address);
    config.health.port = static_cast<uint16_t>(
        read_uint(health, "health", "port", config.health.port, 0, kMaxPort));

    const json* retention = section_of(doc, "retention");
    config.retention.max_age = std::chrono::seconds(
        read_uint(retention, "retention", "max_age_seconds",
                  static_cast<std::uint64_t>(config.retention.max_age.count()), 1,
                  std::numeric_limits<std::uint32_t>::max()));
    config.retention.sweep_interval = std::chrono::seconds(
        read_uint(retention, "retention", "sweep_interval_seconds",
                  static_cast<std::uint64_t>(config.retention.sweep_interval.count()), 1,
                  std::numeric_limits<std::uint32_t>::max()));

    const json* logging = section_of(doc, "logging");
    config.logging.level = checked_level(
        read_string(logging, "logging", "level", config.logging.level), "logging.level");

    return config;
}

void apply_env_overrides(RelayConfig& config, const EnvLookup& lookup) {
    if (const char* port = lookup("PORT")) {
        config.relay.port = parse_port(port, "PORT");
    }
    if (const char* port = lookup("HEALTH_PORT")) {
        config.health.port = parse_port(port, "HEALTH_PORT");
    }
    if (const char* level = lookup("LOG_LEVEL")) {
        config.logging.level = checked_level(level, "LOG_LEVEL");
    }
}
