#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

struct RelaySection {
    std::string bind_address{"0.0.0.0"};
    uint16_t port{3000};
    std::size_t worker_threads{1};
    std::size_t max_frame_bytes{1024 * 1024};
    std::size_t max_outbox_bytes{8 * 1024 * 1024};
};

struct HealthSection {
    bool enabled{true};
    std::string bind_address{"0.0.0.0"};
    uint16_t port{3001};
};

struct RetentionSection {
    std::chrono::seconds max_age{std::chrono::hours(24 * 7)};
    std::chrono::seconds sweep_interval{std::chrono::hours(1)};
};

struct LoggingSection {
    std::string level{"info"};
};

/**
 * Relay settings, one struct per section of the JSON config file:
 *
 *   { "relay":     { "bind_address", "port", "worker_threads", "max_frame_bytes",
 *                    "max_outbox_bytes" },
 *     "health":    { "enabled", "bind_address", "port" },
 *     "retention": { "max_age_seconds", "sweep_interval_seconds" },
 *     "logging":   { "level" } }
 *
 * Every key is optional.
 */
struct RelayConfig {
    RelaySection relay;
    HealthSection health;
    RetentionSection retention;
    LoggingSection logging;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/// Read and validate a config file. Throws ConfigError.
RelayConfig load_relay_config(const std::string& path);

/// Validate an already-parsed document. Throws ConfigError.
RelayConfig relay_config_from_json(const nlohmann::json& doc);

using EnvLookup = std::function<const char*(const char*)>;

/// PORT, HEALTH_PORT and LOG_LEVEL take precedence over the file.
void apply_env_overrides(RelayConfig& config, const EnvLookup& lookup = std::getenv);
