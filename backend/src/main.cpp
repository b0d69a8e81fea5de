/**
 * phantom-relay — Daemon Entry Point
 *
 * Loads config, initialises libsodium, then runs the client listener, the
 * health probe and the offline-queue cleanup on one asio io_context until
 * SIGINT/SIGTERM.
 */

#include <csignal>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "api/health_api.h"
#include "config/relay_config.h"
#include "crypto/secure_random.h"
#include "network/session_server.h"
#include "relay/cleanup_scheduler.h"
#include "relay/relay_server.h"

static RelayConfig load_config(int argc, char* argv[]) {
    RelayConfig config;
    if (argc > 1) {
        config = load_relay_config(argv[1]);
        spdlog::info("Loaded config from {}", argv[1]);
    } else if (std::filesystem::exists("config.json")) {
        config = load_relay_config("config.json");
        spdlog::info("Loaded config from config.json");
    } else {
        spdlog::info("No config file, using defaults");
    }
    apply_env_overrides(config);
    return config;
}

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::info("phantom-relay starting…");

    RelayConfig config;
    try {
        config = load_config(argc, argv);
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config.logging.level));

    if (!SecureRandom::init()) {
        spdlog::error("libsodium initialisation failed");
        return 1;
    }

    asio::io_context io;
    RelayServer relay;

    std::unique_ptr<SessionServer> sessions;
    std::unique_ptr<HealthApi> health;
    try {
        sessions = std::make_unique<SessionServer>(io, config.relay.bind_address,
                                                   config.relay.port,
                                                   config.relay.max_frame_bytes,
                                                   config.relay.max_outbox_bytes);
        if (config.health.enabled) {
            health = std::make_unique<HealthApi>(io, config.health.bind_address,
                                                 config.health.port,
                                                 [&relay] { return relay.status(); });
        }
    } catch (const asio::system_error& e) {
        spdlog::error("Cannot bind listener: {}", e.what());
        return 1;
    }

    sessions->set_on_open([&relay](const ConnectionPtr& c) { relay.on_connect(c); });
    sessions->set_on_message([&relay](const ConnectionPtr& c, const std::string& frame) {
        relay.on_message(c, frame);
    });
    sessions->set_on_close([&relay](const ConnectionPtr& c) { relay.on_close(c); });

    CleanupScheduler cleanup(io, relay.queue(), config.retention.sweep_interval,
                             config.retention.max_age);

    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const asio::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        spdlog::info("Signal {} received, closing server...", signo);
        sessions->stop();
        if (health) {
            health->stop();
        }
        cleanup.stop();
    });

    sessions->start();
    if (health) {
        health->start();
    }
    cleanup.start();

    spdlog::info("Relay ready with {} worker thread(s).", config.relay.worker_threads);

    std::vector<std::thread> workers;
    for (std::size_t i = 1; i < config.relay.worker_threads; ++i) {
        workers.emplace_back([&io] { io.run(); });
    }
    io.run();
    for (auto& worker : workers) {
        worker.join();
    }

    spdlog::info("Server closed");
    return 0;
}
