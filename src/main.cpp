/**
 * @file main.cpp
 * @brief agentbox - sandbox lifecycle and task execution service
 *
 * Loads configuration (defaults, JSON file, AGENTBOX_* environment, flags),
 * starts the engine workers and serves the REST API until SIGINT/SIGTERM.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "agentbox/api/api_router.hpp"
#include "agentbox/api/authenticator.hpp"
#include "agentbox/api/http_server.hpp"
#include "agentbox/core/config.hpp"
#include "agentbox/core/engine.hpp"
#include "agentbox/core/errors.hpp"
#include "agentbox/core/logging.hpp"
#include "agentbox/core/version.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested{false};

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested.store(true);
    }
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"agentbox - sandbox lifecycle and task execution engine"};
    app.set_version_flag("--version", std::string(agentbox::kVersion));

    std::string config_path;
    std::string host;
    int port = 0;
    std::string log_level;
    std::string log_file;
    std::string runtime_kind;
    long long reaper_interval_ms = 0;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--host", host, "Address to bind the HTTP API to");
    app.add_option("-p,--port", port, "Port of the HTTP API")
        ->check(CLI::Range(1, 65535));
    app.add_option("--log-level", log_level, "trace, debug, info, warn, error or critical");
    app.add_option("--log-file", log_file, "Also write logs to this rotating file");
    app.add_option("--runtime", runtime_kind, "Container runtime")
        ->check(CLI::IsMember({"docker", "none"}));
    app.add_option("--reaper-interval-ms", reaper_interval_ms, "Timeout sweep period in milliseconds")
        ->check(CLI::PositiveNumber);

    CLI11_PARSE(app, argc, argv);

    agentbox::core::EngineConfig config;
    try {
        if (!config_path.empty()) {
            agentbox::core::LoadConfigFile(config_path, config);
        }
        agentbox::core::ApplyEnvironment(config);

        if (!host.empty()) config.server.host = host;
        if (port != 0) config.server.port = port;
        if (!log_level.empty()) config.logging.level = log_level;
        if (!log_file.empty()) config.logging.file = log_file;
        if (!runtime_kind.empty()) config.runtime.kind = runtime_kind;
        if (reaper_interval_ms > 0) config.reaper.interval = std::chrono::milliseconds(reaper_interval_ms);

        agentbox::core::Validate(config);
    } catch (const agentbox::core::EngineError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }

    agentbox::core::InitLogging(config.logging);

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("{} v{}", agentbox::kServiceName, agentbox::kVersion);
    spdlog::info("═══════════════════════════════════════════════════════════════");

    try {
        agentbox::core::Engine engine(config);
        engine.Start();

        std::shared_ptr<agentbox::api::Authenticator> authenticator;
        if (config.server.tokens.empty()) {
            spdlog::warn("No API tokens configured; every request is accepted as 'anonymous'");
            authenticator = std::make_shared<agentbox::api::OpenAuthenticator>();
        } else {
            authenticator = std::make_shared<agentbox::api::TokenAuthenticator>(config.server.tokens);
        }

        agentbox::api::ApiRouter router(engine, authenticator);
        agentbox::api::HttpServer server(router, config.server.host, config.server.port);

        std::atomic<bool> listen_failed{false};
        std::thread server_thread([&]() {
            if (!server.Listen()) {
                listen_failed = true;
                g_shutdown_requested = true;
            }
        });

        while (!g_shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Shutdown signal received...");
        server.Stop();
        server_thread.join();
        engine.Stop();

        if (listen_failed) {
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }

    spdlog::info("✓ agentbox stopped");
    return 0;
}
