/**
 * chat-relay — Server Entry Point
 *
 * Loads config, sets up logging, starts the relay and runs until SIGINT
 * or SIGTERM, then shuts down cleanly.
 */

#include <csignal>
#include <exception>
#include <string>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "config/server_config.h"
#include "relay/relay_server.h"

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);

    std::string config_path = (argc > 1) ? argv[1] : "config.json";

    ServerConfig config;
    try {
        config = ServerConfig::load(config_path);
    } catch (const ConfigError& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::info("Loaded config from {}", config_path);

    RelayServer server(config);
    try {
        server.start();
    } catch (const std::exception& e) {
        spdlog::critical("Cannot start relay on {}:{}: {}", config.host, config.port, e.what());
        return 1;
    }

    asio::io_context signal_io;
    asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([](const asio::error_code& ec, int signo) {
        if (!ec)
            spdlog::info("Received signal {}", signo);
    });
    signal_io.run();

    server.stop();
    return 0;
}
