#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

/**
 * Raised for an unreadable config file, invalid JSON, or a bad value.
 * The message names the offending key.
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Runtime settings of the relay server. Every field has a default, so an
 * empty JSON object is a valid configuration.
 */
struct ServerConfig {
    std::string   host              = "0.0.0.0";
    uint16_t      port              = 12345;
    std::size_t   io_threads        = 2;
    std::size_t   max_message_bytes = 64 * 1024;
    std::string   log_level         = "info";

    /// Build from the parsed document. Throws ConfigError.
    static ServerConfig from_json(const nlohmann::json& doc);

    /// Read and parse a config file. Throws ConfigError.
    static ServerConfig load(const std::string& path);
};
