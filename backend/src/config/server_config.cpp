/**
 * ServerConfig — Loads relay settings from a JSON file.
 *
 * Layout:
 *   { "server": { "host", "port", "io_threads", "max_message_bytes" },
 *     "log":    { "level" } }
 *
 * Missing keys keep their defaults; present keys must have the right type
 * and range.
 */

#include "config/server_config.h"

#include <array>
#include <fstream>
#include <limits>

#include <asio.hpp>

using json = nlohmann::json;

namespace {

const json* section(const json& doc, const char* name) {
    auto it = doc.find(name);
    if (it == doc.end())
        return nullptr;
    if (!it->is_object())
        throw ConfigError(std::string("\"") + name + "\" must be an object");
    return &*it;
}

std::string read_string(const json& sec, const std::string& key,
                        const std::string& fallback) {
    auto it = sec.find(key);
    if (it == sec.end())
        return fallback;
    if (!it->is_string())
        throw ConfigError("\"" + key + "\" must be a string");
    return it->get<std::string>();
}

uint64_t read_unsigned(const json& sec, const std::string& key,
                       uint64_t fallback, uint64_t min, uint64_t max) {
    auto it = sec.find(key);
    if (it == sec.end())
        return fallback;
    if (!it->is_number_integer())
        throw ConfigError("\"" + key + "\" must be an integer");
    if (it->is_number_unsigned() || it->get<int64_t>() >= 0) {
        uint64_t value = it->get<uint64_t>();
        if (value >= min && value <= max)
            return value;
    }
    throw ConfigError("\"" + key + "\" must be between " + std::to_string(min)
                      + " and " + std::to_string(max));
}

constexpr std::array<const char*, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"
};

} // namespace

ServerConfig ServerConfig::from_json(const json& doc) {
    if (!doc.is_object())
        throw ConfigError("config root must be an object");

    ServerConfig cfg;

    if (const json* server = section(doc, "server")) {
        cfg.host = read_string(*server, "host", cfg.host);
        asio::error_code ec;
        asio::ip::make_address(cfg.host, ec);
        if (ec)
            throw ConfigError("\"host\" is not an IP address: " + cfg.host);

        cfg.port = static_cast<uint16_t>(
            read_unsigned(*server, "port", cfg.port, 0,
                          std::numeric_limits<uint16_t>::max()));
        cfg.io_threads = static_cast<std::size_t>(
            read_unsigned(*server, "io_threads", cfg.io_threads, 1, 1024));
        cfg.max_message_bytes = static_cast<std::size_t>(
            read_unsigned(*server, "max_message_bytes", cfg.max_message_bytes,
                          1, std::numeric_limits<uint32_t>::max()));
    }

    if (const json* log = section(doc, "log")) {
        cfg.log_level = read_string(*log, "level", cfg.log_level);
        bool known = false;
        for (const char* level : kLogLevels)
            known = known || cfg.log_level == level;
        if (!known)
            throw ConfigError("\"level\" is not a log level: " + cfg.log_level);
    }

    return cfg;
}

ServerConfig ServerConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw ConfigError("cannot open config file: " + path);

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("invalid JSON in " + path + ": " + e.what());
    }
    return from_json(doc);
}
