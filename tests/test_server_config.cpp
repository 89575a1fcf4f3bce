#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "config/server_config.h"

using json = nlohmann::json;

TEST(ServerConfig, EmptyDocumentUsesDefaults) {
    auto cfg = ServerConfig::from_json(json::object());
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.port, 12345);
    EXPECT_EQ(cfg.io_threads, 2u);
    EXPECT_EQ(cfg.max_message_bytes, 64u * 1024u);
    EXPECT_EQ(cfg.log_level, "info");
}

TEST(ServerConfig, OverridesEveryField) {
    auto cfg = ServerConfig::from_json(json::parse(R"({
        "server": { "host": "127.0.0.1", "port": 0, "io_threads": 8,
                    "max_message_bytes": 128 },
        "log": { "level": "debug" }
    })"));
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.port, 0);
    EXPECT_EQ(cfg.io_threads, 8u);
    EXPECT_EQ(cfg.max_message_bytes, 128u);
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST(ServerConfig, AcceptsIpv6Host) {
    auto cfg = ServerConfig::from_json(json::parse(R"({"server": {"host": "::1"}})"));
    EXPECT_EQ(cfg.host, "::1");
}

TEST(ServerConfig, RejectsInvalidValues) {
    const char* bad[] = {
        R"([])",
        R"({"server": 5})",
        R"({"server": {"host": "not-an-ip"}})",
        R"({"server": {"host": 1}})",
        R"({"server": {"port": 70000}})",
        R"({"server": {"port": -1}})",
        R"({"server": {"port": "80"}})",
        R"({"server": {"io_threads": 0}})",
        R"({"server": {"max_message_bytes": 0}})",
        R"({"server": {"io_threads": 1.5}})",
        R"({"log": {"level": "verbose"}})",
    };
    for (const char* text : bad)
        EXPECT_THROW(ServerConfig::from_json(json::parse(text)), ConfigError) << text;
}

TEST(ServerConfig, ErrorNamesTheKey) {
    try {
        ServerConfig::from_json(json::parse(R"({"server": {"io_threads": 0}})"));
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("io_threads"), std::string::npos);
    }
}

TEST(ServerConfig, LoadMissingFileThrows) {
    EXPECT_THROW(ServerConfig::load("/nonexistent/chat-relay.json"), ConfigError);
}

TEST(ServerConfig, LoadFromFile) {
    std::string path = ::testing::TempDir() + "chat_relay_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"server": {"port": 4000}, "log": {"level": "warn"}})";
    }
    auto cfg = ServerConfig::load(path);
    EXPECT_EQ(cfg.port, 4000);
    EXPECT_EQ(cfg.log_level, "warn");
    std::remove(path.c_str());
}

TEST(ServerConfig, LoadInvalidJsonThrows) {
    std::string path = ::testing::TempDir() + "chat_relay_bad_config_test.json";
    {
        std::ofstream out(path);
        out << "{ \"server\": ";
    }
    EXPECT_THROW(ServerConfig::load(path), ConfigError);
    std::remove(path.c_str());
}
