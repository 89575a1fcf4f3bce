/**
 * chat-relay-client — Interactive client.
 *
 * Usage: chat-relay-client [host] [port]
 *
 * Reads a line from stdin, sends it, and prints the next message the
 * relay broadcasts. Stops at end of input.
 */

#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "network/relay_client.h"

int main(int argc, char* argv[]) {
    std::string host = (argc > 1) ? argv[1] : "127.0.0.1";
    uint16_t port = 12345;
    if (argc > 2) {
        try {
            int value = std::stoi(argv[2]);
            if (value < 1 || value > 65535)
                throw std::out_of_range("port");
            port = static_cast<uint16_t>(value);
        } catch (const std::exception&) {
            spdlog::error("Invalid port: {}", argv[2]);
            return 1;
        }
    }

    RelayClient client;
    if (!client.connect(host, port))
        return 1;

    std::string line;
    while (true) {
        std::cout << "Say >" << std::flush;
        if (!std::getline(std::cin, line))
            break;
        if (!client.send(line))
            return 1;

        auto reply = client.receive(std::chrono::seconds(5));
        if (!reply) {
            if (!client.is_connected())
                return 1;
            spdlog::warn("No reply within 5s");
            continue;
        }
        std::cout << "Received > " << *reply << "\n";
    }

    client.disconnect();
    return 0;
}
