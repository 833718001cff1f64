#include "config/config.hpp"
#include "server/relay_server.hpp"
#include "signaling/room_relay.hpp"
#include "signaling/signaling_relay.hpp"
#include "utils/logger.hpp"
#include <iostream>
#include <csignal>
#include <memory>

peerlink::RelayServer* g_server = nullptr;

void signalHandler(int signal) {
    (void)signal;
    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    // Setup signal handlers
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    peerlink::RelayConfig config;
    std::string error;
    if (!peerlink::loadRelayConfig(argc, argv, config, error)) {
        std::cerr << error << std::endl;
        std::cerr << "Usage: peerlink_relay [port]" << std::endl;
        return 2;
    }

    if (!peerlink::applyLogConfig(config.log, error)) {
        std::cerr << error << std::endl;
        return 2;
    }
    peerlink::Logger::getInstance().info("Starting PeerLink relay...");

    std::unique_ptr<peerlink::RelayHandler> handler;
    if (config.mode == peerlink::RelayMode::Room) {
        handler = std::make_unique<peerlink::RoomRelay>();
    } else {
        handler = std::make_unique<peerlink::SignalingRelay>();
    }

    peerlink::Logger::getInstance().info(std::string("Relay mode: ") +
        (config.mode == peerlink::RelayMode::Room ? "room" : "addressed") +
        ", worker threads: " + std::to_string(config.threads));

    peerlink::RelayServer server(config.address, config.port, *handler);
    g_server = &server;

    if (!server.start()) {
        peerlink::Logger::getInstance().error("Failed to start relay");
        g_server = nullptr;
        return 1;
    }

    server.run(config.threads);
    g_server = nullptr;

    std::cout << "\nRelay shut down." << std::endl;
    return 0;
}
