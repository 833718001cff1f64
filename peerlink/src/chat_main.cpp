#include "config/config.hpp"
#include "core/errors.hpp"
#include "crypto/crypto_provider.hpp"
#include "session/datachannel_transport.hpp"
#include "session/session_coordinator.hpp"
#include "session/websocket_relay_link.hpp"
#include "utils/console_reader.hpp"
#include "utils/logger.hpp"
#include <boost/asio.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unistd.h>

using peerlink::session::SessionCoordinator;
using peerlink::session::SessionEvent;
using peerlink::session::SessionEventType;

namespace {

void printEvent(const SessionEvent& event) {
    switch (event.type) {
        case SessionEventType::Registered:
            std::cout << "* registered with relay" << std::endl;
            break;
        case SessionEventType::RoleAssigned:
            std::cout << "* role: " << peerlink::session::roleToString(event.role);
            if (!event.peer.empty()) {
                std::cout << " (peer " << event.peer << ")";
            }
            std::cout << std::endl;
            break;
        case SessionEventType::TransportReady:
            std::cout << "* direct channel open" << std::endl;
            break;
        case SessionEventType::KeyExchangeReady:
            std::cout << "* session key derived" << std::endl;
            break;
        case SessionEventType::PeerEncryptionReady:
            std::cout << "* peer confirmed encryption" << std::endl;
            break;
        case SessionEventType::Secure:
            std::cout << "* secure session established, type to chat (/quit to leave, /status for state)" << std::endl;
            break;
        case SessionEventType::MessageReceived:
            std::cout << event.message.sender << ": " << event.message.text << std::endl;
            break;
        case SessionEventType::TransportClosed:
            std::cout << "* direct channel closed" << std::endl;
            break;
        case SessionEventType::Error:
            std::cout << "! " << peerlink::errorKindToString(event.error_kind)
                      << ": " << event.error_message << std::endl;
            break;
        case SessionEventType::Closed:
            std::cout << "* session closed" << std::endl;
            break;
    }
}

// Errors that leave the session usable
bool isRecoverable(peerlink::ErrorKind kind) {
    return kind == peerlink::ErrorKind::Decryption ||
           kind == peerlink::ErrorKind::ChannelNotReady;
}

} // namespace

int main(int argc, char* argv[]) {
    peerlink::ClientConfig config;
    std::string error;
    if (!peerlink::loadClientConfig(argc, argv, config, error)) {
        std::cerr << error << std::endl;
        return 2;
    }
    if (!peerlink::applyLogConfig(config.log, error)) {
        std::cerr << error << std::endl;
        return 2;
    }

    boost::asio::io_context ioc;
    auto work = boost::asio::make_work_guard(ioc);
    peerlink::crypto::OpenSslCryptoProvider provider;

    auto relay = std::make_shared<peerlink::session::WebSocketRelayLink>(ioc, config.relay_url);

    peerlink::session::DataChannelTransport::Config transport_config;
    if (!config.stun_server.empty()) {
        transport_config.ice_servers.push_back(config.stun_server);
    }
    auto transport = std::make_shared<peerlink::session::DataChannelTransport>(ioc, transport_config);

    SessionCoordinator::Options options;
    options.identity = config.identity;
    options.handshake_timeout = std::chrono::seconds(config.handshake_timeout_seconds);

    SessionCoordinator coordinator(ioc, options, relay, transport, provider);
    bool failed = false;

    coordinator.setEventHandler([&](const SessionEvent& event) {
        printEvent(event);
        if (event.type == SessionEventType::Error && !isRecoverable(event.error_kind)) {
            failed = true;
            boost::asio::post(ioc, [&coordinator]() { coordinator.cleanup(); });
        } else if (event.type == SessionEventType::Closed) {
            work.reset();
            ioc.stop();
        }
    });

    std::unique_ptr<peerlink::ConsoleReader> console;
    try {
        console = std::make_unique<peerlink::ConsoleReader>(ioc, STDIN_FILENO,
            [&coordinator](const std::string& line) {
                if (line == "/quit") {
                    coordinator.cleanup();
                    return;
                }
                if (line == "/status") {
                    std::cout << "* state: " << peerlink::session::sessionStateToString(coordinator.state())
                              << std::endl;
                    return;
                }
                if (line.empty()) {
                    return;
                }
                try {
                    coordinator.sendChatMessage(line);
                } catch (const peerlink::ChannelNotReadyError& e) {
                    std::cout << "! not sent: " << e.what() << std::endl;
                }
            },
            [&coordinator]() { coordinator.cleanup(); });
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&coordinator](const boost::system::error_code& ec, int) {
        if (!ec) {
            coordinator.cleanup();
        }
    });

    coordinator.start();
    if (!config.recipient.empty()) {
        coordinator.setRecipient(config.recipient);
    }
    console->start();

    ioc.run();
    console->stop();
    signals.cancel();

    return failed ? 1 : 0;
}
