#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <cstdint>
#include "../utils/logger.hpp"

namespace peerlink {

enum class RelayMode {
    Addressed, // route by sender/recipient identity
    Room       // two-party room, roles assigned by arrival order
};

struct LogConfig {
    std::string log_file;          // empty: console only
    bool console = true;
    LogLevel level = LogLevel::INFO;
};

struct RelayConfig {
    std::string address = "0.0.0.0";
    unsigned short port = 8080;
    RelayMode mode = RelayMode::Addressed;
    int threads = 1;
    LogConfig log;
};

struct ClientConfig {
    std::string relay_url = "ws://127.0.0.1:8080/";
    std::string stun_server = "stun:stun.l.google.com:19302";
    int handshake_timeout_seconds = 30; // 0 disables the timeout
    std::string identity;
    std::string recipient;             // empty: wait for a room role or an initiate
    LogConfig log;
};

/**
 * Split ws://host[:port][/path] into its parts.
 * Returns false for anything that is not a ws:// URL.
 */
bool parseRelayUrl(const std::string& url, std::string& host, std::string& port, std::string& target);

/**
 * Fill a RelayConfig from PEERLINK_* environment variables and argv.
 * argv[1], when present, overrides the port.
 * Returns false and sets error when a value is invalid.
 */
bool loadRelayConfig(int argc, char* argv[], RelayConfig& config, std::string& error);

/**
 * Fill a ClientConfig from PEERLINK_* environment variables and argv.
 * Usage: <identity> [recipient]
 */
bool loadClientConfig(int argc, char* argv[], ClientConfig& config, std::string& error);

/**
 * Apply a LogConfig to the process-wide Logger.
 * Returns false and sets error when the log file cannot be opened.
 */
bool applyLogConfig(const LogConfig& config, std::string& error);

} // namespace peerlink

#endif // CONFIG_HPP
