#include "../../include/config/config.hpp"
#include <cstdlib>
#include <stdexcept>

namespace peerlink {

namespace {

bool parseInt(const std::string& text, int min_value, int max_value, int& out) {
    try {
        size_t consumed = 0;
        const int value = std::stoi(text, &consumed);
        if (consumed != text.size() || value < min_value || value > max_value) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool loadLogConfig(LogConfig& config, std::string& error) {
    const char* env_file = std::getenv("PEERLINK_LOG_FILE");
    if (env_file) {
        config.log_file = env_file;
    }
    const char* env_level = std::getenv("PEERLINK_LOG_LEVEL");
    if (env_level && !Logger::parseLevel(env_level, config.level)) {
        error = "Invalid PEERLINK_LOG_LEVEL: " + std::string(env_level);
        return false;
    }
    const char* env_console = std::getenv("PEERLINK_LOG_CONSOLE");
    if (env_console) {
        const std::string value = env_console;
        if (value == "1" || value == "true") {
            config.console = true;
        } else if (value == "0" || value == "false") {
            config.console = false;
        } else {
            error = "Invalid PEERLINK_LOG_CONSOLE: " + value;
            return false;
        }
    }
    return true;
}

} // namespace

bool parseRelayUrl(const std::string& url, std::string& host, std::string& port, std::string& target) {
    const std::string scheme = "ws://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return false;
    }
    std::string rest = url.substr(scheme.size());
    const size_t slash = rest.find('/');
    target = slash == std::string::npos ? "/" : rest.substr(slash);
    std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
    if (authority.empty()) {
        return false;
    }

    const size_t colon = authority.rfind(':');
    if (colon == std::string::npos) {
        host = authority;
        port = "80";
    } else {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
        int ignored = 0;
        if (host.empty() || !parseInt(port, 1, 65535, ignored)) {
            return false;
        }
    }
    return true;
}

bool loadRelayConfig(int argc, char* argv[], RelayConfig& config, std::string& error) {
    if (!loadLogConfig(config.log, error)) {
        return false;
    }

    const char* env_address = std::getenv("PEERLINK_RELAY_ADDRESS");
    if (env_address) {
        config.address = env_address;
    }

    std::string port_text;
    const char* env_port = std::getenv("PEERLINK_RELAY_PORT");
    if (env_port) {
        port_text = env_port;
    }
    if (argc > 1) {
        port_text = argv[1];
    }
    if (!port_text.empty()) {
        int port = 0;
        if (!parseInt(port_text, 0, 65535, port)) {
            error = "Invalid port: " + port_text;
            return false;
        }
        config.port = static_cast<unsigned short>(port);
    }

    const char* env_mode = std::getenv("PEERLINK_RELAY_MODE");
    if (env_mode) {
        const std::string mode = env_mode;
        if (mode == "addressed") {
            config.mode = RelayMode::Addressed;
        } else if (mode == "room") {
            config.mode = RelayMode::Room;
        } else {
            error = "Invalid PEERLINK_RELAY_MODE: " + mode;
            return false;
        }
    }

    const char* env_threads = std::getenv("PEERLINK_RELAY_THREADS");
    if (env_threads && !parseInt(env_threads, 1, 256, config.threads)) {
        error = "Invalid PEERLINK_RELAY_THREADS: " + std::string(env_threads);
        return false;
    }

    return true;
}

bool loadClientConfig(int argc, char* argv[], ClientConfig& config, std::string& error) {
    if (argc < 2) {
        error = "Usage: peerlink_chat <identity> [recipient]";
        return false;
    }
    config.identity = argv[1];
    if (config.identity.empty()) {
        error = "Identity must not be empty";
        return false;
    }
    if (argc > 2) {
        config.recipient = argv[2];
    }

    if (!loadLogConfig(config.log, error)) {
        return false;
    }

    const char* env_url = std::getenv("PEERLINK_RELAY_URL");
    if (env_url) {
        config.relay_url = env_url;
    }
    std::string host;
    std::string port;
    std::string target;
    if (!parseRelayUrl(config.relay_url, host, port, target)) {
        error = "Invalid relay URL: " + config.relay_url;
        return false;
    }

    const char* env_stun = std::getenv("PEERLINK_STUN_SERVER");
    if (env_stun) {
        config.stun_server = env_stun;
    }

    const char* env_timeout = std::getenv("PEERLINK_HANDSHAKE_TIMEOUT");
    if (env_timeout && !parseInt(env_timeout, 0, 3600, config.handshake_timeout_seconds)) {
        error = "Invalid PEERLINK_HANDSHAKE_TIMEOUT: " + std::string(env_timeout);
        return false;
    }

    return true;
}

bool applyLogConfig(const LogConfig& config, std::string& error) {
    Logger& logger = Logger::getInstance();
    logger.setMinLevel(config.level);
    if (!config.log_file.empty() && !logger.setLogFile(config.log_file)) {
        error = "Cannot open log file " + config.log_file;
        return false;
    }
    // Never go silent: without a file the console stays on
    logger.setConsoleEnabled(config.console || config.log_file.empty());
    return true;
}

} // namespace peerlink
