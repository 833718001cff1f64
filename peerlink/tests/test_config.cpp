#include <QtTest/QtTest>

#include <string>
#include <vector>

#include "config/config.hpp"

using namespace peerlink;

namespace {

// Owns mutable argv storage for the loaders
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(&arg[0]);
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

} // namespace

class ConfigTests : public QObject {
    Q_OBJECT

private slots:
    void cleanup();

    void parseRelayUrlParts();
    void parseRelayUrlRejects();
    void relayDefaults();
    void relayEnvironmentOverrides();
    void relayInvalidValues();
    void clientRequiresIdentity();
    void clientEnvironmentOverrides();
    void clientInvalidValues();
};

void ConfigTests::cleanup() {
    const char* vars[] = {
        "PEERLINK_RELAY_ADDRESS", "PEERLINK_RELAY_PORT", "PEERLINK_RELAY_MODE",
        "PEERLINK_RELAY_THREADS", "PEERLINK_LOG_FILE", "PEERLINK_LOG_LEVEL",
        "PEERLINK_RELAY_URL", "PEERLINK_STUN_SERVER", "PEERLINK_HANDSHAKE_TIMEOUT",
        "PEERLINK_LOG_CONSOLE"
    };
    for (const char* var : vars) {
        qunsetenv(var);
    }
}

void ConfigTests::parseRelayUrlParts() {
    std::string host;
    std::string port;
    std::string target;

    QVERIFY(parseRelayUrl("ws://relay.example.org:9000/signal", host, port, target));
    QCOMPARE(QString::fromStdString(host), QString("relay.example.org"));
    QCOMPARE(QString::fromStdString(port), QString("9000"));
    QCOMPARE(QString::fromStdString(target), QString("/signal"));

    QVERIFY(parseRelayUrl("ws://localhost", host, port, target));
    QCOMPARE(QString::fromStdString(host), QString("localhost"));
    QCOMPARE(QString::fromStdString(port), QString("80"));
    QCOMPARE(QString::fromStdString(target), QString("/"));
}

void ConfigTests::parseRelayUrlRejects() {
    std::string host;
    std::string port;
    std::string target;
    QVERIFY(!parseRelayUrl("", host, port, target));
    QVERIFY(!parseRelayUrl("wss://secure:443/", host, port, target));
    QVERIFY(!parseRelayUrl("ws:///path", host, port, target));
    QVERIFY(!parseRelayUrl("ws://host:0/", host, port, target));
    QVERIFY(!parseRelayUrl("ws://host:70000/", host, port, target));
}

void ConfigTests::relayDefaults() {
    Args args{"peerlink_relay"};
    RelayConfig config;
    std::string error;
    QVERIFY(loadRelayConfig(args.argc(), args.argv(), config, error));
    QCOMPARE(QString::fromStdString(config.address), QString("0.0.0.0"));
    QCOMPARE(config.port, static_cast<unsigned short>(8080));
    QVERIFY(config.mode == RelayMode::Addressed);
    QCOMPARE(config.threads, 1);
    QVERIFY(config.log.level == LogLevel::INFO);
    QVERIFY(config.log.log_file.empty());
}

void ConfigTests::relayEnvironmentOverrides() {
    qputenv("PEERLINK_RELAY_ADDRESS", "127.0.0.1");
    qputenv("PEERLINK_RELAY_PORT", "9100");
    qputenv("PEERLINK_RELAY_MODE", "room");
    qputenv("PEERLINK_RELAY_THREADS", "4");
    qputenv("PEERLINK_LOG_LEVEL", "Debug");

    RelayConfig config;
    std::string error;
    Args env_only{"peerlink_relay"};
    QVERIFY(loadRelayConfig(env_only.argc(), env_only.argv(), config, error));
    QCOMPARE(QString::fromStdString(config.address), QString("127.0.0.1"));
    QCOMPARE(config.port, static_cast<unsigned short>(9100));
    QVERIFY(config.mode == RelayMode::Room);
    QCOMPARE(config.threads, 4);
    QVERIFY(config.log.level == LogLevel::DEBUG);

    // The command line port wins over the environment
    RelayConfig with_arg;
    Args args{"peerlink_relay", "7000"};
    QVERIFY(loadRelayConfig(args.argc(), args.argv(), with_arg, error));
    QCOMPARE(with_arg.port, static_cast<unsigned short>(7000));
}

void ConfigTests::relayInvalidValues() {
    RelayConfig config;
    std::string error;

    Args bad_port{"peerlink_relay", "80a"};
    QVERIFY(!loadRelayConfig(bad_port.argc(), bad_port.argv(), config, error));
    QVERIFY(error.find("port") != std::string::npos);

    Args args{"peerlink_relay"};
    qputenv("PEERLINK_RELAY_MODE", "mesh");
    QVERIFY(!loadRelayConfig(args.argc(), args.argv(), config, error));
    QVERIFY(error.find("PEERLINK_RELAY_MODE") != std::string::npos);
    qunsetenv("PEERLINK_RELAY_MODE");

    qputenv("PEERLINK_RELAY_THREADS", "0");
    QVERIFY(!loadRelayConfig(args.argc(), args.argv(), config, error));
    qunsetenv("PEERLINK_RELAY_THREADS");

    qputenv("PEERLINK_LOG_LEVEL", "loud");
    QVERIFY(!loadRelayConfig(args.argc(), args.argv(), config, error));
    QVERIFY(error.find("PEERLINK_LOG_LEVEL") != std::string::npos);
    qunsetenv("PEERLINK_LOG_LEVEL");

    qputenv("PEERLINK_LOG_CONSOLE", "maybe");
    QVERIFY(!loadRelayConfig(args.argc(), args.argv(), config, error));
    QVERIFY(error.find("PEERLINK_LOG_CONSOLE") != std::string::npos);
}

void ConfigTests::clientRequiresIdentity() {
    ClientConfig config;
    std::string error;

    Args none{"peerlink_chat"};
    QVERIFY(!loadClientConfig(none.argc(), none.argv(), config, error));
    QVERIFY(error.find("Usage") == 0);

    Args empty{"peerlink_chat", ""};
    QVERIFY(!loadClientConfig(empty.argc(), empty.argv(), config, error));

    Args both{"peerlink_chat", "alice", "bob"};
    QVERIFY(loadClientConfig(both.argc(), both.argv(), config, error));
    QCOMPARE(QString::fromStdString(config.identity), QString("alice"));
    QCOMPARE(QString::fromStdString(config.recipient), QString("bob"));
    QCOMPARE(QString::fromStdString(config.relay_url), QString("ws://127.0.0.1:8080/"));
    QCOMPARE(config.handshake_timeout_seconds, 30);
}

void ConfigTests::clientEnvironmentOverrides() {
    qputenv("PEERLINK_RELAY_URL", "ws://10.0.0.5:9000/");
    qputenv("PEERLINK_STUN_SERVER", "stun:stun.example.org:3478");
    qputenv("PEERLINK_HANDSHAKE_TIMEOUT", "0");
    qputenv("PEERLINK_LOG_CONSOLE", "0");
    qputenv("PEERLINK_LOG_FILE", "/tmp/peerlink-chat.log");

    ClientConfig config;
    std::string error;
    Args args{"peerlink_chat", "alice"};
    QVERIFY(loadClientConfig(args.argc(), args.argv(), config, error));
    QCOMPARE(QString::fromStdString(config.relay_url), QString("ws://10.0.0.5:9000/"));
    QCOMPARE(QString::fromStdString(config.stun_server), QString("stun:stun.example.org:3478"));
    QCOMPARE(config.handshake_timeout_seconds, 0);
    QVERIFY(config.recipient.empty());
    QVERIFY(!config.log.console);
    QCOMPARE(QString::fromStdString(config.log.log_file), QString("/tmp/peerlink-chat.log"));
}

void ConfigTests::clientInvalidValues() {
    ClientConfig config;
    std::string error;
    Args args{"peerlink_chat", "alice"};

    qputenv("PEERLINK_RELAY_URL", "http://relay/");
    QVERIFY(!loadClientConfig(args.argc(), args.argv(), config, error));
    QVERIFY(error.find("relay URL") != std::string::npos);
    qunsetenv("PEERLINK_RELAY_URL");

    qputenv("PEERLINK_HANDSHAKE_TIMEOUT", "-5");
    QVERIFY(!loadClientConfig(args.argc(), args.argv(), config, error));
}

QTEST_MAIN(ConfigTests)
#include "test_config.moc"
