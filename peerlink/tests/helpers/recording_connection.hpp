#ifndef TEST_RECORDING_CONNECTION_HPP
#define TEST_RECORDING_CONNECTION_HPP

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "signaling/relay_connection.hpp"

namespace peerlink {
namespace test {

class RecordingConnection : public RelayConnection {
public:
    explicit RecordingConnection(std::string name) : name_(std::move(name)) {}

    void send(const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back(message);
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

    std::string remoteEndpoint() const override { return name_; }

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.clear();
    }

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::vector<std::string> sent_;
    bool closed_ = false;
};

inline std::shared_ptr<RecordingConnection> makeConnection(const std::string& name) {
    return std::make_shared<RecordingConnection>(name);
}

} // namespace test
} // namespace peerlink

#endif // TEST_RECORDING_CONNECTION_HPP
