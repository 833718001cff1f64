#ifndef TEST_FAKE_RELAY_LINK_HPP
#define TEST_FAKE_RELAY_LINK_HPP

#include <string>
#include <vector>

#include "core/errors.hpp"
#include "session/relay_link.hpp"

namespace peerlink {
namespace test {

/**
 * Scripted relay link: the test decides when it opens, what arrives and
 * when it drops. Everything sent is recorded in order.
 */
class FakeRelayLink : public session::RelayLink {
public:
    void setListener(Listener listener) override { listener_ = std::move(listener); }

    void open() override { open_requested = true; }

    bool isWritable() const override { return open_; }

    void send(const std::string& message) override {
        if (!open_) {
            throw RelayConnectionError("fake link not open");
        }
        sent.push_back(message);
    }

    void close() override {
        closed = true;
        open_ = false;
        listener_ = Listener{};
    }

    void completeOpen() {
        open_ = true;
        if (listener_.on_open) {
            listener_.on_open();
        }
    }

    void deliver(const std::string& message) {
        if (listener_.on_message) {
            listener_.on_message(message);
        }
    }

    void drop(const std::string& reason) {
        open_ = false;
        Listener listener = listener_;
        listener_ = Listener{};
        if (listener.on_closed) {
            listener.on_closed(reason);
        }
    }

    std::vector<std::string> sent;
    bool open_requested = false;
    bool closed = false;

private:
    Listener listener_;
    bool open_ = false;
};

} // namespace test
} // namespace peerlink

#endif // TEST_FAKE_RELAY_LINK_HPP
