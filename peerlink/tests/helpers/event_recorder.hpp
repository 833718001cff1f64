#ifndef TEST_EVENT_RECORDER_HPP
#define TEST_EVENT_RECORDER_HPP

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "session/session_events.hpp"

namespace peerlink {
namespace test {

class EventRecorder {
public:
    session::SessionEventHandler handler() {
        return [this](const session::SessionEvent& event) { events.push_back(event); };
    }

    int count(session::SessionEventType type) const {
        int n = 0;
        for (const auto& event : events) {
            if (event.type == type) {
                ++n;
            }
        }
        return n;
    }

    bool has(session::SessionEventType type) const { return count(type) > 0; }

    // Index of the first event of this type, -1 when absent
    int indexOf(session::SessionEventType type) const {
        for (size_t i = 0; i < events.size(); ++i) {
            if (events[i].type == type) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    const session::SessionEvent* last(session::SessionEventType type) const {
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (it->type == type) {
                return &*it;
            }
        }
        return nullptr;
    }

    std::vector<session::SessionEvent> events;
};

/**
 * Run every ready handler until the io_context is idle.
 */
inline void drain(boost::asio::io_context& ioc) {
    ioc.restart();
    while (ioc.poll() > 0) {
    }
}

/**
 * Run the io_context in small slices until done() holds or timeout expires.
 */
inline bool runUntil(boost::asio::io_context& ioc,
                     const std::function<bool()>& done,
                     std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        ioc.restart();
        ioc.run_for(std::chrono::milliseconds(10));
    }
    return true;
}

} // namespace test
} // namespace peerlink

#endif // TEST_EVENT_RECORDER_HPP
