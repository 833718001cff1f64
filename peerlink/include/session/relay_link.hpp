#ifndef RELAY_LINK_HPP
#define RELAY_LINK_HPP

#include <string>
#include <functional>

namespace peerlink {
namespace session {

/**
 * Client end of the relay connection.
 * Callbacks run on the owning session's io_context; none after close().
 */
class RelayLink {
public:
    struct Listener {
        std::function<void()> on_open;
        std::function<void(const std::string& message)> on_message;
        std::function<void(const std::string& reason)> on_closed;
    };

    virtual ~RelayLink() = default;

    virtual void setListener(Listener listener) = 0;

    /**
     * Begin connecting. on_open or on_closed reports the outcome.
     */
    virtual void open() = 0;

    virtual bool isWritable() const = 0;

    /**
     * Throws RelayConnectionError when the link is not writable.
     */
    virtual void send(const std::string& message) = 0;

    virtual void close() = 0;
};

} // namespace session
} // namespace peerlink

#endif // RELAY_LINK_HPP
