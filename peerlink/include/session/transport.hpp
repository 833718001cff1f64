#ifndef TRANSPORT_HPP
#define TRANSPORT_HPP

#include <string>
#include <functional>

namespace peerlink {
namespace session {

struct IceCandidate {
    std::string candidate;
    std::string sdp_mid;
};

/**
 * Point-to-point message channel negotiated through the relay.
 *
 * Implementations deliver every listener callback on the owning session's
 * io_context and stop delivering once close() has been called.
 */
class Transport {
public:
    struct Listener {
        // type is "offer" or "answer"
        std::function<void(const std::string& sdp, const std::string& type)> on_local_description;
        std::function<void(const IceCandidate& candidate)> on_local_candidate;
        std::function<void()> on_open;
        std::function<void()> on_closed;
        std::function<void(const std::string& message)> on_message;
        std::function<void(const std::string& reason)> on_failure;
    };

    virtual ~Transport() = default;

    virtual void setListener(Listener listener) = 0;

    /**
     * Start negotiation as the offering side. The offer is reported through
     * on_local_description. Throws TransportNegotiationError.
     */
    virtual void createOffer() = 0;

    /**
     * Apply a remote offer and produce an answer through on_local_description.
     * Throws TransportNegotiationError.
     */
    virtual void acceptOffer(const std::string& sdp) = 0;

    /**
     * Throws TransportNegotiationError.
     */
    virtual void applyAnswer(const std::string& sdp) = 0;

    /**
     * Throws TransportNegotiationError.
     */
    virtual void addRemoteCandidate(const IceCandidate& candidate) = 0;

    /**
     * Abandon a local offer that was never answered so that acceptOffer()
     * can take the peer's offer instead. Events from the abandoned attempt
     * are not delivered. Throws TransportNegotiationError.
     */
    virtual void resetNegotiation() = 0;

    /**
     * Throws ChannelNotReadyError when the channel is not open.
     */
    virtual void send(const std::string& message) = 0;

    virtual void close() = 0;
};

} // namespace session
} // namespace peerlink

#endif // TRANSPORT_HPP
