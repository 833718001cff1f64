#ifndef DATACHANNEL_TRANSPORT_HPP
#define DATACHANNEL_TRANSPORT_HPP

#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <mutex>
#include <boost/asio.hpp>
#include "transport.hpp"

namespace rtc {
class PeerConnection;
class DataChannel;
}

namespace peerlink {
namespace session {

/**
 * WebRTC data channel transport using libdatachannel
 *
 * The offering side creates a reliable ordered channel labelled "chat"; the
 * answering side adopts the channel announced by the peer. libdatachannel
 * invokes its callbacks on internal threads, so every event is posted into
 * the session io_context before it reaches the listener.
 */
class DataChannelTransport : public Transport,
                             public std::enable_shared_from_this<DataChannelTransport> {
public:
    static constexpr const char* kChannelLabel = "chat";

    struct Config {
        std::vector<std::string> ice_servers;   // "stun:host:port" or "turn:user:pass@host:port"
    };

    DataChannelTransport(boost::asio::io_context& ioc, const Config& config);
    ~DataChannelTransport() override;

    void setListener(Listener listener) override;
    void createOffer() override;
    void acceptOffer(const std::string& sdp) override;
    void applyAnswer(const std::string& sdp) override;
    void addRemoteCandidate(const IceCandidate& candidate) override;
    void resetNegotiation() override;
    void send(const std::string& message) override;
    void close() override;

private:
    boost::asio::io_context& ioc_;
    Config config_;
    Listener listener_;
    bool closed_ = false;

    std::shared_ptr<rtc::PeerConnection> peer_connection_;
    std::shared_ptr<rtc::DataChannel> channel_;
    unsigned generation_ = 0;   // bumped when a peer connection is abandoned
    mutable std::mutex mutex_;

    void ensurePeerConnection();
    void attachChannel(const std::shared_ptr<rtc::DataChannel>& channel, unsigned generation);
    void releasePeerConnection();

    // Runs fn on the io_context unless the transport is gone, closed or has
    // moved on to a newer peer connection.
    void dispatchEvent(unsigned generation, std::function<void(DataChannelTransport&)> fn);
};

} // namespace session
} // namespace peerlink

#endif // DATACHANNEL_TRANSPORT_HPP
