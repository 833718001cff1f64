#include "../../include/session/datachannel_transport.hpp"
#include "../../include/core/errors.hpp"
#include "../../include/utils/logger.hpp"
#include <rtc/rtc.hpp>
#include <variant>

namespace peerlink {
namespace session {

namespace {

const char* stateName(rtc::PeerConnection::State state) {
    switch (state) {
        case rtc::PeerConnection::State::New: return "new";
        case rtc::PeerConnection::State::Connecting: return "connecting";
        case rtc::PeerConnection::State::Connected: return "connected";
        case rtc::PeerConnection::State::Disconnected: return "disconnected";
        case rtc::PeerConnection::State::Failed: return "failed";
        case rtc::PeerConnection::State::Closed: return "closed";
    }
    return "unknown";
}

} // namespace

constexpr const char* DataChannelTransport::kChannelLabel;

DataChannelTransport::DataChannelTransport(boost::asio::io_context& ioc, const Config& config)
    : ioc_(ioc), config_(config) {
}

DataChannelTransport::~DataChannelTransport() {
    close();
}

void DataChannelTransport::setListener(Listener listener) {
    listener_ = std::move(listener);
}

void DataChannelTransport::dispatchEvent(unsigned generation, std::function<void(DataChannelTransport&)> fn) {
    std::weak_ptr<DataChannelTransport> weak = weak_from_this();
    boost::asio::post(ioc_, [weak, generation, fn]() {
        auto self = weak.lock();
        if (!self || self->closed_ || self->generation_ != generation) {
            return;
        }
        fn(*self);
    });
}

void DataChannelTransport::ensurePeerConnection() {
    if (closed_) {
        throw TransportNegotiationError("Transport is closed");
    }
    unsigned generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (peer_connection_) {
            return;
        }
        generation = generation_;
    }

    try {
        rtc::Configuration rtc_config;
        for (const auto& url : config_.ice_servers) {
            rtc_config.iceServers.emplace_back(url);
            Logger::getInstance().info("Added ICE server: " + url);
        }
        // Descriptions are produced explicitly by createOffer/acceptOffer
        rtc_config.disableAutoNegotiation = true;

        auto pc = std::make_shared<rtc::PeerConnection>(rtc_config);
        std::weak_ptr<DataChannelTransport> weak = weak_from_this();

        pc->onLocalDescription([weak, generation](rtc::Description description) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            const std::string sdp = std::string(description);
            const std::string type = description.typeString();
            self->dispatchEvent(generation, [sdp, type](DataChannelTransport& transport) {
                if (transport.listener_.on_local_description) {
                    transport.listener_.on_local_description(sdp, type);
                }
            });
        });

        pc->onLocalCandidate([weak, generation](rtc::Candidate candidate) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            IceCandidate ice_candidate;
            ice_candidate.candidate = candidate.candidate();
            ice_candidate.sdp_mid = candidate.mid();
            self->dispatchEvent(generation, [ice_candidate](DataChannelTransport& transport) {
                if (transport.listener_.on_local_candidate) {
                    transport.listener_.on_local_candidate(ice_candidate);
                }
            });
        });

        pc->onStateChange([weak, generation](rtc::PeerConnection::State state) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            Logger::getInstance().info(std::string("Peer connection state: ") + stateName(state));

            if (state == rtc::PeerConnection::State::Failed) {
                self->dispatchEvent(generation, [](DataChannelTransport& transport) {
                    if (transport.listener_.on_failure) {
                        transport.listener_.on_failure("Peer connection failed");
                    }
                });
            }
        });

        pc->onDataChannel([weak, generation](std::shared_ptr<rtc::DataChannel> channel) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            if (channel->label() != kChannelLabel) {
                Logger::getInstance().warning("Ignoring unexpected data channel: " + channel->label());
                return;
            }
            self->attachChannel(channel, generation);
        });

        std::lock_guard<std::mutex> lock(mutex_);
        peer_connection_ = pc;
    } catch (const std::exception& e) {
        throw TransportNegotiationError(std::string("libdatachannel initialization error: ") + e.what());
    }
}

void DataChannelTransport::attachChannel(const std::shared_ptr<rtc::DataChannel>& channel, unsigned generation) {
    std::weak_ptr<DataChannelTransport> weak = weak_from_this();

    channel->onOpen([weak, generation]() {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        Logger::getInstance().info("Data channel open");
        self->dispatchEvent(generation, [](DataChannelTransport& transport) {
            if (transport.listener_.on_open) {
                transport.listener_.on_open();
            }
        });
    });

    channel->onClosed([weak, generation]() {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        Logger::getInstance().info("Data channel closed");
        self->dispatchEvent(generation, [](DataChannelTransport& transport) {
            if (transport.listener_.on_closed) {
                transport.listener_.on_closed();
            }
        });
    });

    channel->onError([weak, generation](std::string error) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        Logger::getInstance().error("Data channel error: " + error);
        self->dispatchEvent(generation, [error](DataChannelTransport& transport) {
            if (transport.listener_.on_failure) {
                transport.listener_.on_failure("Data channel error: " + error);
            }
        });
    });

    channel->onMessage([weak, generation](rtc::message_variant data) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        if (!std::holds_alternative<std::string>(data)) {
            Logger::getInstance().warning("Ignoring binary data channel message");
            return;
        }
        std::string message = std::get<std::string>(std::move(data));
        self->dispatchEvent(generation, [message](DataChannelTransport& transport) {
            if (transport.listener_.on_message) {
                transport.listener_.on_message(message);
            }
        });
    });

    std::lock_guard<std::mutex> lock(mutex_);
    if (!peer_connection_ || generation != generation_) {
        return; // closed or reset meanwhile
    }
    channel_ = channel;
}

void DataChannelTransport::createOffer() {
    ensurePeerConnection();
    std::shared_ptr<rtc::PeerConnection> pc;
    unsigned generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pc = peer_connection_;
        generation = generation_;
    }

    try {
        attachChannel(pc->createDataChannel(kChannelLabel), generation);
        pc->setLocalDescription(rtc::Description::Type::Offer);
    } catch (const std::exception& e) {
        throw TransportNegotiationError(std::string("Failed to create offer: ") + e.what());
    }
}

void DataChannelTransport::acceptOffer(const std::string& sdp) {
    ensurePeerConnection();
    std::shared_ptr<rtc::PeerConnection> pc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pc = peer_connection_;
    }

    try {
        pc->setRemoteDescription(rtc::Description(sdp, rtc::Description::Type::Offer));
        pc->setLocalDescription(rtc::Description::Type::Answer);
    } catch (const std::exception& e) {
        throw TransportNegotiationError(std::string("Failed to apply remote offer: ") + e.what());
    }
}

void DataChannelTransport::applyAnswer(const std::string& sdp) {
    std::shared_ptr<rtc::PeerConnection> pc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pc = peer_connection_;
    }
    if (!pc || closed_) {
        throw TransportNegotiationError("Answer received before an offer was created");
    }

    try {
        pc->setRemoteDescription(rtc::Description(sdp, rtc::Description::Type::Answer));
    } catch (const std::exception& e) {
        throw TransportNegotiationError(std::string("Failed to apply remote answer: ") + e.what());
    }
}

void DataChannelTransport::addRemoteCandidate(const IceCandidate& candidate) {
    std::shared_ptr<rtc::PeerConnection> pc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pc = peer_connection_;
    }
    if (!pc || closed_) {
        throw TransportNegotiationError("Candidate received before negotiation started");
    }

    try {
        pc->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.sdp_mid));
    } catch (const std::exception& e) {
        throw TransportNegotiationError(std::string("Failed to add ICE candidate: ") + e.what());
    }
}

void DataChannelTransport::resetNegotiation() {
    if (closed_) {
        throw TransportNegotiationError("Transport is closed");
    }
    Logger::getInstance().info("Abandoning local offer");
    releasePeerConnection();
}

void DataChannelTransport::send(const std::string& message) {
    std::shared_ptr<rtc::DataChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel = channel_;
    }
    if (!channel || !channel->isOpen()) {
        throw ChannelNotReadyError("Data channel is not open");
    }

    try {
        channel->send(message);
    } catch (const std::exception& e) {
        throw ChannelNotReadyError(std::string("Data channel send failed: ") + e.what());
    }
}

void DataChannelTransport::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    listener_ = Listener{};
    releasePeerConnection();
}

void DataChannelTransport::releasePeerConnection() {
    std::shared_ptr<rtc::PeerConnection> pc;
    std::shared_ptr<rtc::DataChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pc = std::move(peer_connection_);
        channel = std::move(channel_);
        ++generation_;
    }

    try {
        if (channel) {
            channel->close();
        }
        if (pc) {
            pc->close();
        }
    } catch (const std::exception& e) {
        Logger::getInstance().warning("Error while closing peer connection: " + std::string(e.what()));
    }
}

} // namespace session
} // namespace peerlink
