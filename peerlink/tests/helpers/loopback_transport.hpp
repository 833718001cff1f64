#ifndef TEST_LOOPBACK_TRANSPORT_HPP
#define TEST_LOOPBACK_TRANSPORT_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "core/errors.hpp"
#include "session/transport.hpp"

namespace peerlink {
namespace test {

/**
 * In-process transport. Two instances are paired with connect(); the
 * channel opens on both ends once the offering side applies the answer.
 * All callbacks are posted to the io_context.
 */
class LoopbackTransport : public session::Transport,
                          public std::enable_shared_from_this<LoopbackTransport> {
public:
    LoopbackTransport(boost::asio::io_context& ioc, std::string name)
        : ioc_(ioc), name_(std::move(name)) {}

    static void connect(const std::shared_ptr<LoopbackTransport>& a,
                        const std::shared_ptr<LoopbackTransport>& b) {
        a->peer_ = b;
        b->peer_ = a;
    }

    void setListener(Listener listener) override { listener_ = std::move(listener); }

    void createOffer() override {
        if (fail_negotiation) {
            throw TransportNegotiationError("loopback offer refused");
        }
        offers_created++;
        const std::string sdp = "offer:" + name_;
        post([sdp](LoopbackTransport& self) {
            if (self.listener_.on_local_description) {
                self.listener_.on_local_description(sdp, "offer");
            }
        });
        emitCandidate();
    }

    void acceptOffer(const std::string& sdp) override {
        if (fail_negotiation || sdp.compare(0, 6, "offer:") != 0) {
            throw TransportNegotiationError("loopback cannot parse offer: " + sdp);
        }
        remote_description = sdp;
        const std::string answer = "answer:" + name_;
        post([answer](LoopbackTransport& self) {
            if (self.listener_.on_local_description) {
                self.listener_.on_local_description(answer, "answer");
            }
        });
        emitCandidate();
    }

    void applyAnswer(const std::string& sdp) override {
        if (fail_negotiation || sdp.compare(0, 7, "answer:") != 0) {
            throw TransportNegotiationError("loopback cannot parse answer: " + sdp);
        }
        remote_description = sdp;
        if (!hold_open) {
            openBothEnds();
        }
    }

    void addRemoteCandidate(const session::IceCandidate& candidate) override {
        if (remote_description.empty()) {
            throw TransportNegotiationError("candidate before remote description");
        }
        remote_candidates.push_back(candidate);
    }

    void resetNegotiation() override {
        negotiation_resets++;
        remote_description.clear();
    }

    void send(const std::string& message) override {
        if (!open_) {
            throw ChannelNotReadyError("loopback channel not open");
        }
        sent.push_back(message);
        auto peer = peer_.lock();
        if (!peer) {
            return;
        }
        peer->post([message](LoopbackTransport& self) {
            if (self.listener_.on_message) {
                self.listener_.on_message(message);
            }
        });
    }

    void close() override {
        if (closed) {
            return;
        }
        closed = true;
        open_ = false;
        listener_ = Listener{};
        auto peer = peer_.lock();
        if (peer && peer->open_) {
            peer->post([](LoopbackTransport& self) {
                self.open_ = false;
                if (self.listener_.on_closed) {
                    self.listener_.on_closed();
                }
            });
        }
    }

    /**
     * Open both ends now. Used with hold_open to control the ordering of
     * transport readiness against the key exchange.
     */
    void openBothEnds() {
        post([](LoopbackTransport& self) { self.markOpen(); });
        auto peer = peer_.lock();
        if (peer) {
            peer->post([](LoopbackTransport& self) { self.markOpen(); });
        }
    }

    /**
     * Push a raw frame to this end as if the peer had sent it.
     */
    void injectMessage(const std::string& message) {
        post([message](LoopbackTransport& self) {
            if (self.listener_.on_message) {
                self.listener_.on_message(message);
            }
        });
    }

    bool fail_negotiation = false;
    bool hold_open = false;
    int offers_created = 0;
    int negotiation_resets = 0;
    bool closed = false;
    std::string remote_description;
    std::vector<session::IceCandidate> remote_candidates;
    std::vector<std::string> sent;

private:
    void post(std::function<void(LoopbackTransport&)> fn) {
        std::weak_ptr<LoopbackTransport> weak = shared_from_this();
        boost::asio::post(ioc_, [weak, fn]() {
            auto self = weak.lock();
            if (!self || self->closed) {
                return;
            }
            fn(*self);
        });
    }

    void emitCandidate() {
        session::IceCandidate candidate;
        candidate.candidate = "candidate:" + name_ + " 1 udp 2122260223 127.0.0.1 50000 typ host";
        candidate.sdp_mid = "0";
        post([candidate](LoopbackTransport& self) {
            if (self.listener_.on_local_candidate) {
                self.listener_.on_local_candidate(candidate);
            }
        });
    }

    void markOpen() {
        if (open_) {
            return;
        }
        open_ = true;
        if (listener_.on_open) {
            listener_.on_open();
        }
    }

    boost::asio::io_context& ioc_;
    std::string name_;
    Listener listener_;
    std::weak_ptr<LoopbackTransport> peer_;
    bool open_ = false;
};

} // namespace test
} // namespace peerlink

#endif // TEST_LOOPBACK_TRANSPORT_HPP
