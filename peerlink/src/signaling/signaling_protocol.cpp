#include "../../include/signaling/signaling_protocol.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/core/errors.hpp"
#include <sstream>
#include <stdexcept>

namespace peerlink {
namespace SignalingProtocol {

namespace {

// Opens an object with type and the optional addressing members.
void beginMessage(std::ostringstream& oss,
                  const char* type,
                  const std::string& sender,
                  const std::string& recipient) {
    oss << "{"
        << "\"type\":\"" << type << "\"";
    if (!sender.empty()) {
        oss << ",\"sender\":\"" << JsonParser::escapeJson(sender) << "\"";
    }
    if (!recipient.empty()) {
        oss << ",\"recipient\":\"" << JsonParser::escapeJson(recipient) << "\"";
    }
}

bool requireField(const Envelope& envelope, const char* name, std::string& reason) {
    if (envelope.fields.find(name) == envelope.fields.end()) {
        reason = std::string("'") + envelope.type + "' message is missing '" + name + "'";
        return false;
    }
    return true;
}

} // namespace

std::string Envelope::field(const std::string& name) const {
    auto it = fields.find(name);
    return it == fields.end() ? std::string() : it->second;
}

std::string createRegister(const std::string& identity) {
    std::ostringstream oss;
    beginMessage(oss, REGISTER, identity, "");
    oss << "}";
    return oss.str();
}

std::string createInitiate(const std::string& sender,
                           const std::string& recipient) {
    std::ostringstream oss;
    beginMessage(oss, INITIATE, sender, recipient);
    oss << "}";
    return oss.str();
}

std::string createOffer(const std::string& sender,
                        const std::string& recipient,
                        const std::string& offer) {
    std::ostringstream oss;
    beginMessage(oss, OFFER, sender, recipient);
    oss << ",\"offer\":\"" << JsonParser::escapeJson(offer) << "\""
        << "}";
    return oss.str();
}

std::string createAnswer(const std::string& sender,
                         const std::string& recipient,
                         const std::string& answer) {
    std::ostringstream oss;
    beginMessage(oss, ANSWER, sender, recipient);
    oss << ",\"answer\":\"" << JsonParser::escapeJson(answer) << "\""
        << "}";
    return oss.str();
}

std::string createIceCandidate(const std::string& sender,
                               const std::string& recipient,
                               const std::string& candidate,
                               const std::string& sdp_mid) {
    std::ostringstream oss;
    beginMessage(oss, ICE_CANDIDATE, sender, recipient);
    oss << ",\"candidate\":\"" << JsonParser::escapeJson(candidate) << "\""
        << ",\"sdpMid\":\"" << JsonParser::escapeJson(sdp_mid) << "\""
        << "}";
    return oss.str();
}

std::string createPublicKey(const std::string& sender,
                            const std::string& recipient,
                            const std::string& key_b64) {
    std::ostringstream oss;
    beginMessage(oss, ECDH_PUBLIC_KEY, sender, recipient);
    oss << ",\"key\":\"" << JsonParser::escapeJson(key_b64) << "\""
        << "}";
    return oss.str();
}

std::string createEncryptionReady(const std::string& sender,
                                  const std::string& recipient) {
    std::ostringstream oss;
    beginMessage(oss, ENCRYPTION_READY, sender, recipient);
    oss << "}";
    return oss.str();
}

std::string createError(const std::string& message) {
    std::ostringstream oss;
    oss << "{"
        << "\"type\":\"" << RELAY_ERROR << "\","
        << "\"message\":\"" << JsonParser::escapeJson(message) << "\""
        << "}";
    return oss.str();
}

std::string createInit(bool is_initiator) {
    std::ostringstream oss;
    oss << "{"
        << "\"type\":\"" << INIT << "\","
        << "\"isInitiator\":" << (is_initiator ? "true" : "false")
        << "}";
    return oss.str();
}

std::string createPeerJoined() {
    return std::string("{\"type\":\"") + PEER_JOINED + "\"}";
}

std::string createEncryptedMessage(const std::string& sealed_b64) {
    std::ostringstream oss;
    oss << "{"
        << "\"type\":\"" << ENCRYPTED_MESSAGE << "\","
        << "\"message\":\"" << JsonParser::escapeJson(sealed_b64) << "\""
        << "}";
    return oss.str();
}

std::string createChatPayload(const std::string& text,
                              const std::string& sender,
                              const std::string& recipient) {
    std::map<std::string, std::string> payload = {
        {"text", text},
        {"sender", sender},
        {"recipient", recipient}
    };
    return JsonParser::stringify(payload);
}

bool isKnownType(const std::string& type) {
    return type == REGISTER || type == INITIATE || type == OFFER ||
           type == ANSWER || type == ICE_CANDIDATE || type == ECDH_PUBLIC_KEY ||
           type == ENCRYPTION_READY || type == RELAY_ERROR || type == INIT ||
           type == PEER_JOINED || type == ENCRYPTED_MESSAGE;
}

bool validateEnvelope(const Envelope& envelope, std::string& reason) {
    if (envelope.type.empty()) {
        reason = "message has no type";
        return false;
    }
    if (!isKnownType(envelope.type)) {
        reason = "unknown message type '" + envelope.type + "'";
        return false;
    }

    // Type-specific validation
    if (envelope.type == REGISTER && !envelope.hasSender()) {
        reason = "'register' message is missing 'sender'";
        return false;
    }
    if (envelope.type == OFFER) {
        return requireField(envelope, "offer", reason);
    }
    if (envelope.type == ANSWER) {
        return requireField(envelope, "answer", reason);
    }
    if (envelope.type == ICE_CANDIDATE) {
        return requireField(envelope, "candidate", reason);
    }
    if (envelope.type == ECDH_PUBLIC_KEY) {
        return requireField(envelope, "key", reason);
    }
    if (envelope.type == RELAY_ERROR || envelope.type == ENCRYPTED_MESSAGE) {
        return requireField(envelope, "message", reason);
    }
    if (envelope.type == INIT) {
        if (!requireField(envelope, "isInitiator", reason)) {
            return false;
        }
        const std::string flag = envelope.field("isInitiator");
        if (flag != "true" && flag != "false") {
            reason = "'init' message has a non-boolean 'isInitiator'";
            return false;
        }
    }

    return true;
}

Envelope parseEnvelope(const std::string& json) {
    std::map<std::string, std::string> data;
    try {
        data = JsonParser::parse(json);
    } catch (const std::invalid_argument& e) {
        throw SignalingParseError(e.what());
    }

    Envelope envelope;
    for (auto& pair : data) {
        if (pair.first == "type") {
            envelope.type = pair.second;
        } else if (pair.first == "sender") {
            envelope.sender = pair.second;
        } else if (pair.first == "recipient") {
            envelope.recipient = pair.second;
        } else {
            envelope.fields.emplace(pair.first, pair.second);
        }
    }

    std::string reason;
    if (!validateEnvelope(envelope, reason)) {
        throw SignalingParseError(reason);
    }
    return envelope;
}

} // namespace SignalingProtocol
} // namespace peerlink
