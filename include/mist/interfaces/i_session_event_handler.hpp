#pragma once
#include "mist/core/failures.hpp"
#include "mist/enums/link_phase.hpp"
#include "mist/enums/signaling_state.hpp"
#include "mist/enums/trust_origin.hpp"
#include <cstdint>
#include <vector>

namespace mist::protocol::interfaces {

/// Events surfaced to the presentation layer. Invoked on the event loop thread.
class ISessionEventHandler {
public:
    virtual ~ISessionEventHandler() = default;

    virtual void OnFriendAdded(const std::vector<uint8_t>& peer, enums::TrustOrigin trust_origin) = 0;
    virtual void OnMessageDecrypted(const std::vector<uint8_t>& peer, const std::vector<uint8_t>& plaintext) = 0;
    virtual void OnTransportStateChanged(const std::vector<uint8_t>& peer, enums::LinkPhase phase) = 0;
    virtual void OnSignalingStateChanged(enums::SignalingState state) = 0;
    /// A message or handshake from this peer failed a cryptographic check.
    virtual void OnMessageRejected(const std::vector<uint8_t>& peer, const ProtocolFailure& failure) = 0;
    /// A known contact sent ciphertext but no session exists for it.
    virtual void OnRehandshakeRequired(const std::vector<uint8_t>& peer) = 0;
    virtual void OnPresence(const std::vector<uint8_t>& peer, bool online) = 0;
    virtual void OnTyping(const std::vector<uint8_t>& peer, bool is_typing) = 0;
};

}
