#pragma once

#include <cstdint>

namespace mist::protocol::enums {

enum class SessionRole : uint8_t {
    Initiator = 0,
    Responder = 1
};

/**
 * @brief Per-peer handshake state held by the session manager
 *
 * NoSession -> HandshakeSent (initiator) | HandshakeReceived (responder)
 *           -> Established | EstablishedAwaitingFirstMessage -> Established
 *
 * The two handshake states are held only while the key agreement for that
 * peer runs; a concurrent handshake for the same peer sees them and backs off.
 */
enum class SessionState : uint8_t {
    NoSession = 0,
    HandshakeSent = 1,
    HandshakeReceived = 2,
    /// Responder that has not decrypted anything yet; it cannot send.
    EstablishedAwaitingFirstMessage = 3,
    Established = 4
};

constexpr const char* ToString(const SessionRole role) noexcept {
    switch (role) {
        case SessionRole::Initiator:
            return "Initiator";
        case SessionRole::Responder:
            return "Responder";
        default:
            return "UNKNOWN";
    }
}

constexpr const char* ToString(const SessionState state) noexcept {
    switch (state) {
        case SessionState::NoSession:
            return "NoSession";
        case SessionState::HandshakeSent:
            return "HandshakeSent";
        case SessionState::HandshakeReceived:
            return "HandshakeReceived";
        case SessionState::EstablishedAwaitingFirstMessage:
            return "EstablishedAwaitingFirstMessage";
        case SessionState::Established:
            return "Established";
        default:
            return "UNKNOWN";
    }
}

constexpr bool IsEstablished(const SessionState state) noexcept {
    return state == SessionState::Established ||
           state == SessionState::EstablishedAwaitingFirstMessage;
}

} // namespace mist::protocol::enums
