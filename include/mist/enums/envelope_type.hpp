#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
namespace mist::protocol::enums {
/// Closed set of signaling envelope tags.
enum class EnvelopeType : uint8_t {
    HandshakeInit = 0,
    TransportOffer = 1,
    TransportAnswer = 2,
    TransportIce = 3,
    RelayedCiphertext = 4,
    Presence = 5,
    Typing = 6,
    PrekeyBundle = 7,
    Ping = 8,
    Pong = 9
};
/// Wire name, e.g. "handshake-init".
inline const char* ToString(const EnvelopeType type) {
    switch (type) {
        case EnvelopeType::HandshakeInit:
            return "handshake-init";
        case EnvelopeType::TransportOffer:
            return "transport-offer";
        case EnvelopeType::TransportAnswer:
            return "transport-answer";
        case EnvelopeType::TransportIce:
            return "transport-ice";
        case EnvelopeType::RelayedCiphertext:
            return "relayed-ciphertext";
        case EnvelopeType::Presence:
            return "presence";
        case EnvelopeType::Typing:
            return "typing";
        case EnvelopeType::PrekeyBundle:
            return "prekey-bundle";
        case EnvelopeType::Ping:
            return "ping";
        case EnvelopeType::Pong:
            return "pong";
        default:
            return "UNKNOWN";
    }
}
inline std::optional<EnvelopeType> EnvelopeTypeFromString(const std::string_view name) {
    for (uint8_t i = 0; i <= static_cast<uint8_t>(EnvelopeType::Pong); ++i) {
        const auto type = static_cast<EnvelopeType>(i);
        if (name == ToString(type)) {
            return type;
        }
    }
    return std::nullopt;
}
}
