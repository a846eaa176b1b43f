#pragma once
#include "mist/core/result.hpp"
#include "mist/core/failures.hpp"
#include "mist/enums/envelope_type.hpp"
#include "protocol/envelope.pb.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mist::protocol::signaling {
using enums::EnvelopeType;

/// One alternative per envelope type, in EnvelopeType order.
using EnvelopePayload = std::variant<
    proto::protocol::HandshakeInitPayload,
    proto::protocol::TransportOfferPayload,
    proto::protocol::TransportAnswerPayload,
    proto::protocol::TransportIcePayload,
    proto::protocol::RelayedCiphertextPayload,
    proto::protocol::PresencePayload,
    proto::protocol::TypingPayload,
    proto::protocol::PrekeyBundlePayload,
    proto::protocol::PingPayload,
    proto::protocol::PongPayload>;

static_assert(std::variant_size_v<EnvelopePayload> == static_cast<size_t>(EnvelopeType::Pong) + 1);

[[nodiscard]] inline EnvelopeType TypeOf(const EnvelopePayload& payload) noexcept {
    return static_cast<EnvelopeType>(payload.index());
}

struct SignalingEnvelope {
    std::vector<uint8_t> from;
    /// Absent for broadcast and group envelopes.
    std::optional<std::vector<uint8_t>> to;
    EnvelopePayload payload;
    /// Milliseconds since the Unix epoch at the sender.
    int64_t timestamp_ms = 0;

    [[nodiscard]] EnvelopeType Type() const noexcept { return TypeOf(payload); }
};

/**
 * @brief JSON wire form of signaling envelopes
 *
 * {"type": "<wire name>", "from": base64, "to"?: base64, "payload": {...},
 * "timestamp": <ms>}. Keys use the standard base64 alphabet with padding.
 * Payload objects are the proto3 JSON mapping of the typed payload.
 */
class EnvelopeCodec {
public:
    [[nodiscard]] static Result<std::string, ProtocolFailure> Encode(const SignalingEnvelope& envelope);

    /// Decode failure for unparsable JSON, an unknown type, malformed keys or a
    /// payload that does not fit its type.
    [[nodiscard]] static Result<SignalingEnvelope, ProtocolFailure> Decode(std::string_view json);

    /// Structural checks on a typed payload (key sizes, required fields).
    [[nodiscard]] static Result<Unit, ProtocolFailure> ValidatePayload(const EnvelopePayload& payload);
};

}
