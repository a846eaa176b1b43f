#include "mist/signaling/signaling_envelope.hpp"
#include "mist/protocol/constants.hpp"
#include "mist/utilities/key_encoding.hpp"
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <fmt/core.h>
#include <cmath>
#include <limits>

namespace mist::protocol::signaling {
    namespace {
        using google::protobuf::util::JsonParseOptions;
        using google::protobuf::util::JsonStringToMessage;
        using google::protobuf::util::MessageToJsonString;

        EnvelopePayload EmptyPayload(const EnvelopeType type) {
            switch (type) {
                case EnvelopeType::HandshakeInit:
                    return proto::protocol::HandshakeInitPayload{};
                case EnvelopeType::TransportOffer:
                    return proto::protocol::TransportOfferPayload{};
                case EnvelopeType::TransportAnswer:
                    return proto::protocol::TransportAnswerPayload{};
                case EnvelopeType::TransportIce:
                    return proto::protocol::TransportIcePayload{};
                case EnvelopeType::RelayedCiphertext:
                    return proto::protocol::RelayedCiphertextPayload{};
                case EnvelopeType::Presence:
                    return proto::protocol::PresencePayload{};
                case EnvelopeType::Typing:
                    return proto::protocol::TypingPayload{};
                case EnvelopeType::PrekeyBundle:
                    return proto::protocol::PrekeyBundlePayload{};
                case EnvelopeType::Ping:
                    return proto::protocol::PingPayload{};
                case EnvelopeType::Pong:
                    return proto::protocol::PongPayload{};
            }
            return proto::protocol::PingPayload{};
        }

        Result<Unit, ProtocolFailure> Malformed(std::string message) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::Decode(std::move(message)));
        }

        bool IsKey(const std::string& bytes, const size_t expected = kEd25519PublicKeyBytes) {
            return bytes.size() == expected;
        }

        Result<std::vector<uint8_t>, ProtocolFailure> DecodeKey(const std::string& text, std::string_view field) {
            auto key = utilities::FromBase64(text);
            if (key.IsErr() || key.Unwrap().size() != kEd25519PublicKeyBytes) {
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                    ProtocolFailure::Decode(fmt::format("Envelope field '{}' is not a base64 public key", field)));
            }
            return key;
        }

        Result<Unit, ProtocolFailure> CheckBundle(const proto::protocol::PrekeyBundle& bundle) {
            if (!IsKey(bundle.identity_key()) || !IsKey(bundle.signed_prekey(), kX25519PublicKeyBytes)) {
                return Malformed("Prekey bundle carries a malformed key");
            }
            if (bundle.signed_prekey_signature().size() != kEd25519SignatureBytes) {
                return Malformed("Prekey bundle signature has the wrong size");
            }
            for (const auto& one_time : bundle.one_time_prekeys()) {
                if (!IsKey(one_time.public_key(), kX25519PublicKeyBytes)) {
                    return Malformed("Prekey bundle carries a malformed one-time prekey");
                }
            }
            return Result<Unit, ProtocolFailure>::Ok(Unit{});
        }

        struct PayloadValidator {
            Result<Unit, ProtocolFailure> operator()(const proto::protocol::HandshakeInitPayload& p) const {
                if (!IsKey(p.identity_key()) || !IsKey(p.ephemeral_key(), kX25519PublicKeyBytes)) {
                    return Malformed("handshake-init carries a malformed key");
                }
                if (p.signed_prekey_id() == 0) {
                    return Malformed("handshake-init names no signed prekey");
                }
                return Result<Unit, ProtocolFailure>::Ok(Unit{});
            }
            Result<Unit, ProtocolFailure> operator()(const proto::protocol::TransportOfferPayload& p) const {
                if (p.negotiation_id().empty() || p.sdp().empty()) {
                    return Malformed("transport-offer requires negotiation_id and sdp");
                }
                return Result<Unit, ProtocolFailure>::Ok(Unit{});
            }
            Result<Unit, ProtocolFailure> operator()(const proto::protocol::TransportAnswerPayload& p) const {
                if (p.negotiation_id().empty() || p.sdp().empty()) {
                    return Malformed("transport-answer requires negotiation_id and sdp");
                }
                return Result<Unit, ProtocolFailure>::Ok(Unit{});
            }
            Result<Unit, ProtocolFailure> operator()(const proto::protocol::TransportIcePayload& p) const {
                if (p.negotiation_id().empty() || p.candidate().empty()) {
                    return Malformed("transport-ice requires negotiation_id and candidate");
                }
                return Result<Unit, ProtocolFailure>::Ok(Unit{});
            }
            Result<Unit, ProtocolFailure> operator()(const proto::protocol::RelayedCiphertextPayload& p) const {
                if (p.ciphertext().empty()) {
                    return Malformed("relayed-ciphertext is empty");
                }
                return Result<Unit, ProtocolFailure>::Ok(Unit{});
            }
            Result<Unit, ProtocolFailure> operator()(const proto::protocol::PrekeyBundlePayload& p) const {
                if (p.request()) {
                    return Result<Unit, ProtocolFailure>::Ok(Unit{});
                }
                if (!p.has_bundle()) {
                    return Malformed("prekey-bundle response carries no bundle");
                }
                return CheckBundle(p.bundle());
            }
            template<typename TPayload>
            Result<Unit, ProtocolFailure> operator()(const TPayload&) const {
                return Result<Unit, ProtocolFailure>::Ok(Unit{});
            }
        };
    }

    Result<Unit, ProtocolFailure> EnvelopeCodec::ValidatePayload(const EnvelopePayload& payload) {
        return std::visit(PayloadValidator{}, payload);
    }

    Result<std::string, ProtocolFailure> EnvelopeCodec::Encode(const SignalingEnvelope& envelope) {
        if (envelope.from.size() != kEd25519PublicKeyBytes ||
            (envelope.to.has_value() && envelope.to->size() != kEd25519PublicKeyBytes)) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::Encode("Envelope keys must be 32 bytes"));
        }

        std::string payload_json;
        const auto print_status = std::visit(
            [&payload_json](const auto& message) { return MessageToJsonString(message, &payload_json); },
            envelope.payload);
        if (!print_status.ok()) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::Encode(fmt::format("Cannot encode payload: {}", print_status.ToString())));
        }

        proto::protocol::WireEnvelope wire;
        wire.set_type(enums::ToString(envelope.Type()));
        wire.set_from(utilities::ToBase64(envelope.from));
        if (envelope.to.has_value()) {
            wire.set_to(utilities::ToBase64(*envelope.to));
        }
        wire.set_timestamp(static_cast<double>(envelope.timestamp_ms));
        if (const auto status = JsonStringToMessage(payload_json, wire.mutable_payload()); !status.ok()) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::Encode(fmt::format("Cannot embed payload: {}", status.ToString())));
        }

        std::string json;
        if (const auto status = MessageToJsonString(wire, &json); !status.ok()) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::Encode(fmt::format("Cannot encode envelope: {}", status.ToString())));
        }
        return Result<std::string, ProtocolFailure>::Ok(std::move(json));
    }

    Result<SignalingEnvelope, ProtocolFailure> EnvelopeCodec::Decode(std::string_view json) {
        using DecodeResult = Result<SignalingEnvelope, ProtocolFailure>;

        proto::protocol::WireEnvelope wire;
        JsonParseOptions lenient;
        lenient.ignore_unknown_fields = true;
        if (const auto status = JsonStringToMessage(std::string(json), &wire, lenient); !status.ok()) {
            return DecodeResult::Err(
                ProtocolFailure::Decode(fmt::format("Envelope is not valid JSON: {}", status.ToString())));
        }

        const auto type = enums::EnvelopeTypeFromString(wire.type());
        if (!type.has_value()) {
            return DecodeResult::Err(
                ProtocolFailure::Decode(fmt::format("Unknown envelope type '{}'", wire.type())));
        }

        SignalingEnvelope envelope{};
        auto from = DecodeKey(wire.from(), "from");
        if (from.IsErr()) {
            return DecodeResult::Err(from.UnwrapErr());
        }
        envelope.from = std::move(from).Unwrap();
        if (!wire.to().empty()) {
            auto to = DecodeKey(wire.to(), "to");
            if (to.IsErr()) {
                return DecodeResult::Err(to.UnwrapErr());
            }
            envelope.to = std::move(to).Unwrap();
        }

        const double timestamp = wire.timestamp();
        if (!std::isfinite(timestamp) || timestamp < 0.0 ||
            timestamp > static_cast<double>(std::numeric_limits<int64_t>::max() / 2)) {
            return DecodeResult::Err(ProtocolFailure::Decode("Envelope timestamp is out of range"));
        }
        envelope.timestamp_ms = static_cast<int64_t>(timestamp);

        if (!wire.has_payload() || !wire.payload().has_struct_value()) {
            return DecodeResult::Err(ProtocolFailure::Decode("Envelope payload must be an object"));
        }
        std::string payload_json;
        if (const auto status = MessageToJsonString(wire.payload(), &payload_json); !status.ok()) {
            return DecodeResult::Err(
                ProtocolFailure::Decode(fmt::format("Cannot read payload: {}", status.ToString())));
        }

        envelope.payload = EmptyPayload(*type);
        JsonParseOptions strict;
        strict.ignore_unknown_fields = false;
        const auto parse_status = std::visit(
            [&payload_json, &strict](auto& message) { return JsonStringToMessage(payload_json, &message, strict); },
            envelope.payload);
        if (!parse_status.ok()) {
            return DecodeResult::Err(ProtocolFailure::Decode(
                fmt::format("Payload does not match '{}': {}", wire.type(), parse_status.ToString())));
        }

        if (auto valid = ValidatePayload(envelope.payload); valid.IsErr()) {
            return DecodeResult::Err(valid.UnwrapErr());
        }
        return DecodeResult::Ok(std::move(envelope));
    }
}
