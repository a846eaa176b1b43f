#include "mist/trust/trust_verifier.hpp"
#include "mist/protocol/constants.hpp"
#include "mist/crypto/sodium_interop.hpp"
#include "mist/utilities/key_encoding.hpp"
#include "mist/core/logging.hpp"
#include <google/protobuf/util/json_util.h>
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <string>

namespace mist::protocol::trust {
    using crypto::SodiumInterop;

    namespace {
        std::string SignedText(std::string_view public_key_b64, std::string_view code, const int64_t timestamp_ms) {
            return fmt::format("{}:{}:{}", public_key_b64, code, timestamp_ms);
        }

        std::string GenerateVerificationCode() {
            const auto bytes = SodiumInterop::GetRandomBytes(3);
            const uint32_t value = (static_cast<uint32_t>(bytes[0]) << 16) |
                                   (static_cast<uint32_t>(bytes[1]) << 8) |
                                   static_cast<uint32_t>(bytes[2]);
            return fmt::format("{:06d}", value % 1'000'000);
        }

        std::string GenerateInviteCode() {
            constexpr std::string_view kAlphabet =
                "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
            std::string code;
            code.reserve(kInviteCodeChars);
            for (size_t i = 0; i < kInviteCodeChars; ++i) {
                code.push_back(kAlphabet[SodiumInterop::GenerateRandomUInt32(
                    static_cast<uint32_t>(kAlphabet.size()))]);
            }
            return code;
        }

        Result<VerifiedPeer, ProtocolFailure> CheckSignature(
            const std::string& public_key_b64,
            std::string_view code,
            const int64_t timestamp_ms,
            const std::string& signature_b64,
            const TrustOrigin origin) {
            auto public_key = utilities::FromBase64(public_key_b64);
            if (public_key.IsErr() || public_key.Unwrap().size() != kEd25519PublicKeyBytes) {
                return Result<VerifiedPeer, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput("Payload public key is not a base64 Ed25519 key"));
            }
            auto signature = utilities::FromBase64(signature_b64);
            if (signature.IsErr()) {
                return Result<VerifiedPeer, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput("Payload signature is not base64"));
            }
            const std::string text = SignedText(public_key_b64, code, timestamp_ms);
            if (!SodiumInterop::VerifyDetached(public_key.Unwrap(), utilities::BytesOf(text), signature.Unwrap())) {
                return Result<VerifiedPeer, ProtocolFailure>::Err(
                    ProtocolFailure::SignatureInvalid("Payload signature verification failed"));
            }
            return Result<VerifiedPeer, ProtocolFailure>::Ok(
                VerifiedPeer{std::move(public_key).Unwrap(), origin, std::string(code)});
        }

        std::string PercentEncode(std::string_view text) {
            std::string out;
            for (const char c : text) {
                const bool unreserved = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                                        (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
                if (unreserved) {
                    out.push_back(c);
                } else {
                    out += fmt::format("%{:02X}", static_cast<unsigned char>(c));
                }
            }
            return out;
        }

        Result<std::string, ProtocolFailure> PercentDecode(std::string_view text) {
            std::string out;
            for (size_t i = 0; i < text.size(); ++i) {
                if (text[i] == '%') {
                    if (i + 2 >= text.size()) {
                        return Result<std::string, ProtocolFailure>::Err(
                            ProtocolFailure::Decode("Truncated percent escape"));
                    }
                    const auto hex = std::string(text.substr(i + 1, 2));
                    if (!std::isxdigit(static_cast<unsigned char>(hex[0])) ||
                        !std::isxdigit(static_cast<unsigned char>(hex[1]))) {
                        return Result<std::string, ProtocolFailure>::Err(
                            ProtocolFailure::Decode("Invalid percent escape"));
                    }
                    out.push_back(static_cast<char>(std::stoi(hex, nullptr, 16)));
                    i += 2;
                } else if (text[i] == '+') {
                    out.push_back(' ');
                } else {
                    out.push_back(text[i]);
                }
            }
            return Result<std::string, ProtocolFailure>::Ok(std::move(out));
        }

        template<typename TMessage>
        Result<TMessage, ProtocolFailure> ParseJson(std::string_view json, std::string_view what) {
            TMessage message;
            google::protobuf::util::JsonParseOptions options;
            options.ignore_unknown_fields = true;
            const auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &message, options);
            if (!status.ok()) {
                return Result<TMessage, ProtocolFailure>::Err(
                    ProtocolFailure::Decode(fmt::format("Invalid {} JSON: {}", what, status.ToString())));
            }
            return Result<TMessage, ProtocolFailure>::Ok(std::move(message));
        }

        std::string ToJson(const google::protobuf::Message& message) {
            std::string json;
            const auto status = google::protobuf::util::MessageToJsonString(message, &json);
            if (!status.ok()) {
                MIST_LOG_ERROR("Failed to encode {} as JSON: {}", message.GetTypeName(), status.ToString());
                return {};
            }
            return json;
        }
    }

    Result<proto::protocol::VerificationPayload, ProtocolFailure> TrustVerifier::IssueVerification(
        const identity::IdentityKeys& identity,
        const int64_t now_ms) {
        const std::string public_key_b64 = utilities::ToBase64(identity.GetIdentityEd25519PublicCopy());
        const std::string code = GenerateVerificationCode();
        auto signature = identity.Sign(utilities::BytesOf(SignedText(public_key_b64, code, now_ms)));
        if (signature.IsErr()) {
            return Result<proto::protocol::VerificationPayload, ProtocolFailure>::Err(signature.UnwrapErr());
        }
        proto::protocol::VerificationPayload payload;
        payload.set_public_key(public_key_b64);
        payload.set_verification_code(code);
        payload.set_timestamp(static_cast<double>(now_ms));
        payload.set_signature(utilities::ToBase64(signature.Unwrap()));
        {
            std::lock_guard<std::mutex> guard(lock_);
            PruneExpiredLocked(now_ms);
            issued_codes_[code] = IssuedCode{TrustOrigin::DirectVerification, now_ms + kVerificationValidityMs};
        }
        return Result<proto::protocol::VerificationPayload, ProtocolFailure>::Ok(std::move(payload));
    }

    Result<proto::protocol::InvitePayload, ProtocolFailure> TrustVerifier::IssueInvite(
        const identity::IdentityKeys& identity,
        const int64_t now_ms) {
        const std::string public_key_b64 = utilities::ToBase64(identity.GetIdentityEd25519PublicCopy());
        const std::string code = GenerateInviteCode();
        const int64_t expires_at = now_ms + kInviteValidityMs;
        auto signature = identity.Sign(utilities::BytesOf(SignedText(public_key_b64, code, expires_at)));
        if (signature.IsErr()) {
            return Result<proto::protocol::InvitePayload, ProtocolFailure>::Err(signature.UnwrapErr());
        }
        proto::protocol::InvitePayload payload;
        payload.set_inviter_public_key(public_key_b64);
        payload.set_invite_code(code);
        payload.set_expires_at(static_cast<double>(expires_at));
        payload.set_signature(utilities::ToBase64(signature.Unwrap()));
        {
            std::lock_guard<std::mutex> guard(lock_);
            PruneExpiredLocked(now_ms);
            issued_codes_[code] = IssuedCode{TrustOrigin::SharedLink, expires_at};
        }
        return Result<proto::protocol::InvitePayload, ProtocolFailure>::Ok(std::move(payload));
    }

    Result<VerifiedPeer, ProtocolFailure> TrustVerifier::VerifyVerification(
        const proto::protocol::VerificationPayload& payload,
        const int64_t now_ms,
        std::optional<std::span<const uint8_t>> expected_public_key) {
        if (payload.public_key().empty() || payload.verification_code().empty() ||
            payload.signature().empty() || payload.timestamp() <= 0) {
            return Result<VerifiedPeer, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Verification payload is missing fields"));
        }
        const auto issued_at = static_cast<int64_t>(payload.timestamp());
        if (now_ms - issued_at > kVerificationValidityMs) {
            return Result<VerifiedPeer, ProtocolFailure>::Err(
                ProtocolFailure::Expired("Verification code expired"));
        }
        auto verified = CheckSignature(payload.public_key(), payload.verification_code(), issued_at,
                                       payload.signature(), TrustOrigin::DirectVerification);
        if (verified.IsErr()) {
            return verified;
        }
        if (expected_public_key.has_value() &&
            utilities::CompareKeys(verified.Unwrap().public_key, *expected_public_key) != 0) {
            return Result<VerifiedPeer, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Verification payload is for a different key"));
        }
        return verified;
    }

    Result<VerifiedPeer, ProtocolFailure> TrustVerifier::RedeemInvite(
        const proto::protocol::InvitePayload& payload,
        const int64_t now_ms) {
        if (payload.inviter_public_key().empty() || payload.invite_code().empty() ||
            payload.signature().empty() || payload.expires_at() <= 0) {
            return Result<VerifiedPeer, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Invite payload is missing fields"));
        }
        {
            std::lock_guard<std::mutex> guard(lock_);
            if (redeemed_invites_.count(payload.invite_code()) > 0) {
                return Result<VerifiedPeer, ProtocolFailure>::Err(
                    ProtocolFailure::ReplayAttack("Invite code already used"));
            }
        }
        const auto expires_at = static_cast<int64_t>(payload.expires_at());
        if (now_ms > expires_at) {
            return Result<VerifiedPeer, ProtocolFailure>::Err(ProtocolFailure::Expired("Invite link expired"));
        }
        auto verified = CheckSignature(payload.inviter_public_key(), payload.invite_code(), expires_at,
                                       payload.signature(), TrustOrigin::SharedLink);
        if (verified.IsErr()) {
            return verified;
        }
        std::lock_guard<std::mutex> guard(lock_);
        if (!redeemed_invites_.insert(payload.invite_code()).second) {
            return Result<VerifiedPeer, ProtocolFailure>::Err(
                ProtocolFailure::ReplayAttack("Invite code already used"));
        }
        return verified;
    }

    std::optional<TrustOrigin> TrustVerifier::ConsumeIssuedCode(std::string_view code, const int64_t now_ms) {
        std::lock_guard<std::mutex> guard(lock_);
        PruneExpiredLocked(now_ms);
        const auto it = issued_codes_.find(code);
        if (it == issued_codes_.end()) {
            return std::nullopt;
        }
        const TrustOrigin origin = it->second.origin;
        issued_codes_.erase(it);
        return origin;
    }

    bool TrustVerifier::HasOutstandingCodes(const int64_t now_ms) const {
        std::lock_guard<std::mutex> guard(lock_);
        return std::any_of(issued_codes_.begin(), issued_codes_.end(),
                           [now_ms](const auto& entry) { return entry.second.expires_at_ms >= now_ms; });
    }

    void TrustVerifier::PruneExpiredLocked(const int64_t now_ms) {
        for (auto it = issued_codes_.begin(); it != issued_codes_.end();) {
            if (it->second.expires_at_ms < now_ms) {
                it = issued_codes_.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::string TrustVerifier::EncodeVerificationJson(const proto::protocol::VerificationPayload& payload) {
        return ToJson(payload);
    }

    Result<proto::protocol::VerificationPayload, ProtocolFailure> TrustVerifier::ParseVerificationJson(
        std::string_view json) {
        return ParseJson<proto::protocol::VerificationPayload>(json, "verification");
    }

    std::string TrustVerifier::EncodeInviteLink(
        const proto::protocol::InvitePayload& payload,
        std::string_view base_url) {
        const std::string json = ToJson(payload);
        return fmt::format("{}?{}={}", base_url, kInviteQueryParameter,
                           PercentEncode(utilities::ToBase64(utilities::BytesOf(json))));
    }

    Result<proto::protocol::InvitePayload, ProtocolFailure> TrustVerifier::ParseInviteLink(std::string_view link) {
        using InviteResult = Result<proto::protocol::InvitePayload, ProtocolFailure>;
        const auto query_start = link.find('?');
        if (query_start == std::string_view::npos) {
            return InviteResult::Err(ProtocolFailure::Decode("Invite link has no query"));
        }
        std::string_view query = link.substr(query_start + 1);
        const auto fragment = query.find('#');
        if (fragment != std::string_view::npos) {
            query = query.substr(0, fragment);
        }
        while (!query.empty()) {
            const auto amp = query.find('&');
            const std::string_view pair = query.substr(0, amp);
            const auto eq = pair.find('=');
            if (eq != std::string_view::npos && pair.substr(0, eq) == kInviteQueryParameter) {
                auto decoded = PercentDecode(pair.substr(eq + 1));
                if (decoded.IsErr()) {
                    return InviteResult::Err(decoded.UnwrapErr());
                }
                auto json_bytes = utilities::FromBase64(decoded.Unwrap());
                if (json_bytes.IsErr()) {
                    return InviteResult::Err(json_bytes.UnwrapErr());
                }
                const auto& bytes = json_bytes.Unwrap();
                return ParseJson<proto::protocol::InvitePayload>(
                    std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()), "invite");
            }
            if (amp == std::string_view::npos) {
                break;
            }
            query = query.substr(amp + 1);
        }
        return InviteResult::Err(ProtocolFailure::Decode("Invite link has no invite parameter"));
    }
}
