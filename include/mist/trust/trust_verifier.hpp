#pragma once
#include "mist/core/result.hpp"
#include "mist/core/failures.hpp"
#include "mist/enums/trust_origin.hpp"
#include "mist/identity/identity_keys.hpp"
#include "protocol/trust.pb.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mist::protocol::trust {
using enums::TrustOrigin;

inline constexpr int64_t kVerificationValidityMs = 5 * 60 * 1000;
inline constexpr int64_t kInviteValidityMs = 24 * 60 * 60 * 1000;
inline constexpr size_t kVerificationCodeDigits = 6;
inline constexpr size_t kInviteCodeChars = 16;
inline constexpr std::string_view kInviteQueryParameter = "invite";

struct VerifiedPeer {
    std::vector<uint8_t> public_key;
    TrustOrigin trust_origin;
    /// Code to echo in the handshake so the issuer recognises the peer.
    std::string trust_code;
};

/**
 * @brief Signed face-to-face verification payloads and one-time invite links
 *
 * Both payloads carry an Ed25519 signature by the issuer over
 * "<publicKeyBase64>:<code>:<timestampMs>". A verification payload is valid
 * for five minutes after issue, an invite until its expiresAt (24 hours).
 *
 * The verifier also remembers the codes this node issued, so the first
 * handshake from a not-yet-known key can be accepted exactly once per code,
 * and the invite codes it has redeemed, so an invite link works only once.
 */
class TrustVerifier {
public:
    [[nodiscard]] Result<proto::protocol::VerificationPayload, ProtocolFailure> IssueVerification(
        const identity::IdentityKeys& identity,
        int64_t now_ms);

    [[nodiscard]] Result<proto::protocol::InvitePayload, ProtocolFailure> IssueInvite(
        const identity::IdentityKeys& identity,
        int64_t now_ms);

    /// Fails with Expired, SignatureInvalid or InvalidInput (malformed or unexpected key).
    [[nodiscard]] static Result<VerifiedPeer, ProtocolFailure> VerifyVerification(
        const proto::protocol::VerificationPayload& payload,
        int64_t now_ms,
        std::optional<std::span<const uint8_t>> expected_public_key = std::nullopt);

    /// Verifies and consumes an invite. A second redeem of the same code fails with ReplayAttack.
    [[nodiscard]] Result<VerifiedPeer, ProtocolFailure> RedeemInvite(
        const proto::protocol::InvitePayload& payload,
        int64_t now_ms);

    /// Consumes a code this node issued. nullopt when unknown, already used or expired.
    [[nodiscard]] std::optional<TrustOrigin> ConsumeIssuedCode(std::string_view code, int64_t now_ms);
    [[nodiscard]] bool HasOutstandingCodes(int64_t now_ms) const;

    [[nodiscard]] static std::string EncodeVerificationJson(const proto::protocol::VerificationPayload& payload);
    [[nodiscard]] static Result<proto::protocol::VerificationPayload, ProtocolFailure> ParseVerificationJson(
        std::string_view json);

    /// "<base_url>?invite=<percent-encoded base64 of the invite JSON>"
    [[nodiscard]] static std::string EncodeInviteLink(
        const proto::protocol::InvitePayload& payload,
        std::string_view base_url);
    [[nodiscard]] static Result<proto::protocol::InvitePayload, ProtocolFailure> ParseInviteLink(
        std::string_view link);

private:
    struct IssuedCode {
        TrustOrigin origin;
        int64_t expires_at_ms;
    };

    void PruneExpiredLocked(int64_t now_ms);

    std::map<std::string, IssuedCode, std::less<>> issued_codes_;
    std::set<std::string, std::less<>> redeemed_invites_;
    mutable std::mutex lock_;
};

}
