#include <catch2/catch_test_macros.hpp>
#include "mist/trust/trust_verifier.hpp"
#include "mist/crypto/sodium_interop.hpp"
#include "mist/utilities/key_encoding.hpp"
#include <cctype>
using namespace mist::protocol;
using namespace mist::protocol::trust;
using mist::protocol::identity::IdentityKeys;
namespace {
    constexpr int64_t kNow = 1'700'000'000'000;
}
TEST_CASE("TrustVerifier - Face-to-face verification", "[trust][verification]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto bob = IdentityKeys::Create(0).Unwrap();
    const auto bob_key = bob.GetIdentityEd25519PublicCopy();
    TrustVerifier issuer;
    auto issued = issuer.IssueVerification(bob, kNow);
    REQUIRE(issued.IsOk());
    const auto payload = issued.Unwrap();
    REQUIRE(payload.verification_code().size() == kVerificationCodeDigits);
    for (const char c : payload.verification_code()) {
        REQUIRE(std::isdigit(static_cast<unsigned char>(c)));
    }
    REQUIRE(payload.public_key() == utilities::ToBase64(bob_key));
    SECTION("Valid payload yields the issuer key") {
        auto verified = TrustVerifier::VerifyVerification(payload, kNow + 1000);
        REQUIRE(verified.IsOk());
        REQUIRE(verified.Unwrap().public_key == bob_key);
        REQUIRE(verified.Unwrap().trust_origin == TrustOrigin::DirectVerification);
        REQUIRE(verified.Unwrap().trust_code == payload.verification_code());
    }
    SECTION("Valid for five minutes") {
        REQUIRE(TrustVerifier::VerifyVerification(payload, kNow + kVerificationValidityMs).IsOk());
        auto late = TrustVerifier::VerifyVerification(payload, kNow + kVerificationValidityMs + 1);
        REQUIRE(late.UnwrapErr().type == ProtocolFailureType::Expired);
    }
    SECTION("Altered code breaks the signature") {
        auto altered = payload;
        altered.set_verification_code(payload.verification_code() == "000000" ? "000001" : "000000");
        REQUIRE(TrustVerifier::VerifyVerification(altered, kNow).UnwrapErr().type ==
                ProtocolFailureType::SignatureInvalid);
    }
    SECTION("Expected key mismatch") {
        const auto other = crypto::SodiumInterop::GetRandomBytes(32);
        auto verified = TrustVerifier::VerifyVerification(payload, kNow, std::span<const uint8_t>(other));
        REQUIRE(verified.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
    SECTION("Missing fields") {
        auto empty = payload;
        empty.clear_signature();
        REQUIRE(TrustVerifier::VerifyVerification(empty, kNow).UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
    SECTION("JSON form parses back") {
        const auto json = TrustVerifier::EncodeVerificationJson(payload);
        REQUIRE(json.find("verificationCode") != std::string::npos);
        auto parsed = TrustVerifier::ParseVerificationJson(json);
        REQUIRE(parsed.IsOk());
        REQUIRE(TrustVerifier::VerifyVerification(parsed.Unwrap(), kNow).IsOk());
        REQUIRE(TrustVerifier::ParseVerificationJson("{not json").UnwrapErr().type == ProtocolFailureType::Decode);
    }
}
TEST_CASE("TrustVerifier - Invite links", "[trust][invite]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto alice = IdentityKeys::Create(0).Unwrap();
    TrustVerifier issuer;
    TrustVerifier redeemer;
    auto invite = issuer.IssueInvite(alice, kNow).Unwrap();
    REQUIRE(invite.invite_code().size() == kInviteCodeChars);
    REQUIRE(static_cast<int64_t>(invite.expires_at()) == kNow + kInviteValidityMs);
    SECTION("Link round trip and single redemption") {
        const auto link = TrustVerifier::EncodeInviteLink(invite, "https://mist.example/add");
        REQUIRE(link.rfind("https://mist.example/add?invite=", 0) == 0);
        auto parsed = TrustVerifier::ParseInviteLink(link);
        REQUIRE(parsed.IsOk());
        auto redeemed = redeemer.RedeemInvite(parsed.Unwrap(), kNow + 60'000);
        REQUIRE(redeemed.IsOk());
        REQUIRE(redeemed.Unwrap().public_key == alice.GetIdentityEd25519PublicCopy());
        REQUIRE(redeemed.Unwrap().trust_origin == TrustOrigin::SharedLink);
        REQUIRE(redeemer.RedeemInvite(parsed.Unwrap(), kNow + 60'000).UnwrapErr().type ==
                ProtocolFailureType::ReplayAttack);
    }
    SECTION("Expired invite") {
        REQUIRE(redeemer.RedeemInvite(invite, kNow + kInviteValidityMs + 1).UnwrapErr().type ==
                ProtocolFailureType::Expired);
    }
    SECTION("Forged expiry breaks the signature") {
        auto forged = invite;
        forged.set_expires_at(invite.expires_at() + 3'600'000);
        REQUIRE(redeemer.RedeemInvite(forged, kNow).UnwrapErr().type == ProtocolFailureType::SignatureInvalid);
    }
    SECTION("Malformed links") {
        REQUIRE(TrustVerifier::ParseInviteLink("https://mist.example/add").IsErr());
        REQUIRE(TrustVerifier::ParseInviteLink("https://mist.example/add?other=1").IsErr());
        REQUIRE(TrustVerifier::ParseInviteLink("https://mist.example/add?invite=%Z1").IsErr());
    }
    SECTION("Other query parameters are ignored") {
        const auto link = TrustVerifier::EncodeInviteLink(invite, "https://mist.example/add");
        const auto query = link.substr(link.find('?') + 1);
        auto parsed = TrustVerifier::ParseInviteLink("https://mist.example/add?ref=qr&" + query + "#top");
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap().invite_code() == invite.invite_code());
    }
}
TEST_CASE("TrustVerifier - Issued codes are consumed once", "[trust]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto bob = IdentityKeys::Create(0).Unwrap();
    TrustVerifier verifier;
    REQUIRE_FALSE(verifier.HasOutstandingCodes(kNow));
    const auto verification = verifier.IssueVerification(bob, kNow).Unwrap();
    const auto invite = verifier.IssueInvite(bob, kNow).Unwrap();
    REQUIRE(verifier.HasOutstandingCodes(kNow));
    SECTION("Each code once, with its origin") {
        REQUIRE(verifier.ConsumeIssuedCode(verification.verification_code(), kNow) == TrustOrigin::DirectVerification);
        REQUIRE_FALSE(verifier.ConsumeIssuedCode(verification.verification_code(), kNow).has_value());
        REQUIRE(verifier.ConsumeIssuedCode(invite.invite_code(), kNow) == TrustOrigin::SharedLink);
        REQUIRE_FALSE(verifier.HasOutstandingCodes(kNow));
    }
    SECTION("Expired codes are not accepted") {
        const int64_t later = kNow + kVerificationValidityMs + 1;
        REQUIRE_FALSE(verifier.ConsumeIssuedCode(verification.verification_code(), later).has_value());
        REQUIRE(verifier.ConsumeIssuedCode(invite.invite_code(), later) == TrustOrigin::SharedLink);
    }
    SECTION("Unknown code") {
        REQUIRE_FALSE(verifier.ConsumeIssuedCode("nope", kNow).has_value());
    }
}
