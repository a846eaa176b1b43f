#include <catch2/catch_test_macros.hpp>
#include "mist/identity/identity_keys.hpp"
#include "mist/crypto/sodium_interop.hpp"
#include "mist/protocol/constants.hpp"
#include "mist/utilities/key_encoding.hpp"
using namespace mist::protocol;
using namespace mist::protocol::identity;
using namespace mist::protocol::crypto;
TEST_CASE("IdentityKeys - Creation", "[identity][keygen]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto created = IdentityKeys::Create(5, 1234);
    REQUIRE(created.IsOk());
    auto keys = std::move(created).Unwrap();
    REQUIRE(keys.GetIdentityEd25519PublicCopy().size() == kEd25519PublicKeyBytes);
    REQUIRE(keys.GetIdentityX25519PublicCopy().size() == kX25519PublicKeyBytes);
    REQUIRE(keys.GetSignedPreKeyId() == kFirstSignedPreKeyId);
    REQUIRE(keys.OneTimePreKeyCount() == 5);
    REQUIRE(keys.CreatedAtMs() == 1234);
    SECTION("Published bundle carries the pool and verifies") {
        const auto bundle = keys.CreatePublicBundle();
        REQUIRE(bundle.identity_key().size() == kEd25519PublicKeyBytes);
        REQUIRE(bundle.one_time_prekeys_size() == 5);
        REQUIRE(IdentityKeys::VerifyBundle(bundle).IsOk());
    }
    SECTION("Two identities differ") {
        auto other = IdentityKeys::Create(0).Unwrap();
        REQUIRE(other.GetIdentityEd25519PublicCopy() != keys.GetIdentityEd25519PublicCopy());
        REQUIRE(other.OneTimePreKeyCount() == 0);
    }
    SECTION("Oversized pool is refused") {
        auto too_many = IdentityKeys::Create(kMaxOneTimeKeyCount + 1);
        REQUIRE(too_many.IsErr());
        REQUIRE(too_many.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}
TEST_CASE("IdentityKeys - Bundle verification rejects tampering", "[identity][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto keys = IdentityKeys::Create(1).Unwrap();
    auto bundle = keys.CreatePublicBundle();
    SECTION("Forged signed prekey") {
        const auto forged = SodiumInterop::GetRandomBytes(kX25519PublicKeyBytes);
        bundle.set_signed_prekey(forged.data(), forged.size());
        REQUIRE(IdentityKeys::VerifyBundle(bundle).UnwrapErr().type == ProtocolFailureType::SignatureInvalid);
    }
    SECTION("Short identity key") {
        bundle.set_identity_key("short");
        REQUIRE(IdentityKeys::VerifyBundle(bundle).UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
    SECTION("Bundle signed by someone else") {
        auto mallory = IdentityKeys::Create(0).Unwrap();
        const auto mallory_key = mallory.GetIdentityEd25519PublicCopy();
        bundle.set_identity_key(mallory_key.data(), mallory_key.size());
        REQUIRE(IdentityKeys::VerifyBundle(bundle).IsErr());
    }
}
TEST_CASE("IdentityKeys - One-time prekey pool", "[identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto keys = IdentityKeys::Create(3).Unwrap();
    const auto first_id = keys.CreatePublicBundle().one_time_prekeys(0).id();
    SECTION("Consuming removes the key once") {
        REQUIRE(keys.GetOneTimePreKeyPrivateCopy(first_id).IsOk());
        REQUIRE(keys.ConsumeOneTimePreKey(first_id).IsOk());
        REQUIRE(keys.OneTimePreKeyCount() == 2);
        REQUIRE(keys.GetOneTimePreKeyPrivateCopy(first_id).UnwrapErr().type == ProtocolFailureType::Handshake);
        REQUIRE(keys.ConsumeOneTimePreKey(first_id).IsErr());
    }
    SECTION("Replenish tops up with fresh ids") {
        REQUIRE(keys.ConsumeOneTimePreKey(first_id).IsOk());
        REQUIRE(keys.ReplenishOneTimePreKeys(3).IsOk());
        REQUIRE(keys.OneTimePreKeyCount() == 3);
        for (const auto& opk : keys.CreatePublicBundle().one_time_prekeys()) {
            REQUIRE(opk.id() != first_id);
        }
    }
    SECTION("Replenish below the current size is a no-op") {
        REQUIRE(keys.ReplenishOneTimePreKeys(1).IsOk());
        REQUIRE(keys.OneTimePreKeyCount() == 3);
    }
}
TEST_CASE("IdentityKeys - Signed prekey rotation", "[identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto keys = IdentityKeys::Create(0).Unwrap();
    const auto old_id = keys.GetSignedPreKeyId();
    const auto old_public = keys.GetSignedPreKeyPublicCopy();
    REQUIRE(keys.RotateSignedPreKey().IsOk());
    REQUIRE(keys.GetSignedPreKeyId() == old_id + 1);
    REQUIRE(keys.GetSignedPreKeyPublicCopy() != old_public);
    REQUIRE(keys.GetSignedPreKeyPrivateCopy(old_id).UnwrapErr().type == ProtocolFailureType::Handshake);
    REQUIRE(keys.GetSignedPreKeyPrivateCopy(old_id + 1).IsOk());
    REQUIRE(IdentityKeys::VerifyBundle(keys.CreatePublicBundle()).IsOk());
}
TEST_CASE("IdentityKeys - Record round trip preserves the identity", "[identity][persistence]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto keys = IdentityKeys::Create(4, 99).Unwrap();
    REQUIRE(keys.ConsumeOneTimePreKey(keys.CreatePublicBundle().one_time_prekeys(0).id()).IsOk());
    auto record = keys.ToRecord();
    REQUIRE(record.IsOk());
    auto restored = IdentityKeys::FromRecord(record.Unwrap());
    REQUIRE(restored.IsOk());
    auto& copy = restored.Unwrap();
    REQUIRE(copy.GetIdentityEd25519PublicCopy() == keys.GetIdentityEd25519PublicCopy());
    REQUIRE(copy.GetSignedPreKeyId() == keys.GetSignedPreKeyId());
    REQUIRE(copy.OneTimePreKeyCount() == 3);
    REQUIRE(copy.CreatedAtMs() == 99);
    SECTION("Signatures from the restored key verify under the original public key") {
        const auto message = utilities::BytesOf("restored");
        auto signature = copy.Sign(message);
        REQUIRE(signature.IsOk());
        REQUIRE(SodiumInterop::VerifyDetached(keys.GetIdentityEd25519PublicCopy(), message, signature.Unwrap()));
    }
    SECTION("Record with a broken signature is refused") {
        auto broken = record.Unwrap();
        std::string signature = broken.signed_pre_key_signature();
        signature[0] = static_cast<char>(signature[0] ^ 0x01);
        broken.set_signed_pre_key_signature(signature);
        REQUIRE(IdentityKeys::FromRecord(broken).UnwrapErr().type == ProtocolFailureType::SignatureInvalid);
    }
    SECTION("Record with truncated keys is refused") {
        auto broken = record.Unwrap();
        broken.set_ed25519_secret("short");
        REQUIRE(IdentityKeys::FromRecord(broken).UnwrapErr().type == ProtocolFailureType::Decode);
    }
}
