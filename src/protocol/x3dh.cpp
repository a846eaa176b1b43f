#include "mist/protocol/x3dh.hpp"
#include "mist/protocol/constants.hpp"
#include "mist/crypto/sodium_interop.hpp"
#include "mist/crypto/hkdf.hpp"
#include "mist/core/logging.hpp"

namespace mist::protocol {
    using crypto::SodiumInterop;
    using crypto::Hkdf;

    namespace {
        void WipeBytes(std::vector<uint8_t>& bytes) {
            auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(bytes));
            (void) _wipe;
        }

        std::vector<uint8_t> BytesFromString(const std::string& value) {
            return {value.begin(), value.end()};
        }

        Result<Unit, ProtocolFailure> AppendDh(
            std::vector<uint8_t>& dh_concat,
            std::span<const uint8_t> private_key,
            std::span<const uint8_t> public_key,
            std::string_view label) {
            auto dh_result = SodiumInterop::ComputeX25519(private_key, public_key, label);
            if (dh_result.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(dh_result.UnwrapErr());
            }
            auto dh = std::move(dh_result).Unwrap();
            dh_concat.insert(dh_concat.end(), dh.begin(), dh.end());
            WipeBytes(dh);
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
    }

    Result<std::vector<uint8_t>, ProtocolFailure> X3dh::DeriveSharedSecret(std::vector<uint8_t>& dh_concat) {
        auto shared = Hkdf::DeriveKeyBytes(dh_concat, kSharedSecretBytes, {}, kX3dhInfo);
        WipeBytes(dh_concat);
        return shared;
    }

    Result<X3dh::InitiatorAgreement, ProtocolFailure> X3dh::InitiatorAgree(
        const identity::IdentityKeys& local_identity,
        const proto::protocol::PrekeyBundle& peer_bundle) {
        using AgreementResult = Result<InitiatorAgreement, ProtocolFailure>;

        if (auto verified = identity::IdentityKeys::VerifyBundle(peer_bundle); verified.IsErr()) {
            return AgreementResult::Err(verified.UnwrapErr());
        }
        auto peer_identity_x = SodiumInterop::ConvertEd25519PublicToX25519(
            BytesFromString(peer_bundle.identity_key()));
        if (peer_identity_x.IsErr()) {
            return AgreementResult::Err(peer_identity_x.UnwrapErr());
        }
        const auto peer_ik = std::move(peer_identity_x).Unwrap();
        const auto peer_spk = BytesFromString(peer_bundle.signed_prekey());

        auto identity_secret_result = local_identity.GetIdentityX25519PrivateKeyCopy();
        if (identity_secret_result.IsErr()) {
            return AgreementResult::Err(identity_secret_result.UnwrapErr());
        }
        auto identity_secret = std::move(identity_secret_result).Unwrap();

        auto ephemeral_result = SodiumInterop::GenerateX25519KeyPair(kPurposeEphemeralX25519);
        if (ephemeral_result.IsErr()) {
            WipeBytes(identity_secret);
            return AgreementResult::Err(ephemeral_result.UnwrapErr());
        }
        auto [ephemeral_handle, ephemeral_public] = std::move(ephemeral_result).Unwrap();
        auto ephemeral_read = ephemeral_handle.ReadBytes();
        if (ephemeral_read.IsErr()) {
            WipeBytes(identity_secret);
            return AgreementResult::Err(ProtocolFailure::FromSodiumFailure(ephemeral_read.UnwrapErr()));
        }
        auto ephemeral_secret = std::move(ephemeral_read).Unwrap();

        std::vector<uint8_t> dh_concat(kX3dhPadBytes, kX3dhPadByte);
        std::optional<uint32_t> used_opk_id;
        auto run = [&]() -> Result<Unit, ProtocolFailure> {
            if (auto r = AppendDh(dh_concat, identity_secret, peer_spk, "DH1"); r.IsErr()) {
                return r;
            }
            if (auto r = AppendDh(dh_concat, ephemeral_secret, peer_ik, "DH2"); r.IsErr()) {
                return r;
            }
            if (auto r = AppendDh(dh_concat, ephemeral_secret, peer_spk, "DH3"); r.IsErr()) {
                return r;
            }
            if (peer_bundle.one_time_prekeys_size() > 0) {
                const auto& opk = peer_bundle.one_time_prekeys(0);
                if (auto r = AppendDh(dh_concat, ephemeral_secret, BytesFromString(opk.public_key()), "DH4");
                    r.IsErr()) {
                    return r;
                }
                used_opk_id = opk.id();
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        };
        auto dh_outcome = run();
        WipeBytes(identity_secret);
        WipeBytes(ephemeral_secret);
        if (dh_outcome.IsErr()) {
            WipeBytes(dh_concat);
            return AgreementResult::Err(dh_outcome.UnwrapErr());
        }

        auto shared = DeriveSharedSecret(dh_concat);
        if (shared.IsErr()) {
            return AgreementResult::Err(shared.UnwrapErr());
        }
        MIST_LOG_DEBUG("X3DH initiator agreement with {} (spk {}, opk {})",
                       logging::ShortKey(BytesFromString(peer_bundle.identity_key())),
                       peer_bundle.signed_prekey_id(),
                       used_opk_id ? std::to_string(*used_opk_id) : std::string("none"));

        InitiatorAgreement agreement;
        agreement.shared_secret = std::move(shared).Unwrap();
        agreement.ephemeral_public = std::move(ephemeral_public);
        agreement.peer_signed_prekey_public = peer_spk;
        agreement.signed_prekey_id = peer_bundle.signed_prekey_id();
        agreement.used_one_time_prekey_id = used_opk_id;
        return AgreementResult::Ok(std::move(agreement));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> X3dh::ResponderAgree(
        const identity::IdentityKeys& local_identity,
        std::span<const uint8_t> peer_identity_ed25519,
        std::span<const uint8_t> peer_ephemeral_public,
        const uint32_t signed_prekey_id,
        const std::optional<uint32_t> one_time_prekey_id) {
        using SecretResult = Result<std::vector<uint8_t>, ProtocolFailure>;

        if (peer_ephemeral_public.size() != kX25519PublicKeyBytes) {
            return SecretResult::Err(ProtocolFailure::InvalidInput("Peer ephemeral key must be 32 bytes"));
        }
        auto peer_identity_x = SodiumInterop::ConvertEd25519PublicToX25519(peer_identity_ed25519);
        if (peer_identity_x.IsErr()) {
            return SecretResult::Err(peer_identity_x.UnwrapErr());
        }
        const auto peer_ik = std::move(peer_identity_x).Unwrap();

        auto spk_result = local_identity.GetSignedPreKeyPrivateCopy(signed_prekey_id);
        if (spk_result.IsErr()) {
            return spk_result;
        }
        auto spk_secret = std::move(spk_result).Unwrap();

        std::optional<std::vector<uint8_t>> opk_secret;
        if (one_time_prekey_id.has_value()) {
            auto opk_result = local_identity.GetOneTimePreKeyPrivateCopy(*one_time_prekey_id);
            if (opk_result.IsErr()) {
                WipeBytes(spk_secret);
                return opk_result;
            }
            opk_secret = std::move(opk_result).Unwrap();
        }

        auto identity_secret_result = local_identity.GetIdentityX25519PrivateKeyCopy();
        if (identity_secret_result.IsErr()) {
            WipeBytes(spk_secret);
            if (opk_secret) {
                WipeBytes(*opk_secret);
            }
            return identity_secret_result;
        }
        auto identity_secret = std::move(identity_secret_result).Unwrap();

        std::vector<uint8_t> dh_concat(kX3dhPadBytes, kX3dhPadByte);
        auto run = [&]() -> Result<Unit, ProtocolFailure> {
            if (auto r = AppendDh(dh_concat, spk_secret, peer_ik, "DH1"); r.IsErr()) {
                return r;
            }
            if (auto r = AppendDh(dh_concat, identity_secret, peer_ephemeral_public, "DH2"); r.IsErr()) {
                return r;
            }
            if (auto r = AppendDh(dh_concat, spk_secret, peer_ephemeral_public, "DH3"); r.IsErr()) {
                return r;
            }
            if (opk_secret) {
                if (auto r = AppendDh(dh_concat, *opk_secret, peer_ephemeral_public, "DH4"); r.IsErr()) {
                    return r;
                }
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        };
        auto dh_outcome = run();
        WipeBytes(spk_secret);
        WipeBytes(identity_secret);
        if (opk_secret) {
            WipeBytes(*opk_secret);
        }
        if (dh_outcome.IsErr()) {
            WipeBytes(dh_concat);
            return SecretResult::Err(dh_outcome.UnwrapErr());
        }
        return DeriveSharedSecret(dh_concat);
    }
}
