#include "mist/identity/identity_keys.hpp"
#include "mist/protocol/constants.hpp"
#include "mist/crypto/sodium_interop.hpp"
#include "mist/core/logging.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <limits>
#include <mutex>

namespace mist::protocol::identity {
    using crypto::SodiumInterop;

    namespace {
        void WipeBytes(std::vector<uint8_t>& bytes) {
            auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(bytes));
            (void) _wipe;
        }

        std::vector<uint8_t> BytesFromString(const std::string& value) {
            return {value.begin(), value.end()};
        }

        Result<std::vector<uint8_t>, ProtocolFailure> ReadHandle(const SecureMemoryHandle& handle) {
            auto read_result = handle.ReadBytes();
            if (read_result.IsErr()) {
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                    ProtocolFailure::FromSodiumFailure(read_result.UnwrapErr()));
            }
            return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(read_result).Unwrap());
        }

        Result<SecureMemoryHandle, ProtocolFailure> HandleFromBytes(std::span<const uint8_t> bytes) {
            auto handle_result = SecureMemoryHandle::FromBytes(bytes);
            if (handle_result.IsErr()) {
                return Result<SecureMemoryHandle, ProtocolFailure>::Err(
                    ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
            }
            return Result<SecureMemoryHandle, ProtocolFailure>::Ok(std::move(handle_result).Unwrap());
        }
    }

    Result<IdentityKeys, ProtocolFailure> IdentityKeys::Create(
        const uint32_t one_time_key_count,
        const int64_t created_at_ms) {
        if (one_time_key_count > kMaxOneTimeKeyCount) {
            return Result<IdentityKeys, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(fmt::format(
                    "One-time prekey count {} exceeds maximum {}", one_time_key_count, kMaxOneTimeKeyCount)));
        }
        auto ed_result = SodiumInterop::GenerateEd25519KeyPair();
        if (ed_result.IsErr()) {
            return Result<IdentityKeys, ProtocolFailure>::Err(ed_result.UnwrapErr());
        }
        auto [ed_secret, ed_public] = std::move(ed_result).Unwrap();

        auto x_public_result = SodiumInterop::ConvertEd25519PublicToX25519(ed_public);
        if (x_public_result.IsErr()) {
            WipeBytes(ed_secret);
            return Result<IdentityKeys, ProtocolFailure>::Err(x_public_result.UnwrapErr());
        }
        auto handle_result = HandleFromBytes(ed_secret);
        WipeBytes(ed_secret);
        if (handle_result.IsErr()) {
            return Result<IdentityKeys, ProtocolFailure>::Err(handle_result.UnwrapErr());
        }

        IdentityKeys keys;
        keys.lock_ = std::make_unique<std::shared_mutex>();
        keys.identity_ed25519_secret_key_handle_ = std::move(handle_result).Unwrap();
        keys.identity_ed25519_public_ = std::move(ed_public);
        keys.identity_x25519_public_ = std::move(x_public_result).Unwrap();
        keys.created_at_ms_ = created_at_ms;

        if (auto spk = keys.GenerateSignedPreKeyLocked(kFirstSignedPreKeyId); spk.IsErr()) {
            return Result<IdentityKeys, ProtocolFailure>::Err(spk.UnwrapErr());
        }
        auto opk_result = GenerateOneTimePreKeys(1, one_time_key_count);
        if (opk_result.IsErr()) {
            return Result<IdentityKeys, ProtocolFailure>::Err(opk_result.UnwrapErr());
        }
        keys.one_time_pre_keys_ = std::move(opk_result).Unwrap();
        keys.next_one_time_pre_key_id_ = one_time_key_count + 1;

        MIST_LOG_INFO("Generated identity {} with {} one-time prekeys",
                      logging::ShortKey(keys.identity_ed25519_public_), one_time_key_count);
        return Result<IdentityKeys, ProtocolFailure>::Ok(std::move(keys));
    }

    Result<IdentityKeys, ProtocolFailure> IdentityKeys::FromRecord(
        const proto::protocol::IdentityRecord& record) {
        if (record.ed25519_secret().size() != kEd25519SecretKeyBytes ||
            record.ed25519_public().size() != kEd25519PublicKeyBytes) {
            return Result<IdentityKeys, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Identity record has invalid Ed25519 key sizes"));
        }
        if (record.signed_pre_key_private().size() != kX25519PrivateKeyBytes ||
            record.signed_pre_key_public().size() != kX25519PublicKeyBytes ||
            record.signed_pre_key_signature().size() != kEd25519SignatureBytes) {
            return Result<IdentityKeys, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Identity record has invalid signed prekey material"));
        }
        auto ed_public = BytesFromString(record.ed25519_public());
        if (!SodiumInterop::VerifyDetached(ed_public,
                                           BytesFromString(record.signed_pre_key_public()),
                                           BytesFromString(record.signed_pre_key_signature()))) {
            return Result<IdentityKeys, ProtocolFailure>::Err(
                ProtocolFailure::SignatureInvalid("Stored signed prekey signature does not verify"));
        }
        auto x_public_result = SodiumInterop::ConvertEd25519PublicToX25519(ed_public);
        if (x_public_result.IsErr()) {
            return Result<IdentityKeys, ProtocolFailure>::Err(x_public_result.UnwrapErr());
        }

        auto ed_secret = BytesFromString(record.ed25519_secret());
        auto ed_handle = HandleFromBytes(ed_secret);
        WipeBytes(ed_secret);
        if (ed_handle.IsErr()) {
            return Result<IdentityKeys, ProtocolFailure>::Err(ed_handle.UnwrapErr());
        }
        auto spk_secret = BytesFromString(record.signed_pre_key_private());
        auto spk_handle = HandleFromBytes(spk_secret);
        WipeBytes(spk_secret);
        if (spk_handle.IsErr()) {
            return Result<IdentityKeys, ProtocolFailure>::Err(spk_handle.UnwrapErr());
        }

        IdentityKeys keys;
        keys.lock_ = std::make_unique<std::shared_mutex>();
        keys.identity_ed25519_secret_key_handle_ = std::move(ed_handle).Unwrap();
        keys.identity_ed25519_public_ = std::move(ed_public);
        keys.identity_x25519_public_ = std::move(x_public_result).Unwrap();
        keys.signed_pre_key_id_ = record.signed_pre_key_id();
        keys.signed_pre_key_secret_key_handle_ = std::move(spk_handle).Unwrap();
        keys.signed_pre_key_public_ = BytesFromString(record.signed_pre_key_public());
        keys.signed_pre_key_signature_ = BytesFromString(record.signed_pre_key_signature());
        keys.next_one_time_pre_key_id_ = record.next_one_time_pre_key_id();
        keys.created_at_ms_ = record.created_at_ms();

        for (const auto& opk : record.one_time_pre_keys()) {
            if (opk.private_key().size() != kX25519PrivateKeyBytes ||
                opk.public_key().size() != kX25519PublicKeyBytes) {
                return Result<IdentityKeys, ProtocolFailure>::Err(
                    ProtocolFailure::Decode(fmt::format("One-time prekey {} has invalid sizes", opk.id())));
            }
            auto opk_secret = BytesFromString(opk.private_key());
            auto opk_handle = HandleFromBytes(opk_secret);
            WipeBytes(opk_secret);
            if (opk_handle.IsErr()) {
                return Result<IdentityKeys, ProtocolFailure>::Err(opk_handle.UnwrapErr());
            }
            keys.one_time_pre_keys_.push_back(OneTimePreKey{
                opk.id(), std::move(opk_handle).Unwrap(), BytesFromString(opk.public_key())});
        }
        return Result<IdentityKeys, ProtocolFailure>::Ok(std::move(keys));
    }

    Result<proto::protocol::IdentityRecord, ProtocolFailure> IdentityKeys::ToRecord() const {
        std::shared_lock lock(*lock_);
        proto::protocol::IdentityRecord record;

        auto ed_secret = ReadHandle(identity_ed25519_secret_key_handle_);
        if (ed_secret.IsErr()) {
            return Result<proto::protocol::IdentityRecord, ProtocolFailure>::Err(ed_secret.UnwrapErr());
        }
        auto ed_bytes = std::move(ed_secret).Unwrap();
        record.set_ed25519_secret(ed_bytes.data(), ed_bytes.size());
        WipeBytes(ed_bytes);
        record.set_ed25519_public(identity_ed25519_public_.data(), identity_ed25519_public_.size());

        auto spk_secret = ReadHandle(signed_pre_key_secret_key_handle_);
        if (spk_secret.IsErr()) {
            return Result<proto::protocol::IdentityRecord, ProtocolFailure>::Err(spk_secret.UnwrapErr());
        }
        auto spk_bytes = std::move(spk_secret).Unwrap();
        record.set_signed_pre_key_id(signed_pre_key_id_);
        record.set_signed_pre_key_private(spk_bytes.data(), spk_bytes.size());
        WipeBytes(spk_bytes);
        record.set_signed_pre_key_public(signed_pre_key_public_.data(), signed_pre_key_public_.size());
        record.set_signed_pre_key_signature(signed_pre_key_signature_.data(), signed_pre_key_signature_.size());

        for (const auto& opk : one_time_pre_keys_) {
            auto opk_secret = ReadHandle(opk.secret_key);
            if (opk_secret.IsErr()) {
                return Result<proto::protocol::IdentityRecord, ProtocolFailure>::Err(opk_secret.UnwrapErr());
            }
            auto opk_bytes = std::move(opk_secret).Unwrap();
            auto* entry = record.add_one_time_pre_keys();
            entry->set_id(opk.id);
            entry->set_private_key(opk_bytes.data(), opk_bytes.size());
            entry->set_public_key(opk.public_key.data(), opk.public_key.size());
            WipeBytes(opk_bytes);
        }
        record.set_next_one_time_pre_key_id(next_one_time_pre_key_id_);
        record.set_created_at_ms(created_at_ms_);
        return Result<proto::protocol::IdentityRecord, ProtocolFailure>::Ok(std::move(record));
    }

    std::vector<uint8_t> IdentityKeys::GetIdentityEd25519PublicCopy() const {
        std::shared_lock lock(*lock_);
        return identity_ed25519_public_;
    }

    std::vector<uint8_t> IdentityKeys::GetIdentityX25519PublicCopy() const {
        std::shared_lock lock(*lock_);
        return identity_x25519_public_;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> IdentityKeys::GetIdentityX25519PrivateKeyCopy() const {
        std::shared_lock lock(*lock_);
        auto ed_secret = ReadHandle(identity_ed25519_secret_key_handle_);
        if (ed_secret.IsErr()) {
            return ed_secret;
        }
        auto ed_bytes = std::move(ed_secret).Unwrap();
        auto x_secret = SodiumInterop::ConvertEd25519SecretToX25519(ed_bytes);
        WipeBytes(ed_bytes);
        return x_secret;
    }

    uint32_t IdentityKeys::GetSignedPreKeyId() const {
        std::shared_lock lock(*lock_);
        return signed_pre_key_id_;
    }

    std::vector<uint8_t> IdentityKeys::GetSignedPreKeyPublicCopy() const {
        std::shared_lock lock(*lock_);
        return signed_pre_key_public_;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> IdentityKeys::GetSignedPreKeyPrivateCopy(
        const uint32_t signed_pre_key_id) const {
        std::shared_lock lock(*lock_);
        if (signed_pre_key_id != signed_pre_key_id_) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Handshake(fmt::format(
                    "Signed prekey {} is stale (current is {})", signed_pre_key_id, signed_pre_key_id_)));
        }
        return ReadHandle(signed_pre_key_secret_key_handle_);
    }

    Result<std::vector<uint8_t>, ProtocolFailure> IdentityKeys::GetOneTimePreKeyPrivateCopy(
        const uint32_t one_time_pre_key_id) const {
        std::shared_lock lock(*lock_);
        const OneTimePreKey* opk = FindOneTimePreKeyLocked(one_time_pre_key_id);
        if (opk == nullptr) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Handshake(fmt::format(
                    "One-time prekey {} not found or already consumed", one_time_pre_key_id)));
        }
        return ReadHandle(opk->secret_key);
    }

    Result<Unit, ProtocolFailure> IdentityKeys::ConsumeOneTimePreKey(const uint32_t one_time_pre_key_id) {
        std::unique_lock lock(*lock_);
        const auto it = std::find_if(one_time_pre_keys_.begin(), one_time_pre_keys_.end(),
                                     [one_time_pre_key_id](const OneTimePreKey& opk) {
                                         return opk.id == one_time_pre_key_id;
                                     });
        if (it == one_time_pre_keys_.end()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Handshake(fmt::format(
                    "One-time prekey {} not found or already consumed", one_time_pre_key_id)));
        }
        one_time_pre_keys_.erase(it);
        MIST_LOG_DEBUG("Consumed one-time prekey {}, {} remaining",
                       one_time_pre_key_id, one_time_pre_keys_.size());
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> IdentityKeys::ReplenishOneTimePreKeys(const uint32_t target_count) {
        std::unique_lock lock(*lock_);
        if (target_count > kMaxOneTimeKeyCount) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("One-time prekey target exceeds maximum"));
        }
        if (one_time_pre_keys_.size() >= target_count) {
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
        const auto missing = static_cast<uint32_t>(target_count - one_time_pre_keys_.size());
        if (next_one_time_pre_key_id_ > std::numeric_limits<uint32_t>::max() - missing) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("One-time prekey id space exhausted"));
        }
        auto generated = GenerateOneTimePreKeys(next_one_time_pre_key_id_, missing);
        if (generated.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(generated.UnwrapErr());
        }
        for (auto& opk : std::move(generated).Unwrap()) {
            one_time_pre_keys_.push_back(std::move(opk));
        }
        next_one_time_pre_key_id_ += missing;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    size_t IdentityKeys::OneTimePreKeyCount() const {
        std::shared_lock lock(*lock_);
        return one_time_pre_keys_.size();
    }

    Result<Unit, ProtocolFailure> IdentityKeys::RotateSignedPreKey() {
        std::unique_lock lock(*lock_);
        if (signed_pre_key_id_ == std::numeric_limits<uint32_t>::max()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Signed prekey id space exhausted"));
        }
        auto result = GenerateSignedPreKeyLocked(signed_pre_key_id_ + 1);
        if (result.IsOk()) {
            MIST_LOG_INFO("Rotated signed prekey to id {}", signed_pre_key_id_);
        }
        return result;
    }

    proto::protocol::PrekeyBundle IdentityKeys::CreatePublicBundle() const {
        std::shared_lock lock(*lock_);
        proto::protocol::PrekeyBundle bundle;
        bundle.set_identity_key(identity_ed25519_public_.data(), identity_ed25519_public_.size());
        bundle.set_signed_prekey_id(signed_pre_key_id_);
        bundle.set_signed_prekey(signed_pre_key_public_.data(), signed_pre_key_public_.size());
        bundle.set_signed_prekey_signature(signed_pre_key_signature_.data(), signed_pre_key_signature_.size());
        for (const auto& opk : one_time_pre_keys_) {
            auto* entry = bundle.add_one_time_prekeys();
            entry->set_id(opk.id);
            entry->set_public_key(opk.public_key.data(), opk.public_key.size());
        }
        return bundle;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> IdentityKeys::Sign(std::span<const uint8_t> message) const {
        std::shared_lock lock(*lock_);
        auto ed_secret = ReadHandle(identity_ed25519_secret_key_handle_);
        if (ed_secret.IsErr()) {
            return ed_secret;
        }
        auto ed_bytes = std::move(ed_secret).Unwrap();
        auto signature = SodiumInterop::SignDetached(ed_bytes, message);
        WipeBytes(ed_bytes);
        return signature;
    }

    Result<Unit, ProtocolFailure> IdentityKeys::VerifyBundle(const proto::protocol::PrekeyBundle& bundle) {
        if (bundle.identity_key().size() != kEd25519PublicKeyBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Bundle identity key must be 32 bytes"));
        }
        if (bundle.signed_prekey().size() != kX25519PublicKeyBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Bundle signed prekey must be 32 bytes"));
        }
        for (const auto& opk : bundle.one_time_prekeys()) {
            if (opk.public_key().size() != kX25519PublicKeyBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput(fmt::format(
                        "Bundle one-time prekey {} must be 32 bytes", opk.id())));
            }
        }
        if (!SodiumInterop::VerifyDetached(BytesFromString(bundle.identity_key()),
                                           BytesFromString(bundle.signed_prekey()),
                                           BytesFromString(bundle.signed_prekey_signature()))) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::SignatureInvalid("Signed prekey signature verification failed"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<OneTimePreKey>, ProtocolFailure> IdentityKeys::GenerateOneTimePreKeys(
        const uint32_t first_id,
        const uint32_t count) {
        std::vector<OneTimePreKey> keys;
        keys.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            auto pair_result = SodiumInterop::GenerateX25519KeyPair(kPurposeOneTimePreKey);
            if (pair_result.IsErr()) {
                return Result<std::vector<OneTimePreKey>, ProtocolFailure>::Err(pair_result.UnwrapErr());
            }
            auto [secret, public_key] = std::move(pair_result).Unwrap();
            keys.push_back(OneTimePreKey{first_id + i, std::move(secret), std::move(public_key)});
        }
        return Result<std::vector<OneTimePreKey>, ProtocolFailure>::Ok(std::move(keys));
    }

    Result<Unit, ProtocolFailure> IdentityKeys::GenerateSignedPreKeyLocked(const uint32_t id) {
        auto pair_result = SodiumInterop::GenerateX25519KeyPair(kPurposeSignedPreKey);
        if (pair_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(pair_result.UnwrapErr());
        }
        auto [secret, public_key] = std::move(pair_result).Unwrap();

        auto ed_secret = ReadHandle(identity_ed25519_secret_key_handle_);
        if (ed_secret.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(ed_secret.UnwrapErr());
        }
        auto ed_bytes = std::move(ed_secret).Unwrap();
        auto signature = SodiumInterop::SignDetached(ed_bytes, public_key);
        WipeBytes(ed_bytes);
        if (signature.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(signature.UnwrapErr());
        }
        signed_pre_key_id_ = id;
        signed_pre_key_secret_key_handle_ = std::move(secret);
        signed_pre_key_public_ = std::move(public_key);
        signed_pre_key_signature_ = std::move(signature).Unwrap();
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    const OneTimePreKey* IdentityKeys::FindOneTimePreKeyLocked(const uint32_t one_time_pre_key_id) const {
        const auto it = std::find_if(one_time_pre_keys_.begin(), one_time_pre_keys_.end(),
                                     [one_time_pre_key_id](const OneTimePreKey& opk) {
                                         return opk.id == one_time_pre_key_id;
                                     });
        return it == one_time_pre_keys_.end() ? nullptr : &*it;
    }
}
