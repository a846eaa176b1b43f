#pragma once
#include "mist/core/result.hpp"
#include "mist/core/failures.hpp"
#include "mist/crypto/sodium_secure_memory_handle.hpp"
#include "protocol/envelope.pb.h"
#include "protocol/records.pb.h"
#include <vector>
#include <cstdint>
#include <optional>
#include <span>
#include <shared_mutex>
#include <memory>
namespace mist::protocol::identity {
using protocol::Result;
using protocol::Unit;
using protocol::ProtocolFailure;
using crypto::SecureMemoryHandle;

struct OneTimePreKey {
    uint32_t id = 0;
    SecureMemoryHandle secret_key;
    std::vector<uint8_t> public_key;
};

/**
 * Long-lived identity of the local installation.
 *
 * The Ed25519 public key is the peer's permanent address. Its X25519 form is
 * derived on demand for key agreement. The signed prekey and the pool of
 * one-time prekeys are owned here and published through CreatePublicBundle().
 *
 * Thread-safe: accessors take a shared lock, mutations an exclusive one.
 */
class IdentityKeys {
public:
    [[nodiscard]] static Result<IdentityKeys, ProtocolFailure> Create(
        uint32_t one_time_key_count,
        int64_t created_at_ms = 0);
    [[nodiscard]] static Result<IdentityKeys, ProtocolFailure> FromRecord(
        const proto::protocol::IdentityRecord& record);
    [[nodiscard]] Result<proto::protocol::IdentityRecord, ProtocolFailure> ToRecord() const;

    [[nodiscard]] std::vector<uint8_t> GetIdentityEd25519PublicCopy() const;
    [[nodiscard]] std::vector<uint8_t> GetIdentityX25519PublicCopy() const;
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> GetIdentityX25519PrivateKeyCopy() const;

    [[nodiscard]] uint32_t GetSignedPreKeyId() const;
    [[nodiscard]] std::vector<uint8_t> GetSignedPreKeyPublicCopy() const;
    /// Fails with Handshake when signed_pre_key_id is not the current one.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> GetSignedPreKeyPrivateCopy(
        uint32_t signed_pre_key_id) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> GetOneTimePreKeyPrivateCopy(
        uint32_t one_time_pre_key_id) const;
    [[nodiscard]] Result<Unit, ProtocolFailure> ConsumeOneTimePreKey(uint32_t one_time_pre_key_id);
    /// Tops the pool back up to target_count fresh keys.
    [[nodiscard]] Result<Unit, ProtocolFailure> ReplenishOneTimePreKeys(uint32_t target_count);
    [[nodiscard]] size_t OneTimePreKeyCount() const;

    /// Replaces the signed prekey. Handshakes naming the old id are rejected afterwards.
    [[nodiscard]] Result<Unit, ProtocolFailure> RotateSignedPreKey();

    [[nodiscard]] proto::protocol::PrekeyBundle CreatePublicBundle() const;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Sign(
        std::span<const uint8_t> message) const;

    /// Checks key sizes and the signed prekey signature of a peer bundle.
    [[nodiscard]] static Result<Unit, ProtocolFailure> VerifyBundle(
        const proto::protocol::PrekeyBundle& bundle);

    [[nodiscard]] int64_t CreatedAtMs() const noexcept { return created_at_ms_; }

    IdentityKeys(IdentityKeys&&) noexcept = default;
    IdentityKeys& operator=(IdentityKeys&&) noexcept = default;
    IdentityKeys(const IdentityKeys&) = delete;
    IdentityKeys& operator=(const IdentityKeys&) = delete;
    ~IdentityKeys() = default;
private:
    IdentityKeys() = default;

    [[nodiscard]] static Result<std::vector<OneTimePreKey>, ProtocolFailure> GenerateOneTimePreKeys(
        uint32_t first_id,
        uint32_t count);
    [[nodiscard]] Result<Unit, ProtocolFailure> GenerateSignedPreKeyLocked(uint32_t id);
    [[nodiscard]] const OneTimePreKey* FindOneTimePreKeyLocked(uint32_t one_time_pre_key_id) const;

    SecureMemoryHandle identity_ed25519_secret_key_handle_;
    std::vector<uint8_t> identity_ed25519_public_;
    std::vector<uint8_t> identity_x25519_public_;
    uint32_t signed_pre_key_id_ = 0;
    SecureMemoryHandle signed_pre_key_secret_key_handle_;
    std::vector<uint8_t> signed_pre_key_public_;
    std::vector<uint8_t> signed_pre_key_signature_;
    std::vector<OneTimePreKey> one_time_pre_keys_;
    uint32_t next_one_time_pre_key_id_ = 1;
    int64_t created_at_ms_ = 0;
    mutable std::unique_ptr<std::shared_mutex> lock_;
};
}
