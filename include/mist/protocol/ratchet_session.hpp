#pragma once
#include "mist/core/failures.hpp"
#include "mist/core/result.hpp"
#include "protocol/state.pb.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace mist::protocol {

/// Double Ratchet session seeded by an X3DH shared secret.
///
/// Root KDF: HKDF-SHA256(salt = root key, ikm = DH output) expanded to 64 bytes
/// (new root key || chain key). Chain KDF: HMAC-SHA256(ck, 0x01) gives the
/// message key and HMAC-SHA256(ck, 0x03) the next chain key. Payloads are
/// sealed with AES-256-GCM under a random 96-bit nonce; the associated data
/// binds the message header and both identity keys.
///
/// The initiator can send immediately. The responder has no sending chain
/// until it has decrypted the first inbound message.
///
/// Thread Safety: all public methods are thread-safe; state is protected by a mutex.
class RatchetSession {
public:
    [[nodiscard]] static Result<std::unique_ptr<RatchetSession>, ProtocolFailure> InitInitiator(
        std::span<const uint8_t> shared_secret,
        std::span<const uint8_t> peer_signed_prekey_public,
        std::span<const uint8_t> local_identity_public,
        std::span<const uint8_t> peer_identity_public);

    /// peer_ephemeral_public is recorded when given but is not an input to the
    /// key schedule: the initiator's ratchet key arrives in the first header.
    [[nodiscard]] static Result<std::unique_ptr<RatchetSession>, ProtocolFailure> InitResponder(
        std::span<const uint8_t> shared_secret,
        std::span<const uint8_t> signed_prekey_private,
        std::span<const uint8_t> signed_prekey_public,
        std::optional<std::span<const uint8_t>> peer_ephemeral_public,
        std::span<const uint8_t> local_identity_public,
        std::span<const uint8_t> peer_identity_public);

    /// Restores a session from Serialize() output. Fails with Decode when the
    /// bytes do not parse, carry invalid key sizes or fail the state MAC.
    [[nodiscard]] static Result<std::unique_ptr<RatchetSession>, ProtocolFailure> Deserialize(
        std::span<const uint8_t> bytes);

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Serialize() const;

    [[nodiscard]] Result<mist::proto::protocol::RatchetMessage, ProtocolFailure> Encrypt(
        std::span<const uint8_t> plaintext);

    /// On failure the session state is left exactly as it was.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        const mist::proto::protocol::RatchetMessage& message);

    [[nodiscard]] bool CanSend() const;
    [[nodiscard]] bool HasReceived() const;
    [[nodiscard]] bool IsInitiator() const;
    [[nodiscard]] uint64_t StateCounter() const;
    [[nodiscard]] std::optional<std::vector<uint8_t>> PeerHandshakeEphemeral() const;

    RatchetSession(const RatchetSession&) = delete;
    RatchetSession& operator=(const RatchetSession&) = delete;
    RatchetSession(RatchetSession&&) noexcept = delete;
    RatchetSession& operator=(RatchetSession&&) noexcept = delete;
    ~RatchetSession();

private:
    explicit RatchetSession(mist::proto::protocol::RatchetState state);

    static Result<Unit, ProtocolFailure> ValidateState(const mist::proto::protocol::RatchetState& state);

    mist::proto::protocol::RatchetState state_;
    mutable std::mutex lock_;
};

}
