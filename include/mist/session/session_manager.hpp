#pragma once
#include "mist/configuration/node_config.hpp"
#include "mist/contacts/contact_directory.hpp"
#include "mist/enums/session_state.hpp"
#include "mist/identity/identity_keys.hpp"
#include "mist/interfaces/i_clock.hpp"
#include "mist/interfaces/i_record_store.hpp"
#include "mist/protocol/ratchet_session.hpp"
#include "protocol/envelope.pb.h"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <vector>

namespace mist::protocol::session {
using enums::SessionRole;
using enums::SessionState;
using enums::TrustOrigin;

/// What the initiator sends to the responder as handshake-init.
struct HandshakeMaterial {
    std::vector<uint8_t> identity_key;
    std::vector<uint8_t> ephemeral_key;
    uint32_t signed_prekey_id = 0;
    std::optional<uint32_t> one_time_prekey_id;

    [[nodiscard]] proto::protocol::HandshakeInitPayload ToPayload() const;
};

/// Contact metadata recorded when a handshake creates a new contact.
struct PeerIntroduction {
    std::string display_name;
    TrustOrigin trust_origin = TrustOrigin::SharedLink;
};

enum class AcceptOutcome : uint8_t {
    Accepted = 0,
    /// A session for this peer already exists; nothing changed.
    Duplicate = 1
};

struct RestoreReport {
    size_t restored = 0;
    /// Storage keys of records that failed to deserialize and were deleted.
    std::vector<std::string> removed;
};

/**
 * @brief Registry of exactly one ratchet session per peer public key
 *
 * Every mutation (handshake completion, encrypt, decrypt) writes the new
 * PeerSessionRecord to the "sessions" namespace before the call returns; if
 * that write fails the call fails with Storage and the in-memory session is
 * reloaded from the stored record. A session whose record cannot be reloaded
 * is dropped, so memory never runs ahead of storage.
 *
 * Thread Safety: the registry is guarded by a shared mutex; encrypt and
 * decrypt for one peer are serialized by that peer's own mutex, different
 * peers proceed in parallel.
 */
class SessionManager {
public:
    SessionManager(
        identity::IdentityKeys& identity,
        contacts::ContactDirectory& contacts,
        interfaces::IRecordStore& store,
        const interfaces::IClock& clock,
        configuration::SessionConfig config);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Loads every stored session record
     *
     * Records that fail to parse, carry another record version or do not
     * match their storage key are removed from the store and listed in the
     * report; the rest are restored. A responder that has not received
     * anything yet comes back as EstablishedAwaitingFirstMessage.
     *
     * @return Ok(report) or Err(Storage) when the store cannot be listed
     */
    [[nodiscard]] Result<RestoreReport, ProtocolFailure> Restore();

    /**
     * @brief Starts a session as initiator from the peer's prekey bundle
     *
     * Verifies the bundle signature, runs the initiator side of X3DH,
     * persists the new session and records the peer as a contact.
     *
     * @param peer_identity Peer's 32-byte Ed25519 identity key
     * @param peer_bundle Bundle published by that identity
     * @param introduction Contact metadata used when the peer is not yet a contact
     * @return Ok(material to send as handshake-init), or Err with SignatureInvalid
     *         for a bad bundle, AlreadyEstablished when a session exists,
     *         InvalidState while another handshake is in progress, Storage
     *         when the record cannot be written
     */
    [[nodiscard]] Result<HandshakeMaterial, ProtocolFailure> InitiateHandshake(
        std::span<const uint8_t> peer_identity,
        const proto::protocol::PrekeyBundle& peer_bundle,
        const PeerIntroduction& introduction = {});

    /**
     * @brief Completes a handshake-init as responder
     *
     * Consumes the named one-time prekey, replenishes the pool and stores
     * the updated identity. The new session may not encrypt until the
     * initiator's first message has been decrypted.
     *
     * @param peer_identity Initiator's identity key
     * @param peer_ephemeral Initiator's X25519 ephemeral key
     * @param signed_prekey_id Signed prekey the initiator used
     * @param one_time_prekey_id One-time prekey the initiator used, if any
     * @param introduction Contact metadata used when the peer is not yet a contact
     * @return Ok(Accepted), Ok(Duplicate) when a session already exists, or Err
     */
    [[nodiscard]] Result<AcceptOutcome, ProtocolFailure> AcceptHandshake(
        std::span<const uint8_t> peer_identity,
        std::span<const uint8_t> peer_ephemeral,
        uint32_t signed_prekey_id,
        std::optional<uint32_t> one_time_prekey_id,
        const PeerIntroduction& introduction = {});

    /**
     * @brief Encrypts one message for a peer and persists the advanced ratchet
     *
     * @param peer Recipient identity key
     * @param plaintext Bytes to encrypt
     * @return Ok(ratchet message), or Err with NoSession for a known contact
     *         without a session, UnknownSender for a stranger,
     *         RoleOrderingViolation for a responder that has not received
     *         anything yet, Storage when the record cannot be written
     */
    [[nodiscard]] Result<proto::protocol::RatchetMessage, ProtocolFailure> EncryptFor(
        std::span<const uint8_t> peer,
        std::span<const uint8_t> plaintext);

    /**
     * @brief Decrypts one message from a peer and persists the advanced ratchet
     *
     * DecryptionFailed leaves the session untouched. The first successful
     * decrypt moves a waiting responder to Established.
     *
     * @param peer Sender identity key
     * @param message Ratchet message as received
     * @return Ok(plaintext) or Err
     */
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> DecryptFrom(
        std::span<const uint8_t> peer,
        const proto::protocol::RatchetMessage& message);

    /**
     * @brief Destroys the session and its stored record
     * @return Ok(false) when there was no session
     */
    [[nodiscard]] Result<bool, ProtocolFailure> RemovePeer(std::span<const uint8_t> peer);
    /// Destroys every session and stored session record.
    [[nodiscard]] Result<Unit, ProtocolFailure> RemoveAll();

    /// HandshakeSent / HandshakeReceived while a handshake is being built, NoSession when unknown.
    [[nodiscard]] SessionState StateOf(std::span<const uint8_t> peer) const;
    [[nodiscard]] bool HasSession(std::span<const uint8_t> peer) const;
    [[nodiscard]] std::optional<SessionRole> RoleOf(std::span<const uint8_t> peer) const;
    [[nodiscard]] std::optional<uint64_t> PersistenceVersionOf(std::span<const uint8_t> peer) const;
    /// True for an initiator session that has not yet decrypted anything from the peer.
    [[nodiscard]] bool IsUnconfirmedInitiator(std::span<const uint8_t> peer) const;
    [[nodiscard]] std::vector<std::vector<uint8_t>> Peers() const;
    [[nodiscard]] size_t SessionCount() const;

    [[nodiscard]] Result<Unit, ProtocolFailure> Flush();

private:
    struct PeerSession {
        std::vector<uint8_t> peer;
        SessionRole role = SessionRole::Initiator;
        SessionState state = SessionState::NoSession;
        uint64_t persistence_version = 0;
        int64_t established_at_ms = 0;
        std::unique_ptr<RatchetSession> ratchet;
        std::mutex lock;
    };

    [[nodiscard]] std::shared_ptr<PeerSession> Find(std::span<const uint8_t> peer) const;
    [[nodiscard]] ProtocolFailure MissingSessionFailure(std::span<const uint8_t> peer) const;

    /// Writes the record with persistence_version + 1 and bumps it on success.
    [[nodiscard]] Result<Unit, ProtocolFailure> PersistLocked(PeerSession& session);
    /// Reloads the ratchet from the stored record after a mutation whose write failed.
    /// When that record is unusable the session is dropped and Storage is returned.
    [[nodiscard]] Result<Unit, ProtocolFailure> RollBackLocked(PeerSession& session);

    [[nodiscard]] bool BeginHandshake(std::span<const uint8_t> peer, SessionState state);
    void EndHandshake(std::span<const uint8_t> peer);
    void Register(std::shared_ptr<PeerSession> session);
    void RecordContact(std::span<const uint8_t> peer, const PeerIntroduction& introduction);

    identity::IdentityKeys& identity_;
    contacts::ContactDirectory& contacts_;
    interfaces::IRecordStore& store_;
    const interfaces::IClock& clock_;
    configuration::SessionConfig config_;
    std::vector<uint8_t> self_public_key_;

    std::map<std::vector<uint8_t>, std::shared_ptr<PeerSession>> sessions_;
    std::map<std::vector<uint8_t>, SessionState> handshakes_in_progress_;
    mutable std::shared_mutex registry_lock_;
};

}
