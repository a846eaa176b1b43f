#include "mist/session/session_manager.hpp"
#include "mist/crypto/sodium_interop.hpp"
#include "mist/identity/identity_store.hpp"
#include "mist/protocol/constants.hpp"
#include "mist/protocol/x3dh.hpp"
#include "mist/storage/record_store.hpp"
#include "mist/utilities/key_encoding.hpp"
#include "mist/core/logging.hpp"
#include "protocol/records.pb.h"
#include <fmt/core.h>

namespace mist::protocol::session {
    using crypto::SodiumInterop;

    namespace {
        using PeerKey = std::vector<uint8_t>;

        PeerKey KeyOf(std::span<const uint8_t> bytes) {
            return {bytes.begin(), bytes.end()};
        }

        std::string StorageKey(std::span<const uint8_t> peer) {
            return utilities::ToUrlSafeBase64(peer);
        }

        proto::protocol::SessionRole ToProto(const SessionRole role) {
            return role == SessionRole::Initiator
                ? proto::protocol::SESSION_ROLE_INITIATOR
                : proto::protocol::SESSION_ROLE_RESPONDER;
        }

        proto::protocol::SessionStatus ToProto(const SessionState state) {
            return state == SessionState::EstablishedAwaitingFirstMessage
                ? proto::protocol::SESSION_STATUS_AWAITING_FIRST_MESSAGE
                : proto::protocol::SESSION_STATUS_ESTABLISHED;
        }

        void Wipe(std::vector<uint8_t>& secret) {
            auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(secret));
            (void) _wipe;
        }

        Result<Unit, ProtocolFailure> RequireKey(std::span<const uint8_t> key, std::string_view what) {
            if (key.size() != kEd25519PublicKeyBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput(fmt::format("{} must be 32 bytes", what)));
            }
            return Result<Unit, ProtocolFailure>::Ok(Unit{});
        }
    }

    proto::protocol::HandshakeInitPayload HandshakeMaterial::ToPayload() const {
        proto::protocol::HandshakeInitPayload payload;
        payload.set_identity_key(identity_key.data(), identity_key.size());
        payload.set_ephemeral_key(ephemeral_key.data(), ephemeral_key.size());
        payload.set_signed_prekey_id(signed_prekey_id);
        if (one_time_prekey_id.has_value()) {
            payload.set_one_time_prekey_id(*one_time_prekey_id);
        }
        return payload;
    }

    SessionManager::SessionManager(
        identity::IdentityKeys& identity,
        contacts::ContactDirectory& contacts,
        interfaces::IRecordStore& store,
        const interfaces::IClock& clock,
        configuration::SessionConfig config)
        : identity_(identity)
        , contacts_(contacts)
        , store_(store)
        , clock_(clock)
        , config_(config)
        , self_public_key_(identity.GetIdentityEd25519PublicCopy()) {
    }

    SessionManager::~SessionManager() = default;

    Result<RestoreReport, ProtocolFailure> SessionManager::Restore() {
        auto keys = store_.List(storage::kSessionsNamespace);
        if (keys.IsErr()) {
            return Result<RestoreReport, ProtocolFailure>::Err(keys.UnwrapErr());
        }

        RestoreReport report;
        std::unique_lock lock(registry_lock_);
        sessions_.clear();
        handshakes_in_progress_.clear();

        for (const auto& key : keys.Unwrap()) {
            proto::protocol::PeerSessionRecord record;
            auto found = storage::GetMessage(store_, storage::kSessionsNamespace, key, record);
            std::string problem;
            std::unique_ptr<RatchetSession> ratchet;
            if (found.IsErr()) {
                problem = found.UnwrapErr().message;
            } else if (!found.Unwrap()) {
                continue;
            } else if (record.record_version() != kSessionRecordVersion) {
                problem = fmt::format("unsupported record version {}", record.record_version());
            } else if (record.peer_public_key().size() != kEd25519PublicKeyBytes ||
                       StorageKey(utilities::SpanOf(record.peer_public_key())) != key) {
                problem = "record key does not match its peer";
            } else if (record.role() == proto::protocol::SESSION_ROLE_UNSPECIFIED) {
                problem = "record has no role";
            } else {
                auto restored = RatchetSession::Deserialize(utilities::SpanOf(record.session_state()));
                if (restored.IsErr()) {
                    problem = restored.UnwrapErr().message;
                } else {
                    ratchet = std::move(restored).Unwrap();
                }
            }

            if (!ratchet) {
                MIST_LOG_WARN("Removing corrupt session record {}: {}", key, problem);
                if (auto removed = store_.Remove(storage::kSessionsNamespace, key); removed.IsErr()) {
                    MIST_LOG_ERROR("Cannot remove session record {}: {}", key, removed.UnwrapErr().message);
                }
                report.removed.push_back(key);
                continue;
            }

            auto session = std::make_shared<PeerSession>();
            session->peer = KeyOf(utilities::SpanOf(record.peer_public_key()));
            session->role = record.role() == proto::protocol::SESSION_ROLE_INITIATOR
                ? SessionRole::Initiator
                : SessionRole::Responder;
            const bool awaiting = session->role == SessionRole::Responder && !ratchet->HasReceived();
            session->state = awaiting ? SessionState::EstablishedAwaitingFirstMessage : SessionState::Established;
            session->persistence_version = record.persistence_version();
            session->established_at_ms = record.established_at_ms();
            session->ratchet = std::move(ratchet);
            sessions_.emplace(session->peer, std::move(session));
            report.restored++;
        }
        MIST_LOG_INFO("Restored {} sessions ({} corrupt records removed)", report.restored, report.removed.size());
        return Result<RestoreReport, ProtocolFailure>::Ok(std::move(report));
    }

    std::shared_ptr<SessionManager::PeerSession> SessionManager::Find(std::span<const uint8_t> peer) const {
        std::shared_lock lock(registry_lock_);
        const auto it = sessions_.find(KeyOf(peer));
        return it == sessions_.end() ? nullptr : it->second;
    }

    ProtocolFailure SessionManager::MissingSessionFailure(std::span<const uint8_t> peer) const {
        if (contacts_.Contains(peer)) {
            return ProtocolFailure::NoSession(
                fmt::format("Contact {} has no session", logging::ShortKey(peer)));
        }
        return ProtocolFailure::UnknownSender(
            fmt::format("No contact or session for {}", logging::ShortKey(peer)));
    }

    bool SessionManager::BeginHandshake(std::span<const uint8_t> peer, const SessionState state) {
        std::unique_lock lock(registry_lock_);
        const PeerKey key = KeyOf(peer);
        if (sessions_.contains(key) || handshakes_in_progress_.contains(key)) {
            return false;
        }
        handshakes_in_progress_.emplace(key, state);
        return true;
    }

    void SessionManager::EndHandshake(std::span<const uint8_t> peer) {
        std::unique_lock lock(registry_lock_);
        handshakes_in_progress_.erase(KeyOf(peer));
    }

    void SessionManager::Register(std::shared_ptr<PeerSession> session) {
        std::unique_lock lock(registry_lock_);
        handshakes_in_progress_.erase(session->peer);
        const PeerKey key = session->peer;
        sessions_[key] = std::move(session);
    }

    void SessionManager::RecordContact(std::span<const uint8_t> peer, const PeerIntroduction& introduction) {
        contacts::ContactRecord contact;
        contact.public_key = KeyOf(peer);
        contact.display_name = introduction.display_name;
        contact.trust_origin = introduction.trust_origin;
        contact.established_at_ms = clock_.WallClockMs();
        auto added = contacts_.AddIfAbsent(std::move(contact));
        if (added.IsErr()) {
            MIST_LOG_ERROR("Cannot record contact {}: {}", logging::ShortKey(peer), added.UnwrapErr().message);
        } else if (added.Unwrap() == contacts::ContactDirectory::AddOutcome::Created) {
            MIST_LOG_INFO("New contact {} ({})", logging::ShortKey(peer), enums::ToString(introduction.trust_origin));
        }
    }

    Result<Unit, ProtocolFailure> SessionManager::PersistLocked(PeerSession& session) {
        auto serialized = session.ratchet->Serialize();
        if (serialized.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(serialized.UnwrapErr());
        }
        auto& state_bytes = serialized.Unwrap();

        proto::protocol::PeerSessionRecord record;
        record.set_record_version(kSessionRecordVersion);
        record.set_peer_public_key(session.peer.data(), session.peer.size());
        record.set_role(ToProto(session.role));
        record.set_status(ToProto(session.state));
        record.set_persistence_version(session.persistence_version + 1);
        record.set_session_state(state_bytes.data(), state_bytes.size());
        record.set_established_at_ms(session.established_at_ms);
        Wipe(state_bytes);

        auto put = storage::PutMessage(store_, storage::kSessionsNamespace, StorageKey(session.peer), record);
        record.clear_session_state();
        if (put.IsErr()) {
            const auto& failure = put.UnwrapErr();
            return Result<Unit, ProtocolFailure>::Err(
                failure.type == ProtocolFailureType::Storage
                    ? failure
                    : ProtocolFailure::Storage(failure.message));
        }
        session.persistence_version++;
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    Result<Unit, ProtocolFailure> SessionManager::RollBackLocked(PeerSession& session) {
        proto::protocol::PeerSessionRecord record;
        auto found = storage::GetMessage(store_, storage::kSessionsNamespace, StorageKey(session.peer), record);
        std::string problem;
        if (found.IsErr()) {
            problem = found.UnwrapErr().message;
        } else if (!found.Unwrap()) {
            problem = "no stored record";
        } else if (record.record_version() != kSessionRecordVersion ||
                   KeyOf(utilities::SpanOf(record.peer_public_key())) != session.peer) {
            problem = "stored record does not belong to this session";
        } else {
            auto restored = RatchetSession::Deserialize(utilities::SpanOf(record.session_state()));
            record.clear_session_state();
            if (restored.IsOk()) {
                session.ratchet = std::move(restored).Unwrap();
                return Result<Unit, ProtocolFailure>::Ok(Unit{});
            }
            problem = restored.UnwrapErr().message;
        }

        MIST_LOG_ERROR("Cannot roll back session {} ({}); dropping it", logging::ShortKey(session.peer), problem);
        {
            std::unique_lock lock(registry_lock_);
            const auto it = sessions_.find(session.peer);
            if (it != sessions_.end() && it->second.get() == &session) {
                sessions_.erase(it);
            }
        }
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::Storage(
            fmt::format("Session with {} was dropped: {}", logging::ShortKey(session.peer), problem)));
    }

    Result<HandshakeMaterial, ProtocolFailure> SessionManager::InitiateHandshake(
        std::span<const uint8_t> peer_identity,
        const proto::protocol::PrekeyBundle& peer_bundle,
        const PeerIntroduction& introduction) {
        using HandshakeResult = Result<HandshakeMaterial, ProtocolFailure>;

        if (auto valid = RequireKey(peer_identity, "Peer identity"); valid.IsErr()) {
            return HandshakeResult::Err(valid.UnwrapErr());
        }
        if (utilities::SpanOf(peer_bundle.identity_key()).size() != peer_identity.size() ||
            utilities::CompareKeys(utilities::SpanOf(peer_bundle.identity_key()), peer_identity) != 0) {
            return HandshakeResult::Err(
                ProtocolFailure::InvalidInput("Prekey bundle belongs to a different identity"));
        }
        if (HasSession(peer_identity)) {
            return HandshakeResult::Err(ProtocolFailure::AlreadyEstablished(
                fmt::format("Session with {} already exists", logging::ShortKey(peer_identity))));
        }
        if (!BeginHandshake(peer_identity, SessionState::HandshakeSent)) {
            return HandshakeResult::Err(ProtocolFailure::InvalidState(
                fmt::format("Handshake with {} already in progress", logging::ShortKey(peer_identity))));
        }

        auto agreement_result = X3dh::InitiatorAgree(identity_, peer_bundle);
        if (agreement_result.IsErr()) {
            EndHandshake(peer_identity);
            MIST_LOG_WARN("Handshake with {} rejected: {}", logging::ShortKey(peer_identity),
                          agreement_result.UnwrapErr().message);
            return HandshakeResult::Err(agreement_result.UnwrapErr());
        }
        auto agreement = std::move(agreement_result).Unwrap();

        auto ratchet = RatchetSession::InitInitiator(
            agreement.shared_secret, agreement.peer_signed_prekey_public, self_public_key_, peer_identity);
        Wipe(agreement.shared_secret);
        if (ratchet.IsErr()) {
            EndHandshake(peer_identity);
            return HandshakeResult::Err(ratchet.UnwrapErr());
        }

        auto session = std::make_shared<PeerSession>();
        session->peer = KeyOf(peer_identity);
        session->role = SessionRole::Initiator;
        session->state = SessionState::Established;
        session->established_at_ms = clock_.WallClockMs();
        session->ratchet = std::move(ratchet).Unwrap();
        {
            std::lock_guard<std::mutex> guard(session->lock);
            if (auto persisted = PersistLocked(*session); persisted.IsErr()) {
                EndHandshake(peer_identity);
                return HandshakeResult::Err(persisted.UnwrapErr());
            }
        }
        Register(session);
        RecordContact(peer_identity, introduction);

        MIST_LOG_INFO("Initiated session with {} (spk {}, opk {})", logging::ShortKey(peer_identity),
                      agreement.signed_prekey_id,
                      agreement.used_one_time_prekey_id.has_value()
                          ? fmt::format("{}", *agreement.used_one_time_prekey_id)
                          : std::string("none"));

        HandshakeMaterial material;
        material.identity_key = self_public_key_;
        material.ephemeral_key = std::move(agreement.ephemeral_public);
        material.signed_prekey_id = agreement.signed_prekey_id;
        material.one_time_prekey_id = agreement.used_one_time_prekey_id;
        return HandshakeResult::Ok(std::move(material));
    }

    Result<AcceptOutcome, ProtocolFailure> SessionManager::AcceptHandshake(
        std::span<const uint8_t> peer_identity,
        std::span<const uint8_t> peer_ephemeral,
        const uint32_t signed_prekey_id,
        const std::optional<uint32_t> one_time_prekey_id,
        const PeerIntroduction& introduction) {
        using AcceptResult = Result<AcceptOutcome, ProtocolFailure>;

        if (auto valid = RequireKey(peer_identity, "Peer identity"); valid.IsErr()) {
            return AcceptResult::Err(valid.UnwrapErr());
        }
        if (peer_ephemeral.size() != kX25519PublicKeyBytes) {
            return AcceptResult::Err(ProtocolFailure::InvalidInput("Peer ephemeral key must be 32 bytes"));
        }
        if (!BeginHandshake(peer_identity, SessionState::HandshakeReceived)) {
            const SessionState current = StateOf(peer_identity);
            if (current == SessionState::HandshakeSent) {
                return AcceptResult::Err(ProtocolFailure::InvalidState(
                    fmt::format("Outgoing handshake with {} in progress", logging::ShortKey(peer_identity))));
            }
            MIST_LOG_INFO("Duplicate handshake from {} ignored ({})", logging::ShortKey(peer_identity),
                          enums::ToString(current));
            return AcceptResult::Ok(AcceptOutcome::Duplicate);
        }

        auto shared_secret_result = X3dh::ResponderAgree(
            identity_, peer_identity, peer_ephemeral, signed_prekey_id, one_time_prekey_id);
        if (shared_secret_result.IsErr()) {
            EndHandshake(peer_identity);
            MIST_LOG_WARN("Handshake from {} rejected: {}", logging::ShortKey(peer_identity),
                          shared_secret_result.UnwrapErr().message);
            return AcceptResult::Err(shared_secret_result.UnwrapErr());
        }
        auto shared_secret = std::move(shared_secret_result).Unwrap();

        auto prekey_private = identity_.GetSignedPreKeyPrivateCopy(signed_prekey_id);
        if (prekey_private.IsErr()) {
            Wipe(shared_secret);
            EndHandshake(peer_identity);
            return AcceptResult::Err(prekey_private.UnwrapErr());
        }
        auto& signed_prekey_private = prekey_private.Unwrap();
        const auto signed_prekey_public = identity_.GetSignedPreKeyPublicCopy();

        auto ratchet = RatchetSession::InitResponder(
            shared_secret, signed_prekey_private, signed_prekey_public,
            peer_ephemeral, self_public_key_, peer_identity);
        Wipe(shared_secret);
        Wipe(signed_prekey_private);
        if (ratchet.IsErr()) {
            EndHandshake(peer_identity);
            return AcceptResult::Err(ratchet.UnwrapErr());
        }

        auto session = std::make_shared<PeerSession>();
        session->peer = KeyOf(peer_identity);
        session->role = SessionRole::Responder;
        session->state = SessionState::EstablishedAwaitingFirstMessage;
        session->established_at_ms = clock_.WallClockMs();
        session->ratchet = std::move(ratchet).Unwrap();
        {
            std::lock_guard<std::mutex> guard(session->lock);
            if (auto persisted = PersistLocked(*session); persisted.IsErr()) {
                EndHandshake(peer_identity);
                return AcceptResult::Err(persisted.UnwrapErr());
            }
        }

        if (one_time_prekey_id.has_value()) {
            if (auto consumed = identity_.ConsumeOneTimePreKey(*one_time_prekey_id); consumed.IsErr()) {
                MIST_LOG_WARN("One-time prekey {} not consumed: {}", *one_time_prekey_id,
                              consumed.UnwrapErr().message);
            }
            if (auto replenished = identity_.ReplenishOneTimePreKeys(config_.one_time_prekey_count);
                replenished.IsErr()) {
                MIST_LOG_WARN("One-time prekey pool not replenished: {}", replenished.UnwrapErr().message);
            }
            if (auto saved = identity::SaveIdentity(store_, identity_); saved.IsErr()) {
                MIST_LOG_ERROR("Cannot store identity after prekey use: {}", saved.UnwrapErr().message);
            }
        }

        Register(session);
        RecordContact(peer_identity, introduction);
        MIST_LOG_INFO("Accepted session from {} (spk {})", logging::ShortKey(peer_identity), signed_prekey_id);
        return AcceptResult::Ok(AcceptOutcome::Accepted);
    }

    Result<proto::protocol::RatchetMessage, ProtocolFailure> SessionManager::EncryptFor(
        std::span<const uint8_t> peer,
        std::span<const uint8_t> plaintext) {
        using EncryptResult = Result<proto::protocol::RatchetMessage, ProtocolFailure>;

        const auto session = Find(peer);
        if (!session) {
            return EncryptResult::Err(MissingSessionFailure(peer));
        }
        std::lock_guard<std::mutex> guard(session->lock);
        if (session->state == SessionState::EstablishedAwaitingFirstMessage) {
            return EncryptResult::Err(ProtocolFailure::RoleOrderingViolation(
                fmt::format("Responder cannot send to {} before the first inbound message",
                            logging::ShortKey(peer))));
        }

        auto message = session->ratchet->Encrypt(plaintext);
        if (message.IsErr()) {
            return message;
        }
        if (auto persisted = PersistLocked(*session); persisted.IsErr()) {
            if (auto rolled_back = RollBackLocked(*session); rolled_back.IsErr()) {
                return EncryptResult::Err(rolled_back.UnwrapErr());
            }
            return EncryptResult::Err(persisted.UnwrapErr());
        }
        return message;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SessionManager::DecryptFrom(
        std::span<const uint8_t> peer,
        const proto::protocol::RatchetMessage& message) {
        using DecryptResult = Result<std::vector<uint8_t>, ProtocolFailure>;

        const auto session = Find(peer);
        if (!session) {
            return DecryptResult::Err(MissingSessionFailure(peer));
        }
        std::lock_guard<std::mutex> guard(session->lock);

        auto plaintext = session->ratchet->Decrypt(message);
        if (plaintext.IsErr()) {
            MIST_LOG_WARN("Message from {} rejected: {}", logging::ShortKey(peer), plaintext.UnwrapErr().message);
            return plaintext;
        }

        const SessionState previous_state = session->state;
        if (previous_state == SessionState::EstablishedAwaitingFirstMessage) {
            session->state = SessionState::Established;
        }
        if (auto persisted = PersistLocked(*session); persisted.IsErr()) {
            session->state = previous_state;
            Wipe(plaintext.Unwrap());
            if (auto rolled_back = RollBackLocked(*session); rolled_back.IsErr()) {
                return DecryptResult::Err(rolled_back.UnwrapErr());
            }
            return DecryptResult::Err(persisted.UnwrapErr());
        }
        if (previous_state != session->state) {
            MIST_LOG_DEBUG("Session with {} now {}", logging::ShortKey(peer), enums::ToString(session->state));
        }
        return plaintext;
    }

    Result<bool, ProtocolFailure> SessionManager::RemovePeer(std::span<const uint8_t> peer) {
        bool existed = false;
        {
            std::unique_lock lock(registry_lock_);
            existed = sessions_.erase(KeyOf(peer)) > 0;
            handshakes_in_progress_.erase(KeyOf(peer));
        }
        if (auto removed = store_.Remove(storage::kSessionsNamespace, StorageKey(peer)); removed.IsErr()) {
            return Result<bool, ProtocolFailure>::Err(removed.UnwrapErr());
        }
        if (existed) {
            MIST_LOG_INFO("Removed session with {}", logging::ShortKey(peer));
        }
        return Result<bool, ProtocolFailure>::Ok(existed);
    }

    Result<Unit, ProtocolFailure> SessionManager::RemoveAll() {
        for (const auto& peer : Peers()) {
            if (auto removed = RemovePeer(peer); removed.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(removed.UnwrapErr());
            }
        }
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    SessionState SessionManager::StateOf(std::span<const uint8_t> peer) const {
        std::shared_ptr<PeerSession> session;
        {
            std::shared_lock lock(registry_lock_);
            const PeerKey key = KeyOf(peer);
            if (const auto pending = handshakes_in_progress_.find(key); pending != handshakes_in_progress_.end()) {
                return pending->second;
            }
            const auto it = sessions_.find(key);
            if (it == sessions_.end()) {
                return SessionState::NoSession;
            }
            session = it->second;
        }
        std::lock_guard<std::mutex> guard(session->lock);
        return session->state;
    }

    bool SessionManager::HasSession(std::span<const uint8_t> peer) const {
        return Find(peer) != nullptr;
    }

    std::optional<SessionRole> SessionManager::RoleOf(std::span<const uint8_t> peer) const {
        const auto session = Find(peer);
        if (!session) {
            return std::nullopt;
        }
        return session->role;
    }

    std::optional<uint64_t> SessionManager::PersistenceVersionOf(std::span<const uint8_t> peer) const {
        const auto session = Find(peer);
        if (!session) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> guard(session->lock);
        return session->persistence_version;
    }

    bool SessionManager::IsUnconfirmedInitiator(std::span<const uint8_t> peer) const {
        const auto session = Find(peer);
        if (!session || session->role != SessionRole::Initiator) {
            return false;
        }
        std::lock_guard<std::mutex> guard(session->lock);
        return !session->ratchet->HasReceived();
    }

    std::vector<std::vector<uint8_t>> SessionManager::Peers() const {
        std::shared_lock lock(registry_lock_);
        std::vector<std::vector<uint8_t>> peers;
        peers.reserve(sessions_.size());
        for (const auto& [peer, session] : sessions_) {
            peers.push_back(peer);
        }
        return peers;
    }

    size_t SessionManager::SessionCount() const {
        std::shared_lock lock(registry_lock_);
        return sessions_.size();
    }

    Result<Unit, ProtocolFailure> SessionManager::Flush() {
        return store_.Flush();
    }
}
