#include "mist/orchestrator/session_orchestrator.hpp"
#include "mist/crypto/sodium_interop.hpp"
#include "mist/identity/identity_store.hpp"
#include "mist/protocol/constants.hpp"
#include "mist/storage/record_store.hpp"
#include "mist/utilities/key_encoding.hpp"
#include "mist/core/logging.hpp"
#include "protocol/records.pb.h"
#include <fmt/core.h>
#include <algorithm>

namespace mist::protocol::orchestrator {
    using crypto::SodiumInterop;
    using enums::EnvelopeType;
    using enums::SignalingState;
    using enums::TrustOrigin;
    using signaling::SignalingEnvelope;

    namespace {
        bool SameKey(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) {
            return std::ranges::equal(lhs, rhs);
        }

        Result<Unit, ProtocolFailure> RequirePeerKey(std::span<const uint8_t> peer) {
            if (peer.size() != kEd25519PublicKeyBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput("Peer public key must be 32 bytes"));
            }
            return Result<Unit, ProtocolFailure>::Ok(Unit{});
        }
    }

    Result<std::unique_ptr<SessionOrchestrator>, ProtocolFailure> SessionOrchestrator::Create(
        runtime::EventLoop& loop,
        configuration::NodeConfig config,
        std::unique_ptr<interfaces::IPubSubTransport> signaling_transport,
        std::unique_ptr<interfaces::IDirectChannelFactory> channel_factory,
        std::shared_ptr<ISessionEventHandler> events,
        std::shared_ptr<interfaces::IRecordStore> store) {
        using CreateResult = Result<std::unique_ptr<SessionOrchestrator>, ProtocolFailure>;

        if (!signaling_transport || !channel_factory || !events) {
            return CreateResult::Err(ProtocolFailure::InvalidInput(
                "Orchestrator requires a signaling transport, a channel factory and an event handler"));
        }
        if (auto valid = config.Validate(); valid.IsErr()) {
            return CreateResult::Err(valid.UnwrapErr());
        }
        if (auto initialized = SodiumInterop::Initialize(); initialized.IsErr()) {
            return CreateResult::Err(ProtocolFailure::FromSodiumFailure(initialized.UnwrapErr()));
        }

        if (!store) {
            if (config.storage.data_directory.empty()) {
                store = std::make_shared<storage::MemoryRecordStore>();
            } else {
                auto opened = storage::FileRecordStore::Open(config.storage.data_directory);
                if (opened.IsErr()) {
                    return CreateResult::Err(opened.UnwrapErr());
                }
                store = std::shared_ptr<interfaces::IRecordStore>(std::move(opened).Unwrap());
            }
        }

        std::unique_ptr<SessionOrchestrator> node(
            new SessionOrchestrator(loop, std::move(config), std::move(store), std::move(events)));
        if (auto restored = node->Restore(std::move(signaling_transport), std::move(channel_factory));
            restored.IsErr()) {
            return CreateResult::Err(restored.UnwrapErr());
        }
        return CreateResult::Ok(std::move(node));
    }

    SessionOrchestrator::SessionOrchestrator(
        runtime::EventLoop& loop,
        configuration::NodeConfig config,
        std::shared_ptr<interfaces::IRecordStore> store,
        std::shared_ptr<ISessionEventHandler> events)
        : loop_(loop)
        , config_(std::move(config))
        , store_(std::move(store))
        , events_(std::move(events))
        , trust_(std::make_unique<trust::TrustVerifier>()) {
        signaling_retry_delay_ = config_.signaling.reconnect_period;
    }

    SessionOrchestrator::~SessionOrchestrator() {
        if (!shut_down_ && signaling_) {
            if (auto result = Shutdown(); result.IsErr()) {
                MIST_LOG_ERROR("Shutdown during teardown failed: {}", result.UnwrapErr().message);
            }
        }
    }

    Result<Unit, ProtocolFailure> SessionOrchestrator::Restore(
        std::unique_ptr<interfaces::IPubSubTransport> signaling_transport,
        std::unique_ptr<interfaces::IDirectChannelFactory> channel_factory) {
        const uint32_t prekey_count = config_.session.one_time_prekey_count;
        auto loaded = identity::LoadOrCreateIdentity(*store_, prekey_count, loop_.Clock().WallClockMs());
        if (loaded.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(loaded.UnwrapErr());
        }
        identity_ = std::make_unique<identity::IdentityKeys>(std::move(loaded).Unwrap());
        self_public_key_ = identity_->GetIdentityEd25519PublicCopy();

        if (identity_->OneTimePreKeyCount() < prekey_count) {
            if (auto replenished = identity_->ReplenishOneTimePreKeys(prekey_count); replenished.IsErr()) {
                return replenished;
            }
            if (auto saved = identity::SaveIdentity(*store_, *identity_); saved.IsErr()) {
                return saved;
            }
        }

        contacts_ = std::make_unique<contacts::ContactDirectory>(*store_);
        if (auto restored = contacts_->Restore(); restored.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(restored.UnwrapErr());
        }

        sessions_ = std::make_unique<session::SessionManager>(
            *identity_, *contacts_, *store_, loop_.Clock(), config_.session);
        auto report = sessions_->Restore();
        if (report.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(report.UnwrapErr());
        }
        for (const auto& removed : report.Unwrap().removed) {
            MIST_LOG_WARN("Session record {} was corrupt and has been discarded", removed);
        }
        if (auto pending = RestorePendingHandshakes(); pending.IsErr()) {
            return pending;
        }

        signaling_ = std::make_unique<signaling::SignalingChannel>(
            loop_, std::move(signaling_transport), config_.signaling);
        router_ = std::make_unique<transport::TransportRouter>(
            loop_, *signaling_, std::move(channel_factory), config_.transport);

        MIST_LOG_INFO("Node {} restored: {} contacts, {} sessions",
                      logging::ShortKey(self_public_key_), contacts_->Size(), sessions_->SessionCount());
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    void SessionOrchestrator::Start(ReadyCallback on_ready) {
        if (!started_) {
            RegisterHandlers();
            started_ = true;
            shut_down_ = false;
        }
        ConnectSignaling(std::move(on_ready));
    }

    void SessionOrchestrator::RegisterHandlers() {
        subscriptions_.push_back(signaling_->Subscribe(EnvelopeType::HandshakeInit,
            [this](const SignalingEnvelope& envelope) { OnHandshakeInit(envelope); }));
        subscriptions_.push_back(signaling_->Subscribe(EnvelopeType::PrekeyBundle,
            [this](const SignalingEnvelope& envelope) { OnPrekeyBundle(envelope); }));
        subscriptions_.push_back(signaling_->Subscribe(EnvelopeType::Presence,
            [this](const SignalingEnvelope& envelope) { OnPresence(envelope); }));
        subscriptions_.push_back(signaling_->Subscribe(EnvelopeType::Typing,
            [this](const SignalingEnvelope& envelope) { OnTyping(envelope); }));

        signaling_->SetStateHandler([this](const SignalingState state) { OnSignalingState(state); });
        router_->SetCiphertextHandler([this](const PeerKey& peer, const std::vector<uint8_t>& bytes) {
            OnCiphertext(peer, bytes);
        });
        router_->SetPhaseHandler([this](const PeerKey& peer, const enums::LinkPhase phase) {
            events_->OnTransportStateChanged(peer, phase);
        });
        // Only contacts may open a direct channel to this node.
        router_->SetAdmissionFilter([this](const PeerKey& peer) { return contacts_->Contains(peer); });
        router_->Start();
    }

    void SessionOrchestrator::UnregisterHandlers() {
        for (const auto id : subscriptions_) {
            signaling_->Unsubscribe(id);
        }
        subscriptions_.clear();
        signaling_->SetStateHandler(nullptr);
        router_->SetCiphertextHandler(nullptr);
        router_->SetPhaseHandler(nullptr);
        router_->SetAdmissionFilter(nullptr);
    }

    void SessionOrchestrator::ConnectSignaling(ReadyCallback on_ready) {
        CancelSignalingRetry();
        signaling_->Connect(self_public_key_, [this, on_ready = std::move(on_ready)](Result<Unit, ProtocolFailure> outcome) {
            if (outcome.IsOk()) {
                signaling_retry_delay_ = config_.signaling.reconnect_period;
                if (auto announced = AnnouncePresence(true); announced.IsErr()) {
                    MIST_LOG_WARN("Presence announcement failed: {}", announced.UnwrapErr().message);
                }
                if (config_.transport.eager_connect) {
                    for (const auto& peer : sessions_->Peers()) {
                        router_->Connect(peer);
                    }
                }
            } else {
                MIST_LOG_WARN("Signaling connect failed: {}", outcome.UnwrapErr().message);
                ScheduleSignalingRetry();
            }
            if (on_ready) {
                on_ready(outcome);
            }
        });
    }

    void SessionOrchestrator::ScheduleSignalingRetry() {
        if (!started_ || shut_down_ || signaling_retry_ ||
            signaling_->State() != SignalingState::Disconnected) {
            return;
        }
        const interfaces::Millis delay = signaling_retry_delay_;
        signaling_retry_delay_ = std::min(signaling_retry_delay_ * 2, config_.signaling.max_backoff);
        MIST_LOG_INFO("Retrying signaling in {} ms", delay.count());
        signaling_retry_ = loop_.ScheduleAfter(delay, [this]() {
            signaling_retry_.reset();
            ConnectSignaling(nullptr);
        });
    }

    void SessionOrchestrator::CancelSignalingRetry() {
        if (signaling_retry_) {
            signaling_retry_->Cancel();
            signaling_retry_.reset();
        }
    }

    Result<Unit, ProtocolFailure> SessionOrchestrator::Shutdown() {
        if (shut_down_) {
            return Result<Unit, ProtocolFailure>::Ok(Unit{});
        }
        shut_down_ = true;
        CancelSignalingRetry();
        if (signaling_->IsConnected()) {
            if (auto announced = AnnouncePresence(false); announced.IsErr()) {
                MIST_LOG_WARN("Offline announcement failed: {}", announced.UnwrapErr().message);
            }
        }
        if (started_) {
            UnregisterHandlers();
            started_ = false;
        }
        router_->Stop();
        signaling_->Disconnect();
        auto flushed = sessions_->Flush();
        MIST_LOG_INFO("Node {} shut down", logging::ShortKey(self_public_key_));
        return flushed;
    }

    bool SessionOrchestrator::SendPlaintext(std::span<const uint8_t> peer, std::span<const uint8_t> plaintext) {
        auto encrypted = sessions_->EncryptFor(peer, plaintext);
        if (encrypted.IsErr()) {
            const auto& failure = encrypted.UnwrapErr();
            MIST_LOG_WARN("Cannot encrypt for {}: {}", logging::ShortKey(peer), failure.message);
            if (failure.type == ProtocolFailureType::NoSession) {
                events_->OnRehandshakeRequired(PeerKey(peer.begin(), peer.end()));
            }
            return false;
        }
        const std::string bytes = encrypted.Unwrap().SerializeAsString();
        auto routed = router_->Send(peer, utilities::SpanOf(bytes));
        if (routed.IsErr()) {
            MIST_LOG_WARN("No route to {}: {}", logging::ShortKey(peer), routed.UnwrapErr().message);
            return false;
        }
        MIST_LOG_DEBUG("Message to {} sent via {}", logging::ShortKey(peer), transport::ToString(routed.Unwrap()));
        return true;
    }

    Result<Unit, ProtocolFailure> SessionOrchestrator::AddFriend(
        std::span<const uint8_t> peer,
        const std::optional<proto::protocol::PrekeyBundle>& bundle,
        const std::string& display_name,
        const TrustOrigin trust_origin,
        const std::string& trust_code) {
        if (auto valid = RequirePeerKey(peer); valid.IsErr()) {
            return valid;
        }
        if (SameKey(peer, self_public_key_)) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput("Cannot add yourself"));
        }
        if (sessions_->HasSession(peer)) {
            // Re-adding an existing friend can only strengthen how it is trusted.
            if (contacts_->Contains(peer)) {
                auto upgraded = contacts_->UpgradeTrustOrigin(peer, trust_origin);
                if (upgraded.IsErr()) {
                    return Result<Unit, ProtocolFailure>::Err(upgraded.UnwrapErr());
                }
            }
            return Result<Unit, ProtocolFailure>::Ok(Unit{});
        }

        PendingFriend info{display_name, trust_origin, trust_code};
        if (bundle.has_value()) {
            return StartHandshake(peer, *bundle, info);
        }

        const PeerKey key(peer.begin(), peer.end());
        pending_friends_[key] = info;
        proto::protocol::PrekeyBundlePayload request;
        request.set_request(true);
        if (auto sent = signaling_->Send(std::move(request), peer); sent.IsErr()) {
            pending_friends_.erase(key);
            return sent;
        }
        MIST_LOG_INFO("Requested prekey bundle from {}", logging::ShortKey(peer));
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    Result<Unit, ProtocolFailure> SessionOrchestrator::StartHandshake(
        std::span<const uint8_t> peer,
        const proto::protocol::PrekeyBundle& bundle,
        const PendingFriend& friend_info) {
        const PeerKey key(peer.begin(), peer.end());
        const bool was_contact = contacts_->Contains(peer);
        auto material = sessions_->InitiateHandshake(
            peer, bundle, session::PeerIntroduction{friend_info.display_name, friend_info.trust_origin});
        pending_friends_.erase(key);
        if (material.IsErr()) {
            const auto& failure = material.UnwrapErr();
            if (failure.type == ProtocolFailureType::SignatureInvalid) {
                events_->OnMessageRejected(key, failure);
            }
            return Result<Unit, ProtocolFailure>::Err(failure);
        }

        auto payload = material.Unwrap().ToPayload();
        payload.set_trust_code(friend_info.trust_code);
        RememberHandshake(key, payload);
        NotifyFriendAdded(key, was_contact);

        if (auto sent = signaling_->Send(std::move(payload), peer); sent.IsErr()) {
            MIST_LOG_WARN("handshake-init to {} not sent ({}); it is resent on reconnect",
                          logging::ShortKey(peer), sent.UnwrapErr().message);
        }
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    void SessionOrchestrator::NotifyFriendAdded(const PeerKey& peer, const bool was_contact) {
        if (was_contact) {
            return;
        }
        const auto contact = contacts_->Find(peer);
        if (contact.has_value()) {
            events_->OnFriendAdded(peer, contact->trust_origin);
        }
    }

    Result<Unit, ProtocolFailure> SessionOrchestrator::AddFriendFromVerification(
        const proto::protocol::VerificationPayload& payload,
        const std::string& display_name) {
        auto verified = trust::TrustVerifier::VerifyVerification(payload, loop_.Clock().WallClockMs());
        if (verified.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(verified.UnwrapErr());
        }
        const auto& peer = verified.Unwrap();
        return AddFriend(peer.public_key, std::nullopt, display_name, peer.trust_origin, peer.trust_code);
    }

    Result<Unit, ProtocolFailure> SessionOrchestrator::AddFriendFromInvite(
        const proto::protocol::InvitePayload& payload,
        const std::string& display_name) {
        auto redeemed = trust_->RedeemInvite(payload, loop_.Clock().WallClockMs());
        if (redeemed.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(redeemed.UnwrapErr());
        }
        const auto& peer = redeemed.Unwrap();
        return AddFriend(peer.public_key, std::nullopt, display_name, peer.trust_origin, peer.trust_code);
    }

    Result<proto::protocol::VerificationPayload, ProtocolFailure> SessionOrchestrator::IssueVerification() {
        return trust_->IssueVerification(*identity_, loop_.Clock().WallClockMs());
    }

    Result<proto::protocol::InvitePayload, ProtocolFailure> SessionOrchestrator::IssueInvite() {
        return trust_->IssueInvite(*identity_, loop_.Clock().WallClockMs());
    }

    Result<Unit, ProtocolFailure> SessionOrchestrator::RemoveFriend(std::span<const uint8_t> peer) {
        const PeerKey key(peer.begin(), peer.end());
        router_->Forget(peer);
        pending_friends_.erase(key);
        ForgetHandshake(key);
        if (auto removed = sessions_->RemovePeer(peer); removed.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(removed.UnwrapErr());
        }
        if (auto removed = contacts_->Remove(peer); removed.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(removed.UnwrapErr());
        }
        MIST_LOG_INFO("Removed friend {}", logging::ShortKey(peer));
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    Result<Unit, ProtocolFailure> SessionOrchestrator::SendTyping(std::span<const uint8_t> peer, const bool is_typing) {
        if (auto valid = RequirePeerKey(peer); valid.IsErr()) {
            return valid;
        }
        proto::protocol::TypingPayload payload;
        payload.set_is_typing(is_typing);
        return signaling_->Send(std::move(payload), peer);
    }

    Result<Unit, ProtocolFailure> SessionOrchestrator::AnnouncePresence(const bool online) {
        proto::protocol::PresencePayload payload;
        payload.set_online(online);
        return signaling_->Send(std::move(payload), std::nullopt);
    }

    void SessionOrchestrator::ConnectDirect(std::span<const uint8_t> peer) {
        router_->Connect(peer);
    }

    Result<Unit, ProtocolFailure> SessionOrchestrator::ResetIdentity(ReadyCallback on_ready) {
        router_->Stop();
        CancelSignalingRetry();
        signaling_->Disconnect();
        pending_friends_.clear();
        while (!unconfirmed_handshakes_.empty()) {
            const PeerKey peer = unconfirmed_handshakes_.begin()->first;
            ForgetHandshake(peer);
        }

        if (auto removed = sessions_->RemoveAll(); removed.IsErr()) {
            return removed;
        }
        if (auto cleared = contacts_->Clear(); cleared.IsErr()) {
            return cleared;
        }
        auto created = identity::IdentityKeys::Create(
            config_.session.one_time_prekey_count, loop_.Clock().WallClockMs());
        if (created.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(created.UnwrapErr());
        }
        auto fresh = std::make_unique<identity::IdentityKeys>(std::move(created).Unwrap());
        if (auto saved = identity::SaveIdentity(*store_, *fresh); saved.IsErr()) {
            return saved;
        }

        sessions_.reset();
        identity_ = std::move(fresh);
        self_public_key_ = identity_->GetIdentityEd25519PublicCopy();
        sessions_ = std::make_unique<session::SessionManager>(
            *identity_, *contacts_, *store_, loop_.Clock(), config_.session);
        trust_ = std::make_unique<trust::TrustVerifier>();
        MIST_LOG_INFO("Identity reset; new identity {}", logging::ShortKey(self_public_key_));

        if (started_) {
            router_->Start();
            ConnectSignaling(std::move(on_ready));
        } else if (on_ready) {
            loop_.Post([on_ready = std::move(on_ready)]() {
                on_ready(Result<Unit, ProtocolFailure>::Ok(Unit{}));
            });
        }
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    proto::protocol::PrekeyBundle SessionOrchestrator::PublicBundle() const {
        return identity_->CreatePublicBundle();
    }

    std::optional<session::PeerIntroduction> SessionOrchestrator::IntroductionFor(
        const PeerKey& peer,
        const proto::protocol::HandshakeInitPayload& payload) {
        if (const auto contact = contacts_->Find(peer); contact.has_value()) {
            return session::PeerIntroduction{contact->display_name, contact->trust_origin};
        }
        if (const auto pending = pending_friends_.find(peer); pending != pending_friends_.end()) {
            return session::PeerIntroduction{pending->second.display_name, pending->second.trust_origin};
        }
        if (!payload.trust_code().empty()) {
            const auto origin = trust_->ConsumeIssuedCode(payload.trust_code(), loop_.Clock().WallClockMs());
            if (origin.has_value()) {
                return session::PeerIntroduction{std::string(), *origin};
            }
        }
        return std::nullopt;
    }

    void SessionOrchestrator::OnHandshakeInit(const SignalingEnvelope& envelope) {
        const auto& payload = std::get<proto::protocol::HandshakeInitPayload>(envelope.payload);
        const PeerKey& peer = envelope.from;
        if (!SameKey(utilities::SpanOf(payload.identity_key()), peer)) {
            MIST_LOG_WARN("Dropping handshake-init whose identity does not match its sender {}",
                          logging::ShortKey(peer));
            return;
        }
        const std::optional<uint32_t> one_time_prekey_id = payload.has_one_time_prekey_id()
            ? std::optional<uint32_t>(payload.one_time_prekey_id())
            : std::nullopt;

        if (sessions_->IsUnconfirmedInitiator(peer)) {
            const auto ours = unconfirmed_handshakes_.find(peer);
            if (utilities::CompareKeys(self_public_key_, peer) < 0 && ours != unconfirmed_handshakes_.end()) {
                // The peer may never have seen our init; answering with it again lets it switch sides.
                MIST_LOG_INFO("Crossed handshake with {}: ours wins", logging::ShortKey(peer));
                if (auto sent = signaling_->Send(ours->second, std::span<const uint8_t>(peer)); sent.IsErr()) {
                    MIST_LOG_WARN("handshake-init resend to {} failed: {}", logging::ShortKey(peer),
                                  sent.UnwrapErr().message);
                }
                return;
            }
            MIST_LOG_INFO("Crossed handshake with {}: accepting theirs", logging::ShortKey(peer));
            if (auto removed = sessions_->RemovePeer(peer); removed.IsErr()) {
                MIST_LOG_ERROR("Cannot drop losing session with {}: {}", logging::ShortKey(peer),
                               removed.UnwrapErr().message);
                return;
            }
            ForgetHandshake(peer);
        } else if (sessions_->HasSession(peer)) {
            auto duplicate = sessions_->AcceptHandshake(
                peer, utilities::SpanOf(payload.ephemeral_key()), payload.signed_prekey_id(), one_time_prekey_id);
            if (duplicate.IsErr()) {
                MIST_LOG_WARN("Repeated handshake from {} failed: {}", logging::ShortKey(peer),
                              duplicate.UnwrapErr().message);
            }
            return;
        }

        const auto introduction = IntroductionFor(peer, payload);
        if (!introduction.has_value()) {
            MIST_LOG_WARN("Dropping handshake-init from unknown key {} without a valid trust code",
                          logging::ShortKey(peer));
            return;
        }

        const bool was_contact = contacts_->Contains(peer);
        auto accepted = sessions_->AcceptHandshake(
            peer, utilities::SpanOf(payload.ephemeral_key()), payload.signed_prekey_id(),
            one_time_prekey_id, *introduction);
        if (accepted.IsErr()) {
            events_->OnMessageRejected(peer, accepted.UnwrapErr());
            return;
        }
        pending_friends_.erase(peer);
        NotifyFriendAdded(peer, was_contact);
    }

    void SessionOrchestrator::OnPrekeyBundle(const SignalingEnvelope& envelope) {
        const auto& payload = std::get<proto::protocol::PrekeyBundlePayload>(envelope.payload);
        const PeerKey& peer = envelope.from;

        if (payload.request()) {
            proto::protocol::PrekeyBundlePayload response;
            *response.mutable_bundle() = identity_->CreatePublicBundle();
            if (auto sent = signaling_->Send(std::move(response), std::span<const uint8_t>(peer)); sent.IsErr()) {
                MIST_LOG_WARN("Prekey bundle for {} not sent: {}", logging::ShortKey(peer), sent.UnwrapErr().message);
            }
            return;
        }

        const auto pending = pending_friends_.find(peer);
        if (pending == pending_friends_.end()) {
            MIST_LOG_DEBUG("Ignoring unsolicited prekey bundle from {}", logging::ShortKey(peer));
            return;
        }
        if (!SameKey(utilities::SpanOf(payload.bundle().identity_key()), peer)) {
            MIST_LOG_WARN("Prekey bundle from {} names another identity", logging::ShortKey(peer));
            return;
        }
        const PendingFriend info = pending->second;
        if (auto started = StartHandshake(peer, payload.bundle(), info); started.IsErr()) {
            MIST_LOG_WARN("Handshake with {} not started: {}", logging::ShortKey(peer), started.UnwrapErr().message);
        }
    }

    void SessionOrchestrator::OnPresence(const SignalingEnvelope& envelope) {
        if (!contacts_->Contains(envelope.from)) {
            return;
        }
        const auto& payload = std::get<proto::protocol::PresencePayload>(envelope.payload);
        events_->OnPresence(envelope.from, payload.online());
    }

    void SessionOrchestrator::OnTyping(const SignalingEnvelope& envelope) {
        if (!contacts_->Contains(envelope.from)) {
            return;
        }
        const auto& payload = std::get<proto::protocol::TypingPayload>(envelope.payload);
        events_->OnTyping(envelope.from, payload.is_typing());
    }

    void SessionOrchestrator::OnCiphertext(const PeerKey& peer, const std::vector<uint8_t>& bytes) {
        proto::protocol::RatchetMessage message;
        if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            MIST_LOG_WARN("Undecodable ciphertext from {}", logging::ShortKey(peer));
            if (contacts_->Contains(peer)) {
                events_->OnMessageRejected(peer, ProtocolFailure::Decode("Ciphertext is not a ratchet message"));
            }
            return;
        }

        auto decrypted = sessions_->DecryptFrom(peer, message);
        if (decrypted.IsErr()) {
            const auto& failure = decrypted.UnwrapErr();
            switch (failure.type) {
                case ProtocolFailureType::NoSession:
                    events_->OnRehandshakeRequired(peer);
                    break;
                case ProtocolFailureType::UnknownSender:
                    MIST_LOG_WARN("Dropping ciphertext from unknown sender {}", logging::ShortKey(peer));
                    break;
                default:
                    events_->OnMessageRejected(peer, failure);
                    break;
            }
            return;
        }
        if (unconfirmed_handshakes_.contains(peer)) {
            ForgetHandshake(peer);
        }
        auto& plaintext = decrypted.Unwrap();
        events_->OnMessageDecrypted(peer, plaintext);
        auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext));
        (void) _wipe;
    }

    void SessionOrchestrator::OnSignalingState(const SignalingState state) {
        events_->OnSignalingStateChanged(state);
        if (state == SignalingState::Connected) {
            ResendPendingHandshakes();
        }
    }

    void SessionOrchestrator::ResendPendingHandshakes() {
        for (auto it = unconfirmed_handshakes_.begin(); it != unconfirmed_handshakes_.end();) {
            if (!sessions_->IsUnconfirmedInitiator(it->first)) {
                const PeerKey confirmed = it->first;
                ++it;
                ForgetHandshake(confirmed);
                continue;
            }
            if (auto sent = signaling_->Send(it->second, std::span<const uint8_t>(it->first)); sent.IsErr()) {
                MIST_LOG_WARN("handshake-init resend to {} failed: {}", logging::ShortKey(it->first),
                              sent.UnwrapErr().message);
            } else {
                MIST_LOG_DEBUG("Resent handshake-init to {}", logging::ShortKey(it->first));
            }
            ++it;
        }
    }

    Result<Unit, ProtocolFailure> SessionOrchestrator::RestorePendingHandshakes() {
        auto names = store_->List(storage::kHandshakesNamespace);
        if (names.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(names.UnwrapErr());
        }
        for (const auto& name : names.Unwrap()) {
            proto::protocol::PendingHandshakeRecord record;
            auto found = storage::GetMessage(*store_, storage::kHandshakesNamespace, name, record);
            const PeerKey peer(record.peer_public_key().begin(), record.peer_public_key().end());
            if (found.IsOk() && found.Unwrap() && sessions_->IsUnconfirmedInitiator(peer)) {
                unconfirmed_handshakes_[peer] = record.handshake_init();
                continue;
            }
            if (auto removed = store_->Remove(storage::kHandshakesNamespace, name); removed.IsErr()) {
                return removed;
            }
        }
        if (!unconfirmed_handshakes_.empty()) {
            MIST_LOG_INFO("{} unconfirmed handshake(s) will be resent", unconfirmed_handshakes_.size());
        }
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    void SessionOrchestrator::RememberHandshake(
        const PeerKey& peer,
        const proto::protocol::HandshakeInitPayload& payload) {
        unconfirmed_handshakes_[peer] = payload;
        proto::protocol::PendingHandshakeRecord record;
        record.set_peer_public_key(peer.data(), peer.size());
        *record.mutable_handshake_init() = payload;
        if (auto put = storage::PutMessage(*store_, storage::kHandshakesNamespace,
                                           utilities::ToUrlSafeBase64(peer), record);
            put.IsErr()) {
            MIST_LOG_ERROR("Pending handshake for {} not stored: {}", logging::ShortKey(peer),
                           put.UnwrapErr().message);
        }
    }

    void SessionOrchestrator::ForgetHandshake(const PeerKey& peer) {
        unconfirmed_handshakes_.erase(peer);
        if (auto removed = store_->Remove(storage::kHandshakesNamespace, utilities::ToUrlSafeBase64(peer));
            removed.IsErr()) {
            MIST_LOG_ERROR("Pending handshake for {} not removed: {}", logging::ShortKey(peer),
                           removed.UnwrapErr().message);
        }
    }
}
