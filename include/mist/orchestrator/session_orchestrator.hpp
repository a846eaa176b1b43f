#pragma once
#include "mist/configuration/node_config.hpp"
#include "mist/contacts/contact_directory.hpp"
#include "mist/identity/identity_keys.hpp"
#include "mist/interfaces/i_direct_channel.hpp"
#include "mist/interfaces/i_pubsub_transport.hpp"
#include "mist/interfaces/i_record_store.hpp"
#include "mist/interfaces/i_session_event_handler.hpp"
#include "mist/runtime/event_loop.hpp"
#include "mist/session/session_manager.hpp"
#include "mist/signaling/signaling_channel.hpp"
#include "mist/transport/transport_router.hpp"
#include "mist/trust/trust_verifier.hpp"
#include "protocol/trust.pb.h"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace mist::protocol::orchestrator {
using interfaces::ISessionEventHandler;

/**
 * @brief Wires identity, contacts, sessions, signaling and transport into one node
 *
 * Boot order: Create() restores (or generates) the identity, then contacts,
 * then every persisted session. Start() registers the envelope handlers and
 * only then connects signaling, so nothing inbound is processed before
 * restoration completes.
 *
 * A handshake-init from a key that is not a contact is accepted only when
 * this node is expecting it: either it asked that key for a prekey bundle,
 * or the handshake carries a verification or invite code this node issued.
 *
 * Crossed handshakes (both sides initiated before either message arrived)
 * resolve by key order: the smaller key's handshake wins, the larger side
 * drops its own session and accepts the winner's. The winner answers the
 * losing init by resending its own, so a lost winning init still converges.
 *
 * A boot connect that fails is retried on the event loop until it succeeds
 * or the node shuts down.
 *
 * Thread Safety: not thread-safe; all calls and events on the event loop thread.
 */
class SessionOrchestrator {
public:
    using PeerKey = std::vector<uint8_t>;
    using ReadyCallback = std::function<void(Result<Unit, ProtocolFailure>)>;

    /// store == nullptr opens the store named by config.storage (memory when empty).
    [[nodiscard]] static Result<std::unique_ptr<SessionOrchestrator>, ProtocolFailure> Create(
        runtime::EventLoop& loop,
        configuration::NodeConfig config,
        std::unique_ptr<interfaces::IPubSubTransport> signaling_transport,
        std::unique_ptr<interfaces::IDirectChannelFactory> channel_factory,
        std::shared_ptr<ISessionEventHandler> events,
        std::shared_ptr<interfaces::IRecordStore> store = nullptr);

    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    /// Registers handlers and connects signaling; on_ready receives the connect outcome.
    void Start(ReadyCallback on_ready);

    /// Announces offline presence, closes links, disconnects signaling and flushes storage.
    [[nodiscard]] Result<Unit, ProtocolFailure> Shutdown();

    /// Encrypts and routes. false when there is no usable session or no route took the bytes.
    bool SendPlaintext(std::span<const uint8_t> peer, std::span<const uint8_t> plaintext);

    /// With a bundle the handshake starts now; without one a prekey-bundle request is sent
    /// and the handshake starts when the bundle arrives.
    [[nodiscard]] Result<Unit, ProtocolFailure> AddFriend(
        std::span<const uint8_t> peer,
        const std::optional<proto::protocol::PrekeyBundle>& bundle,
        const std::string& display_name,
        enums::TrustOrigin trust_origin,
        const std::string& trust_code = {});

    [[nodiscard]] Result<Unit, ProtocolFailure> AddFriendFromVerification(
        const proto::protocol::VerificationPayload& payload,
        const std::string& display_name = {});
    [[nodiscard]] Result<Unit, ProtocolFailure> AddFriendFromInvite(
        const proto::protocol::InvitePayload& payload,
        const std::string& display_name = {});

    [[nodiscard]] Result<proto::protocol::VerificationPayload, ProtocolFailure> IssueVerification();
    [[nodiscard]] Result<proto::protocol::InvitePayload, ProtocolFailure> IssueInvite();

    [[nodiscard]] Result<Unit, ProtocolFailure> RemoveFriend(std::span<const uint8_t> peer);

    [[nodiscard]] Result<Unit, ProtocolFailure> SendTyping(std::span<const uint8_t> peer, bool is_typing);
    [[nodiscard]] Result<Unit, ProtocolFailure> AnnouncePresence(bool online);

    /// Starts direct-link negotiation with a peer.
    void ConnectDirect(std::span<const uint8_t> peer);

    /// Destroys every session and contact and replaces the identity, then
    /// reconnects signaling under the new key.
    [[nodiscard]] Result<Unit, ProtocolFailure> ResetIdentity(ReadyCallback on_ready);

    [[nodiscard]] const PeerKey& SelfPublicKey() const noexcept { return self_public_key_; }
    [[nodiscard]] proto::protocol::PrekeyBundle PublicBundle() const;

    [[nodiscard]] session::SessionManager& Sessions() noexcept { return *sessions_; }
    [[nodiscard]] contacts::ContactDirectory& Contacts() noexcept { return *contacts_; }
    [[nodiscard]] transport::TransportRouter& Router() noexcept { return *router_; }
    [[nodiscard]] signaling::SignalingChannel& Signaling() noexcept { return *signaling_; }
    [[nodiscard]] const identity::IdentityKeys& Identity() const noexcept { return *identity_; }

private:
    struct PendingFriend {
        std::string display_name;
        enums::TrustOrigin trust_origin = enums::TrustOrigin::SharedLink;
        std::string trust_code;
    };

    SessionOrchestrator(
        runtime::EventLoop& loop,
        configuration::NodeConfig config,
        std::shared_ptr<interfaces::IRecordStore> store,
        std::shared_ptr<ISessionEventHandler> events);

    [[nodiscard]] Result<Unit, ProtocolFailure> Restore(
        std::unique_ptr<interfaces::IPubSubTransport> signaling_transport,
        std::unique_ptr<interfaces::IDirectChannelFactory> channel_factory);
    void RegisterHandlers();
    void UnregisterHandlers();
    void ConnectSignaling(ReadyCallback on_ready);
    /// Retries a failed connect after signaling_retry_delay_, doubling up to max_backoff.
    void ScheduleSignalingRetry();
    void CancelSignalingRetry();

    void OnHandshakeInit(const signaling::SignalingEnvelope& envelope);
    void OnPrekeyBundle(const signaling::SignalingEnvelope& envelope);
    void OnPresence(const signaling::SignalingEnvelope& envelope);
    void OnTyping(const signaling::SignalingEnvelope& envelope);
    void OnCiphertext(const PeerKey& peer, const std::vector<uint8_t>& bytes);
    void OnSignalingState(enums::SignalingState state);

    [[nodiscard]] Result<Unit, ProtocolFailure> StartHandshake(
        std::span<const uint8_t> peer,
        const proto::protocol::PrekeyBundle& bundle,
        const PendingFriend& friend_info);
    [[nodiscard]] std::optional<session::PeerIntroduction> IntroductionFor(
        const PeerKey& peer,
        const proto::protocol::HandshakeInitPayload& payload);
    void ResendPendingHandshakes();
    [[nodiscard]] Result<Unit, ProtocolFailure> RestorePendingHandshakes();
    /// Keeps the handshake-init in memory and under "handshakes" until the peer confirms it.
    void RememberHandshake(const PeerKey& peer, const proto::protocol::HandshakeInitPayload& payload);
    void ForgetHandshake(const PeerKey& peer);
    void NotifyFriendAdded(const PeerKey& peer, bool was_contact);

    runtime::EventLoop& loop_;
    configuration::NodeConfig config_;
    std::shared_ptr<interfaces::IRecordStore> store_;
    std::shared_ptr<ISessionEventHandler> events_;
    std::unique_ptr<identity::IdentityKeys> identity_;
    PeerKey self_public_key_;
    std::unique_ptr<contacts::ContactDirectory> contacts_;
    std::unique_ptr<session::SessionManager> sessions_;
    std::unique_ptr<trust::TrustVerifier> trust_;
    std::unique_ptr<signaling::SignalingChannel> signaling_;
    std::unique_ptr<transport::TransportRouter> router_;

    std::map<PeerKey, PendingFriend> pending_friends_;
    std::map<PeerKey, proto::protocol::HandshakeInitPayload> unconfirmed_handshakes_;
    std::vector<signaling::SubscriptionId> subscriptions_;
    std::shared_ptr<runtime::Timer> signaling_retry_;
    interfaces::Millis signaling_retry_delay_{0};
    bool started_ = false;
    bool shut_down_ = false;
};

}
