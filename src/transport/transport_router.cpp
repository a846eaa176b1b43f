#include "mist/transport/transport_router.hpp"
#include "mist/crypto/sodium_interop.hpp"
#include "mist/protocol/constants.hpp"
#include "mist/utilities/key_encoding.hpp"
#include "mist/core/logging.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace mist::protocol::transport {
    using crypto::SodiumInterop;
    using signaling::SignalingEnvelope;
    using enums::EnvelopeType;

    namespace {
        constexpr size_t kNegotiationIdBytes = 9;
        constexpr Millis kMinimumSweepInterval{1};

        std::string NewNegotiationId() {
            return utilities::ToUrlSafeBase64(SodiumInterop::GetRandomBytes(kNegotiationIdBytes));
        }
    }

    TransportRouter::TransportRouter(
        runtime::EventLoop& loop,
        signaling::SignalingChannel& signaling,
        std::unique_ptr<IDirectChannelFactory> channel_factory,
        configuration::TransportConfig config)
        : loop_(loop)
        , signaling_(signaling)
        , channel_factory_(std::move(channel_factory))
        , config_(std::move(config))
        , alive_(std::make_shared<bool>(true)) {
    }

    TransportRouter::~TransportRouter() {
        phase_handler_ = nullptr;
        ciphertext_handler_ = nullptr;
        Stop();
        alive_.reset();
    }

    void TransportRouter::Start() {
        if (!subscriptions_.empty()) {
            return;
        }
        subscriptions_.push_back(signaling_.Subscribe(EnvelopeType::TransportOffer,
            [this](const SignalingEnvelope& envelope) { OnOffer(envelope); }));
        subscriptions_.push_back(signaling_.Subscribe(EnvelopeType::TransportAnswer,
            [this](const SignalingEnvelope& envelope) { OnAnswer(envelope); }));
        subscriptions_.push_back(signaling_.Subscribe(EnvelopeType::TransportIce,
            [this](const SignalingEnvelope& envelope) { OnIce(envelope); }));
        subscriptions_.push_back(signaling_.Subscribe(EnvelopeType::RelayedCiphertext,
            [this](const SignalingEnvelope& envelope) { OnRelayed(envelope); }));
        ScheduleSweep();
    }

    void TransportRouter::Stop() {
        for (const auto id : subscriptions_) {
            signaling_.Unsubscribe(id);
        }
        subscriptions_.clear();
        if (sweep_timer_) {
            sweep_timer_->Cancel();
            sweep_timer_.reset();
        }
        // The phase handler may forget links while we close them.
        for (const auto& peer : LinkKeys()) {
            Link* link = FindLink(peer);
            if (link != nullptr && (link->phase == LinkPhase::Negotiating || link->phase == LinkPhase::Open)) {
                CloseLink(*link, "router stopped");
            }
        }
    }

    void TransportRouter::SetCiphertextHandler(CiphertextHandler handler) {
        ciphertext_handler_ = std::move(handler);
    }

    void TransportRouter::SetPhaseHandler(PhaseHandler handler) {
        phase_handler_ = std::move(handler);
    }

    void TransportRouter::SetAdmissionFilter(AdmissionFilter filter) {
        admission_filter_ = std::move(filter);
    }

    std::vector<TransportRouter::PeerKey> TransportRouter::LinkKeys() const {
        std::vector<PeerKey> keys;
        keys.reserve(links_.size());
        for (const auto& [peer, link] : links_) {
            keys.push_back(peer);
        }
        return keys;
    }

    TransportRouter::Link& TransportRouter::LinkFor(std::span<const uint8_t> peer) {
        PeerKey key(peer.begin(), peer.end());
        auto [it, inserted] = links_.try_emplace(key);
        if (inserted) {
            it->second.peer = std::move(key);
            it->second.last_activity = loop_.Now();
        }
        return it->second;
    }

    TransportRouter::Link* TransportRouter::FindLink(std::span<const uint8_t> peer) {
        const auto it = links_.find(PeerKey(peer.begin(), peer.end()));
        return it == links_.end() ? nullptr : &it->second;
    }

    const TransportRouter::Link* TransportRouter::FindLink(std::span<const uint8_t> peer) const {
        const auto it = links_.find(PeerKey(peer.begin(), peer.end()));
        return it == links_.end() ? nullptr : &it->second;
    }

    LinkPhase TransportRouter::PhaseOf(std::span<const uint8_t> peer) const {
        const Link* link = FindLink(peer);
        return link ? link->phase : LinkPhase::Idle;
    }

    size_t TransportRouter::OpenLinkCount() const {
        return static_cast<size_t>(std::count_if(links_.begin(), links_.end(), [](const auto& entry) {
            return entry.second.phase == LinkPhase::Open;
        }));
    }

    void TransportRouter::Connect(std::span<const uint8_t> peer) {
        if (peer.size() != kEd25519PublicKeyBytes) {
            MIST_LOG_WARN("Ignoring transport connect for a malformed key");
            return;
        }
        Link& link = LinkFor(peer);
        if (link.phase == LinkPhase::Negotiating || link.phase == LinkPhase::Open) {
            return;
        }
        StartNegotiation(link);
    }

    void TransportRouter::StartNegotiation(Link& link) {
        const std::string negotiation_id = NewNegotiationId();
        auto channel = NewChannel(link.peer, negotiation_id);
        auto offer = channel->CreateOffer();
        if (offer.IsErr()) {
            MIST_LOG_WARN("Cannot create offer for {}: {}", logging::ShortKey(link.peer), offer.UnwrapErr().message);
            SetPhase(link, LinkPhase::Closed);
            return;
        }
        link.channel = std::move(channel);
        link.negotiation_id = negotiation_id;
        link.local_offer = true;
        link.last_activity = loop_.Now();
        SetPhase(link, LinkPhase::Negotiating);
        ArmNegotiationTimer(link);

        proto::protocol::TransportOfferPayload payload;
        payload.set_negotiation_id(negotiation_id);
        payload.set_sdp(offer.Unwrap());
        if (auto sent = signaling_.Send(std::move(payload), std::span<const uint8_t>(link.peer)); sent.IsErr()) {
            MIST_LOG_WARN("Offer to {} not sent: {}", logging::ShortKey(link.peer), sent.UnwrapErr().message);
        } else {
            MIST_LOG_DEBUG("Offer {} sent to {}", negotiation_id, logging::ShortKey(link.peer));
        }
    }

    void TransportRouter::AnswerOffer(Link& link, const proto::protocol::TransportOfferPayload& offer) {
        auto channel = NewChannel(link.peer, offer.negotiation_id());
        auto answer = channel->AcceptOffer(offer.sdp());
        if (answer.IsErr()) {
            MIST_LOG_WARN("Cannot answer offer from {}: {}", logging::ShortKey(link.peer), answer.UnwrapErr().message);
            SetPhase(link, LinkPhase::Closed);
            return;
        }
        link.channel = std::move(channel);
        link.negotiation_id = offer.negotiation_id();
        link.local_offer = false;
        link.last_activity = loop_.Now();
        SetPhase(link, LinkPhase::Negotiating);
        ArmNegotiationTimer(link);

        proto::protocol::TransportAnswerPayload payload;
        payload.set_negotiation_id(offer.negotiation_id());
        payload.set_sdp(answer.Unwrap());
        if (auto sent = signaling_.Send(std::move(payload), std::span<const uint8_t>(link.peer)); sent.IsErr()) {
            MIST_LOG_WARN("Answer to {} not sent: {}", logging::ShortKey(link.peer), sent.UnwrapErr().message);
        }
    }

    std::unique_ptr<IDirectChannel> TransportRouter::NewChannel(const PeerKey& peer, const std::string& negotiation_id) {
        auto channel = channel_factory_->CreateChannel(peer);
        std::weak_ptr<bool> alive = alive_;
        channel->SetOpenHandler([this, alive, peer, negotiation_id]() {
            if (!alive.expired()) {
                OnChannelOpen(peer, negotiation_id);
            }
        });
        channel->SetCloseHandler([this, alive, peer, negotiation_id](const std::string& reason) {
            if (!alive.expired()) {
                OnChannelClosed(peer, negotiation_id, reason);
            }
        });
        channel->SetMessageHandler([this, alive, peer, negotiation_id](const std::vector<uint8_t>& bytes) {
            if (!alive.expired()) {
                OnChannelMessage(peer, negotiation_id, bytes);
            }
        });
        channel->SetCandidateHandler([this, alive, peer, negotiation_id](const interfaces::IceCandidate& candidate) {
            if (!alive.expired()) {
                OnLocalCandidate(peer, negotiation_id, candidate);
            }
        });
        return channel;
    }

    void TransportRouter::ArmNegotiationTimer(Link& link) {
        if (link.negotiation_timer) {
            link.negotiation_timer->Cancel();
        }
        std::weak_ptr<bool> alive = alive_;
        link.negotiation_timer = loop_.ScheduleAfter(config_.negotiation_timeout,
            [this, alive, peer = link.peer, negotiation_id = link.negotiation_id]() {
                if (alive.expired()) {
                    return;
                }
                Link* current = FindLink(peer);
                if (current == nullptr || current->phase != LinkPhase::Negotiating ||
                    current->negotiation_id != negotiation_id) {
                    return;
                }
                MIST_LOG_INFO("Negotiation with {} timed out; traffic stays on the relay", logging::ShortKey(peer));
                CloseLink(*current, "negotiation timed out");
            });
    }

    void TransportRouter::RetireChannel(Link& link) {
        if (!link.channel) {
            return;
        }
        link.channel->SetOpenHandler(nullptr);
        link.channel->SetCloseHandler(nullptr);
        link.channel->SetMessageHandler(nullptr);
        link.channel->SetCandidateHandler(nullptr);
        link.channel->Close();
        // May be running inside one of this channel's callbacks; release it on the next turn.
        std::shared_ptr<IDirectChannel> retired = std::move(link.channel);
        loop_.Post([retired]() {});
    }

    void TransportRouter::CloseLink(Link& link, const std::string& reason) {
        MIST_LOG_DEBUG("Closing link to {}: {}", logging::ShortKey(link.peer), reason);
        if (link.negotiation_timer) {
            link.negotiation_timer->Cancel();
            link.negotiation_timer.reset();
        }
        RetireChannel(link);
        link.negotiation_id.clear();
        link.local_offer = false;
        link.last_activity = loop_.Now();
        SetPhase(link, LinkPhase::Closed);
    }

    void TransportRouter::SetPhase(Link& link, const LinkPhase phase) {
        if (link.phase == phase) {
            return;
        }
        MIST_LOG_DEBUG("Link {} {} -> {}", logging::ShortKey(link.peer), enums::ToString(link.phase),
                       enums::ToString(phase));
        link.phase = phase;
        if (phase_handler_) {
            const PeerKey peer = link.peer;
            phase_handler_(peer, phase);
        }
    }

    Result<Route, ProtocolFailure> TransportRouter::Send(std::span<const uint8_t> peer, std::span<const uint8_t> bytes) {
        if (peer.size() != kEd25519PublicKeyBytes) {
            return Result<Route, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Recipient must be a 32-byte public key"));
        }
        if (bytes.empty()) {
            return Result<Route, ProtocolFailure>::Err(ProtocolFailure::InvalidInput("Nothing to send"));
        }
        Link* link = FindLink(peer);
        if (link != nullptr && link->phase == LinkPhase::Open && link->channel) {
            auto direct = link->channel->Send(bytes);
            if (direct.IsOk()) {
                link->last_activity = loop_.Now();
                return Result<Route, ProtocolFailure>::Ok(Route::Direct);
            }
            MIST_LOG_WARN("Direct send to {} failed ({}); relaying", logging::ShortKey(peer),
                          direct.UnwrapErr().message);
            CloseLink(*link, "direct send failed");
        }

        proto::protocol::RelayedCiphertextPayload payload;
        payload.set_ciphertext(bytes.data(), bytes.size());
        auto relayed = signaling_.Send(std::move(payload), peer);
        if (relayed.IsErr()) {
            return Result<Route, ProtocolFailure>::Err(relayed.UnwrapErr());
        }
        return Result<Route, ProtocolFailure>::Ok(Route::Relay);
    }

    void TransportRouter::Disconnect(std::span<const uint8_t> peer) {
        Link* link = FindLink(peer);
        if (link == nullptr) {
            return;
        }
        if (link->phase == LinkPhase::Negotiating || link->phase == LinkPhase::Open) {
            CloseLink(*link, "local disconnect");
        }
    }

    void TransportRouter::Forget(std::span<const uint8_t> peer) {
        Disconnect(peer);
        links_.erase(PeerKey(peer.begin(), peer.end()));
    }

    void TransportRouter::OnOffer(const SignalingEnvelope& envelope) {
        const auto& offer = std::get<proto::protocol::TransportOfferPayload>(envelope.payload);
        if (admission_filter_ && !admission_filter_(envelope.from)) {
            MIST_LOG_DEBUG("Ignoring offer from unknown key {}", logging::ShortKey(envelope.from));
            return;
        }
        Link& link = LinkFor(envelope.from);
        link.last_activity = loop_.Now();

        if (link.negotiation_id == offer.negotiation_id()) {
            MIST_LOG_DEBUG("Duplicate offer {} from {}", offer.negotiation_id(), logging::ShortKey(link.peer));
            return;
        }

        if (link.phase == LinkPhase::Negotiating && link.local_offer) {
            const int order = utilities::CompareKeys(signaling_.SelfPublicKey(), link.peer);
            if (order < 0) {
                MIST_LOG_DEBUG("Crossed offers with {}: keeping ours", logging::ShortKey(link.peer));
                return;
            }
            MIST_LOG_DEBUG("Crossed offers with {}: answering theirs", logging::ShortKey(link.peer));
        } else if (link.phase == LinkPhase::Open) {
            MIST_LOG_INFO("New offer from {} supersedes the open link", logging::ShortKey(link.peer));
        }

        if (link.negotiation_timer) {
            link.negotiation_timer->Cancel();
            link.negotiation_timer.reset();
        }
        RetireChannel(link);
        AnswerOffer(link, offer);
    }

    void TransportRouter::OnAnswer(const SignalingEnvelope& envelope) {
        const auto& answer = std::get<proto::protocol::TransportAnswerPayload>(envelope.payload);
        Link* link = FindLink(envelope.from);
        if (link == nullptr || link->phase != LinkPhase::Negotiating || !link->local_offer ||
            link->negotiation_id != answer.negotiation_id() || !link->channel) {
            MIST_LOG_DEBUG("Ignoring answer {} from {} without a pending offer",
                           answer.negotiation_id(), logging::ShortKey(envelope.from));
            return;
        }
        link->last_activity = loop_.Now();
        if (auto applied = link->channel->ApplyAnswer(answer.sdp()); applied.IsErr()) {
            MIST_LOG_WARN("Answer from {} rejected: {}", logging::ShortKey(link->peer), applied.UnwrapErr().message);
            CloseLink(*link, "answer rejected");
        }
    }

    void TransportRouter::OnIce(const SignalingEnvelope& envelope) {
        const auto& ice = std::get<proto::protocol::TransportIcePayload>(envelope.payload);
        Link* link = FindLink(envelope.from);
        if (link == nullptr || link->negotiation_id != ice.negotiation_id() || !link->channel) {
            MIST_LOG_TRACE("Dropping candidate for unknown negotiation {}", ice.negotiation_id());
            return;
        }
        interfaces::IceCandidate candidate{ice.candidate(), ice.sdp_mid(), ice.sdp_mline_index()};
        if (auto added = link->channel->AddRemoteCandidate(candidate); added.IsErr()) {
            MIST_LOG_DEBUG("Candidate from {} rejected: {}", logging::ShortKey(link->peer), added.UnwrapErr().message);
        }
    }

    void TransportRouter::OnRelayed(const SignalingEnvelope& envelope) {
        const auto& relayed = std::get<proto::protocol::RelayedCiphertextPayload>(envelope.payload);
        if (Link* link = FindLink(envelope.from); link != nullptr) {
            link->last_activity = loop_.Now();
        }
        if (ciphertext_handler_) {
            const std::vector<uint8_t> bytes(relayed.ciphertext().begin(), relayed.ciphertext().end());
            ciphertext_handler_(envelope.from, bytes);
        }
    }

    void TransportRouter::OnChannelOpen(const PeerKey& peer, const std::string& negotiation_id) {
        Link* link = FindLink(peer);
        if (link == nullptr || link->negotiation_id != negotiation_id || link->phase != LinkPhase::Negotiating) {
            return;
        }
        if (link->negotiation_timer) {
            link->negotiation_timer->Cancel();
            link->negotiation_timer.reset();
        }
        link->last_activity = loop_.Now();
        MIST_LOG_INFO("Direct link to {} open", logging::ShortKey(peer));
        SetPhase(*link, LinkPhase::Open);
    }

    void TransportRouter::OnChannelClosed(
        const PeerKey& peer,
        const std::string& negotiation_id,
        const std::string& reason) {
        Link* link = FindLink(peer);
        if (link == nullptr || link->negotiation_id != negotiation_id) {
            return;
        }
        CloseLink(*link, reason);
    }

    void TransportRouter::OnChannelMessage(
        const PeerKey& peer,
        const std::string& negotiation_id,
        const std::vector<uint8_t>& bytes) {
        Link* link = FindLink(peer);
        if (link == nullptr || link->negotiation_id != negotiation_id) {
            return;
        }
        link->last_activity = loop_.Now();
        if (ciphertext_handler_) {
            ciphertext_handler_(peer, bytes);
        }
    }

    void TransportRouter::OnLocalCandidate(
        const PeerKey& peer,
        const std::string& negotiation_id,
        const interfaces::IceCandidate& candidate) {
        const Link* link = FindLink(peer);
        if (link == nullptr || link->negotiation_id != negotiation_id) {
            return;
        }
        proto::protocol::TransportIcePayload payload;
        payload.set_negotiation_id(negotiation_id);
        payload.set_candidate(candidate.candidate);
        payload.set_sdp_mid(candidate.sdp_mid);
        payload.set_sdp_mline_index(candidate.sdp_mline_index);
        if (auto sent = signaling_.Send(std::move(payload), std::span<const uint8_t>(peer)); sent.IsErr()) {
            MIST_LOG_DEBUG("Candidate to {} not sent: {}", logging::ShortKey(peer), sent.UnwrapErr().message);
        }
    }

    void TransportRouter::ScheduleSweep() {
        const Millis interval = std::max(kMinimumSweepInterval, config_.idle_timeout / 5);
        std::weak_ptr<bool> alive = alive_;
        sweep_timer_ = loop_.ScheduleAfter(interval, [this, alive]() {
            if (alive.expired()) {
                return;
            }
            SweepIdle();
            ScheduleSweep();
        });
    }

    void TransportRouter::SweepIdle() {
        const Millis now = loop_.Now();
        for (const auto& peer : LinkKeys()) {
            Link* link = FindLink(peer);
            if (link == nullptr || link->phase == LinkPhase::Negotiating ||
                now - link->last_activity < config_.idle_timeout) {
                continue;
            }
            if (link->phase == LinkPhase::Open) {
                MIST_LOG_INFO("Closing idle link to {}", logging::ShortKey(peer));
                CloseLink(*link, "idle");
                continue;
            }
            // Closed or Idle for a full timeout; the record goes.
            links_.erase(peer);
        }
    }
}
