#pragma once
#include "mist/configuration/node_config.hpp"
#include "mist/enums/link_phase.hpp"
#include "mist/interfaces/i_direct_channel.hpp"
#include "mist/runtime/event_loop.hpp"
#include "mist/signaling/signaling_channel.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace mist::protocol::transport {
using enums::LinkPhase;
using interfaces::IDirectChannel;
using interfaces::IDirectChannelFactory;
using interfaces::Millis;

enum class Route : uint8_t {
    Direct = 0,
    Relay = 1
};

[[nodiscard]] inline const char* ToString(const Route route) {
    return route == Route::Direct ? "direct" : "relay";
}

/**
 * @brief Chooses between a direct peer channel and the signaling relay
 *
 * Each peer has at most one TransportLink. Negotiation envelopes
 * (transport-offer / -answer / -ice) travel over signaling and carry a
 * negotiation id; anything naming a superseded negotiation is ignored.
 *
 * Glare: when offers cross, the side with the lexicographically larger
 * public key drops its own offer and answers the peer's; the smaller side
 * ignores the incoming offer and waits for its answer.
 *
 * Link records exist only for peers this node negotiated with. Records that
 * stay Closed or Idle for idle_timeout are removed by the sweep.
 *
 * Thread Safety: not thread-safe; runs on the event loop thread.
 */
class TransportRouter {
public:
    using PeerKey = std::vector<uint8_t>;
    using CiphertextHandler = std::function<void(const PeerKey& peer, const std::vector<uint8_t>& bytes)>;
    using PhaseHandler = std::function<void(const PeerKey& peer, LinkPhase phase)>;
    using AdmissionFilter = std::function<bool(const PeerKey& peer)>;

    TransportRouter(
        runtime::EventLoop& loop,
        signaling::SignalingChannel& signaling,
        std::unique_ptr<IDirectChannelFactory> channel_factory,
        configuration::TransportConfig config);
    ~TransportRouter();

    TransportRouter(const TransportRouter&) = delete;
    TransportRouter& operator=(const TransportRouter&) = delete;

    /// Registers the negotiation and relay handlers and starts the idle sweep.
    void Start();
    /**
     * @brief Closes every negotiating or open link and unregisters from signaling
     *
     * The phase handler sees each Closed transition and may Forget() links
     * while Stop() is running.
     */
    void Stop();

    /**
     * @brief Starts a direct-link negotiation with a peer
     *
     * Does nothing while a negotiation is running or the link is open, or
     * when the key is not 32 bytes. A negotiation without an open channel
     * after negotiation_timeout moves the link to Closed.
     *
     * @param peer Peer identity key
     */
    void Connect(std::span<const uint8_t> peer);

    /**
     * @brief Delivers bytes over the direct link, falling back to the relay
     *
     * A failed direct send closes the link and the bytes go out on the relay.
     * Sending never creates a link record.
     *
     * @param peer Recipient identity key
     * @param bytes Ciphertext to deliver
     * @return Ok(route taken), or Err when neither route accepted the bytes
     *         (InvalidInput for a malformed key or empty bytes)
     */
    [[nodiscard]] Result<Route, ProtocolFailure> Send(std::span<const uint8_t> peer, std::span<const uint8_t> bytes);

    /// Closes the link but keeps its record until the idle sweep removes it.
    void Disconnect(std::span<const uint8_t> peer);
    /// Disconnects and drops the link record.
    void Forget(std::span<const uint8_t> peer);

    [[nodiscard]] LinkPhase PhaseOf(std::span<const uint8_t> peer) const;
    [[nodiscard]] size_t LinkCount() const noexcept { return links_.size(); }
    [[nodiscard]] size_t OpenLinkCount() const;

    /**
     * @brief Receives ciphertext from either route
     *
     * Relayed ciphertext is handed over for any sender key; deciding whether
     * the sender is known is the handler's job.
     */
    void SetCiphertextHandler(CiphertextHandler handler);
    /// Called on every phase change of every link.
    void SetPhaseHandler(PhaseHandler handler);
    /**
     * @brief Decides which keys may negotiate a direct link with this node
     *
     * Offers from keys the filter rejects are dropped before any link record
     * or channel is created. Without a filter every offer is answered.
     */
    void SetAdmissionFilter(AdmissionFilter filter);

private:
    struct Link {
        PeerKey peer;
        LinkPhase phase = LinkPhase::Idle;
        Millis last_activity{0};
        std::string negotiation_id;
        bool local_offer = false;
        std::unique_ptr<IDirectChannel> channel;
        std::shared_ptr<runtime::Timer> negotiation_timer;
    };

    Link& LinkFor(std::span<const uint8_t> peer);
    [[nodiscard]] Link* FindLink(std::span<const uint8_t> peer);
    [[nodiscard]] const Link* FindLink(std::span<const uint8_t> peer) const;
    [[nodiscard]] std::vector<PeerKey> LinkKeys() const;

    void StartNegotiation(Link& link);
    void AnswerOffer(Link& link, const proto::protocol::TransportOfferPayload& offer);
    [[nodiscard]] std::unique_ptr<IDirectChannel> NewChannel(const PeerKey& peer, const std::string& negotiation_id);
    void ArmNegotiationTimer(Link& link);
    void CloseLink(Link& link, const std::string& reason);
    void RetireChannel(Link& link);
    void SetPhase(Link& link, LinkPhase phase);
    void SweepIdle();
    void ScheduleSweep();

    void OnOffer(const signaling::SignalingEnvelope& envelope);
    void OnAnswer(const signaling::SignalingEnvelope& envelope);
    void OnIce(const signaling::SignalingEnvelope& envelope);
    void OnRelayed(const signaling::SignalingEnvelope& envelope);

    void OnChannelOpen(const PeerKey& peer, const std::string& negotiation_id);
    void OnChannelClosed(const PeerKey& peer, const std::string& negotiation_id, const std::string& reason);
    void OnChannelMessage(const PeerKey& peer, const std::string& negotiation_id, const std::vector<uint8_t>& bytes);
    void OnLocalCandidate(const PeerKey& peer, const std::string& negotiation_id, const interfaces::IceCandidate& candidate);

    runtime::EventLoop& loop_;
    signaling::SignalingChannel& signaling_;
    std::unique_ptr<IDirectChannelFactory> channel_factory_;
    configuration::TransportConfig config_;
    std::map<PeerKey, Link> links_;
    std::vector<signaling::SubscriptionId> subscriptions_;
    std::shared_ptr<runtime::Timer> sweep_timer_;
    CiphertextHandler ciphertext_handler_;
    PhaseHandler phase_handler_;
    AdmissionFilter admission_filter_;
    std::shared_ptr<bool> alive_;
};

}
