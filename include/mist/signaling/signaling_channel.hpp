#pragma once
#include "mist/configuration/node_config.hpp"
#include "mist/enums/signaling_state.hpp"
#include "mist/interfaces/i_pubsub_transport.hpp"
#include "mist/runtime/event_loop.hpp"
#include "mist/signaling/signaling_envelope.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

namespace mist::protocol::signaling {
using enums::SignalingState;
using interfaces::IPubSubTransport;

using SubscriptionId = uint64_t;

/**
 * @brief Rendezvous channel: private inbox, broadcast and group addresses
 *
 * Connect() subscribes the caller's inbox and the broadcast address once the
 * transport is up. Delivery is best effort: an envelope published while the
 * recipient is offline is lost, and envelopes from different senders arrive
 * in any order.
 *
 * Inbound envelopes that do not decode, come from the local key, or are
 * addressed to another key are dropped before any handler runs. Ping
 * envelopes addressed to us are answered with a pong automatically.
 *
 * Thread Safety: not thread-safe. Every method and callback runs on the
 * event loop thread.
 */
class SignalingChannel {
public:
    using EnvelopeHandler = std::function<void(const SignalingEnvelope&)>;
    using StateHandler = std::function<void(SignalingState)>;
    using ConnectCallback = std::function<void(Result<Unit, ProtocolFailure>)>;

    SignalingChannel(
        runtime::EventLoop& loop,
        std::unique_ptr<IPubSubTransport> transport,
        configuration::SignalingConfig config);
    ~SignalingChannel();

    SignalingChannel(const SignalingChannel&) = delete;
    SignalingChannel& operator=(const SignalingChannel&) = delete;

    /// Completes with Ok once connected, or SignalingUnavailable after the last
    /// failed attempt. Calls made while connecting share the pending attempt;
    /// a call made while connected completes immediately.
    void Connect(std::span<const uint8_t> self_public_key, ConnectCallback on_complete);

    /// Unsubscribes, closes the transport and cancels pending retries.
    void Disconnect();

    /// Publishes to the recipient's inbox, or to broadcast when recipient is empty.
    /// Ok only says the envelope was handed to the transport.
    [[nodiscard]] Result<Unit, ProtocolFailure> Send(
        EnvelopePayload payload,
        std::optional<std::span<const uint8_t>> recipient);

    [[nodiscard]] Result<Unit, ProtocolFailure> SendToGroup(
        const std::string& group_id,
        EnvelopePayload payload);

    [[nodiscard]] Result<Unit, ProtocolFailure> JoinGroup(const std::string& group_id);
    [[nodiscard]] Result<Unit, ProtocolFailure> LeaveGroup(const std::string& group_id);

    /// nullopt subscribes to every type.
    SubscriptionId Subscribe(std::optional<EnvelopeType> type, EnvelopeHandler handler);
    bool Unsubscribe(SubscriptionId id);

    void SetStateHandler(StateHandler handler);

    [[nodiscard]] SignalingState State() const noexcept { return state_; }
    [[nodiscard]] bool IsConnected() const noexcept { return state_ == SignalingState::Connected; }
    [[nodiscard]] const std::vector<uint8_t>& SelfPublicKey() const noexcept { return self_public_key_; }
    [[nodiscard]] const std::set<std::string>& Groups() const noexcept { return groups_; }
    [[nodiscard]] uint32_t AttemptCount() const noexcept { return attempt_; }

private:
    struct Subscription {
        std::optional<EnvelopeType> type;
        EnvelopeHandler handler;
    };

    void PostCompletion(ConnectCallback on_complete, Result<Unit, ProtocolFailure> outcome);
    void StartAttempt();
    void OnAttemptFinished(uint64_t attempt_id, Result<Unit, ProtocolFailure> outcome);
    void OnConnectionLost(const std::string& reason);
    void ScheduleRetry();
    [[nodiscard]] Result<Unit, ProtocolFailure> SubscribeAddresses();
    void CompletePending(const Result<Unit, ProtocolFailure>& outcome);
    void CancelTimers();
    void SetState(SignalingState state);
    [[nodiscard]] interfaces::Millis BackoffFor(uint32_t attempt) const;

    void OnTransportMessage(const std::string& topic, const std::string& payload);
    void Dispatch(const SignalingEnvelope& envelope);
    [[nodiscard]] Result<Unit, ProtocolFailure> Publish(
        const std::string& topic,
        EnvelopePayload payload,
        std::optional<std::vector<uint8_t>> recipient);

    runtime::EventLoop& loop_;
    std::unique_ptr<IPubSubTransport> transport_;
    configuration::SignalingConfig config_;
    std::vector<uint8_t> self_public_key_;
    SignalingState state_ = SignalingState::Disconnected;
    StateHandler state_handler_;
    std::vector<ConnectCallback> pending_connects_;
    std::map<SubscriptionId, Subscription> subscriptions_;
    SubscriptionId next_subscription_id_ = 1;
    std::set<std::string> groups_;
    uint32_t attempt_ = 0;
    uint64_t attempt_id_ = 0;
    std::shared_ptr<runtime::Timer> timeout_timer_;
    std::shared_ptr<runtime::Timer> retry_timer_;
    std::shared_ptr<bool> alive_;
};

}
