#include "mist/signaling/signaling_channel.hpp"
#include "mist/signaling/addresses.hpp"
#include "mist/protocol/constants.hpp"
#include "mist/core/logging.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace mist::protocol::signaling {
    using interfaces::Millis;

    namespace {
        bool SameKey(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) {
            return std::ranges::equal(lhs, rhs);
        }
    }

    SignalingChannel::SignalingChannel(
        runtime::EventLoop& loop,
        std::unique_ptr<IPubSubTransport> transport,
        configuration::SignalingConfig config)
        : loop_(loop)
        , transport_(std::move(transport))
        , config_(std::move(config))
        , alive_(std::make_shared<bool>(true)) {
        std::weak_ptr<bool> alive = alive_;
        transport_->SetMessageHandler([this, alive](const std::string& topic, const std::string& payload) {
            if (alive.expired()) {
                return;
            }
            OnTransportMessage(topic, payload);
        });
        transport_->SetConnectionLostHandler([this, alive](const std::string& reason) {
            if (alive.expired()) {
                return;
            }
            OnConnectionLost(reason);
        });
    }

    SignalingChannel::~SignalingChannel() {
        CancelTimers();
        alive_.reset();
        transport_->SetMessageHandler(nullptr);
        transport_->SetConnectionLostHandler(nullptr);
        transport_->Disconnect();
    }

    void SignalingChannel::Connect(std::span<const uint8_t> self_public_key, ConnectCallback on_complete) {
        if (self_public_key.size() != kEd25519PublicKeyBytes) {
            PostCompletion(std::move(on_complete), Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Signaling identity must be a 32-byte public key")));
            return;
        }
        if (state_ != SignalingState::Disconnected && !SameKey(self_public_key, self_public_key_)) {
            PostCompletion(std::move(on_complete), Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Signaling channel is bound to another identity")));
            return;
        }

        switch (state_) {
            case SignalingState::Connected:
                PostCompletion(std::move(on_complete), Result<Unit, ProtocolFailure>::Ok(Unit{}));
                return;
            case SignalingState::Connecting:
            case SignalingState::Reconnecting:
                pending_connects_.push_back(std::move(on_complete));
                return;
            case SignalingState::Disconnected:
                break;
        }

        self_public_key_.assign(self_public_key.begin(), self_public_key.end());
        pending_connects_.push_back(std::move(on_complete));
        attempt_ = 0;
        MIST_LOG_INFO("Signaling connecting as {} ({})",
                      logging::ShortKey(self_public_key_), config_.broker_url);
        SetState(SignalingState::Connecting);
        StartAttempt();
    }

    void SignalingChannel::PostCompletion(ConnectCallback on_complete, Result<Unit, ProtocolFailure> outcome) {
        std::weak_ptr<bool> alive = alive_;
        loop_.Post([alive, on_complete = std::move(on_complete), outcome = std::move(outcome)]() {
            if (alive.expired()) {
                return;
            }
            on_complete(outcome);
        });
    }

    void SignalingChannel::Disconnect() {
        CancelTimers();
        attempt_id_++;
        if (state_ == SignalingState::Disconnected && pending_connects_.empty()) {
            return;
        }
        if (transport_->IsConnected()) {
            for (const auto& group : groups_) {
                if (auto result = transport_->Unsubscribe(GroupAddress(config_.namespace_prefix, group));
                    result.IsErr()) {
                    MIST_LOG_DEBUG("Unsubscribe from group {} failed: {}", group, result.UnwrapErr().message);
                }
            }
        }
        transport_->Disconnect();
        SetState(SignalingState::Disconnected);
        CompletePending(Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::SignalingUnavailable("Signaling disconnected before the connection completed")));
        MIST_LOG_INFO("Signaling disconnected");
    }

    void SignalingChannel::StartAttempt() {
        attempt_++;
        const uint64_t id = ++attempt_id_;
        MIST_LOG_DEBUG("Signaling connect attempt {} (id {})", attempt_, id);

        std::weak_ptr<bool> alive = alive_;
        timeout_timer_ = loop_.ScheduleAfter(config_.connect_timeout, [this, alive, id]() {
            if (alive.expired() || id != attempt_id_) {
                return;
            }
            transport_->Disconnect();
            OnAttemptFinished(id, Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::SignalingUnavailable("Connect attempt timed out")));
        });
        transport_->Connect([this, alive, id](Result<Unit, ProtocolFailure> outcome) {
            if (alive.expired()) {
                return;
            }
            OnAttemptFinished(id, std::move(outcome));
        });
    }

    void SignalingChannel::OnAttemptFinished(const uint64_t attempt_id, Result<Unit, ProtocolFailure> outcome) {
        if (attempt_id != attempt_id_ ||
            (state_ != SignalingState::Connecting && state_ != SignalingState::Reconnecting)) {
            return;
        }
        if (timeout_timer_) {
            timeout_timer_->Cancel();
            timeout_timer_.reset();
        }
        // Stale completions from this attempt must not be handled twice.
        attempt_id_++;

        if (outcome.IsOk()) {
            if (auto subscribed = SubscribeAddresses(); subscribed.IsErr()) {
                transport_->Disconnect();
                outcome = Result<Unit, ProtocolFailure>::Err(subscribed.UnwrapErr());
            }
        }

        if (outcome.IsOk()) {
            MIST_LOG_INFO("Signaling connected after {} attempt(s)", attempt_);
            SetState(SignalingState::Connected);
            CompletePending(Result<Unit, ProtocolFailure>::Ok(Unit{}));
            return;
        }

        const auto& failure = outcome.UnwrapErr();
        MIST_LOG_WARN("Signaling connect attempt {} failed: {}", attempt_, failure.message);
        if (state_ == SignalingState::Connecting && attempt_ >= config_.max_connect_attempts) {
            SetState(SignalingState::Disconnected);
            CompletePending(Result<Unit, ProtocolFailure>::Err(ProtocolFailure::SignalingUnavailable(
                fmt::format("Signaling unavailable after {} attempts: {}", attempt_, failure.message))));
            return;
        }
        ScheduleRetry();
    }

    void SignalingChannel::OnConnectionLost(const std::string& reason) {
        if (state_ != SignalingState::Connected) {
            return;
        }
        MIST_LOG_WARN("Signaling connection lost: {}", reason);
        attempt_ = 0;
        SetState(SignalingState::Reconnecting);
        ScheduleRetry();
    }

    void SignalingChannel::ScheduleRetry() {
        const Millis delay = BackoffFor(attempt_);
        MIST_LOG_DEBUG("Signaling retry in {} ms", delay.count());
        std::weak_ptr<bool> alive = alive_;
        retry_timer_ = loop_.ScheduleAfter(delay, [this, alive]() {
            if (alive.expired()) {
                return;
            }
            retry_timer_.reset();
            StartAttempt();
        });
    }

    Millis SignalingChannel::BackoffFor(const uint32_t attempt) const {
        Millis delay = config_.reconnect_period;
        for (uint32_t i = 1; i < attempt && delay < config_.max_backoff; ++i) {
            delay *= 2;
        }
        return std::min(delay, config_.max_backoff);
    }

    Result<Unit, ProtocolFailure> SignalingChannel::SubscribeAddresses() {
        std::vector<std::string> topics{
            InboxAddress(config_.namespace_prefix, self_public_key_),
            BroadcastAddress(config_.namespace_prefix)};
        for (const auto& group : groups_) {
            topics.push_back(GroupAddress(config_.namespace_prefix, group));
        }
        for (const auto& topic : topics) {
            if (auto result = transport_->Subscribe(topic); result.IsErr()) {
                return result;
            }
        }
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    void SignalingChannel::CompletePending(const Result<Unit, ProtocolFailure>& outcome) {
        auto callbacks = std::move(pending_connects_);
        pending_connects_.clear();
        for (auto& callback : callbacks) {
            callback(outcome);
        }
    }

    void SignalingChannel::CancelTimers() {
        if (timeout_timer_) {
            timeout_timer_->Cancel();
            timeout_timer_.reset();
        }
        if (retry_timer_) {
            retry_timer_->Cancel();
            retry_timer_.reset();
        }
    }

    void SignalingChannel::SetState(const SignalingState state) {
        if (state_ == state) {
            return;
        }
        MIST_LOG_DEBUG("Signaling state {} -> {}", enums::ToString(state_), enums::ToString(state));
        state_ = state;
        if (state_handler_) {
            state_handler_(state);
        }
    }

    void SignalingChannel::SetStateHandler(StateHandler handler) {
        state_handler_ = std::move(handler);
    }

    Result<Unit, ProtocolFailure> SignalingChannel::Send(
        EnvelopePayload payload,
        std::optional<std::span<const uint8_t>> recipient) {
        if (!recipient.has_value()) {
            return Publish(BroadcastAddress(config_.namespace_prefix), std::move(payload), std::nullopt);
        }
        if (recipient->size() != kEd25519PublicKeyBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Recipient must be a 32-byte public key"));
        }
        return Publish(
            InboxAddress(config_.namespace_prefix, *recipient),
            std::move(payload),
            std::vector<uint8_t>(recipient->begin(), recipient->end()));
    }

    Result<Unit, ProtocolFailure> SignalingChannel::SendToGroup(const std::string& group_id, EnvelopePayload payload) {
        if (auto valid = ValidateGroupId(group_id); valid.IsErr()) {
            return valid;
        }
        return Publish(GroupAddress(config_.namespace_prefix, group_id), std::move(payload), std::nullopt);
    }

    Result<Unit, ProtocolFailure> SignalingChannel::Publish(
        const std::string& topic,
        EnvelopePayload payload,
        std::optional<std::vector<uint8_t>> recipient) {
        if (state_ != SignalingState::Connected) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::SignalingUnavailable(fmt::format("Signaling is {}", enums::ToString(state_))));
        }
        if (auto valid = EnvelopeCodec::ValidatePayload(payload); valid.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(valid.UnwrapErr().message));
        }
        SignalingEnvelope envelope{
            self_public_key_,
            std::move(recipient),
            std::move(payload),
            loop_.Clock().WallClockMs()};
        auto encoded = EnvelopeCodec::Encode(envelope);
        if (encoded.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(encoded.UnwrapErr());
        }
        MIST_LOG_TRACE("Publishing {} to {}", enums::ToString(envelope.Type()), topic);
        return transport_->Publish(topic, encoded.Unwrap());
    }

    Result<Unit, ProtocolFailure> SignalingChannel::JoinGroup(const std::string& group_id) {
        if (auto valid = ValidateGroupId(group_id); valid.IsErr()) {
            return valid;
        }
        if (groups_.contains(group_id)) {
            return Result<Unit, ProtocolFailure>::Ok(Unit{});
        }
        if (state_ == SignalingState::Connected) {
            if (auto result = transport_->Subscribe(GroupAddress(config_.namespace_prefix, group_id)); result.IsErr()) {
                return result;
            }
        }
        groups_.insert(group_id);
        MIST_LOG_DEBUG("Joined group {}", group_id);
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    Result<Unit, ProtocolFailure> SignalingChannel::LeaveGroup(const std::string& group_id) {
        if (groups_.erase(group_id) == 0) {
            return Result<Unit, ProtocolFailure>::Ok(Unit{});
        }
        if (state_ == SignalingState::Connected) {
            return transport_->Unsubscribe(GroupAddress(config_.namespace_prefix, group_id));
        }
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    SubscriptionId SignalingChannel::Subscribe(std::optional<EnvelopeType> type, EnvelopeHandler handler) {
        const SubscriptionId id = next_subscription_id_++;
        subscriptions_.emplace(id, Subscription{type, std::move(handler)});
        return id;
    }

    bool SignalingChannel::Unsubscribe(const SubscriptionId id) {
        return subscriptions_.erase(id) > 0;
    }

    void SignalingChannel::OnTransportMessage(const std::string& topic, const std::string& payload) {
        if (state_ != SignalingState::Connected) {
            return;
        }
        auto decoded = EnvelopeCodec::Decode(payload);
        if (decoded.IsErr()) {
            MIST_LOG_WARN("Dropping envelope on {}: {}", topic, decoded.UnwrapErr().message);
            return;
        }
        const auto& envelope = decoded.Unwrap();
        if (SameKey(envelope.from, self_public_key_)) {
            return;
        }
        if (envelope.to.has_value() && !SameKey(*envelope.to, self_public_key_)) {
            MIST_LOG_WARN("Dropping {} from {} addressed to {}",
                          enums::ToString(envelope.Type()),
                          logging::ShortKey(envelope.from),
                          logging::ShortKey(*envelope.to));
            return;
        }

        if (const auto* ping = std::get_if<proto::protocol::PingPayload>(&envelope.payload);
            ping != nullptr && envelope.to.has_value()) {
            proto::protocol::PongPayload pong;
            pong.set_nonce(ping->nonce());
            if (auto sent = Send(pong, std::span<const uint8_t>(envelope.from)); sent.IsErr()) {
                MIST_LOG_WARN("Pong to {} failed: {}", logging::ShortKey(envelope.from), sent.UnwrapErr().message);
            }
        }
        Dispatch(envelope);
    }

    void SignalingChannel::Dispatch(const SignalingEnvelope& envelope) {
        const EnvelopeType type = envelope.Type();
        std::vector<SubscriptionId> matching;
        for (const auto& [id, subscription] : subscriptions_) {
            if (!subscription.type.has_value() || *subscription.type == type) {
                matching.push_back(id);
            }
        }
        MIST_LOG_TRACE("{} from {} -> {} handler(s)",
                       enums::ToString(type), logging::ShortKey(envelope.from), matching.size());
        for (const SubscriptionId id : matching) {
            const auto it = subscriptions_.find(id);
            if (it == subscriptions_.end()) {
                continue;
            }
            auto handler = it->second.handler;
            handler(envelope);
        }
    }
}
