#include "mist/signaling/memory_broker.hpp"
#include "mist/core/logging.hpp"
#include <algorithm>
#include <iterator>

namespace mist::protocol::signaling {

std::shared_ptr<MemoryBroker> MemoryBroker::Create(runtime::EventLoop& loop) {
    return std::shared_ptr<MemoryBroker>(new MemoryBroker(loop));
}

MemoryBroker::MemoryBroker(runtime::EventLoop& loop)
    : loop_(loop) {
}

std::unique_ptr<MemoryPubSubTransport> MemoryBroker::CreateClient(std::string client_id) {
    auto state = std::make_shared<ClientState>();
    state->client_id = std::move(client_id);
    {
        std::lock_guard<std::mutex> guard(lock_);
        std::erase_if(clients_, [](const std::weak_ptr<ClientState>& weak) { return weak.expired(); });
        clients_.push_back(state);
    }
    return std::unique_ptr<MemoryPubSubTransport>(
        new MemoryPubSubTransport(shared_from_this(), std::move(state)));
}

void MemoryBroker::SetAvailable(const bool available) {
    std::lock_guard<std::mutex> guard(lock_);
    available_ = available;
}

void MemoryBroker::SetConnectsHang(const bool hang) {
    std::lock_guard<std::mutex> guard(lock_);
    connects_hang_ = hang;
}

void MemoryBroker::DropAllConnections(const std::string& reason) {
    std::vector<std::pair<std::weak_ptr<ClientState>, uint64_t>> dropped;
    {
        std::lock_guard<std::mutex> guard(lock_);
        for (const auto& weak : clients_) {
            auto client = weak.lock();
            if (!client || !client->connected) {
                continue;
            }
            client->connected = false;
            client->subscriptions.clear();
            dropped.emplace_back(client, ++client->generation);
        }
    }
    MIST_LOG_DEBUG("Memory broker dropping {} connection(s): {}", dropped.size(), reason);
    std::weak_ptr<MemoryBroker> weak_broker = shared_from_this();
    for (auto& [weak, generation] : dropped) {
        loop_.Post([weak_broker, weak = std::move(weak), generation = generation, reason]() {
            auto broker = weak_broker.lock();
            auto state = weak.lock();
            if (!broker || !state) {
                return;
            }
            IPubSubTransport::ConnectionLostHandler handler;
            {
                std::lock_guard<std::mutex> guard(broker->lock_);
                if (state->generation != generation) {
                    return;
                }
                handler = state->on_lost;
            }
            if (handler) {
                handler(reason);
            }
        });
    }
}

void MemoryBroker::DropNextPublishes(const size_t count) {
    std::lock_guard<std::mutex> guard(lock_);
    drop_next_publishes_ = count;
}

size_t MemoryBroker::ConnectedClientCount() const {
    std::lock_guard<std::mutex> guard(lock_);
    return static_cast<size_t>(std::count_if(clients_.begin(), clients_.end(), [](const auto& weak) {
        const auto client = weak.lock();
        return client && client->connected;
    }));
}

size_t MemoryBroker::ConnectAttemptCount() const {
    std::lock_guard<std::mutex> guard(lock_);
    return connect_attempts_;
}

std::vector<MemoryBroker::PublishedMessage> MemoryBroker::Published() const {
    std::lock_guard<std::mutex> guard(lock_);
    return published_;
}

std::vector<MemoryBroker::PublishedMessage> MemoryBroker::PublishedTo(const std::string& topic) const {
    std::lock_guard<std::mutex> guard(lock_);
    std::vector<PublishedMessage> matching;
    std::copy_if(published_.begin(), published_.end(), std::back_inserter(matching),
                 [&topic](const PublishedMessage& message) { return message.topic == topic; });
    return matching;
}

void MemoryBroker::ClearPublished() {
    std::lock_guard<std::mutex> guard(lock_);
    published_.clear();
}

void MemoryBroker::Connect(const std::shared_ptr<ClientState>& client, IPubSubTransport::ConnectHandler on_complete) {
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> guard(lock_);
        connect_attempts_++;
        client->connected = false;
        generation = ++client->generation;
        if (connects_hang_) {
            return;
        }
    }
    std::weak_ptr<ClientState> weak = client;
    std::weak_ptr<MemoryBroker> weak_broker = shared_from_this();
    loop_.Post([weak, weak_broker, generation, on_complete = std::move(on_complete)]() {
        auto broker = weak_broker.lock();
        auto state = weak.lock();
        if (!broker || !state) {
            return;
        }
        bool accepted = false;
        {
            std::lock_guard<std::mutex> guard(broker->lock_);
            if (state->generation != generation) {
                return;
            }
            accepted = broker->available_;
            state->connected = accepted;
        }
        if (accepted) {
            on_complete(Result<Unit, ProtocolFailure>::Ok(Unit{}));
        } else {
            on_complete(Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::SignalingUnavailable("Broker refused the connection")));
        }
    });
}

void MemoryBroker::Disconnect(const std::shared_ptr<ClientState>& client) {
    std::lock_guard<std::mutex> guard(lock_);
    client->connected = false;
    client->generation++;
    client->subscriptions.clear();
}

Result<Unit, ProtocolFailure> MemoryBroker::Publish(
    const std::shared_ptr<ClientState>& client,
    const std::string& topic,
    const std::string& payload) {
    std::vector<std::pair<std::weak_ptr<ClientState>, uint64_t>> recipients;
    {
        std::lock_guard<std::mutex> guard(lock_);
        if (!client->connected) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::SignalingUnavailable("Publish on a closed connection"));
        }
        published_.push_back({topic, payload});
        if (drop_next_publishes_ > 0) {
            drop_next_publishes_--;
            return Result<Unit, ProtocolFailure>::Ok(Unit{});
        }
        for (const auto& weak : clients_) {
            const auto candidate = weak.lock();
            if (candidate && candidate->connected && candidate->subscriptions.contains(topic)) {
                recipients.emplace_back(candidate, candidate->generation);
            }
        }
    }
    std::weak_ptr<MemoryBroker> weak_broker = shared_from_this();
    for (auto& [weak, generation] : recipients) {
        loop_.Post([weak_broker, weak = std::move(weak), generation = generation, topic, payload]() {
            auto broker = weak_broker.lock();
            auto state = weak.lock();
            if (!broker || !state) {
                return;
            }
            IPubSubTransport::MessageHandler handler;
            {
                std::lock_guard<std::mutex> guard(broker->lock_);
                if (state->generation != generation || !state->subscriptions.contains(topic)) {
                    return;
                }
                handler = state->on_message;
            }
            if (handler) {
                handler(topic, payload);
            }
        });
    }
    return Result<Unit, ProtocolFailure>::Ok(Unit{});
}

Result<Unit, ProtocolFailure> MemoryBroker::Subscribe(
    const std::shared_ptr<ClientState>& client,
    const std::string& topic,
    const bool subscribe) {
    std::lock_guard<std::mutex> guard(lock_);
    if (!client->connected) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::SignalingUnavailable("Subscription change on a closed connection"));
    }
    if (subscribe) {
        client->subscriptions.insert(topic);
    } else {
        client->subscriptions.erase(topic);
    }
    return Result<Unit, ProtocolFailure>::Ok(Unit{});
}

MemoryPubSubTransport::MemoryPubSubTransport(
    std::shared_ptr<MemoryBroker> broker,
    std::shared_ptr<MemoryBroker::ClientState> state)
    : broker_(std::move(broker))
    , state_(std::move(state))
    , client_id_(state_->client_id) {
}

MemoryPubSubTransport::~MemoryPubSubTransport() {
    broker_->Disconnect(state_);
}

void MemoryPubSubTransport::Connect(ConnectHandler on_complete) {
    broker_->Connect(state_, std::move(on_complete));
}

void MemoryPubSubTransport::Disconnect() {
    broker_->Disconnect(state_);
}

bool MemoryPubSubTransport::IsConnected() const {
    std::lock_guard<std::mutex> guard(broker_->lock_);
    return state_->connected;
}

Result<Unit, ProtocolFailure> MemoryPubSubTransport::Publish(const std::string& topic, const std::string& payload) {
    return broker_->Publish(state_, topic, payload);
}

Result<Unit, ProtocolFailure> MemoryPubSubTransport::Subscribe(const std::string& topic) {
    return broker_->Subscribe(state_, topic, true);
}

Result<Unit, ProtocolFailure> MemoryPubSubTransport::Unsubscribe(const std::string& topic) {
    return broker_->Subscribe(state_, topic, false);
}

void MemoryPubSubTransport::SetMessageHandler(MessageHandler handler) {
    std::lock_guard<std::mutex> guard(broker_->lock_);
    state_->on_message = std::move(handler);
}

void MemoryPubSubTransport::SetConnectionLostHandler(ConnectionLostHandler handler) {
    std::lock_guard<std::mutex> guard(broker_->lock_);
    state_->on_lost = std::move(handler);
}

}
