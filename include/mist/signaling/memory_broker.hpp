#pragma once
#include "mist/interfaces/i_pubsub_transport.hpp"
#include "mist/runtime/event_loop.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace mist::protocol::signaling {
using interfaces::IPubSubTransport;

class MemoryPubSubTransport;

/**
 * @brief In-process publish/subscribe broker
 *
 * Every client connection, publish and connection drop is delivered as a task
 * on the event loop, never synchronously from the caller. Topics match
 * exactly. The broker can be switched unavailable (connects fail), made to
 * hang connects (so the caller's timeout fires), drop live connections and
 * lose publishes, which is how tests exercise the signaling retry paths.
 */
class MemoryBroker : public std::enable_shared_from_this<MemoryBroker> {
public:
    struct PublishedMessage {
        std::string topic;
        std::string payload;
    };

    [[nodiscard]] static std::shared_ptr<MemoryBroker> Create(runtime::EventLoop& loop);

    [[nodiscard]] std::unique_ptr<MemoryPubSubTransport> CreateClient(std::string client_id);

    void SetAvailable(bool available);
    void SetConnectsHang(bool hang);
    /// Closes every live connection; each client is told through its connection-lost handler.
    void DropAllConnections(const std::string& reason);
    /// The next count publishes are accepted but never delivered.
    void DropNextPublishes(size_t count);

    [[nodiscard]] size_t ConnectedClientCount() const;
    [[nodiscard]] size_t ConnectAttemptCount() const;
    [[nodiscard]] std::vector<PublishedMessage> Published() const;
    [[nodiscard]] std::vector<PublishedMessage> PublishedTo(const std::string& topic) const;
    void ClearPublished();

    MemoryBroker(const MemoryBroker&) = delete;
    MemoryBroker& operator=(const MemoryBroker&) = delete;

private:
    friend class MemoryPubSubTransport;

    struct ClientState {
        std::string client_id;
        bool connected = false;
        uint64_t generation = 0;
        std::set<std::string> subscriptions;
        IPubSubTransport::MessageHandler on_message;
        IPubSubTransport::ConnectionLostHandler on_lost;
    };

    explicit MemoryBroker(runtime::EventLoop& loop);

    void Connect(const std::shared_ptr<ClientState>& client, IPubSubTransport::ConnectHandler on_complete);
    void Disconnect(const std::shared_ptr<ClientState>& client);
    [[nodiscard]] Result<Unit, ProtocolFailure> Publish(
        const std::shared_ptr<ClientState>& client,
        const std::string& topic,
        const std::string& payload);
    [[nodiscard]] Result<Unit, ProtocolFailure> Subscribe(
        const std::shared_ptr<ClientState>& client,
        const std::string& topic,
        bool subscribe);

    runtime::EventLoop& loop_;
    mutable std::mutex lock_;
    std::vector<std::weak_ptr<ClientState>> clients_;
    std::vector<PublishedMessage> published_;
    bool available_ = true;
    bool connects_hang_ = false;
    size_t drop_next_publishes_ = 0;
    size_t connect_attempts_ = 0;
};

/// One client connection to a MemoryBroker.
class MemoryPubSubTransport final : public IPubSubTransport {
public:
    ~MemoryPubSubTransport() override;

    void Connect(ConnectHandler on_complete) override;
    void Disconnect() override;
    [[nodiscard]] bool IsConnected() const override;

    [[nodiscard]] Result<Unit, ProtocolFailure> Publish(
        const std::string& topic,
        const std::string& payload) override;
    [[nodiscard]] Result<Unit, ProtocolFailure> Subscribe(const std::string& topic) override;
    [[nodiscard]] Result<Unit, ProtocolFailure> Unsubscribe(const std::string& topic) override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetConnectionLostHandler(ConnectionLostHandler handler) override;

    [[nodiscard]] const std::string& ClientId() const noexcept { return client_id_; }

private:
    friend class MemoryBroker;

    MemoryPubSubTransport(std::shared_ptr<MemoryBroker> broker, std::shared_ptr<MemoryBroker::ClientState> state);

    std::shared_ptr<MemoryBroker> broker_;
    std::shared_ptr<MemoryBroker::ClientState> state_;
    std::string client_id_;
};

}
