#pragma once
#include "mist/interfaces/i_direct_channel.hpp"
#include "mist/runtime/event_loop.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mist::protocol::transport {
using interfaces::IDirectChannel;
using interfaces::IDirectChannelFactory;
using interfaces::IceCandidate;

/**
 * @brief In-process stand-in for the peer-to-peer network
 *
 * Channels created through factories of the same network can reach each
 * other. The session description names the endpoint ("loopback:<id>"); a
 * channel opens once both ends hold the other's description and at least one
 * remote candidate. Blocking the network keeps channels from opening (as a
 * failed NAT traversal would); failing sends makes Send() report
 * TransportUnavailable.
 *
 * Not thread-safe: use from the event loop thread only.
 */
class LoopbackNetwork : public std::enable_shared_from_this<LoopbackNetwork> {
public:
    [[nodiscard]] static std::shared_ptr<LoopbackNetwork> Create(runtime::EventLoop& loop);

    [[nodiscard]] std::unique_ptr<IDirectChannelFactory> CreateFactory();

    void SetBlocked(bool blocked);
    void SetSendFailing(bool failing);
    /// Ends every open channel; both ends see their close handler.
    void CloseAll(const std::string& reason);

    [[nodiscard]] size_t OpenChannelCount() const;
    [[nodiscard]] size_t CreatedChannelCount() const noexcept { return next_endpoint_id_ - 1; }

    LoopbackNetwork(const LoopbackNetwork&) = delete;
    LoopbackNetwork& operator=(const LoopbackNetwork&) = delete;

private:
    friend class LoopbackDirectChannel;
    friend class LoopbackChannelFactory;

    struct Endpoint {
        uint64_t id = 0;
        std::weak_ptr<Endpoint> peer;
        bool has_remote_description = false;
        bool has_remote_candidate = false;
        bool open = false;
        bool closed = false;
        IDirectChannel::CandidateHandler on_candidate;
        IDirectChannel::OpenHandler on_open;
        IDirectChannel::CloseHandler on_close;
        IDirectChannel::MessageHandler on_message;
    };

    explicit LoopbackNetwork(runtime::EventLoop& loop);

    [[nodiscard]] std::shared_ptr<Endpoint> NewEndpoint();
    [[nodiscard]] std::shared_ptr<Endpoint> FindEndpoint(uint64_t id) const;
    void EmitLocalCandidate(const std::shared_ptr<Endpoint>& endpoint);
    void TryOpen(const std::shared_ptr<Endpoint>& endpoint);
    void Deliver(const std::shared_ptr<Endpoint>& to, std::vector<uint8_t> bytes);
    void NotifyClosed(const std::shared_ptr<Endpoint>& endpoint, const std::string& reason);

    runtime::EventLoop& loop_;
    std::map<uint64_t, std::weak_ptr<Endpoint>> endpoints_;
    uint64_t next_endpoint_id_ = 1;
    bool blocked_ = false;
    bool send_failing_ = false;
};

class LoopbackDirectChannel final : public IDirectChannel {
public:
    ~LoopbackDirectChannel() override;

    [[nodiscard]] Result<std::string, ProtocolFailure> CreateOffer() override;
    [[nodiscard]] Result<std::string, ProtocolFailure> AcceptOffer(const std::string& remote_sdp) override;
    [[nodiscard]] Result<Unit, ProtocolFailure> ApplyAnswer(const std::string& remote_sdp) override;
    [[nodiscard]] Result<Unit, ProtocolFailure> AddRemoteCandidate(const IceCandidate& candidate) override;

    [[nodiscard]] Result<Unit, ProtocolFailure> Send(std::span<const uint8_t> bytes) override;
    void Close() override;
    [[nodiscard]] bool IsOpen() const override;

    void SetCandidateHandler(CandidateHandler handler) override;
    void SetOpenHandler(OpenHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;
    void SetMessageHandler(MessageHandler handler) override;

private:
    friend class LoopbackChannelFactory;

    LoopbackDirectChannel(std::shared_ptr<LoopbackNetwork> network, std::shared_ptr<LoopbackNetwork::Endpoint> endpoint);

    std::shared_ptr<LoopbackNetwork> network_;
    std::shared_ptr<LoopbackNetwork::Endpoint> endpoint_;
};

class LoopbackChannelFactory final : public IDirectChannelFactory {
public:
    explicit LoopbackChannelFactory(std::shared_ptr<LoopbackNetwork> network);

    [[nodiscard]] std::unique_ptr<IDirectChannel> CreateChannel(std::span<const uint8_t> peer_public_key) override;

private:
    std::shared_ptr<LoopbackNetwork> network_;
};

}
