#include "mist/transport/loopback_direct_channel.hpp"
#include "mist/core/logging.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <charconv>
#include <string_view>

namespace mist::protocol::transport {
    namespace {
        constexpr std::string_view kSdpPrefix = "loopback:";
        constexpr std::string_view kCandidatePrefix = "candidate:";
        constexpr uint64_t kFirstPort = 40000;

        Result<uint64_t, ProtocolFailure> ParseSdp(std::string_view sdp) {
            if (!sdp.starts_with(kSdpPrefix)) {
                return Result<uint64_t, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput("Not a loopback session description"));
            }
            sdp.remove_prefix(kSdpPrefix.size());
            uint64_t id = 0;
            const auto [end, error] = std::from_chars(sdp.data(), sdp.data() + sdp.size(), id);
            if (error != std::errc{} || end != sdp.data() + sdp.size() || id == 0) {
                return Result<uint64_t, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput("Malformed loopback endpoint id"));
            }
            return Result<uint64_t, ProtocolFailure>::Ok(id);
        }
    }

    std::shared_ptr<LoopbackNetwork> LoopbackNetwork::Create(runtime::EventLoop& loop) {
        return std::shared_ptr<LoopbackNetwork>(new LoopbackNetwork(loop));
    }

    LoopbackNetwork::LoopbackNetwork(runtime::EventLoop& loop)
        : loop_(loop) {
    }

    std::unique_ptr<IDirectChannelFactory> LoopbackNetwork::CreateFactory() {
        return std::make_unique<LoopbackChannelFactory>(shared_from_this());
    }

    void LoopbackNetwork::SetBlocked(const bool blocked) {
        blocked_ = blocked;
    }

    void LoopbackNetwork::SetSendFailing(const bool failing) {
        send_failing_ = failing;
    }

    void LoopbackNetwork::CloseAll(const std::string& reason) {
        for (const auto& [id, weak] : endpoints_) {
            const auto endpoint = weak.lock();
            if (!endpoint || endpoint->closed || !endpoint->open) {
                continue;
            }
            endpoint->closed = true;
            endpoint->open = false;
            NotifyClosed(endpoint, reason);
        }
    }

    size_t LoopbackNetwork::OpenChannelCount() const {
        return static_cast<size_t>(std::count_if(endpoints_.begin(), endpoints_.end(), [](const auto& entry) {
            const auto endpoint = entry.second.lock();
            return endpoint && endpoint->open && !endpoint->closed;
        }));
    }

    std::shared_ptr<LoopbackNetwork::Endpoint> LoopbackNetwork::NewEndpoint() {
        std::erase_if(endpoints_, [](const auto& entry) { return entry.second.expired(); });
        auto endpoint = std::make_shared<Endpoint>();
        endpoint->id = next_endpoint_id_++;
        endpoints_.emplace(endpoint->id, endpoint);
        return endpoint;
    }

    std::shared_ptr<LoopbackNetwork::Endpoint> LoopbackNetwork::FindEndpoint(const uint64_t id) const {
        const auto it = endpoints_.find(id);
        if (it == endpoints_.end()) {
            return nullptr;
        }
        return it->second.lock();
    }

    void LoopbackNetwork::EmitLocalCandidate(const std::shared_ptr<Endpoint>& endpoint) {
        std::weak_ptr<Endpoint> weak = endpoint;
        IceCandidate candidate{
            fmt::format("candidate:{} 1 udp 2122260223 127.0.0.1 {} typ host", endpoint->id, kFirstPort + endpoint->id),
            "0",
            0};
        loop_.Post([weak, candidate = std::move(candidate)]() {
            const auto target = weak.lock();
            if (!target || target->closed || !target->on_candidate) {
                return;
            }
            auto handler = target->on_candidate;
            handler(candidate);
        });
    }

    void LoopbackNetwork::TryOpen(const std::shared_ptr<Endpoint>& endpoint) {
        const auto peer = endpoint->peer.lock();
        if (!peer || blocked_ || endpoint->open || endpoint->closed || peer->closed) {
            return;
        }
        if (!endpoint->has_remote_description || !endpoint->has_remote_candidate ||
            !peer->has_remote_description || !peer->has_remote_candidate) {
            return;
        }
        endpoint->open = true;
        peer->open = true;
        MIST_LOG_TRACE("Loopback channel {} <-> {} open", endpoint->id, peer->id);
        for (const auto& side : {endpoint, peer}) {
            std::weak_ptr<Endpoint> weak = side;
            loop_.Post([weak]() {
                const auto target = weak.lock();
                if (!target || !target->open || target->closed || !target->on_open) {
                    return;
                }
                auto handler = target->on_open;
                handler();
            });
        }
    }

    void LoopbackNetwork::Deliver(const std::shared_ptr<Endpoint>& to, std::vector<uint8_t> bytes) {
        std::weak_ptr<Endpoint> weak = to;
        loop_.Post([weak, bytes = std::move(bytes)]() {
            const auto target = weak.lock();
            if (!target || target->closed || !target->on_message) {
                return;
            }
            auto handler = target->on_message;
            handler(bytes);
        });
    }

    void LoopbackNetwork::NotifyClosed(const std::shared_ptr<Endpoint>& endpoint, const std::string& reason) {
        std::weak_ptr<Endpoint> weak = endpoint;
        loop_.Post([weak, reason]() {
            const auto target = weak.lock();
            if (!target || !target->on_close) {
                return;
            }
            auto handler = target->on_close;
            handler(reason);
        });
    }

    LoopbackDirectChannel::LoopbackDirectChannel(
        std::shared_ptr<LoopbackNetwork> network,
        std::shared_ptr<LoopbackNetwork::Endpoint> endpoint)
        : network_(std::move(network))
        , endpoint_(std::move(endpoint)) {
    }

    LoopbackDirectChannel::~LoopbackDirectChannel() {
        Close();
    }

    Result<std::string, ProtocolFailure> LoopbackDirectChannel::CreateOffer() {
        if (endpoint_->closed) {
            return Result<std::string, ProtocolFailure>::Err(ProtocolFailure::InvalidState("Channel is closed"));
        }
        network_->EmitLocalCandidate(endpoint_);
        return Result<std::string, ProtocolFailure>::Ok(fmt::format("{}{}", kSdpPrefix, endpoint_->id));
    }

    Result<std::string, ProtocolFailure> LoopbackDirectChannel::AcceptOffer(const std::string& remote_sdp) {
        if (endpoint_->closed) {
            return Result<std::string, ProtocolFailure>::Err(ProtocolFailure::InvalidState("Channel is closed"));
        }
        auto remote_id = ParseSdp(remote_sdp);
        if (remote_id.IsErr()) {
            return Result<std::string, ProtocolFailure>::Err(remote_id.UnwrapErr());
        }
        const auto remote = network_->FindEndpoint(remote_id.Unwrap());
        if (!remote || remote->closed) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::TransportUnavailable("Offering endpoint is gone"));
        }
        if (const auto taken = remote->peer.lock(); taken && taken != endpoint_) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Offer was already answered"));
        }
        endpoint_->peer = remote;
        remote->peer = endpoint_;
        endpoint_->has_remote_description = true;
        network_->EmitLocalCandidate(endpoint_);
        network_->TryOpen(endpoint_);
        return Result<std::string, ProtocolFailure>::Ok(fmt::format("{}{}", kSdpPrefix, endpoint_->id));
    }

    Result<Unit, ProtocolFailure> LoopbackDirectChannel::ApplyAnswer(const std::string& remote_sdp) {
        auto remote_id = ParseSdp(remote_sdp);
        if (remote_id.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(remote_id.UnwrapErr());
        }
        const auto remote = network_->FindEndpoint(remote_id.Unwrap());
        if (!remote || remote->peer.lock() != endpoint_) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Answer does not belong to this offer"));
        }
        endpoint_->peer = remote;
        endpoint_->has_remote_description = true;
        network_->TryOpen(endpoint_);
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    Result<Unit, ProtocolFailure> LoopbackDirectChannel::AddRemoteCandidate(const IceCandidate& candidate) {
        if (!candidate.candidate.starts_with(kCandidatePrefix)) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput("Malformed ICE candidate"));
        }
        endpoint_->has_remote_candidate = true;
        network_->TryOpen(endpoint_);
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    Result<Unit, ProtocolFailure> LoopbackDirectChannel::Send(std::span<const uint8_t> bytes) {
        const auto peer = endpoint_->peer.lock();
        if (!endpoint_->open || endpoint_->closed || !peer || peer->closed) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::TransportUnavailable("Channel is not open"));
        }
        if (network_->send_failing_) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::TransportUnavailable("Network send failed"));
        }
        network_->Deliver(peer, std::vector<uint8_t>(bytes.begin(), bytes.end()));
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    void LoopbackDirectChannel::Close() {
        if (endpoint_->closed) {
            return;
        }
        endpoint_->closed = true;
        endpoint_->open = false;
        const auto peer = endpoint_->peer.lock();
        if (peer && !peer->closed) {
            peer->closed = true;
            peer->open = false;
            network_->NotifyClosed(peer, "remote closed the channel");
        }
    }

    bool LoopbackDirectChannel::IsOpen() const {
        return endpoint_->open && !endpoint_->closed;
    }

    void LoopbackDirectChannel::SetCandidateHandler(CandidateHandler handler) {
        endpoint_->on_candidate = std::move(handler);
    }

    void LoopbackDirectChannel::SetOpenHandler(OpenHandler handler) {
        endpoint_->on_open = std::move(handler);
    }

    void LoopbackDirectChannel::SetCloseHandler(CloseHandler handler) {
        endpoint_->on_close = std::move(handler);
    }

    void LoopbackDirectChannel::SetMessageHandler(MessageHandler handler) {
        endpoint_->on_message = std::move(handler);
    }

    LoopbackChannelFactory::LoopbackChannelFactory(std::shared_ptr<LoopbackNetwork> network)
        : network_(std::move(network)) {
    }

    std::unique_ptr<IDirectChannel> LoopbackChannelFactory::CreateChannel(std::span<const uint8_t>) {
        return std::unique_ptr<IDirectChannel>(new LoopbackDirectChannel(network_, network_->NewEndpoint()));
    }
}
