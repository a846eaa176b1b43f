#pragma once
#include "mist/core/result.hpp"
#include "mist/core/failures.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace mist::protocol::interfaces {

struct IceCandidate {
    std::string candidate;
    std::string sdp_mid;
    int32_t sdp_mline_index = 0;
};

/// One peer-to-peer data channel (a WebRTC data channel in production).
///
/// The offerer calls CreateOffer() then ApplyAnswer(); the answerer calls
/// AcceptOffer(). Both sides feed the other's candidates to
/// AddRemoteCandidate(). Callbacks run on the event loop thread; the close
/// handler fires only when the remote side or the network ends the channel,
/// never for a local Close().
class IDirectChannel {
public:
    using CandidateHandler = std::function<void(const IceCandidate&)>;
    using OpenHandler = std::function<void()>;
    using CloseHandler = std::function<void(const std::string& reason)>;
    using MessageHandler = std::function<void(const std::vector<uint8_t>& bytes)>;

    virtual ~IDirectChannel() = default;

    /// Returns the local session description to send as the offer.
    [[nodiscard]] virtual Result<std::string, ProtocolFailure> CreateOffer() = 0;
    /// Applies a remote offer and returns the answer description.
    [[nodiscard]] virtual Result<std::string, ProtocolFailure> AcceptOffer(const std::string& remote_sdp) = 0;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> ApplyAnswer(const std::string& remote_sdp) = 0;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> AddRemoteCandidate(const IceCandidate& candidate) = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> Send(std::span<const uint8_t> bytes) = 0;
    virtual void Close() = 0;
    [[nodiscard]] virtual bool IsOpen() const = 0;

    virtual void SetCandidateHandler(CandidateHandler handler) = 0;
    virtual void SetOpenHandler(OpenHandler handler) = 0;
    virtual void SetCloseHandler(CloseHandler handler) = 0;
    virtual void SetMessageHandler(MessageHandler handler) = 0;
};

class IDirectChannelFactory {
public:
    virtual ~IDirectChannelFactory() = default;
    [[nodiscard]] virtual std::unique_ptr<IDirectChannel> CreateChannel(std::span<const uint8_t> peer_public_key) = 0;
};

}
