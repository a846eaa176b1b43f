#pragma once
#include "mist/core/result.hpp"
#include "mist/core/failures.hpp"
#include <functional>
#include <string>

namespace mist::protocol::interfaces {

/// Persistent publish/subscribe connection underneath the signaling channel
/// (an MQTT client in production, the in-memory broker in tests).
///
/// Callbacks are invoked on the event loop thread. A connection-lost callback
/// is only raised for a connection that completed; a failed Connect reports
/// through its completion handler instead.
class IPubSubTransport {
public:
    using ConnectHandler = std::function<void(Result<Unit, ProtocolFailure>)>;
    using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;
    using ConnectionLostHandler = std::function<void(const std::string& reason)>;

    virtual ~IPubSubTransport() = default;

    /// Starts connecting. on_complete runs once, unless Disconnect() is called first.
    virtual void Connect(ConnectHandler on_complete) = 0;
    /// Closes the connection or abandons a pending Connect. Never raises connection-lost.
    virtual void Disconnect() = 0;
    [[nodiscard]] virtual bool IsConnected() const = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> Publish(
        const std::string& topic,
        const std::string& payload) = 0;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> Subscribe(const std::string& topic) = 0;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> Unsubscribe(const std::string& topic) = 0;

    virtual void SetMessageHandler(MessageHandler handler) = 0;
    virtual void SetConnectionLostHandler(ConnectionLostHandler handler) = 0;
};

}
