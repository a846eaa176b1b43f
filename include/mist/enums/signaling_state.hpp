#pragma once
#include <cstdint>
namespace mist::protocol::enums {
enum class SignalingState : uint8_t {
    Disconnected = 0,
    Connecting = 1,
    Connected = 2,
    Reconnecting = 3
};
inline const char* ToString(const SignalingState state) {
    switch (state) {
        case SignalingState::Disconnected:
            return "Disconnected";
        case SignalingState::Connecting:
            return "Connecting";
        case SignalingState::Connected:
            return "Connected";
        case SignalingState::Reconnecting:
            return "Reconnecting";
        default:
            return "UNKNOWN";
    }
}
}
