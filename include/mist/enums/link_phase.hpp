#pragma once
#include <cstdint>
namespace mist::protocol::enums {
enum class LinkPhase : uint8_t {
    Idle = 0,
    Negotiating = 1,
    Open = 2,
    Closed = 3
};
inline const char* ToString(const LinkPhase phase) {
    switch (phase) {
        case LinkPhase::Idle:
            return "Idle";
        case LinkPhase::Negotiating:
            return "Negotiating";
        case LinkPhase::Open:
            return "Open";
        case LinkPhase::Closed:
            return "Closed";
        default:
            return "UNKNOWN";
    }
}
}
