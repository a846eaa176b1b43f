#pragma once
#include <cstdint>
namespace mist::protocol::enums {
/// How a contact's public key came to be trusted.
enum class TrustOrigin : uint8_t {
    DirectVerification = 0,
    SharedLink = 1
};
inline const char* ToString(const TrustOrigin origin) {
    switch (origin) {
        case TrustOrigin::DirectVerification:
            return "direct-verification";
        case TrustOrigin::SharedLink:
            return "shared-link";
        default:
            return "UNKNOWN";
    }
}
}
