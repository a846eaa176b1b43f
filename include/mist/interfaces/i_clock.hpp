#pragma once
#include <chrono>
#include <cstdint>

namespace mist::protocol::interfaces {

using Millis = std::chrono::milliseconds;

class IClock {
public:
    virtual ~IClock() = default;
    /// Monotonic time used for timers and timeouts.
    [[nodiscard]] virtual Millis Now() const = 0;
    /// Milliseconds since the Unix epoch, stamped on envelopes and records.
    [[nodiscard]] virtual int64_t WallClockMs() const = 0;
};

}
