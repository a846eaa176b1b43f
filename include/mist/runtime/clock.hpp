#pragma once
#include "mist/interfaces/i_clock.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>

namespace mist::protocol::runtime {
using interfaces::IClock;
using interfaces::Millis;

class SystemClock final : public IClock {
public:
    [[nodiscard]] Millis Now() const override;
    [[nodiscard]] int64_t WallClockMs() const override;
};

/// Clock that only moves when told to. Wall time advances together with monotonic time.
class ManualClock final : public IClock {
public:
    explicit ManualClock(int64_t wall_clock_start_ms = 1'700'000'000'000);

    [[nodiscard]] Millis Now() const override;
    [[nodiscard]] int64_t WallClockMs() const override;

    void Advance(Millis delta);
    void AdvanceTo(Millis now);

private:
    std::atomic<int64_t> now_ms_{0};
    int64_t wall_clock_start_ms_;
};

}
