#include "mist/runtime/clock.hpp"

namespace mist::protocol::runtime {

Millis SystemClock::Now() const {
    return std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now().time_since_epoch());
}

int64_t SystemClock::WallClockMs() const {
    return std::chrono::duration_cast<Millis>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

ManualClock::ManualClock(const int64_t wall_clock_start_ms)
    : wall_clock_start_ms_(wall_clock_start_ms) {
}

Millis ManualClock::Now() const {
    return Millis(now_ms_.load(std::memory_order_acquire));
}

int64_t ManualClock::WallClockMs() const {
    return wall_clock_start_ms_ + now_ms_.load(std::memory_order_acquire);
}

void ManualClock::Advance(const Millis delta) {
    if (delta.count() > 0) {
        now_ms_.fetch_add(delta.count(), std::memory_order_acq_rel);
    }
}

void ManualClock::AdvanceTo(const Millis now) {
    int64_t current = now_ms_.load(std::memory_order_acquire);
    while (now.count() > current &&
           !now_ms_.compare_exchange_weak(current, now.count(), std::memory_order_acq_rel)) {
    }
}

}
