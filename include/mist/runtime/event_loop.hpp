#pragma once
#include "mist/core/result.hpp"
#include "mist/core/failures.hpp"
#include "mist/interfaces/i_clock.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace mist::protocol::runtime {
using interfaces::IClock;
using interfaces::Millis;
using protocol::Result;
using protocol::Unit;
using protocol::ProtocolFailure;

using Task = std::function<void()>;

/// One-shot timer handle. Cancel() is safe from any thread and drops the task.
class Timer {
public:
    void Cancel();
    [[nodiscard]] bool IsCancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }
    [[nodiscard]] Millis DueAt() const noexcept { return due_at_; }

    Timer(Millis due_at, Task task) : due_at_(due_at), task_(std::move(task)) {}

private:
    friend class EventLoop;

    Task TakeTask();

    Millis due_at_;
    Task task_;
    std::mutex task_lock_;
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Single-threaded event loop with deferred tasks and one-shot timers
 *
 * Post() and ScheduleAfter() may be called from any thread; tasks and timer
 * callbacks always run on the thread driving the loop (Run, RunUntilIdle or
 * AdvanceBy). Tasks posted from inside a task run in the same drain.
 */
class EventLoop {
public:
    explicit EventLoop(std::shared_ptr<IClock> clock);
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void Post(Task task);
    std::shared_ptr<Timer> ScheduleAfter(Millis delay, Task task);

    /// Runs queued tasks and due timers until nothing is ready. Returns the number run.
    size_t RunUntilIdle();

    /// Advances a ManualClock by delta, firing timers in due order on the way.
    /// Fails with InvalidState when the loop is driven by a real clock.
    Result<Unit, ProtocolFailure> AdvanceBy(Millis delta);

    /// Blocks processing tasks and timers until Stop() is called.
    void Run();
    void Stop();

    [[nodiscard]] const IClock& Clock() const noexcept { return *clock_; }
    [[nodiscard]] Millis Now() const { return clock_->Now(); }
    [[nodiscard]] size_t PendingTimerCount() const;

    /// Drops every pending task and timer.
    void Clear();

private:
    using TimerKey = std::pair<int64_t, uint64_t>;

    [[nodiscard]] bool RunOneReady();
    [[nodiscard]] std::shared_ptr<Timer> PopDueTimerLocked(Millis now);

    std::shared_ptr<IClock> clock_;
    mutable std::mutex lock_;
    std::condition_variable wakeup_;
    std::deque<Task> tasks_;
    std::map<TimerKey, std::shared_ptr<Timer>> timers_;
    uint64_t next_timer_sequence_ = 0;
    std::atomic<bool> stopping_{false};
};

}
