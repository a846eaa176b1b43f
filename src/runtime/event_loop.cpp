#include "mist/runtime/event_loop.hpp"
#include "mist/runtime/clock.hpp"

namespace mist::protocol::runtime {

void Timer::Cancel() {
    cancelled_.store(true, std::memory_order_release);
    std::lock_guard<std::mutex> guard(task_lock_);
    task_ = nullptr;
}

Task Timer::TakeTask() {
    std::lock_guard<std::mutex> guard(task_lock_);
    Task task = std::move(task_);
    task_ = nullptr;
    return task;
}

EventLoop::EventLoop(std::shared_ptr<IClock> clock)
    : clock_(std::move(clock)) {
}

EventLoop::~EventLoop() {
    Clear();
}

void EventLoop::Post(Task task) {
    {
        std::lock_guard<std::mutex> guard(lock_);
        tasks_.push_back(std::move(task));
    }
    wakeup_.notify_one();
}

std::shared_ptr<Timer> EventLoop::ScheduleAfter(const Millis delay, Task task) {
    const Millis due_at = clock_->Now() + (delay.count() > 0 ? delay : Millis(0));
    auto timer = std::make_shared<Timer>(due_at, std::move(task));
    {
        std::lock_guard<std::mutex> guard(lock_);
        timers_.emplace(TimerKey{due_at.count(), next_timer_sequence_++}, timer);
    }
    wakeup_.notify_one();
    return timer;
}

std::shared_ptr<Timer> EventLoop::PopDueTimerLocked(const Millis now) {
    while (!timers_.empty()) {
        auto it = timers_.begin();
        if (it->second->IsCancelled()) {
            timers_.erase(it);
            continue;
        }
        if (Millis(it->first.first) > now) {
            return nullptr;
        }
        auto timer = std::move(it->second);
        timers_.erase(it);
        return timer;
    }
    return nullptr;
}

bool EventLoop::RunOneReady() {
    Task task;
    {
        std::lock_guard<std::mutex> guard(lock_);
        if (!tasks_.empty()) {
            task = std::move(tasks_.front());
            tasks_.pop_front();
        } else if (auto timer = PopDueTimerLocked(clock_->Now())) {
            task = timer->TakeTask();
            if (!task) {
                return true;
            }
        } else {
            return false;
        }
    }
    if (task) {
        task();
    }
    return true;
}

size_t EventLoop::RunUntilIdle() {
    size_t ran = 0;
    while (!stopping_.load(std::memory_order_acquire) && RunOneReady()) {
        ++ran;
    }
    return ran;
}

Result<Unit, ProtocolFailure> EventLoop::AdvanceBy(const Millis delta) {
    auto* manual = dynamic_cast<ManualClock*>(clock_.get());
    if (manual == nullptr) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("AdvanceBy requires a manual clock"));
    }
    const Millis target = manual->Now() + delta;
    RunUntilIdle();
    for (;;) {
        Millis next_due{};
        {
            std::lock_guard<std::mutex> guard(lock_);
            while (!timers_.empty() && timers_.begin()->second->IsCancelled()) {
                timers_.erase(timers_.begin());
            }
            if (timers_.empty() || Millis(timers_.begin()->first.first) > target) {
                break;
            }
            next_due = Millis(timers_.begin()->first.first);
        }
        manual->AdvanceTo(next_due);
        RunUntilIdle();
    }
    manual->AdvanceTo(target);
    RunUntilIdle();
    return Result<Unit, ProtocolFailure>::Ok(protocol::unit);
}

void EventLoop::Run() {
    stopping_.store(false, std::memory_order_release);
    while (!stopping_.load(std::memory_order_acquire)) {
        RunUntilIdle();
        std::unique_lock<std::mutex> lock(lock_);
        if (stopping_.load(std::memory_order_acquire) || !tasks_.empty()) {
            continue;
        }
        if (timers_.empty()) {
            wakeup_.wait(lock, [this] {
                return stopping_.load(std::memory_order_acquire) || !tasks_.empty() || !timers_.empty();
            });
        } else {
            const Millis wait_for = Millis(timers_.begin()->first.first) - clock_->Now();
            if (wait_for.count() > 0) {
                wakeup_.wait_for(lock, wait_for);
            }
        }
    }
}

void EventLoop::Stop() {
    stopping_.store(true, std::memory_order_release);
    wakeup_.notify_all();
}

size_t EventLoop::PendingTimerCount() const {
    std::lock_guard<std::mutex> guard(lock_);
    size_t count = 0;
    for (const auto& [key, timer] : timers_) {
        if (!timer->IsCancelled()) {
            ++count;
        }
    }
    return count;
}

void EventLoop::Clear() {
    std::deque<Task> tasks;
    std::map<TimerKey, std::shared_ptr<Timer>> timers;
    {
        std::lock_guard<std::mutex> guard(lock_);
        tasks.swap(tasks_);
        timers.swap(timers_);
    }
    for (auto& [key, timer] : timers) {
        timer->Cancel();
    }
}

}
