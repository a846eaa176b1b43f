#include <catch2/catch_test_macros.hpp>
#include "mist/runtime/event_loop.hpp"
#include "mist/runtime/clock.hpp"
#include <string>
#include <vector>
using namespace mist::protocol;
using namespace mist::protocol::runtime;
TEST_CASE("EventLoop - Posted tasks", "[runtime][event_loop]") {
    auto clock = std::make_shared<ManualClock>();
    EventLoop loop(clock);
    std::vector<std::string> order;
    SECTION("Run in submission order") {
        loop.Post([&] { order.push_back("a"); });
        loop.Post([&] { order.push_back("b"); });
        REQUIRE(loop.RunUntilIdle() == 2);
        REQUIRE(order == std::vector<std::string>{"a", "b"});
    }
    SECTION("Tasks posted from a task run in the same drain") {
        loop.Post([&] {
            order.push_back("outer");
            loop.Post([&] { order.push_back("inner"); });
        });
        REQUIRE(loop.RunUntilIdle() == 2);
        REQUIRE(order == std::vector<std::string>{"outer", "inner"});
    }
    SECTION("Nothing to run") {
        REQUIRE(loop.RunUntilIdle() == 0);
    }
}
TEST_CASE("EventLoop - Timers on a manual clock", "[runtime][event_loop][timer]") {
    auto clock = std::make_shared<ManualClock>();
    EventLoop loop(clock);
    std::vector<int> fired;
    SECTION("Fire in due order, ties in scheduling order") {
        loop.ScheduleAfter(Millis(300), [&] { fired.push_back(3); });
        loop.ScheduleAfter(Millis(100), [&] { fired.push_back(1); });
        loop.ScheduleAfter(Millis(100), [&] { fired.push_back(2); });
        REQUIRE(loop.PendingTimerCount() == 3);
        REQUIRE(loop.AdvanceBy(Millis(99)).IsOk());
        REQUIRE(fired.empty());
        REQUIRE(loop.AdvanceBy(Millis(1)).IsOk());
        REQUIRE(fired == std::vector<int>{1, 2});
        REQUIRE(loop.AdvanceBy(Millis(500)).IsOk());
        REQUIRE(fired == std::vector<int>{1, 2, 3});
        REQUIRE(loop.PendingTimerCount() == 0);
        REQUIRE(loop.Now() == Millis(600));
    }
    SECTION("Clock reads the due time inside the callback") {
        Millis seen{};
        loop.ScheduleAfter(Millis(250), [&] { seen = loop.Now(); });
        REQUIRE(loop.AdvanceBy(Millis(1000)).IsOk());
        REQUIRE(seen == Millis(250));
    }
    SECTION("Timer scheduled from a timer fires within the same advance") {
        loop.ScheduleAfter(Millis(100), [&] {
            fired.push_back(1);
            loop.ScheduleAfter(Millis(100), [&] { fired.push_back(2); });
        });
        REQUIRE(loop.AdvanceBy(Millis(200)).IsOk());
        REQUIRE(fired == std::vector<int>{1, 2});
    }
    SECTION("Cancelled timer never fires") {
        auto timer = loop.ScheduleAfter(Millis(50), [&] { fired.push_back(1); });
        timer->Cancel();
        REQUIRE(timer->IsCancelled());
        REQUIRE(loop.PendingTimerCount() == 0);
        REQUIRE(loop.AdvanceBy(Millis(100)).IsOk());
        REQUIRE(fired.empty());
    }
    SECTION("Zero delay is due immediately") {
        auto timer = loop.ScheduleAfter(Millis(0), [&] { fired.push_back(7); });
        REQUIRE(timer->DueAt() == Millis(0));
        loop.RunUntilIdle();
        REQUIRE(fired == std::vector<int>{7});
    }
    SECTION("Clear drops tasks and timers") {
        loop.Post([&] { fired.push_back(1); });
        auto timer = loop.ScheduleAfter(Millis(10), [&] { fired.push_back(2); });
        loop.Clear();
        REQUIRE(timer->IsCancelled());
        REQUIRE(loop.AdvanceBy(Millis(20)).IsOk());
        REQUIRE(fired.empty());
    }
}
TEST_CASE("EventLoop - Real clock", "[runtime][event_loop]") {
    EventLoop loop(std::make_shared<SystemClock>());
    SECTION("AdvanceBy needs a manual clock") {
        auto advanced = loop.AdvanceBy(Millis(10));
        REQUIRE(advanced.IsErr());
        REQUIRE(advanced.UnwrapErr().type == ProtocolFailureType::InvalidState);
    }
    SECTION("Run returns once stopped from a timer") {
        int ticks = 0;
        loop.Post([&] { ++ticks; });
        loop.ScheduleAfter(Millis(5), [&] {
            ++ticks;
            loop.Stop();
        });
        loop.Run();
        REQUIRE(ticks == 2);
    }
}
TEST_CASE("ManualClock - Wall time follows monotonic time", "[runtime][clock]") {
    ManualClock clock(1'000);
    REQUIRE(clock.Now() == Millis(0));
    REQUIRE(clock.WallClockMs() == 1'000);
    clock.Advance(Millis(250));
    REQUIRE(clock.WallClockMs() == 1'250);
    clock.AdvanceTo(Millis(1'000));
    REQUIRE(clock.Now() == Millis(1'000));
    REQUIRE(clock.WallClockMs() == 2'000);
}
