// Virtual-clock loop ordering and the operation-vs-timeout race
#include <string>
#include <thread>
#include "../cpp/pulselink_race.h"
#include "test_util.h"

using namespace pulselink;

int main() {
    // Due-time order, FIFO among equal times, tasks posting tasks
    {
        EventLoop loop;
        std::string trace;
        loop.schedule(2.0, [&] { trace += "c"; });
        loop.post([&] { trace += "a"; loop.post([&] { trace += "b"; }); });
        const TimerId dropped = loop.schedule(1.0, [&] { trace += "x"; });
        CHECK(loop.pending() == 3);
        CHECK(loop.cancel(dropped));
        CHECK(!loop.cancel(dropped));

        CHECK(loop.runUntilIdle() == 2);
        CHECK(trace == "ab");
        CHECK_NEAR(loop.nextDueTime(), 2.0, 1e-12);
        loop.advanceBy(1.5);
        CHECK(trace == "ab");
        CHECK_NEAR(loop.now(), 1.5, 1e-12);
        loop.advanceTo(2.0);
        CHECK(trace == "abc");
        CHECK(loop.pending() == 0);
        CHECK_NEAR(loop.nextDueTime(), 2.0, 1e-12);
    }

    // Timers scheduled inside tasks are relative to the task's due time
    {
        EventLoop loop;
        double firedAt = -1.0;
        loop.schedule(3.0, [&] { loop.schedule(2.0, [&] { firedAt = loop.now(); }); });
        loop.advanceBy(10.0);
        CHECK_NEAR(firedAt, 5.0, 1e-12);
    }

    // Operation wins: done once with success, timer removed
    {
        EventLoop loop;
        int done = 0, cancelled = 0;
        OperationResult last = OperationResult::failure(TransportError());
        auto race = TimeoutRace::start(loop, 10.0, "Service discovery",
            [](Completion c) { c(OperationResult::success()); },
            [&] { ++cancelled; },
            [&](OperationResult r) { ++done; last = r; });
        CHECK(done == 0);   // completions are marshalled onto the loop
        loop.runUntilIdle();
        CHECK(done == 1);
        CHECK(last.ok);
        CHECK(race->settled());
        CHECK(loop.pending() == 0);
        loop.advanceBy(20.0);
        CHECK(done == 1);
        CHECK(cancelled == 0);
    }

    // Timeout wins: operation cancelled, late completion ignored
    {
        EventLoop loop;
        int done = 0, cancelled = 0;
        Completion held;
        OperationResult last;
        auto race = TimeoutRace::start(loop, 10.0, "Service discovery",
            [&](Completion c) { held = std::move(c); },
            [&] { ++cancelled; },
            [&](OperationResult r) { ++done; last = r; });
        loop.advanceBy(9.9);
        CHECK(done == 0);
        loop.advanceBy(0.2);
        CHECK(done == 1);
        CHECK(cancelled == 1);
        CHECK(!last.ok);
        CHECK(last.error.kind == ErrorKind::Timeout);
        CHECK(last.error.describe() == "Service discovery timed out after 10 seconds");
        held(OperationResult::success());
        loop.runUntilIdle();
        CHECK(done == 1);
    }

    // Explicit cancel: neither branch reports
    {
        EventLoop loop;
        int done = 0, cancelled = 0;
        auto race = TimeoutRace::start(loop, 5.0, "Notification setup",
            [](Completion) {},
            [&] { ++cancelled; },
            [&](OperationResult) { ++done; });
        race->cancel();
        race->cancel();
        CHECK(cancelled == 1);
        CHECK(loop.pending() == 0);
        loop.advanceBy(10.0);
        CHECK(done == 0);
    }

    // Completion from a radio thread
    {
        EventLoop loop;
        int done = 0;
        Completion held;
        auto race = TimeoutRace::start(loop, 5.0, "Characteristic discovery",
            [&](Completion c) { held = std::move(c); },
            [] {},
            [&](OperationResult r) { if (r.ok) ++done; });
        std::thread radio([&] { held(OperationResult::success()); });
        radio.join();
        loop.runUntilIdle();
        CHECK(done == 1);
        CHECK(race->settled());
    }

    return finish("event_loop_test");
}
