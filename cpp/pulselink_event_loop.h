#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <unordered_map>
#include <utility>

namespace pulselink {

using TimerId = uint64_t;

// Single logical event loop on a virtual clock (seconds).
// Tasks run in (due time, submission order). post/schedule/cancel may be
// called from any thread; tasks only run inside runUntilIdle/advance*.
class EventLoop {
public:
    double now() const;

    void post(std::function<void()> fn);
    TimerId schedule(double delaySec, std::function<void()> fn);
    // Returns false if the task already ran or was cancelled
    bool cancel(TimerId id);

    // Runs everything due at the current time, including tasks they post
    size_t runUntilIdle();
    size_t advanceBy(double seconds);
    size_t advanceTo(double t);

    size_t pending() const;
    // Due time of the earliest task, or now() when nothing is pending
    double nextDueTime() const;

private:
    bool popDue(double limit, std::function<void()>& fn);

    mutable std::mutex mu_;
    double now_ {0.0};
    TimerId nextId_ {1};
    std::set<std::pair<double, TimerId>> order_;
    std::unordered_map<TimerId, std::pair<double, std::function<void()>>> tasks_;
};

} // namespace pulselink
