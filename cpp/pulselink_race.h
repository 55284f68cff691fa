#pragma once

#include <functional>
#include <memory>
#include <string>
#include "pulselink_errors.h"
#include "pulselink_event_loop.h"

namespace pulselink {

using Completion = std::function<void(OperationResult)>;

// Two-branch select: an async operation against a timer. The first branch
// to finish settles the race and calls done exactly once; the other branch
// is cancelled (timer removed, or cancelOp invoked). Operation completions
// are marshalled onto the loop, so they may arrive from any thread.
class TimeoutRace {
public:
    static std::shared_ptr<TimeoutRace> start(EventLoop& loop,
                                              double timeoutSec,
                                              std::string operation,
                                              std::function<void(Completion)> op,
                                              std::function<void()> cancelOp,
                                              Completion done);

    // Settles without calling done; cancels both branches
    void cancel();
    bool settled() const { return settled_; }

private:
    TimeoutRace(EventLoop& loop, double timeoutSec, std::string operation,
                std::function<void()> cancelOp, Completion done);
    void settle(OperationResult r);
    void onTimeout();

    EventLoop& loop_;
    double timeoutSec_ {0.0};
    std::string operation_;
    std::function<void()> cancelOp_;
    Completion done_;
    TimerId timer_ {0};
    bool settled_ {false};
};

} // namespace pulselink
