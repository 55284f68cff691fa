#include "pulselink_race.h"

#include "pulselink_log.h"

namespace pulselink {

TimeoutRace::TimeoutRace(EventLoop& loop, double timeoutSec, std::string operation,
                         std::function<void()> cancelOp, Completion done)
    : loop_(loop),
      timeoutSec_(timeoutSec),
      operation_(std::move(operation)),
      cancelOp_(std::move(cancelOp)),
      done_(std::move(done)) {}

std::shared_ptr<TimeoutRace> TimeoutRace::start(EventLoop& loop,
                                                double timeoutSec,
                                                std::string operation,
                                                std::function<void(Completion)> op,
                                                std::function<void()> cancelOp,
                                                Completion done) {
    std::shared_ptr<TimeoutRace> race(new TimeoutRace(loop, timeoutSec, std::move(operation),
                                                      std::move(cancelOp), std::move(done)));
    std::weak_ptr<TimeoutRace> weak = race;
    race->timer_ = loop.schedule(timeoutSec, [race]() { race->onTimeout(); });

    EventLoop* lp = &loop;
    op([lp, weak](OperationResult r) {
        lp->post([weak, r]() {
            if (auto self = weak.lock()) self->settle(r);
        });
    });
    return race;
}

void TimeoutRace::settle(OperationResult r) {
    if (settled_) return;
    settled_ = true;
    loop_.cancel(timer_);
    Completion done = std::move(done_);
    done_ = nullptr;
    cancelOp_ = nullptr;
    if (done) done(std::move(r));
}

void TimeoutRace::onTimeout() {
    if (settled_) return;
    settled_ = true;
    PL_LOG_WARN("%s timed out after %.1f s", operation_.c_str(), timeoutSec_);
    if (cancelOp_) cancelOp_();
    cancelOp_ = nullptr;
    Completion done = std::move(done_);
    done_ = nullptr;
    if (done) done(OperationResult::timedOut(operation_, timeoutSec_));
}

void TimeoutRace::cancel() {
    if (settled_) return;
    settled_ = true;
    loop_.cancel(timer_);
    if (cancelOp_) cancelOp_();
    cancelOp_ = nullptr;
    done_ = nullptr;
}

} // namespace pulselink
