#include "pulselink_event_loop.h"

#include <algorithm>

namespace pulselink {

double EventLoop::now() const {
    std::lock_guard<std::mutex> lock(mu_);
    return now_;
}

void EventLoop::post(std::function<void()> fn) {
    schedule(0.0, std::move(fn));
}

TimerId EventLoop::schedule(double delaySec, std::function<void()> fn) {
    std::lock_guard<std::mutex> lock(mu_);
    const TimerId id = nextId_++;
    const double due = now_ + std::max(0.0, delaySec);
    order_.insert({due, id});
    tasks_.emplace(id, std::make_pair(due, std::move(fn)));
    return id;
}

bool EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return false;
    order_.erase({it->second.first, id});
    tasks_.erase(it);
    return true;
}

bool EventLoop::popDue(double limit, std::function<void()>& fn) {
    std::lock_guard<std::mutex> lock(mu_);
    if (order_.empty()) return false;
    auto first = order_.begin();
    if (first->first > limit) return false;
    const TimerId id = first->second;
    now_ = std::max(now_, first->first);
    order_.erase(first);
    auto it = tasks_.find(id);
    fn = std::move(it->second.second);
    tasks_.erase(it);
    return true;
}

size_t EventLoop::runUntilIdle() {
    return advanceBy(0.0);
}

size_t EventLoop::advanceBy(double seconds) {
    return advanceTo(now() + std::max(0.0, seconds));
}

size_t EventLoop::advanceTo(double t) {
    size_t ran = 0;
    std::function<void()> fn;
    while (popDue(t, fn)) {
        if (fn) fn();
        fn = nullptr;
        ++ran;
    }
    std::lock_guard<std::mutex> lock(mu_);
    now_ = std::max(now_, t);
    return ran;
}

size_t EventLoop::pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return tasks_.size();
}

double EventLoop::nextDueTime() const {
    std::lock_guard<std::mutex> lock(mu_);
    return order_.empty() ? now_ : order_.begin()->first;
}

} // namespace pulselink
