#include "pulselink_reconnect.h"

#include <algorithm>
#include <cmath>
#include <vector>
#include "pulselink_log.h"

namespace pulselink {

LinkSupervisor::LinkSupervisor(EventLoop& loop, Transport& transport, Connector connector, const Options& opt)
    : loop_(loop),
      transport_(transport),
      connector_(std::move(connector)),
      opt_(opt),
      alive_(std::make_shared<bool>(true)) {}

LinkSupervisor::~LinkSupervisor() {
    cancelAll();
    if (pollTimer_) loop_.cancel(pollTimer_);
}

void LinkSupervisor::emit(SupervisorEvent::Kind kind, const PeripheralId& id, int attempt, double delay, int rssi) {
    if (!onEvent_) return;
    SupervisorEvent e;
    e.kind = kind;
    e.peripheral = id;
    e.attempt = attempt;
    e.delaySec = delay;
    e.rssi = rssi;
    onEvent_(e);
}

double LinkSupervisor::backoffDelay(int attempt) const {
    const int n = std::max(1, attempt);
    const double d = opt_.reconnectBaseDelaySec * std::pow(2.0, n - 1);
    return std::min(d, opt_.reconnectMaxDelaySec);
}

int LinkSupervisor::attempts(const PeripheralId& id) const {
    auto it = retries_.find(id);
    return it == retries_.end() ? 0 : it->second.attempts;
}

void LinkSupervisor::handleDisconnection(const PeripheralId& id, bool unexpected) {
    stopMonitoring(id);
    if (!unexpected) {
        cancelReconnection(id);
        return;
    }
    auto it = retries_.find(id);
    if (it != retries_.end()) {
        // link dropped again while a retry was pending or in flight
        if (it->second.inFlight) attemptFailed(id, "disconnected during attempt");
        return;
    }
    PL_LOG_WARN("[%s] unexpected disconnection, starting reconnection", id.value.c_str());
    retries_[id] = Retry{};
    scheduleNext(id);
}

void LinkSupervisor::handleConnected(const PeripheralId& id) {
    auto it = retries_.find(id);
    if (it != retries_.end()) {
        const int n = it->second.attempts;
        if (it->second.delayTimer) loop_.cancel(it->second.delayTimer);
        if (it->second.attemptTimer) loop_.cancel(it->second.attemptTimer);
        retries_.erase(it);
        PL_LOG_INFO("[%s] reconnected after %d attempt(s)", id.value.c_str(), n);
        emit(SupervisorEvent::Kind::Succeeded, id, n);
    }
    startMonitoring(id);
}

void LinkSupervisor::handleConnectionFailed(const PeripheralId& id) {
    auto it = retries_.find(id);
    if (it == retries_.end() || !it->second.inFlight) return;
    attemptFailed(id, "connection failed");
}

void LinkSupervisor::cancelReconnection(const PeripheralId& id) {
    auto it = retries_.find(id);
    if (it == retries_.end()) return;
    if (it->second.delayTimer) loop_.cancel(it->second.delayTimer);
    if (it->second.attemptTimer) loop_.cancel(it->second.attemptTimer);
    retries_.erase(it);
    PL_LOG_DEBUG("[%s] reconnection cancelled", id.value.c_str());
}

void LinkSupervisor::cancelAll() {
    for (auto& kv : retries_) {
        if (kv.second.delayTimer) loop_.cancel(kv.second.delayTimer);
        if (kv.second.attemptTimer) loop_.cancel(kv.second.attemptTimer);
    }
    retries_.clear();
}

void LinkSupervisor::scheduleNext(const PeripheralId& id) {
    auto it = retries_.find(id);
    if (it == retries_.end()) return;
    Retry& r = it->second;
    if (r.attempts >= opt_.reconnectMaxAttempts) {
        giveUp(id);
        return;
    }
    const double delay = backoffDelay(r.attempts + 1);
    std::weak_ptr<bool> alive = alive_;
    r.delayTimer = loop_.schedule(delay, [this, alive, id]() {
        if (alive.expired()) return;
        startAttempt(id);
    });
    PL_LOG_INFO("[%s] reconnect attempt %d in %.1f s", id.value.c_str(), r.attempts + 1, delay);
    emit(SupervisorEvent::Kind::ReconnectScheduled, id, r.attempts + 1, delay);
}

void LinkSupervisor::startAttempt(const PeripheralId& id) {
    auto it = retries_.find(id);
    if (it == retries_.end()) return;
    Retry& r = it->second;
    r.delayTimer = 0;
    r.attempts += 1;
    r.inFlight = true;
    const int n = r.attempts;
    std::weak_ptr<bool> alive = alive_;
    r.attemptTimer = loop_.schedule(opt_.reconnectAttemptTimeoutSec, [this, alive, id]() {
        if (alive.expired()) return;
        auto found = retries_.find(id);
        if (found == retries_.end() || !found->second.inFlight) return;
        found->second.attemptTimer = 0;
        attemptFailed(id, "attempt timed out");
    });
    emit(SupervisorEvent::Kind::AttemptStarted, id, n);
    if (connector_) connector_(id);
}

void LinkSupervisor::attemptFailed(const PeripheralId& id, const char* why) {
    auto it = retries_.find(id);
    if (it == retries_.end()) return;
    Retry& r = it->second;
    r.inFlight = false;
    if (r.attemptTimer) {
        loop_.cancel(r.attemptTimer);
        r.attemptTimer = 0;
    }
    PL_LOG_WARN("[%s] reconnect attempt %d/%d failed: %s", id.value.c_str(), r.attempts, opt_.reconnectMaxAttempts, why);
    emit(SupervisorEvent::Kind::AttemptFailed, id, r.attempts);
    scheduleNext(id);
}

void LinkSupervisor::giveUp(const PeripheralId& id) {
    auto it = retries_.find(id);
    if (it == retries_.end()) return;
    const int n = it->second.attempts;
    retries_.erase(it);
    PL_LOG_ERROR("[%s] reconnection gave up after %d attempts", id.value.c_str(), n);
    emit(SupervisorEvent::Kind::GaveUp, id, n);
}

// ---- liveness ----

void LinkSupervisor::startMonitoring(const PeripheralId& id) {
    Liveness l;
    l.lastActivity = loop_.now();
    monitored_[id] = l;
    if (pollTimer_ == 0) {
        std::weak_ptr<bool> alive = alive_;
        pollTimer_ = loop_.schedule(opt_.rssiPollIntervalSec, [this, alive]() {
            if (alive.expired()) return;
            pollTimer_ = 0;
            poll();
        });
    }
}

void LinkSupervisor::stopMonitoring(const PeripheralId& id) {
    monitored_.erase(id);
    if (monitored_.empty() && pollTimer_) {
        loop_.cancel(pollTimer_);
        pollTimer_ = 0;
    }
}

void LinkSupervisor::noteActivity(const PeripheralId& id) {
    auto it = monitored_.find(id);
    if (it == monitored_.end()) return;
    it->second.lastActivity = loop_.now();
    it->second.stale = false;
}

void LinkSupervisor::handleRssi(const PeripheralId& id, int rssi) {
    noteActivity(id);
    emit(SupervisorEvent::Kind::RssiUpdated, id, 0, 0.0, rssi);
}

bool LinkSupervisor::isStale(const PeripheralId& id) const {
    auto it = monitored_.find(id);
    return it != monitored_.end() && it->second.stale;
}

void LinkSupervisor::poll() {
    if (monitored_.empty()) return;
    const double now = loop_.now();
    std::vector<PeripheralId> ids;
    for (const auto& kv : monitored_) ids.push_back(kv.first);
    std::sort(ids.begin(), ids.end());

    for (const auto& id : ids) {
        auto it = monitored_.find(id);
        if (it == monitored_.end()) continue;
        if (!it->second.stale && now - it->second.lastActivity >= opt_.staleThresholdSec) {
            it->second.stale = true;
            PL_LOG_WARN("[%s] connection stale, no traffic for %.1f s", id.value.c_str(), now - it->second.lastActivity);
            emit(SupervisorEvent::Kind::Stale, id);
        }
        transport_.readRssi(id);
    }

    if (!monitored_.empty() && pollTimer_ == 0) {
        std::weak_ptr<bool> alive = alive_;
        pollTimer_ = loop_.schedule(opt_.rssiPollIntervalSec, [this, alive]() {
            if (alive.expired()) return;
            pollTimer_ = 0;
            poll();
        });
    }
}

} // namespace pulselink
