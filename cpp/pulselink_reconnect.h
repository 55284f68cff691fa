#pragma once

#include <functional>
#include <memory>
#include <unordered_map>
#include "pulselink_core.h"
#include "pulselink_event_loop.h"
#include "pulselink_transport.h"

namespace pulselink {

struct SupervisorEvent {
    enum class Kind {
        ReconnectScheduled,
        AttemptStarted,
        AttemptFailed,
        Succeeded,
        GaveUp,
        Stale,
        RssiUpdated
    };
    Kind kind {Kind::ReconnectScheduled};
    PeripheralId peripheral;
    int attempt {0};
    double delaySec {0.0};
    int rssi {0};
};

// Reconnection after unexpected link loss, plus RSSI polling / stale-link
// detection while peripherals are connected. Retry state is keyed by
// peripheral identity.
class LinkSupervisor {
public:
    // Issues one connection attempt (readiness update + transport connect)
    using Connector = std::function<void(const PeripheralId&)>;
    using EventHandler = std::function<void(const SupervisorEvent&)>;

    LinkSupervisor(EventLoop& loop, Transport& transport, Connector connector, const Options& opt = {});
    ~LinkSupervisor();

    LinkSupervisor(const LinkSupervisor&) = delete;
    LinkSupervisor& operator=(const LinkSupervisor&) = delete;

    void setEventHandler(EventHandler h) { onEvent_ = std::move(h); }

    // unexpected: the transport reported an error with the disconnect
    void handleDisconnection(const PeripheralId& id, bool unexpected);
    void handleConnected(const PeripheralId& id);
    void handleConnectionFailed(const PeripheralId& id);
    void cancelReconnection(const PeripheralId& id);
    void cancelAll();

    bool isReconnecting(const PeripheralId& id) const { return retries_.count(id) != 0; }
    int attempts(const PeripheralId& id) const;
    // min(base * 2^(attempt-1), max)
    double backoffDelay(int attempt) const;

    void startMonitoring(const PeripheralId& id);
    void stopMonitoring(const PeripheralId& id);
    void noteActivity(const PeripheralId& id);
    void handleRssi(const PeripheralId& id, int rssi);
    bool isPolling() const { return pollTimer_ != 0; }
    bool isStale(const PeripheralId& id) const;

private:
    struct Retry {
        int attempts {0};
        TimerId delayTimer {0};
        TimerId attemptTimer {0};
        bool inFlight {false};
    };
    struct Liveness {
        double lastActivity {0.0};
        bool stale {false};
    };

    void scheduleNext(const PeripheralId& id);
    void startAttempt(const PeripheralId& id);
    void attemptFailed(const PeripheralId& id, const char* why);
    void giveUp(const PeripheralId& id);
    void poll();
    void emit(SupervisorEvent::Kind kind, const PeripheralId& id, int attempt = 0, double delay = 0.0, int rssi = 0);

    EventLoop& loop_;
    Transport& transport_;
    Connector connector_;
    Options opt_ {};
    EventHandler onEvent_;
    std::unordered_map<PeripheralId, Retry> retries_;
    std::unordered_map<PeripheralId, Liveness> monitored_;
    TimerId pollTimer_ {0};
    std::shared_ptr<bool> alive_;
};

} // namespace pulselink
