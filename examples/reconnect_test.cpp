// Reconnection backoff timeline and liveness monitoring on the virtual clock
#include <algorithm>
#include "../cpp/pulselink_reconnect.h"
#include "fakes.h"
#include "test_util.h"

using namespace pulselink;
using Kind = SupervisorEvent::Kind;

struct Rig {
    EventLoop loop;
    fakes::FakeTransport radio;
    std::vector<double> attemptTimes;
    std::vector<SupervisorEvent> events;
    LinkSupervisor sup;
    PeripheralId id {"ring-1"};

    explicit Rig(const Options& opt = {})
        : sup(loop, radio, [this](const PeripheralId&) { attemptTimes.push_back(loop.now()); }, opt) {
        sup.setEventHandler([this](const SupervisorEvent& e) { events.push_back(e); });
        radio.setEventHandler([this](const TransportEvent& e) {
            if (e.kind == TransportEvent::Kind::RssiUpdated) sup.handleRssi(e.peripheral, e.rssi);
        });
    }
    int count(Kind k) const {
        return static_cast<int>(std::count_if(events.begin(), events.end(), [k](const SupervisorEvent& e) { return e.kind == k; }));
    }
};

int main() {
    // Backoff schedule: base 2 s doubling, capped at 30 s
    {
        Rig r;
        CHECK(r.sup.backoffDelay(1) == 2.0);
        CHECK(r.sup.backoffDelay(2) == 4.0);
        CHECK(r.sup.backoffDelay(3) == 8.0);
        CHECK(r.sup.backoffDelay(4) == 16.0);
        CHECK(r.sup.backoffDelay(5) == 30.0);
        CHECK(r.sup.backoffDelay(9) == 30.0);
    }

    // No answer at all: five attempts, then one give-up
    {
        Rig r;
        r.sup.handleDisconnection(r.id, true);
        CHECK(r.sup.isReconnecting(r.id));
        r.loop.advanceBy(200.0);
        const std::vector<double> expected {2.0, 16.0, 34.0, 60.0, 100.0};
        CHECK(r.attemptTimes == expected);
        CHECK(r.count(Kind::AttemptStarted) == 5);
        CHECK(r.count(Kind::AttemptFailed) == 5);
        CHECK(r.count(Kind::GaveUp) == 1);
        CHECK(!r.sup.isReconnecting(r.id));
        if (!r.events.empty()) {
            CHECK(r.events.back().kind == Kind::GaveUp);
            CHECK(r.events.back().attempt == 5);
        }
        CHECK(r.loop.pending() == 0);
    }

    // Give-up fires when the last attempt times out
    {
        Rig r;
        r.sup.handleDisconnection(r.id, true);
        r.loop.advanceTo(109.9);
        CHECK(r.count(Kind::GaveUp) == 0);
        r.loop.advanceTo(110.0);
        CHECK(r.count(Kind::GaveUp) == 1);
    }

    // Expected disconnects never reconnect
    {
        Rig r;
        r.sup.handleDisconnection(r.id, false);
        r.loop.advanceBy(60.0);
        CHECK(r.attemptTimes.empty());
        CHECK(!r.sup.isReconnecting(r.id));
    }

    // Success on the second attempt clears retry state and starts monitoring
    {
        Rig r;
        r.sup.handleDisconnection(r.id, true);
        r.loop.advanceTo(16.0);
        CHECK(r.attemptTimes.size() == 2);
        CHECK(r.sup.attempts(r.id) == 2);
        r.loop.advanceTo(17.0);
        r.sup.handleConnected(r.id);
        CHECK(!r.sup.isReconnecting(r.id));
        CHECK(r.count(Kind::Succeeded) == 1);
        CHECK(r.events.back().kind == Kind::Succeeded && r.events.back().attempt == 2);
        CHECK(r.sup.isPolling());
        r.loop.advanceBy(100.0);
        CHECK(r.attemptTimes.size() == 2);
    }

    // Refused attempt moves straight to the next backoff
    {
        Rig r;
        r.sup.handleDisconnection(r.id, true);
        r.loop.advanceTo(3.0);
        r.sup.handleConnectionFailed(r.id);
        CHECK(r.count(Kind::AttemptFailed) == 1);
        r.loop.advanceTo(7.0);
        CHECK(r.attemptTimes.size() == 2);
        if (r.attemptTimes.size() == 2) CHECK_NEAR(r.attemptTimes[1], 7.0, 1e-12);
        // a failure report with no attempt in flight is ignored
        r.loop.advanceTo(8.0);
        r.sup.handleConnectionFailed(PeripheralId("other"));
        CHECK(r.count(Kind::AttemptFailed) == 1);
    }

    // Link dropping again while a retry is pending does not restart the count
    {
        Rig r;
        r.sup.handleDisconnection(r.id, true);
        r.sup.handleDisconnection(r.id, true);
        CHECK(r.count(Kind::ReconnectScheduled) == 1);
        r.loop.advanceTo(2.0);
        r.sup.handleDisconnection(r.id, true);   // attempt in flight
        CHECK(r.count(Kind::AttemptFailed) == 1);
        CHECK(r.sup.attempts(r.id) == 1);
    }

    // Success arriving after the attempt timed out still wins
    {
        Rig r;
        r.sup.handleDisconnection(r.id, true);
        r.loop.advanceTo(13.0);
        CHECK(r.count(Kind::AttemptFailed) == 1);
        r.sup.handleConnected(r.id);
        CHECK(!r.sup.isReconnecting(r.id));
        r.loop.advanceTo(40.0);
        CHECK(r.attemptTimes.size() == 1);
    }

    // Cancellation
    {
        Rig r;
        r.sup.handleDisconnection(r.id, true);
        r.sup.cancelReconnection(r.id);
        CHECK(!r.sup.isReconnecting(r.id));
        r.loop.advanceBy(60.0);
        CHECK(r.attemptTimes.empty());

        r.sup.handleDisconnection(PeripheralId("a"), true);
        r.sup.handleDisconnection(PeripheralId("b"), true);
        r.sup.cancelAll();
        r.loop.advanceBy(60.0);
        CHECK(r.attemptTimes.empty());
    }

    // Silent link goes stale once per episode; traffic clears it
    {
        Rig r;
        r.sup.startMonitoring(r.id);
        CHECK(r.sup.isPolling());
        r.loop.advanceTo(25.0);
        CHECK(r.radio.rssiReads[r.id] == 5);
        CHECK(!r.sup.isStale(r.id));
        r.loop.advanceTo(30.0);
        CHECK(r.sup.isStale(r.id));
        CHECK(r.count(Kind::Stale) == 1);
        r.loop.advanceTo(50.0);
        CHECK(r.count(Kind::Stale) == 1);

        r.sup.noteActivity(r.id);
        CHECK(!r.sup.isStale(r.id));
        r.loop.advanceTo(80.0);
        CHECK(r.count(Kind::Stale) == 2);

        r.sup.stopMonitoring(r.id);
        CHECK(!r.sup.isPolling());
        CHECK(!r.sup.isStale(r.id));
    }

    // RSSI answers count as traffic
    {
        Rig r;
        r.radio.answerRssi = true;
        r.sup.startMonitoring(r.id);
        r.loop.advanceTo(120.0);
        CHECK(r.count(Kind::Stale) == 0);
        CHECK(r.count(Kind::RssiUpdated) == 24);
        if (!r.events.empty()) CHECK(r.events.back().rssi == -55);
    }

    return finish("reconnect_test");
}
