#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "pulselink_core.h"
#include "pulselink_event_loop.h"
#include "pulselink_race.h"
#include "pulselink_readiness.h"
#include "pulselink_transport.h"

namespace pulselink {

// Drives a connected peripheral to Ready:
//   services -> characteristics -> notifications (mandatory, each timeout-raced)
//   secondary channels -> device configuration (best-effort, logged)
// The radio link is re-checked before and after each step; a dropped link
// ends the run in Disconnected instead of continuing on a stale handle.
class DiscoveryOrchestrator {
public:
    using FailureHandler = std::function<void(const PeripheralId&, const TransportError&)>;

    DiscoveryOrchestrator(EventLoop& loop, Transport& transport, ConnectionStateMachine& states, const Options& opt = {});
    ~DiscoveryOrchestrator();

    DiscoveryOrchestrator(const DiscoveryOrchestrator&) = delete;
    DiscoveryOrchestrator& operator=(const DiscoveryOrchestrator&) = delete;

    // Restarts any run already in flight for id. driver must outlive the run.
    void start(const PeripheralId& id, DeviceDriver& driver);
    void cancel(const PeripheralId& id);
    void cancelAll();
    bool isRunning(const PeripheralId& id) const { return runs_.count(id) != 0; }

    // Called when a mandatory step fails (readiness is already Failed)
    void setFailureHandler(FailureHandler h) { onFailure_ = std::move(h); }

private:
    struct Run {
        uint64_t generation {0};
        DeviceDriver* driver {nullptr};
        std::shared_ptr<TimeoutRace> race;
        std::vector<std::string> channels;
        size_t nextChannel {0};
    };

    using Op = std::function<void(DeviceDriver&, Completion)>;

    bool stillValid(const PeripheralId& id, uint64_t gen, const char* phase);
    void mandatoryStep(const PeripheralId& id, uint64_t gen, Readiness::Stage during, Readiness::Stage after,
                       const char* operation, ErrorKind failKind, Op op, std::function<void()> next);
    void bestEffortStep(const PeripheralId& id, uint64_t gen, const std::string& operation, Op op, std::function<void()> next);
    void stepServices(const PeripheralId& id, uint64_t gen);
    void stepCharacteristics(const PeripheralId& id, uint64_t gen);
    void stepNotifications(const PeripheralId& id, uint64_t gen);
    void stepSecondary(const PeripheralId& id, uint64_t gen);
    void stepConfigure(const PeripheralId& id, uint64_t gen);
    void finishReady(const PeripheralId& id, uint64_t gen);
    void fail(const PeripheralId& id, const TransportError& e);
    Run* find(const PeripheralId& id, uint64_t gen);

    EventLoop& loop_;
    Transport& transport_;
    ConnectionStateMachine& states_;
    Options opt_ {};
    uint64_t nextGeneration_ {1};
    std::unordered_map<PeripheralId, Run> runs_;
    FailureHandler onFailure_;
    std::shared_ptr<bool> alive_;
};

} // namespace pulselink
