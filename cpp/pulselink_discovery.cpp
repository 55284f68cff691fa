#include "pulselink_discovery.h"

#include "pulselink_log.h"

namespace pulselink {

using Stage = Readiness::Stage;

DiscoveryOrchestrator::DiscoveryOrchestrator(EventLoop& loop, Transport& transport,
                                             ConnectionStateMachine& states, const Options& opt)
    : loop_(loop), transport_(transport), states_(states), opt_(opt), alive_(std::make_shared<bool>(true)) {}

DiscoveryOrchestrator::~DiscoveryOrchestrator() {
    cancelAll();
}

DiscoveryOrchestrator::Run* DiscoveryOrchestrator::find(const PeripheralId& id, uint64_t gen) {
    auto it = runs_.find(id);
    if (it == runs_.end() || it->second.generation != gen) return nullptr;
    return &it->second;
}

void DiscoveryOrchestrator::start(const PeripheralId& id, DeviceDriver& driver) {
    cancel(id);
    Run run;
    run.generation = nextGeneration_++;
    run.driver = &driver;
    const uint64_t gen = run.generation;
    runs_[id] = std::move(run);
    PL_LOG_INFO("[%s] starting discovery", id.value.c_str());

    std::weak_ptr<bool> alive = alive_;
    loop_.post([this, alive, id, gen]() {
        if (alive.expired()) return;
        stepServices(id, gen);
    });
}

void DiscoveryOrchestrator::cancel(const PeripheralId& id) {
    auto it = runs_.find(id);
    if (it == runs_.end()) return;
    if (it->second.race) it->second.race->cancel();
    runs_.erase(it);
    PL_LOG_DEBUG("[%s] discovery cancelled", id.value.c_str());
}

void DiscoveryOrchestrator::cancelAll() {
    for (auto& kv : runs_)
        if (kv.second.race) kv.second.race->cancel();
    runs_.clear();
}

// Cancellation and link state are checked explicitly between steps
bool DiscoveryOrchestrator::stillValid(const PeripheralId& id, uint64_t gen, const char* phase) {
    if (!find(id, gen)) return false;
    if (!transport_.isLinkConnected(id)) {
        PL_LOG_WARN("[%s] link lost %s, aborting discovery", id.value.c_str(), phase);
        runs_.erase(id);
        states_.transition(id, Readiness::disconnected());
        return false;
    }
    return true;
}

void DiscoveryOrchestrator::fail(const PeripheralId& id, const TransportError& e) {
    runs_.erase(id);
    states_.transition(id, Readiness::failed(e.describe()));
    if (onFailure_) onFailure_(id, e);
}

void DiscoveryOrchestrator::mandatoryStep(const PeripheralId& id, uint64_t gen, Stage during, Stage after,
                                          const char* operation, ErrorKind failKind, Op op,
                                          std::function<void()> next) {
    if (!stillValid(id, gen, "before step")) return;
    if (!states_.transition(id, Readiness(during))) {
        if (find(id, gen)) runs_.erase(id);
        return;
    }

    // a readiness listener may have cancelled or restarted the run
    Run* run = find(id, gen);
    if (!run) return;
    DeviceDriver* driver = run->driver;
    const std::string opName = operation;
    run->race = TimeoutRace::start(
        loop_, opt_.stepTimeoutSec, opName,
        [driver, op](Completion c) { op(*driver, std::move(c)); },
        [driver]() { driver->cancelPending(); },
        [this, id, gen, after, failKind, next](OperationResult r) {
            if (!stillValid(id, gen, "after step")) return;
            if (!r.ok) {
                TransportError e = r.error;
                if (e.kind != failKind) e = TransportError(failKind, id, r.error.describe());
                e.peripheral = id;
                fail(id, e);
                return;
            }
            if (after != Stage::Ready && !states_.transition(id, Readiness(after))) {
                if (find(id, gen)) runs_.erase(id);
                return;
            }
            if (!find(id, gen)) return;
            next();
        });
}

void DiscoveryOrchestrator::bestEffortStep(const PeripheralId& id, uint64_t gen, const std::string& operation,
                                           Op op, std::function<void()> next) {
    if (!stillValid(id, gen, "before optional step")) return;
    Run* run = find(id, gen);
    if (!run) return;
    DeviceDriver* driver = run->driver;
    run->race = TimeoutRace::start(
        loop_, opt_.stepTimeoutSec, operation,
        [driver, op](Completion c) { op(*driver, std::move(c)); },
        [driver]() { driver->cancelPending(); },
        [this, id, gen, operation, next](OperationResult r) {
            if (!stillValid(id, gen, "after optional step")) return;
            if (!r.ok) PL_LOG_WARN("[%s] %s failed (non-critical): %s", id.value.c_str(), operation.c_str(), r.error.describe().c_str());
            next();
        });
}

void DiscoveryOrchestrator::stepServices(const PeripheralId& id, uint64_t gen) {
    mandatoryStep(id, gen, Stage::DiscoveringServices, Stage::ServicesDiscovered,
                  "Service discovery", ErrorKind::ServiceDiscoveryFailed,
                  [](DeviceDriver& d, Completion c) { d.discoverServices(std::move(c)); },
                  [this, id, gen]() { stepCharacteristics(id, gen); });
}

void DiscoveryOrchestrator::stepCharacteristics(const PeripheralId& id, uint64_t gen) {
    mandatoryStep(id, gen, Stage::DiscoveringCharacteristics, Stage::CharacteristicsDiscovered,
                  "Characteristic discovery", ErrorKind::CharacteristicDiscoveryFailed,
                  [](DeviceDriver& d, Completion c) { d.discoverCharacteristics(std::move(c)); },
                  [this, id, gen]() { stepNotifications(id, gen); });
}

void DiscoveryOrchestrator::stepNotifications(const PeripheralId& id, uint64_t gen) {
    // Ready is set only after the optional steps
    mandatoryStep(id, gen, Stage::EnablingNotifications, Stage::Ready,
                  "Notification setup", ErrorKind::NotificationSetupFailed,
                  [](DeviceDriver& d, Completion c) { d.enableNotifications(std::move(c)); },
                  [this, id, gen]() {
                      Run* run = find(id, gen);
                      if (!run) return;
                      run->channels = run->driver->secondaryChannels();
                      run->nextChannel = 0;
                      stepSecondary(id, gen);
                  });
}

void DiscoveryOrchestrator::stepSecondary(const PeripheralId& id, uint64_t gen) {
    Run* run = find(id, gen);
    if (!run) return;
    if (run->nextChannel >= run->channels.size()) {
        stepConfigure(id, gen);
        return;
    }
    const std::string channel = run->channels[run->nextChannel++];
    bestEffortStep(id, gen, "Enable " + channel + " notifications",
                   [channel](DeviceDriver& d, Completion c) { d.enableSecondaryNotifications(channel, std::move(c)); },
                   [this, id, gen]() { stepSecondary(id, gen); });
}

void DiscoveryOrchestrator::stepConfigure(const PeripheralId& id, uint64_t gen) {
    bestEffortStep(id, gen, "Device configuration",
                   [](DeviceDriver& d, Completion c) { d.configureDevice(std::move(c)); },
                   [this, id, gen]() { finishReady(id, gen); });
}

void DiscoveryOrchestrator::finishReady(const PeripheralId& id, uint64_t gen) {
    if (!stillValid(id, gen, "before ready")) return;
    runs_.erase(id);
    if (states_.transition(id, Readiness::ready()))
        PL_LOG_INFO("[%s] device ready", id.value.c_str());
}

} // namespace pulselink
