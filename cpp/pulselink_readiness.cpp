#include "pulselink_readiness.h"

#include <algorithm>
#include "pulselink_log.h"

namespace pulselink {

using Stage = Readiness::Stage;

const char* stageName(Stage s) {
    switch (s) {
        case Stage::Disconnected: return "disconnected";
        case Stage::Connecting: return "connecting";
        case Stage::Connected: return "connected";
        case Stage::DiscoveringServices: return "discoveringServices";
        case Stage::ServicesDiscovered: return "servicesDiscovered";
        case Stage::DiscoveringCharacteristics: return "discoveringCharacteristics";
        case Stage::CharacteristicsDiscovered: return "characteristicsDiscovered";
        case Stage::EnablingNotifications: return "enablingNotifications";
        case Stage::Ready: return "ready";
        case Stage::Failed: return "failed";
    }
    return "unknown";
}

bool Readiness::isConnected() const {
    switch (stage) {
        case Stage::Disconnected:
        case Stage::Connecting:
        case Stage::Failed:
            return false;
        case Stage::Connected:
        case Stage::DiscoveringServices:
        case Stage::ServicesDiscovered:
        case Stage::DiscoveringCharacteristics:
        case Stage::CharacteristicsDiscovered:
        case Stage::EnablingNotifications:
        case Stage::Ready:
            return true;
    }
    return false;
}

std::string Readiness::displayText() const {
    switch (stage) {
        case Stage::Disconnected: return "Disconnected";
        case Stage::Connecting: return "Connecting...";
        case Stage::Connected: return "Connected";
        case Stage::DiscoveringServices: return "Discovering services...";
        case Stage::ServicesDiscovered: return "Services found";
        case Stage::DiscoveringCharacteristics: return "Discovering characteristics...";
        case Stage::CharacteristicsDiscovered: return "Characteristics found";
        case Stage::EnablingNotifications: return "Setting up notifications...";
        case Stage::Ready: return "Ready";
        case Stage::Failed: return "Failed: " + reason;
    }
    return "Unknown";
}

// ---- DeviceDirectory ----

static std::vector<DeviceInfo>::iterator findIn(std::vector<DeviceInfo>& v, const PeripheralId& id) {
    return std::find_if(v.begin(), v.end(), [&](const DeviceInfo& d) { return d.id == id; });
}

void DeviceDirectory::upsertDiscovered(const DeviceInfo& info) {
    auto it = findIn(discovered_, info.id);
    if (it == discovered_.end()) {
        discovered_.push_back(info);
    } else {
        // keep the tracked readiness, refresh advertisement data
        it->name = info.name;
        it->type = info.type;
        it->rssi = info.rssi;
    }
}

void DeviceDirectory::addConnected(const PeripheralId& id) {
    if (findIn(connected_, id) != connected_.end()) return;
    auto it = findIn(discovered_, id);
    if (it != discovered_.end()) {
        connected_.push_back(*it);
    } else {
        DeviceInfo d;
        d.id = id;
        connected_.push_back(d);
    }
}

void DeviceDirectory::removeConnected(const PeripheralId& id) {
    auto it = findIn(connected_, id);
    if (it != connected_.end()) connected_.erase(it);
    if (primary_ && primary_->id == id) primary_.reset();
}

void DeviceDirectory::setPrimary(const std::optional<PeripheralId>& id) {
    if (!id) { primary_.reset(); return; }
    auto it = findIn(connected_, *id);
    if (it != connected_.end()) primary_ = *it;
}

void DeviceDirectory::updateRssi(const PeripheralId& id, int rssi) {
    auto a = findIn(discovered_, id);
    if (a != discovered_.end()) a->rssi = rssi;
    auto b = findIn(connected_, id);
    if (b != connected_.end()) b->rssi = rssi;
    if (primary_ && primary_->id == id) primary_->rssi = rssi;
}

void DeviceDirectory::syncReadiness(const PeripheralId& id, const Readiness& r) {
    auto a = findIn(discovered_, id);
    if (a != discovered_.end()) a->readiness = r;
    auto b = findIn(connected_, id);
    if (b != connected_.end()) b->readiness = r;
    if (primary_ && primary_->id == id) primary_->readiness = r;
}

std::optional<DeviceInfo> DeviceDirectory::find(const PeripheralId& id) const {
    for (const auto& d : discovered_) if (d.id == id) return d;
    for (const auto& d : connected_) if (d.id == id) return d;
    return std::nullopt;
}

void DeviceDirectory::clearDiscovered() {
    // connected devices stay listed
    discovered_.erase(std::remove_if(discovered_.begin(), discovered_.end(), [&](const DeviceInfo& d) {
        return findIn(connected_, d.id) == connected_.end();
    }), discovered_.end());
}

// ---- ConnectionStateMachine ----

static int happyPathRank(Stage s) {
    switch (s) {
        case Stage::Connecting: return 0;
        case Stage::Connected: return 1;
        case Stage::DiscoveringServices: return 2;
        case Stage::ServicesDiscovered: return 3;
        case Stage::DiscoveringCharacteristics: return 4;
        case Stage::CharacteristicsDiscovered: return 5;
        case Stage::EnablingNotifications: return 6;
        case Stage::Ready: return 7;
        case Stage::Disconnected:
        case Stage::Failed:
            return -1;
    }
    return -1;
}

bool ConnectionStateMachine::isAllowed(const Readiness& from, const Readiness& to) {
    if (to.stage == Stage::Disconnected || to.stage == Stage::Failed) return true;
    if (to.stage == Stage::Connecting)
        return from.stage == Stage::Disconnected || from.stage == Stage::Failed;
    const int a = happyPathRank(from.stage);
    const int b = happyPathRank(to.stage);
    return a >= 0 && b == a + 1;
}

bool ConnectionStateMachine::transition(const PeripheralId& id, const Readiness& next) {
    auto it = states_.find(id);
    const Readiness prev = it == states_.end() ? Readiness::disconnected() : it->second;
    if (!isAllowed(prev, next)) {
        PL_LOG_WARN("[%s] rejected readiness transition %s -> %s",
                    id.value.c_str(), stageName(prev.stage), stageName(next.stage));
        return false;
    }
    if (prev == next) return true;

    states_[id] = next;
    directory_.syncReadiness(id, next);
    if (next.isFailed()) {
        PL_LOG_ERROR("[%s] readiness: %s", id.value.c_str(), next.displayText().c_str());
    } else {
        PL_LOG_DEBUG("[%s] readiness: %s", id.value.c_str(), next.displayText().c_str());
    }

    if (next.isReady() && scan_ && scan_->isScanning()) {
        PL_LOG_INFO("[%s] device ready, stopping scan", id.value.c_str());
        scan_->stopScanning();
    }

    // listeners may add or remove listeners
    std::vector<Listener> ls;
    for (const auto& kv : listeners_) ls.push_back(kv.second);
    for (const auto& l : ls) l(id, prev, next);
    return true;
}

Readiness ConnectionStateMachine::readiness(const PeripheralId& id) const {
    auto it = states_.find(id);
    return it == states_.end() ? Readiness::disconnected() : it->second;
}

bool ConnectionStateMachine::anyReady() const {
    for (const auto& kv : states_) if (kv.second.isReady()) return true;
    return false;
}

std::vector<PeripheralId> ConnectionStateMachine::peripherals() const {
    std::vector<PeripheralId> out;
    out.reserve(states_.size());
    for (const auto& kv : states_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

void ConnectionStateMachine::remove(const PeripheralId& id) {
    states_.erase(id);
}

uint64_t ConnectionStateMachine::addListener(Listener l) {
    const uint64_t token = nextToken_++;
    listeners_[token] = std::move(l);
    return token;
}

void ConnectionStateMachine::removeListener(uint64_t token) {
    listeners_.erase(token);
}

} // namespace pulselink
