#include "pulselink_device_manager.h"

#include <algorithm>
#include <cctype>
#include "pulselink_log.h"

namespace pulselink {

using Stage = Readiness::Stage;

DeviceManager::DeviceManager(EventLoop& loop,
                             Transport& transport,
                             DriverFactory factory,
                             RememberedDeviceStore* store,
                             const Options& opt)
    : loop_(loop),
      transport_(transport),
      factory_(std::move(factory)),
      store_(store),
      opt_(opt),
      states_(this),
      router_(opt),
      orchestrator_(loop, transport, states_, opt),
      supervisor_(loop, transport, [this](const PeripheralId& id) { connectInternal(id); }, opt),
      alive_(std::make_shared<bool>(true)) {
    btState_ = transport_.state();
    orchestrator_.setFailureHandler([this](const PeripheralId&, const TransportError& e) { recordError(e); });
    supervisor_.setEventHandler([this](const SupervisorEvent& e) { onSupervisorEvent(e); });
    transport_.setEventHandler([this](const TransportEvent& e) { handleEvent(e); });
}

DeviceManager::~DeviceManager() {
    transport_.setEventHandler(nullptr);
    if (autoReconnectTimer_) loop_.cancel(autoReconnectTimer_);
    orchestrator_.cancelAll();
    supervisor_.cancelAll();
}

std::optional<DeviceType> DeviceManager::detectDeviceType(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.find("oralable") != std::string::npos) return DeviceType::Optical;
    if (lower.find("anr") != std::string::npos || lower.find("m40") != std::string::npos) return DeviceType::Emg;
    return std::nullopt;
}

std::optional<DeviceType> DeviceManager::deviceType(const PeripheralId& id) const {
    auto it = devices_.find(id);
    if (it == devices_.end()) return std::nullopt;
    return it->second.type;
}

void DeviceManager::recordError(const TransportError& err) {
    switch (err.severity()) {
        case ErrorSeverity::Info: PL_LOG_INFO("%s: %s", err.code(), err.describe().c_str()); break;
        case ErrorSeverity::Warning: PL_LOG_WARN("%s: %s", err.code(), err.describe().c_str()); break;
        case ErrorSeverity::Error: PL_LOG_ERROR("%s: %s", err.code(), err.describe().c_str()); break;
        case ErrorSeverity::Critical: PL_LOG_FATAL("%s: %s", err.code(), err.describe().c_str()); break;
    }
    lastError_ = err;
}

// ---- scanning ----

void DeviceManager::startScanning() {
    if (states_.anyReady()) {
        PL_LOG_INFO("device already ready, scan skipped");
        return;
    }
    if (scanning_) {
        PL_LOG_DEBUG("already scanning");
        return;
    }
    if (btState_ != BluetoothState::PoweredOn) {
        recordError(TransportError::bluetoothNotReady(btState_));
        return;
    }
    scanning_ = true;
    PL_LOG_INFO("scan started");
    transport_.startScanning();
}

void DeviceManager::stopScanning() {
    if (!scanning_) return;
    scanning_ = false;
    transport_.stopScanning();
    PL_LOG_INFO("scan stopped");
}

// ---- connection actions ----

void DeviceManager::connect(const PeripheralId& id) {
    auto it = devices_.find(id);
    if (it == devices_.end()) throw DeviceError(TransportError(ErrorKind::InvalidPeripheral, id));

    // user intent wins over the retry loop
    supervisor_.cancelReconnection(id);

    const Readiness cur = states_.readiness(id);
    if (cur.isConnected() || cur.stage == Stage::Connecting) {
        PL_LOG_INFO("[%s] connect ignored, already %s", id.value.c_str(), stageName(cur.stage));
        return;
    }
    PL_LOG_INFO("[%s] connecting to %s", id.value.c_str(), it->second.name.c_str());
    connectInternal(id);
}

void DeviceManager::connectInternal(const PeripheralId& id) {
    states_.transition(id, Readiness::connecting());
    transport_.connect(id);
}

void DeviceManager::disconnect(const PeripheralId& id) {
    auto it = devices_.find(id);
    if (it == devices_.end()) {
        PL_LOG_ERROR("[%s] disconnect: device not found", id.value.c_str());
        return;
    }
    supervisor_.cancelReconnection(id);
    orchestrator_.cancel(id);
    it->second.driver->cancelPending();
    PL_LOG_INFO("[%s] disconnecting", id.value.c_str());
    transport_.disconnect(id);
}

void DeviceManager::disconnectAll() {
    PL_LOG_INFO("disconnecting all devices");
    std::vector<PeripheralId> ids;
    for (const auto& d : states_.directory().connected()) ids.push_back(d.id);
    for (const auto& id : ids) disconnect(id);
    supervisor_.cancelAll();
}

void DeviceManager::setPrimaryDevice(const PeripheralId& id) {
    states_.directory().setPrimary(id);
}

void DeviceManager::attemptAutoReconnect() {
    std::vector<PeripheralId> remembered;
    if (store_) remembered = store_->rememberedDevices();
    if (remembered.empty()) {
        PL_LOG_INFO("no remembered devices for auto-reconnect");
        return;
    }
    if (btState_ != BluetoothState::PoweredOn) {
        // deferred until the radio powers on
        pendingAutoReconnect_ = true;
        PL_LOG_INFO("auto-reconnect deferred, bluetooth %s", bluetoothStateName(btState_));
        return;
    }
    runAutoReconnect(remembered);
}

void DeviceManager::runAutoReconnect(const std::vector<PeripheralId>& remembered) {
    pendingAutoReconnect_ = false;
    PL_LOG_INFO("auto-reconnect scan for %zu remembered device(s)", remembered.size());
    startScanning();
    if (autoReconnectTimer_) loop_.cancel(autoReconnectTimer_);
    std::weak_ptr<bool> alive = alive_;
    autoReconnectTimer_ = loop_.schedule(opt_.autoReconnectScanSec, [this, alive, remembered]() {
        if (alive.expired()) return;
        autoReconnectTimer_ = 0;
        for (const auto& id : remembered) {
            if (!states_.directory().find(id) || !devices_.count(id)) continue;
            try {
                connect(id);
                PL_LOG_INFO("[%s] auto-reconnect started", id.value.c_str());
                break;
            } catch (const DeviceError& e) {
                PL_LOG_DEBUG("[%s] auto-reconnect failed: %s", id.value.c_str(), e.what());
            }
        }
        stopScanning();
    });
}

// ---- transport events ----

void DeviceManager::handleEvent(const TransportEvent& e) {
    switch (e.kind) {
        case TransportEvent::Kind::DeviceDiscovered:
            onDiscovered(e.peripheral, e.name, e.rssi);
            break;
        case TransportEvent::Kind::DeviceConnected:
            onConnected(e.peripheral);
            break;
        case TransportEvent::Kind::DeviceDisconnected:
            onDisconnected(e.peripheral, e.error);
            break;
        case TransportEvent::Kind::ConnectionFailed:
            onConnectionFailed(e.peripheral, e.error ? *e.error : TransportError(ErrorKind::ConnectionFailed, e.peripheral));
            break;
        case TransportEvent::Kind::BluetoothStateChanged:
            onBluetoothState(e.state);
            break;
        case TransportEvent::Kind::CharacteristicUpdated:
            onCharacteristicUpdated(e.peripheral, e.readings);
            break;
        case TransportEvent::Kind::RssiUpdated:
            onRssi(e.peripheral, e.rssi);
            break;
        case TransportEvent::Kind::Error:
            if (e.error) onError(*e.error);
            break;
    }
}

void DeviceManager::onDiscovered(const PeripheralId& id, const std::string& name, int rssi) {
    if (states_.directory().find(id)) {
        states_.directory().updateRssi(id, rssi);
        return;
    }
    const std::optional<DeviceType> type = detectDeviceType(name);
    if (!type) {
        PL_LOG_DEBUG("unknown device type '%s' rejected", name.c_str());
        return;
    }

    DeviceInfo info;
    info.id = id;
    info.name = name;
    info.type = *type;
    info.rssi = rssi;
    info.readiness = states_.readiness(id);
    states_.directory().upsertDiscovered(info);
    PL_LOG_INFO("[%s] discovered %s (%s), rssi %d", id.value.c_str(), name.c_str(), deviceTypeName(*type), rssi);

    // driver instances persist across scans
    if (!devices_.count(id)) {
        Entry entry;
        entry.driver = factory_ ? factory_(id, *type) : nullptr;
        if (!entry.driver) {
            PL_LOG_ERROR("[%s] no driver for %s", id.value.c_str(), deviceTypeName(*type));
            return;
        }
        entry.type = *type;
        entry.name = name;
        devices_.emplace(id, std::move(entry));
    }
}

void DeviceManager::onConnected(const PeripheralId& id) {
    auto it = devices_.find(id);
    if (it == devices_.end()) {
        PL_LOG_WARN("[%s] connected but not registered, ignoring", id.value.c_str());
        return;
    }

    const Readiness cur = states_.readiness(id);
    if (cur.stage == Stage::Disconnected || cur.stage == Stage::Failed)
        states_.transition(id, Readiness::connecting());
    if (!states_.transition(id, Readiness::connected())) return;

    supervisor_.handleConnected(id);

    DeviceDirectory& dir = states_.directory();
    dir.addConnected(id);
    dir.syncReadiness(id, states_.readiness(id));
    if (!dir.primary()) dir.setPrimary(id);

    if (store_) store_->remember(id, it->second.name);
    orchestrator_.start(id, *it->second.driver);
}

void DeviceManager::onDisconnected(const PeripheralId& id, const std::optional<TransportError>& err) {
    const bool unexpected = err.has_value();
    orchestrator_.cancel(id);
    auto it = devices_.find(id);
    if (it != devices_.end()) it->second.driver->cancelPending();

    if (unexpected) {
        TransportError e = *err;
        if (e.kind != ErrorKind::UnexpectedDisconnection) e = TransportError(ErrorKind::UnexpectedDisconnection, id, err->describe());
        e.peripheral = id;
        recordError(e);
    } else {
        PL_LOG_INFO("[%s] disconnected", id.value.c_str());
    }

    // a recorded failure survives the clean-up disconnect that follows it
    const Readiness cur = states_.readiness(id);
    if (unexpected || cur.stage != Stage::Failed)
        states_.transition(id, Readiness::disconnected());

    DeviceDirectory& dir = states_.directory();
    dir.removeConnected(id);
    if (!dir.primary() && !dir.connected().empty()) dir.setPrimary(dir.connected().front().id);

    supervisor_.handleDisconnection(id, unexpected);
}

void DeviceManager::onConnectionFailed(const PeripheralId& id, const TransportError& err) {
    TransportError e = err;
    e.peripheral = id;
    recordError(e);
    if (supervisor_.isReconnecting(id)) {
        states_.transition(id, Readiness::disconnected());
        supervisor_.handleConnectionFailed(id);
    } else {
        states_.transition(id, Readiness::failed(e.describe()));
    }
}

void DeviceManager::onBluetoothState(BluetoothState s) {
    btState_ = s;
    PL_LOG_INFO("bluetooth state: %s", bluetoothStateName(s));
    if (s != BluetoothState::PoweredOn) {
        if (scanning_) {
            PL_LOG_WARN("bluetooth not powered on, stopping scan");
            scanning_ = false;
        }
        recordError(TransportError::bluetoothNotReady(s));
        return;
    }
    if (pendingAutoReconnect_) attemptAutoReconnect();
}

void DeviceManager::onCharacteristicUpdated(const PeripheralId& id, const std::vector<SensorReading>& batch) {
    supervisor_.noteActivity(id);
    auto it = devices_.find(id);
    const DeviceType type = it == devices_.end() ? DeviceType::Optical : it->second.type;
    router_.deliver(id, type, batch);
}

void DeviceManager::onRssi(const PeripheralId& id, int rssi) {
    states_.directory().updateRssi(id, rssi);
    supervisor_.handleRssi(id, rssi);
}

void DeviceManager::onError(const TransportError& err) {
    switch (err.kind) {
        case ErrorKind::BluetoothNotReady:
        case ErrorKind::BluetoothUnauthorized:
        case ErrorKind::BluetoothUnsupported:
        case ErrorKind::BluetoothResetting:
            recordError(err);
            if (scanning_) {
                scanning_ = false;
                PL_LOG_WARN("scan stopped by bluetooth error");
            }
            break;
        case ErrorKind::ConnectionFailed:
        case ErrorKind::ConnectionTimeout:
            if (!err.peripheral.empty()) onConnectionFailed(err.peripheral, err);
            else recordError(err);
            break;
        case ErrorKind::MaxReconnectAttemptsExceeded:
            recordError(err);
            if (!err.peripheral.empty()) states_.transition(err.peripheral, Readiness::failed(err.describe()));
            break;
        default:
            recordError(err);
            break;
    }
}

void DeviceManager::onSupervisorEvent(const SupervisorEvent& e) {
    if (e.kind == SupervisorEvent::Kind::AttemptFailed && states_.readiness(e.peripheral).stage == Stage::Connecting) {
        // unanswered attempt; the next one needs Disconnected -> Connecting
        states_.transition(e.peripheral, Readiness::disconnected());
    } else if (e.kind == SupervisorEvent::Kind::GaveUp) {
        const TransportError err = TransportError::reconnectExhausted(e.peripheral, e.attempt);
        recordError(err);
        states_.transition(e.peripheral, Readiness::failed(err.describe()));
    }
    for (const auto& l : supervisorListeners_) l(e);
}

} // namespace pulselink
