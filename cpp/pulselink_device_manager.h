#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "pulselink_core.h"
#include "pulselink_discovery.h"
#include "pulselink_errors.h"
#include "pulselink_event_loop.h"
#include "pulselink_readiness.h"
#include "pulselink_readings.h"
#include "pulselink_reconnect.h"
#include "pulselink_transport.h"

namespace pulselink {

// Facade over the connection lifecycle: owns the per-peripheral driver
// registry (keyed by stable identity), readiness state machine, discovery
// orchestrator, link supervisor and reading router. All methods are meant to
// be called on the event loop's logical thread.
class DeviceManager : public ScanControl {
public:
    using SupervisorListener = std::function<void(const SupervisorEvent&)>;

    DeviceManager(EventLoop& loop,
                  Transport& transport,
                  DriverFactory factory,
                  RememberedDeviceStore* store = nullptr,
                  const Options& opt = {});
    ~DeviceManager() override;

    DeviceManager(const DeviceManager&) = delete;
    DeviceManager& operator=(const DeviceManager&) = delete;

    // Name-based family detection; nullopt for unsupported devices
    static std::optional<DeviceType> detectDeviceType(const std::string& name);

    // Skipped while a device is ready or a scan is already running
    void startScanning();
    void stopScanning() override;
    bool isScanning() const override { return scanning_; }

    // Throws DeviceError(InvalidPeripheral) for an unknown peripheral.
    // Cancels any pending reconnection for id first.
    void connect(const PeripheralId& id);
    void disconnect(const PeripheralId& id);
    void disconnectAll();
    // Scans briefly, then connects the first remembered device seen
    void attemptAutoReconnect();
    void setPrimaryDevice(const PeripheralId& id);

    Readiness readiness(const PeripheralId& id) const { return states_.readiness(id); }
    std::vector<DeviceInfo> discoveredDevices() const { return states_.directory().discovered(); }
    std::vector<DeviceInfo> connectedDevices() const { return states_.directory().connected(); }
    std::optional<DeviceInfo> primaryDevice() const { return states_.directory().primary(); }
    std::optional<DeviceType> deviceType(const PeripheralId& id) const;
    const std::optional<TransportError>& lastError() const { return lastError_; }
    BluetoothState bluetoothState() const { return btState_; }

    uint64_t addReadinessListener(ConnectionStateMachine::Listener l) { return states_.addListener(std::move(l)); }
    void removeReadinessListener(uint64_t token) { states_.removeListener(token); }
    void addSupervisorListener(SupervisorListener l) { supervisorListeners_.push_back(std::move(l)); }

    ReadingRouter& router() { return router_; }
    const ConnectionStateMachine& states() const { return states_; }
    LinkSupervisor& supervisor() { return supervisor_; }

private:
    struct Entry {
        std::unique_ptr<DeviceDriver> driver;
        DeviceType type {DeviceType::Optical};
        std::string name;
    };

    void handleEvent(const TransportEvent& e);
    void onDiscovered(const PeripheralId& id, const std::string& name, int rssi);
    void onConnected(const PeripheralId& id);
    void onDisconnected(const PeripheralId& id, const std::optional<TransportError>& err);
    void onConnectionFailed(const PeripheralId& id, const TransportError& err);
    void onBluetoothState(BluetoothState s);
    void onCharacteristicUpdated(const PeripheralId& id, const std::vector<SensorReading>& batch);
    void onRssi(const PeripheralId& id, int rssi);
    void onError(const TransportError& err);
    void onSupervisorEvent(const SupervisorEvent& e);
    void connectInternal(const PeripheralId& id);
    void runAutoReconnect(const std::vector<PeripheralId>& remembered);
    void recordError(const TransportError& err);

    EventLoop& loop_;
    Transport& transport_;
    DriverFactory factory_;
    RememberedDeviceStore* store_ {nullptr};
    Options opt_ {};

    ConnectionStateMachine states_;
    ReadingRouter router_;
    DiscoveryOrchestrator orchestrator_;
    LinkSupervisor supervisor_;

    std::unordered_map<PeripheralId, Entry> devices_;
    std::vector<SupervisorListener> supervisorListeners_;
    bool scanning_ {false};
    bool pendingAutoReconnect_ {false};
    TimerId autoReconnectTimer_ {0};
    BluetoothState btState_ {BluetoothState::Unknown};
    std::optional<TransportError> lastError_;
    std::shared_ptr<bool> alive_;
};

} // namespace pulselink
