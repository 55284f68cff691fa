#pragma once

// Collaborator interfaces: radio transport, per-device protocol driver,
// remembered-device persistence and scan control.

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "pulselink_core.h"
#include "pulselink_errors.h"
#include "pulselink_race.h"

namespace pulselink {

struct TransportEvent {
    enum class Kind {
        DeviceDiscovered,
        DeviceConnected,
        DeviceDisconnected,   // error set when the link dropped unexpectedly
        ConnectionFailed,
        BluetoothStateChanged,
        CharacteristicUpdated,
        RssiUpdated,
        Error
    };

    Kind kind {Kind::Error};
    PeripheralId peripheral;
    std::string name;
    int rssi {0};
    std::optional<TransportError> error;
    BluetoothState state {BluetoothState::Unknown};
    std::vector<SensorReading> readings;

    static TransportEvent discovered(PeripheralId id, std::string name, int rssi) {
        TransportEvent e; e.kind = Kind::DeviceDiscovered; e.peripheral = std::move(id); e.name = std::move(name); e.rssi = rssi; return e;
    }
    static TransportEvent connected(PeripheralId id) {
        TransportEvent e; e.kind = Kind::DeviceConnected; e.peripheral = std::move(id); return e;
    }
    static TransportEvent disconnected(PeripheralId id, std::optional<TransportError> err = std::nullopt) {
        TransportEvent e; e.kind = Kind::DeviceDisconnected; e.peripheral = std::move(id); e.error = std::move(err); return e;
    }
    static TransportEvent connectionFailed(PeripheralId id, TransportError err) {
        TransportEvent e; e.kind = Kind::ConnectionFailed; e.peripheral = std::move(id); e.error = std::move(err); return e;
    }
    static TransportEvent stateChanged(BluetoothState s) {
        TransportEvent e; e.kind = Kind::BluetoothStateChanged; e.state = s; return e;
    }
    static TransportEvent characteristicUpdated(PeripheralId id, std::vector<SensorReading> batch) {
        TransportEvent e; e.kind = Kind::CharacteristicUpdated; e.peripheral = std::move(id); e.readings = std::move(batch); return e;
    }
    static TransportEvent rssiUpdated(PeripheralId id, int rssi) {
        TransportEvent e; e.kind = Kind::RssiUpdated; e.peripheral = std::move(id); e.rssi = rssi; return e;
    }
    static TransportEvent failure(TransportError err) {
        TransportEvent e; e.kind = Kind::Error; e.peripheral = err.peripheral; e.error = std::move(err); return e;
    }
};

class Transport {
public:
    using EventHandler = std::function<void(const TransportEvent&)>;

    virtual ~Transport() = default;

    virtual void setEventHandler(EventHandler handler) = 0;
    virtual BluetoothState state() const = 0;
    virtual void startScanning() = 0;
    virtual void stopScanning() = 0;
    virtual void connect(const PeripheralId& id) = 0;
    virtual void disconnect(const PeripheralId& id) = 0;
    // Live link check, used between discovery steps
    virtual bool isLinkConnected(const PeripheralId& id) const = 0;
    // Answers with an RssiUpdated event
    virtual void readRssi(const PeripheralId& id) = 0;
};

// Device-specific GATT work. Each call completes exactly once unless
// cancelPending() is called first.
class DeviceDriver {
public:
    virtual ~DeviceDriver() = default;

    virtual void discoverServices(Completion done) = 0;
    virtual void discoverCharacteristics(Completion done) = 0;
    virtual void enableNotifications(Completion done) = 0;

    // Optional extra channels (e.g. accelerometer, temperature)
    virtual std::vector<std::string> secondaryChannels() const { return {}; }
    virtual void enableSecondaryNotifications(const std::string& channel, Completion done) {
        (void)channel;
        done(OperationResult::success());
    }
    virtual void configureDevice(Completion done) { done(OperationResult::success()); }

    virtual void cancelPending() = 0;
};

using DriverFactory = std::function<std::unique_ptr<DeviceDriver>(const PeripheralId&, DeviceType)>;

// Auto-reconnect targets
class RememberedDeviceStore {
public:
    virtual ~RememberedDeviceStore() = default;
    virtual std::vector<PeripheralId> rememberedDevices() const = 0;
    virtual void remember(const PeripheralId& id, const std::string& name) = 0;
    virtual void forget(const PeripheralId& id) = 0;
};

class ScanControl {
public:
    virtual ~ScanControl() = default;
    virtual bool isScanning() const = 0;
    virtual void stopScanning() = 0;
};

} // namespace pulselink
