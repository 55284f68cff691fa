// In-memory collaborators for lifecycle tests: radio, drivers, persistence
#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "../cpp/pulselink_transport.h"

namespace fakes {

using namespace pulselink;

class FakeTransport : public Transport {
public:
    void setEventHandler(EventHandler h) override { handler_ = std::move(h); }
    BluetoothState state() const override { return bt; }
    void startScanning() override { ++scanStarts; }
    void stopScanning() override { ++scanStops; }
    void connect(const PeripheralId& id) override { ++connectCalls[id]; }
    void disconnect(const PeripheralId& id) override {
        ++disconnectCalls[id];
        if (links.erase(id) && emitOnDisconnect) emit(TransportEvent::disconnected(id));
    }
    bool isLinkConnected(const PeripheralId& id) const override { return links.count(id) != 0; }
    void readRssi(const PeripheralId& id) override {
        ++rssiReads[id];
        if (answerRssi) emit(TransportEvent::rssiUpdated(id, rssiValue));
    }

    void emit(const TransportEvent& e) { if (handler_) handler_(e); }

    // Scripted radio activity
    void advertise(const PeripheralId& id, const std::string& name, int rssi = -60) {
        emit(TransportEvent::discovered(id, name, rssi));
    }
    void linkUp(const PeripheralId& id) {
        links.insert(id);
        emit(TransportEvent::connected(id));
    }
    void linkLost(const PeripheralId& id, const std::string& why = "link supervision timeout") {
        links.erase(id);
        emit(TransportEvent::disconnected(id, TransportError(ErrorKind::UnexpectedDisconnection, id, why)));
    }
    void refuse(const PeripheralId& id, const std::string& why = "peer refused") {
        emit(TransportEvent::connectionFailed(id, TransportError(ErrorKind::ConnectionFailed, id, why)));
    }
    void power(BluetoothState s) {
        bt = s;
        emit(TransportEvent::stateChanged(s));
    }

    BluetoothState bt {BluetoothState::PoweredOn};
    std::set<PeripheralId> links;
    bool emitOnDisconnect {true};
    bool answerRssi {false};
    int rssiValue {-55};
    int scanStarts {0};
    int scanStops {0};
    std::map<PeripheralId, int> connectCalls;
    std::map<PeripheralId, int> disconnectCalls;
    std::map<PeripheralId, int> rssiReads;

private:
    EventHandler handler_;
};

// Per-step scripted behavior. Hang keeps the completion until cancelPending.
// DropLink removes the radio link and then reports success.
enum class Behavior { Succeed, Fail, Hang, DropLink };

class FakeDriver : public DeviceDriver {
public:
    FakeDriver(FakeTransport* transport, PeripheralId id) : transport_(transport), id_(std::move(id)) {}

    void discoverServices(Completion done) override {
        calls.push_back("services");
        run(services, ErrorKind::ServiceDiscoveryFailed, std::move(done));
    }
    void discoverCharacteristics(Completion done) override {
        calls.push_back("characteristics");
        run(characteristics, ErrorKind::CharacteristicDiscoveryFailed, std::move(done));
    }
    void enableNotifications(Completion done) override {
        calls.push_back("notifications");
        run(notifications, ErrorKind::NotificationSetupFailed, std::move(done));
    }
    std::vector<std::string> secondaryChannels() const override { return channels; }
    void enableSecondaryNotifications(const std::string& channel, Completion done) override {
        calls.push_back("secondary:" + channel);
        run(secondary, ErrorKind::NotificationSetupFailed, std::move(done));
    }
    void configureDevice(Completion done) override {
        calls.push_back("configure");
        run(configure, ErrorKind::ConfigurationFailed, std::move(done));
    }
    void cancelPending() override {
        ++cancels;
        pending_ = nullptr;
    }

    bool hasPending() const { return static_cast<bool>(pending_); }
    // Completes a hung step late (after a timeout already settled it)
    void completeLate() {
        Completion c = std::move(pending_);
        pending_ = nullptr;
        if (c) c(OperationResult::success());
    }

    Behavior services {Behavior::Succeed};
    Behavior characteristics {Behavior::Succeed};
    Behavior notifications {Behavior::Succeed};
    Behavior secondary {Behavior::Succeed};
    Behavior configure {Behavior::Succeed};
    std::vector<std::string> channels;
    std::string failReason {"gatt error 133"};
    std::vector<std::string> calls;
    int cancels {0};

private:
    void run(Behavior b, ErrorKind kind, Completion done) {
        switch (b) {
            case Behavior::Succeed: done(OperationResult::success()); break;
            case Behavior::Fail: done(OperationResult::failure(TransportError(kind, id_, failReason))); break;
            case Behavior::Hang: pending_ = std::move(done); break;
            case Behavior::DropLink:
                if (transport_) transport_->links.erase(id_);
                done(OperationResult::success());
                break;
        }
    }

    FakeTransport* transport_ {nullptr};
    PeripheralId id_;
    Completion pending_;
};

class MemoryDeviceStore : public RememberedDeviceStore {
public:
    std::vector<PeripheralId> rememberedDevices() const override { return ids; }
    void remember(const PeripheralId& id, const std::string& name) override {
        names[id] = name;
        for (const auto& x : ids) if (x == id) return;
        ids.push_back(id);
    }
    void forget(const PeripheralId& id) override {
        names.erase(id);
        for (auto it = ids.begin(); it != ids.end(); ++it) {
            if (*it == id) { ids.erase(it); return; }
        }
    }

    std::vector<PeripheralId> ids;
    std::map<PeripheralId, std::string> names;
};

} // namespace fakes
