#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "pulselink_core.h"
#include "pulselink_transport.h"

namespace pulselink {

// How far a peripheral has progressed toward streaming. Failed carries a reason.
struct Readiness {
    enum class Stage {
        Disconnected,
        Connecting,
        Connected,
        DiscoveringServices,
        ServicesDiscovered,
        DiscoveringCharacteristics,
        CharacteristicsDiscovered,
        EnablingNotifications,
        Ready,
        Failed
    };

    Stage stage {Stage::Disconnected};
    std::string reason;

    Readiness() = default;
    explicit Readiness(Stage s) : stage(s) {}

    static Readiness disconnected() { return Readiness(Stage::Disconnected); }
    static Readiness connecting() { return Readiness(Stage::Connecting); }
    static Readiness connected() { return Readiness(Stage::Connected); }
    static Readiness ready() { return Readiness(Stage::Ready); }
    static Readiness failed(std::string why) { Readiness r(Stage::Failed); r.reason = std::move(why); return r; }

    bool isConnected() const;
    bool isReady() const { return stage == Stage::Ready; }
    bool isFailed() const { return stage == Stage::Failed; }
    std::string displayText() const;

    bool operator==(const Readiness& o) const { return stage == o.stage && reason == o.reason; }
    bool operator!=(const Readiness& o) const { return !(*this == o); }
};

const char* stageName(Readiness::Stage s);

struct DeviceInfo {
    PeripheralId id;
    std::string name;
    DeviceType type {DeviceType::Optical};
    int rssi {0};
    Readiness readiness;
};

// List views over known devices. Each view holds its own copy of the
// readiness value, kept in sync by the state machine.
class DeviceDirectory {
public:
    void upsertDiscovered(const DeviceInfo& info);
    void addConnected(const PeripheralId& id);
    void removeConnected(const PeripheralId& id);
    void setPrimary(const std::optional<PeripheralId>& id);
    void updateRssi(const PeripheralId& id, int rssi);
    void syncReadiness(const PeripheralId& id, const Readiness& r);

    std::optional<DeviceInfo> find(const PeripheralId& id) const;
    const std::vector<DeviceInfo>& discovered() const { return discovered_; }
    const std::vector<DeviceInfo>& connected() const { return connected_; }
    const std::optional<DeviceInfo>& primary() const { return primary_; }
    void clearDiscovered();

private:
    std::vector<DeviceInfo> discovered_;
    std::vector<DeviceInfo> connected_;
    std::optional<DeviceInfo> primary_;
};

// Single readiness record per peripheral. Happy-path transitions advance one
// stage at a time; Disconnected and Failed are reachable from anywhere and
// Connecting only from Disconnected or Failed. Rejected transitions are logged.
class ConnectionStateMachine {
public:
    using Listener = std::function<void(const PeripheralId&, const Readiness& from, const Readiness& to)>;

    explicit ConnectionStateMachine(ScanControl* scan = nullptr) : scan_(scan) {}

    static bool isAllowed(const Readiness& from, const Readiness& to);

    bool transition(const PeripheralId& id, const Readiness& next);

    // Disconnected for unknown peripherals
    Readiness readiness(const PeripheralId& id) const;
    bool isReady(const PeripheralId& id) const { return readiness(id).isReady(); }
    bool anyReady() const;
    std::vector<PeripheralId> peripherals() const;
    void remove(const PeripheralId& id);

    uint64_t addListener(Listener l);
    void removeListener(uint64_t token);

    DeviceDirectory& directory() { return directory_; }
    const DeviceDirectory& directory() const { return directory_; }

private:
    ScanControl* scan_ {nullptr};
    std::unordered_map<PeripheralId, Readiness> states_;
    DeviceDirectory directory_;
    uint64_t nextToken_ {1};
    std::map<uint64_t, Listener> listeners_;
};

} // namespace pulselink
