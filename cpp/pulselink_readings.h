#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include "pulselink_core.h"

namespace pulselink {

using SubscriptionId = uint64_t;

using BatchHandler = std::function<void(const PeripheralId&, DeviceType, const std::vector<SensorReading>&)>;
using LatestHandler = std::function<void(const SensorReading&)>;
using SampleHandler = std::function<void(const PeripheralId&, const SensorSample&)>;

// Fans out reading batches and keeps bounded histories.
// Snapshots are copies, so consumers may analyze them on another thread.
class ReadingRouter {
public:
    explicit ReadingRouter(const Options& opt = {});

    // Empty batches are ignored
    void deliver(const PeripheralId& id, DeviceType type, const std::vector<SensorReading>& batch);

    SubscriptionId subscribe(BatchHandler h);
    // Invoked once per sensor type present in a batch
    SubscriptionId subscribeLatest(LatestHandler h);
    SubscriptionId subscribeSamples(SampleHandler h);
    void unsubscribe(SubscriptionId id);

    std::optional<SensorReading> latest(SensorType t) const;
    std::map<SensorType, SensorReading> latestAll() const;
    std::vector<SensorReading> history() const;
    size_t historySize() const;
    std::vector<SensorSample> sampleHistory(const PeripheralId& id) const;
    std::optional<SensorSample> latestSample(const PeripheralId& id) const;

    // Drops per-device merge state and samples (device removed)
    void forget(const PeripheralId& id);
    void clear();

private:
    struct DeviceChannels {
        SensorSample merged;
        std::deque<SensorSample> samples;
    };

    std::optional<SensorSample> buildSample(DeviceChannels& dev, DeviceType type, const std::vector<SensorReading>& batch) const;

    Options opt_ {};
    mutable std::mutex mu_;
    std::deque<SensorReading> history_;
    std::map<SensorType, SensorReading> latest_;
    std::unordered_map<PeripheralId, DeviceChannels> devices_;

    SubscriptionId nextId_ {1};
    std::map<SubscriptionId, BatchHandler> batchHandlers_;
    std::map<SubscriptionId, LatestHandler> latestHandlers_;
    std::map<SubscriptionId, SampleHandler> sampleHandlers_;
};

} // namespace pulselink
