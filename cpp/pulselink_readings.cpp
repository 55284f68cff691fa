#include "pulselink_readings.h"

#include <algorithm>
#include "pulselink_log.h"

namespace pulselink {

ReadingRouter::ReadingRouter(const Options& opt) : opt_(opt) {}

std::optional<SensorSample> ReadingRouter::buildSample(DeviceChannels& dev, DeviceType type,
                                                       const std::vector<SensorReading>& batch) const {
    SensorSample& s = dev.merged;
    s.deviceType = type;
    bool hasIr = false;
    bool hasEmg = false;
    double emg = 0.0;
    for (const auto& r : batch) {
        s.timestamp = std::max(s.timestamp, r.timestamp);
        switch (r.type) {
            case SensorType::PpgRed: s.ppg.red = r.value; break;
            case SensorType::PpgInfrared: s.ppg.ir = r.value; hasIr = true; break;
            case SensorType::PpgGreen: s.ppg.green = r.value; break;
            case SensorType::AccelerometerX: s.accelerometer.x = r.value; break;
            case SensorType::AccelerometerY: s.accelerometer.y = r.value; break;
            case SensorType::AccelerometerZ: s.accelerometer.z = r.value; break;
            case SensorType::Temperature: s.temperature = r.value; break;
            case SensorType::Battery: s.battery = r.value; break;
            case SensorType::HeartRate: s.heartRate = r.value; break;
            case SensorType::SpO2: s.spo2 = r.value; break;
            case SensorType::Emg:
            case SensorType::MuscleActivity: emg = r.value; hasEmg = true; break;
        }
    }

    if (type == DeviceType::Optical) {
        if (hasIr && s.ppg.ir > opt_.opticalIrFloor) return s;
        return std::nullopt;
    }
    // EMG amplitude travels in the IR slot
    if (hasEmg && emg > opt_.emgFloor) {
        SensorSample out = s;
        out.ppg = PPGData{0.0, emg, 0.0};
        return out;
    }
    return std::nullopt;
}

void ReadingRouter::deliver(const PeripheralId& id, DeviceType type, const std::vector<SensorReading>& batch) {
    if (batch.empty()) return;

    std::map<SensorType, SensorReading> latestByType;
    std::optional<SensorSample> sample;
    std::vector<BatchHandler> batchHs;
    std::vector<LatestHandler> latestHs;
    std::vector<SampleHandler> sampleHs;
    {
        std::lock_guard<std::mutex> lock(mu_);
        history_.insert(history_.end(), batch.begin(), batch.end());
        const size_t cap = static_cast<size_t>(std::max(1, opt_.historyCapacity));
        if (history_.size() > cap) {
            // Coarse eviction, oldest first
            const size_t drop = std::min(history_.size(),
                                         std::max(history_.size() - cap, static_cast<size_t>(std::max(1, opt_.historyEvictChunk))));
            history_.erase(history_.begin(), history_.begin() + static_cast<std::ptrdiff_t>(drop));
        }

        for (const auto& r : batch) latestByType[r.type] = r;
        for (const auto& kv : latestByType) latest_[kv.first] = kv.second;

        DeviceChannels& dev = devices_[id];
        sample = buildSample(dev, type, batch);
        if (sample) {
            dev.samples.push_back(*sample);
            const size_t scap = static_cast<size_t>(std::max(1, opt_.sampleHistoryCapacity));
            while (dev.samples.size() > scap) dev.samples.pop_front();
        }

        for (const auto& kv : batchHandlers_) batchHs.push_back(kv.second);
        for (const auto& kv : latestHandlers_) latestHs.push_back(kv.second);
        for (const auto& kv : sampleHandlers_) sampleHs.push_back(kv.second);
    }

    PL_LOG_DEBUG("batch of %zu readings from %s, %zu types", batch.size(), id.value.c_str(), latestByType.size());

    for (const auto& kv : latestByType)
        for (const auto& h : latestHs) h(kv.second);
    for (const auto& h : batchHs) h(id, type, batch);
    if (sample)
        for (const auto& h : sampleHs) h(id, *sample);
}

SubscriptionId ReadingRouter::subscribe(BatchHandler h) {
    std::lock_guard<std::mutex> lock(mu_);
    const SubscriptionId sid = nextId_++;
    batchHandlers_[sid] = std::move(h);
    return sid;
}

SubscriptionId ReadingRouter::subscribeLatest(LatestHandler h) {
    std::lock_guard<std::mutex> lock(mu_);
    const SubscriptionId sid = nextId_++;
    latestHandlers_[sid] = std::move(h);
    return sid;
}

SubscriptionId ReadingRouter::subscribeSamples(SampleHandler h) {
    std::lock_guard<std::mutex> lock(mu_);
    const SubscriptionId sid = nextId_++;
    sampleHandlers_[sid] = std::move(h);
    return sid;
}

void ReadingRouter::unsubscribe(SubscriptionId sid) {
    std::lock_guard<std::mutex> lock(mu_);
    batchHandlers_.erase(sid);
    latestHandlers_.erase(sid);
    sampleHandlers_.erase(sid);
}

std::optional<SensorReading> ReadingRouter::latest(SensorType t) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = latest_.find(t);
    if (it == latest_.end()) return std::nullopt;
    return it->second;
}

std::map<SensorType, SensorReading> ReadingRouter::latestAll() const {
    std::lock_guard<std::mutex> lock(mu_);
    return latest_;
}

std::vector<SensorReading> ReadingRouter::history() const {
    std::lock_guard<std::mutex> lock(mu_);
    return std::vector<SensorReading>(history_.begin(), history_.end());
}

size_t ReadingRouter::historySize() const {
    std::lock_guard<std::mutex> lock(mu_);
    return history_.size();
}

std::vector<SensorSample> ReadingRouter::sampleHistory(const PeripheralId& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = devices_.find(id);
    if (it == devices_.end()) return {};
    return std::vector<SensorSample>(it->second.samples.begin(), it->second.samples.end());
}

std::optional<SensorSample> ReadingRouter::latestSample(const PeripheralId& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = devices_.find(id);
    if (it == devices_.end() || it->second.samples.empty()) return std::nullopt;
    return it->second.samples.back();
}

void ReadingRouter::forget(const PeripheralId& id) {
    std::lock_guard<std::mutex> lock(mu_);
    devices_.erase(id);
}

void ReadingRouter::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    history_.clear();
    latest_.clear();
    devices_.clear();
}

} // namespace pulselink
