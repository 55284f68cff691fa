#include "pulselink_pipeline.h"

#include <algorithm>
#include "pulselink_log.h"

namespace pulselink {

BiomarkerPipeline::BiomarkerPipeline(ReadingRouter& router, double fs, const Options& opt)
    : router_(router),
      fs_(fs),
      opt_(opt),
      capacity_(static_cast<size_t>(std::max(1.0, opt.analysisWindowSec * fs))),
      detector_(fs, opt),
      irdc_(fs, opt),
      classifier_(opt),
      compensator_(opt),
      hrv_(opt) {
    subscription_ = router_.subscribe([this](const PeripheralId& id, DeviceType type, const std::vector<SensorReading>& batch) {
        onBatch(id, type, batch);
    });
}

BiomarkerPipeline::~BiomarkerPipeline() {
    router_.unsubscribe(subscription_);
}

void BiomarkerPipeline::clearStreams() {
    ppg_.clear();
    times_.clear();
    dcMean_.clear();
    moving_.clear();
    irdc_.reset();
    classifier_.reset();
    compensator_.reset();
    accel_ = AccelerometerData{};
    hasAccel_ = false;
    activity_ = ActivityType::Relaxed;
}

void BiomarkerPipeline::setSource(const PeripheralId& id) {
    std::lock_guard<std::mutex> lock(mu_);
    if (source_ == id) return;
    source_ = id;
    clearStreams();
}

void BiomarkerPipeline::onBatch(const PeripheralId& id, DeviceType type, const std::vector<SensorReading>& batch) {
    if (type != DeviceType::Optical) return;
    std::lock_guard<std::mutex> lock(mu_);
    if (!source_.empty() && id != source_) return;

    const bool hasGreen = std::any_of(batch.begin(), batch.end(), [](const SensorReading& r) {
        return r.type == SensorType::PpgGreen;
    });
    for (const auto& r : batch) {
        if (!r.isValid()) continue;
        switch (r.type) {
            case SensorType::AccelerometerX: accel_.x = r.value; hasAccel_ = true; continue;
            case SensorType::AccelerometerY: accel_.y = r.value; hasAccel_ = true; continue;
            case SensorType::AccelerometerZ: accel_.z = r.value; hasAccel_ = true; continue;
            default: break;
        }
        if (r.type == SensorType::PpgInfrared) {
            irdc_.process(r.value);
            // without an accelerometer the device is taken to be at rest
            activity_ = classifier_.classify(r.value, hasAccel_ ? accel_.magnitude() : 1.0);
        }
        const bool wanted = hasGreen ? r.type == SensorType::PpgGreen : r.type == SensorType::PpgInfrared;
        if (!wanted) continue;
        const double reference = hasAccel_ ? motionLevel(accel_) : 0.0;
        ppg_.push_back(compensator_.filter(r.value, reference));
        times_.push_back(r.timestamp);
        dcMean_.push_back(irdc_.currentRollingMean());
        moving_.push_back(activity_ == ActivityType::Motion);
        while (ppg_.size() > capacity_) {
            ppg_.pop_front();
            times_.pop_front();
            dcMean_.pop_front();
            moving_.pop_front();
        }
    }
}

BiomarkerReport BiomarkerPipeline::analyze() {
    std::vector<double> ppg, times, dc;
    BiomarkerReport report;
    {
        std::lock_guard<std::mutex> lock(mu_);
        ppg.assign(ppg_.begin(), ppg_.end());
        times.assign(times_.begin(), times_.end());
        dc.assign(dcMean_.begin(), dcMean_.end());
        report.irdc = irdc_.currentResult();
        report.activity = activity_;
        report.motionSamples = static_cast<size_t>(std::count(moving_.begin(), moving_.end(), true));
    }
    report.samples = ppg.size();
    if (ppg.empty()) return report;

    report.beats = detector_.detectBeats(ppg, times, dc);
    report.heartRate = estimateHeartRate(report.beats, ppg, opt_);

    std::lock_guard<std::mutex> lock(hrvMu_);
    for (const auto& b : report.beats) {
        // the same beat can land a few samples apart in consecutive snapshots
        if (lastPeakAdded_ && b.peakTime <= *lastPeakAdded_ + opt_.rrMinSec) continue;
        hrv_.addPeak(b.peakTime);
        lastPeakAdded_ = b.peakTime;
    }
    // window closes just after the newest sample
    report.hrv = hrv_.analyzeWindow(times.back() + 1.0 / fs_);
    PL_LOG_DEBUG("analysis: %zu samples, %zu beats, %zu rr, activity %s",
                 ppg.size(), report.beats.size(), report.hrv.rrCount, activityTypeName(report.activity));
    return report;
}

IRDCResult BiomarkerPipeline::latestIRDC() const {
    std::lock_guard<std::mutex> lock(mu_);
    return irdc_.currentResult();
}

size_t BiomarkerPipeline::bufferedSamples() const {
    std::lock_guard<std::mutex> lock(mu_);
    return ppg_.size();
}

ActivityType BiomarkerPipeline::currentActivity() const {
    std::lock_guard<std::mutex> lock(mu_);
    return activity_;
}

void BiomarkerPipeline::reset() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        clearStreams();
    }
    std::lock_guard<std::mutex> lock(hrvMu_);
    hrv_.reset();
    lastPeakAdded_.reset();
}

} // namespace pulselink
