#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <vector>
#include "pulselink_beats.h"
#include "pulselink_core.h"
#include "pulselink_hrv.h"
#include "pulselink_irdc.h"
#include "pulselink_motion.h"
#include "pulselink_readings.h"

namespace pulselink {

struct BiomarkerReport {
    std::vector<BeatFeature> beats;
    HRVResult hrv;
    IRDCResult irdc;
    std::optional<HeartRateResult> heartRate;
    ActivityType activity {ActivityType::Relaxed};  // latest IR sample
    size_t motionSamples {0};                         // window samples classified as motion
    size_t samples {0};

    std::optional<double> heartRateBpm() const {
        if (!heartRate) return std::nullopt;
        return heartRate->bpm;
    }
};

// Consumes optical reading batches from the router: IR feeds the streaming
// DC analyzer and the activity classifier inline, accelerometer readings set
// the motion reference, and green (IR when green is absent) is buffered
// after motion compensation for windowed beat/HR/HRV analysis. analyze()
// works on a snapshot and may run on another thread than the one delivering
// batches.
class BiomarkerPipeline {
public:
    BiomarkerPipeline(ReadingRouter& router, double fs, const Options& opt = {});
    ~BiomarkerPipeline();

    BiomarkerPipeline(const BiomarkerPipeline&) = delete;
    BiomarkerPipeline& operator=(const BiomarkerPipeline&) = delete;

    // Restrict to one peripheral; empty id accepts any optical device
    void setSource(const PeripheralId& id);

    BiomarkerReport analyze();
    IRDCResult latestIRDC() const;
    size_t bufferedSamples() const;
    ActivityType currentActivity() const;
    void reset();

private:
    void onBatch(const PeripheralId& id, DeviceType type, const std::vector<SensorReading>& batch);
    void clearStreams();

    ReadingRouter& router_;
    SubscriptionId subscription_ {0};
    double fs_ {0.0};
    Options opt_ {};
    size_t capacity_ {0};
    BeatDetector detector_;

    mutable std::mutex mu_;
    PeripheralId source_;
    IRDCAnalyzer irdc_;
    ActivityClassifier classifier_;
    MotionCompensator compensator_;
    AccelerometerData accel_;
    bool hasAccel_ {false};
    ActivityType activity_ {ActivityType::Relaxed};
    std::deque<double> ppg_;
    std::deque<double> times_;
    std::deque<double> dcMean_;
    std::deque<bool> moving_;

    std::mutex hrvMu_;
    HRVAnalyzer hrv_;
    std::optional<double> lastPeakAdded_;
};

} // namespace pulselink
