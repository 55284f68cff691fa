#pragma once

#include <cmath>
#include <deque>
#include <vector>
#include "pulselink_core.h"

namespace pulselink {

// Jaw activity from IR level and accelerometer magnitude, one sample at a time.
// Relaxed samples pull the baseline toward the current IR value; a large
// deviation from it reads as clenching, or as grinding when the recent IR
// history is also noisy. Any magnitude above motionThresholdG is motion.
class ActivityClassifier {
public:
    explicit ActivityClassifier(const Options& opt = {});

    ActivityType classify(double ir, double accMagnitude);
    double baseline() const { return baseline_; }
    void reset();

private:
    Options opt_ {};
    std::deque<double> history_;
    double baseline_ {0.0};
    bool hasBaseline_ {false};
};

// Adaptive (LMS) noise canceller with the accelerometer as reference.
// While the reference itself varies more than lmsVarianceThreshold the output
// is scaled by lmsGatedGain instead.
class MotionCompensator {
public:
    explicit MotionCompensator(const Options& opt = {});

    double filter(double signal, double noiseReference);
    const std::vector<double>& weights() const { return weights_; }
    void reset();

private:
    Options opt_ {};
    std::vector<double> weights_;
    std::deque<double> reference_;   // newest first
};

// Dynamic part of the acceleration: | |a| - 1 g |
inline double motionLevel(const AccelerometerData& a) {
    return std::fabs(a.magnitude() - 1.0);
}

} // namespace pulselink
