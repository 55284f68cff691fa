#include "pulselink_motion.h"

#include <algorithm>
#include <cmath>
#include "pulselink_stats.h"

namespace pulselink {

ActivityClassifier::ActivityClassifier(const Options& opt) : opt_(opt) {}

ActivityType ActivityClassifier::classify(double ir, double accMagnitude) {
    if (!hasBaseline_) {
        baseline_ = ir;
        hasBaseline_ = true;
    }
    const size_t cap = static_cast<size_t>(std::max(2, opt_.activityHistorySize));
    history_.push_back(ir);
    while (history_.size() > cap) history_.pop_front();

    if (accMagnitude > opt_.motionThresholdG) return ActivityType::Motion;

    if (std::fabs(ir - baseline_) > opt_.clenchDeviationThreshold) {
        const double var = varianceOf(history_.begin(), history_.end());
        return var > opt_.grindingVarianceThreshold ? ActivityType::Grinding : ActivityType::Clenching;
    }
    baseline_ += opt_.baselineAdaptRate * (ir - baseline_);
    return ActivityType::Relaxed;
}

void ActivityClassifier::reset() {
    history_.clear();
    baseline_ = 0.0;
    hasBaseline_ = false;
}

MotionCompensator::MotionCompensator(const Options& opt)
    : opt_(opt),
      weights_(static_cast<size_t>(std::max(1, opt.lmsTaps)), 0.0),
      reference_(weights_.size(), 0.0) {}

double MotionCompensator::filter(double signal, double noiseReference) {
    reference_.pop_back();
    reference_.push_front(noiseReference);

    if (varianceOf(reference_.begin(), reference_.end()) > opt_.lmsVarianceThreshold)
        return signal * opt_.lmsGatedGain;

    double estimate = 0.0;
    for (size_t i = 0; i < weights_.size(); ++i) estimate += weights_[i] * reference_[i];
    const double error = signal - estimate;
    for (size_t i = 0; i < weights_.size(); ++i) weights_[i] += opt_.lmsLearningRate * error * reference_[i];
    return error;
}

void MotionCompensator::reset() {
    std::fill(weights_.begin(), weights_.end(), 0.0);
    std::fill(reference_.begin(), reference_.end(), 0.0);
}

} // namespace pulselink
