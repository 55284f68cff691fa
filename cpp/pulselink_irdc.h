#pragma once

#include <cstddef>
#include <deque>
#include <vector>
#include "pulselink_core.h"
#include "pulselink_filter.h"

namespace pulselink {

// IR DC baseline tracking for occlusion detection.
// Positive shift = baseline dropped relative to the early reference window.
class IRDCAnalyzer {
public:
    explicit IRDCAnalyzer(double fs, const Options& opt = {});

    // Batch
    std::vector<double> extractDC(const std::vector<double>& ir) const;
    // Centered rolling mean; windowSeconds <= 0 uses the configured window
    std::vector<double> rollingMean(const std::vector<double>& dc, double windowSeconds = 0.0) const;
    // mean(reference window) - mean(all); 0 for fewer than 10 samples
    double calculateShift(const std::vector<double>& dc) const;
    // Result for the most recent sample of ir (zeros for empty input). The
    // rolling mean and shift cover the trailing window ending at that sample,
    // the same window the streaming path reports.
    IRDCResult analyze(const std::vector<double>& ir) const;

    // Streaming
    double process(double irValue);
    double currentRollingMean() const;
    double currentShift() const;
    IRDCResult currentResult() const;
    size_t bufferedSamples() const { return buffer_.size(); }
    void reset();

    bool isOcclusion(double shift) const { return shift > opt_.occlusionShiftThreshold; }
    double sampleRate() const { return fs_; }

private:
    std::vector<double> recentWindow() const;

    double fs_ {0.0};
    Options opt_ {};
    size_t windowSamples_ {0};
    size_t refSamples_ {0};
    size_t maxBuffer_ {0};
    ButterworthFilter lowpass_;
    std::deque<double> buffer_;
    double lastDc_ {0.0};
};

} // namespace pulselink
