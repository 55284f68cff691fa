#pragma once

#include <cstddef>
#include <optional>
#include <vector>
#include "pulselink_core.h"

namespace pulselink {

// Singular values (descending, min(rows, cols) of them) of a row-major
// rows x cols matrix, via one-sided Jacobi rotations.
std::vector<double> singularValues(const std::vector<double>& rowMajor, size_t rows, size_t cols);

// Beat-timing HRV: interval statistics plus the delay-embedding SVD shape
// biomarker. Peak history is sorted and capped; oldest peaks are dropped.
class HRVAnalyzer {
public:
    explicit HRVAnalyzer(const Options& opt = {});

    void addPeak(double peakTime);
    void addBeats(const std::vector<BeatFeature>& beats);
    void reset() { peaks_.clear(); }
    const std::vector<double>& peakTimes() const { return peaks_; }

    // Intervals among peaks in [start, end), plus the one peak before and
    // after the window when present. Requires two peaks inside the window.
    // Intervals outside [rrMinSec, rrMaxSec] are discarded.
    std::vector<double> getRRIntervals(double start, double end) const;

    // Milliseconds; 0 for fewer than two intervals
    double calculateSDNN(const std::vector<double>& rr) const;
    double calculateRMSSD(const std::vector<double>& rr) const;

    // nullopt for fewer than embeddingDimension + 1 intervals
    std::optional<HRVSVDResult> calculateSVDBiomarker(const std::vector<double>& rr) const;

    // Window [windowEnd - windowSeconds, windowEnd); windowSeconds <= 0 uses the configured one
    HRVResult analyzeWindow(double windowEnd, double windowSeconds = 0.0) const;

private:
    Options opt_ {};
    std::vector<double> peaks_;
};

} // namespace pulselink
