#pragma once

#include <optional>
#include <vector>
#include "pulselink_core.h"
#include "pulselink_filter.h"

namespace pulselink {

// Beat segmentation of a raw optical waveform (green channel preferred).
// Landmarks (onset/peak/offset) are located on the band-passed signal,
// amplitudes are read from the raw signal.
class BeatDetector {
public:
    // Throws std::invalid_argument if fs <= 0 or the band is unusable
    explicit BeatDetector(double fs, const Options& opt = {});

    // timestamps: optional per-sample times (s); otherwise startTime + i/fs.
    // irDc: optional per-sample IR DC rolling mean, copied at the peak index.
    // Fewer than two accepted peaks yields an empty result.
    std::vector<BeatFeature> detectBeats(const std::vector<double>& signal,
                                         const std::vector<double>& timestamps = {},
                                         const std::vector<double>& irDc = {},
                                         double startTime = 0.0) const;

    // Exposed for tests and tuning tools
    std::vector<size_t> findPeaks(const std::vector<double>& filtered, size_t minDistance, double minProminence) const;

    double sampleRate() const { return fs_; }
    double highCutoffHz() const { return highHz_; }

private:
    double fs_ {0.0};
    Options opt_ {};
    double highHz_ {0.0};
    ButterworthFilter band_;
};

// Heart rate from the median of consecutive peak intervals. Intervals outside
// [rrMinSec, rrMaxSec] are skipped; nullopt when none remain or the rate is
// outside [hrMinBpm, hrMaxBpm]. Quality mixes the signal's AC/DC ratio with
// the number of intervals (10 or more counts fully).
std::optional<HeartRateResult> estimateHeartRate(const std::vector<BeatFeature>& beats,
                                                 const std::vector<double>& signal = {},
                                                 const Options& opt = {});

} // namespace pulselink
