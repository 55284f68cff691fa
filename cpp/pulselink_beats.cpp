#include "pulselink_beats.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include "pulselink_log.h"
#include "pulselink_stats.h"

namespace pulselink {

static double clampHighCutoff(double highHz, double fs) {
    if (!(fs > 0.0)) throw std::invalid_argument("Sample rate must be positive");
    const double limit = 0.45 * fs;
    if (highHz >= 0.5 * fs) {
        PL_LOG_WARN("beat band high cutoff %.2f Hz above Nyquist for fs=%.1f, clamped to %.2f Hz", highHz, fs, limit);
        return limit;
    }
    return highHz;
}

BeatDetector::BeatDetector(double fs, const Options& opt)
    : fs_(fs),
      opt_(opt),
      highHz_(clampHighCutoff(opt.beatHighHz, fs)),
      band_(ButterworthFilter::bandPass(opt.beatLowHz, highHz_, fs)) {}

std::vector<size_t> BeatDetector::findPeaks(const std::vector<double>& x, size_t minDistance, double minProminence) const {
    std::vector<size_t> peaks;
    const size_t n = x.size();
    if (n < 5) return peaks;
    const bool checkProminence = minProminence > 0.0;
    for (size_t i = 2; i + 2 < n; ++i) {
        const double v = x[i];
        if (!(v > x[i - 1] && v > x[i + 1])) continue;
        if (!(v > x[i - 2] && v > x[i + 2])) continue;
        if (checkProminence) {
            const size_t lo = i > minDistance ? i - minDistance : 0;
            const size_t hi = std::min(n, i + minDistance + 1);
            const double leftMin = *std::min_element(x.begin() + lo, x.begin() + i);
            const double rightMin = *std::min_element(x.begin() + i + 1, x.begin() + hi);
            if (v - std::max(leftMin, rightMin) < minProminence) continue;
        }
        if (!peaks.empty() && i - peaks.back() < minDistance) continue;
        peaks.push_back(i);
    }
    return peaks;
}

std::vector<BeatFeature> BeatDetector::detectBeats(const std::vector<double>& signal,
                                                   const std::vector<double>& timestamps,
                                                   const std::vector<double>& irDc,
                                                   double startTime) const {
    std::vector<BeatFeature> beats;
    const size_t n = signal.size();
    if (n < 5) return beats;

    // Detrend then zero-phase band-pass
    const double m = mean(signal);
    std::vector<double> detrended(n);
    for (size_t i = 0; i < n; ++i) detrended[i] = signal[i] - m;
    const std::vector<double> filtered = band_.filtfilt(detrended);

    const size_t minDistance = static_cast<size_t>(std::max(1.0, opt_.minPeakDistanceSec * fs_));
    const double threshold = std::max(sampleStdDev(filtered) * opt_.prominenceFactor, opt_.prominenceFloor);
    const std::vector<size_t> peaks = findPeaks(filtered, minDistance, threshold);
    if (peaks.size() < 2) return beats;

    const size_t edge = static_cast<size_t>(opt_.landmarkWindowSec * fs_);
    auto timeAt = [&](size_t idx) {
        return timestamps.size() == n ? timestamps[idx] : startTime + static_cast<double>(idx) / fs_;
    };

    for (size_t k = 0; k < peaks.size(); ++k) {
        const size_t peak = peaks[k];

        const size_t searchStart = k == 0 ? (peak > edge ? peak - edge : 0) : peaks[k - 1];
        if (searchStart >= peak) continue;
        const size_t onset = static_cast<size_t>(std::min_element(filtered.begin() + searchStart, filtered.begin() + peak) - filtered.begin());

        const size_t searchEnd = k + 1 == peaks.size() ? std::min(n - 1, peak + edge) : peaks[k + 1];
        if (peak >= searchEnd) continue;
        const size_t offset = static_cast<size_t>(std::min_element(filtered.begin() + peak, filtered.begin() + searchEnd + 1) - filtered.begin());

        if (!(onset < peak && peak < offset) || offset >= n) continue;

        BeatFeature b;
        b.onsetIndex = onset;
        b.peakIndex = peak;
        b.offsetIndex = offset;
        b.onsetTime = timeAt(onset);
        b.peakTime = timeAt(peak);
        b.offsetTime = timeAt(offset);
        b.riseTime = static_cast<double>(peak - onset) / fs_;
        b.fallTime = static_cast<double>(offset - peak) / fs_;
        b.peakAmplitude = signal[peak];
        b.onsetAmplitude = signal[onset];
        if (irDc.size() > peak) b.irDcMean = irDc[peak];
        beats.push_back(b);
    }
    return beats;
}

std::optional<HeartRateResult> estimateHeartRate(const std::vector<BeatFeature>& beats,
                                                 const std::vector<double>& signal,
                                                 const Options& opt) {
    std::vector<double> rr;
    for (size_t k = 1; k < beats.size(); ++k) {
        const double interval = beats[k].peakTime - beats[k - 1].peakTime;
        if (interval >= opt.rrMinSec && interval <= opt.rrMaxSec) rr.push_back(interval);
    }
    if (rr.empty()) return std::nullopt;

    std::vector<double> sorted(rr);
    std::sort(sorted.begin(), sorted.end());
    const double median = sorted[sorted.size() / 2];
    const double bpm = 60.0 / median;
    if (bpm < opt.hrMinBpm || bpm > opt.hrMaxBpm) return std::nullopt;

    double acdc = 0.0;
    if (!signal.empty()) {
        const double m = mean(signal);
        const double sd = std::sqrt(varianceOf(signal.begin(), signal.end()));
        acdc = std::clamp(sd / std::max(1.0, std::fabs(m)), 0.0, 1.0);
    }
    const double countFactor = std::clamp(static_cast<double>(rr.size()) / 10.0, 0.0, 1.0);

    HeartRateResult r;
    r.bpm = bpm;
    r.quality = std::clamp(0.6 * acdc + 0.4 * countFactor, 0.0, 1.0);
    r.intervals = rr.size();
    return r;
}

} // namespace pulselink
