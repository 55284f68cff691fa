#include "pulselink_irdc.h"

#include <algorithm>
#include <stdexcept>
#include "pulselink_stats.h"

namespace pulselink {

static size_t samplesFor(double seconds, double fs) {
    return static_cast<size_t>(std::max(1.0, seconds * fs));
}

IRDCAnalyzer::IRDCAnalyzer(double fs, const Options& opt)
    : fs_(fs),
      opt_(opt),
      windowSamples_(samplesFor(opt.dcWindowSec, fs)),
      refSamples_(samplesFor(opt.dcReferenceSec, fs)),
      maxBuffer_(samplesFor(opt.dcBufferSec, fs)),
      lowpass_(ButterworthFilter::lowPass(opt.dcCutoffHz, fs)) {}

std::vector<double> IRDCAnalyzer::extractDC(const std::vector<double>& ir) const {
    return lowpass_.filtfilt(ir);
}

std::vector<double> IRDCAnalyzer::rollingMean(const std::vector<double>& dc, double windowSeconds) const {
    const size_t window = windowSeconds > 0.0 ? samplesFor(windowSeconds, fs_) : windowSamples_;
    const size_t half = window / 2;
    const size_t n = dc.size();
    std::vector<double> out(n, 0.0);
    if (n == 0) return out;

    // prefix sums keep this O(n)
    std::vector<double> prefix(n + 1, 0.0);
    for (size_t i = 0; i < n; ++i) prefix[i + 1] = prefix[i] + dc[i];
    for (size_t i = 0; i < n; ++i) {
        const size_t start = i > half ? i - half : 0;
        const size_t end = std::min(n, i + half + 1);
        out[i] = (prefix[end] - prefix[start]) / static_cast<double>(end - start);
    }
    return out;
}

double IRDCAnalyzer::calculateShift(const std::vector<double>& dc) const {
    if (dc.size() < 10) return 0.0;
    const size_t ref = std::min(refSamples_, dc.size());
    const double baseline = meanOf(dc.begin(), dc.begin() + static_cast<std::ptrdiff_t>(ref));
    return baseline - mean(dc);
}

IRDCResult IRDCAnalyzer::analyze(const std::vector<double>& ir) const {
    IRDCResult r;
    if (ir.empty()) return r;
    const std::vector<double> dc = extractDC(ir);
    const size_t start = dc.size() > windowSamples_ ? dc.size() - windowSamples_ : 0;
    const std::vector<double> recent(dc.begin() + static_cast<std::ptrdiff_t>(start), dc.end());
    r.dcValue = dc.back();
    r.rollingMean5s = mean(recent);
    r.shift5s = calculateShift(recent);
    return r;
}

double IRDCAnalyzer::process(double irValue) {
    const double dc = lowpass_.processSample(irValue);
    buffer_.push_back(dc);
    while (buffer_.size() > maxBuffer_) buffer_.pop_front();
    lastDc_ = dc;
    return dc;
}

std::vector<double> IRDCAnalyzer::recentWindow() const {
    const size_t start = buffer_.size() > windowSamples_ ? buffer_.size() - windowSamples_ : 0;
    return std::vector<double>(buffer_.begin() + static_cast<std::ptrdiff_t>(start), buffer_.end());
}

double IRDCAnalyzer::currentRollingMean() const {
    if (buffer_.empty()) return 0.0;
    return mean(recentWindow());
}

double IRDCAnalyzer::currentShift() const {
    return calculateShift(recentWindow());
}

IRDCResult IRDCAnalyzer::currentResult() const {
    IRDCResult r;
    r.dcValue = lastDc_;
    r.rollingMean5s = currentRollingMean();
    r.shift5s = currentShift();
    return r;
}

void IRDCAnalyzer::reset() {
    buffer_.clear();
    lowpass_.reset();
    lastDc_ = 0.0;
}

} // namespace pulselink
