#include "pulselink_hrv.h"

#include <algorithm>
#include <cmath>
#include "pulselink_stats.h"

namespace pulselink {

std::vector<double> singularValues(const std::vector<double>& a, size_t rows, size_t cols) {
    std::vector<double> sv;
    if (rows == 0 || cols == 0 || a.size() != rows * cols) return sv;

    // Column-wise working copy
    std::vector<std::vector<double>> u(cols, std::vector<double>(rows));
    for (size_t i = 0; i < rows; ++i)
        for (size_t j = 0; j < cols; ++j) u[j][i] = a[i * cols + j];

    const double eps = 1e-15;
    for (int sweep = 0; sweep < 60; ++sweep) {
        bool rotated = false;
        for (size_t p = 0; p + 1 < cols; ++p) {
            for (size_t q = p + 1; q < cols; ++q) {
                double alpha = 0.0, beta = 0.0, gamma = 0.0;
                for (size_t i = 0; i < rows; ++i) {
                    alpha += u[p][i] * u[p][i];
                    beta += u[q][i] * u[q][i];
                    gamma += u[p][i] * u[q][i];
                }
                if (alpha == 0.0 || beta == 0.0) continue;
                if (std::fabs(gamma) <= eps * std::sqrt(alpha * beta)) continue;
                rotated = true;
                const double zeta = (beta - alpha) / (2.0 * gamma);
                const double t = (zeta >= 0.0 ? 1.0 : -1.0) / (std::fabs(zeta) + std::sqrt(1.0 + zeta * zeta));
                const double c = 1.0 / std::sqrt(1.0 + t * t);
                const double s = c * t;
                for (size_t i = 0; i < rows; ++i) {
                    const double up = u[p][i];
                    const double uq = u[q][i];
                    u[p][i] = c * up - s * uq;
                    u[q][i] = s * up + c * uq;
                }
            }
        }
        if (!rotated) break;
    }

    sv.reserve(cols);
    for (size_t j = 0; j < cols; ++j) {
        double norm = 0.0;
        for (double v : u[j]) norm += v * v;
        sv.push_back(std::sqrt(norm));
    }
    std::sort(sv.begin(), sv.end(), [](double x, double y) { return x > y; });
    sv.resize(std::min(rows, cols));
    return sv;
}

HRVAnalyzer::HRVAnalyzer(const Options& opt) : opt_(opt) {}

void HRVAnalyzer::addPeak(double peakTime) {
    peaks_.insert(std::upper_bound(peaks_.begin(), peaks_.end(), peakTime), peakTime);
    const size_t cap = static_cast<size_t>(std::max(1, opt_.peakHistoryCapacity));
    if (peaks_.size() > cap) peaks_.erase(peaks_.begin(), peaks_.begin() + static_cast<std::ptrdiff_t>(peaks_.size() - cap));
}

void HRVAnalyzer::addBeats(const std::vector<BeatFeature>& beats) {
    for (const auto& b : beats) addPeak(b.peakTime);
}

std::vector<double> HRVAnalyzer::getRRIntervals(double start, double end) const {
    std::vector<double> rr;
    auto first = std::lower_bound(peaks_.begin(), peaks_.end(), start);
    auto last = std::lower_bound(first, peaks_.end(), end);
    if (last - first < 2) return rr;

    if (first != peaks_.begin()) --first;  // previous peak
    if (last != peaks_.end()) ++last;      // next peak

    for (auto it = first + 1; it != last; ++it) {
        const double interval = *it - *(it - 1);
        if (interval >= opt_.rrMinSec && interval <= opt_.rrMaxSec) rr.push_back(interval);
    }
    return rr;
}

double HRVAnalyzer::calculateSDNN(const std::vector<double>& rr) const {
    if (rr.size() < 2) return 0.0;
    return sampleStdDev(rr) * 1000.0;
}

double HRVAnalyzer::calculateRMSSD(const std::vector<double>& rr) const {
    if (rr.size() < 2) return 0.0;
    double acc = 0.0;
    for (size_t i = 1; i < rr.size(); ++i) {
        const double d = rr[i] - rr[i - 1];
        acc += d * d;
    }
    return std::sqrt(acc / static_cast<double>(rr.size() - 1)) * 1000.0;
}

std::optional<HRVSVDResult> HRVAnalyzer::calculateSVDBiomarker(const std::vector<double>& rr) const {
    const size_t dim = static_cast<size_t>(std::max(1, opt_.embeddingDimension));
    if (rr.size() < dim + 1) return std::nullopt;

    // Delay embedding: row i = rr[i .. i+dim)
    const size_t rows = rr.size() - dim;
    std::vector<double> m;
    m.reserve(rows * dim);
    for (size_t i = 0; i < rows; ++i)
        for (size_t j = 0; j < dim; ++j) m.push_back(rr[i + j]);

    const std::vector<double> sv = singularValues(m, rows, dim);
    if (sv.empty()) return std::nullopt;

    HRVSVDResult r;
    r.s1 = sv[0];
    if (sv.size() > 1) {
        r.s2 = sv[1];
        if (sv[1] > 1e-10) r.ratio = sv[0] / sv[1];
    }
    return r;
}

HRVResult HRVAnalyzer::analyzeWindow(double windowEnd, double windowSeconds) const {
    const double window = windowSeconds > 0.0 ? windowSeconds : opt_.hrvWindowSec;
    const std::vector<double> rr = getRRIntervals(windowEnd - window, windowEnd);
    HRVResult r;
    r.sdnnMs = calculateSDNN(rr);
    r.rmssdMs = calculateRMSSD(rr);
    r.svd = calculateSVDBiomarker(rr);
    r.rrCount = rr.size();
    r.windowSeconds = window;
    r.isValid = rr.size() >= static_cast<size_t>(std::max(0, opt_.minRRCount));
    return r;
}

} // namespace pulselink
