#include "pulselink_filter.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace pulselink {

static inline void checkCutoff(double fc, double fs) {
    if (!(fs > 0.0) || !std::isfinite(fs)) throw std::invalid_argument("Sample rate must be positive");
    if (!(fc > 0.0) || !(fc < fs * 0.5))
        throw std::invalid_argument("Cutoff " + std::to_string(fc) + " Hz outside (0, fs/2) for fs=" + std::to_string(fs));
}

// Bilinear transform with prewarping; Q per section of an order-4 prototype
void ButterworthFilter::appendSections(double cutoffHz, bool highPass) {
    const double K = std::tan(M_PI * cutoffHz / fs_);
    const double K2 = K * K;
    for (int k = 0; k < 2; ++k) {
        const double Q = 1.0 / (2.0 * std::cos(M_PI * (2 * k + 1) / 8.0));
        const double norm = 1.0 / (1.0 + K / Q + K2);
        Biquad s;
        if (highPass) {
            s.b0 = norm;
            s.b1 = -2.0 * norm;
            s.b2 = norm;
        } else {
            s.b0 = K2 * norm;
            s.b1 = 2.0 * s.b0;
            s.b2 = s.b0;
        }
        s.a1 = 2.0 * (K2 - 1.0) * norm;
        s.a2 = (1.0 - K / Q + K2) * norm;
        sections_.push_back(s);
    }
}

ButterworthFilter ButterworthFilter::lowPass(double cutoffHz, double fs) {
    checkCutoff(cutoffHz, fs);
    ButterworthFilter f(fs);
    f.appendSections(cutoffHz, false);
    f.stream_ = f.sections_;
    return f;
}

ButterworthFilter ButterworthFilter::highPass(double cutoffHz, double fs) {
    checkCutoff(cutoffHz, fs);
    ButterworthFilter f(fs);
    f.appendSections(cutoffHz, true);
    f.stream_ = f.sections_;
    return f;
}

ButterworthFilter ButterworthFilter::bandPass(double lowHz, double highHz, double fs) {
    checkCutoff(lowHz, fs);
    checkCutoff(highHz, fs);
    if (!(lowHz < highHz)) throw std::invalid_argument("Band-pass requires lowHz < highHz");
    ButterworthFilter f(fs);
    f.appendSections(lowHz, true);
    f.appendSections(highHz, false);
    f.stream_ = f.sections_;
    return f;
}

void ButterworthFilter::primeCascade(std::vector<Biquad>& s, double u) {
    for (auto& q : s) {
        q.prime(u);
        u *= q.dcGain();
    }
}

std::vector<double> ButterworthFilter::filter(const std::vector<double>& x) const {
    std::vector<double> y;
    if (x.empty()) return y;
    y.reserve(x.size());
    std::vector<Biquad> s = sections_;
    primeCascade(s, x.front());
    for (double v : x) {
        double out = v;
        for (auto& q : s) out = q.process(out);
        y.push_back(out);
    }
    return y;
}

std::vector<double> ButterworthFilter::filtfilt(const std::vector<double>& x) const {
    if (x.size() < 4) return x;
    std::vector<double> y = filter(x);
    std::reverse(y.begin(), y.end());
    y = filter(y);
    std::reverse(y.begin(), y.end());
    return y;
}

double ButterworthFilter::processSample(double x) {
    if (!primed_) {
        primeCascade(stream_, x);
        primed_ = true;
    }
    double out = x;
    for (auto& q : stream_) out = q.process(out);
    return out;
}

void ButterworthFilter::reset() {
    for (auto& q : stream_) q.clear();
    primed_ = false;
}

} // namespace pulselink
