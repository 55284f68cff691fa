#pragma once

#include <cstddef>
#include <vector>

namespace pulselink {

// Second-order section, transposed direct form II
struct Biquad {
    double b0{0}, b1{0}, b2{0}, a1{0}, a2{0};
    double z1{0}, z2{0};

    inline double process(double in) {
        double out = in * b0 + z1;
        z1 = in * b1 + z2 - a1 * out;
        z2 = in * b2 - a2 * out;
        return out;
    }
    double dcGain() const {
        const double den = 1.0 + a1 + a2;
        return den != 0.0 ? (b0 + b1 + b2) / den : 0.0;
    }
    // Sets state as if input u had been applied forever
    void prime(double u) {
        const double y = dcGain() * u;
        z1 = y - b0 * u;
        z2 = b2 * u - a2 * y;
    }
    void clear() { z1 = 0.0; z2 = 0.0; }
};

// 4th-order Butterworth (two cascaded sections per edge).
// Batch calls are const and do not disturb the streaming state.
class ButterworthFilter {
public:
    // Throws std::invalid_argument if fs <= 0 or a cutoff is outside (0, fs/2)
    static ButterworthFilter lowPass(double cutoffHz, double fs);
    static ButterworthFilter highPass(double cutoffHz, double fs);
    static ButterworthFilter bandPass(double lowHz, double highHz, double fs);

    // Single forward pass (causal)
    std::vector<double> filter(const std::vector<double>& x) const;
    // Zero-phase forward-backward; inputs shorter than 4 samples are returned as is
    std::vector<double> filtfilt(const std::vector<double>& x) const;

    // Streaming path; the first sample primes the sections in steady state
    double processSample(double x);
    void reset();

    double sampleRate() const { return fs_; }
    const std::vector<Biquad>& sections() const { return sections_; }

private:
    explicit ButterworthFilter(double fs) : fs_(fs) {}
    void appendSections(double cutoffHz, bool highPass);
    static void primeCascade(std::vector<Biquad>& s, double u);

    double fs_ {0.0};
    std::vector<Biquad> sections_;  // coefficients, state unused
    std::vector<Biquad> stream_;    // streaming copy
    bool primed_ {false};
};

} // namespace pulselink
