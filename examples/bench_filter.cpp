// Minimal benchmark: beat detection + IR DC analysis on a 60 s record
#include <chrono>
#include <cmath>
#include <iostream>
#include <vector>
#include "../cpp/pulselink_beats.h"
#include "../cpp/pulselink_hrv.h"
#include "../cpp/pulselink_irdc.h"

static std::vector<double> make(double fs, double seconds, double bpm, double dc) {
    const size_t n = static_cast<size_t>(fs * seconds);
    std::vector<double> x; x.reserve(n);
    const double f = bpm / 60.0;
    for (size_t i = 0; i < n; ++i) {
        double t = i / fs; x.push_back(0.8 * std::sin(2 * M_PI * f * t) + dc);
    }
    return x;
}

int main() {
    const double fs = 50.0;
    auto green = make(fs, 60.0, 72.0, 2000.0);
    auto ir = make(fs, 60.0, 72.0, 50000.0);
    pulselink::BeatDetector det(fs);
    pulselink::IRDCAnalyzer dc(fs);

    auto t0 = std::chrono::steady_clock::now();
    size_t beats = 0;
    pulselink::HRVResult hrv;
    for (int i = 0; i < 20; ++i) {
        auto mean = dc.rollingMean(dc.extractDC(ir));
        auto b = det.detectBeats(green, {}, mean);
        pulselink::HRVAnalyzer h;
        h.addBeats(b);
        hrv = h.analyzeWindow(60.0, 60.0);
        beats = b.size();
    }
    auto t1 = std::chrono::steady_clock::now();
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    std::cout << "bench_filter: 20 runs in " << ms << " ms, beats=" << beats
              << " sdnn=" << hrv.sdnnMs << " ms\n";
    return 0;
}
