// Butterworth sections: passband/stopband behavior, priming and argument checks
#include <algorithm>
#include <stdexcept>
#include "../cpp/pulselink_filter.h"
#include "test_util.h"

using pulselink::ButterworthFilter;

static double peakAbs(const std::vector<double>& x, size_t from, size_t to) {
    double m = 0.0;
    for (size_t i = from; i < to && i < x.size(); ++i) m = std::max(m, std::fabs(x[i]));
    return m;
}

int main() {
    const double fs = 50.0;

    // Low-pass keeps a constant level exactly (steady-state priming)
    {
        auto lp = ButterworthFilter::lowPass(0.8, fs);
        std::vector<double> flat(500, 48000.0);
        auto y = lp.filtfilt(flat);
        CHECK(y.size() == flat.size());
        CHECK_NEAR(y.front(), 48000.0, 1e-6);
        CHECK_NEAR(y[250], 48000.0, 1e-6);
        CHECK_NEAR(y.back(), 48000.0, 1e-6);
    }

    // Band-pass removes DC and passes a 72 bpm fundamental
    {
        auto bp = ButterworthFilter::bandPass(0.5, 8.0, fs);
        CHECK(bp.sections().size() == 4);
        std::vector<double> flat(400, 512.0);
        CHECK(peakAbs(bp.filtfilt(flat), 0, 400) < 1e-6);

        auto sine = make_sine(fs, 20.0, 1.2);
        auto y = bp.filtfilt(sine);
        const double amp = peakAbs(y, 250, 750);
        CHECK(amp > 0.9 && amp < 1.05);
    }

    // Stopband: 20 Hz through a 2 Hz low-pass at 100 Hz
    {
        auto lp = ButterworthFilter::lowPass(2.0, 100.0);
        auto y = lp.filtfilt(make_sine(100.0, 10.0, 20.0));
        CHECK(peakAbs(y, 200, 800) < 0.01);
    }

    // Streaming path matches the causal batch pass sample for sample
    {
        auto bp = ButterworthFilter::bandPass(0.5, 8.0, fs);
        auto x = make_ppg(fs, 10.0, 72.0);
        auto batch = bp.filter(x);
        double maxDiff = 0.0;
        for (size_t i = 0; i < x.size(); ++i) maxDiff = std::max(maxDiff, std::fabs(bp.processSample(x[i]) - batch[i]));
        CHECK(maxDiff < 1e-9);

        // reset re-primes on the next sample
        bp.reset();
        CHECK_NEAR(bp.processSample(x[0]), batch[0], 1e-9);
    }

    // Short inputs pass through filtfilt untouched
    {
        auto lp = ButterworthFilter::lowPass(5.0, fs);
        std::vector<double> tiny {1.0, 5.0, 2.0};
        CHECK(lp.filtfilt(tiny) == tiny);
        CHECK(lp.filter({}).empty());
    }

    // Invalid arguments
    {
        bool threw = false;
        try { ButterworthFilter::lowPass(30.0, fs); } catch (const std::invalid_argument&) { threw = true; }
        CHECK(threw);
        threw = false;
        try { ButterworthFilter::bandPass(5.0, 1.0, fs); } catch (const std::invalid_argument&) { threw = true; }
        CHECK(threw);
        threw = false;
        try { ButterworthFilter::highPass(1.0, 0.0); } catch (const std::invalid_argument&) { threw = true; }
        CHECK(threw);
    }

    return finish("filter_test");
}
