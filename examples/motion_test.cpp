// Activity classification, LMS motion compensation and heart rate estimation
#include <algorithm>
#include "../cpp/pulselink_beats.h"
#include "../cpp/pulselink_motion.h"
#include "test_util.h"

using namespace pulselink;

static std::vector<BeatFeature> beats_every(double interval, size_t count, double start = 1.0) {
    std::vector<BeatFeature> out;
    for (size_t i = 0; i < count; ++i) {
        BeatFeature b;
        b.peakTime = start + i * interval;
        out.push_back(b);
    }
    return out;
}

int main() {
    // Classifier: relaxed, clenching, grinding, motion
    {
        ActivityClassifier c;
        for (int i = 0; i < 100; ++i) CHECK(c.classify(50000.0, 1.0) == ActivityType::Relaxed);
        CHECK_NEAR(c.baseline(), 50000.0, 1e-6);

        // slow drift is followed by the baseline
        for (int i = 0; i < 200; ++i) CHECK(c.classify(50000.0 + i * 10.0, 1.0) == ActivityType::Relaxed);
        CHECK(c.baseline() > 51500.0);
        const double drifted = c.baseline();

        // a step reads as grinding while the history still holds both levels,
        // then as clenching once the new level is steady
        CHECK(c.classify(drifted + 10000.0, 1.0) == ActivityType::Grinding);
        ActivityType last = ActivityType::Relaxed;
        for (int i = 0; i < 40; ++i) last = c.classify(drifted + 10000.0, 1.0);
        CHECK(last == ActivityType::Clenching);
        CHECK_NEAR(c.baseline(), drifted, 1e-6);

        for (int i = 0; i < 40; ++i) {
            const double ir = drifted + 10000.0 + (i % 2 ? 2000.0 : -2000.0);
            last = c.classify(ir, 1.0);
        }
        CHECK(last == ActivityType::Grinding);

        // motion wins over the IR level
        CHECK(c.classify(drifted, 1.3) == ActivityType::Motion);
        CHECK(c.classify(drifted + 10000.0, 2.0) == ActivityType::Motion);
        CHECK(c.classify(drifted, 1.15) == ActivityType::Relaxed);

        c.reset();
        CHECK(c.classify(70000.0, 1.0) == ActivityType::Relaxed);
        CHECK_NEAR(c.baseline(), 70000.0, 1e-6);

        CHECK(std::string(activityTypeName(ActivityType::Clenching)) == "clenching");
        CHECK(std::string(activityTypeName(ActivityType::Motion)) == "motion");
    }

    // Compensator: silent reference passes the signal through
    {
        MotionCompensator m;
        CHECK(m.weights().size() == 32);
        for (int i = 0; i < 50; ++i) CHECK_NEAR(m.filter(100.0 + i, 0.0), 100.0 + i, 1e-12);
        for (double w : m.weights()) CHECK(w == 0.0);
    }

    // Compensator: a reference varying more than the threshold gates the output
    {
        MotionCompensator m;
        CHECK_NEAR(m.filter(1000.0, 20.0), 10.0, 1e-9);
        for (double w : m.weights()) CHECK(w == 0.0);
    }

    // Compensator: the component correlated with the reference is cancelled
    {
        const double fs = 50.0;
        MotionCompensator m;
        double worst = 0.0;
        for (int i = 0; i < 3000; ++i) {
            const double t = i / fs;
            const double ref = 0.5 * std::sin(2 * M_PI * 0.7 * t);
            const double pulse = 0.2 * std::sin(2 * M_PI * 1.9 * t);
            const double out = m.filter(3.0 * ref + pulse, ref);
            if (i >= 2500) worst = std::max(worst, std::fabs(out - pulse));
        }
        std::cout << "lms residual=" << worst << "\n";
        CHECK(worst < 0.1);

        m.reset();
        for (double w : m.weights()) CHECK(w == 0.0);
        CHECK_NEAR(m.filter(5.0, 0.0), 5.0, 1e-12);
    }

    {
        AccelerometerData rest {0.0, 0.0, 1.0};
        AccelerometerData shake {0.6, 0.0, 1.2};
        CHECK_NEAR(motionLevel(rest), 0.0, 1e-12);
        CHECK_NEAR(motionLevel(shake), std::sqrt(0.36 + 1.44) - 1.0, 1e-12);
    }

    // Heart rate: median interval, outliers skipped
    {
        auto beats = beats_every(60.0 / 72.0, 12);
        auto hr = estimateHeartRate(beats);
        CHECK(hr.has_value());
        if (hr) {
            CHECK_NEAR(hr->bpm, 72.0, 1e-6);
            CHECK(hr->intervals == 11);
            CHECK_NEAR(hr->quality, 0.4, 1e-9);   // no signal: interval count only
            CHECK(std::string(hr->qualityLevel()) == "Poor");
        }

        // a missed beat (double interval) and an extra one do not move the median
        std::vector<BeatFeature> noisy = beats_every(0.8, 10);
        BeatFeature extra;
        extra.peakTime = noisy[4].peakTime + 0.1;
        noisy.insert(noisy.begin() + 5, extra);
        noisy.erase(noisy.begin() + 8);
        auto hr2 = estimateHeartRate(noisy);
        CHECK(hr2.has_value());
        if (hr2) CHECK_NEAR(hr2->bpm, 75.0, 1e-6);

        // 1.5 s intervals: 40 bpm is allowed by the RR gate but not the HR range
        Options narrow;
        narrow.hrMinBpm = 50.0;
        CHECK(estimateHeartRate(beats_every(1.5, 6), {}, narrow) == std::nullopt);
        CHECK(estimateHeartRate(beats_every(1.5, 6)).has_value());

        CHECK(!estimateHeartRate({}).has_value());
        CHECK(!estimateHeartRate(beats_every(0.8, 1)).has_value());
        CHECK(!estimateHeartRate(beats_every(2.0, 5)).has_value());   // every interval above rrMaxSec
    }

    // Heart rate from detected beats, quality from the waveform's AC/DC ratio
    {
        const double fs = 50.0;
        BeatDetector det(fs);
        auto sig = make_ppg(fs, 30.0, 72.0, 1.0);
        auto hr = estimateHeartRate(det.detectBeats(sig), sig);
        CHECK(hr.has_value());
        if (hr) {
            CHECK_NEAR(hr->bpm, 72.0, 2.0);
            CHECK(hr->intervals >= 25);
            CHECK(hr->quality > 0.7);
        }
    }

    {
        HeartRateResult r;
        r.quality = 0.95; CHECK(std::string(r.qualityLevel()) == "Excellent");
        r.quality = 0.85; CHECK(std::string(r.qualityLevel()) == "Good");
        r.quality = 0.75; CHECK(std::string(r.qualityLevel()) == "Fair");
        r.quality = 0.65; CHECK(std::string(r.qualityLevel()) == "Acceptable");
        r.quality = 0.10; CHECK(std::string(r.qualityLevel()) == "Poor");
    }

    return finish("motion_test");
}
