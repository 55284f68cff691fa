// Biomarker pipeline: batches pushed from a radio thread while another thread analyzes
#include <atomic>
#include <chrono>
#include <thread>
#include "../cpp/pulselink_pipeline.h"
#include "test_util.h"

using namespace pulselink;

static std::vector<SensorReading> make_batch(const PeripheralId& id, double fs, size_t first, size_t count,
                                             double bpm, bool withGreen) {
    std::vector<SensorReading> b;
    const double f = bpm / 60.0;
    for (size_t i = first; i < first + count; ++i) {
        const double t = i / fs;
        const double pulse = 0.8 * std::sin(2 * M_PI * f * t) + 0.15 * std::sin(2 * M_PI * 2 * f * t);
        SensorReading ir;
        ir.type = SensorType::PpgInfrared;
        ir.value = 50000.0 + 100.0 * pulse;
        ir.timestamp = t;
        ir.deviceId = id;
        b.push_back(ir);
        if (withGreen) {
            SensorReading g = ir;
            g.type = SensorType::PpgGreen;
            g.value = 2000.0 + 40.0 * pulse;
            b.push_back(g);
        }
    }
    return b;
}

int main() {
    const double fs = 50.0;
    const PeripheralId ring("ring-1");

    // Concurrent delivery and analysis
    {
        ReadingRouter router;
        BiomarkerPipeline pipe(router, fs);
        std::atomic<bool> done {false};
        std::atomic<int> analyses {0};

        std::thread radio([&] {
            for (size_t i = 0; i < 1500; i += 10) {
                router.deliver(ring, DeviceType::Optical, make_batch(ring, fs, i, 10, 72.0, true));
                std::this_thread::sleep_for(std::chrono::microseconds(200));
            }
            done = true;
        });
        std::thread analyst([&] {
            while (!done.load()) {
                auto rep = pipe.analyze();
                CHECK(rep.samples <= 1500);
                ++analyses;
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            }
        });
        radio.join();
        analyst.join();

        CHECK(pipe.bufferedSamples() == 1500);
        auto rep = pipe.analyze();
        std::cout << "analyses=" << analyses.load() << " beats=" << rep.beats.size()
                  << " rr=" << rep.hrv.rrCount << " sdnn=" << rep.hrv.sdnnMs << "\n";
        CHECK(rep.beats.size() >= 30 && rep.beats.size() <= 37);
        CHECK(rep.hrv.isValid);
        CHECK(rep.hrv.rrCount >= 3);
        CHECK(rep.hrv.sdnnMs < 60.0);
        for (const auto& b : rep.beats) CHECK(b.irDcMean.has_value());
        CHECK_NEAR(rep.irdc.dcValue, 50000.0, 150.0);
        CHECK(std::fabs(rep.irdc.shift5s) < 200.0);
        CHECK_NEAR(pipe.latestIRDC().rollingMean5s, 50000.0, 150.0);

        CHECK(rep.heartRate.has_value());
        CHECK(rep.heartRateBpm().has_value());
        if (rep.heartRateBpm()) CHECK_NEAR(*rep.heartRateBpm(), 72.0, 3.0);
        CHECK(rep.activity == ActivityType::Relaxed);
        CHECK(rep.motionSamples == 0);
    }

    // Accelerometer readings drive activity and the motion reference
    {
        Options opt;
        opt.analysisWindowSec = 10.0;
        ReadingRouter router(opt);
        BiomarkerPipeline pipe(router, fs, opt);

        auto with_accel = [&](size_t first, size_t count, double z) {
            auto ppg = make_batch(ring, fs, first, count, 72.0, false);
            std::vector<SensorReading> b;
            for (const auto& r : ppg) {
                SensorReading ax = r;
                ax.type = SensorType::AccelerometerX;
                ax.value = 0.0;
                SensorReading az = r;
                az.type = SensorType::AccelerometerZ;
                az.value = z;
                b.push_back(ax);
                b.push_back(az);
                b.push_back(r);
            }
            return b;
        };

        // at rest (1 g) the reference is silent and the waveform passes through
        router.deliver(ring, DeviceType::Optical, with_accel(0, 400, 1.0));
        CHECK(pipe.currentActivity() == ActivityType::Relaxed);
        auto rest = pipe.analyze();
        CHECK(rest.samples == 400);
        CHECK(rest.motionSamples == 0);
        CHECK(rest.heartRate.has_value());
        if (rest.heartRateBpm()) CHECK_NEAR(*rest.heartRateBpm(), 72.0, 3.0);

        router.deliver(ring, DeviceType::Optical, with_accel(400, 100, 1.3));
        CHECK(pipe.currentActivity() == ActivityType::Motion);
        auto moving = pipe.analyze();
        CHECK(moving.activity == ActivityType::Motion);
        CHECK(moving.motionSamples == 100);
        CHECK(moving.samples == 500);
        CHECK(std::string(activityTypeName(moving.activity)) == "motion");

        // out-of-range axis values are dropped and leave the last reading in place
        router.deliver(ring, DeviceType::Optical, with_accel(500, 10, 25.0));
        CHECK(pipe.currentActivity() == ActivityType::Motion);

        router.deliver(ring, DeviceType::Optical, with_accel(510, 10, 1.0));
        CHECK(pipe.currentActivity() == ActivityType::Relaxed);

        pipe.reset();
        CHECK(pipe.currentActivity() == ActivityType::Relaxed);
        CHECK(pipe.analyze().motionSamples == 0);
    }

    // Source filtering, device family, IR fallback, window cap
    {
        Options opt;
        opt.analysisWindowSec = 10.0;
        ReadingRouter router(opt);
        BiomarkerPipeline pipe(router, fs, opt);
        pipe.setSource(ring);
        router.deliver(PeripheralId("ring-2"), DeviceType::Optical, make_batch(PeripheralId("ring-2"), fs, 0, 50, 72.0, true));
        CHECK(pipe.bufferedSamples() == 0);
        router.deliver(ring, DeviceType::Emg, make_batch(ring, fs, 0, 50, 72.0, true));
        CHECK(pipe.bufferedSamples() == 0);

        router.deliver(ring, DeviceType::Optical, make_batch(ring, fs, 0, 50, 72.0, false));
        CHECK(pipe.bufferedSamples() == 50);
        router.deliver(ring, DeviceType::Optical, make_batch(ring, fs, 50, 1000, 72.0, true));
        CHECK(pipe.bufferedSamples() == 500);

        auto rep = pipe.analyze();
        CHECK(rep.samples == 500);
        CHECK(rep.beats.size() >= 9);

        pipe.reset();
        CHECK(pipe.bufferedSamples() == 0);
        CHECK(pipe.analyze().beats.empty());
    }

    // Unsubscribes on destruction
    {
        ReadingRouter router;
        { BiomarkerPipeline pipe(router, fs); }
        router.deliver(ring, DeviceType::Optical, make_batch(ring, fs, 0, 10, 72.0, true));
        CHECK(router.historySize() == 20);
    }

    return finish("pipeline_concurrency_test");
}
