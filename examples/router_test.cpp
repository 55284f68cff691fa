// Reading fan-out: latest values, bounded histories, per-device merged samples
#include <string>
#include "../cpp/pulselink_readings.h"
#include "test_util.h"

using namespace pulselink;

static SensorReading reading(SensorType t, double v, double ts, const PeripheralId& id) {
    SensorReading r;
    r.type = t;
    r.value = v;
    r.timestamp = ts;
    r.deviceId = id;
    return r;
}

int main() {
    const PeripheralId ring("ring-1");
    const PeripheralId band("band-7");

    // Handler order and merged optical sample
    {
        ReadingRouter router;
        std::vector<std::string> order;
        std::vector<SensorSample> samples;
        router.subscribeLatest([&](const SensorReading& r) { order.push_back(std::string("latest:") + sensorTypeName(r.type)); });
        router.subscribe([&](const PeripheralId& id, DeviceType type, const std::vector<SensorReading>& b) {
            CHECK(id == ring);
            CHECK(type == DeviceType::Optical);
            order.push_back("batch:" + std::to_string(b.size()));
        });
        router.subscribeSamples([&](const PeripheralId&, const SensorSample& s) { order.push_back("sample"); samples.push_back(s); });

        router.deliver(ring, DeviceType::Optical, {
            reading(SensorType::PpgInfrared, 50000.0, 1.00, ring),
            reading(SensorType::PpgRed, 42000.0, 1.00, ring),
            reading(SensorType::PpgGreen, 31000.0, 1.00, ring),
            reading(SensorType::AccelerometerZ, 9.81, 1.02, ring),
            reading(SensorType::Temperature, 36.4, 1.02, ring),
        });

        CHECK(order.size() == 7);
        if (order.size() == 7) {
            CHECK(order[0].rfind("latest:", 0) == 0);
            CHECK(order[5] == "batch:5");
            CHECK(order[6] == "sample");
        }
        CHECK(samples.size() == 1);
        if (!samples.empty()) {
            CHECK(samples[0].ppg.ir == 50000.0);
            CHECK(samples[0].ppg.red == 42000.0);
            CHECK(samples[0].ppg.green == 31000.0);
            CHECK(samples[0].accelerometer.z == 9.81);
            CHECK(samples[0].temperature == 36.4);
            CHECK_NEAR(samples[0].timestamp, 1.02, 1e-12);
        }
        CHECK(router.historySize() == 5);
        CHECK(router.latest(SensorType::PpgRed) && router.latest(SensorType::PpgRed)->value == 42000.0);
        CHECK(!router.latest(SensorType::SpO2));
        CHECK(router.latestAll().size() == 5);

        // Channels without IR keep the merged record but emit no sample
        router.deliver(ring, DeviceType::Optical, {reading(SensorType::Battery, 87.0, 2.0, ring)});
        CHECK(samples.size() == 1);
        // IR at/below the floor is not a usable optical sample
        router.deliver(ring, DeviceType::Optical, {reading(SensorType::PpgInfrared, 60.0, 3.0, ring)});
        CHECK(samples.size() == 1);
        router.deliver(ring, DeviceType::Optical, {reading(SensorType::PpgInfrared, 51000.0, 4.0, ring)});
        CHECK(samples.size() == 2);
        if (samples.size() == 2) {
            CHECK(samples[1].battery == 87.0);   // carried over from the merged record
            CHECK(samples[1].ppg.red == 42000.0);
        }
        CHECK(router.sampleHistory(ring).size() == 2);
        CHECK(router.latestSample(ring) && router.latestSample(ring)->ppg.ir == 51000.0);
    }

    // Latest handler fires once per type; the last reading of the type wins
    {
        ReadingRouter router;
        int latestCalls = 0;
        router.subscribeLatest([&](const SensorReading&) { ++latestCalls; });
        router.deliver(ring, DeviceType::Optical, {
            reading(SensorType::PpgInfrared, 1000.0, 1.0, ring),
            reading(SensorType::PpgInfrared, 2000.0, 1.1, ring),
            reading(SensorType::PpgInfrared, 3000.0, 1.2, ring),
            reading(SensorType::PpgRed, 900.0, 1.2, ring),
        });
        CHECK(latestCalls == 2);
        CHECK(router.latest(SensorType::PpgInfrared)->value == 3000.0);
        CHECK(router.history().size() == 4);
    }

    // EMG amplitude travels in the IR slot
    {
        ReadingRouter router;
        router.deliver(band, DeviceType::Emg, {reading(SensorType::Emg, 320.0, 5.0, band)});
        auto s = router.latestSample(band);
        CHECK(s.has_value());
        if (s) {
            CHECK(s->deviceType == DeviceType::Emg);
            CHECK(s->ppg.ir == 320.0);
            CHECK(s->ppg.red == 0.0);
        }
        router.deliver(band, DeviceType::Emg, {reading(SensorType::MuscleActivity, 0.0, 6.0, band)});
        CHECK(router.sampleHistory(band).size() == 1);
        router.forget(band);
        CHECK(router.sampleHistory(band).empty());
        CHECK(!router.latestSample(band));
    }

    // Empty batches are ignored; unsubscribe stops delivery
    {
        ReadingRouter router;
        int calls = 0;
        auto sid = router.subscribe([&](const PeripheralId&, DeviceType, const std::vector<SensorReading>&) { ++calls; });
        router.deliver(ring, DeviceType::Optical, {});
        CHECK(calls == 0);
        CHECK(router.historySize() == 0);
        router.deliver(ring, DeviceType::Optical, {reading(SensorType::HeartRate, 64.0, 1.0, ring)});
        CHECK(calls == 1);
        router.unsubscribe(sid);
        router.deliver(ring, DeviceType::Optical, {reading(SensorType::HeartRate, 65.0, 2.0, ring)});
        CHECK(calls == 1);
        router.clear();
        CHECK(router.historySize() == 0);
        CHECK(router.latestAll().empty());
    }

    // Coarse history eviction, oldest first
    {
        Options opt;
        opt.historyCapacity = 10;
        opt.historyEvictChunk = 4;
        opt.sampleHistoryCapacity = 3;
        ReadingRouter router(opt);
        std::vector<SensorReading> b;
        for (int i = 0; i < 8; ++i) b.push_back(reading(SensorType::PpgInfrared, 1000.0 + i, i, ring));
        router.deliver(ring, DeviceType::Optical, b);
        CHECK(router.historySize() == 8);

        b.clear();
        for (int i = 8; i < 11; ++i) b.push_back(reading(SensorType::PpgInfrared, 1000.0 + i, i, ring));
        router.deliver(ring, DeviceType::Optical, b);
        CHECK(router.historySize() == 7);   // 11 - chunk of 4
        CHECK(router.history().front().timestamp == 4.0);

        b.clear();
        for (int i = 11; i < 31; ++i) b.push_back(reading(SensorType::PpgInfrared, 1000.0 + i, i, ring));
        router.deliver(ring, DeviceType::Optical, b);
        CHECK(router.historySize() == 10);  // overflow larger than the chunk
        CHECK(router.history().front().timestamp == 21.0);
        CHECK(router.sampleHistory(ring).size() == 3);
    }

    return finish("router_test");
}
