// Simulated session: discover a ring, connect, stream PPG, optionally drop the
// link once, then print biomarkers as JSON. Runs on the virtual clock.
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <cmath>
#include "../cpp/pulselink_device_manager.h"
#include "../cpp/pulselink_log.h"
#include "../cpp/pulselink_options.h"
#include "../cpp/pulselink_pipeline.h"
#include "fakes.h"

using namespace pulselink;

static std::vector<SensorReading> make_chunk(const PeripheralId& id, double fs, size_t first, size_t n, double bpm, double irDc) {
    std::vector<SensorReading> out; out.reserve(n * 2);
    const double f = bpm / 60.0;
    unsigned s = 1234567u + static_cast<unsigned>(first);
    auto rnd = [&](){ s = 1664525u * s + 1013904223u; return ((s>>8)&0xFFFFFF)/double(0xFFFFFF) - 0.5; };
    for (size_t i = first; i < first + n; ++i) {
        double t = i / fs;
        double pulse = 0.75 * std::sin(2 * M_PI * f * t) + 0.20 * std::sin(2 * M_PI * 2 * f * t) + 0.03 * rnd();
        SensorReading g; g.type = SensorType::PpgGreen; g.value = 2000.0 + 60.0 * pulse; g.timestamp = t; g.deviceId = id;
        SensorReading ir = g; ir.type = SensorType::PpgInfrared; ir.value = irDc + 150.0 * pulse;
        out.push_back(g);
        out.push_back(ir);
    }
    return out;
}

static std::string to_json(const BiomarkerReport& r, const Readiness& state, int reconnects) {
    std::ostringstream os;
    os << "{";
    os << "\"state\":\"" << stageName(state.stage) << "\",";
    os << "\"reconnects\":" << reconnects << ",";
    os << "\"samples\":" << r.samples << ",";
    os << "\"beats\":" << r.beats.size() << ",";
    double rise = 0.0;
    for (const auto& b : r.beats) rise += b.riseTime;
    os << "\"meanRiseTime\":" << (r.beats.empty() ? 0.0 : rise / r.beats.size()) << ",";
    if (r.heartRate)
        os << "\"heartRate\":{\"bpm\":" << r.heartRate->bpm << ",\"quality\":\"" << r.heartRate->qualityLevel() << "\"},";
    os << "\"activity\":\"" << activityTypeName(r.activity) << "\",";
    os << "\"hrv\":{\"valid\":" << (r.hrv.isValid ? "true" : "false")
       << ",\"rrCount\":" << r.hrv.rrCount
       << ",\"sdnnMs\":" << r.hrv.sdnnMs
       << ",\"rmssdMs\":" << r.hrv.rmssdMs;
    if (r.hrv.svd) {
        os << ",\"s1\":" << r.hrv.svd->s1;
        if (r.hrv.svd->ratio) os << ",\"svdRatio\":" << *r.hrv.svd->ratio;
    }
    os << "},";
    os << "\"irdc\":{\"dc\":" << r.irdc.dcValue
       << ",\"mean5s\":" << r.irdc.rollingMean5s
       << ",\"shift5s\":" << r.irdc.shift5s << "}";
    os << "}";
    return os.str();
}

int main(int argc, char** argv) {
    double fs = 50.0;
    double seconds = 60.0;
    double bpm = 72.0;
    double dropAt = -1.0;       // seconds into streaming; <0 disables
    double occludeAt = -1.0;    // IR baseline drop
    Options opt;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "--fs" || a == "-f") && i + 1 < argc) { fs = std::atof(argv[++i]); }
        else if ((a == "--seconds" || a == "-s") && i + 1 < argc) { seconds = std::atof(argv[++i]); }
        else if (a == "--bpm" && i + 1 < argc) { bpm = std::atof(argv[++i]); }
        else if (a == "--drop-at" && i + 1 < argc) { dropAt = std::atof(argv[++i]); }
        else if (a == "--occlude-at" && i + 1 < argc) { occludeAt = std::atof(argv[++i]); }
        else if (a == "--debug") { setLogLevel(LogLevel::Debug); }
        else if (a == "--set" && i + 1 < argc) {
            const std::string kv = argv[++i];
            if (!applyOptionOverride(opt, kv)) { std::cerr << "unknown or invalid option: " << kv << "\n"; return 2; }
        }
    }

    const char* code = nullptr;
    std::string msg;
    if (!validateOptions(fs, opt, &code, &msg)) {
        std::cerr << code << ": " << msg << "\n";
        return 2;
    }

    EventLoop loop;
    fakes::FakeTransport radio;
    fakes::MemoryDeviceStore store;
    DeviceManager mgr(loop, radio,
        [&radio](const PeripheralId& id, DeviceType) {
            std::unique_ptr<fakes::FakeDriver> d(new fakes::FakeDriver(&radio, id));
            d->channels = {"accelerometer", "temperature"};
            return std::unique_ptr<DeviceDriver>(std::move(d));
        },
        &store, opt);
    BiomarkerPipeline pipeline(mgr.router(), fs, opt);

    int reconnects = 0;
    mgr.addSupervisorListener([&](const SupervisorEvent& e) {
        if (e.kind == SupervisorEvent::Kind::AttemptStarted) {
            ++reconnects;
            // the ring answers the first attempt
            loop.schedule(0.5, [&radio, id = e.peripheral] { radio.linkUp(id); });
        }
    });

    const PeripheralId ring("demo-ring");
    mgr.startScanning();
    radio.advertise(ring, "Oralable Demo", -58);
    mgr.connect(ring);
    loop.schedule(0.3, [&] { radio.linkUp(ring); });
    loop.advanceBy(1.0);
    if (!mgr.readiness(ring).isReady()) {
        std::cerr << "device did not become ready: " << mgr.readiness(ring).displayText() << "\n";
        return 1;
    }
    pipeline.setSource(ring);

    // Stream in 200 ms notifications; data stops while the link is down
    const size_t chunk = static_cast<size_t>(fs * 0.2);
    const size_t total = static_cast<size_t>(fs * seconds);
    bool dropped = false;
    for (size_t i = 0; i < total; i += chunk) {
        const double t = i / fs;
        if (dropAt >= 0.0 && !dropped && t >= dropAt) {
            radio.linkLost(ring);
            dropped = true;
        }
        loop.advanceBy(0.2);
        if (!mgr.readiness(ring).isReady()) continue;
        const double irDc = (occludeAt >= 0.0 && t >= occludeAt) ? 46000.0 : 50000.0;
        radio.emit(TransportEvent::characteristicUpdated(ring, make_chunk(ring, fs, i, chunk, bpm, irDc)));
    }

    auto report = pipeline.analyze();
    std::cout << to_json(report, mgr.readiness(ring), reconnects) << std::endl;
    mgr.disconnectAll();
    return 0;
}
