// Option validation/overrides, error taxonomy, logging sink and the C bridge
#include <string>
#include <vector>
#include "../cpp/pulselink_bridge.h"
#include "../cpp/pulselink_errors.h"
#include "../cpp/pulselink_log.h"
#include "../cpp/pulselink_options.h"
#include "test_util.h"

using namespace pulselink;

static std::string code_for(double fs, const Options& o) {
    const char* code = nullptr;
    std::string msg;
    if (validateOptions(fs, o, &code, &msg)) return "ok";
    CHECK(!msg.empty());
    return code ? code : "";
}

int main() {
    // Validation codes
    {
        Options o;
        CHECK(code_for(50.0, o) == "ok");
        CHECK(code_for(0.0, o) == "PULSELINK_E001");
        Options band; band.beatLowHz = 9.0;
        CHECK(code_for(50.0, band) == "PULSELINK_E011");
        Options dc; dc.dcCutoffHz = 30.0;
        CHECK(code_for(50.0, dc) == "PULSELINK_E012");
        Options order; order.filterOrder = 2;
        CHECK(code_for(50.0, order) == "PULSELINK_E013");
        Options win; win.dcReferenceSec = 6.0;
        CHECK(code_for(50.0, win) == "PULSELINK_E021");
        Options rr; rr.rrMinSec = 2.0;
        CHECK(code_for(50.0, rr) == "PULSELINK_E031");
        Options retry; retry.reconnectMaxAttempts = 0;
        CHECK(code_for(50.0, retry) == "PULSELINK_E052");
        Options analysis; analysis.analysisWindowSec = 0.0;
        CHECK(code_for(50.0, analysis) == "PULSELINK_E061");
        Options hr; hr.hrMinBpm = 200.0;
        CHECK(code_for(50.0, hr) == "PULSELINK_E071");
        Options activity; activity.baselineAdaptRate = 0.0;
        CHECK(code_for(50.0, activity) == "PULSELINK_E072");
        Options lms; lms.lmsTaps = 0;
        CHECK(code_for(50.0, lms) == "PULSELINK_E073");
        // high cutoff above Nyquist is accepted; the detector clamps it
        Options high; high.beatHighHz = 40.0;
        CHECK(code_for(50.0, high) == "ok");
    }

    // name=value overrides
    {
        Options o;
        CHECK(applyOptionOverride(o, "beatHighHz=6"));
        CHECK(o.beatHighHz == 6.0);
        CHECK(applyOptionOverride(o, "reconnectMaxAttempts=3"));
        CHECK(o.reconnectMaxAttempts == 3);
        CHECK(applyOptionOverride(o, "lmsTaps=16"));
        CHECK(o.lmsTaps == 16);
        CHECK(applyOptionOverride(o, "motionThresholdG=1.4"));
        CHECK(o.motionThresholdG == 1.4);
        CHECK(!applyOptionOverride(o, "reconnectMaxAttempts=2.5"));
        CHECK(o.reconnectMaxAttempts == 3);
        CHECK(!applyOptionOverride(o, "noSuchOption=1"));
        CHECK(!applyOptionOverride(o, "beatHighHz="));
        CHECK(!applyOptionOverride(o, "beatHighHz=fast"));
        CHECK(!applyOptionOverride(o, "=4"));
        CHECK(o.beatHighHz == 6.0);
    }

    // Error taxonomy
    {
        TransportError lost(ErrorKind::UnexpectedDisconnection, PeripheralId("ring-1"), "supervision timeout");
        CHECK(lost.category() == ErrorCategory::Transport);
        CHECK(lost.shouldTriggerReconnection());
        CHECK(lost.isRecoverable());
        CHECK(std::string(lost.code()) == "PULSELINK_E112");

        TransportError svc(ErrorKind::ServiceDiscoveryFailed, PeripheralId("ring-1"), "no services");
        CHECK(svc.category() == ErrorCategory::Protocol);
        CHECK(svc.describe() == "Service discovery failed: no services");
        CHECK(!svc.shouldTriggerReconnection());

        auto t = TransportError::timeout("Notification setup", 10.0);
        CHECK(t.describe() == "Notification setup timed out after 10 seconds");
        CHECK(t.severity() == ErrorSeverity::Warning);

        auto gaveUp = TransportError::reconnectExhausted(PeripheralId("ring-1"), 5);
        CHECK(gaveUp.describe() == "Connection lost: reconnection failed after 5 attempts");
        CHECK(!gaveUp.isRecoverable());

        auto off = TransportError::bluetoothNotReady(BluetoothState::PoweredOff);
        CHECK(off.kind == ErrorKind::BluetoothNotReady);
        CHECK(off.describe() == "Bluetooth is not ready (state: Powered Off)");
        CHECK(TransportError::bluetoothNotReady(BluetoothState::Unsupported).severity() == ErrorSeverity::Critical);

        CHECK(TransportError(ErrorKind::DataCorrupted, PeripheralId()).category() == ErrorCategory::Data);
        CHECK(TransportError(ErrorKind::ConnectionFailed, PeripheralId()).describe() == "Connection failed: Unknown reason");

        DeviceError de(TransportError(ErrorKind::InvalidPeripheral, PeripheralId("x")));
        CHECK(std::string(de.what()) == "Invalid peripheral: x");
    }

    // Logging: level gate and sink
    {
        std::vector<std::pair<LogLevel, std::string>> lines;
        setLogSink([&](LogLevel l, const std::string& m) { lines.emplace_back(l, m); });
        setLogLevel(LogLevel::Warn);
        PL_LOG_INFO("hidden %d", 1);
        PL_LOG_WARN("[%s] rssi %d", "ring-1", -70);
        PL_LOG_ERROR("plain");
        CHECK(lines.size() == 2);
        if (lines.size() == 2) {
            CHECK(lines[0].first == LogLevel::Warn);
            CHECK(lines[0].second == "[ring-1] rssi -70");
            CHECK(lines[1].second == "plain");
        }
        CHECK(logLevel() == LogLevel::Warn);
        setLogSink(nullptr);
        setLogLevel(LogLevel::Info);
    }

    // C bridge: IR DC handle
    {
        CHECK(pl_irdc_create(0.0, nullptr) == nullptr);
        // DC cutoff 0.8 Hz is above Nyquist at 1 Hz: rejected, nothing thrown
        CHECK(pl_irdc_create(1.0, nullptr) == nullptr);
        Options badDc; badDc.dcCutoffHz = 30.0;
        CHECK(pl_irdc_create(50.0, &badDc) == nullptr);
        Options badWin; badWin.dcReferenceSec = 6.0;
        CHECK(pl_irdc_create(50.0, &badWin) == nullptr);
        void* h = pl_irdc_create(50.0, nullptr);
        CHECK(h != nullptr);
        pl_irdc_metrics out {};
        CHECK(pl_irdc_poll(h, &out) == 0);
        std::vector<float> ir(500, 50000.0f);
        pl_irdc_push(h, ir.data(), ir.size());
        CHECK(pl_irdc_poll(h, &out) == 1);
        CHECK_NEAR(out.dc, 50000.0, 1e-2);
        CHECK_NEAR(out.rolling_mean, 50000.0, 1e-2);
        CHECK(out.occlusion == 0);
        CHECK(pl_irdc_poll(h, nullptr) == 0);
        pl_irdc_destroy(h);
        pl_irdc_push(nullptr, ir.data(), ir.size());
        pl_irdc_destroy(nullptr);
    }

    // C bridge: HRV handle
    {
        void* h = pl_hrv_create(nullptr);
        for (int i = 0; i <= 10; ++i) pl_hrv_add_peak(h, i * 0.8);
        pl_hrv_metrics out {};
        CHECK(pl_hrv_analyze(h, 8.01, &out) == 1);
        CHECK(out.rr_count == 7);
        CHECK(out.has_svd == 1);
        CHECK(out.has_ratio == 0);
        CHECK_NEAR(out.rmssd_ms, 0.0, 1e-6);
        CHECK(pl_hrv_analyze(h, 100.0, &out) == 0);
        CHECK(out.valid == 0);
        pl_hrv_destroy(h);
        CHECK(pl_hrv_analyze(nullptr, 1.0, &out) == 0);
    }

    // C bridge: validation
    {
        const char* code = nullptr;
        std::string msg;
        CHECK(pl_validate_options(50.0, nullptr, &code, &msg));
        Options bad;
        bad.filterOrder = 8;
        CHECK(!pl_validate_options(50.0, &bad, &code, &msg));
        CHECK(code && std::string(code) == "PULSELINK_E013");
    }

    return finish("options_bridge_test");
}
