#include "pulselink_options.h"

#include <cmath>
#include <cstdlib>

namespace pulselink {

static inline bool isFinite(double x) {
    return std::isfinite(x) != 0;
}

static inline bool fail(const char** err_code, std::string* err_msg, const char* code, const char* msg) {
    if (err_code) *err_code = code;
    if (err_msg) *err_msg = msg;
    return false;
}

bool validateOptions(double fs,
                     const Options& opt,
                     const char** err_code,
                     std::string* err_msg) {
    // fs: 1..10000
    if (!isFinite(fs) || fs < 1.0 || fs > 10000.0)
        return fail(err_code, err_msg, "PULSELINK_E001", "Invalid sample rate (1-10000 Hz)");

    // beat band: 0 < low < high; high above Nyquist is clamped by the detector
    if (!isFinite(opt.beatLowHz) || !isFinite(opt.beatHighHz) || opt.beatLowHz <= 0.0 || opt.beatLowHz >= opt.beatHighHz || opt.beatLowHz >= fs * 0.5)
        return fail(err_code, err_msg, "PULSELINK_E011", "Invalid beat band (0<low<high, low<fs/2)");

    if (!isFinite(opt.dcCutoffHz) || opt.dcCutoffHz <= 0.0 || opt.dcCutoffHz >= fs * 0.5)
        return fail(err_code, err_msg, "PULSELINK_E012", "Invalid DC cutoff (0<fc<fs/2)");

    if (opt.filterOrder != 4)
        return fail(err_code, err_msg, "PULSELINK_E013", "Unsupported filter order (4)");

    // peak distance 0.1..2 s
    if (!isFinite(opt.minPeakDistanceSec) || opt.minPeakDistanceSec < 0.1 || opt.minPeakDistanceSec > 2.0)
        return fail(err_code, err_msg, "PULSELINK_E014", "Invalid peak distance (0.1-2 s)");

    if (!isFinite(opt.prominenceFactor) || opt.prominenceFactor < 0.0 || !isFinite(opt.prominenceFloor) || opt.prominenceFloor < 0.0)
        return fail(err_code, err_msg, "PULSELINK_E015", "Invalid prominence (>=0)");

    if (!isFinite(opt.landmarkWindowSec) || opt.landmarkWindowSec <= 0.0)
        return fail(err_code, err_msg, "PULSELINK_E016", "Invalid landmark window (>0)");

    // DC windows: 0 < reference <= window <= buffer
    if (!isFinite(opt.dcWindowSec) || !isFinite(opt.dcReferenceSec) || !isFinite(opt.dcBufferSec) ||
        opt.dcReferenceSec <= 0.0 || opt.dcReferenceSec > opt.dcWindowSec || opt.dcWindowSec > opt.dcBufferSec)
        return fail(err_code, err_msg, "PULSELINK_E021", "Invalid DC windows (0<ref<=window<=buffer)");

    if (!isFinite(opt.occlusionShiftThreshold))
        return fail(err_code, err_msg, "PULSELINK_E022", "Invalid occlusion threshold (NaN/Inf)");

    // RR range: 0 < min < max
    if (!isFinite(opt.rrMinSec) || !isFinite(opt.rrMaxSec) || opt.rrMinSec <= 0.0 || !(opt.rrMinSec < opt.rrMaxSec))
        return fail(err_code, err_msg, "PULSELINK_E031", "Invalid RR range (0<min<max)");

    if (opt.embeddingDimension < 2 || opt.embeddingDimension > 10)
        return fail(err_code, err_msg, "PULSELINK_E032", "Invalid embedding dimension (2-10)");

    if (opt.peakHistoryCapacity < opt.embeddingDimension + 2 || opt.minRRCount < 1 || !isFinite(opt.hrvWindowSec) || opt.hrvWindowSec <= 0.0)
        return fail(err_code, err_msg, "PULSELINK_E033", "Invalid HRV history/window");

    if (opt.historyCapacity < 1 || opt.historyEvictChunk < 1 || opt.sampleHistoryCapacity < 1)
        return fail(err_code, err_msg, "PULSELINK_E041", "Invalid history capacity (>=1)");

    if (!isFinite(opt.opticalIrFloor) || !isFinite(opt.emgFloor))
        return fail(err_code, err_msg, "PULSELINK_E042", "Invalid validity floor (NaN/Inf)");

    if (!isFinite(opt.stepTimeoutSec) || opt.stepTimeoutSec <= 0.0 ||
        !isFinite(opt.reconnectAttemptTimeoutSec) || opt.reconnectAttemptTimeoutSec <= 0.0)
        return fail(err_code, err_msg, "PULSELINK_E051", "Invalid timeout (>0)");

    if (opt.reconnectMaxAttempts < 1 || !isFinite(opt.reconnectBaseDelaySec) || opt.reconnectBaseDelaySec < 0.0 ||
        !isFinite(opt.reconnectMaxDelaySec) || opt.reconnectMaxDelaySec < opt.reconnectBaseDelaySec)
        return fail(err_code, err_msg, "PULSELINK_E052", "Invalid reconnect policy (attempts>=1, 0<=base<=max)");

    if (!isFinite(opt.rssiPollIntervalSec) || opt.rssiPollIntervalSec <= 0.0 ||
        !isFinite(opt.staleThresholdSec) || opt.staleThresholdSec <= 0.0 ||
        !isFinite(opt.autoReconnectScanSec) || opt.autoReconnectScanSec <= 0.0)
        return fail(err_code, err_msg, "PULSELINK_E053", "Invalid liveness interval (>0)");

    if (!isFinite(opt.hrMinBpm) || !isFinite(opt.hrMaxBpm) || opt.hrMinBpm <= 0.0 || !(opt.hrMinBpm < opt.hrMaxBpm))
        return fail(err_code, err_msg, "PULSELINK_E071", "Invalid heart rate range (0<min<max)");

    if (opt.activityHistorySize < 2 || !isFinite(opt.motionThresholdG) || opt.motionThresholdG <= 0.0 ||
        !isFinite(opt.clenchDeviationThreshold) || opt.clenchDeviationThreshold < 0.0 ||
        !isFinite(opt.grindingVarianceThreshold) || opt.grindingVarianceThreshold < 0.0 ||
        !isFinite(opt.baselineAdaptRate) || opt.baselineAdaptRate <= 0.0 || opt.baselineAdaptRate > 1.0)
        return fail(err_code, err_msg, "PULSELINK_E072", "Invalid activity classifier settings");

    if (opt.lmsTaps < 1 || opt.lmsTaps > 256 || !isFinite(opt.lmsLearningRate) || opt.lmsLearningRate <= 0.0 ||
        !isFinite(opt.lmsVarianceThreshold) || opt.lmsVarianceThreshold <= 0.0 ||
        !isFinite(opt.lmsGatedGain) || opt.lmsGatedGain < 0.0 || opt.lmsGatedGain > 1.0)
        return fail(err_code, err_msg, "PULSELINK_E073", "Invalid motion compensation settings");

    if (!isFinite(opt.analysisWindowSec) || opt.analysisWindowSec <= 0.0)
        return fail(err_code, err_msg, "PULSELINK_E061", "Invalid analysis window (>0)");

    return true;
}

namespace {

struct DoubleField { const char* name; double Options::*member; };
struct IntField { const char* name; int Options::*member; };

const DoubleField kDoubleFields[] = {
    {"beatLowHz", &Options::beatLowHz},
    {"beatHighHz", &Options::beatHighHz},
    {"dcCutoffHz", &Options::dcCutoffHz},
    {"minPeakDistanceSec", &Options::minPeakDistanceSec},
    {"prominenceFactor", &Options::prominenceFactor},
    {"prominenceFloor", &Options::prominenceFloor},
    {"landmarkWindowSec", &Options::landmarkWindowSec},
    {"dcWindowSec", &Options::dcWindowSec},
    {"dcReferenceSec", &Options::dcReferenceSec},
    {"dcBufferSec", &Options::dcBufferSec},
    {"occlusionShiftThreshold", &Options::occlusionShiftThreshold},
    {"rrMinSec", &Options::rrMinSec},
    {"rrMaxSec", &Options::rrMaxSec},
    {"hrvWindowSec", &Options::hrvWindowSec},
    {"opticalIrFloor", &Options::opticalIrFloor},
    {"emgFloor", &Options::emgFloor},
    {"stepTimeoutSec", &Options::stepTimeoutSec},
    {"reconnectBaseDelaySec", &Options::reconnectBaseDelaySec},
    {"reconnectMaxDelaySec", &Options::reconnectMaxDelaySec},
    {"reconnectAttemptTimeoutSec", &Options::reconnectAttemptTimeoutSec},
    {"rssiPollIntervalSec", &Options::rssiPollIntervalSec},
    {"staleThresholdSec", &Options::staleThresholdSec},
    {"autoReconnectScanSec", &Options::autoReconnectScanSec},
    {"hrMinBpm", &Options::hrMinBpm},
    {"hrMaxBpm", &Options::hrMaxBpm},
    {"motionThresholdG", &Options::motionThresholdG},
    {"clenchDeviationThreshold", &Options::clenchDeviationThreshold},
    {"grindingVarianceThreshold", &Options::grindingVarianceThreshold},
    {"baselineAdaptRate", &Options::baselineAdaptRate},
    {"lmsLearningRate", &Options::lmsLearningRate},
    {"lmsVarianceThreshold", &Options::lmsVarianceThreshold},
    {"lmsGatedGain", &Options::lmsGatedGain},
    {"analysisWindowSec", &Options::analysisWindowSec},
};

const IntField kIntFields[] = {
    {"filterOrder", &Options::filterOrder},
    {"embeddingDimension", &Options::embeddingDimension},
    {"peakHistoryCapacity", &Options::peakHistoryCapacity},
    {"minRRCount", &Options::minRRCount},
    {"historyCapacity", &Options::historyCapacity},
    {"historyEvictChunk", &Options::historyEvictChunk},
    {"sampleHistoryCapacity", &Options::sampleHistoryCapacity},
    {"reconnectMaxAttempts", &Options::reconnectMaxAttempts},
    {"activityHistorySize", &Options::activityHistorySize},
    {"lmsTaps", &Options::lmsTaps},
};

} // namespace

bool applyOptionOverride(Options& opt, const std::string& assignment) {
    const size_t eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= assignment.size()) return false;
    const std::string name = assignment.substr(0, eq);
    const std::string text = assignment.substr(eq + 1);

    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') return false;

    for (const auto& f : kDoubleFields) {
        if (name == f.name) { opt.*(f.member) = v; return true; }
    }
    for (const auto& f : kIntFields) {
        if (name == f.name) {
            if (v != std::floor(v)) return false;
            opt.*(f.member) = static_cast<int>(v);
            return true;
        }
    }
    return false;
}

} // namespace pulselink
