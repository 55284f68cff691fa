#pragma once

#include <cmath>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pulselink {

// Stable identity of one physical peripheral (platform UUID / address string)
struct PeripheralId {
    std::string value;

    PeripheralId() = default;
    explicit PeripheralId(std::string v) : value(std::move(v)) {}

    bool empty() const { return value.empty(); }
    bool operator==(const PeripheralId& o) const { return value == o.value; }
    bool operator!=(const PeripheralId& o) const { return value != o.value; }
    bool operator<(const PeripheralId& o) const { return value < o.value; }
};

enum class SensorType {
    HeartRate,
    SpO2,
    Temperature,
    Battery,
    PpgRed,
    PpgInfrared,
    PpgGreen,
    AccelerometerX,
    AccelerometerY,
    AccelerometerZ,
    Emg,
    MuscleActivity
};

const char* sensorTypeName(SensorType t);
const char* sensorTypeUnit(SensorType t);
bool isValidValue(SensorType t, double value);

struct SensorReading {
    SensorType type {SensorType::PpgInfrared};
    double value {0.0};
    std::optional<double> quality;  // 0..1 when the device reports it
    double timestamp {0.0};         // seconds
    PeripheralId deviceId;

    bool isValid() const { return std::isfinite(value) && isValidValue(type, value); }
};

// Channel semantics differ per device family
enum class DeviceType {
    Optical, // primary PPG wearable
    Emg      // comparison EMG-style device
};

const char* deviceTypeName(DeviceType t);

struct PPGData {
    double red {0.0};
    double ir {0.0};
    double green {0.0};
};

struct AccelerometerData {
    double x {0.0};
    double y {0.0};
    double z {0.0};
    double magnitude() const { return std::sqrt(x * x + y * y + z * z); }
};

// Coherent multi-channel snapshot at one timestamp
struct SensorSample {
    double timestamp {0.0};
    DeviceType deviceType {DeviceType::Optical};
    PPGData ppg;
    AccelerometerData accelerometer;
    double temperature {0.0};
    double battery {0.0};
    std::optional<double> heartRate;
    std::optional<double> spo2;
};

struct BeatFeature {
    size_t onsetIndex {0};
    size_t peakIndex {0};
    size_t offsetIndex {0};
    double onsetTime {0.0};
    double peakTime {0.0};
    double offsetTime {0.0};
    double riseTime {0.0};      // peakTime - onsetTime
    double fallTime {0.0};      // offsetTime - peakTime
    double peakAmplitude {0.0};
    double onsetAmplitude {0.0};
    std::optional<double> irDcMean;

    double pulseAmplitude() const { return peakAmplitude - onsetAmplitude; }
    double symmetry() const { return fallTime > 0.0 ? riseTime / fallTime : 0.0; }
};

struct HRVSVDResult {
    double s1 {0.0};
    std::optional<double> s2;
    std::optional<double> ratio; // s1/s2, only when s2 is non-degenerate

    // Caller supplies the threshold; no validated default exists
    bool exceedsRatioThreshold(double threshold) const { return ratio && *ratio > threshold; }
};

struct HRVResult {
    double sdnnMs {0.0};
    double rmssdMs {0.0};
    std::optional<HRVSVDResult> svd;
    size_t rrCount {0};
    double windowSeconds {0.0};
    bool isValid {false};
};

struct HeartRateResult {
    double bpm {0.0};
    double quality {0.0};    // 0..1
    size_t intervals {0};    // RR intervals the median was taken from

    const char* qualityLevel() const;
};

enum class ActivityType {
    Relaxed,
    Clenching,
    Grinding,
    Motion
};

const char* activityTypeName(ActivityType t);

struct IRDCResult {
    double dcValue {0.0};
    double rollingMean5s {0.0};
    double shift5s {0.0};
};

struct Options {
	// Band-pass for beat detection (Hz)
	double beatLowHz = 0.5;
	double beatHighHz = 8.0;
	// Low-pass for DC / occlusion analysis (Hz)
	double dcCutoffHz = 0.8;
	int filterOrder = 4;          // only 4 is supported

	// Beat detection
	double minPeakDistanceSec = 0.4; // caps detectable rate at 150 bpm
	double prominenceFactor = 0.5;   // x signal std
	double prominenceFloor = 0.0;    // absolute lower bound for the prominence threshold
	double landmarkWindowSec = 0.8;  // onset/offset search at sequence edges

	// IR DC / occlusion
	double dcWindowSec = 5.0;
	double dcReferenceSec = 1.0;
	double dcBufferSec = 60.0;       // streaming ring buffer
	double occlusionShiftThreshold = 1000.0;

	// HRV
	double rrMinSec = 0.33;          // 180 bpm
	double rrMaxSec = 1.5;           // 40 bpm
	int embeddingDimension = 3;
	int peakHistoryCapacity = 100;
	double hrvWindowSec = 5.0;
	int minRRCount = 3;

	// Reading router
	int historyCapacity = 1000;
	int historyEvictChunk = 100;
	int sampleHistoryCapacity = 1000;
	double opticalIrFloor = 100.0;
	double emgFloor = 0.0;

	// Connection lifecycle
	double stepTimeoutSec = 10.0;
	int reconnectMaxAttempts = 5;
	double reconnectBaseDelaySec = 2.0;
	double reconnectMaxDelaySec = 30.0;
	double reconnectAttemptTimeoutSec = 10.0;
	double rssiPollIntervalSec = 5.0;
	double staleThresholdSec = 30.0;
	double autoReconnectScanSec = 3.0;

	// Heart rate from beat intervals
	double hrMinBpm = 40.0;
	double hrMaxBpm = 180.0;

	// Activity classification (accelerometer in g)
	int activityHistorySize = 32;
	double motionThresholdG = 1.15;          // |a| above this is motion
	double clenchDeviationThreshold = 5000.0; // IR counts away from baseline
	double grindingVarianceThreshold = 1000.0;
	double baselineAdaptRate = 0.05;         // relaxed-state baseline tracking

	// LMS motion compensation
	int lmsTaps = 32;
	double lmsLearningRate = 0.01;
	double lmsVarianceThreshold = 1.0;       // reference variance that gates the output
	double lmsGatedGain = 0.01;

	// Biomarker pipeline
	double analysisWindowSec = 30.0;
};

} // namespace pulselink

namespace std {
template <>
struct hash<pulselink::PeripheralId> {
    size_t operator()(const pulselink::PeripheralId& id) const noexcept {
        return hash<string>()(id.value);
    }
};
} // namespace std
