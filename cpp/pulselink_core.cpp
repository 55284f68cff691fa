#include "pulselink_core.h"

namespace pulselink {

const char* sensorTypeName(SensorType t) {
    switch (t) {
        case SensorType::HeartRate: return "Heart Rate";
        case SensorType::SpO2: return "SpO2";
        case SensorType::Temperature: return "Temperature";
        case SensorType::Battery: return "Battery";
        case SensorType::PpgRed: return "PPG Red";
        case SensorType::PpgInfrared: return "PPG Infrared";
        case SensorType::PpgGreen: return "PPG Green";
        case SensorType::AccelerometerX: return "Accelerometer X";
        case SensorType::AccelerometerY: return "Accelerometer Y";
        case SensorType::AccelerometerZ: return "Accelerometer Z";
        case SensorType::Emg: return "EMG";
        case SensorType::MuscleActivity: return "Muscle Activity";
    }
    return "Unknown";
}

const char* sensorTypeUnit(SensorType t) {
    switch (t) {
        case SensorType::HeartRate: return "bpm";
        case SensorType::SpO2: return "%";
        case SensorType::Temperature: return "C";
        case SensorType::Battery: return "%";
        case SensorType::PpgRed:
        case SensorType::PpgInfrared:
        case SensorType::PpgGreen: return "counts";
        case SensorType::AccelerometerX:
        case SensorType::AccelerometerY:
        case SensorType::AccelerometerZ: return "g";
        case SensorType::Emg: return "uV";
        case SensorType::MuscleActivity: return "uV";
    }
    return "";
}

bool isValidValue(SensorType t, double value) {
    if (!std::isfinite(value)) return false;
    switch (t) {
        case SensorType::HeartRate: return value >= 30.0 && value <= 250.0;
        case SensorType::SpO2: return value >= 50.0 && value <= 100.0;
        case SensorType::Temperature: return value >= 20.0 && value <= 45.0;
        case SensorType::Battery: return value >= 0.0 && value <= 100.0;
        case SensorType::PpgRed:
        case SensorType::PpgInfrared:
        case SensorType::PpgGreen: return value >= 0.0;
        case SensorType::AccelerometerX:
        case SensorType::AccelerometerY:
        case SensorType::AccelerometerZ: return value >= -20.0 && value <= 20.0;
        case SensorType::Emg:
        case SensorType::MuscleActivity: return value >= 0.0;
    }
    return false;
}

const char* deviceTypeName(DeviceType t) {
    switch (t) {
        case DeviceType::Optical: return "Oralable";
        case DeviceType::Emg: return "ANR M40";
    }
    return "Unknown";
}

const char* HeartRateResult::qualityLevel() const {
    if (quality >= 0.9) return "Excellent";
    if (quality >= 0.8) return "Good";
    if (quality >= 0.7) return "Fair";
    if (quality >= 0.6) return "Acceptable";
    return "Poor";
}

const char* activityTypeName(ActivityType t) {
    switch (t) {
        case ActivityType::Relaxed: return "relaxed";
        case ActivityType::Clenching: return "clenching";
        case ActivityType::Grinding: return "grinding";
        case ActivityType::Motion: return "motion";
    }
    return "unknown";
}

} // namespace pulselink
